#ifndef WEB_SERVER_SERVER_TRANSPORT_HPP
#define WEB_SERVER_SERVER_TRANSPORT_HPP

/**
 * @file ServerTransport.hpp
 *
 * This module declares the WebServer::ServerTransport interface.
 *
 * © 2018 by Richard Walters
 */

#include "Connection.hpp"

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

namespace WebServer {

    /**
     * This represents the transport layer requirements of WebServer::Server.
     * To integrate WebServer::Server into a larger program, implement this
     * interface in terms of the actual transport layer.
     *
     * AwaitConnection is called concurrently by every worker currently
     * holding an admission permit, so implementations must support
     * several simultaneous callers.
     */
    class ServerTransport {
    public:
        // Lifecycle management

        virtual ~ServerTransport() = default;

        // Methods

        /**
         * This method acquires exclusive access to the given port on
         * the loopback interface and every local network interface,
         * and begins listening for incoming connections from clients.
         *
         * @param[in] port
         *     This is the public port number to which clients may connect
         *     to establish connections with this server.
         *
         * @return
         *     An indication of whether or not the method was successful
         *     is returned.
         */
        virtual bool BindNetwork(uint16_t port) = 0;

        /**
         * This method returns the public port number that was bound
         * for accepting connections from clients.
         *
         * @return
         *     The public port number that was bound
         *     for accepting connections from clients is returned.
         */
        virtual uint16_t GetBoundPort() = 0;

        /**
         * This method returns the host names or addresses on which
         * the transport is listening, such as "localhost" or "192.168.1.5".
         *
         * @return
         *     The host names or addresses on which the transport
         *     is listening are returned.
         */
        virtual std::vector< std::string > GetBoundAddresses() = 0;

        /**
         * This method blocks until the next client connection is accepted.
         *
         * @return
         *     The newly accepted connection is returned.
         *
         * @retval nullptr
         *     This is returned if the network was released, or if the
         *     transport is no longer able to accept connections.
         */
        virtual std::shared_ptr< Connection > AwaitConnection() = 0;

        /**
         * This method releases all resources and access that were acquired
         * and held as a result of calling the BindNetwork method.  Any
         * callers blocked in AwaitConnection are released with nullptr.
         */
        virtual void ReleaseNetwork() = 0;
    };

}

#endif /* WEB_SERVER_SERVER_TRANSPORT_HPP */
