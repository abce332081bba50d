#ifndef WEB_SERVER_CONNECTION_HPP
#define WEB_SERVER_CONNECTION_HPP

/**
 * @file Connection.hpp
 *
 * This module declares the WebServer::Connection interface.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <string>
#include <vector>

namespace WebServer {

    /**
     * This represents a single accepted connection between the web server
     * and a client on a transport layer.  All of its methods are called
     * from the worker which accepted the connection, and block that
     * worker until they complete.
     */
    class Connection {
    public:
        // Lifecycle management

        virtual ~Connection() = default;

        // Methods

        /**
         * This method returns a string that uniquely identifies
         * the peer of this connection in the context of the transport,
         * such as "192.168.1.20:51234".
         *
         * @return
         *     A string that uniquely identifies the peer of this connection
         *     in the context of the transport is returned.
         */
        virtual std::string GetPeerId() = 0;

        /**
         * This method returns the network address of the peer,
         * without any port number.  This is stable across the connections
         * made by one client, and is used as the client's session key.
         *
         * @return
         *     The network address of the peer is returned.
         */
        virtual std::string GetPeerAddress() = 0;

        /**
         * This method returns the local address and port to which the
         * client directed the connection, such as "192.168.1.5:80".
         *
         * @return
         *     The local address and port of the connection is returned.
         */
        virtual std::string GetHostAddress() = 0;

        /**
         * This method blocks until more data is received from the peer,
         * or the connection is broken.
         *
         * @param[out] data
         *     This is where to store the data that was received.
         *
         * @return
         *     An indication of whether or not data was received
         *     is returned.  If false, the connection is broken
         *     and no more data will arrive.
         */
        virtual bool ReceiveData(std::vector< uint8_t >& data) = 0;

        /**
         * This method sends the given data to the remote peer.
         *
         * @param[in] data
         *     This is the data to send to the remote peer.
         */
        virtual void SendData(const std::vector< uint8_t >& data) = 0;

        /**
         * This method breaks the connection to the remote peer.
         *
         * @param[in] clean
         *     This flag indicates whether or not to attempt to complete
         *     any data transmission still in progress, before breaking
         *     the connection.
         */
        virtual void Break(bool clean) = 0;
    };

}

#endif /* WEB_SERVER_CONNECTION_HPP */
