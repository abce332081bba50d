#ifndef WEB_SERVER_SOCKET_SERVER_TRANSPORT_HPP
#define WEB_SERVER_SOCKET_SERVER_TRANSPORT_HPP

/**
 * @file SocketServerTransport.hpp
 *
 * This module declares the WebServer::SocketServerTransport class.
 *
 * © 2018 by Richard Walters
 */

#include "Connection.hpp"
#include "ServerTransport.hpp"

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <vector>

namespace WebServer {

    /**
     * This is an implementation of WebServer::ServerTransport which
     * listens for TCP connections using POSIX sockets, on the loopback
     * address and every IPv4 address of the local network interfaces.
     */
    class SocketServerTransport
        : public ServerTransport
    {
        // Lifecycle management
    public:
        ~SocketServerTransport();
        SocketServerTransport(const SocketServerTransport&) = delete;
        SocketServerTransport(SocketServerTransport&&) = delete;
        SocketServerTransport& operator=(const SocketServerTransport&) = delete;
        SocketServerTransport& operator=(SocketServerTransport&&) = delete;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        SocketServerTransport();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the transport.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to this subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        // ServerTransport
    public:
        virtual bool BindNetwork(uint16_t port) override;
        virtual uint16_t GetBoundPort() override;
        virtual std::vector< std::string > GetBoundAddresses() override;
        virtual std::shared_ptr< Connection > AwaitConnection() override;
        virtual void ReleaseNetwork() override;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< struct Impl > impl_;
    };

}

#endif /* WEB_SERVER_SOCKET_SERVER_TRANSPORT_HPP */
