#ifndef WEB_SERVER_SERVER_HPP
#define WEB_SERVER_SERVER_HPP

/**
 * @file Server.hpp
 *
 * This module declares the WebServer::Server class.
 *
 * © 2018 by Richard Walters
 */

#include "Configuration.hpp"
#include "IServer.hpp"
#include "ServerTransport.hpp"
#include "SessionStore.hpp"
#include "TimeKeeper.hpp"

#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace WebServer {

    /**
     * This is the core of an embeddable web server.
     *
     * This class accepts connections from clients, never letting more
     * than a configured number of workers wait for connections at once.
     * Each worker reads one request from the connection it accepted,
     * associates it with the session of the client, hands it to the
     * application's router, and writes back either a redirect or
     * the content the router provided.
     */
    class Server
        : public IServer
    {
        // Types
    public:
        /**
         * This structure holds all of the dependency objects and
         * application delegates needed by the server when it's mobilized.
         */
        struct MobilizationDependencies {
            /**
             * This is the transport layer implementation to use.
             */
            std::shared_ptr< ServerTransport > transport;

            /**
             * This is the object used to track time in the server.
             */
            std::shared_ptr< TimeKeeper > timeKeeper;

            /**
             * This is the function called to route each request.
             * It must be provided.
             */
            RouteDelegate route;

            /**
             * This is the function called to map error classifications
             * to redirect paths.  It must be provided.
             */
            ErrorDelegate onError;

            /**
             * This is the function, if any, called to observe each request
             * before it's routed.
             */
            RequestDelegate onRequest;

            /**
             * This is the function, if any, called to rewrite HTML content
             * before it's returned.  If not provided, anti-forgery token
             * placeholders are substituted.
             */
            PostProcessDelegate postProcess;
        };

        // Lifecycle management
    public:
        ~Server();
        Server(const Server&) = delete;
        Server(Server&&) = delete;
        Server& operator=(const Server&) = delete;
        Server& operator=(Server&&) = delete;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        Server();

        /**
         * This method will cause the server to bind to the given transport
         * layer and start accepting and processing connections from clients.
         *
         * @param[in] deps
         *     These are all of the dependency objects and delegates
         *     needed by the server when it's mobilized.
         *
         * @return
         *     An indication of whether or not the method was successful
         *     is returned.
         */
        bool Mobilize(const MobilizationDependencies& deps);

        /**
         * This method stops any accepting or processing of client connections,
         * and releases the transport layer, returning the server back to the
         * state it was in before Mobilize was called.
         */
        void Demobilize();

        /**
         * This method blocks until the server stops accepting connections,
         * either because it was demobilized or because the transport
         * failed to provide a connection.
         *
         * @param[out] failure
         *     This is where to store a description of the listener
         *     failure, if there was one.
         *
         * @return
         *     An indication of whether or not accepting connections stopped
         *     because of a listener failure is returned.
         */
        bool WaitForListenerFailure(std::string& failure);

        /**
         * This method returns the admission permits currently held
         * by workers waiting for connections.
         *
         * @return
         *     The number of admission permits currently held is returned.
         */
        size_t GetPermitsInUse();

        /**
         * This method returns the largest number of admission permits
         * held at once since the server was last mobilized.
         *
         * @return
         *     The largest number of admission permits held at once
         *     is returned.
         */
        size_t GetPeakPermitsInUse();

        // IServer
    public:
        virtual SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        ) override;
        virtual std::string GetConfigurationItem(const std::string& key) override;
        virtual void SetConfigurationItem(
            const std::string& key,
            const std::string& value
        ) override;
        virtual std::shared_ptr< TimeKeeper > GetTimeKeeper() override;
        virtual std::shared_ptr< SessionStore > GetSessionStore() override;

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

#endif /* WEB_SERVER_SERVER_HPP */
