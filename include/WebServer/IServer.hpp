#ifndef WEB_SERVER_I_SERVER_HPP
#define WEB_SERVER_I_SERVER_HPP

/**
 * @file IServer.hpp
 *
 * This module declares the WebServer::IServer interface.
 *
 * © 2018 by Richard Walters
 */

#include "SessionStore.hpp"
#include "TimeKeeper.hpp"

#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace WebServer {

    /**
     * This is public interface to the web server from applications
     * and other modules that are outside of the web server.
     */
    class IServer {
    public:
        /**
         * This method forms a new subscription to diagnostic
         * messages published by the sender.
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
        virtual SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        ) = 0;

        /**
         * This method returns the value of the given server
         * configuration item.
         *
         * @param[in] key
         *     This is the key identifying the configuration item
         *     whose value should be returned.
         *
         * @return
         *     The value of the configuration item is returned.
         */
        virtual std::string GetConfigurationItem(const std::string& key) = 0;

        /**
         * This method sets the value of the given server configuration item.
         * Items take effect the next time the server is mobilized.
         *
         * @param[in] key
         *     This is the key identifying the configuration item
         *     whose value should be set.
         *
         * @param[in] value
         *     This is the value to set for the configuration item.
         */
        virtual void SetConfigurationItem(
            const std::string& key,
            const std::string& value
        ) = 0;

        /**
         * This returns the object responsible for tracking web server time.
         *
         * @return
         *     The object responsible for tracking web server time
         *     is returned.
         *
         * @retval nullptr
         *     This is returned if the server has never been mobilized.
         */
        virtual std::shared_ptr< TimeKeeper > GetTimeKeeper() = 0;

        /**
         * This returns the store holding the sessions of the server's
         * clients.
         *
         * @return
         *     The store holding the sessions of the server's clients
         *     is returned.
         *
         * @retval nullptr
         *     This is returned if the server has never been mobilized.
         */
        virtual std::shared_ptr< SessionStore > GetSessionStore() = 0;
    };

}

#endif /* WEB_SERVER_I_SERVER_HPP */
