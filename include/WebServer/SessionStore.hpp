#ifndef WEB_SERVER_SESSION_STORE_HPP
#define WEB_SERVER_SESSION_STORE_HPP

/**
 * @file SessionStore.hpp
 *
 * This module declares the WebServer::SessionStore class.
 *
 * © 2018 by Richard Walters
 */

#include "Configuration.hpp"
#include "Session.hpp"
#include "TimeKeeper.hpp"

#include <memory>
#include <stddef.h>
#include <string>

namespace WebServer {

    /**
     * This owns the live sessions of the web server, one per client key.
     *
     * Expiration is advisory: the store never refuses a request on its
     * own.  The router checks IsExpired for pages which require a live
     * session, and signals ServerError::ExpiredSession itself.
     */
    class SessionStore {
        // Lifecycle management
    public:
        ~SessionStore();
        SessionStore(const SessionStore&) = delete;
        SessionStore(SessionStore&&) = delete;
        SessionStore& operator=(const SessionStore&) = delete;
        SessionStore& operator=(SessionStore&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] configuration
         *     This holds the session expiration period to use.
         *
         * @param[in] timeKeeper
         *     This is the object used to stamp session activity.
         */
        SessionStore(
            const Configuration& configuration,
            std::shared_ptr< TimeKeeper > timeKeeper
        );

        /**
         * This method returns the session of the given client, creating
         * it if the client has none.  Concurrent calls for the same key
         * all return the same session.
         *
         * @param[in] clientKey
         *     This identifies the client whose session to return.
         *
         * @return
         *     The session of the given client is returned.
         */
        std::shared_ptr< Session > Resolve(const std::string& clientKey);

        /**
         * This method records that the session's client has just
         * completed a request.
         *
         * @param[in] session
         *     This is the session to update.
         */
        void Touch(std::shared_ptr< Session > session);

        /**
         * This method returns an indication of whether or not more than
         * the given number of seconds have elapsed since the session's
         * client last completed a request.
         *
         * @param[in] session
         *     This is the session to check.
         *
         * @param[in] ttlSeconds
         *     This is the number of seconds a session may stay idle.
         *
         * @return
         *     An indication of whether or not the session
         *     has expired is returned.
         */
        bool IsExpired(
            std::shared_ptr< Session > session,
            double ttlSeconds
        );

        /**
         * This method returns an indication of whether or not the given
         * session has stayed idle longer than the configured session
         * expiration period.
         *
         * @param[in] session
         *     This is the session to check.
         *
         * @return
         *     An indication of whether or not the session
         *     has expired is returned.
         */
        bool IsExpired(std::shared_ptr< Session > session);

        /**
         * This method removes the session of the given client, if any,
         * so that the client's next request starts a new session.
         *
         * @param[in] clientKey
         *     This identifies the client whose session to remove.
         */
        void Remove(const std::string& clientKey);

        /**
         * This method removes every session that has stayed idle
         * longer than the given number of seconds.
         *
         * @param[in] idleLimitSeconds
         *     This is the number of seconds after which idle sessions
         *     are removed.
         *
         * @return
         *     The number of sessions removed is returned.
         */
        size_t DropStale(double idleLimitSeconds);

        /**
         * This method returns the number of sessions in the store.
         *
         * @return
         *     The number of sessions in the store is returned.
         */
        size_t GetSessionCount();

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

#endif /* WEB_SERVER_SESSION_STORE_HPP */
