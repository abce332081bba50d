#ifndef WEB_SERVER_SESSION_HPP
#define WEB_SERVER_SESSION_HPP

/**
 * @file Session.hpp
 *
 * This module declares the WebServer::Session class.
 *
 * © 2018 by Richard Walters
 */

#include <map>
#include <mutex>
#include <string>

namespace WebServer {

    /**
     * This holds the state the web server keeps about one client,
     * across all the requests that client makes.
     *
     * Sessions are created and owned by a SessionStore.  All methods
     * are safe to call concurrently, though requests of one client
     * racing on the same values are not serialized in any way.
     */
    class Session {
        // Lifecycle management
    public:
        Session(const Session&) = delete;
        Session(Session&&) = delete;
        Session& operator=(const Session&) = delete;
        Session& operator=(Session&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] clientKey
         *     This identifies the client to whom the session belongs.
         *
         * @param[in] creationTime
         *     This is the server time at which the session is created.
         *     It is also the session's initial last-activity time.
         */
        Session(
            const std::string& clientKey,
            double creationTime
        );

        /**
         * This method returns the key identifying the client
         * to whom the session belongs.
         *
         * @return
         *     The client key of the session is returned.
         */
        std::string GetClientKey() const;

        /**
         * This method returns the server time at which
         * the session was created.
         *
         * @return
         *     The creation time of the session is returned.
         */
        double GetCreationTime() const;

        /**
         * This method returns the server time at which the session's
         * client last completed a request.
         *
         * @return
         *     The last-activity time of the session is returned.
         */
        double GetLastActivityTime() const;

        /**
         * This method sets the server time at which the session's
         * client last completed a request.
         *
         * @param[in] time
         *     This is the new last-activity time of the session.
         */
        void SetLastActivityTime(double time);

        /**
         * This method returns an indication of whether or not
         * a value is stored in the session under the given name.
         *
         * @param[in] name
         *     This is the name of the value to check.
         *
         * @return
         *     An indication of whether or not a value is stored
         *     under the given name is returned.
         */
        bool HasValue(const std::string& name) const;

        /**
         * This method returns the value stored in the session
         * under the given name.
         *
         * @param[in] name
         *     This is the name of the value to return.
         *
         * @return
         *     The value stored under the given name is returned,
         *     or an empty string if there is none.
         */
        std::string GetValue(const std::string& name) const;

        /**
         * This method stores a value in the session under the given
         * name, replacing any value already stored under it.
         *
         * @param[in] name
         *     This is the name under which to store the value.
         *
         * @param[in] value
         *     This is the value to store.
         */
        void SetValue(
            const std::string& name,
            const std::string& value
        );

        /**
         * This method removes any value stored in the session
         * under the given name.
         *
         * @param[in] name
         *     This is the name of the value to remove.
         */
        void RemoveValue(const std::string& name);

        // Private properties
    private:
        /**
         * This identifies the client to whom the session belongs.
         */
        const std::string clientKey_;

        /**
         * This is the server time at which the session was created.
         */
        const double creationTime_;

        /**
         * This is the server time at which the session's client
         * last completed a request.
         */
        double lastActivityTime_;

        /**
         * These are the named values stored in the session.
         */
        std::map< std::string, std::string > values_;

        /**
         * This is used to synchronize access to the session.
         */
        mutable std::mutex mutex_;
    };

}

#endif /* WEB_SERVER_SESSION_HPP */
