#ifndef WEB_SERVER_TIME_KEEPER_HPP
#define WEB_SERVER_TIME_KEEPER_HPP

/**
 * @file TimeKeeper.hpp
 *
 * This module declares the WebServer::TimeKeeper interface.
 *
 * © 2018 by Richard Walters
 */

namespace WebServer {

    /**
     * This represents the time-keeping requirements of the web server,
     * used to stamp session creation and activity.  Only differences
     * between readings are meaningful.
     */
    class TimeKeeper {
    public:
        // Lifecycle management

        virtual ~TimeKeeper() = default;

        // Methods

        /**
         * This method returns the current server time, in seconds.
         *
         * @return
         *     The current server time is returned, in seconds.
         */
        virtual double GetCurrentTime() = 0;
    };

}

#endif /* WEB_SERVER_TIME_KEEPER_HPP */
