#ifndef WEB_SERVER_SYSTEM_TIME_KEEPER_HPP
#define WEB_SERVER_SYSTEM_TIME_KEEPER_HPP

/**
 * @file SystemTimeKeeper.hpp
 *
 * This module declares the WebServer::SystemTimeKeeper class.
 *
 * © 2018 by Richard Walters
 */

#include "TimeKeeper.hpp"

#include <chrono>

namespace WebServer {

    /**
     * This is the TimeKeeper used outside of tests.  It measures seconds
     * on the monotonic clock, counting from its construction.
     */
    class SystemTimeKeeper
        : public TimeKeeper
    {
        // Public methods
    public:
        SystemTimeKeeper();

        // TimeKeeper
    public:
        virtual double GetCurrentTime() override;

        // Private properties
    private:
        /**
         * This is the clock reading taken when the object was constructed.
         */
        std::chrono::steady_clock::time_point origin_;
    };

}

#endif /* WEB_SERVER_SYSTEM_TIME_KEEPER_HPP */
