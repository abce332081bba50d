#ifndef WEB_SERVER_CONNECTION_ADMISSION_HPP
#define WEB_SERVER_CONNECTION_ADMISSION_HPP

/**
 * @file ConnectionAdmission.hpp
 *
 * This module declares the WebServer::ConnectionAdmission class.
 *
 * © 2018 by Richard Walters
 */

#include "Configuration.hpp"

#include <memory>
#include <stddef.h>

namespace WebServer {

    /**
     * This is a fixed pool of admission permits.  The server's accept
     * loop acquires a permit before starting each worker that waits for
     * a new connection, and the worker releases it as soon as it has
     * accepted one.  The capacity is fixed at construction.
     */
    class ConnectionAdmission {
        // Lifecycle management
    public:
        ~ConnectionAdmission();
        ConnectionAdmission(const ConnectionAdmission&) = delete;
        ConnectionAdmission(ConnectionAdmission&&) = delete;
        ConnectionAdmission& operator=(const ConnectionAdmission&) = delete;
        ConnectionAdmission& operator=(ConnectionAdmission&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] configuration
         *     This holds the capacity of the pool.  A capacity of zero
         *     is treated as one.
         */
        explicit ConnectionAdmission(const Configuration& configuration);

        /**
         * This method blocks until a permit is available, and then
         * takes it.
         */
        void Acquire();

        /**
         * This method returns a permit to the pool.  Each call must be
         * paired with exactly one earlier call to Acquire.
         */
        void Release();

        /**
         * This method returns the number of permits in the pool.
         *
         * @return
         *     The number of permits in the pool is returned.
         */
        size_t GetCapacity() const;

        /**
         * This method returns the number of permits currently taken.
         *
         * @return
         *     The number of permits currently taken is returned.
         */
        size_t GetPermitsInUse() const;

        /**
         * This method returns the largest number of permits
         * that have been taken at the same time.
         *
         * @return
         *     The largest number of permits taken at the same time
         *     is returned.
         */
        size_t GetPeakPermitsInUse() const;

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

#endif /* WEB_SERVER_CONNECTION_ADMISSION_HPP */
