/**
 * @file ConnectionAdmission.cpp
 *
 * This module contains the implementation of the
 * WebServer::ConnectionAdmission class.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <WebServer/ConnectionAdmission.hpp>

namespace WebServer {

    /**
     * This contains the private properties of a ConnectionAdmission
     * instance.
     */
    struct ConnectionAdmission::Impl {
        /**
         * This is the number of permits in the pool.
         */
        size_t capacity = 1;

        /**
         * This is the number of permits currently taken.
         */
        size_t inUse = 0;

        /**
         * This is the largest value inUse has had.
         */
        size_t peakInUse = 0;

        /**
         * This is used to synchronize access to the pool.
         */
        mutable std::mutex mutex;

        /**
         * This is used to wait for a permit to be released.
         */
        std::condition_variable permitReleased;
    };

    ConnectionAdmission::~ConnectionAdmission() = default;

    ConnectionAdmission::ConnectionAdmission(const Configuration& configuration)
        : impl_(new Impl)
    {
        impl_->capacity = std::max(
            configuration.maxSimultaneousConnections,
            (size_t)1
        );
    }

    void ConnectionAdmission::Acquire() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->permitReleased.wait(
            lock,
            [this]{ return impl_->inUse < impl_->capacity; }
        );
        ++impl_->inUse;
        impl_->peakInUse = std::max(impl_->peakInUse, impl_->inUse);
    }

    void ConnectionAdmission::Release() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->inUse > 0) {
            --impl_->inUse;
        }
        impl_->permitReleased.notify_one();
    }

    size_t ConnectionAdmission::GetCapacity() const {
        return impl_->capacity;
    }

    size_t ConnectionAdmission::GetPermitsInUse() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->inUse;
    }

    size_t ConnectionAdmission::GetPeakPermitsInUse() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->peakInUse;
    }

}
