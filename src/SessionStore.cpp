/**
 * @file SessionStore.cpp
 *
 * This module contains the implementation of the WebServer::SessionStore
 * class.
 *
 * © 2018 by Richard Walters
 */

#include <map>
#include <mutex>
#include <WebServer/SessionStore.hpp>

namespace WebServer {

    /**
     * This contains the private properties of a SessionStore instance.
     */
    struct SessionStore::Impl {
        /**
         * This is the number of seconds a session may stay idle
         * before it's considered expired.
         */
        double sessionExpiration = DEFAULT_SESSION_EXPIRATION_SECONDS;

        /**
         * This is the object used to stamp session activity.
         */
        std::shared_ptr< TimeKeeper > timeKeeper;

        /**
         * These are the live sessions, keyed by client key.
         */
        std::map< std::string, std::shared_ptr< Session > > sessions;

        /**
         * This is used to synchronize access to the sessions.
         */
        std::mutex mutex;
    };

    SessionStore::~SessionStore() = default;

    SessionStore::SessionStore(
        const Configuration& configuration,
        std::shared_ptr< TimeKeeper > timeKeeper
    )
        : impl_(new Impl)
    {
        impl_->sessionExpiration = configuration.sessionExpirationSeconds;
        impl_->timeKeeper = timeKeeper;
    }

    std::shared_ptr< Session > SessionStore::Resolve(const std::string& clientKey) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        auto& session = impl_->sessions[clientKey];
        if (session == nullptr) {
            session = std::make_shared< Session >(
                clientKey,
                impl_->timeKeeper->GetCurrentTime()
            );
        }
        return session;
    }

    void SessionStore::Touch(std::shared_ptr< Session > session) {
        session->SetLastActivityTime(impl_->timeKeeper->GetCurrentTime());
    }

    bool SessionStore::IsExpired(
        std::shared_ptr< Session > session,
        double ttlSeconds
    ) {
        const auto now = impl_->timeKeeper->GetCurrentTime();
        return (now - session->GetLastActivityTime() > ttlSeconds);
    }

    bool SessionStore::IsExpired(std::shared_ptr< Session > session) {
        return IsExpired(session, impl_->sessionExpiration);
    }

    void SessionStore::Remove(const std::string& clientKey) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        (void)impl_->sessions.erase(clientKey);
    }

    size_t SessionStore::DropStale(double idleLimitSeconds) {
        const auto now = impl_->timeKeeper->GetCurrentTime();
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        size_t dropped = 0;
        for (auto entry = impl_->sessions.begin(); entry != impl_->sessions.end();) {
            if (now - entry->second->GetLastActivityTime() > idleLimitSeconds) {
                entry = impl_->sessions.erase(entry);
                ++dropped;
            } else {
                ++entry;
            }
        }
        return dropped;
    }

    size_t SessionStore::GetSessionCount() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->sessions.size();
    }

}
