/**
 * @file Session.cpp
 *
 * This module contains the implementation of the WebServer::Session class.
 *
 * © 2018 by Richard Walters
 */

#include <WebServer/Session.hpp>

namespace WebServer {

    Session::Session(
        const std::string& clientKey,
        double creationTime
    )
        : clientKey_(clientKey)
        , creationTime_(creationTime)
        , lastActivityTime_(creationTime)
    {
    }

    std::string Session::GetClientKey() const {
        return clientKey_;
    }

    double Session::GetCreationTime() const {
        return creationTime_;
    }

    double Session::GetLastActivityTime() const {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        return lastActivityTime_;
    }

    void Session::SetLastActivityTime(double time) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        lastActivityTime_ = time;
    }

    bool Session::HasValue(const std::string& name) const {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        return (values_.find(name) != values_.end());
    }

    std::string Session::GetValue(const std::string& name) const {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        const auto entry = values_.find(name);
        if (entry == values_.end()) {
            return "";
        } else {
            return entry->second;
        }
    }

    void Session::SetValue(
        const std::string& name,
        const std::string& value
    ) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        values_[name] = value;
    }

    void Session::RemoveValue(const std::string& name) {
        std::lock_guard< decltype(mutex_) > lock(mutex_);
        (void)values_.erase(name);
    }

}
