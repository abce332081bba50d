/**
 * @file SystemTimeKeeper.cpp
 *
 * This module contains the implementation of the
 * WebServer::SystemTimeKeeper class.
 *
 * © 2018 by Richard Walters
 */

#include <WebServer/SystemTimeKeeper.hpp>

namespace WebServer {

    SystemTimeKeeper::SystemTimeKeeper()
        : origin_(std::chrono::steady_clock::now())
    {
    }

    double SystemTimeKeeper::GetCurrentTime() {
        return std::chrono::duration< double >(
            std::chrono::steady_clock::now() - origin_
        ).count();
    }

}
