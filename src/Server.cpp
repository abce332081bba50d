/**
 * @file Server.cpp
 *
 * This module contains the implementation of the WebServer::Server class.
 *
 * © 2018 by Richard Walters
 */

#include <chrono>
#include <condition_variable>
#include <inttypes.h>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stddef.h>
#include <stdio.h>
#include <string>
#include <system_error>
#include <SystemAbstractions/StringExtensions.hpp>
#include <thread>
#include <vector>
#include <WebServer/ConnectionAdmission.hpp>
#include <WebServer/RequestPipeline.hpp>
#include <WebServer/Server.hpp>

namespace {

    /**
     * This is the number of milliseconds to wait between rounds of
     * sweeping stale sessions.
     */
    constexpr unsigned int TIMER_POLLING_PERIOD_MILLISECONDS = 1000;

    /**
     * This is a helper function which formats the given double-precision
     * floating-point value as a string, ensuring that it will always
     * look like a floating-point value, and never an integer.
     *
     * @param[in] number
     *     This is the number to format.
     *
     * @return
     *     A string representation of the number, guaranteed not to
     *     look like an integer, is returned.
     */
    std::string FormatDoubleAsDistinctlyNotInteger(double number) {
        auto s = SystemAbstractions::sprintf("%.15lg", number);
        if (s.find_first_not_of("0123456789-") == std::string::npos) {
            s += ".0";
        }
        return s;
    }

}

namespace WebServer {

    /**
     * This contains the private properties of a Server instance.
     */
    struct Server::Impl {
        // Properties

        /**
         * This holds all configuration items for the server, as strings.
         */
        std::map< std::string, std::string > configurationItems;

        /**
         * This holds the parsed configuration items, to be used
         * the next time the server is mobilized.
         */
        Configuration configuration;

        /**
         * This holds the configuration fixed when the server
         * was last mobilized, including the application delegates.
         */
        Configuration activeConfiguration;

        /**
         * This is the transport layer currently bound by the server.
         */
        std::shared_ptr< ServerTransport > transport;

        /**
         * This is the object used to track time in the server.
         */
        std::shared_ptr< TimeKeeper > timeKeeper;

        /**
         * These are the sessions of the server's clients.
         */
        std::shared_ptr< SessionStore > sessions;

        /**
         * This bounds how many workers may wait for connections at once.
         */
        std::unique_ptr< ConnectionAdmission > admission;

        /**
         * This carries each accepted connection from request to response.
         */
        std::unique_ptr< RequestPipeline > pipeline;

        /**
         * This flag indicates whether or not the server is running.
         */
        bool mobilized = false;

        /**
         * This flag indicates whether or not the server should stop
         * accepting connections.
         */
        bool stopping = false;

        /**
         * This flag indicates whether or not the accept loop has ended.
         */
        bool acceptLoopEnded = false;

        /**
         * This flag indicates whether or not the accept loop ended
         * because the transport failed to provide a connection.
         */
        bool listenerFailed = false;

        /**
         * This describes the listener failure, if there was one.
         */
        std::string listenerFailure;

        /**
         * This is the thread which acquires admission permits and
         * starts a worker for each.
         */
        std::thread acceptLoop;

        /**
         * These are the workers that haven't yet finished, keyed by
         * worker identifier.
         */
        std::map< size_t, std::thread > workers;

        /**
         * This is the identifier to give the next worker.
         */
        size_t nextWorkerId = 0;

        /**
         * These are the workers that have finished and are waiting
         * to be joined by the reaper thread.
         */
        std::vector< std::thread > workersToJoin;

        /**
         * These are the connections on which requests are being handled.
         */
        std::set< std::shared_ptr< Connection > > activeConnections;

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is a worker thread whose sole job is to join
         * worker threads that have finished.  A worker can't join itself.
         */
        std::thread reaper;

        /**
         * This flag indicates whether or not the reaper thread should stop.
         */
        bool stopReaper = false;

        /**
         * This is used to synchronize access to the server.
         */
        std::recursive_mutex mutex;

        /**
         * This is used by the reaper thread to wait on any
         * condition that it should cause it to wake up.
         */
        std::condition_variable_any reaperWakeCondition;

        /**
         * This is used to wait for the accept loop to end,
         * or for the workers to finish.
         */
        std::condition_variable_any stateChanged;

        /**
         * This is a worker thread whose sole job is to periodically
         * drop sessions that have been idle past their expiration
         * plus retention period.
         */
        std::thread timer;

        /**
         * This flag indicates whether or not the timer thread should stop.
         */
        bool stopTimer = false;

        /**
         * This is used by the timer thread to wait on any
         * condition that it should cause it to wake up.
         */
        std::condition_variable_any timerWakeCondition;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl()
            : diagnosticsSender("WebServer::Server")
        {
        }

        /**
         * This is the template of a helper function which is used to
         * parse a configuration item and set it if the parsing is successful.
         *
         * @param ItemType
         *     This is the type of the configuration item.
         *
         * @param[in,out] item
         *     This is the configuration item to set.
         *
         * @param[in] scanFormat
         *     This is the scanf-style format specification for printing
         *     the configuration item.
         *
         * @param[in] printFormat
         *     This is the printf-style format specification for printing
         *     the configuration item.
         *
         * @param[in] description
         *     This is the string to display in diagnostic messages about
         *     the configuration item.
         *
         * @param[in] value
         *     This is the value to parse to be the new value of the item.
         */
        template<
            typename ItemType
        > void ParseConfigurationItem(
            ItemType& item,
            const char* const scanFormat,
            const char* const printFormat,
            const char* const description,
            const std::string& value
        ) {
            ItemType newItem;
            if (
                sscanf(
                    value.c_str(),
                    scanFormat,
                    &newItem
                ) == 1
            ) {
                if (item != newItem) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        0,
                        SystemAbstractions::sprintf(
                            "%s changed from %s to %s",
                            description,
                            printFormat,
                            printFormat
                        ).c_str(),
                        item,
                        newItem
                    );
                    item = newItem;
                }
            }
        }

        /**
         * This is a helper function which sets a configuration item
         * which is kept as a string.
         *
         * @param[in,out] item
         *     This is the configuration item to set.
         *
         * @param[in] description
         *     This is the string to display in diagnostic messages about
         *     the configuration item.
         *
         * @param[in] value
         *     This is the new value of the item.
         */
        void SetTextConfigurationItem(
            std::string& item,
            const char* const description,
            const std::string& value
        ) {
            if (item != value) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    0,
                    "%s changed from '%s' to '%s'",
                    description,
                    item.c_str(),
                    value.c_str()
                );
                item = value;
            }
        }

        /**
         * This method is the body of the reaper thread.
         * Until it's told to stop, it joins the workers
         * that have finished whenever it wakes up.
         */
        void Reaper() {
            std::unique_lock< decltype(mutex) > lock(mutex);
            while (!stopReaper) {
                std::vector< std::thread > oldWorkersToJoin(std::move(workersToJoin));
                workersToJoin.clear();
                {
                    lock.unlock();
                    for (auto& worker: oldWorkersToJoin) {
                        worker.join();
                    }
                    oldWorkersToJoin.clear();
                    lock.lock();
                }
                stateChanged.notify_all();
                reaperWakeCondition.wait(
                    lock,
                    [this]{
                        return (
                            stopReaper
                            || !workersToJoin.empty()
                        );
                    }
                );
            }
        }

        /**
         * This method is the body of the timer thread.
         * Until it's told to stop, it drops stale sessions
         * once per polling period.
         */
        void Timer() {
            const auto idleLimit = (
                activeConfiguration.sessionExpirationSeconds
                + activeConfiguration.sessionRetentionSeconds
            );
            std::unique_lock< decltype(mutex) > lock(mutex);
            while (!stopTimer) {
                lock.unlock();
                const auto dropped = sessions->DropStale(idleLimit);
                if (dropped > 0) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        2, "Dropped %zu stale session(s)",
                        dropped
                    );
                }
                lock.lock();
                (void)timerWakeCondition.wait_for(
                    lock,
                    std::chrono::milliseconds(TIMER_POLLING_PERIOD_MILLISECONDS),
                    [this]{ return stopTimer; }
                );
            }
        }

        /**
         * This method records that the transport failed to provide
         * a connection, which stops the server from accepting any more.
         *
         * @param[in] failure
         *     This describes the failure.
         */
        void OnListenerFailure(const std::string& failure) {
            {
                std::lock_guard< decltype(mutex) > lock(mutex);
                if (stopping) {
                    return;
                }
                stopping = true;
                listenerFailed = true;
                listenerFailure = failure;
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Listener failure: %s",
                failure.c_str()
            );
            transport->ReleaseNetwork();
            stateChanged.notify_all();
        }

        /**
         * This method is the body of the accept loop thread.
         * Until the server stops, it acquires an admission permit
         * and starts a worker to await the next connection.
         */
        void AcceptLoop() {
            for (;;) {
                admission->Acquire();
                std::lock_guard< decltype(mutex) > lock(mutex);
                if (stopping) {
                    admission->Release();
                    break;
                }
                const auto id = nextWorkerId++;
                try {
                    workers[id] = std::thread(&Impl::Worker, this, id);
                } catch (const std::system_error& e) {
                    workers.erase(id);
                    admission->Release();
                    OnListenerFailure(
                        SystemAbstractions::sprintf(
                            "unable to start worker: %s",
                            e.what()
                        )
                    );
                    break;
                }
            }
            std::lock_guard< decltype(mutex) > lock(mutex);
            acceptLoopEnded = true;
            stateChanged.notify_all();
        }

        /**
         * This method is the body of each worker thread.  It awaits
         * the next connection, releasing its admission permit as soon
         * as it has one, and then handles the request on the connection.
         *
         * @param[in] id
         *     This identifies the worker.
         */
        void Worker(size_t id) {
            const auto connection = transport->AwaitConnection();
            admission->Release();
            if (connection == nullptr) {
                OnListenerFailure("transport stopped providing connections");
            } else {
                bool accepted = false;
                {
                    std::lock_guard< decltype(mutex) > lock(mutex);
                    if (!stopping) {
                        (void)activeConnections.insert(connection);
                        accepted = true;
                    }
                }
                if (accepted) {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        2, "New connection from %s",
                        connection->GetPeerId().c_str()
                    );
                    pipeline->HandleConnection(connection);
                    std::lock_guard< decltype(mutex) > lock(mutex);
                    (void)activeConnections.erase(connection);
                } else {
                    connection->Break(false);
                }
            }
            std::lock_guard< decltype(mutex) > lock(mutex);
            const auto self = workers.find(id);
            workersToJoin.push_back(std::move(self->second));
            workers.erase(self);
            reaperWakeCondition.notify_all();
            stateChanged.notify_all();
        }

        /**
         * This method returns the addresses, as host and optional port,
         * on which the server's clients may reach it.
         *
         * @return
         *     The addresses on which the server is listening is returned.
         */
        std::vector< std::string > GetListeningAddresses() {
            std::vector< std::string > listeningAddresses;
            for (const auto& address: transport->GetBoundAddresses()) {
                if (activeConfiguration.port == DEFAULT_PORT_NUMBER) {
                    listeningAddresses.push_back(address);
                } else {
                    listeningAddresses.push_back(
                        SystemAbstractions::sprintf(
                            "%s:%" PRIu16,
                            address.c_str(),
                            activeConfiguration.port
                        )
                    );
                }
            }
            return listeningAddresses;
        }
    };

    Server::~Server() {
        Demobilize();
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->stopReaper = true;
            impl_->reaperWakeCondition.notify_all();
        }
        impl_->reaper.join();
    }

    Server::Server()
        : impl_(new Impl)
    {
        const auto& configuration = impl_->configuration;
        impl_->configurationItems["Port"] = SystemAbstractions::sprintf("%" PRIu16, configuration.port);
        impl_->configurationItems["MaxSimultaneousConnections"] = SystemAbstractions::sprintf("%zu", configuration.maxSimultaneousConnections);
        impl_->configurationItems["SessionExpiration"] = FormatDoubleAsDistinctlyNotInteger(configuration.sessionExpirationSeconds);
        impl_->configurationItems["SessionRetention"] = FormatDoubleAsDistinctlyNotInteger(configuration.sessionRetentionSeconds);
        impl_->configurationItems["PublicAddress"] = configuration.publicAddress;
        impl_->configurationItems["ValidationTokenPlaceholder"] = configuration.validationTokenPlaceholder;
        impl_->configurationItems["ValidationTokenName"] = configuration.validationTokenName;
        impl_->configurationItems["HeaderLineLimit"] = SystemAbstractions::sprintf("%zu", configuration.headerLineLimit);
        impl_->configurationItems["MaxContentLength"] = SystemAbstractions::sprintf("%zu", configuration.maxContentLength);
        impl_->reaper = std::thread(&Impl::Reaper, impl_.get());
    }

    bool Server::Mobilize(const MobilizationDependencies& deps) {
        if (impl_->mobilized) {
            return false;
        }
        if (deps.route == nullptr) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Unable to mobilize: no route delegate provided"
            );
            return false;
        }
        if (deps.onError == nullptr) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Unable to mobilize: no error delegate provided"
            );
            return false;
        }
        if (
            (deps.transport == nullptr)
            || (deps.timeKeeper == nullptr)
        ) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Unable to mobilize: missing transport or time keeper"
            );
            return false;
        }
        impl_->transport = deps.transport;
        if (!impl_->transport->BindNetwork(impl_->configuration.port)) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Unable to bind port %" PRIu16,
                impl_->configuration.port
            );
            impl_->transport = nullptr;
            return false;
        }
        impl_->configuration.port = impl_->transport->GetBoundPort();
        impl_->configurationItems["Port"] = SystemAbstractions::sprintf("%" PRIu16, impl_->configuration.port);
        impl_->activeConfiguration = impl_->configuration;
        impl_->activeConfiguration.route = deps.route;
        impl_->activeConfiguration.onError = deps.onError;
        impl_->activeConfiguration.onRequest = deps.onRequest;
        impl_->activeConfiguration.postProcess = deps.postProcess;
        for (const auto& address: impl_->GetListeningAddresses()) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                3, "Listening on http://%s/",
                address.c_str()
            );
        }
        if (!impl_->activeConfiguration.publicAddress.empty()) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                3, "Public address is %s",
                impl_->activeConfiguration.publicAddress.c_str()
            );
        }
        impl_->timeKeeper = deps.timeKeeper;
        impl_->pipeline = nullptr;
        impl_->sessions = std::make_shared< SessionStore >(
            impl_->activeConfiguration,
            impl_->timeKeeper
        );
        impl_->admission.reset(new ConnectionAdmission(impl_->activeConfiguration));
        impl_->pipeline.reset(
            new RequestPipeline(
                impl_->activeConfiguration,
                *impl_->sessions,
                impl_->diagnosticsSender
            )
        );
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->stopping = false;
            impl_->acceptLoopEnded = false;
            impl_->listenerFailed = false;
            impl_->listenerFailure.clear();
            impl_->stopTimer = false;
            impl_->mobilized = true;
        }
        impl_->timer = std::thread(&Impl::Timer, impl_.get());
        impl_->acceptLoop = std::thread(&Impl::AcceptLoop, impl_.get());
        return true;
    }

    void Server::Demobilize() {
        if (!impl_->mobilized) {
            return;
        }
        std::set< std::shared_ptr< Connection > > connections;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->stopping = true;
            connections = impl_->activeConnections;
        }
        impl_->transport->ReleaseNetwork();
        for (const auto& connection: connections) {
            connection->Break(false);
        }
        connections.clear();
        impl_->acceptLoop.join();
        std::vector< std::thread > oldWorkersToJoin;
        {
            std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->stateChanged.wait(
                lock,
                [this]{ return impl_->workers.empty(); }
            );
            oldWorkersToJoin = std::move(impl_->workersToJoin);
            impl_->workersToJoin.clear();
        }
        for (auto& worker: oldWorkersToJoin) {
            worker.join();
        }
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->stopTimer = true;
            impl_->timerWakeCondition.notify_all();
        }
        impl_->timer.join();
        impl_->transport = nullptr;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            impl_->mobilized = false;
            impl_->stateChanged.notify_all();
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            3, "Stopped listening"
        );
    }

    bool Server::WaitForListenerFailure(std::string& failure) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->stateChanged.wait(
            lock,
            [this]{
                return (
                    !impl_->mobilized
                    || impl_->acceptLoopEnded
                );
            }
        );
        if (impl_->listenerFailed) {
            failure = impl_->listenerFailure;
            return true;
        } else {
            return false;
        }
    }

    size_t Server::GetPermitsInUse() {
        if (impl_->admission == nullptr) {
            return 0;
        }
        return impl_->admission->GetPermitsInUse();
    }

    size_t Server::GetPeakPermitsInUse() {
        if (impl_->admission == nullptr) {
            return 0;
        }
        return impl_->admission->GetPeakPermitsInUse();
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Server::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    std::string Server::GetConfigurationItem(const std::string& key) {
        const auto entry = impl_->configurationItems.find(key);
        if (entry == impl_->configurationItems.end()) {
            return "";
        } else {
            return entry->second;
        }
    }

    void Server::SetConfigurationItem(
        const std::string& key,
        const std::string& value
    ) {
        auto& configuration = impl_->configuration;
        impl_->configurationItems[key] = value;
        if (key == "Port") {
            impl_->ParseConfigurationItem(configuration.port, "%" SCNu16, "%" PRIu16, "Port number", value);
        } else if (key == "MaxSimultaneousConnections") {
            impl_->ParseConfigurationItem(configuration.maxSimultaneousConnections, "%zu", "%zu", "Maximum simultaneous connections", value);
        } else if (key == "SessionExpiration") {
            impl_->ParseConfigurationItem(configuration.sessionExpirationSeconds, "%lf", "%lf", "Session expiration", value);
        } else if (key == "SessionRetention") {
            impl_->ParseConfigurationItem(configuration.sessionRetentionSeconds, "%lf", "%lf", "Session retention", value);
        } else if (key == "PublicAddress") {
            impl_->SetTextConfigurationItem(configuration.publicAddress, "Public address", value);
        } else if (key == "ValidationTokenPlaceholder") {
            impl_->SetTextConfigurationItem(configuration.validationTokenPlaceholder, "Validation token placeholder", value);
        } else if (key == "ValidationTokenName") {
            impl_->SetTextConfigurationItem(configuration.validationTokenName, "Validation token name", value);
        } else if (key == "HeaderLineLimit") {
            impl_->ParseConfigurationItem(configuration.headerLineLimit, "%zu", "%zu", "Header line limit", value);
        } else if (key == "MaxContentLength") {
            impl_->ParseConfigurationItem(configuration.maxContentLength, "%zu", "%zu", "Maximum content length", value);
        }
    }

    std::shared_ptr< TimeKeeper > Server::GetTimeKeeper() {
        return impl_->timeKeeper;
    }

    std::shared_ptr< SessionStore > Server::GetSessionStore() {
        return impl_->sessions;
    }

}
