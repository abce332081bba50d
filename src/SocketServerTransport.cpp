/**
 * @file SocketServerTransport.cpp
 *
 * This module contains the implementation of the
 * WebServer::SocketServerTransport class.
 *
 * © 2018 by Richard Walters
 */

#include <arpa/inet.h>
#include <atomic>
#include <condition_variable>
#include <errno.h>
#include <ifaddrs.h>
#include <inttypes.h>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <string.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <unistd.h>
#include <WebServer/SocketServerTransport.hpp>

namespace {

    /**
     * This is the address on which the transport always listens.
     */
    const std::string LOOPBACK_ADDRESS = "127.0.0.1";

    /**
     * This is the name under which the loopback address is reported.
     */
    const std::string LOOPBACK_NAME = "localhost";

    /**
     * This is the number of bytes to try to receive from a connection
     * at a time.
     */
    constexpr size_t RECEIVE_BUFFER_SIZE = 65536;

    /**
     * This function formats the given IPv4 socket address
     * as dotted-decimal text.
     *
     * @param[in] address
     *     This is the socket address to format.
     *
     * @return
     *     The dotted-decimal form of the address is returned.
     */
    std::string FormatAddress(const struct sockaddr_in& address) {
        char buffer[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &address.sin_addr, buffer, sizeof(buffer)) == NULL) {
            return "";
        }
        return buffer;
    }

    /**
     * This function returns the dotted-decimal IPv4 addresses on which
     * to listen: the loopback address, followed by the address of every
     * local network interface.
     *
     * @return
     *     The addresses on which to listen are returned.
     */
    std::vector< std::string > GetListenAddresses() {
        std::vector< std::string > addresses{LOOPBACK_ADDRESS};
        struct ifaddrs* interfaces;
        if (getifaddrs(&interfaces) != 0) {
            return addresses;
        }
        for (auto interface = interfaces; interface != NULL; interface = interface->ifa_next) {
            if (
                (interface->ifa_addr == NULL)
                || (interface->ifa_addr->sa_family != AF_INET)
            ) {
                continue;
            }
            const auto address = FormatAddress(*(const struct sockaddr_in*)interface->ifa_addr);
            if (address.empty()) {
                continue;
            }
            bool duplicate = false;
            for (const auto& existingAddress: addresses) {
                if (existingAddress == address) {
                    duplicate = true;
                    break;
                }
            }
            if (!duplicate) {
                addresses.push_back(address);
            }
        }
        freeifaddrs(interfaces);
        return addresses;
    }

    /**
     * This is the implementation of WebServer::Connection
     * for a connected TCP socket.
     */
    class SocketConnection
        : public WebServer::Connection
    {
        // Lifecycle management
    public:
        ~SocketConnection() {
            (void)close(sock_);
        }
        SocketConnection(const SocketConnection&) = delete;
        SocketConnection(SocketConnection&&) = delete;
        SocketConnection& operator=(const SocketConnection&) = delete;
        SocketConnection& operator=(SocketConnection&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] sock
         *     This is the connected socket, which the connection owns.
         *
         * @param[in] peer
         *     This is the address of the remote end of the socket.
         */
        SocketConnection(
            int sock,
            const struct sockaddr_in& peer
        )
            : sock_(sock)
        {
            peerAddress_ = FormatAddress(peer);
            peerId_ = SystemAbstractions::sprintf(
                "%s:%" PRIu16,
                peerAddress_.c_str(),
                ntohs(peer.sin_port)
            );
            struct sockaddr_in host;
            socklen_t hostLength = sizeof(host);
            if (getsockname(sock_, (struct sockaddr*)&host, &hostLength) == 0) {
                hostAddress_ = SystemAbstractions::sprintf(
                    "%s:%" PRIu16,
                    FormatAddress(host).c_str(),
                    ntohs(host.sin_port)
                );
            }
        }

        // WebServer::Connection
    public:
        virtual std::string GetPeerId() override {
            return peerId_;
        }

        virtual std::string GetPeerAddress() override {
            return peerAddress_;
        }

        virtual std::string GetHostAddress() override {
            return hostAddress_;
        }

        virtual bool ReceiveData(std::vector< uint8_t >& data) override {
            data.resize(RECEIVE_BUFFER_SIZE);
            for (;;) {
                const auto amountReceived = recv(sock_, data.data(), data.size(), 0);
                if (amountReceived > 0) {
                    data.resize((size_t)amountReceived);
                    return true;
                }
                if (
                    (amountReceived < 0)
                    && (errno == EINTR)
                ) {
                    continue;
                }
                data.clear();
                return false;
            }
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            std::lock_guard< decltype(sendMutex_) > lock(sendMutex_);
            size_t amountSent = 0;
            while (
                !broken_
                && (amountSent < data.size())
            ) {
                const auto result = send(
                    sock_,
                    data.data() + amountSent,
                    data.size() - amountSent,
                    MSG_NOSIGNAL
                );
                if (result < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    break;
                }
                amountSent += (size_t)result;
            }
        }

        virtual void Break(bool clean) override {
            // A send blocked on a peer that stopped reading fails
            // once the socket is shut down.
            if (broken_.exchange(true)) {
                return;
            }
            (void)shutdown(sock_, clean ? SHUT_WR : SHUT_RDWR);
        }

        // Private properties
    private:
        /**
         * This is the connected socket.
         */
        int sock_;

        /**
         * This is the network address of the peer.
         */
        std::string peerAddress_;

        /**
         * This identifies the peer by address and port.
         */
        std::string peerId_;

        /**
         * This is the local address and port of the connection.
         */
        std::string hostAddress_;

        /**
         * This flag indicates whether or not the connection was broken.
         */
        std::atomic< bool > broken_{false};

        /**
         * This is used to keep data from concurrent senders
         * from being interleaved.
         */
        std::mutex sendMutex_;
    };

}

namespace WebServer {

    /**
     * This contains the private properties of a SocketServerTransport
     * instance.
     */
    struct SocketServerTransport::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * These are the listening sockets.
         */
        std::vector< int > listeners;

        /**
         * These are the host names or addresses on which the transport
         * is listening.
         */
        std::vector< std::string > boundAddresses;

        /**
         * This is the port number on which the transport is listening.
         */
        uint16_t port = 0;

        /**
         * This is signaled to release callers blocked in AwaitConnection.
         */
        int wakeEvent = -1;

        /**
         * This flag indicates whether or not the network has been released.
         */
        bool released = true;

        /**
         * This is the number of callers currently blocked
         * in AwaitConnection.
         */
        size_t waiters = 0;

        /**
         * This is used to synchronize access to the transport.
         */
        std::mutex mutex;

        /**
         * This is used to wait for callers of AwaitConnection
         * to leave, before closing the listening sockets.
         */
        std::condition_variable waitersLeft;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl()
            : diagnosticsSender("WebServer::SocketServerTransport")
        {
        }

        /**
         * This method opens a listening socket on the given address
         * and the current port.  If the current port is zero,
         * an ephemeral port is picked, and becomes the current port.
         *
         * @param[in] address
         *     This is the dotted-decimal address on which to listen.
         *
         * @return
         *     An indication of whether or not the method was successful
         *     is returned.
         */
        bool Listen(const std::string& address) {
            struct sockaddr_in socketAddress;
            (void)memset(&socketAddress, 0, sizeof(socketAddress));
            socketAddress.sin_family = AF_INET;
            socketAddress.sin_port = htons(port);
            if (inet_pton(AF_INET, address.c_str(), &socketAddress.sin_addr) != 1) {
                return false;
            }
            const auto sock = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
            if (sock < 0) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "error creating socket for %s: %s",
                    address.c_str(),
                    strerror(errno)
                );
                return false;
            }
            int option = 1;
            (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &option, sizeof(option));
            if (
                (bind(sock, (const struct sockaddr*)&socketAddress, sizeof(socketAddress)) != 0)
                || (listen(sock, SOMAXCONN) != 0)
            ) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "error listening on %s:%" PRIu16 ": %s",
                    address.c_str(),
                    port,
                    strerror(errno)
                );
                (void)close(sock);
                return false;
            }
            if (port == 0) {
                socklen_t socketAddressLength = sizeof(socketAddress);
                if (getsockname(sock, (struct sockaddr*)&socketAddress, &socketAddressLength) == 0) {
                    port = ntohs(socketAddress.sin_port);
                }
            }
            listeners.push_back(sock);
            if (address == LOOPBACK_ADDRESS) {
                boundAddresses.push_back(LOOPBACK_NAME);
            } else {
                boundAddresses.push_back(address);
            }
            return true;
        }

        /**
         * This method closes all listening sockets and the wake event.
         */
        void CloseAll() {
            for (auto listener: listeners) {
                (void)close(listener);
            }
            listeners.clear();
            boundAddresses.clear();
            if (wakeEvent >= 0) {
                (void)close(wakeEvent);
                wakeEvent = -1;
            }
        }

        /**
         * This method waits for any listening socket to become ready
         * and accepts the next connection from it.
         *
         * @param[in] fds
         *     These are the listening sockets to wait on, with the
         *     wake event last.
         *
         * @return
         *     The newly accepted connection is returned.
         *
         * @retval nullptr
         *     This is returned if the network was released, or if
         *     waiting or accepting failed.
         */
        std::shared_ptr< Connection > Accept(std::vector< struct pollfd >& fds) {
            for (;;) {
                for (auto& fd: fds) {
                    fd.revents = 0;
                }
                if (poll(fds.data(), (nfds_t)fds.size(), -1) < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                        "error waiting for connections: %s",
                        strerror(errno)
                    );
                    return nullptr;
                }
                if (fds.back().revents != 0) {
                    return nullptr;
                }
                for (size_t i = 0; i + 1 < fds.size(); ++i) {
                    if (fds[i].revents == 0) {
                        continue;
                    }
                    struct sockaddr_in peer;
                    socklen_t peerLength = sizeof(peer);
                    const auto sock = accept4(
                        fds[i].fd,
                        (struct sockaddr*)&peer,
                        &peerLength,
                        SOCK_CLOEXEC
                    );
                    if (sock >= 0) {
                        return std::make_shared< SocketConnection >(sock, peer);
                    }
                    switch (errno) {
                        // Another caller took the connection first, or the
                        // client gave up before it was accepted.
                        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
                        case EWOULDBLOCK:
#endif
                        case ECONNABORTED:
                        case EINTR:
                        case EPROTO: {
                        } break;

                        default: {
                            diagnosticsSender.SendDiagnosticInformationFormatted(
                                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                                "error accepting connection: %s",
                                strerror(errno)
                            );
                        } return nullptr;
                    }
                }
            }
        }
    };

    SocketServerTransport::~SocketServerTransport() {
        ReleaseNetwork();
    }

    SocketServerTransport::SocketServerTransport()
        : impl_(new Impl)
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SocketServerTransport::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    bool SocketServerTransport::BindNetwork(uint16_t port) {
        ReleaseNetwork();
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->port = port;
        for (const auto& address: GetListenAddresses()) {
            if (!impl_->Listen(address)) {
                if (address == LOOPBACK_ADDRESS) {
                    impl_->CloseAll();
                    return false;
                }
            }
        }
        impl_->wakeEvent = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (impl_->wakeEvent < 0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "error creating wake event: %s",
                strerror(errno)
            );
            impl_->CloseAll();
            return false;
        }
        impl_->released = false;
        return true;
    }

    uint16_t SocketServerTransport::GetBoundPort() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->port;
    }

    std::vector< std::string > SocketServerTransport::GetBoundAddresses() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->boundAddresses;
    }

    std::shared_ptr< Connection > SocketServerTransport::AwaitConnection() {
        std::vector< struct pollfd > fds;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            if (impl_->released) {
                return nullptr;
            }
            for (auto listener: impl_->listeners) {
                struct pollfd fd;
                fd.fd = listener;
                fd.events = POLLIN;
                fds.push_back(fd);
            }
            struct pollfd wake;
            wake.fd = impl_->wakeEvent;
            wake.events = POLLIN;
            fds.push_back(wake);
            ++impl_->waiters;
        }
        const auto connection = impl_->Accept(fds);
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        --impl_->waiters;
        impl_->waitersLeft.notify_all();
        return connection;
    }

    void SocketServerTransport::ReleaseNetwork() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->released) {
            return;
        }
        impl_->released = true;
        (void)eventfd_write(impl_->wakeEvent, 1);
        impl_->waitersLeft.wait(
            lock,
            [this]{ return impl_->waiters == 0; }
        );
        impl_->CloseAll();
    }

}
