#ifndef WEB_SERVER_RESPONSE_WRITER_HPP
#define WEB_SERVER_RESPONSE_WRITER_HPP

/**
 * @file ResponseWriter.hpp
 *
 * This module declares the functions which render response descriptors
 * onto the wire, and the WebServer::ConnectionCloser guard.
 *
 * © 2018 by Richard Walters
 */

#include "Connection.hpp"
#include "Response.hpp"
#include "ResponseDescriptor.hpp"

#include <memory>
#include <string>

namespace WebServer {

    /**
     * This function returns the absolute location to which a redirect
     * to the given path sends the client.
     *
     * @param[in] path
     *     This is the path to which the client is redirected.
     *
     * @param[in] publicAddress
     *     This is the configured public host name or address.
     *     If empty, the host address is used instead.
     *
     * @param[in] hostAddress
     *     This is the address on which the request arrived.
     *
     * @return
     *     The absolute redirect location is returned.
     */
    std::string MakeRedirectLocation(
        const std::string& path,
        const std::string& publicAddress,
        const std::string& hostAddress
    );

    /**
     * This function builds the HTTP response for the given descriptor:
     * a "302 Found" redirect if the descriptor has a redirect, or else
     * a "200 OK" carrying the descriptor's content.
     *
     * @param[in] descriptor
     *     This describes the response to build.
     *
     * @param[in] publicAddress
     *     This is the configured public host name or address.
     *
     * @param[in] hostAddress
     *     This is the address on which the request arrived.
     *
     * @return
     *     The HTTP response is returned.
     */
    Response BuildResponse(
        const ResponseDescriptor& descriptor,
        const std::string& publicAddress,
        const std::string& hostAddress
    );

    /**
     * This function transmits the given response on the given connection.
     *
     * @param[in] connection
     *     This is the connection on which to transmit the response.
     *
     * @param[in] response
     *     This is the response to transmit.
     */
    void WriteResponse(
        std::shared_ptr< Connection > connection,
        const Response& response
    );

    /**
     * This breaks a connection gracefully when it goes out of scope,
     * so that every way out of handling a request closes the connection
     * exactly once.
     */
    class ConnectionCloser {
        // Lifecycle management
    public:
        ~ConnectionCloser();
        ConnectionCloser(const ConnectionCloser&) = delete;
        ConnectionCloser(ConnectionCloser&&) = delete;
        ConnectionCloser& operator=(const ConnectionCloser&) = delete;
        ConnectionCloser& operator=(ConnectionCloser&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] connection
         *     This is the connection to close.
         */
        explicit ConnectionCloser(std::shared_ptr< Connection > connection);

        // Private properties
    private:
        /**
         * This is the connection to close.
         */
        std::shared_ptr< Connection > connection_;
    };

}

#endif /* WEB_SERVER_RESPONSE_WRITER_HPP */
