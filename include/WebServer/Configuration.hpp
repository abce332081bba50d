#ifndef WEB_SERVER_CONFIGURATION_HPP
#define WEB_SERVER_CONFIGURATION_HPP

/**
 * @file Configuration.hpp
 *
 * This module declares the WebServer::Configuration structure and the
 * delegate types through which the web server calls into the
 * application.
 *
 * © 2018 by Richard Walters
 */

#include "Parameters.hpp"
#include "Request.hpp"
#include "ResponseDescriptor.hpp"
#include "Session.hpp"

#include <functional>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace WebServer {

    /**
     * This is the type of function which routes a request, producing
     * the descriptor of the response to return.  It may throw; the
     * server turns any exception into a "ServerError" redirect.
     *
     * @param[in] session
     *     This is the session of the client making the request.
     *     Its last-activity time still reflects the previous request.
     *
     * @param[in] verb
     *     This is the request method, such as "GET".
     *
     * @param[in] path
     *     This is the request target up to the first question mark.
     *
     * @param[in] parameters
     *     These are the query string and body parameters of the request,
     *     body values taking precedence.
     *
     * @return
     *     The descriptor of the response to return is returned.
     */
    typedef std::function<
        ResponseDescriptor(
            std::shared_ptr< Session > session,
            const std::string& verb,
            const std::string& path,
            const Parameters& parameters
        )
    > RouteDelegate;

    /**
     * This is the type of function which maps an error classification
     * to the path to which the client is redirected.
     */
    typedef std::function< std::string(ServerError error) > ErrorDelegate;

    /**
     * This is the type of function which observes every request once
     * its session is resolved.  Exceptions thrown by it are reported
     * and otherwise ignored.
     */
    typedef std::function<
        void(
            std::shared_ptr< Session > session,
            const Request& request
        )
    > RequestDelegate;

    /**
     * This is the type of function which rewrites HTML content
     * before it is returned to the client.
     */
    typedef std::function<
        std::string(
            std::shared_ptr< Session > session,
            const std::string& html
        )
    > PostProcessDelegate;

    /**
     * This is the default number of workers allowed to wait
     * simultaneously for new connections.
     */
    constexpr size_t DEFAULT_MAX_SIMULTANEOUS_CONNECTIONS = 20;

    /**
     * This is the default number of seconds a session may stay idle
     * before it's considered expired.
     */
    constexpr double DEFAULT_SESSION_EXPIRATION_SECONDS = 60.0;

    /**
     * This is the default number of seconds an expired session is kept
     * before it's dropped.
     */
    constexpr double DEFAULT_SESSION_RETENTION_SECONDS = 600.0;

    /**
     * This is the default public port number to which clients may connect
     * to establish connections with this server.
     */
    constexpr uint16_t DEFAULT_PORT_NUMBER = 80;

    /**
     * This is the default maximum length allowed for a request header line.
     */
    constexpr size_t DEFAULT_HEADER_LINE_LIMIT = 1000;

    /**
     * This is the default maximum allowed request body size.
     */
    constexpr size_t DEFAULT_MAX_CONTENT_LENGTH = 10000000;

    /**
     * This holds everything the server's components need to know,
     * fixed when the server is mobilized.
     */
    struct Configuration {
        // Properties

        /**
         * This is the public port number to which clients may connect.
         */
        uint16_t port = DEFAULT_PORT_NUMBER;

        /**
         * This is the capacity of the admission permit pool: how many
         * workers may wait simultaneously for new connections.
         */
        size_t maxSimultaneousConnections = DEFAULT_MAX_SIMULTANEOUS_CONNECTIONS;

        /**
         * This is the number of seconds a session may stay idle
         * before it's considered expired.
         */
        double sessionExpirationSeconds = DEFAULT_SESSION_EXPIRATION_SECONDS;

        /**
         * This is the number of seconds an expired session is kept,
         * so the router can still see it as expired, before it's dropped.
         */
        double sessionRetentionSeconds = DEFAULT_SESSION_RETENTION_SECONDS;

        /**
         * This is the host name or address to put in redirect locations.
         * If empty, the address on which the request arrived is used.
         */
        std::string publicAddress;

        /**
         * This is the placeholder in HTML content which the default
         * post-processing replaces with the anti-forgery token field.
         */
        std::string validationTokenPlaceholder = "<%AntiForgeryToken%>";

        /**
         * This is the name of the anti-forgery token field, and the name
         * of the session value holding the token.
         */
        std::string validationTokenName = "__CSRFToken__";

        /**
         * This is the maximum number of characters allowed on any header
         * line of an HTTP request.
         */
        size_t headerLineLimit = DEFAULT_HEADER_LINE_LIMIT;

        /**
         * This is the maximum allowed request body size.
         */
        size_t maxContentLength = DEFAULT_MAX_CONTENT_LENGTH;

        /**
         * This is the function called to route each request.
         */
        RouteDelegate route;

        /**
         * This is the function called to map error classifications
         * to redirect paths.
         */
        ErrorDelegate onError;

        /**
         * This is the function, if any, called to observe each request.
         */
        RequestDelegate onRequest;

        /**
         * This is the function called to rewrite HTML content.
         * If not set, the default anti-forgery token substitution is used.
         */
        PostProcessDelegate postProcess;
    };

}

#endif /* WEB_SERVER_CONFIGURATION_HPP */
