#ifndef WEB_SERVER_REQUEST_HPP
#define WEB_SERVER_REQUEST_HPP

/**
 * @file Request.hpp
 *
 * This module declares the WebServer::Request structure.
 *
 * © 2018 by Richard Walters
 */

#include <MessageHeaders/MessageHeaders.hpp>
#include <ostream>
#include <string>
#include <Uri/Uri.hpp>

namespace WebServer {

    /**
     * This represents an overall HTTP server request, decomposed
     * into its various elements.
     */
    struct Request {
        // Types

        /**
         * This type is used to track how much of the request
         * has been constructed so far.
         */
        enum class State {
            /**
             * In this state, we're still waiting to construct
             * the full request line.
             */
            RequestLine,

            /**
             * In this state, we've constructed the request
             * line, and possibly some header lines, but haven't yet
             * constructed all of the header lines.
             */
            Headers,

            /**
             * In this state, we've constructed the request
             * line and headers, and possibly some of the body, but
             * haven't yet constructed all of the body.
             */
            Body,

            /**
             * In this state, the request is fully constructed,
             * though it may still have failed validity checks.
             */
            Complete,

            /**
             * In this state, the request could not be constructed,
             * and nothing more should be read from the connection.
             */
            Error,
        };

        // Properties

        /**
         * This flag indicates whether or not the request
         * has passed all validity checks.
         */
        bool valid = true;

        /**
         * This indicates the request method to be performed on the
         * target resource.
         */
        std::string method;

        /**
         * This is the request target exactly as it appeared on the
         * request line, including any query string.
         */
        std::string rawTarget;

        /**
         * This identifies the target resource upon which to apply
         * the request.
         */
        Uri::Uri target;

        /**
         * This is the protocol identifier from the request line,
         * such as "HTTP/1.1".
         */
        std::string protocol;

        /**
         * These are the message headers that were included
         * in the request.
         */
        MessageHeaders::MessageHeaders headers;

        /**
         * This is the body of the request, if there is a body.
         */
        std::string body;

        /**
         * This indicates how far construction of the request has
         * progressed, and whether or not it failed.
         */
        State state = State::RequestLine;

        // Methods

        /**
         * This method returns an indication of whether or not the request
         * has been fully constructed (valid or not).
         *
         * @return
         *     An indication of whether or not the request
         *     has been fully constructed (valid or not) is returned.
         */
        bool IsCompleteOrError() const;

        /**
         * This method returns the part of the request target
         * before the first question mark.
         *
         * @return
         *     The path of the request target is returned.
         */
        std::string GetPath() const;

        /**
         * This method returns the part of the request target
         * after the first question mark, or an empty string
         * if there is no question mark.
         *
         * @return
         *     The raw query string of the request target is returned.
         */
        std::string GetQuery() const;

        /**
         * This method returns the character encoding declared by the
         * "charset" parameter of the request's "Content-Type" header,
         * in lower case, or "utf-8" if none is declared.
         *
         * @return
         *     The character encoding of the request body is returned.
         */
        std::string GetBodyEncoding() const;

        /**
         * This method generates the raw HTTP request message
         * equivalent to this request.
         *
         * @return
         *     The raw HTTP request message is returned.
         */
        std::string Generate() const;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Request::State class.
     *
     * @param[in] state
     *     This is the server request state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     server request state value.
     */
    void PrintTo(
        const Request::State& state,
        std::ostream* os
    );

}

#endif /* WEB_SERVER_REQUEST_HPP */
