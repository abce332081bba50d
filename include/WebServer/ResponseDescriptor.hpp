#ifndef WEB_SERVER_RESPONSE_DESCRIPTOR_HPP
#define WEB_SERVER_RESPONSE_DESCRIPTOR_HPP

/**
 * @file ResponseDescriptor.hpp
 *
 * This module declares the WebServer::ResponseDescriptor structure
 * and the WebServer::ServerError classification it carries.
 *
 * © 2018 by Richard Walters
 */

#include <ostream>
#include <string>

namespace WebServer {

    /**
     * This classifies the outcome of routing a request.  Every value
     * other than Ok is turned into a redirect by the server's error
     * delegate.
     */
    enum class ServerError {
        Ok,
        ExpiredSession,
        NotAuthorized,
        FileNotFound,
        PageNotFound,
        ServerError,
        UnknownType,
        ValidationError,
    };

    /**
     * This describes the response the router wants returned for
     * a request.  Either the redirect is set, or the content triple
     * (data, content type, encoding) is.
     */
    struct ResponseDescriptor {
        // Properties

        /**
         * This is the path to which to redirect the client.
         * If empty, the content is returned instead.
         */
        std::string redirect;

        /**
         * This is the raw content to return to the client.
         */
        std::string data;

        /**
         * This is the media type of the content, such as "text/html".
         */
        std::string contentType;

        /**
         * This is the character encoding of textual content,
         * such as "utf-8", or empty for binary content.
         */
        std::string encoding;

        /**
         * This classifies the outcome of routing the request.
         */
        ServerError error = ServerError::Ok;

        // Methods

        /**
         * This method returns an indication of whether or not
         * the descriptor calls for a redirect.
         *
         * @return
         *     An indication of whether or not the descriptor
         *     calls for a redirect is returned.
         */
        bool IsRedirect() const;

        /**
         * This method returns an indication of whether or not
         * the content is HTML, and so subject to post-processing.
         *
         * @return
         *     An indication of whether or not the content is HTML
         *     is returned.
         */
        bool IsHtml() const;

        /**
         * This function constructs a descriptor which redirects the
         * client to the given path.
         *
         * @param[in] path
         *     This is the path to which to redirect the client.
         *
         * @return
         *     The redirect descriptor is returned.
         */
        static ResponseDescriptor Redirect(const std::string& path);

        /**
         * This function constructs a descriptor which returns
         * the given content to the client.
         *
         * @param[in] data
         *     This is the raw content to return.
         *
         * @param[in] contentType
         *     This is the media type of the content.
         *
         * @param[in] encoding
         *     This is the character encoding of textual content,
         *     or empty for binary content.
         *
         * @return
         *     The content descriptor is returned.
         */
        static ResponseDescriptor Content(
            const std::string& data,
            const std::string& contentType,
            const std::string& encoding = ""
        );

        /**
         * This function constructs a descriptor which signals
         * the given error classification.
         *
         * @param[in] error
         *     This is the error classification to signal.
         *
         * @return
         *     The error descriptor is returned.
         */
        static ResponseDescriptor Error(ServerError error);
    };

    /**
     * This function returns the name of the given error classification.
     *
     * @param[in] error
     *     This is the error classification to name.
     *
     * @return
     *     The name of the error classification is returned.
     */
    std::string ServerErrorToString(ServerError error);

    /**
     * This is a support function for Google Test to print out
     * values of the ServerError class.
     *
     * @param[in] error
     *     This is the error classification to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     error classification.
     */
    void PrintTo(
        const ServerError& error,
        std::ostream* os
    );

}

#endif /* WEB_SERVER_RESPONSE_DESCRIPTOR_HPP */
