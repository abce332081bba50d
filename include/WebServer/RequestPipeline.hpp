#ifndef WEB_SERVER_REQUEST_PIPELINE_HPP
#define WEB_SERVER_REQUEST_PIPELINE_HPP

/**
 * @file RequestPipeline.hpp
 *
 * This module declares the WebServer::RequestPipeline class.
 *
 * © 2018 by Richard Walters
 */

#include "Configuration.hpp"
#include "Connection.hpp"
#include "Request.hpp"
#include "ResponseDescriptor.hpp"
#include "SessionStore.hpp"

#include <memory>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace WebServer {

    /**
     * This carries one accepted connection through reading and parsing
     * the request, resolving the client's session, routing, translating
     * errors into redirects, post-processing, and responding.
     *
     * Nothing thrown by the application's delegates escapes the pipeline:
     * every failure becomes a redirect to the path the error delegate
     * gives for ServerError::ServerError.
     */
    class RequestPipeline {
        // Lifecycle management
    public:
        ~RequestPipeline();
        RequestPipeline(const RequestPipeline&) = delete;
        RequestPipeline(RequestPipeline&&) = delete;
        RequestPipeline& operator=(const RequestPipeline&) = delete;
        RequestPipeline& operator=(RequestPipeline&&) = delete;

        // Public methods
    public:
        /**
         * This is the constructor.
         *
         * @param[in] configuration
         *     This holds the limits and delegates to use.  It must
         *     outlive the pipeline.
         *
         * @param[in] sessions
         *     This is the store from which to resolve client sessions.
         *     It must outlive the pipeline.
         *
         * @param[in] diagnosticsSender
         *     This is used to publish diagnostic messages about requests.
         *     It must outlive the pipeline.
         */
        RequestPipeline(
            const Configuration& configuration,
            SessionStore& sessions,
            SystemAbstractions::DiagnosticsSender& diagnosticsSender
        );

        /**
         * This method is called one or more times to incrementally parse
         * a raw HTTP request message.  For the first call, pass in a newly-
         * constructed request object, and the beginning of the raw
         * HTTP request message.  Continue calling with the same request
         * object and the unconsumed remainder plus any newly-received
         * characters, until the request's state becomes
         * Request::State::Complete or Request::State::Error.
         *
         * @param[in,out] request
         *     This is the request being parsed.
         *
         * @param[in] nextRawRequestPart
         *     This is the next part of the raw HTTP request message.
         *
         * @return
         *     A count of the number of characters that were taken from
         *     the given input string is returned.
         */
        size_t ParseRequest(
            Request& request,
            const std::string& nextRawRequestPart
        );

        /**
         * This method turns a received request into the descriptor of
         * the response to return for it.  This covers decoding the
         * parameters, resolving the session, observing, routing,
         * touching the session, error translation, and post-processing.
         *
         * @param[in] request
         *     This is the request received from the client.
         *
         * @param[in] clientKey
         *     This identifies the client, selecting its session.
         *
         * @param[in] peerId
         *     This identifies the client's end of the connection
         *     in diagnostic messages.
         *
         * @return
         *     The descriptor of the response to return is returned.
         */
        ResponseDescriptor ProcessRequest(
            const Request& request,
            const std::string& clientKey,
            const std::string& peerId
        );

        /**
         * This method reads one request from the given connection,
         * processes it, writes the response, and closes the connection.
         * If the connection breaks before a request is received,
         * it's closed without a response.
         *
         * @param[in] connection
         *     This is the connection to handle.
         */
        void HandleConnection(std::shared_ptr< Connection > connection);

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< struct Impl > impl_;
    };

}

#endif /* WEB_SERVER_REQUEST_PIPELINE_HPP */
