/**
 * @file RequestPipeline.cpp
 *
 * This module contains the implementation of the
 * WebServer::RequestPipeline class.
 *
 * © 2018 by Richard Walters
 */

#include <exception>
#include <stdint.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>
#include <WebServer/Parameters.hpp>
#include <WebServer/PostProcessor.hpp>
#include <WebServer/RequestPipeline.hpp>
#include <WebServer/ResponseWriter.hpp>

namespace {

    /**
     * This is the character sequence corresponding to a carriage return (CR)
     * followed by a line feed (LF), which officially delimits each
     * line of an HTTP request.
     */
    const std::string CRLF("\r\n");

    /**
     * This is the path to which a client is redirected when translating
     * a failure fails as well.
     */
    const std::string FALLBACK_REDIRECT_PATH = "/";

    /**
     * This method parses the method, target URI, and protocol identifier
     * from the given request line.
     *
     * @param[in] request
     *     This is the request in which to store the parsed method and
     *     target URI.
     *
     * @param[in] requestLine
     *     This is the raw request line string to parse.
     *
     * @return
     *     An indication of whether or not the request line
     *     was successfully parsed is returned.
     */
    bool ParseRequestLine(
        WebServer::Request& request,
        const std::string& requestLine
    ) {
        // Parse the method.
        const auto methodDelimiter = requestLine.find(' ');
        if (methodDelimiter == std::string::npos) {
            return false;
        }
        request.method = requestLine.substr(0, methodDelimiter);
        if (request.method.empty()) {
            return false;
        }

        // Parse the target URI.
        const auto targetDelimiter = requestLine.find(' ', methodDelimiter + 1);
        if (targetDelimiter == std::string::npos) {
            return false;
        }
        const auto targetLength = targetDelimiter - methodDelimiter - 1;
        if (targetLength == 0) {
            return false;
        }
        request.rawTarget = requestLine.substr(methodDelimiter + 1, targetLength);
        if (!request.target.ParseFromString(request.rawTarget)) {
            return false;
        }

        // Parse the protocol.
        request.protocol = requestLine.substr(targetDelimiter + 1);
        return (
            (request.protocol == "HTTP/1.1")
            || (request.protocol == "HTTP/1.0")
        );
    }

    /**
     * This function converts the given request body to UTF-8
     * according to the given declared character encoding.
     * Bodies in encodings other than ISO-8859-1 are passed through as-is.
     *
     * @param[in] body
     *     This is the raw request body.
     *
     * @param[in] encoding
     *     This is the character encoding declared for the body.
     *
     * @return
     *     The body text is returned.
     */
    std::string DecodeBodyText(
        const std::string& body,
        const std::string& encoding
    ) {
        if (
            (encoding != "iso-8859-1")
            && (encoding != "latin1")
        ) {
            return body;
        }
        std::string text;
        for (auto c: body) {
            const auto byte = (uint8_t)c;
            if (byte < 0x80) {
                text.push_back(c);
            } else {
                text.push_back((char)(0xC0 | (byte >> 6)));
                text.push_back((char)(0x80 | (byte & 0x3F)));
            }
        }
        return text;
    }

}

namespace WebServer {

    /**
     * This contains the private properties of a RequestPipeline instance.
     */
    struct RequestPipeline::Impl {
        // Properties

        /**
         * This holds the limits and delegates to use.
         */
        const Configuration& configuration;

        /**
         * This is the store from which client sessions are resolved.
         */
        SessionStore& sessions;

        /**
         * This is used to publish diagnostic messages about requests.
         */
        SystemAbstractions::DiagnosticsSender& diagnosticsSender;

        /**
         * This is the delegate used to post-process HTML content.
         */
        PostProcessDelegate postProcess;

        // Methods

        /**
         * This is the constructor for the structure.
         *
         * @param[in] newConfiguration
         *     This holds the limits and delegates to use.
         *
         * @param[in] newSessions
         *     This is the store from which client sessions are resolved.
         *
         * @param[in] newDiagnosticsSender
         *     This is used to publish diagnostic messages about requests.
         */
        Impl(
            const Configuration& newConfiguration,
            SessionStore& newSessions,
            SystemAbstractions::DiagnosticsSender& newDiagnosticsSender
        )
            : configuration(newConfiguration)
            , sessions(newSessions)
            , diagnosticsSender(newDiagnosticsSender)
        {
            if (configuration.postProcess == nullptr) {
                postProcess = MakeDefaultPostProcessor(configuration);
            } else {
                postProcess = configuration.postProcess;
            }
        }

        /**
         * This method returns the path to which to redirect the client
         * after a failure that wasn't classified by the router.
         * If the error delegate fails as well, the root path is used.
         *
         * @return
         *     The path to which to redirect the client is returned.
         */
        std::string GetServerErrorRedirect() {
            try {
                return configuration.onError(ServerError::ServerError);
            } catch (const std::exception& e) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                    "error translation failed: %s",
                    e.what()
                );
            } catch (...) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                    "error translation failed with an unknown exception"
                );
            }
            return FALLBACK_REDIRECT_PATH;
        }

        /**
         * This method gives the application a look at the request
         * before it's routed.  Nothing the observer throws stops the
         * request from being routed.
         *
         * @param[in] session
         *     This is the session of the client making the request.
         *
         * @param[in] request
         *     This is the request to observe.
         */
        void ObserveRequest(
            std::shared_ptr< Session > session,
            const Request& request
        ) {
            if (configuration.onRequest == nullptr) {
                return;
            }
            try {
                configuration.onRequest(session, request);
            } catch (const std::exception& e) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "request observer failed: %s",
                    e.what()
                );
            } catch (...) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "request observer failed with an unknown exception"
                );
            }
        }

        /**
         * This method processes a complete and valid request, without
         * guarding against exceptions thrown by the application.
         *
         * @param[in] request
         *     This is the request to process.
         *
         * @param[in] clientKey
         *     This identifies the client, selecting its session.
         *
         * @param[in] peerId
         *     This identifies the client in diagnostic messages.
         *
         * @return
         *     The descriptor of the response to return is returned.
         */
        ResponseDescriptor Dispatch(
            const Request& request,
            const std::string& clientKey,
            const std::string& peerId
        ) {
            const auto path = request.GetPath();
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1, "%s %s %s",
                peerId.c_str(),
                request.method.c_str(),
                path.c_str()
            );

            // Body parameters override query parameters of the same name.
            Parameters parameters;
            DecodeParameters(request.GetQuery(), parameters);
            DecodeParameters(
                DecodeBodyText(request.body, request.GetBodyEncoding()),
                parameters
            );
            for (const auto& parameter: parameters) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    1, "%s : %s",
                    parameter.first.c_str(),
                    parameter.second.c_str()
                );
            }

            const auto session = sessions.Resolve(clientKey);
            ObserveRequest(session, request);
            auto descriptor = configuration.route(
                session,
                request.method,
                path,
                parameters
            );
            sessions.Touch(session);
            if (descriptor.error != ServerError::Ok) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    2, "%s %s from %s: %s",
                    request.method.c_str(),
                    path.c_str(),
                    peerId.c_str(),
                    ServerErrorToString(descriptor.error).c_str()
                );
                descriptor.redirect = configuration.onError(descriptor.error);
            } else if (
                !descriptor.IsRedirect()
                && descriptor.IsHtml()
            ) {
                descriptor.data = postProcess(session, descriptor.data);
            }
            return descriptor;
        }
    };

    RequestPipeline::~RequestPipeline() = default;

    RequestPipeline::RequestPipeline(
        const Configuration& configuration,
        SessionStore& sessions,
        SystemAbstractions::DiagnosticsSender& diagnosticsSender
    )
        : impl_(new Impl(configuration, sessions, diagnosticsSender))
    {
    }

    size_t RequestPipeline::ParseRequest(
        Request& request,
        const std::string& nextRawRequestPart
    ) {
        const auto headerLineLimit = impl_->configuration.headerLineLimit;

        // Count the number of characters incorporated into
        // the request object.
        size_t messageEnd = 0;

        // First, extract and parse the request line.
        if (request.state == Request::State::RequestLine) {
            const auto requestLineEnd = nextRawRequestPart.find(CRLF);
            if (requestLineEnd == std::string::npos) {
                if (nextRawRequestPart.length() > headerLineLimit) {
                    request.state = Request::State::Error;
                }
                return messageEnd;
            }
            if (requestLineEnd > headerLineLimit) {
                request.state = Request::State::Error;
                return messageEnd;
            }
            const auto requestLine = nextRawRequestPart.substr(0, requestLineEnd);
            messageEnd = requestLineEnd + CRLF.length();
            request.state = Request::State::Headers;
            request.valid = ParseRequestLine(request, requestLine);
        }

        // Second, parse the message headers and identify where the body begins.
        if (request.state == Request::State::Headers) {
            request.headers.SetLineLimit(headerLineLimit);
            size_t bodyOffset;
            const auto headersState = request.headers.ParseRawMessage(
                nextRawRequestPart.substr(messageEnd),
                bodyOffset
            );
            messageEnd += bodyOffset;
            switch (headersState) {
                case MessageHeaders::MessageHeaders::State::Complete: {
                    if (!request.headers.IsValid()) {
                        request.valid = false;
                    }
                    request.state = Request::State::Body;

                    // HTTP/1.1 requires the "Host" header.
                    if (
                        (request.protocol == "HTTP/1.1")
                        && !request.headers.HasHeader("Host")
                    ) {
                        request.valid = false;
                    }
                } break;

                case MessageHeaders::MessageHeaders::State::Incomplete: {
                } return messageEnd;

                case MessageHeaders::MessageHeaders::State::Error:
                default: {
                    request.state = Request::State::Error;
                } return messageEnd;
            }
        }

        // Finally, extract the body.
        if (request.state == Request::State::Body) {
            const auto bytesAvailableForBody = nextRawRequestPart.length() - messageEnd;

            // If there is a "Content-Length" header, we carefully carve
            // exactly that number of characters out (and wait if we don't
            // have enough).  Otherwise, there is no body.
            if (request.headers.HasHeader("Content-Length")) {
                intmax_t contentLengthAsInt;
                switch (
                    SystemAbstractions::ToInteger(
                        request.headers.GetHeaderValue("Content-Length"),
                        contentLengthAsInt
                    )
                ) {
                    case SystemAbstractions::ToIntegerResult::NotANumber:
                    case SystemAbstractions::ToIntegerResult::Overflow: {
                        request.state = Request::State::Error;
                    } return messageEnd;

                    default: break;
                }
                if (
                    (contentLengthAsInt < 0)
                    || ((size_t)contentLengthAsInt > impl_->configuration.maxContentLength)
                ) {
                    request.state = Request::State::Error;
                    return messageEnd;
                }
                const auto contentLength = (size_t)contentLengthAsInt;
                if (contentLength > bytesAvailableForBody) {
                    return messageEnd;
                }
                request.body = nextRawRequestPart.substr(messageEnd, contentLength);
                messageEnd += contentLength;
                request.state = Request::State::Complete;
            } else {
                request.body.clear();
                request.state = Request::State::Complete;
            }
        }
        return messageEnd;
    }

    ResponseDescriptor RequestPipeline::ProcessRequest(
        const Request& request,
        const std::string& clientKey,
        const std::string& peerId
    ) {
        if (
            (request.state != Request::State::Complete)
            || !request.valid
        ) {
            if (!request.method.empty()) {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    1, "%s %s %s",
                    peerId.c_str(),
                    request.method.c_str(),
                    request.GetPath().c_str()
                );
            }
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                2, "bad request from %s",
                peerId.c_str()
            );
            return ResponseDescriptor::Redirect(impl_->GetServerErrorRedirect());
        }
        try {
            return impl_->Dispatch(request, clientKey, peerId);
        } catch (const std::exception& e) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "%s %s from %s failed: %s",
                request.method.c_str(),
                request.GetPath().c_str(),
                peerId.c_str(),
                e.what()
            );
        } catch (...) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "%s %s from %s failed with an unknown exception",
                request.method.c_str(),
                request.GetPath().c_str(),
                peerId.c_str()
            );
        }
        return ResponseDescriptor::Redirect(impl_->GetServerErrorRedirect());
    }

    void RequestPipeline::HandleConnection(std::shared_ptr< Connection > connection) {
        ConnectionCloser closer(connection);
        const auto peerId = connection->GetPeerId();

        // Read until a request has been fully constructed (valid or not).
        Request request;
        std::string reassemblyBuffer;
        while (!request.IsCompleteOrError()) {
            std::vector< uint8_t > data;
            if (!connection->ReceiveData(data)) {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    1, "connection from %s closed before a request was received",
                    peerId.c_str()
                );
                return;
            }
            reassemblyBuffer += std::string(data.begin(), data.end());
            const auto charactersAccepted = ParseRequest(request, reassemblyBuffer);
            reassemblyBuffer.erase(0, charactersAccepted);
        }

        const auto descriptor = ProcessRequest(
            request,
            connection->GetPeerAddress(),
            peerId
        );
        const auto response = BuildResponse(
            descriptor,
            impl_->configuration.publicAddress,
            connection->GetHostAddress()
        );
        WriteResponse(connection, response);
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            1, "Sent %u '%s' response back to %s",
            response.statusCode,
            response.reasonPhrase.c_str(),
            peerId.c_str()
        );
    }

}
