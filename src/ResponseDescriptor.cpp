/**
 * @file ResponseDescriptor.cpp
 *
 * This module contains the implementation of the
 * WebServer::ResponseDescriptor structure.
 *
 * © 2018 by Richard Walters
 */

#include <WebServer/ResponseDescriptor.hpp>

namespace WebServer {

    bool ResponseDescriptor::IsRedirect() const {
        return !redirect.empty();
    }

    bool ResponseDescriptor::IsHtml() const {
        return (contentType.compare(0, 9, "text/html") == 0);
    }

    ResponseDescriptor ResponseDescriptor::Redirect(const std::string& path) {
        ResponseDescriptor descriptor;
        descriptor.redirect = path;
        return descriptor;
    }

    ResponseDescriptor ResponseDescriptor::Content(
        const std::string& data,
        const std::string& contentType,
        const std::string& encoding
    ) {
        ResponseDescriptor descriptor;
        descriptor.data = data;
        descriptor.contentType = contentType;
        descriptor.encoding = encoding;
        return descriptor;
    }

    ResponseDescriptor ResponseDescriptor::Error(ServerError error) {
        ResponseDescriptor descriptor;
        descriptor.error = error;
        return descriptor;
    }

    std::string ServerErrorToString(ServerError error) {
        switch (error) {
            case ServerError::Ok: return "Ok";
            case ServerError::ExpiredSession: return "ExpiredSession";
            case ServerError::NotAuthorized: return "NotAuthorized";
            case ServerError::FileNotFound: return "FileNotFound";
            case ServerError::PageNotFound: return "PageNotFound";
            case ServerError::ServerError: return "ServerError";
            case ServerError::UnknownType: return "UnknownType";
            case ServerError::ValidationError: return "ValidationError";
            default: return "???";
        }
    }

    void PrintTo(
        const ServerError& error,
        std::ostream* os
    ) {
        *os << ServerErrorToString(error);
    }

}
