/**
 * @file ResponseWriter.cpp
 *
 * This module contains the implementation of the functions which render
 * response descriptors onto the wire.
 *
 * © 2018 by Richard Walters
 */

#include <stdint.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>
#include <WebServer/ResponseWriter.hpp>

namespace WebServer {

    std::string MakeRedirectLocation(
        const std::string& path,
        const std::string& publicAddress,
        const std::string& hostAddress
    ) {
        if (publicAddress.empty()) {
            return "http://" + hostAddress + path;
        } else {
            return "http://" + publicAddress + path;
        }
    }

    Response BuildResponse(
        const ResponseDescriptor& descriptor,
        const std::string& publicAddress,
        const std::string& hostAddress
    ) {
        Response response;
        if (descriptor.IsRedirect()) {
            response.statusCode = 302;
            response.reasonPhrase = "Found";
            response.headers.SetHeader(
                "Location",
                MakeRedirectLocation(descriptor.redirect, publicAddress, hostAddress)
            );
            response.headers.SetHeader("Content-Length", "0");
        } else {
            response.statusCode = 200;
            response.reasonPhrase = "OK";
            auto contentType = descriptor.contentType;
            if (
                !descriptor.encoding.empty()
                && (contentType.find("charset=") == std::string::npos)
            ) {
                contentType += "; charset=" + descriptor.encoding;
            }
            if (!contentType.empty()) {
                response.headers.SetHeader("Content-Type", contentType);
            }
            response.headers.SetHeader(
                "Content-Length",
                SystemAbstractions::sprintf("%zu", descriptor.data.length())
            );
            response.body = descriptor.data;
        }
        response.headers.SetHeader("Connection", "close");
        return response;
    }

    void WriteResponse(
        std::shared_ptr< Connection > connection,
        const Response& response
    ) {
        const auto responseText = response.Generate();
        connection->SendData(
            std::vector< uint8_t >(
                responseText.begin(),
                responseText.end()
            )
        );
    }

    ConnectionCloser::~ConnectionCloser() {
        connection_->Break(true);
    }

    ConnectionCloser::ConnectionCloser(std::shared_ptr< Connection > connection)
        : connection_(connection)
    {
    }

}
