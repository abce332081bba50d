/**
 * @file Response.cpp
 *
 * This module contains the implementation of the WebServer::Response
 * structure.
 *
 * © 2018 by Richard Walters
 */

#include <sstream>
#include <WebServer/Response.hpp>

namespace WebServer {

    std::string Response::Generate() const {
        std::ostringstream builder;
        builder << "HTTP/1.1 " << statusCode << ' ' << reasonPhrase << "\r\n";
        builder << headers.GenerateRawHeaders();
        builder << body;
        return builder.str();
    }

}
