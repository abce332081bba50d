/**
 * @file Request.cpp
 *
 * This module contains the implementation of the WebServer::Request
 * structure.
 *
 * © 2018 by Richard Walters
 */

#include <ctype.h>
#include <sstream>
#include <WebServer/Request.hpp>

namespace {

    /**
     * This is the character encoding assumed for request bodies
     * which don't declare one.
     */
    const std::string DEFAULT_BODY_ENCODING = "utf-8";

    /**
     * This function returns a copy of the given string with whitespace
     * removed from both ends.
     *
     * @param[in] s
     *     This is the string to trim.
     *
     * @return
     *     The trimmed string is returned.
     */
    std::string Trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }

    /**
     * This function returns a copy of the given string with
     * all ASCII letters converted to lower case.
     *
     * @param[in] s
     *     This is the string to convert.
     *
     * @return
     *     The lower-case copy of the string is returned.
     */
    std::string ToLower(const std::string& s) {
        std::string lower;
        lower.reserve(s.length());
        for (auto c: s) {
            lower.push_back((char)tolower((unsigned char)c));
        }
        return lower;
    }

}

namespace WebServer {

    bool Request::IsCompleteOrError() const {
        return (
            (state == State::Complete)
            || (state == State::Error)
        );
    }

    std::string Request::GetPath() const {
        return rawTarget.substr(0, rawTarget.find('?'));
    }

    std::string Request::GetQuery() const {
        const auto delimiter = rawTarget.find('?');
        if (delimiter == std::string::npos) {
            return "";
        }
        return rawTarget.substr(delimiter + 1);
    }

    std::string Request::GetBodyEncoding() const {
        if (!headers.HasHeader("Content-Type")) {
            return DEFAULT_BODY_ENCODING;
        }
        const auto contentType = headers.GetHeaderValue("Content-Type");
        size_t parameterStart = contentType.find(';');
        while (parameterStart != std::string::npos) {
            const auto parameterEnd = contentType.find(';', parameterStart + 1);
            const auto parameter = Trim(
                contentType.substr(
                    parameterStart + 1,
                    (
                        (parameterEnd == std::string::npos)
                        ? std::string::npos
                        : parameterEnd - parameterStart - 1
                    )
                )
            );
            const auto delimiter = parameter.find('=');
            if (delimiter != std::string::npos) {
                const auto name = ToLower(Trim(parameter.substr(0, delimiter)));
                if (name == "charset") {
                    auto value = Trim(parameter.substr(delimiter + 1));
                    if (
                        (value.length() >= 2)
                        && (value.front() == '"')
                        && (value.back() == '"')
                    ) {
                        value = value.substr(1, value.length() - 2);
                    }
                    value = ToLower(value);
                    if (!value.empty()) {
                        return value;
                    }
                }
            }
            parameterStart = parameterEnd;
        }
        return DEFAULT_BODY_ENCODING;
    }

    std::string Request::Generate() const {
        std::ostringstream builder;
        builder << method << ' ' << rawTarget << ' ' << protocol << "\r\n";
        builder << headers.GenerateRawHeaders();
        builder << body;
        return builder.str();
    }

    void PrintTo(
        const Request::State& state,
        std::ostream* os
    ) {
        switch (state) {
            case Request::State::RequestLine: {
                *os << "Constructing Request line";
            } break;
            case Request::State::Headers: {
                *os << "Constructing Headers";
            } break;
            case Request::State::Body: {
                *os << "Constructing Body";
            } break;
            case Request::State::Complete: {
                *os << "COMPLETE";
            } break;
            case Request::State::Error: {
                *os << "ERROR";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
