/**
 * @file Parameters.cpp
 *
 * This module contains the implementation of the parameter decoding
 * functions.
 *
 * © 2018 by Richard Walters
 */

#include <WebServer/Parameters.hpp>

namespace WebServer {

    void DecodeParameters(
        const std::string& raw,
        Parameters& parameters
    ) {
        if (raw.empty()) {
            return;
        }
        size_t segmentStart = 0;
        for (;;) {
            const auto segmentEnd = raw.find('&', segmentStart);
            const auto segment = raw.substr(
                segmentStart,
                (
                    (segmentEnd == std::string::npos)
                    ? std::string::npos
                    : segmentEnd - segmentStart
                )
            );
            const auto delimiter = segment.find('=');
            if (delimiter == std::string::npos) {
                parameters[segment] = "";
            } else {
                parameters[segment.substr(0, delimiter)] = segment.substr(delimiter + 1);
            }
            if (segmentEnd == std::string::npos) {
                break;
            }
            segmentStart = segmentEnd + 1;
        }
    }

    Parameters DecodeParameters(const std::string& raw) {
        Parameters parameters;
        DecodeParameters(raw, parameters);
        return parameters;
    }

}
