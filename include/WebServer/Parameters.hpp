#ifndef WEB_SERVER_PARAMETERS_HPP
#define WEB_SERVER_PARAMETERS_HPP

/**
 * @file Parameters.hpp
 *
 * This module declares the WebServer::Parameters type and the functions
 * which decode parameters from query strings and form bodies.
 *
 * © 2018 by Richard Walters
 */

#include <map>
#include <string>

namespace WebServer {

    /**
     * This holds the named parameters of a request, merged from its
     * query string and its body.
     */
    typedef std::map< std::string, std::string > Parameters;

    /**
     * This function decodes the given "key=value&key=value" string
     * into parameters.  Each segment is split on its first equals sign;
     * a segment without one becomes a key with an empty value.
     * Values are taken literally, without percent-decoding.
     *
     * @param[in] raw
     *     This is the encoded string to decode.
     *
     * @param[in,out] parameters
     *     This is where to insert the decoded parameters.  A key
     *     already present, or repeated in the raw string, takes
     *     the value decoded last.
     */
    void DecodeParameters(
        const std::string& raw,
        Parameters& parameters
    );

    /**
     * This function decodes the given "key=value&key=value" string
     * into a new set of parameters.
     *
     * @param[in] raw
     *     This is the encoded string to decode.
     *
     * @return
     *     The decoded parameters are returned.
     */
    Parameters DecodeParameters(const std::string& raw);

}

#endif /* WEB_SERVER_PARAMETERS_HPP */
