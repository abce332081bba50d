#ifndef WEB_SERVER_POST_PROCESSOR_HPP
#define WEB_SERVER_POST_PROCESSOR_HPP

/**
 * @file PostProcessor.hpp
 *
 * This module declares the default post-processing of HTML content,
 * which injects anti-forgery tokens into forms.
 *
 * © 2018 by Richard Walters
 */

#include "Configuration.hpp"
#include "Session.hpp"

#include <memory>
#include <string>

namespace WebServer {

    /**
     * This function replaces every occurrence of the given placeholder
     * in the given HTML with a hidden form field carrying the session's
     * anti-forgery token:
     *
     *     <input name='NAME' type='hidden' value='TOKEN' id='__csrf__'/>
     *
     * If the session holds no token, the field's value is left empty,
     * which will fail any later token validation.
     *
     * @param[in] session
     *     This is the session holding the token.
     *
     * @param[in] html
     *     This is the HTML to rewrite.
     *
     * @param[in] placeholder
     *     This is the text to replace.
     *
     * @param[in] tokenName
     *     This is the name of the session value holding the token,
     *     which is also used as the name of the form field.
     *
     * @return
     *     The rewritten HTML is returned.
     */
    std::string InsertAntiForgeryToken(
        std::shared_ptr< Session > session,
        const std::string& html,
        const std::string& placeholder,
        const std::string& tokenName
    );

    /**
     * This function returns the post-processing delegate used when
     * the application provides none: InsertAntiForgeryToken, with the
     * placeholder and token name taken from the given configuration.
     *
     * @param[in] configuration
     *     This holds the placeholder and token name to use.
     *
     * @return
     *     The default post-processing delegate is returned.
     */
    PostProcessDelegate MakeDefaultPostProcessor(const Configuration& configuration);

    /**
     * This function generates a new random anti-forgery token,
     * as 32 hexadecimal digits.
     *
     * @return
     *     The new token is returned.
     */
    std::string GenerateAntiForgeryToken();

}

#endif /* WEB_SERVER_POST_PROCESSOR_HPP */
