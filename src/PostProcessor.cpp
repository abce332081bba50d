/**
 * @file PostProcessor.cpp
 *
 * This module contains the implementation of the default post-processing
 * of HTML content.
 *
 * © 2018 by Richard Walters
 */

#include <random>
#include <SystemAbstractions/StringExtensions.hpp>
#include <WebServer/PostProcessor.hpp>

namespace {

    /**
     * This is the identifier given to the generated anti-forgery
     * token field.
     */
    const std::string TOKEN_FIELD_ID = "__csrf__";

    /**
     * This is the number of 32-bit random words in a token.
     */
    constexpr size_t TOKEN_WORDS = 4;

}

namespace WebServer {

    std::string InsertAntiForgeryToken(
        std::shared_ptr< Session > session,
        const std::string& html,
        const std::string& placeholder,
        const std::string& tokenName
    ) {
        if (placeholder.empty()) {
            return html;
        }
        auto position = html.find(placeholder);
        if (position == std::string::npos) {
            return html;
        }
        const auto field = SystemAbstractions::sprintf(
            "<input name='%s' type='hidden' value='%s' id='%s'/>",
            tokenName.c_str(),
            session->GetValue(tokenName).c_str(),
            TOKEN_FIELD_ID.c_str()
        );
        std::string output;
        size_t copied = 0;
        while (position != std::string::npos) {
            output += html.substr(copied, position - copied);
            output += field;
            copied = position + placeholder.length();
            position = html.find(placeholder, copied);
        }
        output += html.substr(copied);
        return output;
    }

    PostProcessDelegate MakeDefaultPostProcessor(const Configuration& configuration) {
        const auto placeholder = configuration.validationTokenPlaceholder;
        const auto tokenName = configuration.validationTokenName;
        return [placeholder, tokenName](
            std::shared_ptr< Session > session,
            const std::string& html
        ){
            return InsertAntiForgeryToken(session, html, placeholder, tokenName);
        };
    }

    std::string GenerateAntiForgeryToken() {
        std::random_device generator;
        std::string token;
        for (size_t i = 0; i < TOKEN_WORDS; ++i) {
            token += SystemAbstractions::sprintf("%08x", (unsigned int)generator());
        }
        return token;
    }

}
