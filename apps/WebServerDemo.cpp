/**
 * @file WebServerDemo.cpp
 *
 * This module contains a small demonstration web application built
 * on the WebServer library: a login form protected by an anti-forgery
 * token, a page visible only to logged-in clients, and error pages.
 *
 * © 2018 by Richard Walters
 */

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <SystemAbstractions/DiagnosticsStreamReporter.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <thread>
#include <WebServer/PostProcessor.hpp>
#include <WebServer/Server.hpp>
#include <WebServer/SocketServerTransport.hpp>
#include <WebServer/SystemTimeKeeper.hpp>

namespace {

    /**
     * This flag is set by the signal handler when the user
     * asks the program to stop.
     */
    std::atomic< bool > shutDown(false);

    /**
     * This maps command-line options to the server configuration
     * items they set.
     */
    const std::map< std::string, std::string > OPTION_CONFIGURATION_ITEMS{
        {"--port", "Port"},
        {"--max-connections", "MaxSimultaneousConnections"},
        {"--session-expiration", "SessionExpiration"},
        {"--session-retention", "SessionRetention"},
        {"--public-address", "PublicAddress"},
        {"--header-line-limit", "HeaderLineLimit"},
        {"--max-content-length", "MaxContentLength"},
    };

    /**
     * This is the name of the session value identifying
     * the logged-in user.
     */
    const std::string USER_VALUE_NAME = "user";

    /**
     * This is the page with the login form.  The anti-forgery token
     * field is substituted for the placeholder before it's sent.
     */
    const std::string LOGIN_PAGE = (
        "<html><body>"
        "<h1>Log in</h1>"
        "<form method='post' action='/login'>"
        "<%AntiForgeryToken%>"
        "User name: <input name='username'/><br/>"
        "Password: <input name='password' type='password'/><br/>"
        "<input type='submit' value='Log in'/>"
        "</form>"
        "</body></html>"
    );

    /**
     * This function is set up to be called when the SIGINT signal is
     * received by the program.  It just sets the "shutDown" flag
     * and relies on the program to be polling the flag to detect
     * when it's been set.
     *
     * @param[in] sig
     *     This is the signal for which this function was called.
     */
    void InterruptHandler(int) {
        shutDown = true;
    }

    /**
     * This function prints to the standard error stream information
     * about how to use this program.
     */
    void PrintUsageInformation() {
        fprintf(
            stderr,
            (
                "Usage: WebServerDemo [options]\n"
                "\n"
                "Serve a demonstration web application.\n"
                "\n"
                "Options:\n"
                "  --port <n>                  port on which to listen (default 80)\n"
                "  --max-connections <n>       maximum simultaneous connection waits\n"
                "  --session-expiration <s>    seconds until an idle session expires\n"
                "  --session-retention <s>     seconds to keep expired sessions\n"
                "  --public-address <host>     host to use in redirect locations\n"
                "  --header-line-limit <n>     maximum request header line length\n"
                "  --max-content-length <n>    maximum request body length\n"
            )
        );
    }

    /**
     * This function wraps the given body in a minimal HTML page.
     *
     * @param[in] title
     *     This is the heading of the page.
     *
     * @param[in] body
     *     This is the content of the page below the heading.
     *
     * @return
     *     The HTML page is returned.
     */
    std::string MakePage(
        const std::string& title,
        const std::string& body
    ) {
        return SystemAbstractions::sprintf(
            "<html><body><h1>%s</h1>%s</body></html>",
            title.c_str(),
            body.c_str()
        );
    }

    /**
     * This function escapes the characters of the given text which
     * have special meaning in HTML.
     *
     * @param[in] text
     *     This is the text to escape.
     *
     * @return
     *     The escaped text is returned.
     */
    std::string EscapeHtml(const std::string& text) {
        std::string escaped;
        for (auto c: text) {
            switch (c) {
                case '&': escaped += "&amp;"; break;
                case '<': escaped += "&lt;"; break;
                case '>': escaped += "&gt;"; break;
                case '\'': escaped += "&#39;"; break;
                case '"': escaped += "&quot;"; break;
                default: escaped.push_back(c); break;
            }
        }
        return escaped;
    }

    /**
     * This function returns the path of the page describing
     * the given error.
     *
     * @param[in] error
     *     This is the error to describe.
     *
     * @return
     *     The path of the page describing the error is returned.
     */
    std::string MapErrorToPath(WebServer::ServerError error) {
        switch (error) {
            case WebServer::ServerError::ExpiredSession: return "/expired";
            case WebServer::ServerError::NotAuthorized: return "/";
            case WebServer::ServerError::FileNotFound:
            case WebServer::ServerError::PageNotFound: return "/notfound";
            case WebServer::ServerError::ValidationError: return "/validation";
            default: return "/error";
        }
    }

    /**
     * This function routes one request of the demonstration application.
     *
     * @param[in] server
     *     This is the server on which the request arrived.
     *
     * @param[in] session
     *     This is the session of the client making the request.
     *
     * @param[in] verb
     *     This is the request method.
     *
     * @param[in] path
     *     This is the path of the request target.
     *
     * @param[in] parameters
     *     These are the decoded query and body parameters.
     *
     * @return
     *     The descriptor of the response is returned.
     */
    WebServer::ResponseDescriptor Route(
        WebServer::Server& server,
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) {
        const auto sessions = server.GetSessionStore();
        const auto tokenName = server.GetConfigurationItem("ValidationTokenName");
        if (path == "/") {
            return WebServer::ResponseDescriptor::Content(LOGIN_PAGE, "text/html", "utf-8");
        } else if (
            (path == "/login")
            && (verb == "POST")
        ) {
            const auto token = parameters.find(tokenName);
            if (
                (token == parameters.end())
                || (token->second != session->GetValue(tokenName))
            ) {
                return WebServer::ResponseDescriptor::Error(WebServer::ServerError::ValidationError);
            }
            const auto username = parameters.find("username");
            if (
                (username == parameters.end())
                || username->second.empty()
            ) {
                return WebServer::ResponseDescriptor::Error(WebServer::ServerError::NotAuthorized);
            }
            session->SetValue(USER_VALUE_NAME, username->second);
            return WebServer::ResponseDescriptor::Redirect("/welcome");
        } else if (path == "/welcome") {
            if (!session->HasValue(USER_VALUE_NAME)) {
                return WebServer::ResponseDescriptor::Error(WebServer::ServerError::NotAuthorized);
            }
            if (sessions->IsExpired(session)) {
                session->RemoveValue(USER_VALUE_NAME);
                return WebServer::ResponseDescriptor::Error(WebServer::ServerError::ExpiredSession);
            }
            return WebServer::ResponseDescriptor::Content(
                MakePage(
                    "Welcome",
                    SystemAbstractions::sprintf(
                        "<p>Hello, %s.</p><p><a href='/logout'>Log out</a></p>",
                        EscapeHtml(session->GetValue(USER_VALUE_NAME)).c_str()
                    )
                ),
                "text/html",
                "utf-8"
            );
        } else if (path == "/logout") {
            sessions->Remove(session->GetClientKey());
            return WebServer::ResponseDescriptor::Redirect("/");
        } else if (path == "/expired") {
            return WebServer::ResponseDescriptor::Content(
                MakePage("Session expired", "<p><a href='/'>Log in again</a></p>"),
                "text/html",
                "utf-8"
            );
        } else if (path == "/validation") {
            return WebServer::ResponseDescriptor::Content(
                MakePage("Form validation failed", "<p><a href='/'>Try again</a></p>"),
                "text/html",
                "utf-8"
            );
        } else if (path == "/notfound") {
            return WebServer::ResponseDescriptor::Content(
                MakePage("Page not found", "<p><a href='/'>Home</a></p>"),
                "text/html",
                "utf-8"
            );
        } else if (path == "/error") {
            return WebServer::ResponseDescriptor::Content(
                MakePage("Something went wrong", "<p><a href='/'>Home</a></p>"),
                "text/html",
                "utf-8"
            );
        } else {
            return WebServer::ResponseDescriptor::Error(WebServer::ServerError::PageNotFound);
        }
    }

}

/**
 * This function is the entrypoint of the program.
 *
 * @param[in] argc
 *     This is the number of command-line arguments given to the program.
 *
 * @param[in] argv
 *     This is the array of command-line arguments given to the program.
 */
int main(int argc, char* argv[]) {
    const auto previousInterruptHandler = signal(SIGINT, InterruptHandler);
    WebServer::Server server;
    const auto diagnosticsPublisher = SystemAbstractions::DiagnosticsStreamReporter(stdout, stderr);
    const auto serverUnsubscribe = server.SubscribeToDiagnostics(diagnosticsPublisher, 0);
    for (int i = 1; i < argc; ++i) {
        const auto option = OPTION_CONFIGURATION_ITEMS.find(argv[i]);
        if (
            (option == OPTION_CONFIGURATION_ITEMS.end())
            || (i + 1 >= argc)
        ) {
            PrintUsageInformation();
            return EXIT_FAILURE;
        }
        server.SetConfigurationItem(option->second, argv[++i]);
    }
    const auto transport = std::make_shared< WebServer::SocketServerTransport >();
    const auto transportUnsubscribe = transport->SubscribeToDiagnostics(diagnosticsPublisher, 0);
    WebServer::Server::MobilizationDependencies deps;
    deps.transport = transport;
    deps.timeKeeper = std::make_shared< WebServer::SystemTimeKeeper >();
    deps.route = [&server](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ){
        return Route(server, session, verb, path, parameters);
    };
    deps.onError = MapErrorToPath;
    deps.onRequest = [&server](
        std::shared_ptr< WebServer::Session > session,
        const WebServer::Request& request
    ){
        const auto tokenName = server.GetConfigurationItem("ValidationTokenName");
        if (!session->HasValue(tokenName)) {
            session->SetValue(tokenName, WebServer::GenerateAntiForgeryToken());
        }
    };
    if (!server.Mobilize(deps)) {
        transportUnsubscribe();
        serverUnsubscribe();
        return EXIT_FAILURE;
    }
    printf("Web server up and running.  Press Ctrl+C to stop.\n");
    std::atomic< bool > listenerFailed(false);
    std::thread listenerMonitor(
        [&server, &listenerFailed]{
            std::string failure;
            if (server.WaitForListenerFailure(failure)) {
                fprintf(stderr, "Listener failed: %s\n", failure.c_str());
                listenerFailed = true;
            }
        }
    );
    while (
        !shutDown
        && !listenerFailed
    ) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    server.Demobilize();
    listenerMonitor.join();
    printf("Exiting...\n");
    transportUnsubscribe();
    serverUnsubscribe();
    (void)signal(SIGINT, previousInterruptHandler);
    return listenerFailed ? EXIT_FAILURE : EXIT_SUCCESS;
}
