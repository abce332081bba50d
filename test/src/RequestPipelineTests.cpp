/**
 * @file RequestPipelineTests.cpp
 *
 * This module contains the unit tests of the
 * WebServer::RequestPipeline class.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <deque>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>
#include <WebServer/RequestPipeline.hpp>

namespace {

    /**
     * This is a fake client connection which is used to test the pipeline.
     */
    struct MockConnection
        : public WebServer::Connection
    {
        // Properties

        /**
         * These are the pieces of data the "client" sends, in order.
         * Once they're all received, the client breaks the connection.
         */
        std::deque< std::string > chunksToReceive;

        /**
         * This holds onto a copy of all data sent to the client.
         */
        std::string dataSent;

        /**
         * This counts the number of times the connection was broken.
         */
        size_t breaks = 0;

        /**
         * This is the network address of the client.
         */
        std::string peerAddress = "10.0.0.1";

        // Methods

        // WebServer::Connection

        virtual std::string GetPeerId() override {
            return peerAddress + ":5555";
        }

        virtual std::string GetPeerAddress() override {
            return peerAddress;
        }

        virtual std::string GetHostAddress() override {
            return "10.0.0.2:8080";
        }

        virtual bool ReceiveData(std::vector< uint8_t >& data) override {
            if (chunksToReceive.empty()) {
                return false;
            }
            const auto chunk = chunksToReceive.front();
            chunksToReceive.pop_front();
            data.assign(chunk.begin(), chunk.end());
            return true;
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            dataSent += std::string(data.begin(), data.end());
        }

        virtual void Break(bool clean) override {
            ++breaks;
        }
    };

    /**
     * This is a fake time-keeper which is used to test the pipeline.
     */
    struct MockTimeKeeper
        : public WebServer::TimeKeeper
    {
        // Properties

        double currentTime = 0.0;

        // Methods

        // WebServer::TimeKeeper

        virtual double GetCurrentTime() override {
            return currentTime;
        }
    };

    /**
     * This is the error delegate used by the tests, which redirects
     * each error to a page named after it.
     *
     * @param[in] error
     *     This is the error to translate.
     *
     * @return
     *     The path of the page for the error is returned.
     */
    std::string ErrorPage(WebServer::ServerError error) {
        switch (error) {
            case WebServer::ServerError::NotAuthorized: return "/login";
            case WebServer::ServerError::ServerError: return "/servererror";
            default: return "/error";
        }
    }

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct RequestPipelineTests
    : public ::testing::Test
{
    // Properties

    /**
     * This holds the limits and delegates used by the pipeline.
     */
    WebServer::Configuration configuration;

    /**
     * This is the fake time-keeper used to stamp sessions.
     */
    std::shared_ptr< MockTimeKeeper > timeKeeper = std::make_shared< MockTimeKeeper >();

    /**
     * This is the store from which the pipeline resolves sessions.
     */
    std::unique_ptr< WebServer::SessionStore > sessions;

    /**
     * This is used by the pipeline to publish diagnostic messages.
     */
    SystemAbstractions::DiagnosticsSender diagnosticsSender;

    /**
     * This is the unit under test.
     */
    std::unique_ptr< WebServer::RequestPipeline > pipeline;

    /**
     * These are the diagnostic messages that have been
     * received from the unit under test.
     */
    std::vector< std::string > diagnosticMessages;

    /**
     * This is the delegate obtained when subscribing
     * to receive diagnostic messages from the unit under test.
     * It's called to terminate the subscription.
     */
    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate diagnosticsUnsubscribeDelegate;

    /**
     * This counts the number of times the route delegate was called.
     */
    size_t routeCalls = 0;

    // Methods

    /**
     * This is the constructor for the fixture.
     */
    RequestPipelineTests()
        : diagnosticsSender("WebServer::Server")
    {
    }

    /**
     * This method (re)creates the pipeline under test, so that it
     * picks up changes made to the configuration's post-processing.
     */
    void MakePipeline() {
        pipeline.reset(
            new WebServer::RequestPipeline(
                configuration,
                *sessions,
                diagnosticsSender
            )
        );
    }

    /**
     * This method parses the given raw request in one piece.
     *
     * @param[in] rawRequest
     *     This is the raw HTTP request message as a single string.
     *
     * @param[out] messageEnd
     *     This is where to store a count of the number of characters
     *     that made up the request message.
     *
     * @return
     *     The parsed request is returned, or nullptr if the request
     *     was incomplete.
     */
    std::shared_ptr< WebServer::Request > ParseRequest(
        const std::string& rawRequest,
        size_t& messageEnd
    ) {
        const auto request = std::make_shared< WebServer::Request >();
        messageEnd = pipeline->ParseRequest(*request, rawRequest);
        if (request->IsCompleteOrError()) {
            return request;
        } else {
            return nullptr;
        }
    }

    /**
     * This method parses the given raw request in one piece.
     *
     * @param[in] rawRequest
     *     This is the raw HTTP request message as a single string.
     *
     * @return
     *     The parsed request is returned, or nullptr if the request
     *     was incomplete.
     */
    std::shared_ptr< WebServer::Request > ParseRequest(const std::string& rawRequest) {
        size_t messageEnd;
        return ParseRequest(rawRequest, messageEnd);
    }

    /**
     * This method has the pipeline handle a connection from a client
     * which sends the given pieces of data.
     *
     * @param[in] chunks
     *     These are the pieces of data the client sends.
     *
     * @return
     *     The connection, after the pipeline is done with it,
     *     is returned.
     */
    std::shared_ptr< MockConnection > Serve(const std::vector< std::string >& chunks) {
        const auto connection = std::make_shared< MockConnection >();
        connection->chunksToReceive.assign(chunks.begin(), chunks.end());
        pipeline->HandleConnection(connection);
        return connection;
    }

    /**
     * This method returns an indication of whether or not the given
     * diagnostic message was published.
     *
     * @param[in] message
     *     This is the diagnostic message to look for.
     *
     * @return
     *     An indication of whether or not the given diagnostic message
     *     was published is returned.
     */
    bool HasDiagnostic(const std::string& message) {
        return (
            std::find(
                diagnosticMessages.begin(),
                diagnosticMessages.end(),
                message
            ) != diagnosticMessages.end()
        );
    }

    // ::testing::Test

    virtual void SetUp() {
        configuration.route = [this](
            std::shared_ptr< WebServer::Session > session,
            const std::string& verb,
            const std::string& path,
            const WebServer::Parameters& parameters
        ) -> WebServer::ResponseDescriptor {
            ++routeCalls;
            return WebServer::ResponseDescriptor::Content("Hello!", "text/plain", "utf-8");
        };
        configuration.onError = ErrorPage;
        sessions.reset(new WebServer::SessionStore(configuration, timeKeeper));
        MakePipeline();
        diagnosticsUnsubscribeDelegate = diagnosticsSender.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                diagnosticMessages.push_back(
                    SystemAbstractions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            0
        );
    }

    virtual void TearDown() {
        diagnosticsUnsubscribeDelegate();
    }
};

TEST_F(RequestPipelineTests, ParseGetRequest) {
    const auto request = ParseRequest(
        "GET /hello.txt?lang=en HTTP/1.1\r\n"
        "User-Agent: curl/7.16.3 libcurl/7.16.3 OpenSSL/0.9.7l zlib/1.2.3\r\n"
        "Host: www.example.com\r\n"
        "Accept-Language: en, mi\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_TRUE(request->valid);
    Uri::Uri expectedUri;
    expectedUri.ParseFromString("/hello.txt?lang=en");
    ASSERT_EQ("GET", request->method);
    ASSERT_EQ(expectedUri, request->target);
    ASSERT_EQ("/hello.txt", request->GetPath());
    ASSERT_EQ("lang=en", request->GetQuery());
    ASSERT_EQ("HTTP/1.1", request->protocol);
    ASSERT_TRUE(request->headers.HasHeader("User-Agent"));
    ASSERT_EQ("curl/7.16.3 libcurl/7.16.3 OpenSSL/0.9.7l zlib/1.2.3", request->headers.GetHeaderValue("User-Agent"));
    ASSERT_TRUE(request->headers.HasHeader("Host"));
    ASSERT_EQ("www.example.com", request->headers.GetHeaderValue("Host"));
    ASSERT_TRUE(request->headers.HasHeader("Accept-Language"));
    ASSERT_EQ("en, mi", request->headers.GetHeaderValue("Accept-Language"));
    ASSERT_TRUE(request->body.empty());
}

TEST_F(RequestPipelineTests, ParsePostRequest) {
    size_t messageEnd;
    const std::string rawRequest = (
        "POST / HTTP/1.1\r\n"
        "Host: foo.com\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
        "Content-Length: 13\r\n"
        "\r\n"
        "say=Hi&to=Mom\r\n"
    );
    const auto request = ParseRequest(rawRequest, messageEnd);
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_EQ("POST", request->method);
    ASSERT_EQ("/", request->GetPath());
    ASSERT_TRUE(request->headers.HasHeader("Content-Type"));
    ASSERT_EQ("application/x-www-form-urlencoded", request->headers.GetHeaderValue("Content-Type"));
    ASSERT_TRUE(request->headers.HasHeader("Content-Length"));
    ASSERT_EQ("13", request->headers.GetHeaderValue("Content-Length"));
    ASSERT_EQ("say=Hi&to=Mom", request->body);
    ASSERT_EQ(rawRequest.length() - 2, messageEnd);
}

TEST_F(RequestPipelineTests, ParseHttp10RequestWithoutHost) {
    const auto request = ParseRequest(
        "GET / HTTP/1.0\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_TRUE(request->valid);
    ASSERT_EQ("HTTP/1.0", request->protocol);
}

TEST_F(RequestPipelineTests, ParseInvalidHttp11RequestWithoutHost) {
    const auto request = ParseRequest(
        "GET / HTTP/1.1\r\n"
        "Accept-Language: en, mi\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_FALSE(request->valid);
}

TEST_F(RequestPipelineTests, ParseInvalidRequestNoMethod) {
    const auto request = ParseRequest(
        " /hello.txt HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_FALSE(request->valid);
}

TEST_F(RequestPipelineTests, ParseInvalidRequestNoTarget) {
    const auto request = ParseRequest(
        "GET  HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_FALSE(request->valid);
}

TEST_F(RequestPipelineTests, ParseInvalidRequestBadProtocol) {
    const auto request = ParseRequest(
        "GET /hello.txt Foo\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_FALSE(request->valid);
}

TEST_F(RequestPipelineTests, ParseInvalidDamagedHeader) {
    size_t messageEnd;
    const std::string rawRequest = (
        "GET /hello.txt HTTP/1.1\r\n"
        "User-Agent curl/7.16.3 libcurl/7.16.3 OpenSSL/0.9.7l zlib/1.2.3\r\n"
        "Host: www.example.com\r\n"
        "Accept-Language: en, mi\r\n"
        "\r\n"
    );
    const auto request = ParseRequest(rawRequest, messageEnd);
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_FALSE(request->valid);
    ASSERT_EQ(rawRequest.length(), messageEnd);
}

TEST_F(RequestPipelineTests, ParseInvalidHeaderLineTooLong) {
    const std::string testHeaderName("X-Poggers");
    const std::string testHeaderNameWithDelimiters = testHeaderName + ": ";
    const std::string valueIsTooLong(999 - testHeaderNameWithDelimiters.length(), 'X');
    const std::string rawRequest = (
        "GET /hello.txt HTTP/1.1\r\n"
        "User-Agent: curl/7.16.3 libcurl/7.16.3 OpenSSL/0.9.7l zlib/1.2.3\r\n"
        + testHeaderNameWithDelimiters + valueIsTooLong + "\r\n"
        "Host: www.example.com\r\n"
        "Accept-Language: en, mi\r\n"
        "\r\n"
    );
    const auto request = ParseRequest(rawRequest);
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Error, request->state);
}

TEST_F(RequestPipelineTests, ParseValidHeaderLineLongerThanDefault) {
    const std::string testHeaderName("X-Poggers");
    const std::string testHeaderNameWithDelimiters = testHeaderName + ": ";
    const std::string valueIsLongButWithinCustomLimit(999 - testHeaderNameWithDelimiters.length(), 'X');
    const std::string rawRequest = (
        "GET /hello.txt HTTP/1.1\r\n"
        "User-Agent: curl/7.16.3 libcurl/7.16.3 OpenSSL/0.9.7l zlib/1.2.3\r\n"
        + testHeaderNameWithDelimiters + valueIsLongButWithinCustomLimit + "\r\n"
        "Host: www.example.com\r\n"
        "Accept-Language: en, mi\r\n"
        "\r\n"
    );
    configuration.headerLineLimit = 1001;
    const auto request = ParseRequest(rawRequest);
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
}

TEST_F(RequestPipelineTests, ParseInvalidRequestLineTooLong) {
    const std::string uriTooLong(1000, 'X');
    const auto request = ParseRequest("GET " + uriTooLong + " HTTP/1.1\r\n");
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Error, request->state);
}

TEST_F(RequestPipelineTests, ParseInvalidBodyInsanelyTooLarge) {
    const auto request = ParseRequest(
        "POST /hello.txt HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Length: 1000000000000000000000000000000000000000000000000000000000000000000\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Error, request->state);
}

TEST_F(RequestPipelineTests, ParseInvalidBodySlightlyTooLarge) {
    const auto request = ParseRequest(
        "POST /hello.txt HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Length: 10000001\r\n"
        "\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Error, request->state);
}

TEST_F(RequestPipelineTests, ParseInvalidBodyOverCustomLimit) {
    configuration.maxContentLength = 10;
    const auto request = ParseRequest(
        "POST /login HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "username=ab"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Error, request->state);
}

TEST_F(RequestPipelineTests, ParseIncompleteBodyRequest) {
    const auto request = ParseRequest(
        "POST / HTTP/1.1\r\n"
        "Host: foo.com\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
        "Content-Length: 100\r\n"
        "\r\n"
        "say=Hi&to=Mom\r\n"
    );
    ASSERT_TRUE(request == nullptr);
}

TEST_F(RequestPipelineTests, ParseIncompleteHeadersBetweenLinesRequest) {
    const auto request = ParseRequest(
        "POST / HTTP/1.1\r\n"
        "Host: foo.com\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
    );
    ASSERT_TRUE(request == nullptr);
}

TEST_F(RequestPipelineTests, ParseIncompleteHeadersMidLineRequest) {
    const auto request = ParseRequest(
        "POST / HTTP/1.1\r\n"
        "Host: foo.com\r\n"
        "Content-Type: application/x-w"
    );
    ASSERT_TRUE(request == nullptr);
}

TEST_F(RequestPipelineTests, ParseIncompleteRequestLine) {
    const auto request = ParseRequest("POST / HTTP/1.1\r");
    ASSERT_TRUE(request == nullptr);
}

TEST_F(RequestPipelineTests, ParseIncompleteNoHeadersRequest) {
    const auto request = ParseRequest("POST / HTTP/1.1\r\n");
    ASSERT_TRUE(request == nullptr);
}

TEST_F(RequestPipelineTests, RequestWithNoContentLengthHasNoBody) {
    const auto request = ParseRequest(
        "GET /hello.txt HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
        "Hello, World!\r\n"
    );
    ASSERT_FALSE(request == nullptr);
    ASSERT_EQ(WebServer::Request::State::Complete, request->state);
    ASSERT_TRUE(request->body.empty());
}

TEST_F(RequestPipelineTests, QueryAndBodyParametersMergedBodyWins) {
    std::string routedVerb, routedPath;
    WebServer::Parameters routedParameters;
    configuration.route = [&routedVerb, &routedPath, &routedParameters](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        routedVerb = verb;
        routedPath = path;
        routedParameters = parameters;
        return WebServer::ResponseDescriptor::Redirect("/welcome");
    };
    const auto connection = Serve({
        "POST /login?debug=1&username=fromquery HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
        "Content-Length: 25\r\n"
        "\r\n"
        "username=abc&password=123"
    });
    EXPECT_EQ("POST", routedVerb);
    EXPECT_EQ("/login", routedPath);
    EXPECT_EQ(
        (WebServer::Parameters{
            {"debug", "1"},
            {"username", "abc"},
            {"password", "123"},
        }),
        routedParameters
    );
    EXPECT_EQ(
        "HTTP/1.1 302 Found\r\n"
        "Location: http://10.0.0.2:8080/welcome\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n"
        "\r\n",
        connection->dataSent
    );
    EXPECT_EQ(1, connection->breaks);
}

TEST_F(RequestPipelineTests, RequestLogged) {
    (void)Serve({
        "POST /login?debug=1 HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Length: 12\r\n"
        "\r\n"
        "username=abc"
    });
    EXPECT_TRUE(HasDiagnostic("WebServer::Server[1]: 10.0.0.1:5555 POST /login"));
    EXPECT_TRUE(HasDiagnostic("WebServer::Server[1]: debug : 1"));
    EXPECT_TRUE(HasDiagnostic("WebServer::Server[1]: username : abc"));
}

TEST_F(RequestPipelineTests, RequestInSeveralPieces) {
    WebServer::Parameters routedParameters;
    configuration.route = [&routedParameters](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        routedParameters = parameters;
        return WebServer::ResponseDescriptor::Content("ok", "text/plain");
    };
    const auto connection = Serve({
        "POST /login HTTP/1.1\r\nHo",
        "st: www.example.com\r\nContent-Le",
        "ngth: 12\r\n\r\nuser",
        "name=abc",
    });
    EXPECT_EQ(
        (WebServer::Parameters{
            {"username", "abc"},
        }),
        routedParameters
    );
    EXPECT_EQ(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: 2\r\n"
        "Connection: close\r\n"
        "\r\n"
        "ok",
        connection->dataSent
    );
}

TEST_F(RequestPipelineTests, Latin1BodyDecodedToUtf8) {
    WebServer::Parameters routedParameters;
    configuration.route = [&routedParameters](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        routedParameters = parameters;
        return WebServer::ResponseDescriptor::Redirect("/");
    };
    (void)Serve({
        "POST /order HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Type: application/x-www-form-urlencoded; charset=ISO-8859-1\r\n"
        "Content-Length: 9\r\n"
        "\r\n"
        "item=caf\xe9"
    });
    EXPECT_EQ("caf\xc3\xa9", routedParameters["item"]);
}

TEST_F(RequestPipelineTests, RouteExceptionBecomesServerErrorRedirect) {
    configuration.route = [](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        throw std::runtime_error("database unavailable");
    };
    const auto connection = Serve({
        "GET /account HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    EXPECT_EQ(
        "HTTP/1.1 302 Found\r\n"
        "Location: http://10.0.0.2:8080/servererror\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n"
        "\r\n",
        connection->dataSent
    );
    EXPECT_EQ(1, connection->breaks);
    EXPECT_TRUE(
        HasDiagnostic(
            SystemAbstractions::sprintf(
                "WebServer::Server[%zu]: GET /account from 10.0.0.1:5555 failed: database unavailable",
                (size_t)SystemAbstractions::DiagnosticsSender::Levels::ERROR
            )
        )
    );
}

TEST_F(RequestPipelineTests, NonStandardRouteExceptionBecomesServerErrorRedirect) {
    configuration.route = [](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        throw 42;
    };
    const auto descriptor = pipeline->ProcessRequest(
        *ParseRequest(
            "GET /account HTTP/1.1\r\n"
            "Host: www.example.com\r\n"
            "\r\n"
        ),
        "10.0.0.1",
        "10.0.0.1:5555"
    );
    EXPECT_EQ("/servererror", descriptor.redirect);
}

TEST_F(RequestPipelineTests, ErrorClassificationTranslatedToRedirect) {
    configuration.route = [](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        return WebServer::ResponseDescriptor::Error(WebServer::ServerError::NotAuthorized);
    };
    configuration.publicAddress = "1.2.3.4";
    const auto connection = Serve({
        "GET /account HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    EXPECT_EQ(
        "HTTP/1.1 302 Found\r\n"
        "Location: http://1.2.3.4/login\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n"
        "\r\n",
        connection->dataSent
    );
}

TEST_F(RequestPipelineTests, FailingErrorTranslationFallsBackToRoot) {
    configuration.route = [](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        throw std::runtime_error("route failed");
    };
    configuration.onError = [](WebServer::ServerError error) -> std::string {
        throw std::runtime_error("error page lookup failed");
    };
    const auto descriptor = pipeline->ProcessRequest(
        *ParseRequest(
            "GET /account HTTP/1.1\r\n"
            "Host: www.example.com\r\n"
            "\r\n"
        ),
        "10.0.0.1",
        "10.0.0.1:5555"
    );
    EXPECT_EQ("/", descriptor.redirect);
}

TEST_F(RequestPipelineTests, InvalidRequestRedirectedWithoutRouting) {
    const auto connection = Serve({
        "GET /hello.txt Foo\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    EXPECT_EQ(0, routeCalls);
    EXPECT_EQ(
        "HTTP/1.1 302 Found\r\n"
        "Location: http://10.0.0.2:8080/servererror\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n"
        "\r\n",
        connection->dataSent
    );
    EXPECT_EQ(1, connection->breaks);
    EXPECT_EQ(0, sessions->GetSessionCount());
}

TEST_F(RequestPipelineTests, InvalidRequestLogged) {
    (void)Serve({
        "GET /hello.txt Foo\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    EXPECT_TRUE(HasDiagnostic("WebServer::Server[1]: 10.0.0.1:5555 GET /hello.txt"));
    EXPECT_TRUE(HasDiagnostic("WebServer::Server[2]: bad request from 10.0.0.1:5555"));
}

TEST_F(RequestPipelineTests, UnparseableRequestRedirectedWithoutRouting) {
    const std::string uriTooLong(1000, 'X');
    const auto connection = Serve({"GET " + uriTooLong + " HTTP/1.1\r\n"});
    EXPECT_EQ(0, routeCalls);
    EXPECT_EQ(
        "HTTP/1.1 302 Found\r\n"
        "Location: http://10.0.0.2:8080/servererror\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n"
        "\r\n",
        connection->dataSent
    );
}

TEST_F(RequestPipelineTests, ConnectionBrokenBeforeRequestComplete) {
    const auto connection = Serve({
        "POST /login HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Length: 100\r\n"
        "\r\n"
        "username=abc"
    });
    EXPECT_EQ(0, routeCalls);
    EXPECT_TRUE(connection->dataSent.empty());
    EXPECT_EQ(1, connection->breaks);
}

TEST_F(RequestPipelineTests, SessionTouchedAfterDispatch) {
    double lastActivitySeenByRoute = -1.0;
    bool expiredSeenByRoute = false;
    configuration.route = [this, &lastActivitySeenByRoute, &expiredSeenByRoute](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        lastActivitySeenByRoute = session->GetLastActivityTime();
        expiredSeenByRoute = sessions->IsExpired(session);
        return WebServer::ResponseDescriptor::Redirect("/");
    };
    const std::string rawRequest = (
        "GET / HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    );
    timeKeeper->currentTime = 10.0;
    (void)Serve({rawRequest});
    EXPECT_EQ(10.0, lastActivitySeenByRoute);
    EXPECT_FALSE(expiredSeenByRoute);
    timeKeeper->currentTime = 100.0;
    (void)Serve({rawRequest});
    EXPECT_EQ(10.0, lastActivitySeenByRoute);
    EXPECT_TRUE(expiredSeenByRoute);
    EXPECT_EQ(100.0, sessions->Resolve("10.0.0.1")->GetLastActivityTime());
}

TEST_F(RequestPipelineTests, SessionKeyedByPeerAddress) {
    std::vector< std::shared_ptr< WebServer::Session > > routedSessions;
    configuration.route = [&routedSessions](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        routedSessions.push_back(session);
        return WebServer::ResponseDescriptor::Redirect("/");
    };
    const std::string rawRequest = (
        "GET / HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    );
    (void)Serve({rawRequest});
    (void)Serve({rawRequest});
    const auto otherClient = std::make_shared< MockConnection >();
    otherClient->peerAddress = "10.0.0.9";
    otherClient->chunksToReceive.push_back(rawRequest);
    pipeline->HandleConnection(otherClient);
    ASSERT_EQ(3, routedSessions.size());
    EXPECT_EQ(routedSessions[0], routedSessions[1]);
    EXPECT_NE(routedSessions[0], routedSessions[2]);
    EXPECT_EQ("10.0.0.9", routedSessions[2]->GetClientKey());
}

TEST_F(RequestPipelineTests, RequestObserverSeesRequestBeforeRouting) {
    std::string observedTarget;
    configuration.onRequest = [&observedTarget](
        std::shared_ptr< WebServer::Session > session,
        const WebServer::Request& request
    ){
        observedTarget = request.rawTarget;
        session->SetValue("__CSRFToken__", "T0KEN");
    };
    std::string tokenSeenByRoute;
    configuration.route = [&tokenSeenByRoute](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        tokenSeenByRoute = session->GetValue("__CSRFToken__");
        return WebServer::ResponseDescriptor::Redirect("/");
    };
    (void)Serve({
        "GET /form?x=1 HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    EXPECT_EQ("/form?x=1", observedTarget);
    EXPECT_EQ("T0KEN", tokenSeenByRoute);
}

TEST_F(RequestPipelineTests, RequestObserverExceptionDoesNotStopRouting) {
    configuration.onRequest = [](
        std::shared_ptr< WebServer::Session > session,
        const WebServer::Request& request
    ){
        throw std::runtime_error("audit log full");
    };
    const auto connection = Serve({
        "GET / HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    EXPECT_EQ(1, routeCalls);
    EXPECT_EQ(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain; charset=utf-8\r\n"
        "Content-Length: 6\r\n"
        "Connection: close\r\n"
        "\r\n"
        "Hello!",
        connection->dataSent
    );
    EXPECT_TRUE(
        HasDiagnostic(
            SystemAbstractions::sprintf(
                "WebServer::Server[%zu]: request observer failed: audit log full",
                (size_t)SystemAbstractions::DiagnosticsSender::Levels::WARNING
            )
        )
    );
}

TEST_F(RequestPipelineTests, HtmlContentGetsAntiForgeryToken) {
    configuration.onRequest = [](
        std::shared_ptr< WebServer::Session > session,
        const WebServer::Request& request
    ){
        session->SetValue("__CSRFToken__", "abc123");
    };
    configuration.route = [](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        return WebServer::ResponseDescriptor::Content(
            "<form><%AntiForgeryToken%></form>",
            "text/html",
            "utf-8"
        );
    };
    const auto connection = Serve({
        "GET / HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    const std::string expectedBody = "<form><input name='__CSRFToken__' type='hidden' value='abc123' id='__csrf__'/></form>";
    EXPECT_EQ(
        SystemAbstractions::sprintf(
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: text/html; charset=utf-8\r\n"
            "Content-Length: %zu\r\n"
            "Connection: close\r\n"
            "\r\n"
            "%s",
            expectedBody.length(),
            expectedBody.c_str()
        ),
        connection->dataSent
    );
}

TEST_F(RequestPipelineTests, NonHtmlContentPassesThroughUnchanged) {
    const std::string binary("<%AntiForgeryToken%>\x00\xff", 22);
    configuration.route = [&binary](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        return WebServer::ResponseDescriptor::Content(binary, "application/octet-stream");
    };
    const auto connection = Serve({
        "GET /download HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "\r\n"
    });
    const auto bodyStart = connection->dataSent.find("\r\n\r\n");
    ASSERT_NE(std::string::npos, bodyStart);
    EXPECT_EQ(binary, connection->dataSent.substr(bodyStart + 4));
}

TEST_F(RequestPipelineTests, CustomPostProcessorUsed) {
    configuration.postProcess = [](
        std::shared_ptr< WebServer::Session > session,
        const std::string& html
    ){
        return html + "<!-- processed -->";
    };
    MakePipeline();
    configuration.route = [](
        std::shared_ptr< WebServer::Session > session,
        const std::string& verb,
        const std::string& path,
        const WebServer::Parameters& parameters
    ) -> WebServer::ResponseDescriptor {
        return WebServer::ResponseDescriptor::Content("<p>Hi</p>", "text/html");
    };
    const auto descriptor = pipeline->ProcessRequest(
        *ParseRequest(
            "GET / HTTP/1.1\r\n"
            "Host: www.example.com\r\n"
            "\r\n"
        ),
        "10.0.0.1",
        "10.0.0.1:5555"
    );
    EXPECT_EQ("<p>Hi</p><!-- processed -->", descriptor.data);
}
