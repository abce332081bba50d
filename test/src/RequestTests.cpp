/**
 * @file RequestTests.cpp
 *
 * This module contains the unit tests of the
 * WebServer::Request structure.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <SystemAbstractions/StringExtensions.hpp>
#include <WebServer/Request.hpp>

TEST(RequestTests, Is_Complete_Or_Error) {
    WebServer::Request request;
    request.state = WebServer::Request::State::Complete;
    EXPECT_TRUE(request.IsCompleteOrError());
    request.state = WebServer::Request::State::Error;
    EXPECT_TRUE(request.IsCompleteOrError());
    request.state = WebServer::Request::State::Headers;
    EXPECT_FALSE(request.IsCompleteOrError());
    request.state = WebServer::Request::State::RequestLine;
    EXPECT_FALSE(request.IsCompleteOrError());
    request.state = WebServer::Request::State::Body;
    EXPECT_FALSE(request.IsCompleteOrError());
}

TEST(RequestTests, Path_And_Query_Split_At_First_Question_Mark) {
    WebServer::Request request;
    request.rawTarget = "/search?q=a?b&debug=1";
    EXPECT_EQ("/search", request.GetPath());
    EXPECT_EQ("q=a?b&debug=1", request.GetQuery());
}

TEST(RequestTests, Target_Without_Query_Has_Empty_Query) {
    WebServer::Request request;
    request.rawTarget = "/login";
    EXPECT_EQ("/login", request.GetPath());
    EXPECT_EQ("", request.GetQuery());
}

TEST(RequestTests, Body_Encoding_Defaults_To_Utf8) {
    WebServer::Request request;
    EXPECT_EQ("utf-8", request.GetBodyEncoding());
    request.headers.SetHeader("Content-Type", "application/x-www-form-urlencoded");
    EXPECT_EQ("utf-8", request.GetBodyEncoding());
}

TEST(RequestTests, Body_Encoding_From_Content_Type_Charset) {
    WebServer::Request request;
    request.headers.SetHeader("Content-Type", "application/x-www-form-urlencoded; charset=ISO-8859-1");
    EXPECT_EQ("iso-8859-1", request.GetBodyEncoding());
    request.headers.SetHeader("Content-Type", "text/plain; format=flowed; Charset=\"UTF-16\"");
    EXPECT_EQ("utf-16", request.GetBodyEncoding());
}

TEST(RequestTests, Body_Encoding_With_Non_Ascii_Bytes_In_Content_Type) {
    WebServer::Request request;
    request.headers.SetHeader("Content-Type", "text/plain; ch\xc4rset=ISO-8859-1");
    EXPECT_EQ("utf-8", request.GetBodyEncoding());
    request.headers.SetHeader("Content-Type", "text/plain; charset=\xc4\xd6");
    EXPECT_EQ("\xc4\xd6", request.GetBodyEncoding());
}

TEST(RequestTests, Generate_Get_Request) {
    WebServer::Request request;
    request.method = "GET";
    request.rawTarget = "/foo?bar=1";
    request.protocol = "HTTP/1.1";
    request.headers.SetHeader("Host", "www.example.com");
    request.headers.SetHeader("Content-Type", "text/plain");
    ASSERT_EQ(
        "GET /foo?bar=1 HTTP/1.1\r\n"
        "Host: www.example.com\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n",
        request.Generate()
    );
}

TEST(RequestTests, Generate_Post_Request) {
    WebServer::Request request;
    request.method = "POST";
    request.rawTarget = "/login";
    request.protocol = "HTTP/1.1";
    request.headers.SetHeader("Host", "www.example.com");
    request.headers.SetHeader("Content-Type", "application/x-www-form-urlencoded");
    request.body = "username=abc&password=123";
    request.headers.AddHeader("Content-Length", SystemAbstractions::sprintf("%zu", request.body.size()));
    ASSERT_EQ(
        SystemAbstractions::sprintf(
            "POST /login HTTP/1.1\r\n"
            "Host: www.example.com\r\n"
            "Content-Type: application/x-www-form-urlencoded\r\n"
            "Content-Length: %zu\r\n"
            "\r\n"
            "username=abc&password=123",
            request.body.size()
        ),
        request.Generate()
    );
}
