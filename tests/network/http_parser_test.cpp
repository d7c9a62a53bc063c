#include "csync/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace csync::network;
using csync::ErrorCode;

namespace {

csync::Result<bool> feed(HttpResponseParser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpResponseParserTest, ParsesContentLengthResponse) {
    HttpResponseParser parser;
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "[]");

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_TRUE(result.value());
    const auto response = parser.get_response();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.reason_phrase, "OK");
    EXPECT_EQ(response.get_header("content-type"), "application/json");
    EXPECT_EQ(response.body_as_string(), "[]");
}

TEST(HttpResponseParserTest, AcceptsOneByteAtATime) {
    const std::string wire =
        "HTTP/1.1 401 Unauthorized\r\n"
        "Content-Length: 17\r\n"
        "\r\n"
        "401: Unauthorized";

    HttpResponseParser parser;
    for (std::size_t i = 0; i < wire.size(); ++i) {
        EXPECT_FALSE(parser.is_complete()) << "byte " << i;
        ASSERT_TRUE(parser.parse(&wire[i], 1).is_ok()) << "byte " << i;
    }

    ASSERT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.get_response().status_code, 401);
    EXPECT_EQ(parser.get_response().body_as_string(), "401: Unauthorized");
}

TEST(HttpResponseParserTest, DecodesChunkedBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "4;name=value\r\n"
        "[{\"a\r\n"
        "3\r\n"
        "\":1\r\n"
        "2\r\n"
        "}]\r\n"
        "0\r\n"
        "X-Trailer: ignored\r\n"
        "\r\n");

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "[{\"a\":1}]");
}

TEST(HttpResponseParserTest, BodyUntilCloseCompletesOnFinish) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.0 200 OK\r\nServer: test\r\n\r\npartial body");

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_EQ(parser.get_response().version, HttpVersion::HTTP_1_0);
    EXPECT_EQ(parser.get_response().body_as_string(), "partial body");
}

TEST(HttpResponseParserTest, FinishBeforeCompletionIsProtocolError) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc").is_ok());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().code, ErrorCode::Protocol);
}

TEST(HttpResponseParserTest, NoContentCompletesWithoutBody) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 204 No Content\r\n\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.get_response().body.empty());
}

TEST(HttpResponseParserTest, StatusLineWithoutReasonPhrase) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 200\r\nContent-Length: 0\r\n\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().status_code, 200);
    EXPECT_TRUE(parser.get_response().reason_phrase.empty());
}

TEST(HttpResponseParserTest, RejectsMalformedResponses) {
    const char* inputs[] = {
        "HTTP/2.0 200 OK\r\n\r\n",
        "HTTP/1.1 20 OK\r\n\r\n",
        "HTTP/1.1 2x0 OK\r\n\r\n",
        "HTTP/1.1 200 OK\n\n",
        "HTTP/1.1 200 OK\r\nBad Header: x\r\n\r\n",
        "HTTP/1.1 200 OK\r\nContent-Length: 1O\r\n\r\n",
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n",
    };

    for (const char* input : inputs) {
        HttpResponseParser parser;
        auto result = feed(parser, input);
        ASSERT_TRUE(result.is_error()) << input;
        EXPECT_EQ(result.error().code, ErrorCode::Protocol) << input;
        EXPECT_NE(result.error().message.find("Malformed"), std::string::npos) << input;
    }
}

TEST(HttpResponseParserTest, ResetAllowsReuse) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 999 Nope\r\nX: \r\n").is_ok());
    ASSERT_TRUE(feed(parser, "bad header\r\n").is_error());

    parser.reset();
    auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "ok");
}
