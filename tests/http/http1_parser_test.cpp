/**
 * hellosvc HTTP/1 Parser Tests
 *
 * Request line, headers, framing (Content-Length, chunked, keep-alive) and
 * incremental parsing.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/http/http1_parser.h"

#include <cctype>
#include <string>
#include <vector>

using namespace hellosvc::http;
using namespace hellosvc::testing;

// =============================================================================
// HTTP/1 Parser Test Fixture
// =============================================================================

class HTTP1ParserTest : public HelloSvcTest {
protected:
    HTTP1Parser parser_;
    HTTP1Request request_;
    size_t consumed_{0};
    std::string buffer_;  // keeps parsed input alive for request_'s views

    void SetUp() override {
        HelloSvcTest::SetUp();
        parser_.reset();
        request_ = HTTP1Request{};
        consumed_ = 0;
    }

    int parse(const std::string& data) {
        buffer_ = data;
        return parser_.parse(
            reinterpret_cast<const uint8_t*>(buffer_.data()),
            buffer_.size(),
            request_,
            consumed_
        );
    }

    std::string random_query() {
        int params = rng_.random_int(1, 4);
        std::string query;
        for (int i = 0; i < params; ++i) {
            if (i > 0) query += "&";
            query += rng_.random_string(5) + "=" + rng_.random_string(8);
        }
        return query;
    }
};

// =============================================================================
// Request Line
// =============================================================================

TEST_F(HTTP1ParserTest, ParseHelloRequest) {
    std::string req = "GET /hello HTTP/1.1\r\nHost: localhost:3000\r\n\r\n";

    EXPECT_EQ(parse(req), 0);
    EXPECT_TRUE(parser_.is_complete());
    EXPECT_EQ(request_.method, HTTP1Method::GET);
    EXPECT_EQ(request_.method_str, "GET");
    EXPECT_EQ(request_.version, HTTP1Version::HTTP_1_1);
    EXPECT_EQ(request_.url, "/hello");
    EXPECT_EQ(request_.path, "/hello");
    EXPECT_TRUE(request_.query.empty());
    EXPECT_EQ(request_.header_count, 1u);
    EXPECT_EQ(consumed_, req.size());
    EXPECT_EQ(request_.header_length, req.size());
}

TEST_F(HTTP1ParserTest, ParseAllMethods) {
    std::vector<std::pair<std::string, HTTP1Method>> methods = {
        {"GET", HTTP1Method::GET},
        {"HEAD", HTTP1Method::HEAD},
        {"POST", HTTP1Method::POST},
        {"PUT", HTTP1Method::PUT},
        {"DELETE", HTTP1Method::DELETE},
        {"CONNECT", HTTP1Method::CONNECT},
        {"OPTIONS", HTTP1Method::OPTIONS},
        {"TRACE", HTTP1Method::TRACE},
        {"PATCH", HTTP1Method::PATCH}
    };

    for (const auto& [method_str, expected] : methods) {
        std::string req = method_str + " /hello HTTP/1.1\r\nHost: x\r\n\r\n";
        EXPECT_EQ(parse(req), 0) << method_str;
        EXPECT_EQ(request_.method, expected) << method_str;
        EXPECT_EQ(request_.method_str, method_str);
    }
}

TEST_F(HTTP1ParserTest, ExtensionMethodIsUnknownButValid) {
    EXPECT_EQ(parse("PROPFIND /hello HTTP/1.1\r\n\r\n"), 0);
    EXPECT_EQ(request_.method, HTTP1Method::UNKNOWN);
    EXPECT_EQ(request_.method_str, "PROPFIND");
}

TEST_F(HTTP1ParserTest, ParseHTTP10) {
    EXPECT_EQ(parse("GET /hello HTTP/1.0\r\n\r\n"), 0);
    EXPECT_EQ(request_.version, HTTP1Version::HTTP_1_0);
    EXPECT_FALSE(request_.keep_alive);
}

TEST_F(HTTP1ParserTest, QueryAndFragmentAreSplitOff) {
    std::string query = random_query();
    EXPECT_EQ(parse("GET /hello?" + query + "#frag HTTP/1.1\r\n\r\n"), 0);
    EXPECT_EQ(request_.path, "/hello");
    EXPECT_EQ(request_.query, query);
    EXPECT_EQ(request_.fragment, "frag");

    EXPECT_EQ(parse("GET /hello#top HTTP/1.1\r\n\r\n"), 0);
    EXPECT_EQ(request_.path, "/hello");
    EXPECT_TRUE(request_.query.empty());
    EXPECT_EQ(request_.fragment, "top");
}

TEST_F(HTTP1ParserTest, RandomPaths) {
    for (int i = 0; i < 50; ++i) {
        std::string path = rng_.random_unrouted_path();
        EXPECT_EQ(parse("GET " + path + " HTTP/1.1\r\n\r\n"), 0) << path;
        EXPECT_EQ(request_.path, path);
    }
}

// =============================================================================
// Headers
// =============================================================================

TEST_F(HTTP1ParserTest, HeaderLookupIsCaseInsensitive) {
    std::string name = rng_.random_header_name();
    std::string value = rng_.random_header_value();

    EXPECT_EQ(parse("GET /hello HTTP/1.1\r\n" + name + ":   " + value + "  \r\n\r\n"), 0);

    std::string upper = name;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    EXPECT_EQ(request_.get_header(upper), value);
    EXPECT_TRUE(request_.has_header(upper));
    EXPECT_FALSE(request_.has_header("X-Missing"));
    EXPECT_TRUE(request_.get_header("X-Missing").empty());
}

TEST_F(HTTP1ParserTest, EmptyHeaderValue) {
    EXPECT_EQ(parse("GET /hello HTTP/1.1\r\nX-Empty:\r\n\r\n"), 0);
    EXPECT_TRUE(request_.has_header("x-empty"));
    EXPECT_TRUE(request_.get_header("x-empty").empty());
}

TEST_F(HTTP1ParserTest, TooManyHeadersIsAnError) {
    std::string req = "GET /hello HTTP/1.1\r\n";
    for (size_t i = 0; i <= HTTP1Request::MAX_HEADERS; ++i) {
        req += "X-H" + std::to_string(i) + ": v\r\n";
    }
    req += "\r\n";
    EXPECT_EQ(parse(req), 1);
    EXPECT_TRUE(parser_.has_error());
}

TEST_F(HTTP1ParserTest, InvalidHeaderNameIsAnError) {
    EXPECT_EQ(parse("GET /hello HTTP/1.1\r\nBad Header: x\r\n\r\n"), 1);
    EXPECT_EQ(parse("GET /hello HTTP/1.1\r\n: x\r\n\r\n"), 1);
}

// =============================================================================
// Framing
// =============================================================================

TEST_F(HTTP1ParserTest, ContentLengthBody) {
    std::string body = rng_.random_json_body();
    std::string req = "POST /hello HTTP/1.1\r\nContent-Type: application/json\r\n"
                      "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;

    EXPECT_EQ(parse(req), 0);
    EXPECT_TRUE(request_.has_content_length);
    EXPECT_EQ(request_.content_length, body.size());
    EXPECT_EQ(request_.body, body);
    EXPECT_EQ(consumed_, req.size());
}

TEST_F(HTTP1ParserTest, WaitingForBodyReportsContentLength) {
    std::string req = "POST /hello HTTP/1.1\r\nContent-Length: 100\r\n\r\n0123456789";

    EXPECT_EQ(parse(req), -1);
    EXPECT_EQ(parser_.get_state(), HTTP1State::BODY);
    EXPECT_EQ(request_.content_length, 100u);
}

TEST_F(HTTP1ParserTest, InvalidContentLengthIsAnError) {
    for (const char* value : {"abc", "-5", "12x", ""}) {
        std::string req = std::string("POST /hello HTTP/1.1\r\nContent-Length: ") + value +
                          "\r\n\r\n";
        EXPECT_EQ(parse(req), 1) << "'" << value << "'";
    }
}

TEST_F(HTTP1ParserTest, ChunkedIsFlagged) {
    EXPECT_EQ(parse("POST /hello HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"), 0);
    EXPECT_TRUE(request_.chunked);
}

TEST_F(HTTP1ParserTest, KeepAliveDefaults) {
    EXPECT_EQ(parse("GET /hello HTTP/1.1\r\n\r\n"), 0);
    EXPECT_TRUE(request_.keep_alive);

    EXPECT_EQ(parse("GET /hello HTTP/1.1\r\nConnection: Close\r\n\r\n"), 0);
    EXPECT_FALSE(request_.keep_alive);

    EXPECT_EQ(parse("GET /hello HTTP/1.0\r\nConnection: keep-alive\r\n\r\n"), 0);
    EXPECT_TRUE(request_.keep_alive);
}

TEST_F(HTTP1ParserTest, PipelinedRequestsConsumeOneAtATime) {
    std::string first = "GET /hello HTTP/1.1\r\n\r\n";
    std::string second = "GET /other HTTP/1.1\r\n\r\n";

    EXPECT_EQ(parse(first + second), 0);
    EXPECT_EQ(request_.path, "/hello");
    EXPECT_EQ(consumed_, first.size());
}

// =============================================================================
// Incremental Parsing
// =============================================================================

TEST_F(HTTP1ParserTest, EveryPrefixNeedsMoreData) {
    std::string body = rng_.random_string(rng_.random_size(1, 64));
    std::string req = "PUT /hello?x=1 HTTP/1.1\r\nHost: localhost\r\n"
                      "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;

    for (size_t len = 1; len < req.size(); ++len) {
        EXPECT_EQ(parse(req.substr(0, len)), -1) << "prefix length " << len;
    }
    EXPECT_EQ(parse(req), 0);
    EXPECT_EQ(request_.body, body);
}

TEST_F(HTTP1ParserTest, EmptyInputNeedsMoreData) {
    EXPECT_EQ(parser_.parse(nullptr, 0, request_, consumed_), -1);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(HTTP1ParserTest, MalformedRequestLines) {
    std::vector<std::string> bad = {
        "G(T /hello HTTP/1.1\r\n\r\n",
        " /hello HTTP/1.1\r\n\r\n",
        "GET  HTTP/1.1\r\n\r\n",
        "GET /hello HTTP/2.0\r\n\r\n",
        "GET /hello FTP/1.1\r\n\r\n",
        "GET /hel\nlo HTTP/1.1\r\n\r\n",
    };
    for (const auto& req : bad) {
        EXPECT_EQ(parse(req), 1) << req;
        EXPECT_TRUE(parser_.has_error());
    }
}

TEST_F(HTTP1ParserTest, MethodFromString) {
    EXPECT_EQ(HTTP1Parser::method_from_string("GET"), HTTP1Method::GET);
    EXPECT_EQ(HTTP1Parser::method_from_string("get"), HTTP1Method::UNKNOWN);
    EXPECT_TRUE(HTTP1Parser::str_eq_ci("Content-Length", "content-length"));
    EXPECT_FALSE(HTTP1Parser::str_eq_ci("Content-Length", "content-lengths"));
}

// =============================================================================
// Performance
// =============================================================================

TEST_F(HTTP1ParserTest, ParsePerformance) {
    std::string req = "GET /hello HTTP/1.1\r\nHost: localhost\r\nUser-Agent: bench\r\n"
                      "Accept: */*\r\n\r\n";
    // Generous bound: sanitizer and debug builds run this too
    assert_average_within([&]() { parse(req); }, 50000);
}
