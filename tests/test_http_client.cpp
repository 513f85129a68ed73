/**
 * @file test_http_client.cpp
 * @brief Unit tests for URL splitting and response header lookup
 */

#include <gtest/gtest.h>
#include <certstalker/http/http_client.h>

using namespace certstalker::http;

// ============================================================================
// splitUrl
// ============================================================================

TEST(HttpClientSplitUrlTest, OriginAndPathWithQuery) {
    auto parts = HttpClient::splitUrl("https://api.certspotter.com/v1/issuances?domain=example.com");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "https://api.certspotter.com");
    EXPECT_EQ(parts->second, "/v1/issuances?domain=example.com");
}

TEST(HttpClientSplitUrlTest, QueryOnlyGetsRootPath) {
    auto parts = HttpClient::splitUrl("https://crt.sh?q=%25.example.com&output=json");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "https://crt.sh");
    EXPECT_EQ(parts->second, "/?q=%25.example.com&output=json");

    parts = HttpClient::splitUrl("https://crt.sh/?q=x");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->second, "/?q=x");
}

TEST(HttpClientSplitUrlTest, PortStaysInOrigin) {
    auto parts = HttpClient::splitUrl("https://www.example.com:8443");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "https://www.example.com:8443");
    EXPECT_EQ(parts->second, "/");

    parts = HttpClient::splitUrl("http://10.0.0.1:80/health");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "http://10.0.0.1:80");
    EXPECT_EQ(parts->second, "/health");
}

TEST(HttpClientSplitUrlTest, FragmentDropped) {
    auto parts = HttpClient::splitUrl("https://www.example.com/page#top");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->second, "/page");
}

TEST(HttpClientSplitUrlTest, SchemeIsCaseInsensitive) {
    auto parts = HttpClient::splitUrl("HTTPS://www.example.com/");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "HTTPS://www.example.com");
}

TEST(HttpClientSplitUrlTest, RejectsNonHttpUrls) {
    EXPECT_FALSE(HttpClient::splitUrl("ftp://files.example.com/pub").has_value());
    EXPECT_FALSE(HttpClient::splitUrl("www.example.com/path").has_value());
    EXPECT_FALSE(HttpClient::splitUrl("https://").has_value());
    EXPECT_FALSE(HttpClient::splitUrl("").has_value());
}

TEST(HttpClientTest, InvalidUrlReportedWithoutRequest) {
    HttpClient client;
    HttpRequest request;
    request.url = "ftp://files.example.com/pub";

    auto result = client.get(request);
    EXPECT_FALSE(result.received);
    EXPECT_EQ(result.error, "invalid URL: ftp://files.example.com/pub");
}

// ============================================================================
// HttpResult::header
// ============================================================================

TEST(HttpResultTest, HeaderLookupIgnoresCase) {
    HttpResult result;
    result.headers["retry-after"] = "30";
    result.headers["content-type"] = "application/json";

    EXPECT_EQ(result.header("Retry-After"), std::optional<std::string>("30"));
    EXPECT_EQ(result.header("RETRY-AFTER"), std::optional<std::string>("30"));
    EXPECT_EQ(result.header("content-type"), std::optional<std::string>("application/json"));
}

TEST(HttpResultTest, MissingHeaderIsNullopt) {
    HttpResult result;
    result.headers["content-type"] = "text/html";
    EXPECT_FALSE(result.header("Retry-After").has_value());
    EXPECT_FALSE(HttpResult().header("content-type").has_value());
}
