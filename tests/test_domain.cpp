/**
 * @file test_domain.cpp
 * @brief Unit tests for domain and hostname normalization
 */

#include <gtest/gtest.h>
#include <certstalker/common/exceptions.h>
#include <certstalker/model/domain.h>

using namespace certstalker::model;
using certstalker::common::InvalidDomainException;

class DomainTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// normalizeDomain
TEST_F(DomainTest, Normalize_Lowercase) {
    EXPECT_EQ(normalizeDomain("Example.COM"), "example.com");
}

TEST_F(DomainTest, Normalize_StripsSchemeAndPath) {
    EXPECT_EQ(normalizeDomain("https://example.com/login?next=/"), "example.com");
}

TEST_F(DomainTest, Normalize_StripsPortUserinfoAndTrailingDot) {
    EXPECT_EQ(normalizeDomain("http://user:pw@Example.com:8443/"), "example.com");
    EXPECT_EQ(normalizeDomain("example.com."), "example.com");
    EXPECT_EQ(normalizeDomain("  example.com  "), "example.com");
}

TEST_F(DomainTest, Normalize_Invalid) {
    EXPECT_THROW(normalizeDomain(""), InvalidDomainException);
    EXPECT_THROW(normalizeDomain("https://"), InvalidDomainException);
    EXPECT_THROW(normalizeDomain("exa mple.com"), InvalidDomainException);
    EXPECT_THROW(normalizeDomain("*.example.com"), InvalidDomainException);
    EXPECT_THROW(normalizeDomain("example..com"), InvalidDomainException);
}

// isValidHostname
TEST_F(DomainTest, ValidHostname) {
    EXPECT_TRUE(isValidHostname("www.example.com"));
    EXPECT_TRUE(isValidHostname("xn--bcher-kva.example"));
    EXPECT_TRUE(isValidHostname("a1-b2.example.com"));
    EXPECT_TRUE(isValidHostname("localhost"));
}

TEST_F(DomainTest, InvalidHostname) {
    EXPECT_FALSE(isValidHostname(""));
    EXPECT_FALSE(isValidHostname("-api.example.com"));
    EXPECT_FALSE(isValidHostname("api-.example.com"));
    EXPECT_FALSE(isValidHostname("admin@example.com"));
    EXPECT_FALSE(isValidHostname("under_score.example.com"));
    EXPECT_FALSE(isValidHostname(".example.com"));
    EXPECT_FALSE(isValidHostname(std::string(64, 'a') + ".com"));
}

TEST_F(DomainTest, HostnameLengthLimit) {
    std::string label(63, 'a');
    std::string name = label + "." + label + "." + label + "." + std::string(61, 'a');
    EXPECT_EQ(name.size(), 253u);
    EXPECT_TRUE(isValidHostname(name));
    EXPECT_FALSE(isValidHostname(name + "a"));
}

// isWildcard
TEST_F(DomainTest, Wildcard) {
    EXPECT_TRUE(isWildcard("*.example.com"));
    EXPECT_FALSE(isWildcard("www.example.com"));
}

// normalizeHostname
TEST_F(DomainTest, NormalizeHostname) {
    EXPECT_EQ(normalizeHostname(" WWW.Example.com. "), std::optional<std::string>("www.example.com"));
    EXPECT_FALSE(normalizeHostname("*.example.com").has_value());
    EXPECT_FALSE(normalizeHostname("").has_value());
}

// isInScope
TEST_F(DomainTest, InScope) {
    EXPECT_TRUE(isInScope("example.com", "example.com"));
    EXPECT_TRUE(isInScope("a.b.example.com", "example.com"));
    EXPECT_FALSE(isInScope("badexample.com", "example.com"));
    EXPECT_FALSE(isInScope("example.com.evil.net", "example.com"));
}
