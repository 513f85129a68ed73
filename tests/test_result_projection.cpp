/**
 * @file test_result_projection.cpp
 * @brief Unit tests for the JSON output projections
 */

#include <gtest/gtest.h>
#include <certstalker/common/exceptions.h>
#include <certstalker/output/result_projection.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace certstalker;
using namespace certstalker::output;
using namespace certstalker::model;

namespace {

std::chrono::system_clock::time_point at(std::time_t seconds) {
    return std::chrono::system_clock::from_time_t(seconds);
}

LivenessResult reachable(const std::string& host, int port, int status) {
    LivenessResult r;
    r.endpoint = EndpointTarget{host, port};
    r.reachable = true;
    r.checkedAt = at(1709296496);
    r.protocol = "https";
    r.statusCode = status;
    return r;
}

} // anonymous namespace

class ResultProjectionTest : public ::testing::Test {
protected:
    AggregatedResult makeResult(std::optional<LivenessMap> liveliness = std::nullopt) {
        std::vector<CertificateRecord> certificates;
        certificates.emplace_back("certspotter", "1001", "C=US, O=Let's Encrypt, CN=R3",
                                  at(1704067200), at(1711843200),
                                  std::set<std::string>{"www.example.com", "*.example.com"});
        certificates.emplace_back("crtsh", "42", "DigiCert", std::nullopt, std::nullopt,
                                  std::set<std::string>{"api.example.com"});

        HostnameSet hostnames;
        hostnames.add("www.example.com", "certspotter");
        hostnames.add("api.example.com", "crtsh");
        hostnames.add("api.example.com", "certspotter");

        ProviderReport ok;
        ok.provider = "certspotter";
        ok.status = ProviderStatus::OK;
        ok.attempts = 1;
        ok.certificateCount = 1;
        ok.hostnameCount = 2;

        ProviderReport failed;
        failed.provider = "crtsh";
        failed.status = ProviderStatus::FAILED;
        failed.attempts = 3;
        failed.error = "crtsh: transport error: 502";

        return AggregatedResult("5f0c6a4e-1b2d-4c3e-8f9a-0b1c2d3e4f50", "example.com",
                                at(1709296496), std::move(certificates), std::move(hostnames),
                                {ok, failed}, {443, 8443}, std::move(liveliness));
    }

    LivenessMap sampleLiveness() {
        LivenessMap map;
        auto up = reachable("www.example.com", 443, 200);
        map.emplace(up.endpoint, up);
        auto down = LivenessResult::unreachable(EndpointTarget{"api.example.com", 443},
                                                "https: connection refused; http: connection refused");
        map.emplace(down.endpoint, down);
        return map;
    }
};

TEST_F(ResultProjectionTest, Detailed_RunMetadata) {
    Json::Value json = toDetailedJson(makeResult());

    EXPECT_EQ(json["runId"].asString(), "5f0c6a4e-1b2d-4c3e-8f9a-0b1c2d3e4f50");
    EXPECT_EQ(json["domain"].asString(), "example.com");
    EXPECT_EQ(json["generatedAt"].asString(), "2024-03-01T12:34:56Z");
    ASSERT_EQ(json["ports"].size(), 2u);
    EXPECT_EQ(json["ports"][1].asInt(), 8443);
    EXPECT_FALSE(json.isMember("liveliness"));
}

TEST_F(ResultProjectionTest, Detailed_ProviderReports) {
    Json::Value providers = toDetailedJson(makeResult())["providers"];
    ASSERT_EQ(providers.size(), 2u);

    EXPECT_EQ(providers[0]["provider"].asString(), "certspotter");
    EXPECT_EQ(providers[0]["status"].asString(), "OK");
    EXPECT_EQ(providers[0]["hostnames"].asUInt64(), 2u);
    EXPECT_FALSE(providers[0].isMember("error"));

    EXPECT_EQ(providers[1]["status"].asString(), "FAILED");
    EXPECT_EQ(providers[1]["attempts"].asInt(), 3);
    EXPECT_EQ(providers[1]["error"].asString(), "crtsh: transport error: 502");
}

TEST_F(ResultProjectionTest, Detailed_CertificatesAndHostnames) {
    Json::Value json = toDetailedJson(makeResult());

    const Json::Value& first = json["certificates"][0];
    EXPECT_EQ(first["id"].asString(), "1001");
    EXPECT_EQ(first["notBefore"].asString(), "2024-01-01T00:00:00Z");
    ASSERT_EQ(first["subjectAlternativeNames"].size(), 2u);
    EXPECT_EQ(first["subjectAlternativeNames"][0].asString(), "*.example.com");

    EXPECT_TRUE(json["certificates"][1]["notAfter"].isNull());

    const Json::Value& hostnames = json["hostnames"];
    ASSERT_EQ(hostnames.size(), 2u);
    EXPECT_EQ(hostnames[0]["hostname"].asString(), "api.example.com");
    EXPECT_EQ(hostnames[0]["sources"].size(), 2u);
}

TEST_F(ResultProjectionTest, Detailed_WithLiveness) {
    Json::Value live = toDetailedJson(makeResult(sampleLiveness()))["liveliness"];
    ASSERT_EQ(live.size(), 2u);

    // Map order: api before www
    EXPECT_EQ(live[0]["hostname"].asString(), "api.example.com");
    EXPECT_FALSE(live[0]["reachable"].asBool());
    EXPECT_NE(live[0]["error"].asString().find("connection refused"), std::string::npos);
    EXPECT_FALSE(live[0].isMember("statusCode"));

    EXPECT_TRUE(live[1]["reachable"].asBool());
    EXPECT_EQ(live[1]["statusCode"].asInt(), 200);
    EXPECT_EQ(live[1]["protocol"].asString(), "https");
    EXPECT_FALSE(live[1]["checkedAt"].asString().empty());
}

TEST_F(ResultProjectionTest, Endpoints_WithoutLiveness) {
    Json::Value endpoints = toEndpointsJson(makeResult(), false);

    // 2 hostnames x 2 ports, reachability unknown
    ASSERT_EQ(endpoints.size(), 4u);
    EXPECT_EQ(endpoints[0]["hostname"].asString(), "api.example.com");
    EXPECT_EQ(endpoints[0]["port"].asInt(), 443);
    EXPECT_EQ(endpoints[1]["port"].asInt(), 8443);
    EXPECT_TRUE(endpoints[0]["reachable"].isNull());
}

TEST_F(ResultProjectionTest, Endpoints_UnreachableFiltered) {
    Json::Value endpoints = toEndpointsJson(makeResult(sampleLiveness()), false);
    ASSERT_EQ(endpoints.size(), 1u);
    EXPECT_EQ(endpoints[0]["hostname"].asString(), "www.example.com");
    EXPECT_TRUE(endpoints[0]["reachable"].asBool());
}

TEST_F(ResultProjectionTest, Endpoints_UnreachableIncluded) {
    Json::Value endpoints = toEndpointsJson(makeResult(sampleLiveness()), true);
    ASSERT_EQ(endpoints.size(), 2u);
    EXPECT_FALSE(endpoints[0]["reachable"].asBool());
    EXPECT_TRUE(endpoints[0].isMember("error"));
}

TEST_F(ResultProjectionTest, Project_SelectsFormat) {
    auto result = makeResult();
    EXPECT_TRUE(project(result, common::OutputFormat::DETAILED, false).isObject());
    EXPECT_TRUE(project(result, common::OutputFormat::ENDPOINTS_ONLY, false).isArray());
}

TEST_F(ResultProjectionTest, ToJsonString_FourSpaceIndent) {
    Json::Value value;
    value["domain"] = "example.com";
    EXPECT_NE(toJsonString(value).find("\n    \"domain\""), std::string::npos);
}

TEST_F(ResultProjectionTest, WriteJsonFile) {
    std::string path = "/tmp/certstalker_projection_" + std::to_string(::getpid()) + ".json";
    writeJsonFile(path, toEndpointsJson(makeResult(), false));

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    Json::Value parsed;
    Json::CharReaderBuilder reader;
    std::string errs;
    ASSERT_TRUE(Json::parseFromStream(reader, in, &parsed, &errs)) << errs;
    EXPECT_EQ(parsed.size(), 4u);
    std::remove(path.c_str());
}

TEST_F(ResultProjectionTest, WriteJsonFile_BadPathThrows) {
    EXPECT_THROW(writeJsonFile("/nonexistent-dir/out.json", Json::Value()),
                 common::CertStalkerException);
}
