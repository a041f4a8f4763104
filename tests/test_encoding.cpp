#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>

#include "server/encoding.h"
#include "server/api_error.h"

using namespace logq;
using namespace logq::server;
using json = nlohmann::json;

namespace {

constexpr int64_t kTs = 1554375800000000000LL; // 2019-04-04T11:03:20Z

query::Streams sampleStreams() {
    query::Stream s;
    s.labels = {{"app", "x"}, {"env", "prod"}};
    s.entries.push_back({query::fromUnixNanos(kTs), "hello"});
    s.entries.push_back({query::fromUnixNanos(kTs + 500000000LL), "world"});
    return {s};
}

} // namespace

TEST(EncodingTest, VersionFromPath) {
    EXPECT_EQ(versionFromPath("/loki/api/v1/query_range"), ApiVersion::V1);
    EXPECT_EQ(versionFromPath("/LOKI/API/V1/tail"), ApiVersion::V1);
    EXPECT_EQ(versionFromPath("/api/prom/query"), ApiVersion::Legacy);
    EXPECT_EQ(versionFromPath("/api/prom/label"), ApiVersion::Legacy);
    EXPECT_EQ(&encoderFor(ApiVersion::V1), &encoderFor(ApiVersion::V1));
    EXPECT_EQ(encoderFor(ApiVersion::Legacy).version(), ApiVersion::Legacy);
}

TEST(EncodingTest, FormatSampleValue) {
    EXPECT_EQ(formatSampleValue(3.0), "3");
    EXPECT_EQ(formatSampleValue(0.0), "0");
    EXPECT_EQ(formatSampleValue(0.5), "0.5");
    EXPECT_EQ(formatSampleValue(-2.0), "-2");
    EXPECT_EQ(formatSampleValue(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(formatSampleValue(std::numeric_limits<double>::infinity()), "+Inf");
    EXPECT_EQ(formatSampleValue(-std::numeric_limits<double>::infinity()), "-Inf");
}

TEST(EncodingTest, V1Streams) {
    auto body = json::parse(encoderFor(ApiVersion::V1).encodeQueryResult(sampleStreams()));

    EXPECT_EQ(body["status"], "success");
    EXPECT_EQ(body["data"]["resultType"], "streams");
    const auto& stream = body["data"]["result"][0];
    EXPECT_EQ(stream["stream"]["app"], "x");
    EXPECT_EQ(stream["stream"]["env"], "prod");
    ASSERT_EQ(stream["values"].size(), 2u);
    EXPECT_EQ(stream["values"][0][0], "1554375800000000000");
    EXPECT_EQ(stream["values"][0][1], "hello");
    EXPECT_EQ(stream["values"][1][0], "1554375800500000000");
}

TEST(EncodingTest, V1VectorAndMatrix) {
    query::Sample sample_in;
    sample_in.metric = {{"app", "x"}};
    sample_in.timestamp = query::fromUnixNanos(kTs);
    sample_in.value = 3.0;
    query::Vector vec{sample_in};
    auto body = json::parse(encoderFor(ApiVersion::V1).encodeQueryResult(vec));
    EXPECT_EQ(body["data"]["resultType"], "vector");
    const auto& sample = body["data"]["result"][0];
    EXPECT_EQ(sample["metric"]["app"], "x");
    EXPECT_DOUBLE_EQ(sample["value"][0].get<double>(), 1554375800.0);
    EXPECT_EQ(sample["value"][1], "3");

    query::Series series;
    series.metric = {{"app", "x"}};
    series.points.push_back({query::fromUnixNanos(kTs), 1.0});
    series.points.push_back({query::fromUnixNanos(kTs + 60000000000LL), 0.25});
    auto mbody = json::parse(encoderFor(ApiVersion::V1).encodeQueryResult(query::Matrix{series}));
    EXPECT_EQ(mbody["data"]["resultType"], "matrix");
    const auto& values = mbody["data"]["result"][0]["values"];
    ASSERT_EQ(values.size(), 2u);
    EXPECT_DOUBLE_EQ(values[1][0].get<double>(), 1554375860.0);
    EXPECT_EQ(values[1][1], "0.25");
}

TEST(EncodingTest, EmptyResultIsEmptyArray) {
    auto body = json::parse(encoderFor(ApiVersion::V1).encodeQueryResult(query::Streams{}));
    ASSERT_TRUE(body["data"]["result"].is_array());
    EXPECT_TRUE(body["data"]["result"].empty());
}

TEST(EncodingTest, LegacyStreams) {
    auto body = json::parse(encoderFor(ApiVersion::Legacy).encodeQueryResult(sampleStreams()));

    EXPECT_FALSE(body.contains("status"));
    const auto& stream = body["streams"][0];
    EXPECT_EQ(stream["labels"], "{app=\"x\", env=\"prod\"}");
    EXPECT_EQ(stream["entries"][0]["ts"], "2019-04-04T11:03:20Z");
    EXPECT_EQ(stream["entries"][0]["line"], "hello");
    EXPECT_EQ(stream["entries"][1]["ts"], "2019-04-04T11:03:20.5Z");
}

TEST(EncodingTest, Labels) {
    query::LabelResponse labels;
    labels.values = {"app", "env"};
    auto v1 = json::parse(encoderFor(ApiVersion::V1).encodeLabels(labels));
    EXPECT_EQ(v1["status"], "success");
    EXPECT_EQ(v1["data"], json::array({"app", "env"}));

    auto legacy = json::parse(encoderFor(ApiVersion::Legacy).encodeLabels(labels));
    EXPECT_EQ(legacy["values"], json::array({"app", "env"}));

    auto empty = json::parse(encoderFor(ApiVersion::V1).encodeLabels(query::LabelResponse{}));
    EXPECT_TRUE(empty["data"].is_array());
}

TEST(EncodingTest, TailFrames) {
    query::TailResponse frame;
    frame.streams = sampleStreams();
    frame.dropped_entries.push_back({query::fromUnixNanos(kTs), {{"app", "x"}}});

    auto v1 = json::parse(encoderFor(ApiVersion::V1).encodeTailResponse(frame));
    EXPECT_EQ(v1["streams"][0]["values"][0][1], "hello");
    EXPECT_EQ(v1["dropped_entries"][0]["timestamp"], "1554375800000000000");
    EXPECT_EQ(v1["dropped_entries"][0]["labels"]["app"], "x");

    auto legacy = json::parse(encoderFor(ApiVersion::Legacy).encodeTailResponse(frame));
    EXPECT_EQ(legacy["streams"][0]["entries"][0]["line"], "hello");
    EXPECT_EQ(legacy["dropped_entries"][0]["Timestamp"], "2019-04-04T11:03:20Z");
    EXPECT_EQ(legacy["dropped_entries"][0]["Labels"], "{app=\"x\"}");
}

TEST(EncodingTest, InvalidUtf8IsEncodeError) {
    query::Stream s;
    s.labels = {{"app", "x"}};
    s.entries.push_back({query::fromUnixNanos(kTs), std::string("bad \xff line")});

    try {
        encoderFor(ApiVersion::V1).encodeQueryResult(query::Streams{s});
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Encode);
        EXPECT_EQ(e.statusCode(), 500u);
    }

    query::TailResponse frame;
    frame.streams.push_back(s);
    EXPECT_THROW(encoderFor(ApiVersion::Legacy).encodeTailResponse(frame), ApiError);
}

TEST(EncodingTest, DecodePush) {
    auto streams = decodePushRequest(R"({"streams":[
        {"stream":{"app":"x"},"values":[["1554375800000000000","hello"],["1554375801000000000","world"]]},
        {"stream":{"app":"y"},"values":[]}
    ]})");

    ASSERT_EQ(streams.size(), 2u);
    EXPECT_EQ(streams[0].labels.at("app"), "x");
    ASSERT_EQ(streams[0].entries.size(), 2u);
    EXPECT_EQ(query::toUnixNanos(streams[0].entries[0].timestamp), kTs);
    EXPECT_EQ(streams[0].entries[1].line, "world");
    EXPECT_TRUE(streams[1].entries.empty());
}

TEST(EncodingTest, DecodePushRejectsMalformed) {
    for (const char* bad : {
            "",
            "not json",
            "[]",
            "{\"streams\":{}}",
            "{\"streams\":[{\"values\":[]}]}",
            "{\"streams\":[{\"stream\":{\"app\":1},\"values\":[]}]}",
            "{\"streams\":[{\"stream\":{},\"values\":[[\"1\"]]}]}",
            "{\"streams\":[{\"stream\":{},\"values\":[[\"12x\",\"line\"]]}]}",
            "{\"streams\":[{\"stream\":{},\"values\":[[\"\",\"line\"]]}]}",
            "{\"streams\":[{\"stream\":{},\"values\":[[1,\"line\"]]}]}"}) {
        try {
            decodePushRequest(bad);
            ADD_FAILURE() << "accepted: " << bad;
        } catch (const ApiError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidParameter) << bad;
        }
    }
}
