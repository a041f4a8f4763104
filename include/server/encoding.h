#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "query/types.h"

namespace logq {
namespace server {

enum class ApiVersion {
    Legacy,   // /api/prom/...
    V1        // /loki/api/v1/...
};

// Any path containing /loki/api/v1 (case-insensitive) is V1
ApiVersion versionFromPath(std::string_view path);

/**
 * @brief Version-specific JSON rendering of query results, label lists and
 *        tail frames. Chosen once per request.
 *
 * All methods throw ApiError(Encode) when the value cannot be serialized
 * (for example a log line that is not valid UTF-8).
 */
class ResponseEncoder {
public:
    virtual ~ResponseEncoder() = default;

    virtual ApiVersion version() const = 0;
    virtual std::string encodeQueryResult(const query::QueryResult& result) const = 0;
    virtual std::string encodeLabels(const query::LabelResponse& labels) const = 0;
    virtual std::string encodeTailResponse(const query::TailResponse& response) const = 0;
};

class V1Encoder : public ResponseEncoder {
public:
    ApiVersion version() const override { return ApiVersion::V1; }
    std::string encodeQueryResult(const query::QueryResult& result) const override;
    std::string encodeLabels(const query::LabelResponse& labels) const override;
    std::string encodeTailResponse(const query::TailResponse& response) const override;
};

class LegacyEncoder : public ResponseEncoder {
public:
    ApiVersion version() const override { return ApiVersion::Legacy; }
    std::string encodeQueryResult(const query::QueryResult& result) const override;
    std::string encodeLabels(const query::LabelResponse& labels) const override;
    std::string encodeTailResponse(const query::TailResponse& response) const override;
};

const ResponseEncoder& encoderFor(ApiVersion version);

// Sample values as rendered on the wire: integral values without a fraction
std::string formatSampleValue(double value);

struct PushStream {
    query::LabelSet labels;
    std::vector<query::Entry> entries;
};

// Decodes {"streams":[{"stream":{...},"values":[["<ns>","line"],...]}]}.
// Throws ApiError(InvalidParameter) on malformed bodies.
std::vector<PushStream> decodePushRequest(const std::string& body);

} // namespace server
} // namespace logq
