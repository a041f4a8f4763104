#include "server/encoding.h"
#include "server/api_error.h"
#include "utils/time_format.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <variant>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace logq {
namespace server {

using json = nlohmann::json;

namespace {

json labelsToJson(const query::LabelSet& labels) {
    json j = json::object();
    for (const auto& [name, value] : labels) {
        j[name] = value;
    }
    return j;
}

std::string nanosString(query::Timestamp ts) {
    return std::to_string(query::toUnixNanos(ts));
}

double unixSeconds(query::Timestamp ts) {
    return static_cast<double>(query::toUnixNanos(ts)) / 1e9;
}

json v1Stream(const query::Stream& stream) {
    json values = json::array();
    for (const auto& e : stream.entries) {
        values.push_back(json::array({nanosString(e.timestamp), e.line}));
    }
    return json{{"stream", labelsToJson(stream.labels)}, {"values", std::move(values)}};
}

json legacyStream(const query::Stream& stream) {
    json entries = json::array();
    for (const auto& e : stream.entries) {
        entries.push_back(json{
            {"ts", utils::formatRfc3339Nano(query::toUnixNanos(e.timestamp))},
            {"line", e.line}
        });
    }
    return json{{"labels", query::labelsToString(stream.labels)}, {"entries", std::move(entries)}};
}

json sampleJson(const query::Sample& s) {
    return json{
        {"metric", labelsToJson(s.metric)},
        {"value", json::array({unixSeconds(s.timestamp), formatSampleValue(s.value)})}
    };
}

json seriesJson(const query::Series& s) {
    json values = json::array();
    for (const auto& p : s.points) {
        values.push_back(json::array({unixSeconds(p.timestamp), formatSampleValue(p.value)}));
    }
    return json{{"metric", labelsToJson(s.metric)}, {"values", std::move(values)}};
}

template <typename StreamFn>
json resultJson(const query::QueryResult& result, StreamFn streamFn) {
    json out = json::array();
    if (auto streams = std::get_if<query::Streams>(&result)) {
        for (const auto& s : *streams) out.push_back(streamFn(s));
    } else if (auto vec = std::get_if<query::Vector>(&result)) {
        for (const auto& s : *vec) out.push_back(sampleJson(s));
    } else if (auto mat = std::get_if<query::Matrix>(&result)) {
        for (const auto& s : *mat) out.push_back(seriesJson(s));
    }
    return out;
}

// Dumps, reporting serialization failures as encode errors
std::string dump(const json& j) {
    try {
        return j.dump();
    } catch (const json::exception& e) {
        throw ApiError(ErrorKind::Encode, e.what());
    }
}

} // namespace

ApiVersion versionFromPath(std::string_view path) {
    std::string lower(path);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("/loki/api/v1") != std::string::npos ? ApiVersion::V1 : ApiVersion::Legacy;
}

std::string formatSampleValue(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return fmt::format("{:.0f}", value);
    }
    return fmt::format("{}", value);
}

// ---------------------------------------------------------------------------
// v1
// ---------------------------------------------------------------------------

std::string V1Encoder::encodeQueryResult(const query::QueryResult& result) const {
    json data = {
        {"resultType", query::resultTypeName(result)},
        {"result", resultJson(result, v1Stream)}
    };
    return dump(json{{"status", "success"}, {"data", std::move(data)}});
}

std::string V1Encoder::encodeLabels(const query::LabelResponse& labels) const {
    return dump(json{{"status", "success"}, {"data", labels.values}});
}

std::string V1Encoder::encodeTailResponse(const query::TailResponse& response) const {
    json streams = json::array();
    for (const auto& s : response.streams) {
        streams.push_back(v1Stream(s));
    }
    json dropped = json::array();
    for (const auto& d : response.dropped_entries) {
        dropped.push_back(json{{"labels", labelsToJson(d.labels)}, {"timestamp", nanosString(d.timestamp)}});
    }
    return dump(json{{"streams", std::move(streams)}, {"dropped_entries", std::move(dropped)}});
}

// ---------------------------------------------------------------------------
// legacy
// ---------------------------------------------------------------------------

std::string LegacyEncoder::encodeQueryResult(const query::QueryResult& result) const {
    if (std::holds_alternative<query::Streams>(result)) {
        return dump(json{{"streams", resultJson(result, legacyStream)}});
    }
    return dump(json{
        {"resultType", query::resultTypeName(result)},
        {"result", resultJson(result, legacyStream)}
    });
}

std::string LegacyEncoder::encodeLabels(const query::LabelResponse& labels) const {
    return dump(json{{"values", labels.values}});
}

std::string LegacyEncoder::encodeTailResponse(const query::TailResponse& response) const {
    json streams = json::array();
    for (const auto& s : response.streams) {
        streams.push_back(legacyStream(s));
    }
    json dropped = json::array();
    for (const auto& d : response.dropped_entries) {
        dropped.push_back(json{
            {"Timestamp", utils::formatRfc3339Nano(query::toUnixNanos(d.timestamp))},
            {"Labels", query::labelsToString(d.labels)}
        });
    }
    return dump(json{{"streams", std::move(streams)}, {"dropped_entries", std::move(dropped)}});
}

const ResponseEncoder& encoderFor(ApiVersion version) {
    static const V1Encoder v1;
    static const LegacyEncoder legacy;
    if (version == ApiVersion::V1) {
        return v1;
    }
    return legacy;
}

std::vector<PushStream> decodePushRequest(const std::string& body) {
    std::vector<PushStream> out;
    try {
        json j = json::parse(body);
        if (!j.is_object() || !j.contains("streams") || !j["streams"].is_array()) {
            throw ApiError(ErrorKind::InvalidParameter, "push body must be an object with a 'streams' array");
        }
        for (const auto& s : j["streams"]) {
            PushStream ps;
            for (const auto& [name, value] : s.at("stream").items()) {
                ps.labels[name] = value.get<std::string>();
            }
            for (const auto& v : s.at("values")) {
                if (!v.is_array() || v.size() != 2) {
                    throw ApiError(ErrorKind::InvalidParameter, "push value must be a [\"<unix ns>\", \"<line>\"] pair");
                }
                const auto ts = v[0].get<std::string>();
                size_t pos = 0;
                long long nanos = std::stoll(ts, &pos);
                if (pos != ts.size()) {
                    throw ApiError(ErrorKind::InvalidParameter, fmt::format("invalid push timestamp '{}'", ts));
                }
                ps.entries.push_back(query::Entry{query::fromUnixNanos(nanos), v[1].get<std::string>()});
            }
            out.push_back(std::move(ps));
        }
    } catch (const json::exception& e) {
        throw ApiError(ErrorKind::InvalidParameter, fmt::format("invalid push body: {}", e.what()));
    } catch (const std::logic_error& e) {
        // std::stoll: invalid_argument / out_of_range
        throw ApiError(ErrorKind::InvalidParameter, fmt::format("invalid push timestamp: {}", e.what()));
    }
    return out;
}

} // namespace server
} // namespace logq
