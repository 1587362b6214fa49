#pragma once

#include <sdkgate/rpc/context.hpp>
#include <sdkgate/rpc/error.hpp>
#include <sdkgate/schema/codec.hpp>
#include <sdkgate/util/random_id.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace sdkgate::rpc {

/// Source of fresh request/device identifiers
using id_generator = std::function<std::string()>;

/// Default identifiers: 128 random bits as hex
inline id_generator default_id_generator() {
    return [] { return util::random_hex_id(16); };
}

/// Detect the wire generation of a decoded payload
///
/// First match wins: an explicit "version" field, then "requestId" (2),
/// then "device" (1), otherwise 3. An explicit version may be any JSON
/// number with an integral value (2 and 2.0 alike) in 1..3.
/// @throws parse_error if the payload is not an object or the version is not 1, 2 or 3
inline int classify(const json& payload) {
    if (!payload.is_object()) {
        throw parse_error("request must be an object");
    }
    if (auto it = payload.find("version"); it != payload.end()) {
        auto number = schema::detail::integral(*it);
        if (!number) {
            throw parse_error("version must be an integer");
        }
        auto v = *number;
        if (v < 1 || v > 3) {
            throw parse_error(fmt::format("unsupported protocol version {}", v));
        }
        return static_cast<int>(v);
    }
    if (payload.contains("requestId")) {
        return 2;
    }
    if (payload.contains("device")) {
        return 1;
    }
    return 3;
}

namespace detail {

/// Per-version request shapes, checked before mapping
inline const json& shape_types() {
    static const json types = {
        {"V1Request", {
            {"args", "json"},
            {"device", {
                {"id", "string?"},
                {"language", "string?"},
                {"platform", "json?"},
                {"timezone", "string?"},
                {"type", "string?"},
                {"version", "string?"},
            }},
            {"id", "string"},
            {"name", "string"},
        }},
        {"V2Request", {
            {"args", "json"},
            {"deviceId", "string"},
            {"info", {
                {"browserUserAgent", "string?"},
                {"language", "string"},
                {"type", "string"},
            }},
            {"name", "string"},
            {"partnerId", "string?"},
            {"requestId", "string"},
            {"sessionId", "string?"},
        }},
        {"V3DeviceInfo", {
            {"browserUserAgent", "string?"},
            {"id", "string?"},
            {"language", "string?"},
            {"platform", "json?"},
            {"timezone", "string?"},
            {"type", "string?"},
            {"version", "string?"},
        }},
        {"V3Request", {
            {"args", "json"},
            {"deviceInfo", "V3DeviceInfo?"},
            {"extra", "json?"},
            {"name", "string"},
            {"requestId", "string?"},
        }},
    };
    return types;
}

inline json check_shape(const char* shape, const json& payload) {
    try {
        return schema::decode(shape_types(), "root", shape, payload);
    } catch (const schema::codec_error& e) {
        throw parse_error(e.what());
    }
}

inline std::optional<std::string> optional_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return std::nullopt;
}

/// A string that is present and non-empty
inline std::optional<std::string> non_empty(const json& value) {
    if (value.is_string() && !value.get_ref<const std::string&>().empty()) {
        return value.get<std::string>();
    }
    return std::nullopt;
}

inline canonical_request normalize_v1(const json& payload) {
    auto parsed = check_shape("V1Request", payload);
    const auto& device = parsed["device"];

    canonical_request req{v1_extra{}};
    req.request_id = parsed["id"].get<std::string>();
    req.call_name = parsed["name"].get<std::string>();
    req.raw_args = parsed["args"];

    req.device.id = non_empty(device["id"]).value_or(req.request_id);
    req.device.language = optional_string(device["language"]);
    req.device.platform = device["platform"];
    req.device.timezone = optional_string(device["timezone"]);
    req.device.type = non_empty(device["type"])
                          .value_or(non_empty(device["platform"]).value_or(""));
    req.device.version = optional_string(device["version"]);
    return req;
}

inline canonical_request normalize_v2(const json& payload) {
    auto parsed = check_shape("V2Request", payload);
    const auto& info = parsed["info"];

    canonical_request req{v2_extra{
        optional_string(parsed["partnerId"]),
        optional_string(parsed["sessionId"]),
    }};
    req.request_id = parsed["requestId"].get<std::string>();
    req.call_name = parsed["name"].get<std::string>();
    req.raw_args = parsed["args"];

    req.device.id = parsed["deviceId"].get<std::string>();
    req.device.language = info["language"].get<std::string>();
    req.device.platform = {{"browserUserAgent", non_empty(info["browserUserAgent"])
                                                    ? info["browserUserAgent"]
                                                    : json(nullptr)}};
    req.device.timezone = std::nullopt;
    req.device.type = info["type"].get<std::string>();
    req.device.version = std::string();
    return req;
}

inline canonical_request normalize_v3(const json& payload, const id_generator& ids) {
    auto parsed = check_shape("V3Request", payload);
    const json device = parsed["deviceInfo"].is_object() ? parsed["deviceInfo"] : json::object();
    auto field = [&](const char* name) -> json {
        return device.contains(name) ? device[name] : json(nullptr);
    };

    v3_extra extra;
    if (parsed["extra"].is_object()) {
        extra.values = parsed["extra"];
    }

    canonical_request req{std::move(extra)};
    req.request_id = non_empty(parsed["requestId"]).value_or("");
    if (req.request_id.empty()) {
        req.request_id = ids();
    }
    req.call_name = parsed["name"].get<std::string>();
    req.raw_args = parsed["args"];

    req.device.id = non_empty(field("id")).value_or("");
    if (req.device.id.empty()) {
        req.device.id = ids();
    }
    req.device.language = non_empty(field("language"));

    json platform = field("platform");
    if (!platform.is_null() && !platform.is_object()) {
        throw parse_error(schema::codec_error("root.deviceInfo.platform", "object", platform).what());
    }
    if (auto agent = non_empty(field("browserUserAgent"))) {
        if (platform.is_null()) {
            platform = json::object();
        }
        platform["browserUserAgent"] = *agent;
    } else if (platform.is_null()) {
        platform = json::object();
    }
    req.device.platform = std::move(platform);

    req.device.timezone = non_empty(field("timezone"));
    req.device.type = non_empty(field("type")).value_or("api");
    req.device.version = non_empty(field("version"));
    return req;
}

} // namespace detail

/// Map a classified payload into a canonical request
/// @throws parse_error on a shape mismatch or unknown version
inline canonical_request normalize(int version, const json& payload, std::string source_ip,
                                   const http::headers& headers,
                                   const id_generator& ids = default_id_generator()) {
    auto req = [&] {
        switch (version) {
            case 1: return detail::normalize_v1(payload);
            case 2: return detail::normalize_v2(payload);
            case 3: return detail::normalize_v3(payload, ids);
            default:
                throw parse_error(fmt::format("unsupported protocol version {}", version));
        }
    }();

    req.source_ip = std::move(source_ip);
    req.headers = headers;
    return req;
}

/// Deepest array/object nesting accepted in a request body
inline constexpr int max_body_depth = 512;

/// Decode, classify and normalize a raw request body
///
/// Nesting is capped at max_body_depth while parsing; later copies of the
/// document recurse per level.
/// @throws parse_error if the body is not a request of any known generation
inline canonical_request parse_request(std::string_view body, std::string source_ip,
                                       const http::headers& headers,
                                       const id_generator& ids = default_id_generator()) {
    auto limit_depth = [](int depth, json::parse_event_t event, json&) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
            depth >= max_body_depth) {
            throw parse_error(fmt::format("nesting deeper than {} levels", max_body_depth));
        }
        return true;
    };

    json payload;
    try {
        payload = json::parse(body, limit_depth);
    } catch (const json::parse_error& e) {
        throw parse_error(e.what());
    }
    return normalize(classify(payload), payload, std::move(source_ip), headers, ids);
}

} // namespace sdkgate::rpc
