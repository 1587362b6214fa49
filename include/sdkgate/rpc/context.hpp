#pragma once

#include <sdkgate/rpc/error.hpp>
#include <sdkgate/schema/schema.hpp>
#include <sdkgate/http/http_common.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace sdkgate::rpc {

/// Wire generation a request arrived in
enum class protocol_version : int {
    v1 = 1,
    v2 = 2,
    v3 = 3
};

inline constexpr int to_int(protocol_version v) noexcept {
    return static_cast<int>(v);
}

/// Client device description, defaulted per protocol version
struct device_info {
    std::string id;
    std::optional<std::string> language;
    json platform;                          ///< Free-form bag, may be null
    std::optional<std::string> timezone;
    std::string type;
    std::optional<std::string> version;
};

/// Version 1 carries no side channel
struct v1_extra {};

/// Version 2 side channel
struct v2_extra {
    std::optional<std::string> partner_id;
    std::optional<std::string> session_id;
};

/// Version 3 free-form side channel
struct v3_extra {
    json values = json::object();
};

/// Alternative index + 1 is the protocol version
using request_extra = std::variant<v1_extra, v2_extra, v3_extra>;

/// One inbound call, independent of its wire encoding
///
/// The protocol version is derived from the extra alternative, so the
/// two cannot disagree once the request is built.
class canonical_request {
public:
    explicit canonical_request(request_extra extra)
        : extra_(std::move(extra)) {}

    protocol_version version() const noexcept {
        return static_cast<protocol_version>(extra_.index() + 1);
    }

    const request_extra& extra() const noexcept { return extra_; }

    /// Version 2 extras, nullptr for other versions
    const v2_extra* v2() const noexcept { return std::get_if<v2_extra>(&extra_); }

    /// Version 3 extras, nullptr for other versions
    const v3_extra* v3() const noexcept { return std::get_if<v3_extra>(&extra_); }

    std::string request_id;
    std::string call_name;
    json raw_args;
    device_info device;
    std::string source_ip;
    http::headers headers;

private:
    request_extra extra_;
};

/// Error half of a reply
struct reply_error {
    std::string type;
    std::string message;
};

/// Outcome of a call: an encoded result or a typed error, never both
class canonical_reply {
public:
    static canonical_reply success(json result) {
        return canonical_reply(value_type(std::in_place_type<json>, std::move(result)));
    }

    static canonical_reply failure(std::string type, std::string message) {
        return canonical_reply(value_type(std::in_place_type<reply_error>,
                                          reply_error{std::move(type), std::move(message)}));
    }

    static canonical_reply failure(const rpc_error& e) {
        return failure(e.type(), std::string(e.message()));
    }

    bool ok() const noexcept { return std::holds_alternative<json>(value_); }

    /// Encoded result; only valid when ok()
    const json& result() const { return std::get<json>(value_); }

    /// Error; only valid when !ok()
    const reply_error& error() const { return std::get<reply_error>(value_); }
    reply_error& error() { return std::get<reply_error>(value_); }

private:
    using value_type = std::variant<json, reply_error>;

    explicit canonical_reply(value_type value)
        : value_(std::move(value)) {}

    value_type value_;
};

} // namespace sdkgate::rpc
