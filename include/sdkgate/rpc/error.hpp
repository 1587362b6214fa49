#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sdkgate::rpc {

/// Reserved generic error category
inline constexpr std::string_view fatal_type = "Fatal";

/// Typed failure raised by implementations and hooks
///
/// The type is reported to clients and checked against the call's
/// declared-throws set; the message travels unchanged.
class rpc_error : public std::runtime_error {
public:
    rpc_error(std::string type, const std::string& message)
        : std::runtime_error(message), type_(std::move(type)) {}

    const std::string& type() const noexcept { return type_; }

    std::string_view message() const noexcept { return what(); }

private:
    std::string type_;
};

/// Create a Fatal error
inline rpc_error fatal(const std::string& message) {
    return rpc_error(std::string(fatal_type), message);
}

/// Body is not a well-formed request of any known protocol generation
class parse_error : public rpc_error {
public:
    explicit parse_error(std::string_view detail = {})
        : rpc_error(std::string(fatal_type),
                    detail.empty() ? std::string("Failed to understand request")
                                   : "Failed to understand request: " + std::string(detail)) {}
};

} // namespace sdkgate::rpc
