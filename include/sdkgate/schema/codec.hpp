#pragma once

#include <sdkgate/schema/schema.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sdkgate::schema {

/// Value does not conform to its declared type
class codec_error : public std::runtime_error {
public:
    codec_error(std::string path, std::string expected, const json& got)
        : std::runtime_error(fmt::format("Invalid type at '{}', expected {}, got {}",
                                         path, expected, got.dump()))
        , path_(std::move(path)) {}

    explicit codec_error(const std::string& message)
        : std::runtime_error(message) {}

    /// Error category reported to clients
    std::string_view type() const noexcept { return "Fatal"; }

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

namespace detail {

enum class direction { decode, encode };

inline std::string describe(const json& type) {
    return type.is_string() ? type.get<std::string>() : type.dump();
}

inline bool is_hex(std::string_view s) {
    if (s.size() % 2 != 0) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

inline bool is_uuid(std::string_view s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

inline bool is_base64(std::string_view s) {
    if (s.size() % 4 != 0) return false;
    size_t padding = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '=') {
            ++padding;
            if (i < s.size() - 2) return false;
            continue;
        }
        if (padding > 0) return false;
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/')) return false;
    }
    return padding <= 2;
}

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline bool valid_calendar_date(int y, int m, int d) {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12 || d < 1) return false;
    int limit = days[m - 1] + (m == 2 && is_leap_year(y) ? 1 : 0);
    return d <= limit;
}

inline bool is_date(const std::string& s) {
    static const std::regex re(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return false;
    return valid_calendar_date(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]));
}

inline bool is_datetime(const std::string& s) {
    static const std::regex re(
        R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(\.\d{1,9})?(Z|[+-]\d{2}:\d{2})?$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return false;
    if (!valid_calendar_date(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]))) return false;
    return std::stoi(m[4]) < 24 && std::stoi(m[5]) < 60 && std::stoi(m[6]) < 61;
}

inline bool is_email(const std::string& s) {
    static const std::regex re(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
    return std::regex_match(s, re);
}

inline bool is_url(const std::string& s) {
    static const std::regex re(R"(^[A-Za-z][A-Za-z0-9+.\-]*://[^\s/?#]+[^\s]*$)");
    return std::regex_match(s, re);
}

/// Integral value of a JSON number, if it has one
inline std::optional<int64_t> integral(const json& value) {
    if (value.is_number_integer()) {
        if (value.is_number_unsigned() &&
            value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            std::fabs(d) < 9007199254740992.0) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

/// Validate and convert a primitive; nullopt when the name is not a primitive
inline std::optional<json> primitive(direction dir, const std::string& path,
                                     const std::string& type, const json& value) {
    auto fail = [&]() -> json { throw codec_error(path, type, value); };

    if (type == "json") {
        return value;
    }
    if (type == "void") {
        if (dir == direction::decode && !value.is_null()) fail();
        return json(nullptr);
    }
    if (type == "string") {
        if (!value.is_string()) fail();
        return value;
    }
    if (type == "bool") {
        if (!value.is_boolean()) fail();
        return value;
    }
    if (type == "float") {
        if (!value.is_number()) fail();
        return value;
    }
    if (type == "int" || type == "money") {
        auto n = integral(value);
        if (!n) fail();
        return json(*n);
    }
    if (type == "uint") {
        auto n = integral(value);
        if (!n || *n < 0) fail();
        return json(*n);
    }

    // String-encoded primitives
    bool known = type == "hex" || type == "uuid" || type == "base64" || type == "bytes" ||
                 type == "date" || type == "datetime" || type == "email" || type == "url";
    if (!known) {
        return std::nullopt;
    }
    if (!value.is_string()) fail();
    const auto& s = value.get_ref<const std::string&>();

    bool ok = false;
    if (type == "hex") ok = is_hex(s);
    else if (type == "uuid") ok = is_uuid(s);
    else if (type == "base64" || type == "bytes") ok = is_base64(s);
    else if (type == "date") ok = is_date(s);
    else if (type == "datetime") ok = is_datetime(s);
    else if (type == "email") ok = is_email(s);
    else if (type == "url") ok = is_url(s);
    if (!ok) fail();

    if (type == "hex" || type == "uuid") {
        std::string lower = s;
        for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return json(std::move(lower));
    }
    return value;
}

inline json transform(direction dir, const json& types, const std::string& path,
                      const json& type, const json& value);

inline json transform_struct(direction dir, const json& types, const std::string& path,
                             const json& fields, const json& value, const json& type_name) {
    if (!value.is_object()) {
        throw codec_error(path, describe(type_name), value);
    }

    // Declared fields only; unknown fields are dropped
    json result = json::object();
    for (const auto& [field, field_type] : fields.items()) {
        auto it = value.find(field);
        const json& field_value = it == value.end() ? json(nullptr) : *it;
        result[field] = transform(dir, types, path + "." + field, field_type, field_value);
    }
    return result;
}

inline json transform(direction dir, const json& types, const std::string& path,
                      const json& type, const json& value) {
    if (type.is_object()) {
        return transform_struct(dir, types, path, type, value, type);
    }
    if (!type.is_string()) {
        throw codec_error(fmt::format("Invalid type definition at '{}': {}", path, type.dump()));
    }

    const auto& name = type.get_ref<const std::string&>();

    if (name.ends_with("?")) {
        if (value.is_null()) {
            return json(nullptr);
        }
        return transform(dir, types, path, json(name.substr(0, name.size() - 1)), value);
    }

    if (name.ends_with("[]")) {
        if (!value.is_array()) {
            throw codec_error(path, name, value);
        }
        json element_type(name.substr(0, name.size() - 2));
        json result = json::array();
        for (size_t i = 0; i < value.size(); ++i) {
            result.push_back(transform(dir, types, fmt::format("{}[{}]", path, i), element_type, value[i]));
        }
        return result;
    }

    if (auto converted = primitive(dir, path, name, value)) {
        return std::move(*converted);
    }

    auto it = types.find(name);
    if (it == types.end()) {
        throw codec_error(fmt::format("Unknown type '{}' at '{}'", name, path));
    }

    const json& def = *it;
    if (def.is_object()) {
        return transform_struct(dir, types, path, def, value, type);
    }
    if (def.is_array()) {
        if (!value.is_string() ||
            std::find(def.begin(), def.end(), value) == def.end()) {
            throw codec_error(path, name, value);
        }
        return value;
    }
    // Alias
    return transform(dir, types, path, def, value);
}

} // namespace detail

/// Validate a wire value against a type and convert it for use
/// @param types Named type table
/// @param path Location reported in errors, e.g. "getUser.args"
/// @throws codec_error on mismatch
inline json decode(const json& types, const std::string& path, const json& type, const json& value) {
    return detail::transform(detail::direction::decode, types, path, type, value);
}

/// Validate a value produced by an implementation and convert it for the wire
/// @throws codec_error on mismatch
inline json encode(const json& types, const std::string& path, const json& type, const json& value) {
    return detail::transform(detail::direction::encode, types, path, type, value);
}

} // namespace sdkgate::schema
