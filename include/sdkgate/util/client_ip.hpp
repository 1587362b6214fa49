#pragma once

#include <sdkgate/http/http_common.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace sdkgate::util {

/// True for a literal IPv4 or IPv6 address
inline bool is_ip(std::string_view candidate) {
    if (candidate.empty() || candidate.size() >= INET6_ADDRSTRLEN) {
        return false;
    }
    std::string s(candidate);
    in_addr v4{};
    in6_addr v6{};
    return inet_pton(AF_INET, s.c_str(), &v4) == 1 || inet_pton(AF_INET6, s.c_str(), &v6) == 1;
}

namespace detail {

/// Strip quoting, brackets and an IPv4 port from one forwarded entry
inline std::string_view clean_forwarded_entry(std::string_view entry) {
    entry = http::trim(entry);

    if (entry.size() > 4 && http::to_lower(entry.substr(0, 4)) == "for=") {
        entry.remove_prefix(4);
    }
    if (entry.size() >= 2 && entry.front() == '"' && entry.back() == '"') {
        entry = entry.substr(1, entry.size() - 2);
    }
    if (!entry.empty() && entry.front() == '[') {
        auto close = entry.find(']');
        if (close != std::string_view::npos) {
            return entry.substr(1, close - 1);
        }
    }
    // host:port for IPv4 only; IPv6 has several colons
    auto colon = entry.find(':');
    if (colon != std::string_view::npos && entry.find(':', colon + 1) == std::string_view::npos) {
        return entry.substr(0, colon);
    }
    return entry;
}

/// First valid address in a comma/semicolon separated list
inline std::optional<std::string> first_valid(std::string_view list) {
    while (!list.empty()) {
        auto sep = list.find_first_of(",;");
        auto entry = clean_forwarded_entry(list.substr(0, sep));
        if (is_ip(entry)) {
            return std::string(entry);
        }
        if (sep == std::string_view::npos) break;
        list.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

} // namespace detail

/// Determine the originating client address
///
/// Proxy headers are consulted in a fixed order before the socket peer:
/// x-client-ip, x-forwarded-for, cf-connecting-ip, fastly-client-ip,
/// true-client-ip, x-real-ip, x-cluster-client-ip, x-forwarded,
/// forwarded-for, forwarded.
inline std::optional<std::string> client_ip(const http::headers& hdrs, std::string_view peer) {
    static constexpr std::array<std::string_view, 10> ordered = {
        "x-client-ip",
        "x-forwarded-for",
        "cf-connecting-ip",
        "fastly-client-ip",
        "true-client-ip",
        "x-real-ip",
        "x-cluster-client-ip",
        "x-forwarded",
        "forwarded-for",
        "forwarded",
    };

    for (auto name : ordered) {
        auto value = hdrs.get(name);
        if (value.empty()) {
            continue;
        }
        if (auto ip = detail::first_valid(value)) {
            return ip;
        }
    }

    auto peer_host = detail::clean_forwarded_entry(peer);
    if (is_ip(peer_host)) {
        return std::string(peer_host);
    }
    return std::nullopt;
}

} // namespace sdkgate::util
