#pragma once

#include <sdkgate/log/macros.hpp>

#include <unistd.h>
#include <climits>
#include <cstring>
#include <cerrno>
#include <string>

namespace sdkgate::util {

/// Name of this host, looked up once
inline const std::string& host_name() {
    static const std::string name = [] {
#ifdef HOST_NAME_MAX
        char buf[HOST_NAME_MAX + 1] = {};
#else
        char buf[256] = {};
#endif
        if (::gethostname(buf, sizeof(buf) - 1) != 0) {
            SDKGATE_LOG_WARNING("gethostname failed: {}", strerror(errno));
            return std::string("localhost");
        }
        return std::string(buf);
    }();
    return name;
}

} // namespace sdkgate::util
