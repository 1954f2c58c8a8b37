#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

namespace call_relay {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string default_config_path() {
    const std::string fallback = "config/config.json";

    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) {
        return fallback;
    }
    buf[len] = '\0';
    std::string exe_dir(buf);
    size_t pos = exe_dir.find_last_of('/');
    if (pos == std::string::npos) {
        return fallback;
    }

    // e.g. build/call_relay -> build/../config/config.json
    std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
    std::ifstream test(candidate);
    return test.good() ? candidate : fallback;
}

} // namespace call_relay
