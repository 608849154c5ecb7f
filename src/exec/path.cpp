/*
 * PATH resolution implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/exec/path.hpp>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace devdeck {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

static std::vector<std::string> split_path(const std::string& paths) {
    std::vector<std::string> parts;
    size_t start=0;
    while (true) {
        size_t colon = paths.find(':', start);
        if (colon == std::string::npos) { parts.push_back(paths.substr(start)); break; }
        parts.push_back(paths.substr(start, colon-start));
        start = colon+1;
    }
    return parts;
}

std::optional<std::string> resolve_executable(const std::string& cmd,
                                              const std::optional<std::string>& path_env) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd;
        return std::nullopt;
    }
    std::string paths;
    if (path_env) {
        paths = *path_env;
    } else {
        const char* env = std::getenv("PATH");
        if (!env) return std::nullopt;
        paths = env;
    }
    for (auto &d : split_path(paths)) {
        if (d.empty()) continue;
        std::string full = d + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

} // namespace devdeck
