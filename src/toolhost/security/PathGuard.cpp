//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathGuard.cpp
// Purpose: Allow-list check for filesystem paths touched by file tools
//==========================================================================================================

#include <algorithm>
#include <system_error>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/security/PathGuard.h"

namespace fs = std::filesystem;

namespace toolhost {
namespace security {

namespace {
// Drops the empty trailing element a path like "/tmp/" yields.
fs::path stripTrailingSeparator(fs::path p) {
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}
} // namespace

fs::path PathGuard::Normalize(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) {
        abs = fs::path(path);
    }
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) {
        canon = abs.lexically_normal();
    }
    return stripTrailingSeparator(canon);
}

PathGuard::PathGuard(const std::vector<std::string>& allowedRoots) {
    for (const auto& root : allowedRoots) {
        if (root.empty()) {
            continue;
        }
        roots_.push_back(Normalize(root));
        LOG_DEBUG("PathGuard: allowed root {}", roots_.back().string());
    }
}

bool PathGuard::IsPathAllowed(const std::string& path) const {
    if (path.empty()) {
        return false;
    }
    const fs::path target = Normalize(path);
    for (const auto& root : roots_) {
        auto r = root.begin();
        auto t = target.begin();
        for (; r != root.end() && t != target.end(); ++r, ++t) {
            if (*r != *t) {
                break;
            }
        }
        if (r == root.end()) {
            return true;
        }
    }
    return false;
}

void PathGuard::Require(const std::string& path) const {
    if (!IsPathAllowed(path)) {
        LOG_WARN("PathGuard: denied access to {}", path);
        throw errors::ToolError(errors::ErrorKind::AccessDenied, "Access denied to " + path);
    }
}

std::vector<std::string> DefaultAllowedRoots() {
    std::vector<std::string> roots;
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        roots.push_back(cwd.string());
    }
    const std::string home = GetEnvOrDefault("HOME", "");
    if (!home.empty()) {
        roots.push_back((fs::path(home) / "Documents").string());
    }
    roots.push_back("/tmp");
    return roots;
}

} // namespace security
} // namespace toolhost
