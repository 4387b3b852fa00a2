//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathGuard.h
// Purpose: Allow-list check for filesystem paths touched by file tools
//==========================================================================================================

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace toolhost {
namespace security {

//==========================================================================================================
// PathGuard
// Purpose: Decides whether a path lies inside one of the allowed root directories. Paths are made
//          absolute and normalized (weakly_canonical, so symlinks in existing prefixes are resolved and
//          ".." cannot escape), then compared component-wise; "/tmpfoo" is not inside "/tmp".
//==========================================================================================================
class PathGuard {
public:
    explicit PathGuard(const std::vector<std::string>& allowedRoots);

    //==========================================================================================================
    // Args:
    //   path: Relative (to the current directory) or absolute path; need not exist.
    // Returns:
    //   true when the normalized path equals or is nested under an allowed root.
    //==========================================================================================================
    bool IsPathAllowed(const std::string& path) const;

    // Throws errors::ToolError(AccessDenied, "Access denied to <path>") when the path is not allowed.
    void Require(const std::string& path) const;

    const std::vector<std::filesystem::path>& GetRoots() const { return roots_; }

    static std::filesystem::path Normalize(const std::string& path);

private:
    std::vector<std::filesystem::path> roots_;
};

// Current directory, ~/Documents (when HOME is set) and /tmp.
std::vector<std::string> DefaultAllowedRoots();

} // namespace security
} // namespace toolhost
