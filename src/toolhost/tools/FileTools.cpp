//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileTools.cpp
// Purpose: File management tools confined to the allowed roots of a PathGuard
//==========================================================================================================

#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

#include <fmt/core.h>

#include "logging/Logger.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/security/PathGuard.h"
#include "toolhost/tools/BuiltinTools.h"
#include "toolhost/tools/SchemaBuilder.h"

namespace toolhost {
namespace tools {

namespace fs = std::filesystem;
using errors::ErrorKind;
using errors::ToolError;

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw ToolError(ErrorKind::ExecutionError, message);
}

bool isValidUtf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::size_t countCodePoints(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string humanSize(uintmax_t size) {
    if (size < 1024) {
        return fmt::format("{} B", size);
    }
    if (size < 1024 * 1024) {
        return fmt::format("{:.1f} KB", static_cast<double>(size) / 1024.0);
    }
    return fmt::format("{:.1f} MB", static_cast<double>(size) / (1024.0 * 1024.0));
}

double toEpochSeconds(const struct timespec& ts) {
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
}

bool hasWildcard(const std::string& part) {
    return part.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> splitPattern(const std::string& pattern) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : pattern) {
        if (c == '/') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

//==========================================================================================================
// Glob expansion over the filesystem. Each pattern component is matched with fnmatch against directory
// entries (FNM_PERIOD, so hidden entries need an explicit leading '.'); "**" spans zero or more
// directories, and as the last component it matches everything below.
//==========================================================================================================
class GlobWalker {
public:
    GlobWalker(std::vector<std::string> parts, std::stop_token stop)
        : parts_(std::move(parts)), stop_(std::move(stop)) {}

    std::set<std::string> Run(const fs::path& base) {
        expand(base, 0);
        return std::move(matches_);
    }

private:
    void expand(const fs::path& base, std::size_t i) {
        if (stop_.stop_requested()) {
            return;
        }
        if (i == parts_.size()) {
            matches_.insert(base.string());
            return;
        }
        const std::string& part = parts_[i];
        const bool last = (i + 1 == parts_.size());
        std::error_code ec;

        if (part == "**") {
            if (!last) {
                expand(base, i + 1);
            }
            for (const auto& entry : listVisible(base)) {
                const bool dir = fs::is_directory(entry, ec);
                if (last) {
                    matches_.insert(entry.string());
                }
                if (dir && !fs::is_symlink(entry, ec)) {
                    expand(entry, i);
                }
            }
            return;
        }

        if (!hasWildcard(part)) {
            const fs::path child = base / part;
            if (fs::exists(child, ec) && (last || fs::is_directory(child, ec))) {
                expand(child, i + 1);
            }
            return;
        }

        for (const auto& entry : listAll(base)) {
            const std::string name = entry.filename().string();
            if (::fnmatch(part.c_str(), name.c_str(), FNM_PERIOD) != 0) {
                continue;
            }
            if (last) {
                matches_.insert(entry.string());
            } else if (fs::is_directory(entry, ec)) {
                expand(entry, i + 1);
            }
        }
    }

    static std::vector<fs::path> listAll(const fs::path& dir) {
        std::vector<fs::path> out;
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            return out;
        }
        for (const auto& entry : it) {
            out.push_back(entry.path());
        }
        return out;
    }

    static std::vector<fs::path> listVisible(const fs::path& dir) {
        std::vector<fs::path> out;
        for (auto& p : listAll(dir)) {
            if (p.filename().string().rfind('.', 0) != 0) {
                out.push_back(std::move(p));
            }
        }
        return out;
    }

    std::vector<std::string> parts_;
    std::stop_token stop_;
    std::set<std::string> matches_;
};

///////////////////////////////////////// Handlers ///////////////////////////////////////////
ToolOutput readFile(const security::PathGuard& guard, const JSONValue& args) {
    const std::string filepath = getStringOr(args, "filepath", "");
    guard.Require(filepath);

    std::error_code ec;
    if (!fs::exists(filepath, ec)) {
        fail("File not found: " + filepath);
    }
    if (!fs::is_regular_file(filepath, ec)) {
        fail(filepath + " is not a file");
    }
    std::ifstream in(filepath, std::ios::binary);
    if (!in) {
        fail(fmt::format("Cannot open {}: {}", filepath, std::strerror(errno)));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!isValidUtf8(content)) {
        fail("Cannot read " + filepath + " as text (binary file?)");
    }
    return {makeText("Content of " + filepath + ":\n\n" + content)};
}

ToolOutput writeFile(const security::PathGuard& guard, const JSONValue& args) {
    const std::string filepath = getStringOr(args, "filepath", "");
    const std::string content = getStringOr(args, "content", "");
    const bool append = getStringOr(args, "mode", "write") == "append";
    guard.Require(filepath);

    const fs::path parent = fs::path(filepath).parent_path();
    std::error_code ec;
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            fail(fmt::format("Cannot create directory {}: {}", parent.string(), ec.message()));
        }
    }

    std::ofstream out(filepath, append ? (std::ios::binary | std::ios::app) : (std::ios::binary | std::ios::trunc));
    if (!out) {
        fail(fmt::format("Cannot open {} for writing: {}", filepath, std::strerror(errno)));
    }
    out << content;
    out.flush();
    if (!out) {
        fail("Failed to write " + filepath);
    }
    LOG_DEBUG("write_file: {} bytes to {} (append={})", content.size(), filepath, append);
    return {makeText(fmt::format("{} {} successfully ({} characters)", append ? "Appended to" : "Written to",
                                 filepath, countCodePoints(content)))};
}

ToolOutput listDirectory(const security::PathGuard& guard, const JSONValue& args) {
    const std::string directory = getStringOr(args, "directory", "");
    const bool includeHidden = getBoolOr(args, "include_hidden", false);
    guard.Require(directory);

    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        fail("Directory not found: " + directory);
    }
    if (!fs::is_directory(directory, ec)) {
        fail(directory + " is not a directory");
    }

    std::vector<std::string> lines;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        fail(fmt::format("Cannot list {}: {}", directory, ec.message()));
    }
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!includeHidden && name.rfind('.', 0) == 0) {
            continue;
        }
        std::error_code entryEc;
        if (entry.is_directory(entryEc)) {
            lines.push_back("DIR  " + name);
        } else if (entry.is_regular_file(entryEc)) {
            const auto size = entry.file_size(entryEc);
            lines.push_back("FILE " + name + (entryEc ? std::string(" (size unknown)") : " (" + humanSize(size) + ")"));
        } else {
            lines.push_back("FILE " + name);
        }
    }
    std::sort(lines.begin(), lines.end());

    std::string text = "Contents of " + directory + ":\n\n";
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) text += "\n";
        text += lines[i];
    }
    return {makeText(std::move(text))};
}

ToolOutput searchFiles(const security::PathGuard& guard, const JSONValue& args, std::stop_token stop) {
    const std::string pattern = getStringOr(args, "pattern", "");
    const std::string directory = getStringOr(args, "directory", ".");
    guard.Require(directory);

    // Absolute patterns are rooted at "/" rather than the search directory.
    const fs::path base = (!pattern.empty() && pattern.front() == '/') ? fs::path("/") : fs::path(directory);
    std::set<std::string> found = GlobWalker(splitPattern(pattern), stop).Run(base);

    std::vector<std::string> allowed;
    for (const auto& m : found) {
        if (guard.IsPathAllowed(m)) {
            allowed.push_back(m);
        }
    }
    if (allowed.empty()) {
        return {makeText("No files found matching pattern: " + pattern)};
    }

    std::string text = fmt::format("Found {} files matching '{}':", allowed.size(), pattern);
    for (const auto& m : allowed) {
        std::error_code ec;
        if (fs::is_regular_file(m, ec)) {
            text += fmt::format("\nFILE {} ({} bytes)", m, fs::file_size(m, ec));
        } else {
            text += "\nDIR  " + m;
        }
    }
    return {makeText(std::move(text))};
}

ToolOutput getFileInfo(const security::PathGuard& guard, const JSONValue& args) {
    const std::string filepath = getStringOr(args, "filepath", "");
    guard.Require(filepath);

    struct stat st{};
    if (::stat(filepath.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            fail("Path not found: " + filepath);
        }
        fail(fmt::format("Cannot stat {}: {}", filepath, std::strerror(errno)));
    }

    const bool isDir = S_ISDIR(st.st_mode);
    std::error_code ec;
    fs::path absolute = fs::absolute(filepath, ec).lexically_normal();
    std::string absoluteStr = absolute.string();
    if (absoluteStr.size() > 1 && absoluteStr.back() == '/') {
        absoluteStr.pop_back();
    }

    JSONValue::Object info;
    setField(info, "path", JSONValue(filepath));
    setField(info, "absolute_path", JSONValue(absoluteStr));
    setField(info, "type", JSONValue(isDir ? "directory" : "file"));
    setField(info, "size_bytes", JSONValue(static_cast<int64_t>(st.st_size)));
    setField(info, "modified_time", JSONValue(toEpochSeconds(st.st_mtim)));
    setField(info, "created_time", JSONValue(toEpochSeconds(st.st_ctim)));
    setField(info, "permissions", JSONValue(fmt::format("{:03o}", st.st_mode & 0777)));
    setField(info, "is_readable", JSONValue(::access(filepath.c_str(), R_OK) == 0));
    setField(info, "is_writable", JSONValue(::access(filepath.c_str(), W_OK) == 0));
    setField(info, "is_executable", JSONValue(::access(filepath.c_str(), X_OK) == 0));
    if (S_ISREG(st.st_mode)) {
        setField(info, "extension", JSONValue(fs::path(filepath).extension().string()));
    }
    return {makeText("File Information:\n" + serializeJSONValuePretty(JSONValue(std::move(info))))};
}

ToolOutput createDirectory(const security::PathGuard& guard, const JSONValue& args) {
    const std::string directory = getStringOr(args, "directory", "");
    const bool recursive = getBoolOr(args, "recursive", true);
    guard.Require(directory);

    std::error_code ec;
    if (fs::exists(directory, ec)) {
        return {makeText("Directory already exists: " + directory)};
    }
    if (recursive) {
        fs::create_directories(directory, ec);
    } else {
        fs::create_directory(directory, ec);
    }
    if (ec) {
        fail(fmt::format("Cannot create directory {}: {}", directory, ec.message()));
    }
    return {makeText("Created directory: " + directory)};
}

} // namespace

void RegisterFileTools(ToolRegistry& registry, std::shared_ptr<const security::PathGuard> guard) {
    if (!guard) {
        throw std::invalid_argument("RegisterFileTools requires a PathGuard");
    }

    registry.Register(
        ToolSpec{"read_file", "Read the contents of a text file",
                 SchemaBuilder().property("filepath", "string", "Path to the file to read").required({"filepath"}).build()},
        [guard](const JSONValue& args, std::stop_token) { return readFile(*guard, args); });

    registry.Register(
        ToolSpec{"write_file", "Write content to a text file",
                 SchemaBuilder()
                     .property("filepath", "string", "Path to the file to write")
                     .property("content", "string", "Content to write to the file")
                     .property("mode", "string", "Write mode: 'write' to overwrite, 'append' to add to end")
                     .withEnum({"write", "append"})
                     .withDefault(JSONValue("write"))
                     .required({"filepath", "content"})
                     .build()},
        [guard](const JSONValue& args, std::stop_token) { return writeFile(*guard, args); });

    registry.Register(
        ToolSpec{"list_directory", "List contents of a directory",
                 SchemaBuilder()
                     .property("directory", "string", "Path to the directory to list")
                     .property("include_hidden", "boolean", "Whether to include hidden files")
                     .withDefault(JSONValue(false))
                     .required({"directory"})
                     .build()},
        [guard](const JSONValue& args, std::stop_token) { return listDirectory(*guard, args); });

    registry.Register(
        ToolSpec{"search_files", "Search for files matching a pattern",
                 SchemaBuilder()
                     .property("pattern", "string", "Glob pattern to search for (e.g., '*.py', '**/*.txt')")
                     .property("directory", "string", "Directory to search in (defaults to current directory)")
                     .withDefault(JSONValue("."))
                     .required({"pattern"})
                     .build()},
        [guard](const JSONValue& args, std::stop_token stop) { return searchFiles(*guard, args, stop); });

    registry.Register(
        ToolSpec{"get_file_info", "Get detailed information about a file or directory",
                 SchemaBuilder().property("filepath", "string", "Path to the file or directory").required({"filepath"}).build()},
        [guard](const JSONValue& args, std::stop_token) { return getFileInfo(*guard, args); });

    registry.Register(
        ToolSpec{"create_directory", "Create a new directory",
                 SchemaBuilder()
                     .property("directory", "string", "Path of the directory to create")
                     .property("recursive", "boolean", "Create parent directories if they don't exist")
                     .withDefault(JSONValue(true))
                     .required({"directory"})
                     .build()},
        [guard](const JSONValue& args, std::stop_token) { return createDirectory(*guard, args); });
}

} // namespace tools
} // namespace toolhost
