//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_file_tools.cpp
// Purpose: File management tools confined to allowed roots
//==========================================================================================================

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "toolhost/Dispatcher.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/security/PathGuard.h"
#include "toolhost/tools/BuiltinTools.h"

using namespace toolhost;
using errors::ErrorKind;
namespace fs = std::filesystem;

namespace {

class FileToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("toolhost_files_" + std::to_string(::getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
        tools::RegisterFileTools(registry,
                                 std::make_shared<const security::PathGuard>(std::vector<std::string>{root.string()}));
        registry.Freeze();
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    InvocationResult call(const std::string& name, std::vector<std::pair<std::string, JSONValue>> fields) {
        JSONValue::Object args;
        for (auto& [key, value] : fields) {
            setField(args, key, std::move(value));
        }
        return Dispatcher(registry, nullptr).Invoke(name, JSONValue(std::move(args)), std::stop_token{});
    }

    std::string text(const std::string& name, std::vector<std::pair<std::string, JSONValue>> fields) {
        auto result = call(name, std::move(fields));
        if (!result.ok()) {
            ADD_FAILURE() << name << " failed: " << result.asFailure()->message;
            return std::string();
        }
        return *getText(result.asSuccess()->content.at(0));
    }

    std::string at(const std::string& rel) const { return (root / rel).string(); }

    void touch(const std::string& rel, const std::string& content) {
        fs::create_directories((root / rel).parent_path());
        std::ofstream(root / rel, std::ios::binary) << content;
    }

    fs::path root;
    ToolRegistry registry;
};

} // namespace

TEST_F(FileToolsTest, WriteThenReadAndAppend) {
    const std::string path = at("nested/dir/note.txt");
    EXPECT_EQ(text("write_file", {{"filepath", JSONValue(path)}, {"content", JSONValue("hello")}}),
              "Written to " + path + " successfully (5 characters)");
    EXPECT_EQ(text("write_file",
                   {{"filepath", JSONValue(path)}, {"content", JSONValue(" w\xC3\xB6rld")}, {"mode", JSONValue("append")}}),
              "Appended to " + path + " successfully (6 characters)");
    EXPECT_EQ(text("read_file", {{"filepath", JSONValue(path)}}),
              "Content of " + path + ":\n\nhello w\xC3\xB6rld");

    text("write_file", {{"filepath", JSONValue(path)}, {"content", JSONValue("reset")}});
    EXPECT_EQ(text("read_file", {{"filepath", JSONValue(path)}}), "Content of " + path + ":\n\nreset");
}

TEST_F(FileToolsTest, ReadFailures) {
    auto missing = call("read_file", {{"filepath", JSONValue(at("absent.txt"))}});
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.asFailure()->kind, ErrorKind::ExecutionError);
    EXPECT_EQ(missing.asFailure()->message, "File not found: " + at("absent.txt"));

    auto dir = call("read_file", {{"filepath", JSONValue(root.string())}});
    ASSERT_FALSE(dir.ok());
    EXPECT_EQ(dir.asFailure()->message, root.string() + " is not a file");

    touch("blob.bin", std::string("\x00\xFF\xFE\x01", 4));
    auto binary = call("read_file", {{"filepath", JSONValue(at("blob.bin"))}});
    ASSERT_FALSE(binary.ok());
    EXPECT_NE(binary.asFailure()->message.find("binary file?"), std::string::npos);
}

TEST_F(FileToolsTest, OutsideRootsIsAccessDenied) {
    for (const char* tool : {"read_file", "get_file_info"}) {
        auto result = call(tool, {{"filepath", JSONValue("/etc/hostname")}});
        ASSERT_FALSE(result.ok()) << tool;
        EXPECT_EQ(result.asFailure()->kind, ErrorKind::AccessDenied) << tool;
        EXPECT_EQ(result.asFailure()->message, "Access denied to /etc/hostname");
    }
    auto escape = call("write_file", {{"filepath", JSONValue(at("../escape.txt"))}, {"content", JSONValue("x")}});
    ASSERT_FALSE(escape.ok());
    EXPECT_EQ(escape.asFailure()->kind, ErrorKind::AccessDenied);
    EXPECT_FALSE(fs::exists(root.parent_path() / "escape.txt"));

    auto list = call("list_directory", {{"directory", JSONValue("/")}});
    ASSERT_FALSE(list.ok());
    EXPECT_EQ(list.asFailure()->kind, ErrorKind::AccessDenied);
}

TEST_F(FileToolsTest, MissingFileOutsideRootsIsStillAccessDenied) {
    const std::string missing = "/nonexistent_dir/x.txt";
    ASSERT_FALSE(fs::exists(missing));
    for (const char* tool : {"read_file", "get_file_info"}) {
        auto result = call(tool, {{"filepath", JSONValue(missing)}});
        ASSERT_FALSE(result.ok()) << tool;
        EXPECT_EQ(result.asFailure()->kind, ErrorKind::AccessDenied) << tool;
        EXPECT_EQ(result.asFailure()->message, "Access denied to " + missing) << tool;
    }
}

TEST_F(FileToolsTest, ListDirectorySortedWithSizes) {
    touch("b.txt", "12345");
    touch("a.txt", std::string(2048, 'x'));
    touch(".hidden", "");
    fs::create_directories(root / "sub");

    EXPECT_EQ(text("list_directory", {{"directory", JSONValue(root.string())}}),
              "Contents of " + root.string() + ":\n\nDIR  sub\nFILE a.txt (2.0 KB)\nFILE b.txt (5 B)");

    const std::string withHidden =
        text("list_directory", {{"directory", JSONValue(root.string())}, {"include_hidden", JSONValue(true)}});
    EXPECT_NE(withHidden.find("FILE .hidden (0 B)"), std::string::npos);

    auto notDir = call("list_directory", {{"directory", JSONValue(at("b.txt"))}});
    ASSERT_FALSE(notDir.ok());
    EXPECT_EQ(notDir.asFailure()->message, at("b.txt") + " is not a directory");
}

TEST_F(FileToolsTest, SearchFilesWithGlobs) {
    touch("top.txt", "abc");
    touch("one/mid.txt", "a");
    touch("one/two/deep.txt", "a");
    touch("one/two/skip.md", "a");
    touch(".secret/hidden.txt", "a");

    EXPECT_EQ(text("search_files", {{"pattern", JSONValue("*.txt")}, {"directory", JSONValue(root.string())}}),
              "Found 1 files matching '*.txt':\nFILE " + at("top.txt") + " (3 bytes)");

    const std::string recursive =
        text("search_files", {{"pattern", JSONValue("**/*.txt")}, {"directory", JSONValue(root.string())}});
    EXPECT_EQ(recursive.rfind("Found 3 files matching '**/*.txt':", 0), 0u) << recursive;
    EXPECT_NE(recursive.find(at("one/two/deep.txt")), std::string::npos);
    EXPECT_NE(recursive.find(at("top.txt")), std::string::npos);
    EXPECT_EQ(recursive.find("hidden.txt"), std::string::npos);

    EXPECT_EQ(text("search_files", {{"pattern", JSONValue("*.none")}, {"directory", JSONValue(root.string())}}),
              "No files found matching pattern: *.none");
}

TEST_F(FileToolsTest, SearchFilesOnlyReportsAllowedMatches) {
    touch("mine.conf", "x");
    const std::string out =
        text("search_files", {{"pattern", JSONValue("/etc/*.conf")}, {"directory", JSONValue(root.string())}});
    EXPECT_EQ(out, "No files found matching pattern: /etc/*.conf");
}

TEST_F(FileToolsTest, GetFileInfoReportsMetadata) {
    touch("data.json", "{}");
    fs::permissions(root / "data.json", fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

    const std::string out = text("get_file_info", {{"filepath", JSONValue(at("data.json"))}});
    ASSERT_EQ(out.rfind("File Information:\n", 0), 0u);
    JSONValue info = parseJSONValue(out.substr(std::string("File Information:\n").size()));
    EXPECT_EQ(getStringOr(info, "type", ""), "file");
    EXPECT_EQ(getStringOr(info, "absolute_path", ""), at("data.json"));
    EXPECT_DOUBLE_EQ(getNumber(info, "size_bytes").value(), 2.0);
    EXPECT_EQ(getStringOr(info, "permissions", ""), "640");
    EXPECT_EQ(getStringOr(info, "extension", ""), ".json");
    EXPECT_TRUE(getBoolOr(info, "is_readable", false));

    const std::string dirOut = text("get_file_info", {{"filepath", JSONValue(root.string())}});
    JSONValue dirInfo = parseJSONValue(dirOut.substr(std::string("File Information:\n").size()));
    EXPECT_EQ(getStringOr(dirInfo, "type", ""), "directory");
    EXPECT_EQ(dirInfo.find("extension"), nullptr);

    auto missing = call("get_file_info", {{"filepath", JSONValue(at("nope"))}});
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.asFailure()->message, "Path not found: " + at("nope"));
}

TEST_F(FileToolsTest, CreateDirectory) {
    const std::string deep = at("x/y/z");
    EXPECT_EQ(text("create_directory", {{"directory", JSONValue(deep)}}), "Created directory: " + deep);
    EXPECT_TRUE(fs::is_directory(deep));
    EXPECT_EQ(text("create_directory", {{"directory", JSONValue(deep)}}), "Directory already exists: " + deep);

    auto flat = call("create_directory", {{"directory", JSONValue(at("p/q"))}, {"recursive", JSONValue(false)}});
    ASSERT_FALSE(flat.ok());
    EXPECT_EQ(flat.asFailure()->kind, ErrorKind::ExecutionError);
}
