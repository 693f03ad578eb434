#include "deltacode/inventory/loader.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using deltacode::ErrorCode;
using deltacode::inventory::InventoryLoader;
using deltacode::inventory::PathSegments;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto dir = fs::temp_directory_path() /
                     fs::path("deltacode_loader_test_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

} // namespace

TEST(InventoryLoaderTest, ParsesPlainInventory) {
    auto result = InventoryLoader::parse_string(R"({
        "files": [
            {"path": "a/b.txt", "size": 10, "fingerprint": "X",
             "attributes": {"license": "mit"}},
            {"path": "c.txt", "fingerprint": "Y"}
        ]
    })", "old");

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    const auto& snapshot = result.value();
    EXPECT_EQ(snapshot.label, "old");
    ASSERT_EQ(snapshot.size(), 2u);

    EXPECT_EQ(snapshot.records[0].path, (PathSegments{"a", "b.txt"}));
    EXPECT_EQ(snapshot.records[0].size, 10u);
    EXPECT_EQ(snapshot.records[0].fingerprint, "X");
    EXPECT_EQ(snapshot.records[0].attributes.at("license"), "mit");

    EXPECT_EQ(snapshot.records[1].size, 0u);
    EXPECT_TRUE(snapshot.records[1].attributes.empty());
}

TEST(InventoryLoaderTest, FoldsScanCodeLicensesAndCopyrights) {
    auto result = InventoryLoader::parse_string(R"({
        "files": [
            {"path": "src", "type": "directory"},
            {"path": "src/main.c", "type": "file", "size": 120, "sha1": "abc",
             "licenses": [{"key": "mit"}, {"key": "apache-2.0"}, {"key": "mit"}],
             "copyrights": [{"value": "Copyright (c) B"},
                            {"statements": ["Copyright (c) A"]}]}
        ]
    })", "scan");

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    const auto& snapshot = result.value();
    ASSERT_EQ(snapshot.size(), 1u);

    const auto& record = snapshot.records.front();
    EXPECT_EQ(record.path_string(), "src/main.c");
    EXPECT_EQ(record.fingerprint, "abc");
    EXPECT_EQ(record.attributes.at("license"), "apache-2.0,mit");
    EXPECT_EQ(record.attributes.at("copyright"), "Copyright (c) A\nCopyright (c) B");
}

TEST(InventoryLoaderTest, FingerprintFallsBackToMd5) {
    auto result = InventoryLoader::parse_string(
        R"({"files": [{"path": "x.bin", "sha1": null, "md5": "d41d8"}]})", "scan");
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().records.front().fingerprint, "d41d8");
}

TEST(InventoryLoaderTest, MissingFingerprintIsMalformed) {
    auto result = InventoryLoader::parse_string(
        R"({"files": [{"path": "a.txt", "size": 3}]})", "old");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::MalformedRecord);
    EXPECT_NE(result.error().message.find("files[0]"), std::string::npos);
}

TEST(InventoryLoaderTest, MissingOrEmptyPathIsMalformed) {
    auto missing = InventoryLoader::parse_string(R"({"files": [{"fingerprint": "X"}]})", "old");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::MalformedRecord);

    auto empty = InventoryLoader::parse_string(R"({"files": [{"path": "./", "fingerprint": "X"}]})", "old");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().code, ErrorCode::MalformedRecord);
}

TEST(InventoryLoaderTest, NegativeSizeIsMalformed) {
    auto result = InventoryLoader::parse_string(
        R"({"files": [{"path": "a.txt", "size": -1, "fingerprint": "X"}]})", "old");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::MalformedRecord);
}

TEST(InventoryLoaderTest, NonStringAttributeIsMalformed) {
    auto result = InventoryLoader::parse_string(
        R"({"files": [{"path": "a.txt", "fingerprint": "X", "attributes": {"license": 3}}]})", "old");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::MalformedRecord);
}

TEST(InventoryLoaderTest, RejectsDocumentsWithoutFilesArray) {
    auto not_json = InventoryLoader::parse_string("{not json", "old");
    ASSERT_TRUE(not_json.is_error());
    EXPECT_EQ(not_json.error().code, ErrorCode::Parse);

    auto no_files = InventoryLoader::parse_string(R"({"headers": []})", "old");
    ASSERT_TRUE(no_files.is_error());
    EXPECT_EQ(no_files.error().code, ErrorCode::Parse);
}

TEST(InventoryLoaderTest, LoadFileUsesPathAsLabel) {
    const auto dir = create_temp_dir();
    const auto file = dir / "old.json";
    write_file(file, R"({"files": [{"path": "a.txt", "size": 1, "fingerprint": "X"}]})");

    auto result = InventoryLoader::load_file(file);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().label, file.generic_string());
    EXPECT_EQ(result.value().size(), 1u);

    auto missing = InventoryLoader::load_file(dir / "missing.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Io);

    fs::remove_all(dir);
}
