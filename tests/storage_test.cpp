#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include "stitch/storage/filesystem_sink.hpp"
#include "stitch/storage/supabase_sink.hpp"

namespace stitch::storage {
namespace {

namespace fs = std::filesystem;

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class FilesystemSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("stitch-storage-" + std::to_string(rd()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

TEST_F(FilesystemSinkTest, UploadWritesObject) {
    FilesystemSink sink(root);

    auto result = sink.upload("petri-images", "img-1.jpg", bytes("\xFF\xD8jpeg"), "image/jpeg");
    ASSERT_TRUE(result.ok) << result.error;

    fs::path object = root / "petri-images" / "img-1.jpg";
    EXPECT_TRUE(fs::exists(object));
    EXPECT_EQ(read_file(object), "\xFF\xD8jpeg");
    EXPECT_EQ(result.value.rfind("file://", 0), 0u);
    EXPECT_THAT(result.value, ::testing::EndsWith("img-1.jpg"));
    EXPECT_FALSE(fs::exists(root / "petri-images" / ".img-1.jpg.part"));
}

TEST_F(FilesystemSinkTest, RefusesOverwrite) {
    FilesystemSink sink(root);
    ASSERT_TRUE(sink.upload("b", "k.jpg", bytes("one"), "image/jpeg").ok);

    auto second = sink.upload("b", "k.jpg", bytes("two"), "image/jpeg");
    EXPECT_FALSE(second.ok);
    EXPECT_THAT(second.error, ::testing::HasSubstr("already exists"));
    EXPECT_EQ(read_file(root / "b" / "k.jpg"), "one");
}

TEST_F(FilesystemSinkTest, RejectsUnsafeNames) {
    FilesystemSink sink(root);

    EXPECT_FALSE(sink.upload("b", "../escape.jpg", bytes("x"), "image/jpeg").ok);
    EXPECT_FALSE(sink.upload("..", "k.jpg", bytes("x"), "image/jpeg").ok);
    EXPECT_FALSE(sink.upload("b", "sub/k.jpg", bytes("x"), "image/jpeg").ok);
    EXPECT_FALSE(sink.insert_record("../table", {{"a", 1}}).ok);
    EXPECT_FALSE(fs::exists(root.parent_path() / "escape.jpg"));
}

TEST_F(FilesystemSinkTest, IsSafeName) {
    EXPECT_TRUE(FilesystemSink::is_safe_name("img-20240101120000.jpg"));
    EXPECT_FALSE(FilesystemSink::is_safe_name(""));
    EXPECT_FALSE(FilesystemSink::is_safe_name("."));
    EXPECT_FALSE(FilesystemSink::is_safe_name(".hidden"));
    EXPECT_FALSE(FilesystemSink::is_safe_name("a\\b"));
    EXPECT_FALSE(FilesystemSink::is_safe_name(std::string("a\0b", 3)));
}

TEST_F(FilesystemSinkTest, InsertRecordAppendsJsonLines) {
    FilesystemSink sink(root);

    auto first = sink.insert_record("observations", {{"image_id", "img-1"}});
    auto second = sink.insert_record("observations", {{"image_id", "img-2"}});
    ASSERT_TRUE(first.ok);
    ASSERT_TRUE(second.ok);
    EXPECT_EQ(first.value, "1");
    EXPECT_EQ(second.value, "2");

    std::ifstream in(root / "observations.jsonl");
    std::string line;
    std::vector<nlohmann::json> rows;
    while (std::getline(in, line)) {
        rows.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["image_id"], "img-1");
    EXPECT_EQ(rows[1]["id"], 2);
}

TEST_F(FilesystemSinkTest, RecordIdsContinueAcrossInstances) {
    {
        FilesystemSink sink(root);
        sink.insert_record("t", {{"n", 1}});
    }
    FilesystemSink sink(root);
    EXPECT_EQ(sink.insert_record("t", {{"n", 2}}).value, "2");
    EXPECT_EQ(sink.insert_record("other", {{"n", 3}}).value, "1");
}

TEST(SupabaseSinkTest, PublicUrlLayout) {
    SupabaseSink sink({.url = "https://example.supabase.co/", .service_key = "key"});
    EXPECT_EQ(sink.public_url("petri-images", "img-1.jpg"),
              "https://example.supabase.co/storage/v1/object/public/petri-images/img-1.jpg");
    EXPECT_EQ(sink.name(), "supabase");
}

TEST(SupabaseSinkTest, PublicUrlEscapesKey) {
    SupabaseSink sink({.url = "https://example.supabase.co", .service_key = "key"});
    EXPECT_EQ(sink.public_url("b", "a b.jpg"),
              "https://example.supabase.co/storage/v1/object/public/b/a%20b.jpg");
}

}  // namespace
}  // namespace stitch::storage
