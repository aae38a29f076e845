#include <gtest/gtest.h>
#include "roomcast/errors.hpp"
#include "roomcast/file_catalog.hpp"

using namespace roomcast;

TEST(FileCatalogTest, ClassifiesByExtensionCaseInsensitively) {
    EXPECT_EQ(catalog::classify_file_type("photo.JPG"), "image");
    EXPECT_EQ(catalog::classify_file_type("clip.mkv"), "video");
    EXPECT_EQ(catalog::classify_file_type("song.flac"), "audio");
    EXPECT_EQ(catalog::classify_file_type("report.pdf"), "document");
    EXPECT_EQ(catalog::classify_file_type("main.cpp"), "code");
    EXPECT_EQ(catalog::classify_file_type("notes.md"), "text");
    EXPECT_EQ(catalog::classify_file_type("backup.tar.gz"), "archive");
    EXPECT_EQ(catalog::classify_file_type("setup.exe"), "executable");
    EXPECT_EQ(catalog::classify_file_type("README"), "other");
    EXPECT_EQ(catalog::classify_file_type(".bashrc"), "other");
    EXPECT_EQ(catalog::classify_file_type(""), "other");
}

TEST(FileCatalogTest, GuessesMimeTypes) {
    EXPECT_EQ(catalog::guess_mime_type("a.png"), "image/png");
    EXPECT_EQ(catalog::guess_mime_type("dir/a.PDF"), "application/pdf");
    EXPECT_EQ(catalog::guess_mime_type("a.unknownext"), "application/octet-stream");
}

TEST(FileCatalogTest, FormatsSizesWithTwoDecimals) {
    EXPECT_EQ(catalog::format_file_size(0), "0.00 B");
    EXPECT_EQ(catalog::format_file_size(1023), "1023.00 B");
    EXPECT_EQ(catalog::format_file_size(1024), "1.00 KB");
    EXPECT_EQ(catalog::format_file_size(150000), "146.48 KB");
    EXPECT_EQ(catalog::format_file_size(5ull * 1024 * 1024), "5.00 MB");
}

TEST(FileCatalogTest, SanitizesRelativePaths) {
    EXPECT_EQ(catalog::sanitize_relative_path("photos/2024/a.jpg"), "photos/2024/a.jpg");
    EXPECT_EQ(catalog::sanitize_relative_path("../../etc/passwd"), "etc/passwd");
    EXPECT_EQ(catalog::sanitize_relative_path("a//b/./c/"), "a/b/c");
    EXPECT_EQ(catalog::sanitize_relative_path("\\windows\\style\\x.txt"), "windows/style/x.txt");
    EXPECT_EQ(catalog::sanitize_relative_path(".."), "");
    EXPECT_EQ(catalog::sanitize_relative_path(""), "");
}

TEST(FileCatalogTest, RejectsControlCharactersInPaths) {
    EXPECT_THROW(catalog::sanitize_relative_path(std::string("a\0b", 3)), ValidationError);
    EXPECT_THROW(catalog::sanitize_relative_path("line\nbreak"), ValidationError);
}

TEST(FileCatalogTest, BaseName) {
    EXPECT_EQ(catalog::base_name("a/b/c.txt"), "c.txt");
    EXPECT_EQ(catalog::base_name("C:\\x\\y.bin"), "y.bin");
    EXPECT_EQ(catalog::base_name("plain"), "plain");
    EXPECT_EQ(catalog::base_name("dir/"), "");
}

TEST(FileCatalogTest, NormalizesRoomCodes) {
    EXPECT_EQ(catalog::normalize_room_code("q7k2m9"), "Q7K2M9");
    EXPECT_EQ(catalog::normalize_room_code("  abc123\n"), "ABC123");
    EXPECT_THROW(catalog::normalize_room_code("ABC12"), ValidationError);
    EXPECT_THROW(catalog::normalize_room_code("ABC1234"), ValidationError);
    EXPECT_THROW(catalog::normalize_room_code("ABC-12"), ValidationError);
    EXPECT_THROW(catalog::normalize_room_code(""), ValidationError);
}

TEST(FileCatalogTest, ValidatesFileIds) {
    EXPECT_NO_THROW(catalog::validate_file_id("3f2b9c1e-7d4a-4b8e-9f00-123456789abc"));
    EXPECT_THROW(catalog::validate_file_id(""), ValidationError);
    EXPECT_THROW(catalog::validate_file_id("../secret"), ValidationError);
    EXPECT_THROW(catalog::validate_file_id(std::string(65, 'a')), ValidationError);
}
