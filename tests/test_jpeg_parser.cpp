//
// Created by Giuseppe Francione on 12/02/26.
//

#include <gtest/gtest.h>

#include "test_fixtures.hpp"
#include "../libunmeta/include/errors.hpp"
#include "../libunmeta/include/jpeg_parser.hpp"

#include <algorithm>

namespace fs = std::filesystem;

using unmeta::CleaningError;
using unmeta::InvalidInputError;
using unmeta::JpegParser;
using namespace unmeta::test;

namespace {

const std::string kXmpPacket =
    R"(<x:xmpmeta xmlns:x="adobe:ns:meta/"><rdf:RDF/><dc:creator>someone</dc:creator></x:xmpmeta>)";

bool has_application_or_comment(const std::vector<int>& markers) {
    return std::any_of(markers.begin(), markers.end(), [](const int m) {
        return (m > 0xE0 && m <= 0xEF) || m == 0xFE;
    });
}

} // namespace

TEST(JpegParserTest, ReadsCommentExifAndXmp) {
    TempDir dir;
    const auto path = dir / "dirty.jpg";
    write_bytes(path, make_jpeg({com_marker("Created with GIMP"), exif_marker(make_exif_tiff()),
                                 xmp_marker(kXmpPacket)}));

    const auto meta = JpegParser(path).get_meta();
    ASSERT_EQ(meta.size(), 3u);
    EXPECT_EQ(meta.at("Comment").text(), "Created with GIMP");
    EXPECT_EQ(meta.at("XMP").text(), kXmpPacket);

    ASSERT_TRUE(meta.at("Exif").is_nested());
    const auto& exif = meta.at("Exif").nested();
    EXPECT_EQ(exif.at("Make").text(), "Canon");
    EXPECT_EQ(exif.at("Exif").nested().at("DateTimeOriginal").text(), "2024:01:02 03:04:05");
}

TEST(JpegParserTest, ReadsBigEndianExif) {
    TempDir dir;
    const auto path = dir / "motorola.jpg";
    write_bytes(path, make_jpeg({exif_marker(make_exif_tiff(true))}));

    const auto meta = JpegParser(path).get_meta();
    EXPECT_EQ(meta.at("Exif").nested().at("GPS").nested().at("GPSLatitude").text(), "48/1 51/1 2904/100");
}

TEST(JpegParserTest, BrokenExifKeepsTheOtherFields) {
    TempDir dir;
    const auto path = dir / "broken_exif.jpg";
    auto tiff = make_exif_tiff();
    // Make: count 100, value at 0xFFFF
    tiff[14] = 100;
    tiff[18] = 0xFF;
    tiff[19] = 0xFF;
    write_bytes(path, make_jpeg({com_marker("Created with GIMP"), exif_marker(tiff)}));

    const auto meta = JpegParser(path).get_meta();
    EXPECT_EQ(meta.at("Comment").text(), "Created with GIMP");
    EXPECT_EQ(meta.at("Exif").nested().at("Make").text(), "invalid");
    EXPECT_EQ(meta.at("Exif").nested().at("Software").text(), "GIMP 2.10");
}

TEST(JpegParserTest, UnreadableExifIsReportedNotThrown) {
    TempDir dir;
    const auto path = dir / "bad_header.jpg";
    write_bytes(path, make_jpeg({com_marker("hello"), exif_marker({'X', 'X', 0, 0, 0, 0, 0, 0})}));

    ScopedCapture capture;
    const auto meta = JpegParser(path).get_meta();
    EXPECT_EQ(meta.at("Comment").text(), "hello");
    EXPECT_EQ(meta.at("Exif").text(), "invalid");
    EXPECT_TRUE(capture.contains(LogLevel::Warning, "Unreadable EXIF"));
}

TEST(JpegParserTest, ReportsUnknownAndVendorSegments) {
    TempDir dir;
    const auto path = dir / "vendor.jpg";
    write_bytes(path, make_jpeg({app_marker(10, "AROT some vendor data"), app_marker(13, "Photoshop 3.0"),
                                 app_marker(12, "Ducky payload")}));

    const auto meta = JpegParser(path).get_meta();
    EXPECT_EQ(meta.at("APP10").text(), "21 bytes");
    EXPECT_EQ(meta.at("Photoshop").text(), "13 bytes");
    EXPECT_EQ(meta.at("Ducky").text(), "13 bytes");
}

TEST(JpegParserTest, StructuralSegmentsAreNotMetadata) {
    TempDir dir;
    const auto path = dir / "plain.jpg";
    const std::string icc("ICC_PROFILE\0\x01\x01profile", 21);
    const std::string adobe("Adobe\0\x64\0\0\0\0\x01", 12);
    write_bytes(path, make_jpeg({app_marker(2, icc), app_marker(14, adobe)}));

    EXPECT_TRUE(JpegParser(path).get_meta().empty());
}

TEST(JpegParserTest, RepeatedCommentsAreNumbered) {
    TempDir dir;
    const auto path = dir / "two.jpg";
    write_bytes(path, make_jpeg({com_marker("one"), com_marker("two")}));

    const auto meta = JpegParser(path).get_meta();
    EXPECT_EQ(meta.at("Comment").text(), "one");
    EXPECT_EQ(meta.at("Comment 2").text(), "two");
}

TEST(JpegParserTest, ThoroughCleaningKeepsOnlyJfif) {
    TempDir dir;
    const auto path = dir / "dirty.jpg";
    const auto original = make_jpeg({com_marker("Created with GIMP"), exif_marker(make_exif_tiff()),
                                     xmp_marker(kXmpPacket), app_marker(10, "vendor")});
    write_bytes(path, original);

    JpegParser p(path);
    EXPECT_EQ(p.output_filename(), dir / "dirty.cleaned.jpg");
    ASSERT_TRUE(p.remove_all());

    EXPECT_EQ(read_bytes(path), original);
    const auto markers = jpeg_markers(p.output_filename());
    EXPECT_FALSE(has_application_or_comment(markers));
    EXPECT_TRUE(JpegParser(p.output_filename()).get_meta().empty());
}

TEST(JpegParserTest, ThoroughCleaningIsIdempotent) {
    TempDir dir;
    const auto path = dir / "dirty.jpg";
    write_bytes(path, make_jpeg({com_marker("Created with GIMP"), exif_marker(make_exif_tiff())}));

    JpegParser first(path);
    ASSERT_TRUE(first.remove_all());

    JpegParser second(first.output_filename());
    EXPECT_EQ(second.output_filename(), dir / "dirty.cleaned.cleaned.jpg");
    EXPECT_TRUE(second.remove_all());
    EXPECT_TRUE(JpegParser(second.output_filename()).get_meta().empty());
    EXPECT_TRUE(JpegParser(first.output_filename()).get_meta().empty());
}

TEST(JpegParserTest, ThoroughCleaningKeepsProgressiveMode) {
    TempDir dir;
    const auto path = dir / "progressive.jpg";
    write_bytes(path, make_jpeg({com_marker("progressive")}, true));

    JpegParser p(path);
    ASSERT_TRUE(p.remove_all());
    const auto markers = jpeg_markers(p.output_filename());
    EXPECT_NE(std::find(markers.begin(), markers.end(), 0xC2), markers.end());
    EXPECT_TRUE(JpegParser(p.output_filename()).get_meta().empty());
}

TEST(JpegParserTest, TruncatedHeaderFailsWithoutOutput) {
    TempDir dir;
    const auto path = dir / "short.jpg";
    auto bytes = make_jpeg({com_marker("Created with GIMP")});
    bytes.resize(60);
    write_bytes(path, bytes);

    JpegParser p(path);
    EXPECT_THROW((void)p.get_meta(), CleaningError);
    EXPECT_THROW(p.remove_all(), CleaningError);
    EXPECT_FALSE(fs::exists(p.output_filename()));

    JpegParser light(path);
    light.set_lightweight_cleaning(true);
    EXPECT_THROW(light.remove_all(), CleaningError);
    EXPECT_FALSE(fs::exists(light.output_filename()));
}

TEST(JpegParserTest, RejectsNonJpegInput) {
    TempDir dir;
    const auto path = dir / "fake.jpg";
    write_bytes(path, make_png());
    EXPECT_THROW(JpegParser{path}, InvalidInputError);

    const auto empty = dir / "empty.jpg";
    write_bytes(empty, {});
    EXPECT_THROW(JpegParser{empty}, InvalidInputError);
}

TEST(JpegParserTest, DescribesItself) {
    TempDir dir;
    const auto path = dir / "a.jpeg";
    write_bytes(path, make_jpeg());
    const JpegParser p(path);
    EXPECT_EQ(p.get_name(), "JpegParser");
    EXPECT_EQ(p.get_supported_mime_types()[0], "image/jpeg");
    const auto list = p.get_meta_list();
    EXPECT_NE(std::find(list.begin(), list.end(), "Exif"), list.end());
    EXPECT_EQ(p.output_filename(), dir / "a.cleaned.jpeg");
}
