//
// Created by Giuseppe Francione on 11/02/26.
//

#include <gtest/gtest.h>

#include "stub_parser.hpp"
#include "test_fixtures.hpp"
#include "../libunmeta/include/errors.hpp"
#include "../libunmeta/include/jpeg_parser.hpp"
#include "../libunmeta/include/png_parser.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

using unmeta::CleaningError;
using unmeta::JpegParser;
using unmeta::Parser;
using unmeta::PngParser;
using unmeta::StateError;
using unmeta::SwapReport;
using namespace unmeta::test;

namespace {

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace

TEST(InPlaceTest, JpegCommentIsGoneAfterSwap) {
    TempDir dir;
    const auto path = dir / "clean.jpg";
    write_bytes(path, make_jpeg({com_marker("Created with GIMP")}));

    {
        JpegParser p(path);
        const auto meta = p.get_meta();
        ASSERT_EQ(meta.count("Comment"), 1u);
        EXPECT_EQ(meta.at("Comment").text(), "Created with GIMP");

        p.set_edit_in_place();
        EXPECT_TRUE(p.in_place());
        EXPECT_EQ(p.state(), Parser::State::InPlaceRequested);
        EXPECT_TRUE(p.remove_all());
    }

    const JpegParser reopened(path);
    EXPECT_TRUE(reopened.get_meta().empty());
}

TEST(InPlaceTest, TemporaryFileKeepsTheSourceExtension) {
    TempDir dir;
    const auto path = dir / "photo.png";
    write_bytes(path, make_png());

    PngParser p(path);
    p.set_edit_in_place();
    const fs::path temp = p.output_filename();

    EXPECT_NE(temp, path);
    EXPECT_EQ(temp.extension(), ".png");
    EXPECT_TRUE(fs::exists(temp));
    EXPECT_TRUE(fs::equivalent(temp.parent_path(), fs::temp_directory_path()));

    // a second parser gets its own temporary file
    PngParser other(path);
    other.set_edit_in_place();
    EXPECT_NE(other.output_filename(), temp);
}

TEST(InPlaceTest, ExplicitFinalizeSwapsAndRemovesTheTemporary) {
    TempDir dir;
    const auto path = dir / "photo.png";
    write_bytes(path, make_png({text_chunk("Comment", "This is a comment, be careful!")}));

    PngParser p(path);
    p.set_edit_in_place();
    const fs::path temp = p.output_filename();
    ASSERT_TRUE(p.remove_all());
    EXPECT_EQ(p.state(), Parser::State::Cleaned);

    const SwapReport report = p.finalize();
    EXPECT_EQ(report.status, SwapReport::Status::Swapped);
    EXPECT_TRUE(report.ok());
    EXPECT_FALSE(report.original_untouched);
    EXPECT_TRUE(report.temp_removed);
    EXPECT_EQ(p.state(), Parser::State::Swapped);
    EXPECT_FALSE(fs::exists(temp));

    EXPECT_TRUE(PngParser(path).get_meta().empty());
}

TEST(InPlaceTest, FinalizeRunsOnlyOnce) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser p(path);
    p.set_edit_in_place();
    ASSERT_TRUE(p.remove_all());

    const SwapReport first = p.finalize();
    const SwapReport second = p.finalize();
    EXPECT_EQ(first.status, SwapReport::Status::Swapped);
    EXPECT_EQ(second.status, SwapReport::Status::Swapped);
    EXPECT_EQ(p.move_calls, 1);
    EXPECT_EQ(slurp(path), "cleaned");
}

TEST(InPlaceTest, FailedMoveLeavesOriginalAndNoTemporary) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});
    const auto before = read_bytes(path);

    ScopedCapture capture;
    StubParser p(path);
    p.move_error = std::errc::permission_denied;
    p.set_edit_in_place();
    const fs::path temp = p.output_filename();
    ASSERT_TRUE(p.remove_all());
    ASSERT_TRUE(fs::exists(temp));

    const SwapReport report = p.finalize();
    EXPECT_EQ(report.status, SwapReport::Status::NotCleaned);
    EXPECT_FALSE(report.ok());
    EXPECT_TRUE(report.original_untouched);
    EXPECT_TRUE(report.temp_removed);
    EXPECT_TRUE(report.cleanup_error.empty());
    EXPECT_EQ(report.reason, std::make_error_code(std::errc::permission_denied).message());

    EXPECT_EQ(read_bytes(path), before);
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_TRUE(capture.contains(LogLevel::Error, "was NOT cleaned"));
}

TEST(InPlaceTest, UnremovableTemporaryIsReported) {
    TempDir dir;
    const auto path = dir / "clean.jpg";
    write_bytes(path, make_jpeg({com_marker("Created with GIMP")}));
    const auto before = read_bytes(path);

    JpegParser p(path);
    p.set_edit_in_place();
    const fs::path temp = p.output_filename();
    ASSERT_TRUE(p.remove_all());

    // a non-empty directory can be neither moved over a file nor removed
    fs::remove(temp);
    fs::create_directory(temp);
    write_bytes(temp / "blocker", {1});

    const SwapReport report = p.finalize();
    EXPECT_EQ(report.status, SwapReport::Status::NotCleaned);
    EXPECT_TRUE(report.original_untouched);
    EXPECT_FALSE(report.temp_removed);
    EXPECT_FALSE(report.reason.empty());
    EXPECT_FALSE(report.cleanup_error.empty());
    EXPECT_EQ(read_bytes(path), before);

    std::error_code ec;
    fs::permissions(temp, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(temp, ec);
}

TEST(InPlaceTest, FailedCleaningNeverSwaps) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser p(path);
    p.outcome = StubParser::Outcome::ThrowAfterPartialWrite;
    p.set_edit_in_place();
    const fs::path temp = p.output_filename();

    EXPECT_THROW(p.remove_all(), CleaningError);
    EXPECT_EQ(p.state(), Parser::State::Failed);

    const SwapReport report = p.finalize();
    EXPECT_EQ(report.status, SwapReport::Status::NotCleaned);
    EXPECT_EQ(p.move_calls, 0);
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_EQ(slurp(path), "dirty");
}

TEST(InPlaceTest, DestructorRemovesTemporaryOfFailedCleaning) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    fs::path temp;
    {
        StubParser p(path);
        p.outcome = StubParser::Outcome::ReturnFalse;
        p.set_edit_in_place();
        temp = p.output_filename();
        EXPECT_FALSE(p.remove_all());
    }
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_EQ(slurp(path), "dirty");
}

TEST(InPlaceTest, DestructorSwapsWhenFinalizeWasNotCalled) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    fs::path temp;
    {
        StubParser p(path);
        p.set_edit_in_place();
        temp = p.output_filename();
        ASSERT_TRUE(p.remove_all());
    }
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_EQ(slurp(path), "cleaned");
}

TEST(InPlaceTest, DestructorHonoursAFailingMove) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    ScopedCapture capture;
    fs::path temp;
    {
        StubParser p(path);
        p.move_error = std::errc::permission_denied;
        p.set_edit_in_place();
        temp = p.output_filename();
        ASSERT_TRUE(p.remove_all());
    }
    EXPECT_EQ(slurp(path), "dirty");
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_TRUE(capture.contains(LogLevel::Error, "was NOT cleaned"));
}

TEST(InPlaceTest, TemporaryFileIsPrivate) {
    TempDir dir;
    const auto path = dir / "photo.png";
    write_bytes(path, make_png());
    fs::permissions(path, fs::perms::all);

    PngParser p(path);
    p.set_edit_in_place();
    const auto perms = fs::status(p.output_filename()).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_NE(perms & fs::perms::owner_read, fs::perms::none);
}

TEST(InPlaceTest, DestructorSwapsOnExceptionalExit) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    fs::path temp;
    try {
        StubParser p(path);
        p.set_edit_in_place();
        temp = p.output_filename();
        ASSERT_TRUE(p.remove_all());
        throw std::runtime_error("caller bails out");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_EQ(slurp(path), "cleaned");
}

TEST(InPlaceTest, FinalizeBeforeCleaningDiscardsTheTemporary) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser p(path);
    p.set_edit_in_place();
    const fs::path temp = p.output_filename();

    const SwapReport report = p.finalize();
    EXPECT_EQ(report.status, SwapReport::Status::NotCleaned);
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_THROW(p.remove_all(), StateError);
}

TEST(InPlaceTest, SwapKeepsPermissionBitsOfTheOriginal) {
    TempDir dir;
    const auto path = dir / "photo.png";
    write_bytes(path, make_png({text_chunk("Author", "someone")}));
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

    {
        PngParser p(path);
        p.set_edit_in_place();
        ASSERT_TRUE(p.remove_all());
        ASSERT_TRUE(p.finalize().ok());
    }

    const auto perms = fs::status(path).permissions() & fs::perms::all;
    EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);
}

TEST(InPlaceTest, LightweightInPlaceKeepsUnknownChunks) {
    TempDir dir;
    const auto path = dir / "photo.png";
    write_bytes(path, make_png({text_chunk("Comment", "hello"), private_chunk("tracking-id")}));

    {
        PngParser p(path);
        p.set_lightweight_cleaning(true);
        p.set_edit_in_place();
        ASSERT_TRUE(p.remove_all());
    }

    EXPECT_TRUE(PngParser(path).get_meta().empty());
    const auto types = chunk_types(path);
    EXPECT_NE(std::find(types.begin(), types.end(), "prVt"), types.end());
}

TEST(LifecycleTest, NonInPlaceFinalizeIsANoOp) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser p(path);
    ASSERT_TRUE(p.remove_all());
    const SwapReport report = p.finalize();
    EXPECT_EQ(report.status, SwapReport::Status::NotInPlace);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(p.move_calls, 0);
    EXPECT_EQ(slurp(p.output_filename()), "cleaned");
    EXPECT_EQ(slurp(path), "dirty");
}

TEST(LifecycleTest, RemoveAllRunsOnce) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser p(path);
    ASSERT_TRUE(p.remove_all());
    EXPECT_THROW(p.remove_all(), StateError);
    EXPECT_EQ(p.thorough_calls, 1);
}

TEST(LifecycleTest, InPlaceMustBeRequestedBeforeCleaning) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser cleaned(path);
    ASSERT_TRUE(cleaned.remove_all());
    EXPECT_THROW(cleaned.set_edit_in_place(), StateError);

    StubParser twice(path);
    twice.set_edit_in_place();
    EXPECT_THROW(twice.set_edit_in_place(), StateError);
}

TEST(LifecycleTest, ModeFlagSelectsTheStrippingHook) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser light(path);
    light.set_lightweight_cleaning(true);
    ASSERT_TRUE(light.remove_all());
    EXPECT_EQ(light.lightweight_calls, 1);
    EXPECT_EQ(light.thorough_calls, 0);
}

TEST(LifecycleTest, FailedCleaningDropsPartialOutput) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser p(path);
    p.outcome = StubParser::Outcome::ThrowAfterPartialWrite;
    EXPECT_THROW(p.remove_all(), CleaningError);
    EXPECT_EQ(p.state(), Parser::State::Failed);
    EXPECT_FALSE(fs::exists(p.output_filename()));
    EXPECT_EQ(slurp(path), "dirty");
}

TEST(LifecycleTest, FalseFromTheHookIsReportedAsFailure) {
    TempDir dir;
    const auto path = dir / "data.stub";
    write_bytes(path, {'d', 'i', 'r', 't', 'y'});

    StubParser p(path);
    p.outcome = StubParser::Outcome::ReturnFalse;
    EXPECT_FALSE(p.remove_all());
    EXPECT_EQ(p.state(), Parser::State::Failed);
    EXPECT_THROW(p.remove_all(), StateError);
}
