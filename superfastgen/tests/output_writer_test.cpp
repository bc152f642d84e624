#include "io/output_writer.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace sfg;
using namespace sfg::io;

class OutputWriterTest : public ::testing::Test {
protected:
    test::TempDir dir_;
    OutputWriter writer_;

    auto leftover_temps() const -> size_t {
        size_t n = 0;
        for (const auto& entry : fs::recursive_directory_iterator(dir_.path())) {
            if (entry.path().string().find(".sfg-tmp-") != std::string::npos) {
                ++n;
            }
        }
        return n;
    }
};

// ============================================================================
// Writing
// ============================================================================

TEST_F(OutputWriterTest, WritesNewFileAndCreatesDirectories) {
    auto path = dir_ / "lib/models/user.g.dart";
    auto result = writer_.write(path, "part of 'user.dart';\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), WriteOutcome::Written);
    EXPECT_EQ(test::read_text(path), "part of 'user.dart';\n");
    EXPECT_EQ(leftover_temps(), 0u);
}

TEST_F(OutputWriterTest, IdenticalContentIsUnchanged) {
    auto path = dir_ / "a.g.dart";
    ASSERT_TRUE(is_ok(writer_.write(path, "x")));
    auto before = fs::last_write_time(path);

    auto again = writer_.write(path, "x");
    ASSERT_TRUE(is_ok(again));
    EXPECT_EQ(unwrap(again), WriteOutcome::Unchanged);
    EXPECT_EQ(fs::last_write_time(path), before);

    auto changed = writer_.write(path, "y");
    ASSERT_TRUE(is_ok(changed));
    EXPECT_EQ(unwrap(changed), WriteOutcome::Written);
    EXPECT_EQ(test::read_text(path), "y");
}

TEST_F(OutputWriterTest, UnwritableParentFails) {
    auto blocker = dir_ / "blocker";
    test::write_text(blocker, "file, not a directory");
    auto result = writer_.write(blocker / "out.g.dart", "x");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).path, (blocker / "out.g.dart").string());
    EXPECT_FALSE(unwrap_err(result).reason.empty());
    EXPECT_EQ(leftover_temps(), 0u);
}

TEST_F(OutputWriterTest, ConcurrentWritesToSamePath) {
    auto path = dir_ / "shared.g.dart";
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto text = std::string(1000, static_cast<char>('a' + i));
            auto result = writer_.write(path, text);
            EXPECT_TRUE(is_ok(result));
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    auto text = test::read_text(path);
    ASSERT_EQ(text.size(), 1000u);
    EXPECT_EQ(text, std::string(1000, text.front()));
    EXPECT_EQ(leftover_temps(), 0u);
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(OutputWriterTest, Remove) {
    auto path = dir_ / "gone.g.dart";
    test::write_text(path, "x");
    auto removed = writer_.remove(path);
    ASSERT_TRUE(is_ok(removed));
    EXPECT_TRUE(unwrap(removed));
    EXPECT_FALSE(fs::exists(path));

    auto again = writer_.remove(path);
    ASSERT_TRUE(is_ok(again));
    EXPECT_FALSE(unwrap(again));
}

TEST_F(OutputWriterTest, TempFileGuardRemovesUncommitted) {
    auto temp = dir_ / "file.sfg-tmp-9";
    test::write_text(temp, "partial");
    { TempFileGuard guard(temp); }
    EXPECT_FALSE(fs::exists(temp));

    test::write_text(temp, "kept");
    {
        TempFileGuard guard(temp);
        guard.commit();
    }
    EXPECT_TRUE(fs::exists(temp));
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(OutputWriterTest, GeneratedFileDetection) {
    auto generated = dir_ / "a.g.dart";
    test::write_text(generated, "// GENERATED CODE - DO NOT MODIFY BY HAND\n\npart of 'a.dart';\n");
    auto freezed = dir_ / "a.freezed.dart";
    test::write_text(freezed,
                     "// coverage:ignore-file\n// GENERATED CODE - DO NOT MODIFY BY HAND\n");
    auto handwritten = dir_ / "b.g.dart";
    test::write_text(handwritten, "// my own code\n");

    EXPECT_TRUE(is_generated_file(generated));
    EXPECT_TRUE(is_generated_file(freezed));
    EXPECT_FALSE(is_generated_file(handwritten));
    EXPECT_FALSE(is_generated_file(dir_ / "missing.g.dart"));
}

TEST_F(OutputWriterTest, ReadFile) {
    test::write_text(dir_ / "r.txt", "line\n");
    EXPECT_EQ(read_file(dir_ / "r.txt"), std::optional<std::string>("line\n"));
    EXPECT_FALSE(read_file(dir_ / "nope.txt").has_value());
}
