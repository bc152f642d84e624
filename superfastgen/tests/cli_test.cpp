#include "cli/cli.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace sfg;
using namespace sfg::cli;
using model::VariantTag;

class CliTest : public ::testing::Test {
protected:
    auto parse(std::vector<std::string> args) -> CliOptions {
        auto result = parse_args(args);
        if (is_err(result)) {
            ADD_FAILURE() << "Usage error: " << unwrap_err(result).message;
            return {};
        }
        return std::move(unwrap(result));
    }

    auto usage_error(std::vector<std::string> args) -> std::string {
        auto result = parse_args(args);
        if (is_ok(result)) {
            ADD_FAILURE() << "Expected a usage error";
            return {};
        }
        return unwrap_err(result).message;
    }
};

// ============================================================================
// Argument Parsing
// ============================================================================

TEST_F(CliTest, NoArgumentsShowsHelp) {
    EXPECT_EQ(parse({}).command, Command::Help);
    EXPECT_EQ(parse({"--help"}).command, Command::Help);
    EXPECT_EQ(parse({"-V"}).command, Command::Version);
    EXPECT_EQ(parse({"generate", "-h"}).command, Command::Help);
}

TEST_F(CliTest, Commands) {
    EXPECT_EQ(parse({"generate"}).command, Command::Generate);
    EXPECT_EQ(parse({"clean"}).command, Command::Clean);
    EXPECT_EQ(parse({"watch"}).command, Command::Watch);
    EXPECT_EQ(parse({"assets"}).command, Command::Assets);
}

TEST_F(CliTest, TypeSelection) {
    auto options = parse({"generate", "--type=freezed", "--type", "provider", "--type=freezed"});
    ASSERT_TRUE(options.overrides.variants.has_value());
    EXPECT_EQ(*options.overrides.variants,
              (std::vector<VariantTag>{VariantTag::Immutable, VariantTag::Provider}));

    EXPECT_FALSE(parse({"generate"}).overrides.variants.has_value());
}

TEST_F(CliTest, AllSelectsEveryVariant) {
    auto options = parse({"all"});
    EXPECT_EQ(options.command, Command::All);
    ASSERT_TRUE(options.overrides.variants.has_value());
    EXPECT_EQ(options.overrides.variants->size(), 3u);
}

TEST_F(CliTest, PathOptions) {
    auto options = parse({"generate", "--input=lib", "--input", "packages/core/lib",
                          "--output=gen", "--config", "ci.yaml", "--report=out.json",
                          "--delete-conflicting-outputs"});
    ASSERT_TRUE(options.overrides.input_paths.has_value());
    EXPECT_EQ(options.overrides.input_paths->size(), 2u);
    EXPECT_EQ(options.overrides.output_root, fs::path("gen"));
    EXPECT_EQ(options.config_path, fs::path("ci.yaml"));
    EXPECT_EQ(options.report_path, fs::path("out.json"));
    EXPECT_EQ(options.overrides.delete_conflicting_outputs, true);
}

TEST_F(CliTest, LogOptionsAreSkipped) {
    auto options = parse({"-vv", "generate", "--log-level=debug", "--type=json"});
    EXPECT_EQ(options.command, Command::Generate);
    EXPECT_EQ(options.overrides.variants->size(), 1u);
}

TEST_F(CliTest, UsageErrors) {
    EXPECT_NE(usage_error({"build"}).find("unknown command 'build'"), std::string::npos);
    EXPECT_NE(usage_error({"generate", "--type=assets"}).find("unknown generator type"),
              std::string::npos);
    EXPECT_NE(usage_error({"generate", "--input"}).find("missing value for --input"),
              std::string::npos);
    EXPECT_NE(usage_error({"generate", "--inputs=lib"}).find("unknown option"),
              std::string::npos);
    EXPECT_NE(usage_error({"generate", "extra"}).find("unknown option 'extra'"),
              std::string::npos);
}

TEST_F(CliTest, UsageAndVersionText) {
    std::ostringstream usage;
    print_usage(usage);
    EXPECT_NE(usage.str().find("Usage: superfastgen <command> [options]"), std::string::npos);
    EXPECT_NE(usage.str().find("--delete-conflicting-outputs"), std::string::npos);

    std::ostringstream version;
    print_version(version);
    EXPECT_EQ(version.str(), std::string("superfastgen ") + VERSION + "\n");
}

// ============================================================================
// Commands
// ============================================================================

class CliCommandTest : public CliTest {
protected:
    test::TempDir dir_;

    void SetUp() override {
        test::write_text(dir_ / "lib/user.dart", test::USER_SOURCE);
        test::write_text(dir_ / "lib/provider.dart", test::PROVIDER_SOURCE);
        test::write_text(dir_ / "superfastgen.yaml",
                         "generate:\n  input: " + (dir_ / "lib").string() + "\n");
    }

    auto options_for(std::vector<std::string> args) -> CliOptions {
        args.push_back("--config=" + (dir_ / "superfastgen.yaml").string());
        return parse(args);
    }
};

TEST_F(CliCommandTest, GenerateWritesCompanionsAndReport) {
    auto report_path = dir_ / "report.json";
    auto options = options_for({"generate", "--report=" + report_path.string()});
    EXPECT_EQ(run_generate(options), 0);

    EXPECT_TRUE(fs::exists(dir_ / "lib/user.freezed.dart"));
    EXPECT_TRUE(fs::exists(dir_ / "lib/user.g.dart"));
    EXPECT_TRUE(fs::exists(dir_ / "lib/provider.g.dart"));
    auto json = test::read_text(report_path);
    EXPECT_NE(json.find("\"files_processed\":2"), std::string::npos);
    EXPECT_NE(json.find("\"files_written\":3"), std::string::npos);
}

TEST_F(CliCommandTest, TypeFlagLimitsVariants) {
    auto options = options_for({"generate", "--type=riverpod"});
    EXPECT_EQ(run_generate(options), 0);
    EXPECT_TRUE(fs::exists(dir_ / "lib/provider.g.dart"));
    EXPECT_FALSE(fs::exists(dir_ / "lib/user.freezed.dart"));
}

TEST_F(CliCommandTest, FileErrorsStillExitZero) {
    test::write_text(dir_ / "lib/broken.dart", "@freezed\nclass Broken {\n");
    auto report_path = dir_ / "report.json";
    auto options = options_for({"generate", "--report=" + report_path.string()});
    EXPECT_EQ(run_generate(options), 0);
    EXPECT_NE(test::read_text(report_path).find("\"kind\":\"parse\""), std::string::npos);
}

TEST_F(CliCommandTest, MissingConfigFileFails) {
    auto options = parse({"generate", "--config=" + (dir_ / "nope.yaml").string()});
    EXPECT_EQ(run_generate(options), 1);
}

TEST_F(CliCommandTest, MalformedConfigFails) {
    test::write_text(dir_ / "superfastgen.yaml", "generate:\n  json: sometimes\n");
    EXPECT_EQ(run_generate(options_for({"generate"})), 1);
    EXPECT_EQ(run_clean(options_for({"clean"})), 1);
}

TEST_F(CliCommandTest, UnwritableReportFails) {
    auto options =
        options_for({"generate", "--report=" + (dir_ / "missing/dir/report.json").string()});
    EXPECT_EQ(run_generate(options), 1);
}

TEST_F(CliCommandTest, CleanRemovesCompanions) {
    ASSERT_EQ(run_generate(options_for({"generate"})), 0);
    EXPECT_EQ(run_clean(options_for({"clean"})), 0);
    EXPECT_FALSE(fs::exists(dir_ / "lib/user.g.dart"));
    EXPECT_FALSE(fs::exists(dir_ / "lib/provider.g.dart"));
    EXPECT_TRUE(fs::exists(dir_ / "lib/user.dart"));
}

TEST_F(CliCommandTest, WatchWithoutInputsFails) {
    auto options = options_for({"watch", "--input=" + (dir_ / "absent").string()});
    EXPECT_EQ(run_watch(options), 1);
}
