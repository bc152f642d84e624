#include "pipeline/pipeline.hpp"
#include "pipeline/worker_pool.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace sfg;
using namespace sfg::pipeline;
using report::DiagnosticKind;

class PipelineTest : public ::testing::Test {
protected:
    test::TempDir dir_;
    io::OutputWriter writer_;

    void SetUp() override {
        test::write_text(dir_ / "lib/user.dart", test::USER_SOURCE);
        test::write_text(dir_ / "lib/provider.dart", test::PROVIDER_SOURCE);
        test::write_text(dir_ / "lib/models/product.dart", test::PRODUCT_SOURCE);
    }

    auto make_config() const -> config::GeneratorConfig {
        config::GeneratorConfig config;
        config.input_paths = {dir_ / "lib"};
        config.workers = 2;
        return config;
    }

    static auto has_diagnostic(const std::vector<report::Diagnostic>& list, DiagnosticKind kind,
                               std::string_view needle) -> bool {
        for (const auto& d : list) {
            if (d.kind == kind && d.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

// ============================================================================
// File Classification
// ============================================================================

TEST_F(PipelineTest, SourceAndCompanionFiles) {
    EXPECT_TRUE(is_source_file("lib/user.dart"));
    EXPECT_FALSE(is_source_file("lib/user.g.dart"));
    EXPECT_FALSE(is_source_file("lib/user.freezed.dart"));
    EXPECT_FALSE(is_source_file("lib/injection.config.dart"));
    EXPECT_FALSE(is_source_file("lib/readme.md"));
    EXPECT_TRUE(is_companion_file("a/b.g.dart"));
    EXPECT_FALSE(is_companion_file("a/b.dart"));
}

TEST_F(PipelineTest, DiscoverSources) {
    test::write_text(dir_ / "lib/user.g.dart", "// stale\n");
    test::write_text(dir_ / "lib/notes.txt", "x");
    report::RunReport report;
    auto sources = discover_sources({dir_ / "lib", dir_ / "missing"}, report);
    ASSERT_EQ(sources.size(), 3u);
    EXPECT_TRUE(std::is_sorted(sources.begin(), sources.end()));
    EXPECT_TRUE(has_diagnostic(report.warnings, DiagnosticKind::Input, "does not exist"));
    EXPECT_FALSE(report.has_errors());
}

// ============================================================================
// Batch Runs
// ============================================================================

TEST_F(PipelineTest, RunAllGeneratesEveryCompanion) {
    Pipeline pipeline(make_config(), writer_);
    auto report = pipeline.run_all();

    EXPECT_EQ(report.files_processed, 3u);
    EXPECT_EQ(report.files_written, 4u);
    EXPECT_FALSE(report.has_errors());
    EXPECT_EQ(report.emitted(model::VariantTag::Immutable), 1u);
    EXPECT_EQ(report.emitted(model::VariantTag::JsonCodec), 1u);
    EXPECT_EQ(report.emitted(model::VariantTag::Provider), 3u);

    auto freezed = test::read_text(dir_ / "lib/user.freezed.dart");
    EXPECT_NE(freezed.find("mixin _$User {"), std::string::npos);
    auto user_g = test::read_text(dir_ / "lib/user.g.dart");
    EXPECT_NE(user_g.find("part of 'user.dart';"), std::string::npos);
    auto provider_g = test::read_text(dir_ / "lib/provider.g.dart");
    EXPECT_NE(provider_g.find("final greetingProvider"), std::string::npos);
    auto product_g = test::read_text(dir_ / "lib/models/product.g.dart");
    EXPECT_NE(product_g.find("_$ProductFromJson"), std::string::npos);
}

TEST_F(PipelineTest, SecondRunLeavesFilesUnchanged) {
    Pipeline pipeline(make_config(), writer_);
    ASSERT_FALSE(pipeline.run_all().has_errors());
    auto again = pipeline.run_all();
    EXPECT_EQ(again.files_written, 0u);
    EXPECT_EQ(again.files_unchanged, 4u);
    EXPECT_EQ(again.companions_by_variant[static_cast<size_t>(model::VariantTag::Provider)], 1u);
}

TEST_F(PipelineTest, ParseErrorIsScopedToItsFile) {
    test::write_text(dir_ / "lib/broken.dart", "@freezed\nclass Broken with _$Broken {\n");
    Pipeline pipeline(make_config(), writer_);
    auto report = pipeline.run_all();

    EXPECT_EQ(report.files_processed, 4u);
    EXPECT_EQ(report.files_written, 4u);
    ASSERT_FALSE(report.errors.empty());
    EXPECT_EQ(report.errors[0].kind, DiagnosticKind::Parse);
    EXPECT_NE(report.errors[0].path.find("broken.dart"), std::string::npos);
    EXPECT_FALSE(report.fatal);
    EXPECT_FALSE(fs::exists(dir_ / "lib/broken.freezed.dart"));
}

TEST_F(PipelineTest, MissingPartDirectiveWarns) {
    test::write_text(dir_ / "lib/loose.dart",
                     "@riverpod\nint loose(LooseRef ref) => 1;\n");
    Pipeline pipeline(make_config(), writer_);
    auto report = pipeline.process(dir_ / "lib/loose.dart");
    EXPECT_EQ(report.files_written, 1u);
    EXPECT_TRUE(has_diagnostic(report.warnings, DiagnosticKind::Extraction,
                               "missing part directive: part 'loose.g.dart';"));
}

TEST_F(PipelineTest, DisabledVariantIsNotWritten) {
    auto config = make_config();
    config.enabled = {true, false, false};
    Pipeline pipeline(config, writer_);
    auto report = pipeline.run_all();
    EXPECT_EQ(report.files_written, 1u);
    EXPECT_TRUE(fs::exists(dir_ / "lib/user.freezed.dart"));
    EXPECT_FALSE(fs::exists(dir_ / "lib/user.g.dart"));
    EXPECT_FALSE(fs::exists(dir_ / "lib/provider.g.dart"));
}

// ============================================================================
// Stale Outputs
// ============================================================================

TEST_F(PipelineTest, StaleCompanionIsRemoved) {
    Pipeline pipeline(make_config(), writer_);
    ASSERT_FALSE(pipeline.run_all().has_errors());
    ASSERT_TRUE(fs::exists(dir_ / "lib/models/product.g.dart"));

    test::write_text(dir_ / "lib/models/product.dart", "class Product {}\n");
    auto report = pipeline.process(dir_ / "lib/models/product.dart");
    EXPECT_EQ(report.files_removed, 1u);
    EXPECT_FALSE(fs::exists(dir_ / "lib/models/product.g.dart"));
}

TEST_F(PipelineTest, DisabledVariantKeepsExistingCompanion) {
    Pipeline full(make_config(), writer_);
    ASSERT_FALSE(full.run_all().has_errors());

    auto config = make_config();
    config.enabled = {true, false, true};
    Pipeline partial(config, writer_);
    auto report = partial.process(dir_ / "lib/user.dart");
    EXPECT_EQ(report.files_removed, 0u);
    EXPECT_TRUE(fs::exists(dir_ / "lib/user.g.dart"));
}

TEST_F(PipelineTest, HandwrittenCompanionIsNotRemoved) {
    test::write_text(dir_ / "lib/plain.dart", "class Plain {}\n");
    test::write_text(dir_ / "lib/plain.g.dart", "// written by hand\n");
    Pipeline pipeline(make_config(), writer_);
    auto report = pipeline.process(dir_ / "lib/plain.dart");
    EXPECT_EQ(report.files_removed, 0u);
    EXPECT_TRUE(fs::exists(dir_ / "lib/plain.g.dart"));
}

TEST_F(PipelineTest, RemoveOutputsOfDeletedSource) {
    Pipeline pipeline(make_config(), writer_);
    ASSERT_FALSE(pipeline.run_all().has_errors());
    fs::remove(dir_ / "lib/user.dart");
    auto report = pipeline.remove_outputs(dir_ / "lib/user.dart");
    EXPECT_EQ(report.files_removed, 2u);
    EXPECT_FALSE(fs::exists(dir_ / "lib/user.freezed.dart"));
    EXPECT_FALSE(fs::exists(dir_ / "lib/user.g.dart"));
}

TEST_F(PipelineTest, Clean) {
    Pipeline pipeline(make_config(), writer_);
    ASSERT_FALSE(pipeline.run_all().has_errors());
    auto report = pipeline.clean();
    EXPECT_EQ(report.files_removed, 4u);
    EXPECT_FALSE(fs::exists(dir_ / "lib/provider.g.dart"));
    EXPECT_TRUE(fs::exists(dir_ / "lib/provider.dart"));
}

TEST_F(PipelineTest, DeleteConflictingOutputsCleansFirst) {
    test::write_text(dir_ / "lib/orphan.g.dart", "// GENERATED CODE - DO NOT MODIFY BY HAND\n");
    auto config = make_config();
    config.delete_conflicting_outputs = true;
    Pipeline pipeline(config, writer_);
    auto report = pipeline.run_all();
    EXPECT_FALSE(fs::exists(dir_ / "lib/orphan.g.dart"));
    EXPECT_EQ(report.files_removed, 1u);
    EXPECT_EQ(report.files_written, 4u);
}

// ============================================================================
// Output Root
// ============================================================================

TEST_F(PipelineTest, OutputRootMirrorsInputTree) {
    auto config = make_config();
    config.output_root = dir_ / "gen";
    Pipeline pipeline(config, writer_);
    auto report = pipeline.process(dir_ / "lib/models/product.dart");
    EXPECT_EQ(report.files_written, 1u);
    auto text = test::read_text(dir_ / "gen/models/product.g.dart");
    EXPECT_NE(text.find("part of '../../lib/models/product.dart';"), std::string::npos);
}

// ============================================================================
// In-Memory Generation and Reload
// ============================================================================

TEST_F(PipelineTest, GenerateTextDoesNotTouchDisk) {
    Pipeline pipeline(make_config(), writer_);
    report::RunReport report;
    auto results = pipeline.generate_text("mem/user.dart", test::USER_SOURCE, report);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].target, fs::path("mem/user.freezed.dart"));
    EXPECT_FALSE(fs::exists("mem/user.freezed.dart"));
    EXPECT_FALSE(report.has_errors());
}

TEST_F(PipelineTest, ReloadReadsConfigFile) {
    auto config_file = dir_ / "superfastgen.yaml";
    test::write_text(config_file, "generate:\n  input: " + (dir_ / "lib/models").string() +
                                      "\n  riverpod: false\n");
    Pipeline pipeline(make_config(), writer_, config_file);
    auto sources = pipeline.reload();
    ASSERT_TRUE(is_ok(sources));
    ASSERT_EQ(unwrap(sources).size(), 1u);
    EXPECT_EQ(unwrap(sources)[0].filename(), "product.dart");
    EXPECT_FALSE(pipeline.config().is_enabled(model::VariantTag::Provider));

    test::write_text(config_file, "generate:\n  freezed: maybe\n");
    auto broken = pipeline.reload();
    ASSERT_TRUE(is_err(broken));
    EXPECT_TRUE(pipeline.config().is_enabled(model::VariantTag::Immutable));
}

TEST_F(PipelineTest, ReloadReappliesOverrides) {
    auto config_file = dir_ / "superfastgen.yaml";
    test::write_text(config_file, "generate:\n  input: " + (dir_ / "lib").string() + "\n");
    config::ConfigOverrides overrides;
    overrides.variants = config::parse_variant_selection("json");
    Pipeline pipeline(make_config(), writer_, config_file, overrides);
    ASSERT_TRUE(is_ok(pipeline.reload()));
    EXPECT_FALSE(pipeline.config().is_enabled(model::VariantTag::Immutable));
    EXPECT_TRUE(pipeline.config().is_enabled(model::VariantTag::JsonCodec));
}

// ============================================================================
// WorkerPool
// ============================================================================

TEST(WorkerPoolTest, RunsEveryTask) {
    std::atomic<int> done{0};
    WorkerPool pool(4);
    EXPECT_EQ(pool.size(), 4u);
    for (int i = 0; i < 100; ++i) {
        pool.submit([&done] { done.fetch_add(1); });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 100);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotStopPool) {
    std::atomic<int> done{0};
    WorkerPool pool(1);
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&done] { done.fetch_add(1); });
    pool.wait_idle();
    EXPECT_EQ(done.load(), 1);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}
