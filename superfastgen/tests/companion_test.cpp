#include "classify/classifier.hpp"
#include "emit/companion.hpp"
#include "parser/parser.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace sfg;
using namespace sfg::emit;

class CompanionTest : public ::testing::Test {
protected:
    std::string text_;
    model::SourceModel model_;
    classify::ClassificationResult classes_;

    void load(const std::string& code, const std::string& path) {
        text_ = code;
        auto source = lexer::Source::from_string(code, path);
        auto parsed = parser::parse_source(source);
        ASSERT_TRUE(is_ok(parsed));
        model_ = extract::Extractor(path).extract(unwrap(parsed)).model;
        classes_ = classify::Classifier().classify_all(model_);
    }

    auto assemble(const std::string& stem, CompanionOptions options = {}) -> CompanionSet {
        CompanionPaths paths{.freezed = "lib/" + stem + ".freezed.dart",
                             .g = "lib/" + stem + ".g.dart",
                             .part_of = stem + ".dart"};
        return assemble_companions(model_, text_, classes_, paths, options);
    }

    static auto find(const CompanionSet& set, const std::string& suffix)
        -> const model::EmissionResult* {
        for (const auto& r : set.results) {
            if (r.target.string().ends_with(suffix)) {
                return &r;
            }
        }
        return nullptr;
    }

    static auto contains(const std::string& text, std::string_view needle) -> bool {
        return text.find(needle) != std::string::npos;
    }
};

// ============================================================================
// Headers
// ============================================================================

TEST_F(CompanionTest, GFileHeader) {
    auto header = g_file_header("user.dart");
    EXPECT_TRUE(header.starts_with(std::string(GENERATED_HEADER) + "\n"));
    EXPECT_TRUE(contains(header, "part of 'user.dart';"));
}

TEST_F(CompanionTest, SectionBanner) {
    auto banner = section_banner("RiverpodGenerator");
    EXPECT_TRUE(banner.starts_with("// ****"));
    EXPECT_TRUE(contains(banner, "\n// RiverpodGenerator\n"));
}

// ============================================================================
// Assembly
// ============================================================================

TEST_F(CompanionTest, FreezedWithJsonProducesBothFiles) {
    load(test::USER_SOURCE, "lib/user.dart");
    auto set = assemble("user");

    EXPECT_TRUE(set.wants_freezed);
    EXPECT_TRUE(set.wants_g);
    ASSERT_EQ(set.results.size(), 2u);
    EXPECT_EQ(set.emitted[static_cast<size_t>(model::VariantTag::Immutable)], 1u);

    const auto* freezed = find(set, "user.freezed.dart");
    ASSERT_NE(freezed, nullptr);
    EXPECT_TRUE(contains(freezed->text, "mixin _$User {"));
    EXPECT_TRUE(freezed->source_identity.starts_with("lib/user.dart#User@"));

    const auto* g = find(set, "user.g.dart");
    ASSERT_NE(g, nullptr);
    EXPECT_TRUE(contains(g->text, "part of 'user.dart';"));
    EXPECT_TRUE(contains(g->text, "// JsonSerializableGenerator"));
    EXPECT_TRUE(contains(g->text, "_$$UserImplFromJson"));
    EXPECT_FALSE(contains(g->text, "// RiverpodGenerator"));
    EXPECT_EQ(g->variants, (std::vector<model::VariantTag>{model::VariantTag::JsonCodec}));
}

TEST_F(CompanionTest, ProvidersOnlyProduceGFile) {
    load(test::PROVIDER_SOURCE, "lib/provider.dart");
    auto set = assemble("provider");

    EXPECT_FALSE(set.wants_freezed);
    ASSERT_EQ(set.results.size(), 1u);
    const auto& g = set.results[0];
    EXPECT_EQ(g.target, std::filesystem::path("lib/provider.g.dart"));
    EXPECT_TRUE(contains(g.text, "// RiverpodGenerator"));
    EXPECT_FALSE(contains(g.text, "// JsonSerializableGenerator"));
    EXPECT_TRUE(contains(g.text, "// ignore_for_file: type=lint"));
    EXPECT_EQ(set.emitted[static_cast<size_t>(model::VariantTag::Provider)], 3u);
    EXPECT_TRUE(
        g.source_identity.starts_with("lib/provider.dart#greeting,userAge,Counter@"));
}

TEST_F(CompanionTest, JsonSectionPrecedesRiverpodSection) {
    std::string code = std::string(test::PRODUCT_SOURCE) +
                       "\n@riverpod\nProduct featured(FeaturedRef ref) => throw 0;\n";
    load(code, "lib/product.dart");
    auto set = assemble("product");
    ASSERT_EQ(set.results.size(), 1u);
    const auto& text = set.results[0].text;
    auto json = text.find("// JsonSerializableGenerator");
    auto riverpod = text.find("// RiverpodGenerator");
    ASSERT_NE(json, std::string::npos);
    ASSERT_NE(riverpod, std::string::npos);
    EXPECT_LT(json, riverpod);
    EXPECT_EQ(set.results[0].variants.size(), 2u);
}

TEST_F(CompanionTest, DisabledVariantsAreSkippedButStillWanted) {
    load(test::USER_SOURCE, "lib/user.dart");
    auto set = assemble("user", CompanionOptions{.freezed = true, .json = false});
    EXPECT_TRUE(set.wants_g);
    ASSERT_EQ(set.results.size(), 1u);
    EXPECT_NE(find(set, "user.freezed.dart"), nullptr);
}

TEST_F(CompanionTest, NothingToEmit) {
    load("class Plain {}\n", "lib/plain.dart");
    auto set = assemble("plain");
    EXPECT_TRUE(set.results.empty());
    EXPECT_FALSE(set.wants_freezed);
    EXPECT_FALSE(set.wants_g);
}

TEST_F(CompanionTest, IdentityChangesWithSource) {
    load(test::PROVIDER_SOURCE, "lib/provider.dart");
    auto before = assemble("provider").results.at(0).source_identity;
    load(std::string(test::PROVIDER_SOURCE) + "\n// trailing\n", "lib/provider.dart");
    auto after = assemble("provider").results.at(0).source_identity;
    EXPECT_NE(before, after);
}

TEST_F(CompanionTest, GenericValueTypeIsReportedAndSkipped) {
    load(R"(
@freezed
class Box<T> with _$Box<T> {
  const factory Box({required T value, List<T>? items}) = _Box<T>;
}

@freezed
class Point with _$Point {
  const factory Point({required int x, required int y}) = _Point;
}
)",
         "lib/shapes.dart");
    auto set = assemble("shapes");

    EXPECT_TRUE(set.wants_freezed);
    ASSERT_EQ(set.errors.size(), 1u);
    EXPECT_EQ(set.errors[0].declaration, "Box");
    EXPECT_TRUE(contains(set.errors[0].message, "Box<T>"));
    EXPECT_EQ(set.emitted[static_cast<size_t>(model::VariantTag::Immutable)], 1u);

    const auto* freezed = find(set, "shapes.freezed.dart");
    ASSERT_NE(freezed, nullptr);
    EXPECT_TRUE(contains(freezed->text, "mixin _$Point {"));
    EXPECT_FALSE(contains(freezed->text, "_$Box"));
    EXPECT_TRUE(freezed->source_identity.starts_with("lib/shapes.dart#Point@"));
}

TEST_F(CompanionTest, GenericJsonClassIsReportedAndSkipped) {
    load(R"(
@JsonSerializable()
class Page<T> {
  Page(this.items);
  final List<T> items;
}
)",
         "lib/page.dart");
    auto set = assemble("page");

    EXPECT_TRUE(set.wants_g);
    EXPECT_TRUE(set.results.empty());
    ASSERT_EQ(set.errors.size(), 1u);
    EXPECT_EQ(set.errors[0].declaration, "Page");
}
