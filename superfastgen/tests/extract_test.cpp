#include "extract/extractor.hpp"
#include "parser/parser.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace sfg;
using namespace sfg::model;

class ExtractTest : public ::testing::Test {
protected:
    std::vector<extract::ExtractionWarning> warnings_;

    auto extract(const std::string& code) -> SourceModel {
        auto source = lexer::Source::from_string(code, "lib/test.dart");
        auto parsed = parser::parse_source(source);
        if (is_err(parsed)) {
            ADD_FAILURE() << "Parse error: " << unwrap_err(parsed).front().message;
            return {};
        }
        extract::Extractor extractor("lib/test.dart");
        auto result = extractor.extract(unwrap(parsed));
        warnings_ = std::move(result.warnings);
        return std::move(result.model);
    }

    auto has_warning(std::string_view needle) const -> bool {
        for (const auto& w : warnings_) {
            if (w.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    static auto param(const std::vector<Parameter>& params, std::string_view name)
        -> const Parameter* {
        for (const auto& p : params) {
            if (p.name == name) {
                return &p;
            }
        }
        return nullptr;
    }
};

// ============================================================================
// Value Types
// ============================================================================

TEST_F(ExtractTest, FreezedValueType) {
    auto model = extract(test::USER_SOURCE);
    EXPECT_EQ(model.path, "lib/test.dart");
    ASSERT_EQ(model.part_directives.size(), 2u);
    EXPECT_TRUE(model.has_part("user.g.dart"));

    ASSERT_EQ(model.declarations.size(), 1u);
    const auto& decl = model.declarations[0];
    EXPECT_EQ(decl.kind, DeclarationKind::ValueType);
    EXPECT_EQ(decl.name, "User");
    ASSERT_NE(decl.marker("freezed"), nullptr);
    EXPECT_TRUE(decl.has_from_json);
    EXPECT_FALSE(decl.is_union());
    EXPECT_EQ(decl.redirect_name, "_User");
    EXPECT_EQ(decl.line, 6u);

    ASSERT_EQ(decl.constructor_params.size(), 4u);
    const auto* name = param(decl.constructor_params, "name");
    ASSERT_NE(name, nullptr);
    EXPECT_TRUE(name->required);
    EXPECT_TRUE(name->is_named());
    EXPECT_EQ(name->type.to_dart(), "String");

    const auto* email = param(decl.constructor_params, "email");
    ASSERT_NE(email, nullptr);
    EXPECT_FALSE(email->required);
    EXPECT_TRUE(email->type.accepts_null());

    const auto* tags = param(decl.constructor_params, "tags");
    ASSERT_NE(tags, nullptr);
    EXPECT_EQ(tags->default_value, "[]");
    EXPECT_EQ(tags->type.collection, CollectionKind::List);
}

TEST_F(ExtractTest, UnionCases) {
    auto model = extract(R"(
@Freezed(unionKey: 'kind')
sealed class Result with _$Result {
  const factory Result.success(int value) = Success;
  const factory Result.failure({required String message}) = Failure;
  const Result._();
}
)");
    ASSERT_EQ(model.declarations.size(), 1u);
    const auto& decl = model.declarations[0];
    EXPECT_TRUE(decl.is_union());
    EXPECT_TRUE(decl.is_abstract);
    EXPECT_TRUE(decl.has_private_constructor);
    EXPECT_EQ(decl.union_key, "kind");
    ASSERT_EQ(decl.union_cases.size(), 2u);
    EXPECT_EQ(decl.union_cases[0].name, "success");
    EXPECT_EQ(decl.union_cases[0].redirect, "Success");
    ASSERT_EQ(decl.union_cases[0].params.size(), 1u);
    EXPECT_EQ(decl.union_cases[0].params[0].kind, ParameterKind::Positional);
    EXPECT_TRUE(decl.union_cases[0].params[0].required);
    EXPECT_EQ(decl.union_cases[1].params[0].name, "message");
}

TEST_F(ExtractTest, ThisParamsTakeFieldTypesAndKeys) {
    auto model = extract(test::PRODUCT_SOURCE);
    ASSERT_EQ(model.enums.size(), 1u);
    EXPECT_EQ(model.enums[0].name, "Category");
    EXPECT_EQ(model.enums[0].values, (std::vector<std::string>{"food", "toys"}));

    ASSERT_EQ(model.declarations.size(), 1u);
    const auto& params = model.declarations[0].constructor_params;
    ASSERT_EQ(params.size(), 5u);

    const auto* name = param(params, "name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->type.to_dart(), "String");
    EXPECT_EQ(name->json_key, "display_name");

    const auto* id = param(params, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->json_key, "id");

    const auto* created = param(params, "createdAt");
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->type.to_dart(), "DateTime?");
    EXPECT_FALSE(created->required);
}

TEST_F(ExtractTest, JsonKeyOptions) {
    auto model = extract(R"(
@JsonSerializable()
class Settings {
  Settings({
    @JsonKey(ignore: true) this.cache,
    @JsonKey(includeIfNull: false) this.theme,
    @JsonKey(defaultValue: 10) required this.limit,
    @JsonKey(includeFromJson: false, includeToJson: false) this.secret,
  });
  final Object? cache;
  final String? theme;
  final int limit;
  final String? secret;
}
)");
    ASSERT_EQ(model.declarations.size(), 1u);
    const auto& params = model.declarations[0].constructor_params;
    EXPECT_TRUE(param(params, "cache")->json_ignored);
    EXPECT_EQ(param(params, "theme")->include_if_null, false);
    EXPECT_EQ(param(params, "limit")->decode_default(), "10");
    EXPECT_TRUE(param(params, "secret")->json_ignored);
}

TEST_F(ExtractTest, FieldsWithoutConstructor) {
    auto model = extract(R"(
@JsonSerializable()
class Point {
  final double x;
  final double? y;
  final int version = 1;
  static const origin = 0;
  String label = '';
}
)");
    ASSERT_EQ(model.declarations.size(), 1u);
    const auto& params = model.declarations[0].constructor_params;
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0].name, "x");
    EXPECT_TRUE(params[0].required);
    EXPECT_EQ(params[1].name, "y");
    EXPECT_FALSE(params[1].required);
}

TEST_F(ExtractTest, UnannotatedClassesAreIgnored) {
    auto model = extract("class Plain { final int x; Plain(this.x); }\nint helper() => 1;");
    EXPECT_TRUE(model.declarations.empty());
}

// ============================================================================
// Functions and Units
// ============================================================================

TEST_F(ExtractTest, ProviderFunctionsAndUnits) {
    auto model = extract(test::PROVIDER_SOURCE);
    ASSERT_EQ(model.declarations.size(), 3u);

    const auto& greeting = model.declarations[0];
    EXPECT_EQ(greeting.kind, DeclarationKind::PlainFunction);
    ASSERT_TRUE(greeting.return_type.has_value());
    EXPECT_EQ(greeting.return_type->to_dart(), "String");
    ASSERT_EQ(greeting.params.size(), 1u);

    const auto& age = model.declarations[1];
    EXPECT_EQ(age.async_marker, "async");
    ASSERT_EQ(age.params.size(), 2u);
    EXPECT_EQ(age.params[1].type.to_dart(), "String");

    const auto& counter = model.declarations[2];
    EXPECT_EQ(counter.kind, DeclarationKind::StatefulUnit);
    EXPECT_EQ(counter.name, "Counter");
    ASSERT_TRUE(counter.return_type.has_value());
    EXPECT_EQ(counter.return_type->to_dart(), "int");
    EXPECT_TRUE(counter.params.empty());
}

TEST_F(ExtractTest, MissingReturnTypeIsInferred) {
    auto model = extract("@riverpod\nvalue(ValueRef ref) => 1;");
    ASSERT_EQ(model.declarations.size(), 1u);
    EXPECT_EQ(model.declarations[0].return_type->shape, TypeShape::Inferred);
    EXPECT_TRUE(has_warning("missing return type"));
}

// ============================================================================
// Warnings
// ============================================================================

TEST_F(ExtractTest, DuplicateParameterKeepsFirst) {
    auto model = extract(R"(
@freezed
class Dup with _$Dup {
  const factory Dup({required int a, String? a}) = _Dup;
}
)");
    ASSERT_EQ(model.declarations.size(), 1u);
    const auto& params = model.declarations[0].constructor_params;
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params[0].type.to_dart(), "int");
    EXPECT_TRUE(has_warning("duplicate parameter 'a'"));
}

TEST_F(ExtractTest, UntypedParameterIsDynamic) {
    auto model = extract(R"(
@riverpod
String echo(EchoRef ref, value) => '$value';
)");
    ASSERT_EQ(model.declarations.size(), 1u);
    const auto& params = model.declarations[0].params;
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[1].type.shape, TypeShape::Inferred);
    EXPECT_EQ(params[1].type.to_dart(), "dynamic");
    EXPECT_TRUE(has_warning("has no type"));
}

TEST_F(ExtractTest, UnresolvedThisParamWarns) {
    auto model = extract("@JsonSerializable()\nclass A { A(this.missing); }");
    ASSERT_EQ(model.declarations.size(), 1u);
    EXPECT_TRUE(has_warning("cannot resolve the type of 'this.missing'"));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(ExtractHelpersTest, Unquote) {
    EXPECT_EQ(extract::unquote("'a'"), "a");
    EXPECT_EQ(extract::unquote("\"b\""), "b");
    EXPECT_EQ(extract::unquote("r'c'"), "c");
    EXPECT_EQ(extract::unquote("value"), "value");
}

TEST(TypeDescriptorTest, Spelling) {
    auto map = TypeDescriptor::named(
        "Map", {TypeDescriptor::named("String"),
                TypeDescriptor::named("List", {TypeDescriptor::named("int")}, true)},
        true);
    EXPECT_EQ(map.to_dart(), "Map<String, List<int>?>?");
    EXPECT_EQ(map.collection, CollectionKind::Map);
    EXPECT_EQ(map.non_nullable().to_dart(), "Map<String, List<int>?>");
    EXPECT_EQ(TypeDescriptor::named("int").as_nullable().to_dart(), "int?");
    EXPECT_EQ(TypeDescriptor::inferred().as_nullable().to_dart(), "dynamic");
    EXPECT_TRUE(TypeDescriptor::named("dynamic").accepts_null());
    EXPECT_FALSE(TypeDescriptor::named("Object").accepts_null());
}
