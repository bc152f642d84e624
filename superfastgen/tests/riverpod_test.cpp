#include "classify/classifier.hpp"
#include "crypto/digest.hpp"
#include "emit/riverpod_generator.hpp"
#include "parser/parser.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace sfg;
using namespace sfg::emit;

class RiverpodTest : public ::testing::Test {
protected:
    model::SourceModel model_;
    classify::ClassificationResult classes_;

    void load(const std::string& code) {
        auto source = lexer::Source::from_string(code, "lib/provider.dart");
        auto parsed = parser::parse_source(source);
        ASSERT_TRUE(is_ok(parsed));
        model_ = extract::Extractor("lib/provider.dart").extract(unwrap(parsed)).model;
        classes_ = classify::Classifier().classify_all(model_);
    }

    auto targets() const -> std::vector<RiverpodTarget> {
        std::vector<RiverpodTarget> out;
        for (const auto* c : classes_.with_tag(model::VariantTag::Provider)) {
            out.push_back(RiverpodTarget{.declaration = c->declaration,
                                         .variant = std::get<model::ProviderVariant>(c->variant)});
        }
        return out;
    }

    auto generate() -> std::string {
        RiverpodGenerator generator;
        auto result = generator.generate(targets());
        if (is_err(result)) {
            ADD_FAILURE() << "Emit error: " << unwrap_err(result).message;
            return {};
        }
        return unwrap(result).text;
    }

    static auto contains(const std::string& text, std::string_view needle) -> bool {
        return text.find(needle) != std::string::npos;
    }

    static auto count(const std::string& text, std::string_view needle) -> size_t {
        size_t n = 0;
        for (auto pos = text.find(needle); pos != std::string::npos;
             pos = text.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }
};

// ============================================================================
// Shapes
// ============================================================================

TEST_F(RiverpodTest, ProviderShapes) {
    model::Declaration decl;
    decl.return_type = model::TypeDescriptor::named("Future", {model::TypeDescriptor::named("int")});
    auto shape = provider_shape(decl);
    EXPECT_EQ(shape.flavor, ProviderFlavor::Future);
    EXPECT_EQ(shape.value_type.to_dart(), "int");

    decl.return_type =
        model::TypeDescriptor::named("Stream", {model::TypeDescriptor::named("String", {}, true)});
    shape = provider_shape(decl);
    EXPECT_EQ(shape.flavor, ProviderFlavor::Stream);
    EXPECT_EQ(shape.value_type.to_dart(), "String?");

    decl.return_type = model::TypeDescriptor::named("List", {model::TypeDescriptor::named("int")});
    shape = provider_shape(decl);
    EXPECT_EQ(shape.flavor, ProviderFlavor::Value);
    EXPECT_EQ(shape.value_type.to_dart(), "List<int>");

    decl.return_type.reset();
    EXPECT_EQ(provider_shape(decl).value_type.to_dart(), "dynamic");
}

// ============================================================================
// Function Providers
// ============================================================================

TEST_F(RiverpodTest, SimpleFunctionProvider) {
    load(test::PROVIDER_SOURCE);
    auto text = generate();

    auto digest = crypto::sha1_hex(model_.declarations[0].source_text);
    ASSERT_TRUE(is_ok(digest));
    EXPECT_TRUE(contains(text, "String _$greetingHash() => r'" + unwrap(digest) + "';"));

    EXPECT_TRUE(contains(text, "/// See also [greeting].\n@ProviderFor(greeting)\n"
                               "final greetingProvider = AutoDisposeProvider<String>.internal("));
    EXPECT_TRUE(contains(text, "  greeting,\n"));
    EXPECT_TRUE(contains(text, "  name: r'greetingProvider',"));
    EXPECT_TRUE(contains(text, "debugGetCreateSourceHash:"));
    EXPECT_TRUE(contains(text, "typedef GreetingRef = AutoDisposeProviderRef<String>;"));
}

TEST_F(RiverpodTest, KeepAliveDropsAutoDispose) {
    load(R"(
@Riverpod(keepAlive: true)
Future<String> settings(SettingsRef ref) async => '';
)");
    auto text = generate();
    EXPECT_TRUE(contains(text, "final settingsProvider = FutureProvider<String>.internal("));
    EXPECT_TRUE(contains(text, "typedef SettingsRef = FutureProviderRef<String>;"));
    EXPECT_FALSE(contains(text, "AutoDispose"));
}

TEST_F(RiverpodTest, FunctionWithoutRefGetsWrapper) {
    load("@riverpod\nint answer() => 42;");
    auto text = generate();
    EXPECT_TRUE(contains(text, "(ref) => answer(),"));
}

TEST_F(RiverpodTest, FamilyProvider) {
    load(test::PROVIDER_SOURCE);
    auto text = generate();

    EXPECT_TRUE(contains(text, "const userAgeProvider = UserAgeFamily();"));
    EXPECT_TRUE(contains(text, "class UserAgeFamily extends Family<AsyncValue<int>> {"));
    EXPECT_TRUE(contains(text, "class UserAgeProvider extends AutoDisposeFutureProvider<int> {"));
    EXPECT_TRUE(contains(text, "ref as UserAgeRef,"));
    EXPECT_TRUE(contains(text, "required this.userId,"));
    EXPECT_TRUE(contains(text, "final String userId;"));
    EXPECT_TRUE(contains(text, "FutureOr<int> Function(UserAgeRef provider) create,"));
    EXPECT_TRUE(contains(text, "mixin UserAgeRef on AutoDisposeFutureProviderRef<int> {"));
    EXPECT_TRUE(contains(text, "String get userId;"));
    EXPECT_TRUE(contains(text, "_SystemHash.combine(hash, userId.hashCode)"));
}

TEST_F(RiverpodTest, SystemHashEmittedOnce) {
    load(R"(
@riverpod
int first(FirstRef ref, int a) => a;

@riverpod
int second(SecondRef ref, String b) => 0;
)");
    auto text = generate();
    EXPECT_EQ(count(text, "class _SystemHash {"), 1u);
    EXPECT_TRUE(contains(text, "class FirstFamily extends Family<int> {"));
    EXPECT_TRUE(contains(text, "class SecondFamily extends Family<int> {"));
}

// ============================================================================
// Stateful Units
// ============================================================================

TEST_F(RiverpodTest, NotifierUnit) {
    load(test::PROVIDER_SOURCE);
    auto text = generate();

    EXPECT_TRUE(contains(text, "String _$counterHash() => r'"));
    EXPECT_TRUE(
        contains(text, "abstract class _$Counter extends BuildlessAutoDisposeNotifier<int> {"));
    EXPECT_TRUE(contains(text, "int build();"));
    EXPECT_TRUE(contains(text, "final counterProvider = CounterProvider._();"));
    EXPECT_TRUE(contains(text, "AutoDisposeNotifierProviderImpl<Counter, int>"));
    EXPECT_TRUE(contains(text, "int runNotifierBuild("));
    EXPECT_TRUE(contains(text, "covariant Counter notifier,"));
}

TEST_F(RiverpodTest, NotifierRejectsMutationAfterDisposal) {
    load(test::PROVIDER_SOURCE);
    auto text = generate();

    EXPECT_TRUE(contains(text, "  bool _$disposed = false;\n"));
    EXPECT_TRUE(contains(text, "  int _$runBuild() {\n"
                               "    _$disposed = false;\n"
                               "    ref.onDispose(() => _$disposed = true);\n"
                               "    return build();\n"
                               "  }\n"));
    EXPECT_TRUE(contains(text, "  @override\n  set state(int value) {\n    if (_$disposed) {\n"));
    EXPECT_TRUE(contains(text, "throw StateError('Counter was mutated after it was disposed');"));
    EXPECT_TRUE(contains(text, "    super.state = value;\n"));
}

TEST_F(RiverpodTest, AsyncNotifierFamily) {
    load(R"(
@riverpod
class Todos extends _$Todos {
  @override
  Future<List<String>> build(String owner) async => [];
}
)");
    auto text = generate();
    EXPECT_TRUE(contains(text, "BuildlessAutoDisposeAsyncNotifier<List<String>>"));
    EXPECT_TRUE(contains(text, "late final String owner;"));
    EXPECT_TRUE(contains(text, "class TodosFamily extends Family<AsyncValue<List<String>>> {"));
    EXPECT_TRUE(contains(text, "FutureOr<List<String>> runNotifierBuild("));
}

TEST_F(RiverpodTest, OutputOrderFollowsSource) {
    load(test::PROVIDER_SOURCE);
    auto text = generate();
    auto greeting = text.find("_$greetingHash");
    auto age = text.find("_$userAgeHash");
    auto counter = text.find("_$counterHash");
    ASSERT_NE(greeting, std::string::npos);
    ASSERT_NE(age, std::string::npos);
    ASSERT_NE(counter, std::string::npos);
    EXPECT_LT(greeting, age);
    EXPECT_LT(age, counter);
    EXPECT_FALSE(text.ends_with("\n\n"));
}
