//! # Reactive Provider Emitter
//!
//! Produces the `RiverpodGenerator` section of `<stem>.g.dart`, following
//! riverpod_generator 2.x naming.
//!
//! | Variant | Emitted |
//! |---------|---------|
//! | function | `xProvider` global + `XRef` typedef |
//! | function family | `XFamily`, argument-keyed `XProvider`, `XRef` mixin, element |
//! | unit | `_$X` controller base + `XProvider` class + `xProvider` global |
//! | unit family | `_$X` base with argument fields + `XFamily` + `XProvider` |
//!
//! Every provider starts with `_$<name>Hash()`, the SHA-1 of the
//! declaration source. Family providers compare arguments structurally
//! through `_SystemHash`, which is emitted once per file.
//!
//! ## Unit State Machine
//!
//! The controller base wraps `build` in `_$runBuild()`, which registers a
//! dispose callback. Assigning `state` after disposal throws `StateError`.

#ifndef SFG_EMIT_RIVERPOD_GENERATOR_HPP
#define SFG_EMIT_RIVERPOD_GENERATOR_HPP

#include "common.hpp"
#include "emit/dart_writer.hpp"
#include "emit/errors.hpp"
#include "model/declaration.hpp"
#include "model/variant.hpp"

#include <string>
#include <vector>

namespace sfg::emit {

struct RiverpodTarget {
    const model::Declaration* declaration = nullptr;
    model::ProviderVariant variant;
};

/// What a provider exposes: a plain value, a `Future` or a `Stream`.
enum class ProviderFlavor { Value, Future, Stream };

struct ProviderShape {
    ProviderFlavor flavor = ProviderFlavor::Value;
    model::TypeDescriptor value_type; ///< `T` in `Future<T>` / `Stream<T>` / `T`
};

/// Classifies a function or `build` return type.
[[nodiscard]] auto provider_shape(const model::Declaration& decl) -> ProviderShape;

class RiverpodGenerator {
public:
    [[nodiscard]] auto generate(const std::vector<RiverpodTarget>& targets)
        -> Result<EmitOutput, EmitError>;

private:
    DartWriter out_;
    bool system_hash_emitted_ = false;

    struct Names {
        std::string base;        ///< function or class name
        std::string variable;    ///< `fooProvider`
        std::string provider;    ///< `FooProvider`
        std::string family;      ///< `FooFamily`
        std::string ref;         ///< `FooRef`
        std::string hash_fn;     ///< `_$fooHash`
        std::string prefix;      ///< `AutoDispose` or empty for keepAlive
        ProviderShape shape;
    };

    [[nodiscard]] auto names_for(const RiverpodTarget& target) const -> Names;

    void gen_system_hash();
    void gen_hash_arg(const Names& n, size_t extra);
    void gen_family_class(const Names& n, const std::vector<model::Parameter>& params,
                          const std::string& value_type);
    void gen_provider_identity(const Names& n, const std::vector<model::Parameter>& params);
    void gen_ref_and_element(const Names& n, const std::vector<model::Parameter>& params,
                             const std::string& ref_base, const std::string& element_base);

    void gen_function(const RiverpodTarget& target, const Names& n);
    void gen_function_family(const RiverpodTarget& target, const Names& n);
    void gen_unit_base(const RiverpodTarget& target, const Names& n);
    void gen_unit(const RiverpodTarget& target, const Names& n);
    void gen_unit_family(const RiverpodTarget& target, const Names& n);
};

} // namespace sfg::emit

#endif // SFG_EMIT_RIVERPOD_GENERATOR_HPP
