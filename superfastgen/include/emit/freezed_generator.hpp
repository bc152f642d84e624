//! # Immutable Value Emitter
//!
//! Produces the body of `<stem>.freezed.dart` for every class classified
//! as `Immutable`, matching freezed 2.x output.
//!
//! ## Emission Order (per class)
//!
//! | Block | Present when |
//! |-------|--------------|
//! | `_$XFromJson` dispatcher | JSON enabled |
//! | `mixin _$X` | always |
//! | `$XCopyWith` / `_$XCopyWithImpl` | always |
//! | `_$$<Impl>CopyWith` / `__$$<Impl>CopyWithImpl` | per case |
//! | `_$<Case>Impl` | per case |
//! | abstract redirect class | per case |
//!
//! ## Collections
//!
//! `List`, `Map` and `Set` fields are stored in a private field and exposed
//! through `EqualUnmodifiable*View`. Equality and hashing use
//! `const DeepCollectionEquality()`.
//!
//! ## Unsupported Types
//!
//! A parameter written without a type has no known equality strategy. It
//! is kept in the constructor, getters and `copyWith`, left out of
//! `operator ==` and `hashCode`, and reported as an `UnsupportedTypeError`.

#ifndef SFG_EMIT_FREEZED_GENERATOR_HPP
#define SFG_EMIT_FREEZED_GENERATOR_HPP

#include "emit/dart_writer.hpp"
#include "emit/errors.hpp"
#include "model/declaration.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sfg::emit {

/// The six pattern-matching members generated for unions.
enum class UnionDispatch { When, WhenOrNull, MaybeWhen, Map, MapOrNull, MaybeMap };

inline constexpr UnionDispatch ALL_DISPATCH[] = {
    UnionDispatch::When, UnionDispatch::WhenOrNull, UnionDispatch::MaybeWhen,
    UnionDispatch::Map,  UnionDispatch::MapOrNull,  UnionDispatch::MaybeMap};

struct FreezedTarget {
    const model::Declaration* declaration = nullptr;
    bool with_json = false;
};

/// The `.freezed.dart` file preamble up to and including the
/// `_privateConstructorUsedError` declaration.
[[nodiscard]] auto freezed_file_header(std::string_view part_of) -> std::string;

class FreezedGenerator {
public:
    /// Emits the full file: header then one block per target, in order.
    [[nodiscard]] auto generate(const std::vector<FreezedTarget>& targets,
                                std::string_view part_of) -> EmitOutput;

    /// Emits the blocks for one class without the file header.
    [[nodiscard]] auto generate_class(const FreezedTarget& target) -> EmitOutput;

private:
    struct CaseView {
        const model::UnionCase* source = nullptr;
        std::string redirect; ///< Abstract redirect class (`_User`, `Success`)
        std::string impl;     ///< Implementation class (`_$UserImpl`)
        std::string display;  ///< `toString` prefix (`User`, `Result.success`)
    };

    DartWriter out_;
    std::vector<UnsupportedTypeError> unsupported_;

    const model::Declaration* decl_ = nullptr;
    bool with_json_ = false;
    std::vector<CaseView> cases_;
    std::vector<const model::Parameter*> common_;

    void prepare(const FreezedTarget& target);
    void check_types();

    // Shared blocks
    void gen_from_json_dispatcher();
    void gen_mixin();
    void gen_dispatch_signature(UnionDispatch d);
    void gen_copy_with_interface();

    // Per case
    void gen_case_copy_with(const CaseView& c);
    void gen_copy_with_call(const std::vector<const model::Parameter*>& params,
                            const std::string& target, bool case_level);
    void gen_impl(const CaseView& c);
    void gen_impl_constructor(const CaseView& c);
    void gen_impl_fields(const CaseView& c);
    void gen_equality(const CaseView& c);
    void gen_hash_code(const CaseView& c);
    void gen_union_overrides(const CaseView& c);
    void gen_redirect_class(const CaseView& c);

    [[nodiscard]] auto is_common(const model::Parameter& p) const -> bool;
    [[nodiscard]] auto is_equatable(const model::Parameter& p) const -> bool;
    [[nodiscard]] auto json_union() const -> bool {
        return with_json_ && decl_->is_union();
    }
};

} // namespace sfg::emit

#endif // SFG_EMIT_FREEZED_GENERATOR_HPP
