//! Helpers shared by the freezed emitter translation units.

#ifndef SFG_EMIT_FREEZED_INTERNAL_HPP
#define SFG_EMIT_FREEZED_INTERNAL_HPP

#include "emit/dart_writer.hpp"
#include "emit/freezed_generator.hpp"
#include "model/declaration.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfg::emit::detail {

inline constexpr std::string_view PRIVATE_ERROR = "_privateConstructorUsedError";
inline constexpr std::string_view CAST_IGNORE = "// ignore: cast_nullable_to_non_nullable";

using ParamList = std::vector<const model::Parameter*>;

[[nodiscard]] auto params_of(const model::UnionCase& c) -> ParamList;

/// Collection fields get a private backing field and an unmodifiable view.
[[nodiscard]] auto is_wrapped(const model::Parameter& p) -> bool;

/// `_tags` for wrapped collections, the plain name otherwise.
[[nodiscard]] auto storage_name(const model::Parameter& p) -> std::string;

[[nodiscard]] auto view_class(model::CollectionKind kind) -> std::string_view;

/// Default value as written in generated constructors (`[]` becomes `const []`).
[[nodiscard]] auto default_literal(std::string_view value) -> std::string;

/// `@JsonKey(...)` line copied onto generated fields and getters, if any.
[[nodiscard]] auto key_annotation(const model::Parameter& p) -> std::optional<std::string>;

/// `_$UserImpl` to `UserImpl`, the stem of the `_$$UserImpl*` helper names.
[[nodiscard]] auto impl_stem(std::string_view impl) -> std::string;

/// Renders a parameter list with `[...]` and `{...}` sections attached to
/// the first and last item of each section.
[[nodiscard]] auto group_params(const ParamList& params,
                                const std::function<std::string(const model::Parameter&)>& render)
    -> std::vector<std::string>;

/// Lays out `head items tail` in the formatter's style: one line, then
/// items on a continuation line, then one item per line. Lines after the
/// first carry their own extra indentation.
[[nodiscard]] auto layout_call(std::string_view head, const std::vector<std::string>& items,
                               std::string_view tail, size_t base_indent)
    -> std::vector<std::string>;

[[nodiscard]] auto dispatch_name(UnionDispatch d) -> std::string_view;
[[nodiscard]] auto is_or_null(UnionDispatch d) -> bool;
[[nodiscard]] auto is_maybe(UnionDispatch d) -> bool;
[[nodiscard]] auto is_map(UnionDispatch d) -> bool;

void emit_lines(DartWriter& out, const std::vector<std::string>& lines);

} // namespace sfg::emit::detail

#endif // SFG_EMIT_FREEZED_INTERNAL_HPP
