//! # Generated Names
//!
//! Naming conventions shared by the emitters. All of them are fixed by the
//! generator packages the output has to match.
//!
//! | Input | Helper | Output |
//! |-------|--------|--------|
//! | `_User` | `impl_class_name` | `_$UserImpl` |
//! | `getUserName` | `provider_variable` | `getUserNameProvider` |
//! | `getUserName` | `pascal_case` | `GetUserName` |
//! | `lib/user.dart` | `file_stem` | `user` |

#ifndef SFG_EMIT_NAMING_HPP
#define SFG_EMIT_NAMING_HPP

#include "model/declaration.hpp"

#include <string>
#include <string_view>

namespace sfg::emit {

/// Freezed implementation class for a redirect target (`_User` and `User` both give `_$UserImpl`).
[[nodiscard]] auto impl_class_name(std::string_view redirect) -> std::string;

[[nodiscard]] auto pascal_case(std::string_view name) -> std::string;
[[nodiscard]] auto camel_case(std::string_view name) -> std::string;

/// `fooProvider` for function `foo` and class `Foo`.
[[nodiscard]] auto provider_variable(std::string_view name) -> std::string;

/// `FooProvider` for function `foo` and class `Foo`.
[[nodiscard]] auto provider_class(std::string_view name) -> std::string;

/// `FooFamily` for function `foo` and class `Foo`.
[[nodiscard]] auto family_class(std::string_view name) -> std::string;

/// `FooRef`
[[nodiscard]] auto ref_name(std::string_view name) -> std::string;

/// File name without directories and without the `.dart` extension.
[[nodiscard]] auto file_stem(std::string_view path) -> std::string;

/// `r'...'` literal, falling back to a double-quoted raw string when the
/// text contains a single quote, and to an escaped `'...'` literal when it
/// contains both quote kinds.
[[nodiscard]] auto raw_string(std::string_view text) -> std::string;

/// Parameter rendered as a declaration (`required String name`, `int? age`).
[[nodiscard]] auto param_declaration(const model::Parameter& param) -> std::string;

} // namespace sfg::emit

#endif // SFG_EMIT_NAMING_HPP
