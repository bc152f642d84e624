//! # Emitter Errors
//!
//! | Error | Scope |
//! |-------|-------|
//! | `UnsupportedTypeError` | one member left out of the emitted text |
//! | `EmitError` | the whole companion could not be produced |

#ifndef SFG_EMIT_ERRORS_HPP
#define SFG_EMIT_ERRORS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sfg::emit {

/// A field or parameter whose type has no known equality, hash or JSON
/// strategy. The member is omitted from the affected generated members.
struct UnsupportedTypeError {
    std::string declaration;
    std::string member;
    std::string type; ///< Dart spelling of the offending type
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;
};

struct EmitError {
    std::string declaration;
    std::string message;
};

/// Generated text for one section plus the members that were left out.
struct EmitOutput {
    std::string text;
    std::vector<UnsupportedTypeError> unsupported;
};

} // namespace sfg::emit

#endif // SFG_EMIT_ERRORS_HPP
