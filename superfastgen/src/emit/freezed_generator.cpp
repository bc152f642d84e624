//! # Immutable Value Emitter
//!
//! File header, shared per-class blocks (JSON dispatcher, mixin, copyWith
//! interface) and the layout helpers. Per-case blocks live in
//! `freezed_impl.cpp`.

#include "emit/freezed_generator.hpp"

#include "emit/naming.hpp"
#include "freezed_internal.hpp"
#include "log/log.hpp"

namespace sfg::emit {

// ============================================================================
// Helpers
// ============================================================================

namespace detail {

auto params_of(const model::UnionCase& c) -> ParamList {
    ParamList out;
    out.reserve(c.params.size());
    for (const auto& p : c.params) {
        out.push_back(&p);
    }
    return out;
}

auto is_wrapped(const model::Parameter& p) -> bool {
    return p.type.shape == model::TypeShape::Named && p.type.is_collection();
}

auto storage_name(const model::Parameter& p) -> std::string {
    return is_wrapped(p) ? "_" + p.name : p.name;
}

auto view_class(model::CollectionKind kind) -> std::string_view {
    switch (kind) {
    case model::CollectionKind::List:
        return "EqualUnmodifiableListView";
    case model::CollectionKind::Map:
        return "EqualUnmodifiableMapView";
    case model::CollectionKind::Set:
        return "EqualUnmodifiableSetView";
    case model::CollectionKind::None:
        break;
    }
    return "";
}

auto default_literal(std::string_view value) -> std::string {
    if (!value.empty() && (value[0] == '[' || value[0] == '{' || value[0] == '<')) {
        return "const " + std::string(value);
    }
    return std::string(value);
}

auto key_annotation(const model::Parameter& p) -> std::optional<std::string> {
    if (p.json_ignored) {
        return "@JsonKey(ignore: true)";
    }
    if (p.json_key != p.name) {
        return "@JsonKey(name: '" + p.json_key + "')";
    }
    if (p.default_value) {
        return "@JsonKey()";
    }
    return std::nullopt;
}

auto impl_stem(std::string_view impl) -> std::string {
    if (impl.substr(0, 2) == "_$") {
        impl.remove_prefix(2);
    }
    return std::string(impl);
}

auto group_params(const ParamList& params,
                  const std::function<std::string(const model::Parameter&)>& render)
    -> std::vector<std::string> {
    std::vector<std::string> positional;
    std::vector<std::string> optional;
    std::vector<std::string> named;
    for (const auto* p : params) {
        switch (p->kind) {
        case model::ParameterKind::Positional:
            positional.push_back(render(*p));
            break;
        case model::ParameterKind::OptionalPositional:
            optional.push_back(render(*p));
            break;
        case model::ParameterKind::Named:
            named.push_back(render(*p));
            break;
        }
    }

    auto bracket = [](std::vector<std::string>& section, char open, char close) {
        if (section.empty()) {
            return;
        }
        section.front().insert(section.front().begin(), open);
        section.back().push_back(close);
    };
    bracket(optional, '[', ']');
    bracket(named, '{', '}');

    std::vector<std::string> items = std::move(positional);
    items.insert(items.end(), optional.begin(), optional.end());
    items.insert(items.end(), named.begin(), named.end());
    return items;
}

auto layout_call(std::string_view head, const std::vector<std::string>& items,
                 std::string_view tail, size_t base_indent) -> std::vector<std::string> {
    std::string joined = join(items, ", ");
    std::string one = std::string(head) + joined + std::string(tail);
    if (items.empty() || base_indent + one.size() <= LINE_WIDTH) {
        return {one};
    }

    std::string continuation = "    " + joined + std::string(tail);
    if (base_indent + continuation.size() <= LINE_WIDTH) {
        return {std::string(head), continuation};
    }

    std::vector<std::string> lines{std::string(head)};
    for (size_t i = 0; i < items.size(); ++i) {
        bool last = i + 1 == items.size();
        lines.push_back("    " + items[i] + (last ? std::string(tail) : ","));
    }
    return lines;
}

void emit_lines(DartWriter& out, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        out.emit_line(line);
    }
}

} // namespace detail

using namespace detail;

// ============================================================================
// File Header
// ============================================================================

auto freezed_file_header(std::string_view part_of) -> std::string {
    DartWriter out;
    out.emit_line("// coverage:ignore-file");
    out.emit_line("// GENERATED CODE - DO NOT MODIFY BY HAND");
    out.emit_line("// ignore_for_file: type=lint");
    out.emit_line(
        "// ignore_for_file: unused_element, deprecated_member_use, "
        "deprecated_member_use_from_same_package, use_function_type_syntax_for_parameters, "
        "unnecessary_const, avoid_init_to_null, invalid_override_different_default_values_named, "
        "prefer_expression_function_bodies, annotate_overrides, invalid_annotation_target, "
        "unnecessary_question_mark");
    out.emit_blank();
    out.emit_line("part of '" + std::string(part_of) + "';");
    out.emit_blank();
    out.emit_line("// **************************************************************************");
    out.emit_line("// FreezedGenerator");
    out.emit_line("// **************************************************************************");
    out.emit_blank();
    out.emit_line("T _$identity<T>(T value) => value;");
    out.emit_blank();
    out.emit_line("final _privateConstructorUsedError = UnsupportedError(");
    out.emit_line(
        "    'It seems like you constructed your class using `MyClass._()`. This constructor is "
        "only meant to be used by freezed and you are not supposed to need it nor use it.\\nPlease "
        "check the documentation here for more information: "
        "https://github.com/rrousselGit/freezed#adding-getters-and-methods-to-our-models');");
    out.emit_blank();
    return out.take();
}

// ============================================================================
// Generator
// ============================================================================

auto FreezedGenerator::generate(const std::vector<FreezedTarget>& targets,
                                std::string_view part_of) -> EmitOutput {
    EmitOutput result;
    result.text = freezed_file_header(part_of);
    for (const auto& target : targets) {
        auto part = generate_class(target);
        result.text += part.text;
        for (auto& u : part.unsupported) {
            result.unsupported.push_back(std::move(u));
        }
    }
    while (result.text.size() >= 2 && result.text.ends_with("\n\n")) {
        result.text.pop_back();
    }
    return result;
}

auto FreezedGenerator::generate_class(const FreezedTarget& target) -> EmitOutput {
    out_ = DartWriter{};
    unsupported_.clear();
    prepare(target);
    check_types();

    SFG_LOG_DEBUG("emit", "freezed: " << decl_->name << " (" << cases_.size() << " case"
                                      << (cases_.size() == 1 ? "" : "s")
                                      << (with_json_ ? ", json" : "") << ")");

    if (with_json_) {
        gen_from_json_dispatcher();
    }
    gen_mixin();
    gen_copy_with_interface();
    for (const auto& c : cases_) {
        gen_case_copy_with(c);
        gen_impl(c);
        gen_redirect_class(c);
    }

    return EmitOutput{.text = out_.take(), .unsupported = std::move(unsupported_)};
}

void FreezedGenerator::prepare(const FreezedTarget& target) {
    decl_ = target.declaration;
    with_json_ = target.with_json;
    cases_.clear();
    common_.clear();

    for (const auto& uc : decl_->union_cases) {
        std::string redirect = uc.redirect.substr(0, uc.redirect.find('.'));
        cases_.push_back(CaseView{.source = &uc,
                                  .redirect = redirect,
                                  .impl = impl_class_name(redirect),
                                  .display = decl_->is_union() ? decl_->name + "." + uc.name
                                                               : decl_->name});
    }

    if (cases_.empty()) {
        return;
    }
    // A field is shared when every case declares it with the same type.
    for (const auto& p : cases_.front().source->params) {
        bool shared = true;
        for (size_t i = 1; i < cases_.size() && shared; ++i) {
            bool found = false;
            for (const auto& q : cases_[i].source->params) {
                if (q.name == p.name && q.type.to_dart() == p.type.to_dart()) {
                    found = true;
                    break;
                }
            }
            shared = found;
        }
        if (shared) {
            common_.push_back(&p);
        }
    }
}

void FreezedGenerator::check_types() {
    for (const auto& c : cases_) {
        for (const auto& p : c.source->params) {
            if (is_equatable(p)) {
                continue;
            }
            unsupported_.push_back(UnsupportedTypeError{
                .declaration = decl_->name,
                .member = p.name,
                .type = p.type.to_dart(),
                .message = "type of '" + p.name + "' in " + c.display +
                           " is not written; it is left out of == and hashCode",
                .line = decl_->line,
                .column = decl_->column});
        }
    }
}

auto FreezedGenerator::is_common(const model::Parameter& p) const -> bool {
    for (const auto* c : common_) {
        if (c->name == p.name) {
            return true;
        }
    }
    return false;
}

auto FreezedGenerator::is_equatable(const model::Parameter& p) const -> bool {
    return p.type.shape != model::TypeShape::Inferred;
}

// ============================================================================
// Shared Blocks
// ============================================================================

void FreezedGenerator::gen_from_json_dispatcher() {
    const auto& name = decl_->name;
    out_.emit_line(name + " _$" + name + "FromJson(Map<String, dynamic> json) {");
    {
        IndentScope body(out_);
        if (!decl_->is_union()) {
            out_.emit_line("return " + cases_.front().redirect + ".fromJson(json);");
        } else {
            const auto& key = decl_->union_key;
            out_.emit_line("switch (json['" + key + "']) {");
            {
                IndentScope sw(out_);
                for (const auto& c : cases_) {
                    out_.emit_line("case '" + c.source->name + "':");
                    out_.emit_line("return " + c.redirect + ".fromJson(json);", 2);
                }
                out_.emit_blank();
                out_.emit_line("default:");
                out_.emit_line("throw CheckedFromJsonException(json, '" + key + "', '" + name + "',",
                               2);
                out_.emit_line("'Invalid union type \"${json['" + key + "']}\"!');", 6);
            }
            out_.emit_line("}");
        }
    }
    out_.emit_line("}");
    out_.emit_blank();
}

void FreezedGenerator::gen_mixin() {
    const auto& name = decl_->name;
    out_.emit_line("/// @nodoc");
    out_.emit_line("mixin _$" + name + " {");
    {
        IndentScope body(out_);
        for (const auto* p : common_) {
            if (auto ann = key_annotation(*p)) {
                out_.emit_line(*ann);
            }
            std::string getter = p->type.to_dart() + " get " + p->name + " =>";
            std::string throw_expr = "throw " + std::string(PRIVATE_ERROR) + ";";
            if (out_.fits(getter + " " + throw_expr)) {
                out_.emit_line(getter + " " + throw_expr);
            } else {
                out_.emit_line(getter);
                out_.emit_line(throw_expr, 4);
            }
        }
        if (!common_.empty()) {
            out_.emit_blank();
        }
        if (decl_->is_union()) {
            for (auto d : ALL_DISPATCH) {
                gen_dispatch_signature(d);
                out_.emit_line("}) =>");
                out_.emit_line("throw " + std::string(PRIVATE_ERROR) + ";", 4);
            }
        }
        if (with_json_) {
            out_.emit_line("Map<String, dynamic> toJson() => throw " + std::string(PRIVATE_ERROR) +
                           ";");
        }
        if (!common_.empty()) {
            out_.emit_line("@JsonKey(ignore: true)");
            std::string line = "$" + name + "CopyWith<" + name + "> get copyWith =>";
            std::string throw_expr = "throw " + std::string(PRIVATE_ERROR) + ";";
            if (out_.fits(line + " " + throw_expr)) {
                out_.emit_line(line + " " + throw_expr);
            } else {
                out_.emit_line(line);
                out_.emit_line(throw_expr, 4);
            }
        }
    }
    out_.emit_line("}");
    out_.emit_blank();
}

namespace detail {

auto dispatch_name(UnionDispatch d) -> std::string_view {
    switch (d) {
    case UnionDispatch::When:
        return "when";
    case UnionDispatch::WhenOrNull:
        return "whenOrNull";
    case UnionDispatch::MaybeWhen:
        return "maybeWhen";
    case UnionDispatch::Map:
        return "map";
    case UnionDispatch::MapOrNull:
        return "mapOrNull";
    case UnionDispatch::MaybeMap:
        return "maybeMap";
    }
    return "";
}

auto is_or_null(UnionDispatch d) -> bool {
    return d == UnionDispatch::WhenOrNull || d == UnionDispatch::MapOrNull;
}

auto is_maybe(UnionDispatch d) -> bool {
    return d == UnionDispatch::MaybeWhen || d == UnionDispatch::MaybeMap;
}

auto is_map(UnionDispatch d) -> bool {
    return d == UnionDispatch::Map || d == UnionDispatch::MapOrNull ||
           d == UnionDispatch::MaybeMap;
}

} // namespace detail

/// Emits the signature of one pattern-matching method up to the closing `})`.
void FreezedGenerator::gen_dispatch_signature(UnionDispatch d) {
    std::string result = is_or_null(d) ? "TResult?" : "TResult";
    out_.emit_line("@optionalTypeArgs");
    out_.emit_line(result + " " + std::string(dispatch_name(d)) + "<TResult extends Object?>({");
    IndentScope params(out_);
    for (const auto& c : cases_) {
        std::string args;
        if (is_map(d)) {
            args = c.redirect + " value";
        } else {
            std::vector<std::string> parts;
            for (const auto& p : c.source->params) {
                parts.push_back(p.type.to_dart() + " " + p.name);
            }
            args = join(parts, ", ");
        }
        std::string fn = result + " Function(" + args + ")";
        if (d == UnionDispatch::When || d == UnionDispatch::Map) {
            out_.emit_line("required " + fn + " " + c.source->name + ",");
        } else {
            out_.emit_line(fn + "? " + c.source->name + ",");
        }
    }
    if (is_maybe(d)) {
        out_.emit_line("required TResult orElse(),");
    }
}

void FreezedGenerator::gen_copy_with_interface() {
    const auto& name = decl_->name;
    std::string iface = "$" + name + "CopyWith";
    std::string impl = "_$" + name + "CopyWithImpl";

    out_.emit_line("/// @nodoc");
    out_.emit_line("abstract class " + iface + "<$Res> {");
    {
        IndentScope body(out_);
        std::string factory = "factory " + iface + "(" + name + " value, $Res Function(" + name +
                              ") then) =";
        std::string target = impl + "<$Res, " + name + ">;";
        if (out_.fits(factory + " " + target)) {
            out_.emit_line(factory + " " + target);
        } else {
            out_.emit_line(factory);
            out_.emit_line(target, 4);
        }
        if (!common_.empty()) {
            out_.emit_line("@useResult");
            // copyWith always takes named arguments.
            ParamList named;
            std::vector<model::Parameter> copies;
            copies.reserve(common_.size());
            for (const auto* p : common_) {
                copies.push_back(*p);
                copies.back().kind = model::ParameterKind::Named;
            }
            for (const auto& p : copies) {
                named.push_back(&p);
            }
            auto items = group_params(named, [](const model::Parameter& p) {
                return p.type.to_dart() + " " + p.name;
            });
            emit_lines(out_, layout_call("$Res call(", items, ");", out_.indent_width()));
        }
    }
    out_.emit_line("}");
    out_.emit_blank();

    out_.emit_line("/// @nodoc");
    std::string header = "class " + impl + "<$Res, $Val extends " + name + ">";
    std::string implements = "implements " + iface + "<$Res> {";
    if (out_.fits(header + " " + implements)) {
        out_.emit_line(header + " " + implements);
    } else {
        out_.emit_line(header);
        out_.emit_line(implements, 4);
    }
    {
        IndentScope body(out_);
        out_.emit_line(impl + "(this._value, this._then);");
        out_.emit_blank();
        out_.emit_line("// ignore: unused_field");
        out_.emit_line("final $Val _value;");
        out_.emit_line("// ignore: unused_field");
        out_.emit_line("final $Res Function($Val) _then;");
        if (!common_.empty()) {
            out_.emit_blank();
            gen_copy_with_call(common_, "_value.copyWith", false);
        }
    }
    out_.emit_line("}");
    out_.emit_blank();
}

void FreezedGenerator::gen_copy_with_call(const std::vector<const model::Parameter*>& params,
                                          const std::string& target, bool case_level) {
    out_.emit_line("@pragma('vm:prefer-inline')");
    out_.emit_line("@override");
    out_.emit_line("$Res call({");
    for (const auto* p : params) {
        const char* sentinel = p->type.accepts_null() ? "freezed" : "null";
        out_.emit_line("Object? " + p->name + " = " + sentinel + ",", 2);
    }
    out_.emit_line("}) {");
    {
        IndentScope body(out_);
        out_.emit_line("return _then(" + target + "(");
        for (const auto* p : params) {
            const char* sentinel = p->type.accepts_null() ? "freezed" : "null";
            bool named = !case_level || p->is_named();
            std::string prefix = named ? p->name + ": " : "";
            std::string current = "_value." + (case_level ? storage_name(*p) : p->name);
            out_.emit_line(prefix + sentinel + " == " + p->name, 2);
            out_.emit_line("? " + current, 6);
            out_.emit_line(": " + p->name + " " + std::string(CAST_IGNORE), 6);
            out_.emit_line("as " + p->type.to_dart() + ",", 10);
        }
        out_.emit_line(case_level ? "));" : ") as $Val);");
    }
    out_.emit_line("}");
}

} // namespace sfg::emit
