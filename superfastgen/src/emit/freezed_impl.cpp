//! # Immutable Value Emitter: Per-Case Blocks
//!
//! The case-level copyWith pair, the `_$<Case>Impl` class and the abstract
//! redirect class.

#include "emit/freezed_generator.hpp"

#include "emit/naming.hpp"
#include "freezed_internal.hpp"

namespace sfg::emit {

using namespace detail;

void FreezedGenerator::gen_case_copy_with(const CaseView& c) {
    const auto& name = decl_->name;
    auto params = params_of(*c.source);
    std::string stem = impl_stem(c.impl);
    std::string iface = "_$$" + stem + "CopyWith";
    std::string impl = "__$$" + stem + "CopyWithImpl";

    out_.emit_line("/// @nodoc");
    std::string header = "abstract class " + iface + "<$Res>";
    if (params.empty()) {
        out_.emit_line(header + " {");
    } else {
        std::string implements = "implements $" + name + "CopyWith<$Res> {";
        if (out_.fits(header + " " + implements)) {
            out_.emit_line(header + " " + implements);
        } else {
            out_.emit_line(header);
            out_.emit_line(implements, 4);
        }
    }
    {
        IndentScope body(out_);
        std::string head = "factory " + iface + "(";
        std::string args = c.impl + " value, $Res Function(" + c.impl + ") then) =";
        std::string target = impl + "<$Res>;";
        if (out_.fits(head + args + " " + target)) {
            out_.emit_line(head + args + " " + target);
        } else if (out_.fits(head + args)) {
            out_.emit_line(head + args);
            out_.emit_line(target, 4);
        } else {
            out_.emit_line(head);
            out_.emit_line(args, 8);
            out_.emit_line(target, 4);
        }
        if (!params.empty()) {
            if (!common_.empty()) {
                out_.emit_line("@override");
            }
            out_.emit_line("@useResult");
            std::vector<model::Parameter> copies;
            copies.reserve(params.size());
            for (const auto* p : params) {
                copies.push_back(*p);
                copies.back().kind = model::ParameterKind::Named;
            }
            ParamList named;
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
    std::string cls = "class " + impl + "<$Res>";
    std::string extends = "extends _$" + name + "CopyWithImpl<$Res, " + c.impl + ">";
    std::string implements = "implements " + iface + "<$Res> {";
    if (out_.fits(cls + " " + extends + " " + implements)) {
        out_.emit_line(cls + " " + extends + " " + implements);
    } else {
        out_.emit_line(cls);
        out_.emit_line(extends, 4);
        out_.emit_line(implements, 4);
    }
    {
        IndentScope body(out_);
        std::string ctor = impl + "(" + c.impl + " _value, $Res Function(" + c.impl + ") _then)";
        if (out_.fits(ctor)) {
            out_.emit_line(ctor);
        } else {
            out_.emit_line(impl + "(");
            out_.emit_line(c.impl + " _value, $Res Function(" + c.impl + ") _then)", 4);
        }
        out_.emit_line(": super(_value, _then);", 4);
        if (!params.empty()) {
            out_.emit_blank();
            gen_copy_with_call(params, c.impl, true);
        }
    }
    out_.emit_line("}");
    out_.emit_blank();
}

// ============================================================================
// Implementation Class
// ============================================================================

void FreezedGenerator::gen_impl(const CaseView& c) {
    auto params = params_of(*c.source);

    out_.emit_line("/// @nodoc");
    if (with_json_) {
        std::string annotation = "@JsonSerializable()";
        if (const auto* m = decl_->marker("JsonSerializable")) {
            std::vector<std::string> args;
            for (const auto& a : m->args) {
                args.push_back(a.name.empty() ? a.value : a.name + ": " + a.value);
            }
            annotation = "@JsonSerializable(" + join(args, ", ") + ")";
        }
        out_.emit_line(annotation);
    }
    std::string relation = decl_->has_private_constructor ? " extends " : " implements ";
    out_.emit_line("class " + c.impl + relation + c.redirect + " {");
    {
        IndentScope body(out_);
        gen_impl_constructor(c);

        if (with_json_) {
            out_.emit_blank();
            std::string factory =
                "factory " + c.impl + ".fromJson(Map<String, dynamic> json) =>";
            std::string call = "_$$" + impl_stem(c.impl) + "FromJson(json);";
            if (out_.fits(factory + " " + call)) {
                out_.emit_line(factory + " " + call);
            } else {
                out_.emit_line(factory);
                out_.emit_line(call, 4);
            }
        }

        if (!params.empty() || json_union()) {
            out_.emit_blank();
            gen_impl_fields(c);
        }

        out_.emit_blank();
        out_.emit_line("@override");
        out_.emit_line("String toString() {");
        {
            std::vector<std::string> parts;
            for (const auto* p : params) {
                parts.push_back(p->name + ": $" + p->name);
            }
            out_.emit_line("return '" + c.display + "(" + join(parts, ", ") + ")';", 2);
        }
        out_.emit_line("}");

        out_.emit_blank();
        gen_equality(c);
        out_.emit_blank();
        gen_hash_code(c);

        if (!params.empty()) {
            std::string stem = impl_stem(c.impl);
            out_.emit_blank();
            out_.emit_line("@JsonKey(ignore: true)");
            out_.emit_line("@override");
            out_.emit_line("@pragma('vm:prefer-inline')");
            out_.emit_line("_$$" + stem + "CopyWith<" + c.impl + "> get copyWith =>");
            out_.emit_line("__$$" + stem + "CopyWithImpl<" + c.impl + ">(this, _$identity);", 4);
        }

        if (decl_->is_union()) {
            gen_union_overrides(c);
        }

        if (with_json_) {
            out_.emit_blank();
            out_.emit_line("@override");
            out_.emit_line("Map<String, dynamic> toJson() {");
            out_.emit_line("return _$$" + impl_stem(c.impl) + "ToJson(", 2);
            out_.emit_line("this,", 4);
            out_.emit_line(");", 2);
            out_.emit_line("}");
        }
    }
    out_.emit_line("}");
    out_.emit_blank();
}

void FreezedGenerator::gen_impl_constructor(const CaseView& c) {
    auto params = params_of(*c.source);
    std::vector<std::string> initializers;

    auto items = group_params(params, [&](const model::Parameter& p) {
        std::string out;
        bool required = p.is_named() && p.required && !p.default_value;
        if (required) {
            out += "required ";
        }
        if (is_wrapped(p)) {
            out += "final " + p.type.to_dart() + " " + p.name;
            initializers.push_back(storage_name(p) + " = " + p.name);
        } else {
            out += "this." + p.name;
        }
        if (p.default_value && p.kind != model::ParameterKind::Positional) {
            out += " = " + default_literal(*p.default_value);
        }
        return out;
    });

    if (json_union()) {
        bool has_optional_positional = false;
        for (const auto* p : params) {
            has_optional_positional |= p->kind == model::ParameterKind::OptionalPositional;
        }
        const std::string& case_name = c.source->name;
        if (has_optional_positional) {
            initializers.push_back("$type = '" + case_name + "'");
        } else {
            bool has_named = false;
            for (const auto* p : params) {
                has_named |= p->is_named();
            }
            if (has_named) {
                items.back().pop_back(); // reopen the `{...}` section
                items.push_back("final String? $type}");
            } else {
                items.push_back("{final String? $type}");
            }
            initializers.push_back("$type = $type ?? '" + case_name + "'");
        }
    }
    if (decl_->has_private_constructor) {
        initializers.push_back("super._()");
    }

    std::string head = std::string(c.source->is_const ? "const " : "") + c.impl + "(";
    if (initializers.empty()) {
        emit_lines(out_, layout_call(head, items, ");", out_.indent_width()));
        return;
    }

    std::string inits = join(initializers, ", ");
    auto one = layout_call(head, items, ") : " + inits + ";", out_.indent_width());
    if (one.size() == 1) {
        out_.emit_line(one.front());
        return;
    }
    emit_lines(out_, layout_call(head, items, ")", out_.indent_width()));
    for (size_t i = 0; i < initializers.size(); ++i) {
        bool last = i + 1 == initializers.size();
        std::string line = (i == 0 ? ": " : "  ") + initializers[i] + (last ? ";" : ",");
        out_.emit_line(line, 4);
    }
}

void FreezedGenerator::gen_impl_fields(const CaseView& c) {
    auto params = params_of(*c.source);
    for (size_t i = 0; i < params.size(); ++i) {
        const auto& p = *params[i];
        auto annotation = key_annotation(p);
        std::string type = p.type.to_dart();

        if (!is_wrapped(p)) {
            out_.emit_line("@override");
            if (annotation) {
                out_.emit_line(*annotation);
            }
            out_.emit_line("final " + type + " " + p.name + ";");
            continue;
        }

        std::string field = storage_name(p);
        std::string view(view_class(p.type.collection));
        out_.emit_line("final " + type + " " + field + ";");
        out_.emit_line("@override");
        if (annotation) {
            out_.emit_line(*annotation);
        }
        out_.emit_line(type + " get " + p.name + " {");
        {
            IndentScope body(out_);
            std::string wrapped = field;
            if (p.type.nullable) {
                out_.emit_line("final value = " + field + ";");
                out_.emit_line("if (value == null) return null;");
                wrapped = "value";
            }
            out_.emit_line("if (" + field + " is " + view + ") return " + field + ";");
            out_.emit_line("// ignore: implicit_dynamic_type");
            out_.emit_line("return " + view + "(" + wrapped + ");");
        }
        out_.emit_line("}");
        if (i + 1 < params.size()) {
            out_.emit_blank();
        }
    }

    if (json_union()) {
        if (!params.empty()) {
            out_.emit_blank();
        }
        out_.emit_line("@JsonKey(name: '" + decl_->union_key + "')");
        out_.emit_line("final String $type;");
    }
}

void FreezedGenerator::gen_equality(const CaseView& c) {
    std::vector<std::string> checks;
    std::vector<std::string> continuations;
    // Column of each check relative to the class body.
    constexpr size_t CHECK_INDENT = 10;

    for (const auto& p : c.source->params) {
        if (!is_equatable(p)) {
            continue;
        }
        if (is_wrapped(p)) {
            std::string field = storage_name(p);
            std::string check = "const DeepCollectionEquality().equals(other." + field + ", " +
                                field + ")";
            if (out_.indent_width() + CHECK_INDENT + check.size() + 3 <= LINE_WIDTH) {
                checks.push_back(check);
            } else {
                checks.push_back("const DeepCollectionEquality()\n" +
                                 std::string(out_.indent_width() + CHECK_INDENT + 4, ' ') +
                                 ".equals(other." + field + ", " + field + ")");
            }
        } else {
            std::string check = "(identical(other." + p.name + ", " + p.name + ") || other." +
                                p.name + " == " + p.name + ")";
            if (out_.indent_width() + CHECK_INDENT + check.size() + 3 <= LINE_WIDTH) {
                checks.push_back(check);
            } else {
                checks.push_back("(identical(other." + p.name + ", " + p.name + ") ||\n" +
                                 std::string(out_.indent_width() + CHECK_INDENT + 4, ' ') +
                                 "other." + p.name + " == " + p.name + ")");
            }
        }
    }

    out_.emit_line("@override");
    out_.emit_line("bool operator ==(Object other) {");
    {
        IndentScope body(out_);
        out_.emit_line("return identical(this, other) ||");
        out_.emit_line("(other.runtimeType == runtimeType &&", 4);
        if (checks.empty()) {
            out_.emit_line("other is " + c.impl + ");", 8);
        } else {
            out_.emit_line("other is " + c.impl + " &&", 8);
            for (size_t i = 0; i < checks.size(); ++i) {
                bool last = i + 1 == checks.size();
                out_.emit_line(checks[i] + (last ? ");" : " &&"), 8);
            }
        }
    }
    out_.emit_line("}");
}

void FreezedGenerator::gen_hash_code(const CaseView& c) {
    std::vector<std::string> items{"runtimeType"};
    for (const auto& p : c.source->params) {
        if (!is_equatable(p)) {
            continue;
        }
        if (is_wrapped(p)) {
            items.push_back("const DeepCollectionEquality().hash(" + storage_name(p) + ")");
        } else {
            items.push_back(p.name);
        }
    }
    // Object.hash accepts at most 20 values.
    constexpr size_t MAX_HASH_ARGS = 20;

    out_.emit_line("@JsonKey(ignore: true)");
    out_.emit_line("@override");
    if (items.size() == 1) {
        out_.emit_line("int get hashCode => runtimeType.hashCode;");
        return;
    }

    bool hash_all = items.size() > MAX_HASH_ARGS;
    std::string open = hash_all ? "Object.hashAll([" : "Object.hash(";
    std::string close = hash_all ? "])" : ")";
    std::string expr = open + join(items, ", ") + close + ";";
    std::string getter = "int get hashCode =>";

    if (out_.fits(getter + " " + expr)) {
        out_.emit_line(getter + " " + expr);
    } else if (out_.indent_width() + 4 + expr.size() <= LINE_WIDTH) {
        out_.emit_line(getter);
        out_.emit_line(expr, 4);
    } else if (hash_all) {
        out_.emit_line(getter + " " + open);
        for (const auto& item : items) {
            out_.emit_line(item + ",", 6);
        }
        out_.emit_line("]);", 4);
    } else {
        out_.emit_line(getter + " " + open);
        for (size_t i = 0; i < items.size(); ++i) {
            bool last = i + 1 == items.size();
            out_.emit_line(items[i] + (last ? ");" : ","), 4);
        }
    }
}

void FreezedGenerator::gen_union_overrides(const CaseView& c) {
    std::vector<std::string> names;
    for (const auto& p : c.source->params) {
        names.push_back(p.name);
    }
    std::string args = join(names, ", ");
    const std::string& cb = c.source->name;

    for (auto d : ALL_DISPATCH) {
        std::string call_args = is_map(d) ? "this" : args;
        out_.emit_blank();
        out_.emit_line("@override");
        gen_dispatch_signature(d);
        out_.emit_line("}) {");
        {
            IndentScope body(out_);
            if (is_maybe(d)) {
                out_.emit_line("if (" + cb + " != null) {");
                out_.emit_line("return " + cb + "(" + call_args + ");", 2);
                out_.emit_line("}");
                out_.emit_line("return orElse();");
            } else if (is_or_null(d)) {
                out_.emit_line("return " + cb + "?.call(" + call_args + ");");
            } else {
                out_.emit_line("return " + cb + "(" + call_args + ");");
            }
        }
        out_.emit_line("}");
    }
}

// ============================================================================
// Redirect Class
// ============================================================================

void FreezedGenerator::gen_redirect_class(const CaseView& c) {
    auto params = params_of(*c.source);
    const auto& name = decl_->name;
    std::string relation = decl_->has_private_constructor ? " extends " : " implements ";

    out_.emit_line("abstract class " + c.redirect + relation + name + " {");
    {
        IndentScope body(out_);
        auto items = group_params(params, [](const model::Parameter& p) {
            std::string out;
            if (p.is_named() && p.required && !p.default_value) {
                out += "required ";
            }
            return out + "final " + p.type.to_dart() + " " + p.name;
        });
        std::string head =
            std::string(c.source->is_const ? "const " : "") + "factory " + c.redirect + "(";
        emit_lines(out_, layout_call(head, items, ") = " + c.impl + ";", out_.indent_width()));

        if (decl_->has_private_constructor) {
            out_.emit_line(std::string(c.source->is_const ? "const " : "") + c.redirect +
                           "._() : super._();");
        }

        if (with_json_) {
            out_.emit_blank();
            std::string factory = "factory " + c.redirect + ".fromJson(Map<String, dynamic> json) =";
            std::string target = c.impl + ".fromJson;";
            if (out_.fits(factory + " " + target)) {
                out_.emit_line(factory + " " + target);
            } else {
                out_.emit_line(factory);
                out_.emit_line(target, 4);
            }
        }

        if (!params.empty()) {
            out_.emit_blank();
        }
        for (const auto* p : params) {
            if (is_common(*p)) {
                out_.emit_line("@override");
            }
            if (auto annotation = key_annotation(*p)) {
                out_.emit_line(*annotation);
            }
            out_.emit_line(p->type.to_dart() + " get " + p->name + ";");
        }
        if (!params.empty()) {
            std::string stem = impl_stem(c.impl);
            if (!common_.empty()) {
                out_.emit_line("@override");
            }
            out_.emit_line("@JsonKey(ignore: true)");
            std::string getter = "_$$" + stem + "CopyWith<" + c.impl + "> get copyWith =>";
            std::string throw_expr = "throw " + std::string(PRIVATE_ERROR) + ";";
            if (out_.fits(getter + " " + throw_expr)) {
                out_.emit_line(getter + " " + throw_expr);
            } else {
                out_.emit_line(getter);
                out_.emit_line(throw_expr, 4);
            }
        }
    }
    out_.emit_line("}");
    out_.emit_blank();
}

} // namespace sfg::emit
