#include "emit/json_generator.hpp"

#include "emit/naming.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace sfg::emit {

namespace {

auto is_one_of(const std::string& name, std::initializer_list<std::string_view> names) -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

auto is_dynamic(const model::TypeDescriptor& t) -> bool {
    return t.shape == model::TypeShape::Inferred ||
           (t.shape == model::TypeShape::Named && t.name == "dynamic");
}

/// Element type of a collection, `dynamic` when the source left it out.
auto type_arg(const model::TypeDescriptor& t, size_t index, std::string_view fallback)
    -> model::TypeDescriptor {
    if (index < t.args.size()) {
        return t.args[index];
    }
    if (fallback == "dynamic") {
        return model::TypeDescriptor::inferred();
    }
    return model::TypeDescriptor::named(std::string(fallback));
}

auto is_iterable(const model::TypeDescriptor& t) -> bool {
    return is_one_of(t.name, {"List", "Set", "Iterable"});
}

/// Dart literal for a JSON key or class name.
auto quoted(const std::string& text) -> std::string {
    if (text.find('$') != std::string::npos || text.find('\'') != std::string::npos) {
        return raw_string(text);
    }
    return "'" + text + "'";
}

auto default_expression(const std::string& value) -> std::string {
    if (!value.empty() && (value[0] == '[' || value[0] == '{')) {
        return "const " + value;
    }
    return value;
}

/// `true` / `false` literal of a named marker argument.
auto marker_bool(const model::Marker& marker, std::string_view key) -> std::optional<bool> {
    const auto* a = marker.arg(key);
    if (!a || (a->value != "true" && a->value != "false")) {
        return std::nullopt;
    }
    return a->value == "true";
}

void apply_marker_options(JsonTarget& target, const model::Declaration& decl) {
    const auto* m = decl.marker("JsonSerializable");
    if (!m) {
        return;
    }
    target.checked = marker_bool(*m, "checked");
    target.include_if_null = marker_bool(*m, "includeIfNull");
    target.explicit_to_json = marker_bool(*m, "explicitToJson");
}

} // anonymous namespace

// ============================================================================
// Targets
// ============================================================================

auto json_target_for_class(const model::Declaration& decl) -> JsonTarget {
    JsonTarget target{.declaration = decl.name,
                      .class_name = decl.name,
                      .function_stem = "_$" + decl.name,
                      .line = decl.line,
                      .column = decl.column};
    for (const auto& p : decl.constructor_params) {
        target.params.push_back(&p);
    }
    apply_marker_options(target, decl);
    return target;
}

auto json_targets_for_freezed(const model::Declaration& decl) -> std::vector<JsonTarget> {
    std::vector<JsonTarget> targets;
    for (const auto& c : decl.union_cases) {
        std::string impl = impl_class_name(c.redirect);
        JsonTarget target{.declaration = decl.name,
                          .class_name = impl,
                          .function_stem = "_$$" + impl.substr(2),
                          .line = decl.line,
                          .column = decl.column};
        for (const auto& p : c.params) {
            target.params.push_back(&p);
        }
        if (decl.is_union()) {
            target.union_key = decl.union_key;
            target.union_value = c.name;
        }
        apply_marker_options(target, decl);
        targets.push_back(std::move(target));
    }
    return targets;
}

// ============================================================================
// Conversions
// ============================================================================

JsonGenerator::JsonGenerator(const model::SourceModel& source, JsonOptions options)
    : source_(source), defaults_(options), options_(options) {}

auto JsonGenerator::enum_map(const std::string& enum_name) -> std::string {
    if (std::find(used_enums_.begin(), used_enums_.end(), enum_name) == used_enums_.end()) {
        used_enums_.push_back(enum_name);
    }
    return "_$" + enum_name + "EnumMap";
}

auto JsonGenerator::unsupported_reason(const model::TypeDescriptor& type) const
    -> std::optional<std::string> {
    switch (type.shape) {
    case model::TypeShape::Function:
        return "function types have no JSON representation";
    case model::TypeShape::Record:
        return "record types are not supported by the JSON codec";
    case model::TypeShape::Inferred:
        return std::nullopt;
    case model::TypeShape::Named:
        break;
    }

    if (type.name == "Map") {
        auto key = type_arg(type, 0, "String");
        if (!is_dynamic(key) && !is_one_of(key.name, {"String", "Object", "int"}) &&
            !source_.find_enum(key.name)) {
            return "map keys of type " + key.to_dart() + " cannot be converted";
        }
        return unsupported_reason(type_arg(type, 1, "dynamic"));
    }
    for (const auto& arg : type.args) {
        if (auto reason = unsupported_reason(arg)) {
            return reason;
        }
    }
    return std::nullopt;
}

auto JsonGenerator::decode_key(const model::TypeDescriptor& key) -> std::string {
    if (key.name == "int") {
        return "int.parse(k)";
    }
    if (source_.find_enum(key.name)) {
        return "$enumDecode(" + enum_map(key.name) + ", k)";
    }
    return "k";
}

auto JsonGenerator::encode_key(const model::TypeDescriptor& key) -> std::string {
    if (key.name == "int") {
        return "k.toString()";
    }
    if (source_.find_enum(key.name)) {
        return enum_map(key.name) + "[k]!";
    }
    return "k";
}

auto JsonGenerator::decode_parts(const model::TypeDescriptor& t, const std::string& in)
    -> Decoded {
    bool nullable = t.nullable;

    if (is_dynamic(t)) {
        return {.expr = in, .non_null = in};
    }
    if (t.name == "Object") {
        std::string cast = in + " as Object";
        return {.expr = nullable ? in : cast, .non_null = cast};
    }
    if (is_one_of(t.name, {"String", "bool", "num"})) {
        std::string cast = in + " as " + t.name;
        return {.expr = nullable ? cast + "?" : cast, .non_null = cast};
    }
    if (t.name == "int" || t.name == "double") {
        std::string method = t.name == "int" ? ".toInt()" : ".toDouble()";
        std::string non_null = "(" + in + " as num)" + method;
        return {.expr = nullable ? "(" + in + " as num?)?" + method : non_null,
                .non_null = non_null};
    }
    if (is_one_of(t.name, {"DateTime", "Uri", "BigInt"})) {
        std::string non_null = t.name + ".parse(" + in + " as String)";
        return {.expr = nullable ? in + " == null ? null : " + non_null : non_null,
                .non_null = non_null,
                .ternary = true};
    }
    if (t.name == "Duration") {
        std::string non_null = "Duration(microseconds: (" + in + " as num).toInt())";
        return {.expr = nullable ? in + " == null ? null : " + non_null : non_null,
                .non_null = non_null,
                .ternary = true};
    }
    if (source_.find_enum(t.name)) {
        std::string map = enum_map(t.name);
        std::string non_null = "$enumDecode(" + map + ", " + in + ")";
        return {.expr = nullable ? "$enumDecodeNullable(" + map + ", " + in + ")" : non_null,
                .non_null = non_null};
    }
    if (is_iterable(t)) {
        std::string elem = decode(type_arg(t, 0, "dynamic"), "e");
        std::string suffix = t.name == "List" ? ".toList()" : t.name == "Set" ? ".toSet()" : "";
        std::string non_null;
        std::string nullable_form;
        if (elem == "e") {
            if (t.name == "Set") {
                non_null = "(" + in + " as List<dynamic>).toSet()";
                nullable_form = "(" + in + " as List<dynamic>?)?.toSet()";
            } else {
                non_null = in + " as List<dynamic>";
                nullable_form = non_null + "?";
            }
        } else {
            non_null = "(" + in + " as List<dynamic>).map((e) => " + elem + ")" + suffix;
            nullable_form = "(" + in + " as List<dynamic>?)?.map((e) => " + elem + ")" + suffix;
        }
        return {.expr = nullable ? nullable_form : non_null, .non_null = non_null};
    }
    if (t.name == "Map") {
        std::string key = decode_key(type_arg(t, 0, "String"));
        std::string value = decode(type_arg(t, 1, "dynamic"), "e");
        std::string non_null;
        std::string nullable_form;
        if (key == "k" && value == "e") {
            non_null = in + " as Map<String, dynamic>";
            nullable_form = non_null + "?";
        } else {
            std::string entry = ".map((k, e) => MapEntry(" + key + ", " + value + "))";
            non_null = "(" + in + " as Map<String, dynamic>)" + entry;
            nullable_form = "(" + in + " as Map<String, dynamic>?)?" + entry;
        }
        return {.expr = nullable ? nullable_form : non_null, .non_null = non_null};
    }

    std::string non_null = t.name + ".fromJson(" + in + " as Map<String, dynamic>)";
    return {.expr = nullable ? in + " == null ? null : " + non_null : non_null,
            .non_null = non_null,
            .ternary = true};
}

auto JsonGenerator::decode(const model::TypeDescriptor& type, const std::string& input)
    -> std::string {
    return decode_parts(type, input).expr;
}

auto JsonGenerator::decode_or(const model::TypeDescriptor& type, const std::string& input,
                              const std::string& fallback) -> std::string {
    auto parts = decode_parts(type.as_nullable(), input);
    if (parts.ternary) {
        return input + " == null ? " + fallback + " : " + parts.non_null;
    }
    return parts.expr + " ?? " + fallback;
}

auto JsonGenerator::encode(const model::TypeDescriptor& t, const std::string& in) -> std::string {
    if (is_dynamic(t) || t.shape != model::TypeShape::Named) {
        return in;
    }
    std::string q = t.nullable ? "?" : "";

    if (is_one_of(t.name, {"Object", "String", "bool", "num", "int", "double"})) {
        return in;
    }
    if (t.name == "DateTime") {
        return in + q + ".toIso8601String()";
    }
    if (t.name == "Uri" || t.name == "BigInt") {
        return in + q + ".toString()";
    }
    if (t.name == "Duration") {
        return in + q + ".inMicroseconds";
    }
    if (source_.find_enum(t.name)) {
        return enum_map(t.name) + "[" + in + "]" + (t.nullable ? "" : "!");
    }
    if (is_iterable(t)) {
        std::string elem = encode(type_arg(t, 0, "dynamic"), "e");
        if (elem == "e") {
            return t.name == "List" ? in : in + q + ".toList()";
        }
        return in + q + ".map((e) => " + elem + ").toList()";
    }
    if (t.name == "Map") {
        std::string key = encode_key(type_arg(t, 0, "String"));
        std::string value = encode(type_arg(t, 1, "dynamic"), "e");
        if (key == "k" && value == "e") {
            return in;
        }
        return in + q + ".map((k, e) => MapEntry(" + key + ", " + value + "))";
    }
    if (options_.explicit_to_json) {
        return in + q + ".toJson()";
    }
    return in;
}

// ============================================================================
// Generation
// ============================================================================

auto JsonGenerator::generate(const std::vector<JsonTarget>& targets) -> EmitOutput {
    out_ = DartWriter{};
    unsupported_.clear();
    used_enums_.clear();

    for (const auto& target : targets) {
        options_ = JsonOptions{
            .checked = target.checked.value_or(defaults_.checked),
            .include_if_null = target.include_if_null.value_or(defaults_.include_if_null),
            .explicit_to_json = target.explicit_to_json.value_or(defaults_.explicit_to_json)};
        std::vector<const model::Parameter*> fields;
        for (const auto* p : target.params) {
            if (p->json_ignored) {
                continue;
            }
            if (auto reason = unsupported_reason(p->type)) {
                SFG_LOG_DEBUG("emit", "json: " << target.class_name << "." << p->name << ": "
                                               << *reason);
                unsupported_.push_back(UnsupportedTypeError{.declaration = target.declaration,
                                                            .member = p->name,
                                                            .type = p->type.to_dart(),
                                                            .message = *reason,
                                                            .line = target.line,
                                                            .column = target.column});
                continue;
            }
            fields.push_back(p);
        }
        gen_from_json(target, fields);
        out_.emit_blank();
        gen_to_json(target, fields);
        out_.emit_blank();
    }
    options_ = defaults_;
    gen_enum_maps();

    std::string text = out_.take();
    while (text.size() >= 2 && text.ends_with("\n\n")) {
        text.pop_back();
    }
    return EmitOutput{.text = std::move(text), .unsupported = std::move(unsupported_)};
}

void JsonGenerator::gen_from_json(const JsonTarget& target,
                                  const std::vector<const model::Parameter*>& fields) {
    bool has_optional_positional = false;
    for (const auto* p : target.params) {
        has_optional_positional |= p->kind == model::ParameterKind::OptionalPositional;
    }

    struct Arg {
        std::string prefix; ///< `name: ` or empty for positional arguments
        std::string key;
        std::string value; ///< Conversion of `v` (checked) or of `json['key']`
    };
    std::vector<Arg> args;
    for (const auto* p : fields) {
        std::string input = options_.checked ? "v" : "json[" + quoted(p->json_key) + "]";
        const auto& fallback = p->decode_default();
        std::string value = fallback ? decode_or(p->type, input, default_expression(*fallback))
                                     : decode(p->type, input);
        args.push_back(Arg{.prefix = p->kind == model::ParameterKind::Named ? p->name + ": " : "",
                           .key = p->json_key,
                           .value = std::move(value)});
    }
    if (target.union_key && !has_optional_positional) {
        std::string input = options_.checked ? "v" : "json[" + quoted(*target.union_key) + "]";
        args.push_back(Arg{.prefix = "$type: ", .key = *target.union_key, .value = input + " as String?"});
    }

    std::string signature = target.class_name + " " + target.function_stem +
                            "FromJson(Map<String, dynamic> json) =>";

    if (!options_.checked) {
        if (args.empty()) {
            out_.emit_line(signature + " " + target.class_name + "();");
            return;
        }
        out_.emit_line(signature + " " + target.class_name + "(");
        out_.push_indent();
        for (const auto& a : args) {
            std::string line = a.prefix + a.value + ",";
            if (out_.indent_width() + 4 + line.size() <= LINE_WIDTH || a.prefix.empty()) {
                out_.emit_line(line, 4);
            } else {
                out_.emit_line(a.prefix, 4);
                out_.emit_line(a.value + ",", 8);
            }
        }
        out_.emit_line(");", 2);
        out_.pop_indent();
        return;
    }

    std::vector<std::string> key_map;
    for (const auto* p : fields) {
        if (p->json_key != p->name) {
            key_map.push_back(quoted(p->name) + ": " + quoted(p->json_key));
        }
    }
    if (target.union_key && !has_optional_positional && *target.union_key != "$type") {
        key_map.push_back(quoted("$type") + ": " + quoted(*target.union_key));
    }

    out_.emit_line(signature + " $checkedCreate(");
    out_.emit_line(quoted(target.class_name) + ",", 6);
    out_.emit_line("json,", 6);
    out_.emit_line("($checkedConvert) {", 6);
    if (args.empty()) {
        out_.emit_line("final val = " + target.class_name + "();", 8);
    } else {
        out_.emit_line("final val = " + target.class_name + "(", 8);
        for (const auto& a : args) {
            std::string head = a.prefix + "$checkedConvert(" + quoted(a.key) + ",";
            std::string lambda = "(v) => " + a.value + "),";
            if (out_.indent_width() + 10 + head.size() + 1 + lambda.size() <= LINE_WIDTH) {
                out_.emit_line(head + " " + lambda, 10);
            } else {
                out_.emit_line(head, 10);
                out_.emit_line(lambda, 14);
            }
        }
        out_.emit_line(");", 8);
    }
    out_.emit_line("return val;", 8);
    out_.emit_line("},", 6);
    if (!key_map.empty()) {
        out_.emit_line("fieldKeyMap: const {" + join(key_map, ", ") + "},", 6);
    }
    out_.emit_line(");", 4);
}

void JsonGenerator::gen_to_json(const JsonTarget& target,
                                const std::vector<const model::Parameter*>& fields) {
    std::string signature = "Map<String, dynamic> " + target.function_stem + "ToJson(" +
                            target.class_name + " instance) =>";

    bool has_optional_positional = false;
    for (const auto* p : target.params) {
        has_optional_positional |= p->kind == model::ParameterKind::OptionalPositional;
    }
    bool write_type = target.union_key && !has_optional_positional;

    if (fields.empty() && !write_type) {
        out_.emit_line(signature + " <String, dynamic>{};");
        return;
    }

    out_.emit_line(signature + " <String, dynamic>{");
    for (const auto* p : fields) {
        std::string value = encode(p->type, "instance." + p->name);
        bool include_null = p->include_if_null.value_or(options_.include_if_null);
        std::string line;
        if (p->type.accepts_null() && !include_null) {
            line = "if (" + value + " case final value?) " + quoted(p->json_key) + ": value,";
        } else {
            line = quoted(p->json_key) + ": " + value + ",";
        }
        out_.emit_line(line, 6);
    }
    if (write_type) {
        out_.emit_line(quoted(*target.union_key) + ": instance.$type,", 6);
    }
    out_.emit_line("};", 4);
}

void JsonGenerator::gen_enum_maps() {
    for (const auto& name : used_enums_) {
        const auto* info = source_.find_enum(name);
        if (!info) {
            continue;
        }
        out_.emit_line("const _$" + name + "EnumMap = {");
        for (size_t i = 0; i < info->values.size(); ++i) {
            const auto& value = info->values[i];
            std::string json = i < info->json_values.size() && !info->json_values[i].empty()
                                   ? info->json_values[i]
                                   : "'" + value + "'";
            out_.emit_line(name + "." + value + ": " + json + ",", 2);
        }
        out_.emit_line("};");
        out_.emit_blank();
    }
}

} // namespace sfg::emit
