//! # Declaration Extractor
//!
//! Syntax-tree to model conversion. See `extract/extractor.hpp`.

#include "extract/extractor.hpp"

#include "log/log.hpp"

#include <unordered_set>

namespace sfg::extract {

using model::Declaration;
using model::DeclarationKind;
using model::Parameter;
using model::ParameterKind;
using model::TypeDescriptor;

// ============================================================================
// Conversion Helpers
// ============================================================================

auto to_type_descriptor(const parser::TypeNode& node) -> TypeDescriptor {
    TypeDescriptor t;
    t.nullable = node.nullable;

    switch (node.kind) {
    case parser::TypeNode::Kind::Function:
        t.shape = model::TypeShape::Function;
        t.name = "Function";
        t.spelling = node.text;
        return t;
    case parser::TypeNode::Kind::Record:
        t.shape = model::TypeShape::Record;
        t.name = "Record";
        t.spelling = node.text;
        return t;
    case parser::TypeNode::Kind::Named:
        break;
    }

    t.name = node.name;
    t.collection = model::collection_kind_for(node.name);
    for (const auto& arg : node.args) {
        t.args.push_back(to_type_descriptor(arg));
    }
    return t;
}

auto to_marker(const parser::Annotation& annotation) -> model::Marker {
    model::Marker marker;
    marker.name = annotation.name;
    if (!annotation.constructor.empty()) {
        marker.name += "." + annotation.constructor;
    }
    for (const auto& arg : annotation.args) {
        marker.args.push_back(model::MarkerArg{.name = arg.name, .value = arg.value});
    }
    return marker;
}

auto unquote(std::string_view literal) -> std::string {
    std::string_view text = literal;
    if (!text.empty() && text[0] == 'r') {
        text.remove_prefix(1);
    }
    if (text.size() >= 2 && (text[0] == '\'' || text[0] == '"') && text.back() == text[0]) {
        return std::string(text.substr(1, text.size() - 2));
    }
    return std::string(literal);
}

namespace {

auto find_annotation(const std::vector<parser::Annotation>& annotations, std::string_view name)
    -> const parser::Annotation* {
    for (const auto& a : annotations) {
        if (a.name == name) {
            return &a;
        }
    }
    return nullptr;
}

/// Reads a boolean named argument written as a literal.
auto bool_arg(const parser::Annotation& annotation, std::string_view key)
    -> std::optional<bool> {
    const auto* arg = annotation.arg(key);
    if (!arg) {
        return std::nullopt;
    }
    if (arg->value == "true") {
        return true;
    }
    if (arg->value == "false") {
        return false;
    }
    return std::nullopt;
}

auto to_parameter_kind(parser::ParamKind kind) -> ParameterKind {
    switch (kind) {
    case parser::ParamKind::Positional:
        return ParameterKind::Positional;
    case parser::ParamKind::OptionalPositional:
        return ParameterKind::OptionalPositional;
    case parser::ParamKind::Named:
        return ParameterKind::Named;
    }
    return ParameterKind::Positional;
}

/// Applies `@JsonKey(...)` from `annotations` to `param`. Returns false when absent.
auto apply_json_key(Parameter& param, const std::vector<parser::Annotation>& annotations) -> bool {
    const auto* key = find_annotation(annotations, "JsonKey");
    if (!key) {
        return false;
    }
    if (const auto* name = key->arg("name")) {
        param.json_key = unquote(name->value);
    }
    auto from_json = bool_arg(*key, "includeFromJson");
    auto to_json = bool_arg(*key, "includeToJson");
    if (bool_arg(*key, "ignore").value_or(false) || (from_json == false && to_json == false)) {
        param.json_ignored = true;
    }
    param.include_if_null = bool_arg(*key, "includeIfNull");
    if (const auto* def = key->arg("defaultValue")) {
        param.json_default = def->value;
    }
    return true;
}

/// Instance fields of a class in declaration order.
auto instance_fields(const parser::ClassNode& cls) -> std::vector<const parser::FieldNode*> {
    std::vector<const parser::FieldNode*> fields;
    for (const auto& member : cls.members) {
        if (const auto* field = std::get_if<parser::FieldNode>(&member)) {
            if (!field->is_static) {
                fields.push_back(field);
            }
        }
    }
    return fields;
}

auto find_method(const parser::ClassNode& cls, std::string_view name) -> const parser::MethodNode* {
    for (const auto& member : cls.members) {
        if (const auto* method = std::get_if<parser::MethodNode>(&member)) {
            if (method->name == name && method->kind == parser::MethodNode::Kind::Method &&
                !method->is_static) {
                return method;
            }
        }
    }
    return nullptr;
}

/// `class Counter extends _$Counter` marks a generated notifier base.
auto extends_generated_base(const parser::ClassNode& cls) -> bool {
    return cls.superclass && cls.superclass->kind == parser::TypeNode::Kind::Named &&
           cls.superclass->name == "_$" + cls.name;
}

} // anonymous namespace

// ============================================================================
// Extractor
// ============================================================================

Extractor::Extractor(std::string path) : path_(std::move(path)) {}

void Extractor::warn(const std::string& declaration, const SourceSpan& span,
                     std::string message) {
    SFG_LOG_DEBUG("extract", path_ << ":" << span.start.line << ": " << declaration << ": "
                                   << message);
    warnings_.push_back(ExtractionWarning{.declaration = declaration,
                                          .message = std::move(message),
                                          .line = span.start.line,
                                          .column = span.start.column});
}

auto Extractor::extract(const parser::CompilationUnit& unit) -> ExtractionResult {
    warnings_.clear();

    ExtractionResult result;
    result.model.path = path_;

    for (const auto& directive : unit.directives) {
        if (directive.kind == parser::DirectiveNode::Kind::Part) {
            result.model.part_directives.push_back(directive.uri);
        }
    }

    for (const auto& decl : unit.decls) {
        if (decl.is<parser::EnumNode>()) {
            result.model.enums.push_back(extract_enum(decl.as<parser::EnumNode>()));
        } else if (decl.is<parser::ClassNode>()) {
            const auto& cls = decl.as<parser::ClassNode>();
            if (!cls.annotations.empty()) {
                result.model.declarations.push_back(extract_class(cls));
            }
        } else if (decl.is<parser::FunctionNode>()) {
            const auto& fn = decl.as<parser::FunctionNode>();
            if (!fn.annotations.empty()) {
                result.model.declarations.push_back(extract_function(fn));
            }
        }
    }

    SFG_LOG_DEBUG("extract", path_ << ": " << result.model.declarations.size()
                                   << " declarations, " << result.model.enums.size()
                                   << " enums, " << warnings_.size() << " warnings");
    result.warnings = std::move(warnings_);
    warnings_.clear();
    return result;
}

auto Extractor::extract_params(const std::string& owner,
                               const std::vector<parser::ParamNode>& params,
                               const std::vector<const parser::FieldNode*>& fields)
    -> std::vector<Parameter> {
    std::vector<Parameter> out;
    std::unordered_set<std::string> seen;

    for (const auto& node : params) {
        if (!seen.insert(node.name).second) {
            warn(owner, node.span,
                 "duplicate parameter '" + node.name + "' ignored after its first declaration");
            continue;
        }

        Parameter param;
        param.name = node.name;
        param.json_key = node.name;
        param.kind = to_parameter_kind(node.kind);
        param.required = node.kind == parser::ParamKind::Positional || node.required;
        param.default_value = node.default_value;

        const parser::FieldNode* field = nullptr;
        if (node.form == parser::ParamForm::ThisField) {
            for (const auto* f : fields) {
                if (f->name == node.name) {
                    field = f;
                    break;
                }
            }
        }

        switch (node.form) {
        case parser::ParamForm::Typed:
            param.type = to_type_descriptor(*node.type);
            break;
        case parser::ParamForm::ThisField: {
            if (node.type) {
                param.type = to_type_descriptor(*node.type);
                break;
            }
            if (field && field->type) {
                param.type = to_type_descriptor(*field->type);
            } else {
                warn(owner, node.span,
                     "cannot resolve the type of 'this." + node.name + "'; using dynamic");
                param.type = TypeDescriptor::inferred();
            }
            break;
        }
        case parser::ParamForm::SuperField:
            if (node.type) {
                param.type = to_type_descriptor(*node.type);
            } else {
                warn(owner, node.span,
                     "super parameter '" + node.name + "' has no visible type; using dynamic");
                param.type = TypeDescriptor::inferred();
            }
            break;
        case parser::ParamForm::Untyped:
            warn(owner, node.span, "parameter '" + node.name + "' has no type; using dynamic");
            param.type = TypeDescriptor::inferred();
            break;
        case parser::ParamForm::FunctionTyped:
            warn(owner, node.span,
                 "function-typed parameter '" + node.name + "' is kept with its raw signature");
            param.type = to_type_descriptor(*node.type);
            break;
        }

        if (const auto* def = find_annotation(node.annotations, "Default")) {
            if (!def->args.empty()) {
                param.default_value = def->args.front().value;
            }
        }

        // `this.x` parameters take the key settings of the field they initialize.
        if (!apply_json_key(param, node.annotations) && field) {
            apply_json_key(param, field->annotations);
        }

        out.push_back(std::move(param));
    }
    return out;
}

auto Extractor::extract_class(const parser::ClassNode& cls) -> Declaration {
    Declaration decl;
    decl.name = cls.name;
    decl.source_text = cls.text;
    decl.line = cls.span.start.line;
    decl.column = cls.span.start.column;
    decl.is_abstract = cls.has_modifier("abstract") || cls.has_modifier("sealed");
    for (const auto& annotation : cls.annotations) {
        decl.markers.push_back(to_marker(annotation));
    }
    for (const auto& tp : cls.type_params) {
        decl.type_params.push_back(tp.name);
    }
    for (const auto& skipped : cls.skipped_members) {
        warn(cls.name, cls.span, "skipped unrecognized member: " + skipped);
    }

    if (extends_generated_base(cls) && find_method(cls, "build")) {
        decl.kind = DeclarationKind::StatefulUnit;
        extract_unit(cls, decl);
    } else {
        decl.kind = DeclarationKind::ValueType;
        extract_value_type(cls, decl);
    }
    return decl;
}

void Extractor::extract_value_type(const parser::ClassNode& cls, Declaration& decl) {
    auto fields = instance_fields(cls);

    const parser::ConstructorNode* generative = nullptr;
    std::vector<model::UnionCase> named_cases;
    std::optional<model::UnionCase> unnamed_case;

    for (const auto& member : cls.members) {
        const auto* ctor = std::get_if<parser::ConstructorNode>(&member);
        if (!ctor) {
            continue;
        }
        if (ctor->name == "fromJson") {
            decl.has_from_json = true;
            continue;
        }
        if (ctor->name == "_" && ctor->params.empty() && !ctor->is_factory) {
            decl.has_private_constructor = true;
            continue;
        }
        if (ctor->is_factory && ctor->redirect) {
            model::UnionCase c{.name = ctor->name,
                               .redirect = *ctor->redirect,
                               .params = extract_params(cls.name, ctor->params, fields),
                               .is_const = ctor->is_const};
            if (ctor->name.empty()) {
                unnamed_case = std::move(c);
            } else {
                named_cases.push_back(std::move(c));
            }
            continue;
        }
        if (!ctor->is_factory && ctor->name.empty()) {
            generative = ctor;
        }
    }

    if (!named_cases.empty()) {
        if (unnamed_case) {
            warn(cls.name, cls.span,
                 "unnamed factory mixed with named union cases; the unnamed factory is ignored");
        }
        decl.union_cases = std::move(named_cases);
    } else if (unnamed_case) {
        decl.redirect_name = unnamed_case->redirect;
        decl.constructor_params = unnamed_case->params;
        decl.union_cases.push_back(std::move(*unnamed_case));
    } else if (generative) {
        decl.constructor_params = extract_params(cls.name, generative->params, fields);
    } else {
        // No constructor: the final instance fields act as named parameters.
        for (const auto* field : fields) {
            if (!field->is_final || field->has_initializer) {
                continue;
            }
            Parameter param;
            param.name = field->name;
            param.json_key = field->name;
            param.kind = ParameterKind::Named;
            if (field->type) {
                param.type = to_type_descriptor(*field->type);
            } else {
                warn(cls.name, field->span, "field '" + field->name + "' has no type");
                param.type = TypeDescriptor::inferred();
            }
            param.required = !param.type.accepts_null();
            apply_json_key(param, field->annotations);
            decl.constructor_params.push_back(std::move(param));
        }
    }

    if (const auto* freezed = find_annotation(cls.annotations, "Freezed")) {
        if (const auto* key = freezed->arg("unionKey")) {
            decl.union_key = unquote(key->value);
        }
    }
}

void Extractor::extract_unit(const parser::ClassNode& cls, Declaration& decl) {
    const auto* build = find_method(cls, "build");
    decl.params = extract_params(cls.name, build->params, {});
    decl.async_marker = build->async_marker;
    if (build->return_type) {
        decl.return_type = to_type_descriptor(*build->return_type);
    } else {
        warn(cls.name, build->span, "'build' has no return type; the state type is dynamic");
        decl.return_type = TypeDescriptor::inferred();
    }
}

auto Extractor::extract_function(const parser::FunctionNode& fn) -> Declaration {
    Declaration decl;
    decl.kind = DeclarationKind::PlainFunction;
    decl.name = fn.name;
    decl.source_text = fn.text;
    decl.line = fn.span.start.line;
    decl.column = fn.span.start.column;
    decl.async_marker = fn.async_marker;
    for (const auto& annotation : fn.annotations) {
        decl.markers.push_back(to_marker(annotation));
    }
    for (const auto& tp : fn.type_params) {
        decl.type_params.push_back(tp.name);
    }

    decl.params = extract_params(fn.name, fn.params, {});
    if (fn.return_type) {
        decl.return_type = to_type_descriptor(*fn.return_type);
    } else {
        warn(fn.name, fn.span, "missing return type; the provider value type is dynamic");
        decl.return_type = TypeDescriptor::inferred();
    }
    return decl;
}

auto Extractor::extract_enum(const parser::EnumNode& en) -> model::EnumInfo {
    model::EnumInfo info;
    info.name = en.name;
    for (const auto& value : en.values) {
        info.values.push_back(value.name);
        std::string json_value;
        if (const auto* jv = find_annotation(value.annotations, "JsonValue")) {
            if (!jv->args.empty()) {
                json_value = jv->args.front().value;
            }
        }
        info.json_values.push_back(std::move(json_value));
    }
    return info;
}

} // namespace sfg::extract
