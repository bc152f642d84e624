#include "emit/riverpod_generator.hpp"

#include "classify/classifier.hpp"
#include "crypto/digest.hpp"
#include "emit/naming.hpp"
#include "log/log.hpp"

namespace sfg::emit {

namespace {

auto flavor_infix(ProviderFlavor flavor) -> std::string {
    switch (flavor) {
    case ProviderFlavor::Value:
        return "";
    case ProviderFlavor::Future:
        return "Future";
    case ProviderFlavor::Stream:
        return "Stream";
    }
    return "";
}

auto notifier_infix(ProviderFlavor flavor) -> std::string {
    switch (flavor) {
    case ProviderFlavor::Value:
        return "";
    case ProviderFlavor::Future:
        return "Async";
    case ProviderFlavor::Stream:
        return "Stream";
    }
    return "";
}

/// Type the provider's listeners observe.
auto exposed_type(const ProviderShape& shape) -> std::string {
    if (shape.flavor == ProviderFlavor::Value) {
        return shape.value_type.to_dart();
    }
    return "AsyncValue<" + shape.value_type.to_dart() + ">";
}

/// Return type of the create callback or `runNotifierBuild`.
auto create_type(const ProviderShape& shape) -> std::string {
    switch (shape.flavor) {
    case ProviderFlavor::Value:
        return shape.value_type.to_dart();
    case ProviderFlavor::Future:
        return "FutureOr<" + shape.value_type.to_dart() + ">";
    case ProviderFlavor::Stream:
        return "Stream<" + shape.value_type.to_dart() + ">";
    }
    return "";
}

auto is_collection_param(const model::Parameter& p) -> bool {
    return p.type.shape == model::TypeShape::Named && p.type.is_collection();
}

auto declaration_of(const model::Parameter& p) -> std::string {
    std::string out = param_declaration(p);
    if (p.default_value) {
        out += " = " + *p.default_value;
    }
    return out;
}

/// `expr` passed to `p` as a positional or named argument.
auto argument(const model::Parameter& p, const std::string& expr) -> std::string {
    return p.is_named() ? p.name + ": " + expr : expr;
}

/// Parameter list in the one-per-line, trailing-comma layout.
void emit_param_block(DartWriter& out, const std::string& head,
                      const std::vector<model::Parameter>& params, const std::string& tail) {
    if (params.empty()) {
        out.emit_line(head + "()" + tail);
        return;
    }
    std::vector<const model::Parameter*> required;
    std::vector<const model::Parameter*> optional;
    char open = 0;
    char close = 0;
    for (const auto& p : params) {
        if (p.kind == model::ParameterKind::Positional) {
            required.push_back(&p);
        } else {
            optional.push_back(&p);
            open = p.is_named() ? '{' : '[';
            close = p.is_named() ? '}' : ']';
        }
    }

    if (required.empty()) {
        out.emit_line(head + "(" + open);
    } else {
        out.emit_line(head + "(");
    }
    for (size_t i = 0; i < required.size(); ++i) {
        bool opens_section = i + 1 == required.size() && !optional.empty();
        out.emit_line(declaration_of(*required[i]) + "," + (opens_section ? std::string(" ") + open : ""),
                      2);
    }
    for (const auto* p : optional) {
        out.emit_line(declaration_of(*p) + ",", 2);
    }
    std::string closing = optional.empty() ? ")" : std::string(1, close) + ")";
    out.emit_line(closing + tail);
}

void emit_arg_block(DartWriter& out, const std::string& head, const std::vector<std::string>& args,
                    const std::string& tail) {
    if (args.empty()) {
        out.emit_line(head + "()" + tail);
        return;
    }
    out.emit_line(head + "(");
    for (const auto& a : args) {
        out.emit_line(a + ",", 2);
    }
    out.emit_line(")" + tail);
}

} // anonymous namespace

auto provider_shape(const model::Declaration& decl) -> ProviderShape {
    ProviderShape shape;
    if (!decl.return_type) {
        shape.value_type = model::TypeDescriptor::inferred();
        return shape;
    }
    const auto& r = *decl.return_type;
    auto inner = [&]() {
        return r.args.empty() ? model::TypeDescriptor::inferred() : r.args.front();
    };
    if (r.shape == model::TypeShape::Named && (r.name == "Future" || r.name == "FutureOr")) {
        shape.flavor = ProviderFlavor::Future;
        shape.value_type = inner();
    } else if (r.shape == model::TypeShape::Named && r.name == "Stream") {
        shape.flavor = ProviderFlavor::Stream;
        shape.value_type = inner();
    } else {
        shape.value_type = r;
    }
    return shape;
}

// ============================================================================
// Generator
// ============================================================================

auto RiverpodGenerator::names_for(const RiverpodTarget& target) const -> Names {
    const auto& decl = *target.declaration;
    return Names{.base = decl.name,
                 .variable = provider_variable(decl.name),
                 .provider = provider_class(decl.name),
                 .family = family_class(decl.name),
                 .ref = ref_name(decl.name),
                 .hash_fn = "_$" + camel_case(decl.name) + "Hash",
                 .prefix = target.variant.keep_alive ? "" : "AutoDispose",
                 .shape = provider_shape(decl)};
}

auto RiverpodGenerator::generate(const std::vector<RiverpodTarget>& targets)
    -> Result<EmitOutput, EmitError> {
    out_ = DartWriter{};
    system_hash_emitted_ = false;

    for (const auto& target : targets) {
        const auto& decl = *target.declaration;
        auto digest = crypto::sha1_hex(decl.source_text);
        if (is_err(digest)) {
            return EmitError{.declaration = decl.name,
                             .message = "cannot hash provider source: " +
                                        unwrap_err(digest).message};
        }
        Names n = names_for(target);
        SFG_LOG_DEBUG("emit", "riverpod: " << decl.name << (target.variant.is_unit ? " unit" : "")
                                           << (target.variant.is_family ? " family" : ""));

        out_.emit_line("String " + n.hash_fn + "() => r'" + unwrap(digest) + "';");
        out_.emit_blank();

        if (target.variant.is_unit) {
            gen_unit_base(target, n);
            if (target.variant.is_family) {
                gen_unit_family(target, n);
            } else {
                gen_unit(target, n);
            }
        } else if (target.variant.is_family) {
            gen_function_family(target, n);
        } else {
            gen_function(target, n);
        }
    }

    std::string text = out_.take();
    while (text.size() >= 2 && text.ends_with("\n\n")) {
        text.pop_back();
    }
    return EmitOutput{.text = std::move(text), .unsupported = {}};
}

void RiverpodGenerator::gen_system_hash() {
    if (system_hash_emitted_) {
        return;
    }
    system_hash_emitted_ = true;
    out_.emit_line("/// Copied from Dart SDK");
    out_.emit_line("class _SystemHash {");
    out_.emit_line("_SystemHash._();", 2);
    out_.emit_blank();
    out_.emit_line("static int combine(int hash, int value) {", 2);
    out_.emit_line("// ignore: parameter_assignments", 4);
    out_.emit_line("hash = 0x1fffffff & (hash + value);", 4);
    out_.emit_line("// ignore: parameter_assignments", 4);
    out_.emit_line("hash = 0x1fffffff & (hash + ((0x0007ffff & hash) << 10));", 4);
    out_.emit_line("return hash ^ (hash >> 6);", 4);
    out_.emit_line("}", 2);
    out_.emit_blank();
    out_.emit_line("static int finish(int hash) {", 2);
    out_.emit_line("// ignore: parameter_assignments", 4);
    out_.emit_line("hash = 0x1fffffff & (hash + ((0x03ffffff & hash) << 3));", 4);
    out_.emit_line("// ignore: parameter_assignments", 4);
    out_.emit_line("hash = hash ^ (hash >> 11);", 4);
    out_.emit_line("return 0x1fffffff & (hash + ((0x00003fff & hash) << 15));", 4);
    out_.emit_line("}", 2);
    out_.emit_line("}");
    out_.emit_blank();
}

void RiverpodGenerator::gen_hash_arg(const Names& n, size_t extra) {
    std::string condition = "const bool.fromEnvironment('dart.vm.product')";
    std::string inline_form = condition + " ? null : " + n.hash_fn + ",";
    out_.emit_line("debugGetCreateSourceHash:", extra);
    if (out_.indent_width() + extra + 4 + inline_form.size() <= LINE_WIDTH) {
        out_.emit_line(inline_form, extra + 4);
    } else {
        out_.emit_line(condition, extra + 4);
        out_.emit_line("? null", extra + 8);
        out_.emit_line(": " + n.hash_fn + ",", extra + 8);
    }
}

// ============================================================================
// Function Providers
// ============================================================================

void RiverpodGenerator::gen_function(const RiverpodTarget& target, const Names& n) {
    const auto& decl = *target.declaration;
    std::string value = n.shape.value_type.to_dart();
    std::string provider_type =
        n.prefix + flavor_infix(n.shape.flavor) + "Provider<" + value + ">";
    std::string create = classify::context_param_index(decl) ? n.base : "(ref) => " + n.base + "()";

    out_.emit_line("/// See also [" + n.base + "].");
    out_.emit_line("@ProviderFor(" + n.base + ")");
    std::string head = "final " + n.variable + " = " + provider_type + ".internal(";
    if (out_.fits(head)) {
        out_.emit_line(head);
    } else {
        out_.emit_line("final " + n.variable + " =");
        out_.emit_line(provider_type + ".internal(", 4);
    }
    out_.emit_line(create + ",", 2);
    out_.emit_line("name: " + raw_string(n.variable) + ",", 2);
    gen_hash_arg(n, 2);
    out_.emit_line("dependencies: null,", 2);
    out_.emit_line("allTransitiveDependencies: null,", 2);
    out_.emit_line(");");
    out_.emit_blank();
    out_.emit_line("typedef " + n.ref + " = " + n.prefix + flavor_infix(n.shape.flavor) +
                   "ProviderRef<" + value + ">;");
    out_.emit_blank();
}

void RiverpodGenerator::gen_family_class(const Names& n, const std::vector<model::Parameter>& params,
                                         const std::string& value_type) {
    std::string see_also = "/// See also [" + n.base + "].";

    out_.emit_line(see_also);
    out_.emit_line("@ProviderFor(" + n.base + ")");
    out_.emit_line("const " + n.variable + " = " + n.family + "();");
    out_.emit_blank();

    out_.emit_line(see_also);
    out_.emit_line("class " + n.family + " extends Family<" + value_type + "> {");
    {
        IndentScope body(out_);
        out_.emit_line(see_also);
        out_.emit_line("const " + n.family + "();");
        out_.emit_blank();

        out_.emit_line(see_also);
        emit_param_block(out_, n.provider + " call", params, " {");
        {
            std::vector<std::string> args;
            for (const auto& p : params) {
                args.push_back(argument(p, p.name));
            }
            IndentScope call_body(out_);
            emit_arg_block(out_, "return " + n.provider, args, ";");
        }
        out_.emit_line("}");
        out_.emit_blank();

        out_.emit_line("@override");
        out_.emit_line(n.provider + " getProviderOverride(");
        out_.emit_line("covariant " + n.provider + " provider,", 2);
        out_.emit_line(") {");
        {
            std::vector<std::string> args;
            for (const auto& p : params) {
                args.push_back(argument(p, "provider." + p.name));
            }
            IndentScope override_body(out_);
            emit_arg_block(out_, "return call", args, ";");
        }
        out_.emit_line("}");
        out_.emit_blank();

        out_.emit_line("static const Iterable<ProviderOrFamily>? _dependencies = null;");
        out_.emit_blank();
        out_.emit_line("@override");
        out_.emit_line("Iterable<ProviderOrFamily>? get dependencies => _dependencies;");
        out_.emit_blank();
        out_.emit_line("static const Iterable<ProviderOrFamily>? _allTransitiveDependencies = null;");
        out_.emit_blank();
        out_.emit_line("@override");
        out_.emit_line("Iterable<ProviderOrFamily>? get allTransitiveDependencies =>");
        out_.emit_line("_allTransitiveDependencies;", 4);
        out_.emit_blank();
        out_.emit_line("@override");
        out_.emit_line("String? get name => " + raw_string(n.variable) + ";");
    }
    out_.emit_line("}");
    out_.emit_blank();
}

/// `operator ==` and `hashCode` over the family arguments.
void RiverpodGenerator::gen_provider_identity(const Names& n,
                                              const std::vector<model::Parameter>& params) {
    std::vector<std::string> checks{"other is " + n.provider};
    for (const auto& p : params) {
        if (is_collection_param(p)) {
            checks.push_back("const DeepCollectionEquality().equals(other." + p.name + ", " +
                             p.name + ")");
        } else {
            checks.push_back("other." + p.name + " == " + p.name);
        }
    }

    out_.emit_line("@override");
    out_.emit_line("bool operator ==(Object other) {");
    {
        IndentScope body(out_);
        std::string one = "return " + join(checks, " && ") + ";";
        if (out_.fits(one)) {
            out_.emit_line(one);
        } else {
            out_.emit_line("return " + checks.front() + " &&");
            for (size_t i = 1; i < checks.size(); ++i) {
                bool last = i + 1 == checks.size();
                out_.emit_line(checks[i] + (last ? ";" : " &&"), 4);
            }
        }
    }
    out_.emit_line("}");
    out_.emit_blank();

    out_.emit_line("@override");
    out_.emit_line("int get hashCode {");
    {
        IndentScope body(out_);
        out_.emit_line("var hash = _SystemHash.combine(0, runtimeType.hashCode);");
        for (const auto& p : params) {
            std::string value = is_collection_param(p)
                                    ? "const DeepCollectionEquality().hash(" + p.name + ")"
                                    : p.name + ".hashCode";
            out_.emit_line("hash = _SystemHash.combine(hash, " + value + ");");
        }
        out_.emit_blank();
        out_.emit_line("return _SystemHash.finish(hash);");
    }
    out_.emit_line("}");
}

void RiverpodGenerator::gen_ref_and_element(const Names& n,
                                            const std::vector<model::Parameter>& params,
                                            const std::string& ref_base,
                                            const std::string& element_base) {
    out_.emit_line("mixin " + n.ref + " on " + ref_base + " {");
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            out_.emit_blank();
        }
        out_.emit_line("/// The parameter `" + params[i].name + "` of this provider.", 2);
        out_.emit_line(params[i].type.to_dart() + " get " + params[i].name + ";", 2);
    }
    out_.emit_line("}");
    out_.emit_blank();

    std::string element = "_" + n.provider + "Element";
    std::string header = "class " + element + " extends " + element_base + " with " + n.ref + " {";
    if (out_.fits(header)) {
        out_.emit_line(header);
    } else {
        out_.emit_line("class " + element);
        out_.emit_line("extends " + element_base + " with " + n.ref + " {", 4);
    }
    {
        IndentScope body(out_);
        out_.emit_line(element + "(super.provider);");
        for (const auto& p : params) {
            out_.emit_blank();
            out_.emit_line("@override");
            out_.emit_line(p.type.to_dart() + " get " + p.name + " => (origin as " + n.provider +
                           ")." + p.name + ";");
        }
    }
    out_.emit_line("}");
    out_.emit_blank();
}

void RiverpodGenerator::gen_function_family(const RiverpodTarget& target, const Names& n) {
    const auto& decl = *target.declaration;
    auto params = classify::family_params(decl);
    bool has_context = classify::context_param_index(decl).has_value();
    std::string value = n.shape.value_type.to_dart();
    std::string infix = flavor_infix(n.shape.flavor);
    std::string base_provider = n.prefix + infix + "Provider<" + value + ">";
    std::string see_also = "/// See also [" + n.base + "].";

    gen_system_hash();
    gen_family_class(n, params, exposed_type(n.shape));

    out_.emit_line(see_also);
    out_.emit_line("class " + n.provider + " extends " + base_provider + " {");
    {
        IndentScope body(out_);
        out_.emit_line(see_also);
        emit_param_block(out_, n.provider, params, " : this._internal(");
        {
            std::vector<std::string> call_args;
            if (has_context) {
                call_args.push_back("ref as " + n.ref);
            }
            for (const auto& p : params) {
                call_args.push_back(argument(p, p.name));
            }
            constexpr size_t ARGS = 8;
            out_.emit_line("(ref) => " + n.base + "(", ARGS);
            for (const auto& a : call_args) {
                out_.emit_line(a + ",", ARGS + 2);
            }
            out_.emit_line("),", ARGS);
            out_.emit_line("from: " + n.variable + ",", ARGS);
            out_.emit_line("name: " + raw_string(n.variable) + ",", ARGS);
            gen_hash_arg(n, ARGS);
            out_.emit_line("dependencies: " + n.family + "._dependencies,", ARGS);
            out_.emit_line("allTransitiveDependencies:", ARGS);
            out_.emit_line(n.family + "._allTransitiveDependencies,", ARGS + 4);
            for (const auto& p : params) {
                out_.emit_line(p.name + ": " + p.name + ",", ARGS);
            }
            out_.emit_line(");", 6);
        }
        out_.emit_blank();

        out_.emit_line(n.provider + "._internal(");
        out_.emit_line("super._createNotifier, {", 2);
        out_.emit_line("required super.name,", 2);
        out_.emit_line("required super.dependencies,", 2);
        out_.emit_line("required super.allTransitiveDependencies,", 2);
        out_.emit_line("required super.debugGetCreateSourceHash,", 2);
        out_.emit_line("required super.from,", 2);
        for (const auto& p : params) {
            out_.emit_line("required this." + p.name + ",", 2);
        }
        out_.emit_line("}) : super.internal();");
        out_.emit_blank();

        for (const auto& p : params) {
            out_.emit_line("final " + p.type.to_dart() + " " + p.name + ";");
        }
        out_.emit_blank();

        out_.emit_line("@override");
        out_.emit_line("Override overrideWith(");
        out_.emit_line(create_type(n.shape) + " Function(" + n.ref + " provider) create,", 2);
        out_.emit_line(") {");
        {
            IndentScope override_body(out_);
            out_.emit_line("return ProviderOverride(");
            out_.emit_line("origin: this,", 2);
            out_.emit_line("override: " + n.provider + "._internal(", 2);
            out_.emit_line("(ref) => create(ref as " + n.ref + "),", 4);
            out_.emit_line("from: from,", 4);
            out_.emit_line("name: null,", 4);
            out_.emit_line("dependencies: null,", 4);
            out_.emit_line("allTransitiveDependencies: null,", 4);
            out_.emit_line("debugGetCreateSourceHash: null,", 4);
            for (const auto& p : params) {
                out_.emit_line(p.name + ": " + p.name + ",", 4);
            }
            out_.emit_line("),", 2);
            out_.emit_line(");");
        }
        out_.emit_line("}");
        out_.emit_blank();

        std::string element_type = n.prefix + infix + "ProviderElement<" + value + ">";
        out_.emit_line("@override");
        out_.emit_line(element_type + " createElement() {");
        out_.emit_line("return _" + n.provider + "Element(this);", 2);
        out_.emit_line("}");
        out_.emit_blank();

        gen_provider_identity(n, params);
    }
    out_.emit_line("}");
    out_.emit_blank();

    gen_ref_and_element(n, params, n.prefix + infix + "ProviderRef<" + value + ">",
                        n.prefix + infix + "ProviderElement<" + value + ">");
}

// ============================================================================
// Stateful Units
// ============================================================================

void RiverpodGenerator::gen_unit_base(const RiverpodTarget& target, const Names& n) {
    const auto& decl = *target.declaration;
    std::string value = n.shape.value_type.to_dart();
    std::string buildless =
        "Buildless" + n.prefix + notifier_infix(n.shape.flavor) + "Notifier<" + value + ">";
    std::string build_type = decl.return_type ? decl.return_type->to_dart() : "dynamic";
    std::string state_type = exposed_type(n.shape);

    std::string header = "abstract class _$" + n.base + " extends " + buildless + " {";
    if (out_.fits(header)) {
        out_.emit_line(header);
    } else {
        out_.emit_line("abstract class _$" + n.base);
        out_.emit_line("extends " + buildless + " {", 4);
    }
    {
        IndentScope body(out_);
        for (const auto& p : decl.params) {
            out_.emit_line("late final " + p.type.to_dart() + " " + p.name + ";");
        }
        out_.emit_line("bool _$disposed = false;");
        out_.emit_blank();

        if (decl.params.empty()) {
            out_.emit_line(build_type + " build();");
        } else {
            emit_param_block(out_, build_type + " build", decl.params, ";");
        }
        out_.emit_blank();

        out_.emit_line(build_type + " _$runBuild() {");
        {
            IndentScope run(out_);
            // onDispose also fires on rebuild, and the instance is reused afterwards.
            out_.emit_line("_$disposed = false;");
            out_.emit_line("ref.onDispose(() => _$disposed = true);");
            std::vector<std::string> args;
            for (const auto& p : decl.params) {
                args.push_back(argument(p, p.name));
            }
            if (args.empty()) {
                out_.emit_line("return build();");
            } else {
                emit_arg_block(out_, "return build", args, ";");
            }
        }
        out_.emit_line("}");
        out_.emit_blank();

        out_.emit_line("@override");
        out_.emit_line("set state(" + state_type + " value) {");
        {
            IndentScope setter(out_);
            out_.emit_line("if (_$disposed) {");
            std::string message = "'" + n.base + " was mutated after it was disposed'";
            std::string one = "throw StateError(" + message + ");";
            if (out_.indent_width() + 2 + one.size() <= LINE_WIDTH) {
                out_.emit_line(one, 2);
            } else {
                out_.emit_line("throw StateError(", 2);
                out_.emit_line(message + ");", 6);
            }
            out_.emit_line("}");
            out_.emit_line("super.state = value;");
        }
        out_.emit_line("}");
    }
    out_.emit_line("}");
    out_.emit_blank();
}

void RiverpodGenerator::gen_unit(const RiverpodTarget& /*target*/, const Names& n) {
    std::string value = n.shape.value_type.to_dart();
    std::string impl = n.prefix + notifier_infix(n.shape.flavor) + "NotifierProviderImpl<" +
                       n.base + ", " + value + ">";
    std::string see_also = "/// See also [" + n.base + "].";

    out_.emit_line(see_also);
    out_.emit_line("@ProviderFor(" + n.base + ")");
    out_.emit_line("final " + n.variable + " = " + n.provider + "._();");
    out_.emit_blank();

    out_.emit_line(see_also);
    std::string header = "class " + n.provider + " extends " + impl + " {";
    if (out_.fits(header)) {
        out_.emit_line(header);
    } else {
        out_.emit_line("class " + n.provider);
        out_.emit_line("extends " + impl + " {", 4);
    }
    {
        IndentScope body(out_);
        out_.emit_line(n.provider + "._()");
        out_.emit_line(": super.internal(", 4);
        out_.emit_line(n.base + ".new,", 8);
        out_.emit_line("name: " + raw_string(n.variable) + ",", 8);
        gen_hash_arg(n, 8);
        out_.emit_line("dependencies: null,", 8);
        out_.emit_line("allTransitiveDependencies: null,", 8);
        out_.emit_line(");", 6);
        out_.emit_blank();

        out_.emit_line("@override");
        out_.emit_line(create_type(n.shape) + " runNotifierBuild(");
        out_.emit_line("covariant " + n.base + " notifier,", 2);
        out_.emit_line(") {");
        out_.emit_line("return notifier._$runBuild();", 2);
        out_.emit_line("}");
    }
    out_.emit_line("}");
    out_.emit_blank();
}

void RiverpodGenerator::gen_unit_family(const RiverpodTarget& target, const Names& n) {
    const auto& params = target.declaration->params;
    std::string value = n.shape.value_type.to_dart();
    std::string infix = notifier_infix(n.shape.flavor);
    std::string impl =
        n.prefix + infix + "NotifierProviderImpl<" + n.base + ", " + value + ">";
    std::string see_also = "/// See also [" + n.base + "].";

    std::string cascade = n.base + "()";
    for (const auto& p : params) {
        cascade += ".." + p.name + " = " + p.name;
    }

    gen_system_hash();
    gen_family_class(n, params, exposed_type(n.shape));

    out_.emit_line(see_also);
    std::string header = "class " + n.provider + " extends " + impl + " {";
    if (out_.fits(header)) {
        out_.emit_line(header);
    } else {
        out_.emit_line("class " + n.provider);
        out_.emit_line("extends " + impl + " {", 4);
    }
    {
        IndentScope body(out_);
        out_.emit_line(see_also);
        emit_param_block(out_, n.provider, params, " : this._internal(");
        {
            constexpr size_t ARGS = 8;
            out_.emit_line("() => " + cascade + ",", ARGS);
            out_.emit_line("from: " + n.variable + ",", ARGS);
            out_.emit_line("name: " + raw_string(n.variable) + ",", ARGS);
            gen_hash_arg(n, ARGS);
            out_.emit_line("dependencies: " + n.family + "._dependencies,", ARGS);
            out_.emit_line("allTransitiveDependencies:", ARGS);
            out_.emit_line(n.family + "._allTransitiveDependencies,", ARGS + 4);
            for (const auto& p : params) {
                out_.emit_line(p.name + ": " + p.name + ",", ARGS);
            }
            out_.emit_line(");", 6);
        }
        out_.emit_blank();

        out_.emit_line(n.provider + "._internal(");
        out_.emit_line("super._createNotifier, {", 2);
        out_.emit_line("required super.name,", 2);
        out_.emit_line("required super.dependencies,", 2);
        out_.emit_line("required super.allTransitiveDependencies,", 2);
        out_.emit_line("required super.debugGetCreateSourceHash,", 2);
        out_.emit_line("required super.from,", 2);
        for (const auto& p : params) {
            out_.emit_line("required this." + p.name + ",", 2);
        }
        out_.emit_line("}) : super.internal();");
        out_.emit_blank();

        for (const auto& p : params) {
            out_.emit_line("final " + p.type.to_dart() + " " + p.name + ";");
        }
        out_.emit_blank();

        out_.emit_line("@override");
        out_.emit_line(create_type(n.shape) + " runNotifierBuild(");
        out_.emit_line("covariant " + n.base + " notifier,", 2);
        out_.emit_line(") {");
        out_.emit_line("return notifier._$runBuild();", 2);
        out_.emit_line("}");
        out_.emit_blank();

        std::string override_cascade = "create()";
        for (const auto& p : params) {
            override_cascade += ".." + p.name + " = " + p.name;
        }
        out_.emit_line("@override");
        out_.emit_line("Override overrideWith(" + n.base + " Function() create) {");
        {
            IndentScope override_body(out_);
            out_.emit_line("return ProviderOverride(");
            out_.emit_line("origin: this,", 2);
            out_.emit_line("override: " + n.provider + "._internal(", 2);
            out_.emit_line("() => " + override_cascade + ",", 4);
            out_.emit_line("from: from,", 4);
            out_.emit_line("name: null,", 4);
            out_.emit_line("dependencies: null,", 4);
            out_.emit_line("allTransitiveDependencies: null,", 4);
            out_.emit_line("debugGetCreateSourceHash: null,", 4);
            for (const auto& p : params) {
                out_.emit_line(p.name + ": " + p.name + ",", 4);
            }
            out_.emit_line("),", 2);
            out_.emit_line(");");
        }
        out_.emit_line("}");
        out_.emit_blank();

        std::string element_type =
            n.prefix + infix + "NotifierProviderElement<" + n.base + ", " + value + ">";
        out_.emit_line("@override");
        out_.emit_line(element_type + " createElement() {");
        out_.emit_line("return _" + n.provider + "Element(this);", 2);
        out_.emit_line("}");
        out_.emit_blank();

        gen_provider_identity(n, params);
    }
    out_.emit_line("}");
    out_.emit_blank();

    gen_ref_and_element(n, params, n.prefix + infix + "NotifierProviderRef<" + value + ">",
                        n.prefix + infix + "NotifierProviderElement<" + n.base + ", " + value +
                            ">");
}

} // namespace sfg::emit
