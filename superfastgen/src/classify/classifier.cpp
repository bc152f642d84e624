#include "classify/classifier.hpp"

#include "log/log.hpp"

namespace sfg::classify {

auto recognize_marker(std::string_view name) -> std::optional<MarkerKind> {
    if (name == "freezed" || name == "Freezed") {
        return MarkerKind::Immutable;
    }
    if (name == "JsonSerializable") {
        return MarkerKind::Json;
    }
    if (name == "riverpod" || name == "Riverpod") {
        return MarkerKind::Provider;
    }
    return std::nullopt;
}

auto ClassificationResult::with_tag(model::VariantTag tag) const
    -> std::vector<const ClassifiedDeclaration*> {
    std::vector<const ClassifiedDeclaration*> out;
    for (const auto& c : classified) {
        if (model::variant_tag(c.variant) == tag) {
            out.push_back(&c);
        }
    }
    return out;
}

// ============================================================================
// Provider Parameters
// ============================================================================

namespace {

auto is_context_param(const model::Parameter& param) -> bool {
    if (param.kind != model::ParameterKind::Positional) {
        return false;
    }
    if (param.name == "ref") {
        return true;
    }
    const auto& type = param.type.name;
    return type.size() >= 3 && type.compare(type.size() - 3, 3, "Ref") == 0;
}

} // anonymous namespace

auto context_param_index(const model::Declaration& decl) -> std::optional<size_t> {
    if (decl.kind != model::DeclarationKind::PlainFunction || decl.params.empty()) {
        return std::nullopt;
    }
    if (is_context_param(decl.params.front())) {
        return 0;
    }
    return std::nullopt;
}

auto family_params(const model::Declaration& decl) -> std::vector<model::Parameter> {
    auto ctx = context_param_index(decl);
    std::vector<model::Parameter> out;
    for (size_t i = 0; i < decl.params.size(); ++i) {
        if (ctx && *ctx == i) {
            continue;
        }
        out.push_back(decl.params[i]);
    }
    return out;
}

// ============================================================================
// Classifier
// ============================================================================

void Classifier::warn(const model::Declaration& decl, std::string message) {
    SFG_LOG_DEBUG("classify", decl.name << ": " << message);
    warnings_.push_back(extract::ExtractionWarning{
        .declaration = decl.name, .message = std::move(message), .line = decl.line, .column = decl.column});
}

auto Classifier::classify_provider(const model::Declaration& decl)
    -> std::optional<model::ProviderVariant> {
    model::ProviderVariant variant;
    for (const auto& m : decl.markers) {
        if (m.name == "Riverpod" && m.flag("keepAlive")) {
            variant.keep_alive = true;
        }
    }

    switch (decl.kind) {
    case model::DeclarationKind::PlainFunction:
        if (!context_param_index(decl)) {
            warn(decl, "provider function has no 'ref' parameter; all parameters key the family");
        }
        variant.is_family = !family_params(decl).empty();
        return variant;
    case model::DeclarationKind::StatefulUnit:
        variant.is_unit = true;
        variant.is_family = !decl.params.empty();
        return variant;
    case model::DeclarationKind::ValueType:
        warn(decl, "provider classes must extend _$" + decl.name +
                       " and declare a build method; nothing generated");
        return std::nullopt;
    }
    return std::nullopt;
}

auto Classifier::classify(const model::Declaration& decl)
    -> Result<std::optional<model::GenerationVariant>, ConflictError> {
    const model::Marker* immutable = nullptr;
    const model::Marker* json = nullptr;
    const model::Marker* provider = nullptr;

    for (const auto& m : decl.markers) {
        auto kind = recognize_marker(m.name);
        if (!kind) {
            continue;
        }
        switch (*kind) {
        case MarkerKind::Immutable:
            immutable = immutable ? immutable : &m;
            break;
        case MarkerKind::Json:
            json = json ? json : &m;
            break;
        case MarkerKind::Provider:
            provider = provider ? provider : &m;
            break;
        }
    }

    if (provider && (immutable || json)) {
        ConflictError err{.declaration = decl.name, .line = decl.line, .column = decl.column};
        for (const auto* m : {immutable, json, provider}) {
            if (m) {
                err.markers.push_back("@" + m->name);
            }
        }
        err.message = "'" + decl.name + "' combines @" + provider->name + " with @" +
                      (immutable ? immutable : json)->name +
                      "; a provider cannot also be a generated value type";
        return err;
    }

    if (immutable) {
        if (decl.kind != model::DeclarationKind::ValueType) {
            warn(decl, "@" + immutable->name + " only applies to classes; nothing generated");
            return std::optional<model::GenerationVariant>{};
        }
        if (decl.union_cases.empty()) {
            warn(decl, "no redirecting factory constructor; nothing generated");
            return std::optional<model::GenerationVariant>{};
        }
        return std::optional<model::GenerationVariant>{
            model::ImmutableVariant{.with_json = json != nullptr || decl.has_from_json}};
    }

    if (json) {
        if (decl.kind != model::DeclarationKind::ValueType) {
            warn(decl, "@JsonSerializable only applies to classes; nothing generated");
            return std::optional<model::GenerationVariant>{};
        }
        return std::optional<model::GenerationVariant>{model::JsonCodecVariant{}};
    }

    if (provider) {
        auto variant = classify_provider(decl);
        if (!variant) {
            return std::optional<model::GenerationVariant>{};
        }
        return std::optional<model::GenerationVariant>{*variant};
    }

    return std::optional<model::GenerationVariant>{};
}

auto Classifier::classify_all(const model::SourceModel& source) -> ClassificationResult {
    warnings_.clear();
    ClassificationResult result;

    for (const auto& decl : source.declarations) {
        auto r = classify(decl);
        if (is_err(r)) {
            auto err = unwrap_err(r);
            SFG_LOG_INFO("classify", source.path << ": " << err.message);
            result.conflicts.push_back(std::move(err));
            continue;
        }
        auto variant = unwrap(r);
        if (variant) {
            result.classified.push_back(
                ClassifiedDeclaration{.declaration = &decl, .variant = *variant});
        }
    }

    SFG_LOG_DEBUG("classify", source.path << ": " << result.classified.size() << " classified, "
                                          << result.conflicts.size() << " conflicts");
    result.warnings = std::move(warnings_);
    warnings_.clear();
    return result;
}

} // namespace sfg::classify
