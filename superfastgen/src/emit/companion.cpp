#include "emit/companion.hpp"

#include "crypto/digest.hpp"
#include "emit/dart_writer.hpp"
#include "emit/freezed_generator.hpp"
#include "emit/riverpod_generator.hpp"
#include "log/log.hpp"

namespace sfg::emit {

namespace {

constexpr std::string_view RIVERPOD_FOOTER =
    "// ignore_for_file: type=lint\n"
    "// ignore_for_file: subtype_of_sealed_class, invalid_use_of_internal_member, "
    "invalid_use_of_visible_for_testing_member\n";

auto index_of(model::VariantTag tag) -> size_t {
    return static_cast<size_t>(tag);
}

void append_unsupported(CompanionSet& set, std::vector<UnsupportedTypeError>& from) {
    for (auto& u : from) {
        set.unsupported.push_back(std::move(u));
    }
}

auto identity(std::string_view path, const std::vector<std::string>& names,
              const std::string& digest) -> std::string {
    return std::string(path) + "#" + join(names, ",") + "@" + digest;
}

/// Generated members would reference type parameters they never declare.
auto generic_error(const model::Declaration& decl) -> EmitError {
    return EmitError{.declaration = decl.name,
                     .message = "generic declaration " + decl.name + "<" +
                                join(decl.type_params, ", ") +
                                "> is not supported; nothing was generated for it"};
}

} // anonymous namespace

auto section_banner(std::string_view generator) -> std::string {
    DartWriter out;
    out.emit_line("// **************************************************************************");
    out.emit_line("// " + std::string(generator));
    out.emit_line("// **************************************************************************");
    return out.take();
}

auto g_file_header(std::string_view part_of) -> std::string {
    DartWriter out;
    out.emit_line(GENERATED_HEADER);
    out.emit_blank();
    out.emit_line("part of '" + std::string(part_of) + "';");
    out.emit_blank();
    return out.take();
}

auto assemble_companions(const model::SourceModel& source, std::string_view source_text,
                         const classify::ClassificationResult& classes,
                         const CompanionPaths& paths, const CompanionOptions& options)
    -> CompanionSet {
    CompanionSet set;

    std::vector<FreezedTarget> freezed_targets;
    std::vector<JsonTarget> json_targets;
    std::vector<RiverpodTarget> riverpod_targets;
    std::vector<std::string> freezed_names;
    std::vector<std::string> g_names;

    for (const auto& c : classes.classified) {
        const auto& decl = *c.declaration;
        switch (model::variant_tag(c.variant)) {
        case model::VariantTag::Immutable: {
            const auto& v = std::get<model::ImmutableVariant>(c.variant);
            set.wants_freezed = true;
            set.wants_g |= v.with_json;
            if (!decl.type_params.empty()) {
                set.errors.push_back(generic_error(decl));
                break;
            }
            if (options.freezed) {
                freezed_targets.push_back(
                    FreezedTarget{.declaration = &decl, .with_json = v.with_json});
                freezed_names.push_back(decl.name);
                ++set.emitted[index_of(model::VariantTag::Immutable)];
            }
            if (v.with_json && options.json) {
                for (auto& t : json_targets_for_freezed(decl)) {
                    json_targets.push_back(std::move(t));
                }
                g_names.push_back(decl.name);
            }
            break;
        }
        case model::VariantTag::JsonCodec:
            set.wants_g = true;
            if (!decl.type_params.empty()) {
                set.errors.push_back(generic_error(decl));
                break;
            }
            if (options.json) {
                json_targets.push_back(json_target_for_class(decl));
                g_names.push_back(decl.name);
                ++set.emitted[index_of(model::VariantTag::JsonCodec)];
            }
            break;
        case model::VariantTag::Provider:
            set.wants_g = true;
            if (!decl.type_params.empty()) {
                set.errors.push_back(generic_error(decl));
                break;
            }
            if (options.riverpod) {
                riverpod_targets.push_back(RiverpodTarget{
                    .declaration = &decl, .variant = std::get<model::ProviderVariant>(c.variant)});
                g_names.push_back(decl.name);
                ++set.emitted[index_of(model::VariantTag::Provider)];
            }
            break;
        }
    }

    if (freezed_targets.empty() && json_targets.empty() && riverpod_targets.empty()) {
        return set;
    }

    auto digest = crypto::sha1_hex(source_text);
    if (is_err(digest)) {
        set.errors.push_back(EmitError{.declaration = "",
                                       .message = "cannot fingerprint " + source.path + ": " +
                                                  unwrap_err(digest).message});
        return set;
    }
    const std::string& fingerprint = unwrap(digest);

    if (!freezed_targets.empty()) {
        FreezedGenerator freezed;
        auto output = freezed.generate(freezed_targets, paths.part_of);
        append_unsupported(set, output.unsupported);
        set.results.push_back(model::EmissionResult{
            .target = paths.freezed,
            .text = std::move(output.text),
            .source_identity = identity(source.path, freezed_names, fingerprint),
            .variants = {model::VariantTag::Immutable}});
    }

    if (json_targets.empty() && riverpod_targets.empty()) {
        return set;
    }

    std::vector<model::VariantTag> g_variants;
    std::string text = g_file_header(paths.part_of);
    if (!json_targets.empty()) {
        g_variants.push_back(model::VariantTag::JsonCodec);
        JsonGenerator json(source, options.json_options);
        auto output = json.generate(json_targets);
        append_unsupported(set, output.unsupported);
        text += section_banner("JsonSerializableGenerator");
        text += "\n";
        text += output.text;
    }
    if (!riverpod_targets.empty()) {
        RiverpodGenerator riverpod;
        auto output = riverpod.generate(riverpod_targets);
        if (is_err(output)) {
            auto& error = unwrap_err(output);
            SFG_LOG_ERROR("emit", source.path << ": " << error.message);
            set.errors.push_back(std::move(error));
            set.emitted[index_of(model::VariantTag::Provider)] = 0;
            if (json_targets.empty()) {
                return set;
            }
        } else {
            if (!json_targets.empty()) {
                text += "\n";
            }
            text += section_banner("RiverpodGenerator");
            text += "\n";
            text += unwrap(output).text;
            text += RIVERPOD_FOOTER;
            g_variants.push_back(model::VariantTag::Provider);
        }
    }

    SFG_LOG_DEBUG("emit", source.path << ": " << json_targets.size() << " json target(s), "
                                      << riverpod_targets.size() << " provider(s)");
    set.results.push_back(model::EmissionResult{.target = paths.g,
                                                .text = std::move(text),
                                                .source_identity =
                                                    identity(source.path, g_names, fingerprint),
                                                .variants = std::move(g_variants)});
    return set;
}

} // namespace sfg::emit
