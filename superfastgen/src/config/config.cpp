#include "config/config.hpp"

#include "io/output_writer.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <thread>

namespace sfg::config {

namespace {

constexpr size_t MAX_DEFAULT_WORKERS = 8;

constexpr std::string_view KNOWN_KEYS[] = {
    "generate.input",    "generate.output",           "generate.freezed",
    "generate.json",     "generate.riverpod",         "generate.provider",
    "generate.checked",  "generate.include_if_null",  "generate.explicit_to_json",
    "watch.debounce_ms", "watch.poll_ms",             "watch.workers",
    "generate.delete_conflicting_outputs",
};

auto is_known(const std::string& key) -> bool {
    if (key == "assets" || key.starts_with("assets.")) {
        return true;
    }
    return std::find(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), key) != std::end(KNOWN_KEYS);
}

auto read_bool(const YamlDocument& doc, std::string_view key, bool& target)
    -> std::optional<ConfigError> {
    const auto* value = doc.get(key);
    if (!value) {
        return std::nullopt;
    }
    auto b = value->as_bool();
    if (!b) {
        return ConfigError{.path = "",
                           .message = std::string(key) + ": expected a boolean, found '" +
                                      value->scalar + "'",
                           .line = value->line};
    }
    target = *b;
    return std::nullopt;
}

auto read_count(const YamlDocument& doc, std::string_view key, int64_t& target)
    -> std::optional<ConfigError> {
    const auto* value = doc.get(key);
    if (!value) {
        return std::nullopt;
    }
    auto n = value->as_int();
    if (!n || *n < 0) {
        return ConfigError{.path = "",
                           .message = std::string(key) + ": expected a non-negative integer, found '" +
                                      value->scalar + "'",
                           .line = value->line};
    }
    target = *n;
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// GeneratorConfig
// ============================================================================

auto GeneratorConfig::worker_count() const -> size_t {
    if (workers > 0) {
        return workers;
    }
    size_t hw = std::thread::hardware_concurrency();
    return std::clamp<size_t>(hw, 1, MAX_DEFAULT_WORKERS);
}

auto GeneratorConfig::companion_options() const -> emit::CompanionOptions {
    return emit::CompanionOptions{.freezed = is_enabled(model::VariantTag::Immutable),
                                  .json = is_enabled(model::VariantTag::JsonCodec),
                                  .riverpod = is_enabled(model::VariantTag::Provider),
                                  .json_options = json};
}

auto companion_path(const fs::path& source, std::string_view suffix) -> fs::path {
    fs::path out = source;
    out.replace_extension();
    out += std::string(suffix);
    return out;
}

auto GeneratorConfig::companion_paths(const fs::path& source) const -> emit::CompanionPaths {
    if (output_root.empty()) {
        return emit::CompanionPaths{.freezed = companion_path(source, ".freezed.dart"),
                                    .g = companion_path(source, ".g.dart"),
                                    .part_of = source.filename().generic_string()};
    }

    fs::path normal = source.lexically_normal();
    fs::path relative = normal.filename();
    for (const auto& input : input_paths) {
        fs::path rel = normal.lexically_relative(input.lexically_normal());
        if (rel.empty() || rel == "." || *rel.begin() == "..") {
            continue;
        }
        relative = rel;
        break;
    }

    fs::path dir = (output_root / relative.parent_path()).lexically_normal();
    fs::path stem = relative.filename();
    fs::path back = normal.lexically_relative(dir);
    return emit::CompanionPaths{.freezed = companion_path(dir / stem, ".freezed.dart"),
                                .g = companion_path(dir / stem, ".g.dart"),
                                .part_of = back.empty() ? normal.generic_string()
                                                        : back.generic_string()};
}

// ============================================================================
// Loading
// ============================================================================

auto parse_variant_selection(std::string_view name)
    -> std::optional<std::vector<model::VariantTag>> {
    using model::VariantTag;
    if (name == "freezed") {
        return std::vector<VariantTag>{VariantTag::Immutable};
    }
    if (name == "json") {
        return std::vector<VariantTag>{VariantTag::JsonCodec};
    }
    if (name == "riverpod" || name == "provider") {
        return std::vector<VariantTag>{VariantTag::Provider};
    }
    if (name == "all") {
        return std::vector<VariantTag>{VariantTag::Immutable, VariantTag::JsonCodec,
                                       VariantTag::Provider};
    }
    return std::nullopt;
}

auto from_document(const YamlDocument& doc) -> Result<GeneratorConfig, ConfigError> {
    GeneratorConfig config;

    bool has_assets = false;
    for (const auto& [key, value] : doc.values) {
        has_assets |= key == "assets" || key.starts_with("assets.");
        if (!is_known(key)) {
            SFG_LOG_WARN("config", "Ignoring unknown key '" << key << "' (line " << value.line
                                                            << ")");
        }
    }
    if (has_assets) {
        SFG_LOG_INFO("config", "The assets section is not supported and is ignored");
    }

    if (const auto* input = doc.get("generate.input")) {
        auto list = input->as_list();
        if (list.empty()) {
            return ConfigError{.path = "", .message = "generate.input is empty", .line = input->line};
        }
        config.input_paths.assign(list.begin(), list.end());
    }
    if (const auto* output = doc.get("generate.output")) {
        if (output->is_list) {
            return ConfigError{
                .path = "", .message = "generate.output must be a single path", .line = output->line};
        }
        config.output_root = output->scalar;
    }

    bool freezed = true;
    bool json = true;
    bool riverpod = true;
    int64_t debounce = config.debounce.count();
    int64_t poll = config.poll_interval.count();
    int64_t workers = 0;

    std::optional<ConfigError> error;
    auto check = [&](std::optional<ConfigError> e) {
        if (e && !error) {
            error = std::move(e);
        }
    };
    check(read_bool(doc, "generate.freezed", freezed));
    check(read_bool(doc, "generate.json", json));
    if (doc.get("generate.riverpod")) {
        check(read_bool(doc, "generate.riverpod", riverpod));
    } else {
        check(read_bool(doc, "generate.provider", riverpod));
    }
    check(read_bool(doc, "generate.delete_conflicting_outputs", config.delete_conflicting_outputs));
    check(read_bool(doc, "generate.checked", config.json.checked));
    check(read_bool(doc, "generate.include_if_null", config.json.include_if_null));
    check(read_bool(doc, "generate.explicit_to_json", config.json.explicit_to_json));
    check(read_count(doc, "watch.debounce_ms", debounce));
    check(read_count(doc, "watch.poll_ms", poll));
    check(read_count(doc, "watch.workers", workers));
    if (error) {
        return *error;
    }

    config.enabled = {freezed, json, riverpod};
    config.debounce = std::chrono::milliseconds(debounce);
    config.poll_interval = std::chrono::milliseconds(std::max<int64_t>(poll, 10));
    config.workers = static_cast<size_t>(workers);
    return config;
}

auto load_config(const fs::path& path, bool required) -> Result<GeneratorConfig, ConfigError> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (required) {
            return ConfigError{.path = path.string(), .message = "configuration file not found"};
        }
        SFG_LOG_DEBUG("config", "No " << path.string() << ", using defaults");
        return GeneratorConfig{};
    }

    auto content = io::read_file(path);
    if (!content) {
        return ConfigError{.path = path.string(), .message = "cannot read configuration file"};
    }

    SimpleYamlParser parser(std::move(*content));
    auto doc = parser.parse();
    if (is_err(doc)) {
        auto error = std::move(unwrap_err(doc));
        error.path = path.string();
        return error;
    }

    auto config = from_document(unwrap(doc));
    if (is_err(config)) {
        unwrap_err(config).path = path.string();
        return config;
    }
    unwrap(config).source = path;
    SFG_LOG_INFO("config", "Loaded " << path.string());
    return config;
}

void apply_overrides(GeneratorConfig& config, const ConfigOverrides& overrides) {
    if (overrides.variants) {
        config.enabled = {false, false, false};
        for (auto tag : *overrides.variants) {
            config.enabled[static_cast<size_t>(tag)] = true;
        }
    }
    if (overrides.input_paths) {
        config.input_paths = *overrides.input_paths;
    }
    if (overrides.output_root) {
        config.output_root = *overrides.output_root;
    }
    if (overrides.delete_conflicting_outputs) {
        config.delete_conflicting_outputs = *overrides.delete_conflicting_outputs;
    }
}

} // namespace sfg::config
