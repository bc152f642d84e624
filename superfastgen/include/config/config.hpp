//! # Generator Configuration
//!
//! The resolved configuration value passed to the pipeline and the
//! regeneration coordinator. Loaded from `superfastgen.yaml`, then
//! overridden by command-line flags.
//!
//! | Key | Field | Default |
//! |-----|-------|---------|
//! | `generate.input` | `input_paths` | `lib` |
//! | `generate.output` | `output_root` | empty (companions next to sources) |
//! | `generate.freezed` / `json` / `riverpod` / `provider` | `enabled` | all enabled |
//! | `generate.delete_conflicting_outputs` | `delete_conflicting_outputs` | false |
//! | `generate.checked` / `include_if_null` / `explicit_to_json` | `json` | true / false / false |
//! | `watch.debounce_ms` / `poll_ms` / `workers` | scheduling | 150 / 500 / 0 |
//!
//! A missing file yields the defaults. A malformed one is a `ConfigError`.

#ifndef SFG_CONFIG_CONFIG_HPP
#define SFG_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "config/yaml.hpp"
#include "emit/companion.hpp"
#include "model/variant.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfg::config {

namespace fs = std::filesystem;

inline constexpr std::string_view CONFIG_FILE_NAME = "superfastgen.yaml";

struct GeneratorConfig {
    std::vector<fs::path> input_paths{"lib"};
    fs::path output_root;
    /// Indexed by `model::VariantTag`.
    std::array<bool, 3> enabled{true, true, true};
    bool delete_conflicting_outputs = false;
    emit::JsonOptions json;

    std::chrono::milliseconds debounce{150};
    std::chrono::milliseconds poll_interval{500};
    size_t workers = 0;

    /// File this configuration was read from; empty for defaults.
    fs::path source;

    [[nodiscard]] auto is_enabled(model::VariantTag tag) const -> bool {
        return enabled[static_cast<size_t>(tag)];
    }

    /// Worker threads to use: `workers`, or hardware concurrency capped at 8.
    [[nodiscard]] auto worker_count() const -> size_t;

    [[nodiscard]] auto companion_options() const -> emit::CompanionOptions;

    /// Companion locations for `source`, honoring `output_root`.
    [[nodiscard]] auto companion_paths(const fs::path& source) const -> emit::CompanionPaths;
};

/// Values given on the command line. Unset fields keep the file's value.
struct ConfigOverrides {
    std::optional<std::vector<model::VariantTag>> variants;
    std::optional<std::vector<fs::path>> input_paths;
    std::optional<fs::path> output_root;
    std::optional<bool> delete_conflicting_outputs;
};

/// Maps `freezed`, `json`, `riverpod`, `provider` or `all` to variants.
[[nodiscard]] auto parse_variant_selection(std::string_view name)
    -> std::optional<std::vector<model::VariantTag>>;

/// Builds a configuration from a parsed document.
[[nodiscard]] auto from_document(const YamlDocument& doc) -> Result<GeneratorConfig, ConfigError>;

/// Reads `path`. A missing file gives the defaults unless `required` is set.
[[nodiscard]] auto load_config(const fs::path& path, bool required)
    -> Result<GeneratorConfig, ConfigError>;

void apply_overrides(GeneratorConfig& config, const ConfigOverrides& overrides);

/// Companion path for `source` with the `.dart` extension replaced by `suffix`.
[[nodiscard]] auto companion_path(const fs::path& source, std::string_view suffix) -> fs::path;

} // namespace sfg::config

#endif // SFG_CONFIG_CONFIG_HPP
