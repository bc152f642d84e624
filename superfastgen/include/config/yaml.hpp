//! # YAML Subset Parser
//!
//! `SimpleYamlParser` reads the subset of YAML used by `superfastgen.yaml`.
//!
//! | Construct | Example |
//! |-----------|---------|
//! | comments | `# note`, `key: value  # note` |
//! | nested mappings | `generate:` followed by indented `key: value` lines |
//! | scalars | `lib/`, `'lib/'`, `"lib/"`, `true`, `150` |
//! | inline sequences | `input: [lib, test]` |
//! | block sequences | `input:` followed by indented `- lib` lines |
//! | inline mappings | `assets: { ... }` (kept as raw text) |
//!
//! Keys are flattened into dotted paths: `generate.input`, `watch.debounce_ms`.

#ifndef SFG_CONFIG_YAML_HPP
#define SFG_CONFIG_YAML_HPP

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfg::config {

struct ConfigError {
    std::string path;
    std::string message;
    uint32_t line = 0;
};

struct YamlValue {
    std::string scalar;
    std::vector<std::string> items;
    bool is_list = false;
    uint32_t line = 0;

    /// `true`/`false`/`yes`/`no`/`on`/`off`, `nullopt` otherwise.
    [[nodiscard]] auto as_bool() const -> std::optional<bool>;

    [[nodiscard]] auto as_int() const -> std::optional<int64_t>;

    /// Items of a sequence, or the scalar as a one-element list.
    [[nodiscard]] auto as_list() const -> std::vector<std::string>;
};

struct YamlDocument {
    /// Dotted key path to value. Mapping keys without a value of their own are absent.
    std::map<std::string, YamlValue> values;

    [[nodiscard]] auto get(std::string_view key) const -> const YamlValue*;
};

class SimpleYamlParser {
public:
    explicit SimpleYamlParser(std::string content);

    [[nodiscard]] auto parse() -> Result<YamlDocument, ConfigError>;

private:
    struct Frame {
        size_t indent;
        std::string key;
    };

    std::string content_;
    std::vector<Frame> stack_;
    std::string pending_list_key_;
    size_t pending_list_indent_ = 0;
    uint32_t line_ = 0;

    [[nodiscard]] auto error(std::string message) const -> ConfigError;
    [[nodiscard]] auto key_path(const std::string& key) const -> std::string;

    /// Parses a scalar, stripping quotes and trailing comments.
    [[nodiscard]] auto parse_scalar(std::string_view text) const -> Result<std::string, ConfigError>;
    [[nodiscard]] auto parse_inline_list(std::string_view text) const
        -> Result<std::vector<std::string>, ConfigError>;
};

} // namespace sfg::config

#endif // SFG_CONFIG_YAML_HPP
