//! # YAML Subset Parser
//!
//! Line-oriented: every non-blank, non-comment line is either a
//! `key: value` pair, a `key:` that opens a nested mapping or block
//! sequence, or a `- item` belonging to the innermost open key.
//! Indentation is measured in spaces; tabs are rejected.

#include "config/yaml.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace sfg::config {

namespace {

auto trim(std::string_view s) -> std::string_view {
    size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r')) {
        --end;
    }
    return s.substr(start, end - start);
}

auto lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Position of the `:` separating key and value, skipping quoted text.
auto find_separator(std::string_view line) -> size_t {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ')) {
            return std::string_view::npos;
        } else if (c == ':' && (i + 1 == line.size() || line[i + 1] == ' ')) {
            return i;
        }
    }
    return std::string_view::npos;
}

/// Strips a trailing ` # comment` outside quotes.
auto strip_comment(std::string_view text) -> std::string_view {
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#' && (i == 0 || text[i - 1] == ' ' || text[i - 1] == '\t')) {
            return trim(text.substr(0, i));
        }
    }
    return trim(text);
}

} // anonymous namespace

// ============================================================================
// Values
// ============================================================================

auto YamlValue::as_bool() const -> std::optional<bool> {
    if (is_list) {
        return std::nullopt;
    }
    std::string v = lower(scalar);
    if (v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "off") {
        return false;
    }
    return std::nullopt;
}

auto YamlValue::as_int() const -> std::optional<int64_t> {
    if (is_list || scalar.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    const char* first = scalar.data();
    const char* last = scalar.data() + scalar.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

auto YamlValue::as_list() const -> std::vector<std::string> {
    if (is_list) {
        return items;
    }
    if (scalar.empty()) {
        return {};
    }
    return {scalar};
}

auto YamlDocument::get(std::string_view key) const -> const YamlValue* {
    auto it = values.find(std::string(key));
    return it == values.end() ? nullptr : &it->second;
}

// ============================================================================
// SimpleYamlParser
// ============================================================================

SimpleYamlParser::SimpleYamlParser(std::string content) : content_(std::move(content)) {}

auto SimpleYamlParser::error(std::string message) const -> ConfigError {
    return ConfigError{.path = "", .message = std::move(message), .line = line_};
}

auto SimpleYamlParser::key_path(const std::string& key) const -> std::string {
    std::string path;
    for (const auto& frame : stack_) {
        path += frame.key;
        path += '.';
    }
    return path + key;
}

auto SimpleYamlParser::parse_scalar(std::string_view text) const
    -> Result<std::string, ConfigError> {
    text = trim(text);
    if (text.empty()) {
        return std::string{};
    }
    char quote = text.front();
    if (quote != '\'' && quote != '"') {
        return std::string(strip_comment(text));
    }

    std::string value;
    size_t i = 1;
    bool closed = false;
    while (i < text.size()) {
        char c = text[i];
        if (quote == '\'' && c == '\'') {
            if (i + 1 < text.size() && text[i + 1] == '\'') {
                value += '\'';
                i += 2;
                continue;
            }
            closed = true;
            ++i;
            break;
        }
        if (quote == '"' && c == '\\' && i + 1 < text.size()) {
            char next = text[i + 1];
            switch (next) {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            default:
                value += next;
                break;
            }
            i += 2;
            continue;
        }
        if (quote == '"' && c == '"') {
            closed = true;
            ++i;
            break;
        }
        value += c;
        ++i;
    }
    if (!closed) {
        return error("unterminated quoted string");
    }
    auto rest = trim(text.substr(i));
    if (!rest.empty() && rest.front() != '#') {
        return error("unexpected text after quoted string: '" + std::string(rest) + "'");
    }
    return value;
}

auto SimpleYamlParser::parse_inline_list(std::string_view text) const
    -> Result<std::vector<std::string>, ConfigError> {
    std::vector<std::string> items;
    char quote = 0;
    size_t close = std::string_view::npos;
    for (size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == ']') {
            close = i;
            break;
        }
    }
    if (close == std::string_view::npos) {
        return error("unterminated inline sequence");
    }

    std::string_view body = text.substr(1, close - 1);
    size_t start = 0;
    quote = 0;
    for (size_t i = 0; i <= body.size(); ++i) {
        char c = i < body.size() ? body[i] : ',';
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == ',') {
            auto piece = trim(body.substr(start, i - start));
            start = i + 1;
            if (piece.empty()) {
                continue;
            }
            auto item = parse_scalar(piece);
            if (is_err(item)) {
                return unwrap_err(item);
            }
            items.push_back(std::move(unwrap(item)));
        }
    }
    return items;
}

auto SimpleYamlParser::parse() -> Result<YamlDocument, ConfigError> {
    YamlDocument doc;
    stack_.clear();
    pending_list_key_.clear();
    line_ = 0;

    std::istringstream in(content_);
    std::string raw;
    while (std::getline(in, raw)) {
        ++line_;
        std::string_view line = raw;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') {
            ++indent;
        }
        if (indent < line.size() && line[indent] == '\t') {
            return error("tabs are not allowed in indentation");
        }
        auto rest = trim(line);
        if (rest.empty() || rest.front() == '#' || rest == "---") {
            continue;
        }

        if (rest.front() == '-' && (rest.size() == 1 || rest[1] == ' ')) {
            if (pending_list_key_.empty() || indent < pending_list_indent_) {
                return error("sequence item without an enclosing key");
            }
            auto item = parse_scalar(rest.substr(1));
            if (is_err(item)) {
                return unwrap_err(item);
            }
            auto& value = doc.values[pending_list_key_];
            if (!value.is_list) {
                value.line = line_;
            }
            value.is_list = true;
            value.items.push_back(std::move(unwrap(item)));
            continue;
        }

        size_t sep = find_separator(rest);
        if (sep == std::string_view::npos) {
            return error("expected 'key: value', found '" + std::string(rest) + "'");
        }
        auto key_result = parse_scalar(rest.substr(0, sep));
        if (is_err(key_result)) {
            return unwrap_err(key_result);
        }
        std::string key = std::move(unwrap(key_result));
        if (key.empty()) {
            return error("empty key");
        }

        while (!stack_.empty() && stack_.back().indent >= indent) {
            stack_.pop_back();
        }
        if (!pending_list_key_.empty() && doc.values.count(pending_list_key_) &&
            doc.values[pending_list_key_].is_list && indent > pending_list_indent_) {
            return error("mapping entry inside a sequence is not supported");
        }
        pending_list_key_.clear();

        std::string path = key_path(key);
        auto value_text = strip_comment(rest.substr(sep + 1));

        if (value_text.empty()) {
            stack_.push_back(Frame{.indent = indent, .key = key});
            pending_list_key_ = path;
            pending_list_indent_ = indent;
            continue;
        }

        YamlValue value;
        value.line = line_;
        if (value_text.front() == '[') {
            auto items = parse_inline_list(value_text);
            if (is_err(items)) {
                return unwrap_err(items);
            }
            value.is_list = true;
            value.items = std::move(unwrap(items));
        } else if (value_text.front() == '{') {
            if (value_text.back() != '}') {
                return error("inline mappings must close on the same line");
            }
            value.scalar = std::string(value_text);
        } else {
            auto scalar = parse_scalar(value_text);
            if (is_err(scalar)) {
                return unwrap_err(scalar);
            }
            value.scalar = std::move(unwrap(scalar));
        }
        SFG_LOG_TRACE("config", path << " = " << (value.is_list ? "[...]" : value.scalar));
        doc.values[path] = std::move(value);
    }
    return doc;
}

} // namespace sfg::config
