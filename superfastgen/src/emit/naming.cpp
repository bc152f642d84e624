#include "emit/naming.hpp"

#include <cctype>

namespace sfg::emit {

auto impl_class_name(std::string_view redirect) -> std::string {
    std::string_view base = redirect;
    auto dot = base.find('.');
    if (dot != std::string_view::npos) {
        base = base.substr(0, dot);
    }
    while (!base.empty() && base.front() == '_') {
        base.remove_prefix(1);
    }
    return "_$" + std::string(base) + "Impl";
}

auto pascal_case(std::string_view name) -> std::string {
    std::string out(name);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

auto camel_case(std::string_view name) -> std::string {
    std::string out(name);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    }
    return out;
}

auto provider_variable(std::string_view name) -> std::string {
    return camel_case(name) + "Provider";
}

auto provider_class(std::string_view name) -> std::string {
    return pascal_case(name) + "Provider";
}

auto family_class(std::string_view name) -> std::string {
    return pascal_case(name) + "Family";
}

auto ref_name(std::string_view name) -> std::string {
    return pascal_case(name) + "Ref";
}

auto file_stem(std::string_view path) -> std::string {
    auto slash = path.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        path = path.substr(slash + 1);
    }
    constexpr std::string_view ext = ".dart";
    if (path.size() > ext.size() && path.substr(path.size() - ext.size()) == ext) {
        path = path.substr(0, path.size() - ext.size());
    }
    return std::string(path);
}

auto raw_string(std::string_view text) -> std::string {
    if (text.find('\'') == std::string_view::npos) {
        return "r'" + std::string(text) + "'";
    }
    if (text.find('"') == std::string_view::npos) {
        return "r\"" + std::string(text) + "\"";
    }
    // Both quote kinds: no raw form can hold the text.
    std::string out = "'";
    for (char c : text) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\'':
            out += "\\'";
            break;
        case '$':
            out += "\\$";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            out += c;
        }
    }
    out += "'";
    return out;
}

auto param_declaration(const model::Parameter& param) -> std::string {
    std::string out;
    if (param.is_named() && param.required) {
        out += "required ";
    }
    out += param.type.to_dart();
    out += " ";
    out += param.name;
    return out;
}

} // namespace sfg::emit
