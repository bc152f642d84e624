#include "emit/dart_writer.hpp"

namespace sfg::emit {

void DartWriter::emit_line(std::string_view text) {
    emit_line(text, 0);
}

void DartWriter::emit_line(std::string_view text, size_t extra) {
    if (text.empty()) {
        output_ += '\n';
        return;
    }
    output_.append(indent_width() + extra, ' ');
    output_ += text;
    output_ += '\n';
}

void DartWriter::emit_blank() {
    output_ += '\n';
}

void DartWriter::emit_raw(std::string_view text) {
    output_ += text;
}

auto join(const std::vector<std::string>& items, std::string_view sep) -> std::string {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

} // namespace sfg::emit
