#include "lexer/token.hpp"

namespace sfg::lexer {

auto Token::string_value() const -> std::optional<std::string> {
    if (kind != TokenKind::StringLiteral || interpolated) {
        return std::nullopt;
    }

    std::string_view text = lexeme;
    bool raw = false;
    if (!text.empty() && text[0] == 'r') {
        raw = true;
        text.remove_prefix(1);
    }

    size_t quote_len = 1;
    if (text.size() >= 6 && (text.starts_with("'''") || text.starts_with("\"\"\""))) {
        quote_len = 3;
    }
    if (text.size() < quote_len * 2) {
        return std::nullopt;
    }
    text = text.substr(quote_len, text.size() - quote_len * 2);

    // A triple-quoted string drops a newline directly after the opening quotes.
    if (quote_len == 3 && !text.empty() && text[0] == '\n') {
        text.remove_prefix(1);
    }

    if (raw) {
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\\' || i + 1 >= text.size()) {
            out += c;
            continue;
        }
        char e = text[++i];
        switch (e) {
        case 'n':
            out += '\n';
            break;
        case 't':
            out += '\t';
            break;
        case 'r':
            out += '\r';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'v':
            out += '\v';
            break;
        default:
            out += e;
            break;
        }
    }
    return out;
}

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of file";
    case TokenKind::Error:
        return "error";
    case TokenKind::IntLiteral:
        return "integer";
    case TokenKind::DoubleLiteral:
        return "double";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::KwAssert:
        return "assert";
    case TokenKind::KwBreak:
        return "break";
    case TokenKind::KwCase:
        return "case";
    case TokenKind::KwCatch:
        return "catch";
    case TokenKind::KwClass:
        return "class";
    case TokenKind::KwConst:
        return "const";
    case TokenKind::KwContinue:
        return "continue";
    case TokenKind::KwDefault:
        return "default";
    case TokenKind::KwDo:
        return "do";
    case TokenKind::KwElse:
        return "else";
    case TokenKind::KwEnum:
        return "enum";
    case TokenKind::KwExtends:
        return "extends";
    case TokenKind::KwFalse:
        return "false";
    case TokenKind::KwFinal:
        return "final";
    case TokenKind::KwFinally:
        return "finally";
    case TokenKind::KwFor:
        return "for";
    case TokenKind::KwIf:
        return "if";
    case TokenKind::KwIn:
        return "in";
    case TokenKind::KwIs:
        return "is";
    case TokenKind::KwNew:
        return "new";
    case TokenKind::KwNull:
        return "null";
    case TokenKind::KwRethrow:
        return "rethrow";
    case TokenKind::KwReturn:
        return "return";
    case TokenKind::KwSuper:
        return "super";
    case TokenKind::KwSwitch:
        return "switch";
    case TokenKind::KwThis:
        return "this";
    case TokenKind::KwThrow:
        return "throw";
    case TokenKind::KwTrue:
        return "true";
    case TokenKind::KwTry:
        return "try";
    case TokenKind::KwVar:
        return "var";
    case TokenKind::KwVoid:
        return "void";
    case TokenKind::KwWhile:
        return "while";
    case TokenKind::KwWith:
        return "with";
    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";
    case TokenKind::LBracket:
        return "[";
    case TokenKind::RBracket:
        return "]";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Semi:
        return ";";
    case TokenKind::Colon:
        return ":";
    case TokenKind::Dot:
        return ".";
    case TokenKind::DotDot:
        return "..";
    case TokenKind::Ellipsis:
        return "...";
    case TokenKind::At:
        return "@";
    case TokenKind::Hash:
        return "#";
    case TokenKind::Question:
        return "?";
    case TokenKind::QuestionDot:
        return "?.";
    case TokenKind::Arrow:
        return "=>";
    case TokenKind::Eq:
        return "=";
    case TokenKind::EqEq:
        return "==";
    case TokenKind::Bang:
        return "!";
    case TokenKind::BangEq:
        return "!=";
    case TokenKind::Lt:
        return "<";
    case TokenKind::Le:
        return "<=";
    case TokenKind::Gt:
        return ">";
    case TokenKind::Ge:
        return ">=";
    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::Slash:
        return "/";
    case TokenKind::TildeSlash:
        return "~/";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Amp:
        return "&";
    case TokenKind::AmpAmp:
        return "&&";
    case TokenKind::Pipe:
        return "|";
    case TokenKind::PipePipe:
        return "||";
    case TokenKind::Caret:
        return "^";
    case TokenKind::Tilde:
        return "~";
    case TokenKind::PlusPlus:
        return "++";
    case TokenKind::MinusMinus:
        return "--";
    case TokenKind::QuestionQuestion:
        return "??";
    case TokenKind::CompoundAssign:
        return "compound assignment";
    case TokenKind::ShiftLeft:
        return "<<";
    }
    return "unknown";
}

} // namespace sfg::lexer
