#include "dslex/token.hpp"

namespace dslex {

TokCategory category(TokKind k) {
    switch (k) {
        case TokKind::Illegal:
        case TokKind::Eof:
        case TokKind::Ws:
            return TokCategory::Special;

        case TokKind::LParen:
        case TokKind::RParen:
        case TokKind::LBracket:
        case TokKind::RBracket:
        case TokKind::LCurly:
        case TokKind::RCurly:
        case TokKind::Comma:
        case TokKind::Semicolon:
        case TokKind::Colon:
        case TokKind::Percent:
        case TokKind::Dollar:
        case TokKind::Hash:
        case TokKind::AtSign:
            return TokCategory::Punctuation;

        case TokKind::Ident:
        case TokKind::Number:
        case TokKind::Duration:
        case TokKind::String:
        case TokKind::BadString:
        case TokKind::BadEscape:
        case TokKind::True:
        case TokKind::False:
        case TokKind::Regex:
        case TokKind::BadRegex:
            return TokCategory::Literal;

        case TokKind::Plus:
        case TokKind::Minus:
        case TokKind::Mul:
        case TokKind::Div:
        case TokKind::Ampersand:
        case TokKind::Xor:
        case TokKind::Pipe:
        case TokKind::LShift:
        case TokKind::RShift:
        case TokKind::Pow:
        case TokKind::EqArrow:
        case TokKind::And:
        case TokKind::Or:
        case TokKind::Eq:
        case TokKind::Neq:
        case TokKind::EqRegex:
        case TokKind::NeqRegex:
        case TokKind::Lt:
        case TokKind::Lte:
        case TokKind::Gt:
        case TokKind::Gte:
            return TokCategory::Operator;
    }
    if (static_cast<int>(k) >= kFirstUserToken) return TokCategory::Keyword;
    return TokCategory::Special;
}

bool is_operator(TokKind k) { return category(k) == TokCategory::Operator; }

int precedence(TokKind k) {
    switch (k) {
        case TokKind::Or:        return 1;
        case TokKind::And:       return 2;
        case TokKind::Eq:
        case TokKind::Neq:
        case TokKind::EqRegex:
        case TokKind::NeqRegex:
        case TokKind::Lt:
        case TokKind::Lte:
        case TokKind::Gt:
        case TokKind::Gte:       return 3;
        case TokKind::Plus:
        case TokKind::Minus:     return 4;
        case TokKind::Mul:
        case TokKind::Div:       return 5;
        case TokKind::Pipe:
        case TokKind::Xor:
        case TokKind::LShift:
        case TokKind::RShift:
        case TokKind::Pow:       return 6;
        default:                 return 0;
    }
}

std::string_view builtin_string(TokKind k) {
    switch (k) {
        case TokKind::Illegal:   return "ILLEGAL";
        case TokKind::Eof:       return "EOF";
        case TokKind::Ws:        return "WS";

        case TokKind::LParen:    return "(";
        case TokKind::RParen:    return ")";
        case TokKind::LBracket:  return "[";
        case TokKind::RBracket:  return "]";
        case TokKind::LCurly:    return "{";
        case TokKind::RCurly:    return "}";
        case TokKind::Comma:     return ",";
        case TokKind::Semicolon: return ";";
        case TokKind::Colon:     return ":";
        case TokKind::Percent:   return "%";
        case TokKind::Dollar:    return "$";
        case TokKind::Hash:      return "#";
        case TokKind::AtSign:    return "@";

        case TokKind::Ident:     return "IDENT";
        case TokKind::Number:    return "NUMBER";
        case TokKind::Duration:  return "DURATION";
        case TokKind::String:    return "STRING";
        case TokKind::BadString: return "BADSTRING";
        case TokKind::BadEscape: return "BADESCAPE";
        case TokKind::True:      return "true";
        case TokKind::False:     return "false";
        case TokKind::Regex:     return "REGEX";
        case TokKind::BadRegex:  return "BADREGEX";

        case TokKind::Plus:      return "+";
        case TokKind::Minus:     return "-";
        case TokKind::Mul:       return "*";
        case TokKind::Div:       return "/";
        case TokKind::Ampersand: return "&";
        case TokKind::Xor:       return "^";
        case TokKind::Pipe:      return "|";
        case TokKind::LShift:    return "<<";
        case TokKind::RShift:    return ">>";
        case TokKind::Pow:       return "**";
        case TokKind::EqArrow:   return "=>";
        case TokKind::And:       return "AND";
        case TokKind::Or:        return "OR";
        case TokKind::Eq:        return "=";
        case TokKind::Neq:       return "!=";
        case TokKind::EqRegex:   return "=~";
        case TokKind::NeqRegex:  return "!~";
        case TokKind::Lt:        return "<";
        case TokKind::Lte:       return "<=";
        case TokKind::Gt:        return ">";
        case TokKind::Gte:       return ">=";
    }
    return {};
}

bool operator==(const ScanResult& a, const ScanResult& b) {
    return a.tok == b.tok && a.pos == b.pos && a.lit == b.lit;
}

std::ostream& operator<<(std::ostream& os, TokKind k) {
    std::string_view s = builtin_string(k);
    if (s.empty()) return os << "TOKEN(" << static_cast<int>(k) << ')';
    return os << s;
}

std::ostream& operator<<(std::ostream& os, const ScanResult& r) {
    os << r.pos << ' ' << r.tok;
    if (!r.lit.empty()) os << " \"" << r.lit << '"';
    return os;
}

} // namespace dslex
