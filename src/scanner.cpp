#include "dslex/scanner.hpp"

#include <utility>

namespace dslex {

namespace {

// Operators spelled with two characters. A first character listed here
// costs one rune of lookahead before falling back to kSingle.
struct OperatorPair {
    char32_t first;
    char32_t second;
    TokKind kind;
};

constexpr OperatorPair kPairs[] = {
    {'!', '=', TokKind::Neq},
    {'!', '~', TokKind::NeqRegex},
    {'=', '~', TokKind::EqRegex},
    {'>', '=', TokKind::Gte},
    {'>', '>', TokKind::RShift},
    {'<', '=', TokKind::Lte},
    {'<', '>', TokKind::Neq},
    {'<', '<', TokKind::LShift},
};

struct OperatorSingle {
    char32_t ch;
    TokKind kind;
};

constexpr OperatorSingle kSingle[] = {
    {'(', TokKind::LParen},    {')', TokKind::RParen},
    {'[', TokKind::LBracket},  {']', TokKind::RBracket},
    {'{', TokKind::LCurly},    {'}', TokKind::RCurly},
    {',', TokKind::Comma},     {';', TokKind::Semicolon},
    {':', TokKind::Colon},     {'%', TokKind::Percent},
    {'$', TokKind::Dollar},    {'#', TokKind::Hash},
    {'@', TokKind::AtSign},    {'*', TokKind::Mul},
    {'/', TokKind::Div},       {'&', TokKind::Ampersand},
    {'^', TokKind::Xor},       {'|', TokKind::Pipe},
    {'=', TokKind::Eq},        {'<', TokKind::Lt},
    {'>', TokKind::Gt},
};

constexpr char32_t kMicroSign = 0x00B5; // µ

bool starts_pair(char32_t ch) {
    for (const auto& p : kPairs)
        if (p.first == ch) return true;
    return false;
}

} // namespace

Scanner::Scanner(std::istream& in, std::shared_ptr<const Vocabulary> vocab)
    : r_(in), vocab_(std::move(vocab)) {
    if (!vocab_) vocab_ = Vocabulary::builtin();
}

Scanner::Scanner(std::string_view text, std::shared_ptr<const Vocabulary> vocab)
    : owned_(std::make_unique<std::istringstream>(std::string(text))), r_(*owned_), vocab_(std::move(vocab)) {
    if (!vocab_) vocab_ = Vocabulary::builtin();
}

ScanResult Scanner::scan() {
    Rune r0 = r_.read();

    if (is_whitespace(r0.ch)) return scan_whitespace();

    if (is_letter(r0.ch) || r0.ch == '_' || r0.ch == '"') {
        r_.unread();
        return scan_ident();
    }

    if (is_digit(r0.ch) || r0.ch == '.' || r0.ch == '+' || r0.ch == '-') return scan_number();

    if (r0.ch == '\'') return scan_string();

    if (r0.ch == kEof) return {TokKind::Eof, r0.pos, {}};

    return scan_operator(r0);
}

// Consumes the current rune and all contiguous whitespace.
ScanResult Scanner::scan_whitespace() {
    Rune first = r_.current();
    std::string buf;
    append_utf8(buf, first.ch);

    for (;;) {
        Rune c = r_.read();
        if (c.ch == kEof) break;
        if (!is_whitespace(c.ch)) {
            r_.unread();
            break;
        }
        append_utf8(buf, c.ch);
    }
    return {TokKind::Ws, first.pos, std::move(buf)};
}

// Bare identifiers are looked up in the keyword table. A double quote
// switches to quoted mode: the quoted text becomes the whole literal and
// any bare prefix read so far is dropped.
ScanResult Scanner::scan_ident() {
    const Pos pos = r_.read().pos;
    r_.unread();

    std::string buf;
    for (;;) {
        Rune c = r_.read();
        if (c.ch == kEof) break;

        if (c.ch == '"') {
            ScanResult q = scan_string();
            if (q.tok == TokKind::BadString || q.tok == TokKind::BadEscape) return q;
            return {TokKind::Ident, pos, std::move(q.lit)};
        }

        r_.unread();
        if (!is_ident_char(c.ch)) break;
        buf += scan_bare_ident(r_);
    }

    TokKind k = vocab_->lookup(buf);
    if (k != TokKind::Ident) return {k, pos, {}};
    return {TokKind::Ident, pos, std::move(buf)};
}

// The opening quote is the current rune.
ScanResult Scanner::scan_string() {
    const Pos pos = r_.current().pos;
    r_.unread();

    LiteralScan q = scan_quoted(r_);
    switch (q.status) {
        case LiteralStatus::Ok:        return {TokKind::String, pos, std::move(q.text)};
        case LiteralStatus::BadEscape: return {TokKind::BadEscape, q.err_pos, std::move(q.text)};
        default:                       return {TokKind::BadString, pos, std::move(q.text)};
    }
}

// Entered on a digit, '.', '+' or '-'. Signs and dots that do not start a
// number come back as PLUS, MINUS or ILLEGAL. A duration unit is only
// recognised directly after an integral value ("10s", not "10.5s").
ScanResult Scanner::scan_number() {
    const Rune first = r_.current();
    std::string buf;

    if (first.ch == '+' || first.ch == '-') {
        char32_t ch1 = r_.read().ch;
        char32_t ch2 = r_.read().ch;
        r_.unread();
        r_.unread();

        if (!is_digit(ch1) && !(ch1 == '.' && is_digit(ch2)))
            return {first.ch == '+' ? TokKind::Plus : TokKind::Minus, first.pos, {}};
        append_utf8(buf, first.ch);
    } else if (first.ch == '.') {
        char32_t ch1 = r_.read().ch;
        r_.unread();
        if (!is_digit(ch1)) return {TokKind::Illegal, first.pos, "."};
        r_.unread(); // re-read the dot below
    } else {
        r_.unread();
    }

    buf += scan_digits();

    Rune dot = r_.read();
    if (dot.ch == '.') {
        Rune d = r_.read();
        if (is_digit(d.ch)) {
            buf += '.';
            append_utf8(buf, d.ch);
            buf += scan_digits();
        } else {
            r_.unread();
            r_.unread();
        }
    } else {
        r_.unread();
    }

    if (buf.find('.') == std::string::npos) {
        Rune unit = r_.read();
        switch (unit.ch) {
            case 'u':
            case kMicroSign:
            case 's':
            case 'h':
            case 'd':
            case 'w':
                append_utf8(buf, unit.ch);
                return {TokKind::Duration, first.pos, std::move(buf)};
            case 'm': {
                buf += 'm';
                Rune s = r_.read();
                if (s.ch == 's') buf += 's';
                else r_.unread();
                return {TokKind::Duration, first.pos, std::move(buf)};
            }
            default:
                r_.unread();
                break;
        }
    }
    return {TokKind::Number, first.pos, std::move(buf)};
}

std::string Scanner::scan_digits() {
    std::string buf;
    for (;;) {
        Rune c = r_.read();
        if (!is_digit(c.ch)) {
            r_.unread();
            break;
        }
        buf += static_cast<char>(c.ch);
    }
    return buf;
}

ScanResult Scanner::scan_operator(const Rune& r0) {
    if (starts_pair(r0.ch)) {
        char32_t ch1 = r_.read().ch;
        for (const auto& p : kPairs)
            if (p.first == r0.ch && p.second == ch1) return {p.kind, r0.pos, {}};
        r_.unread();
    }

    for (const auto& s : kSingle)
        if (s.ch == r0.ch) return {s.kind, r0.pos, {}};

    std::string lit;
    append_utf8(lit, r0.ch);
    return {TokKind::Illegal, r0.pos, std::move(lit)};
}

ScanResult Scanner::scan_regex() {
    const Pos pos = r_.read().pos;
    r_.unread();

    static const std::map<char32_t, char32_t> escapes{{'/', '/'}};
    LiteralScan d = scan_delimited(r_, '/', '/', escapes);
    switch (d.status) {
        case LiteralStatus::Ok:        return {TokKind::Regex, pos, std::move(d.text)};
        case LiteralStatus::BadEscape: return {TokKind::BadEscape, d.err_pos, std::move(d.text)};
        default:                       return {TokKind::BadRegex, pos, std::move(d.text)};
    }
}

} // namespace dslex
