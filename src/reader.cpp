#include "dslex/reader.hpp"

#include <stdexcept>

namespace dslex {

bool is_whitespace(char32_t ch) { return ch == ' ' || ch == '\t' || ch == '\n'; }
bool is_letter(char32_t ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }
bool is_digit(char32_t ch) { return ch >= '0' && ch <= '9'; }
bool is_ident_char(char32_t ch) { return is_letter(ch) || is_digit(ch) || ch == '_'; }

void append_utf8(std::string& out, char32_t ch) {
    if (ch == kEof) return;
    if (ch > 0x10FFFF || (ch >= 0xD800 && ch <= 0xDFFF)) ch = kReplacementChar;

    if (ch < 0x80) {
        out += static_cast<char>(ch);
    } else if (ch < 0x800) {
        out += static_cast<char>(0xC0 | (ch >> 6));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    } else if (ch < 0x10000) {
        out += static_cast<char>(0xE0 | (ch >> 12));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (ch >> 18));
        out += static_cast<char>(0x80 | ((ch >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
}

// Pull one code point off the stream. Stream failures count as end of input.
char32_t RuneReader::decode() {
    using traits = std::istream::traits_type;

    int c0 = in_.get();
    if (c0 == traits::eof()) return kEof;

    auto b0 = static_cast<unsigned char>(c0);
    if (b0 < 0x80) return b0;

    int extra = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((b0 & 0xE0) == 0xC0) { extra = 1; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { extra = 2; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { extra = 3; cp = b0 & 0x07; min = 0x10000; }
    else return kReplacementChar;

    for (int k = 0; k < extra; ++k) {
        int next = in_.peek();
        if (next == traits::eof() || (static_cast<unsigned char>(next) & 0xC0) != 0x80) {
            // Truncated sequence: leave the offending byte for the next read.
            return kReplacementChar;
        }
        in_.get();
        cp = (cp << 6) | (static_cast<unsigned char>(next) & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return kReplacementChar;
    return cp;
}

Rune RuneReader::read() {
    if (n_ > 0) {
        --n_;
        return current();
    }

    char32_t ch = eof_ ? kEof : decode();
    if (ch == '\r') {
        // Fold "\r\n" into one newline.
        if (in_.peek() == '\n') in_.get();
        ch = '\n';
    }

    i_ = (i_ + 1) % buf_.size();
    buf_[i_] = Rune{ch, pos_};

    if (ch == kEof) {
        eof_ = true;
    } else if (ch == '\n') {
        ++pos_.line;
        pos_.column = 0;
    } else {
        ++pos_.column;
    }
    return current();
}

void RuneReader::unread() {
    if (n_ + 1 >= buf_.size()) throw std::logic_error("RuneReader: pushback history exhausted");
    ++n_;
}

Rune RuneReader::current() const {
    return buf_[(i_ + buf_.size() - n_) % buf_.size()];
}

char32_t RuneReader::peek() {
    char32_t ch = read().ch;
    unread();
    return ch;
}

std::string scan_bare_ident(RuneReader& r) {
    std::string buf;
    for (;;) {
        Rune c = r.read();
        if (c.ch == kEof) break;
        if (!is_ident_char(c.ch)) {
            r.unread();
            break;
        }
        append_utf8(buf, c.ch);
    }
    return buf;
}

LiteralScan scan_quoted(RuneReader& r) {
    LiteralScan out;

    const char32_t ending = r.read().ch;
    if (ending == kEof) {
        out.status = LiteralStatus::BadString;
        return out;
    }

    for (;;) {
        Rune c0 = r.read();
        if (c0.ch == ending) return out;
        if (c0.ch == kEof || c0.ch == '\n') {
            out.status = LiteralStatus::BadString;
            return out;
        }
        if (c0.ch != '\\') {
            append_utf8(out.text, c0.ch);
            continue;
        }

        Rune c1 = r.read();
        switch (c1.ch) {
            case 'n':  out.text += '\n'; break;
            case '\\': out.text += '\\'; break;
            case '"':  out.text += '"'; break;
            case '\'': out.text += '\''; break;
            default:
                out.status = LiteralStatus::BadEscape;
                out.err_pos = c1.pos;
                return out;
        }
    }
}

LiteralScan scan_delimited(RuneReader& r, char32_t start, char32_t end,
                           const std::map<char32_t, char32_t>& escapes) {
    LiteralScan out;

    if (r.read().ch != start) {
        out.status = LiteralStatus::Malformed;
        return out;
    }

    for (;;) {
        Rune c0 = r.read();
        if (c0.ch == end) return out;
        if (c0.ch == kEof || c0.ch == '\n') {
            out.status = LiteralStatus::Malformed;
            return out;
        }
        if (c0.ch != '\\') {
            append_utf8(out.text, c0.ch);
            continue;
        }

        Rune c1 = r.read();
        auto it = escapes.find(c1.ch);
        if (it == escapes.end()) {
            out.status = LiteralStatus::BadEscape;
            out.err_pos = c1.pos;
            return out;
        }
        append_utf8(out.text, it->second);
    }
}

} // namespace dslex
