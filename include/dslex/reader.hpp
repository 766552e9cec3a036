#pragma once
#include <array>
#include <istream>
#include <map>
#include <string>

#include "dslex/position.hpp"

namespace dslex {

// Returned by RuneReader once the input is exhausted (or unreadable).
// Lies outside the Unicode range so NUL bytes stay ordinary runes.
constexpr char32_t kEof = 0xFFFFFFFFu;

// Substituted for bytes that are not valid UTF-8.
constexpr char32_t kReplacementChar = 0xFFFDu;

struct Rune {
    char32_t ch{kEof};
    Pos pos{};
};

bool is_whitespace(char32_t ch);
bool is_letter(char32_t ch);
bool is_digit(char32_t ch);
bool is_ident_char(char32_t ch);

void append_utf8(std::string& out, char32_t ch);

// UTF-8 rune reader with position tracking and a small pushback history.
// "\r\n" and a lone '\r' are both read as '\n'.
class RuneReader {
public:
    explicit RuneReader(std::istream& in) : in_(in) {}

    // Next rune and its position; kEof forever once the stream ends.
    Rune read();

    // Push back the most recently read rune. Up to kHistory - 1 runes can be
    // pending at once; throws std::logic_error beyond that.
    void unread();

    // The last rune handed out by read(), taking unread() into account.
    Rune current() const;

    // Next rune without consuming it.
    char32_t peek();

    static constexpr std::size_t kHistory = 3;

private:
    char32_t decode();

    std::istream& in_;
    std::array<Rune, kHistory> buf_{};
    std::size_t i_{0}; // slot of the newest rune
    std::size_t n_{0}; // runes pushed back
    Pos pos_{};        // position of the next rune
    bool eof_{false};
};

enum class LiteralStatus {
    Ok,
    BadString, // input or line ended before the closing delimiter
    BadEscape, // escape character not in the accepted set
    Malformed, // delimited text without its delimiters
};

struct LiteralScan {
    LiteralStatus status{LiteralStatus::Ok};
    std::string text{}; // content up to the failure point
    Pos err_pos{};      // position of the rejected escape character
};

// Consume a maximal run of identifier characters.
std::string scan_bare_ident(RuneReader& r);

// Read a quoted literal. The first rune read is the quote that also closes
// it; \n \\ \" and \' are the accepted escapes.
LiteralScan scan_quoted(RuneReader& r);

// Read text between start and end, translating "\x" through escapes.
LiteralScan scan_delimited(RuneReader& r, char32_t start, char32_t end,
                           const std::map<char32_t, char32_t>& escapes);

} // namespace dslex
