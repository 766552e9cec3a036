#pragma once
#include <ostream>
#include <string>
#include <string_view>

#include "dslex/position.hpp"

namespace dslex {

// Built-in token kinds. The numeric value is only a stable identifier;
// grouping is answered by category(). Host applications register their own
// kinds from kFirstUserToken upwards (see Vocabulary::load).
enum class TokKind : int {
    Illegal = 0,
    Eof,
    Ws,

    // Punctuation
    LParen,    // (
    RParen,    // )
    LBracket,  // [
    RBracket,  // ]
    LCurly,    // {
    RCurly,    // }
    Comma,     // ,
    Semicolon, // ;
    Colon,     // :
    Percent,   // %
    Dollar,    // $
    Hash,      // #
    AtSign,    // @

    // Literals
    Ident,
    Number,
    Duration,
    String,
    BadString,
    BadEscape,
    True,
    False,
    Regex,
    BadRegex,

    // Operators
    Plus,      // +
    Minus,     // -
    Mul,       // *
    Div,       // /
    Ampersand, // &
    Xor,       // ^
    Pipe,      // |
    LShift,    // <<
    RShift,    // >>
    Pow,       // **
    EqArrow,   // =>
    And,       // AND
    Or,        // OR
    Eq,        // =
    Neq,       // != or <>
    EqRegex,   // =~
    NeqRegex,  // !~
    Lt,        // <
    Lte,       // <=
    Gt,        // >
    Gte,       // >=
};

// Last built-in kind. Keep it pointing at the final enumerator.
constexpr TokKind kLastBuiltin = TokKind::Gte;

// First numeric identifier a host may use for its own kinds.
constexpr int kFirstUserToken = 1000;

enum class TokCategory {
    Special,     // ILLEGAL, EOF, WS
    Punctuation,
    Literal,
    Operator,
    Keyword,     // host-registered
};

TokCategory category(TokKind k);

bool is_operator(TokKind k);

// Binding strength of a binary operator, 0 for anything that is not one.
// OR < AND < comparisons < additive < multiplicative < bitwise/power.
int precedence(TokKind k);

// Canonical display string of a built-in kind, empty for anything else.
// Host kinds are rendered by Vocabulary::to_string.
std::string_view builtin_string(TokKind k);

// One unit of scanner output.
struct ScanResult {
    TokKind tok{TokKind::Illegal};
    Pos pos{};
    std::string lit{}; // empty for fixed-form tokens
};

bool operator==(const ScanResult& a, const ScanResult& b);
inline bool operator!=(const ScanResult& a, const ScanResult& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& os, TokKind k);
std::ostream& operator<<(std::ostream& os, const ScanResult& r);

} // namespace dslex
