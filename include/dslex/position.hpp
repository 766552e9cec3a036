#pragma once
#include <ostream>

namespace dslex {

// Line and column of a rune in the input. Both are zero-based.
struct Pos {
    int line{0};
    int column{0};
};

inline bool operator==(const Pos& a, const Pos& b) { return a.line == b.line && a.column == b.column; }
inline bool operator!=(const Pos& a, const Pos& b) { return !(a == b); }

// Prints "line:column".
std::ostream& operator<<(std::ostream& os, const Pos& p);

} // namespace dslex
