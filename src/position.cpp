#include "dslex/position.hpp"

namespace dslex {

std::ostream& operator<<(std::ostream& os, const Pos& p) {
    return os << p.line << ':' << p.column;
}

} // namespace dslex
