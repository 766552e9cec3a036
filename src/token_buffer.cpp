#include "dslex/token_buffer.hpp"

#include <string>
#include <utility>

namespace dslex {

static std::size_t checked_capacity(std::size_t capacity) {
    if (capacity < 2)
        throw std::invalid_argument("TokenBuffer capacity must be at least 2, got " + std::to_string(capacity));
    return capacity;
}

TokenBuffer::TokenBuffer(std::istream& in, std::shared_ptr<const Vocabulary> vocab, std::size_t capacity)
    : s_(in, std::move(vocab)), ring_(checked_capacity(capacity)) {}

TokenBuffer::TokenBuffer(std::string_view text, std::shared_ptr<const Vocabulary> vocab, std::size_t capacity)
    : s_(text, std::move(vocab)), ring_(checked_capacity(capacity)) {}

ScanResult TokenBuffer::scan() {
    return scan_with([this] { return s_.scan(); });
}

ScanResult TokenBuffer::scan_regex() {
    return scan_with([this] { return s_.scan_regex(); });
}

void TokenBuffer::unscan() {
    if (pending_ + 1 >= ring_.size())
        throw UnscanError("unscan: at most " + std::to_string(ring_.size() - 1) + " tokens can be pushed back");
    if (pending_ + 1 > stored_)
        throw UnscanError("unscan: only " + std::to_string(stored_) + " tokens have been scanned");
    ++pending_;
}

ScanResult TokenBuffer::current() const {
    return ring_[(write_ + ring_.size() - pending_) % ring_.size()];
}

} // namespace dslex
