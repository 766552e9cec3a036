#pragma once
#include <cstddef>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "dslex/scanner.hpp"

namespace dslex {

struct UnscanError : std::out_of_range { using std::out_of_range::out_of_range; };

// Scanner wrapper that remembers the last few results so a recursive-descent
// parser can push tokens back with unscan() and read them again.
class TokenBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 6;

    explicit TokenBuffer(std::istream& in,
                         std::shared_ptr<const Vocabulary> vocab = Vocabulary::builtin(),
                         std::size_t capacity = kDefaultCapacity);
    explicit TokenBuffer(std::string_view text,
                         std::shared_ptr<const Vocabulary> vocab = Vocabulary::builtin(),
                         std::size_t capacity = kDefaultCapacity);

    // Replays a pushed-back result if there is one, otherwise scans.
    ScanResult scan();

    // Same replay rules, but a fresh read goes through Scanner::scan_regex.
    ScanResult scan_regex();

    /// Push the most recently returned result back. At most capacity() - 1
    /// results can be pending, and never more than have been scanned.
    /// Throws UnscanError otherwise.
    void unscan();

    // The result most recently returned by scan()/scan_regex(), accounting
    // for pending replays. Default ScanResult before the first scan.
    ScanResult current() const;

    // Next rune of the underlying input. Pending replays are not considered.
    char32_t peek() { return s_.peek(); }

    std::size_t pending() const { return pending_; }
    std::size_t capacity() const { return ring_.size(); }

    const Vocabulary& vocabulary() const { return s_.vocabulary(); }

private:
    template <class Fn>
    ScanResult scan_with(Fn&& fn) {
        if (pending_ > 0) {
            --pending_;
            return current();
        }
        write_ = (write_ + 1) % ring_.size();
        ring_[write_] = fn();
        if (stored_ < ring_.size()) ++stored_;
        return ring_[write_];
    }

    Scanner s_;
    std::vector<ScanResult> ring_;
    std::size_t write_{0};   // slot holding the newest scanned result
    std::size_t stored_{0};  // filled slots
    std::size_t pending_{0}; // results waiting to be replayed
};

} // namespace dslex
