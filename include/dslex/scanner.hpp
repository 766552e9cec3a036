#pragma once
#include <istream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "dslex/reader.hpp"
#include "dslex/token.hpp"
#include "dslex/vocabulary.hpp"

namespace dslex {

// Lexical scanner. Turns a rune stream into (kind, position, literal)
// results. Malformed input is reported in-band (ILLEGAL, BADSTRING,
// BADESCAPE, BADREGEX) and scanning can always continue afterwards.
//
// Not safe for concurrent use; create one scanner per input.
class Scanner {
public:
    explicit Scanner(std::istream& in,
                     std::shared_ptr<const Vocabulary> vocab = Vocabulary::builtin());
    explicit Scanner(std::string_view text,
                     std::shared_ptr<const Vocabulary> vocab = Vocabulary::builtin());

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /// Next token. Whitespace runs come back as a single WS token; EOF is
    /// returned once the input is exhausted.
    ScanResult scan();

    /// Read a /regex/ starting at the next rune. Only callers know when a
    /// slash opens a regex rather than a division, so scan() never does this.
    ScanResult scan_regex();

    // Next rune without consuming it.
    char32_t peek() { return r_.peek(); }

    const Vocabulary& vocabulary() const { return *vocab_; }

private:
    ScanResult scan_whitespace();
    ScanResult scan_ident();
    ScanResult scan_string();
    ScanResult scan_number();
    ScanResult scan_operator(const Rune& r0);
    std::string scan_digits();

    std::unique_ptr<std::istringstream> owned_; // set when scanning a string_view
    RuneReader r_;
    std::shared_ptr<const Vocabulary> vocab_;
};

} // namespace dslex
