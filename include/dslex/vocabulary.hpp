#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "dslex/token.hpp"

namespace dslex {

struct VocabularyError : std::invalid_argument { using std::invalid_argument::invalid_argument; };

// Display strings for every token kind plus the case-insensitive keyword
// table consulted for bare identifiers.
//
// Build and extend a Vocabulary before handing it to a Scanner; scanners
// only ever read it. Sharing one instance between scanners on different
// threads is fine as long as nobody calls load() on it any more.
class Vocabulary {
public:
    // Built-in strings and the keywords and, or, true, false.
    Vocabulary();

    // Process-wide immutable built-in vocabulary.
    static std::shared_ptr<const Vocabulary> builtin();

    /// Merge host kinds into the display strings and, lower-cased, into the
    /// keyword table. Registering a kind again replaces its string.
    /// Throws VocabularyError for kinds below kFirstUserToken or empty strings.
    void load(const std::map<TokKind, std::string>& tokens);

    // Keyword kind for ident (any case), or TokKind::Ident.
    TokKind lookup(std::string_view ident) const;

    // Display string, empty for unknown kinds.
    std::string to_string(TokKind k) const;

    // lit if non-empty, otherwise the display string of k.
    std::string tokstr(TokKind k, std::string_view lit) const;

private:
    void add_keyword(TokKind k, std::string_view name);

    std::map<TokKind, std::string> strings_;
    std::map<std::string, TokKind> keywords_;
};

} // namespace dslex
