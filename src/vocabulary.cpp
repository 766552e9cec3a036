#include "dslex/vocabulary.hpp"

#include <cctype>

namespace dslex {

static std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

Vocabulary::Vocabulary() {
    for (int i = static_cast<int>(TokKind::Illegal); i <= static_cast<int>(kLastBuiltin); ++i) {
        TokKind k = static_cast<TokKind>(i);
        strings_.emplace(k, std::string(builtin_string(k)));
    }
    add_keyword(TokKind::And, "and");
    add_keyword(TokKind::Or, "or");
    add_keyword(TokKind::True, "true");
    add_keyword(TokKind::False, "false");
}

std::shared_ptr<const Vocabulary> Vocabulary::builtin() {
    static const std::shared_ptr<const Vocabulary> v = std::make_shared<Vocabulary>();
    return v;
}

void Vocabulary::add_keyword(TokKind k, std::string_view name) {
    keywords_[to_lower(name)] = k;
}

void Vocabulary::load(const std::map<TokKind, std::string>& tokens) {
    // Validate everything first so a bad entry leaves the tables untouched.
    for (const auto& [k, s] : tokens) {
        if (static_cast<int>(k) < kFirstUserToken)
            throw VocabularyError("Token id " + std::to_string(static_cast<int>(k)) +
                                  " is inside the built-in range (host ids start at " +
                                  std::to_string(kFirstUserToken) + ")");
        if (s.empty())
            throw VocabularyError("Empty display string for token id " + std::to_string(static_cast<int>(k)));
    }

    for (const auto& [k, s] : tokens) {
        auto prev = strings_.find(k);
        if (prev != strings_.end()) {
            auto kw = keywords_.find(to_lower(prev->second));
            if (kw != keywords_.end() && kw->second == k) keywords_.erase(kw);
        }
        strings_[k] = s;
    }
    for (const auto& [k, s] : tokens) add_keyword(k, s);
}

TokKind Vocabulary::lookup(std::string_view ident) const {
    auto it = keywords_.find(to_lower(ident));
    if (it == keywords_.end()) return TokKind::Ident;
    return it->second;
}

std::string Vocabulary::to_string(TokKind k) const {
    auto it = strings_.find(k);
    if (it == strings_.end()) return {};
    return it->second;
}

std::string Vocabulary::tokstr(TokKind k, std::string_view lit) const {
    if (!lit.empty()) return std::string(lit);
    return to_string(k);
}

} // namespace dslex
