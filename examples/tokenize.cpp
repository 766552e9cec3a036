#include <dslex/scanner.hpp>
#include <dslex/vocabulary.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>

// Reads stdin and prints one token per line:
//   line:column KIND "literal"
//
//   dslex_tokenize [--show-ws] [--keyword NAME]...

static void usage() {
    std::cerr << "usage: dslex_tokenize [--show-ws] [--keyword NAME]...\n";
}

int main(int argc, char** argv) {
    bool show_ws = false;
    std::map<dslex::TokKind, std::string> keywords;
    int next_id = dslex::kFirstUserToken;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--show-ws") {
            show_ws = true;
        } else if (arg == "--keyword" && i + 1 < argc) {
            keywords[static_cast<dslex::TokKind>(next_id++)] = argv[++i];
        } else {
            usage();
            return 2;
        }
    }

    auto vocab = std::make_shared<dslex::Vocabulary>();
    try {
        vocab->load(keywords);
    } catch (const dslex::VocabularyError& e) {
        std::cerr << "dslex_tokenize: " << e.what() << "\n";
        return 2;
    }

    dslex::Scanner scanner(std::cin, vocab);
    int errors = 0;
    for (;;) {
        dslex::ScanResult r = scanner.scan();
        if (r.tok == dslex::TokKind::Eof) break;
        if (r.tok == dslex::TokKind::Ws && !show_ws) continue;

        std::cout << r.pos << ' ' << vocab->to_string(r.tok);
        if (!r.lit.empty()) std::cout << " \"" << r.lit << '"';
        std::cout << "\n";

        switch (r.tok) {
            case dslex::TokKind::Illegal:
            case dslex::TokKind::BadString:
            case dslex::TokKind::BadEscape:
            case dslex::TokKind::BadRegex:
                ++errors;
                break;
            default:
                break;
        }
    }
    return errors == 0 ? 0 : 1;
}
