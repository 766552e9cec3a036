#include <dslex/token_buffer.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Infix to Reverse Polish Notation over the dslex token stream.
//
//   echo "a + f(b, 2) * 3 AND name =~ /x.*/" | dslex_rpn
//   a b 2 f/2 3 * + name /x.*/ =~ AND

namespace {

struct RpnError : std::runtime_error { using std::runtime_error::runtime_error; };

struct Converter {
    dslex::TokenBuffer& buf;

    dslex::ScanResult next() {
        for (;;) {
            dslex::ScanResult r = buf.scan();
            if (r.tok != dslex::TokKind::Ws) return r;
        }
    }

    std::string text(const dslex::ScanResult& r) const {
        if (r.tok == dslex::TokKind::Regex) return "/" + r.lit + "/";
        return buf.vocabulary().tokstr(r.tok, r.lit);
    }

    // After =~ or !~ the next slash opens a regex, not a division.
    dslex::ScanResult regex_operand() {
        if (dslex::is_whitespace(buf.peek())) buf.scan();
        dslex::ScanResult r = buf.scan_regex();
        if (r.tok != dslex::TokKind::Regex) throw RpnError("Bad regex at " + position(r));
        return r;
    }

    static std::string position(const dslex::ScanResult& r) {
        return std::to_string(r.pos.line) + ":" + std::to_string(r.pos.column);
    }

    std::vector<std::string> run() {
        struct Frame { std::string name; int argc; bool saw_any_arg; };

        std::vector<std::string> output;
        std::vector<dslex::ScanResult> opstack;
        std::vector<Frame> fnstack;

        for (dslex::ScanResult t = next(); t.tok != dslex::TokKind::Eof; t = next()) {
            switch (t.tok) {
                case dslex::TokKind::Ident: {
                    dslex::ScanResult peek = next();
                    if (peek.tok == dslex::TokKind::LParen) {
                        opstack.push_back(t);
                        opstack.push_back(peek);
                        fnstack.push_back(Frame{t.lit, 0, false});
                        continue;
                    }
                    buf.unscan();
                    output.push_back(t.lit);
                    if (!fnstack.empty()) fnstack.back().saw_any_arg = true;
                    continue;
                }

                case dslex::TokKind::Number:
                case dslex::TokKind::Duration:
                case dslex::TokKind::String:
                case dslex::TokKind::True:
                case dslex::TokKind::False:
                    output.push_back(text(t));
                    if (!fnstack.empty()) fnstack.back().saw_any_arg = true;
                    continue;

                case dslex::TokKind::LParen:
                    opstack.push_back(t);
                    continue;

                case dslex::TokKind::Comma:
                    while (!opstack.empty() && opstack.back().tok != dslex::TokKind::LParen) {
                        output.push_back(text(opstack.back()));
                        opstack.pop_back();
                    }
                    if (opstack.empty() || fnstack.empty()) throw RpnError("Comma not within function call at " + position(t));
                    fnstack.back().argc += 1;
                    continue;

                case dslex::TokKind::RParen: {
                    while (!opstack.empty() && opstack.back().tok != dslex::TokKind::LParen) {
                        output.push_back(text(opstack.back()));
                        opstack.pop_back();
                    }
                    if (opstack.empty()) throw RpnError("Mismatched ')' at " + position(t));
                    opstack.pop_back(); // '('

                    if (!opstack.empty() && opstack.back().tok == dslex::TokKind::Ident) {
                        opstack.pop_back();
                        Frame frame = fnstack.back();
                        fnstack.pop_back();
                        int argc = frame.saw_any_arg ? frame.argc + 1 : 0;
                        output.push_back(frame.name + "/" + std::to_string(argc));
                        if (!fnstack.empty()) fnstack.back().saw_any_arg = true;
                    }
                    continue;
                }

                default:
                    break;
            }

            int pcur = dslex::precedence(t.tok);
            if (pcur == 0) throw RpnError("Unexpected " + text(t) + " at " + position(t));

            while (!opstack.empty() && dslex::precedence(opstack.back().tok) >= pcur) {
                output.push_back(text(opstack.back()));
                opstack.pop_back();
            }
            opstack.push_back(t);

            if (t.tok == dslex::TokKind::EqRegex || t.tok == dslex::TokKind::NeqRegex) {
                output.push_back(text(regex_operand()));
                if (!fnstack.empty()) fnstack.back().saw_any_arg = true;
            }
        }

        while (!opstack.empty()) {
            if (opstack.back().tok == dslex::TokKind::LParen) throw RpnError("Mismatched '('");
            if (opstack.back().tok == dslex::TokKind::Ident) throw RpnError("Mismatched function call");
            output.push_back(text(opstack.back()));
            opstack.pop_back();
        }
        return output;
    }
};

} // namespace

int main() {
    std::string line;
    int status = 0;
    while (std::getline(std::cin, line)) {
        dslex::TokenBuffer buf(line);
        try {
            std::vector<std::string> rpn = Converter{buf}.run();
            for (std::size_t i = 0; i < rpn.size(); ++i) {
                if (i) std::cout << ' ';
                std::cout << rpn[i];
            }
            std::cout << "\n";
        } catch (const std::exception& e) {
            std::cerr << "dslex_rpn: " << e.what() << "\n";
            status = 1;
        }
    }
    return status;
}
