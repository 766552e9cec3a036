#include <gtest/gtest.h>
#include <dslex/scanner.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using dslex::Pos;
using dslex::ScanResult;
using dslex::Scanner;
using dslex::TokKind;

// Everything up to and including EOF.
static std::vector<ScanResult> scan_all(Scanner& s) {
    std::vector<ScanResult> out;
    for (;;) {
        out.push_back(s.scan());
        if (out.back().tok == TokKind::Eof || out.size() > 1000) break;
    }
    return out;
}

static std::vector<ScanResult> scan_all(std::string_view text) {
    Scanner s(text);
    return scan_all(s);
}

static ScanResult first(std::string_view text) {
    Scanner s(text);
    return s.scan();
}

TEST(Scanner, IdentifierRun) {
    auto toks = scan_all("hello");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Ident, {0, 0}, "hello"}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Eof, {0, 5}, ""}));

    EXPECT_EQ(first("_foo_bar9 x"), (ScanResult{TokKind::Ident, {0, 0}, "_foo_bar9"}));
}

TEST(Scanner, KeywordsAnyCase) {
    EXPECT_EQ(first("AND"), (ScanResult{TokKind::And, {0, 0}, ""}));
    EXPECT_EQ(first("and"), (ScanResult{TokKind::And, {0, 0}, ""}));
    EXPECT_EQ(first("oR"), (ScanResult{TokKind::Or, {0, 0}, ""}));
    EXPECT_EQ(first("True"), (ScanResult{TokKind::True, {0, 0}, ""}));
    EXPECT_EQ(first("false"), (ScanResult{TokKind::False, {0, 0}, ""}));
    EXPECT_EQ(first("andy"), (ScanResult{TokKind::Ident, {0, 0}, "andy"}));
}

TEST(Scanner, HostKeywords) {
    const auto kSelect = static_cast<TokKind>(dslex::kFirstUserToken);
    const auto kLimit = static_cast<TokKind>(dslex::kFirstUserToken + 1);

    auto vocab = std::make_shared<dslex::Vocabulary>();
    vocab->load({{kSelect, "SELECT"}, {kLimit, "limit"}});

    Scanner s("select x LIMIT 10", vocab);
    auto toks = scan_all(s);
    ASSERT_EQ(toks.size(), 8u);
    EXPECT_EQ(toks[0], (ScanResult{kSelect, {0, 0}, ""}));
    EXPECT_EQ(toks[2], (ScanResult{TokKind::Ident, {0, 7}, "x"}));
    EXPECT_EQ(toks[4], (ScanResult{kLimit, {0, 9}, ""}));
    EXPECT_EQ(toks[6], (ScanResult{TokKind::Number, {0, 15}, "10"}));

    // A scanner on the built-in vocabulary is unaffected.
    EXPECT_EQ(first("select").tok, TokKind::Ident);
}

TEST(Scanner, WhitespaceIsCoalesced) {
    auto toks = scan_all("a   b");
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Ident, {0, 0}, "a"}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Ws, {0, 1}, "   "}));
    EXPECT_EQ(toks[2], (ScanResult{TokKind::Ident, {0, 4}, "b"}));
    EXPECT_EQ(toks[3].tok, TokKind::Eof);

    auto mixed = scan_all(" \t\n x");
    ASSERT_EQ(mixed.size(), 3u);
    EXPECT_EQ(mixed[0], (ScanResult{TokKind::Ws, {0, 0}, " \t\n "}));
    EXPECT_EQ(mixed[1], (ScanResult{TokKind::Ident, {1, 1}, "x"}));
}

TEST(Scanner, TrailingWhitespaceThenEof) {
    auto toks = scan_all("x  ");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Ws, {0, 1}, "  "}));
    EXPECT_EQ(toks[2].tok, TokKind::Eof);
}

TEST(Scanner, EmptyInput) {
    Scanner s("");
    EXPECT_EQ(s.scan(), (ScanResult{TokKind::Eof, {0, 0}, ""}));
    EXPECT_EQ(s.scan().tok, TokKind::Eof);
}

TEST(Scanner, SignsAndNumbers) {
    EXPECT_EQ(first("+"), (ScanResult{TokKind::Plus, {0, 0}, ""}));
    EXPECT_EQ(first("-"), (ScanResult{TokKind::Minus, {0, 0}, ""}));
    EXPECT_EQ(first("+3"), (ScanResult{TokKind::Number, {0, 0}, "+3"}));
    EXPECT_EQ(first("-42"), (ScanResult{TokKind::Number, {0, 0}, "-42"}));
    EXPECT_EQ(first("-.5"), (ScanResult{TokKind::Number, {0, 0}, "-.5"}));
    EXPECT_EQ(first("+.25x"), (ScanResult{TokKind::Number, {0, 0}, "+.25"}));
    EXPECT_EQ(first(".5"), (ScanResult{TokKind::Number, {0, 0}, ".5"}));
    EXPECT_EQ(first("3.14159"), (ScanResult{TokKind::Number, {0, 0}, "3.14159"}));
}

TEST(Scanner, SignNotFollowedByNumber) {
    auto toks = scan_all("-x");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Minus, {0, 0}, ""}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Ident, {0, 1}, "x"}));

    auto dot = scan_all("+.x");
    ASSERT_EQ(dot.size(), 4u);
    EXPECT_EQ(dot[0], (ScanResult{TokKind::Plus, {0, 0}, ""}));
    EXPECT_EQ(dot[1], (ScanResult{TokKind::Illegal, {0, 1}, "."}));
    EXPECT_EQ(dot[2], (ScanResult{TokKind::Ident, {0, 2}, "x"}));

    auto bin = scan_all("a-1");
    ASSERT_EQ(bin.size(), 3u);
    EXPECT_EQ(bin[1], (ScanResult{TokKind::Number, {0, 1}, "-1"}));
}

TEST(Scanner, LoneDotIsIllegal) {
    auto toks = scan_all(".");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Illegal, {0, 0}, "."}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Eof, {0, 1}, ""}));
}

TEST(Scanner, DotWithoutFractionIsLeftBehind) {
    auto toks = scan_all("1.x");
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Number, {0, 0}, "1"}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Illegal, {0, 1}, "."}));
    EXPECT_EQ(toks[2], (ScanResult{TokKind::Ident, {0, 2}, "x"}));
}

TEST(Scanner, Durations) {
    EXPECT_EQ(first("10s"), (ScanResult{TokKind::Duration, {0, 0}, "10s"}));
    EXPECT_EQ(first("10ms"), (ScanResult{TokKind::Duration, {0, 0}, "10ms"}));
    EXPECT_EQ(first("5m"), (ScanResult{TokKind::Duration, {0, 0}, "5m"}));
    EXPECT_EQ(first("3u"), (ScanResult{TokKind::Duration, {0, 0}, "3u"}));
    EXPECT_EQ(first("3\xC2\xB5"), (ScanResult{TokKind::Duration, {0, 0}, "3\xC2\xB5"}));
    EXPECT_EQ(first("2h"), (ScanResult{TokKind::Duration, {0, 0}, "2h"}));
    EXPECT_EQ(first("7d"), (ScanResult{TokKind::Duration, {0, 0}, "7d"}));
    EXPECT_EQ(first("1w"), (ScanResult{TokKind::Duration, {0, 0}, "1w"}));
    EXPECT_EQ(first("-30s"), (ScanResult{TokKind::Duration, {0, 0}, "-30s"}));
    EXPECT_EQ(first("10"), (ScanResult{TokKind::Number, {0, 0}, "10"}));
    EXPECT_EQ(first("10x"), (ScanResult{TokKind::Number, {0, 0}, "10"}));
}

TEST(Scanner, DurationUnitIsOneRune) {
    auto toks = scan_all("10mx");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Duration, {0, 0}, "10m"}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Ident, {0, 3}, "x"}));

    auto sec = scan_all("10sec");
    ASSERT_EQ(sec.size(), 3u);
    EXPECT_EQ(sec[0], (ScanResult{TokKind::Duration, {0, 0}, "10s"}));
    EXPECT_EQ(sec[1], (ScanResult{TokKind::Ident, {0, 3}, "ec"}));
}

TEST(Scanner, FractionalNumbersNeverBecomeDurations) {
    auto toks = scan_all("10.5s");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Number, {0, 0}, "10.5"}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Ident, {0, 4}, "s"}));
    EXPECT_EQ(toks[2].tok, TokKind::Eof);
}

TEST(Scanner, Strings) {
    EXPECT_EQ(first("'hello world'"), (ScanResult{TokKind::String, {0, 0}, "hello world"}));
    EXPECT_EQ(first(R"('it\'s')"), (ScanResult{TokKind::String, {0, 0}, "it's"}));
    EXPECT_EQ(first("''"), (ScanResult{TokKind::String, {0, 0}, ""}));

    auto toks = scan_all("x = 'a b'");
    ASSERT_EQ(toks.size(), 6u);
    EXPECT_EQ(toks[4], (ScanResult{TokKind::String, {0, 4}, "a b"}));
}

TEST(Scanner, UnterminatedString) {
    auto toks = scan_all("  'abc");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[1], (ScanResult{TokKind::BadString, {0, 2}, "abc"}));
    EXPECT_EQ(toks[2].tok, TokKind::Eof);
}

TEST(Scanner, BadEscapeKeepsScanning) {
    Scanner s(R"('ab\xcd' 1)");
    EXPECT_EQ(s.scan(), (ScanResult{TokKind::BadEscape, {0, 4}, "ab"}));
    // The scanner resumes right after the bad escape.
    EXPECT_EQ(s.scan(), (ScanResult{TokKind::Ident, {0, 5}, "cd"}));
}

TEST(Scanner, QuotedIdentifier) {
    EXPECT_EQ(first(R"("foo bar")"), (ScanResult{TokKind::Ident, {0, 0}, "foo bar"}));
    EXPECT_EQ(first(R"("and")"), (ScanResult{TokKind::Ident, {0, 0}, "and"}));
    EXPECT_EQ(first(R"("say \"hi\"")"), (ScanResult{TokKind::Ident, {0, 0}, "say \"hi\""}));
}

TEST(Scanner, QuotedIdentifierFailures) {
    EXPECT_EQ(first(R"("open)"), (ScanResult{TokKind::BadString, {0, 0}, "open"}));
    EXPECT_EQ(first(R"("a\tb")"), (ScanResult{TokKind::BadEscape, {0, 3}, "a"}));
}

TEST(Scanner, BareThenQuotedIdentifier) {
    // The quoted part replaces the bare prefix.
    auto toks = scan_all(R"(abc"def ghi" x)");
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Ident, {0, 0}, "def ghi"}));
    EXPECT_EQ(toks[2], (ScanResult{TokKind::Ident, {0, 13}, "x"}));

    EXPECT_EQ(first(R"(abc"def)"), (ScanResult{TokKind::BadString, {0, 3}, "def"}));
}

TEST(Scanner, Punctuation) {
    auto toks = scan_all("()[]{},;:%$#@");
    std::vector<TokKind> want{
        TokKind::LParen, TokKind::RParen, TokKind::LBracket, TokKind::RBracket,
        TokKind::LCurly, TokKind::RCurly, TokKind::Comma,    TokKind::Semicolon,
        TokKind::Colon,  TokKind::Percent, TokKind::Dollar,  TokKind::Hash,
        TokKind::AtSign, TokKind::Eof,
    };
    ASSERT_EQ(toks.size(), want.size());
    for (std::size_t i = 0; i < want.size(); ++i) {
        EXPECT_EQ(toks[i].tok, want[i]) << "at " << i;
        EXPECT_EQ(toks[i].pos, (Pos{0, static_cast<int>(i)}));
        EXPECT_TRUE(toks[i].lit.empty());
    }
}

TEST(Scanner, Operators) {
    auto toks = scan_all("* / & ^ | = < > != !~ =~ >= <= >> << <>");
    std::vector<TokKind> want{
        TokKind::Mul, TokKind::Div, TokKind::Ampersand, TokKind::Xor,     TokKind::Pipe,
        TokKind::Eq,  TokKind::Lt,  TokKind::Gt,
        TokKind::Neq, TokKind::NeqRegex, TokKind::EqRegex, TokKind::Gte,  TokKind::Lte,
        TokKind::RShift, TokKind::LShift, TokKind::Neq,
    };
    std::vector<TokKind> got;
    for (const auto& t : toks) {
        if (t.tok == TokKind::Ws || t.tok == TokKind::Eof) continue;
        EXPECT_TRUE(t.lit.empty());
        got.push_back(t.tok);
    }
    EXPECT_EQ(got, want);
}

TEST(Scanner, OperatorsWithoutSpaces) {
    auto toks = scan_all("a<=b<c");
    ASSERT_EQ(toks.size(), 6u);
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Lte, {0, 1}, ""}));
    EXPECT_EQ(toks[2], (ScanResult{TokKind::Ident, {0, 3}, "b"}));
    EXPECT_EQ(toks[3], (ScanResult{TokKind::Lt, {0, 4}, ""}));
}

TEST(Scanner, StarsAndArrowsAreSingleCharacters) {
    auto pow = scan_all("2**3");
    ASSERT_EQ(pow.size(), 5u);
    EXPECT_EQ(pow[1], (ScanResult{TokKind::Mul, {0, 1}, ""}));
    EXPECT_EQ(pow[2], (ScanResult{TokKind::Mul, {0, 2}, ""}));
    EXPECT_EQ(pow[3], (ScanResult{TokKind::Number, {0, 3}, "3"}));

    auto arrow = scan_all("a=>b");
    ASSERT_EQ(arrow.size(), 5u);
    EXPECT_EQ(arrow[1], (ScanResult{TokKind::Eq, {0, 1}, ""}));
    EXPECT_EQ(arrow[2], (ScanResult{TokKind::Gt, {0, 2}, ""}));

    std::vector<TokKind> kinds;
    for (const auto& t : scan_all("a==>b")) kinds.push_back(t.tok);
    std::vector<TokKind> want{TokKind::Ident, TokKind::Eq, TokKind::Eq, TokKind::Gt, TokKind::Ident, TokKind::Eof};
    EXPECT_EQ(kinds, want);
}

TEST(Scanner, IllegalCharacters) {
    auto toks = scan_all("!x ?");
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[0], (ScanResult{TokKind::Illegal, {0, 0}, "!"}));
    EXPECT_EQ(toks[1], (ScanResult{TokKind::Ident, {0, 1}, "x"}));
    EXPECT_EQ(toks[3], (ScanResult{TokKind::Illegal, {0, 3}, "?"}));

    EXPECT_EQ(first("\xE2\x82\xAC"), (ScanResult{TokKind::Illegal, {0, 0}, "\xE2\x82\xAC"}));
    EXPECT_EQ(first("!"), (ScanResult{TokKind::Illegal, {0, 0}, "!"}));
}

TEST(Scanner, PositionsAcrossLines) {
    auto toks = scan_all("a\n  b\r\nc");
    ASSERT_EQ(toks.size(), 6u);
    EXPECT_EQ(toks[2], (ScanResult{TokKind::Ident, {1, 2}, "b"}));
    EXPECT_EQ(toks[3], (ScanResult{TokKind::Ws, {1, 3}, "\n"}));
    EXPECT_EQ(toks[4], (ScanResult{TokKind::Ident, {2, 0}, "c"}));
}

TEST(Scanner, Regex) {
    Scanner s(R"(/ab\/c.*/ rest)");
    EXPECT_EQ(s.scan_regex(), (ScanResult{TokKind::Regex, {0, 0}, "ab/c.*"}));
    EXPECT_EQ(s.scan().tok, TokKind::Ws);
    EXPECT_EQ(s.scan(), (ScanResult{TokKind::Ident, {0, 10}, "rest"}));
}

TEST(Scanner, RegexAfterMatchOperator) {
    Scanner s("name =~ /^x/");
    EXPECT_EQ(s.scan().tok, TokKind::Ident);
    EXPECT_EQ(s.scan().tok, TokKind::Ws);
    EXPECT_EQ(s.scan().tok, TokKind::EqRegex);
    EXPECT_EQ(s.scan().tok, TokKind::Ws);
    EXPECT_EQ(s.peek(), U'/');
    EXPECT_EQ(s.scan_regex(), (ScanResult{TokKind::Regex, {0, 8}, "^x"}));
    EXPECT_EQ(s.scan().tok, TokKind::Eof);
}

TEST(Scanner, RegexFailures) {
    {
        Scanner s("/abc");
        EXPECT_EQ(s.scan_regex(), (ScanResult{TokKind::BadRegex, {0, 0}, "abc"}));
        EXPECT_EQ(s.scan().tok, TokKind::Eof);
    }
    {
        Scanner s(R"(/a\d/)");
        EXPECT_EQ(s.scan_regex(), (ScanResult{TokKind::BadEscape, {0, 3}, "a"}));
    }
    {
        Scanner s("x/");
        EXPECT_EQ(s.scan_regex().tok, TokKind::BadRegex);
    }
    {
        Scanner s("/a\nb/");
        EXPECT_EQ(s.scan_regex(), (ScanResult{TokKind::BadRegex, {0, 0}, "a"}));
        EXPECT_EQ(s.scan(), (ScanResult{TokKind::Ident, {1, 0}, "b"}));
    }
}

TEST(Scanner, ReadsFromStream) {
    std::istringstream in("count >= 3");
    Scanner s(in);
    auto toks = scan_all(s);
    ASSERT_EQ(toks.size(), 6u);
    EXPECT_EQ(toks[2], (ScanResult{TokKind::Gte, {0, 6}, ""}));
    EXPECT_EQ(toks[4], (ScanResult{TokKind::Number, {0, 9}, "3"}));
}

TEST(Scanner, Expression) {
    std::vector<TokKind> kinds;
    for (const auto& t : scan_all("f(x, -2.5) * 10ms AND NOT_A_KEYWORD")) {
        if (t.tok != TokKind::Ws) kinds.push_back(t.tok);
    }
    std::vector<TokKind> want{
        TokKind::Ident, TokKind::LParen, TokKind::Ident, TokKind::Comma, TokKind::Number,
        TokKind::RParen, TokKind::Mul, TokKind::Duration, TokKind::And, TokKind::Ident,
        TokKind::Eof,
    };
    EXPECT_EQ(kinds, want);
}

} // namespace
