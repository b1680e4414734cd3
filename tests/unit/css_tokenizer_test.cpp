#include <gtest/gtest.h>
#include <csskit/css/parser/tokenizer.h>

using namespace csskit::css;

// =============================================================================
// Tokenizer Tests
// =============================================================================

class CSSTokenizerTest : public ::testing::Test {};

// Test 1: Ident token
TEST_F(CSSTokenizerTest, IdentToken) {
    auto tokens = CSSTokenizer::tokenize_all("color");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, CSSToken::Ident);
    EXPECT_EQ(tokens[0].value, "color");
    EXPECT_EQ(tokens[0].span, (Span{0, 5}));
    EXPECT_EQ(tokens[1].type, CSSToken::EndOfFile);
}

// Test 2: Hash token drops '#'
TEST_F(CSSTokenizerTest, HashToken) {
    auto tokens = CSSTokenizer::tokenize_all("#fff");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::Hash);
    EXPECT_EQ(tokens[0].value, "fff");
    EXPECT_EQ(tokens[0].span, (Span{0, 4}));
}

// Test 3: Numeric literals keep their full text
TEST_F(CSSTokenizerTest, NumericTokens) {
    auto tokens = CSSTokenizer::tokenize_all("42 16px 50% -1.5em +3");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].type, CSSToken::Number);
    EXPECT_EQ(tokens[0].value, "42");
    EXPECT_EQ(tokens[1].type, CSSToken::Dimension);
    EXPECT_EQ(tokens[1].value, "16px");
    EXPECT_EQ(tokens[2].type, CSSToken::Percentage);
    EXPECT_EQ(tokens[2].value, "50%");
    EXPECT_EQ(tokens[3].type, CSSToken::Dimension);
    EXPECT_EQ(tokens[3].value, "-1.5em");
    EXPECT_EQ(tokens[4].type, CSSToken::Number);
    EXPECT_EQ(tokens[4].value, "+3");
}

// Test 4: Identifier followed by '(' is a function
TEST_F(CSSTokenizerTest, FunctionToken) {
    auto tokens = CSSTokenizer::tokenize_all("rgb(1, 2, 3)");
    ASSERT_GE(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].type, CSSToken::Function);
    EXPECT_EQ(tokens[0].value, "rgb");
    EXPECT_EQ(tokens[0].span, (Span{0, 4}));
    EXPECT_EQ(tokens[1].type, CSSToken::Number);
    EXPECT_EQ(tokens[2].type, CSSToken::Comma);
    EXPECT_EQ(tokens[6].type, CSSToken::CloseParenthesis);
}

// Test 5: At-keyword
TEST_F(CSSTokenizerTest, AtKeywordToken) {
    auto tokens = CSSTokenizer::tokenize_all("@media");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::AtKeyword);
    EXPECT_EQ(tokens[0].value, "media");
}

// Test 6: Quoted strings, both quote styles, escapes kept raw
TEST_F(CSSTokenizerTest, QuotedStrings) {
    auto tokens = CSSTokenizer::tokenize_all(R"("hello" 'it\'s')");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, CSSToken::QuotedString);
    EXPECT_EQ(tokens[0].value, "hello");
    EXPECT_EQ(tokens[1].type, CSSToken::QuotedString);
    EXPECT_EQ(tokens[1].value, "it\\'s");
}

// Test 7: Unterminated string is a bad string
TEST_F(CSSTokenizerTest, UnterminatedString) {
    auto tokens = CSSTokenizer::tokenize_all("\"open");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::BadString);
    EXPECT_EQ(tokens[0].value, "\"open");
}

// Test 8: url() forms
TEST_F(CSSTokenizerTest, UrlForms) {
    auto plain = CSSTokenizer::tokenize_all("url(img/a.png)");
    EXPECT_EQ(plain[0].type, CSSToken::UnquotedUrl);
    EXPECT_EQ(plain[0].value, "img/a.png");

    auto empty = CSSTokenizer::tokenize_all("url()");
    EXPECT_EQ(empty[0].type, CSSToken::BadUrl);

    auto junk = CSSTokenizer::tokenize_all("url(a b)");
    EXPECT_EQ(junk[0].type, CSSToken::BadUrl);

    auto quoted = CSSTokenizer::tokenize_all("url(\"a.png\")");
    ASSERT_GE(quoted.size(), 3u);
    EXPECT_EQ(quoted[0].type, CSSToken::Function);
    EXPECT_EQ(quoted[0].value, "url");
    EXPECT_EQ(quoted[1].type, CSSToken::QuotedString);
    EXPECT_EQ(quoted[2].type, CSSToken::CloseParenthesis);
}

// Test 9: Selector-shaped tokens keep their prefix
TEST_F(CSSTokenizerTest, SelectorTokens) {
    auto tokens = CSSTokenizer::tokenize_all(".note :hover ::before --gap");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].type, CSSToken::ClassSelector);
    EXPECT_EQ(tokens[0].value, ".note");
    EXPECT_EQ(tokens[1].type, CSSToken::PseudoClass);
    EXPECT_EQ(tokens[1].value, ":hover");
    EXPECT_EQ(tokens[2].type, CSSToken::PseudoElement);
    EXPECT_EQ(tokens[2].value, "::before");
    EXPECT_EQ(tokens[3].type, CSSToken::CustomProperty);
    EXPECT_EQ(tokens[3].value, "--gap");
}

// Test 10: Colon before whitespace stays a colon
TEST_F(CSSTokenizerTest, ColonToken) {
    auto tokens = CSSTokenizer::tokenize_all("color: red");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].type, CSSToken::Colon);
    EXPECT_EQ(tokens[2].type, CSSToken::Ident);
}

// Test 11: !important, with and without a space
TEST_F(CSSTokenizerTest, ImportantToken) {
    auto tight = CSSTokenizer::tokenize_all("!important");
    EXPECT_EQ(tight[0].type, CSSToken::Important);
    EXPECT_EQ(tight[0].value, "!important");

    auto spaced = CSSTokenizer::tokenize_all("! IMPORTANT");
    EXPECT_EQ(spaced[0].type, CSSToken::Important);

    auto bang = CSSTokenizer::tokenize_all("!x");
    EXPECT_EQ(bang[0].type, CSSToken::Delim);
    EXPECT_EQ(bang[0].value, "!");
}

// Test 12: Parenthesis and bracket blocks are flat
TEST_F(CSSTokenizerTest, FlatBracketBlocks) {
    auto tokens = CSSTokenizer::tokenize_all("(a (b) c)");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::ParenthesisBlock);
    EXPECT_EQ(tokens[0].value, "(a (b)");

    auto attr = CSSTokenizer::tokenize_all("[type=\"text\"]");
    EXPECT_EQ(attr[0].type, CSSToken::SquareBracketBlock);
    EXPECT_EQ(attr[0].value, "[type=\"text\"]");
}

// Test 13: Curly blocks capture nested braces
TEST_F(CSSTokenizerTest, CurlyBlockCapturesNestedRules) {
    auto tokens = CSSTokenizer::tokenize_all("{ a { b: c; } }");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, CSSToken::CurlyBracketBlock);
    EXPECT_EQ(tokens[0].value, "{ a { b: c; } }");
}

// Test 14: Braces inside strings and comments do not count
TEST_F(CSSTokenizerTest, CurlyBlockIgnoresQuotedBraces) {
    auto tokens = CSSTokenizer::tokenize_all("{ content: \"}\"; /* } */ } tail");
    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, CSSToken::CurlyBracketBlock);
    EXPECT_EQ(tokens[1].type, CSSToken::Ident);
    EXPECT_EQ(tokens[1].value, "tail");
}

// Test 15: An unclosed opener is a plain delimiter
TEST_F(CSSTokenizerTest, UnclosedBlockIsDelim) {
    auto tokens = CSSTokenizer::tokenize_all("{ a");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_TRUE(tokens[0].is_delim('{'));
    EXPECT_EQ(tokens[1].type, CSSToken::Ident);
}

// Test 16: Comments are emitted, whitespace is not
TEST_F(CSSTokenizerTest, CommentsAreTokens) {
    auto tokens = CSSTokenizer::tokenize_all("  /* note */  a");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, CSSToken::Comment);
    EXPECT_EQ(tokens[0].value, " note ");
    EXPECT_EQ(tokens[0].span, (Span{2, 12}));
    EXPECT_EQ(tokens[1].type, CSSToken::Ident);
}

// Test 17: Attribute match operators and HTML comment markers
TEST_F(CSSTokenizerTest, MatchOperatorsAndMarkers) {
    auto tokens = CSSTokenizer::tokenize_all("~= |= ^= $= *= <!-- -->");
    ASSERT_EQ(tokens.size(), 8u);
    EXPECT_EQ(tokens[0].type, CSSToken::IncludeMatch);
    EXPECT_EQ(tokens[1].type, CSSToken::DashMatch);
    EXPECT_EQ(tokens[2].type, CSSToken::PrefixMatch);
    EXPECT_EQ(tokens[3].type, CSSToken::SuffixMatch);
    EXPECT_EQ(tokens[4].type, CSSToken::SubstringMatch);
    EXPECT_EQ(tokens[5].type, CSSToken::CDO);
    EXPECT_EQ(tokens[6].type, CSSToken::CDC);
}

// Test 18: Control bytes are lex errors and scanning continues
TEST_F(CSSTokenizerTest, ControlByteIsInvalid) {
    auto tokens = CSSTokenizer::tokenize_all(std::string("a\x01 b"));
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].type, CSSToken::Invalid);
    EXPECT_EQ(tokens[1].span, (Span{1, 2}));
    EXPECT_EQ(tokens[2].value, "b");
}

// Test 19: Delimiters
TEST_F(CSSTokenizerTest, DelimTokens) {
    auto tokens = CSSTokenizer::tokenize_all("> + ~ * / &");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_TRUE(tokens[0].is_delim('>'));
    EXPECT_TRUE(tokens[1].is_delim('+'));
    EXPECT_TRUE(tokens[2].is_delim('~'));
    EXPECT_TRUE(tokens[3].is_delim('*'));
    EXPECT_TRUE(tokens[4].is_delim('/'));
    EXPECT_TRUE(tokens[5].is_delim('&'));
}

// Test 20: Base offset shifts every span
TEST_F(CSSTokenizerTest, BaseOffsetShiftsSpans) {
    CSSTokenizer tokenizer("color: red", 100);
    auto first = tokenizer.next_token();
    EXPECT_EQ(first.span, (Span{100, 105}));
    auto colon = tokenizer.next_token();
    EXPECT_EQ(colon.span, (Span{105, 106}));
    EXPECT_EQ(tokenizer.position(), 106u);
}

// Test 21: seek() re-reads from an absolute offset
TEST_F(CSSTokenizerTest, SeekRereadsInput) {
    CSSTokenizer tokenizer("a:red", 10);
    tokenizer.next_token();
    auto pseudo = tokenizer.next_token();
    EXPECT_EQ(pseudo.type, CSSToken::PseudoClass);
    tokenizer.seek(pseudo.span.begin + 1);
    auto ident = tokenizer.next_token();
    EXPECT_EQ(ident.type, CSSToken::Ident);
    EXPECT_EQ(ident.value, "red");
    EXPECT_EQ(ident.span, (Span{12, 15}));
}

// Test 22: End of input repeats
TEST_F(CSSTokenizerTest, EndOfFileRepeats) {
    CSSTokenizer tokenizer("");
    EXPECT_EQ(tokenizer.next_token().type, CSSToken::EndOfFile);
    EXPECT_EQ(tokenizer.next_token().type, CSSToken::EndOfFile);
}

// Test 23: Token type names
TEST_F(CSSTokenizerTest, TokenTypeNames) {
    EXPECT_STREQ(token_type_name(CSSToken::Ident), "ident");
    EXPECT_STREQ(token_type_name(CSSToken::CurlyBracketBlock), "{-block");
    EXPECT_STREQ(token_type_name(CSSToken::EndOfFile), "end of input");
}

// Test 24: Unclosed openers stand alone, inner blocks still close
TEST_F(CSSTokenizerTest, UnclosedOpenersAreDelims) {
    auto tokens = CSSTokenizer::tokenize_all("{ { } ( [");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_TRUE(tokens[0].is_delim('{'));
    EXPECT_EQ(tokens[0].span, (Span{0, 1}));
    EXPECT_EQ(tokens[1].type, CSSToken::CurlyBracketBlock);
    EXPECT_EQ(tokens[1].value, "{ }");
    EXPECT_EQ(tokens[1].span, (Span{2, 5}));
    EXPECT_TRUE(tokens[2].is_delim('('));
    EXPECT_TRUE(tokens[3].is_delim('['));
    EXPECT_EQ(tokens[4].type, CSSToken::EndOfFile);
}

// Test 25: Long runs of unclosed openers lex in one pass
TEST_F(CSSTokenizerTest, LongRunsOfUnclosedOpeners) {
    const size_t n = 200000;
    for (char open : {'(', '[', '{'}) {
        auto tokens = CSSTokenizer::tokenize_all(std::string(n, open));
        ASSERT_EQ(tokens.size(), n + 1) << open;
        EXPECT_TRUE(tokens[0].is_delim(open));
        EXPECT_TRUE(tokens[n - 1].is_delim(open));
        EXPECT_EQ(tokens[n - 1].span, (Span{n - 1, n}));
    }

    // Only the innermost brace finds its closer
    auto tokens = CSSTokenizer::tokenize_all(std::string(n, '{') + "}");
    ASSERT_EQ(tokens.size(), n + 1);
    EXPECT_TRUE(tokens[n - 2].is_delim('{'));
    EXPECT_EQ(tokens[n - 1].type, CSSToken::CurlyBracketBlock);
    EXPECT_EQ(tokens[n - 1].span, (Span{n - 1, n + 1}));
}
