#pragma once
#include <csskit/core/span.h>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace csskit::css {

using core::Span;

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, QuotedString, UnquotedUrl,
        BadUrl, BadString, Number, Percentage, Dimension,
        ClassSelector, PseudoClass, PseudoElement, CustomProperty, Important,
        ParenthesisBlock, SquareBracketBlock, CurlyBracketBlock,
        CloseParenthesis, CloseSquareBracket, CloseCurlyBracket,
        Colon, Semicolon, Comma,
        IncludeMatch, DashMatch, PrefixMatch, SuffixMatch, SubstringMatch,
        CDO, CDC, Comment, Delim, Invalid, EndOfFile
    };
    Type type = EndOfFile;
    // Token text. Prefix characters the grammar needs to tell kinds apart are
    // kept (".class", ":hover", "::before", "--var"); "@", "#" and string
    // quotes are stripped. Numeric tokens keep their full literal ("16px").
    std::string value;
    Span span;

    bool is(Type t) const { return type == t; }
    bool is_delim(char c) const {
        return type == Delim && value.size() == 1 && value[0] == c;
    }

    bool operator==(const CSSToken& other) const;
};

const char* token_type_name(CSSToken::Type type);

class CSSTokenizer {
public:
    // base_offset is added to every span, so a tokenizer over a block's
    // substring reports positions in the enclosing source.
    explicit CSSTokenizer(std::string_view input, size_t base_offset = 0);

    // Whitespace is skipped; comments are returned. Unrecognised bytes come
    // back as Invalid tokens and scanning continues after them. Returns
    // EndOfFile forever once the input is exhausted.
    CSSToken next_token();

    // Reposition the cursor to an absolute source offset inside this
    // tokenizer's window.
    void seek(size_t absolute_offset);
    size_t position() const { return base_offset_ + pos_; }

    // Space, tab, CR, LF and FF
    static bool is_whitespace(char c);

    // Tokenize all at once (last token is EndOfFile)
    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t base_offset_ = 0;
    size_t pos_ = 0;
    // Last ')' and ']' in the input; an opener after them never closes
    size_t last_paren_close_ = std::string_view::npos;
    size_t last_bracket_close_ = std::string_view::npos;
    // '{' offset -> end of its block, or npos when it never closes. Filled
    // when a brace scan reaches the end of input without closing.
    std::unordered_map<size_t, size_t> brace_ends_;

    char consume();
    char peek() const;
    char peek(size_t offset) const;
    bool at_end() const;
    void reconsume();

    CSSToken make_token(CSSToken::Type type, size_t start, std::string value) const;

    void consume_whitespace();
    CSSToken consume_comment(size_t start);
    CSSToken consume_string(char ending, size_t start);
    CSSToken consume_numeric(size_t start);
    CSSToken consume_ident_like(size_t start);
    CSSToken consume_url(size_t start);
    CSSToken consume_block(char open, char close, CSSToken::Type type, size_t start);
    CSSToken consume_brace_block(size_t start);
    CSSToken consume_important(size_t start);
    std::string consume_name();
    bool starts_identifier(size_t offset = 0) const;
    bool starts_number() const;
    bool is_name_start_char(char c) const;
    bool is_name_char(char c) const;
};

} // namespace csskit::css
