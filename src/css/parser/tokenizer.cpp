#include <csskit/css/parser/tokenizer.h>
#include <cctype>
#include <utility>

namespace csskit::css {

// ---------------------------------------------------------------------------
// CSSToken
// ---------------------------------------------------------------------------

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value && span == other.span;
}

const char* token_type_name(CSSToken::Type type) {
    switch (type) {
        case CSSToken::Ident:              return "ident";
        case CSSToken::Function:           return "function";
        case CSSToken::AtKeyword:          return "at-keyword";
        case CSSToken::Hash:               return "hash";
        case CSSToken::QuotedString:       return "string";
        case CSSToken::UnquotedUrl:        return "url";
        case CSSToken::BadUrl:             return "bad-url";
        case CSSToken::BadString:          return "bad-string";
        case CSSToken::Number:             return "number";
        case CSSToken::Percentage:         return "percentage";
        case CSSToken::Dimension:          return "dimension";
        case CSSToken::ClassSelector:      return "class-selector";
        case CSSToken::PseudoClass:        return "pseudo-class";
        case CSSToken::PseudoElement:      return "pseudo-element";
        case CSSToken::CustomProperty:     return "custom-property";
        case CSSToken::Important:          return "!important";
        case CSSToken::ParenthesisBlock:   return "(-block";
        case CSSToken::SquareBracketBlock: return "[-block";
        case CSSToken::CurlyBracketBlock:  return "{-block";
        case CSSToken::CloseParenthesis:   return ")";
        case CSSToken::CloseSquareBracket: return "]";
        case CSSToken::CloseCurlyBracket:  return "}";
        case CSSToken::Colon:              return ":";
        case CSSToken::Semicolon:          return ";";
        case CSSToken::Comma:              return ",";
        case CSSToken::IncludeMatch:       return "~=";
        case CSSToken::DashMatch:          return "|=";
        case CSSToken::PrefixMatch:        return "^=";
        case CSSToken::SuffixMatch:        return "$=";
        case CSSToken::SubstringMatch:     return "*=";
        case CSSToken::CDO:                return "<!--";
        case CSSToken::CDC:                return "-->";
        case CSSToken::Comment:            return "comment";
        case CSSToken::Delim:              return "delim";
        case CSSToken::Invalid:            return "invalid";
        case CSSToken::EndOfFile:          return "end of input";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// CSSTokenizer
// ---------------------------------------------------------------------------

CSSTokenizer::CSSTokenizer(std::string_view input, size_t base_offset)
    : input_(input),
      base_offset_(base_offset),
      pos_(0),
      last_paren_close_(input.rfind(')')),
      last_bracket_close_(input.rfind(']')) {}

char CSSTokenizer::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char CSSTokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

char CSSTokenizer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    if (idx < input_.size()) {
        return input_[idx];
    }
    return '\0';
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

void CSSTokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
    }
}

void CSSTokenizer::seek(size_t absolute_offset) {
    size_t local = absolute_offset >= base_offset_ ? absolute_offset - base_offset_ : 0;
    pos_ = local < input_.size() ? local : input_.size();
}

CSSToken CSSTokenizer::make_token(CSSToken::Type type, size_t start, std::string value) const {
    CSSToken token;
    token.type = type;
    token.value = std::move(value);
    token.span = Span{base_offset_ + start, base_offset_ + pos_};
    return token;
}

bool CSSTokenizer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

void CSSTokenizer::consume_whitespace() {
    while (!at_end() && is_whitespace(peek())) {
        consume();
    }
}

bool CSSTokenizer::is_name_start_char(char c) const {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           (static_cast<unsigned char>(c) >= 0x80);
}

bool CSSTokenizer::is_name_char(char c) const {
    return is_name_start_char(c) || std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-';
}

bool CSSTokenizer::starts_identifier(size_t offset) const {
    char c = peek(offset);
    if (is_name_start_char(c)) return true;
    if (c == '-') {
        char next = peek(offset + 1);
        if (is_name_start_char(next)) return true;
        return next == '\\' && peek(offset + 2) != '\n' && peek(offset + 2) != '\0';
    }
    if (c == '\\') {
        // Valid escape: backslash not followed by newline
        char next = peek(offset + 1);
        return next != '\n' && next != '\0';
    }
    return false;
}

bool CSSTokenizer::starts_number() const {
    char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c))) return true;
    if (c == '.') {
        return std::isdigit(static_cast<unsigned char>(peek(1)));
    }
    if (c == '+' || c == '-') {
        char next = peek(1);
        if (std::isdigit(static_cast<unsigned char>(next))) return true;
        if (next == '.' && std::isdigit(static_cast<unsigned char>(peek(2))))
            return true;
    }
    return false;
}

// Escapes stay in the text as written; the AST carries source text.
std::string CSSTokenizer::consume_name() {
    std::string result;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result += consume();
        } else if (c == '\\' && peek(1) != '\n' && peek(1) != '\0') {
            result += consume();
            result += consume();
        } else {
            break;
        }
    }
    return result;
}

CSSToken CSSTokenizer::consume_comment(size_t start) {
    // '/' and '*' already consumed
    size_t body_start = pos_;
    while (!at_end()) {
        if (peek() == '*' && peek(1) == '/') {
            std::string body(input_.substr(body_start, pos_ - body_start));
            consume();
            consume();
            return make_token(CSSToken::Comment, start, std::move(body));
        }
        consume();
    }
    // Unterminated comment runs to the end of input
    return make_token(CSSToken::Comment, start,
                      std::string(input_.substr(body_start)));
}

CSSToken CSSTokenizer::consume_string(char ending, size_t start) {
    std::string result;

    while (!at_end()) {
        char c = consume();
        if (c == ending) {
            return make_token(CSSToken::QuotedString, start, std::move(result));
        }
        if (c == '\\') {
            if (at_end()) {
                break;
            }
            result += c;
            result += consume();
        } else if (c == '\n') {
            // Unescaped newline ends the string without closing it
            reconsume();
            break;
        } else {
            result += c;
        }
    }

    return make_token(CSSToken::BadString, start,
                      std::string(input_.substr(start, pos_ - start)));
}

CSSToken CSSTokenizer::consume_numeric(size_t start) {
    if (peek() == '+' || peek() == '-') {
        consume();
    }
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
        consume();
    }
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        consume(); // '.'
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            consume();
        }
    }

    if (peek() == '%') {
        consume();
        return make_token(CSSToken::Percentage, start,
                          std::string(input_.substr(start, pos_ - start)));
    }

    if (std::isalpha(static_cast<unsigned char>(peek()))) {
        while (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
            consume();
        }
        return make_token(CSSToken::Dimension, start,
                          std::string(input_.substr(start, pos_ - start)));
    }

    return make_token(CSSToken::Number, start,
                      std::string(input_.substr(start, pos_ - start)));
}

CSSToken CSSTokenizer::consume_ident_like(size_t start) {
    std::string name = consume_name();

    if (peek() == '(') {
        consume(); // consume '('
        bool is_url = name.size() == 3 &&
                      std::tolower(static_cast<unsigned char>(name[0])) == 'u' &&
                      std::tolower(static_cast<unsigned char>(name[1])) == 'r' &&
                      std::tolower(static_cast<unsigned char>(name[2])) == 'l';
        if (is_url) {
            return consume_url(start);
        }
        return make_token(CSSToken::Function, start, std::move(name));
    }

    return make_token(CSSToken::Ident, start, std::move(name));
}

CSSToken CSSTokenizer::consume_url(size_t start) {
    // "url(" already consumed
    size_t after_paren = pos_;
    consume_whitespace();

    // Quoted form: leave the string for the parser's url() grammar
    if (peek() == '"' || peek() == '\'') {
        pos_ = after_paren;
        return make_token(CSSToken::Function, start,
                          std::string(input_.substr(start, 3)));
    }

    size_t content_start = pos_;
    bool bad = false;
    while (!at_end()) {
        char c = peek();
        if (c == ')') {
            std::string content(input_.substr(content_start, pos_ - content_start));
            consume();
            if (bad || content.empty()) {
                return make_token(CSSToken::BadUrl, start,
                                  std::string(input_.substr(start, pos_ - start)));
            }
            return make_token(CSSToken::UnquotedUrl, start, std::move(content));
        }
        if (is_whitespace(c)) {
            // Trailing whitespace is allowed, anything after it is not
            size_t ws_start = pos_;
            consume_whitespace();
            if (peek() == ')') {
                std::string content(input_.substr(content_start, ws_start - content_start));
                consume();
                if (bad || content.empty()) {
                    return make_token(CSSToken::BadUrl, start,
                                      std::string(input_.substr(start, pos_ - start)));
                }
                return make_token(CSSToken::UnquotedUrl, start, std::move(content));
            }
            bad = true;
            continue;
        }
        if (c == '"' || c == '\'' || c == '(') {
            bad = true;
        } else if (c == '\\' && peek(1) != '\0') {
            consume();
        }
        consume();
    }

    return make_token(CSSToken::BadUrl, start,
                      std::string(input_.substr(start, pos_ - start)));
}

CSSToken CSSTokenizer::consume_block(char open, char close, CSSToken::Type type,
                                     size_t start) {
    // The opener has been consumed. Parentheses and square brackets capture
    // up to the first closer; braces count depth so a rule's block holds its
    // nested rules.
    if (open == '{') {
        return consume_brace_block(start);
    }

    size_t last_close = open == '(' ? last_paren_close_ : last_bracket_close_;
    if (last_close == std::string_view::npos || last_close < pos_) {
        // No closer: the opener stands alone
        return make_token(CSSToken::Delim, start, std::string(1, open));
    }
    pos_ = input_.find(close, pos_) + 1;
    return make_token(type, start, std::string(input_.substr(start, pos_ - start)));
}

CSSToken CSSTokenizer::consume_brace_block(size_t start) {
    auto known = brace_ends_.find(start);
    if (known != brace_ends_.end()) {
        if (known->second == std::string_view::npos) {
            return make_token(CSSToken::Delim, start, "{");
        }
        pos_ = known->second;
        return make_token(CSSToken::CurlyBracketBlock, start,
                          std::string(input_.substr(start, pos_ - start)));
    }

    // Strings and comments are opaque while counting braces
    std::vector<size_t> open_braces{start};
    std::vector<std::pair<size_t, size_t>> inner_blocks;
    while (!at_end()) {
        char c = consume();
        if (c == '"' || c == '\'') {
            while (!at_end()) {
                char s = consume();
                if (s == '\\') {
                    consume();
                } else if (s == c || s == '\n') {
                    break;
                }
            }
            continue;
        }
        if (c == '/' && peek() == '*') {
            consume();
            while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
                consume();
            }
            consume();
            consume();
            continue;
        }
        if (c == '{') {
            open_braces.push_back(pos_ - 1);
        } else if (c == '}') {
            size_t opener = open_braces.back();
            open_braces.pop_back();
            if (open_braces.empty()) {
                return make_token(CSSToken::CurlyBracketBlock, start,
                                  std::string(input_.substr(start, pos_ - start)));
            }
            inner_blocks.emplace_back(opener, pos_);
        }
    }

    // No closer: the opener stands alone. Every brace seen on the way is
    // recorded so re-reading them after the rewind does not rescan.
    for (const auto& [opener, end] : inner_blocks) {
        brace_ends_[opener] = end;
    }
    for (size_t opener : open_braces) {
        brace_ends_[opener] = std::string_view::npos;
    }
    pos_ = start + 1;
    return make_token(CSSToken::Delim, start, "{");
}

CSSToken CSSTokenizer::consume_important(size_t start) {
    // '!' already consumed
    static constexpr std::string_view kImportant = "important";
    consume_whitespace();
    bool matches = input_.size() - pos_ >= kImportant.size();
    for (size_t i = 0; matches && i < kImportant.size(); ++i) {
        matches = std::tolower(static_cast<unsigned char>(input_[pos_ + i])) == kImportant[i];
    }
    if (matches && !is_name_char(peek(kImportant.size()))) {
        pos_ += kImportant.size();
        return make_token(CSSToken::Important, start, "!important");
    }
    pos_ = start + 1;
    return make_token(CSSToken::Delim, start, "!");
}

CSSToken CSSTokenizer::next_token() {
    consume_whitespace();

    if (at_end()) {
        return make_token(CSSToken::EndOfFile, pos_, "");
    }

    size_t start = pos_;
    char c = consume();

    switch (c) {
        case '/':
            if (peek() == '*') {
                consume();
                return consume_comment(start);
            }
            return make_token(CSSToken::Delim, start, "/");

        case '"':
        case '\'':
            return consume_string(c, start);

        case '#':
            if (is_name_char(peek()) || starts_identifier()) {
                return make_token(CSSToken::Hash, start, consume_name());
            }
            return make_token(CSSToken::Delim, start, "#");

        case '(':
            return consume_block('(', ')', CSSToken::ParenthesisBlock, start);
        case '[':
            return consume_block('[', ']', CSSToken::SquareBracketBlock, start);
        case '{':
            return consume_block('{', '}', CSSToken::CurlyBracketBlock, start);

        case ')':
            return make_token(CSSToken::CloseParenthesis, start, ")");
        case ']':
            return make_token(CSSToken::CloseSquareBracket, start, "]");
        case '}':
            return make_token(CSSToken::CloseCurlyBracket, start, "}");

        case ',':
            return make_token(CSSToken::Comma, start, ",");
        case ';':
            return make_token(CSSToken::Semicolon, start, ";");

        case ':':
            if (peek() == ':' && starts_identifier(1)) {
                consume();
                return make_token(CSSToken::PseudoElement, start, "::" + consume_name());
            }
            if (starts_identifier()) {
                return make_token(CSSToken::PseudoClass, start, ":" + consume_name());
            }
            return make_token(CSSToken::Colon, start, ":");

        case '.':
            reconsume();
            if (starts_number()) {
                return consume_numeric(start);
            }
            consume();
            if (starts_identifier()) {
                return make_token(CSSToken::ClassSelector, start, "." + consume_name());
            }
            return make_token(CSSToken::Delim, start, ".");

        case '+':
            reconsume();
            if (starts_number()) {
                return consume_numeric(start);
            }
            consume();
            return make_token(CSSToken::Delim, start, "+");

        case '-':
            if (peek() == '-' && peek(1) == '>') {
                consume();
                consume();
                return make_token(CSSToken::CDC, start, "-->");
            }
            reconsume();
            if (starts_number()) {
                return consume_numeric(start);
            }
            if (peek(1) == '-' && (is_name_char(peek(2)) || peek(2) == '\\')) {
                consume();
                consume();
                return make_token(CSSToken::CustomProperty, start, "--" + consume_name());
            }
            if (starts_identifier()) {
                return consume_ident_like(start);
            }
            consume();
            return make_token(CSSToken::Delim, start, "-");

        case '<':
            if (peek() == '!' && peek(1) == '-' && peek(2) == '-') {
                consume();
                consume();
                consume();
                return make_token(CSSToken::CDO, start, "<!--");
            }
            return make_token(CSSToken::Delim, start, "<");

        case '@':
            if (starts_identifier()) {
                return make_token(CSSToken::AtKeyword, start, consume_name());
            }
            return make_token(CSSToken::Delim, start, "@");

        case '!':
            return consume_important(start);

        case '~':
        case '|':
        case '^':
        case '$':
        case '*':
            if (peek() == '=') {
                consume();
                CSSToken::Type type = c == '~' ? CSSToken::IncludeMatch
                                    : c == '|' ? CSSToken::DashMatch
                                    : c == '^' ? CSSToken::PrefixMatch
                                    : c == '$' ? CSSToken::SuffixMatch
                                               : CSSToken::SubstringMatch;
                return make_token(type, start, std::string{c, '='});
            }
            return make_token(CSSToken::Delim, start, std::string(1, c));

        case '\\':
            if (!at_end() && peek() != '\n') {
                reconsume();
                return consume_ident_like(start);
            }
            return make_token(CSSToken::Delim, start, "\\");

        default:
            break;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        reconsume();
        return consume_numeric(start);
    }

    if (is_name_start_char(c)) {
        reconsume();
        return consume_ident_like(start);
    }

    unsigned char byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7F) {
        return make_token(CSSToken::Invalid, start, std::string(1, c));
    }

    return make_token(CSSToken::Delim, start, std::string(1, c));
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;

    while (true) {
        CSSToken token = tokenizer.next_token();
        bool done = token.type == CSSToken::EndOfFile;
        tokens.push_back(std::move(token));
        if (done) {
            break;
        }
    }

    return tokens;
}

} // namespace csskit::css
