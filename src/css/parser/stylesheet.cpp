#include <csskit/css/parser/stylesheet.h>
#include <csskit/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace csskit::css {

bool Stylesheet::operator==(const Stylesheet& o) const {
    return rules == o.rules;
}

bool RuleSet::operator==(const RuleSet& o) const {
    return selectors == o.selectors && declarations == o.declarations &&
           nested_rules == o.nested_rules;
}

bool AtRule::operator==(const AtRule& o) const {
    return name == o.name && prelude == o.prelude && block == o.block;
}

namespace {

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_lex_error(const CSSToken& token) {
    return token.type == CSSToken::Invalid || token.type == CSSToken::BadString ||
           token.type == CSSToken::BadUrl;
}

std::string describe(const CSSToken& token) {
    if (token.type == CSSToken::EndOfFile) {
        return "end of input";
    }
    return std::string(token_type_name(token.type)) + " '" + token.value + "'";
}

} // namespace

// ---------------------------------------------------------------------------
// Internal stylesheet parser
//
// One instance parses one window of the source. A rule set's or at-rule's
// {...} block is parsed by a fresh instance over the block's inner text, so
// nesting is handled here and never by the tokenizer.
// ---------------------------------------------------------------------------

class StyleSheetParser {
public:
    StyleSheetParser(std::string_view source, size_t begin, size_t end,
                     const ParserOptions& options, size_t depth);

    // Top level and at-rule blocks: rule sets and at-rules, other tokens skipped.
    Stylesheet parse();
    // Rule set body: declarations and nested rules.
    void parse_block_contents(std::vector<Declaration>& declarations,
                              std::vector<Rule>& nested_rules);

private:
    std::string_view source_;
    const ParserOptions& options_;
    size_t depth_;
    size_t function_depth_ = 0;
    CSSTokenizer tokenizer_;
    CSSToken current_;

    const CSSToken& current() const { return current_; }
    bool at_end() const { return current_.type == CSSToken::EndOfFile; }
    void advance();
    void skip_comments();
    void skip_token();

    bool starts_rule() const;
    bool starts_nested_rule() const;

    std::vector<Selector> parse_selectors();
    RuleSet parse_rule_set();
    AtRule parse_at_rule(const std::string& name, Span at_span);
    Declaration parse_declaration();
    std::vector<Value> parse_declaration_value();

    Value parse_function(const std::string& name, Span name_span);
    Value parse_rgb_function(const std::string& name, Span name_span);
    Value parse_calc_function(const std::string& name, Span name_span);
    Value parse_url_function(const std::string& name, Span name_span);
    Value parse_rect_function(const std::string& name, Span name_span);
    Value parse_generic_function(const std::string& name, Span name_span);

    StyleSheetParser nested_parser(const CSSToken& block) const;

    double parse_double(const std::string& text, Span span) const;
    Dimension parse_dimension(const CSSToken& token) const;
    uint8_t parse_channel(const std::string& text, Span span) const;

    ParseException error(ErrorKind kind, std::string message, Span span) const;
    ParseException unexpected(const std::string& expectation) const;
    ParseException unterminated(const std::string& name, Span name_span) const;
    void warn(const char* stage, const std::string& message, Span span) const;
};

StyleSheetParser::StyleSheetParser(std::string_view source, size_t begin, size_t end,
                                   const ParserOptions& options, size_t depth)
    : source_(source),
      options_(options),
      depth_(depth),
      tokenizer_(source.substr(begin, end - begin), begin) {
    advance();
}

void StyleSheetParser::advance() {
    current_ = tokenizer_.next_token();
    if (is_lex_error(current_)) {
        warn("tokenize", "lex error: " + describe(current_), current_.span);
    }
}

void StyleSheetParser::skip_comments() {
    while (current_.type == CSSToken::Comment) {
        advance();
    }
}

void StyleSheetParser::skip_token() {
    if (current_.type != CSSToken::Comment && current_.type != CSSToken::CDO &&
        current_.type != CSSToken::CDC) {
        warn("parse", "skipped " + describe(current_), current_.span);
    }
    advance();
}

// ---------------------------------------------------------------------------
// Errors and diagnostics
// ---------------------------------------------------------------------------

ParseException StyleSheetParser::error(ErrorKind kind, std::string message, Span span) const {
    return ParseException(ParseError{kind, std::move(message), span});
}

ParseException StyleSheetParser::unexpected(const std::string& expectation) const {
    ErrorKind kind = is_lex_error(current_) ? ErrorKind::LexError : ErrorKind::UnexpectedToken;
    return error(kind, expectation + ", found " + describe(current_), current_.span);
}

ParseException StyleSheetParser::unterminated(const std::string& name, Span name_span) const {
    return error(ErrorKind::UnterminatedConstruct,
                 "input ended inside " + name + "()",
                 Span{name_span.begin, current_.span.end});
}

void StyleSheetParser::warn(const char* stage, const std::string& message, Span span) const {
    if (options_.diagnostics) {
        options_.diagnostics->emit(core::Severity::Warning, core::config::kDiagnosticsModule,
                                   stage, message, span);
    }
}

// ---------------------------------------------------------------------------
// Rules
// ---------------------------------------------------------------------------

bool StyleSheetParser::starts_rule() const {
    switch (current_.type) {
        case CSSToken::Ident:
        case CSSToken::ClassSelector:
        case CSSToken::Hash:
        case CSSToken::PseudoClass:
        case CSSToken::PseudoElement:
        case CSSToken::SquareBracketBlock:
            return true;
        case CSSToken::Delim:
            return current_.is_delim('*');
        default:
            return false;
    }
}

// Inside a rule set an identifier is always a property name, so nested rules
// have to start with something else.
bool StyleSheetParser::starts_nested_rule() const {
    switch (current_.type) {
        case CSSToken::ClassSelector:
        case CSSToken::Hash:
        case CSSToken::PseudoClass:
        case CSSToken::PseudoElement:
        case CSSToken::SquareBracketBlock:
        case CSSToken::ParenthesisBlock:
            return true;
        case CSSToken::Delim:
            return current_.is_delim('*') || current_.is_delim('&');
        default:
            return false;
    }
}

Stylesheet StyleSheetParser::parse() {
    Stylesheet sheet;

    while (!at_end()) {
        if (current().type == CSSToken::AtKeyword) {
            std::string name = current().value;
            Span at_span = current().span;
            advance();
            sheet.rules.push_back(Rule{parse_at_rule(name, at_span)});
        } else if (starts_rule()) {
            sheet.rules.push_back(Rule{parse_rule_set()});
        } else {
            skip_token();
        }
    }

    return sheet;
}

void StyleSheetParser::parse_block_contents(std::vector<Declaration>& declarations,
                                            std::vector<Rule>& nested_rules) {
    while (!at_end()) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::Ident || tok.type == CSSToken::CustomProperty) {
            declarations.push_back(parse_declaration());
        } else if (tok.type == CSSToken::AtKeyword) {
            std::string name = tok.value;
            Span at_span = tok.span;
            advance();
            nested_rules.push_back(Rule{parse_at_rule(name, at_span)});
        } else if (starts_nested_rule()) {
            nested_rules.push_back(Rule{parse_rule_set()});
        } else {
            skip_token();
        }
    }
}

StyleSheetParser StyleSheetParser::nested_parser(const CSSToken& block) const {
    if (depth_ + 1 > options_.max_nesting_depth) {
        throw error(ErrorKind::NestingDepthExceeded,
                    "blocks nested deeper than " + std::to_string(options_.max_nesting_depth),
                    block.span);
    }

    // Inner text without the braces, trimmed
    size_t begin = block.span.begin + 1;
    size_t end = block.span.end > begin ? block.span.end - 1 : begin;
    while (begin < end && CSSTokenizer::is_whitespace(source_[begin])) ++begin;
    while (end > begin && CSSTokenizer::is_whitespace(source_[end - 1])) --end;

    return StyleSheetParser(source_, begin, end, options_, depth_ + 1);
}

RuleSet StyleSheetParser::parse_rule_set() {
    RuleSet rule;
    rule.selectors = parse_selectors();

    if (current().type != CSSToken::CurlyBracketBlock) {
        throw unexpected("expected '{' after selectors");
    }
    if (rule.selectors.empty()) {
        throw unexpected("expected a selector");
    }

    StyleSheetParser block_parser = nested_parser(current());
    advance();
    block_parser.parse_block_contents(rule.declarations, rule.nested_rules);
    return rule;
}

AtRule StyleSheetParser::parse_at_rule(const std::string& name, Span at_span) {
    AtRule rule;
    rule.name = name;

    while (!at_end()) {
        const CSSToken& tok = current();
        switch (tok.type) {
            case CSSToken::CurlyBracketBlock: {
                StyleSheetParser block_parser = nested_parser(tok);
                advance();
                rule.block = block_parser.parse();
                return rule;
            }
            case CSSToken::Ident:
            case CSSToken::Number:
            case CSSToken::Dimension:
            case CSSToken::ParenthesisBlock:
            case CSSToken::SquareBracketBlock:
            case CSSToken::QuotedString:
            case CSSToken::UnquotedUrl:
                rule.prelude.push_back(tok.value);
                advance();
                break;
            case CSSToken::Semicolon:
                advance();
                if (options_.allow_blockless_at_rules) {
                    return rule;
                }
                break;
            default:
                advance();
                break;
        }
    }

    throw error(ErrorKind::UnterminatedConstruct, "expected '{' in @" + name,
                Span{at_span.begin, current().span.end});
}

// ---------------------------------------------------------------------------
// Selectors
//
// Everything becomes a SimpleSelector. Pseudo and bracket fragments attach
// to the selector before them unless a ',' or combinator intervened, and a
// combinator splices the following selector into the previous tag.
// ---------------------------------------------------------------------------

std::vector<Selector> StyleSheetParser::parse_selectors() {
    std::vector<Selector> selectors;
    bool has_separator = true;

    auto push_tag = [&selectors](const std::string& text) {
        SimpleSelector simple;
        simple.tag = text;
        selectors.push_back(Selector{simple});
    };
    auto last_simple = [&selectors]() -> SimpleSelector* {
        return selectors.empty() ? nullptr
                                 : std::get_if<SimpleSelector>(&selectors.back().data);
    };

    while (!at_end()) {
        const CSSToken& tok = current();
        switch (tok.type) {
            case CSSToken::Comment:
                advance();
                break;

            case CSSToken::Hash: {
                SimpleSelector simple;
                simple.id = tok.value;
                selectors.push_back(Selector{simple});
                has_separator = false;
                advance();
                break;
            }

            case CSSToken::Ident:
            case CSSToken::ClassSelector:
                push_tag(tok.value);
                has_separator = false;
                advance();
                break;

            case CSSToken::PseudoClass:
            case CSSToken::PseudoElement:
            case CSSToken::SquareBracketBlock:
            case CSSToken::ParenthesisBlock:
                if (SimpleSelector* last = last_simple(); last && !has_separator) {
                    last->classes.push_back(tok.value);
                } else {
                    push_tag(tok.value);
                }
                advance();
                break;

            case CSSToken::Comma:
                has_separator = true;
                advance();
                break;

            case CSSToken::Delim: {
                if (tok.is_delim('*') || tok.is_delim('&')) {
                    push_tag(tok.value);
                    has_separator = false;
                    advance();
                    break;
                }
                if (!combinator_from_string(tok.value)) {
                    return selectors;
                }

                std::string combinator = tok.value;
                advance();
                skip_comments();

                std::string next;
                const CSSToken& next_tok = current();
                if (next_tok.type == CSSToken::Ident || next_tok.type == CSSToken::ClassSelector ||
                    next_tok.is_delim('*') || next_tok.is_delim('&')) {
                    next = next_tok.value;
                } else if (next_tok.type == CSSToken::Hash) {
                    next = "#" + next_tok.value;
                }

                if (!next.empty()) {
                    advance();
                    if (SimpleSelector* last = last_simple()) {
                        last->tag = last->tag ? *last->tag + " " + combinator + " " + next : next;
                    } else {
                        push_tag(next);
                    }
                }
                has_separator = true;
                break;
            }

            default:
                return selectors;
        }
    }

    return selectors;
}

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

Declaration StyleSheetParser::parse_declaration() {
    Declaration decl;
    decl.property = current().value;
    advance();
    skip_comments();

    if (current().type == CSSToken::Colon) {
        advance();
    } else if (current().type == CSSToken::PseudoClass) {
        // "color:red" lexes as a pseudo-class; re-read what follows the ':'
        tokenizer_.seek(current().span.begin + 1);
        advance();
    } else {
        throw unexpected("expected ':' after property '" + decl.property + "'");
    }

    decl.value = parse_declaration_value();
    skip_comments();

    if (current().type != CSSToken::Semicolon) {
        throw unexpected("expected ';' after value of '" + decl.property + "'");
    }
    advance();

    return decl;
}

std::vector<Value> StyleSheetParser::parse_declaration_value() {
    std::vector<Value> values;

    while (!at_end()) {
        const CSSToken& tok = current();
        switch (tok.type) {
            case CSSToken::Semicolon:
                return values;
            case CSSToken::Comment:
            case CSSToken::Comma:
                break;
            case CSSToken::Hash:
                values.push_back(Value{ColorValue{HexColor{tok.value}}});
                break;
            case CSSToken::Ident:
                values.push_back(Value{Identifier{tok.value}});
                break;
            case CSSToken::Number:
                values.push_back(Value{Number{parse_double(tok.value, tok.span)}});
                break;
            case CSSToken::Dimension:
                values.push_back(Value{parse_dimension(tok)});
                break;
            case CSSToken::Percentage:
                values.push_back(Value{Percentage{
                    parse_double(tok.value.substr(0, tok.value.size() - 1), tok.span)}});
                break;
            case CSSToken::QuotedString:
                values.push_back(Value{StringValue{tok.value}});
                break;
            case CSSToken::UnquotedUrl:
                values.push_back(Value{Uri{tok.value}});
                break;
            case CSSToken::CustomProperty:
                values.push_back(Value{Var{tok.value}});
                break;
            case CSSToken::Important:
                values.push_back(Value{Identifier{"!important"}});
                break;
            case CSSToken::Function: {
                std::string name = tok.value;
                Span name_span = tok.span;
                advance();
                values.push_back(parse_function(name, name_span));
                continue;
            }
            case CSSToken::Delim:
                if (!tok.is_delim('/')) {
                    return values;
                }
                values.push_back(Value{Identifier{"/"}});
                break;
            default:
                return values;
        }
        advance();
    }

    return values;
}

// ---------------------------------------------------------------------------
// Numbers
// ---------------------------------------------------------------------------

// Locale independent; the tokenizer never emits exponents or hex
double StyleSheetParser::parse_double(const std::string& text, Span span) const {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    double value = 0.0;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (digits.empty() || ec != std::errc() || ptr != last) {
        throw error(ErrorKind::NumberFormat, "invalid number '" + text + "'", span);
    }
    return value;
}

// "16px" -> {16, "px"}: split at the first alphabetic character
Dimension StyleSheetParser::parse_dimension(const CSSToken& token) const {
    const std::string& text = token.value;
    auto unit_start = std::find_if(text.begin(), text.end(), [](unsigned char c) {
        return std::isalpha(c);
    });
    Dimension dim;
    dim.value = parse_double(std::string(text.begin(), unit_start), token.span);
    dim.unit = std::string(unit_start, text.end());
    return dim;
}

uint8_t StyleSheetParser::parse_channel(const std::string& text, Span span) const {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    unsigned value = 0;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (digits.empty() || ec != std::errc() || ptr != last || value > 255) {
        throw error(ErrorKind::NumberFormat,
                    "color channel must be an integer 0..255, got '" + text + "'", span);
    }
    return static_cast<uint8_t>(value);
}

// ---------------------------------------------------------------------------
// Functions
// ---------------------------------------------------------------------------

Value StyleSheetParser::parse_function(const std::string& name, Span name_span) {
    if (function_depth_ + 1 > options_.max_function_depth) {
        throw error(ErrorKind::NestingDepthExceeded,
                    "functions nested deeper than " +
                        std::to_string(options_.max_function_depth),
                    name_span);
    }

    ++function_depth_;
    std::string lower = ascii_lower(name);
    Value value;
    if (lower == "rgb" || lower == "rgba") {
        value = parse_rgb_function(name, name_span);
    } else if (lower == "calc") {
        value = parse_calc_function(name, name_span);
    } else if (lower == "url") {
        value = parse_url_function(name, name_span);
    } else if (lower == "rect") {
        value = parse_rect_function(name, name_span);
    } else {
        value = parse_generic_function(name, name_span);
    }
    --function_depth_;
    return value;
}

Value StyleSheetParser::parse_rgb_function(const std::string& name, Span name_span) {
    std::vector<std::pair<std::string, Span>> args;

    while (true) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::EndOfFile) {
            throw unterminated(name, name_span);
        }
        if (tok.type == CSSToken::CloseParenthesis) {
            break;
        }
        if (tok.type == CSSToken::Number) {
            args.emplace_back(tok.value, tok.span);
        } else if (tok.type != CSSToken::Comma && tok.type != CSSToken::Comment &&
                   !tok.is_delim('/')) {
            throw unexpected("invalid argument in " + name + "()");
        }
        advance();
    }

    Span call{name_span.begin, current().span.end};
    advance();

    if (args.size() < 3 || args.size() > 4) {
        throw error(ErrorKind::InvalidArity,
                    name + "() takes 3 or 4 numbers, got " + std::to_string(args.size()),
                    call);
    }

    uint8_t r = parse_channel(args[0].first, args[0].second);
    uint8_t g = parse_channel(args[1].first, args[1].second);
    uint8_t b = parse_channel(args[2].first, args[2].second);
    if (args.size() == 4) {
        float a = static_cast<float>(parse_double(args[3].first, args[3].second));
        return Value{ColorValue{RgbaColor{r, g, b, a}}};
    }
    return Value{ColorValue{RgbColor{r, g, b}}};
}

Value StyleSheetParser::parse_calc_function(const std::string& name, Span name_span) {
    CalcExpression expr;

    while (true) {
        const CSSToken& tok = current();
        switch (tok.type) {
            case CSSToken::EndOfFile:
                throw unterminated(name, name_span);
            case CSSToken::CloseParenthesis:
                advance();
                return Value{expr};
            case CSSToken::Comment:
                break;
            case CSSToken::Number:
                expr.terms.push_back(CalcNumber{parse_double(tok.value, tok.span), std::nullopt});
                break;
            case CSSToken::Dimension: {
                Dimension dim = parse_dimension(tok);
                expr.terms.push_back(CalcNumber{dim.value, dim.unit});
                break;
            }
            case CSSToken::Percentage:
                expr.terms.push_back(CalcNumber{
                    parse_double(tok.value.substr(0, tok.value.size() - 1), tok.span),
                    std::string("%")});
                break;
            case CSSToken::Delim:
                if (tok.is_delim('%')) {
                    // A bare '%' stands in as a zero percentage term
                    expr.terms.push_back(CalcNumber{0.0, std::string("%")});
                } else if (tok.is_delim('+')) {
                    expr.terms.push_back(CalcOperator::Add);
                } else if (tok.is_delim('-')) {
                    expr.terms.push_back(CalcOperator::Subtract);
                } else if (tok.is_delim('*')) {
                    expr.terms.push_back(CalcOperator::Multiply);
                } else if (tok.is_delim('/')) {
                    expr.terms.push_back(CalcOperator::Divide);
                } else {
                    throw unexpected("invalid term in " + name + "()");
                }
                break;
            default:
                throw unexpected("invalid term in " + name + "()");
        }
        advance();
    }
}

Value StyleSheetParser::parse_url_function(const std::string& name, Span name_span) {
    std::string url;

    while (true) {
        const CSSToken& tok = current();
        switch (tok.type) {
            case CSSToken::EndOfFile:
                throw unterminated(name, name_span);
            case CSSToken::CloseParenthesis:
                advance();
                return Value{Uri{url}};
            case CSSToken::QuotedString:
            case CSSToken::UnquotedUrl:
                url += tok.value;
                break;
            case CSSToken::Comment:
                break;
            default:
                throw unexpected("invalid argument in " + name + "()");
        }
        advance();
    }
}

Value StyleSheetParser::parse_rect_function(const std::string& name, Span name_span) {
    FunctionValue fn;
    fn.name = "rect";

    while (true) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::EndOfFile) {
            throw unterminated(name, name_span);
        }
        if (tok.type == CSSToken::CloseParenthesis) {
            break;
        }
        if (tok.type == CSSToken::Number) {
            fn.arguments.push_back(Value{Number{parse_double(tok.value, tok.span)}});
        } else if (tok.type != CSSToken::Comma && tok.type != CSSToken::Comment) {
            throw unexpected("invalid argument in " + name + "()");
        }
        advance();
    }

    Span call{name_span.begin, current().span.end};
    advance();

    if (fn.arguments.size() != 4) {
        throw error(ErrorKind::InvalidArity,
                    "rect() takes 4 numbers, got " + std::to_string(fn.arguments.size()),
                    call);
    }
    return Value{fn};
}

// Any other function: arguments are parsed like a declaration value, up to
// the closing ')'. Nested function calls recurse through here.
Value StyleSheetParser::parse_generic_function(const std::string& name, Span name_span) {
    FunctionValue fn;
    fn.name = name;

    while (true) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::EndOfFile) {
            throw unterminated(name, name_span);
        }
        if (tok.type == CSSToken::CloseParenthesis) {
            advance();
            return Value{fn};
        }

        size_t before = tok.span.begin;
        std::vector<Value> args = parse_declaration_value();
        if (args.empty() && current().span.begin == before) {
            throw unexpected("invalid argument in " + name + "()");
        }
        for (auto& arg : args) {
            fn.arguments.push_back(std::move(arg));
        }
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

namespace {

void report_outcome(const ParserOptions& options, const std::optional<ParseError>& error,
                    const std::string& summary) {
    if (!options.diagnostics) {
        return;
    }
    if (error) {
        options.diagnostics->emit(core::Severity::Error, core::config::kDiagnosticsModule,
                                  "parse", error->format(), error->span);
    } else {
        options.diagnostics->emit(core::Severity::Info, core::config::kDiagnosticsModule,
                                  "parse", summary);
    }
}

} // namespace

ParseResult parse_stylesheet(std::string_view css, const ParserOptions& options) {
    ParseResult result;
    try {
        StyleSheetParser parser(css, 0, css.size(), options, 0);
        result.stylesheet = parser.parse();
    } catch (const ParseException& e) {
        result.error = e.error();
    }

    report_outcome(options, result.error,
                   result.stylesheet
                       ? "parsed " + std::to_string(result.stylesheet->rules.size()) + " rules"
                       : std::string());
    return result;
}

DeclarationListResult parse_declaration_list(std::string_view css,
                                             const ParserOptions& options) {
    DeclarationListResult result;
    try {
        std::vector<Declaration> declarations;
        std::vector<Rule> nested_rules;
        StyleSheetParser parser(css, 0, css.size(), options, 0);
        parser.parse_block_contents(declarations, nested_rules);
        result.declarations = std::move(declarations);
        result.nested_rules = std::move(nested_rules);
    } catch (const ParseException& e) {
        result.error = e.error();
    }

    report_outcome(options, result.error,
                   "parsed " + std::to_string(result.declarations.size()) + " declarations");
    return result;
}

} // namespace csskit::css
