#pragma once
#include <csskit/core/config.h>
#include <csskit/core/diagnostics.h>
#include <csskit/css/parser/parse_error.h>
#include <csskit/css/parser/selector.h>
#include <csskit/css/parser/value.h>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace csskit::css {

struct Declaration {
    std::string property;
    // Source order. Space-separated shorthand parts are consecutive entries;
    // commas are dropped; "!important" is kept as an Identifier.
    std::vector<Value> value;

    bool operator==(const Declaration& o) const {
        return property == o.property && value == o.value;
    }
};

struct Rule;

struct Stylesheet {
    std::vector<Rule> rules;
    bool operator==(const Stylesheet& o) const;
};

struct RuleSet {
    std::vector<Selector> selectors;
    std::vector<Declaration> declarations;
    std::vector<Rule> nested_rules;
    bool operator==(const RuleSet& o) const;
};

struct AtRule {
    std::string name;                  // without '@'
    std::vector<std::string> prelude;  // raw prelude pieces, in order
    std::optional<Stylesheet> block;
    bool operator==(const AtRule& o) const;
};

struct Rule {
    std::variant<RuleSet, AtRule> data;

    bool is_rule_set() const { return std::holds_alternative<RuleSet>(data); }
    bool is_at_rule() const { return std::holds_alternative<AtRule>(data); }
    const RuleSet* rule_set() const { return std::get_if<RuleSet>(&data); }
    const AtRule* at_rule() const { return std::get_if<AtRule>(&data); }

    bool operator==(const Rule& o) const { return data == o.data; }
};

struct ParserOptions {
    size_t max_nesting_depth = core::config::kDefaultMaxNestingDepth;
    size_t max_function_depth = core::config::kDefaultMaxFunctionDepth;
    bool allow_blockless_at_rules = core::config::kDefaultAllowBlocklessAtRules;
    // Not owned. Receives skipped-token warnings, lex errors and the outcome.
    core::DiagnosticEmitter* diagnostics = nullptr;
};

struct ParseResult {
    std::optional<Stylesheet> stylesheet;
    std::optional<ParseError> error;

    bool ok() const { return stylesheet.has_value(); }
};

struct DeclarationListResult {
    std::vector<Declaration> declarations;
    std::vector<Rule> nested_rules;
    std::optional<ParseError> error;

    bool ok() const { return !error.has_value(); }
};

// Parse functions
ParseResult parse_stylesheet(std::string_view css, const ParserOptions& options = {});

// Parse the inside of one block ("color: red; .child { ... }"), e.g. a
// style attribute, with the same rules as a rule set's body.
DeclarationListResult parse_declaration_list(std::string_view css,
                                             const ParserOptions& options = {});

} // namespace csskit::css
