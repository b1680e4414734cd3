#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace csskit::css {

// The stylesheet parser only ever produces SimpleSelector. Pseudo-classes,
// pseudo-elements and attribute brackets are kept as raw text in `tag` or
// `classes`, and `>`, `+`, `~` are spliced into `tag` ("a > b"). The richer
// variants below are produced by interpret_selector_fragment().
struct SimpleSelector {
    std::optional<std::string> tag;
    std::optional<std::string> id;
    std::vector<std::string> classes;

    bool empty() const { return !tag && !id && classes.empty(); }
    bool operator==(const SimpleSelector& o) const {
        return tag == o.tag && id == o.id && classes == o.classes;
    }
};

enum class AttributeOperator {
    Equals,         // [attr=val]
    Includes,       // [attr~=val]
    DashMatch,      // [attr|=val]
    PrefixMatch,    // [attr^=val]
    SuffixMatch,    // [attr$=val]
    SubstringMatch  // [attr*=val]
};

struct AttributeSelector {
    std::string attribute;
    std::optional<AttributeOperator> op;
    std::optional<std::string> value;  // quotes stripped
    bool operator==(const AttributeSelector& o) const {
        return attribute == o.attribute && op == o.op && value == o.value;
    }
};

struct PseudoClassSelector {
    std::string name;                   // without ':'
    std::optional<std::string> argument;  // nth-child(2n+1) -> "2n+1"
    bool operator==(const PseudoClassSelector& o) const {
        return name == o.name && argument == o.argument;
    }
};

struct PseudoElementSelector {
    std::string name;  // without '::'
    bool operator==(const PseudoElementSelector& o) const { return name == o.name; }
};

enum class Combinator {
    Descendant,      // space
    Child,           // >
    AdjacentSibling, // +
    GeneralSibling   // ~
};

struct Selector;

struct CombinatorSelector {
    Combinator kind = Combinator::Descendant;
    std::shared_ptr<const Selector> inner;
    bool operator==(const CombinatorSelector& o) const;
};

struct Selector {
    std::variant<SimpleSelector, AttributeSelector, PseudoClassSelector,
                 PseudoElementSelector, CombinatorSelector> data;

    template <typename T>
    bool is() const { return std::holds_alternative<T>(data); }

    template <typename T>
    const T* get() const { return std::get_if<T>(&data); }

    bool operator==(const Selector& o) const { return data == o.data; }
};

std::optional<Combinator> combinator_from_string(std::string_view text);
const char* combinator_symbol(Combinator combinator);

// Classify one selector fragment: "[type=\"text\"]" -> AttributeSelector,
// ":nth-child(2)" -> PseudoClassSelector{"nth-child", "2"}, "::before" ->
// PseudoElementSelector, "#main" -> Simple{id}, ".note" or "div" ->
// Simple{tag}. Returns nullopt for empty or malformed text.
std::optional<Selector> interpret_selector_fragment(std::string_view text);

// Rebuild the structure the parser folded away. "body > .a + .b" in `tag`
// becomes [Simple{body}, Combinator{Child, .a}, Combinator{AdjacentSibling, .b}];
// each entry of `classes` is interpreted in turn, with a "(...)" entry
// becoming the argument of the pseudo-class before it. Fragments that do not
// classify are kept as Simple{tag}.
std::vector<Selector> expand_selector(const SimpleSelector& folded);

} // namespace csskit::css
