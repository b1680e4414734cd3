#include <gtest/gtest.h>
#include <csskit/css/parser/selector.h>
#include <csskit/css/parser/stylesheet.h>

using namespace csskit::css;

namespace {

SimpleSelector tag_selector(const std::string& tag) {
    SimpleSelector simple;
    simple.tag = tag;
    return simple;
}

} // namespace

// =============================================================================
// Fragment Tests
// =============================================================================

class SelectorFragmentTest : public ::testing::Test {};

// Test 1: Plain tag and class text stay simple
TEST_F(SelectorFragmentTest, TagAndClass) {
    EXPECT_EQ(interpret_selector_fragment("div"), Selector{tag_selector("div")});
    EXPECT_EQ(interpret_selector_fragment(".note"), Selector{tag_selector(".note")});
}

// Test 2: Id fragment
TEST_F(SelectorFragmentTest, IdFragment) {
    SimpleSelector expected;
    expected.id = "main";
    EXPECT_EQ(interpret_selector_fragment("#main"), Selector{expected});
    EXPECT_FALSE(interpret_selector_fragment("#").has_value());
}

// Test 3: Pseudo-class with and without an argument
TEST_F(SelectorFragmentTest, PseudoClass) {
    auto hover = interpret_selector_fragment(":hover");
    ASSERT_TRUE(hover.has_value());
    EXPECT_EQ(*hover, (Selector{PseudoClassSelector{"hover", std::nullopt}}));

    auto nth = interpret_selector_fragment(":nth-child( 2n+1 )");
    ASSERT_TRUE(nth.has_value());
    const auto* pseudo = nth->get<PseudoClassSelector>();
    ASSERT_NE(pseudo, nullptr);
    EXPECT_EQ(pseudo->name, "nth-child");
    EXPECT_EQ(pseudo->argument, std::optional<std::string>("2n+1"));
}

// Test 4: Pseudo-element
TEST_F(SelectorFragmentTest, PseudoElement) {
    EXPECT_EQ(interpret_selector_fragment("::before"),
              Selector{PseudoElementSelector{"before"}});
    EXPECT_FALSE(interpret_selector_fragment("::").has_value());
}

// Test 5: Attribute selectors and their operators
TEST_F(SelectorFragmentTest, AttributeOperators) {
    auto present = interpret_selector_fragment("[disabled]");
    ASSERT_TRUE(present.has_value());
    EXPECT_EQ(*present, (Selector{AttributeSelector{"disabled", std::nullopt, std::nullopt}}));

    auto equals = interpret_selector_fragment("[type=\"text\"]");
    ASSERT_TRUE(equals.has_value());
    EXPECT_EQ(*equals, (Selector{AttributeSelector{"type", AttributeOperator::Equals, "text"}}));

    auto prefix = interpret_selector_fragment("[href^='https']");
    ASSERT_TRUE(prefix.has_value());
    EXPECT_EQ(*prefix,
              (Selector{AttributeSelector{"href", AttributeOperator::PrefixMatch, "https"}}));

    auto includes = interpret_selector_fragment("[class~=a]");
    ASSERT_TRUE(includes.has_value());
    EXPECT_EQ(includes->get<AttributeSelector>()->op, AttributeOperator::Includes);

    auto dash = interpret_selector_fragment("[lang|=en]");
    EXPECT_EQ(dash->get<AttributeSelector>()->op, AttributeOperator::DashMatch);

    auto suffix = interpret_selector_fragment("[src$=\".png\"]");
    EXPECT_EQ(suffix->get<AttributeSelector>()->op, AttributeOperator::SuffixMatch);

    auto substring = interpret_selector_fragment("[title*=x]");
    EXPECT_EQ(substring->get<AttributeSelector>()->op, AttributeOperator::SubstringMatch);
}

// Test 6: Case flag is dropped from attribute values
TEST_F(SelectorFragmentTest, AttributeCaseFlag) {
    auto sel = interpret_selector_fragment("[type=\"TEXT\" i]");
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ(sel->get<AttributeSelector>()->value, std::optional<std::string>("TEXT"));
}

// Test 7: Malformed fragments
TEST_F(SelectorFragmentTest, MalformedFragments) {
    EXPECT_FALSE(interpret_selector_fragment("").has_value());
    EXPECT_FALSE(interpret_selector_fragment("[]").has_value());
    EXPECT_FALSE(interpret_selector_fragment("[a").has_value());
    EXPECT_FALSE(interpret_selector_fragment("(odd)").has_value());
    EXPECT_FALSE(interpret_selector_fragment(":is(a").has_value());
}

// Test 8: Combinator symbols
TEST_F(SelectorFragmentTest, Combinators) {
    EXPECT_EQ(combinator_from_string(">"), Combinator::Child);
    EXPECT_EQ(combinator_from_string("+"), Combinator::AdjacentSibling);
    EXPECT_EQ(combinator_from_string("~"), Combinator::GeneralSibling);
    EXPECT_EQ(combinator_from_string(" "), Combinator::Descendant);
    EXPECT_FALSE(combinator_from_string("/").has_value());
    EXPECT_STREQ(combinator_symbol(Combinator::Child), ">");
}

// =============================================================================
// Expansion Tests
// =============================================================================

class SelectorExpandTest : public ::testing::Test {};

// Test 1: A spliced tag becomes combinator nodes
TEST_F(SelectorExpandTest, SplicedTag) {
    auto parts = expand_selector(tag_selector("body > .container + .item"));
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], Selector{tag_selector("body")});

    const auto* child = parts[1].get<CombinatorSelector>();
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->kind, Combinator::Child);
    ASSERT_NE(child->inner, nullptr);
    EXPECT_EQ(*child->inner, Selector{tag_selector(".container")});

    const auto* sibling = parts[2].get<CombinatorSelector>();
    ASSERT_NE(sibling, nullptr);
    EXPECT_EQ(sibling->kind, Combinator::AdjacentSibling);
    EXPECT_EQ(*sibling->inner, Selector{tag_selector(".item")});
}

// Test 2: Folded classes are interpreted in order
TEST_F(SelectorExpandTest, FoldedClasses) {
    SimpleSelector folded = tag_selector("input");
    folded.classes = {"[type=\"text\"]", ":focus", "::placeholder"};
    auto parts = expand_selector(folded);
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_TRUE(parts[0].is<SimpleSelector>());
    EXPECT_TRUE(parts[1].is<AttributeSelector>());
    EXPECT_EQ(parts[2], (Selector{PseudoClassSelector{"focus", std::nullopt}}));
    EXPECT_EQ(parts[3], Selector{PseudoElementSelector{"placeholder"}});
}

// Test 3: A parenthesis capture becomes the pseudo-class argument
TEST_F(SelectorExpandTest, ParenthesisBecomesArgument) {
    auto parsed = parse_stylesheet("li:nth-child(2n+1) { x: y; }");
    ASSERT_TRUE(parsed.ok());
    const RuleSet* rule = parsed.stylesheet->rules[0].rule_set();
    ASSERT_NE(rule, nullptr);
    const auto* folded = rule->selectors[0].get<SimpleSelector>();
    ASSERT_NE(folded, nullptr);

    auto parts = expand_selector(*folded);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], Selector{tag_selector("li")});
    EXPECT_EQ(parts[1], (Selector{PseudoClassSelector{"nth-child", std::string("2n+1")}}));
}

// Test 4: Id comes first
TEST_F(SelectorExpandTest, IdOnly) {
    SimpleSelector folded;
    folded.id = "nav";
    auto parts = expand_selector(folded);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].get<SimpleSelector>()->id, std::optional<std::string>("nav"));
}

// Test 5: Whitespace inside brackets does not split
TEST_F(SelectorExpandTest, QuotedWhitespaceStaysTogether) {
    auto parts = expand_selector(tag_selector("a ~ [title='a b']"));
    ASSERT_EQ(parts.size(), 2u);
    const auto* sibling = parts[1].get<CombinatorSelector>();
    ASSERT_NE(sibling, nullptr);
    EXPECT_EQ(sibling->kind, Combinator::GeneralSibling);
    EXPECT_EQ(*sibling->inner,
              (Selector{AttributeSelector{"title", AttributeOperator::Equals, "a b"}}));
}

// Test 6: Trailing combinator has no inner selector
TEST_F(SelectorExpandTest, TrailingCombinator) {
    auto parts = expand_selector(tag_selector("ul >"));
    ASSERT_EQ(parts.size(), 2u);
    const auto* child = parts[1].get<CombinatorSelector>();
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->inner, nullptr);
}
