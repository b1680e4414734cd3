#include <csskit/css/parser/selector.h>
#include <cctype>

namespace csskit::css {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string strip_quotes(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        s = s.substr(1, s.size() - 2);
    }
    return std::string(s);
}

Selector simple_tag(std::string_view text) {
    SimpleSelector simple;
    simple.tag = std::string(text);
    return Selector{simple};
}

std::optional<Selector> interpret_attribute(std::string_view inner) {
    inner = trim(inner);
    size_t eq = inner.find('=');
    AttributeSelector attr;
    if (eq == std::string_view::npos) {
        attr.attribute = std::string(inner);
    } else {
        size_t name_end = eq;
        attr.op = AttributeOperator::Equals;
        if (eq > 0) {
            switch (inner[eq - 1]) {
                case '~': attr.op = AttributeOperator::Includes; --name_end; break;
                case '|': attr.op = AttributeOperator::DashMatch; --name_end; break;
                case '^': attr.op = AttributeOperator::PrefixMatch; --name_end; break;
                case '$': attr.op = AttributeOperator::SuffixMatch; --name_end; break;
                case '*': attr.op = AttributeOperator::SubstringMatch; --name_end; break;
                default: break;
            }
        }
        attr.attribute = std::string(trim(inner.substr(0, name_end)));
        std::string_view value = trim(inner.substr(eq + 1));
        // Drop a trailing case-sensitivity flag: [type="a" i]
        if (value.size() > 2 && (value.back() == 'i' || value.back() == 's') &&
            std::isspace(static_cast<unsigned char>(value[value.size() - 2]))) {
            value = trim(value.substr(0, value.size() - 1));
        }
        attr.value = strip_quotes(value);
    }
    if (attr.attribute.empty()) {
        return std::nullopt;
    }
    return Selector{attr};
}

// Split folded tag text at top-level whitespace: "a > b[x='1 2']" ->
// {"a", ">", "b[x='1 2']"}.
std::vector<std::string_view> split_fragments(std::string_view text) {
    std::vector<std::string_view> parts;
    size_t depth = 0;
    char quote = 0;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') quote = c;
        else if (c == '[' || c == '(') ++depth;
        else if ((c == ']' || c == ')') && depth > 0) --depth;
        else if (depth == 0 && std::isspace(static_cast<unsigned char>(c))) {
            if (i > start) parts.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    if (start < text.size()) parts.push_back(text.substr(start));
    return parts;
}

} // namespace

bool CombinatorSelector::operator==(const CombinatorSelector& o) const {
    if (kind != o.kind) return false;
    if (!inner || !o.inner) return !inner && !o.inner;
    return *inner == *o.inner;
}

std::optional<Combinator> combinator_from_string(std::string_view text) {
    if (text == " ") return Combinator::Descendant;
    if (text == ">") return Combinator::Child;
    if (text == "+") return Combinator::AdjacentSibling;
    if (text == "~") return Combinator::GeneralSibling;
    return std::nullopt;
}

const char* combinator_symbol(Combinator combinator) {
    switch (combinator) {
        case Combinator::Descendant:      return " ";
        case Combinator::Child:           return ">";
        case Combinator::AdjacentSibling: return "+";
        case Combinator::GeneralSibling:  return "~";
    }
    return " ";
}

std::optional<Selector> interpret_selector_fragment(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;

    if (text.substr(0, 2) == "::") {
        if (text.size() == 2) return std::nullopt;
        return Selector{PseudoElementSelector{std::string(text.substr(2))}};
    }

    if (text.front() == ':') {
        PseudoClassSelector pseudo;
        size_t paren = text.find('(');
        if (paren == std::string_view::npos) {
            pseudo.name = std::string(text.substr(1));
        } else {
            if (text.back() != ')') return std::nullopt;
            pseudo.name = std::string(text.substr(1, paren - 1));
            pseudo.argument = std::string(trim(text.substr(paren + 1, text.size() - paren - 2)));
        }
        if (pseudo.name.empty()) return std::nullopt;
        return Selector{pseudo};
    }

    if (text.front() == '[') {
        if (text.back() != ']' || text.size() < 3) return std::nullopt;
        return interpret_attribute(text.substr(1, text.size() - 2));
    }

    if (text.front() == '#') {
        if (text.size() == 1) return std::nullopt;
        SimpleSelector simple;
        simple.id = std::string(text.substr(1));
        return Selector{simple};
    }

    if (text.front() == '(') return std::nullopt;

    return simple_tag(text);
}

std::vector<Selector> expand_selector(const SimpleSelector& folded) {
    std::vector<Selector> result;

    if (folded.id) {
        SimpleSelector simple;
        simple.id = folded.id;
        result.push_back(Selector{simple});
    }

    if (folded.tag) {
        std::optional<Combinator> pending;
        for (std::string_view part : split_fragments(*folded.tag)) {
            if (auto comb = combinator_from_string(part)) {
                pending = comb;
                continue;
            }
            auto sel = interpret_selector_fragment(part);
            Selector piece = sel ? *sel : simple_tag(part);
            if (pending) {
                CombinatorSelector joined;
                joined.kind = *pending;
                joined.inner = std::make_shared<const Selector>(std::move(piece));
                result.push_back(Selector{joined});
                pending.reset();
            } else {
                result.push_back(std::move(piece));
            }
        }
        // A trailing combinator with nothing after it
        if (pending) {
            result.push_back(Selector{CombinatorSelector{*pending, nullptr}});
        }
    }

    for (const auto& entry : folded.classes) {
        std::string_view text = trim(entry);
        if (!text.empty() && text.front() == '(' && text.back() == ')' && !result.empty()) {
            if (auto* pseudo = std::get_if<PseudoClassSelector>(&result.back().data);
                pseudo && !pseudo->argument) {
                pseudo->argument = std::string(trim(text.substr(1, text.size() - 2)));
                continue;
            }
        }
        auto sel = interpret_selector_fragment(text);
        result.push_back(sel ? *sel : simple_tag(text));
    }

    return result;
}

} // namespace csskit::css
