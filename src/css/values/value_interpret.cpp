#include <csskit/css/values/value_interpret.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace csskit::css {

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Named color table
constexpr std::array<std::string_view, 21> kNamedColors = {
    "black", "white", "red", "green", "blue", "yellow", "orange",
    "purple", "gray", "grey", "transparent", "cyan", "magenta", "lime",
    "maroon", "navy", "olive", "teal", "silver", "aqua", "fuchsia",
};

bool is_one_of(const std::string& word, std::initializer_list<std::string_view> words) {
    return std::find(words.begin(), words.end(), word) != words.end();
}

const Identifier* as_identifier(const Value& value) {
    return value.get<Identifier>();
}

std::string lower_identifier(const Value& value) {
    const Identifier* ident = as_identifier(value);
    return ident ? to_lower(ident->name) : std::string();
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Position text for "at <position>": keywords and lengths joined by spaces
std::optional<std::string> position_piece(const Value& value) {
    if (const Identifier* ident = as_identifier(value)) {
        std::string word = to_lower(ident->name);
        if (is_one_of(word, {"center", "top", "bottom", "left", "right"})) return word;
        return std::nullopt;
    }
    if (const Percentage* pct = value.get<Percentage>()) {
        return format_number(pct->value) + "%";
    }
    if (const Dimension* dim = value.get<Dimension>()) {
        return format_number(dim->value) + dim->unit;
    }
    if (const Number* num = value.get<Number>(); num && num->value == 0) {
        return std::string("0");
    }
    return std::nullopt;
}

// hsl(h, s%, l%) / hsla(h, s%, l%, a). Hue is a number or a deg dimension;
// alpha is a number or a percentage. A "/" separator is ignored.
std::optional<ColorValue> interpret_hsl(const FunctionValue& fn) {
    std::vector<const Value*> args;
    for (const auto& arg : fn.arguments) {
        if (lower_identifier(arg) == "/") continue;
        args.push_back(&arg);
    }
    if (args.size() != 3 && args.size() != 4) return std::nullopt;

    float h = 0;
    if (const Number* num = args[0]->get<Number>()) {
        h = static_cast<float>(num->value);
    } else if (const Dimension* dim = args[0]->get<Dimension>(); dim && to_lower(dim->unit) == "deg") {
        h = static_cast<float>(dim->value);
    } else {
        return std::nullopt;
    }

    const Percentage* s = args[1]->get<Percentage>();
    const Percentage* l = args[2]->get<Percentage>();
    if (!s || !l) return std::nullopt;

    if (args.size() == 3) {
        return ColorValue{HslColor{h, static_cast<float>(s->value), static_cast<float>(l->value)}};
    }

    float a = 1.0f;
    if (const Number* num = args[3]->get<Number>()) {
        a = static_cast<float>(num->value);
    } else if (const Percentage* pct = args[3]->get<Percentage>()) {
        a = static_cast<float>(pct->value / 100.0);
    } else {
        return std::nullopt;
    }
    return ColorValue{HslaColor{h, static_cast<float>(s->value), static_cast<float>(l->value), a}};
}

// Color stops from args[start..]: a color, optionally followed by a position
std::optional<std::vector<ColorStop>> parse_color_stops(const std::vector<Value>& args,
                                                        size_t start) {
    std::vector<ColorStop> stops;
    size_t i = start;
    while (i < args.size()) {
        auto color = interpret_color(args[i]);
        if (!color) return std::nullopt;
        ColorStop stop{*color, std::nullopt};
        ++i;
        if (i < args.size()) {
            if (const Percentage* pct = args[i].get<Percentage>()) {
                stop.position = Dimension{pct->value, "%"};
                ++i;
            } else if (const Dimension* dim = args[i].get<Dimension>()) {
                stop.position = *dim;
                ++i;
            }
        }
        stops.push_back(std::move(stop));
    }
    if (stops.size() < 2) return std::nullopt;
    return stops;
}

std::optional<LinearGradient> interpret_linear(const std::vector<Value>& args) {
    LinearGradient gradient;
    size_t i = 0;

    if (!args.empty()) {
        if (const Dimension* dim = args[0].get<Dimension>()) {
            auto typed = classify_dimension(*dim);
            if (!typed || !typed->is<Angle>()) return std::nullopt;
            gradient.angle = *typed->get<Angle>();
            i = 1;
        } else if (lower_identifier(args[0]) == "to") {
            std::string side = "to";
            i = 1;
            while (i < args.size()) {
                std::string word = lower_identifier(args[i]);
                if (!is_one_of(word, {"top", "bottom", "left", "right"})) break;
                side += " " + word;
                ++i;
            }
            if (side == "to") return std::nullopt;
            gradient.side = side;
        }
    }

    auto stops = parse_color_stops(args, i);
    if (!stops) return std::nullopt;
    gradient.color_stops = std::move(*stops);
    return gradient;
}

std::optional<RadialGradient> interpret_radial(const std::vector<Value>& args) {
    RadialGradient gradient;
    size_t i = 0;

    for (; i < args.size(); ++i) {
        std::string word = lower_identifier(args[i]);
        if (is_one_of(word, {"circle", "ellipse"}) && !gradient.shape) {
            gradient.shape = word;
        } else if (is_one_of(word, {"closest-side", "closest-corner", "farthest-side",
                                    "farthest-corner"}) && !gradient.size) {
            gradient.size = word;
        } else {
            break;
        }
    }

    if (i < args.size() && lower_identifier(args[i]) == "at") {
        std::string position;
        ++i;
        while (i < args.size()) {
            auto piece = position_piece(args[i]);
            if (!piece) break;
            position += position.empty() ? *piece : " " + *piece;
            ++i;
        }
        if (position.empty()) return std::nullopt;
        gradient.position = position;
    }

    auto stops = parse_color_stops(args, i);
    if (!stops) return std::nullopt;
    gradient.color_stops = std::move(*stops);
    return gradient;
}

} // namespace

bool is_named_color(std::string_view name) {
    std::string lower = to_lower(name);
    return std::find(kNamedColors.begin(), kNamedColors.end(), lower) != kNamedColors.end();
}

std::optional<ColorValue> interpret_color(const Value& value) {
    if (const ColorValue* color = value.get<ColorValue>()) {
        return *color;
    }
    if (const Identifier* ident = value.get<Identifier>()) {
        if (!is_named_color(ident->name)) return std::nullopt;
        return ColorValue{NamedColor{to_lower(ident->name)}};
    }
    if (const FunctionValue* fn = value.get<FunctionValue>()) {
        std::string name = to_lower(fn->name);
        if (name == "hsl" || name == "hsla") return interpret_hsl(*fn);
    }
    return std::nullopt;
}

std::optional<Value> classify_dimension(const Dimension& dimension) {
    std::string unit = to_lower(dimension.unit);
    double v = dimension.value;

    if (unit == "deg") return Value{Angle{v, AngleUnit::Degree}};
    if (unit == "grad") return Value{Angle{v, AngleUnit::Grad}};
    if (unit == "rad") return Value{Angle{v, AngleUnit::Radian}};
    if (unit == "turn") return Value{Angle{v, AngleUnit::Turn}};
    if (unit == "s") return Value{Time{v, TimeUnit::Second}};
    if (unit == "ms") return Value{Time{v, TimeUnit::Millisecond}};
    if (unit == "hz") return Value{Frequency{v, FrequencyUnit::Hertz}};
    if (unit == "khz") return Value{Frequency{v, FrequencyUnit::Kilohertz}};
    if (unit == "dpi") return Value{Resolution{v, ResolutionUnit::Dpi}};
    if (unit == "dpcm") return Value{Resolution{v, ResolutionUnit::Dpcm}};
    if (unit == "dppx") return Value{Resolution{v, ResolutionUnit::Dppx}};
    return std::nullopt;
}

std::optional<GradientValue> interpret_gradient(const FunctionValue& function) {
    std::string name = to_lower(function.name);

    if (name == "linear-gradient" || name == "repeating-linear-gradient") {
        auto linear = interpret_linear(function.arguments);
        if (!linear) return std::nullopt;
        GradientKind kind = name == "linear-gradient" ? GradientKind::Linear
                                                      : GradientKind::RepeatingLinear;
        return GradientValue{kind, std::move(*linear)};
    }

    if (name == "radial-gradient" || name == "repeating-radial-gradient") {
        auto radial = interpret_radial(function.arguments);
        if (!radial) return std::nullopt;
        GradientKind kind = name == "radial-gradient" ? GradientKind::Radial
                                                      : GradientKind::RepeatingRadial;
        return GradientValue{kind, std::move(*radial)};
    }

    return std::nullopt;
}

const char* angle_unit_name(AngleUnit unit) {
    switch (unit) {
        case AngleUnit::Degree: return "deg";
        case AngleUnit::Grad:   return "grad";
        case AngleUnit::Radian: return "rad";
        case AngleUnit::Turn:   return "turn";
    }
    return "";
}

const char* time_unit_name(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Second:      return "s";
        case TimeUnit::Millisecond: return "ms";
    }
    return "";
}

const char* frequency_unit_name(FrequencyUnit unit) {
    switch (unit) {
        case FrequencyUnit::Hertz:     return "hz";
        case FrequencyUnit::Kilohertz: return "khz";
    }
    return "";
}

const char* resolution_unit_name(ResolutionUnit unit) {
    switch (unit) {
        case ResolutionUnit::Dpi:  return "dpi";
        case ResolutionUnit::Dpcm: return "dpcm";
        case ResolutionUnit::Dppx: return "dppx";
    }
    return "";
}

} // namespace csskit::css
