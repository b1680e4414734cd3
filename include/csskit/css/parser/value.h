#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace csskit::css {

struct Value;

// ---------------------------------------------------------------------------
// Colors
// ---------------------------------------------------------------------------

struct HexColor {
    std::string digits;  // without '#': "fff", "007bff"
    bool operator==(const HexColor& o) const { return digits == o.digits; }
};

struct RgbColor {
    uint8_t r = 0, g = 0, b = 0;
    bool operator==(const RgbColor& o) const { return r == o.r && g == o.g && b == o.b; }
};

struct RgbaColor {
    uint8_t r = 0, g = 0, b = 0;
    float a = 1.0f;  // 0..1
    bool operator==(const RgbaColor& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
};

struct HslColor {
    float h = 0, s = 0, l = 0;  // degrees, percent, percent
    bool operator==(const HslColor& o) const { return h == o.h && s == o.s && l == o.l; }
};

struct HslaColor {
    float h = 0, s = 0, l = 0;
    float a = 1.0f;
    bool operator==(const HslaColor& o) const {
        return h == o.h && s == o.s && l == o.l && a == o.a;
    }
};

struct NamedColor {
    std::string name;
    bool operator==(const NamedColor& o) const { return name == o.name; }
};

using ColorValue = std::variant<HexColor, RgbColor, RgbaColor, HslColor, HslaColor, NamedColor>;

// ---------------------------------------------------------------------------
// Typed dimensions
// ---------------------------------------------------------------------------

enum class AngleUnit { Degree, Grad, Radian, Turn };
enum class TimeUnit { Second, Millisecond };
enum class FrequencyUnit { Hertz, Kilohertz };
enum class ResolutionUnit { Dpi, Dpcm, Dppx };

struct Angle {
    double value = 0;
    AngleUnit unit = AngleUnit::Degree;
    bool operator==(const Angle& o) const { return value == o.value && unit == o.unit; }
};

struct Time {
    double value = 0;
    TimeUnit unit = TimeUnit::Second;
    bool operator==(const Time& o) const { return value == o.value && unit == o.unit; }
};

struct Frequency {
    double value = 0;
    FrequencyUnit unit = FrequencyUnit::Hertz;
    bool operator==(const Frequency& o) const { return value == o.value && unit == o.unit; }
};

struct Resolution {
    double value = 0;
    ResolutionUnit unit = ResolutionUnit::Dpi;
    bool operator==(const Resolution& o) const { return value == o.value && unit == o.unit; }
};

// ---------------------------------------------------------------------------
// Plain values
// ---------------------------------------------------------------------------

struct Identifier {
    std::string name;
    bool operator==(const Identifier& o) const { return name == o.name; }
};

struct StringValue {
    std::string text;  // quotes stripped, escapes as written
    bool operator==(const StringValue& o) const { return text == o.text; }
};

struct Number {
    double value = 0;
    bool operator==(const Number& o) const { return value == o.value; }
};

struct Percentage {
    double value = 0;  // 50% -> 50.0
    bool operator==(const Percentage& o) const { return value == o.value; }
};

struct Dimension {
    double value = 0;
    std::string unit;  // as written: "px", "rem", "Deg"
    bool operator==(const Dimension& o) const { return value == o.value && unit == o.unit; }
};

struct Uri {
    std::string url;
    bool operator==(const Uri& o) const { return url == o.url; }
};

struct Var {
    std::string name;  // "--main-color"
    bool operator==(const Var& o) const { return name == o.name; }
};

struct FunctionValue {
    std::string name;
    std::vector<Value> arguments;
    bool operator==(const FunctionValue& o) const;
};

// ---------------------------------------------------------------------------
// calc()
// ---------------------------------------------------------------------------

enum class CalcOperator { Add, Subtract, Multiply, Divide };

struct CalcNumber {
    double value = 0;
    std::optional<std::string> unit;  // "px", "%", none for a bare number
    bool operator==(const CalcNumber& o) const { return value == o.value && unit == o.unit; }
};

using CalcTerm = std::variant<CalcNumber, CalcOperator>;

struct CalcExpression {
    std::vector<CalcTerm> terms;  // source order, no precedence applied
    bool operator==(const CalcExpression& o) const { return terms == o.terms; }
};

// ---------------------------------------------------------------------------
// Gradients
// ---------------------------------------------------------------------------

struct ColorStop {
    ColorValue color;
    std::optional<Dimension> position;  // percentages use unit "%"
    bool operator==(const ColorStop& o) const {
        return color == o.color && position == o.position;
    }
};

struct LinearGradient {
    std::optional<Angle> angle;        // 45deg
    std::optional<std::string> side;   // "to right", "to top left"
    std::vector<ColorStop> color_stops;
    bool operator==(const LinearGradient& o) const {
        return angle == o.angle && side == o.side && color_stops == o.color_stops;
    }
};

struct RadialGradient {
    std::optional<std::string> shape;     // circle, ellipse
    std::optional<std::string> size;      // closest-side, farthest-corner
    std::optional<std::string> position;  // "center", "top left"
    std::vector<ColorStop> color_stops;
    bool operator==(const RadialGradient& o) const {
        return shape == o.shape && size == o.size && position == o.position &&
               color_stops == o.color_stops;
    }
};

enum class GradientKind { Linear, Radial, RepeatingLinear, RepeatingRadial };

struct GradientValue {
    GradientKind kind = GradientKind::Linear;
    // LinearGradient for Linear/RepeatingLinear, RadialGradient otherwise
    std::variant<LinearGradient, RadialGradient> gradient;
    bool operator==(const GradientValue& o) const {
        return kind == o.kind && gradient == o.gradient;
    }
};

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

struct Value {
    std::variant<Identifier, StringValue, Number, Percentage, Dimension, Uri,
                 FunctionValue, CalcExpression, Var, ColorValue, GradientValue,
                 Angle, Time, Frequency, Resolution> data;

    template <typename T>
    bool is() const { return std::holds_alternative<T>(data); }

    template <typename T>
    const T* get() const { return std::get_if<T>(&data); }

    bool operator==(const Value& o) const { return data == o.data; }
};

inline bool FunctionValue::operator==(const FunctionValue& o) const {
    return name == o.name && arguments == o.arguments;
}

} // namespace csskit::css
