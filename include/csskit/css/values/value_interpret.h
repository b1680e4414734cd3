#pragma once
#include <csskit/css/parser/value.h>
#include <optional>
#include <string_view>

namespace csskit::css {

// Basic CSS color keywords, plus "transparent". Case-insensitive.
bool is_named_color(std::string_view name);

// Colors the parser leaves generic: named identifiers and hsl()/hsla() calls.
// Values that are already a ColorValue pass through unchanged.
std::optional<ColorValue> interpret_color(const Value& value);

// deg/grad/rad/turn -> Angle, s/ms -> Time, hz/khz -> Frequency,
// dpi/dpcm/dppx -> Resolution. nullopt for any other unit.
std::optional<Value> classify_dimension(const Dimension& dimension);

// linear-gradient(), radial-gradient() and their repeating- forms.
// Needs at least two color stops.
std::optional<GradientValue> interpret_gradient(const FunctionValue& function);

const char* angle_unit_name(AngleUnit unit);
const char* time_unit_name(TimeUnit unit);
const char* frequency_unit_name(FrequencyUnit unit);
const char* resolution_unit_name(ResolutionUnit unit);

} // namespace csskit::css
