#ifndef CUTPLAN_UNITS_UNIT_HPP
#define CUTPLAN_UNITS_UNIT_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace cutplan {

// Linear measurement systems a length may be entered in.
// All arithmetic happens in the canonical unit (millimetres).
enum class Unit {
    Millimeter,
    Centimeter,
    Meter,
    Inch,
    Foot,
    Yard
};

constexpr std::array<Unit, 6> kAllUnits = {
    Unit::Millimeter, Unit::Centimeter, Unit::Meter,
    Unit::Inch, Unit::Foot, Unit::Yard
};

// Millimetres per one `unit`. Throws std::logic_error for an
// out-of-range enumerator.
double unit_factor(Unit unit);

double to_canonical(double value, Unit unit);
double from_canonical(double value, Unit unit);
double convert_length(double value, Unit from, Unit to);

// Short suffix ("mm", "in", ...) and long name ("millimeter", ...)
std::string unit_suffix(Unit unit);
std::string unit_name(Unit unit);

// Accepts suffixes, singular and plural long names, case-insensitive.
std::optional<Unit> unit_from_string(std::string_view text);

// Display rounding, e.g. format_length(496.8, Unit::Millimeter) -> "496.8mm"
std::string format_length(double value, Unit unit, int precision = 1);
std::string format_number(double value, int precision = 1);

}  // namespace cutplan

#endif // CUTPLAN_UNITS_UNIT_HPP
