#include "unit.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cutplan {

double unit_factor(Unit unit) {
    switch (unit) {
        case Unit::Millimeter: return 1.0;
        case Unit::Centimeter: return 10.0;
        case Unit::Meter:      return 1000.0;
        case Unit::Inch:       return 25.4;
        case Unit::Foot:       return 304.8;
        case Unit::Yard:       return 914.4;
    }
    throw std::logic_error("Unknown unit enumerator: " +
                           std::to_string(static_cast<int>(unit)));
}

double to_canonical(double value, Unit unit) {
    return value * unit_factor(unit);
}

double from_canonical(double value, Unit unit) {
    return value / unit_factor(unit);
}

double convert_length(double value, Unit from, Unit to) {
    if (from == to) {
        return value;
    }
    return from_canonical(to_canonical(value, from), to);
}

std::string unit_suffix(Unit unit) {
    switch (unit) {
        case Unit::Millimeter: return "mm";
        case Unit::Centimeter: return "cm";
        case Unit::Meter:      return "m";
        case Unit::Inch:       return "in";
        case Unit::Foot:       return "ft";
        case Unit::Yard:       return "yd";
    }
    throw std::logic_error("Unknown unit enumerator: " +
                           std::to_string(static_cast<int>(unit)));
}

std::string unit_name(Unit unit) {
    switch (unit) {
        case Unit::Millimeter: return "millimeter";
        case Unit::Centimeter: return "centimeter";
        case Unit::Meter:      return "meter";
        case Unit::Inch:       return "inch";
        case Unit::Foot:       return "foot";
        case Unit::Yard:       return "yard";
    }
    throw std::logic_error("Unknown unit enumerator: " +
                           std::to_string(static_cast<int>(unit)));
}

std::optional<Unit> unit_from_string(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "mm" || lower == "millimeter" || lower == "millimeters" ||
        lower == "millimetre" || lower == "millimetres") {
        return Unit::Millimeter;
    }
    if (lower == "cm" || lower == "centimeter" || lower == "centimeters" ||
        lower == "centimetre" || lower == "centimetres") {
        return Unit::Centimeter;
    }
    if (lower == "m" || lower == "meter" || lower == "meters" ||
        lower == "metre" || lower == "metres") {
        return Unit::Meter;
    }
    if (lower == "in" || lower == "inch" || lower == "inches") {
        return Unit::Inch;
    }
    if (lower == "ft" || lower == "foot" || lower == "feet") {
        return Unit::Foot;
    }
    if (lower == "yd" || lower == "yard" || lower == "yards") {
        return Unit::Yard;
    }
    return std::nullopt;
}

std::string format_number(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string format_length(double value, Unit unit, int precision) {
    return format_number(value, precision) + unit_suffix(unit);
}

}  // namespace cutplan
