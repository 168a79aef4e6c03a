#ifndef CUTPLAN_SERIALIZATION_JOB_JSON_HPP
#define CUTPLAN_SERIALIZATION_JOB_JSON_HPP

#include <nlohmann/json.hpp>
#include <job/cut_job.hpp>
#include <plan/cut_request.hpp>
#include <units/unit.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace cutplan {

// Unit serialization (as its suffix). Unknown names are rejected rather
// than mapped to a default unit.
inline void to_json(nlohmann::json& j, const Unit& unit) {
    j = unit_suffix(unit);
}

inline void from_json(const nlohmann::json& j, Unit& unit) {
    auto text = j.get<std::string>();
    auto parsed = unit_from_string(text);
    if (!parsed) {
        throw std::invalid_argument("Unknown unit: '" + text + "'");
    }
    unit = *parsed;
}

// Counts are read as numbers so that negative or fractional values are
// caught here instead of wrapping through an unsigned conversion. Negative
// values become 0, which clamp_job then coerces like any other
// non-positive count.
inline uint32_t count_from_json(const nlohmann::json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& field = j.at(key);
    if (!field.is_number()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a number");
    }
    double value = field.get<double>();
    if (value < 0.0) {
        return 0;
    }
    if (std::floor(value) != value ||
        value > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        throw std::invalid_argument(std::string("'") + key + "' must be a whole number, got " +
                                    field.dump());
    }
    return static_cast<uint32_t>(value);
}

// CutRequest serialization
inline void to_json(nlohmann::json& j, const CutRequest& request) {
    j = {
        {"length", request.length},
        {"quantity", request.quantity}
    };
}

inline void from_json(const nlohmann::json& j, CutRequest& request) {
    request.length = j.value("length", 0.0);
    request.quantity = count_from_json(j, "quantity", 1);
}

// CutJob serialization
inline void to_json(nlohmann::json& j, const CutJob& job) {
    j = {
        {"stock_count", job.stock_count},
        {"stock_length", job.stock_length},
        {"length_unit", job.length_unit},
        {"kerf_width", job.kerf_width},
        {"kerf_unit", job.kerf_unit},
        {"cuts", job.cuts}
    };
}

inline void from_json(const nlohmann::json& j, CutJob& job) {
    CutJob defaults;
    job.stock_count = count_from_json(j, "stock_count", defaults.stock_count);
    job.stock_length = j.value("stock_length", defaults.stock_length);
    job.length_unit = j.contains("length_unit") ? j["length_unit"].get<Unit>()
                                                : defaults.length_unit;
    job.kerf_width = j.value("kerf_width", defaults.kerf_width);
    job.kerf_unit = j.contains("kerf_unit") ? j["kerf_unit"].get<Unit>()
                                            : defaults.kerf_unit;
    if (j.contains("cuts")) {
        job.cuts = j["cuts"].get<std::vector<CutRequest>>();
    } else {
        job.cuts = defaults.cuts;
    }
}

}  // namespace cutplan

#endif // CUTPLAN_SERIALIZATION_JOB_JSON_HPP
