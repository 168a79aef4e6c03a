#ifndef CUTPLAN_SERIALIZATION_RESULT_JSON_HPP
#define CUTPLAN_SERIALIZATION_RESULT_JSON_HPP

#include <serialization/json_serialization.hpp>
#include <serialization/job_json.hpp>
#include <serialization/plan_json.hpp>
#include <job/cut_job.hpp>
#include <string>

namespace cutplan::json {

// Wrap a planned job: config = job, stats = summary and warnings, data = plans
inline SerializedData serialize_result(const JobResult& result,
                                       const std::string& source_file = "") {
    SerializedData data;
    data.step = "plan";
    data.timestamp = get_timestamp();
    data.source_file = source_file;
    data.config = nlohmann::json(result.job);
    data.stats = nlohmann::json(result.summary);
    data.stats["warnings"] = result.warnings;
    data.data = nlohmann::json(result.plans);
    return data;
}

inline JobResult deserialize_result(const SerializedData& data) {
    data.require_step("plan");

    JobResult result;
    result.job = data.config.get<CutJob>();
    result.plans = data.data.get<std::vector<CutPlan>>();
    if (data.stats.is_object()) {
        result.summary = data.stats.get<PlanSummary>();
        result.warnings = data.stats.value("warnings", std::vector<std::string>{});
    } else {
        result.summary = summarize(result.job.cuts, result.plans);
    }
    return result;
}

// Wrap an unplanned job
inline SerializedData serialize_job(const CutJob& job, const std::string& source_file = "") {
    SerializedData data;
    data.step = "job";
    data.timestamp = get_timestamp();
    data.source_file = source_file;
    data.data = nlohmann::json(job);
    data.stats = {
        {"request_count", job.cuts.size()},
        {"stock_count", job.stock_count}
    };
    return data;
}

}  // namespace cutplan::json

#endif // CUTPLAN_SERIALIZATION_RESULT_JSON_HPP
