#include "cli_common.hpp"
#include <serialization/result_json.hpp>

namespace cutplan::cli {

int command_plan(int argc, char** argv) {
    auto log = cutplan::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: cutplan plan <job.txt|job.json> [-o <plan.json>]\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Planning job: {}", ctx.input_path);

        CutJob job = load_job(ctx.input_path);
        JobResult result = plan_job(job);

        std::string output = resolve_output_path(ctx.input_path, ".plan.json", ctx.output_path);
        json::write_serialized(output, json::serialize_result(result, ctx.input_path));

        log->info("Wrote plan to {}", output);
        std::cerr << "Wrote " << output << " (" << result.summary.total_made << " of "
                  << result.summary.total_needed << " cuts on "
                  << result.summary.bars_used << " bars)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace cutplan::cli
