#include "cli_common.hpp"
#include <serialization/result_json.hpp>

namespace cutplan::cli {

int command_parse(int argc, char** argv) {
    auto log = cutplan::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: cutplan parse <job.txt> [-o <job.json>]\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Parsing cut list: {}", ctx.input_path);

        CutJob job = parse_job_text(read_file(ctx.input_path));
        std::string output = resolve_output_path(ctx.input_path, ".job.json", ctx.output_path);

        json::write_serialized(output, json::serialize_job(job, ctx.input_path));

        log->info("Wrote job to {}", output);
        std::cerr << "Wrote " << output << " (" << job.cuts.size() << " cut requests)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace cutplan::cli
