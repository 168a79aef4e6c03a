#include "cli_common.hpp"
#include <report/plan_report.hpp>
#include <serialization/result_json.hpp>

namespace cutplan::cli {

// Render a JobResult in the requested format ("text", "svg" or "csv")
std::string render_result(const JobResult& result, const std::string& format) {
    if (format == "text") {
        return render_text(result);
    }
    if (format == "svg") {
        return render_svg(result);
    }
    if (format == "csv") {
        return render_csv(result);
    }
    throw std::invalid_argument("Unknown format: " + format + " (expected text, svg or csv)");
}

int command_report(int argc, char** argv) {
    auto log = cutplan::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: cutplan report <plan.json> [-o <output>] [-f text|svg|csv]\n";
            return ctx.help ? 0 : 1;
        }

        std::string format = ctx.format.value_or(has_suffix(ctx.output_path, ".svg") ? "svg" : "text");
        log->info("Rendering {} report from {}", format, ctx.input_path);

        JobResult result = json::deserialize_result(json::read_serialized(ctx.input_path));
        emit_output(ctx.output_path, render_result(result, format));

        if (!ctx.output_path.empty()) {
            log->info("Wrote report to {}", ctx.output_path);
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int command_run(int argc, char** argv, int start_idx) {
    auto log = cutplan::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, start_idx);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: cutplan <job.txt|job.json> [-o <output>] [-f text|svg|csv|json]\n";
            return 1;
        }

        log->info("Starting cutplan pipeline");
        log->info("Input file: {}", ctx.input_path);

        log->debug("Stage 1: Loading job");
        CutJob job = load_job(ctx.input_path);
        log->debug("Loaded {} cut requests", job.cuts.size());

        log->debug("Stage 2: Planning");
        JobResult result = plan_job(job);

        log->debug("Stage 3: Rendering");
        std::string format = ctx.format.value_or("text");
        if (format == "json") {
            emit_output(ctx.output_path,
                        json::serialize_result(result, ctx.input_path).to_json().dump(2) + "\n");
        } else {
            emit_output(ctx.output_path, render_result(result, format));
        }

        log->info("Pipeline complete: {} of {} cuts on {} of {} bars",
                  result.summary.total_made, result.summary.total_needed,
                  result.summary.bars_used, result.summary.bar_count);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace cutplan::cli
