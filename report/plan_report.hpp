#ifndef CUTPLAN_REPORT_PLAN_REPORT_HPP
#define CUTPLAN_REPORT_PLAN_REPORT_HPP

#include <job/cut_job.hpp>
#include <string>

namespace cutplan {

struct ReportConfig {
    int bar_width = 60;        // Characters per bar in the text chart
    int precision = 1;         // Decimal places for lengths
    bool show_chart = true;
    bool show_summary = true;

    // SVG layout (pixels)
    int svg_width = 800;
    int svg_row_height = 24;
    int svg_row_gap = 6;
};

// Bar chart of every stock bar followed by the made/needed summary
std::string render_text(const JobResult& result, const ReportConfig& config = {});

// The same chart as a standalone SVG document
std::string render_svg(const JobResult& result, const ReportConfig& config = {});

// One line per bar: index, cuts separated by ';', waste
std::string render_csv(const JobResult& result, const ReportConfig& config = {});

// A single bar of the text chart, exactly `width` characters:
// '#' for cuts, '|' for kerf, '.' for waste
std::string render_bar(const CutPlan& plan, double stock_length, double kerf, int width);

}  // namespace cutplan

#endif // CUTPLAN_REPORT_PLAN_REPORT_HPP
