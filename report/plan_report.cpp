#include "plan_report.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace cutplan {

namespace {

int scaled_width(double length, double stock_length, int width) {
    if (stock_length <= 0.0) return 0;
    return static_cast<int>(std::lround(length / stock_length * width));
}

std::string join_cuts(const CutPlan& plan, int precision, const std::string& separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < plan.cuts.size(); ++i) {
        if (i > 0) oss << separator;
        oss << format_number(plan.cuts[i], precision);
    }
    return oss.str();
}

}  // namespace

std::string render_bar(const CutPlan& plan, double stock_length, double kerf, int width) {
    std::string bar;
    bar.reserve(static_cast<size_t>(std::max(width, 0)));

    for (double cut : plan.cuts) {
        // Every piece stays visible, however short
        int cells = std::max(1, scaled_width(cut, stock_length, width));
        bar.append(static_cast<size_t>(cells), '#');
        if (kerf > 0.0) {
            int kerf_cells = std::max(1, scaled_width(kerf, stock_length, width));
            bar.append(static_cast<size_t>(kerf_cells), '|');
        }
    }

    size_t target = static_cast<size_t>(std::max(width, 0));
    if (bar.size() > target) {
        bar.resize(target);
    } else {
        bar.append(target - bar.size(), '.');
    }
    return bar;
}

std::string render_text(const JobResult& result, const ReportConfig& config) {
    const CutJob& job = result.job;
    const std::string suffix = unit_suffix(job.length_unit);
    const double kerf = kerf_in_display_unit(job);
    std::ostringstream out;

    out << "Cut plan: " << job.stock_count << " x "
        << format_length(job.stock_length, job.length_unit, config.precision)
        << " stock, kerf " << format_number(job.kerf_width, config.precision)
        << unit_suffix(job.kerf_unit) << "\n";

    for (const auto& warning : result.warnings) {
        out << "Warning: " << warning << "\n";
    }

    if (config.show_chart) {
        out << "\n";
        int index_width = static_cast<int>(std::to_string(result.plans.size()).size());
        for (size_t i = 0; i < result.plans.size(); ++i) {
            const CutPlan& plan = result.plans[i];
            std::string index = std::to_string(i + 1);
            out << std::string(static_cast<size_t>(index_width) - index.size(), ' ')
                << index << ". ["
                << render_bar(plan, job.stock_length, kerf, config.bar_width) << "] ";
            if (plan.empty()) {
                out << "unused, " << format_length(plan.waste, job.length_unit, config.precision);
            } else {
                out << join_cuts(plan, config.precision, ", ")
                    << " | waste " << format_length(plan.waste, job.length_unit, config.precision);
            }
            out << "\n";
        }
    }

    if (config.show_summary) {
        const PlanSummary& summary = result.summary;
        out << "\nSummary\n";
        for (const auto& row : summary.rows) {
            out << "  -> " << format_number(row.length, config.precision) << suffix
                << " cuts: " << row.made << " of " << row.needed << " needed\n";
        }
        out << "  -> Total cuts: " << summary.total_made << " of "
            << summary.total_needed << " needed\n";
        out << "  -> Total waste: "
            << format_length(summary.total_waste, job.length_unit, config.precision) << "\n";
        out << "  -> Bars: " << summary.bars_used << " of " << summary.bar_count << " used\n";
        if (!summary.complete()) {
            out << "  -> Short by " << summary.deficit() << " pieces\n";
        }
    }

    return out.str();
}

std::string render_svg(const JobResult& result, const ReportConfig& config) {
    const CutJob& job = result.job;
    const double kerf = kerf_in_display_unit(job);
    const int label_width = 40;
    const double chart_width = config.svg_width - label_width;
    const int pitch = config.svg_row_height + config.svg_row_gap;
    const int height = static_cast<int>(result.plans.size()) * pitch + config.svg_row_gap;

    auto scale = [&](double length) {
        return job.stock_length > 0.0 ? length / job.stock_length * chart_width : 0.0;
    };

    std::ostringstream out;
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << config.svg_width
        << "\" height=\"" << height << "\" font-family=\"monospace\" font-size=\"11\">\n";
    out << "  <rect width=\"100%\" height=\"100%\" fill=\"#000000\"/>\n";

    for (size_t i = 0; i < result.plans.size(); ++i) {
        const CutPlan& plan = result.plans[i];
        const int y = config.svg_row_gap + static_cast<int>(i) * pitch;
        const int text_y = y + config.svg_row_height / 2 + 4;

        out << "  <text x=\"4\" y=\"" << text_y << "\" fill=\"#4b5563\">" << (i + 1) << ".</text>\n";
        out << "  <rect x=\"" << label_width << "\" y=\"" << y << "\" width=\"" << chart_width
            << "\" height=\"" << config.svg_row_height << "\" fill=\"#111827\"/>\n";

        double x = label_width;
        for (double cut : plan.cuts) {
            double w = scale(cut);
            out << "  <rect x=\"" << x << "\" y=\"" << y << "\" width=\"" << w
                << "\" height=\"" << config.svg_row_height << "\" fill=\"#1f2937\"/>\n";
            out << "  <text x=\"" << (x + w / 2) << "\" y=\"" << text_y
                << "\" fill=\"#ffffff\" text-anchor=\"middle\">"
                << format_number(cut, config.precision) << "</text>\n";
            x += w;
            if (kerf > 0.0) {
                double kw = std::max(1.0, scale(kerf));
                out << "  <rect x=\"" << x << "\" y=\"" << y << "\" width=\"" << kw
                    << "\" height=\"" << config.svg_row_height << "\" fill=\"#7f1d1d\"/>\n";
                x += kw;
            }
        }

        if (plan.waste > 0.0) {
            double waste_x = plan.empty() ? label_width : x;
            double waste_w = std::max(0.0, label_width + chart_width - waste_x);
            out << "  <text x=\"" << (waste_x + waste_w / 2) << "\" y=\"" << text_y
                << "\" fill=\"#6b7280\" text-anchor=\"middle\">"
                << format_number(plan.waste, config.precision) << "</text>\n";
        }
    }

    out << "</svg>\n";
    return out.str();
}

std::string render_csv(const JobResult& result, const ReportConfig& config) {
    std::ostringstream out;
    out << "bar,cuts,waste\n";
    for (size_t i = 0; i < result.plans.size(); ++i) {
        const CutPlan& plan = result.plans[i];
        out << (i + 1) << "," << join_cuts(plan, config.precision, ";") << ","
            << format_number(plan.waste, config.precision) << "\n";
    }
    return out.str();
}

}  // namespace cutplan
