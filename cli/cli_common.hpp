#ifndef CUTPLAN_CLI_CLI_COMMON_HPP
#define CUTPLAN_CLI_CLI_COMMON_HPP

#include <job/cut_job.hpp>
#include <parser/parser.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/job_json.hpp>
#include <common/logging.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cutplan::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> format;
    bool verbose = false;
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-f" || arg == "--format") {
            if (i + 1 < argc) {
                ctx.format = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-f/--format requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::enable_verbose();
    }

    return {ctx, i};
}

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    // Find last dot in input path
    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Make sure dot comes after last slash (if any)
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

inline bool has_suffix(const std::string& path, const std::string& suffix) {
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Read entire file to string
inline std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Write to the output path, or stdout when none was given
inline void emit_output(const std::string& path, const std::string& content) {
    if (path.empty() || path == "-") {
        std::cout << content;
    } else {
        write_file(path, content);
    }
}

// Parse cut-list text into a job; throws with every parse error listed
inline CutJob parse_job_text(const std::string& text) {
    auto log = logging::get_logger();

    parser::Tokenizer tokenizer(text);
    parser::Parser parser(tokenizer);
    CutJob job = parser.parse();

    if (parser.has_errors()) {
        std::ostringstream oss;
        oss << parser.errors().size() << " parse error(s)";
        for (const auto& error : parser.errors()) {
            log->error("Parse error: {}", error);
            oss << "\n  " << error;
        }
        throw std::invalid_argument(oss.str());
    }
    return job;
}

// Load a job from a cut-list text file or a JSON file (bare or wrapped)
inline CutJob load_job(const std::string& path) {
    if (has_suffix(path, ".json")) {
        nlohmann::json j = json::read_json_file(path);
        if (json::is_serialized(j)) {
            auto data = json::SerializedData::from_json(j);
            data.require_step("job");
            return data.data.get<CutJob>();
        }
        return j.get<CutJob>();
    }
    return parse_job_text(read_file(path));
}

// Command function declarations
int command_parse(int argc, char** argv);
int command_plan(int argc, char** argv);
int command_report(int argc, char** argv);
int command_run(int argc, char** argv, int start_idx);

}  // namespace cutplan::cli

#endif // CUTPLAN_CLI_CLI_COMMON_HPP
