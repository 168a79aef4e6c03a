#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <input>\n";
    std::cerr << "       " << program_name << " [options] <job.txt|job.json>\n";
    std::cerr << "\n";
    std::cerr << "Computes a cutting plan for linear stock bars.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  parse       Cut-list text -> job JSON\n";
    std::cerr << "  plan        Job (text or JSON) -> plan JSON\n";
    std::cerr << "  report      Plan JSON -> text, SVG or CSV report\n";
    std::cerr << "\n";
    std::cerr << "Without a command the whole pipeline runs and the report is\n";
    std::cerr << "printed to stdout.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>   Output file (defaults depend on the command)\n";
    std::cerr << "  -f, --format <fmt>    text, svg, csv (or json without a command)\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  -h, --help            Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Cut list format:\n";
    std::cerr << "  stock 10 x 2000 mm\n";
    std::cerr << "  kerf 3.2 mm\n";
    std::cerr << "  cut 1500 x 6\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  CUTPLAN_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "parse") {
        return cutplan::cli::command_parse(argc, argv);
    }
    if (command == "plan") {
        return cutplan::cli::command_plan(argc, argv);
    }
    if (command == "report") {
        return cutplan::cli::command_report(argc, argv);
    }

    return cutplan::cli::command_run(argc, argv, 1);
}
