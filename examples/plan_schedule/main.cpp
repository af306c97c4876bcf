/**
 * @file main.cpp
 * @brief Plan Schedule - place a task breakdown into free calendar time
 *
 * A command-line utility that builds free time from busy calendar
 * intervals and places the items of a task breakdown into it.
 *
 * Usage:
 *   plan_schedule [options] --item <entry> [--item <entry> ...]
 *
 * Example:
 *   plan_schedule --now 2026-10-19T08:00 --busy 2026-10-19T10:00/2026-10-19T11:00 \
 *       --title "Essay" --due 2026-10-24 \
 *       --item "Research|2|2026-10-20 morning" --item "Draft|3"
 */

#include "studyplan/core/local_zone.hpp"
#include "studyplan/intake/plan_hint_parser.hpp"
#include "studyplan/intake/plan_intake.hpp"
#include "studyplan/integration/logger_adapter.hpp"
#include "studyplan/scheduling/free_slot_generator.hpp"
#include "studyplan/scheduling/placement_scheduler.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

// =============================================================================
// Constants
// =============================================================================

/// Version information
constexpr const char* version_string = "1.0.0";

// =============================================================================
// Command Line Options
// =============================================================================

/**
 * @brief Command line options structure
 */
struct options {
    // Time options
    std::string now_text;
    int utc_offset_minutes{0};
    int horizon_days{studyplan::scheduling::defaults::horizon_days};

    // Plan options
    std::string title{"Assignment Plan"};
    std::string due_date;
    std::string category;
    std::vector<std::string> busy_entries;
    std::vector<std::string> item_entries;

    // Output options
    bool verbose{false};

    // Help/version flags
    bool show_help{false};
    bool show_version{false};
};

// =============================================================================
// Output Functions
// =============================================================================

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << R"( [options] --item <entry> [--item <entry> ...]

Options:
  -h, --help                    Show this help message and exit
  -v, --verbose                 Log placement decisions
  --version                     Show version information

Time Options:
  --now <iso>                   Current time, e.g. 2026-10-19T08:00 (default: system clock)
  --utc-offset <minutes>        Local offset from UTC (default: 0)
  --horizon <days>              Days of free time to consider (default: 21)

Plan Options:
  --title <text>                Parent task title (default: Assignment Plan)
  --due <YYYY-MM-DD>            Parent task due date
  --category <text>             Routing tag copied onto every entry
  --busy <start>/<end>          Existing calendar entry, ISO-8601 (repeatable)
  --item <title|hours|hint|focus>
                                Work item; hours, hint and focus may be empty

Exit Codes:
  0  Success - every item was scheduled
  1  Partial - some items could not be scheduled
  2  Error - Invalid arguments
)";
}

/**
 * @brief Print version information
 */
void print_version() {
    std::cout << "plan_schedule version " << version_string << "\n";
}

// =============================================================================
// Argument Parsing
// =============================================================================

/**
 * @brief Parse integer value from string
 * @param value String value
 * @param result Output integer value
 * @param option_name Name of the option for error messages
 * @return true if parsing succeeded
 */
bool parse_int(const std::string& value, int& result, const std::string& option_name) {
    try {
        std::size_t consumed = 0;
        result = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            std::cerr << "Error: Invalid value for " << option_name << ": '"
                      << value << "'\n";
            return false;
        }
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid value for " << option_name << ": '"
                  << value << "'\n";
        return false;
    }
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param opts Output: parsed options
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            return true;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }

        if (i + 1 >= argc) {
            std::cerr << "Error: Unknown option or missing value: '" << arg << "'\n";
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--now") {
            opts.now_text = value;
        } else if (arg == "--utc-offset") {
            if (!parse_int(value, opts.utc_offset_minutes, "--utc-offset")) {
                return false;
            }
        } else if (arg == "--horizon") {
            if (!parse_int(value, opts.horizon_days, "--horizon")) {
                return false;
            }
        } else if (arg == "--title") {
            opts.title = value;
        } else if (arg == "--due") {
            opts.due_date = value;
        } else if (arg == "--category") {
            opts.category = value;
        } else if (arg == "--busy") {
            opts.busy_entries.push_back(value);
        } else if (arg == "--item") {
            opts.item_entries.push_back(value);
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        }
    }

    if (opts.item_entries.empty()) {
        std::cerr << "Error: At least one --item is required\n";
        return false;
    }
    return true;
}

/**
 * @brief Split "a|b|c" into fields, keeping empty ones
 */
std::vector<std::string> split_fields(const std::string& entry, char separator) {
    std::vector<std::string> fields;
    std::istringstream iss(entry);
    std::string field;
    while (std::getline(iss, field, separator)) {
        fields.push_back(field);
    }
    return fields;
}

/**
 * @brief Convert a "title|hours|hint|focus" entry into a proposed item
 */
studyplan::intake::proposed_item parse_item(const std::string& entry) {
    auto fields = split_fields(entry, '|');
    studyplan::intake::proposed_item item;
    if (!fields.empty()) item.title = fields[0];
    if (fields.size() > 1 && !fields[1].empty()) item.estimated_hours = fields[1];
    if (fields.size() > 2 && !fields[2].empty()) item.planned_start = fields[2];
    if (fields.size() > 3 && !fields[3].empty()) item.focus = fields[3];
    return item;
}

/**
 * @brief Convert a "start/end" entry into a calendar event
 * @return true if both instants parsed
 */
bool parse_busy(const std::string& entry, const studyplan::core::local_zone& zone,
                studyplan::intake::calendar_event& event) {
    auto fields = split_fields(entry, '/');
    if (fields.size() != 2) {
        std::cerr << "Error: --busy expects <start>/<end>: '" << entry << "'\n";
        return false;
    }
    event.title = entry;
    event.start = studyplan::intake::parse_plan_hint(fields[0], zone);
    event.end = studyplan::intake::parse_plan_hint(fields[1], zone);
    if (!event.start || !event.end) {
        std::cerr << "Error: Invalid --busy interval: '" << entry << "'\n";
        return false;
    }
    return true;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    using namespace studyplan;

    options opts;
    if (!parse_arguments(argc, argv, opts)) {
        std::cerr << "Use --help for usage information\n";
        return 2;
    }
    if (opts.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (opts.show_version) {
        print_version();
        return 0;
    }

    integration::logger_config log_config;
    log_config.min_level =
        opts.verbose ? integration::log_level::debug : integration::log_level::warn;
    integration::logger_adapter::initialize(log_config);

    auto zone_result = core::local_zone::create(std::chrono::minutes{opts.utc_offset_minutes});
    if (zone_result.is_err()) {
        std::cerr << "Error: " << zone_result.error().message << "\n";
        integration::logger_adapter::shutdown();
        return 2;
    }
    const auto zone = zone_result.value();

    scheduling::scheduler_config config;
    config.horizon_days = opts.horizon_days;
    auto valid = config.validate();
    if (valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << "\n";
        integration::logger_adapter::shutdown();
        return 2;
    }

    auto now = std::chrono::system_clock::now();
    if (!opts.now_text.empty()) {
        auto parsed = intake::parse_plan_hint(opts.now_text, zone);
        if (!parsed) {
            std::cerr << "Error: Invalid --now value: '" << opts.now_text << "'\n";
            integration::logger_adapter::shutdown();
            return 2;
        }
        now = *parsed;
    }

    std::vector<intake::calendar_event> events;
    for (const auto& entry : opts.busy_entries) {
        intake::calendar_event event;
        if (!parse_busy(entry, zone, event)) {
            integration::logger_adapter::shutdown();
            return 2;
        }
        events.push_back(std::move(event));
    }

    std::vector<intake::proposed_item> items;
    for (const auto& entry : opts.item_entries) {
        items.push_back(parse_item(entry));
    }

    scheduling::plan_context context;
    context.parent_title = opts.title;
    context.deadline = intake::parse_due_datetime(opts.due_date, zone);
    if (!opts.category.empty()) {
        context.category = opts.category;
    }

    scheduling::free_slot_generator generator{config, zone};
    scheduling::placement_scheduler scheduler{config, zone};

    auto slots = generator.generate(intake::collect_busy_intervals(events, now), now);
    auto result = scheduler.schedule(intake::make_requests(items, zone), slots, context, now);

    for (const auto& assignment : result.scheduled) {
        std::cout << assignment.interval.to_string(zone) << "  " << assignment.title;
        if (assignment.focus) {
            std::cout << " @ " << *assignment.focus;
        }
        std::cout << "\n";
    }
    for (const auto& item : result.unscheduled) {
        std::cout << "unscheduled  #" << item.position << " "
                  << (item.title.empty() ? "Subtask" : item.title) << "\n";
    }
    std::cout << intake::summarize(result) << "\n";

    integration::logger_adapter::shutdown();
    return result.all_scheduled() ? 0 : 1;
}
