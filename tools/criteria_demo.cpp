#include "examples/demo/scenarios.hpp"

#include "criteria/core/platform_utils.hpp"
#include "criteria/core/text.hpp"
#include "criteria/error.hpp"

#include <charconv>
#include <cstddef>
#include <expected>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using criteria::demo::demo_options;
using criteria::demo::scenario;
using criteria::demo::scenario_group;

namespace {

struct Args {
    demo_options options;
    std::optional<std::string> scenario_name;   // name or "all"
    bool list{false};
    bool menu{false};
    bool help{false};
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "criteria demo: specification rules over sample and warehouse data\n"
              << "Usage: criteria_demo [--scenario=name|all] [--list] [--menu]\n"
              << "  [--domestic=USA] [--cycle_count_days=30] [--expiring_days=30] [--urgent_days=7]\n"
              << "Without --scenario the interactive menu is shown.\n"
              << "Environment: CRITERIA_DOMESTIC_COUNTRY (domestic country), CRITERIA_TRACE=1 (stderr trace)\n";
}

static auto config_error(std::string message) -> std::unexpected<criteria::core::error> {
    return std::unexpected(criteria::core::error{criteria::core::error_code::config_invalid,
                                                 std::move(message), "demo.config"});
}

static auto parse_days(std::string_view flag, const std::string& value)
    -> std::expected<int, criteria::core::error> {
    int out = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last || value.empty()) {
        return config_error(std::string(flag) + " expects an integer, got '" + value + "'");
    }
    if (out < 0) return config_error(std::string(flag) + " must be non-negative");
    return out;
}

static auto parse_args(int argc, char** argv) -> std::expected<Args, criteria::core::error> {
    Args args;
    if (auto env = criteria::core::safe_getenv("CRITERIA_DOMESTIC_COUNTRY"); env && !env->empty()) {
        args.options.domestic_country = *env;
    }
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") args.help = true;
        else if (a == "--list") args.list = true;
        else if (a == "--menu") args.menu = true;
        else if (auto v = eat(a, "--scenario=")) args.scenario_name = *v;
        else if (auto v = eat(a, "--domestic=")) args.options.domestic_country = *v;
        else if (auto v = eat(a, "--cycle_count_days=")) {
            auto n = parse_days("--cycle_count_days", *v);
            if (!n) return std::unexpected(n.error());
            args.options.cycle_count_days = *n;
        } else if (auto v = eat(a, "--expiring_days=")) {
            auto n = parse_days("--expiring_days", *v);
            if (!n) return std::unexpected(n.error());
            args.options.expiring_days = *n;
        } else if (auto v = eat(a, "--urgent_days=")) {
            auto n = parse_days("--urgent_days", *v);
            if (!n) return std::unexpected(n.error());
            args.options.urgent_days = *n;
        } else {
            return config_error("unknown argument '" + a + "'");
        }
    }
    if (criteria::core::is_blank(args.options.domestic_country)) {
        return config_error("domestic country must not be blank");
    }
    if (args.scenario_name && *args.scenario_name != "all" && !criteria::demo::find_scenario(*args.scenario_name)) {
        return config_error("unknown scenario '" + *args.scenario_name + "' (see --list)");
    }
    return args;
}

static void list_scenarios() {
    for (const auto& s : criteria::demo::catalog()) {
        std::cout << "  " << s.name << std::string(s.name.size() < 18 ? 18 - s.name.size() : 1, ' ')
                  << s.title << "\n";
    }
}

static auto report(const criteria::demo::scenario_result& r) -> int {
    if (r) return 0;
    std::cerr << "scenario failed: " << criteria::core::describe(r.error()) << "\n";
    return 1;
}

static auto pick_from_group(scenario_group group) -> const scenario* {
    std::vector<const scenario*> items;
    for (const auto& s : criteria::demo::catalog()) {
        if (s.group == group) items.push_back(&s);
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
        std::cout << "  [" << (i + 1) << "] " << items[i]->title << "\n";
    }
    std::cout << "  [0] Back to main menu\n\nEnter your choice: " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line) || line == "0") return nullptr;
    const auto* picked = criteria::demo::pick_in_group(group, line);
    if (!picked) std::cout << "Invalid choice.\n\n";
    return picked;
}

static auto run_menu(const demo_options& opts) -> int {
    int status = 0;
    for (;;) {
        std::cout << "\n  [1] Run all simple examples\n"
                  << "  [2] Run all warehouse examples\n"
                  << "  [3] Run a specific simple example\n"
                  << "  [4] Run a specific warehouse example\n"
                  << "  [5] Attribute expression query\n"
                  << "  [0] Exit\n\nEnter your choice: " << std::flush;
        std::string choice;
        if (!std::getline(std::cin, choice) || choice == "0") break;
        std::cout << "\n";
        criteria::demo::scenario_result r;
        if (choice == "1") r = criteria::demo::run_group(scenario_group::simple, std::cout, opts);
        else if (choice == "2") r = criteria::demo::run_group(scenario_group::warehouse, std::cout, opts);
        else if (choice == "3" || choice == "4") {
            const auto* s = pick_from_group(choice == "3" ? scenario_group::simple : scenario_group::warehouse);
            if (s) r = criteria::demo::run_scenario(*s, std::cout, opts);
        } else if (choice == "5") r = criteria::demo::run_group(scenario_group::query, std::cout, opts);
        else std::cout << "Invalid choice. Please try again.\n";
        if (report(r) != 0) status = 1;
    }
    std::cout << "\nGoodbye.\n";
    return status;
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << criteria::core::describe(parsed.error()) << "\n";
        print_usage();
        return 2;
    }
    const Args& args = *parsed;
    if (args.help) { print_usage(); return 0; }
    if (args.list) { list_scenarios(); return 0; }

    if (args.scenario_name && !args.menu) {
        if (*args.scenario_name == "all") return report(criteria::demo::run_all(std::cout, args.options));
        return report(criteria::demo::run_scenario(*criteria::demo::find_scenario(*args.scenario_name),
                                                   std::cout, args.options));
    }
    return run_menu(args.options);
}
