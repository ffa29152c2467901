#include "AppException.hpp"
#include "DirectoryNameProbe.hpp"
#include "Logger.hpp"
#include "PlanReporter.hpp"
#include "PlanSerializer.hpp"
#include "RenamePlanner.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

std::atomic<bool> g_cancel_requested{false};

void handle_interrupt(int)
{
    g_cancel_requested.store(true);
}

struct ParsedArguments {
    std::string manifest_path;
    std::optional<std::string> destination_dir;
    std::optional<std::string> plan_path;
};

std::optional<ParsedArguments> parse_command_line(int argc, char** argv)
{
    if (argc < 2 || argc > 4) {
        return std::nullopt;
    }
    const std::string first = argv[1];
    if (first == "-h" || first == "--help") {
        return std::nullopt;
    }

    ParsedArguments parsed;
    parsed.manifest_path = first;
    if (argc > 2) {
        parsed.destination_dir = std::string(argv[2]);
    }
    if (argc > 3) {
        parsed.plan_path = std::string(argv[3]);
    }
    return parsed;
}

void print_usage(const char* program)
{
    std::fprintf(stderr,
                 "Usage: %s <manifest.json> [destination_dir] [plan.json]\n"
                 "  Prints proposed ebook file names for the manifest items.\n"
                 "  destination_dir  existing names here are avoided\n"
                 "  plan.json        also write the plan as JSON\n",
                 program);
}

bool initialize_loggers(const Settings& settings)
{
    try {
        Logger::setup_loggers(Utils::path_to_utf8(Utils::utf8_to_path(settings.get_config_dir()) / "logs"),
                              settings.get_log_level());
        return true;
    } catch (const std::exception& e) {
        const auto info = ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::LOGGER_INIT_FAILED, e.what());
        std::fprintf(stderr, "%s\n", info.get_full_details().c_str());
        return false;
    }
}

int run(const ParsedArguments& args)
{
    Settings settings;
    settings.load();

    if (!initialize_loggers(settings)) {
        return kExitFailure;
    }
    auto logger = Logger::get_logger("core_logger");

    const std::vector<BookRecord> records = PlanSerializer::load_manifest(args.manifest_path);

    ExistingNamesProbe probe;
    if (args.destination_dir) {
        DirectoryNameProbe directory_probe(*args.destination_dir);
        if (logger) {
            logger->info("Destination '{}' holds {} name(s)", *args.destination_dir, directory_probe.size());
        }
        probe = directory_probe.as_probe();
    }

    RenamePlanner planner(settings.get_normalization_options(), settings.get_default_extension());
    std::signal(SIGINT, handle_interrupt);
    const RenamePlan plan = planner.plan(records, probe, &g_cancel_requested);
    std::signal(SIGINT, SIG_DFL);

    PlanReporter::print(records, plan, std::cout);

    if (args.plan_path) {
        PlanSerializer::save_plan(plan, *args.plan_path);
    }
    return kExitOk;
}

} // namespace


int main(int argc, char** argv)
{
    const auto args = parse_command_line(argc, argv);
    if (!args) {
        print_usage(argc > 0 ? argv[0] : "ebook-renamer-plan");
        return kExitUsage;
    }

    try {
        return run(*args);
    } catch (const ErrorCodes::AppException& e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", e.get_full_details());
        }
        std::fprintf(stderr, "%s\n", e.get_user_message().c_str());
        return kExitFailure;
    } catch (const std::exception& e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Unhandled exception: {}", e.what());
        }
        std::fprintf(stderr, "Error: %s\n", e.what());
        return kExitFailure;
    }
}
