/**
 * @file main.cpp
 * @brief rfuri CLI entry point
 *
 * Commands:
 *   validate  - Crawl a service and check every URI against an OpenAPI specification
 *   version   - Show version information
 */

#include "rfuri/common.hpp"
#include "rfuri/config.hpp"
#include "rfuri/crawler.hpp"
#include "rfuri/openapi.hpp"
#include "rfuri/report.hpp"
#include "rfuri/report/html.hpp"
#include "rfuri/require_cpp23.hpp"
#include "rfuri/validation.hpp"
#include "rfuri/version.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

enum class ReportFormat { kHtml, kJson, kAll };

void print_version()
{
    std::println("{} {} ({})", rfuri::kToolName, rfuri::kVersion, rfuri::kBuildId);
    std::println("  results schema: {}", rfuri::kResultsSchemaVersion);
    std::println("  config schema:  {}", rfuri::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(rfuri - Redfish URI Validator

Usage: rfuri <command> [options]

Commands:
  validate    Crawl a service and check every URI against an OpenAPI specification
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'rfuri <command> --help' for command-specific options.
)");
}

void print_validate_help()
{
    std::print(R"(Usage: rfuri validate [options]

Crawl a service and check every URI against an OpenAPI specification

Options:
  --openapi FILE, -o        OpenAPI specification, YAML or JSON (required)
  --mockup DIR              Crawl a Redfish mockup directory
  --payloads FILE           Use a pre-crawled JSON array of payloads
  --rhost NAME, -r          System label shown in the report (default: input location)
  --logdir DIR, -d          Output directory for reports (default: current directory)
  --config FILE             Validator configuration (config.v1)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --format html|json|all    Report formats to write (default: all)
  --max-resources N         Stop crawling after N payloads (default: unbounded)
  --help, -h                Show this help

Exactly one of --mockup and --payloads is required.

Output:
  <logdir>/RedfishURITestReport_<MM>_<DD>_<YYYY>_<HHMMSS>.html
  <logdir>/RedfishURITestResults_<MM>_<DD>_<YYYY>_<HHMMSS>.json
)");
}

struct ValidateOptions
{
    std::string openapi;
    std::string mockup;
    std::string payloads;
    std::string rhost;
    std::string logdir;
    std::optional<std::string> config;
    std::string schema_dir;
    ReportFormat format;
    std::size_t max_resources;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> rfuri::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            rfuri::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] rfuri::Result<std::size_t> parse_count_value(std::string_view option,
                                                           std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(rfuri::Error::make(
            "InvalidArgument",
            std::string("Invalid ") + std::string(option) + " value: " + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] rfuri::Result<ReportFormat> parse_format_value(std::string_view value)
{
    if (value == "html") {
        return ReportFormat::kHtml;
    }
    if (value == "json") {
        return ReportFormat::kJson;
    }
    if (value == "all") {
        return ReportFormat::kAll;
    }
    return std::unexpected(
        rfuri::Error::make("InvalidArgument", "Invalid --format value: " + std::string(value)));
}

// NOLINTNEXTLINE(readability-function-size) - One branch per option.
[[nodiscard]] auto set_validate_option(std::string_view arg,
                                       std::span<char*> args,
                                       std::size_t idx,
                                       ValidateOptions& options,
                                       bool& skip_next) -> rfuri::Result<bool>
{
    auto string_target = [&]() -> std::string* {
        if (arg == "--openapi" || arg == "-o") {
            return &options.openapi;
        }
        if (arg == "--mockup") {
            return &options.mockup;
        }
        if (arg == "--payloads") {
            return &options.payloads;
        }
        if (arg == "--rhost" || arg == "-r") {
            return &options.rhost;
        }
        if (arg == "--logdir" || arg == "-d") {
            return &options.logdir;
        }
        if (arg == "--schema-dir") {
            return &options.schema_dir;
        }
        return nullptr;
    };

    const bool known = string_target() != nullptr || arg == "--config" || arg == "--format"
                       || arg == "--max-resources";
    if (!known) {
        return rfuri::Result<bool>{false};
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;

    if (auto* target = string_target()) {
        *target = *value;
    } else if (arg == "--config") {
        options.config = *value;
    } else if (arg == "--format") {
        auto format = parse_format_value(*value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
    } else {
        auto count = parse_count_value(arg, *value);
        if (!count) {
            return std::unexpected(count.error());
        }
        options.max_resources = *count;
    }
    return rfuri::Result<bool>{true};
}

[[nodiscard]] rfuri::Result<ValidateOptions> parse_validate_args(std::span<char*> args)
{
    ValidateOptions options{.openapi = std::string{},
                            .mockup = std::string{},
                            .payloads = std::string{},
                            .rhost = std::string{},
                            .logdir = std::string{},
                            .config = std::nullopt,
                            .schema_dir = "schemas",
                            .format = ReportFormat::kAll,
                            .max_resources = 0,
                            .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_validate_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                rfuri::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] rfuri::Result<rfuri::resource::ResourceCollection>
collect_resources(const ValidateOptions& options, const rfuri::config::ValidatorConfig& config)
{
    if (!options.payloads.empty()) {
        std::println("[validate] Reading payloads from {}...", options.payloads);
        return rfuri::crawler::load_payload_dump(options.payloads);
    }

    std::println("[validate] Crawling mockup {}; this may take a while...", options.mockup);
    rfuri::crawler::MockupFetcher fetcher(options.mockup);
    rfuri::crawler::CrawlOptions crawl_options;
    crawl_options.identifier_property = config.run.resolver.identifier_property;
    crawl_options.max_resources = options.max_resources;
    if (!config.run.resolver.service_roots.empty()) {
        crawl_options.service_root = config.run.resolver.service_roots.front();
    }

    rfuri::crawler::Crawler crawler(fetcher, crawl_options);
    auto crawled = crawler.crawl();
    if (!crawled) {
        return std::unexpected(crawled.error());
    }
    for (const auto& warning : crawled->warnings) {
        std::println(stderr, "Warning: {}: {}", warning.uri, warning.message);
    }
    return std::move(crawled->resources);
}

[[nodiscard]] int run_validate(const ValidateOptions& options)
{
    rfuri::config::ValidatorConfig config;
    if (options.config) {
        auto loaded = rfuri::config::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            std::println(stderr, "Error: {}", loaded.error().message);
            return 1;
        }
        config = std::move(*loaded);
    }

    std::println("[validate] Opening {}...", options.openapi);
    auto paths = rfuri::openapi::load_path_set(options.openapi);
    if (!paths) {
        std::println(stderr, "Error: {}", paths.error().message);
        return 1;
    }

    auto resources = collect_resources(options, config);
    if (!resources) {
        std::println(stderr, "Error: {}", resources.error().message);
        return 1;
    }

    std::println("[validate] Generating results for {} resources against {} paths...",
                 resources->size(),
                 paths->size());
    const rfuri::validation::ValidationRun run(config.run);
    const auto result = run.run(*resources, *paths);

    const auto now = std::chrono::system_clock::now();
    const rfuri::report::ReportBranding branding{.tool_name = rfuri::kToolName,
                                                 .tool_version = rfuri::kVersion,
                                                 .project_url = config.report.project_url,
                                                 .logo_base64 = config.report.logo_base64};
    const rfuri::report::ReportContext context{
        .system = !options.rhost.empty()
                      ? options.rhost
                      : (!options.mockup.empty() ? options.mockup : options.payloads),
        .openapi_path = options.openapi,
        .generated_at = rfuri::report::format_timestamp(now)};

    const std::filesystem::path logdir = options.logdir.empty() ? "." : options.logdir;
    const std::string stamp = rfuri::report::file_stamp(now);

    if (options.format != ReportFormat::kJson) {
        const auto html_path = logdir / ("RedfishURITestReport_" + stamp + ".html");
        std::println("[validate] Generating {}...", html_path.string());
        const rfuri::report::HtmlReportWriter writer(branding);
        if (auto written = writer.write(result, context, html_path); !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return 1;
        }
    }
    if (options.format != ReportFormat::kHtml) {
        const auto json_path = logdir / ("RedfishURITestResults_" + stamp + ".json");
        std::println("[validate] Generating {}...", json_path.string());
        const auto document = rfuri::report::build_results_json(result, context, branding);
        if (auto written =
                rfuri::report::write_results_json(document, json_path, options.schema_dir);
            !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return 1;
        }
    }

    std::println("[validate] Pass: {}, Fail: {}, Warning: {} (orphans: {})",
                 result.total_pass,
                 result.total_fail,
                 result.total_warn,
                 result.orphans.size());
    return 0;
}

int cmd_validate(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_validate_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_validate_help();
        return 0;
    }
    if (options->openapi.empty()) {
        std::println(stderr, "Error: --openapi is required");
        print_validate_help();
        return 1;
    }
    if (options->mockup.empty() == options->payloads.empty()) {
        std::println(stderr, "Error: exactly one of --mockup and --payloads is required");
        print_validate_help();
        return 1;
    }
    return run_validate(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        if (cmd == "validate") {
            return cmd_validate(argc - 2, argv + 2);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
