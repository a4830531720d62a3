/**
 * @file main.cpp
 * @brief semjson CLI entry point
 *
 * Commands:
 *   compare       - Decide whether two JSON documents are semantically equal
 *   canonicalize  - Re-encode a JSON document in canonical form
 *   plan          - Run the JSON plan modifier on a state/config pair
 *   version       - Show version information
 */

#include "semjson/canonical_json.hpp"
#include "semjson/common.hpp"
#include "semjson/engine_config.hpp"
#include "semjson/equality.hpp"
#include "semjson/plan.hpp"
#include "semjson/version.hpp"

#include <charconv>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace {

/// Exit code of `compare` when the documents differ
constexpr int kExitDifferent = 2;

void print_version()
{
    std::println("semjson {} ({})", semjson::kVersion, semjson::kBuildId);
    std::println("  policy schema: {}", semjson::kPolicySchemaVersion);
}

void print_help()
{
    std::print(R"(semjson - Semantic JSON comparison and canonicalization

Usage: semjson <command> [options]

Commands:
  compare       Decide whether two JSON documents are semantically equal
  canonicalize  Re-encode a JSON document in canonical form
  plan          Run the JSON plan modifier on a state/config pair
  version       Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'semjson <command> --help' for command-specific options.
)");
}

void print_compare_help()
{
    std::print(R"(Usage: semjson compare [options]

Decide whether two JSON documents are semantically equal, ignoring
formatting, key order, nulls, optional fields and keyed-array order.

Options:
  --left FILE               First document (required)
  --right FILE              Second document (required)
  --policy FILE             Policy file (default: workflow node defaults)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --max-depth N             Maximum nesting depth, 1-10000 (overrides the policy)
  --help, -h                Show this help

Exit status:
  0 equal, 2 different, 1 error
)");
}

void print_canonicalize_help()
{
    std::print(R"(Usage: semjson canonicalize [options]

Re-encode a JSON document with sorted keys and no whitespace

Options:
  --input FILE              Input document (required)
  --output FILE, -o         Output file (default: stdout)
  --max-depth N             Maximum nesting depth, 1-10000
  --help, -h                Show this help
)");
}

void print_plan_help()
{
    std::print(R"(Usage: semjson plan [options]

Compute the planned value of a JSON attribute. The config document is the
proposed value; the state text replaces it when both are semantically equal.

Options:
  --state FILE              Persisted document (required)
  --config FILE             Configured document (required)
  --policy FILE             Policy file (default: workflow node defaults)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help

Output:
  planned value on stdout, decision on stderr
)");
}

struct CompareOptions
{
    std::string left;
    std::string right;
    std::optional<std::string> policy;
    std::string schema_dir;
    std::optional<std::size_t> max_depth;
    bool show_help;
};

struct CanonicalizeOptions
{
    std::string input;
    std::optional<std::string> output;
    std::optional<std::size_t> max_depth;
    bool show_help;
};

struct PlanOptions
{
    std::string state;
    std::string config;
    std::optional<std::string> policy;
    std::string schema_dir;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> semjson::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            semjson::Error::make("MissingArgument",
                                 std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] semjson::Result<std::size_t> parse_depth_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed == 0) {
        return std::unexpected(
            semjson::Error::make("InvalidArgument",
                                 std::string("Invalid --max-depth value: ") + std::string(value)));
    }
    if (parsed > semjson::value::kMaxSupportedDepth) {
        return std::unexpected(semjson::Error::make(
            "InvalidArgument",
            std::format("--max-depth {} exceeds the supported maximum of {}",
                        parsed,
                        semjson::value::kMaxSupportedDepth)));
    }
    return parsed;
}

[[nodiscard]] semjson::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            semjson::Error::make("IOError", "Failed to open file: " + path.string()));
    }
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

[[nodiscard]] semjson::VoidResult write_text_file(const std::filesystem::path& path,
                                                  std::string_view text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            semjson::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << text << "\n";
    if (!out) {
        return std::unexpected(
            semjson::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

[[nodiscard]] semjson::Result<semjson::config::EngineConfig>
resolve_engine_config(const std::optional<std::string>& policy, const std::string& schema_dir)
{
    if (!policy) {
        return semjson::config::default_engine_config();
    }
    return semjson::config::load_engine_config(*policy, schema_dir);
}

[[nodiscard]] semjson::Result<CompareOptions> parse_compare_args(std::span<char*> args)
{
    CompareOptions options{.left = std::string{},
                           .right = std::string{},
                           .policy = std::nullopt,
                           .schema_dir = "schemas",
                           .max_depth = std::nullopt,
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
        if (arg == "--left") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.left = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--right") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.right = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--policy") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.policy = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--max-depth") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto depth = parse_depth_value(*value);
            if (!depth) {
                return std::unexpected(depth.error());
            }
            options.max_depth = *depth;
            skip_next = true;
            continue;
        }
        return std::unexpected(semjson::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] semjson::Result<CanonicalizeOptions> parse_canonicalize_args(std::span<char*> args)
{
    CanonicalizeOptions options{.input = std::string{},
                                .output = std::nullopt,
                                .max_depth = std::nullopt,
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
        if (arg == "--input") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.input = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--max-depth") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto depth = parse_depth_value(*value);
            if (!depth) {
                return std::unexpected(depth.error());
            }
            options.max_depth = *depth;
            skip_next = true;
            continue;
        }
        return std::unexpected(semjson::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] semjson::Result<PlanOptions> parse_plan_args(std::span<char*> args)
{
    PlanOptions options{.state = std::string{},
                        .config = std::string{},
                        .policy = std::nullopt,
                        .schema_dir = "schemas",
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
        if (arg == "--state") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.state = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--config") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.config = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--policy") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.policy = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(semjson::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] int run_compare(const CompareOptions& options)
{
    auto config = resolve_engine_config(options.policy, options.schema_dir);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }
    if (options.max_depth) {
        config->parse.max_depth = *options.max_depth;
    }

    auto left = read_text_file(options.left);
    if (!left) {
        std::println(stderr, "Error: {}", left.error().message);
        return 1;
    }
    auto right = read_text_file(options.right);
    if (!right) {
        std::println(stderr, "Error: {}", right.error().message);
        return 1;
    }

    const auto comparator = semjson::config::make_comparator(*config);
    auto equal = comparator.compare_texts(*left, *right);
    if (!equal) {
        std::println(stderr, "Error: {} ({})", equal.error().message, equal.error().code);
        return 1;
    }

    std::println("{}", *equal ? "equal" : "different");
    return *equal ? 0 : kExitDifferent;
}

[[nodiscard]] int run_canonicalize(const CanonicalizeOptions& options)
{
    auto input = read_text_file(options.input);
    if (!input) {
        std::println(stderr, "Error: {}", input.error().message);
        return 1;
    }

    semjson::value::ParseOptions parse_options;
    if (options.max_depth) {
        parse_options.max_depth = *options.max_depth;
    }
    auto canonical = semjson::canonical::canonicalize(*input, parse_options);
    if (!canonical) {
        std::println(stderr, "Error: {} ({})", canonical.error().message, canonical.error().code);
        return 1;
    }

    if (!options.output) {
        std::println("{}", *canonical);
        return 0;
    }
    if (auto write = write_text_file(*options.output, *canonical); !write) {
        std::println(stderr, "Error: {}", write.error().message);
        return 1;
    }
    std::println("[canonicalize] Wrote canonical JSON");
    std::println("  input: {}", options.input);
    std::println("  output: {}", *options.output);
    return 0;
}

[[nodiscard]] int run_plan(const PlanOptions& options)
{
    auto config = resolve_engine_config(options.policy, options.schema_dir);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }

    auto state = read_text_file(options.state);
    if (!state) {
        std::println(stderr, "Error: {}", state.error().message);
        return 1;
    }
    auto configured = read_text_file(options.config);
    if (!configured) {
        std::println(stderr, "Error: {}", configured.error().message);
        return 1;
    }

    const auto comparator = semjson::config::make_comparator(*config);
    const semjson::plan::StringPlanRequest request{
        .state = semjson::plan::PlanValue::known(*state),
        .config = semjson::plan::PlanValue::known(*configured),
        .plan = semjson::plan::PlanValue::known(*configured),
    };
    const auto planned = semjson::plan::apply_json_semantic_equality(request, comparator);

    const bool suppressed = planned.text != *configured;
    std::print("{}", planned.text);
    std::println(stderr, "[plan] {}", suppressed ? "suppressed (semantically equal to state)"
                                                 : "changed (config value stands)");
    return 0;
}

int cmd_compare(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_compare_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_compare_help();
        return 0;
    }
    if (options->left.empty() || options->right.empty()) {
        std::println(stderr, "Error: --left and --right are required");
        print_compare_help();
        return 1;
    }
    return run_compare(*options);
}

int cmd_canonicalize(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_canonicalize_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_canonicalize_help();
        return 0;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_canonicalize_help();
        return 1;
    }
    return run_canonicalize(*options);
}

int cmd_plan(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_plan_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_plan_help();
        return 0;
    }
    if (options->state.empty() || options->config.empty()) {
        std::println(stderr, "Error: --state and --config are required");
        print_plan_help();
        return 1;
    }
    return run_plan(*options);
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

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "compare") {
            return cmd_compare(sub_argc, sub_argv);
        }
        if (cmd == "canonicalize") {
            return cmd_canonicalize(sub_argc, sub_argv);
        }
        if (cmd == "plan") {
            return cmd_plan(sub_argc, sub_argv);
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
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
