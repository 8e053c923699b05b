// === Configuration Loader ====================================================
//
// Parses the command line and environment into `Configuration`.
//
// Command line
// - one positional CHART_PATH (not required with --version or --help);
// - -f/--values (repeatable, comma-separated lists are split),
//   -o/--output-dir, -l/--log-level, -v/--version, -h/--help;
// - `--flag=value`, `--flag value`, `-f value` and `-fvalue` spellings.
//
// Environment
// - ROAR_MAX_CONCURRENCY, ROAR_HELM_BINARY, ROAR_GIT_BINARY, ROAR_LOG_DIR.
//   Unparseable numbers fall back to defaults and leave a warning behind.

#include "roar/configuration.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "roar/errors.hpp"

namespace roar {

namespace {

enum class Flag {
    Values,
    OutputDir,
    LogLevel,
    Version,
    Help
};

struct FlagSpec final {
    Flag flag;
    char short_name;
    std::string_view long_name;
    bool takes_value;
};

constexpr FlagSpec k_flags[] = {
    {Flag::Values, 'f', "values", true},
    {Flag::OutputDir, 'o', "output-dir", true},
    {Flag::LogLevel, 'l', "log-level", true},
    {Flag::Version, 'v', "version", false},
    {Flag::Help, 'h', "help", false},
};

const FlagSpec* find_long(std::string_view name) {
    for (const FlagSpec& spec : k_flags) {
        if (spec.long_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

const FlagSpec* find_short(char name) {
    for (const FlagSpec& spec : k_flags) {
        if (spec.short_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

void append_values_files(Configuration& config, std::string_view list) {
    std::size_t start = 0;
    while (start <= list.size()) {
        const auto comma_pos = list.find(',', start);
        const std::string_view item = list.substr(start, comma_pos == std::string_view::npos ? std::string_view::npos : comma_pos - start);
        if (!item.empty()) {
            config.values_files.emplace_back(std::string{item});
        }
        if (comma_pos == std::string_view::npos) {
            break;
        }
        start = comma_pos + 1;
    }
}

void apply_flag(Configuration& config, Flag flag, const std::string& value) {
    switch (flag) {
        case Flag::Values:
            append_values_files(config, value);
            break;
        case Flag::OutputDir:
            config.output_directory = value;
            break;
        case Flag::LogLevel:
            config.logging.level = value;
            break;
        case Flag::Version:
            config.show_version = true;
            break;
        case Flag::Help:
            config.show_help = true;
            break;
    }
}

std::optional<std::string> read_environment(const char* name) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::nullopt;
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load(int argc, const char* const argv[]) {
    Configuration config{};
    std::vector<std::string> list_positionals;

    bool only_positionals = false;
    for (int index = 1; index < argc; ++index) {
        const std::string argument{argv[index]};

        if (only_positionals || argument.size() < 2 || argument.front() != '-') {
            list_positionals.push_back(argument);
            continue;
        }
        if (argument == "--") {
            only_positionals = true;
            continue;
        }

        const FlagSpec* spec = nullptr;
        std::optional<std::string> inline_value;
        if (argument.rfind("--", 0) == 0) {
            const std::string body = argument.substr(2);
            const auto equals_pos = body.find('=');
            spec = find_long(body.substr(0, equals_pos));
            if (equals_pos != std::string::npos) {
                inline_value = body.substr(equals_pos + 1);
            }
        } else {
            spec = find_short(argument[1]);
            if (argument.size() > 2) {
                inline_value = argument.substr(argument[2] == '=' ? 3 : 2);
            }
        }
        if (spec == nullptr) {
            throw UsageError(fmt::format("unknown flag: {}", argument));
        }

        if (!spec->takes_value) {
            if (inline_value.has_value()) {
                throw UsageError(fmt::format("flag does not take a value: {}", argument));
            }
            apply_flag(config, spec->flag, {});
            continue;
        }
        if (!inline_value.has_value()) {
            if (index + 1 >= argc) {
                throw UsageError(fmt::format("flag needs an argument: {}", argument));
            }
            inline_value = argv[++index];
        }
        apply_flag(config, spec->flag, *inline_value);
    }

    load_environment(config);

    if (config.show_version || config.show_help) {
        return config;
    }
    if (list_positionals.size() != 1) {
        throw UsageError("exactly one argument [CHART_PATH] is required");
    }
    config.chart_path = list_positionals.front();
    return config;
}

std::string ConfigurationLoader::usage(std::string_view program_name) {
    return fmt::format(
        "Usage: {} [CHART_PATH] [flags]\n"
        "\n"
        "Arguments:\n"
        "  CHART_PATH   Path to the app-of-apps Helm chart (required)\n"
        "\n"
        "Flags:\n"
        "  -f, --values strings      Path to a values file for the app-of-apps chart (can be repeated)\n"
        "  -o, --output-dir string   Directory to save rendered manifests (default \"rendered\")\n"
        "  -l, --log-level string    Log level (debug, info, warn, error) (default \"warn\")\n"
        "  -v, --version             Print version information and exit\n"
        "  -h, --help                Print this help and exit\n"
        "\n"
        "Environment:\n"
        "  ROAR_MAX_CONCURRENCY      Applications rendered in parallel (default {})\n"
        "  ROAR_HELM_BINARY          helm executable (default \"helm\")\n"
        "  ROAR_GIT_BINARY           git executable (default \"git\")\n"
        "  ROAR_LOG_DIR              Also write JSON logs to this directory\n",
        program_name,
        k_default_max_concurrency
    );
}

void ConfigurationLoader::load_environment(Configuration& config) {
    if (const auto raw_concurrency = read_environment("ROAR_MAX_CONCURRENCY"); raw_concurrency.has_value()) {
        const std::string& text = *raw_concurrency;
        std::size_t parsed_value = 0;
        const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), parsed_value);
        if (error == std::errc{} && end == text.data() + text.size() && parsed_value > 0) {
            config.max_concurrency = parsed_value;
        } else {
            config.list_warnings.push_back(fmt::format(
                "Failed to parse ROAR_MAX_CONCURRENCY='{}'; using fallback {}", text, k_default_max_concurrency));
        }
    }
    if (auto helm_binary = read_environment("ROAR_HELM_BINARY"); helm_binary.has_value()) {
        config.helm_binary = std::move(*helm_binary);
    }
    if (auto git_binary = read_environment("ROAR_GIT_BINARY"); git_binary.has_value()) {
        config.git_binary = std::move(*git_binary);
    }
    if (auto log_directory = read_environment("ROAR_LOG_DIR"); log_directory.has_value()) {
        config.logging.log_directory = std::move(*log_directory);
    }
}

}  // namespace roar
