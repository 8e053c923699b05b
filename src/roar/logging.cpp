#include "roar/logging.hpp"

#include <ctime>
#include <filesystem>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace roar {

namespace {
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};

/** `%*`: the message payload as a quoted JSON string. */
class JsonMessageFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        auto out = std::back_inserter(dest);
        *out++ = '"';
        for (const char ch : msg.payload) {
            switch (ch) {
            case '"':
                fmt::format_to(out, "\\\"");
                break;
            case '\\':
                fmt::format_to(out, "\\\\");
                break;
            case '\n':
                fmt::format_to(out, "\\n");
                break;
            case '\r':
                fmt::format_to(out, "\\r");
                break;
            case '\t':
                fmt::format_to(out, "\\t");
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    fmt::format_to(out, "\\u{:04x}", static_cast<unsigned>(ch));
                } else {
                    *out++ = ch;
                }
            }
        }
        *out++ = '"';
    }

    [[nodiscard]] std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%l] %v");
    sinks.push_back(console_sink);

    if (!config.log_directory.empty()) {
        const std::filesystem::path path_log_dir{config.log_directory};
        std::error_code error_directory;
        std::filesystem::create_directories(path_log_dir, error_directory);
        if (error_directory) {
            throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
        }

        const std::filesystem::path path_log_file = path_log_dir / "roar.log";
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path_log_file.string(),
            k_max_file_size_bytes,
            k_max_files
        );
        auto file_formatter = std::make_unique<spdlog::pattern_formatter>();
        file_formatter->add_flag<JsonMessageFlag>('*').set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":%*})");
        file_sink->set_formatter(std::move(file_formatter));
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("roar", sinks.begin(), sinks.end());
    set_log_level(*logger, config.level);
    return logger;
}

void set_log_level(spdlog::logger& logger, const std::string& str_level) {
    const auto level = spdlog::level::from_str(str_level);
    // from_str maps unknown names to off; only "off" itself may select it.
    if (level == spdlog::level::off && str_level != "off") {
        logger.set_level(spdlog::level::info);
        logger.warn("Unknown log level {}; defaulting to info", str_level);
        return;
    }
    logger.set_level(level);
}

}  // namespace roar
