/**
 * @file logging.cpp
 * @brief Default logger with severity-tagged stderr output
 *
 * @date 2025
 */

#include "ctforge/utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace ctforge {
namespace utils {

namespace {

class SeverityFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&,
                spdlog::memory_buf_t& dest) override {
        const std::string tag = SeverityTag(static_cast<int>(msg.level));
        dest.append(tag.data(), tag.data() + tag.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<SeverityFlag>();
    }
};

} // anonymous namespace

std::string SeverityTag(int level) {
    switch (static_cast<spdlog::level::level_enum>(level)) {
        case spdlog::level::trace:    return "TRACE";
        case spdlog::level::debug:    return "DEBUG";
        case spdlog::level::info:     return "INFO";
        case spdlog::level::warn:     return "WARNING";
        case spdlog::level::err:      return "ERROR";
        case spdlog::level::critical: return "CRITICAL";
        default:                      return "OFF";
    }
}

void InitLogging(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!options.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            options.log_file.string(), false));
    }

    auto logger = std::make_shared<spdlog::logger>("ctforge", sinks.begin(), sinks.end());

    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<SeverityFlag>('*').set_pattern(kLogPattern);
    logger->set_formatter(std::move(formatter));

    logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);

    if (options.verbose) {
        spdlog::debug("Verbose logging enabled");
    }
}

} // namespace utils
} // namespace ctforge
