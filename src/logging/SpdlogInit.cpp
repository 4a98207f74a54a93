#include "SpdlogInit.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

static std::shared_ptr<spdlog::logger> main_logger;

void AssistantBot_SpdlogInit() {
    if (main_logger) return;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    main_logger = std::make_shared<spdlog::logger>("assistantbot", console_sink);
    main_logger->set_level(spdlog::level::warn);

    spdlog::set_default_logger(main_logger);

    // Abseil-like format: [severity] message
    spdlog::set_pattern("[%L] %v");
}

bool AssistantBot_SpdlogSetLevel(const std::string_view level) {
    const auto parsed = spdlog::level::from_str(std::string(level));
    // from_str() falls back to off for unknown names.
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    spdlog::set_level(parsed);
    return true;
}

bool AssistantBot_SpdlogAddFileSink(const std::filesystem::path& path) {
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    try {
        file_sink =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open log file {}: {}", path.string(), e.what());
        return false;
    }
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%L] %v");
    spdlog::default_logger()->sinks().push_back(std::move(file_sink));
    return true;
}

void AssistantBot_SpdlogDeInit() {
    if (!main_logger) {
        return;
    }
    spdlog::drop_all();
    main_logger.reset();
}
