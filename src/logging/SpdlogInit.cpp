#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>

#include "SpdlogInit.hpp"

static std::shared_ptr<spdlog::logger> main_logger;
static std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;

void GmShim_SpdlogInit(const std::optional<std::filesystem::path>& logFile) {
    if (!main_logger) {
        auto console_sink =
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        main_logger = std::make_shared<spdlog::logger>("gmshim", console_sink);
        main_logger->set_level(spdlog::level::trace);

        spdlog::set_default_logger(main_logger);
        // Abseil-like: [severity] message
        spdlog::set_pattern("[%L] %v");
    }

    if (logFile && !file_sink) {
        try {
            file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                logFile->string());
        } catch (const spdlog::spdlog_ex& e) {
            SPDLOG_ERROR("Couldn't open file {}: {}", logFile->string(),
                         e.what());
            return;
        }
        file_sink->set_pattern("%Y-%m-%d %H:%M:%S.%e [%L] %v");
        main_logger->sinks().push_back(file_sink);
        SPDLOG_INFO("File {} added as logsink", logFile->string());
    }
}

void GmShim_SpdlogDeInit() {
    if (!main_logger) {
        return;
    }
    spdlog::drop_all();
    file_sink.reset();
    main_logger.reset();
}
