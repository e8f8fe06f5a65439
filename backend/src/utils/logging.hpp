#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "Config.hpp"

namespace Log
{
    inline void init(const LogConfig& cfg)
    {
        // File logger unless no file is configured
        std::shared_ptr<spdlog::logger> logger;
        if (cfg.file.empty()) {
            logger = spdlog::stdout_color_mt("retain");
        }
        else {
            logger = spdlog::basic_logger_mt("retain", cfg.file);
        }

        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(spdlog::level::from_str(cfg.level));
        spdlog::flush_on(spdlog::level::info);
    }
}
