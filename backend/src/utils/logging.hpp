#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // File logger shared by the engine, the store and the CLI
    inline void init(const std::string& filename = "vocabra.log")
    {
        auto file_logger = spdlog::basic_logger_mt("vocabra", filename);

        spdlog::set_default_logger(file_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // Scheduling details are logged at debug
        spdlog::set_level(spdlog::level::debug);
        spdlog::flush_on(spdlog::level::info);
    }

    // Tests keep the console logger; misses and clamps log at warn and would flood it
    inline void quiet()
    {
        spdlog::set_level(spdlog::level::err);
    }
}
