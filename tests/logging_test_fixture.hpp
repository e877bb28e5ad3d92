#pragma once

#include "spawnwatch/logging.hpp"

#include <filesystem>
#include <memory>

namespace spawnwatch::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "spawnwatch_tests_logs";
        auto logger = spawnwatch::initialize_logger(log_dir.string());
        logger->set_level(spdlog::level::warn);
        return logger;
    }();
    (void)logger_handle;
}

}  // namespace spawnwatch::test
