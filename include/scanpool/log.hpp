#pragma once

#include <memory>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace scanpool::log {

    /// @brief Name of the logger every scanpool component writes to.
    inline constexpr const char* kLoggerName = "scanpool";

    /// @brief Shared library logger.
    /// @note Created on first use as a thread-safe colored stderr logger
    /// unless the application registered its own logger under kLoggerName.
    std::shared_ptr<spdlog::logger> get();

    /// @brief Install an application-provided logger for the library.
    void set_logger(std::shared_ptr<spdlog::logger> logger);

    void set_level(spdlog::level::level_enum level);

}  // namespace scanpool::log
