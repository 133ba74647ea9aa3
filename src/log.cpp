#include "scanpool/log.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace scanpool::log {

    namespace {
        std::mutex g_logger_mu;
        std::shared_ptr<spdlog::logger> g_logger;
    }  // namespace

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard<std::mutex> lk(g_logger_mu);
        if (g_logger) return g_logger;

        g_logger = spdlog::get(kLoggerName);
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt(kLoggerName);
            g_logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        }
        return g_logger;
    }

    void set_logger(std::shared_ptr<spdlog::logger> logger) {
        std::lock_guard<std::mutex> lk(g_logger_mu);
        g_logger = std::move(logger);
    }

    void set_level(spdlog::level::level_enum level) { get()->set_level(level); }

}  // namespace scanpool::log
