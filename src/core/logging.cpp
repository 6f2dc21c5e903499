#include "core/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace riskwatch {

void setup_logging(const std::string& level) {
    static std::once_flag once;
    std::call_once(once, []() {
        // Async logging keeps console I/O off the worker threads
        spdlog::init_thread_pool(8192, 1);

        auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto logger = std::make_shared<spdlog::async_logger>(
            "riskwatch",
            stdout_sink,
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest
        );

        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    });

    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

}  // namespace riskwatch
