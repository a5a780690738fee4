#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace kvcache {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

// The registered logger called `name`, or a new colored stdout logger with
// the kvcache pattern.  Only a newly created logger gets `level`.
std::shared_ptr<spdlog::logger> get_or_create(const std::string& name,
                                              spdlog::level::level_enum level) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level) {
    auto logger = get_or_create("kvcache", level);
    // Re-initialising only changes the level.
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
}

std::shared_ptr<spdlog::logger> make_cache_logger(
    const std::string& name,
    spdlog::level::level_enum level)
{
    return get_or_create(name, level);
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    // spdlog also accepts "warning" and "err"; "off" is not offered.
    const auto level = spdlog::level::from_str(s);
    if (level == spdlog::level::off) {
        return spdlog::level::info;
    }
    return level;
}

} // namespace kvcache
