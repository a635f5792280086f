#include "logging.hpp"
#include "error.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cosign {

namespace {

constexpr const char* LOGGER_NAME = "cosign";

} // namespace

std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        return spdlog::stderr_color_mt(LOGGER_NAME);
    }();
    return logger;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw Error(Error::Code::InvalidArgument, "Unknown log level: " + level);
    }
    get_logger()->set_level(parsed);
}

} // namespace cosign
