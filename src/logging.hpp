#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace cosign {

// The library's named logger ("cosign"). Created on first use with a stderr
// color sink unless the host application registered one under that name.
std::shared_ptr<spdlog::logger> get_logger();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Throws Error(InvalidArgument) on an unknown name.
void set_log_level(const std::string& level);

} // namespace cosign
