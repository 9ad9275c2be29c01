#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace corona {
std::shared_ptr<spdlog::logger> _get_logger(const std::string& name);
} // namespace corona
