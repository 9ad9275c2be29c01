#include <corona/common/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <experimental/filesystem>

namespace corona
{
std::shared_ptr<spdlog::logger> _get_logger(const std::string& name)
{
  std::experimental::filesystem::path path(name);
  const auto filename = path.filename().string();
  auto logger = spdlog::get(filename);
  if (!logger) {
    return spdlog::stdout_color_mt(filename);
  }
  return logger;
}

} // namespace corona
