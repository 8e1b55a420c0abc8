// Ticket: 0012_contact_logging

#include "lcs-sim/src/Contact/ContactLogger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lcs_sim
{

std::shared_ptr<spdlog::logger> makeContactLogger(const std::string& name,
                                                  spdlog::level::level_enum level)
{
  if (auto existing = spdlog::get(name))
  {
    return existing;
  }

  auto logger = spdlog::stdout_color_mt(name);
  logger->set_level(level);
  return logger;
}

}  // namespace lcs_sim
