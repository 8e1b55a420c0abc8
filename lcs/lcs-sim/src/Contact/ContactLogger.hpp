// Ticket: 0012_contact_logging

#ifndef LCS_SIM_CONTACT_CONTACT_LOGGER_HPP
#define LCS_SIM_CONTACT_CONTACT_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace lcs_sim
{

/**
 * @brief Colored stdout logger for a ContactSolver
 *
 * Returns the logger already registered under `name` if there is one,
 * otherwise registers a new stdout_color_mt logger at `level`.
 *
 * @throws spdlog::spdlog_ex if the sink cannot be created
 * @ticket 0012_contact_logging
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> makeContactLogger(
  const std::string& name = "lcs-contact",
  spdlog::level::level_enum level = spdlog::level::info);

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_CONTACT_LOGGER_HPP
