#pragma once

#include <gr4ft/session.hpp>
#include <iosfwd>

namespace gr4ftx::commands {

enum class exit_status : int { ok = 0, fatal = 1, partial = 2 };

/**
 * @brief Apply every missing instrumentation to the target tree
 *
 * @param options Session options (webroot, settings, overrides)
 * @param out Stream receiving the per-group report
 * @return exit code: 0 all applied, 1 detection/configuration error, 2 partial failure
 */
int apply(const gr4ft::session_options& options, std::ostream& out);

/**
 * @brief Revert every applied instrumentation in the target tree
 */
int revert(const gr4ft::session_options& options, std::ostream& out);

/**
 * @brief Report applied / unapplied counts per group without modifying anything
 */
int status(const gr4ft::session_options& options, std::ostream& out);

} // namespace gr4ftx::commands
