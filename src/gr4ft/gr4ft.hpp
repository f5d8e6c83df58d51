#pragma once

// core types and context
#include "engine/result.hpp"
#include "engine/types.hpp"
#include "engine/target_context.hpp"

// instrumentation operations
#include "ops/operation.hpp"

// discovery and orchestration
#include "engine/resource_resolver.hpp"
#include "engine/instrumentation_set.hpp"
#include "engine/orchestrator.hpp"

// collaborators
#include "detect/cakephp_detector.hpp"
#include "settings/settings.hpp"

#include "session.hpp"

namespace gr4ft {

/**
 * @brief check if settings script support is compiled in
 */
inline bool has_scripting_support() {
#ifdef GR4FT_HAS_SCRIPTING
  return true;
#else
  return false;
#endif
}

} // namespace gr4ft
