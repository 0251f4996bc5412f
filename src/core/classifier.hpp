#pragma once
#include <string>
#include <vector>
#include "core/outcome.hpp"
#include "runtime/runner.hpp"

namespace execbox::core {

// Map a raw run to its outcome. Timeout wins over anything observed at the
// same time, since our own kill produces a misleading signal.
// memory_markers: stderr text meaning an allocation failed under RLIMIT_AS.
ExecutionOutcome classify(const runtime::RawOutcome& raw,
                          const std::string& request_id,
                          const std::vector<std::string>& memory_markers);

} // namespace execbox::core
