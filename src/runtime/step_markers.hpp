#pragma once

#include <string>
#include <vector>
#include "protocol/step_outcome.hpp"

namespace diagcollect::runtime {

// "STEP:" lines parsed by triage tooling. The wording is a compatibility
// contract; change it only together with the tooling.
std::string format_step_marker(const protocol::StepOutcome& outcome);

std::string join_candidates(const std::vector<std::string>& candidates);

}  // namespace diagcollect::runtime
