#pragma once

#include "types.hpp"
#include <string>

// Plain-text explanation built only from the leg's own numbers and identifiers
std::string generate_rationale(const ScoredCandidate& scored);
