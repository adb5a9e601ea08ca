#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace cursorup {

// PreflightError naming every tool in `tools` that is not on PATH.
Result CheckDependencies(const std::vector<std::string>& tools);

} // namespace cursorup
