
#pragma once

#include <string>
#include "formula.h"

namespace dmlgeom {

/// Returns the parsed definition of a preset constant (such as "cd4" or "wd2"), or NULL if name is not a preset constant.
const Expression *findPresetConstant(const std::string &name);

/// Returns the unparsed definition of a preset constant, or NULL if name is not a preset constant.
const char *presetConstantDefinition(const std::string &name);

}
