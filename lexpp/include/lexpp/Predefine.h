#pragma once
#include "lexpp/Diagnostic.h"
#include "lexpp/Environment.h"
#include <string>
#include <vector>

namespace lexpp {

// Name of the pseudo-source holding command-line definitions.
inline constexpr const char *kCommandLineSource = "<command line>";

// Turns each -D argument into a #define (NAME, NAME=VALUE or
// NAME(params)=VALUE) and expands them into an empty environment, then
// removes every -U name. Malformed arguments throw a Syntax PreprocError.
Environment predefine(const std::vector<std::string> &defs,
                      const std::vector<std::string> &undefs,
                      DiagEngine &diag);

// "#define " line for one -D argument.
std::string defineDirective(const std::string &def);

} // namespace lexpp
