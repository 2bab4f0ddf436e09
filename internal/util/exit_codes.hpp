#pragma once

#include <exception>

#include "internal/util/errors.hpp"

namespace hashtax::util {

enum ExitCode : int {
  kExitOk                = 0,
  kExitUsage             = 1,
  kExitInputError        = 2,
  kExitUnsupportedFormat = 3,
  kExitInternal          = 4,
};

/*
  Converts internal exceptions into process exit codes.
*/
int ToExitCode(const std::exception& e);

} // namespace hashtax::util
