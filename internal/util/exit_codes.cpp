#include "internal/util/exit_codes.hpp"

namespace hashtax::util {

int ToExitCode(const std::exception& e) {
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return kExitUsage;
  }
  if (dynamic_cast<const FileNotFound*>(&e) || dynamic_cast<const MissingColumn*>(&e) || dynamic_cast<const EmptyInput*>(&e)) {
    return kExitInputError;
  }
  if (dynamic_cast<const NoValidInputFiles*>(&e) || dynamic_cast<const MixedInputFormats*>(&e)) {
    return kExitInputError;
  }
  if (dynamic_cast<const UnsupportedInputFormat*>(&e) || dynamic_cast<const UnsupportedOutputFormat*>(&e)) {
    return kExitUnsupportedFormat;
  }

  return kExitInternal;
}

} // namespace hashtax::util
