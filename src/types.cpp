#include "types.hpp"

std::string_view edit_error_name(EditError e) {
  switch (e) {
    case EditError::None: return "none";
    case EditError::NoFile: return "no file";
    case EditError::Io: return "io error";
    case EditError::CopyFailed: return "copy failed";
    case EditError::OutOfBounds: return "out of bounds";
  }
  return "unknown";
}
