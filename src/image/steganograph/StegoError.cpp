#include "StegoError.hpp"

namespace sten {

std::string_view errorToString(StegoError::Code code) noexcept {
  switch (code) {
  case StegoError::Code::NotFound:
    return "No hidden message found";
  case StegoError::Code::MissingKey:
    return "Missing key";
  case StegoError::Code::EmptyMessage:
    return "Empty message";
  case StegoError::Code::NonPrintableMessage:
    return "Non-printable message";
  case StegoError::Code::CapacityExceeded:
    return "Capacity exceeded";
  case StegoError::Code::DelimiterInMessage:
    return "Message contains the delimiter";
  default:
    return "Unknown error";
  }
}

} // namespace sten
