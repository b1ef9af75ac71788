#pragma once

#include <string>
#include <string_view>

namespace sten {

/**
 * @struct StegoError
 * @brief Expected, non-exceptional outcomes of encoding and decoding.
 */
struct StegoError {
  enum class Code {
    NotFound,            ///< No delimiter in the scanned bits
    MissingKey,          ///< A cipher was chosen without a key
    EmptyMessage,        ///< Nothing to encode
    NonPrintableMessage, ///< Message or payload outside printable ASCII
    CapacityExceeded,    ///< Message does not fit the plan
    DelimiterInMessage   ///< Message contains the delimiter itself
  };

  Code code;
  std::string message;
};

// String representation for StegoError::Code
std::string_view errorToString(StegoError::Code code) noexcept;

} // namespace sten
