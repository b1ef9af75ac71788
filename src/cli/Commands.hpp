#pragma once

#include <QStringList>
#include <iosfwd>

namespace sten::cli {

enum ExitCode { Success = 0, Failure = 1, UsageError = 2 };

/**
 * @brief Runs one sten command line.
 *
 * Parses the arguments, loads the settings file, starts logging and
 * dispatches to encode, decode, info or ciphers.
 * @param arguments Program name followed by the command line.
 * @param out Stream for results (decoded text, picture info).
 * @param err Stream for error messages and usage text.
 * @return ExitCode::Success, Failure for a failed operation or UsageError
 * for a malformed command line.
 */
int run(const QStringList &arguments, std::ostream &out, std::ostream &err);

} // namespace sten::cli
