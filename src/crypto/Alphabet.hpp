#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace sten {

/**
 * @brief The ordered character set all ciphers operate over.
 *
 * Printable ASCII in the order digits, lowercase, uppercase, punctuation,
 * whitespace. Every cipher reduces indices modulo Alphabet::size().
 */
class Alphabet {
public:
  static constexpr std::string_view characters =
      "0123456789"
      "abcdefghijklmnopqrstuvwxyz"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~"
      " \t\n\r\x0b\x0c";

  static constexpr int size() noexcept {
    return static_cast<int>(characters.size());
  }

  /**
   * @brief Checks whether a character belongs to the alphabet.
   * @param c The character to check.
   * @return True if the character is a member.
   */
  static bool contains(char c) noexcept;

  /**
   * @brief Gets the position of a character in the alphabet.
   * @param c The character to look up.
   * @return The index of the character (0..size()-1).
   * @throws std::invalid_argument if the character is not a member.
   */
  static int index(char c);

  /**
   * @brief Gets the character at an index, reduced modulo size().
   * @param i Any integer, negative values included.
   * @return The character at the reduced index.
   */
  static char at(long long i) noexcept;

  /**
   * @brief Reduces an integer modulo size() into 0..size()-1.
   */
  static int mod(long long value) noexcept;
};

/**
 * @brief Finds the first character of a text that is not in the alphabet.
 * @param text The text to scan.
 * @return The offending character, or std::nullopt if the text is clean.
 */
std::optional<char> firstNonPrintable(std::string_view text) noexcept;

} // namespace sten
