#pragma once

#include <cstddef>
#include <opencv2/core.hpp>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace sten {

/**
 * @brief Exception thrown when a cipher cannot be built from a key.
 */
class CipherError : public std::runtime_error {
public:
  enum class Kind {
    DegenerateKey,         ///< The key leaves the text unchanged
    NonInvertibleKey,      ///< Key matrix determinant is zero
    KeyAlphabetNotCoprime, ///< Determinant shares a factor with the alphabet
    InvalidKey             ///< Key cannot be parsed for this cipher
  };

  CipherError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

/**
 * @brief Kind of edit applied to a key entry.
 */
enum class EditAction { Delete, Insert };

/**
 * @brief Which text a cipher's validate predicate expects for an edit.
 *
 * InsertedText is the text being inserted, ProposedValue is the whole key
 * as it would read after the edit.
 */
enum class KeyEditData { InsertedText, ProposedValue };

// Identity transform, takes no key
struct NotACipher {
  static constexpr std::string_view name = "";
  static constexpr KeyEditData editData = KeyEditData::InsertedText;

  static bool validate(EditAction action, std::string_view data) noexcept;

  std::string encrypt(std::string_view text) const;
  std::string decrypt(std::string_view text) const;
};

/**
 * @brief Additive shift over the alphabet.
 */
class Caesar {
public:
  static constexpr std::string_view name = "Caesar";
  static constexpr KeyEditData editData = KeyEditData::InsertedText;

  /**
   * @brief Builds the cipher from a decimal shift.
   * @throws CipherError InvalidKey if the key is not an integer,
   * DegenerateKey if the shift is a multiple of the alphabet size.
   */
  explicit Caesar(std::string_view key);
  explicit Caesar(long long shift);

  static bool validate(EditAction action, std::string_view data) noexcept;

  std::string encrypt(std::string_view text) const;
  std::string decrypt(std::string_view text) const;

  [[nodiscard]] long long shift() const noexcept { return shift_; }

private:
  std::string shiftBy(std::string_view text, long long shift) const;

  long long shift_;
};

/**
 * @brief Block cipher multiplying blocks of alphabet indices by a square
 * key matrix modulo the alphabet size.
 *
 * A key of length n gives an m x m matrix with m = ceil(sqrt(n)). Cells past
 * the key, and cells past the text in the last block, are filled with a
 * counter 0, 1, 2, ... so ciphertext length is rounded up to a multiple of m.
 */
class Hill {
public:
  static constexpr std::string_view name = "Hill";
  static constexpr KeyEditData editData = KeyEditData::InsertedText;

  /**
   * @brief Builds the key matrix and its modular inverse.
   * @param key Non-empty string of alphabet members.
   * @throws CipherError InvalidKey, NonInvertibleKey or
   * KeyAlphabetNotCoprime.
   */
  explicit Hill(std::string_view key);

  static bool validate(EditAction action, std::string_view data) noexcept;

  std::string encrypt(std::string_view text) const;
  std::string decrypt(std::string_view text) const;

  /// Matrix dimension m
  [[nodiscard]] int order() const noexcept { return order_; }
  [[nodiscard]] long long determinant() const noexcept { return det_; }
  [[nodiscard]] const cv::Mat1d &keyMatrix() const noexcept { return key_; }
  [[nodiscard]] const cv::Mat1d &inverseMatrix() const noexcept {
    return inverse_;
  }

private:
  static cv::Mat1d fill(std::string_view values, int rows, int cols,
                        bool columnMajor);

  std::string apply(const cv::Mat1d &matrix, std::string_view text) const;

  int order_ = 0;
  long long det_ = 0;
  cv::Mat1d key_;
  cv::Mat1d inverse_; ///< round(adjugate * det^-1 mod N)
};

/**
 * @brief Columnar transposition with a fixed number of columns.
 */
class Scytale {
public:
  static constexpr std::string_view name = "Scytale";
  static constexpr KeyEditData editData = KeyEditData::ProposedValue;

  /**
   * @brief Builds the cipher from a positive decimal column count.
   * @throws CipherError InvalidKey for zero or non-numeric keys.
   */
  explicit Scytale(std::string_view key);
  explicit Scytale(std::size_t columns);

  static bool validate(EditAction action, std::string_view data) noexcept;

  std::string encrypt(std::string_view text) const;
  std::string decrypt(std::string_view text) const;

  [[nodiscard]] std::size_t columns() const noexcept { return columns_; }

private:
  std::size_t columns_;
};

/**
 * @brief Polyalphabetic substitution with a repeating key.
 */
class Vigenere {
public:
  static constexpr std::string_view name = "Vigenère";
  static constexpr KeyEditData editData = KeyEditData::InsertedText;

  /**
   * @throws CipherError InvalidKey if the key is empty or contains a
   * character outside the alphabet.
   */
  explicit Vigenere(std::string_view key);

  static bool validate(EditAction action, std::string_view data) noexcept;

  std::string encrypt(std::string_view text) const;
  std::string decrypt(std::string_view text) const;

  [[nodiscard]] const std::string &key() const noexcept { return key_; }

private:
  std::string shiftBy(std::string_view text, int sign) const;

  std::string key_;
};

using CipherVariant = std::variant<NotACipher, Caesar, Hill, Scytale, Vigenere>;

/**
 * @brief A keyed cipher bound to a plain/cipher text.
 *
 * The variant is fixed at construction; only the bound text can be replaced.
 */
class Cipher {
public:
  explicit Cipher(CipherVariant variant, std::string text = {});

  /**
   * @brief Builds a cipher by name.
   * @param name A canonical name from names() or one of its aliases.
   * @param key The key as typed by the user.
   * @param text The text to bind.
   * @return The keyed cipher.
   * @throws std::invalid_argument for an unknown name.
   * @throws CipherError if the key is unusable.
   */
  static Cipher create(std::string_view name, std::string_view key,
                       std::string text = {});

  /**
   * @brief Canonical cipher names in menu order, the identity first.
   */
  static std::span<const std::string_view> names() noexcept;

  /**
   * @brief Resolves an alias to its canonical name.
   * @throws std::invalid_argument for an unknown name.
   */
  static std::string_view canonicalName(std::string_view name);

  /**
   * @brief Runs the named cipher's key-entry predicate.
   * @param name Cipher name or alias.
   * @param action The edit being applied.
   * @param data Inserted text or proposed value, see editData().
   * @return True if the edit keeps the key acceptable.
   */
  static bool validate(std::string_view name, EditAction action,
                       std::string_view data);

  /**
   * @brief Which text validate() expects for the named cipher.
   */
  static KeyEditData editData(std::string_view name);

  /**
   * @brief Replays a key one character at a time through validate().
   * @return True if every keystroke would have been accepted.
   */
  static bool acceptsKey(std::string_view name, std::string_view key);

  [[nodiscard]] std::string_view name() const noexcept;
  [[nodiscard]] const CipherVariant &variant() const noexcept {
    return variant_;
  }

  [[nodiscard]] const std::string &text() const noexcept { return text_; }
  void setText(std::string text) { text_ = std::move(text); }

  std::string encrypt() const;
  std::string decrypt() const;

private:
  CipherVariant variant_;
  std::string text_;
};

} // namespace sten
