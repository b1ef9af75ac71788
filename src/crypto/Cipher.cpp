#include "Cipher.hpp"
#include "Alphabet.hpp"
#include "../utils/Logger.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <fmt/format.h>
#include <type_traits>
#include <vector>

namespace sten {

namespace {
constexpr std::array<std::string_view, 5> kNames{
    NotACipher::name, Caesar::name, Hill::name, Scytale::name,
    Vigenere::name};

struct Alias {
  std::string_view alias;
  std::string_view name;
};

constexpr std::array<Alias, 5> kAliases{{
    {"Caesar-style", Caesar::name},
    {"Matrix", Hill::name},
    {"Transposition", Scytale::name},
    {"Polyalphabetic", Vigenere::name},
    {"Vigenere", Vigenere::name},
}};

bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

template <typename Int> bool parseInteger(std::string_view text, Int &out) {
  if (text.empty()) {
    return false;
  }
  const auto *first = text.data();
  const auto *last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

// Calls f with the type tag of the named cipher
template <typename F>
decltype(auto) dispatchByName(std::string_view name, F &&f) {
  const auto canonical = Cipher::canonicalName(name);
  if (canonical == Caesar::name) {
    return f(std::type_identity<Caesar>{});
  }
  if (canonical == Hill::name) {
    return f(std::type_identity<Hill>{});
  }
  if (canonical == Scytale::name) {
    return f(std::type_identity<Scytale>{});
  }
  if (canonical == Vigenere::name) {
    return f(std::type_identity<Vigenere>{});
  }
  return f(std::type_identity<NotACipher>{});
}
} // namespace

// ---------------------------------------------------------------- NotACipher

bool NotACipher::validate(EditAction, std::string_view) noexcept {
  return false;
}

std::string NotACipher::encrypt(std::string_view text) const {
  return std::string(text);
}

std::string NotACipher::decrypt(std::string_view text) const {
  return std::string(text);
}

// -------------------------------------------------------------------- Caesar

Caesar::Caesar(std::string_view key) : shift_(0) {
  if (!parseInteger(key, shift_)) {
    throw CipherError(CipherError::Kind::InvalidKey,
                      fmt::format("Key error. '{}' is not an integer.", key));
  }
  if (Alphabet::mod(shift_) == 0) {
    throw CipherError(CipherError::Kind::DegenerateKey,
                      "Key error. Shift value is equal to 0.");
  }
}

Caesar::Caesar(long long shift) : shift_(shift) {
  if (Alphabet::mod(shift_) == 0) {
    throw CipherError(CipherError::Kind::DegenerateKey,
                      "Key error. Shift value is equal to 0.");
  }
}

bool Caesar::validate(EditAction action, std::string_view data) noexcept {
  if (action == EditAction::Delete) {
    return true;
  }
  return !data.empty() && std::ranges::all_of(data, isDigit);
}

std::string Caesar::encrypt(std::string_view text) const {
  return shiftBy(text, shift_);
}

std::string Caesar::decrypt(std::string_view text) const {
  return shiftBy(text, -Alphabet::mod(shift_));
}

std::string Caesar::shiftBy(std::string_view text, long long shift) const {
  const int reduced = Alphabet::mod(shift);
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    result += Alphabet::at(Alphabet::index(c) + reduced);
  }
  return result;
}

// ------------------------------------------------------------------- Scytale

Scytale::Scytale(std::string_view key) : columns_(0) {
  if (!parseInteger(key, columns_) || columns_ == 0) {
    throw CipherError(
        CipherError::Kind::InvalidKey,
        fmt::format("Key error. '{}' is not a positive integer.", key));
  }
}

Scytale::Scytale(std::size_t columns) : columns_(columns) {
  if (columns_ == 0) {
    throw CipherError(CipherError::Kind::InvalidKey,
                      "Key error. Column count must be positive.");
  }
}

bool Scytale::validate(EditAction action, std::string_view data) noexcept {
  if (action == EditAction::Delete) {
    return true;
  }
  // ^[1-9][0-9]*$
  return !data.empty() && data.front() != '0' &&
         std::ranges::all_of(data, isDigit);
}

std::string Scytale::encrypt(std::string_view text) const {
  const std::size_t length = text.size();
  const std::size_t columns =
      std::min(columns_, std::max<std::size_t>(length, 1));

  std::string result;
  result.reserve(length);
  for (std::size_t col = 0; col < columns; ++col) {
    for (std::size_t i = col; i < length; i += columns) {
      result += text[i];
    }
  }
  return result;
}

std::string Scytale::decrypt(std::string_view text) const {
  const std::size_t length = text.size();
  if (length == 0) {
    return {};
  }

  // 列数多于字符数时等价于恒等变换
  const std::size_t columns = std::min(columns_, length);
  const std::size_t rows = length / columns;
  const std::size_t longColumns = length % columns;

  // Start offset of every column in the ciphertext
  std::vector<std::size_t> starts(columns, 0);
  for (std::size_t col = 1; col < columns; ++col) {
    const std::size_t previous = rows + (col - 1 < longColumns ? 1 : 0);
    starts[col] = starts[col - 1] + previous;
  }

  std::string result;
  result.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    const std::size_t row = i / columns;
    const std::size_t col = i % columns;
    result += text[starts[col] + row];
  }
  return result;
}

// ------------------------------------------------------------------ Vigenere

Vigenere::Vigenere(std::string_view key) : key_(key) {
  if (key_.empty()) {
    throw CipherError(CipherError::Kind::InvalidKey,
                      "Key error. Key must not be empty.");
  }
  if (auto bad = firstNonPrintable(key_)) {
    throw CipherError(CipherError::Kind::InvalidKey,
                      fmt::format("Key error. Character 0x{:02x} is not in "
                                  "the alphabet.",
                                  static_cast<unsigned char>(*bad)));
  }
}

bool Vigenere::validate(EditAction action, std::string_view data) noexcept {
  if (action == EditAction::Delete) {
    return true;
  }
  return !data.empty() && std::ranges::all_of(data, Alphabet::contains);
}

std::string Vigenere::encrypt(std::string_view text) const {
  return shiftBy(text, 1);
}

std::string Vigenere::decrypt(std::string_view text) const {
  return shiftBy(text, -1);
}

std::string Vigenere::shiftBy(std::string_view text, int sign) const {
  std::string result;
  result.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const int k = Alphabet::index(key_[i % key_.size()]);
    result += Alphabet::at(Alphabet::index(text[i]) + sign * k);
  }
  return result;
}

// -------------------------------------------------------------------- Cipher

Cipher::Cipher(CipherVariant variant, std::string text)
    : variant_(std::move(variant)), text_(std::move(text)) {}

Cipher Cipher::create(std::string_view name, std::string_view key,
                      std::string text) {
  auto logger = moduleLogger("Cipher");
  try {
    return dispatchByName(name, [&](auto tag) {
      using T = typename decltype(tag)::type;
      if constexpr (std::is_same_v<T, NotACipher>) {
        return Cipher(NotACipher{}, std::move(text));
      } else {
        return Cipher(T(key), std::move(text));
      }
    });
  } catch (const CipherError &e) {
    logger->warn("Cannot build {} cipher: {}", canonicalName(name), e.what());
    throw;
  }
}

std::span<const std::string_view> Cipher::names() noexcept { return kNames; }

std::string_view Cipher::canonicalName(std::string_view name) {
  if (auto it = std::ranges::find(kNames, name); it != kNames.end()) {
    return *it;
  }
  for (const auto &alias : kAliases) {
    if (alias.alias == name) {
      return alias.name;
    }
  }
  throw std::invalid_argument(fmt::format("Unknown cipher: '{}'", name));
}

bool Cipher::validate(std::string_view name, EditAction action,
                      std::string_view data) {
  return dispatchByName(name, [&](auto tag) {
    using T = typename decltype(tag)::type;
    return T::validate(action, data);
  });
}

KeyEditData Cipher::editData(std::string_view name) {
  return dispatchByName(name, [](auto tag) {
    using T = typename decltype(tag)::type;
    return T::editData;
  });
}

bool Cipher::acceptsKey(std::string_view name, std::string_view key) {
  const KeyEditData data = editData(name);
  std::string proposed;
  for (char c : key) {
    proposed += c;
    const std::string_view typed =
        data == KeyEditData::ProposedValue ? std::string_view(proposed)
                                           : std::string_view(&c, 1);
    if (!validate(name, EditAction::Insert, typed)) {
      return false;
    }
  }
  return true;
}

std::string_view Cipher::name() const noexcept {
  return std::visit(
      [](const auto &cipher) {
        return std::decay_t<decltype(cipher)>::name;
      },
      variant_);
}

std::string Cipher::encrypt() const {
  return std::visit([&](const auto &cipher) { return cipher.encrypt(text_); },
                    variant_);
}

std::string Cipher::decrypt() const {
  return std::visit([&](const auto &cipher) { return cipher.decrypt(text_); },
                    variant_);
}

} // namespace sten
