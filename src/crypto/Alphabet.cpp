#include "Alphabet.hpp"

#include <array>
#include <fmt/format.h>
#include <stdexcept>

namespace sten {

namespace {
// 反向查找表，-1 表示不在字母表中
constexpr auto buildIndexTable() {
  std::array<int, 256> table{};
  table.fill(-1);
  for (std::size_t i = 0; i < Alphabet::characters.size(); ++i) {
    table[static_cast<unsigned char>(Alphabet::characters[i])] =
        static_cast<int>(i);
  }
  return table;
}

constexpr auto kIndexTable = buildIndexTable();
} // namespace

bool Alphabet::contains(char c) noexcept {
  return kIndexTable[static_cast<unsigned char>(c)] >= 0;
}

int Alphabet::index(char c) {
  const int i = kIndexTable[static_cast<unsigned char>(c)];
  if (i < 0) {
    throw std::invalid_argument(fmt::format(
        "Character 0x{:02x} is not in the alphabet",
        static_cast<unsigned char>(c)));
  }
  return i;
}

int Alphabet::mod(long long value) noexcept {
  const long long n = size();
  return static_cast<int>(((value % n) + n) % n);
}

char Alphabet::at(long long i) noexcept { return characters[mod(i)]; }

std::optional<char> firstNonPrintable(std::string_view text) noexcept {
  for (char c : text) {
    if (!Alphabet::contains(c)) {
      return c;
    }
  }
  return std::nullopt;
}

} // namespace sten
