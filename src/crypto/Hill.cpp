#include "Alphabet.hpp"
#include "Cipher.hpp"
#include "../utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <opencv2/core.hpp>
#include <utility>

namespace sten {

namespace {
// det^-1 mod N, det must be coprime with N
long long modularInverse(long long det) {
  long long a = Alphabet::mod(det);
  long long m = Alphabet::size();
  long long x0 = 1, x1 = 0;
  while (m != 0) {
    const long long q = a / m;
    a = std::exchange(m, a - q * m);
    x0 = std::exchange(x1, x0 - q * x1);
  }
  return Alphabet::mod(x0);
}
} // namespace

Hill::Hill(std::string_view key) {
  if (key.empty()) {
    throw CipherError(CipherError::Kind::InvalidKey,
                      "Key error. Key must not be empty.");
  }
  if (auto bad = firstNonPrintable(key)) {
    throw CipherError(CipherError::Kind::InvalidKey,
                      fmt::format("Key error. Character 0x{:02x} is not in "
                                  "the alphabet.",
                                  static_cast<unsigned char>(*bad)));
  }

  // m = ceil(sqrt(n))
  while (static_cast<std::size_t>(order_) * order_ < key.size()) {
    ++order_;
  }

  key_ = fill(key, order_, order_, false);
  det_ = std::llround(cv::determinant(key_));

  if (det_ == 0) {
    throw CipherError(CipherError::Kind::NonInvertibleKey,
                      "Key matrix is not invertible.");
  }
  if (std::gcd(det_, static_cast<long long>(Alphabet::size())) != 1) {
    throw CipherError(
        CipherError::Kind::KeyAlphabetNotCoprime,
        "Key determinant and alphabet length are not co-prime.");
  }

  cv::Mat1d inverse;
  cv::invert(key_, inverse, cv::DECOMP_LU);
  const cv::Mat1d adjugate = inverse * static_cast<double>(det_);

  inverse_ = adjugate * static_cast<double>(modularInverse(det_));
  for (auto &value : inverse_) {
    value = Alphabet::mod(std::llround(value));
  }

  moduleLogger("Cipher")->debug("Hill key matrix {0}x{0}, determinant {1}",
                                order_, det_);
}

bool Hill::validate(EditAction action, std::string_view data) noexcept {
  if (action == EditAction::Delete) {
    return true;
  }
  return !data.empty() && std::ranges::all_of(data, Alphabet::contains);
}

std::string Hill::encrypt(std::string_view text) const {
  return apply(key_, text);
}

std::string Hill::decrypt(std::string_view text) const {
  return apply(inverse_, text);
}

cv::Mat1d Hill::fill(std::string_view values, int rows, int cols,
                     bool columnMajor) {
  cv::Mat1d matrix(rows, cols, 0.0);

  const int outer = columnMajor ? cols : rows;
  const int inner = columnMajor ? rows : cols;

  std::size_t idx = 0;
  int extra = 0;
  for (int i = 0; i < outer; ++i) {
    for (int j = 0; j < inner; ++j) {
      double &cell = columnMajor ? matrix(j, i) : matrix(i, j);
      if (idx == values.size()) {
        cell = extra++;
        continue;
      }
      cell = Alphabet::index(values[idx++]);
    }
  }
  return matrix;
}

std::string Hill::apply(const cv::Mat1d &matrix, std::string_view text) const {
  if (text.empty()) {
    return {};
  }

  const auto m = static_cast<std::size_t>(order_);
  const int cols = static_cast<int>((text.size() + m - 1) / m);
  const cv::Mat1d vectors = fill(text, order_, cols, true);
  const cv::Mat1d product = matrix * vectors;

  // 按列读出结果
  std::string result;
  result.reserve(static_cast<std::size_t>(cols) * order_);
  for (int c = 0; c < cols; ++c) {
    for (int r = 0; r < order_; ++r) {
      result += Alphabet::at(std::llround(product(r, c)));
    }
  }
  return result;
}

} // namespace sten
