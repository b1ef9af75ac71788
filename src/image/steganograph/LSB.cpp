#include "LSB.hpp"
#include "../../utils/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <bitset>
#include <fmt/format.h>
#include <numeric>
#include <opencv2/core.hpp>
#include <optional>
#include <random>
#include <vector>

using namespace cv;
using namespace std;

namespace sten {

namespace {
shared_ptr<spdlog::logger> lsbLogger() { return moduleLogger("LSB"); }

void checkImage(const Mat &image) {
  if (image.empty() || image.depth() != CV_8U ||
      (image.channels() != 3 && image.channels() != 4)) {
    throw invalid_argument("Image must be 8-bit with 3 or 4 channels");
  }
}

constexpr unsigned lowMask(int bits) noexcept { return (1u << bits) - 1u; }

// 顺序扫描，遇到分隔符立即停止
optional<string> scan(const uchar *data, int channels,
                      const vector<size_t> &order, const BandDepthPlan &plan) {
  string message;
  unsigned accumulator = 0;
  int pending = 0;

  for (size_t pix : order) {
    const uchar *pixel = data + pix * channels;
    for (const auto &[channel, depth] : plan) {
      accumulator = (accumulator << depth) | (pixel[channel] & lowMask(depth));
      pending += depth;

      if (pending < kBitsPerByte) {
        continue;
      }

      pending -= kBitsPerByte;
      message += static_cast<char>((accumulator >> pending) & 0xFF);
      accumulator &= lowMask(pending);

      if (message.ends_with(kDelimiter)) {
        message.resize(message.size() - kDelimiter.size());
        return message;
      }
    }
  }
  return nullopt;
}
} // namespace

// 将字符串预处理为位流缓存
BitStreamBuffer::BitStreamBuffer(string_view message, bool add_delimiter) {
  const size_t length =
      message.length() + (add_delimiter ? kDelimiter.length() : 0);
  bits.reserve(length * kBitsPerByte);

  auto push = [this](char c) {
    bitset<8> charBits(static_cast<unsigned char>(c));
    for (int i = 7; i >= 0; --i) {
      bits.push_back(charBits[i]);
    }
  };

  for (char c : message) {
    push(c);
  }
  if (add_delimiter) {
    for (char c : kDelimiter) {
      push(c);
    }
  }
}

const vector<bool> &BitStreamBuffer::getBits() const { return bits; }
size_t BitStreamBuffer::size() const { return bits.size(); }

BandDepthPlan makePlan(const vector<int> &depths) {
  BandDepthPlan plan;
  for (size_t channel = 0; channel < depths.size(); ++channel) {
    if (depths[channel] != 0) {
      plan.push_back({static_cast<int>(channel), depths[channel]});
    }
  }
  return plan;
}

void validatePlan(const BandDepthPlan &plan, int channels) {
  if (plan.empty()) {
    throw invalid_argument("Plan must use at least one channel");
  }

  vector<bool> seen(static_cast<size_t>(max(channels, 0)), false);
  for (const auto &[channel, depth] : plan) {
    if (channel < 0 || channel >= channels) {
      throw invalid_argument(fmt::format(
          "Channel {} is out of range for a {}-channel image", channel,
          channels));
    }
    if (depth < 1 || depth > kBitsPerByte) {
      throw invalid_argument(
          fmt::format("Depth {} of channel {} is not in 1-8", depth, channel));
    }
    if (seen[channel]) {
      throw invalid_argument(
          fmt::format("Channel {} appears twice in the plan", channel));
    }
    seen[channel] = true;
  }
}

int bitsPerPixel(const BandDepthPlan &plan) noexcept {
  return accumulate(plan.begin(), plan.end(), 0,
                    [](int sum, const BandDepth &entry) {
                      return sum + entry.depth;
                    });
}

int64_t capacity(size_t pixelCount, const BandDepthPlan &plan) noexcept {
  const auto bits =
      static_cast<int64_t>(pixelCount) * static_cast<int64_t>(bitsPerPixel(plan));
  return bits / kBitsPerByte - static_cast<int64_t>(kDelimiter.size());
}

vector<size_t> pixelOrder(size_t pixelCount, string_view seed) {
  vector<size_t> order(pixelCount);
  iota(order.begin(), order.end(), size_t{0});

  // 使用种子生成随机序列
  if (!seed.empty()) {
    seed_seq sequence(seed.begin(), seed.end());
    mt19937 gen(sequence);
    shuffle(order.begin(), order.end(), gen);
  }
  return order;
}

Mat embedLSB(const Mat &image, string_view message, const BandDepthPlan &plan,
             string_view seed) {
  checkImage(image);
  validatePlan(plan, image.channels());

  BitStreamBuffer bit_buffer(message);
  const auto &bits = bit_buffer.getBits();

  // 容量检查
  const size_t pixelCount = image.total();
  const auto perPixel = static_cast<size_t>(bitsPerPixel(plan));
  if (bits.size() > pixelCount * perPixel) {
    throw CapacityExceededError(fmt::format(
        "Message needs {} bits but the plan holds {} bits", bits.size(),
        pixelCount * perPixel));
  }

  Mat result = image.clone();
  const auto order = pixelOrder(pixelCount, seed);
  const size_t usedPixels = (bits.size() + perPixel - 1) / perPixel;
  const int channels = result.channels();
  uchar *data = result.ptr<uchar>();

  // Each visited pixel owns bits [position * perPixel, +perPixel)
  parallel_for_(Range(0, static_cast<int>(usedPixels)), [&](const Range &range) {
    for (int position = range.start; position < range.end; ++position) {
      size_t cursor = static_cast<size_t>(position) * perPixel;
      uchar *pixel = data + order[position] * channels;

      for (const auto &[channel, depth] : plan) {
        if (cursor >= bits.size()) {
          break;
        }

        // 最后一段不足 depth 位时写入窗口高位，其余低位保持不变
        const int take =
            static_cast<int>(min<size_t>(depth, bits.size() - cursor));
        unsigned window = 0;
        for (int b = 0; b < take; ++b) {
          window = (window << 1) | static_cast<unsigned>(bits[cursor + b]);
        }

        const int shift = depth - take;
        const unsigned mask = lowMask(take) << shift;
        pixel[channel] =
            static_cast<uchar>((pixel[channel] & ~mask) | (window << shift));
        cursor += take;
      }
    }
  });

  lsbLogger()->debug("Embedded {} bits into {} of {} pixels", bits.size(),
                     usedPixels, pixelCount);
  return result;
}

expected<string, StegoError> extractLSB(const Mat &image,
                                        const BandDepthPlan &plan,
                                        string_view seed) {
  checkImage(image);
  validatePlan(plan, image.channels());

  const Mat source = image.isContinuous() ? image : image.clone();
  const auto order = pixelOrder(source.total(), seed);

  if (auto message =
          scan(source.ptr<uchar>(), source.channels(), order, plan)) {
    lsbLogger()->debug("Found a {}-character payload", message->size());
    return std::move(*message);
  }

  return unexpected(
      StegoError{StegoError::Code::NotFound, "No hidden message found."});
}

const vector<BandDepthPlan> &bruteForcePlans() {
  static const vector<BandDepthPlan> plans = [] {
    vector<BandDepthPlan> result;
    result.reserve(9 * 9 * 9 - 1);
    for (int red = 0; red <= kBitsPerByte; ++red) {
      for (int green = 0; green <= kBitsPerByte; ++green) {
        for (int blue = 0; blue <= kBitsPerByte; ++blue) {
          if (red == 0 && green == 0 && blue == 0) {
            continue;
          }
          result.push_back(makePlan({red, green, blue}));
        }
      }
    }
    return result;
  }();
  return plans;
}

expected<string, StegoError>
extractLSBBruteForce(const Mat &image, string_view seed, bool parallel) {
  checkImage(image);

  const Mat source = image.isContinuous() ? image : image.clone();
  const auto order = pixelOrder(source.total(), seed);
  const auto &plans = bruteForcePlans();
  const uchar *data = source.ptr<uchar>();
  const int channels = source.channels();

  vector<optional<string>> results(plans.size());
  atomic<size_t> best{plans.size()};

  // 只跳过排在已知成功方案之后的候选，保证结果确定
  auto evaluate = [&](size_t i) {
    if (i > best.load()) {
      return;
    }
    results[i] = scan(data, channels, order, plans[i]);
    if (!results[i]) {
      return;
    }
    size_t current = best.load();
    while (i < current && !best.compare_exchange_weak(current, i)) {
    }
  };

  if (parallel) {
    parallel_for_(Range(0, static_cast<int>(plans.size())),
                  [&](const Range &range) {
                    for (int i = range.start; i < range.end; ++i) {
                      evaluate(static_cast<size_t>(i));
                    }
                  });
  } else {
    for (size_t i = 0; i < plans.size() && best.load() == plans.size(); ++i) {
      evaluate(i);
    }
  }

  const size_t winner = best.load();
  if (winner == plans.size()) {
    lsbLogger()->info("Brute force tried {} plans without success",
                      plans.size());
    return unexpected(
        StegoError{StegoError::Code::NotFound, "No hidden message found."});
  }

  lsbLogger()->info("Brute force matched plan #{}", winner);
  return std::move(*results[winner]);
}

// 位平面分解
Mat getBitPlane(const Mat &image, int channel, int bitPosition) {
  CV_Assert(image.depth() == CV_8U);
  if (channel < 0 || channel >= image.channels()) {
    throw invalid_argument(fmt::format("Channel {} is out of range", channel));
  }
  if (bitPosition < 0 || bitPosition >= kBitsPerByte) {
    throw invalid_argument(
        fmt::format("Bit position {} is not in 0-7", bitPosition));
  }

  Mat band;
  extractChannel(image, band, channel);
  Mat plane = Mat::zeros(band.size(), CV_8UC1);

  const uchar mask = static_cast<uchar>(1u << bitPosition);
  parallel_for_(Range(0, band.rows), [&](const Range &range) {
    for (int y = range.start; y < range.end; ++y) {
      const uchar *in = band.ptr<uchar>(y);
      uchar *out = plane.ptr<uchar>(y);
      for (int x = 0; x < band.cols; ++x) {
        out[x] = ((in[x] & mask) >> bitPosition) * 255;
      }
    }
  });

  return plane;
}

} // namespace sten
