#pragma once

#include "StegoError.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sten {

/// Sentinel appended to every payload, shared by both ends of the codec
inline constexpr std::string_view kDelimiter = "$t3nb7$3rh@tC3l!k";

inline constexpr int kBitsPerByte = 8;

/// Smallest picture able to carry an empty payload at one bit per pixel
inline constexpr std::size_t kMinimumPixels =
    kBitsPerByte + kBitsPerByte * kDelimiter.size();

/**
 * @brief One entry of a band/depth plan: a channel and its low-bit count.
 */
struct BandDepth {
  int channel; ///< Channel index in R, G, B, A order
  int depth;   ///< Number of low-order bits carrying payload (1-8)

  bool operator==(const BandDepth &) const = default;
};

/**
 * @brief Ordered list of channels carrying payload bits.
 *
 * Entry order is the packing order within every visited pixel.
 */
using BandDepthPlan = std::vector<BandDepth>;

/**
 * @brief Exception thrown when a payload does not fit a plan.
 */
class CapacityExceededError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * @brief Class for buffering a string message as a bit stream.
 */
class BitStreamBuffer {
public:
  /**
   * @brief Constructs a BitStreamBuffer from a string message.
   * @param message The input string message.
   * @param add_delimiter Whether to append kDelimiter (default is true).
   */
  explicit BitStreamBuffer(std::string_view message,
                           bool add_delimiter = true);

  /**
   * @brief Gets the buffered bits, most significant bit of each byte first.
   * @return A reference to the vector of bits.
   */
  const std::vector<bool> &getBits() const;

  /**
   * @brief Gets the size of the buffered bits.
   * @return The size of the buffered bits.
   */
  size_t size() const;

private:
  std::vector<bool> bits; ///< The buffered bits
};

/**
 * @brief Builds a plan from per-channel depths, dropping zero depths.
 * @param depths Depth of channel 0, 1, ... in that order.
 * @return The plan in ascending channel order.
 */
BandDepthPlan makePlan(const std::vector<int> &depths);

/**
 * @brief Checks a plan against a pixel layout.
 * @param plan The plan to check.
 * @param channels Number of channels per pixel.
 * @throws std::invalid_argument for an empty plan, a depth outside 1-8, a
 * channel out of range or a repeated channel.
 */
void validatePlan(const BandDepthPlan &plan, int channels);

/**
 * @brief Sum of the plan's depths.
 */
int bitsPerPixel(const BandDepthPlan &plan) noexcept;

/**
 * @brief Number of plaintext characters a plan can carry.
 *
 * floor(pixelCount * bitsPerPixel / 8) - delimiter length; may be negative
 * for pictures too small to hold the delimiter.
 */
std::int64_t capacity(std::size_t pixelCount,
                      const BandDepthPlan &plan) noexcept;

/**
 * @brief Builds the pixel visitation order.
 * @param pixelCount Number of pixels.
 * @param seed Empty for row-major order, otherwise the seed of a shuffle.
 * @return A permutation of 0..pixelCount-1, identical for identical seeds.
 */
std::vector<std::size_t> pixelOrder(std::size_t pixelCount,
                                    std::string_view seed);

/**
 * @brief Embeds a message into the low bits of an image.
 * @param image 8-bit image with 3 or 4 channels.
 * @param message The message to embed, without the delimiter.
 * @param plan Channels and depths to write.
 * @param seed Pixel order seed, empty for row-major order.
 * @return A modified copy of the image.
 * @throws CapacityExceededError if the message plus delimiter does not fit.
 * @throws std::invalid_argument for an unsupported image or plan.
 */
cv::Mat embedLSB(const cv::Mat &image, std::string_view message,
                 const BandDepthPlan &plan, std::string_view seed = {});

/**
 * @brief Extracts a delimiter-terminated message from an image.
 * @param image 8-bit image with 3 or 4 channels.
 * @param plan Channels and depths used when embedding.
 * @param seed Pixel order seed used when embedding.
 * @return The message without the delimiter, or StegoError::Code::NotFound.
 */
std::expected<std::string, StegoError>
extractLSB(const cv::Mat &image, const BandDepthPlan &plan,
           std::string_view seed = {});

/**
 * @brief Every nonzero red/green/blue depth combination, in search order.
 *
 * The order of a base-9 counter over (red, green, blue) from (0,0,1) to
 * (8,8,8); channels with depth 0 are left out of each plan.
 */
const std::vector<BandDepthPlan> &bruteForcePlans();

/**
 * @brief Tries every plan of bruteForcePlans() and keeps the first success.
 * @param image 8-bit image with 3 or 4 channels.
 * @param seed Pixel order seed used when embedding.
 * @param parallel Evaluate candidates concurrently; the result is the same.
 * @return The message of the lowest-index plan that succeeds, or NotFound.
 */
std::expected<std::string, StegoError>
extractLSBBruteForce(const cv::Mat &image, std::string_view seed = {},
                     bool parallel = true);

/**
 * @brief Gets one bit plane of one channel.
 * @param image The input image.
 * @param channel The channel index.
 * @param bitPosition The bit position (0-7).
 * @return A single-channel image, 255 where the bit is set.
 */
cv::Mat getBitPlane(const cv::Mat &image, int channel, int bitPosition);

} // namespace sten
