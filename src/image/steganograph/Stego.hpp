#pragma once

#include "LSB.hpp"
#include "StegoError.hpp"

#include <expected>
#include <opencv2/core.hpp>
#include <string>

namespace sten {

// Configuration for one encode or decode run
struct StegoConfig {
  std::string cipher;                         // Cipher name, empty for none
  std::string key;                            // Cipher key as typed
  std::string seed;                           // Pixel order seed
  BandDepthPlan plan = makePlan({1, 1, 1});   // Channels and depths
  bool brute = false;                         // Decode by trying every plan
  bool parallel = true;                       // Parallel brute force
  bool allow_delimiter_loss = false;          // Encode even if cut short
  bool truncate = false;                      // Cut message to capacity
};

/**
 * @brief Encrypts a message and embeds it into a carrier image.
 * @param carrier The input carrier image (RGB or RGBA, 8-bit).
 * @param message The plaintext message.
 * @param config The steganography configuration.
 * @return The image with the embedded message, or the reason it was refused.
 * @throws CipherError if the key is unusable.
 * @throws std::invalid_argument for an unknown cipher or a bad plan.
 */
std::expected<cv::Mat, StegoError> embed_message(const cv::Mat &carrier,
                                                 const std::string &message,
                                                 const StegoConfig &config);

/**
 * @brief Extracts a hidden message and decrypts it.
 * @param stego The input stego image.
 * @param config The steganography configuration used when embedding.
 * @return The decrypted message or the reason none was recovered.
 * @throws CipherError if the key is unusable.
 * @throws std::invalid_argument for an unknown cipher or a bad plan.
 */
std::expected<std::string, StegoError>
extract_message(const cv::Mat &stego, const StegoConfig &config);

/**
 * @brief Evaluates the quality of the stego image compared to the original.
 * @param original The original image.
 * @param stego The stego image.
 * @return Peak signal-to-noise ratio in dB.
 */
double evaluate_image_quality(const cv::Mat &original, const cv::Mat &stego);

/**
 * @brief Low-bit depths from 4 upward leave visible noise.
 */
constexpr bool isConspicuousDepth(int depth) noexcept { return depth >= 4; }

} // namespace sten
