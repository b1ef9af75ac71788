#ifndef STEN_IMAGEIO_HPP
#define STEN_IMAGEIO_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace cv {
class Mat;
}

namespace sten {

namespace fs = std::filesystem;

// Error types for picture loading and saving
enum class ImageIOError {
  FileNotFound,
  UnsupportedFormat,
  ReadError,
  WriteError,
  UnsupportedMode,
  TooSmall
};

/**
 * @brief Properties reported for an opened picture.
 */
struct PictureInfo {
  int width = 0;
  int height = 0;
  std::string mode;          ///< "RGB" or "RGBA"
  int bit_depth = 0;         ///< 8 bits per channel times channel count
  std::int64_t capacity = 0; ///< Characters at full depth on R, G and B
};

void to_json(nlohmann::json &j, const PictureInfo &info);

/**
 * @brief Checks whether a path has a supported picture extension.
 * @param path The path to check (.bmp or .png, any case).
 */
bool isPictureExtension(const fs::path &path) noexcept;

/**
 * @brief Loads a picture as an RGB or RGBA 8-bit image.
 * @param filename The path to the picture file.
 * @return The image with channels in R, G, B(, A) order, or an error.
 */
auto loadPicture(const fs::path &filename) noexcept
    -> std::expected<cv::Mat, ImageIOError>;

/**
 * @brief Saves an RGB or RGBA image to a picture file.
 * @param filename The path to the output file (.bmp or .png).
 * @param image The image to save, channels in R, G, B(, A) order.
 * @return Success or specific error.
 */
auto savePicture(const fs::path &filename, const cv::Mat &image) noexcept
    -> std::expected<void, ImageIOError>;

/**
 * @brief Collects the properties of an image.
 * @param image An RGB or RGBA image.
 */
PictureInfo describePicture(const cv::Mat &image);

// String representation for ImageIOError
std::string_view errorToString(ImageIOError error) noexcept;

} // namespace sten

#endif // STEN_IMAGEIO_HPP
