#include "ImageIO.hpp"
#include "steganograph/LSB.hpp"
#include "../utils/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/core.hpp>
#include <string>

namespace sten {

namespace {
std::shared_ptr<spdlog::logger> imageIOLogger() {
  return moduleLogger("ImageIO");
}

std::string lowerExtension(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

// OpenCV 使用 BGR(A) 顺序，对外统一为 RGB(A)
cv::Mat swapRedBlue(const cv::Mat &image) {
  cv::Mat swapped;
  cv::cvtColor(image, swapped,
               image.channels() == 4 ? cv::COLOR_BGRA2RGBA : cv::COLOR_BGR2RGB);
  return swapped;
}
} // namespace

std::string_view errorToString(ImageIOError error) noexcept {
  switch (error) {
  case ImageIOError::FileNotFound:
    return "File not found";
  case ImageIOError::UnsupportedFormat:
    return "Not a valid extension (valid: .bmp|.png)";
  case ImageIOError::ReadError:
    return "Read error";
  case ImageIOError::WriteError:
    return "Write error";
  case ImageIOError::UnsupportedMode:
    return "Mode not supported (supported: RGB|RGBA)";
  case ImageIOError::TooSmall:
    return "Picture has too few pixels";
  default:
    return "Unknown error";
  }
}

void to_json(nlohmann::json &j, const PictureInfo &info) {
  j = nlohmann::json{{"width", info.width},
                     {"height", info.height},
                     {"mode", info.mode},
                     {"bitDepth", info.bit_depth},
                     {"capacity", info.capacity}};
}

bool isPictureExtension(const fs::path &path) noexcept {
  try {
    const std::string ext = lowerExtension(path);
    return ext == ".bmp" || ext == ".png";
  } catch (const std::exception &) {
    return false;
  }
}

auto loadPicture(const fs::path &filename) noexcept
    -> std::expected<cv::Mat, ImageIOError> {
  auto logger = imageIOLogger();
  try {
    if (!isPictureExtension(filename)) {
      logger->error("Not a valid extension: {}", filename.string());
      return std::unexpected(ImageIOError::UnsupportedFormat);
    }
    if (!fs::exists(filename)) {
      logger->error("File not found: {}", filename.string());
      return std::unexpected(ImageIOError::FileNotFound);
    }

    cv::Mat image = cv::imread(filename.string(), cv::IMREAD_UNCHANGED);
    if (image.empty()) {
      logger->error("Cannot decode picture: {}", filename.string());
      return std::unexpected(ImageIOError::ReadError);
    }

    if (image.depth() != CV_8U ||
        (image.channels() != 3 && image.channels() != 4)) {
      logger->error("Mode not supported: {} channels, depth {}",
                    image.channels(), image.depth());
      return std::unexpected(ImageIOError::UnsupportedMode);
    }

    if (image.total() < kMinimumPixels) {
      logger->error("Need minimum {} pixels, provided: {}", kMinimumPixels,
                    image.total());
      return std::unexpected(ImageIOError::TooSmall);
    }

    logger->info("Loaded {} ({}x{}, {} channels)", filename.string(),
                 image.cols, image.rows, image.channels());
    return swapRedBlue(image);
  } catch (const cv::Exception &e) {
    logger->error("OpenCV error while reading {}: {}", filename.string(),
                  e.what());
    return std::unexpected(ImageIOError::ReadError);
  } catch (const std::exception &e) {
    logger->error("Error while reading {}: {}", filename.string(), e.what());
    return std::unexpected(ImageIOError::ReadError);
  }
}

auto savePicture(const fs::path &filename, const cv::Mat &image) noexcept
    -> std::expected<void, ImageIOError> {
  auto logger = imageIOLogger();
  try {
    if (!isPictureExtension(filename)) {
      logger->error("Not a valid extension: {}", filename.string());
      return std::unexpected(ImageIOError::UnsupportedFormat);
    }
    if (image.empty() || image.depth() != CV_8U ||
        (image.channels() != 3 && image.channels() != 4)) {
      logger->error("Cannot save image with {} channels", image.channels());
      return std::unexpected(ImageIOError::UnsupportedMode);
    }

    if (!cv::imwrite(filename.string(), swapRedBlue(image))) {
      logger->error("Failed to write {}", filename.string());
      return std::unexpected(ImageIOError::WriteError);
    }

    logger->info("Saved {}", filename.string());
    return {};
  } catch (const cv::Exception &e) {
    logger->error("OpenCV error while writing {}: {}", filename.string(),
                  e.what());
    return std::unexpected(ImageIOError::WriteError);
  } catch (const std::exception &e) {
    logger->error("Error while writing {}: {}", filename.string(), e.what());
    return std::unexpected(ImageIOError::WriteError);
  }
}

PictureInfo describePicture(const cv::Mat &image) {
  PictureInfo info;
  info.width = image.cols;
  info.height = image.rows;
  info.mode = image.channels() == 4 ? "RGBA" : "RGB";
  info.bit_depth = kBitsPerByte * image.channels();
  info.capacity =
      capacity(image.total(), makePlan({kBitsPerByte, kBitsPerByte,
                                        kBitsPerByte}));
  return info;
}

} // namespace sten
