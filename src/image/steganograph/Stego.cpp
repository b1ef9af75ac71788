#include "Stego.hpp"
#include "../../crypto/Alphabet.hpp"
#include "../../crypto/Cipher.hpp"
#include "../../utils/Logger.hpp"

#include <fmt/format.h>
#include <opencv2/core.hpp>

using namespace cv;
using namespace std;

namespace sten {

namespace {
shared_ptr<spdlog::logger> stegoLogger() { return moduleLogger("Stego"); }

bool needsKey(const StegoConfig &config) {
  return !Cipher::canonicalName(config.cipher).empty() && config.key.empty();
}

unexpected<StegoError> missingKey(const StegoConfig &config) {
  return unexpected(StegoError{
      StegoError::Code::MissingKey,
      fmt::format("The {} cipher needs a key.",
                  Cipher::canonicalName(config.cipher))});
}

string describeChar(char c) {
  return fmt::format("0x{:02x}", static_cast<unsigned char>(c));
}

void warnConspicuous(const BandDepthPlan &plan) {
  for (const auto &[channel, depth] : plan) {
    if (isConspicuousDepth(depth)) {
      stegoLogger()->warn("Channel {} uses {} low bits; changes may be visible",
                          channel, depth);
    }
  }
}
} // namespace

expected<Mat, StegoError> embed_message(const Mat &carrier,
                                        const string &message,
                                        const StegoConfig &config) {
  // 输入验证
  if (carrier.empty()) {
    throw invalid_argument("Empty carrier image");
  }
  if (needsKey(config)) {
    return missingKey(config);
  }
  if (message.empty()) {
    return unexpected(
        StegoError{StegoError::Code::EmptyMessage, "Message is empty."});
  }
  if (auto bad = firstNonPrintable(message)) {
    return unexpected(StegoError{
        StegoError::Code::NonPrintableMessage,
        fmt::format("Message contains a non-ASCII character: {}",
                    describeChar(*bad))});
  }

  validatePlan(config.plan, carrier.channels());
  warnConspicuous(config.plan);

  Cipher cipher = Cipher::create(config.cipher, config.key, message);
  string payload = cipher.encrypt();

  const int64_t limit = capacity(carrier.total(), config.plan);
  if (static_cast<int64_t>(payload.size()) > limit) {
    if (!config.truncate || limit <= 0) {
      return unexpected(StegoError{
          StegoError::Code::CapacityExceeded,
          fmt::format("Cipher text length {} exceeds the character limit {}.",
                      payload.size(), max<int64_t>(limit, 0))});
    }

    // 截断明文后重新加密，分组密码可能需要多截几位
    string plain = message.substr(0, static_cast<size_t>(limit));
    cipher.setText(plain);
    payload = cipher.encrypt();
    while (static_cast<int64_t>(payload.size()) > limit && !plain.empty()) {
      plain.pop_back();
      cipher.setText(plain);
      payload = cipher.encrypt();
    }
    if (plain.empty()) {
      return unexpected(StegoError{StegoError::Code::CapacityExceeded,
                                   "Nothing fits in the selected channels."});
    }
    stegoLogger()->warn("Message truncated from {} to {} characters",
                        message.size(), plain.size());
  }

  if (payload.find(kDelimiter) != string::npos) {
    if (!config.allow_delimiter_loss) {
      return unexpected(StegoError{
          StegoError::Code::DelimiterInMessage,
          "Some data will be lost! Message will contain the delimiter."});
    }
    stegoLogger()->warn("Payload contains the delimiter; data after it is "
                        "lost on extraction");
  }

  stegoLogger()->info("Embedding {} characters ({} cipher) into {}x{} image",
                      payload.size(),
                      cipher.name().empty() ? "no" : cipher.name(),
                      carrier.cols, carrier.rows);

  return embedLSB(carrier, payload, config.plan, config.seed);
}

expected<string, StegoError> extract_message(const Mat &stego,
                                             const StegoConfig &config) {
  if (stego.empty()) {
    throw invalid_argument("Empty stego image");
  }
  if (needsKey(config)) {
    return missingKey(config);
  }

  Cipher cipher = Cipher::create(config.cipher, config.key);

  auto payload = config.brute
                     ? extractLSBBruteForce(stego, config.seed, config.parallel)
                     : extractLSB(stego, config.plan, config.seed);
  if (!payload) {
    return unexpected(payload.error());
  }

  if (auto bad = firstNonPrintable(*payload)) {
    return unexpected(StegoError{
        StegoError::Code::NonPrintableMessage,
        fmt::format("Message contains a non-ASCII character ({}). Are you "
                    "sure this message was created using sten?",
                    describeChar(*bad))});
  }

  cipher.setText(std::move(*payload));
  stegoLogger()->info("Recovered {} characters", cipher.text().size());
  return cipher.decrypt();
}

double evaluate_image_quality(const Mat &original, const Mat &stego) {
  if (original.size() != stego.size() || original.type() != stego.type()) {
    throw invalid_argument("Images must have same size and type");
  }

  // 计算PSNR
  return PSNR(original, stego);
}

} // namespace sten
