#include "Commands.hpp"
#include "../crypto/Cipher.hpp"
#include "../image/ImageIO.hpp"
#include "../image/steganograph/LSB.hpp"
#include "../image/steganograph/Stego.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Settings.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <filesystem>
#include <fmt/format.h>
#include <opencv2/imgcodecs.hpp>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sten::cli {

namespace {
namespace fs = std::filesystem;

const char *const kChannelNames[] = {"red", "green", "blue", "alpha"};

std::string toStd(const QString &value) { return value.toStdString(); }

struct Options {
  QCommandLineOption output{{"o", "output"}, "Output picture.", "file"};
  QCommandLineOption message{{"m", "message"}, "Message to hide.", "text"};
  QCommandLineOption messageFile{{"f", "message-file"},
                                 "Read the message from a file.", "file"};
  QCommandLineOption cipher{{"c", "cipher"}, "Cipher name (see 'ciphers').",
                            "name", ""};
  QCommandLineOption key{{"k", "key"}, "Cipher key.", "key"};
  QCommandLineOption seed{{"s", "seed"}, "Pixel order seed.", "seed"};
  QCommandLineOption red{"red", "Low bits used in the red channel.", "0-8",
                         "1"};
  QCommandLineOption green{"green", "Low bits used in the green channel.",
                           "0-8", "1"};
  QCommandLineOption blue{"blue", "Low bits used in the blue channel.", "0-8",
                          "1"};
  QCommandLineOption alpha{"alpha", "Low bits used in the alpha channel.",
                           "0-8", "0"};
  QCommandLineOption brute{"brute", "Decode by trying every channel/depth."};
  QCommandLineOption truncate{"truncate",
                              "Cut the message to the picture capacity."};
  QCommandLineOption force{
      "force", "Overwrite the output and accept delimiter loss."};
  QCommandLineOption json{"json", "Print picture properties as JSON."};
  QCommandLineOption planes{"planes", "Write every bit plane into a folder.",
                            "dir"};
  QCommandLineOption config{"config", "Settings file.", "file"};
  QCommandLineOption logLevel{"log-level", "trace|debug|info|warn|error|off",
                              "level"};
  QCommandLineOption help{{"h", "help"}, "Displays help."};
  QCommandLineOption version{{"v", "version"}, "Displays version."};
};

// State shared by every command of one invocation
struct Context {
  Context(std::ostream &out, std::ostream &err) : out(out), err(err) {}

  QCommandLineParser parser;
  Options options;
  Settings settings;
  std::ostream &out;
  std::ostream &err;

  int fail(std::string_view message) const {
    err << "sten: " << message << std::endl;
    return Failure;
  }

  int usage(std::string_view message) const {
    err << "sten: " << message << "\n\n" << toStd(parser.helpText());
    return UsageError;
  }
};

BandDepthPlan planFrom(const Context &ctx) {
  const auto &options = ctx.options;
  std::vector<int> depths;
  for (const auto *option :
       {&options.red, &options.green, &options.blue, &options.alpha}) {
    bool ok = false;
    const int depth = ctx.parser.value(*option).toInt(&ok);
    if (!ok || depth < 0 || depth > kBitsPerByte) {
      throw std::invalid_argument(
          fmt::format("--{} must be an integer in 0-8",
                      toStd(option->names().constLast())));
    }
    depths.push_back(depth);
  }

  auto plan = makePlan(depths);
  if (plan.empty()) {
    throw std::invalid_argument("Select at least one channel");
  }
  return plan;
}

StegoConfig configFrom(const Context &ctx) {
  const auto &parser = ctx.parser;
  const auto &options = ctx.options;

  StegoConfig config;
  config.cipher = toStd(parser.value(options.cipher));
  config.key = toStd(parser.value(options.key));
  config.seed = toStd(parser.value(options.seed));
  config.plan = planFrom(ctx);
  config.brute = parser.isSet(options.brute) || ctx.settings.brute;
  config.parallel = ctx.settings.parallel_brute_force;
  config.allow_delimiter_loss = parser.isSet(options.force);
  config.truncate = parser.isSet(options.truncate);

  if (!Cipher::acceptsKey(config.cipher, config.key)) {
    throw std::invalid_argument(
        config.cipher.empty()
            ? std::string("A key needs a cipher (see 'ciphers')")
            : fmt::format("The key is not valid for the {} cipher",
                          config.cipher));
  }
  return config;
}

std::string readMessage(const Context &ctx) {
  if (ctx.parser.isSet(ctx.options.messageFile)) {
    QFile file(ctx.parser.value(ctx.options.messageFile));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
      throw std::runtime_error(
          fmt::format("Cannot open message file {}", toStd(file.fileName())));
    }
    return file.readAll().toStdString();
  }
  return toStd(ctx.parser.value(ctx.options.message));
}

int runEncode(const Context &ctx, const fs::path &input) {
  auto logger = moduleLogger("sten");

  if (!ctx.parser.isSet(ctx.options.output)) {
    return ctx.usage("encode needs --output");
  }
  const fs::path output = toStd(ctx.parser.value(ctx.options.output));
  if (!isPictureExtension(output)) {
    return ctx.fail(fmt::format("Not a valid extension: {}",
                                output.extension().string()));
  }
  if (fs::exists(output) && ctx.settings.confirm_overwrite &&
      !ctx.parser.isSet(ctx.options.force)) {
    return ctx.fail(fmt::format("{} exists, use --force to overwrite",
                                output.string()));
  }

  const auto config = configFrom(ctx);
  const std::string message = readMessage(ctx);

  auto carrier = loadPicture(input);
  if (!carrier) {
    return ctx.fail(errorToString(carrier.error()));
  }

  logger->info("Encoding with key '{}' and seed '{}'",
               ctx.settings.maskKey(config.key),
               ctx.settings.maskSeed(config.seed));

  auto stego = embed_message(*carrier, message, config);
  if (!stego) {
    return ctx.fail(stego.error().message);
  }

  if (auto saved = savePicture(output, *stego); !saved) {
    return ctx.fail(errorToString(saved.error()));
  }

  ctx.out << "File is encoded! " << output.string() << '\n'
          << fmt::format("PSNR: {:.2f} dB",
                         evaluate_image_quality(*carrier, *stego))
          << std::endl;
  return Success;
}

int runDecode(const Context &ctx, const fs::path &input) {
  const auto config = configFrom(ctx);

  auto stego = loadPicture(input);
  if (!stego) {
    return ctx.fail(errorToString(stego.error()));
  }

  moduleLogger("sten")->info("Decoding with key '{}' and seed '{}'{}",
                             ctx.settings.maskKey(config.key),
                             ctx.settings.maskSeed(config.seed),
                             config.brute ? " (brute force)" : "");

  auto message = extract_message(*stego, config);
  if (!message) {
    return ctx.fail(message.error().message);
  }

  ctx.out << *message << std::endl;
  return Success;
}

int runInfo(const Context &ctx, const fs::path &input) {
  auto picture = loadPicture(input);
  if (!picture) {
    return ctx.fail(errorToString(picture.error()));
  }

  const auto info = describePicture(*picture);
  if (ctx.parser.isSet(ctx.options.json)) {
    ctx.out << nlohmann::json(info).dump(2) << std::endl;
  } else {
    ctx.out << fmt::format("Capacity: {} characters\n"
                           "Width: {} pixels\n"
                           "Height: {} pixels\n"
                           "Bit depth: {} ({})",
                           info.capacity, info.width, info.height,
                           info.bit_depth, info.mode)
            << std::endl;
  }

  if (ctx.parser.isSet(ctx.options.planes)) {
    const fs::path folder = toStd(ctx.parser.value(ctx.options.planes));
    fs::create_directories(folder);
    for (int channel = 0; channel < picture->channels(); ++channel) {
      for (int bit = 0; bit < kBitsPerByte; ++bit) {
        const auto file =
            folder / fmt::format("{}_bit{}.png", kChannelNames[channel], bit);
        if (!cv::imwrite(file.string(), getBitPlane(*picture, channel, bit))) {
          return ctx.fail(fmt::format("Cannot write {}", file.string()));
        }
      }
    }
  }
  return Success;
}

int runCiphers(const Context &ctx) {
  for (const auto name : Cipher::names()) {
    const char *hint = "no key";
    if (name == Caesar::name) {
      hint = "integer shift";
    } else if (name == Scytale::name) {
      hint = "positive column count";
    } else if (!name.empty()) {
      hint = "text key";
    }
    ctx.out << fmt::format("{:<10} {}", name.empty() ? "\"\"" : name, hint)
            << std::endl;
  }
  return Success;
}

fs::path settingsPath(const Context &ctx) {
  if (ctx.parser.isSet(ctx.options.config)) {
    return toStd(ctx.parser.value(ctx.options.config));
  }
  // 默认配置文件位于可执行文件旁
  if (QCoreApplication::instance() != nullptr) {
    return toStd(
        QDir(QCoreApplication::applicationDirPath()).filePath("sten.json"));
  }
  return "sten.json";
}
} // namespace

int run(const QStringList &arguments, std::ostream &out, std::ostream &err) {
  Context ctx(out, err);
  auto &parser = ctx.parser;
  const auto &options = ctx.options;

  parser.setApplicationDescription(
      "Hide a text message in the low bits of a picture.");
  parser.addPositionalArgument("command", "encode | decode | info | ciphers");
  parser.addPositionalArgument("picture", "Input picture (.bmp or .png).");
  parser.addOptions({options.output, options.message, options.messageFile,
                     options.cipher, options.key, options.seed, options.red,
                     options.green, options.blue, options.alpha,
                     options.brute, options.truncate, options.force,
                     options.json, options.planes, options.config,
                     options.logLevel, options.help, options.version});

  if (!parser.parse(arguments)) {
    return ctx.usage(toStd(parser.errorText()));
  }
  if (parser.isSet(options.help)) {
    out << toStd(parser.helpText());
    return Success;
  }
  if (parser.isSet(options.version)) {
    out << "sten " << toStd(QCoreApplication::applicationVersion())
        << std::endl;
    return Success;
  }

  ctx.settings = Settings::load(settingsPath(ctx));
  if (parser.isSet(options.logLevel)) {
    ctx.settings.log_level = toStd(parser.value(options.logLevel));
  }
  initLogging(ctx.settings.logConfig());

  auto logger = moduleLogger("sten");
  logger->info("Application started");

  const QStringList args = parser.positionalArguments();
  if (args.isEmpty()) {
    return ctx.usage("missing command");
  }

  const std::string command = toStd(args.at(0));
  if (command == "ciphers") {
    return runCiphers(ctx);
  }
  if (command != "encode" && command != "decode" && command != "info") {
    return ctx.usage(fmt::format("unknown command '{}'", command));
  }
  if (args.size() < 2) {
    return ctx.usage(fmt::format("{} needs a picture", command));
  }
  const fs::path input = toStd(args.at(1));

  try {
    if (command == "encode") {
      return runEncode(ctx, input);
    }
    if (command == "decode") {
      return runDecode(ctx, input);
    }
    return runInfo(ctx, input);
  } catch (const CipherError &e) {
    logger->error("Cipher error: {}", e.what());
    return ctx.fail(e.what());
  } catch (const std::invalid_argument &e) {
    logger->error("Invalid argument: {}", e.what());
    return ctx.usage(e.what());
  } catch (const std::exception &e) {
    logger->critical("Unhandled exception: {}", e.what());
    return ctx.fail(e.what());
  }
}

} // namespace sten::cli
