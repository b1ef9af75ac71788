#include "image/steganograph/LSB.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <algorithm>
#include <numeric>
#include <string>

using namespace sten;

namespace {
cv::Mat noiseImage(int rows, int cols, int type = CV_8UC3,
                   unsigned seed = 1234) {
  cv::Mat image(rows, cols, type);
  cv::RNG rng(seed);
  rng.fill(image, cv::RNG::UNIFORM, 0, 256);
  return image;
}
} // namespace

TEST(BitStreamBufferTest, PacksMostSignificantBitFirst) {
  BitStreamBuffer buffer("A", false); // 0x41
  const std::vector<bool> expected{false, true,  false, false,
                                   false, false, false, true};
  EXPECT_EQ(buffer.getBits(), expected);
}

TEST(BitStreamBufferTest, AppendsDelimiter) {
  BitStreamBuffer buffer("hello");
  EXPECT_EQ(buffer.size(), (5 + kDelimiter.size()) * kBitsPerByte);
}

TEST(PlanTest, MakePlanDropsZeroDepths) {
  const BandDepthPlan expected{{0, 2}, {2, 5}};
  EXPECT_EQ(makePlan({2, 0, 5}), expected);
  EXPECT_TRUE(makePlan({0, 0, 0}).empty());
  EXPECT_EQ(bitsPerPixel(makePlan({2, 0, 5})), 7);
}

TEST(PlanTest, ValidateRejectsBadPlans) {
  EXPECT_NO_THROW(validatePlan({{2, 1}, {0, 8}}, 3));
  EXPECT_NO_THROW(validatePlan({{3, 1}}, 4));
  EXPECT_THROW(validatePlan({}, 3), std::invalid_argument);
  EXPECT_THROW(validatePlan({{3, 1}}, 3), std::invalid_argument);
  EXPECT_THROW(validatePlan({{-1, 1}}, 3), std::invalid_argument);
  EXPECT_THROW(validatePlan({{0, 0}}, 3), std::invalid_argument);
  EXPECT_THROW(validatePlan({{0, 9}}, 3), std::invalid_argument);
  EXPECT_THROW(validatePlan({{1, 1}, {1, 2}}, 3), std::invalid_argument);
}

TEST(PlanTest, CapacityIgnoresEntryOrder) {
  EXPECT_EQ(capacity(100, makePlan({1, 1, 1})), 37 - 17);
  EXPECT_EQ(capacity(100, {{0, 2}, {1, 1}}), 20);
  EXPECT_EQ(capacity(100, {{1, 1}, {0, 2}}), 20);
  EXPECT_EQ(capacity(kMinimumPixels, makePlan({1})), 1);
  EXPECT_LT(capacity(10, makePlan({1})), 0);
}

TEST(PixelOrderTest, EmptySeedIsRowMajor) {
  std::vector<std::size_t> expected(50);
  std::iota(expected.begin(), expected.end(), std::size_t{0});
  EXPECT_EQ(pixelOrder(50, ""), expected);
}

TEST(PixelOrderTest, SeedGivesReproduciblePermutation) {
  const auto first = pixelOrder(1000, "correct horse");
  EXPECT_EQ(first, pixelOrder(1000, "correct horse"));
  EXPECT_NE(first, pixelOrder(1000, "battery staple"));

  auto sorted = first;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sorted, pixelOrder(1000, ""));
}

TEST(LSBTest, RoundTripsWithDefaultPlan) {
  const cv::Mat carrier = noiseImage(32, 32);
  const cv::Mat stego = embedLSB(carrier, "Hello, World!", makePlan({1, 1, 1}));

  auto message = extractLSB(stego, makePlan({1, 1, 1}));
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "Hello, World!");
}

TEST(LSBTest, RoundTripsWithSeedAndUnorderedPlan) {
  const cv::Mat carrier = noiseImage(40, 30);
  const BandDepthPlan plan{{2, 3}, {0, 1}, {1, 6}};
  const cv::Mat stego = embedLSB(carrier, "Meet at dawn.", plan, "s33d");

  auto message = extractLSB(stego, plan, "s33d");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "Meet at dawn.");
}

TEST(LSBTest, UsesAlphaChannelWhenPlanned) {
  const cv::Mat carrier = noiseImage(20, 20, CV_8UC4);
  const BandDepthPlan plan{{3, 2}};
  const cv::Mat stego = embedLSB(carrier, "alpha", plan);
  ASSERT_EQ(stego.channels(), 4);

  auto message = extractLSB(stego, plan);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "alpha");
}

TEST(LSBTest, EmptyMessageIsJustTheDelimiter) {
  const cv::Mat carrier = noiseImage(12, 12);
  const cv::Mat stego = embedLSB(carrier, "", makePlan({1}));
  auto message = extractLSB(stego, makePlan({1}));
  ASSERT_TRUE(message.has_value());
  EXPECT_TRUE(message->empty());
}

TEST(LSBTest, DoesNotModifyCarrier) {
  const cv::Mat carrier = noiseImage(16, 16);
  const cv::Mat copy = carrier.clone();
  embedLSB(carrier, "payload", makePlan({2, 2, 2}));
  EXPECT_EQ(cv::norm(carrier, copy, cv::NORM_INF), 0.0);
}

TEST(LSBTest, OnlyPlannedLowBitsChange) {
  const cv::Mat carrier = noiseImage(24, 24);
  const BandDepthPlan plan{{0, 3}, {2, 1}};
  const cv::Mat stego = embedLSB(carrier, "only the low bits", plan, "k");

  const uchar allowed[3] = {0x07, 0x00, 0x01};
  for (int y = 0; y < carrier.rows; ++y) {
    for (int x = 0; x < carrier.cols; ++x) {
      const auto &a = carrier.at<cv::Vec3b>(y, x);
      const auto &b = stego.at<cv::Vec3b>(y, x);
      for (int c = 0; c < 3; ++c) {
        EXPECT_EQ((a[c] ^ b[c]) & ~allowed[c], 0) << y << "," << x << "," << c;
      }
    }
  }
}

TEST(LSBTest, PartialChunkFillsTopOfWindow) {
  // (2 + 17) * 8 = 152 bits at 3 bits per pixel: 50 full pixels and 2 bits
  const cv::Mat carrier = noiseImage(1, 64);
  const BandDepthPlan plan{{0, 3}};
  const cv::Mat stego = embedLSB(carrier, "ab", plan);

  const auto before = carrier.at<cv::Vec3b>(0, 50)[0];
  const auto after = stego.at<cv::Vec3b>(0, 50)[0];
  EXPECT_EQ(before & 0x01, after & 0x01);
  EXPECT_EQ(before & 0xF8, after & 0xF8);

  for (int x = 51; x < carrier.cols; ++x) {
    EXPECT_EQ(carrier.at<cv::Vec3b>(0, x), stego.at<cv::Vec3b>(0, x));
  }

  auto message = extractLSB(stego, plan);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "ab");
}

TEST(LSBTest, StopsAtDelimiterIgnoringTrailingPixels) {
  const cv::Mat carrier = noiseImage(1, 200);
  cv::Mat stego = embedLSB(carrier, "xy", makePlan({1, 1, 1}));

  // (2 + 17) * 8 = 152 bits, 51 pixels at 3 bits per pixel
  cv::Mat tail = stego.colRange(60, 200);
  cv::RNG rng(99);
  rng.fill(tail, cv::RNG::UNIFORM, 0, 256);

  auto message = extractLSB(stego, makePlan({1, 1, 1}));
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "xy");
}

TEST(LSBTest, RejectsMessageOverCapacity) {
  const cv::Mat carrier = noiseImage(12, 12); // 144 pixels
  EXPECT_NO_THROW(embedLSB(carrier, "a", makePlan({1})));
  EXPECT_THROW(embedLSB(carrier, "ab", makePlan({1})), CapacityExceededError);
}

TEST(LSBTest, RejectsUnsupportedImages) {
  const cv::Mat gray(20, 20, CV_8UC1, cv::Scalar(0));
  EXPECT_THROW(embedLSB(gray, "x", makePlan({1})), std::invalid_argument);
  const cv::Mat deep(20, 20, CV_16UC3, cv::Scalar(0, 0, 0));
  EXPECT_THROW(extractLSB(deep, makePlan({1})), std::invalid_argument);
}

TEST(LSBTest, ReportsNotFoundWithoutDelimiter) {
  const cv::Mat blank(32, 32, CV_8UC3, cv::Scalar(0, 0, 0));
  auto message = extractLSB(blank, makePlan({1, 1, 1}));
  ASSERT_FALSE(message.has_value());
  EXPECT_EQ(message.error().code, StegoError::Code::NotFound);
}

TEST(LSBTest, WrongSeedDoesNotRecoverMessage) {
  const cv::Mat carrier = noiseImage(32, 32);
  const cv::Mat stego = embedLSB(carrier, "secret", makePlan({1, 1, 1}), "a");
  auto message = extractLSB(stego, makePlan({1, 1, 1}), "b");
  EXPECT_FALSE(message.has_value() && *message == "secret");
}

TEST(BruteForceTest, EnumeratesEveryNonEmptyPlanInCounterOrder) {
  const auto &plans = bruteForcePlans();
  ASSERT_EQ(plans.size(), 728u);
  EXPECT_EQ(plans.front(), (BandDepthPlan{{2, 1}}));
  EXPECT_EQ(plans[7], (BandDepthPlan{{2, 8}}));
  EXPECT_EQ(plans[8], (BandDepthPlan{{1, 1}}));
  EXPECT_EQ(plans.back(), (BandDepthPlan{{0, 8}, {1, 8}, {2, 8}}));
}

TEST(BruteForceTest, RecoversMessageWithoutKnowingThePlan) {
  const cv::Mat carrier = noiseImage(48, 48);
  const BandDepthPlan plan = makePlan({3, 0, 5});
  const cv::Mat stego = embedLSB(carrier, "found me", plan, "seed");

  auto message = extractLSBBruteForce(stego, "seed");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "found me");
}

TEST(BruteForceTest, ParallelAndSequentialAgree) {
  const cv::Mat carrier = noiseImage(48, 48);
  const cv::Mat stego = embedLSB(carrier, "same answer", makePlan({2, 2, 2}));

  auto parallel = extractLSBBruteForce(stego, "", true);
  auto sequential = extractLSBBruteForce(stego, "", false);
  ASSERT_TRUE(parallel.has_value());
  ASSERT_TRUE(sequential.has_value());
  EXPECT_EQ(*parallel, *sequential);
  EXPECT_EQ(*parallel, "same answer");
}

TEST(BruteForceTest, LowestIndexPlanWinsWhenSeveralSucceed) {
  // Blue at depth 1 is candidate 0, red at depth 1 is candidate 81
  const cv::Mat carrier = noiseImage(48, 48);
  cv::Mat stego = embedLSB(carrier, "first", BandDepthPlan{{2, 1}});
  stego = embedLSB(stego, "second", BandDepthPlan{{0, 1}});

  ASSERT_EQ(extractLSB(stego, BandDepthPlan{{0, 1}}).value_or(""), "second");

  for (bool parallel : {true, false}) {
    auto message = extractLSBBruteForce(stego, "", parallel);
    ASSERT_TRUE(message.has_value()) << "parallel " << parallel;
    EXPECT_EQ(*message, "first") << "parallel " << parallel;
  }
}

TEST(BruteForceTest, ReportsNotFoundOnBlankImage) {
  const cv::Mat blank(16, 16, CV_8UC3, cv::Scalar(0, 0, 0));
  auto message = extractLSBBruteForce(blank);
  ASSERT_FALSE(message.has_value());
  EXPECT_EQ(message.error().code, StegoError::Code::NotFound);
}

TEST(BitPlaneTest, ExtractsSingleBit) {
  cv::Mat image(2, 2, CV_8UC3, cv::Scalar(0b101, 0, 0));
  const cv::Mat low = getBitPlane(image, 0, 0);
  const cv::Mat mid = getBitPlane(image, 0, 1);
  EXPECT_EQ(low.type(), CV_8UC1);
  EXPECT_EQ(cv::countNonZero(low), 4);
  EXPECT_EQ(cv::countNonZero(mid), 0);
  EXPECT_EQ(low.at<uchar>(0, 0), 255);
  EXPECT_THROW(getBitPlane(image, 3, 0), std::invalid_argument);
  EXPECT_THROW(getBitPlane(image, 0, 8), std::invalid_argument);
}
