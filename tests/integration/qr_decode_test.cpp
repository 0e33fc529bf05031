#include <docscan/app/config.hpp>
#include <docscan/app/result_writer.hpp>
#include <docscan/app/scanner.hpp>
#include <docscan/core/qr_detection.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

namespace {

constexpr int kWidth = 640;
constexpr int kHeight = 480;

/// White RGBA page with a generated QR symbol at (x, y), 8 pixels per module.
std::vector<std::byte> page_with_qr(const std::string& payload, int x, int y) {
  cv::Mat modules;
  cv::QRCodeEncoder::create()->encode(payload, modules);
  cv::Mat bordered;
  cv::copyMakeBorder(modules, bordered, 4, 4, 4, 4, cv::BORDER_CONSTANT, cv::Scalar(255));
  cv::Mat symbol;
  cv::resize(bordered, symbol, cv::Size(), 8.0, 8.0, cv::INTER_NEAREST);

  cv::Mat page(kHeight, kWidth, CV_8UC1, cv::Scalar(255));
  symbol.copyTo(page(cv::Rect(x, y, symbol.cols, symbol.rows)));

  cv::Mat rgba;
  cv::cvtColor(page, rgba, cv::COLOR_GRAY2RGBA);
  std::vector<std::byte> buf(rgba.total() * rgba.elemSize());
  std::memcpy(buf.data(), rgba.data, buf.size());
  return buf;
}

}  // namespace

TEST(QrDecodeIntegration, FindsGeneratedSymbolInStandardPass) {
  const auto buf = page_with_qr("DOCSCAN-42", 40, 40);
  const auto out = docscan::app::decode_qr(buf, kWidth, kHeight);
  ASSERT_TRUE(out.has_value()) << docscan::core::describe(out.error());
  ASSERT_EQ(out->size(), 1u);

  const auto& d = (*out)[0];
  EXPECT_EQ(d.payload, "DOCSCAN-42");
  EXPECT_GE(d.version, 1);
  for (const auto& p : d.bounds) {
    EXPECT_GE(p.x, 0.f);
    EXPECT_LT(p.x, static_cast<float>(kWidth));
    EXPECT_GE(p.y, 0.f);
    EXPECT_LT(p.y, static_cast<float>(kHeight));
  }
}

TEST(QrDecodeIntegration, RepeatedDecodeIsDeterministic) {
  const auto buf = page_with_qr("repeat me", 200, 120);
  const auto first = docscan::app::decode_qr(buf, kWidth, kHeight);
  const auto second = docscan::app::decode_qr(buf, kWidth, kHeight);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(first->size(), second->size());
  for (std::size_t i = 0; i < first->size(); ++i) {
    EXPECT_EQ((*first)[i].payload, (*second)[i].payload);
    for (std::size_t c = 0; c < 4; ++c) {
      EXPECT_FLOAT_EQ((*first)[i].bounds[c].x, (*second)[i].bounds[c].x);
      EXPECT_FLOAT_EQ((*first)[i].bounds[c].y, (*second)[i].bounds[c].y);
    }
  }
}

TEST(QrDecodeIntegration, BlankPageHasNoCodes) {
  std::vector<std::byte> buf(static_cast<std::size_t>(kWidth) * kHeight * 4, std::byte{255});
  const auto out = docscan::app::decode_qr(buf, kWidth, kHeight);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->empty());
}

TEST(QrDecodeIntegration, ResultFormatsAsText) {
  const auto buf = page_with_qr("formatted", 40, 40);
  auto pipeline = docscan::app::build_qr_pipeline(docscan::app::default_config());
  docscan::core::Frame frame(kWidth, kHeight, docscan::core::PixelFormat::RGBA8,
                             std::vector<std::byte>(buf.begin(), buf.end()));
  auto result = pipeline.run(frame);
  ASSERT_TRUE(result.has_value());
  const std::string text = docscan::app::format_qr_results(*result);
  EXPECT_EQ(text.rfind("frame_id=0 codes=1 pass=standard\n", 0), 0u);
  EXPECT_NE(text.find("payload=\"formatted\""), std::string::npos);
}
