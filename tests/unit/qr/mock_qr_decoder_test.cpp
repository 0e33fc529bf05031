#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/qr/mock_qr_decoder.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace dc = docscan::core;
namespace dq = docscan::qr;

namespace {

dc::Frame gray(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  return dc::Frame(w, h, dc::PixelFormat::Grayscale8, std::move(buf));
}

}  // namespace

TEST(MockQrDecoder, FollowsScriptThenDefault) {
  dq::MockQrDecoder mock;
  mock.set_script({{{"first", 1, {}, true}}, {}});
  mock.set_default({{"fallback", 2, {}, true}, {"other", 3, {}, true}});

  EXPECT_EQ(mock.detect_grids(gray(4, 4)).size(), 1u);
  EXPECT_TRUE(mock.detect_grids(gray(4, 4)).empty());
  EXPECT_EQ(mock.detect_grids(gray(4, 4)).size(), 2u);
  EXPECT_EQ(mock.detect_calls(), 3u);
}

TEST(MockQrDecoder, DecodesCurrentGrids) {
  dq::MockQrDecoder mock;
  mock.set_default({{"ok", 4, {}, true}, {"broken", 1, {}, false}});
  const auto frame = gray(4, 4);
  auto grids = mock.detect_grids(frame);
  ASSERT_EQ(grids.size(), 2u);

  auto first = mock.decode(frame, grids[0]);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->payload, "ok");
  EXPECT_EQ(first->version, 4);

  auto second = mock.decode(frame, grids[1]);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().kind, dc::ErrorKind::DecodeFailed);
}

TEST(MockQrDecoder, RecordsImageSizes) {
  dq::MockQrDecoder mock;
  (void)mock.detect_grids(gray(3, 5));
  (void)mock.detect_grids(gray(7, 2));
  ASSERT_EQ(mock.seen_sizes().size(), 2u);
  EXPECT_EQ(mock.seen_sizes()[0], std::make_pair(3u, 5u));
  EXPECT_EQ(mock.seen_sizes()[1], std::make_pair(7u, 2u));
}
