#include <earscope/core/geometry.hpp>
#include <gtest/gtest.h>

namespace nc = earscope::core;

TEST(Geometry, ToOriginalAddsOffset) {
  const nc::CropBox crop{90, 270, 990, 1170};
  const nc::BBox b = nc::to_original(nc::BBox{10.f, 20.f, 110.f, 220.f}, crop);
  EXPECT_FLOAT_EQ(b.x1, 100.f);
  EXPECT_FLOAT_EQ(b.y1, 290.f);
  EXPECT_FLOAT_EQ(b.x2, 200.f);
  EXPECT_FLOAT_EQ(b.y2, 490.f);
}

TEST(Geometry, FullExtentIsIdentity) {
  const nc::Shape shape{480, 640};
  const nc::CropBox full = nc::CropBox::full(shape);
  EXPECT_TRUE(nc::is_full_extent(full, shape));
  const nc::Point p{123.5f, 45.25f};
  const nc::Point o = nc::to_original(p, full);
  EXPECT_FLOAT_EQ(o.x, p.x);
  EXPECT_FLOAT_EQ(o.y, p.y);
  const nc::Point c = nc::to_cropped(p, full);
  EXPECT_FLOAT_EQ(c.x, p.x);
  EXPECT_FLOAT_EQ(c.y, p.y);
}

TEST(Geometry, ToCroppedClampsOutsidePoints) {
  const nc::CropBox crop{100, 50, 300, 250};
  const nc::Point before = nc::to_cropped(nc::Point{20.f, 10.f}, crop);
  EXPECT_FLOAT_EQ(before.x, 0.f);
  EXPECT_FLOAT_EQ(before.y, 0.f);
  const nc::Point after = nc::to_cropped(nc::Point{500.f, 400.f}, crop);
  EXPECT_FLOAT_EQ(after.x, 200.f);
  EXPECT_FLOAT_EQ(after.y, 200.f);
}

TEST(Geometry, RoundTripInsideCrop) {
  const nc::CropBox crop{90, 270, 990, 1170};
  for (const nc::Point p : {nc::Point{90.f, 270.f}, nc::Point{500.5f, 700.25f},
                            nc::Point{990.f, 1170.f}, nc::Point{90.f, 1170.f}}) {
    const nc::Point back = nc::to_original(nc::to_cropped(p, crop), crop);
    EXPECT_FLOAT_EQ(back.x, p.x);
    EXPECT_FLOAT_EQ(back.y, p.y);
  }
}

TEST(Geometry, ClipBox) {
  const nc::BBox b = nc::clip_box(nc::BBox{-5.f, 10.f, 700.f, 500.f}, 640.f, 480.f);
  EXPECT_FLOAT_EQ(b.x1, 0.f);
  EXPECT_FLOAT_EQ(b.y1, 10.f);
  EXPECT_FLOAT_EQ(b.x2, 640.f);
  EXPECT_FLOAT_EQ(b.y2, 480.f);
}

TEST(Geometry, ClipCropBoxStaysInside) {
  const nc::CropBox c = nc::clip_crop_box(nc::CropBox{-20, 100, 700, 900}, nc::Shape{480, 640});
  EXPECT_EQ(c.x1, 0);
  EXPECT_EQ(c.y1, 100);
  EXPECT_EQ(c.x2, 640);
  EXPECT_EQ(c.y2, 480);
}

TEST(Geometry, BoxIou) {
  const nc::BBox a{0.f, 0.f, 10.f, 10.f};
  EXPECT_FLOAT_EQ(nc::box_iou(a, a), 1.f);
  EXPECT_FLOAT_EQ(nc::box_iou(a, nc::BBox{5.f, 0.f, 15.f, 10.f}), 50.f / 150.f);
  EXPECT_FLOAT_EQ(nc::box_iou(a, nc::BBox{20.f, 20.f, 30.f, 30.f}), 0.f);
  const nc::BBox degenerate{3.f, 3.f, 3.f, 3.f};
  EXPECT_FLOAT_EQ(nc::box_iou(degenerate, degenerate), 0.f);
}

TEST(Geometry, PlaceMaskAtOffset) {
  nc::Mask cropped(4, 3);
  cropped.at(0, 0) = 1;
  cropped.at(3, 2) = 1;
  const nc::Mask placed = nc::place_mask(cropped, nc::CropBox{5, 2, 9, 5}, nc::Shape{8, 12});
  ASSERT_EQ(placed.width, 12u);
  ASSERT_EQ(placed.height, 8u);
  EXPECT_EQ(placed.at(5, 2), 1);
  EXPECT_EQ(placed.at(8, 4), 1);

  int ones = 0;
  for (std::uint32_t y = 0; y < placed.height; ++y) {
    for (std::uint32_t x = 0; x < placed.width; ++x) {
      if (placed.at(x, y)) {
        ++ones;
        // Every set pixel lies inside the crop box.
        EXPECT_GE(x, 5u);
        EXPECT_LT(x, 9u);
        EXPECT_GE(y, 2u);
        EXPECT_LT(y, 5u);
      }
    }
  }
  EXPECT_EQ(ones, 2);
}

TEST(Geometry, PlaceMaskDropsPixelsOutsideImage) {
  nc::Mask cropped(4, 4);
  for (auto& v : cropped.data) v = 1;
  const nc::Mask placed = nc::place_mask(cropped, nc::CropBox{-2, 6, 2, 10}, nc::Shape{8, 8});
  int ones = 0;
  for (auto v : placed.data) ones += v;
  // Columns 0..1 and rows 6..7 remain.
  EXPECT_EQ(ones, 4);
  EXPECT_EQ(placed.at(0, 6), 1);
  EXPECT_EQ(placed.at(1, 7), 1);
}

TEST(Geometry, PlaceEmptyMaskGivesZeroGrid) {
  const nc::Mask placed = nc::place_mask(nc::Mask{}, nc::CropBox{0, 0, 4, 4}, nc::Shape{4, 4});
  EXPECT_EQ(placed.data.size(), 16u);
  for (auto v : placed.data) EXPECT_EQ(v, 0);
}
