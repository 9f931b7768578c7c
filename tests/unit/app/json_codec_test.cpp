#include <earscope/app/json_codec.hpp>
#include <earscope/core/analysis.hpp>
#include <earscope/core/error.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace na = earscope::app;
namespace nc = earscope::core;
using nlohmann::json;

TEST(ParseAnalysisRequest, AppliesDefaults) {
  auto req = na::parse_analysis_request(R"({"image": "QUJD"})");
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->image, "QUJD");
  EXPECT_FLOAT_EQ(req->params.conf_thres, 0.25f);
  EXPECT_FLOAT_EQ(req->params.iou_thres, 0.45f);
  EXPECT_TRUE(req->params.include_crop_coords);
  EXPECT_EQ(req->params.coordinate_type, nc::CoordinateType::Original);
}

TEST(ParseAnalysisRequest, ReadsAllFields) {
  auto req = na::parse_analysis_request(
      R"({"image": "QUJD", "conf_thres": 0.6, "iou_thres": 0.3,
          "include_crop_coords": false, "coordinate_type": "cropped"})");
  ASSERT_TRUE(req.has_value());
  EXPECT_FLOAT_EQ(req->params.conf_thres, 0.6f);
  EXPECT_FLOAT_EQ(req->params.iou_thres, 0.3f);
  EXPECT_FALSE(req->params.include_crop_coords);
  EXPECT_EQ(req->params.coordinate_type, nc::CoordinateType::Cropped);
}

TEST(ParseAnalysisRequest, ServiceDefaultsApplyToMissingKeys) {
  nc::AnalysisParams defaults;
  defaults.conf_thres = 0.4f;
  auto req = na::parse_analysis_request(R"({"image": "QUJD", "conf_thres": null})", defaults);
  ASSERT_TRUE(req.has_value());
  EXPECT_FLOAT_EQ(req->params.conf_thres, 0.4f);
}

TEST(ParseAnalysisRequest, RejectsBadBodies) {
  for (const char* body : {"", "not json", "[1, 2]", R"({"conf_thres": 0.5})",
                           R"({"image": 42})", R"({"image": ""})"}) {
    auto req = na::parse_analysis_request(body);
    ASSERT_FALSE(req.has_value()) << body;
    EXPECT_EQ(req.error().code, nc::PipelineError::InvalidParameter);
  }
}

TEST(ParseAnalysisRequest, RejectsBadParameters) {
  struct Case {
    const char* body;
    const char* field;
  };
  for (const Case& c : {Case{R"({"image": "QUJD", "conf_thres": 1.5})", "conf_thres"},
                        Case{R"({"image": "QUJD", "conf_thres": "0.5"})", "conf_thres"},
                        Case{R"({"image": "QUJD", "iou_thres": -0.1})", "iou_thres"},
                        Case{R"({"image": "QUJD", "include_crop_coords": "yes"})",
                             "include_crop_coords"},
                        Case{R"({"image": "QUJD", "coordinate_type": "pixels"})",
                             "coordinate_type"}}) {
    auto req = na::parse_analysis_request(c.body);
    ASSERT_FALSE(req.has_value()) << c.body;
    EXPECT_EQ(req.error().field, c.field);
  }
}

TEST(JsonCodec, DetectionWithMask) {
  nc::Detection d;
  d.bbox = {10.f, 20.f, 30.5f, 40.f};
  d.confidence = 0.85f;
  d.class_id = 4;
  d.class_name = "cerumen";
  nc::Mask m(3, 2);
  m.at(1, 0) = 1;
  m.at(2, 1) = 1;
  d.mask = m;

  const json j = na::to_json(d);
  EXPECT_EQ(j["bbox"], json::array({10.0, 20.0, 30.5, 40.0}));
  EXPECT_DOUBLE_EQ(j["confidence"].get<double>(), 0.85);
  EXPECT_EQ(j["class_id"], 4);
  EXPECT_EQ(j["class_name"], "cerumen");
  EXPECT_EQ(j["mask"], json::parse("[[0,1,0],[0,0,1]]"));
}

TEST(JsonCodec, DetectionWithoutMaskOmitsKey) {
  nc::Detection d;
  d.class_name = "normal";
  EXPECT_FALSE(na::to_json(d).contains("mask"));
}

TEST(JsonCodec, CropResultShapes) {
  nc::CropResult crop;
  crop.success = true;
  crop.center = nc::Point{540.f, 720.f};
  crop.radius = 450;
  crop.crop_box = {90, 270, 990, 1170};
  crop.original_shape = {1440, 1080};
  crop.cropped_shape = nc::Shape{900, 900};
  crop.threshold = 127.0;

  const json j = na::to_json(crop);
  EXPECT_EQ(j["success"], true);
  EXPECT_EQ(j["center"], json::array({540.0, 720.0}));
  EXPECT_EQ(j["radius"], 450);
  EXPECT_EQ(j["crop_box"], json::array({90, 270, 990, 1170}));
  EXPECT_EQ(j["original_shape"], json::array({1440, 1080}));
  EXPECT_EQ(j["cropped_shape"], json::array({900, 900}));
  EXPECT_DOUBLE_EQ(j["threshold"].get<double>(), 127.0);
}

TEST(JsonCodec, FailedCropHasNulls) {
  nc::CropResult crop;
  crop.original_shape = {480, 640};
  crop.crop_box = nc::CropBox::full(crop.original_shape);
  const json j = na::to_json(crop);
  EXPECT_EQ(j["success"], false);
  EXPECT_TRUE(j["center"].is_null());
  EXPECT_TRUE(j["radius"].is_null());
  EXPECT_TRUE(j["cropped_shape"].is_null());
  EXPECT_EQ(j["crop_box"], json::array({0, 0, 640, 480}));
}

TEST(JsonCodec, ResponseEchoesParameters) {
  nc::AnalysisResponse r;
  r.coordinate_type = nc::CoordinateType::Original;
  r.parameters.conf_thres = 0.45f;
  r.parameters.coordinate_type = nc::CoordinateType::Cropped;
  const json j = na::to_json(r);
  EXPECT_TRUE(j["detections"].is_array());
  EXPECT_TRUE(j["detections"].empty());
  EXPECT_EQ(j["coordinate_type"], "original");
  EXPECT_EQ(j["parameters"]["coordinate_type"], "cropped");
  EXPECT_EQ(j["parameters"]["conf_thres"].dump(), "0.45");
  EXPECT_EQ(j["parameters"]["include_crop_coords"], true);
  EXPECT_FALSE(j.contains("crop_info"));
}

TEST(JsonCodec, ErrorBody) {
  const json j = na::error_body("image is not valid base64", "InputError");
  EXPECT_EQ(j["error"], "image is not valid base64");
  EXPECT_EQ(j["type"], "InputError");
  EXPECT_EQ(j.size(), 2u);
}
