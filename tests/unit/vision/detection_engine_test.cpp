#include <earscope/core/detection.hpp>
#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/vision/detection_decoder.hpp>
#include <earscope/vision/detection_engine.hpp>
#include <earscope/vision/inference_backend.hpp>
#include <earscope/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace nv = earscope::vision;
namespace nc = earscope::core;

namespace {

nc::Frame make_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  return nc::Frame(w, h, nc::PixelFormat::BGR8, std::move(buf));
}

nc::Detection make_candidate(nc::BBox box, float score, std::int32_t class_id) {
  nc::Detection d;
  d.bbox = box;
  d.confidence = score;
  d.class_id = class_id;
  return d;
}

// Non-reentrant backend that records how many infer() calls overlap.
class CountingBackend : public nv::IInferenceBackend {
 public:
  std::expected<nv::InferenceResult, nc::PipelineError> infer(const nc::Frame& input) override {
    const int now = ++in_flight_;
    int seen = max_in_flight_.load();
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    --in_flight_;
    nv::InferenceResult r;
    r.image_width = input.width();
    r.image_height = input.height();
    return r;
  }

  static std::atomic<int> in_flight_;
  static std::atomic<int> max_in_flight_;
};

std::atomic<int> CountingBackend::in_flight_{0};
std::atomic<int> CountingBackend::max_in_flight_{0};

}  // namespace

TEST(DetectionEngine, RejectsNullBackend) {
  EXPECT_THROW(nv::DetectionEngine(nullptr, nv::DetectionDecoder(nv::ear_pathology_classes())),
               std::invalid_argument);
}

TEST(DetectionEngine, ReturnsDecodedDetections) {
  auto mock = std::make_unique<nv::MockInferenceBackend>();
  mock->set_detections({make_candidate({10, 10, 60, 60}, 0.85f, 17)});
  const nv::DetectionEngine engine(std::move(mock),
                                   nv::DetectionDecoder(nv::ear_pathology_classes()));
  auto out = engine.infer(make_frame(100, 100), 0.25f, 0.45f);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->size(), 1u);
  EXPECT_EQ((*out)[0].class_name, "normal");
  EXPECT_FLOAT_EQ((*out)[0].confidence, 0.85f);
}

TEST(DetectionEngine, HighConfidenceThresholdGivesNoDetections) {
  auto mock = std::make_unique<nv::MockInferenceBackend>();
  mock->set_detections({make_candidate({10, 10, 60, 60}, 0.85f, 3),
                        make_candidate({20, 20, 80, 80}, 0.5f, 4)});
  const nv::DetectionEngine engine(std::move(mock),
                                   nv::DetectionDecoder(nv::ear_pathology_classes()));
  auto out = engine.infer(make_frame(100, 100), 0.9f, 0.45f);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->empty());
}

TEST(DetectionEngine, RejectsOutOfRangeThresholds) {
  const nv::DetectionEngine engine(std::make_unique<nv::MockInferenceBackend>(),
                                   nv::DetectionDecoder(nv::ear_pathology_classes()));
  const nc::Frame frame = make_frame(10, 10);
  for (const auto& [conf, iou] :
       std::vector<std::pair<float, float>>{{-0.1f, 0.45f},
                                            {1.5f, 0.45f},
                                            {0.25f, 2.f},
                                            {std::numeric_limits<float>::quiet_NaN(), 0.45f}}) {
    auto out = engine.infer(frame, conf, iou);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), nc::PipelineError::InvalidParameter);
  }
}

TEST(DetectionEngine, RejectsEmptyFrame) {
  const nv::DetectionEngine engine(std::make_unique<nv::MockInferenceBackend>(),
                                   nv::DetectionDecoder(nv::ear_pathology_classes()));
  auto out = engine.infer(nc::Frame{}, 0.25f, 0.45f);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), nc::PipelineError::InvalidFrame);
}

TEST(DetectionEngine, Deterministic) {
  auto mock = std::make_unique<nv::MockInferenceBackend>();
  mock->set_detections({make_candidate({10, 10, 60, 60}, 0.85f, 3),
                        make_candidate({12, 12, 62, 62}, 0.8f, 3),
                        make_candidate({40, 40, 90, 90}, 0.6f, 8)});
  const nv::DetectionEngine engine(std::move(mock),
                                   nv::DetectionDecoder(nv::ear_pathology_classes()));
  const nc::Frame frame = make_frame(100, 100);
  auto a = engine.infer(frame, 0.25f, 0.45f);
  auto b = engine.infer(frame, 0.25f, 0.45f);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  ASSERT_EQ(a->size(), b->size());
  for (std::size_t i = 0; i < a->size(); ++i) {
    EXPECT_EQ((*a)[i].class_id, (*b)[i].class_id);
    EXPECT_FLOAT_EQ((*a)[i].bbox.x1, (*b)[i].bbox.x1);
    EXPECT_FLOAT_EQ((*a)[i].confidence, (*b)[i].confidence);
  }
}

TEST(DetectionEngine, MockBackendRunsConcurrently) {
  const nv::DetectionEngine engine(std::make_unique<nv::MockInferenceBackend>(),
                                   nv::DetectionDecoder(nv::ear_pathology_classes()));
  EXPECT_FALSE(engine.serializes_inference());
  EXPECT_EQ(engine.device(), "cpu");
  EXPECT_EQ(engine.input_size(), 640u);
  EXPECT_EQ(engine.classes().size(), 18u);
}

TEST(DetectionEngine, NonReentrantBackendIsSerialized) {
  CountingBackend::in_flight_ = 0;
  CountingBackend::max_in_flight_ = 0;
  const nv::DetectionEngine engine(std::make_unique<CountingBackend>(),
                                   nv::DetectionDecoder(nv::ear_pathology_classes()));
  ASSERT_TRUE(engine.serializes_inference());

  const nc::Frame frame = make_frame(32, 32);
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 5; ++i) {
        if (engine.infer(frame, 0.25f, 0.45f)) ++ok;
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(ok.load(), 20);
  EXPECT_EQ(CountingBackend::max_in_flight_.load(), 1);
}
