#include <earscope/vision/onnx_inference_backend.hpp>
#include "frame_cv_utils.hpp"
#include "yolo_output.hpp"
#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <earscope/core/log.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace earscope::vision {

namespace {

constexpr int64_t kNumChannels = 3;
constexpr int kPadValue = 114;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      const std::size_t dst_idx = static_cast<std::size_t>(y) * w + x;
      nchw[0 * hw + dst_idx] = hwc[src_idx + 0];
      nchw[1 * hw + dst_idx] = hwc[src_idx + 1];
      nchw[2 * hw + dst_idx] = hwc[src_idx + 2];
    }
  }
}

struct Letterbox {
  cv::Mat image;  // RGB float [0,1], net_h x net_w
  detail::LetterboxGeometry geometry;
};

Letterbox MakeLetterbox(const cv::Mat& bgr, std::uint32_t net_w, std::uint32_t net_h) {
  Letterbox lb;
  lb.geometry = detail::compute_letterbox(static_cast<std::uint32_t>(bgr.cols),
                                          static_cast<std::uint32_t>(bgr.rows), net_w, net_h);
  const detail::LetterboxGeometry& g = lb.geometry;

  cv::Mat resized;
  if (g.resized_width != bgr.cols || g.resized_height != bgr.rows) {
    cv::resize(bgr, resized, cv::Size(g.resized_width, g.resized_height), 0, 0,
               cv::INTER_LINEAR);
  } else {
    resized = bgr;
  }

  cv::Mat padded;
  cv::copyMakeBorder(resized, padded, g.top, g.bottom, g.left, g.right, cv::BORDER_CONSTANT,
                     cv::Scalar(kPadValue, kPadValue, kPadValue));

  cv::Mat rgb;
  cv::cvtColor(padded, rgb, cv::COLOR_BGR2RGB);
  rgb.convertTo(lb.image, CV_32FC3, 1.0 / 255.0);
  return lb;
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "earscope"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::vector<std::string> output_names;  // pred, then proto if present
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  std::size_t num_classes{0};
  bool has_proto{false};
  std::string device{"cpu"};

  std::vector<float> nchw_buffer;  // scratch for HWC -> NCHW

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path,
                                           std::size_t num_classes,
                                           std::uint32_t img_size,
                                           std::string device)
    : impl_(std::make_unique<Impl>()) {
  impl_->num_classes = num_classes;
  if (device == "cuda" || device == "0") {
    try {
      OrtCUDAProviderOptions cuda_options{};
      impl_->session_options.AppendExecutionProvider_CUDA(cuda_options);
      impl_->device = "cuda";
    } catch (const Ort::Exception& e) {
      EARSCOPE_LOG_WARN << "CUDA requested but unavailable (" << e.what()
                        << "), falling back to CPU";
    }
  }
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const std::vector<int64_t> dims = input_type.GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u || (dims[1] != kNumChannels && dims[1] > 0)) {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W]");
  }
  impl_->input_height = dims[2] > 0 ? static_cast<std::uint32_t>(dims[2]) : img_size;
  impl_->input_width = dims[3] > 0 ? static_cast<std::uint32_t>(dims[3]) : img_size;

  std::string pred_name;
  std::string proto_name;
  const size_t num_outputs = impl_->session.GetOutputCount();
  for (size_t i = 0; i < num_outputs; ++i) {
    const auto rank =
        impl_->session.GetOutputTypeInfo(i).GetTensorTypeAndShapeInfo().GetShape().size();
    std::string name = impl_->session.GetOutputNameAllocated(i, allocator).get();
    if (rank == 3u && pred_name.empty()) {
      pred_name = std::move(name);
    } else if (rank == 4u && proto_name.empty()) {
      proto_name = std::move(name);
    }
  }
  if (pred_name.empty()) {
    throw std::runtime_error("OnnxInferenceBackend: model has no rank-3 prediction output");
  }
  impl_->output_names.push_back(pred_name);
  if (!proto_name.empty()) {
    impl_->has_proto = true;
    impl_->output_names.push_back(proto_name);
  }
  for (const auto& name : impl_->output_names) {
    impl_->output_name_ptrs.push_back(name.c_str());
  }

  EARSCOPE_LOG_INFO << "loaded ONNX model " << model_path << " (input "
                    << impl_->input_width << "x" << impl_->input_height << ", "
                    << (impl_->has_proto ? "segmentation" : "detection") << ", device "
                    << impl_->device << ")";
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::string OnnxInferenceBackend::device() const { return impl_->device; }

std::uint32_t OnnxInferenceBackend::input_size() const noexcept {
  return std::max(impl_->input_width, impl_->input_height);
}

std::expected<void, earscope::core::PipelineError>
OnnxInferenceBackend::validate_input(const earscope::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(earscope::core::PipelineError::InvalidFrame);
  }
  if (input.format() == earscope::core::PixelFormat::Unknown) {
    return std::unexpected(earscope::core::PipelineError::InvalidFrame);
  }
  if (input.size_bytes() <
      earscope::core::Frame::min_bytes(input.width(), input.height(), input.format())) {
    return std::unexpected(earscope::core::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<InferenceResult, earscope::core::PipelineError>
OnnxInferenceBackend::infer(const earscope::core::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto mat = detail::frame_to_mat(input);
  if (!mat) {
    return std::unexpected(earscope::core::PipelineError::InvalidFrame);
  }

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;
  const Letterbox lb = MakeLetterbox(detail::to_bgr(*mat, input.format()), w, h);
  const cv::Mat hwc = lb.image.isContinuous() ? lb.image : lb.image.clone();

  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;
  impl_->nchw_buffer.resize(num_floats);
  HwcToNchw(hwc.ptr<float>(), h, w, impl_->nchw_buffer.data());

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                     static_cast<int64_t>(w)};
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, impl_->nchw_buffer.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(
        run_options,
        input_names_c, &input_tensor, 1,
        impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    EARSCOPE_LOG_ERROR << "ONNX Runtime run failed: " << e.what();
    return std::unexpected(earscope::core::PipelineError::InferenceFailed);
  }
  if (outputs.size() != impl_->output_names.size()) {
    return std::unexpected(earscope::core::PipelineError::InferenceFailed);
  }

  InferenceResult result;
  result.image_width = input.width();
  result.image_height = input.height();

  std::int64_t nm = 0;
  if (impl_->has_proto) {
    Ort::Value& proto = outputs[1];
    const auto pshape = proto.GetTensorTypeAndShapeInfo().GetShape();
    if (pshape.size() != 4u || pshape[0] != 1 || pshape[1] <= 0 || pshape[2] <= 0 ||
        pshape[3] <= 0) {
      return std::unexpected(earscope::core::PipelineError::InferenceFailed);
    }
    nm = pshape[1];
    MaskPrototypes& p = result.prototypes;
    p.channels = static_cast<std::uint32_t>(pshape[1]);
    p.height = static_cast<std::uint32_t>(pshape[2]);
    p.width = static_cast<std::uint32_t>(pshape[3]);
    p.input_width = w;
    p.input_height = h;
    p.scale = lb.geometry.scale;
    p.pad_x = static_cast<float>(lb.geometry.left);
    p.pad_y = static_cast<float>(lb.geometry.top);
    const float* pdata = proto.GetTensorData<float>();
    p.data.assign(pdata, pdata + static_cast<std::size_t>(p.channels) * p.height * p.width);
    result.num_mask_coeffs = p.channels;
  }

  Ort::Value& pred = outputs[0];
  const auto pred_info = pred.GetTensorTypeAndShapeInfo();
  const std::vector<int64_t> pred_shape = pred_info.GetShape();
  const std::span<const float> pred_data(pred.GetTensorData<float>(),
                                         pred_info.GetElementCount());
  auto decoded = detail::decode_predictions(pred_data, pred_shape, impl_->num_classes,
                                            static_cast<std::size_t>(nm), lb.geometry, result);
  if (!decoded) {
    return std::unexpected(decoded.error());
  }
  return result;
}

void OnnxInferenceBackend::warmup() {
  const std::uint32_t w = impl_->input_width;
  const std::uint32_t h = impl_->input_height;
  std::vector<std::byte> buffer(
      earscope::core::Frame::min_bytes(w, h, earscope::core::PixelFormat::BGR8), std::byte{0});
  earscope::core::Frame frame(w, h, earscope::core::PixelFormat::BGR8, std::move(buffer));
  if (!infer(frame)) {
    EARSCOPE_LOG_WARN << "ONNX warmup inference failed";
  }
}

}  // namespace earscope::vision
