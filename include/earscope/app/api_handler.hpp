#pragma once

#include <earscope/app/detector_state.hpp>
#include <earscope/core/analysis.hpp>
#include <earscope/vision/circle_cropper.hpp>
#include <string>
#include <string_view>

namespace earscope::app {

inline constexpr std::string_view kServiceName = "earscope";
inline constexpr std::string_view kServiceVersion = "1.0.0";

/// Transport-independent HTTP response.
struct HttpResponse {
  int status{200};
  std::string body;
  std::string content_type{"application/json"};
};

/// Routes /api/health, /api/info and /api/analyze. Stateless apart from the
/// shared DetectorState; handle() may be called from many server threads.
class ApiHandler {
 public:
  ApiHandler(const DetectorState& detector,
             earscope::core::AnalysisParams defaults = {},
             earscope::vision::CircleCropper cropper = earscope::vision::CircleCropper{});

  [[nodiscard]] HttpResponse handle(std::string_view method,
                                    std::string_view path,
                                    std::string_view body) const;

  [[nodiscard]] HttpResponse health() const;
  [[nodiscard]] HttpResponse info() const;
  [[nodiscard]] HttpResponse analyze(std::string_view body) const;

 private:
  const DetectorState& detector_;
  earscope::core::AnalysisParams defaults_;
  earscope::vision::CircleCropper cropper_;
};

}  // namespace earscope::app
