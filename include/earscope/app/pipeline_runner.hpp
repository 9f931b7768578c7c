#pragma once

#include <earscope/app/analysis_service.hpp>
#include <earscope/core/analysis.hpp>
#include <earscope/core/error.hpp>
#include <earscope/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace earscope::app {

using AnalysisOutcome =
    std::expected<earscope::core::AnalysisResponse, earscope::core::PipelineError>;

/// Callback for each analyzed frame: (frame index, outcome). Failures are reported
/// too. May be invoked from worker threads when using analyze_batch_parallel.
using AnalysisCallback = std::function<void(std::size_t index, const AnalysisOutcome&)>;

/// Analyzes frames sequentially with the same parameters; calls callback in order.
void analyze_batch(const AnalysisService& service,
                   const std::vector<earscope::core::Frame>& frames,
                   const earscope::core::AnalysisParams& params,
                   AnalysisCallback callback);

/// Analyzes frames on a pool of worker threads sharing one service (and therefore
/// one engine gate). Callback may be invoked from any worker, in any order, and
/// must be thread-safe. num_workers 0 = use hardware concurrency.
void analyze_batch_parallel(const AnalysisService& service,
                            const std::vector<earscope::core::Frame>& frames,
                            const earscope::core::AnalysisParams& params,
                            AnalysisCallback callback,
                            std::size_t num_workers = 0);

}  // namespace earscope::app
