/*
Chartwell — DatasetValidation
Role: Pre-render checks over a Dataset: candle ordering and OHLC bounds, overlay alignment.
Inputs/Outputs: Takes a Dataset; returns a Report with one optional diagnostic per pane-relevant series.
Threading: Pure functions; safe on any thread.
Performance: Single linear pass per series.
Integration: Called by ChartOrchestrator at the top of every reconcile cycle.
Observability: No logging here; callers log the returned diagnostics.
Related: SeriesData.h, ChartOrchestrator.hpp.
Assumptions: Overlays are never resampled; any mismatch is reported, not repaired.
*/
#pragma once
#include "SeriesData.h"
#include <optional>
#include <string>
#include <vector>

namespace DatasetValidation {

struct Report {
    std::optional<std::string> candleError;
    std::optional<std::string> bandError;
    std::optional<std::string> oscillatorError;

    bool ok() const { return !candleError && !bandError && !oscillatorError; }
};

std::optional<std::string> checkCandles(const std::vector<CandlePoint>& candles);
std::optional<std::string> checkBands(const std::vector<CandlePoint>& candles,
                                      const std::vector<BandPoint>& bands);
std::optional<std::string> checkOscillator(const std::vector<CandlePoint>& candles,
                                           const std::vector<ScalarPoint>& series);

Report validate(const Dataset& dataset);

} // namespace DatasetValidation
