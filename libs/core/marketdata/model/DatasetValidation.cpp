#include "DatasetValidation.hpp"
#include <cmath>
#include <fmt/format.h>

namespace {

template <typename Point>
std::optional<std::string> checkTimeIndex(const std::vector<CandlePoint>& candles,
                                          const std::vector<Point>& series,
                                          const char* seriesName) {
    if (series.size() != candles.size()) {
        return fmt::format("{} has {} points but candles have {}",
                           seriesName, series.size(), candles.size());
    }
    for (size_t i = 0; i < series.size(); ++i) {
        if (series[i].time != candles[i].time) {
            return fmt::format("{} time {} at index {} does not match candle time {}",
                               seriesName, series[i].time, i, candles[i].time);
        }
    }
    return std::nullopt;
}

} // namespace

namespace DatasetValidation {

std::optional<std::string> checkCandles(const std::vector<CandlePoint>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        if (i > 0 && c.time <= candles[i - 1].time) {
            return fmt::format("candle times not strictly increasing at index {} ({} after {})",
                               i, c.time, candles[i - 1].time);
        }
        if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) || !std::isfinite(c.close)) {
            return fmt::format("candle at index {} has a non-finite price (o={} h={} l={} c={})",
                               i, c.open, c.high, c.low, c.close);
        }
        if (c.volume && !std::isfinite(*c.volume)) {
            return fmt::format("candle at index {} has non-finite volume", i);
        }
        if (c.open > c.high || c.close > c.high || c.open < c.low || c.close < c.low) {
            return fmt::format("candle at index {} violates OHLC bounds (o={} h={} l={} c={})",
                               i, c.open, c.high, c.low, c.close);
        }
        if (c.volume && *c.volume < 0.0) {
            return fmt::format("candle at index {} has negative volume {}", i, *c.volume);
        }
    }
    return std::nullopt;
}

std::optional<std::string> checkBands(const std::vector<CandlePoint>& candles,
                                      const std::vector<BandPoint>& bands) {
    if (auto err = checkTimeIndex(candles, bands, "bbSeries")) {
        return err;
    }
    for (size_t i = 0; i < bands.size(); ++i) {
        const auto& b = bands[i];
        if (!std::isfinite(b.lower) || !std::isfinite(b.middle) || !std::isfinite(b.upper)) {
            return fmt::format("bbSeries at index {} has a non-finite value", i);
        }
        if (b.lower > b.middle || b.middle > b.upper) {
            return fmt::format("bbSeries at index {} is not ordered (l={} m={} u={})",
                               i, b.lower, b.middle, b.upper);
        }
    }
    return std::nullopt;
}

std::optional<std::string> checkOscillator(const std::vector<CandlePoint>& candles,
                                           const std::vector<ScalarPoint>& series) {
    if (auto err = checkTimeIndex(candles, series, "rsiSeries")) {
        return err;
    }
    for (size_t i = 0; i < series.size(); ++i) {
        if (!std::isfinite(series[i].value)) {
            return fmt::format("rsiSeries at index {} has a non-finite value", i);
        }
    }
    return std::nullopt;
}

Report validate(const Dataset& dataset) {
    Report report;
    report.candleError = checkCandles(dataset.candles);
    if (dataset.bandOverlay) {
        report.bandError = checkBands(dataset.candles, *dataset.bandOverlay);
    }
    if (dataset.oscillatorSeries) {
        report.oscillatorError = checkOscillator(dataset.candles, *dataset.oscillatorSeries);
    }
    return report;
}

} // namespace DatasetValidation
