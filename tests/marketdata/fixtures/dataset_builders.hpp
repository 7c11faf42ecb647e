#pragma once
#include "marketdata/model/SeriesData.h"
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace fixtures {

constexpr int64_t kStartTime = 1700000000;
constexpr int64_t kDay = 86400;

/// n well-formed daily candles, alternating up and down bars around a slow drift
inline std::vector<CandlePoint> candles(size_t n, int64_t start = kStartTime, int64_t step = kDay,
                                        double base = 100.0) {
    std::vector<CandlePoint> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        CandlePoint c;
        c.time = start + static_cast<int64_t>(i) * step;
        const double mid = base + static_cast<double>(i) * 0.25;
        const bool up = (i % 2) == 0;
        c.open = up ? mid - 0.5 : mid + 0.5;
        c.close = up ? mid + 0.5 : mid - 0.5;
        c.high = mid + 1.0;
        c.low = mid - 1.0;
        c.volume = 1000.0 + static_cast<double>(i);
        out.push_back(c);
    }
    return out;
}

/// Band triple aligned to the candles' time index
inline std::vector<BandPoint> bands(const std::vector<CandlePoint>& source) {
    std::vector<BandPoint> out;
    out.reserve(source.size());
    for (const auto& c : source) {
        BandPoint b;
        b.time = c.time;
        b.middle = c.close;
        b.upper = c.close + 2.0;
        b.lower = c.close - 2.0;
        out.push_back(b);
    }
    return out;
}

/// Oscillator values in [30, 70] aligned to the candles' time index
inline std::vector<ScalarPoint> rsi(const std::vector<CandlePoint>& source) {
    std::vector<ScalarPoint> out;
    out.reserve(source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        ScalarPoint p;
        p.time = source[i].time;
        p.value = 50.0 + 20.0 * std::sin(static_cast<double>(i) / 5.0);
        out.push_back(p);
    }
    return out;
}

inline PatternEvent pattern(std::string label,
                            PatternClassification classification,
                            PatternStrength strength = PatternStrength::Moderate) {
    PatternEvent p;
    p.label = std::move(label);
    p.classification = classification;
    p.strength = strength;
    return p;
}

inline std::shared_ptr<Dataset> makeDataset(size_t n, bool withBands, bool withRsi,
                                            std::vector<PatternEvent> patterns = {},
                                            std::string symbol = "AAPL") {
    auto ds = std::make_shared<Dataset>();
    ds->symbol = std::move(symbol);
    ds->candles = candles(n);
    if (withBands) ds->bandOverlay = bands(ds->candles);
    if (withRsi) ds->oscillatorSeries = rsi(ds->candles);
    ds->patterns = std::move(patterns);
    return ds;
}

inline DatasetPtr dataset(size_t n, bool withBands, bool withRsi,
                          std::vector<PatternEvent> patterns = {},
                          std::string symbol = "AAPL") {
    return makeDataset(n, withBands, withRsi, std::move(patterns), std::move(symbol));
}

} // namespace fixtures
