#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <QMetaType>

// Base for every series entry. Unix seconds, strictly increasing within a series.
struct TimePoint {
    int64_t time = 0;
};

struct CandlePoint : TimePoint {
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    std::optional<double> volume;
};

struct ScalarPoint : TimePoint {
    double value = 0.0;
};

// Envelope triple, lower <= middle <= upper
struct BandPoint : TimePoint {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
};

enum class PatternClassification {
    Bullish,
    Bearish,
    Neutral
};

enum class PatternStrength {
    Weak,
    Moderate,
    Strong
};

// A detected chart pattern. Carries no timestamp: it is always anchored to the
// dataset's final candle.
struct PatternEvent {
    std::string label;
    PatternClassification classification = PatternClassification::Neutral;
    PatternStrength strength = PatternStrength::Moderate;
};

// One fetch result. Immutable once published; overlays, when present, share the
// candles' time index exactly.
struct Dataset {
    std::string symbol;
    std::vector<CandlePoint> candles;
    std::optional<std::vector<BandPoint>> bandOverlay;
    std::optional<std::vector<ScalarPoint>> oscillatorSeries;
    std::vector<PatternEvent> patterns;

    std::optional<double> currentPrice;
    std::optional<double> priceChange;

    bool empty() const { return candles.empty(); }
    int64_t lastTime() const { return candles.empty() ? 0 : candles.back().time; }
    int64_t firstTime() const { return candles.empty() ? 0 : candles.front().time; }
};

using DatasetPtr = std::shared_ptr<const Dataset>;

const char* toString(PatternClassification classification);
const char* toString(PatternStrength strength);

Q_DECLARE_METATYPE(DatasetPtr)
