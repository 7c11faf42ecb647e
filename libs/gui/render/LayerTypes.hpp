#pragma once
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>
#include <QColor>
#include <QString>

struct RenderableCandle {
    int64_t time = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    std::optional<double> volume;

    bool isUp() const { return close >= open; }
};

struct RenderablePoint {
    int64_t time = 0;
    double value = 0.0;
};

struct LineStyle {
    QColor color{"#8b5cf6"};
    double width = 1.0;
    Qt::PenStyle penStyle = Qt::SolidLine;
};

struct CandleStyle {
    QColor upColor{"#22c55e"};
    QColor downColor{"#ef4444"};
};

struct CandleLayer {
    std::vector<RenderableCandle> candles;
    CandleStyle style;

    bool empty() const { return candles.empty(); }
};

struct LineLayer {
    QString name;
    std::vector<RenderablePoint> points;
    LineStyle style;

    bool empty() const { return points.empty(); }
};

// Horizontal line at a fixed value spanning the whole pane
struct ReferenceLine {
    double value = 0.0;
    LineStyle style;
    QString label;
};

enum class MarkerPosition {
    AboveBar,
    BelowBar
};

enum class MarkerShape {
    ArrowUp,
    ArrowDown,
    Circle
};

struct MarkerSpec {
    int64_t time = 0;
    MarkerPosition position = MarkerPosition::AboveBar;
    MarkerShape shape = MarkerShape::Circle;
    QColor color;
    QString text;
    int size = 1;
};

using SeriesLayer = std::variant<CandleLayer, LineLayer>;

// Everything attached to one pane. Replaced as a whole by PaneController::setLayers.
struct PaneLayers {
    std::vector<SeriesLayer> series;
    std::vector<ReferenceLine> referenceLines;
    std::vector<MarkerSpec> markers;

    bool empty() const { return series.empty() && referenceLines.empty() && markers.empty(); }
};

const char* toString(MarkerPosition position);
const char* toString(MarkerShape shape);
