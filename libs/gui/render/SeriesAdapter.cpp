#include "SeriesAdapter.hpp"

namespace SeriesAdapter {

CandleLayer toCandleLayer(const std::vector<CandlePoint>& candles, const CandleStyle& style) {
    CandleLayer layer;
    layer.style = style;
    layer.candles.reserve(candles.size());
    for (const auto& c : candles) {
        layer.candles.push_back({c.time, c.open, c.high, c.low, c.close, c.volume});
    }
    return layer;
}

LineLayer toLineLayer(const std::vector<ScalarPoint>& points, const LineStyle& style, const QString& name) {
    LineLayer layer;
    layer.name = name;
    layer.style = style;
    layer.points.reserve(points.size());
    for (const auto& p : points) {
        layer.points.push_back({p.time, p.value});
    }
    return layer;
}

BandLayers toBandLayers(const std::vector<BandPoint>& bands,
                        const LineStyle& edgeStyle, const LineStyle& middleStyle) {
    BandLayers out;
    out.upper.name = "Upper";
    out.middle.name = "Middle";
    out.lower.name = "Lower";
    out.upper.style = edgeStyle;
    out.middle.style = middleStyle;
    out.lower.style = edgeStyle;

    out.upper.points.reserve(bands.size());
    out.middle.points.reserve(bands.size());
    out.lower.points.reserve(bands.size());
    for (const auto& b : bands) {
        out.upper.points.push_back({b.time, b.upper});
        out.middle.points.push_back({b.time, b.middle});
        out.lower.points.push_back({b.time, b.lower});
    }
    return out;
}

} // namespace SeriesAdapter
