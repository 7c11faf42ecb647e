#include "ILayerPainter.hpp"
#include <QPen>
#include <variant>

double ILayerPainter::barSpacing(const std::vector<RenderableCandle>& candles, const Viewport& viewport) {
    if (candles.size() < 2) {
        return viewport.width * 0.5;
    }
    const double first = CoordinateSystem::timeToX(candles.front().time, viewport);
    const double last = CoordinateSystem::timeToX(candles.back().time, viewport);
    return (last - first) / static_cast<double>(candles.size() - 1);
}

QPen ILayerPainter::makePen(const LineStyle& style) {
    QPen pen(style.color);
    pen.setWidthF(style.width);
    pen.setStyle(style.penStyle);
    pen.setCapStyle(Qt::FlatCap);
    return pen;
}

const CandleLayer* ILayerPainter::findCandleLayer(const PaneLayers& layers) {
    for (const auto& series : layers.series) {
        if (const auto* candles = std::get_if<CandleLayer>(&series)) {
            return candles;
        }
    }
    return nullptr;
}
