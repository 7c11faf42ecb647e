#include "CandlePainter.hpp"
#include <QPainter>
#include <algorithm>
#include <cmath>
#include <variant>

void CandlePainter::paint(QPainter& painter, const PaneLayers& layers, const Viewport& viewport) const {
    for (const auto& series : layers.series) {
        if (const auto* candles = std::get_if<CandleLayer>(&series)) {
            paintLayer(painter, *candles, viewport);
        }
    }
}

void CandlePainter::paintLayer(QPainter& painter, const CandleLayer& layer, const Viewport& viewport) const {
    if (layer.empty() || !CoordinateSystem::validateViewport(viewport)) return;

    const double spacing = barSpacing(layer.candles, viewport);
    const double bodyWidth = std::clamp(spacing * 0.7, 1.0, 40.0);

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, false);
    for (const auto& c : layer.candles) {
        const double x = CoordinateSystem::timeToX(c.time, viewport);
        if (x < -bodyWidth || x > viewport.width + bodyWidth) continue;

        const QColor color = c.isUp() ? layer.style.upColor : layer.style.downColor;
        const double yHigh = CoordinateSystem::valueToY(c.high, viewport);
        const double yLow = CoordinateSystem::valueToY(c.low, viewport);
        const double yOpen = CoordinateSystem::valueToY(c.open, viewport);
        const double yClose = CoordinateSystem::valueToY(c.close, viewport);

        painter.setPen(QPen(color, 1.0));
        painter.drawLine(QPointF(x, yHigh), QPointF(x, yLow));

        const double top = std::min(yOpen, yClose);
        const double height = std::max(1.0, std::abs(yClose - yOpen));
        painter.fillRect(QRectF(x - bodyWidth / 2.0, top, bodyWidth, height), color);
    }
    painter.restore();
}
