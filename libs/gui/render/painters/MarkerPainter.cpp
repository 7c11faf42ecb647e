#include "MarkerPainter.hpp"
#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <algorithm>
#include <map>
#include <utility>

namespace {

constexpr double kBarGap = 4.0;

// Bar extremes at time t, or the vertical middle of the pane when there is no bar
std::pair<double, double> anchorExtremes(const CandleLayer* candles, int64_t t, const Viewport& viewport) {
    if (candles) {
        auto it = std::lower_bound(candles->candles.begin(), candles->candles.end(), t,
                                   [](const RenderableCandle& c, int64_t time) { return c.time < time; });
        if (it != candles->candles.end() && it->time == t) {
            return {CoordinateSystem::valueToY(it->high, viewport), CoordinateSystem::valueToY(it->low, viewport)};
        }
    }
    const double mid = viewport.height / 2.0;
    return {mid, mid};
}

QPainterPath glyphPath(MarkerShape shape, const QPointF& center, double size) {
    QPainterPath path;
    const double h = size / 2.0;
    switch (shape) {
        case MarkerShape::ArrowUp:
            path.moveTo(center.x(), center.y() - h);
            path.lineTo(center.x() + h, center.y() + h);
            path.lineTo(center.x() - h, center.y() + h);
            path.closeSubpath();
            break;
        case MarkerShape::ArrowDown:
            path.moveTo(center.x(), center.y() + h);
            path.lineTo(center.x() + h, center.y() - h);
            path.lineTo(center.x() - h, center.y() - h);
            path.closeSubpath();
            break;
        case MarkerShape::Circle:
            path.addEllipse(center, h, h);
            break;
    }
    return path;
}

} // namespace

void MarkerPainter::paint(QPainter& painter, const PaneLayers& layers, const Viewport& viewport) const {
    if (layers.markers.empty() || !CoordinateSystem::validateViewport(viewport)) return;

    const CandleLayer* candles = findCandleLayer(layers);
    const QFontMetricsF metrics(painter.font());

    // Running stack offset per (time, side)
    std::map<std::pair<int64_t, MarkerPosition>, double> stacks;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    for (const auto& marker : layers.markers) {
        const double x = CoordinateSystem::timeToX(marker.time, viewport);
        const auto [yHigh, yLow] = anchorExtremes(candles, marker.time, viewport);
        const double size = glyphSize(marker.size);
        double& offset = stacks[{marker.time, marker.position}];

        const bool above = marker.position == MarkerPosition::AboveBar;
        const double lineHeight = size + metrics.height() + 2.0;
        const double cy = above ? yHigh - kBarGap - offset - size / 2.0
                                : yLow + kBarGap + offset + size / 2.0;
        offset += lineHeight;

        painter.setPen(Qt::NoPen);
        painter.setBrush(marker.color);
        painter.drawPath(glyphPath(marker.shape, QPointF(x, cy), size));

        if (!marker.text.isEmpty()) {
            const double textWidth = metrics.horizontalAdvance(marker.text);
            const double ty = above ? cy - size / 2.0 - 2.0
                                    : cy + size / 2.0 + metrics.ascent() + 2.0;
            painter.setPen(marker.color);
            painter.drawText(QPointF(x - textWidth / 2.0, ty), marker.text);
        }
    }
    painter.restore();
}
