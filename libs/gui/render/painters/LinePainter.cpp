#include "LinePainter.hpp"
#include <QPainter>
#include <QPolygonF>
#include <variant>

void LinePainter::paint(QPainter& painter, const PaneLayers& layers, const Viewport& viewport) const {
    if (!CoordinateSystem::validateViewport(viewport)) return;

    for (const auto& line : layers.referenceLines) {
        paintReference(painter, line, viewport);
    }
    for (const auto& series : layers.series) {
        if (const auto* line = std::get_if<LineLayer>(&series)) {
            paintSeries(painter, *line, viewport);
        }
    }
}

void LinePainter::paintSeries(QPainter& painter, const LineLayer& layer, const Viewport& viewport) const {
    if (layer.empty()) return;

    QPolygonF polyline;
    polyline.reserve(static_cast<int>(layer.points.size()));
    for (const auto& p : layer.points) {
        polyline << CoordinateSystem::worldToScreen(p.time, p.value, viewport);
    }

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setPen(makePen(layer.style));
    painter.setBrush(Qt::NoBrush);
    if (polyline.size() == 1) {
        painter.drawPoint(polyline.front());
    } else {
        painter.drawPolyline(polyline);
    }
    painter.restore();
}

void LinePainter::paintReference(QPainter& painter, const ReferenceLine& line, const Viewport& viewport) const {
    const double y = CoordinateSystem::valueToY(line.value, viewport);
    if (y < 0.0 || y > viewport.height) return;

    painter.save();
    painter.setPen(makePen(line.style));
    painter.drawLine(QPointF(0.0, y), QPointF(viewport.width, y));
    if (!line.label.isEmpty()) {
        painter.setPen(line.style.color);
        painter.drawText(QPointF(4.0, y - 3.0), QString("%1 %2").arg(line.label).arg(line.value));
    }
    painter.restore();
}
