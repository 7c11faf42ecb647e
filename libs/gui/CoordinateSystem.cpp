#include "CoordinateSystem.h"
#include <algorithm>
#include <cmath>

QPointF CoordinateSystem::worldToScreen(int64_t time, double value, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        return QPointF(0, 0);
    }
    return QPointF(timeToX(time, viewport), valueToY(value, viewport));
}

QPointF CoordinateSystem::screenToWorld(const QPointF& screenPos, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        return QPointF(0, 0);
    }
    return QPointF(static_cast<double>(xToTime(screenPos.x(), viewport)), yToValue(screenPos.y(), viewport));
}

double CoordinateSystem::timeToX(int64_t time, const Viewport& viewport) {
    return normalizeTime(time, viewport) * viewport.width;
}

double CoordinateSystem::valueToY(double value, const Viewport& viewport) {
    return (1.0 - normalizeValue(value, viewport)) * viewport.height;  // Flip Y for screen coordinates
}

int64_t CoordinateSystem::xToTime(double x, const Viewport& viewport) {
    if (viewport.width <= EPSILON) return viewport.timeStart;
    const double ratio = x / viewport.width;
    return viewport.timeStart +
        static_cast<int64_t>(std::llround(ratio * static_cast<double>(viewport.timeEnd - viewport.timeStart)));
}

double CoordinateSystem::yToValue(double y, const Viewport& viewport) {
    if (viewport.height <= EPSILON) return viewport.valueMin;
    const double ratio = 1.0 - (y / viewport.height);
    return viewport.valueMin + ratio * (viewport.valueMax - viewport.valueMin);
}

std::pair<double, double> CoordinateSystem::fitValueRange(double min, double max,
                                                          double topMargin, double bottomMargin) {
    if (min > max) std::swap(min, max);
    double span = max - min;
    if (span <= EPSILON) {
        // Flat series: give it a visible band around the value
        const double pad = std::max(std::abs(max) * 0.01, 1.0);
        min -= pad;
        max += pad;
        span = max - min;
    }

    topMargin = std::clamp(topMargin, 0.0, 0.45);
    bottomMargin = std::clamp(bottomMargin, 0.0, 0.45);
    const double dataShare = 1.0 - topMargin - bottomMargin;
    const double total = span / dataShare;
    return {min - total * bottomMargin, max + total * topMargin};
}

bool CoordinateSystem::validateViewport(const Viewport& viewport) {
    return viewport.timeEnd > viewport.timeStart &&
           viewport.valueMax > viewport.valueMin &&
           viewport.width > EPSILON &&
           viewport.height > EPSILON;
}

QString CoordinateSystem::viewportDebugString(const Viewport& viewport) {
    return QString("Viewport{time: %1-%2s, value: %3-%4, size: %5x%6}")
        .arg(viewport.timeStart)
        .arg(viewport.timeEnd)
        .arg(viewport.valueMin)
        .arg(viewport.valueMax)
        .arg(viewport.width)
        .arg(viewport.height);
}

double CoordinateSystem::normalizeTime(int64_t time, const Viewport& viewport) {
    const int64_t timeRange = viewport.timeEnd - viewport.timeStart;
    if (timeRange <= 0) return 0.0;

    return static_cast<double>(time - viewport.timeStart) / static_cast<double>(timeRange);
}

double CoordinateSystem::normalizeValue(double value, const Viewport& viewport) {
    const double valueRange = viewport.valueMax - viewport.valueMin;
    if (valueRange <= EPSILON) return 0.0;

    return (value - viewport.valueMin) / valueRange;
}
