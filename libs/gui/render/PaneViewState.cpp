#include "PaneViewState.hpp"
#include "ChartwellLogging.hpp"
#include <algorithm>
#include <cmath>

PaneViewState::PaneViewState(QObject* parent)
    : QObject(parent) {
}

Viewport PaneViewState::viewport() const {
    Viewport vp;
    vp.timeStart = m_visibleRange.from;
    vp.timeEnd = m_visibleRange.to;
    vp.valueMin = m_minValue;
    vp.valueMax = m_maxValue;
    vp.width = m_viewportWidth;
    vp.height = m_viewportHeight;
    return vp;
}

void PaneViewState::setVisibleTimeRange(TimeRange range) {
    if (!range.valid() || range == m_visibleRange) {
        return;
    }
    m_visibleRange = range;
    emit visibleTimeRangeChanged();
    emit viewportChanged();
}

void PaneViewState::setValueRange(double minValue, double maxValue) {
    if (maxValue <= minValue) return;
    if (m_minValue == minValue && m_maxValue == maxValue) return;
    m_minValue = minValue;
    m_maxValue = maxValue;
    emit viewportChanged();
}

void PaneViewState::setViewportSize(double width, double height) {
    if (width <= 0 || height <= 0) return;
    if (m_viewportWidth == width && m_viewportHeight == height) return;
    m_viewportWidth = width;
    m_viewportHeight = height;
    emit viewportChanged();
}

void PaneViewState::fitTimeRange(int64_t first, int64_t last, size_t barCount) {
    if (last < first) std::swap(first, last);

    const int64_t span = last - first;
    const int64_t barInterval = (barCount > 1 && span > 0)
        ? std::max<int64_t>(1, span / static_cast<int64_t>(barCount - 1))
        : 60;
    const int64_t pad = std::max<int64_t>(1, barInterval / 2);

    const int64_t minSpan = std::max<int64_t>(2, barInterval * 2);
    const TimeRange fitted{first - pad, last + pad};
    const bool axisOnlyChanged = fitted == m_visibleRange && (m_zoomFactor != 1.0 || m_minSpan != minSpan);

    m_minSpan = minSpan;
    m_zoomFactor = 1.0;
    cwLog_Debug("Fit time range" << first << "-" << last << "bars" << static_cast<qulonglong>(barCount));
    setVisibleTimeRange(fitted);
    // Linked panes follow on this signal, so it fires even when only the zoom state was reset
    if (axisOnlyChanged) {
        emit visibleTimeRangeChanged();
    }
}

void PaneViewState::followTimeAxis(const PaneViewState& leader) {
    m_zoomFactor = leader.m_zoomFactor;
    m_minSpan = leader.m_minSpan;
    setVisibleTimeRange(leader.m_visibleRange);
}

void PaneViewState::zoom(double factor, double anchorRatio) {
    if (!m_visibleRange.valid() || factor <= 0.0) return;

    const double newZoom = std::clamp(m_zoomFactor * factor, kMinZoom, kMaxZoom);
    const double applied = newZoom / m_zoomFactor;
    if (applied == 1.0) return;

    anchorRatio = std::clamp(anchorRatio, 0.0, 1.0);
    const double span = static_cast<double>(m_visibleRange.span());
    const double newSpan = std::max(static_cast<double>(m_minSpan), span / applied);
    const double anchorTime = static_cast<double>(m_visibleRange.from) + span * anchorRatio;

    const auto from = static_cast<int64_t>(std::llround(anchorTime - newSpan * anchorRatio));
    const auto to = static_cast<int64_t>(std::llround(anchorTime + newSpan * (1.0 - anchorRatio)));
    if (to <= from) return;

    m_zoomFactor = newZoom;
    setVisibleTimeRange({from, to});
}

void PaneViewState::zoomIn() {
    zoom(kZoomStep);
}

void PaneViewState::zoomOut() {
    zoom(1.0 / kZoomStep);
}

void PaneViewState::panByPixels(double dx) {
    if (!m_visibleRange.valid() || m_viewportWidth <= 0.0 || dx == 0.0) return;
    const double secondsPerPixel = static_cast<double>(m_visibleRange.span()) / m_viewportWidth;
    const auto shift = static_cast<int64_t>(std::llround(-dx * secondsPerPixel));
    if (shift == 0) return;
    setVisibleTimeRange({m_visibleRange.from + shift, m_visibleRange.to + shift});
}

void PaneViewState::handleWheel(double angleDelta, const QPointF& center) {
    const double delta = std::clamp(angleDelta * ZOOM_SENSITIVITY, -MAX_ZOOM_DELTA, MAX_ZOOM_DELTA);
    const double ratio = m_viewportWidth > 0.0 ? center.x() / m_viewportWidth : 0.5;
    zoom(1.0 + delta, ratio);
}

void PaneViewState::handlePanStart(const QPointF& position) {
    m_isDragging = true;
    m_lastMousePos = position;
}

void PaneViewState::handlePanMove(const QPointF& position) {
    if (!m_isDragging) return;
    const double dx = position.x() - m_lastMousePos.x();
    m_lastMousePos = position;
    panByPixels(dx);
}

void PaneViewState::handlePanEnd() {
    m_isDragging = false;
}
