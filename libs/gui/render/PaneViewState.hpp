/*
Chartwell — PaneViewState
Role: View state of one pane: visible time range, value range, viewport size, zoom and pan.
Inputs/Outputs: Takes fit/zoom/pan requests and mouse deltas; emits visibleTimeRangeChanged and viewportChanged.
Threading: Lives on the main GUI thread.
Performance: Constant-time updates; change signals fire only on actual changes.
Integration: Owned by PaneController; read by the pane surface, linked across panes by ChartOrchestrator.
Observability: Zoom and fit actions logged via cwLog_Debug.
Related: PaneViewState.cpp, PaneController.hpp, CoordinateSystem.h.
Assumptions: Times are unix seconds; the fitted range defines zoom 1.0.
*/
#pragma once
#include <QObject>
#include <QPointF>
#include <cstdint>
#include "CoordinateSystem.h"

struct TimeRange {
    int64_t from = 0;
    int64_t to = 0;

    bool valid() const { return to > from; }
    int64_t span() const { return to - from; }
    bool operator==(const TimeRange& other) const { return from == other.from && to == other.to; }
    bool operator!=(const TimeRange& other) const { return !(*this == other); }
};

class PaneViewState : public QObject {
    Q_OBJECT

public:
    explicit PaneViewState(QObject* parent = nullptr);

    TimeRange visibleTimeRange() const { return m_visibleRange; }
    double minValue() const { return m_minValue; }
    double maxValue() const { return m_maxValue; }
    double viewportWidth() const { return m_viewportWidth; }
    double viewportHeight() const { return m_viewportHeight; }
    double zoomFactor() const { return m_zoomFactor; }
    bool isDragging() const { return m_isDragging; }

    Viewport viewport() const;

    // No-op (and no signal) when the range is unchanged or invalid
    void setVisibleTimeRange(TimeRange range);
    void setValueRange(double minValue, double maxValue);
    void setViewportSize(double width, double height);

    // Fits [first, last] with half a bar of padding on each side; resets zoom to 1.0
    void fitTimeRange(int64_t first, int64_t last, size_t barCount);

    // Adopts the leader's visible range, zoom factor and minimum span so linked panes clamp alike
    void followTimeAxis(const PaneViewState& leader);
    int64_t minSpan() const { return m_minSpan; }

    // factor > 1 zooms in. anchorRatio is the horizontal position kept fixed (0 = left edge).
    void zoom(double factor, double anchorRatio = 0.5);
    void zoomIn();
    void zoomOut();
    void panByPixels(double dx);

    // Mouse interaction
    void handleWheel(double angleDelta, const QPointF& center);
    void handlePanStart(const QPointF& position);
    void handlePanMove(const QPointF& position);
    void handlePanEnd();

    static constexpr double kZoomStep = 1.25;
    static constexpr double kMinZoom = 0.1;
    static constexpr double kMaxZoom = 20.0;

signals:
    void visibleTimeRangeChanged();
    void viewportChanged();

private:
    TimeRange m_visibleRange;
    double m_minValue = 0.0;
    double m_maxValue = 0.0;

    double m_viewportWidth = 800.0;
    double m_viewportHeight = 400.0;

    double m_zoomFactor = 1.0;
    int64_t m_minSpan = 1;

    // Zoom sensitivity control
    static constexpr double ZOOM_SENSITIVITY = 0.0015;
    static constexpr double MAX_ZOOM_DELTA = 0.4;

    bool m_isDragging = false;
    QPointF m_lastMousePos;
};
