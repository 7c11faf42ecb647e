/*
Chartwell — PaneSurfaceWidget
Role: QWidget surface for one pane: axes, grid, layer painters, crosshair and legend.
Inputs/Outputs: Takes PaneLayers and a PaneViewState; paints with QPainter; turns mouse input into pan/zoom.
Threading: GUI thread only.
Performance: Repaints on viewportChanged; painters skip bars outside the visible range.
Integration: Created by WidgetSurfaceFactory inside a pane container; owned through PaneController.
Observability: Paint passes counted with a throttled cwLog_RenderN.
Related: PaneSurfaceWidget.cpp, WidgetSurfaceFactory.hpp, ILayerPainter.hpp, PaneViewState.hpp.
Assumptions: The view state outlives the widget.
*/
#pragma once
#include <QWidget>
#include <memory>
#include <optional>
#include <vector>
#include "ILayerPainter.hpp"
#include "IPaneSurface.hpp"

class PaneViewState;

class PaneSurfaceWidget : public QWidget {
    Q_OBJECT

public:
    PaneSurfaceWidget(PaneViewState& viewState, const PaneOptions& options, QWidget* parent = nullptr);
    ~PaneSurfaceWidget() override;

    void setLayers(const PaneLayers& layers);
    const PaneLayers& layers() const { return m_layers; }
    const PaneOptions& options() const { return m_options; }

    QRectF plotRect() const;
    Viewport plotViewport() const;
    QString legendText(int64_t time) const;

    QSize sizeHint() const override;

    static constexpr int kValueAxisWidth = 64;
    static constexpr int kTimeAxisHeight = 22;

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    void paintGrid(QPainter& painter, const QRectF& plot, const Viewport& vp) const;
    void paintValueAxis(QPainter& painter, const QRectF& plot, const Viewport& vp) const;
    void paintTimeAxis(QPainter& painter, const QRectF& plot, const Viewport& vp) const;
    void paintCrosshair(QPainter& painter, const QRectF& plot, const Viewport& vp) const;
    QString formatTime(int64_t time, int64_t span) const;

    PaneViewState& m_viewState;
    PaneOptions m_options;
    PaneLayers m_layers;
    std::vector<std::unique_ptr<ILayerPainter>> m_painters;
    std::optional<QPointF> m_hover;
};
