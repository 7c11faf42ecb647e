#include "PaneSurfaceWidget.hpp"
#include "ChartwellLogging.hpp"
#include "PaneViewState.hpp"
#include "painters/CandlePainter.hpp"
#include "painters/LinePainter.hpp"
#include "painters/MarkerPainter.hpp"
#include <QDateTime>
#include <QMouseEvent>
#include <QPainter>
#include <QStringList>
#include <QWheelEvent>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <type_traits>
#include <variant>

namespace {

constexpr int kValueTicks = 5;
constexpr int kTimeTicks = 6;

template <typename Point>
const Point* nearestByTime(const std::vector<Point>& points, int64_t time) {
    if (points.empty()) return nullptr;
    auto it = std::lower_bound(points.begin(), points.end(), time,
                               [](const Point& p, int64_t t) { return p.time < t; });
    if (it == points.end()) return &points.back();
    if (it == points.begin()) return &*it;
    auto prev = std::prev(it);
    return (time - prev->time) <= (it->time - time) ? &*prev : &*it;
}

} // namespace

PaneSurfaceWidget::PaneSurfaceWidget(PaneViewState& viewState, const PaneOptions& options, QWidget* parent)
    : QWidget(parent)
    , m_viewState(viewState)
    , m_options(options)
{
    setMouseTracking(true);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setObjectName(m_options.name);

    m_painters.push_back(std::make_unique<LinePainter>());
    m_painters.push_back(std::make_unique<CandlePainter>());
    m_painters.push_back(std::make_unique<MarkerPainter>());

    connect(&m_viewState, &PaneViewState::viewportChanged, this, qOverload<>(&QWidget::update));
}

PaneSurfaceWidget::~PaneSurfaceWidget() = default;

void PaneSurfaceWidget::setLayers(const PaneLayers& layers) {
    m_layers = layers;
    update();
}

QSize PaneSurfaceWidget::sizeHint() const {
    return QSize(800, m_options.height);
}

QRectF PaneSurfaceWidget::plotRect() const {
    const double bottom = m_options.timeAxisVisible ? kTimeAxisHeight : 0;
    return QRectF(0, 0, std::max(0, width() - kValueAxisWidth), std::max(0.0, height() - bottom));
}

Viewport PaneSurfaceWidget::plotViewport() const {
    Viewport vp = m_viewState.viewport();
    const QRectF plot = plotRect();
    vp.width = plot.width();
    vp.height = plot.height();
    return vp;
}

void PaneSurfaceWidget::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.fillRect(rect(), m_options.palette.background);

    const QRectF plot = plotRect();
    const Viewport vp = plotViewport();
    if (!CoordinateSystem::validateViewport(vp) || plot.isEmpty()) {
        return;
    }

    paintGrid(painter, plot, vp);
    paintValueAxis(painter, plot, vp);
    if (m_options.timeAxisVisible) {
        paintTimeAxis(painter, plot, vp);
    }

    painter.save();
    painter.setClipRect(plot);
    painter.translate(plot.topLeft());
    for (const auto& layerPainter : m_painters) {
        layerPainter->paint(painter, m_layers, vp);
    }
    painter.restore();

    paintCrosshair(painter, plot, vp);
    cwLog_RenderN(200, "Painted" << m_options.name << "pane");
}

void PaneSurfaceWidget::paintGrid(QPainter& painter, const QRectF& plot, const Viewport& vp) const {
    Q_UNUSED(vp);
    painter.save();
    painter.setPen(QPen(m_options.palette.grid, 1.0));
    for (int i = 1; i < kValueTicks; ++i) {
        const double y = plot.top() + plot.height() * i / kValueTicks;
        painter.drawLine(QPointF(plot.left(), y), QPointF(plot.right(), y));
    }
    for (int i = 1; i < kTimeTicks; ++i) {
        const double x = plot.left() + plot.width() * i / kTimeTicks;
        painter.drawLine(QPointF(x, plot.top()), QPointF(x, plot.bottom()));
    }
    painter.restore();
}

void PaneSurfaceWidget::paintValueAxis(QPainter& painter, const QRectF& plot, const Viewport& vp) const {
    painter.save();
    painter.setPen(m_options.palette.axisText);
    const double span = vp.valueMax - vp.valueMin;
    const int decimals = span < 1.0 ? 4 : (span < 100.0 ? 2 : 1);
    for (int i = 1; i < kValueTicks; ++i) {
        const double y = plot.height() * i / kValueTicks;
        const double value = CoordinateSystem::yToValue(y, vp);
        painter.drawText(QPointF(plot.right() + 6, plot.top() + y + 4), QString::number(value, 'f', decimals));
    }
    painter.restore();
}

QString PaneSurfaceWidget::formatTime(int64_t time, int64_t span) const {
    const QDateTime dt = QDateTime::fromSecsSinceEpoch(time);
    if (span > 3 * 86400) return dt.toString("MMM d");
    if (span > 86400) return dt.toString("d hh:mm");
    return dt.toString("hh:mm");
}

void PaneSurfaceWidget::paintTimeAxis(QPainter& painter, const QRectF& plot, const Viewport& vp) const {
    painter.save();
    painter.setPen(m_options.palette.axisText);
    const int64_t span = vp.timeEnd - vp.timeStart;
    for (int i = 1; i < kTimeTicks; ++i) {
        const double x = plot.width() * i / kTimeTicks;
        const QString label = formatTime(CoordinateSystem::xToTime(x, vp), span);
        const double w = painter.fontMetrics().horizontalAdvance(label);
        painter.drawText(QPointF(plot.left() + x - w / 2.0, plot.bottom() + kTimeAxisHeight - 6), label);
    }
    painter.restore();
}

QString PaneSurfaceWidget::legendText(int64_t time) const {
    QStringList parts;
    parts << m_options.name;
    for (const auto& series : m_layers.series) {
        std::visit([&](const auto& layer) {
            using T = std::decay_t<decltype(layer)>;
            if constexpr (std::is_same_v<T, CandleLayer>) {
                if (const auto* c = nearestByTime(layer.candles, time)) {
                    parts << QString("O %1 H %2 L %3 C %4")
                                 .arg(c->open, 0, 'f', 2).arg(c->high, 0, 'f', 2)
                                 .arg(c->low, 0, 'f', 2).arg(c->close, 0, 'f', 2);
                }
            } else {
                if (const auto* p = nearestByTime(layer.points, time)) {
                    parts << QString("%1 %2").arg(layer.name).arg(p->value, 0, 'f', 2);
                }
            }
        }, series);
    }
    return parts.join("  ");
}

void PaneSurfaceWidget::paintCrosshair(QPainter& painter, const QRectF& plot, const Viewport& vp) const {
    if (!m_hover || !plot.contains(*m_hover)) return;

    const QPointF local = *m_hover - plot.topLeft();
    painter.save();
    painter.setPen(QPen(m_options.palette.crosshair, 1.0, Qt::DashLine));
    painter.drawLine(QPointF(m_hover->x(), plot.top()), QPointF(m_hover->x(), plot.bottom()));
    painter.drawLine(QPointF(plot.left(), m_hover->y()), QPointF(plot.right(), m_hover->y()));

    painter.setPen(m_options.palette.legendText);
    const int64_t time = CoordinateSystem::xToTime(local.x(), vp);
    painter.drawText(QPointF(plot.left() + 6, plot.top() + 14), legendText(time));
    painter.drawText(QPointF(plot.right() + 6, m_hover->y() + 4),
                     QString::number(CoordinateSystem::yToValue(local.y(), vp), 'f', 2));
    painter.restore();
}

void PaneSurfaceWidget::mousePressEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton) {
        m_viewState.handlePanStart(event->position());
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void PaneSurfaceWidget::mouseMoveEvent(QMouseEvent* event) {
    m_hover = event->position();
    if (m_viewState.isDragging()) {
        m_viewState.handlePanMove(event->position());
    }
    update();
}

void PaneSurfaceWidget::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton) {
        m_viewState.handlePanEnd();
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void PaneSurfaceWidget::wheelEvent(QWheelEvent* event) {
    const QPointF local = event->position() - plotRect().topLeft();
    m_viewState.handleWheel(event->angleDelta().y(), local);
    event->accept();
}

void PaneSurfaceWidget::leaveEvent(QEvent* event) {
    m_hover.reset();
    update();
    QWidget::leaveEvent(event);
}
