#include "WidgetSurfaceFactory.hpp"
#include "PaneSurfaceWidget.hpp"
#include <QPointer>

namespace {

// Owns the widget unless its parent container already deleted it
class WidgetPaneSurface : public IPaneSurface {
public:
    explicit WidgetPaneSurface(PaneSurfaceWidget* widget) : m_widget(widget) {}

    ~WidgetPaneSurface() override {
        delete m_widget.data();
    }

    void setSurfaceSize(int width, int height) override {
        if (m_widget) m_widget->setGeometry(0, 0, width, height);
    }
    int surfaceWidth() const override { return m_widget ? m_widget->width() : 0; }
    int surfaceHeight() const override { return m_widget ? m_widget->height() : 0; }

    void applyLayers(const PaneLayers& layers) override {
        if (m_widget) m_widget->setLayers(layers);
    }

private:
    QPointer<PaneSurfaceWidget> m_widget;
};

} // namespace

std::unique_ptr<IPaneSurface> WidgetSurfaceFactory::createSurface(const IPaneContainer& container,
                                                                  PaneViewState& viewState,
                                                                  const PaneOptions& options) {
    QWidget* host = container.hostWidget();
    auto* widget = new PaneSurfaceWidget(viewState, options, host);
    if (host) {
        host->setMinimumHeight(options.height);
        widget->show();
    }
    return std::make_unique<WidgetPaneSurface>(widget);
}
