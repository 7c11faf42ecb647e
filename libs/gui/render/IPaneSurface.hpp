#pragma once
#include <QString>
#include "ChartPalette.hpp"
#include "LayerTypes.hpp"

class QWidget;

// Caller-supplied appearance of one pane
struct PaneOptions {
    QString name;
    int height = 400;
    bool timeAxisVisible = true;
    double topMargin = 0.1;     // fraction of height kept free above the data
    double bottomMargin = 0.1;
    ChartPalette palette;
};

// Host-side slot a pane is mounted into. Only read for width and used as a parent.
class IPaneContainer {
public:
    virtual ~IPaneContainer() = default;

    virtual int availableWidth() const = 0;
    virtual QWidget* hostWidget() const = 0;   // may be null for headless containers
};

// A drawing surface owned by exactly one PaneController
class IPaneSurface {
public:
    virtual ~IPaneSurface() = default;

    virtual void setSurfaceSize(int width, int height) = 0;
    virtual int surfaceWidth() const = 0;
    virtual int surfaceHeight() const = 0;

    virtual void applyLayers(const PaneLayers& layers) = 0;
};
