#pragma once
#include <vector>
#include "CoordinateSystem.h"
#include "LayerTypes.hpp"

class QPainter;
class QPen;

// One drawing pass over a pane's layers. Painters are stateless and run in
// the order the surface registers them.
class ILayerPainter {
public:
    virtual ~ILayerPainter() = default;

    virtual void paint(QPainter& painter, const PaneLayers& layers, const Viewport& viewport) const = 0;
    virtual const char* getPainterName() const = 0;

protected:
    // Average horizontal distance between consecutive bars, in pixels
    static double barSpacing(const std::vector<RenderableCandle>& candles, const Viewport& viewport);
    static QPen makePen(const LineStyle& style);
    static const CandleLayer* findCandleLayer(const PaneLayers& layers);
};
