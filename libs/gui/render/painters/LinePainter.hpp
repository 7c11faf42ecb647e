#pragma once
#include "../ILayerPainter.hpp"

// Polyline series (band edges, oscillator) plus horizontal reference lines
class LinePainter : public ILayerPainter {
public:
    void paint(QPainter& painter, const PaneLayers& layers, const Viewport& viewport) const override;
    const char* getPainterName() const override { return "Lines"; }

private:
    void paintSeries(QPainter& painter, const LineLayer& layer, const Viewport& viewport) const;
    void paintReference(QPainter& painter, const ReferenceLine& line, const Viewport& viewport) const;
};
