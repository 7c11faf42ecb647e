#pragma once
#include "../ILayerPainter.hpp"

// Pattern markers. Glyphs sharing a bar and side are stacked away from the bar.
class MarkerPainter : public ILayerPainter {
public:
    void paint(QPainter& painter, const PaneLayers& layers, const Viewport& viewport) const override;
    const char* getPainterName() const override { return "Markers"; }

    static double glyphSize(int size) { return 6.0 + 3.0 * size; }
};
