#pragma once
#include "../ILayerPainter.hpp"

// OHLC candlesticks: wick from low to high, body from open to close, up/down colored
class CandlePainter : public ILayerPainter {
public:
    void paint(QPainter& painter, const PaneLayers& layers, const Viewport& viewport) const override;
    const char* getPainterName() const override { return "Candles"; }

private:
    void paintLayer(QPainter& painter, const CandleLayer& layer, const Viewport& viewport) const;
};
