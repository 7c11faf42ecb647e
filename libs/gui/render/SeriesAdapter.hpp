#pragma once
#include "LayerTypes.hpp"
#include "marketdata/model/SeriesData.h"

struct BandLayers {
    LineLayer upper;
    LineLayer middle;
    LineLayer lower;
};

// Domain series -> renderable layers. Pure; empty input gives an empty layer.
namespace SeriesAdapter {

CandleLayer toCandleLayer(const std::vector<CandlePoint>& candles, const CandleStyle& style = {});
LineLayer toLineLayer(const std::vector<ScalarPoint>& points, const LineStyle& style = {},
                      const QString& name = QString());
BandLayers toBandLayers(const std::vector<BandPoint>& bands,
                        const LineStyle& edgeStyle = {}, const LineStyle& middleStyle = {});

} // namespace SeriesAdapter
