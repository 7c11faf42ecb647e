#pragma once
#include <vector>
#include "ChartPalette.hpp"
#include "LayerTypes.hpp"
#include "marketdata/model/SeriesData.h"

// Pattern events -> markers, all anchored at one time (the dataset's last candle).
// bullish: arrow up below the bar; bearish: arrow down above; neutral: circle above.
// One marker per event, input order kept.
namespace AnnotationMapper {

std::vector<MarkerSpec> mapPatterns(const std::vector<PatternEvent>& patterns,
                                    int64_t anchorTime,
                                    const ChartPalette& palette = {});

int markerSize(PatternStrength strength);

} // namespace AnnotationMapper
