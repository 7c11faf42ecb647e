#include "AnnotationMapper.hpp"

namespace AnnotationMapper {

int markerSize(PatternStrength strength) {
    switch (strength) {
        case PatternStrength::Weak:   return 1;
        case PatternStrength::Strong: return 3;
        default:                      return 2;
    }
}

std::vector<MarkerSpec> mapPatterns(const std::vector<PatternEvent>& patterns,
                                    int64_t anchorTime,
                                    const ChartPalette& palette) {
    std::vector<MarkerSpec> markers;
    markers.reserve(patterns.size());
    for (const auto& p : patterns) {
        MarkerSpec m;
        m.time = anchorTime;
        m.text = QString::fromStdString(p.label);
        m.size = markerSize(p.strength);
        switch (p.classification) {
            case PatternClassification::Bullish:
                m.shape = MarkerShape::ArrowUp;
                m.position = MarkerPosition::BelowBar;
                m.color = palette.bullish;
                break;
            case PatternClassification::Bearish:
                m.shape = MarkerShape::ArrowDown;
                m.position = MarkerPosition::AboveBar;
                m.color = palette.bearish;
                break;
            case PatternClassification::Neutral:
                m.shape = MarkerShape::Circle;
                m.position = MarkerPosition::AboveBar;
                m.color = palette.neutral;
                break;
        }
        markers.push_back(std::move(m));
    }
    return markers;
}

} // namespace AnnotationMapper
