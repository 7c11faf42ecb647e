#include "SeriesData.h"

const char* toString(PatternClassification classification) {
    switch (classification) {
        case PatternClassification::Bullish: return "bullish";
        case PatternClassification::Bearish: return "bearish";
        default:                             return "neutral";
    }
}

const char* toString(PatternStrength strength) {
    switch (strength) {
        case PatternStrength::Weak:   return "weak";
        case PatternStrength::Strong: return "strong";
        default:                      return "moderate";
    }
}
