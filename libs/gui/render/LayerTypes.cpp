#include "LayerTypes.hpp"

const char* toString(MarkerPosition position) {
    return position == MarkerPosition::AboveBar ? "aboveBar" : "belowBar";
}

const char* toString(MarkerShape shape) {
    switch (shape) {
        case MarkerShape::ArrowUp:   return "arrowUp";
        case MarkerShape::ArrowDown: return "arrowDown";
        default:                     return "circle";
    }
}
