/*
Chartwell — CoordinateSystem
Role: Coordinate transformation between world (unix seconds, value) and pane pixels.
Inputs/Outputs: Takes world/screen coordinates and a Viewport; outputs converted coordinates.
Threading: Pure static functions; safe on any thread.
Performance: Simple arithmetic, called per point during painting.
Integration: Used by PaneViewState, PaneSurfaceWidget and the layer painters.
Observability: No internal logging.
Related: CoordinateSystem.cpp, render/PaneViewState.hpp, render/ILayerPainter.hpp.
Assumptions: Linear mapping on both axes; Y grows downwards on screen.
*/
#pragma once
#include <QPointF>
#include <QString>
#include <cstdint>
#include <utility>

struct Viewport {
    int64_t timeStart = 0;
    int64_t timeEnd = 0;
    double valueMin = 0.0;
    double valueMax = 0.0;
    double width = 800.0;
    double height = 600.0;
};

class CoordinateSystem {
public:
    static QPointF worldToScreen(int64_t time, double value, const Viewport& viewport);
    static QPointF screenToWorld(const QPointF& screenPos, const Viewport& viewport);

    static double timeToX(int64_t time, const Viewport& viewport);
    static double valueToY(double value, const Viewport& viewport);
    static int64_t xToTime(double x, const Viewport& viewport);
    static double yToValue(double y, const Viewport& viewport);

    // Expands [min, max] so the data occupies the pane minus the given fractional margins.
    // A flat range is widened to a non-zero span.
    static std::pair<double, double> fitValueRange(double min, double max,
                                                   double topMargin, double bottomMargin);

    static bool validateViewport(const Viewport& viewport);
    static QString viewportDebugString(const Viewport& viewport);

private:
    static double normalizeTime(int64_t time, const Viewport& viewport);
    static double normalizeValue(double value, const Viewport& viewport);
    static constexpr double EPSILON = 1e-10;
};
