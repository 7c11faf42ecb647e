#pragma once

#include <QString>
#include "render/ChartPalette.hpp"

/**
 * Interface for theme implementations.
 * A theme supplies the widget stylesheet and the colors used inside chart panes.
 */
class ITheme {
public:
    virtual ~ITheme() = default;

    virtual QString name() const = 0;
    virtual QString id() const = 0;
    virtual QString stylesheet() const = 0;

    /**
     * Colors for pane backgrounds, candles, overlays and pattern markers.
     */
    virtual ChartPalette chartPalette() const = 0;
};
