#pragma once

#include "ITheme.hpp"
#include <QString>

/**
 * Dark slate theme for the Chartwell analytics window.
 */
class DarkTheme : public ITheme {
public:
    QString name() const override { return "Dark"; }
    QString id() const override { return "dark"; }
    QString stylesheet() const override;
    ChartPalette chartPalette() const override;
};
