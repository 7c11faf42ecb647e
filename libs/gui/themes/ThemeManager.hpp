#pragma once

#include "ITheme.hpp"
#include <QApplication>
#include <QString>
#include <memory>
#include <map>

// Process-wide theme registry. The applied theme styles the widgets and supplies
// the palette that MainWindow hands to new chart panes.
class ThemeManager {
public:
    static ThemeManager& instance();

    // Replaces any theme already registered under the same id
    void registerTheme(std::unique_ptr<ITheme> theme);

    // Returns false (and changes nothing) for unknown ids or a null app
    bool applyTheme(const QString& themeId, QApplication* app);

    // Dark palette until a theme has been applied
    ChartPalette currentPalette() const;

    // Registers the built-in themes; call after QApplication exists
    void initializeDefaults();

private:
    ThemeManager() = default;
    ~ThemeManager() = default;
    ThemeManager(const ThemeManager&) = delete;
    ThemeManager& operator=(const ThemeManager&) = delete;

    std::map<QString, std::unique_ptr<ITheme>> m_themes;
    const ITheme* m_applied = nullptr;
};
