#include "ThemeManager.hpp"
#include "ChartwellLogging.hpp"
#include "DarkTheme.hpp"

ThemeManager& ThemeManager::instance() {
    static ThemeManager instance;
    return instance;
}

void ThemeManager::registerTheme(std::unique_ptr<ITheme> theme) {
    if (!theme) {
        cwLog_Warning("ThemeManager: ignoring null theme");
        return;
    }

    const QString id = theme->id();
    auto& slot = m_themes[id];
    const bool wasApplied = slot && m_applied == slot.get();
    slot = std::move(theme);
    if (wasApplied) {
        m_applied = slot.get();
    }
    cwLog_App("ThemeManager: registered" << id << "-" << slot->name());
}

bool ThemeManager::applyTheme(const QString& themeId, QApplication* app) {
    if (!app) {
        cwLog_Warning("ThemeManager: no application to style");
        return false;
    }

    auto it = m_themes.find(themeId);
    if (it == m_themes.end()) {
        cwLog_Warning("ThemeManager: unknown theme" << themeId);
        return false;
    }

    app->setStyleSheet(it->second->stylesheet());
    m_applied = it->second.get();
    cwLog_App("ThemeManager: applied" << themeId);
    return true;
}

ChartPalette ThemeManager::currentPalette() const {
    return m_applied ? m_applied->chartPalette() : DarkTheme().chartPalette();
}

void ThemeManager::initializeDefaults() {
    registerTheme(std::make_unique<DarkTheme>());
}
