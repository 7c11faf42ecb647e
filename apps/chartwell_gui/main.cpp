/*
Chartwell — main.cpp
Role: Entry point for the Chartwell GUI application.
*/
#include "MainWindow.hpp"
#include <QApplication>
#include <QMetaType>
#include "ChartwellLogging.hpp"
#include "config/ChartConfig.hpp"
#include "marketdata/model/SeriesData.h"
#include "themes/ThemeManager.hpp"

// --- Qt metatype registration ---
void registerMetaTypes() {
    qRegisterMetaType<DatasetPtr>("DatasetPtr");
}

// --- Theme selection with fallback to dark ---
void applyTheme(QApplication& app, const QString& themeId) {
    auto& themes = ThemeManager::instance();
    themes.initializeDefaults();
    if (!themes.applyTheme(themeId, &app)) {
        cwLog_Warning("Unknown theme" << themeId << "- falling back to dark");
        themes.applyTheme("dark", &app);
    }
}

int main(int argc, char *argv[])
{
    cwLog_App("[Chartwell starting...]");

    QApplication app(argc, argv);
    QApplication::setApplicationName("Chartwell");
    QApplication::setOrganizationName("Chartwell");

    registerMetaTypes();

    const ChartConfig config = ChartConfig::load();
    applyTheme(app, config.theme);

    MainWindow window(config);
    window.show();
    cwLog_App("Main window shown, entering event loop");

    return app.exec();
}
