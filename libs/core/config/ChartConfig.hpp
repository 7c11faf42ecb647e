#pragma once
#include <string>
#include <QString>

class QSettings;

// Analytics backend endpoint. {symbol} in target is replaced per request.
struct ApiConfig {
    std::string host = "localhost";
    int port = 5000;
    std::string target = "/api/patterns/{symbol}";
    bool tls = false;
    int timeoutSeconds = 15;

    std::string targetFor(const std::string& symbol) const;
};

struct ChartConfig {
    static constexpr int kDefaultPriceHeight = 400;
    static constexpr int kDefaultOscillatorHeight = 120;

    ApiConfig api;
    int priceHeight = kDefaultPriceHeight;
    int oscillatorHeight = kDefaultOscillatorHeight;
    QString defaultSymbol;
    QString theme = "dark";

    // config.ini (INI format), then CHARTWELL_* environment overrides
    static ChartConfig load(const QString& path = "config.ini");
    static ChartConfig fromSettings(const QSettings& settings);

    void applyEnvironment();
};
