#include "ChartConfig.hpp"
#include "ChartwellLogging.hpp"
#include <QSettings>

std::string ApiConfig::targetFor(const std::string& symbol) const {
    static const std::string kPlaceholder = "{symbol}";
    std::string out = target;
    const auto pos = out.find(kPlaceholder);
    if (pos == std::string::npos) {
        if (!out.empty() && out.back() != '/') out += '/';
        return out + symbol;
    }
    out.replace(pos, kPlaceholder.size(), symbol);
    return out;
}

ChartConfig ChartConfig::fromSettings(const QSettings& settings) {
    ChartConfig config;
    config.api.host = settings.value("api/host", QString::fromStdString(config.api.host)).toString().toStdString();
    config.api.port = settings.value("api/port", config.api.port).toInt();
    config.api.target = settings.value("api/target", QString::fromStdString(config.api.target)).toString().toStdString();
    config.api.tls = settings.value("api/tls", config.api.tls).toBool();
    config.api.timeoutSeconds = settings.value("api/timeoutSeconds", config.api.timeoutSeconds).toInt();

    config.priceHeight = settings.value("chart/priceHeight", kDefaultPriceHeight).toInt();
    config.oscillatorHeight = settings.value("chart/oscillatorHeight", kDefaultOscillatorHeight).toInt();
    config.defaultSymbol = settings.value("chart/defaultSymbol").toString().trimmed().toUpper();
    config.theme = settings.value("ui/theme", config.theme).toString();

    if (config.priceHeight <= 0) {
        cwLog_Warning("chart/priceHeight must be positive, using" << kDefaultPriceHeight);
        config.priceHeight = kDefaultPriceHeight;
    }
    if (config.oscillatorHeight <= 0) {
        cwLog_Warning("chart/oscillatorHeight must be positive, using" << kDefaultOscillatorHeight);
        config.oscillatorHeight = kDefaultOscillatorHeight;
    }
    if (config.api.timeoutSeconds <= 0) config.api.timeoutSeconds = 15;
    return config;
}

ChartConfig ChartConfig::load(const QString& path) {
    QSettings settings(path, QSettings::IniFormat);
    ChartConfig config = fromSettings(settings);
    config.applyEnvironment();
    cwLog_App("Config loaded from" << path << "api" << QString::fromStdString(config.api.host)
              << config.api.port << (config.api.tls ? "tls" : "plain"));
    return config;
}

void ChartConfig::applyEnvironment() {
    const QString host = qEnvironmentVariable("CHARTWELL_API_HOST");
    if (!host.isEmpty()) api.host = host.toStdString();

    bool ok = false;
    const int port = qEnvironmentVariableIntValue("CHARTWELL_API_PORT", &ok);
    if (ok && port > 0) api.port = port;

    const QString tls = qEnvironmentVariable("CHARTWELL_API_TLS").toLower();
    if (!tls.isEmpty()) api.tls = (tls == "1" || tls == "true" || tls == "yes");

    const QString symbol = qEnvironmentVariable("CHARTWELL_DEFAULT_SYMBOL");
    if (!symbol.isEmpty()) defaultSymbol = symbol.trimmed().toUpper();
}
