/*
CandleView — ChartConfig
Role: Implements JSON/file/environment loading of chart settings.
Inputs/Outputs: Reads a JSON object such as {"height": 420, "theme": "dark", "timeZone": "America/New_York"}.
Threading: Executes on the calling thread.
Observability: Loading failures from the environment path are logged, not thrown.
Related: ChartConfig.hpp.
*/
#include "ChartConfig.hpp"
#include "CandleViewLogging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

QString stringOr(const nlohmann::json& j, const char* key, const QString& fallback) {
    if (!j.contains(key) || !j.at(key).is_string()) return fallback;
    return QString::fromStdString(j.at(key).get<std::string>());
}

} // namespace

QTimeZone ChartConfig::displayZone() const {
    if (displayTimeZone.isEmpty() || displayTimeZone == QLatin1String("UTC")) {
        return QTimeZone::utc();
    }

    QTimeZone zone(displayTimeZone.toUtf8());
    if (!zone.isValid()) {
        cvLog_Warning("ChartConfig: Unknown time zone" << displayTimeZone << "- using UTC");
        return QTimeZone::utc();
    }
    return zone;
}

ChartConfig ChartConfig::fromJson(const nlohmann::json& j) {
    ChartConfig config;
    if (!j.is_object()) return config;

    config.height = j.value("height", config.height);
    config.themeId = stringOr(j, "theme", config.themeId);
    config.priceScaleId = stringOr(j, "priceScaleId", config.priceScaleId);
    config.displayTimeZone = stringOr(j, "timeZone", config.displayTimeZone);
    config.tickMarkMaxCharacterLength = j.value("tickMarkMaxCharacterLength", config.tickMarkMaxCharacterLength);

    if (j.contains("priceScaleMargins")) {
        const auto& margins = j.at("priceScaleMargins");
        config.priceScaleMarginTop = margins.value("top", config.priceScaleMarginTop);
        config.priceScaleMarginBottom = margins.value("bottom", config.priceScaleMarginBottom);
    }

    if (j.contains("crosshair")) {
        const auto& crosshair = j.at("crosshair");
        config.crosshairVertLabelVisible = crosshair.value("vertLabelVisible", config.crosshairVertLabelVisible);
        config.crosshairHorzLabelVisible = crosshair.value("horzLabelVisible", config.crosshairHorzLabelVisible);
    }

    if (j.contains("handleScroll")) {
        const auto& scroll = j.at("handleScroll");
        config.scrollMouseWheel = scroll.value("mouseWheel", config.scrollMouseWheel);
        config.scrollPressedMouseMove = scroll.value("pressedMouseMove", config.scrollPressedMouseMove);
        config.scrollHorzTouchDrag = scroll.value("horzTouchDrag", config.scrollHorzTouchDrag);
    }

    if (config.height <= 0) {
        throw std::runtime_error("ChartConfig: 'height' must be positive");
    }
    return config;
}

ChartConfig ChartConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("ChartConfig: Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    }
    catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("ChartConfig: Failed to parse JSON from config file: " + std::string(ex.what()));
    }

    try {
        return fromJson(j);
    }
    catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("ChartConfig: Invalid value in config file: " + std::string(ex.what()));
    }
}

ChartConfig ChartConfig::fromEnvironment() {
    const char* path = std::getenv(kConfigEnvVar);
    if (!path || !*path) {
        return ChartConfig{};
    }

    try {
        ChartConfig config = loadFile(path);
        cvLog_App("ChartConfig: Loaded" << path);
        return config;
    }
    catch (const std::runtime_error& ex) {
        cvLog_Warning("ChartConfig:" << ex.what() << "- using defaults");
        return ChartConfig{};
    }
}
