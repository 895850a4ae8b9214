/*
CandleView — ChartConfig
Role: Chart construction settings: fixed height, theme, price scale, display zone, interaction flags.
Inputs/Outputs: Built from defaults, a JSON object, a JSON file, or the CANDLEVIEW_CHART_CONFIG env var.
Threading: Plain value type; read on the GUI thread when a chart is mounted.
Observability: fromEnvironment() and displayZone() log fallbacks via cvLog_Warning.
Related: ChartConfig.cpp, ChartController.h, ChartThemeRegistry.hpp.
Assumptions: Keys missing from the JSON keep their defaults.
*/
#pragma once
#include <QString>
#include <QTimeZone>
#include <nlohmann/json_fwd.hpp>
#include <string>

struct ChartConfig {
    int height = 300;
    QString themeId = QStringLiteral("dark");
    QString priceScaleId = QStringLiteral("right");
    QString displayTimeZone = QStringLiteral("UTC");
    int tickMarkMaxCharacterLength = 10;

    // Price scale margins as a fraction of the pane height
    double priceScaleMarginTop = 0.1;
    double priceScaleMarginBottom = 0.1;

    bool crosshairVertLabelVisible = false;
    bool crosshairHorzLabelVisible = true;

    bool scrollMouseWheel = true;
    bool scrollPressedMouseMove = true;
    bool scrollHorzTouchDrag = true;

    // Resolves displayTimeZone; unknown ids fall back to UTC
    QTimeZone displayZone() const;

    static ChartConfig fromJson(const nlohmann::json& j);

    // Throws std::runtime_error when the file cannot be opened or parsed
    static ChartConfig loadFile(const std::string& path);

    // Reads CANDLEVIEW_CHART_CONFIG; defaults when unset or unreadable
    static ChartConfig fromEnvironment();

    static constexpr const char* kConfigEnvVar = "CANDLEVIEW_CHART_CONFIG";
};
