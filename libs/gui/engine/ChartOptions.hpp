/*
CandleView — ChartOptions
Role: Value types exchanged with the rendering engine: creation options, series options, bars, pointer events.
Inputs/Outputs: Built by ChartController from ChartConfig and the active theme palette.
Threading: Plain values, GUI thread only.
Related: IChartEngine.hpp, ChartController.h.
*/
#pragma once
#include <QColor>
#include <QPointF>
#include <QString>
#include <functional>
#include <optional>

// Crosshair follows the pointer freely
enum class CrosshairMode {
    Normal
};

struct ChartOptions {
    int width = 0;
    int height = 0;

    // Layout
    QColor backgroundColor;
    QColor textColor;
    QColor vertGridColor;
    QColor horzGridColor;

    // Crosshair
    CrosshairMode crosshairMode = CrosshairMode::Normal;
    bool crosshairVertLabelVisible = false;
    bool crosshairHorzLabelVisible = true;

    // Right price scale
    QColor priceScaleBorderColor;
    double priceScaleMarginTop = 0.1;
    double priceScaleMarginBottom = 0.1;
    bool priceScaleVisible = true;

    // Time scale; the engine calls tickMarkFormatter for every tick it draws
    QColor timeScaleBorderColor;
    bool timeVisible = true;
    int tickMarkMaxCharacterLength = 10;
    std::function<QString(qint64 time)> tickMarkFormatter;

    // Scroll handling
    bool scrollMouseWheel = true;
    bool scrollPressedMouseMove = true;
    bool scrollHorzTouchDrag = true;
};

struct CandlestickSeriesOptions {
    QColor upColor;
    QColor downColor;
    QColor wickUpColor;
    QColor wickDownColor;
    bool borderVisible = false;
};

struct PriceScaleOptions {
    std::optional<bool> autoScale;
};

// Bar in the shape the engine accepts
struct CandlestickBar {
    qint64 time = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
};

// Pointer position reported by the engine. Either field is empty when the
// pointer is outside the plot area or over an axis/empty region.
struct PointerMoveEvent {
    std::optional<QPointF> point;
    std::optional<qint64> time;
};
