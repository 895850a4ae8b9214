#pragma once

#include <QColor>
#include <QString>

/**
 * Colours handed to the rendering engine when a chart is created.
 */
struct ChartPalette {
    QColor background;
    QColor text;
    QColor gridLines;
    QColor scaleBorder;

    QColor candleUp;
    QColor candleDown;
    QColor wickUp;
    QColor wickDown;
    bool candleBorderVisible = false;
};

/**
 * Interface for chart theme implementations.
 * Each theme provides an id, a display name and a palette.
 */
class IChartTheme {
public:
    virtual ~IChartTheme() = default;

    /**
     * Get the display name of this theme.
     */
    virtual QString name() const = 0;

    /**
     * Get the unique identifier for this theme.
     */
    virtual QString id() const = 0;

    /**
     * Get the colours for this theme.
     */
    virtual ChartPalette palette() const = 0;
};
