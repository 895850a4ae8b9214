#pragma once

#include "IChartTheme.hpp"

/**
 * Dark slate theme; the default chart appearance.
 */
class DarkChartTheme : public IChartTheme {
public:
    QString name() const override { return "Dark"; }
    QString id() const override { return "dark"; }
    ChartPalette palette() const override;
};
