#include "DarkChartTheme.hpp"

ChartPalette DarkChartTheme::palette() const {
    ChartPalette p;
    p.background  = QColor("#1f2937");
    p.text        = QColor("#d1d5db");
    p.gridLines   = QColor("#374151");
    p.scaleBorder = QColor("#9ca3af");

    p.candleUp   = QColor("#10b981");
    p.candleDown = QColor("#ef4444");
    p.wickUp     = QColor("#10b981");
    p.wickDown   = QColor("#ef4444");
    p.candleBorderVisible = false;
    return p;
}
