/*
CandleView — DataSynchronizer
Role: One reconciliation pass: recompute day boundaries, replace series content, reset view on symbol change.
Inputs/Outputs: Takes a candle snapshot and symbol; returns whether the chart now has data.
Threading: Main GUI thread, invoked by CandlestickChart on every data/symbol update.
Performance: O(n) per pass; boundaries are rebuilt from scratch since snapshots may be wholesale replacements.
Related: DataSynchronizer.cpp, DayBoundaryDetector.hpp, ViewResetPolicy.h.
Assumptions: Candle values are passed through unvalidated.
*/
#pragma once
#include <QString>
#include <vector>
#include "Candle.h"
#include "engine/ChartOptions.hpp"

class ChartController;
class ViewResetPolicy;

class DataSynchronizer {
public:
    DataSynchronizer(ChartController& controller, ViewResetPolicy& resetPolicy);

    // Returns the resulting hasData flag
    bool synchronize(const CandleSeries& candles, const QString& symbol);

    static std::vector<CandlestickBar> toBars(const CandleSeries& candles);

private:
    ChartController& m_controller;
    ViewResetPolicy& m_resetPolicy;
};
