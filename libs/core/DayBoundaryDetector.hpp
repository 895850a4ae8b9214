#pragma once
#include "Candle.h"

/**
 * DayBoundaryDetector - Finds the first candle of every UTC calendar day
 *
 * A candle is a boundary when its UTC date differs from the date of the
 * candle immediately before it. The first candle is always a boundary.
 * Input is expected in ascending time order and is never re-sorted; an
 * unsorted sequence still yields a subset of the candle times, just not a
 * meaningful one.
 */
class DayBoundaryDetector {
public:
    static DayBoundarySet detect(const CandleSeries& candles);
};
