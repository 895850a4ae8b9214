/*
CandleView — Candle
Role: Plain OHLC bar received from the data pipeline, one per time bucket.
Inputs/Outputs: Value type; sequences are passed as const std::vector<Candle>&.
Threading: Immutable snapshots, safe to read from any thread.
Assumptions: Times are unique and non-decreasing within a sequence (not enforced).
*/
#pragma once
#include <QtGlobal>
#include <unordered_set>
#include <vector>

struct Candle {
    qint64 time = 0;     // seconds since epoch
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
};

using CandleSeries = std::vector<Candle>;

// Candle times that open a new UTC calendar day
using DayBoundarySet = std::unordered_set<qint64>;
