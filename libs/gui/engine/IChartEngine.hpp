/*
CandleView — IChartEngine
Role: Capability interface of the external rendering engine (series, scales, pointer events, sizing).
Inputs/Outputs: Receives ChartOptions/bars from the controller; reports pointer moves through callbacks.
Threading: GUI thread only; callbacks are invoked synchronously on that thread.
Integration: ChartController owns the engine; tests substitute FakeChartEngine.
Related: ChartOptions.hpp, ChartController.h, tests/fixtures/fake_chart_engine.hpp.
Assumptions: After remove() the engine never invokes a callback again.
*/
#pragma once
#include "ChartOptions.hpp"
#include <QString>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

class ChartContainer;

class ICandlestickSeries {
public:
    virtual ~ICandlestickSeries() = default;

    // Replaces the whole series content
    virtual void setData(const std::vector<CandlestickBar>& bars) = 0;
};

class ITimeScale {
public:
    virtual ~ITimeScale() = default;
    virtual void fitContent() = 0;
};

class IPriceScale {
public:
    virtual ~IPriceScale() = default;
    virtual void applyOptions(const PriceScaleOptions& options) = 0;
};

class IChartEngine {
public:
    using PointerMoveCb = std::function<void(const PointerMoveEvent&)>;
    using SubscriptionId = std::uint64_t;

    virtual ~IChartEngine() = default;

    // Series stay owned by the engine and die with it
    virtual ICandlestickSeries* addCandlestickSeries(const CandlestickSeriesOptions& options) = 0;

    virtual SubscriptionId subscribePointerMove(PointerMoveCb callback) = 0;
    virtual void unsubscribePointerMove(SubscriptionId id) = 0;

    virtual void applyWidth(int width) = 0;

    virtual ITimeScale& timeScale() = 0;
    virtual IPriceScale& priceScale(const QString& id) = 0;

    // Releases native resources; no other call is valid afterwards
    virtual void remove() = 0;
};

class IChartEngineFactory {
public:
    virtual ~IChartEngineFactory() = default;

    // Failures propagate as exceptions; the caller does not catch them
    virtual std::unique_ptr<IChartEngine> create(ChartContainer& container, const ChartOptions& options) = 0;
};
