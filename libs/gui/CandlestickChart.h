/*
CandleView — CandlestickChart
Role: Caller-facing chart binding: mount into a container, feed candle snapshots, read the view state.
Inputs/Outputs: mount()/unmount(), update(candles, symbol), resetView(); exposes hasData and the crosshair readout.
Threading: Lives on the main GUI thread; every stimulus runs to completion before the next.
Integration: Composes ChartController, DataSynchronizer, CrosshairTracker and ViewResetPolicy.
Observability: Components log through the candleview.* categories.
Related: CandlestickChart.cpp, ChartController.h, DataSynchronizer.h, CrosshairTracker.h, ViewResetPolicy.h.
Assumptions: The engine factory outlives the chart.
*/
#pragma once
#include <QObject>
#include <QString>
#include <optional>
#include "Candle.h"
#include "ChartController.h"
#include "CrosshairTracker.h"
#include "DataSynchronizer.h"
#include "ViewResetPolicy.h"

struct ViewState {
    bool hasData = false;
    std::optional<QString> crosshairTime;
    std::optional<double> crosshairX;
};

class CandlestickChart : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool hasData READ hasData NOTIFY hasDataChanged)

public:
    explicit CandlestickChart(IChartEngineFactory& factory,
                              ChartConfig config = ChartConfig::fromEnvironment(),
                              QObject* parent = nullptr);
    ~CandlestickChart() override;

    // Mounts and replays the last snapshot, if any. False when the container is not ready,
    // in which case a current mount stays live.
    bool mount(ChartContainer* container);
    void unmount();

    // One reconciliation pass for a new snapshot and/or symbol
    void update(const CandleSeries& candles, const QString& symbol);

    Q_INVOKABLE void resetView();

    bool hasData() const { return m_hasData; }
    const std::optional<QString>& crosshairTime() const { return m_crosshair.crosshairTime(); }
    const std::optional<double>& crosshairX() const { return m_crosshair.crosshairX(); }
    ViewState viewState() const;

    ChartController& controller() { return m_controller; }

signals:
    void hasDataChanged(bool hasData);
    void crosshairChanged();

private slots:
    void onUnmounted();

private:
    void synchronize();
    void setHasData(bool hasData);

    ChartController m_controller;
    ViewResetPolicy m_resetPolicy;
    DataSynchronizer m_synchronizer;
    CrosshairTracker m_crosshair;

    CandleSeries m_candles;
    QString m_symbol;
    bool m_hasData = false;
};
