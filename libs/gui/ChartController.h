/*
CandleView — ChartController
Role: Owns the rendering-engine instance bound to a container: creation, resize adaptation, teardown.
Inputs/Outputs: mount()/unmount() from the caller; container resized()/lost()/destroyed() signals; exposes the engine handle.
Threading: Lives on the main GUI thread; all methods and slots run there.
Performance: Mount/unmount are one-off; resize only forwards the new width.
Integration: DataSynchronizer, CrosshairTracker and ViewResetPolicy reach the engine through this class.
Observability: Logs mount/unmount via cvLog_App and resizes via cvLog_Render.
Related: ChartController.cpp, ChartContainer.h, engine/IChartEngine.hpp, CandlestickChart.h.
Assumptions: The engine factory outlives the controller.
*/
#pragma once
#include <QMetaObject>
#include <QObject>
#include <QString>
#include <memory>
#include <optional>
#include "Candle.h"
#include "ChartConfig.hpp"
#include "ChartContainer.h"
#include "TimeFormatter.hpp"
#include "engine/IChartEngine.hpp"
#include "themes/ChartThemeRegistry.hpp"

// Everything that lives exactly as long as one mount
struct ChartState {
    std::unique_ptr<IChartEngine> engine;
    ICandlestickSeries* series = nullptr;
    std::optional<IChartEngine::SubscriptionId> pointerSubscription;
    QMetaObject::Connection resizeConnection;
    QMetaObject::Connection lostConnection;
    QMetaObject::Connection destroyedConnection;

    std::optional<QString> previousSymbol;
    DayBoundarySet dayBoundaries;
};

class ChartController : public QObject {
    Q_OBJECT
public:
    explicit ChartController(IChartEngineFactory& factory, ChartConfig config = ChartConfig{}, QObject* parent = nullptr);
    ~ChartController() override;

    // Returns the live engine, or nullptr when the container is absent/unattached.
    // An absent/unattached container leaves any current mount untouched.
    // Engine factory exceptions propagate unchanged.
    IChartEngine* mount(ChartContainer* container, IChartEngine::PointerMoveCb onPointerMove = {});

    bool isMounted() const { return m_state.engine != nullptr; }
    IChartEngine* engine() const { return m_state.engine.get(); }
    ICandlestickSeries* series() const { return m_state.series; }

    const DayBoundarySet& dayBoundaries() const { return m_state.dayBoundaries; }
    void setDayBoundaries(DayBoundarySet boundaries) { m_state.dayBoundaries = std::move(boundaries); }

    const std::optional<QString>& previousSymbol() const { return m_state.previousSymbol; }
    void recordSymbol(const QString& symbol) { m_state.previousSymbol = symbol; }

    const ChartConfig& config() const { return m_config; }
    const TimeFormatter& formatter() const { return m_formatter; }
    ChartThemeRegistry& themes() { return m_themes; }

    ChartOptions buildChartOptions(int width) const;
    CandlestickSeriesOptions buildSeriesOptions() const;

public slots:
    // Safe to call at any time, including before a successful mount
    void unmount();

signals:
    void mounted();
    void unmounted();

private slots:
    void onContainerResized(int width, int height);

private:
    IChartEngineFactory& m_factory;
    ChartConfig m_config;
    TimeFormatter m_formatter;
    ChartThemeRegistry m_themes;
    ChartState m_state;
};
