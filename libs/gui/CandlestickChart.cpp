#include "CandlestickChart.h"
#include "CandleViewLogging.hpp"
#include <utility>

CandlestickChart::CandlestickChart(IChartEngineFactory& factory, ChartConfig config, QObject* parent)
    : QObject(parent)
    , m_controller(factory, std::move(config))
    , m_resetPolicy(m_controller)
    , m_synchronizer(m_controller, m_resetPolicy)
    , m_crosshair(m_controller.formatter())
{
    connect(&m_controller, &ChartController::unmounted, this, &CandlestickChart::onUnmounted);
    connect(&m_crosshair, &CrosshairTracker::crosshairChanged, this, &CandlestickChart::crosshairChanged);
}

CandlestickChart::~CandlestickChart() {
    // Tear down while every member is still alive
    disconnect(&m_controller, nullptr, this, nullptr);
    m_controller.unmount();
}

bool CandlestickChart::mount(ChartContainer* container) {
    IChartEngine* engine = m_controller.mount(container, [this](const PointerMoveEvent& event) {
        m_crosshair.onPointerMove(event);
    });
    if (!engine) {
        // A refused container keeps an existing mount as it was
        if (!m_controller.isMounted()) {
            setHasData(false);
        }
        return false;
    }

    synchronize();
    return true;
}

void CandlestickChart::unmount() {
    m_controller.unmount();
}

void CandlestickChart::update(const CandleSeries& candles, const QString& symbol) {
    m_candles = candles;
    m_symbol = symbol;
    synchronize();
}

void CandlestickChart::resetView() {
    if (!m_resetPolicy.reset()) {
        cvLog_Debug("CandlestickChart: resetView ignored - not mounted");
    }
}

ViewState CandlestickChart::viewState() const {
    return ViewState{m_hasData, m_crosshair.crosshairTime(), m_crosshair.crosshairX()};
}

void CandlestickChart::onUnmounted() {
    m_crosshair.clear();
    setHasData(false);
}

void CandlestickChart::synchronize() {
    setHasData(m_synchronizer.synchronize(m_candles, m_symbol));
}

void CandlestickChart::setHasData(bool hasData) {
    if (m_hasData == hasData) return;
    m_hasData = hasData;
    emit hasDataChanged(hasData);
}
