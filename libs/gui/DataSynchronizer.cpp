#include "DataSynchronizer.h"
#include "ChartController.h"
#include "DayBoundaryDetector.hpp"
#include "ViewResetPolicy.h"
#include "CandleViewLogging.hpp"

DataSynchronizer::DataSynchronizer(ChartController& controller, ViewResetPolicy& resetPolicy)
    : m_controller(controller)
    , m_resetPolicy(resetPolicy)
{
}

bool DataSynchronizer::synchronize(const CandleSeries& candles, const QString& symbol) {
    ICandlestickSeries* series = m_controller.series();
    if (!m_controller.engine() || !series || candles.empty()) {
        cvLog_Data("DataSynchronizer: Nothing to show - mounted:" << m_controller.isMounted()
                   << "candles:" << candles.size());
        return false;
    }

    m_controller.setDayBoundaries(DayBoundaryDetector::detect(candles));
    series->setData(toBars(candles));

    cvLog_Data("DataSynchronizer:" << symbol << candles.size() << "candles,"
               << m_controller.dayBoundaries().size() << "day boundaries");

    const auto& previous = m_controller.previousSymbol();
    if (!previous || *previous != symbol) {
        cvLog_App("DataSynchronizer: Symbol changed" << previous.value_or(QStringLiteral("<none>"))
                  << "->" << symbol);
        m_resetPolicy.reset();
    }
    m_controller.recordSymbol(symbol);

    return true;
}

std::vector<CandlestickBar> DataSynchronizer::toBars(const CandleSeries& candles) {
    std::vector<CandlestickBar> bars;
    bars.reserve(candles.size());
    for (const auto& c : candles) {
        bars.push_back(CandlestickBar{c.time, c.open, c.high, c.low, c.close});
    }
    return bars;
}
