#include "DayBoundaryDetector.hpp"
#include "CandleViewLogging.hpp"
#include <QDate>
#include <QDateTime>
#include <QTimeZone>

DayBoundarySet DayBoundaryDetector::detect(const CandleSeries& candles) {
    DayBoundarySet boundaries;

    QDate lastDay;  // invalid until the first candle
    for (const auto& candle : candles) {
        const QDate day = QDateTime::fromSecsSinceEpoch(candle.time, QTimeZone::utc()).date();
        if (!lastDay.isValid() || day != lastDay) {
            boundaries.insert(candle.time);
            lastDay = day;
        }
    }

    cvLog_Debug("DayBoundaryDetector:" << boundaries.size() << "boundaries in" << candles.size() << "candles");
    return boundaries;
}
