#include "TimeFormatter.hpp"
#include <QDateTime>
#include <utility>

namespace {
const QString kDayPattern = QStringLiteral("MMM d");
const QString kIntradayPattern = QStringLiteral("h:mm AP");   // 12-hour clock, "12" for hour 0 and noon
const QString kCrosshairPattern = QStringLiteral("MMM d, yyyy h:mm AP");
}

TimeFormatter::TimeFormatter(QTimeZone displayZone)
    : m_zone(displayZone.isValid() ? std::move(displayZone) : QTimeZone::utc()) {
}

QString TimeFormatter::tickLabel(qint64 time, bool isDayBoundary) const {
    return format(time, isDayBoundary ? kDayPattern : kIntradayPattern);
}

QString TimeFormatter::crosshairLabel(qint64 time) const {
    return format(time, kCrosshairPattern);
}

QString TimeFormatter::format(qint64 time, const QString& pattern) const {
    const QDateTime dateTime = QDateTime::fromSecsSinceEpoch(time, m_zone);
    return m_locale.toString(dateTime, pattern);
}
