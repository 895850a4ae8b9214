#pragma once
#include <QLocale>
#include <QString>
#include <QTimeZone>

/**
 * TimeFormatter - Axis and crosshair labels for candle timestamps
 *
 * Day-boundary ticks read "Nov 14", intraday ticks read "10:13 PM" and the
 * crosshair readout reads "Nov 14, 2023 10:13 PM". Month and AM/PM names are
 * always English; the display zone is fixed at construction so the same
 * timestamp always renders the same text.
 */
class TimeFormatter {
public:
    explicit TimeFormatter(QTimeZone displayZone = QTimeZone::utc());

    QString tickLabel(qint64 time, bool isDayBoundary) const;
    QString crosshairLabel(qint64 time) const;

    const QTimeZone& displayZone() const { return m_zone; }

private:
    QString format(qint64 time, const QString& pattern) const;

    QTimeZone m_zone;
    QLocale m_locale{QLocale::English, QLocale::UnitedStates};
};
