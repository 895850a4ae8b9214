/*
CandleView — TimeFormatter Tests
Role: Pin the exact axis and crosshair strings
Coverage: Day labels, 12-hour intraday labels, midnight/noon, crosshair readout, display zone
*/
#include <gtest/gtest.h>
#include "TimeFormatter.hpp"
#include <QRegularExpression>

namespace {
const QRegularExpression kTimeOfDay(QStringLiteral("^\\d{1,2}:\\d{2} (AM|PM)$"));
const QRegularExpression kMonthDay(QStringLiteral("^[A-Z][a-z]{2} \\d{1,2}$"));
}

TEST(TimeFormatter, DayBoundaryTickIsMonthAndDay) {
    TimeFormatter fmt;
    EXPECT_EQ(fmt.tickLabel(1700000000, true), "Nov 14");
    EXPECT_EQ(fmt.tickLabel(1700086400, true), "Nov 15");
    EXPECT_EQ(fmt.tickLabel(1704067200, true), "Jan 1");   // 2024-01-01 00:00 UTC
}

TEST(TimeFormatter, IntradayTickIsTwelveHourClock) {
    TimeFormatter fmt;
    EXPECT_EQ(fmt.tickLabel(1700003600, false), "11:13 PM");
    EXPECT_EQ(fmt.tickLabel(1700000000, false), "10:13 PM");
    EXPECT_EQ(fmt.tickLabel(1700000000 - 6 * 3600, false), "4:13 PM");
    EXPECT_EQ(fmt.tickLabel(1700000000 + 3 * 3600, false), "1:13 AM");
}

TEST(TimeFormatter, MidnightAndNoonUseTwelve) {
    TimeFormatter fmt;
    EXPECT_EQ(fmt.tickLabel(1704067200, false), "12:00 AM");          // 00:00 UTC
    EXPECT_EQ(fmt.tickLabel(1704067200 + 12 * 3600, false), "12:00 PM");
    EXPECT_EQ(fmt.tickLabel(1704067200 + 5 * 60, false), "12:05 AM");  // minutes zero-padded
}

TEST(TimeFormatter, BoundaryNeverLooksLikeTimeAndViceVersa) {
    TimeFormatter fmt;
    for (qint64 t = 1700000000; t < 1700000000 + 3 * 86400; t += 1800) {
        const QString day = fmt.tickLabel(t, true);
        const QString time = fmt.tickLabel(t, false);
        EXPECT_TRUE(kMonthDay.match(day).hasMatch()) << day.toStdString();
        EXPECT_FALSE(kTimeOfDay.match(day).hasMatch()) << day.toStdString();
        EXPECT_TRUE(kTimeOfDay.match(time).hasMatch()) << time.toStdString();
        EXPECT_FALSE(kMonthDay.match(time).hasMatch()) << time.toStdString();
    }
}

TEST(TimeFormatter, CrosshairLabelIsFullDateAndTime) {
    TimeFormatter fmt;
    EXPECT_EQ(fmt.crosshairLabel(1700000000), "Nov 14, 2023 10:13 PM");
    EXPECT_EQ(fmt.crosshairLabel(1704067200), "Jan 1, 2024 12:00 AM");
}

TEST(TimeFormatter, DisplayZoneShiftsLabels) {
    TimeFormatter tokyo(QTimeZone("Asia/Tokyo"));   // UTC+9, no DST
    EXPECT_EQ(tokyo.tickLabel(1700000000, true), "Nov 15");
    EXPECT_EQ(tokyo.tickLabel(1700000000, false), "7:13 AM");
    EXPECT_EQ(tokyo.crosshairLabel(1700000000), "Nov 15, 2023 7:13 AM");
}

TEST(TimeFormatter, InvalidZoneFallsBackToUtc) {
    TimeFormatter fmt{QTimeZone()};
    EXPECT_EQ(fmt.displayZone(), QTimeZone::utc());
    EXPECT_EQ(fmt.tickLabel(1700003600, false), "11:13 PM");
}
