#include "CrosshairTracker.h"
#include "TimeFormatter.hpp"
#include "CandleViewLogging.hpp"
#include <utility>

CrosshairTracker::CrosshairTracker(const TimeFormatter& formatter, QObject* parent)
    : QObject(parent)
    , m_formatter(formatter)
{
}

void CrosshairTracker::onPointerMove(const PointerMoveEvent& event) {
    // Off the plot area, or over an axis / empty region
    if (!event.point || !event.time) {
        clear();
        return;
    }

    update(m_formatter.crosshairLabel(*event.time), event.point->x());
    cvLog_Render("CrosshairTracker:" << *m_time << "at x" << *m_x);
}

void CrosshairTracker::clear() {
    update(std::nullopt, std::nullopt);
}

void CrosshairTracker::update(std::optional<QString> time, std::optional<double> x) {
    if (m_time == time && m_x == x) return;

    m_time = std::move(time);
    m_x = x;
    emit crosshairChanged();
}
