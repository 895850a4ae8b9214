/*
CandleView — CrosshairTracker
Role: Turns engine pointer-move notifications into the crosshair readout (label + pixel x).
Inputs/Outputs: onPointerMove() from the engine callback; emits crosshairChanged() when the readout changes.
Threading: Main GUI thread; the engine invokes the callback synchronously.
Integration: ChartController owns the subscription; CandlestickChart forwards the readout to callers.
Related: CrosshairTracker.cpp, TimeFormatter.hpp.
*/
#pragma once
#include <QObject>
#include <QString>
#include <optional>
#include "engine/ChartOptions.hpp"

class TimeFormatter;

class CrosshairTracker : public QObject {
    Q_OBJECT
public:
    explicit CrosshairTracker(const TimeFormatter& formatter, QObject* parent = nullptr);

    const std::optional<QString>& crosshairTime() const { return m_time; }
    const std::optional<double>& crosshairX() const { return m_x; }

    void onPointerMove(const PointerMoveEvent& event);
    void clear();

signals:
    void crosshairChanged();

private:
    void update(std::optional<QString> time, std::optional<double> x);

    const TimeFormatter& m_formatter;
    std::optional<QString> m_time;
    std::optional<double> m_x;
};
