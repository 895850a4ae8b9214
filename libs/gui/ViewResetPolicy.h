#pragma once
#include <QString>

class ChartController;

/**
 * ViewResetPolicy - Fit all loaded data and re-enable price autoscaling
 *
 * Invoked automatically by DataSynchronizer when the symbol changes and
 * manually through CandlestickChart::resetView(). Repeating a reset on the
 * same data leaves the viewport exactly as a single reset does.
 */
class ViewResetPolicy {
public:
    explicit ViewResetPolicy(ChartController& controller);

    // Returns false (and does nothing) when no engine is mounted
    bool reset();

private:
    ChartController& m_controller;
};
