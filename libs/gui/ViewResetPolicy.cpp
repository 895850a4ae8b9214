#include "ViewResetPolicy.h"
#include "ChartController.h"
#include "CandleViewLogging.hpp"

ViewResetPolicy::ViewResetPolicy(ChartController& controller)
    : m_controller(controller) {
}

bool ViewResetPolicy::reset() {
    IChartEngine* engine = m_controller.engine();
    if (!engine) return false;

    engine->timeScale().fitContent();

    PriceScaleOptions priceOptions;
    priceOptions.autoScale = true;
    engine->priceScale(m_controller.config().priceScaleId).applyOptions(priceOptions);

    cvLog_App("ViewResetPolicy: Fit content and autoscale on" << m_controller.config().priceScaleId);
    return true;
}
