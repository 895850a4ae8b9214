/*
CandleView — ChartController
Role: Implements engine creation, resize forwarding and ordered teardown.
Inputs/Outputs: Builds ChartOptions from ChartConfig + theme palette; wires container signals.
Threading: All code is executed on the main GUI thread.
Observability: cvLog_App for lifecycle, cvLog_Render for resize.
Related: ChartController.h.
Assumptions: Connections are made only after the engine is fully set up, so a failed mount leaves none behind.
*/
#include "ChartController.h"
#include "CandleViewLogging.hpp"
#include <QScopeGuard>
#include <utility>

ChartController::ChartController(IChartEngineFactory& factory, ChartConfig config, QObject* parent)
    : QObject(parent)
    , m_factory(factory)
    , m_config(std::move(config))
    , m_formatter(m_config.displayZone())
{
}

ChartController::~ChartController() {
    unmount();
}

IChartEngine* ChartController::mount(ChartContainer* container, IChartEngine::PointerMoveCb onPointerMove) {
    if (!container || !container->isAttached()) {
        cvLog_Warning("ChartController: Container not attached - mount skipped");
        return nullptr;
    }

    if (isMounted()) {
        unmount();
    }

    const ChartOptions options = buildChartOptions(container->width());
    std::unique_ptr<IChartEngine> engine = m_factory.create(*container, options);
    if (!engine) {
        cvLog_Warning("ChartController: Engine factory returned no engine");
        return nullptr;
    }

    // Undo the half-built engine on any early exit below
    auto removeEngine = qScopeGuard([&engine]() { engine->remove(); });

    ICandlestickSeries* series = engine->addCandlestickSeries(buildSeriesOptions());
    if (!series) {
        cvLog_Warning("ChartController: Engine refused the candlestick series");
        return nullptr;
    }

    std::optional<IChartEngine::SubscriptionId> subscription;
    if (onPointerMove) {
        subscription = engine->subscribePointerMove(std::move(onPointerMove));
    }

    removeEngine.dismiss();

    m_state.engine = std::move(engine);
    m_state.series = series;
    m_state.pointerSubscription = subscription;
    m_state.resizeConnection = connect(container, &ChartContainer::resized,
                                       this, &ChartController::onContainerResized);
    m_state.lostConnection = connect(container, &ChartContainer::lost,
                                     this, &ChartController::unmount);
    // The engine was created against this container and must not outlive it
    m_state.destroyedConnection = connect(container, &QObject::destroyed,
                                          this, &ChartController::unmount);

    cvLog_App("ChartController: Mounted" << options.width << "x" << options.height
              << "theme" << m_config.themeId);
    emit mounted();
    return m_state.engine.get();
}

void ChartController::unmount() {
    if (!m_state.engine) return;

    QObject::disconnect(m_state.resizeConnection);
    QObject::disconnect(m_state.lostConnection);
    QObject::disconnect(m_state.destroyedConnection);
    if (m_state.pointerSubscription) {
        m_state.engine->unsubscribePointerMove(*m_state.pointerSubscription);
    }

    // Null the handle before disposing so nothing can reach a dying engine
    std::unique_ptr<IChartEngine> engine = std::move(m_state.engine);
    m_state = ChartState{};
    engine->remove();

    cvLog_App("ChartController: Unmounted");
    emit unmounted();
}

void ChartController::onContainerResized(int width, int height) {
    Q_UNUSED(height)  // chart height is fixed by config
    if (!m_state.engine) return;

    m_state.engine->applyWidth(width);
    cvLog_Render("ChartController: Applied width" << width);
}

ChartOptions ChartController::buildChartOptions(int width) const {
    const ChartPalette palette = m_themes.resolve(m_config.themeId).palette();

    ChartOptions options;
    options.width = width;
    options.height = m_config.height;

    options.backgroundColor = palette.background;
    options.textColor = palette.text;
    options.vertGridColor = palette.gridLines;
    options.horzGridColor = palette.gridLines;

    options.crosshairMode = CrosshairMode::Normal;
    options.crosshairVertLabelVisible = m_config.crosshairVertLabelVisible;
    options.crosshairHorzLabelVisible = m_config.crosshairHorzLabelVisible;

    options.priceScaleBorderColor = palette.scaleBorder;
    options.priceScaleMarginTop = m_config.priceScaleMarginTop;
    options.priceScaleMarginBottom = m_config.priceScaleMarginBottom;
    options.priceScaleVisible = true;

    options.timeScaleBorderColor = palette.scaleBorder;
    options.timeVisible = true;
    options.tickMarkMaxCharacterLength = m_config.tickMarkMaxCharacterLength;
    // Reads the boundary set of the current pass; the engine dies before this controller does
    options.tickMarkFormatter = [this](qint64 time) {
        return m_formatter.tickLabel(time, m_state.dayBoundaries.count(time) > 0);
    };

    options.scrollMouseWheel = m_config.scrollMouseWheel;
    options.scrollPressedMouseMove = m_config.scrollPressedMouseMove;
    options.scrollHorzTouchDrag = m_config.scrollHorzTouchDrag;
    return options;
}

CandlestickSeriesOptions ChartController::buildSeriesOptions() const {
    const ChartPalette palette = m_themes.resolve(m_config.themeId).palette();

    CandlestickSeriesOptions options;
    options.upColor = palette.candleUp;
    options.downColor = palette.candleDown;
    options.wickUpColor = palette.wickUp;
    options.wickDownColor = palette.wickDown;
    options.borderVisible = palette.candleBorderVisible;
    return options;
}
