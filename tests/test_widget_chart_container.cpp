/*
CandleView — WidgetChartContainer Tests
Role: QWidget adapter forwards resize events and reports widget loss
Testing Strategy: Offscreen QApplication, synthetic QResizeEvent, widget deletion while mounted
*/
#include <gtest/gtest.h>
#include <QApplication>
#include <QResizeEvent>
#include <QWidget>
#include <memory>
#include "CandlestickChart.h"
#include "ChartContainer.h"
#include "fixtures/candle_fixtures.hpp"
#include "fixtures/fake_chart_engine.hpp"

TEST(WidgetChartContainer, ReportsWidgetWidth) {
    QWidget widget;
    widget.resize(640, 300);
    WidgetChartContainer container(&widget);

    EXPECT_TRUE(container.isAttached());
    EXPECT_EQ(container.width(), 640);
    EXPECT_EQ(container.widget(), &widget);
}

TEST(WidgetChartContainer, NullWidgetIsNotAttached) {
    WidgetChartContainer container(nullptr);
    EXPECT_FALSE(container.isAttached());
    EXPECT_EQ(container.width(), 0);
}

TEST(WidgetChartContainer, ResizeEventsAreForwarded) {
    QWidget widget;
    WidgetChartContainer container(&widget);

    std::vector<int> widths;
    QObject::connect(&container, &ChartContainer::resized, [&](int w, int) { widths.push_back(w); });

    QResizeEvent first(QSize(500, 300), QSize(100, 30));
    QCoreApplication::sendEvent(&widget, &first);
    QResizeEvent second(QSize(820, 300), QSize(500, 300));
    QCoreApplication::sendEvent(&widget, &second);

    EXPECT_EQ(widths, (std::vector<int>{500, 820}));
}

TEST(WidgetChartContainer, DestroyedWidgetUnmountsChart) {
    FakeChartEngineFactory factory;
    auto widget = std::make_unique<QWidget>();
    widget->resize(700, 300);
    WidgetChartContainer container(widget.get());
    CandlestickChart chart(factory, ChartConfig{});

    ASSERT_TRUE(chart.mount(&container));
    chart.update(fixtures::twoDays(), "AAPL");
    EXPECT_EQ(factory.log->chartOptions.front().width, 700);
    ASSERT_TRUE(chart.hasData());

    widget.reset();

    EXPECT_FALSE(container.isAttached());
    EXPECT_FALSE(chart.hasData());
    EXPECT_EQ(factory.log->removed, 1);
    EXPECT_FALSE(chart.mount(&container));
}

int main(int argc, char** argv) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
