#include "ChartContainer.h"
#include "CandleViewLogging.hpp"
#include <QEvent>
#include <QResizeEvent>

WidgetChartContainer::WidgetChartContainer(QWidget* widget, QObject* parent)
    : ChartContainer(parent)
    , m_widget(widget)
{
    if (!m_widget) return;

    m_widget->installEventFilter(this);
    connect(m_widget, &QObject::destroyed, this, [this]() {
        cvLog_App("WidgetChartContainer: Widget destroyed");
        emit lost();
    });
}

WidgetChartContainer::~WidgetChartContainer() {
    if (m_widget) {
        m_widget->removeEventFilter(this);
    }
}

bool WidgetChartContainer::isAttached() const {
    return !m_widget.isNull();
}

int WidgetChartContainer::width() const {
    return m_widget ? m_widget->width() : 0;
}

bool WidgetChartContainer::eventFilter(QObject* watched, QEvent* event) {
    if (watched == m_widget && event->type() == QEvent::Resize) {
        const auto* resize = static_cast<QResizeEvent*>(event);
        cvLog_Render("WidgetChartContainer: Resized to" << resize->size());
        emit resized(resize->size().width(), resize->size().height());
    }
    return ChartContainer::eventFilter(watched, event);
}
