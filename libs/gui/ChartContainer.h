/*
CandleView — ChartContainer
Role: The display region a chart is mounted into: reports its width and announces box-size changes.
Inputs/Outputs: Emits resized() on every size change and lost() when the underlying region goes away.
Threading: Lives on the main GUI thread.
Integration: ChartController connects to resized()/lost() on mount and disconnects on unmount.
Related: ChartContainer.cpp, ChartController.h.
Assumptions: A container that is not attached must not be mounted into.
*/
#pragma once
#include <QObject>
#include <QPointer>
#include <QWidget>

class ChartContainer : public QObject {
    Q_OBJECT
public:
    explicit ChartContainer(QObject* parent = nullptr) : QObject(parent) {}
    ~ChartContainer() override = default;

    virtual bool isAttached() const = 0;
    virtual int width() const = 0;

signals:
    void resized(int width, int height);
    void lost();
};

// Adapts a QWidget: resize events are observed through an event filter
class WidgetChartContainer : public ChartContainer {
    Q_OBJECT
public:
    explicit WidgetChartContainer(QWidget* widget, QObject* parent = nullptr);
    ~WidgetChartContainer() override;

    bool isAttached() const override;
    int width() const override;
    QWidget* widget() const { return m_widget.data(); }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    QPointer<QWidget> m_widget;
};
