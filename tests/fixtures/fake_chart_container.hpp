#pragma once
#include "ChartContainer.h"

/// Container stand-in whose size and attachment are driven by the test
class FakeChartContainer : public ChartContainer {
public:
    explicit FakeChartContainer(int width = 800, bool attached = true)
        : width_(width)
        , attached_(attached)
    {}

    bool isAttached() const override { return attached_; }
    int width() const override { return width_; }

    void resize(int width, int height) {
        width_ = width;
        emit resized(width, height);
    }

    void setAttached(bool attached) { attached_ = attached; }

    /// The region went away underneath the chart
    void lose() {
        attached_ = false;
        emit lost();
    }

private:
    int width_;
    bool attached_;
};
