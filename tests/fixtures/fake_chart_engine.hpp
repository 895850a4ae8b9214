#pragma once
#include "engine/IChartEngine.hpp"
#include "ChartContainer.h"
#include <QString>
#include <map>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

/// Everything a FakeChartEngine did, kept alive after the engine itself is destroyed
struct FakeEngineLog {
    struct Viewport {
        qint64 from = 0;
        qint64 to = 0;
        bool autoScale = true;
        bool operator==(const Viewport& o) const { return from == o.from && to == o.to && autoScale == o.autoScale; }
    };

    int created = 0;
    int removed = 0;
    std::vector<ChartOptions> chartOptions;
    std::vector<CandlestickSeriesOptions> seriesOptions;
    std::vector<std::vector<CandlestickBar>> setDataCalls;
    std::vector<int> appliedWidths;
    int fitContentCalls = 0;
    std::vector<std::pair<QString, PriceScaleOptions>> priceScaleCalls;
    int subscribeCalls = 0;
    int unsubscribeCalls = 0;
    int subscribersAtRemove = -1;   // callbacks still registered when remove() ran
    Viewport viewport;

    int resetCount() const { return fitContentCalls; }
};

/// Recording rendering engine for tests: no pixels, only call history and a toy viewport
class FakeChartEngine : public IChartEngine {
public:
    explicit FakeChartEngine(std::shared_ptr<FakeEngineLog> log, bool refuseSeries = false)
        : log_(std::move(log))
        , series_(*this)
        , timeScale_(*this)
        , priceScale_(*this)
        , refuseSeries_(refuseSeries)
    {}

    ICandlestickSeries* addCandlestickSeries(const CandlestickSeriesOptions& options) override {
        if (refuseSeries_) return nullptr;
        log_->seriesOptions.push_back(options);
        return &series_;
    }

    SubscriptionId subscribePointerMove(PointerMoveCb callback) override {
        ++log_->subscribeCalls;
        const SubscriptionId id = nextId_++;
        callbacks_[id] = std::move(callback);
        return id;
    }

    void unsubscribePointerMove(SubscriptionId id) override {
        ++log_->unsubscribeCalls;
        callbacks_.erase(id);
    }

    void applyWidth(int width) override {
        log_->appliedWidths.push_back(width);
    }

    ITimeScale& timeScale() override { return timeScale_; }

    IPriceScale& priceScale(const QString& id) override {
        priceScale_.id = id;
        return priceScale_;
    }

    void remove() override {
        ++log_->removed;
        log_->subscribersAtRemove = static_cast<int>(callbacks_.size());
        callbacks_.clear();
    }

    /// Simulate the user moving the pointer over the chart
    void movePointer(const PointerMoveEvent& event) {
        for (const auto& [id, cb] : callbacks_) {
            cb(event);
        }
    }

    /// Simulate a user pan: shifts the range and turns autoscale off
    void panBy(qint64 seconds) {
        log_->viewport.from += seconds;
        log_->viewport.to += seconds;
        log_->viewport.autoScale = false;
    }

    std::size_t subscriberCount() const { return callbacks_.size(); }

    /// Ask the time axis for a label the way a real engine would
    QString tickLabel(qint64 time) const {
        return log_->chartOptions.back().tickMarkFormatter(time);
    }

private:
    struct Series : ICandlestickSeries {
        explicit Series(FakeChartEngine& e) : engine(e) {}
        void setData(const std::vector<CandlestickBar>& bars) override {
            engine.log_->setDataCalls.push_back(bars);
            engine.bars_ = bars;
        }
        FakeChartEngine& engine;
    };

    struct TimeScale : ITimeScale {
        explicit TimeScale(FakeChartEngine& e) : engine(e) {}
        void fitContent() override {
            auto& log = *engine.log_;
            ++log.fitContentCalls;
            if (!engine.bars_.empty()) {
                log.viewport.from = engine.bars_.front().time;
                log.viewport.to = engine.bars_.back().time;
            }
        }
        FakeChartEngine& engine;
    };

    struct PriceScale : IPriceScale {
        explicit PriceScale(FakeChartEngine& e) : engine(e) {}
        void applyOptions(const PriceScaleOptions& options) override {
            engine.log_->priceScaleCalls.emplace_back(id, options);
            if (options.autoScale) engine.log_->viewport.autoScale = *options.autoScale;
        }
        FakeChartEngine& engine;
        QString id;
    };

    std::shared_ptr<FakeEngineLog> log_;
    Series series_;
    TimeScale timeScale_;
    PriceScale priceScale_;
    bool refuseSeries_;
    std::vector<CandlestickBar> bars_;
    std::map<SubscriptionId, PointerMoveCb> callbacks_;
    SubscriptionId nextId_ = 1;
};

/// Factory handing out FakeChartEngines; can be told to fail
class FakeChartEngineFactory : public IChartEngineFactory {
public:
    std::unique_ptr<IChartEngine> create(ChartContainer& container, const ChartOptions& options) override {
        (void)container;
        if (throwOnCreate_) {
            throw std::runtime_error("FakeChartEngineFactory: engine construction failed");
        }
        ++log->created;
        log->chartOptions.push_back(options);
        auto engine = std::make_unique<FakeChartEngine>(log, refuseSeries_);
        last_ = engine.get();
        return engine;
    }

    void setThrowOnCreate(bool shouldThrow) { throwOnCreate_ = shouldThrow; }
    void setRefuseSeries(bool refuse) { refuseSeries_ = refuse; }

    /// Most recently created engine; only valid while it is mounted
    FakeChartEngine* lastEngine() const { return last_; }

    std::shared_ptr<FakeEngineLog> log = std::make_shared<FakeEngineLog>();

private:
    bool throwOnCreate_ = false;
    bool refuseSeries_ = false;
    FakeChartEngine* last_ = nullptr;
};
