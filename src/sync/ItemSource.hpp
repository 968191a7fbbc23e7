#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace lnt::sync {

// Pull-based lazy sequence, iterated by a single consumer thread.
template <typename V>
class ItemSource {
public:
    virtual ~ItemSource() = default;

    // Next item, or std::nullopt once the sequence is finished.
    virtual std::optional<V> next() = 0;

    // Stops the sequence early; further next() calls return std::nullopt.
    virtual void close() {}
};

template <typename V>
using ItemSourcePtr = std::unique_ptr<ItemSource<V>>;

template <typename V>
class VectorSource : public ItemSource<V> {
public:
    explicit VectorSource(std::vector<V> items) : items_(items.begin(), items.end()) {}

    std::optional<V> next() override {
        if (items_.empty()) {
            return std::nullopt;
        }
        V item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() override { items_.clear(); }

private:
    std::deque<V> items_;
};

// Maps every input item to zero or more outputs. A converter exception skips
// that single item.
template <typename In, typename Out>
class ConvertingSource : public ItemSource<Out> {
public:
    using Convert = std::function<std::vector<Out>(const In&)>;

    ConvertingSource(ItemSourcePtr<In> inner, Convert convert, std::string name)
        : inner_(std::move(inner)), convert_(std::move(convert)), name_(std::move(name)) {}

    std::optional<Out> next() override {
        while (pending_.empty()) {
            if (!inner_) {
                return std::nullopt;
            }
            auto item = inner_->next();
            if (!item) {
                return std::nullopt;
            }
            try {
                auto converted = convert_(*item);
                for (auto& value : converted) {
                    pending_.push_back(std::move(value));
                }
            } catch (const std::exception& ex) {
                lnt::common::metrics::Registry::instance().incrementCounter("conversion_errors_total");
                LOG_WARN(name_ << ": skipping item that failed to convert: " << ex.what());
            }
        }
        Out value = std::move(pending_.front());
        pending_.pop_front();
        return value;
    }

    void close() override {
        pending_.clear();
        if (inner_) {
            inner_->close();
            inner_.reset();
        }
    }

private:
    ItemSourcePtr<In> inner_;
    Convert convert_;
    std::string name_;
    std::deque<Out> pending_;
};

// Logs progress of the wrapped sequence every `every` items.
template <typename V>
class StreamLogger : public ItemSource<V> {
public:
    StreamLogger(ItemSourcePtr<V> inner, std::string name, std::size_t every = 100)
        : inner_(std::move(inner)), name_(std::move(name)), every_(every == 0U ? 1U : every) {}

    ~StreamLogger() override {
        if (count_ > 0U) {
            LOG_INFO(name_ << ": stream finished after " << count_ << " items");
        }
    }

    std::optional<V> next() override {
        auto item = inner_->next();
        if (item) {
            ++count_;
            if (count_ % every_ == 0U) {
                LOG_INFO(name_ << ": " << count_ << " items processed");
            }
        }
        return item;
    }

    void close() override { inner_->close(); }

    std::size_t count() const noexcept { return count_; }

private:
    ItemSourcePtr<V> inner_;
    std::string name_;
    std::size_t every_;
    std::size_t count_{0};
};

}  // namespace lnt::sync
