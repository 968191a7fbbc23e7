#pragma once

#include <functional>
#include <memory>
#include <optional>

namespace lnt::sync {

// One live server-side subscription. read() is called from a single thread;
// cancel() may be called from any thread and must unblock a pending read().
template <typename T>
class UpstreamStream {
public:
    virtual ~UpstreamStream() = default;

    // Blocks for the next item. std::nullopt means the server closed the stream
    // cleanly; failures are thrown.
    virtual std::optional<T> read() = 0;

    virtual void cancel() = 0;
};

template <typename T>
using OpenStream = std::function<std::unique_ptr<UpstreamStream<T>>()>;

}  // namespace lnt::sync
