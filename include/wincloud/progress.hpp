#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace wincloud {

enum class ProgressStage {
    Compressing,
    Uploading,
    Writing,
    Reading,
    Downloading,
    Reassembling,
    Done
};

std::string_view ToString(ProgressStage stage);

struct ProgressEvent {
    ProgressStage stage = ProgressStage::Compressing;
    int percent = 0;
    std::string message;
};

// Ordered event queue between the engine worker and whoever drives it. Once
// closed, readers drain what is left and then see the end of the stream.
class ProgressChannel {
public:
    void Publish(ProgressEvent event);
    void Close();

    // Non-blocking; empty when nothing is queued.
    std::optional<ProgressEvent> TryNext();

    // Blocks until an event arrives, the channel closes or |timeout| passes.
    std::optional<ProgressEvent> WaitNext(std::chrono::milliseconds timeout);

    bool closed() const;

    // Re-opens a drained channel for the next operation.
    void Reset();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;
};

class CancellationToken {
public:
    void Cancel() {
        cancelled_.store(true);
    }

    void Reset() {
        cancelled_.store(false);
    }

    bool IsCancelled() const {
        return cancelled_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace wincloud
