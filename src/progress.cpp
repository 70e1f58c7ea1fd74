#include "wincloud/progress.hpp"

#include <utility>

namespace wincloud {

std::string_view ToString(const ProgressStage stage) {
    switch (stage) {
        case ProgressStage::Compressing:
            return "compressing";
        case ProgressStage::Uploading:
            return "uploading";
        case ProgressStage::Writing:
            return "writing";
        case ProgressStage::Reading:
            return "reading";
        case ProgressStage::Downloading:
            return "downloading";
        case ProgressStage::Reassembling:
            return "reassembling";
        case ProgressStage::Done:
            return "done";
    }
    return "unknown";
}

void ProgressChannel::Publish(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void ProgressChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<ProgressEvent> ProgressChannel::TryNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::WaitNext(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void ProgressChannel::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    closed_ = false;
}

}  // namespace wincloud
