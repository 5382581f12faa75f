#include "stream_channel.h"
#include <algorithm>
#include <cstring>

bool StreamChannel::write(const std::string& data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finished_) {
            return false;
        }
        if (!data.empty()) {
            pending_.push_back(data);
        }
    }
    cv_.notify_all();
    return true;
}

void StreamChannel::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

size_t StreamChannel::read(char* buffer, size_t max_size) {
    if (max_size == 0) {
        return 0;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !pending_.empty() || finished_ || closed_; });

    size_t copied = 0;
    while (copied < max_size && !pending_.empty()) {
        const std::string& front = pending_.front();
        size_t available = front.size() - front_offset_;
        size_t chunk = std::min(available, max_size - copied);
        std::memcpy(buffer + copied, front.data() + front_offset_, chunk);
        copied += chunk;
        front_offset_ += chunk;
        if (front_offset_ == front.size()) {
            pending_.pop_front();
            front_offset_ = 0;
        }
    }
    return copied;
}

void StreamChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        pending_.clear();
        front_offset_ = 0;
    }
    cv_.notify_all();
}
