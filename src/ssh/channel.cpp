#include "channel.hpp"

std::unique_ptr<ForwardChannel> ChannelQueue::push(std::unique_ptr<ForwardChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return channel;
    pending_.push_back(std::move(channel));
    cv_.notify_one();
    return nullptr;
}

std::unique_ptr<ForwardChannel> ChannelQueue::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !pending_.empty(); });
    if (pending_.empty()) return nullptr;
    auto channel = std::move(pending_.front());
    pending_.pop_front();
    return channel;
}

void ChannelQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

bool ChannelQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
