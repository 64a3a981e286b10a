#include <mcp_relay/bridge/output_queue.hpp>

#include <mcp_relay/core/log.hpp>

namespace mcp_relay {

OutputQueue::OutputQueue(std::ostream& out) : out_(out) {}

OutputQueue::~OutputQueue() {
    Close();
}

void OutputQueue::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writer_.joinable() || closed_) return;
    writer_ = std::thread(&OutputQueue::WriterLoop, this);
}

void OutputQueue::Push(std::string line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            LogWarn("output", "Dropping message after close");
            return;
        }
        lines_.push_back(std::move(line));
    }
    cv_.notify_one();
}

void OutputQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_one();
    if (writer_.joinable()) writer_.join();
}

std::size_t OutputQueue::Written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

void OutputQueue::WriterLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return closed_ || !lines_.empty(); });
        if (lines_.empty()) break;  // closed and drained

        auto line = std::move(lines_.front());
        lines_.pop_front();
        lock.unlock();
        out_ << line << '\n';
        out_.flush();
        if (!out_) {
            LogError("output", "stdout write failed");
        }
        lock.lock();
        ++written_;
    }
}

} // namespace mcp_relay
