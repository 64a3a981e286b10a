#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace mcp_relay {

// ---------------------------------------------------------------------------
// OutputQueue — the bridge's single stdout writer. Producers push complete
// serialized messages; one thread writes them newline-terminated and
// flushed, so lines never interleave.
// ---------------------------------------------------------------------------
class OutputQueue {
public:
    explicit OutputQueue(std::ostream& out);
    ~OutputQueue();

    OutputQueue(const OutputQueue&) = delete;
    OutputQueue& operator=(const OutputQueue&) = delete;

    void Start();

    /// Queue one message (without trailing newline). Dropped after Close().
    void Push(std::string line);

    /// Write everything queued, then stop the writer thread.
    void Close();

    [[nodiscard]] std::size_t Written() const;

private:
    void WriterLoop();

    std::ostream& out_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> lines_;
    bool closed_ = false;
    std::size_t written_ = 0;
    std::thread writer_;
};

} // namespace mcp_relay
