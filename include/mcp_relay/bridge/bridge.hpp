#pragma once

#include <mcp_relay/bridge/control_plane_client.hpp>
#include <mcp_relay/bridge/output_queue.hpp>
#include <mcp_relay/core/result.hpp>
#include <mcp_relay/protocol/json_rpc.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

struct BridgeOptions {
    // One worker forwards requests in the order they were read; more
    // overlap HTTP calls and may reach the control plane out of order.
    std::size_t workers = 1;
    int retry_attempts = 3;
    std::chrono::milliseconds reconnect_base{500};
    std::chrono::milliseconds reconnect_cap{10000};
};

// ---------------------------------------------------------------------------
// Bridge — exposes the control plane as an MCP server on a line stream.
//
// An input thread only moves raw lines from stdin into a shared buffer, so
// it may outlive the Bridge while blocked on a read. The reader parses those
// lines and hands requests to a worker pool; workers
// forward them under a fresh correlation id and re-key each reply to the
// caller's id; every reply goes through the OutputQueue. `ping` is answered
// locally. When the control plane becomes unreachable, every call in flight
// fails with TransportFailure, the reader pauses and one worker reconnects
// with backoff; exhausting the attempts ends Run() with exit code 1.
// ---------------------------------------------------------------------------
class Bridge {
public:
    Bridge(IControlPlaneClient& client, BridgeOptions options,
           std::istream& in, std::ostream& out);
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /// Serve until input EOF, RequestStop() or reconnect exhaustion.
    /// Returns the process exit code.
    [[nodiscard]] int Run();

    /// Stop from another thread (signal handling).
    void RequestStop();

private:
    // Lines read from the input stream. Owned jointly with the input thread.
    struct InputBuffer {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> lines;
        bool eof = false;     // the stream ended
        bool closed = false;  // the Bridge stopped consuming
    };

    struct Job {
        int64_t correlation_id = 0;
        Method method = Method::Ping;
        nlohmann::json request;
    };

    static void InputLoop(std::istream& in, std::shared_ptr<InputBuffer> input);
    std::optional<std::string> NextLine();
    void CloseInput();
    void ReaderLoop();
    void HandleLine(const std::string& line);
    void Enqueue(const Envelope& envelope, Method method);
    void WorkerLoop();
    void Process(const Job& job);
    void HandleTransportFailure(const Error& error);
    void Reconnect();

    std::optional<nlohmann::json> TakeCorrelation(int64_t correlation_id);
    void FailAllInFlight(const Error& error);
    void Emit(const nlohmann::json& message);

    IControlPlaneClient& client_;
    const BridgeOptions options_;
    std::istream& in_;
    std::shared_ptr<InputBuffer> input_;
    OutputQueue output_;

    std::mutex mutex_;
    std::condition_variable cv_;        // jobs, connection state, completion
    std::deque<Job> jobs_;
    std::map<int64_t, nlohmann::json> correlations_;  // correlation id -> caller id
    int64_t next_correlation_ = 1;
    bool connected_ = true;
    bool reader_done_ = false;
    bool stop_requested_ = false;
    bool fatal_ = false;
    bool workers_closing_ = false;

    std::thread input_thread_;
    std::thread reader_;
    std::vector<std::thread> workers_;
};

/// Random session id for X-MCP-Session, e.g. "bridge-3f9a...".
[[nodiscard]] std::string NewSessionId();

} // namespace mcp_relay
