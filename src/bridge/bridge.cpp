#include <mcp_relay/bridge/bridge.hpp>

#include <mcp_relay/core/log.hpp>
#include <mcp_relay/process/backoff.hpp>

#include <functional>
#include <iomanip>
#include <random>
#include <sstream>

namespace mcp_relay {

namespace {

constexpr const char* kComponent = "bridge";

// How long the destructor waits for a reader still blocked on input.
constexpr std::chrono::milliseconds kReaderGrace{200};

Error Unavailable(const std::string& detail) {
    auto error = MakeError(ErrorCategory::TransportFailure, "Forward",
                           "Control plane unavailable");
    error.target = detail;
    return error;
}

} // anonymous namespace

std::string NewSessionId() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::ostringstream oss;
    oss << "bridge-" << std::hex << std::setfill('0') << std::setw(16) << engine()
        << std::setw(16) << engine();
    return oss.str();
}

Bridge::Bridge(IControlPlaneClient& client, BridgeOptions options,
               std::istream& in, std::ostream& out)
    : client_(client),
      options_(options),
      in_(in),
      input_(std::make_shared<InputBuffer>()),
      output_(out) {}

Bridge::~Bridge() {
    RequestStop();
    CloseInput();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    if (reader_.joinable()) reader_.join();
    if (!input_thread_.joinable()) return;

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(input_->mutex);
        finished = input_->cv.wait_for(lock, kReaderGrace, [this] { return input_->eof; });
    }
    // A read blocked on stdin cannot be interrupted portably. The detached
    // thread keeps the InputBuffer alive and touches nothing else.
    if (finished) {
        input_thread_.join();
    } else {
        input_thread_.detach();
    }
}

// ---------------------------------------------------------------------------
// Run / stop
// ---------------------------------------------------------------------------

int Bridge::Run() {
    output_.Start();
    const auto worker_count = options_.workers > 0 ? options_.workers : 1;
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&Bridge::WorkerLoop, this);
    }
    input_thread_ = std::thread(&Bridge::InputLoop, std::ref(in_), input_);
    reader_ = std::thread(&Bridge::ReaderLoop, this);
    LogInfo(kComponent, "Bridge running with " + std::to_string(worker_count) +
                            " worker(s)");

    bool stopped = false;
    bool fatal = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return reader_done_ || stop_requested_ || fatal_; });
        stopped = stop_requested_;
    }
    // No new jobs once the reader is gone.
    CloseInput();
    reader_.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // On stop, queued calls are answered rather than forwarded.
        if (stopped) {
            for (const auto& job : jobs_) {
                auto it = correlations_.find(job.correlation_id);
                if (it == correlations_.end()) continue;
                output_.Push(MakeErrorResponse(it->second,
                                               MakeError(ErrorCategory::Cancelled,
                                                         "Forward", "Request cancelled"))
                                 .dump());
                correlations_.erase(it);
            }
            jobs_.clear();
        }
        workers_closing_ = true;
    }
    cv_.notify_all();

    // Cancelling the session first lets in-flight calls return promptly.
    if (stopped) {
        auto closed = client_.CloseSession();
        if (closed.IsErr()) {
            LogWarn(kComponent, "Session close failed: " + closed.Error().ToString());
        }
    }

    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        fatal = fatal_;
    }
    if (!stopped && !fatal) {
        auto closed = client_.CloseSession();
        if (closed.IsErr()) {
            LogWarn(kComponent, "Session close failed: " + closed.Error().ToString());
        }
    }

    output_.Close();

    if (fatal) {
        LogError(kComponent, "Control plane unreachable, giving up");
        return 1;
    }
    LogInfo(kComponent, "Bridge stopped");
    return 0;
}

void Bridge::RequestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Reader
// ---------------------------------------------------------------------------

void Bridge::InputLoop(std::istream& in, std::shared_ptr<InputBuffer> input) {
    std::string line;
    while (std::getline(in, line)) {
        std::lock_guard<std::mutex> lock(input->mutex);
        if (input->closed) break;
        input->lines.push_back(std::move(line));
        input->cv.notify_all();
    }
    std::lock_guard<std::mutex> lock(input->mutex);
    input->eof = true;
    input->cv.notify_all();
}

std::optional<std::string> Bridge::NextLine() {
    std::unique_lock<std::mutex> lock(input_->mutex);
    input_->cv.wait(lock, [this] {
        return input_->closed || input_->eof || !input_->lines.empty();
    });
    if (input_->closed || input_->lines.empty()) return std::nullopt;
    auto line = std::move(input_->lines.front());
    input_->lines.pop_front();
    return line;
}

void Bridge::CloseInput() {
    std::lock_guard<std::mutex> lock(input_->mutex);
    input_->closed = true;
    input_->cv.notify_all();
}

void Bridge::ReaderLoop() {
    while (auto line = NextLine()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return connected_ || stop_requested_ || fatal_; });
            if (stop_requested_ || fatal_) break;
        }
        HandleLine(*line);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reader_done_ = true;
    }
    LogDebug(kComponent, "Input closed");
    cv_.notify_all();
}

void Bridge::HandleLine(const std::string& raw) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) return;

    auto parsed = ParseEnvelope(line);
    if (parsed.IsErr()) {
        const auto& rejected = parsed.Error();
        LogWarn(kComponent, "Rejected input: " + rejected.error.message);
        Emit(MakeErrorResponse(rejected.id, rejected.error.JsonRpcCode(),
                               rejected.error.message));
        return;
    }
    const auto& envelope = parsed.Value();

    switch (envelope.kind) {
        case Envelope::Kind::Notification:
            if (envelope.method == MethodName(Method::Initialized)) {
                LogInfo(kComponent, "Client initialized");
            } else {
                LogDebug(kComponent, "Notification " + envelope.method);
            }
            return;
        case Envelope::Kind::Response:
            LogWarn(kComponent, "Ignoring response from client, id " + envelope.id.dump());
            return;
        case Envelope::Kind::Request:
            break;
    }

    auto method = ParseMethod(envelope.method);
    if (!method.has_value() || *method == Method::Initialized) {
        Emit(MakeErrorResponse(envelope.id, rpc_code::kMethodNotFound,
                               "Method not found: " + envelope.method));
        return;
    }
    if (*method == Method::Ping) {
        Emit(MakeResult(envelope.id, nlohmann::json::object()));
        return;
    }
    Enqueue(envelope, *method);
}

void Bridge::Enqueue(const Envelope& envelope, Method method) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Job job;
        job.correlation_id = next_correlation_++;
        job.method = method;
        job.request = MakeRequest(job.correlation_id, envelope.method, envelope.params);
        correlations_[job.correlation_id] = envelope.id;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

void Bridge::WorkerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return workers_closing_ || !jobs_.empty(); });
            if (jobs_.empty()) return;  // closing and drained
            job = std::move(jobs_.front());
            jobs_.pop_front();
            if (correlations_.count(job.correlation_id) == 0) continue;  // already failed
        }
        Process(job);
    }
}

void Bridge::Process(const Job& job) {
    auto reply = client_.Forward(job.method, job.request);
    if (reply.IsErr() && reply.Error().category == ErrorCategory::TransportFailure) {
        LogWarn(kComponent, reply.Error().ToString());
        HandleTransportFailure(reply.Error());
        return;
    }

    auto caller_id = TakeCorrelation(job.correlation_id);
    if (!caller_id.has_value()) {
        LogDebug(kComponent, "Discarding reply for correlation " +
                                 std::to_string(job.correlation_id));
        return;
    }
    if (reply.IsErr()) {
        Emit(MakeErrorResponse(*caller_id, reply.Error()));
        return;
    }
    auto message = std::move(reply).Value();
    message["id"] = *caller_id;
    Emit(message);
}

void Bridge::HandleTransportFailure(const Error& error) {
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_ && !fatal_) {
            connected_ = false;
            owner = true;
        }
    }
    FailAllInFlight(Unavailable(error.message));
    if (owner) {
        Reconnect();
    }
}

void Bridge::Reconnect() {
    for (int attempt = 0; attempt < options_.retry_attempts; ++attempt) {
        auto delay = BackoffDelay(options_.reconnect_base, options_.reconnect_cap, attempt);
        LogInfo(kComponent, "Reconnecting in " + std::to_string(delay.count()) +
                                "ms (attempt " + std::to_string(attempt + 1) + " of " +
                                std::to_string(options_.retry_attempts) + ")");
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, delay, [this] { return stop_requested_; })) return;
        }

        auto health = client_.CheckHealth();
        if (health.IsOk()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                connected_ = true;
            }
            cv_.notify_all();
            LogInfo(kComponent, "Control plane reachable again");
            return;
        }
        LogWarn(kComponent, "Health check failed: " + health.Error().message);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        fatal_ = true;
    }
    cv_.notify_all();
    FailAllInFlight(Unavailable("reconnect attempts exhausted"));
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::optional<nlohmann::json> Bridge::TakeCorrelation(int64_t correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = correlations_.find(correlation_id);
    if (it == correlations_.end()) return std::nullopt;
    auto caller_id = std::move(it->second);
    correlations_.erase(it);
    return caller_id;
}

void Bridge::FailAllInFlight(const Error& error) {
    std::map<int64_t, nlohmann::json> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.swap(correlations_);
    }
    for (const auto& [correlation_id, caller_id] : failed) {
        Emit(MakeErrorResponse(caller_id, error));
    }
}

void Bridge::Emit(const nlohmann::json& message) {
    output_.Push(message.dump());
}

} // namespace mcp_relay
