/**
 * Dispatcher.cpp - Queue of (session, input) requests served by worker threads
 */

#include "ut/Dispatcher.hpp"
#include "ut/ExecutionEngine.hpp"
#include "ut/Log.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ut {

namespace {

struct Request {
    std::string session_id;
    std::string raw_input;
    std::promise<Result> reply;
};

// One FIFO lane per session; a lane is handed to at most one worker at a time,
// so a session's requests run in submission order. pop() returns nullopt once
// closed, drained and nothing is in flight.
class RequestQueue {
public:
    bool push(Request request) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            Lane& lane = lanes_[request.session_id];
            lane.requests.push_back(std::move(request));
            ++queued_;
            if (lane.scheduled) {
                return true;
            }
            lane.scheduled = true;
            ready_.push_back(lane.requests.back().session_id);
        }
        condition_.notify_one();
        return true;
    }

    std::optional<Request> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return !ready_.empty() || (closed_ && in_flight_ == 0); });

        if (ready_.empty()) {
            return std::nullopt;
        }

        std::string session_id = std::move(ready_.front());
        ready_.pop_front();
        Lane& lane = lanes_[session_id];
        Request request = std::move(lane.requests.front());
        lane.requests.pop_front();
        --queued_;
        ++in_flight_;
        return request;
    }

    // Called once the request popped for this session has been answered
    void finish(const std::string& session_id) {
        bool wake_all = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
            auto it = lanes_.find(session_id);
            if (it != lanes_.end()) {
                if (it->second.requests.empty()) {
                    lanes_.erase(it);
                } else {
                    ready_.push_back(session_id);
                }
            }
            wake_all = closed_ && in_flight_ == 0;
        }
        if (wake_all) {
            condition_.notify_all();
        } else {
            condition_.notify_one();
        }
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        condition_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queued_;
    }

private:
    struct Lane {
        std::deque<Request> requests;
        bool scheduled = false;   // waiting in ready_ or being served
    };

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::map<std::string, Lane> lanes_;
    std::deque<std::string> ready_;
    size_t queued_ = 0;
    size_t in_flight_ = 0;
    bool closed_ = false;
};

} // anonymous namespace

struct Dispatcher::Impl {
    ExecutionEngine& engine;
    RequestQueue queue;
    std::vector<std::thread> workers;
    std::mutex shutdown_mutex;
    bool stopped = false;

    explicit Impl(ExecutionEngine& e) : engine(e) {}

    void workerLoop() {
        while (auto request = queue.pop()) {
            // process() converts every error into a Result
            request->reply.set_value(engine.process(request->session_id, request->raw_input));
            queue.finish(request->session_id);
        }
    }
};

Dispatcher::Dispatcher(ExecutionEngine& engine, size_t workers)
    : impl_(std::make_unique<Impl>(engine)) {
    if (workers == 0) {
        workers = 1;
    }
    impl_->workers.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        impl_->workers.emplace_back([this] { impl_->workerLoop(); });
    }
    Logger::debug("dispatcher", "started " + std::to_string(workers) + " workers");
}

Dispatcher::~Dispatcher() {
    shutdown();
}

std::future<Result> Dispatcher::submit(const std::string& session_id, const std::string& raw_input) {
    Request request;
    request.session_id = session_id;
    request.raw_input = raw_input;
    std::future<Result> reply = request.reply.get_future();

    if (!impl_->queue.push(std::move(request))) {
        throw std::runtime_error("dispatcher is shut down");
    }
    return reply;
}

void Dispatcher::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->shutdown_mutex);
    if (impl_->stopped) {
        return;
    }
    impl_->stopped = true;

    impl_->queue.close();
    for (auto& worker : impl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    Logger::debug("dispatcher", "stopped");
}

size_t Dispatcher::pending() const {
    return impl_->queue.size();
}

size_t Dispatcher::workerCount() const {
    return impl_->workers.size();
}

} // namespace ut
