/**
 * Dispatcher.hpp - Queue of (session, input) requests served by worker threads
 *
 * Front-ends submit requests and wait on the returned future. Requests of one
 * session run one at a time in submission order; different sessions run in
 * parallel across the workers.
 */

#pragma once

#include "ut/Result.hpp"

#include <future>
#include <memory>
#include <string>

namespace ut {

class ExecutionEngine;

class Dispatcher {
public:
    Dispatcher(ExecutionEngine& engine, size_t workers = 4);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Throws std::runtime_error after shutdown()
    std::future<Result> submit(const std::string& session_id, const std::string& raw_input);

    // Serves everything already queued, then joins the workers
    void shutdown();

    size_t pending() const;
    size_t workerCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ut
