/**
 * ExecutionEngine.cpp - Session table and the request lifecycle
 */

#include "ut/ExecutionEngine.hpp"
#include "ut/CommandParser.hpp"
#include "ut/Handlers.hpp"
#include "ut/HistoryStore.hpp"
#include "ut/Log.hpp"
#include "ut/Resolver.hpp"

#include <atomic>
#include <filesystem>
#include <iomanip>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ut {

namespace {

struct Session {
    std::string id;

    // Held for the whole lifecycle of one request
    std::mutex request_mutex;

    // Guards cwd and last_exit; history appends happen under it too
    mutable std::mutex state_mutex;
    std::string cwd;
    int last_exit = 0;
    HistoryStore history;

    std::atomic<bool> cancel{false};
    std::atomic<bool> busy{false};
    std::atomic<std::chrono::steady_clock::rep> last_activity{0};

    void touch() {
        last_activity.store(std::chrono::steady_clock::now().time_since_epoch().count());
    }
};

std::string newSessionId() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    std::lock_guard<std::mutex> lock(rng_mutex);
    std::ostringstream id;
    id << std::hex << std::setfill('0')
       << std::setw(16) << rng()
       << std::setw(16) << rng();
    return id.str();
}

std::string shortId(const std::string& id) {
    return id.size() > 8 ? id.substr(0, 8) : id;
}

} // anonymous namespace

struct ExecutionEngine::Impl {
    EngineConfig config;
    std::shared_ptr<const CommandRegistry> registry;
    Resolver resolver;
    CommandParser parser;

    mutable std::mutex sessions_mutex;
    std::map<std::string, std::shared_ptr<Session>> sessions;

    Impl(EngineConfig cfg, std::shared_ptr<const CommandRegistry> reg,
         std::shared_ptr<TranslationBackend> backend)
        : config(std::move(cfg)),
          registry(std::move(reg)),
          resolver(registry, std::move(backend), config.resolver_timeout) {}

    std::string defaultDirectory() const {
        if (!config.initial_directory.empty()) {
            return fs::absolute(config.initial_directory).lexically_normal().string();
        }
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        return ec ? std::string("/") : cwd.string();
    }

    std::string checkedDirectory(const std::string& requested) const {
        if (requested.empty()) return defaultDirectory();

        std::string path = fs::absolute(requested).lexically_normal().string();
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            throw std::invalid_argument("not a directory: " + requested);
        }
        return path;
    }

    std::shared_ptr<Session> makeSession(const std::string& id, const std::string& cwd) const {
        auto session = std::make_shared<Session>();
        session->id = id;
        session->cwd = cwd;
        session->touch();
        return session;
    }

    std::shared_ptr<Session> find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(id);
        return it == sessions.end() ? nullptr : it->second;
    }

    std::shared_ptr<Session> require(const std::string& id) const {
        auto session = find(id);
        if (!session) {
            throw std::out_of_range("unknown session: " + id);
        }
        return session;
    }

    std::shared_ptr<Session> findOrCreate(const std::string& id) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(id);
        if (it != sessions.end()) return it->second;

        auto session = makeSession(id, defaultDirectory());
        sessions.emplace(id, session);
        Logger::info("engine", "session " + shortId(id) + " created on first contact");
        return session;
    }

    void stage(const Session& session, const char* name, const std::string& detail = "") const {
        if (!Logger::enabled(LogLevel::DEBUG)) return;
        Logger::debug("engine", "session " + shortId(session.id) + ": " + name +
                      (detail.empty() ? "" : " (" + detail + ")"));
    }

    Result run(Session& session, const std::string& input, std::string& resolved_command) {
        try {
            bool literal = registry->isKnown(parser.leadingToken(input));
            stage(session, "Classified", literal ? "literal" : "natural language");

            Resolution resolution = resolver.resolve(input, &session.cancel);
            resolved_command = resolution.command_line;
            stage(session, "Resolved", resolved_command);

            ParsedCommand command = parser.parse(resolved_command);
            const CommandSpec* spec = registry->lookup(command.name);
            if (spec == nullptr) {
                throw ResolutionError(ErrorKind::Unrecognized, "Unrecognized command: " + command.name);
            }
            spec->checkArity(command.args);
            spec->handler->validate(command.args);
            stage(session, "Validated", spec->name);

            std::vector<HistoryEntry> snapshot = session.history.entries();
            HandlerContext ctx;
            {
                std::lock_guard<std::mutex> lock(session.state_mutex);
                ctx.cwd = session.cwd;
            }
            ctx.timeout = config.handler_timeout;
            ctx.cancel = &session.cancel;
            ctx.registry = registry.get();
            ctx.history = &snapshot;

            Result result = spec->handler->execute(command.args, ctx);
            stage(session, "Executed", "exit " + std::to_string(result.exit_status));
            return result;
        } catch (const UtError& e) {
            Logger::debug("engine", std::string(toString(e.kind())) + ": " + e.what());
            return Result::failure(e.kind(), e.what());
        } catch (const std::exception& e) {
            Logger::error("engine", "session " + shortId(session.id) + ": unexpected failure: " + e.what());
            return Result::failure(ErrorKind::Internal, std::string("Internal error: ") + e.what());
        }
    }

    Result process(Session& session, const std::string& raw_input) {
        std::lock_guard<std::mutex> request_lock(session.request_mutex);
        session.cancel = false;
        session.busy = true;
        session.touch();
        stage(session, "Received");

        std::string input = CommandParser::trim(raw_input);
        if (input.empty()) {
            session.busy = false;
            stage(session, "Responded", "empty input");
            return Result::success();
        }

        std::string resolved_command = input;
        Result result = run(session, input, resolved_command);

        HistoryEntry entry;
        entry.raw_input = raw_input;
        entry.resolved_command = resolved_command;
        entry.timestamp = std::chrono::system_clock::now();
        entry.result = result;

        {
            std::lock_guard<std::mutex> lock(session.state_mutex);
            if (result.cwd_change) {
                session.cwd = *result.cwd_change;
            }
            session.last_exit = result.exit_status;
            session.history.append(std::move(entry));
        }
        stage(session, "Recorded");

        session.touch();
        session.busy = false;
        stage(session, "Responded", "exit " + std::to_string(result.exit_status));
        return result;
    }
};

ExecutionEngine::ExecutionEngine(EngineConfig config,
                                 std::shared_ptr<const CommandRegistry> registry,
                                 std::shared_ptr<TranslationBackend> backend) {
    config.validate();
    if (!registry) {
        throw std::invalid_argument("command registry is required");
    }
    impl_ = std::make_unique<Impl>(std::move(config), std::move(registry), std::move(backend));
}

ExecutionEngine::~ExecutionEngine() = default;

std::string ExecutionEngine::openSession(const std::string& initial_cwd) {
    std::string cwd = impl_->checkedDirectory(initial_cwd);

    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    std::string id;
    do {
        id = newSessionId();
    } while (impl_->sessions.count(id) != 0);

    impl_->sessions.emplace(id, impl_->makeSession(id, cwd));
    Logger::info("engine", "session " + shortId(id) + " opened in " + cwd);
    return id;
}

bool ExecutionEngine::openSession(const std::string& session_id, const std::string& initial_cwd) {
    if (session_id.empty()) {
        throw std::invalid_argument("session id must not be empty");
    }
    std::string cwd = impl_->checkedDirectory(initial_cwd);

    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    if (impl_->sessions.count(session_id) != 0) {
        return false;
    }
    impl_->sessions.emplace(session_id, impl_->makeSession(session_id, cwd));
    Logger::info("engine", "session " + shortId(session_id) + " opened in " + cwd);
    return true;
}

Result ExecutionEngine::process(const std::string& session_id, const std::string& raw_input) {
    std::shared_ptr<Session> session = impl_->findOrCreate(session_id);
    return impl_->process(*session, raw_input);
}

std::vector<std::string> ExecutionEngine::complete(const std::string& session_id, const std::string& prefix) {
    std::shared_ptr<Session> session = impl_->findOrCreate(session_id);
    session->touch();

    std::string cwd;
    {
        std::lock_guard<std::mutex> lock(session->state_mutex);
        cwd = session->cwd;
    }
    return session->history.complete(prefix, cwd, impl_->registry->allNames());
}

std::vector<HistoryEntry> ExecutionEngine::history(const std::string& session_id) const {
    return impl_->require(session_id)->history.entries();
}

std::string ExecutionEngine::currentDirectory(const std::string& session_id) const {
    auto session = impl_->require(session_id);
    std::lock_guard<std::mutex> lock(session->state_mutex);
    return session->cwd;
}

int ExecutionEngine::lastExitStatus(const std::string& session_id) const {
    auto session = impl_->require(session_id);
    std::lock_guard<std::mutex> lock(session->state_mutex);
    return session->last_exit;
}

bool ExecutionEngine::cancel(const std::string& session_id) {
    auto session = impl_->find(session_id);
    if (!session || !session->busy) {
        return false;
    }
    session->cancel = true;
    Logger::info("engine", "session " + shortId(session_id) + ": cancel requested");
    return true;
}

bool ExecutionEngine::closeSession(const std::string& session_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        auto it = impl_->sessions.find(session_id);
        if (it == impl_->sessions.end()) {
            return false;
        }
        session = it->second;
        impl_->sessions.erase(it);
    }

    // An in-flight request keeps its own reference and finishes as cancelled
    if (session->busy) {
        session->cancel = true;
    }
    Logger::info("engine", "session " + shortId(session_id) + " closed");
    return true;
}

size_t ExecutionEngine::reapIdleSessions() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    auto limit = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        impl_->config.session_idle_timeout).count();

    size_t removed = 0;
    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    for (auto it = impl_->sessions.begin(); it != impl_->sessions.end();) {
        const Session& session = *it->second;
        if (!session.busy && now.count() - session.last_activity.load() > limit) {
            Logger::info("engine", "session " + shortId(it->first) + " expired");
            it = impl_->sessions.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ExecutionEngine::sessionCount() const {
    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    return impl_->sessions.size();
}

const EngineConfig& ExecutionEngine::config() const {
    return impl_->config;
}

const CommandRegistry& ExecutionEngine::registry() const {
    return *impl_->registry;
}

} // namespace ut
