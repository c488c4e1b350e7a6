/**
 * Handlers.hpp - OS operation handlers behind the command registry
 *
 * Each handler validates its own argument shape and performs one filesystem,
 * process or network operation. Failures are thrown as HandlerError and turned
 * into Results by the execution engine.
 */

#pragma once

#include "ut/Result.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace ut {

class CommandRegistry;

struct HandlerContext {
    std::string cwd;
    std::chrono::milliseconds timeout{15000};
    const std::atomic<bool>* cancel = nullptr;
    const CommandRegistry* registry = nullptr;
    const std::vector<HistoryEntry>* history = nullptr;

    bool cancelled() const { return cancel != nullptr && cancel->load(); }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // Shape checks beyond arity; throws ValidationError
    virtual void validate(const std::vector<std::string>& args) const { (void)args; }

    virtual Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const = 0;
};

using HandlerPtr = std::shared_ptr<const CommandHandler>;

// Filesystem
HandlerPtr makeListDirectoryHandler();
HandlerPtr makeChangeDirectoryHandler();
HandlerPtr makePrintDirectoryHandler();
HandlerPtr makeMakeDirectoryHandler();
HandlerPtr makeRemoveDirectoryHandler();
HandlerPtr makeDeleteFileHandler();
HandlerPtr makeCopyHandler();
HandlerPtr makeMoveHandler();
HandlerPtr makeRenameHandler();
HandlerPtr makeReadFileHandler();
HandlerPtr makeTouchHandler();

// Processes and system snapshot
HandlerPtr makeProcessListHandler();
HandlerPtr makeKillProcessHandler();
HandlerPtr makeCpuHandler();
HandlerPtr makeMemoryHandler();

// Network
HandlerPtr makeInterfacesHandler();
HandlerPtr makePingHandler();
HandlerPtr makeConnectionsHandler();

// Session utilities
HandlerPtr makeEchoHandler();
HandlerPtr makeHistoryHandler();
HandlerPtr makeHelpHandler();
HandlerPtr makeClearScreenHandler();
HandlerPtr makeExitHandler();

// Relative to cwd, "~" expanded, lexically normalized
std::string resolvePath(const std::string& arg, const std::string& cwd);

// Maps an OS error code to NotFound / PermissionDenied / InvalidArgument and throws
[[noreturn]] void throwSystemError(const std::string& operation, const std::string& subject,
                                   const std::error_code& ec);

// Exit 0 folds stderr into stdout; nonzero becomes a CommandFailed Result
Result resultFromProcess(const std::string& program, const std::string& out,
                         const std::string& err, int exit_code);

} // namespace ut
