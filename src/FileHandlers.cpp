/**
 * FileHandlers.cpp - Directory listing, navigation and file manipulation
 *
 * Also home to the helpers every handler shares: path resolution, OS error
 * mapping and turning a finished child process into a Result.
 */

#include "ut/Handlers.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <tuple>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ut {

namespace {

const std::uintmax_t MAX_READ_BYTES = 1024 * 1024;

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') return "/";
    return home;
}

[[noreturn]] void throwMissing(const std::string& operation, const std::string& path) {
    throwSystemError(operation, path, std::make_error_code(std::errc::no_such_file_or_directory));
}

// lstat-style status; only "no such entry" counts as absent, other errors
// (EACCES on a parent, EIO) are raised for `operation` on `subject`
fs::file_status entryStatus(const fs::path& path, const std::string& operation,
                            const std::string& subject) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        throwSystemError(operation, subject, ec);
    }
    return status;
}

bool pathExists(const fs::path& path, const std::string& operation, const std::string& subject) {
    return fs::exists(entryStatus(path, operation, subject));
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += args[i];
    }
    return joined;
}

// Destination inside an existing directory takes the source's file name
fs::path destinationFor(const fs::path& source, const fs::path& destination) {
    if (isDirectory(destination)) {
        return destination / source.filename();
    }
    return destination;
}

bool isWithin(const fs::path& child, const fs::path& parent) {
    auto rel = child.lexically_relative(parent);
    return !rel.empty() && *rel.begin() != "..";
}

class ListDirectoryHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        std::string shown = args.empty() ? "." : args[0];
        fs::path target = args.empty() ? fs::path(ctx.cwd) : fs::path(resolvePath(args[0], ctx.cwd));

        std::error_code ec;
        auto status = fs::status(target, ec);
        if (ec || !fs::exists(status)) {
            throwSystemError("dir", shown, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
        }
        if (!fs::is_directory(status)) {
            throwSystemError("dir", shown, std::make_error_code(std::errc::not_a_directory));
        }

        fs::directory_iterator it(target, ec);
        if (ec) {
            throwSystemError("dir", shown, ec);
        }

        // (is_file, name, line): directories first, then files, each by name
        std::vector<std::tuple<bool, std::string, std::string>> rows;
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            const fs::directory_entry& entry = *it;
            std::string name = entry.path().filename().string();
            std::error_code entry_ec;
            if (entry.is_directory(entry_ec)) {
                rows.emplace_back(false, name, name + "/");
            } else {
                auto size = entry.file_size(entry_ec);
                std::string line = name;
                if (!entry_ec) {
                    line += " (" + std::to_string(size) + " bytes)";
                }
                rows.emplace_back(true, name, line);
            }
        }
        if (ec) {
            throwSystemError("dir", shown, ec);
        }
        std::sort(rows.begin(), rows.end());

        if (rows.empty()) {
            return Result::success("Directory is empty\n");
        }

        std::ostringstream out;
        for (const auto& row : rows) {
            out << std::get<2>(row) << "\n";
        }
        return Result::success(out.str());
    }
};

class ChangeDirectoryHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        std::string shown = args.empty() ? "~" : args[0];
        std::string target = args.empty() ? resolvePath("~", ctx.cwd) : resolvePath(args[0], ctx.cwd);

        std::error_code ec;
        auto status = fs::status(target, ec);
        if (ec || !fs::exists(status)) {
            throwSystemError("cd", shown, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
        }
        if (!fs::is_directory(status)) {
            throwSystemError("cd", shown, std::make_error_code(std::errc::not_a_directory));
        }
        if (::access(target.c_str(), X_OK) != 0) {
            throwSystemError("cd", shown, std::error_code(errno, std::generic_category()));
        }

        return Result::changeDirectory(target);
    }
};

class PrintDirectoryHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>&, const HandlerContext& ctx) const override {
        return Result::success(ctx.cwd + "\n");
    }
};

class MakeDirectoryHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        for (const auto& arg : args) {
            fs::path path = resolvePath(arg, ctx.cwd);
            if (pathExists(path, "mkdir", arg)) {
                if (isDirectory(path)) continue;
                throwSystemError("mkdir", arg, std::make_error_code(std::errc::file_exists));
            }
            std::error_code ec;
            fs::create_directories(path, ec);
            if (ec) {
                throwSystemError("mkdir", arg, ec);
            }
        }
        return Result::success("Created directory: " + joinArgs(args) + "\n");
    }
};

class RemoveDirectoryHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        for (const auto& arg : args) {
            fs::path path = resolvePath(arg, ctx.cwd);
            auto status = entryStatus(path, "rmdir", arg);
            if (!fs::exists(status)) {
                throwMissing("rmdir", arg);
            }
            if (!fs::is_directory(status)) {
                throwSystemError("rmdir", arg, std::make_error_code(std::errc::not_a_directory));
            }
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                throwSystemError("rmdir", arg, ec);
            }
        }
        return Result::success("Removed directory: " + joinArgs(args) + "\n");
    }
};

class DeleteFileHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        for (const auto& arg : args) {
            fs::path path = resolvePath(arg, ctx.cwd);
            auto status = entryStatus(path, "del", arg);
            if (!fs::exists(status)) {
                throwMissing("del", arg);
            }
            if (fs::is_directory(status)) {
                throw HandlerError(ErrorKind::InvalidArgument,
                                   "del: '" + arg + "': Is a directory (use rmdir)");
            }
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                throwSystemError("del", arg, ec);
            }
        }
        return Result::success("Deleted file: " + joinArgs(args) + "\n");
    }
};

class CopyHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        fs::path source = resolvePath(args[0], ctx.cwd);
        if (!pathExists(source, "copy", args[0])) {
            throwMissing("copy", args[0]);
        }
        fs::path destination = destinationFor(source, resolvePath(args[1], ctx.cwd));

        if (source == destination) {
            throw HandlerError(ErrorKind::InvalidArgument,
                               "copy: '" + args[0] + "' and '" + args[1] + "' are the same file");
        }

        std::error_code ec;
        if (isDirectory(source)) {
            if (isWithin(destination, source)) {
                throw HandlerError(ErrorKind::InvalidArgument,
                                   "copy: cannot copy a directory into itself");
            }
            fs::copy(source, destination, fs::copy_options::recursive, ec);
        } else {
            fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            throwSystemError("copy", args[0], ec);
        }

        return Result::success("Copied '" + args[0] + "' to '" + destination.string() + "'\n");
    }
};

class MoveHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        fs::path source = resolvePath(args[0], ctx.cwd);
        if (!pathExists(source, "move", args[0])) {
            throwMissing("move", args[0]);
        }
        fs::path destination = destinationFor(source, resolvePath(args[1], ctx.cwd));

        if (isDirectory(source) && isWithin(destination, source)) {
            throw HandlerError(ErrorKind::InvalidArgument, "move: cannot move a directory into itself");
        }

        std::error_code ec;
        fs::rename(source, destination, ec);
        if (ec == std::errc::cross_device_link) {
            // Different filesystem: copy then remove the original
            ec.clear();
            if (isDirectory(source)) {
                fs::copy(source, destination, fs::copy_options::recursive, ec);
            } else {
                fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
            }
            if (!ec) {
                fs::remove_all(source, ec);
            }
        }
        if (ec) {
            throwSystemError("move", args[0], ec);
        }

        return Result::success("Moved '" + args[0] + "' to '" + destination.string() + "'\n");
    }
};

class RenameHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        fs::path source = resolvePath(args[0], ctx.cwd);
        fs::path target = resolvePath(args[1], ctx.cwd);

        if (!pathExists(source, "ren", args[0])) {
            throwMissing("ren", args[0]);
        }
        if (pathExists(target, "ren", args[1])) {
            throwSystemError("ren", args[1], std::make_error_code(std::errc::file_exists));
        }

        std::error_code ec;
        fs::rename(source, target, ec);
        if (ec) {
            throwSystemError("ren", args[0], ec);
        }

        return Result::success("Renamed '" + args[0] + "' to '" + args[1] + "'\n");
    }
};

class ReadFileHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        fs::path path = resolvePath(args[0], ctx.cwd);

        std::error_code ec;
        auto status = fs::status(path, ec);
        if (!fs::exists(status)) {
            throwMissing("type", args[0]);
        }
        if (fs::is_directory(status)) {
            throwSystemError("type", args[0], std::make_error_code(std::errc::is_a_directory));
        }
        if (::access(path.c_str(), R_OK) != 0) {
            throwSystemError("type", args[0], std::error_code(errno, std::generic_category()));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.good()) {
            throwSystemError("type", args[0], std::make_error_code(std::errc::io_error));
        }

        std::string content;
        content.resize(MAX_READ_BYTES);
        file.read(&content[0], static_cast<std::streamsize>(content.size()));
        content.resize(static_cast<size_t>(file.gcount()));

        if (file.peek() != std::char_traits<char>::eof()) {
            content += "\n... [output truncated]\n";
        }

        return Result::success(content);
    }
};

class TouchHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        for (const auto& arg : args) {
            std::string path = resolvePath(arg, ctx.cwd);

            if (pathExists(path, "touch", arg)) {
                if (::utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0) {
                    throwSystemError("touch", arg, std::error_code(errno, std::generic_category()));
                }
                continue;
            }

            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd < 0) {
                throwSystemError("touch", arg, std::error_code(errno, std::generic_category()));
            }
            ::close(fd);
        }
        return Result::success("Created file: " + joinArgs(args) + "\n");
    }
};

} // anonymous namespace

std::string resolvePath(const std::string& arg, const std::string& cwd) {
    std::string expanded = arg;
    if (expanded == "~") {
        expanded = homeDirectory();
    } else if (expanded.rfind("~/", 0) == 0) {
        expanded = homeDirectory() + expanded.substr(1);
    }

    fs::path path(expanded);
    if (path.is_relative()) {
        path = fs::path(cwd) / path;
    }

    std::string normal = path.lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

void throwSystemError(const std::string& operation, const std::string& subject,
                      const std::error_code& ec) {
    std::string message = operation + ": '" + subject + "': " + ec.message();

    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::no_such_process) {
        throw HandlerError(ErrorKind::NotFound, message);
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        throw HandlerError(ErrorKind::PermissionDenied, message);
    }
    if (ec == std::errc::timed_out) {
        throw HandlerError(ErrorKind::Timeout, message);
    }
    throw HandlerError(ErrorKind::InvalidArgument, message);
}

Result resultFromProcess(const std::string& program, const std::string& out,
                         const std::string& err, int exit_code) {
    if (exit_code == 0) {
        return Result::success(out + err);
    }
    std::string message = err.empty() ? program + " exited with status " + std::to_string(exit_code) : err;
    return Result::failure(ErrorKind::CommandFailed, exit_code, out, message);
}

HandlerPtr makeListDirectoryHandler() { return std::make_shared<ListDirectoryHandler>(); }
HandlerPtr makeChangeDirectoryHandler() { return std::make_shared<ChangeDirectoryHandler>(); }
HandlerPtr makePrintDirectoryHandler() { return std::make_shared<PrintDirectoryHandler>(); }
HandlerPtr makeMakeDirectoryHandler() { return std::make_shared<MakeDirectoryHandler>(); }
HandlerPtr makeRemoveDirectoryHandler() { return std::make_shared<RemoveDirectoryHandler>(); }
HandlerPtr makeDeleteFileHandler() { return std::make_shared<DeleteFileHandler>(); }
HandlerPtr makeCopyHandler() { return std::make_shared<CopyHandler>(); }
HandlerPtr makeMoveHandler() { return std::make_shared<MoveHandler>(); }
HandlerPtr makeRenameHandler() { return std::make_shared<RenameHandler>(); }
HandlerPtr makeReadFileHandler() { return std::make_shared<ReadFileHandler>(); }
HandlerPtr makeTouchHandler() { return std::make_shared<TouchHandler>(); }

} // namespace ut
