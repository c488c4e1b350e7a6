/**
 * test_handlers.cpp - Unit tests for the OS operation handlers
 */

#include "ut/CommandRegistry.hpp"
#include "ut/Handlers.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::shared_ptr<const ut::CommandRegistry> registry = ut::CommandRegistry::withDefaults();

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("ut_handlers_" + std::to_string(::getpid()) + "_" +
                                            std::to_string(counter++));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    static int counter;
};

int TempDir::counter = 0;

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

ut::HandlerContext contextFor(const fs::path& cwd) {
    ut::HandlerContext ctx;
    ctx.cwd = cwd.string();
    ctx.timeout = std::chrono::milliseconds(5000);
    ctx.registry = registry.get();
    return ctx;
}

ut::Result run(const std::string& name, const std::vector<std::string>& args, const ut::HandlerContext& ctx) {
    const ut::CommandSpec* spec = registry->lookup(name);
    assert(spec != nullptr);
    spec->checkArity(args);
    spec->handler->validate(args);
    return spec->handler->execute(args, ctx);
}

// Kind of the UtError the command throws; None if it succeeds
ut::ErrorKind failureOf(const std::string& name, const std::vector<std::string>& args,
                        const ut::HandlerContext& ctx) {
    try {
        run(name, args, ctx);
    } catch (const ut::UtError& e) {
        return e.kind();
    }
    return ut::ErrorKind::None;
}

} // anonymous namespace

void test_mkdir_creates_directories() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    auto result = run("mkdir", {"notes", "a/b/c"}, ctx);

    assert(result.ok());
    assert(result.stderr_text.empty());
    assert(!result.cwd_change);
    assert(fs::is_directory(tmp.path / "notes"));
    assert(fs::is_directory(tmp.path / "a" / "b" / "c"));

    // Existing directory is fine
    assert(run("mkdir", {"notes"}, ctx).ok());

    writeFile(tmp.path / "plain", "x");
    assert(failureOf("mkdir", {"plain"}, ctx) == ut::ErrorKind::InvalidArgument);

    std::cout << "[PASS] test_mkdir_creates_directories\n";
}

void test_dir_lists_directories_first() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);
    fs::create_directory(tmp.path / "zeta");
    writeFile(tmp.path / "alpha.txt", "hello");

    auto result = run("dir", {}, ctx);

    assert(result.ok());
    assert(result.stdout_text == "zeta/\nalpha.txt (5 bytes)\n");

    auto empty = run("ls", {"zeta"}, ctx);
    assert(empty.stdout_text == "Directory is empty\n");

    assert(failureOf("dir", {"missing"}, ctx) == ut::ErrorKind::NotFound);

    std::cout << "[PASS] test_dir_lists_directories_first\n";
}

void test_cd_reports_directory_change() {
    TempDir tmp;
    fs::create_directory(tmp.path / "sub");
    writeFile(tmp.path / "file.txt", "x");
    auto ctx = contextFor(tmp.path);

    auto result = run("cd", {"sub"}, ctx);
    assert(result.ok());
    assert(result.cwd_change);
    assert(*result.cwd_change == (tmp.path / "sub").string());

    auto ctx_sub = contextFor(tmp.path / "sub");
    auto up = run("cd", {".."}, ctx_sub);
    assert(*up.cwd_change == tmp.path.string());

    assert(failureOf("cd", {"nowhere"}, ctx) == ut::ErrorKind::NotFound);
    assert(failureOf("cd", {"file.txt"}, ctx) == ut::ErrorKind::InvalidArgument);

    std::cout << "[PASS] test_cd_reports_directory_change\n";
}

void test_pwd_prints_cwd() {
    TempDir tmp;
    auto result = run("pwd", {}, contextFor(tmp.path));

    assert(result.stdout_text == tmp.path.string() + "\n");

    std::cout << "[PASS] test_pwd_prints_cwd\n";
}

void test_del_and_rmdir() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);
    writeFile(tmp.path / "a.txt", "a");
    fs::create_directory(tmp.path / "empty");
    fs::create_directory(tmp.path / "full");
    writeFile(tmp.path / "full" / "x", "x");

    assert(run("del", {"a.txt"}, ctx).ok());
    assert(!fs::exists(tmp.path / "a.txt"));

    assert(failureOf("del", {"missing.txt"}, ctx) == ut::ErrorKind::NotFound);
    assert(failureOf("rm", {"empty"}, ctx) == ut::ErrorKind::InvalidArgument);
    assert(fs::exists(tmp.path / "empty"));

    assert(run("rmdir", {"empty"}, ctx).ok());
    assert(!fs::exists(tmp.path / "empty"));

    // Not empty
    assert(failureOf("rd", {"full"}, ctx) == ut::ErrorKind::InvalidArgument);
    assert(fs::exists(tmp.path / "full" / "x"));

    std::cout << "[PASS] test_del_and_rmdir\n";
}

void test_del_missing_message_names_file() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    try {
        run("del", {"missing.txt"}, ctx);
        assert(false);
    } catch (const ut::HandlerError& e) {
        std::string message = e.what();
        assert(message.find("missing.txt") != std::string::npos);
        assert(message.find("No such file or directory") != std::string::npos);
    }

    std::cout << "[PASS] test_del_missing_message_names_file\n";
}

void test_copy_file_and_tree() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);
    writeFile(tmp.path / "file.txt", "data");
    fs::create_directory(tmp.path / "backup");
    fs::create_directories(tmp.path / "tree" / "inner");
    writeFile(tmp.path / "tree" / "inner" / "leaf", "leaf");

    assert(run("copy", {"file.txt", "backup"}, ctx).ok());
    assert(fs::exists(tmp.path / "backup" / "file.txt"));
    assert(fs::exists(tmp.path / "file.txt"));

    assert(run("cp", {"tree", "tree2"}, ctx).ok());
    assert(fs::exists(tmp.path / "tree2" / "inner" / "leaf"));

    assert(failureOf("copy", {"tree", "tree/inner"}, ctx) == ut::ErrorKind::InvalidArgument);
    assert(failureOf("copy", {"nothing", "backup"}, ctx) == ut::ErrorKind::NotFound);

    std::cout << "[PASS] test_copy_file_and_tree\n";
}

void test_move_and_rename() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);
    writeFile(tmp.path / "old.txt", "x");
    writeFile(tmp.path / "taken.txt", "y");
    fs::create_directory(tmp.path / "dest");

    assert(failureOf("ren", {"old.txt", "taken.txt"}, ctx) == ut::ErrorKind::InvalidArgument);
    assert(run("ren", {"old.txt", "new.txt"}, ctx).ok());
    assert(fs::exists(tmp.path / "new.txt"));
    assert(!fs::exists(tmp.path / "old.txt"));

    assert(run("move", {"new.txt", "dest"}, ctx).ok());
    assert(fs::exists(tmp.path / "dest" / "new.txt"));

    assert(failureOf("mv", {"dest", "dest/inside"}, ctx) == ut::ErrorKind::InvalidArgument);

    std::cout << "[PASS] test_move_and_rename\n";
}

void test_type_and_touch() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);
    writeFile(tmp.path / "notes.txt", "line one\nline two\n");

    auto result = run("type", {"notes.txt"}, ctx);
    assert(result.stdout_text == "line one\nline two\n");

    assert(failureOf("cat", {"."}, ctx) == ut::ErrorKind::InvalidArgument);
    assert(failureOf("type", {"ghost"}, ctx) == ut::ErrorKind::NotFound);

    assert(run("touch", {"fresh.txt"}, ctx).ok());
    assert(fs::exists(tmp.path / "fresh.txt"));
    assert(fs::file_size(tmp.path / "fresh.txt") == 0);

    std::cout << "[PASS] test_type_and_touch\n";
}

void test_permission_errors_are_not_missing_files() {
    if (::geteuid() == 0) {
        std::cout << "[SKIP] test_permission_errors_are_not_missing_files (running as root)\n";
        return;
    }
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    fs::create_directories(tmp.path / "locked" / "sub");
    writeFile(tmp.path / "locked" / "notes.txt", "x");
    fs::permissions(tmp.path / "locked", fs::perms::none);

    assert(failureOf("del", {"locked/notes.txt"}, ctx) == ut::ErrorKind::PermissionDenied);
    assert(failureOf("rmdir", {"locked/sub"}, ctx) == ut::ErrorKind::PermissionDenied);
    assert(failureOf("copy", {"locked/notes.txt", "copy.txt"}, ctx) == ut::ErrorKind::PermissionDenied);
    assert(failureOf("ren", {"locked/notes.txt", "other.txt"}, ctx) == ut::ErrorKind::PermissionDenied);
    assert(failureOf("dir", {"locked"}, ctx) == ut::ErrorKind::PermissionDenied);

    // Genuinely absent entries are still NotFound
    assert(failureOf("del", {"absent.txt"}, ctx) == ut::ErrorKind::NotFound);
    assert(failureOf("rmdir", {"absent"}, ctx) == ut::ErrorKind::NotFound);

    fs::permissions(tmp.path / "locked", fs::perms::owner_all);
    std::cout << "[PASS] test_permission_errors_are_not_missing_files\n";
}

void test_tasklist_snapshot() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    auto result = run("tasklist", {}, ctx);
    assert(result.ok());
    assert(result.stdout_text.find("PID") != std::string::npos);
    assert(result.stdout_text.find("NAME") != std::string::npos);

    auto filtered = run("ps", {"no-such-process-name-xyz"}, ctx);
    assert(filtered.stdout_text == "No processes matching 'no-such-process-name-xyz'\n");

    std::cout << "[PASS] test_tasklist_snapshot\n";
}

void test_taskkill_argument_shapes() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    assert(failureOf("taskkill", {"abc"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("taskkill", {"/pid"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("taskkill", {"/im"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("taskkill", {"/f"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("taskkill", {"99999999999999999999"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("taskkill", {"0"}, ctx) == ut::ErrorKind::Validation);

    // An id past the pid_t range must not wrap onto a live process
    pid_t child = ::fork();
    if (child == 0) {
        ::pause();
        ::_exit(0);
    }
    assert(child > 0);
    std::string wrapped = std::to_string(4294967296LL + child);
    assert(failureOf("taskkill", {"/f", wrapped}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("taskkill", {"/pid", wrapped}, ctx) == ut::ErrorKind::Validation);
    assert(::kill(child, 0) == 0);
    ::kill(child, SIGKILL);
    int status = 0;
    ::waitpid(child, &status, 0);

    assert(failureOf("taskkill", {std::to_string(::getpid())}, ctx) == ut::ErrorKind::InvalidArgument);
    assert(failureOf("kill", {"999999999"}, ctx) == ut::ErrorKind::NotFound);
    assert(failureOf("taskkill", {"/im", "no-such-process-name-xyz"}, ctx) == ut::ErrorKind::NotFound);

    std::cout << "[PASS] test_taskkill_argument_shapes\n";
}

void test_taskkill_terminates_child() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    pid_t child = ::fork();
    if (child == 0) {
        ::pause();
        ::_exit(0);
    }
    assert(child > 0);

    auto result = run("taskkill", {"/f", "/pid", std::to_string(child)}, ctx);
    assert(result.ok());
    assert(result.stdout_text.find("SIGKILL") != std::string::npos);

    int status = 0;
    ::waitpid(child, &status, 0);
    assert(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL);

    std::cout << "[PASS] test_taskkill_terminates_child\n";
}

void test_cpu_and_memory_snapshots() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    auto cpu = run("cpu", {}, ctx);
    assert(cpu.ok());
    assert(cpu.stdout_text.find("CPU Usage:") == 0);

    auto mem = run("mem", {}, ctx);
    assert(mem.ok());
    assert(mem.stdout_text.find("Memory:") == 0);

    std::cout << "[PASS] test_cpu_and_memory_snapshots\n";
}

void test_ping_validates_before_spawning() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    assert(failureOf("ping", {"bad host!"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("ping", {"-c"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("ping", {"localhost", "0"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("ping", {"localhost", "1000"}, ctx) == ut::ErrorKind::Validation);
    assert(failureOf("netstat", {"-x"}, ctx) == ut::ErrorKind::Validation);

    std::cout << "[PASS] test_ping_validates_before_spawning\n";
}

void test_process_output_becomes_result() {
    auto ok = ut::resultFromProcess("ss", "State Recv-Q\n", "warning: partial\n", 0);
    assert(ok.ok());
    assert(ok.stdout_text == "State Recv-Q\nwarning: partial\n");
    assert(ok.stderr_text.empty());

    auto failed = ut::resultFromProcess("ping", "PING host\n", "ping: unknown host\n", 2);
    assert(failed.error == ut::ErrorKind::CommandFailed);
    assert(failed.exit_status == 2);
    assert(failed.stdout_text == "PING host\n");
    assert(failed.stderr_text == "ping: unknown host\n");

    auto silent = ut::resultFromProcess("netstat", "", "", 3);
    assert(silent.exit_status == 3);
    assert(silent.stderr_text.find("netstat exited with status 3") != std::string::npos);

    std::cout << "[PASS] test_process_output_becomes_result\n";
}

void test_session_utilities() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    assert(run("echo", {"hello", "world"}, ctx).stdout_text == "hello world\n");

    auto help = run("help", {}, ctx);
    assert(help.stdout_text.find("mkdir") != std::string::npos);
    assert(help.stdout_text.find("taskkill") != std::string::npos);

    auto one = run("help", {"cp"}, ctx);
    assert(one.stdout_text.find("Usage: copy <source> <destination>") == 0);
    assert(failureOf("help", {"frobnicate"}, ctx) == ut::ErrorKind::NotFound);

    assert(run("cls", {}, ctx).control == ut::Control::ClearScreen);
    assert(run("quit", {}, ctx).control == ut::Control::Exit);

    std::cout << "[PASS] test_session_utilities\n";
}

void test_history_listing() {
    TempDir tmp;
    auto ctx = contextFor(tmp.path);

    assert(run("history", {}, ctx).stdout_text == "No command history\n");

    std::vector<ut::HistoryEntry> entries(3);
    entries[0].raw_input = "dir";
    entries[0].resolved_command = "dir";
    entries[1].raw_input = "make a folder named notes";
    entries[1].resolved_command = "mkdir notes";
    entries[2].raw_input = "del missing.txt";
    entries[2].resolved_command = "del missing.txt";
    entries[2].result = ut::Result::failure(ut::ErrorKind::NotFound, "gone");
    ctx.history = &entries;

    auto all = run("history", {}, ctx);
    assert(all.stdout_text.find("make a folder named notes  -> mkdir notes") != std::string::npos);
    assert(all.stdout_text.find("[exit 1]") != std::string::npos);

    auto last = run("history", {"1"}, ctx);
    assert(last.stdout_text.find("dir\n") == std::string::npos);
    assert(last.stdout_text.find("    3  del missing.txt") == 0);

    assert(failureOf("history", {"zero"}, ctx) == ut::ErrorKind::Validation);

    std::cout << "[PASS] test_history_listing\n";
}

void test_resolve_path() {
    assert(ut::resolvePath("b/../c", "/a") == "/a/c");
    assert(ut::resolvePath("/x/y/", "/a") == "/x/y");
    assert(ut::resolvePath("..", "/") == "/");

    std::cout << "[PASS] test_resolve_path\n";
}

int main() {
    std::cout << "Running handler tests...\n\n";

    test_mkdir_creates_directories();
    test_dir_lists_directories_first();
    test_cd_reports_directory_change();
    test_pwd_prints_cwd();
    test_del_and_rmdir();
    test_del_missing_message_names_file();
    test_permission_errors_are_not_missing_files();
    test_copy_file_and_tree();
    test_move_and_rename();
    test_type_and_touch();
    test_tasklist_snapshot();
    test_taskkill_argument_shapes();
    test_taskkill_terminates_child();
    test_cpu_and_memory_snapshots();
    test_ping_validates_before_spawning();
    test_process_output_becomes_result();
    test_session_utilities();
    test_history_listing();
    test_resolve_path();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
