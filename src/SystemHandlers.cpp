/**
 * SystemHandlers.cpp - Process table, termination, CPU and memory snapshots
 *
 * Everything here reads /proc directly; a listing is a point-in-time snapshot
 * and a process may be gone by the time it is signalled.
 */

#include "ut/Handlers.hpp"
#include "ut/CommandParser.hpp"

#include <algorithm>
#include <cerrno>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <thread>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ut {

namespace {

const size_t DEFAULT_LISTING = 30;
const std::chrono::milliseconds CPU_SAMPLE_WINDOW(250);

struct ProcessInfo {
    pid_t pid = 0;
    pid_t ppid = 0;
    char state = '?';
    std::string name;
    unsigned long long rss_bytes = 0;
    double cpu_seconds = 0.0;
};

bool isNumber(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Values that do not fit pid_t are rejected rather than narrowed onto another pid
pid_t parsePid(const std::string& text) {
    long long value = 0;
    try {
        value = std::stoll(text);
    } catch (const std::exception&) {
        throw ValidationError("taskkill: process id out of range: " + text);
    }
    if (value <= 0 || value > std::numeric_limits<pid_t>::max()) {
        throw ValidationError("taskkill: process id out of range: " + text);
    }
    return static_cast<pid_t>(value);
}

std::optional<ProcessInfo> readProcess(const std::string& pid_dir) {
    std::ifstream stat_file("/proc/" + pid_dir + "/stat");
    std::string line;
    if (!std::getline(stat_file, line)) {
        return std::nullopt;  // exited while scanning
    }

    // pid (comm) state ppid ... ; comm may itself contain spaces and parentheses
    size_t open = line.find('(');
    size_t close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcessInfo info;
    info.pid = static_cast<pid_t>(std::stol(pid_dir));
    info.name = line.substr(open + 1, close - open - 1);

    std::istringstream rest(line.substr(close + 1));
    std::vector<std::string> fields;
    std::string field;
    while (rest >> field) {
        fields.push_back(field);
    }
    // fields[0] is stat field 3 (state)
    if (fields.size() < 22) {
        return std::nullopt;
    }

    static const long page_size = ::sysconf(_SC_PAGESIZE);
    static const long ticks = ::sysconf(_SC_CLK_TCK);

    try {
        info.state = fields[0].empty() ? '?' : fields[0][0];
        info.ppid = static_cast<pid_t>(std::stol(fields[1]));
        unsigned long long utime = std::stoull(fields[11]);
        unsigned long long stime = std::stoull(fields[12]);
        info.cpu_seconds = ticks > 0 ? static_cast<double>(utime + stime) / static_cast<double>(ticks) : 0.0;
        info.rss_bytes = std::stoull(fields[21]) * static_cast<unsigned long long>(page_size);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    return info;
}

std::vector<ProcessInfo> snapshotProcesses() {
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        throw HandlerError(ErrorKind::NotFound, "process table unavailable: /proc: " + ec.message());
    }

    std::vector<ProcessInfo> processes;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        if (!isNumber(name)) continue;
        auto info = readProcess(name);
        if (info) {
            processes.push_back(*info);
        }
    }
    return processes;
}

std::string formatMegabytes(unsigned long long bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0);
    return out.str();
}

class ProcessListHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext&) const override {
        auto processes = snapshotProcesses();
        std::string filter = args.empty() ? "" : CommandParser::toLower(args[0]);

        if (!filter.empty()) {
            processes.erase(std::remove_if(processes.begin(), processes.end(),
                                           [&](const ProcessInfo& p) {
                                               return CommandParser::toLower(p.name).find(filter) == std::string::npos;
                                           }),
                            processes.end());
        }

        std::sort(processes.begin(), processes.end(), [](const ProcessInfo& a, const ProcessInfo& b) {
            if (a.rss_bytes != b.rss_bytes) return a.rss_bytes > b.rss_bytes;
            return a.pid < b.pid;
        });

        if (processes.empty()) {
            return Result::success(filter.empty() ? "No processes\n" : "No processes matching '" + args[0] + "'\n");
        }

        size_t shown = filter.empty() ? std::min(processes.size(), DEFAULT_LISTING) : processes.size();

        std::ostringstream out;
        out << std::left << std::setw(8) << "PID" << std::setw(8) << "PPID" << std::setw(6) << "STATE"
            << std::right << std::setw(10) << "MEM(MB)" << std::setw(10) << "CPU(s)" << "  NAME\n";
        out << std::string(60, '-') << "\n";

        for (size_t i = 0; i < shown; ++i) {
            const auto& p = processes[i];
            out << std::left << std::setw(8) << p.pid << std::setw(8) << p.ppid << std::setw(6) << p.state
                << std::right << std::setw(10) << formatMegabytes(p.rss_bytes)
                << std::setw(10) << std::fixed << std::setprecision(1) << p.cpu_seconds
                << "  " << p.name << "\n";
        }

        if (shown < processes.size()) {
            out << "... and " << (processes.size() - shown) << " more processes\n";
        }

        return Result::success(out.str());
    }
};

struct KillRequest {
    bool force = false;
    std::optional<pid_t> pid;
    std::string image;
};

KillRequest parseKillRequest(const std::vector<std::string>& args) {
    KillRequest request;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = CommandParser::toLower(args[i]);

        if (arg == "/f" || arg == "-9" || arg == "-f" || arg == "-kill") {
            request.force = true;
        } else if (arg == "/pid" || arg == "-p") {
            if (i + 1 >= args.size() || !isNumber(args[i + 1])) {
                throw ValidationError("taskkill: /pid needs a numeric process id");
            }
            request.pid = parsePid(args[++i]);
        } else if (arg == "/im") {
            if (i + 1 >= args.size()) {
                throw ValidationError("taskkill: /im needs a process name");
            }
            request.image = args[++i];
        } else if (isNumber(arg)) {
            if (request.pid) {
                throw ValidationError("taskkill: only one process id may be given");
            }
            request.pid = parsePid(arg);
        } else {
            throw ValidationError("taskkill: unexpected argument '" + args[i] +
                                  "'. Usage: taskkill [-9|/f] <pid> | /pid <pid> | /im <name>");
        }
    }

    if (!request.pid && request.image.empty()) {
        throw ValidationError("taskkill: no process id or name given");
    }
    if (request.pid && !request.image.empty()) {
        throw ValidationError("taskkill: give either a process id or a name, not both");
    }

    return request;
}

class KillProcessHandler : public CommandHandler {
public:
    void validate(const std::vector<std::string>& args) const override {
        parseKillRequest(args);
    }

    Result execute(const std::vector<std::string>& args, const HandlerContext&) const override {
        KillRequest request = parseKillRequest(args);
        int sig = request.force ? SIGKILL : SIGTERM;
        std::string sig_name = request.force ? "SIGKILL" : "SIGTERM";

        if (request.pid) {
            pid_t pid = *request.pid;
            if (pid <= 0) {
                throw HandlerError(ErrorKind::InvalidArgument, "taskkill: invalid process id " + std::to_string(pid));
            }
            if (pid == ::getpid()) {
                throw HandlerError(ErrorKind::InvalidArgument, "taskkill: refusing to terminate the terminal itself");
            }
            if (::kill(pid, sig) != 0) {
                throwSystemError("taskkill", std::to_string(pid), std::error_code(errno, std::generic_category()));
            }
            return Result::success("Terminated process " + std::to_string(pid) + " (" + sig_name + ")\n");
        }

        std::string wanted = CommandParser::toLower(request.image);
        size_t signalled = 0;
        size_t denied = 0;

        for (const auto& p : snapshotProcesses()) {
            if (CommandParser::toLower(p.name) != wanted || p.pid == ::getpid()) continue;
            if (::kill(p.pid, sig) == 0) {
                ++signalled;
            } else if (errno == EPERM) {
                ++denied;
            }
        }

        if (signalled == 0) {
            if (denied > 0) {
                throw HandlerError(ErrorKind::PermissionDenied,
                                   "taskkill: '" + request.image + "': Operation not permitted");
            }
            throw HandlerError(ErrorKind::NotFound, "taskkill: '" + request.image + "': No such process");
        }

        std::string message = "Terminated " + std::to_string(signalled) + " process(es) named '" +
                              request.image + "' (" + sig_name + ")\n";
        if (denied > 0) {
            message += std::to_string(denied) + " could not be signalled (permission denied)\n";
        }
        return Result::success(message);
    }
};

struct CpuTimes {
    unsigned long long idle = 0;
    unsigned long long total = 0;
};

CpuTimes readCpuTimes() {
    std::ifstream stat_file("/proc/stat");
    std::string label;
    if (!(stat_file >> label) || label != "cpu") {
        throw HandlerError(ErrorKind::NotFound, "cpu: /proc/stat unavailable");
    }

    CpuTimes times;
    unsigned long long value = 0;
    for (int i = 0; i < 8 && (stat_file >> value); ++i) {
        times.total += value;
        // idle and iowait
        if (i == 3 || i == 4) times.idle += value;
    }
    return times;
}

class CpuHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>&, const HandlerContext& ctx) const override {
        CpuTimes first = readCpuTimes();
        std::this_thread::sleep_for(CPU_SAMPLE_WINDOW);
        if (ctx.cancelled()) {
            throw HandlerError(ErrorKind::Cancelled, "cpu: interrupted");
        }
        CpuTimes second = readCpuTimes();

        unsigned long long total = second.total - first.total;
        unsigned long long idle = second.idle - first.idle;
        double usage = total == 0 ? 0.0 : 100.0 * static_cast<double>(total - idle) / static_cast<double>(total);

        long cores = ::sysconf(_SC_NPROCESSORS_ONLN);

        std::ostringstream out;
        out << "CPU Usage: " << std::fixed << std::setprecision(1) << usage << "% (Cores: " << cores << ")\n";

        std::ifstream loadavg("/proc/loadavg");
        double one = 0, five = 0, fifteen = 0;
        if (loadavg >> one >> five >> fifteen) {
            out << "Load average: " << std::setprecision(2) << one << " " << five << " " << fifteen << "\n";
        }

        return Result::success(out.str());
    }
};

class MemoryHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>&, const HandlerContext&) const override {
        std::ifstream meminfo("/proc/meminfo");
        if (!meminfo.good()) {
            throw HandlerError(ErrorKind::NotFound, "mem: /proc/meminfo unavailable");
        }

        std::map<std::string, unsigned long long> values;  // kB
        std::string key;
        unsigned long long value = 0;
        std::string line;
        while (std::getline(meminfo, line)) {
            std::istringstream iss(line);
            if (iss >> key >> value) {
                if (!key.empty() && key.back() == ':') key.pop_back();
                values[key] = value;
            }
        }

        unsigned long long total = values["MemTotal"];
        unsigned long long available = values.count("MemAvailable")
            ? values["MemAvailable"]
            : values["MemFree"] + values["Buffers"] + values["Cached"];
        if (total == 0) {
            throw HandlerError(ErrorKind::NotFound, "mem: MemTotal missing from /proc/meminfo");
        }
        unsigned long long used = total > available ? total - available : 0;

        const double gib = 1024.0 * 1024.0;
        std::ostringstream out;
        out << std::fixed << std::setprecision(1)
            << "Memory: " << 100.0 * static_cast<double>(used) / static_cast<double>(total) << "% used ("
            << static_cast<double>(used) / gib << " GB / " << static_cast<double>(total) / gib << " GB)\n";

        unsigned long long swap_total = values["SwapTotal"];
        if (swap_total > 0) {
            unsigned long long swap_used = swap_total - std::min(swap_total, values["SwapFree"]);
            out << "Swap: " << static_cast<double>(swap_used) / gib << " GB / "
                << static_cast<double>(swap_total) / gib << " GB\n";
        }

        return Result::success(out.str());
    }
};

} // anonymous namespace

HandlerPtr makeProcessListHandler() { return std::make_shared<ProcessListHandler>(); }
HandlerPtr makeKillProcessHandler() { return std::make_shared<KillProcessHandler>(); }
HandlerPtr makeCpuHandler() { return std::make_shared<CpuHandler>(); }
HandlerPtr makeMemoryHandler() { return std::make_shared<MemoryHandler>(); }

} // namespace ut
