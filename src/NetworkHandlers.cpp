/**
 * NetworkHandlers.cpp - Interface listing, ping and socket table
 */

#include "ut/Handlers.hpp"
#include "ut/CommandParser.hpp"
#include "ut/ProcessRunner.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <map>
#include <sstream>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <sys/socket.h>

namespace ut {

namespace {

const int MAX_PING_COUNT = 20;

bool isHostName(const std::string& host) {
    if (host.empty() || host.front() == '-' || host.size() > 253) return false;
    return std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-' || c == ':' || c == '_' || c == '%';
    });
}

std::string numericHost(const sockaddr* addr) {
    if (addr == nullptr) return "";
    socklen_t len = addr->sa_family == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
    char host[NI_MAXHOST];
    if (::getnameinfo(addr, len, host, sizeof(host), nullptr, 0, NI_NUMERICHOST) != 0) {
        return "";
    }
    return host;
}

class InterfacesHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>&, const HandlerContext&) const override {
        ifaddrs* list = nullptr;
        if (::getifaddrs(&list) != 0) {
            throwSystemError("ipconfig", "getifaddrs", std::error_code(errno, std::generic_category()));
        }

        std::vector<std::string> order;
        std::map<std::string, unsigned int> flags;
        std::map<std::string, std::vector<std::string>> addresses;

        for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
            std::string name = ifa->ifa_name;
            if (flags.find(name) == flags.end()) {
                order.push_back(name);
                flags[name] = ifa->ifa_flags;
            }
            if (ifa->ifa_addr == nullptr) continue;

            int family = ifa->ifa_addr->sa_family;
            if (family == AF_INET) {
                std::string line = "inet " + numericHost(ifa->ifa_addr);
                std::string mask = numericHost(ifa->ifa_netmask);
                if (!mask.empty()) line += "  netmask " + mask;
                addresses[name].push_back(line);
            } else if (family == AF_INET6) {
                addresses[name].push_back("inet6 " + numericHost(ifa->ifa_addr));
            }
        }
        ::freeifaddrs(list);

        std::ostringstream out;
        for (const auto& name : order) {
            unsigned int f = flags[name];
            out << name << " (" << ((f & IFF_UP) ? "up" : "down");
            if (f & IFF_LOOPBACK) out << ", loopback";
            out << ")\n";
            for (const auto& line : addresses[name]) {
                out << "    " << line << "\n";
            }
        }

        std::string text = out.str();
        return Result::success(text.empty() ? "No network interfaces\n" : text);
    }
};

class PingHandler : public CommandHandler {
public:
    void validate(const std::vector<std::string>& args) const override {
        if (!isHostName(args[0])) {
            throw ValidationError("ping: invalid host '" + args[0] + "'");
        }
        if (args.size() > 1) {
            countFrom(args[1]);
        }
    }

    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        int count = args.size() > 1 ? countFrom(args[1]) : 4;
        auto output = ProcessRunner::run({"ping", "-c", std::to_string(count), "-W", "2", args[0]},
                                         ctx.cwd, ctx.timeout, ctx.cancel);
        return resultFromProcess("ping", output.out, output.err, output.exit_code);
    }

private:
    static int countFrom(const std::string& text) {
        bool numeric = !text.empty() && std::all_of(text.begin(), text.end(),
                                                    [](unsigned char c) { return std::isdigit(c); });
        if (!numeric || text.size() > 3) {
            throw ValidationError("ping: count must be a number between 1 and " + std::to_string(MAX_PING_COUNT));
        }
        int count = std::stoi(text);
        if (count < 1 || count > MAX_PING_COUNT) {
            throw ValidationError("ping: count must be a number between 1 and " + std::to_string(MAX_PING_COUNT));
        }
        return count;
    }
};

class ConnectionsHandler : public CommandHandler {
public:
    void validate(const std::vector<std::string>& args) const override {
        if (!args.empty()) {
            std::string mode = CommandParser::toLower(args[0]);
            if (mode != "listen" && mode != "-l") {
                throw ValidationError("netstat: unknown option '" + args[0] + "'. Usage: netstat [listen]");
            }
        }
    }

    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        std::string flags = args.empty() ? "-tuna" : "-tunl";

        ProcessOutput output;
        std::string program = "ss";
        try {
            output = ProcessRunner::run({"ss", flags}, ctx.cwd, ctx.timeout, ctx.cancel);
        } catch (const HandlerError& e) {
            if (e.kind() != ErrorKind::NotFound) throw;
            // iproute2 missing: fall back to net-tools
            program = "netstat";
            output = ProcessRunner::run({"netstat", flags}, ctx.cwd, ctx.timeout, ctx.cancel);
        }
        return resultFromProcess(program, output.out, output.err, output.exit_code);
    }
};

} // anonymous namespace

HandlerPtr makeInterfacesHandler() { return std::make_shared<InterfacesHandler>(); }
HandlerPtr makePingHandler() { return std::make_shared<PingHandler>(); }
HandlerPtr makeConnectionsHandler() { return std::make_shared<ConnectionsHandler>(); }

} // namespace ut
