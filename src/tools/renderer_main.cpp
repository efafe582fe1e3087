#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ipc/Message.hpp"
#include "net/ClientConnection.hpp"
#include "tools/ToolArgs.hpp"

using namespace schedview;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--host <addr>] [--port <n>] [--table]\n"
              << "  --table   print the full process table after every tick\n";
}

std::string processLabel(const Process& p) {
    return p.name.empty() ? "P" + std::to_string(p.id) : p.name;
}

std::string fixed(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

// One status line per tick: clock, policy, CPU owner and ready queue.
std::string summaryLine(const Snapshot& snap) {
    std::ostringstream out;
    out << "t=" << snap.tick << " [" << snap.policy;
    if (snap.quantum) {
        out << " q=" << *snap.quantum;
    }
    out << "] cpu=";
    const Process* running = snap.running_id ? snap.find(*snap.running_id) : nullptr;
    out << (running ? processLabel(*running) : std::string("idle"));

    out << " ready={";
    bool first = true;
    for (const auto& p : snap.processes) {
        if (p.state != ProcessState::READY) {
            continue;
        }
        out << (first ? "" : " ") << processLabel(p) << "(" << p.remaining << ")";
        first = false;
    }
    out << "} done=" << snap.stats.completed << "/" << snap.stats.total;
    if (snap.paused) {
        out << " [paused]";
    }
    if (snap.complete && snap.stats.total > 0) {
        out << " [complete]";
    }
    return out.str();
}

void printTable(const Snapshot& snap) {
    std::cout << "  id  name              state     arr  burst  rem  prio  wait  finish\n";
    for (const auto& p : snap.processes) {
        char row[160];
        std::snprintf(row, sizeof(row), "  %-3d %-17.17s %-9s %4lld %6lld %4lld %5d %5lld  %s\n",
                      p.id, processLabel(p).c_str(), toString(p.state),
                      static_cast<long long>(p.arrival_tick),
                      static_cast<long long>(p.burst_total),
                      static_cast<long long>(p.remaining), p.priority,
                      static_cast<long long>(p.waiting),
                      p.finish_tick ? std::to_string(*p.finish_tick).c_str() : "-");
        std::cout << row;
    }
    if (snap.stats.completed > 0) {
        std::cout << "  avg wait " << fixed(snap.stats.avg_waiting)
                  << "  avg turnaround " << fixed(snap.stats.avg_turnaround)
                  << "  avg response " << fixed(snap.stats.avg_response)
                  << "  cpu " << fixed(snap.stats.cpu_utilization) << "%"
                  << "  switches " << snap.context_switches << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    tools::Endpoint endpoint;
    std::vector<std::string> rest;
    std::string error;
    if (!tools::parseEndpoint(args, endpoint, rest, error)) {
        std::cerr << "[!] " << error << "\n";
        printUsage(argv[0]);
        return 2;
    }

    bool table = false;
    for (const auto& arg : rest) {
        if (arg == "--table") {
            table = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "[!] unknown argument '" << arg << "'\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    net::ClientConnection connection;
    if (!connection.open(endpoint.host, endpoint.port, ipc::ClientRole::Renderer, error)) {
        std::cerr << "[!] " << endpoint.host << ":" << endpoint.port << ": " << error << "\n";
        return 1;
    }
    std::cout << "[+] connected to " << endpoint.host << ":" << endpoint.port
              << " as renderer" << std::endl;

    std::string line;
    while (true) {
        auto status = connection.readLine(line);
        if (status == net::Socket::ReadStatus::Timeout) {
            continue;
        }
        if (status != net::Socket::ReadStatus::Line) {
            break;
        }
        std::string reason;
        auto snap = ipc::decodeSnapshot(line, &reason);
        if (!snap) {
            std::cerr << "[!] ignoring malformed snapshot: " << reason << "\n";
            continue;
        }
        std::cout << summaryLine(*snap) << "\n";
        if (table) {
            printTable(*snap);
        }
        std::cout.flush();
    }

    std::cout << "[-] server closed the connection" << std::endl;
    return 0;
}
