#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ipc/Message.hpp"
#include "net/ClientConnection.hpp"
#include "tools/ToolArgs.hpp"

using namespace schedview;

namespace {

const char* kServiceNames[] = {
    "apache", "nginx", "mysql", "postgres", "mongodb",
    "redis", "elastic", "kafka", "rabbitmq", "jenkins",
    "docker", "kubelet", "terraform", "ansible", "prometheus",
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--host <addr>] [--port <n>]\n"
              << "Reads commands from stdin; type 'help' for the list.\n";
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  add <burst> [arrival] [priority] [name]  submit one process\n"
              << "  random | r                                submit a random process\n"
              << "  batch <n>                                 submit n random processes\n"
              << "  algo <FCFS|SJF|SRTF|RR|PRIORITY> [q]      change policy before the run starts\n"
              << "  pause | resume                            control the clock\n"
              << "  state                                     print the current snapshot\n"
              << "  help                                      this text\n"
              << "  quit | q                                  disconnect\n";
}

long long parseNumber(const std::string& text, const char* what) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw std::invalid_argument(std::string("bad ") + what + " '" + text + "'");
    }
    return value;
}

/**
 * Interactive client that feeds processes and operator commands to the
 * server, one request and one reply at a time.
 */
class Injector {
public:
    explicit Injector(net::ClientConnection& connection)
        : connection_(connection), rng_(std::random_device{}()) {}

    /** Handle one command line. False when the session should end. */
    bool handle(const std::vector<std::string>& words) {
        const std::string& action = words[0];
        if (action == "quit" || action == "exit" || action == "q") {
            return false;
        }
        if (action == "help" || action == "?") {
            printHelp();
            return true;
        }
        if (action == "add" && words.size() >= 2) {
            ProcessSpec spec;
            spec.burst_total = parseNumber(words[1], "burst");
            if (words.size() > 2 && words[2] != "-") {
                spec.arrival_tick = parseNumber(words[2], "arrival");
            }
            if (words.size() > 3) {
                spec.priority = static_cast<int>(parseNumber(words[3], "priority"));
            }
            if (words.size() > 4) {
                spec.name = words[4];
            }
            return submit(spec);
        }
        if (action == "random" || action == "r") {
            return submit(randomSpec());
        }
        if (action == "batch" && words.size() >= 2) {
            long long count = parseNumber(words[1], "count");
            for (long long i = 0; i < count; ++i) {
                if (!submit(randomSpec())) {
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            std::cout << "[*] " << count << " processes submitted" << std::endl;
            return true;
        }
        if (action == "algo" && words.size() >= 2) {
            ipc::InjectorRequest request;
            request.type = ipc::RequestType::SetPolicy;
            request.policy = words[1];
            if (words.size() > 2) {
                request.quantum = static_cast<int>(parseNumber(words[2], "quantum"));
            }
            return command(request, "policy set to " + words[1]);
        }
        if (action == "pause" || action == "resume") {
            ipc::InjectorRequest request;
            request.type = action == "pause" ? ipc::RequestType::Pause : ipc::RequestType::Resume;
            return command(request, action == "pause" ? "clock paused" : "clock resumed");
        }
        if (action == "state") {
            ipc::InjectorRequest request;
            request.type = ipc::RequestType::State;
            auto reply = exchange(request);
            if (!reply) {
                return false;
            }
            if (reply->snapshot) {
                printState(*reply->snapshot);
            } else {
                std::cout << "[!] no snapshot in reply" << std::endl;
            }
            return true;
        }
        std::cout << "[!] unknown or incomplete command, try 'help'" << std::endl;
        return true;
    }

private:
    ProcessSpec randomSpec() {
        std::uniform_int_distribution<int> burst(2, 15);
        std::uniform_int_distribution<int> priority(1, 10);
        constexpr std::size_t kNames = sizeof(kServiceNames) / sizeof(kServiceNames[0]);
        ProcessSpec spec;
        spec.burst_total = burst(rng_);
        spec.priority = priority(rng_);
        spec.name = kServiceNames[nextName_ % kNames];
        ++nextName_;
        return spec;
    }

    bool submit(const ProcessSpec& spec) {
        ipc::InjectorRequest request;
        request.type = ipc::RequestType::AddProcess;
        request.spec = spec;
        auto reply = exchange(request);
        if (!reply) {
            return false;
        }
        std::string label = spec.name.empty() ? std::string("process") : spec.name;
        if (reply->ok) {
            std::cout << "[>] " << label << " accepted as id " << reply->id.value_or(0)
                      << " (burst=" << spec.burst_total << ", priority=" << spec.priority << ")"
                      << std::endl;
        } else {
            std::cout << "[!] " << label << " rejected: " << reply->reason << std::endl;
        }
        return true;
    }

    bool command(const ipc::InjectorRequest& request, const std::string& success) {
        auto reply = exchange(request);
        if (!reply) {
            return false;
        }
        if (reply->ok) {
            std::cout << "[>] " << success << std::endl;
        } else {
            std::cout << "[!] rejected: " << reply->reason << std::endl;
        }
        return true;
    }

    std::optional<ipc::Reply> exchange(const ipc::InjectorRequest& request) {
        std::string error;
        auto reply = connection_.request(ipc::encodeRequest(request), error);
        if (!reply) {
            std::cerr << "[!] " << error << std::endl;
        }
        return reply;
    }

    static void printState(const Snapshot& snap) {
        std::cout << "tick " << snap.tick << "  policy " << snap.policy;
        if (snap.quantum) {
            std::cout << " (q=" << *snap.quantum << ")";
        }
        std::cout << (snap.paused ? "  paused" : "") << (snap.complete ? "  complete" : "")
                  << "\n";
        for (const auto& p : snap.processes) {
            std::cout << "  " << p.id << " " << (p.name.empty() ? "-" : p.name) << " "
                      << toString(p.state) << " remaining=" << p.remaining
                      << " priority=" << p.priority << "\n";
        }
        std::cout << "  completed " << snap.stats.completed << "/" << snap.stats.total
                  << ", context switches " << snap.context_switches << std::endl;
    }

    net::ClientConnection& connection_;
    std::mt19937 rng_;
    std::size_t nextName_{0};
};

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
    for (const auto& arg : rest) {
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        std::cerr << "[!] unknown argument '" << arg << "'\n";
        printUsage(argv[0]);
        return 2;
    }

    net::ClientConnection connection;
    if (!connection.open(endpoint.host, endpoint.port, ipc::ClientRole::Injector, error)) {
        std::cerr << "[!] " << endpoint.host << ":" << endpoint.port << ": " << error << "\n";
        return 1;
    }
    std::cout << "[+] connected to " << endpoint.host << ":" << endpoint.port
              << " as injector, type 'help' for commands" << std::endl;

    Injector injector(connection);
    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        std::istringstream tokens(line);
        std::vector<std::string> words;
        for (std::string word; tokens >> word;) {
            words.push_back(word);
        }
        if (words.empty()) {
            continue;
        }
        try {
            if (!injector.handle(words)) {
                break;
            }
        } catch (const std::invalid_argument& e) {
            std::cout << "[!] " << e.what() << std::endl;
        }
    }

    connection.close();
    std::cout << "[*] injector closed" << std::endl;
    return 0;
}
