#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace schedview {
namespace tools {

// Connection settings shared by the client tools.
struct Endpoint {
    std::string host{"127.0.0.1"};
    std::uint16_t port{5555};
};

/**
 * Consume `--host <addr>` and `--port <n>` from args. Remaining arguments
 * are left in `rest`.
 */
inline bool parseEndpoint(const std::vector<std::string>& args, Endpoint& endpoint,
                          std::vector<std::string>& rest, std::string& error) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if ((arg == "--host" || arg == "--port") && i + 1 >= args.size()) {
            error = arg + " needs a value";
            return false;
        }
        if (arg == "--host") {
            endpoint.host = args[++i];
        } else if (arg == "--port") {
            const std::string& value = args[++i];
            unsigned long port = 0;
            try {
                std::size_t used = 0;
                port = std::stoul(value, &used);
                if (used != value.size()) {
                    port = 0;
                }
            } catch (const std::exception&) {
                port = 0;
            }
            if (port == 0 || port > 65535) {
                error = "invalid port '" + value + "'";
                return false;
            }
            endpoint.port = static_cast<std::uint16_t>(port);
        } else {
            rest.push_back(arg);
        }
    }
    return true;
}

} // namespace tools
} // namespace schedview
