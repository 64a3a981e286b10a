#include <mcp_relay/process/server_descriptor.hpp>

namespace mcp_relay {

std::optional<ServerType> ParseServerType(std::string_view name) {
    if (name == "python") return ServerType::Python;
    if (name == "npx") return ServerType::Npx;
    if (name == "uv") return ServerType::Uv;
    if (name == "binary") return ServerType::Binary;
    return std::nullopt;
}

const char* ServerTypeName(ServerType type) {
    switch (type) {
        case ServerType::Python: return "python";
        case ServerType::Npx:    return "npx";
        case ServerType::Uv:     return "uv";
        case ServerType::Binary: return "binary";
    }
    return "binary";
}

} // namespace mcp_relay
