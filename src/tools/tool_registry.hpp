#pragma once

#include "tool_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct ServerConfig;

namespace weather {
class Provider;
}

namespace mcp::tools {

/// Catalog of tools, filled once at startup and read-only afterwards.
class ToolRegistry {
public:
    /// Throws std::invalid_argument on a duplicate name.
    void add(std::unique_ptr<ToolHandler> handler);
    ToolHandler* find(const std::string& name) const;

    /// In registration order.
    std::vector<ToolDescriptor> descriptors() const;
    size_t size() const { return handlers_.size(); }

private:
    std::vector<std::unique_ptr<ToolHandler>> handlers_;
    std::unordered_map<std::string, ToolHandler*> index_;
};

void register_weather_tools(ToolRegistry& registry, weather::Provider& provider, const ServerConfig& config);

} // namespace mcp::tools
