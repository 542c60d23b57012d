#include "tool_registry.hpp"

#include "../json_codec.hpp"

#include <stdexcept>

namespace mcp::tools {

void ToolRegistry::add(std::unique_ptr<ToolHandler> handler) {
    if (!handler) {
        return;
    }

    std::string name = handler->name();
    if (index_.count(name) > 0) {
        throw std::invalid_argument("Duplicate tool: " + name);
    }
    index_.emplace(name, handler.get());
    handlers_.push_back(std::move(handler));
}

ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<ToolDescriptor> ToolRegistry::descriptors() const {
    std::vector<ToolDescriptor> result;
    result.reserve(handlers_.size());
    for (const auto& handler : handlers_) {
        result.push_back(handler->descriptor());
    }
    return result;
}

std::string ToolHandler::string_argument(const json& arguments, const std::string& key, const std::string& fallback) const {
    if (const json* value = codec::find_key(arguments, key)) {
        return codec::as_string(*value, fallback);
    }
    return fallback;
}

int64_t ToolHandler::integer_argument(const json& arguments, const std::string& key, int64_t fallback) const {
    if (const json* value = codec::find_key(arguments, key)) {
        return codec::as_int64(*value, fallback);
    }
    return fallback;
}

} // namespace mcp::tools
