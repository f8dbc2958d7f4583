#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include <Marginalia/Tools/ToolTypes.hpp>

namespace Marginalia {

extern const std::vector<std::string> DEFAULT_TOOL_NAMES;

struct RequiredToolsCheck {
    bool valid = true;
    std::vector<std::string> missing;
};

// Name -> tool lookup. Iteration follows registration order.
class ToolRegistry {
public:
    ToolRegistry() = default;

    // throws std::invalid_argument if the name is taken
    ToolRegistry& registerTool(ToolPtr tool);
    ToolRegistry& registerAll(const std::vector<ToolPtr>& tools);
    bool unregister(const std::string& name);

    ToolPtr get(const std::string& name) const;
    bool has(const std::string& name) const { return tools_.count(name) > 0; }
    std::vector<ToolPtr> getAll() const;
    std::vector<std::string> getNames() const { return order_; }
    size_t size() const { return order_.size(); }

    nlohmann::json toProviderFormat() const;
    // Registry containing only the named tools that exist here.
    ToolRegistry subset(const std::vector<std::string>& names) const;
    ToolRegistry clone() const { return *this; }
    void clear();

    RequiredToolsCheck validateRequired(const std::vector<std::string>& names) const;

private:
    std::unordered_map<std::string, ToolPtr> tools_;
    std::vector<std::string> order_;
};

// highlight_text, get_line_content, get_document_stats, finish_review
ToolRegistry createDefaultToolRegistry();

} // namespace Marginalia
