#include <Marginalia/Tools/ToolRegistry.hpp>
#include <Marginalia/Tools/HighlightTextTool.hpp>
#include <Marginalia/Tools/GetLineContentTool.hpp>
#include <Marginalia/Tools/GetDocumentStatsTool.hpp>
#include <Marginalia/Tools/FinishReviewTool.hpp>
#include <algorithm>
#include <stdexcept>
#include <plog/Log.h>

namespace Marginalia {

const std::vector<std::string> DEFAULT_TOOL_NAMES = {
    "highlight_text", "get_line_content", "get_document_stats", "finish_review"
};

ToolRegistry& ToolRegistry::registerTool(ToolPtr tool){
    if(!tool) throw std::invalid_argument("Cannot register a null tool");
    const std::string& name = tool->name();
    if(has(name)) throw std::invalid_argument("Tool \"" + name + "\" is already registered");
    order_.push_back(name);
    tools_.emplace(name, std::move(tool));
    PLOGV << "[Tools] registered " << name;
    return *this;
}

ToolRegistry& ToolRegistry::registerAll(const std::vector<ToolPtr>& tools){
    for(const auto& t : tools) registerTool(t);
    return *this;
}

bool ToolRegistry::unregister(const std::string& name){
    if(tools_.erase(name) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    return true;
}

ToolPtr ToolRegistry::get(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second;
}

std::vector<ToolPtr> ToolRegistry::getAll() const {
    std::vector<ToolPtr> out;
    out.reserve(order_.size());
    for(const auto& n : order_) out.push_back(tools_.at(n));
    return out;
}

nlohmann::json ToolRegistry::toProviderFormat() const {
    nlohmann::json arr = nlohmann::json::array();
    for(const auto& n : order_) arr.push_back(Marginalia::toProviderFormat(*tools_.at(n)));
    return arr;
}

ToolRegistry ToolRegistry::subset(const std::vector<std::string>& names) const {
    ToolRegistry out;
    for(const auto& n : names){
        auto t = get(n);
        if(t && !out.has(n)) out.registerTool(t);
    }
    return out;
}

void ToolRegistry::clear(){
    tools_.clear();
    order_.clear();
}

RequiredToolsCheck ToolRegistry::validateRequired(const std::vector<std::string>& names) const {
    RequiredToolsCheck check;
    for(const auto& n : names) if(!has(n)) check.missing.push_back(n);
    check.valid = check.missing.empty();
    return check;
}

ToolRegistry createDefaultToolRegistry(){
    ToolRegistry registry;
    registry.registerAll({
        std::make_shared<HighlightTextTool>(),
        std::make_shared<GetLineContentTool>(),
        std::make_shared<GetDocumentStatsTool>(),
        std::make_shared<FinishReviewTool>()
    });
    return registry;
}

} // namespace Marginalia
