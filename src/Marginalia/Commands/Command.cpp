#include <Marginalia/Commands/Command.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

BaseCommand::BaseCommand(CommandOptions options)
    : createdAt_(currentTimeMillis()), options_(std::move(options)) {}

CompositeCommand::CompositeCommand(std::vector<CommandPtr> commands, std::optional<std::string> description)
    : commands_(std::move(commands)), createdAt_(currentTimeMillis())
{
    description_ = description ? *description : std::to_string(commands_.size()) + " grouped commands";
}

void CompositeCommand::execute(){
    for(auto& c : commands_) c->execute();
}

void CompositeCommand::undo(){
    for(auto it = commands_.rbegin(); it != commands_.rend(); ++it) (*it)->undo();
}

std::string generateCommandId(){
    return generateId("cmd");
}

std::string truncateText(const std::string& text, size_t maxLength){
    if(text.size() <= maxLength) return text;
    return text.substr(0, maxLength > 3 ? maxLength - 3 : 0) + "...";
}

} // namespace Marginalia
