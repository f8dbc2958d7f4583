#include <Marginalia/Commands/DismissSuggestionCommand.hpp>

namespace Marginalia {

DismissSuggestionCommand::DismissSuggestionCommand(SuggestionHighlight suggestion, StoreUpdater storeUpdater, StoreStatePtr previousStoreState)
    : BaseCommand(CommandOptions{generateCommandId(), std::nullopt, {}}),
      suggestion_(std::move(suggestion)),
      storeUpdater_(std::move(storeUpdater)),
      previousStoreState_(std::move(previousStoreState))
{
    description_ = "Dismiss suggestion: \"" + truncateText(suggestion_.originalText, 40) + "\"";
}

void DismissSuggestionCommand::execute(){
    storeUpdater_(StoreAction::remove(suggestion_.id));
}

void DismissSuggestionCommand::undo(){
    storeUpdater_(StoreAction::restore(previousStoreState_));
}

DismissAllSuggestionsCommand::DismissAllSuggestionsCommand(StoreUpdater storeUpdater, StoreStatePtr previousStoreState)
    : BaseCommand(CommandOptions{generateCommandId(), std::nullopt, {}}),
      storeUpdater_(std::move(storeUpdater)),
      previousStoreState_(std::move(previousStoreState))
{
    suggestionCount_ = previousStoreState_ ? previousStoreState_->highlights.size() : 0;
    description_ = "Dismiss all " + std::to_string(suggestionCount_) + (suggestionCount_ == 1 ? " suggestion" : " suggestions");
}

void DismissAllSuggestionsCommand::execute(){
    storeUpdater_(StoreAction::removeAll());
}

void DismissAllSuggestionsCommand::undo(){
    storeUpdater_(StoreAction::restore(previousStoreState_));
}

std::shared_ptr<DismissSuggestionCommand> createDismissSuggestionCommand(const SuggestionHighlight& suggestion,
    StoreUpdater storeUpdater, StoreStatePtr currentStoreState)
{
    return std::make_shared<DismissSuggestionCommand>(suggestion, std::move(storeUpdater), std::move(currentStoreState));
}

std::shared_ptr<DismissAllSuggestionsCommand> createDismissAllSuggestionsCommand(StoreUpdater storeUpdater, StoreStatePtr currentStoreState){
    return std::make_shared<DismissAllSuggestionsCommand>(std::move(storeUpdater), std::move(currentStoreState));
}

} // namespace Marginalia
