#pragma once
#include <memory>
#include <string>
#include <Marginalia/Commands/Command.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

// Store-only: removes one suggestion, undo restores the captured state.
class DismissSuggestionCommand : public BaseCommand {
public:
    DismissSuggestionCommand(SuggestionHighlight suggestion, StoreUpdater storeUpdater, StoreStatePtr previousStoreState);

    std::string type() const override { return "DISMISS_SUGGESTION"; }
    std::string description() const override { return description_; }

    void execute() override;
    void undo() override;

    const SuggestionHighlight& getSuggestion() const { return suggestion_; }
    const std::string& getSuggestionId() const { return suggestion_.id; }

private:
    SuggestionHighlight suggestion_;
    StoreUpdater storeUpdater_;
    StoreStatePtr previousStoreState_;
    std::string description_;
};

class DismissAllSuggestionsCommand : public BaseCommand {
public:
    DismissAllSuggestionsCommand(StoreUpdater storeUpdater, StoreStatePtr previousStoreState);

    std::string type() const override { return "DISMISS_ALL_SUGGESTIONS"; }
    std::string description() const override { return description_; }

    void execute() override;
    void undo() override;

    size_t getSuggestionCount() const { return suggestionCount_; }

private:
    StoreUpdater storeUpdater_;
    StoreStatePtr previousStoreState_;
    size_t suggestionCount_;
    std::string description_;
};

std::shared_ptr<DismissSuggestionCommand> createDismissSuggestionCommand(const SuggestionHighlight& suggestion,
    StoreUpdater storeUpdater, StoreStatePtr currentStoreState);
std::shared_ptr<DismissAllSuggestionsCommand> createDismissAllSuggestionsCommand(StoreUpdater storeUpdater, StoreStatePtr currentStoreState);

} // namespace Marginalia
