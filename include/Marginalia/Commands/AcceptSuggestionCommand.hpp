#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <Marginalia/Commands/Command.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

struct AcceptSuggestionParams {
    SuggestionHighlight suggestion;
    DocumentUpdater documentUpdater;
    StoreUpdater storeUpdater;
    DocumentGetter getDocument;
    StoreStatePtr previousStoreState; // restored verbatim on undo
};

// Replaces the suggestion's original text with its revision, drops the suggestion
// and shifts every other suggestion past the edit.
class AcceptSuggestionCommand : public BaseCommand {
public:
    explicit AcceptSuggestionCommand(AcceptSuggestionParams params);

    std::string type() const override { return "ACCEPT_SUGGESTION"; }
    std::string description() const override { return description_; }

    // Throws DocumentError when the original text can no longer be found.
    void execute() override;
    // Throws DocumentError when the revised text can no longer be found.
    void undo() override;

    const std::string& getSuggestionId() const { return suggestionId_; }
    const std::string& getOriginalText() const { return originalText_; }
    const std::string& getRevisedText() const { return revisedText_; }
    int64_t getPosition() const { return position_; }

private:
    std::string suggestionId_;
    std::string originalText_;
    std::string revisedText_;
    int64_t position_;
    StoreStatePtr previousStoreState_;
    DocumentUpdater documentUpdater_;
    StoreUpdater storeUpdater_;
    DocumentGetter getDocument_;
    std::string description_;
};

// Finds text at the hint, else the nearest hit within 1000 characters forward, else backward,
// else anywhere. nullopt when text does not occur in doc.
std::optional<int64_t> findTextPosition(const std::string& doc, const std::string& text, int64_t positionHint);

std::shared_ptr<AcceptSuggestionCommand> createAcceptSuggestionCommand(const SuggestionHighlight& suggestion,
    DocumentUpdater documentUpdater, StoreUpdater storeUpdater, DocumentGetter getDocument, StoreStatePtr currentStoreState);

} // namespace Marginalia
