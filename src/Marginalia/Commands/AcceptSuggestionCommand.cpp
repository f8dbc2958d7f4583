#include <Marginalia/Commands/AcceptSuggestionCommand.hpp>
#include <Marginalia/Errors.hpp>
#include <algorithm>
#include <plog/Log.h>

namespace Marginalia {

static constexpr int64_t kMaxSearchDistance = 1000;

std::optional<int64_t> findTextPosition(const std::string& doc, const std::string& text, int64_t positionHint){
    const int64_t docLen = static_cast<int64_t>(doc.size());
    const int64_t textLen = static_cast<int64_t>(text.size());
    if(positionHint >= 0 && positionHint + textLen <= docLen){
        if(doc.compare(static_cast<size_t>(positionHint), text.size(), text) == 0) return positionHint;
    }

    const int64_t forwardStart = std::max<int64_t>(0, positionHint);
    const int64_t forwardEnd = std::min(docLen, positionHint + kMaxSearchDistance);
    if(forwardStart <= docLen){
        const size_t forward = doc.find(text, static_cast<size_t>(forwardStart));
        if(forward != std::string::npos && static_cast<int64_t>(forward) < forwardEnd) return static_cast<int64_t>(forward);
    }

    const int64_t backwardStart = std::min(docLen, std::max<int64_t>(0, positionHint - kMaxSearchDistance));
    const int64_t backwardEnd = std::max(backwardStart, std::min(docLen, positionHint + textLen));
    const std::string area = doc.substr(static_cast<size_t>(backwardStart), static_cast<size_t>(backwardEnd - backwardStart));
    const size_t backward = area.rfind(text);
    if(backward != std::string::npos) return backwardStart + static_cast<int64_t>(backward);

    const size_t global = doc.find(text);
    if(global == std::string::npos) return std::nullopt;
    return static_cast<int64_t>(global);
}

static std::string splice(const std::string& doc, int64_t pos, size_t removeLen, const std::string& insert){
    return doc.substr(0, static_cast<size_t>(pos)) + insert + doc.substr(static_cast<size_t>(pos) + removeLen);
}

AcceptSuggestionCommand::AcceptSuggestionCommand(AcceptSuggestionParams params)
    : BaseCommand(CommandOptions{generateCommandId(), std::nullopt, {}}),
      suggestionId_(params.suggestion.id),
      originalText_(params.suggestion.originalText),
      revisedText_(params.suggestion.suggestedRevision),
      position_(params.suggestion.range.start()),
      previousStoreState_(std::move(params.previousStoreState)),
      documentUpdater_(std::move(params.documentUpdater)),
      storeUpdater_(std::move(params.storeUpdater)),
      getDocument_(std::move(params.getDocument))
{
    description_ = "Accept suggestion: \"" + truncateText(originalText_, 30) + "\" -> \"" + truncateText(revisedText_, 30) + "\"";
}

void AcceptSuggestionCommand::execute(){
    const std::string doc = getDocument_();
    const int64_t docLen = static_cast<int64_t>(doc.size());
    const int64_t origLen = static_cast<int64_t>(originalText_.size());

    const bool inPlace = position_ + origLen <= docLen && doc.compare(static_cast<size_t>(position_), originalText_.size(), originalText_) == 0;
    if(!inPlace){
        auto found = findTextPosition(doc, originalText_, position_);
        if(!found){
            throw DocumentError("Cannot accept suggestion: original text \"" + truncateText(originalText_, 20) + "\" not found at expected position");
        }
        PLOGW << "[Undo] suggestion " << suggestionId_ << " text moved from " << position_ << " to " << *found;
        position_ = *found;
    }

    documentUpdater_(splice(doc, position_, originalText_.size(), revisedText_));
    storeUpdater_(StoreAction::remove(suggestionId_));
    if(revisedText_.size() != originalText_.size()){
        storeUpdater_(StoreAction::applyEdit(position_, origLen, static_cast<int64_t>(revisedText_.size())));
    }
}

void AcceptSuggestionCommand::undo(){
    const std::string doc = getDocument_();
    auto found = findTextPosition(doc, revisedText_, position_);
    if(!found){
        throw DocumentError("Cannot undo: revised text \"" + truncateText(revisedText_, 20) + "\" not found");
    }
    documentUpdater_(splice(doc, *found, revisedText_.size(), originalText_));
    storeUpdater_(StoreAction::restore(previousStoreState_));
}

std::shared_ptr<AcceptSuggestionCommand> createAcceptSuggestionCommand(const SuggestionHighlight& suggestion,
    DocumentUpdater documentUpdater, StoreUpdater storeUpdater, DocumentGetter getDocument, StoreStatePtr currentStoreState)
{
    return std::make_shared<AcceptSuggestionCommand>(AcceptSuggestionParams{
        suggestion, std::move(documentUpdater), std::move(storeUpdater), std::move(getDocument), std::move(currentStoreState)});
}

} // namespace Marginalia
