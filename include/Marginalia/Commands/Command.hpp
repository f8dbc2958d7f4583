#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <Marginalia/SuggestionStore.hpp>

namespace Marginalia {

// Collaborators a command uses to reach the live document and the store.
// The document is always re-read through the getter right before use.
using DocumentGetter = std::function<std::string()>;
using DocumentUpdater = std::function<void(const std::string&)>;
using StoreUpdater = std::function<void(const StoreAction&)>;

// Reversible unit of work recorded by UndoManager.
struct Command {
    virtual ~Command() = default;

    virtual std::string type() const = 0;
    virtual std::string description() const = 0;
    virtual int64_t createdAt() const = 0;

    virtual std::optional<std::string> id() const { return std::nullopt; }
    virtual std::optional<std::string> groupId() const { return std::nullopt; }
    virtual std::vector<std::string> tags() const { return {}; }

    virtual void execute() = 0;
    virtual void undo() = 0;
};

using CommandPtr = std::shared_ptr<Command>;

struct CommandOptions {
    std::optional<std::string> id;
    std::optional<std::string> groupId;
    std::vector<std::string> tags;
};

// Carries creation time and the optional grouping metadata.
class BaseCommand : public Command {
public:
    explicit BaseCommand(CommandOptions options = {});

    int64_t createdAt() const override { return createdAt_; }
    std::optional<std::string> id() const override { return options_.id; }
    std::optional<std::string> groupId() const override { return options_.groupId; }
    std::vector<std::string> tags() const override { return options_.tags; }

private:
    int64_t createdAt_;
    CommandOptions options_;
};

// Runs its children in order and undoes them in reverse.
class CompositeCommand : public Command {
public:
    explicit CompositeCommand(std::vector<CommandPtr> commands, std::optional<std::string> description = std::nullopt);

    std::string type() const override { return "COMPOSITE"; }
    std::string description() const override { return description_; }
    int64_t createdAt() const override { return createdAt_; }

    void execute() override;
    void undo() override;

    const std::vector<CommandPtr>& getCommands() const { return commands_; }

private:
    std::vector<CommandPtr> commands_;
    std::string description_;
    int64_t createdAt_;
};

// "cmd-<ms>-<random>"
std::string generateCommandId();

// Text longer than maxLength is cut to maxLength - 3 characters plus "...".
std::string truncateText(const std::string& text, size_t maxLength);

} // namespace Marginalia
