#include <Marginalia/Types.hpp>
#include <Marginalia/Errors.hpp>
#include <chrono>
#include <random>
#include <sstream>

namespace Marginalia {

const char* toString(HighlightCategory c){
    switch(c){
        case HighlightCategory::Clarity: return "clarity";
        case HighlightCategory::Grammar: return "grammar";
        case HighlightCategory::Style: return "style";
        case HighlightCategory::Structure: return "structure";
        case HighlightCategory::Economy: return "economy";
        case HighlightCategory::Search: return "search";
        case HighlightCategory::Selection: return "selection";
    }
    return "clarity";
}

const char* toString(SuggestionCategory c){
    return toString(toHighlightCategory(c));
}

const char* toString(Priority p){
    switch(p){
        case Priority::Critical: return "critical";
        case Priority::High: return "high";
        case Priority::Medium: return "medium";
        case Priority::Low: return "low";
        case Priority::Background: return "background";
    }
    return "medium";
}

std::optional<HighlightCategory> parseHighlightCategory(const std::string& s){
    if(s == "clarity") return HighlightCategory::Clarity;
    if(s == "grammar") return HighlightCategory::Grammar;
    if(s == "style") return HighlightCategory::Style;
    if(s == "structure") return HighlightCategory::Structure;
    if(s == "economy") return HighlightCategory::Economy;
    if(s == "search") return HighlightCategory::Search;
    if(s == "selection") return HighlightCategory::Selection;
    return std::nullopt;
}

std::optional<SuggestionCategory> parseSuggestionCategory(const std::string& s){
    if(s == "clarity") return SuggestionCategory::Clarity;
    if(s == "grammar") return SuggestionCategory::Grammar;
    if(s == "style") return SuggestionCategory::Style;
    if(s == "structure") return SuggestionCategory::Structure;
    if(s == "economy") return SuggestionCategory::Economy;
    return std::nullopt;
}

std::optional<Priority> parsePriority(const std::string& s){
    if(s == "critical") return Priority::Critical;
    if(s == "high") return Priority::High;
    if(s == "medium") return Priority::Medium;
    if(s == "low") return Priority::Low;
    if(s == "background") return Priority::Background;
    return std::nullopt;
}

const std::vector<std::string>& suggestionCategoryNames(){
    static const std::vector<std::string> names = {"clarity", "grammar", "style", "structure", "economy"};
    return names;
}

HighlightCategory toHighlightCategory(SuggestionCategory c){
    switch(c){
        case SuggestionCategory::Clarity: return HighlightCategory::Clarity;
        case SuggestionCategory::Grammar: return HighlightCategory::Grammar;
        case SuggestionCategory::Style: return HighlightCategory::Style;
        case SuggestionCategory::Structure: return HighlightCategory::Structure;
        case SuggestionCategory::Economy: return HighlightCategory::Economy;
    }
    return HighlightCategory::Clarity;
}

int priorityValue(Priority p){
    switch(p){
        case Priority::Critical: return 100;
        case Priority::High: return 75;
        case Priority::Medium: return 50;
        case Priority::Low: return 25;
        case Priority::Background: return 0;
    }
    return 50;
}

PositionedSuggestion toPositionedSuggestion(const SuggestionHighlight& s, int64_t lineNumber, int64_t columnNumber){
    PositionedSuggestion p;
    static_cast<SuggestionHighlight&>(p) = s;
    p.lineNumber = lineNumber;
    p.columnNumber = columnNumber;
    return p;
}

int64_t currentTimeMillis(){
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string generateId(const std::string& prefix){
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dis(0, 35);
    std::stringstream ss;
    ss << prefix << "-" << currentTimeMillis() << "-";
    for(int i = 0; i < 9; ++i) ss << alphabet[dis(gen)];
    return ss.str();
}

std::string createSuggestionId(){
    return generateId("suggestion");
}

void to_json(nlohmann::json& j, const Range& r){
    j = nlohmann::json{{"start", r.start()}, {"end", r.end()}};
}

void from_json(const nlohmann::json& j, Range& r){
    r = Range(j.at("start").get<int64_t>(), j.at("end").get<int64_t>());
}

void to_json(nlohmann::json& j, const SuggestionHighlight& s){
    j = nlohmann::json{
        {"id", s.id},
        {"range", s.range},
        {"category", toString(s.category)},
        {"priority", toString(s.priority)},
        {"originalText", s.originalText},
        {"observation", s.observation},
        {"suggestedRevision", s.suggestedRevision}
    };
    if(s.confidence) j["confidence"] = *s.confidence;
    if(!s.metadata.is_null()) j["metadata"] = s.metadata;
}

void from_json(const nlohmann::json& j, SuggestionHighlight& s){
    s.id = j.at("id").get<std::string>();
    s.range = j.at("range").get<Range>();
    auto category = parseSuggestionCategory(j.at("category").get<std::string>());
    if(!category) throw DocumentError("Unknown suggestion category: " + j.at("category").get<std::string>());
    s.category = *category;
    s.priority = Priority::Medium;
    if(j.contains("priority")){
        auto p = parsePriority(j["priority"].get<std::string>());
        if(p) s.priority = *p;
    }
    s.originalText = j.at("originalText").get<std::string>();
    s.observation = j.value("observation", std::string());
    s.suggestedRevision = j.at("suggestedRevision").get<std::string>();
    s.confidence.reset();
    if(j.contains("confidence") && j["confidence"].is_number()) s.confidence = j["confidence"].get<double>();
    s.metadata = j.contains("metadata") ? j["metadata"] : nlohmann::json();
}

void to_json(nlohmann::json& j, const PositionedSuggestion& s){
    to_json(j, static_cast<const SuggestionHighlight&>(s));
    j["lineNumber"] = s.lineNumber;
    j["columnNumber"] = s.columnNumber;
}

} // namespace Marginalia
