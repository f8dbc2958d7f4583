#include <Marginalia/EngineConfig.hpp>
#include <Marginalia/FeatureFlags.hpp>
#include <Marginalia/HighlightSession.hpp>
#include <Marginalia/Tools/ToolExecutor.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

using namespace Marginalia;

static void printUsage(const char* argv0){
    std::cerr << "usage: " << argv0 << " <document> <tool-calls.json> [--config cfg.json]\n";
}

static bool readFile(const std::string& path, std::string& out){
    std::ifstream in(path, std::ios::binary);
    if(!in) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// Accepts a bare array of calls or {"tool_calls": [...]}.
static bool parseToolCalls(const std::string& text, std::vector<ToolCall>& out, std::string& err){
    nlohmann::json j;
    try{
        j = nlohmann::json::parse(text);
    } catch(const nlohmann::json::parse_error& e){
        err = e.what();
        return false;
    }
    if(j.is_object() && j.contains("tool_calls")) j = j["tool_calls"];
    if(!j.is_array()){
        err = "expected an array of tool calls";
        return false;
    }
    try{
        for(const auto& c : j) out.push_back(c.get<ToolCall>());
    } catch(const nlohmann::json::exception& e){
        err = e.what();
        return false;
    }
    return true;
}

int main(int argc, char** argv)
{
    // Logs go to stderr so stdout carries only the JSON report.
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::info, &consoleAppender);

    std::vector<std::string> positional;
    std::string configPath;
    for(int i = 1; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "--config"){
            if(i + 1 >= argc){ printUsage(argv[0]); return 1; }
            configPath = argv[++i];
        } else if(arg == "-h" || arg == "--help"){
            printUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if(positional.size() != 2){
        printUsage(argv[0]);
        return 1;
    }

    EngineConfig config;
    if(!configPath.empty()){
        std::string err;
        auto loaded = EngineConfig::loadFile(configPath, &err);
        if(!loaded){
            std::cerr << "config error: " << err << "\n";
            return 1;
        }
        config = *loaded;
    }
    setFeatureFlags(config.featureFlags);
    if(isDebugEnabled()){
        plog::get()->setMaxSeverity(plog::debug);
        PLOGD << "[Flags] " << debugFlags().dump();
    }

    std::string document;
    if(!readFile(positional[0], document)){
        PLOGE << "cannot read document " << positional[0];
        return 1;
    }
    std::string callsText;
    if(!readFile(positional[1], callsText)){
        PLOGE << "cannot read tool calls " << positional[1];
        return 1;
    }
    std::vector<ToolCall> calls;
    std::string parseErr;
    if(!parseToolCalls(callsText, calls, parseErr)){
        PLOGE << "invalid tool calls file: " << parseErr;
        return 1;
    }

    HighlightSession session([&document](){ return document; },
                             [&document](const std::string& next){ document = next; },
                             HighlightSessionOptions::fromConfig(config));

    ToolExecutorOptions execOptions;
    execOptions.timeoutMs = config.toolTimeoutMs;
    execOptions.continueOnError = config.continueOnError;

    PLOGI << "running " << calls.size() << " tool call(s) over " << positional[0];
    ToolCallResults results = session.runToolCalls(calls, execOptions);

    nlohmann::json report;
    report["results"] = results;
    report["stats"] = toJson(calculateBatchStats(results));
    report["state"] = toString(session.state());
    report["suggestions"] = session.positionedSuggestions();
    std::cout << report.dump(2) << std::endl;
    return 0;
}
