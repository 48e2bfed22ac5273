/// @file main.cpp
/// @brief PromptGuard command-line entry point
///
/// Screens prompts from a file (one per line) or from the command line
/// against a fresh in-memory session and prints the verdicts as JSON.

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "security/security_config.h"
#include "security/session_store.h"

namespace {

constexpr const char* kVersion = "1.0.0";

bool ReadPrompts(const std::string& path, std::vector<std::string>& prompts) {
    std::ifstream input(path);
    if (!input) {
        return false;
    }
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            prompts.push_back(line);
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"PromptGuard - prompt injection screening for LLM front ends"};

    std::string config_path;
    std::string prompts_path;
    std::string session_id = "cli-session";
    std::string log_level;
    std::vector<std::string> prompt_args;
    std::optional<double> high_confidence;
    bool single_flag = false;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("-f,--file", prompts_path, "File with one prompt per line");
    app.add_option("--session", session_id, "Session identifier for the batch");
    app.add_option("--high-confidence", high_confidence,
                   "Session termination bar (0.0-1.0)");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("--single", single_flag,
                 "Preprocess each prompt on its own instead of as a guarded batch");
    app.add_flag("-v,--version", version_flag, "Print version and exit");
    app.add_option("prompts", prompt_args, "Prompts to screen");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "PromptGuard v" << kVersion << std::endl;
        return 0;
    }

    // Load configuration
    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto config_or = promptguard::LoadConfig(path);
    if (!config_or.ok()) {
        std::cerr << "Failed to load config: " << config_or.status().message() << std::endl;
        return 1;
    }
    if (!log_level.empty()) {
        config_or->Set("logging.level", log_level);
    }
    if (high_confidence.has_value()) {
        config_or->Set("security.batch.high_confidence_threshold", *high_confidence);
    }

    auto settings_or = promptguard::security::LoadPromptGuardConfig(*config_or);
    if (!settings_or.ok()) {
        std::cerr << "Invalid configuration: " << settings_or.status().message() << std::endl;
        return 1;
    }
    auto& settings = *settings_or;

    // Logs go to stderr so stdout carries only JSON
    settings.logging.name = "promptguard-cli";
    settings.logging.console_to_stderr = true;
    promptguard::InitLogging(settings.logging);

    // Collect prompts
    std::vector<std::string> prompts;
    if (!prompts_path.empty() && !ReadPrompts(prompts_path, prompts)) {
        PROMPTGUARD_LOG_ERROR("Cannot read prompts from {}", prompts_path);
        return 1;
    }
    prompts.insert(prompts.end(), prompt_args.begin(), prompt_args.end());
    if (prompts.empty()) {
        PROMPTGUARD_LOG_ERROR("No prompts given; use --file or positional arguments");
        return 1;
    }

    auto sessions = std::make_shared<promptguard::security::InMemorySessionStore>();
    sessions->CreateSession(session_id, {{"origin", "cli"}});

    auto pipeline_or = promptguard::security::BuildPromptGuardPipeline(settings, sessions);
    if (!pipeline_or.ok()) {
        PROMPTGUARD_LOG_ERROR("Failed to build pipeline: {}", pipeline_or.status().message());
        return 1;
    }
    auto& pipeline = *pipeline_or;

    PROMPTGUARD_LOG_INFO("Screening {} prompt(s) for session {}", prompts.size(), session_id);

    int exit_code = 0;
    nlohmann::json output;
    if (single_flag) {
        output = nlohmann::json::array();
        promptguard::security::DetectionContext context;
        context.session_id = session_id;
        for (const auto& prompt : prompts) {
            auto result = pipeline.preprocessor->Preprocess(prompt, context);
            if (!result.ok()) {
                output.push_back({{"error", absl::StatusCodeToString(result.status().code())}});
                exit_code = 2;
                continue;
            }
            output.push_back(promptguard::security::SecurePreprocessResultToJson(*result));
        }
    } else {
        auto result = pipeline.processor->ProcessPromptsWithSecurity(prompts, session_id);
        if (!result.ok()) {
            PROMPTGUARD_LOG_ERROR("Batch failed: {}", result.status().message());
            pipeline.Shutdown();
            promptguard::ShutdownLogging();
            return 1;
        }
        output = result->ToJson();
    }

    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;

    pipeline.Shutdown();
    promptguard::ShutdownLogging();
    return exit_code;
}
