/// @file injection_patterns.cpp
/// @brief Built-in injection signatures and word lists

#include "security/injection_patterns.h"

namespace promptguard::security {

namespace {

using T = InjectionType;
using S = SecuritySeverity;

}  // namespace

const std::vector<InjectionPatternSpec>& DefaultInjectionPatterns() {
    static const std::vector<InjectionPatternSpec> kPatterns = {
        // =====================================================================
        // Instruction override
        // =====================================================================
        {"instruction_override",
         R"re(\b(?:ignore|disregard|forget|bypass|override)\s{1,8}(?:all\s{1,8}(?:of\s{1,8})?)?(?:(?:the|your|my|any)\s{1,8})?(?:previous|prior|earlier|above|preceding|system|initial|original)\s{1,8}(?:instructions?|directives?|rules?|prompts?|commands?|guidelines?))re",
         T::kInstructionOverride, S::kHigh, 0.95},
        {"instruction_discard",
         R"re(\b(?:ignore|disregard|forget)\s{1,8}(?:(?:all|everything)\s{1,8}(?:(?:of\s{1,8})?(?:your|the)\s{1,8})?|your\s{1,8})(?:instructions?|directives?|rules?|prompts?|commands?|guidelines?|training)\b)re",
         T::kInstructionOverride, S::kHigh, 0.9},
        {"instruction_discard_all",
         R"re(\b(?:ignore|disregard|forget)\s{1,8}(?:all|everything)\s{1,8}(?:above|before|you\s{1,8}(?:know|learned|were\s{1,8}told)))re",
         T::kInstructionOverride, S::kHigh, 0.9},
        {"disobey_rules",
         R"re(\bdisobey\s{1,8}(?:(?:the|your|all|any)\s{1,8}){0,4}(?:rules?|instructions?|directives?|guidelines?|system))re",
         T::kInstructionOverride, S::kHigh, 0.9},
        {"new_instructions",
         R"re(\bnew\s{1,8}(?:instructions?|directives?|rules)\s{0,8}:)re",
         T::kInstructionOverride, S::kHigh, 0.85},
        {"conversation_reset",
         R"re(\b(?:reset|clear|wipe|erase)\s{1,8}(?:(?:the|this|your|our|all)\s{1,8}){0,4}(?:conversation|context|chat|session|memory|history)\b)re",
         T::kContextManipulation, S::kHigh, 0.85},

        // =====================================================================
        // Safety bypass / jailbreak
        // =====================================================================
        {"safety_bypass",
         R"re(\b(?:override|bypass|skip|disable|circumvent)\s{1,8}(?:(?:the|your|all|any)\s{1,8}){0,4}(?:security|safety|filters?|checks?|restrictions?|guardrails?|moderation))re",
         T::kInstructionOverride, S::kHigh, 0.9},
        {"restriction_removal",
         R"re(\b(?:disable|remove|ignore|lift)\s{1,8}(?:(?:all|your|any)\s{1,8}){0,4}(?:restrictions?|limitations?|constraints?))re",
         T::kInstructionOverride, S::kHigh, 0.9},
        {"jailbreak",
         R"re(\bjailbreak|\b(?:dan\s{1,8}mode|do\s{1,8}anything\s{1,8}now|developer\s{1,8}mode|god\s{1,8}mode)\b)re",
         T::kInstructionOverride, S::kHigh, 0.9},

        // =====================================================================
        // System prompt extraction
        // =====================================================================
        {"system_prompt_extraction",
         R"re(\b(?:show|tell|reveal|display|print|output|repeat|leak|dump)\s{1,8}(?:(?:me|us)\s{1,8})?(?:all\s{1,8})?(?:your\s{1,8}(?:(?:hidden|secret|original|initial|internal|full|system)\s{1,8}){0,4}(?:prompts?|instructions?|system\s{1,8}message|rules|directives?|guidelines)|the\s{1,8}(?:(?:hidden|secret|original|initial|internal|system)\s{1,8}){1,4}(?:prompts?|instructions?|message)))re",
         T::kSystemPromptAccess, S::kHigh, 0.88},
        {"system_prompt_question",
         R"re(\bwhat\s{1,8}(?:are|were|is)\s{1,8}your\s{1,8}(?:(?:original|initial|system|hidden|secret)\s{1,8}){0,4}(?:instructions?|prompts?|rules|directives?|system\s{1,8}message))re",
         T::kSystemPromptAccess, S::kHigh, 0.88},
        {"repeat_above",
         R"re(\brepeat\s{1,8}(?:everything|all|the\s{1,8}text)\s{1,8}(?:above|before))re",
         T::kSystemPromptAccess, S::kHigh, 0.88},
        {"config_access",
         R"re(\b(?:show|reveal|display|print|dump|read|cat|give\s{1,8}me)\b[^\n]{0,40}?(?:\.env\b|environment\s{1,8}variables|api\s{1,8}keys?|secret\s{1,8}keys?|credentials|passwords?))re",
         T::kSystemPromptAccess, S::kHigh, 0.85},

        // =====================================================================
        // Role and channel spoofing
        // =====================================================================
        {"system_role_preface",
         R"re((?:^|\n)[ \t]{0,8}system[ \t]{0,8}:)re",
         T::kSystemPromptAccess, S::kHigh, 0.9},
        {"assistant_role_preface",
         R"re((?:^|\n)[ \t]{0,8}assistant[ \t]{0,8}:)re",
         T::kRoleConfusion, S::kHigh, 0.85},
        {"user_role_preface",
         R"re((?:^|\n)[ \t]{0,8}user[ \t]{0,8}:)re",
         T::kRoleConfusion, S::kHigh, 0.85},
        {"chat_template_token",
         R"re(<\|im_start\|>|<\|im_end\|>|<\|endoftext\|>|\[/?INST\]|<</?SYS>>|</?system>|\[\[(?:system|assistant|user)\]\])re",
         T::kRoleConfusion, S::kHigh, 0.9},
        {"markdown_role_header",
         R"re(#{2,}[ \t]{0,8}(?:system|assistant|user|instructions?)[ \t]{0,8}:)re",
         T::kRoleConfusion, S::kHigh, 0.85},

        // Role directives; legitimate personas are damped
        {"you_are_now",
         R"re(\byou\s{1,8}are\s{1,8}now\b)re",
         T::kRoleConfusion, S::kMedium, 0.82, PatternDamping::kLegitimateRole},
        {"pretend_to_be",
         R"re(\bpretend\s{1,8}(?:to\s{1,8}be|you\s{1,8}are|that\s{1,8}you\s{1,8}are)\b)re",
         T::kRoleConfusion, S::kMedium, 0.82, PatternDamping::kLegitimateRole},
        {"roleplay_as",
         R"re(\brole-?\s?play\s{1,8}as\b)re",
         T::kRoleConfusion, S::kMedium, 0.82, PatternDamping::kLegitimateRole},
        {"act_as",
         R"re((?:^|[.!?;\n][ \t]{0,8}|\b(?:please|now|you\s{1,8}will|you\s{1,8}must|you\s{1,8}should|i\s{1,8}want\s{1,8}you\s{1,8}to|from\s{1,8}now\s{1,8}on,?)\s{1,8})act\s{1,8}as\b)re",
         T::kRoleConfusion, S::kMedium, 0.82, PatternDamping::kLegitimateRole},

        // =====================================================================
        // Structural delimiters
        // =====================================================================
        {"delimiter_dashes",
         R"re((?:^|\n)[ \t]{0,8}-{3,}[ \t]{0,8}(?:\r?\n|$))re",
         T::kDelimiterInjection, S::kMedium, 0.8},
        {"delimiter_hashes",
         R"re((?:^|\n)[ \t]{0,8}#{3,}[ \t]{0,8}(?:\r?\n|$))re",
         T::kDelimiterInjection, S::kMedium, 0.8},
        {"role_tagged_fence",
         R"re(```[ \t]{0,8}(?:system|assistant|user|prompt|instructions?)\b)re",
         T::kDelimiterInjection, S::kMedium, 0.8},

        // =====================================================================
        // Memory and context manipulation
        // =====================================================================
        {"memory_wipe",
         R"re(\bmemory\s{1,8}(?:wipe|clear|reset|erase)\b|\b(?:wipe|erase)\s{1,8}your\s{1,8}memory\b)re",
         T::kContextManipulation, S::kHigh, 0.85},
        {"context_boundary",
         R"re(\b(?:new|fresh)\s{1,8}(?:conversation|session|context)\s{1,8}(?:starts?|begins?)\b|\bend\s{1,8}of\s{1,8}(?:conversation|context|session)\b)re",
         T::kContextManipulation, S::kHigh, 0.85},
        {"memory_implant",
         R"re(\b(?:remember|memorize)\s{1,8}(?:this|that|the\s{1,8}following)\s{1,8}(?:as\s{1,8})?(?:your\s{1,8})?(?:new\s{1,8})?(?:instructions?|rules?|directives?))re",
         T::kContextManipulation, S::kMedium, 0.75},

        // =====================================================================
        // Parameters, tools, templates
        // =====================================================================
        {"parameter_injection",
         R"re(\b(?:top_k|similarity_threshold|temperature|max_tokens|namespace|system_prompt)\s{0,8}[=:])re",
         T::kParameterManipulation, S::kMedium, 0.7},
        {"tool_invocation",
         R"re(</?tool_call>|<function_call>|\bcall_tool\s{0,8}\(|"tool_calls?"\s{0,8}:)re",
         T::kOther, S::kMedium, 0.8},
        {"template_injection",
         R"re(\{\{[^}\n]{1,200}\}\}|\$\{[^}\n]{1,200}\}|<%[^%\n]{0,200}%>)re",
         T::kOther, S::kMedium, 0.6},
    };
    return kPatterns;
}

const std::vector<std::string_view>& LegitimateRoleNouns() {
    static const std::vector<std::string_view> kNouns = {
        "financial advisor", "advisor", "adviser", "consultant", "teacher",
        "tutor", "guide", "helper", "mentor", "expert in", "professional",
        "responsible investor", "translator", "interviewer", "coach",
        "reviewer", "editor",
    };
    return kNouns;
}

const std::vector<std::string_view>& ContextBoundaryIndicators() {
    static const std::vector<std::string_view> kIndicators = {
        "conversation history", "previous messages", "chat log", "session data",
        "memory bank", "new conversation", "context reset", "memory wipe",
        "session begins",
    };
    return kIndicators;
}

const std::vector<std::string_view>& LegitimateContextMarkers() {
    static const std::vector<std::string_view> kMarkers = {
        "how do i", "what is", "can you explain", "tell me about",
        "help me understand", "bitcoin", "blockchain", "cryptocurrency",
        "responsible investor", "configure", "settings",
    };
    return kMarkers;
}

const std::vector<std::string_view>& TechnicalTerms() {
    static const std::vector<std::string_view> kTerms = {
        "bitcoin", "blockchain", "cryptocurrency", "crypto", "btc", "eth",
        "ethereum", "mining", "hash", "block", "transaction", "wallet",
        "address", "key", "network", "node", "consensus", "proof", "work",
        "stake", "defi", "smart", "contract", "token", "coin", "exchange",
        "trading", "price", "market", "value", "investment", "security",
        "protocol", "algorithm", "decentralized", "distributed", "peer",
        "ledger", "chain", "fork", "lightning", "layer", "scaling", "gas",
        "fee", "satoshi", "wei", "api", "sdk", "json", "http", "url",
        "database", "server", "client", "function", "method", "class",
        "object", "array", "string", "integer", "boolean", "null", "true",
        "false", "error", "exception", "debug",
    };
    return kTerms;
}

const std::vector<std::string_view>& ObfuscatedKeywords() {
    static const std::vector<std::string_view> kKeywords = {
        "ignoreprevious", "ignoreall", "ignoreinstructions", "ignoreyour",
        "ignoreprior", "disregardprevious", "disregardall", "forgetprevious",
        "forgetall", "forgetyour", "overridesystem", "bypasssafety",
        "bypasssecurity", "systemprompt", "jailbreak", "revealyour",
        "youarenow", "developermode",
    };
    return kKeywords;
}

}  // namespace promptguard::security
