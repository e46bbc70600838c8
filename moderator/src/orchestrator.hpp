#pragma once

#include "classification_client.hpp"
#include "keyword_matcher.hpp"
#include "violation_ledger.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class Outcome { Clean, Violation, Unknown };
enum class VerdictSource { None, Local, Remote };

const char* outcome_name(Outcome outcome);
const char* source_name(VerdictSource source);

struct ModerationRequest {
    std::string group_id;
    std::string user_id;
    std::string user_name;
    std::string text;
};

struct ModerationDecision {
    Outcome outcome = Outcome::Unknown;
    VerdictSource source = VerdictSource::None;
    int tier = 0;
    int ban_duration = 0;
    std::vector<std::string> matched_words;
    std::string source_text;
    std::string masked_text;
};

struct OrchestratorOptions {
    bool enable_local_check = true;
    bool enable_auto_ban = true;   // false records violations with a zero duration
};

// Keyword match, then remote classification, then ledger escalation.
// Returns data only; acting on the decision is the caller's job.
class ModerationOrchestrator {
public:
    ModerationOrchestrator(std::shared_ptr<ClassificationClient> client,
                           std::shared_ptr<KeywordMatcher> keywords,
                           std::shared_ptr<ViolationLedger> ledger,
                           OrchestratorOptions options);

    // Ledger write failures (StorageError) and OperationCancelled propagate
    ModerationDecision moderate(const ModerationRequest& request);

    // Same classification path without touching the ledger
    ModerationDecision check(const std::string& text);

    void replace_client(std::shared_ptr<ClassificationClient> client);
    void replace_keywords(std::shared_ptr<KeywordMatcher> keywords);

    std::shared_ptr<ClassificationClient> client() const;
    std::shared_ptr<KeywordMatcher> keywords() const;
    std::shared_ptr<ViolationLedger> ledger() const { return ledger_; }

private:
    std::shared_ptr<ViolationLedger> ledger_;
    const OrchestratorOptions options_;

    mutable std::mutex swap_mutex_;
    std::shared_ptr<ClassificationClient> client_;
    std::shared_ptr<KeywordMatcher> keywords_;

    ModerationDecision classify(const std::string& text);
};
