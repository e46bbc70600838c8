#include "orchestrator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <utility>

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::Clean: return "clean";
    case Outcome::Violation: return "violation";
    case Outcome::Unknown: return "unknown";
    }
    return "unknown";
}

const char* source_name(VerdictSource source) {
    switch (source) {
    case VerdictSource::Local: return "local";
    case VerdictSource::Remote: return "remote";
    case VerdictSource::None: return "none";
    }
    return "none";
}

ModerationOrchestrator::ModerationOrchestrator(std::shared_ptr<ClassificationClient> client,
                                               std::shared_ptr<KeywordMatcher> keywords,
                                               std::shared_ptr<ViolationLedger> ledger,
                                               OrchestratorOptions options)
    : ledger_(std::move(ledger))
    , options_(options)
    , client_(std::move(client))
    , keywords_(std::move(keywords))
{}

std::shared_ptr<ClassificationClient> ModerationOrchestrator::client() const {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    return client_;
}

std::shared_ptr<KeywordMatcher> ModerationOrchestrator::keywords() const {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    return keywords_;
}

void ModerationOrchestrator::replace_client(std::shared_ptr<ClassificationClient> client) {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    client_ = std::move(client);
    spdlog::info("Classification client replaced");
}

void ModerationOrchestrator::replace_keywords(std::shared_ptr<KeywordMatcher> keywords) {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    keywords_ = std::move(keywords);
    spdlog::info("Keyword list replaced ({} words)", keywords_ ? keywords_->size() : 0);
}

ModerationDecision ModerationOrchestrator::classify(const std::string& text) {
    ModerationDecision decision;

    // Hold our own references so a concurrent swap cannot pull them away mid-call
    auto keywords = this->keywords();
    auto client = this->client();

    if (options_.enable_local_check && keywords) {
        auto words = keywords->match(text);
        if (!words.empty()) {
            decision.outcome = Outcome::Violation;
            decision.source = VerdictSource::Local;
            decision.matched_words = std::move(words);
            decision.source_text = text;
            return decision;
        }
    }

    if (!client) {
        decision.outcome = Outcome::Unknown;
        return decision;
    }

    auto verdict = client->classify(text);
    if (!verdict) {
        decision.outcome = Outcome::Unknown;
        return decision;
    }

    decision.source = VerdictSource::Remote;
    if (!verdict->is_violation) {
        decision.outcome = Outcome::Clean;
        return decision;
    }

    decision.outcome = Outcome::Violation;
    decision.matched_words = verdict->matched_terms;
    decision.source_text = verdict->original_text.empty() ? text : verdict->original_text;
    decision.masked_text = verdict->masked_text;
    return decision;
}

ModerationDecision ModerationOrchestrator::moderate(const ModerationRequest& request) {
    ModerationDecision decision = classify(request.text);

    if (decision.outcome != Outcome::Violation) {
        spdlog::debug("Message from {}/{}: {}", request.group_id, request.user_id,
                      outcome_name(decision.outcome));
        return decision;
    }

    std::optional<int> duration_override;
    if (!options_.enable_auto_ban) {
        duration_override = 0;
    }

    auto recorded = ledger_->record_violation(request.group_id,
                                              request.user_id,
                                              request.user_name,
                                              decision.matched_words,
                                              decision.source_text,
                                              duration_override);

    decision.tier = recorded.tier;
    decision.ban_duration = recorded.ban_duration;

    spdlog::info("{} violation in {} by {}: [{}] tier {}",
                 source_name(decision.source), request.group_id, request.user_id,
                 util::join(decision.matched_words, ", "), decision.tier);
    return decision;
}

ModerationDecision ModerationOrchestrator::check(const std::string& text) {
    return classify(text);
}
