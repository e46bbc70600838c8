#include "ledger_connection.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

LedgerTransaction::LedgerTransaction(LedgerConnection& conn,
                                     const std::string& group_id,
                                     const std::string& user_id)
    : conn_(conn)
{
    conn_.begin_exclusive(group_id, user_id);
}

LedgerTransaction::~LedgerTransaction() {
    if (done_) {
        return;
    }
    try {
        conn_.rollback();
    } catch (const std::exception& e) {
        spdlog::warn("Rollback on {} failed: {}", conn_.backend_name(), e.what());
    }
}

void LedgerTransaction::commit() {
    conn_.commit();
    done_ = true;
}

std::string encode_words(const std::vector<std::string>& words) {
    nlohmann::json j = words;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> decode_words(const std::string& text, const std::string& backend) {
    if (text.empty()) {
        return {};
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw CorruptRecord(backend, std::string("forbidden_words: ") + e.what());
    }

    if (!j.is_array()) {
        throw CorruptRecord(backend, "forbidden_words is not an array");
    }

    std::vector<std::string> words;
    for (const auto& item : j) {
        if (!item.is_string()) {
            throw CorruptRecord(backend, "forbidden_words holds a non-string item");
        }
        words.push_back(item.get<std::string>());
    }
    return words;
}

util::CivilDate decode_date(const std::string& text, const std::string& backend) {
    util::CivilDate date;
    if (!util::CivilDate::parse(text, date)) {
        throw CorruptRecord(backend, "bad last_violation_date '" + text + "'");
    }
    return date;
}
