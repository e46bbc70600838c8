#include "keyword_matcher.hpp"
#include "util.hpp"

KeywordMatcher::KeywordMatcher(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        add(word);
    }
}

int KeywordMatcher::index_of(const std::string& folded) const {
    for (size_t i = 0; i < folded_.size(); i++) {
        if (folded_[i] == folded) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<std::string> KeywordMatcher::match(const std::string& text) const {
    std::vector<std::string> found;
    if (text.empty()) {
        return found;
    }

    std::string haystack = util::fold_case(text);

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < folded_.size(); i++) {
        if (haystack.find(folded_[i]) != std::string::npos) {
            found.push_back(words_[i]);
        }
    }
    return found;
}

bool KeywordMatcher::add(const std::string& word) {
    std::string cleaned = util::trim(word);
    if (cleaned.empty()) {
        return false;
    }

    std::string folded = util::fold_case(cleaned);

    std::lock_guard<std::mutex> lock(mutex_);
    if (index_of(folded) >= 0) {
        return false;
    }
    words_.push_back(cleaned);
    folded_.push_back(folded);
    return true;
}

bool KeywordMatcher::remove(const std::string& word) {
    std::string folded = util::fold_case(util::trim(word));

    std::lock_guard<std::mutex> lock(mutex_);
    int idx = index_of(folded);
    if (idx < 0) {
        return false;
    }
    words_.erase(words_.begin() + idx);
    folded_.erase(folded_.begin() + idx);
    return true;
}

std::vector<std::string> KeywordMatcher::words() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return words_;
}

size_t KeywordMatcher::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return words_.size();
}
