#pragma once

#include <mutex>
#include <string>
#include <vector>

// Case-insensitive substring match over an editable word list
class KeywordMatcher {
public:
    explicit KeywordMatcher(const std::vector<std::string>& words = {});

    // Distinct listed words found in text, in list order
    std::vector<std::string> match(const std::string& text) const;

    bool add(const std::string& word);
    bool remove(const std::string& word);

    std::vector<std::string> words() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> words_;
    std::vector<std::string> folded_;

    int index_of(const std::string& folded) const;
};
