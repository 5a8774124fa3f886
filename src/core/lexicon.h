#ifndef PL_LEXICON_H
#define PL_LEXICON_H

// Multilingual hesitation lexicons (filler words, self-correction markers).
// Built once on first use and never mutated; safe to share across threads.

#include <string>
#include <unordered_set>
#include <vector>

namespace pl {

class Lexicon {
public:
    static const Lexicon& instance();

    // Supported language codes in priority order (en, fr, es, de, pt)
    const std::vector<std::string>& languages() const { return languages_; }

    bool supports(const std::string& code) const;

    // Lower-cased filler entries (unigrams and two-word phrases) of the given languages
    std::unordered_set<std::string> fillers_for(const std::vector<std::string>& langs) const;

    // Lower-cased self-correction markers of one language; empty if unsupported
    const std::vector<std::string>& correction_markers(const std::string& lang) const;

private:
    struct Entry {
        std::string code;
        std::vector<std::string> fillers;
        std::vector<std::string> corrections;
    };

    Lexicon();
    Lexicon(const Lexicon&) = delete;
    Lexicon& operator=(const Lexicon&) = delete;

    const Entry* find(const std::string& code) const;

    std::vector<Entry>       entries_;
    std::vector<std::string> languages_;
};

// ASCII and Latin-1 supplement lower-casing of UTF-8 text
std::string to_lower(const std::string& text);

// True when the code point starting at / ending before byte `pos` is a letter
bool is_letter_at(const std::string& text, size_t pos);
bool is_letter_before(const std::string& text, size_t pos);

// At most `max_chars` UTF-8 code points of `text` starting at byte `pos`
std::string utf8_prefix(const std::string& text, size_t pos, size_t max_chars);

// Strip surrounding punctuation from a token
std::string clean_word(const std::string& word);

} // namespace pl

#endif // PL_LEXICON_H
