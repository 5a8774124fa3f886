#include "core/lexicon.h"

#include <cctype>
#include <cstdint>

namespace pl {

namespace {

// Decode the UTF-8 code point at byte `pos`; returns 0 on malformed input.
uint32_t decode_at(const std::string& s, size_t pos) {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) return b0;
    int extra = (b0 >= 0xF0) ? 3 : (b0 >= 0xE0) ? 2 : (b0 >= 0xC0) ? 1 : -1;
    if (extra < 0 || pos + extra >= s.size()) return 0;
    uint32_t cp = b0 & (0x3F >> extra);
    for (int i = 1; i <= extra; ++i)
        cp = (cp << 6) | (static_cast<unsigned char>(s[pos + i]) & 0x3F);
    return cp;
}

bool is_letter_cp(uint32_t cp) {
    if (cp < 0x80) return std::isalpha(static_cast<int>(cp)) != 0;
    if (cp >= 0xC0 && cp <= 0x24F) return cp != 0xD7 && cp != 0xF7;   // Latin-1 / Extended
    if (cp >= 0x370 && cp <= 0x1FFF) return true;                      // Greek, Cyrillic, ...
    if (cp >= 0x3040 && cp <= 0x9FFF) return true;                     // Kana, CJK
    if (cp >= 0xAC00 && cp <= 0xD7AF) return true;                     // Hangul
    return false;
}

} // anonymous namespace

// ============================================================
Lexicon::Lexicon() {
    entries_ = {
        {"en",
         {"um", "uh", "uh huh", "like", "you know", "i mean", "so", "well", "actually",
          "basically", "literally", "okay so"},
         {"i mean", "no wait", "sorry", "actually no", "let me rephrase", "or rather", "well no"}},
        {"fr",
         {"euh", "heu", "genre", "en fait", "du coup", "voilà", "quoi", "bah",
          "bon", "ben", "tu vois", "en gros", "c'est-à-dire"},
         {"en fait", "non attends", "pardon", "je veux dire", "non en fait", "ou plutôt", "enfin"}},
        {"es",
         {"eh", "este", "bueno", "o sea", "pues", "digamos", "como que",
          "a ver", "entonces", "mira"},
         {"o sea", "no espera", "perdón", "quiero decir", "mejor dicho", "bueno no"}},
        {"de",
         {"äh", "ähm", "also", "halt", "sozusagen", "quasi", "na ja",
          "irgendwie", "sag mal", "weißt du"},
         {"ich meine", "nein warte", "also nein", "beziehungsweise", "anders gesagt"}},
        {"pt",
         {"é", "tipo", "então", "né", "bem", "quer dizer", "assim",
          "olha", "sabe", "entendeu"},
         {"quer dizer", "não espera", "desculpa", "ou melhor", "na verdade não"}},
    };
    for (const auto& e : entries_) languages_.push_back(e.code);
}

const Lexicon& Lexicon::instance() {
    static const Lexicon lexicon;
    return lexicon;
}

const Lexicon::Entry* Lexicon::find(const std::string& code) const {
    for (const auto& e : entries_)
        if (e.code == code) return &e;
    return nullptr;
}

bool Lexicon::supports(const std::string& code) const {
    return find(code) != nullptr;
}

std::unordered_set<std::string> Lexicon::fillers_for(const std::vector<std::string>& langs) const {
    std::unordered_set<std::string> combined;
    for (const auto& lang : langs) {
        if (const Entry* e = find(lang))
            combined.insert(e->fillers.begin(), e->fillers.end());
    }
    return combined;
}

const std::vector<std::string>& Lexicon::correction_markers(const std::string& lang) const {
    static const std::vector<std::string> kEmpty;
    const Entry* e = find(lang);
    return e ? e->corrections : kEmpty;
}

// ============================================================
std::string to_lower(const std::string& text) {
    std::string out(text);
    for (size_t i = 0; i < out.size(); ++i) {
        auto c = static_cast<unsigned char>(out[i]);
        if (c < 0x80) {
            out[i] = static_cast<char>(std::tolower(c));
        } else if (c == 0xC3 && i + 1 < out.size()) {
            // U+00C0..U+00DE (except U+00D7) map to U+00E0..U+00FE
            auto n = static_cast<unsigned char>(out[i + 1]);
            if (n >= 0x80 && n <= 0x9E && n != 0x97) out[i + 1] = static_cast<char>(n + 0x20);
            ++i;
        }
    }
    return out;
}

bool is_letter_at(const std::string& text, size_t pos) {
    if (pos >= text.size()) return false;
    return is_letter_cp(decode_at(text, pos));
}

bool is_letter_before(const std::string& text, size_t pos) {
    if (pos == 0 || pos > text.size()) return false;
    size_t start = pos - 1;
    // Back up over continuation bytes to the lead byte
    while (start > 0 && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) --start;
    return is_letter_cp(decode_at(text, start));
}

std::string utf8_prefix(const std::string& text, size_t pos, size_t max_chars) {
    if (pos >= text.size()) return {};
    size_t end = pos, chars = 0;
    while (end < text.size()) {
        if ((static_cast<unsigned char>(text[end]) & 0xC0) != 0x80) {
            if (chars == max_chars) break;
            ++chars;
        }
        ++end;
    }
    return text.substr(pos, end - pos);
}

std::string clean_word(const std::string& word) {
    static const std::string kStrip = " .,!?;:\"'()[]*";
    size_t b = 0, e = word.size();
    while (b < e && kStrip.find(word[b]) != std::string::npos) ++b;
    while (e > b && kStrip.find(word[e - 1]) != std::string::npos) --e;
    return word.substr(b, e - b);
}

} // namespace pl
