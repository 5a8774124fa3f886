// Unit tests for HesitationAnalyzer and the multilingual lexicon.

#include <gtest/gtest.h>
#include "core/hesitation_analyzer.h"
#include "core/lexicon.h"

#include <string>
#include <vector>

using namespace pl;

namespace {

// Non-silent windows every 25 ms over [0, seconds); energy chosen per window
template<typename EnergyFn>
static ProsodyResult make_prosody(double seconds, EnergyFn energy_at) {
    ProsodyResult r;
    for (double t = 0.0; t + 0.05 <= seconds + 1e-9; t += 0.025) {
        ProsodyWindow w;
        w.start_time   = t;
        w.end_time     = t + 0.05;
        w.pitch_hz     = 150.0f;
        w.energy_db    = energy_at(t);
        w.energy_delta = energy_at(t) + 20.0f;
        r.windows.push_back(w);
    }
    return r;
}

static std::vector<TranscriptSegment> contiguous(const std::vector<std::string>& texts,
                                                 double seg_len = 1.0) {
    std::vector<TranscriptSegment> segs;
    for (size_t i = 0; i < texts.size(); ++i)
        segs.push_back({i * seg_len, (i + 1) * seg_len, texts[i]});
    return segs;
}

static std::string join(const std::vector<TranscriptSegment>& segs) {
    std::string out;
    for (const auto& s : segs) {
        if (!out.empty()) out += ' ';
        out += s.text;
    }
    return out;
}

// Well-formed UTF-8: every lead byte is followed by its exact continuation count
static bool valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t extra;
        if (c < 0x80)                extra = 0;
        else if ((c & 0xE0) == 0xC0) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0) extra = 3;
        else return false;
        if (i + extra >= s.size() && extra > 0) return false;
        for (size_t k = 1; k <= extra; ++k)
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        i += extra + 1;
    }
    return true;
}

static std::vector<HesitationAnnotation> of_type(const HesitationResult& r, HesitationType t) {
    std::vector<HesitationAnnotation> out;
    for (const auto& a : r.annotations)
        if (a.type == t) out.push_back(a);
    return out;
}

} // namespace

// ----------------------------------------------------------------
// Degenerate input
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, EmptyTextIsFullyFluent) {
    HesitationAnalyzer analyzer;
    for (const char* text : {"", "   ", "\n\t "}) {
        auto r = analyzer.analyze(text, nullptr, nullptr);
        EXPECT_FLOAT_EQ(r.fluency_score, 1.0f);
        EXPECT_TRUE(r.annotations.empty());
        EXPECT_EQ(r.filler_count, 0);
    }
}

TEST(HesitationAnalyzer, CleanTextHasNoAnnotations) {
    auto r = HesitationAnalyzer().analyze("The quarterly report is ready for review.",
                                          nullptr, nullptr, "en");
    EXPECT_TRUE(r.annotations.empty());
    EXPECT_FLOAT_EQ(r.fluency_score, 1.0f);
}

// ----------------------------------------------------------------
// Fillers
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, CountsEnglishFillers) {
    auto r = HesitationAnalyzer().analyze("um I think uh this is right", nullptr, nullptr, "en");
    EXPECT_EQ(r.filler_count, 2);
    auto fillers = of_type(r, HesitationType::FillerWord);
    ASSERT_EQ(fillers.size(), 2u);
    EXPECT_EQ(fillers[0].text, "um");
    EXPECT_EQ(fillers[1].text, "uh");
    EXPECT_FLOAT_EQ(fillers[0].confidence, 0.9f);
    // No segments: no time estimate
    EXPECT_DOUBLE_EQ(fillers[0].start_time, 0.0);
    EXPECT_DOUBLE_EQ(fillers[0].end_time, 0.0);
}

TEST(HesitationAnalyzer, FillersAreCaseAndPunctuationInsensitive) {
    auto r = HesitationAnalyzer().analyze("Um, we should (UH) go.", nullptr, nullptr);
    EXPECT_EQ(r.filler_count, 2);
}

TEST(HesitationAnalyzer, BigramFiller) {
    auto r = HesitationAnalyzer().analyze("I was, you know, tired", nullptr, nullptr, "en");
    EXPECT_EQ(r.filler_count, 1);
    auto fillers = of_type(r, HesitationType::FillerWord);
    ASSERT_EQ(fillers.size(), 1u);
    EXPECT_EQ(fillers[0].text, "you");
}

TEST(HesitationAnalyzer, AccentedUppercaseFiller) {
    auto r = HesitationAnalyzer().analyze("\xC3\x84h, das ist gut", nullptr, nullptr, "de-DE");
    EXPECT_EQ(r.filler_count, 1);
}

TEST(HesitationAnalyzer, FillerTimeFromWordPosition) {
    std::vector<TranscriptSegment> segs{{1.0, 3.0, "um a b c"}};
    auto r = HesitationAnalyzer().analyze("um a b c", &segs, nullptr);
    auto fillers = of_type(r, HesitationType::FillerWord);
    ASSERT_EQ(fillers.size(), 1u);
    EXPECT_DOUBLE_EQ(fillers[0].start_time, 1.0);
    EXPECT_DOUBLE_EQ(fillers[0].end_time, 1.5);
}

// ----------------------------------------------------------------
// Language resolution
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, DetectedLanguageFirstThenAll) {
    auto langs = HesitationAnalyzer().resolve_languages("fr-FR");
    ASSERT_EQ(langs.size(), 5u);
    EXPECT_EQ(langs[0], "fr");
    EXPECT_EQ(langs[1], "en");
}

TEST(HesitationAnalyzer, UnknownLanguageSearchesAll) {
    auto langs = HesitationAnalyzer().resolve_languages("xx");
    ASSERT_EQ(langs.size(), 5u);
    EXPECT_EQ(langs[0], "en");
}

TEST(HesitationAnalyzer, SingleLanguagePolicy) {
    HesitationConfig cfg;
    cfg.union_all_languages = false;
    HesitationAnalyzer strict(cfg);

    auto langs = strict.resolve_languages("FR");
    ASSERT_EQ(langs.size(), 1u);
    EXPECT_EQ(langs[0], "fr");

    // English "so" only counts when every lexicon is searched
    EXPECT_EQ(strict.analyze("so euh voila", nullptr, nullptr, "fr").filler_count, 1);
    EXPECT_EQ(HesitationAnalyzer().analyze("so euh voila", nullptr, nullptr, "fr").filler_count, 2);

    // Unknown language still falls back to every lexicon
    EXPECT_EQ(strict.resolve_languages("").size(), 5u);
}

// ----------------------------------------------------------------
// Self-corrections
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, SelfCorrectionWithSuggestion) {
    auto r = HesitationAnalyzer().analyze("Send it to Bob, I mean Alice, tomorrow",
                                          nullptr, nullptr, "en");
    EXPECT_EQ(r.self_correction_count, 1);
    auto corrections = of_type(r, HesitationType::SelfCorrection);
    ASSERT_EQ(corrections.size(), 1u);
    EXPECT_EQ(corrections[0].text, "I mean");
    EXPECT_FLOAT_EQ(corrections[0].confidence, 0.8f);
    ASSERT_FALSE(corrections[0].suggestion.empty());
    EXPECT_NE(corrections[0].suggestion.find("\"Alice, tomorrow\""), std::string::npos);
}

TEST(HesitationAnalyzer, SelfCorrectionRequiresWordBoundary) {
    auto r = HesitationAnalyzer().analyze("I meant every word of it", nullptr, nullptr, "en");
    EXPECT_EQ(r.self_correction_count, 0);
}

TEST(HesitationAnalyzer, SelfCorrectionAtEndHasNoSuggestion) {
    auto r = HesitationAnalyzer().analyze("That was the wrong file, sorry", nullptr, nullptr, "en");
    auto corrections = of_type(r, HesitationType::SelfCorrection);
    ASSERT_EQ(corrections.size(), 1u);
    EXPECT_TRUE(corrections[0].suggestion.empty());
}

TEST(HesitationAnalyzer, SuggestionIsLimitedToSixtyChars) {
    std::string tail(100, 'x');
    auto r = HesitationAnalyzer().analyze("no wait " + tail, nullptr, nullptr, "en");
    auto corrections = of_type(r, HesitationType::SelfCorrection);
    ASSERT_EQ(corrections.size(), 1u);
    // Marker is followed by one space then 59 x's
    EXPECT_NE(corrections[0].suggestion.find("\"" + std::string(59, 'x') + "\""),
              std::string::npos);
}

TEST(HesitationAnalyzer, SuggestionKeepsUtf8Intact) {
    std::string tail;
    for (int i = 0; i < 100; ++i) tail += "\xC3\xA9";
    auto r = HesitationAnalyzer().analyze("no wait " + tail, nullptr, nullptr, "en");
    auto corrections = of_type(r, HesitationType::SelfCorrection);
    ASSERT_EQ(corrections.size(), 1u);
    EXPECT_TRUE(valid_utf8(corrections[0].suggestion));

    // Sixty code points: the leading space then 59 accented letters
    std::string expected;
    for (int i = 0; i < 59; ++i) expected += "\xC3\xA9";
    EXPECT_NE(corrections[0].suggestion.find("\"" + expected + "\""), std::string::npos);
}

TEST(HesitationAnalyzer, ShortAccentedSuggestionIsWhole) {
    std::string tail;
    for (int i = 0; i < 40; ++i) tail += "\xC3\xA9";
    auto r = HesitationAnalyzer().analyze("no wait " + tail, nullptr, nullptr, "en");
    auto corrections = of_type(r, HesitationType::SelfCorrection);
    ASSERT_EQ(corrections.size(), 1u);
    EXPECT_TRUE(valid_utf8(corrections[0].suggestion));
    EXPECT_NE(corrections[0].suggestion.find("\"" + tail + "\""), std::string::npos);
}

// ----------------------------------------------------------------
// Uncertainty
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, FillerDenseWindowIsUncertain) {
    auto segs = contiguous({"um uh so", "well like um", "okay"});
    auto r = HesitationAnalyzer().analyze(join(segs), &segs, nullptr);
    auto unc = of_type(r, HesitationType::Uncertainty);
    ASSERT_EQ(unc.size(), 1u);
    EXPECT_DOUBLE_EQ(unc[0].start_time, 0.0);
    EXPECT_DOUBLE_EQ(unc[0].end_time, 3.0);
    EXPECT_EQ(unc[0].suggestion, "[uncertain]");
    EXPECT_FLOAT_EQ(unc[0].confidence, 1.0f);
}

TEST(HesitationAnalyzer, QuietSpeechBoostsUncertainty) {
    auto segs = contiguous({"um I went there", "and uh saw the", "so nice"});
    const std::string text = join(segs);

    auto plain = HesitationAnalyzer().analyze(text, &segs, nullptr);
    auto unc = of_type(plain, HesitationType::Uncertainty);
    ASSERT_EQ(unc.size(), 1u);
    EXPECT_NEAR(unc[0].confidence, 0.6f, 1e-5f);

    // energy_delta = -5 dB everywhere
    auto prosody = make_prosody(3.0, [](double) { return -25.0f; });
    auto boosted = HesitationAnalyzer().analyze(text, &segs, &prosody);
    unc = of_type(boosted, HesitationType::Uncertainty);
    ASSERT_EQ(unc.size(), 1u);
    EXPECT_NEAR(unc[0].confidence, 0.8f, 1e-5f);

    // 3 fillers, 1 uncertain passage
    EXPECT_NEAR(boosted.fluency_score, 0.75f, 1e-5f);
}

TEST(HesitationAnalyzer, OverlappingUncertainWindowsFlaggedOnce) {
    auto segs = contiguous({"um uh", "um so", "uh well", "like um"});
    auto r = HesitationAnalyzer().analyze(join(segs), &segs, nullptr);
    // Windows [0,3] and [1,4] overlap
    EXPECT_EQ(of_type(r, HesitationType::Uncertainty).size(), 1u);
}

TEST(HesitationAnalyzer, SingleSegmentSkipsUncertainty) {
    auto segs = contiguous({"um uh um uh"});
    auto r = HesitationAnalyzer().analyze(join(segs), &segs, nullptr);
    EXPECT_TRUE(of_type(r, HesitationType::Uncertainty).empty());
}

// ----------------------------------------------------------------
// Fatigue
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, SlowerLastQuarterIsFatigue) {
    std::vector<std::string> texts;
    for (int i = 0; i < 3; ++i) texts.push_back("alpha beta gamma delta");
    for (int i = 0; i < 6; ++i) texts.push_back("alpha beta gamma");
    for (int i = 0; i < 3; ++i) texts.push_back("alpha beta");
    auto segs = contiguous(texts);

    auto r = HesitationAnalyzer().analyze(join(segs), &segs, nullptr);
    EXPECT_GT(r.fatigue_level, 0.0f);
    EXPECT_NEAR(r.fatigue_level, 0.5f, 1e-5f);

    auto fatigue = of_type(r, HesitationType::FatigueWarning);
    ASSERT_EQ(fatigue.size(), 1u);
    EXPECT_DOUBLE_EQ(fatigue[0].start_time, 9.0);
    EXPECT_DOUBLE_EQ(fatigue[0].end_time, 12.0);
    EXPECT_FLOAT_EQ(fatigue[0].confidence, 1.0f);
    EXPECT_NE(fatigue[0].suggestion.find("50%"), std::string::npos);
}

TEST(HesitationAnalyzer, SteadyRateIsNotFatigue) {
    std::vector<std::string> texts(12, "alpha beta gamma");
    auto segs = contiguous(texts);
    auto r = HesitationAnalyzer().analyze(join(segs), &segs, nullptr);
    EXPECT_FLOAT_EQ(r.fatigue_level, 0.0f);
    EXPECT_TRUE(of_type(r, HesitationType::FatigueWarning).empty());
}

TEST(HesitationAnalyzer, TooFewSegmentsForFatigue) {
    std::vector<std::string> texts{"a b c d", "a b c d", "a b c", "a b c", "a b", "a", "a"};
    auto segs = contiguous(texts);
    auto r = HesitationAnalyzer().analyze(join(segs), &segs, nullptr);
    EXPECT_TRUE(of_type(r, HesitationType::FatigueWarning).empty());
}

// ----------------------------------------------------------------
// Topic changes
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, EnergyShiftIsTopicChange) {
    auto segs = contiguous({"first point here", "still on it", "now something else", "and more"});
    auto prosody = make_prosody(4.0, [](double t) { return t < 2.0 ? -10.0f : -25.0f; });

    auto r = HesitationAnalyzer().analyze(join(segs), &segs, &prosody);
    auto topics = of_type(r, HesitationType::TopicChange);
    ASSERT_EQ(topics.size(), 1u);
    EXPECT_DOUBLE_EQ(topics[0].start_time, 2.0);
    EXPECT_DOUBLE_EQ(topics[0].end_time, 2.0);
    EXPECT_FLOAT_EQ(topics[0].confidence, 0.6f);

    // A pause at the boundary raises confidence
    prosody.pauses.push_back({1.95, 2.1});
    r = HesitationAnalyzer().analyze(join(segs), &segs, &prosody);
    topics = of_type(r, HesitationType::TopicChange);
    ASSERT_EQ(topics.size(), 1u);
    EXPECT_FLOAT_EQ(topics[0].confidence, 0.85f);
}

TEST(HesitationAnalyzer, PitchShiftAloneIsTopicChange) {
    auto segs = contiguous({"first point here", "still on it", "now something else", "and more"});
    auto prosody = make_prosody(4.0, [](double) { return -15.0f; });
    for (auto& w : prosody.windows) w.pitch_delta = w.start_time < 2.0 ? 0.0f : 0.4f;

    auto r = HesitationAnalyzer().analyze(join(segs), &segs, &prosody);
    auto topics = of_type(r, HesitationType::TopicChange);
    ASSERT_EQ(topics.size(), 1u);
    EXPECT_DOUBLE_EQ(topics[0].start_time, 2.0);
    EXPECT_FLOAT_EQ(topics[0].confidence, 0.6f);
}

TEST(HesitationAnalyzer, SmallPitchShiftIsNotTopicChange) {
    auto segs = contiguous({"first point here", "still on it", "now something else", "and more"});
    auto prosody = make_prosody(4.0, [](double) { return -15.0f; });
    for (auto& w : prosody.windows) w.pitch_delta = w.start_time < 2.0 ? 0.0f : 0.2f;

    auto r = HesitationAnalyzer().analyze(join(segs), &segs, &prosody);
    EXPECT_TRUE(of_type(r, HesitationType::TopicChange).empty());
}

TEST(HesitationAnalyzer, FailedProsodyDisablesTopicChange) {
    auto segs = contiguous({"first point here", "still on it", "now something else", "and more"});
    auto prosody = make_prosody(4.0, [](double t) { return t < 2.0 ? -10.0f : -25.0f; });
    prosody.status = -10;

    auto r = HesitationAnalyzer().analyze(join(segs), &segs, &prosody);
    EXPECT_TRUE(of_type(r, HesitationType::TopicChange).empty());
}

// ----------------------------------------------------------------
// Scores / footer
// ----------------------------------------------------------------
TEST(HesitationAnalyzer, FluencyPenaltiesAreCapped) {
    std::string text;
    for (int i = 0; i < 30; ++i) text += "um ";
    auto r = HesitationAnalyzer().analyze(text, nullptr, nullptr);
    EXPECT_EQ(r.filler_count, 30);
    EXPECT_NEAR(r.fluency_score, 0.5f, 1e-5f);
}

TEST(HesitationAnalyzer, ConfidencesInUnitRange) {
    auto segs = contiguous({"um uh so", "I mean like um", "well okay so", "sorry uh no wait",
                            "a b c d e", "f g", "h", "i", "um"});
    auto prosody = make_prosody(9.0, [](double t) { return t < 4.0 ? -10.0f : -30.0f; });
    auto r = HesitationAnalyzer().analyze(join(segs), &segs, &prosody);
    EXPECT_FALSE(r.annotations.empty());
    for (const auto& a : r.annotations) {
        EXPECT_GE(a.confidence, 0.0f);
        EXPECT_LE(a.confidence, 1.0f);
    }
    EXPECT_GE(r.fluency_score, 0.0f);
    EXPECT_LE(r.fluency_score, 1.0f);
}

TEST(HesitationResult, SummaryFooter) {
    HesitationResult r;
    r.fluency_score = 0.85f;
    r.filler_count  = 3;
    EXPECT_EQ(r.build_summary_footer(), "\n---\n[Hesitation Analysis] Fluency: 85% | Fillers: 3");

    r.fatigue_level = 0.4f;
    r.annotations.push_back({HesitationType::TopicChange, 1.0, 1.0, "", "", 0.6f});
    EXPECT_EQ(r.build_summary_footer(),
              "\n---\n[Hesitation Analysis] Fluency: 85% | Fillers: 3 | Fatigue: 40% | Topic shifts: 1");
}

TEST(HesitationResult, TypeNames) {
    EXPECT_STREQ(hesitation_type_name(HesitationType::FillerWord), "filler_word");
    EXPECT_STREQ(hesitation_type_name(HesitationType::FatigueWarning), "fatigue_warning");
}

// ----------------------------------------------------------------
// Lexicon helpers
// ----------------------------------------------------------------
TEST(Lexicon, SupportsFiveLanguages) {
    const auto& lex = Lexicon::instance();
    EXPECT_EQ(lex.languages().size(), 5u);
    EXPECT_TRUE(lex.supports("pt"));
    EXPECT_FALSE(lex.supports("ja"));
    EXPECT_TRUE(lex.correction_markers("ja").empty());
    EXPECT_EQ(lex.fillers_for({"en"}).count("you know"), 1u);
}

TEST(Lexicon, CleanWordStripsPunctuation) {
    EXPECT_EQ(clean_word("\"(um),\""), "um");
    EXPECT_EQ(clean_word("**uh**"), "uh");
    EXPECT_EQ(clean_word("c'est-\xC3\xA0-dire"), "c'est-\xC3\xA0-dire");
    EXPECT_EQ(clean_word("..."), "");
}

TEST(Lexicon, Utf8PrefixCountsCodePoints) {
    const std::string text = "a\xC3\xA9\xE2\x86\x92z";
    EXPECT_EQ(utf8_prefix(text, 0, 2), "a\xC3\xA9");
    EXPECT_EQ(utf8_prefix(text, 1, 2), "\xC3\xA9\xE2\x86\x92");
    EXPECT_EQ(utf8_prefix(text, 0, 10), text);
    EXPECT_EQ(utf8_prefix(text, 0, 0), "");
    EXPECT_EQ(utf8_prefix(text, text.size(), 5), "");
}

TEST(Lexicon, LowerCasesLatin1) {
    EXPECT_EQ(to_lower("\xC3\x84H \xC3\x89T\xC3\x89"), "\xC3\xA4h \xC3\xA9t\xC3\xA9");
}
