#include <iostream>
#include <vector>
#include <string>
#include <cmath>
#include <cstdint>
#include <paraling/paraling_api.h>

// Synthetic utterance: a calm phrase, a pause, then a louder phrase with rising pitch
static std::vector<int16_t> generate_utterance(int sample_rate = 16000) {
    std::vector<int16_t> samples;
    double phase = 0.0;
    auto tone = [&](float seconds, float amp, float f0, float f1) {
        int n = static_cast<int>(seconds * sample_rate);
        for (int i = 0; i < n; ++i) {
            float freq = f0 + (f1 - f0) * i / n;
            phase += 2.0 * 3.14159265 * freq / sample_rate;
            samples.push_back(static_cast<int16_t>(amp * 32767.0f * std::sin(phase)));
        }
    };
    tone(1.5f, 0.15f, 160.0f, 160.0f);
    samples.insert(samples.end(), static_cast<size_t>(1.7f * sample_rate), 0);
    tone(1.5f, 0.60f, 180.0f, 260.0f);
    return samples;
}

static void print_result(PlSessionHandle session, const PlSessionResult& result) {
    std::cout << "  Windows: " << result.prosody.window_count
              << ", voiced: " << result.prosody.voiced_count
              << ", pauses: " << result.prosody.pause_count
              << ", baseline pitch: " << result.prosody.baseline_pitch_hz << " Hz" << std::endl;

    std::vector<char> text(result.formatted_text_length + 1);
    if (pl_session_get_formatted_text(session, text.data(), static_cast<int>(text.size())) == PL_OK) {
        std::cout << "\n--- Formatted text ---\n" << text.data() << std::endl;
    }

    int count = 0;
    std::vector<PlHesitationAnnotation> annotations(32);
    if (pl_session_get_hesitations(session, annotations.data(),
                                   static_cast<int>(annotations.size()), &count) == PL_OK) {
        std::cout << "\n--- Hesitations (" << count << ") ---" << std::endl;
        for (int i = 0; i < count && i < static_cast<int>(annotations.size()); ++i) {
            const auto& a = annotations[i];
            std::cout << "  [" << a.start_sec << "-" << a.end_sec << "s] "
                      << pl_hesitation_type_name(a.type) << ": \"" << a.text << "\"";
            if (a.suggestion[0]) std::cout << "  -> " << a.suggestion;
            std::cout << std::endl;
        }
    }

    std::vector<PlEmotionSegment> emotions(16);
    if (pl_session_get_emotion_segments(session, emotions.data(),
                                        static_cast<int>(emotions.size()), &count) == PL_OK) {
        std::cout << "\n--- Emotion per segment ---" << std::endl;
        for (int i = 0; i < count && i < static_cast<int>(emotions.size()); ++i) {
            std::cout << "  [" << emotions[i].start_sec << "-" << emotions[i].end_sec << "s] "
                      << pl_emotion_name(emotions[i].emotion_id)
                      << " (" << emotions[i].confidence << ")" << std::endl;
        }
    }
    if (result.emotion.should_warn) {
        std::cout << "  Warning: " << result.emotion.warning_message << std::endl;
    }

    char footer[1024] = {};
    if (pl_session_get_footer(session, footer, sizeof(footer)) == PL_OK) {
        std::cout << footer << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::cout << "=== Paraling C++ Demo ===" << std::endl;

    // 1. Initialize library
    std::cout << "\n[1] Initializing..." << std::endl;
    int ret = pl_init("paraling_demo.log");
    if (ret != PL_OK) {
        std::cerr << "Init failed: " << pl_get_last_error() << std::endl;
        return 1;
    }

    PlSessionHandle session = nullptr;
    ret = pl_session_create(&session);
    if (ret != PL_OK) {
        std::cerr << "Session create failed: " << pl_get_last_error() << std::endl;
        pl_release();
        return 1;
    }

    // 2. Audio: WAV file if provided, otherwise synthetic
    if (argc >= 2) {
        std::cout << "\n[2] Analyzing prosody from: " << argv[1] << std::endl;
        ret = pl_session_set_audio_file(session, argv[1]);
    } else {
        std::cout << "\nUsage for WAV file demo:" << std::endl;
        std::cout << "  paraling_demo <speech.wav> [transcript] [language]" << std::endl;
        std::cout << "\n[2] Analyzing prosody of a synthetic utterance..." << std::endl;
        auto audio = generate_utterance();
        ret = pl_session_set_audio(session, audio.data(), static_cast<int>(audio.size()), 16000);
    }
    if (ret != PL_OK) {
        std::cerr << "  Prosody analysis failed: " << pl_get_last_error() << std::endl;
        std::cerr << "  Continuing with transcript-only analysis" << std::endl;
    }

    // 3. Transcript. A user transcript is one segment spanning the whole recording.
    std::cout << "\n[3] Setting transcript..." << std::endl;
    if (argc >= 3) {
        const char* language = argc >= 4 ? argv[3] : "en";
        pl_session_set_transcript(session, argv[2], language);

        PlProsodySummary summary{};
        if (pl_session_get_prosody_summary(session, &summary) == PL_OK) {
            pl_session_add_segment(session, 0.0, summary.duration_sec, argv[2]);
        }
    } else {
        const char* first  = "um so the quarterly numbers are in";
        const char* second = "I think we beat the target";
        pl_session_set_transcript(session, "um so the quarterly numbers are in "
                                           "I think we beat the target", "en");
        pl_session_add_segment(session, 0.0, 1.5, first);
        pl_session_add_segment(session, 3.2, 4.7, second);
    }

    // 4. Analyze
    std::cout << "\n[4] Running formatting, hesitation and emotion analysis..." << std::endl;
    PlSessionResult result{};
    ret = pl_session_analyze(session, PL_FEATURE_ALL, &result);
    if (ret == PL_OK) {
        print_result(session, result);
    } else {
        std::cerr << "  Analyze failed: " << pl_get_last_error() << std::endl;
    }

    // 5. Release
    std::cout << "\n[Final] Releasing..." << std::endl;
    pl_session_destroy(session);
    pl_release();
    std::cout << "Released." << std::endl;

    return ret == PL_OK ? 0 : 1;
}
