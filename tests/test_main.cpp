#include <iostream>
#include <cstdlib>
#include <exception>
#include <string>

// Declarations of test functions
bool test_speech_metrics_fillers_and_pace();
bool test_speech_metrics_without_duration();
bool test_tokenize_keeps_accented_words_whole();
bool test_sentence_spans_split_on_punctuation_and_gaps();
bool test_pause_effective_and_awkward();
bool test_pause_mid_sentence_gap_is_awkward();
bool test_pitch_constant_tone_is_monotone();
bool test_pitch_sweep_is_dynamic();
bool test_pitch_silence_and_short_audio_are_unknown();
bool test_volume_trailing_off_is_inconsistent();
bool test_volume_quiet_buffer_is_too_quiet();
bool test_audio_delivery_without_audio_keeps_unknown_shape();
bool test_audio_delivery_rejects_invalid_config();
bool test_decode_pcm16_normalizes_samples();
bool test_wav_loader_rejects_zero_sample_rate();
bool test_event_segmenter_min_duration();
bool test_gesture_identical_vectors_are_unknown();
bool test_gesture_energy_levels();
bool test_attention_proxy_and_levels();
bool test_posture_sway_and_stability();
bool test_non_verbal_fuses_gaze_away_events();
bool test_non_verbal_events_sorted_with_gesture_advisory();
bool test_landmark_parsing_and_stride();
bool test_landmark_tool_sampling_is_trusted_without_source_fps();
bool test_markers_baseline_when_nothing_fires();
bool test_markers_placement_and_order();
bool test_markers_fallback_duration();
bool test_summary_feedback_mentions_findings();
bool test_pipeline_end_to_end_without_backends();
bool test_pipeline_runs_audio_delivery_with_decoder();
bool test_pipeline_degraded_transcript_and_fallback_duration();
bool test_pipeline_transcript_without_word_timings_is_not_empty();
bool test_pipeline_unexpected_fault_marks_job_error();
bool test_pipeline_deletes_owned_input();
bool test_pipeline_builder_config();
bool test_job_state_machine();
bool test_sidecar_transcript_parsing();

int main() {
    int failed = 0;
    int total = 0;

    const char* quietEnv = std::getenv("DAE_TEST_QUIET");
    bool quiet = quietEnv && std::string(quietEnv) != "0";

    if (!quiet) std::cout << "Running tests..." << std::endl;

    auto run_test = [&](const char* name, bool (*fn)()) {
        ++total;
        bool ok = false;
        try {
            ok = fn();
        } catch (const std::exception& e) {
            std::cerr << name << " threw: " << e.what() << std::endl;
        }
        if (!quiet) {
            std::cout << "- " << name << ": " << (ok ? "PASS" : "FAIL") << std::endl;
        }
        if (!ok) ++failed;
    };

    run_test("test_speech_metrics_fillers_and_pace", &test_speech_metrics_fillers_and_pace);
    run_test("test_speech_metrics_without_duration", &test_speech_metrics_without_duration);
    run_test("test_tokenize_keeps_accented_words_whole", &test_tokenize_keeps_accented_words_whole);
    run_test("test_sentence_spans_split_on_punctuation_and_gaps", &test_sentence_spans_split_on_punctuation_and_gaps);
    run_test("test_pause_effective_and_awkward", &test_pause_effective_and_awkward);
    run_test("test_pause_mid_sentence_gap_is_awkward", &test_pause_mid_sentence_gap_is_awkward);
    run_test("test_pitch_constant_tone_is_monotone", &test_pitch_constant_tone_is_monotone);
    run_test("test_pitch_sweep_is_dynamic", &test_pitch_sweep_is_dynamic);
    run_test("test_pitch_silence_and_short_audio_are_unknown", &test_pitch_silence_and_short_audio_are_unknown);
    run_test("test_volume_trailing_off_is_inconsistent", &test_volume_trailing_off_is_inconsistent);
    run_test("test_volume_quiet_buffer_is_too_quiet", &test_volume_quiet_buffer_is_too_quiet);
    run_test("test_audio_delivery_without_audio_keeps_unknown_shape", &test_audio_delivery_without_audio_keeps_unknown_shape);
    run_test("test_audio_delivery_rejects_invalid_config", &test_audio_delivery_rejects_invalid_config);
    run_test("test_decode_pcm16_normalizes_samples", &test_decode_pcm16_normalizes_samples);
    run_test("test_wav_loader_rejects_zero_sample_rate", &test_wav_loader_rejects_zero_sample_rate);
    run_test("test_event_segmenter_min_duration", &test_event_segmenter_min_duration);
    run_test("test_gesture_identical_vectors_are_unknown", &test_gesture_identical_vectors_are_unknown);
    run_test("test_gesture_energy_levels", &test_gesture_energy_levels);
    run_test("test_attention_proxy_and_levels", &test_attention_proxy_and_levels);
    run_test("test_posture_sway_and_stability", &test_posture_sway_and_stability);
    run_test("test_non_verbal_fuses_gaze_away_events", &test_non_verbal_fuses_gaze_away_events);
    run_test("test_non_verbal_events_sorted_with_gesture_advisory", &test_non_verbal_events_sorted_with_gesture_advisory);
    run_test("test_landmark_parsing_and_stride", &test_landmark_parsing_and_stride);
    run_test("test_landmark_tool_sampling_is_trusted_without_source_fps", &test_landmark_tool_sampling_is_trusted_without_source_fps);
    run_test("test_markers_baseline_when_nothing_fires", &test_markers_baseline_when_nothing_fires);
    run_test("test_markers_placement_and_order", &test_markers_placement_and_order);
    run_test("test_markers_fallback_duration", &test_markers_fallback_duration);
    run_test("test_summary_feedback_mentions_findings", &test_summary_feedback_mentions_findings);
    run_test("test_pipeline_end_to_end_without_backends", &test_pipeline_end_to_end_without_backends);
    run_test("test_pipeline_runs_audio_delivery_with_decoder", &test_pipeline_runs_audio_delivery_with_decoder);
    run_test("test_pipeline_degraded_transcript_and_fallback_duration", &test_pipeline_degraded_transcript_and_fallback_duration);
    run_test("test_pipeline_transcript_without_word_timings_is_not_empty", &test_pipeline_transcript_without_word_timings_is_not_empty);
    run_test("test_pipeline_unexpected_fault_marks_job_error", &test_pipeline_unexpected_fault_marks_job_error);
    run_test("test_pipeline_deletes_owned_input", &test_pipeline_deletes_owned_input);
    run_test("test_pipeline_builder_config", &test_pipeline_builder_config);
    run_test("test_job_state_machine", &test_job_state_machine);
    run_test("test_sidecar_transcript_parsing", &test_sidecar_transcript_parsing);

    int passed = total - failed;
    std::cout << "Summary: " << passed << "/" << total << " passed, " << failed << " failed" << std::endl;

    return failed == 0 ? 0 : 1;
}
