#include "vosk_recognizer.hpp"

#include <climits>

namespace {

std::string or_empty(const char* s) {
    return s ? s : "";
}

} // namespace

std::expected<std::unique_ptr<VoskSpeechRecognizer>, std::string>
VoskSpeechRecognizer::create(const std::string& model_path, float sample_rate) {
    std::unique_ptr<VoskSpeechRecognizer> rec(new VoskSpeechRecognizer());

    rec->model_.reset(vosk_model_new(model_path.c_str()));
    if (!rec->model_) return std::unexpected("failed to load model: " + model_path);

    rec->recognizer_.reset(vosk_recognizer_new(rec->model_.get(), sample_rate));
    if (!rec->recognizer_) return std::unexpected("failed to create recognizer");

    return rec;
}

std::expected<bool, std::string> VoskSpeechRecognizer::accept(std::span<const int16_t> samples) {
    while (samples.size() > INT_MAX) {
        auto head = accept(samples.first(INT_MAX));
        if (!head) return head;
        samples = samples.subspan(INT_MAX);
    }

    int rc = vosk_recognizer_accept_waveform_s(recognizer_.get(), samples.data(),
                                               static_cast<int>(samples.size()));
    if (rc < 0) return std::unexpected("recognizer rejected audio");
    return rc == 1;
}

std::string VoskSpeechRecognizer::result() {
    return or_empty(vosk_recognizer_result(recognizer_.get()));
}

std::string VoskSpeechRecognizer::partial_result() {
    return or_empty(vosk_recognizer_partial_result(recognizer_.get()));
}

std::string VoskSpeechRecognizer::final_result() {
    return or_empty(vosk_recognizer_final_result(recognizer_.get()));
}
