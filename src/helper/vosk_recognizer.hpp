#pragma once

#include "speech_recognizer.hpp"

#include <memory>
#include <vosk_api.h>

class VoskSpeechRecognizer : public SpeechRecognizer {
public:
    static std::expected<std::unique_ptr<VoskSpeechRecognizer>, std::string>
    create(const std::string& model_path, float sample_rate);

    std::expected<bool, std::string> accept(std::span<const int16_t> samples) override;
    std::string result() override;
    std::string partial_result() override;
    std::string final_result() override;

private:
    struct ModelDeleter {
        void operator()(VoskModel* p) const { vosk_model_free(p); }
    };
    struct RecognizerDeleter {
        void operator()(VoskRecognizer* p) const { vosk_recognizer_free(p); }
    };

    VoskSpeechRecognizer() = default;

    std::unique_ptr<VoskModel, ModelDeleter> model_;
    std::unique_ptr<VoskRecognizer, RecognizerDeleter> recognizer_;
};
