#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Recognizer {
        std::string program = "glu-stt-helper";
        std::vector<std::string> args;   // inserted before --model
        std::string model_path;          // empty: ~/.local/share/vosk/model
        uint32_t sample_rate = 16000;
        std::string device;              // empty: helper's default
    } recognizer;

    struct Launcher {
        std::string multiplexer = "tmux";
        std::string assistant = "codex";
        std::vector<std::string> extra_args;
    } launcher;

    struct Storage {
        std::string db_path; // empty: <data dir>/prompts.db
    } storage;

    struct Output {
        std::string inject_window; // xdotool window id
    } output;

    int history_limit = 100;

    static Config load(const std::string& path);
    static Config load_default();

    // VOSK_MODEL_PATH, STT_DEVICE and XDO_WINDOW_ID take precedence over the file.
    void apply_environment();

    std::string model_path() const;
    std::string db_path() const;
};
