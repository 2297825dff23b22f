#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("recognizer")) {
            auto& r = j["recognizer"];
            if (r.contains("program")) cfg.recognizer.program = r["program"].get<std::string>();
            if (r.contains("args")) cfg.recognizer.args = r["args"].get<std::vector<std::string>>();
            if (r.contains("model_path")) cfg.recognizer.model_path = r["model_path"].get<std::string>();
            if (r.contains("sample_rate")) cfg.recognizer.sample_rate = r["sample_rate"].get<uint32_t>();
            if (r.contains("device")) cfg.recognizer.device = r["device"].get<std::string>();
        }

        if (j.contains("launcher")) {
            auto& l = j["launcher"];
            if (l.contains("multiplexer")) cfg.launcher.multiplexer = l["multiplexer"].get<std::string>();
            if (l.contains("assistant")) cfg.launcher.assistant = l["assistant"].get<std::string>();
            if (l.contains("extra_args")) cfg.launcher.extra_args = l["extra_args"].get<std::vector<std::string>>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("db_path")) cfg.storage.db_path = s["db_path"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("inject_window")) cfg.output.inject_window = o["inject_window"].get<std::string>();
        }

        if (j.contains("history_limit")) {
            cfg.history_limit = j["history_limit"].get<int>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_environment() {
    auto env = [](const char* name) -> std::string {
        const char* v = std::getenv(name);
        return v ? v : "";
    };

    if (auto v = env("VOSK_MODEL_PATH"); !v.empty()) recognizer.model_path = v;
    if (auto v = env("STT_DEVICE"); !v.empty()) recognizer.device = v;
    if (auto v = env("XDO_WINDOW_ID"); !v.empty()) output.inject_window = v;
}

std::string Config::model_path() const {
    if (!recognizer.model_path.empty()) return recognizer.model_path;
    return platform::default_model_dir();
}

std::string Config::db_path() const {
    if (!storage.db_path.empty()) return storage.db_path;
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/glu-code/prompts.db";
    return data + "/prompts.db";
}
