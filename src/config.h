#pragma once

#include "models.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>

// Effective settings. Defaults are the documented fallbacks for missing or
// invalid values in the config file.
struct dictate_config {
    // dictation
    std::string model          = DEFAULT_MODEL;
    std::string hotkey         = "f9";
    bool        auto_paste     = true;
    std::string paste_command  = "ctrl+shift+v";
    int32_t     min_record_ms  = 300;
    int32_t     max_record_ms  = 30000;
    int32_t     type_delay_ms  = 12;

    // engine
    std::string language       = "en";
    int32_t     n_threads      = 4;
    bool        use_gpu        = true;
    bool        flash_attn     = true;
    bool        translate      = false;
    std::string models_dir;

    // audio
    int32_t     capture_id     = -1;
};

// Defaults, with n_threads and models_dir resolved for this machine
dictate_config default_config();

// JSON config file. Keys the program does not know are kept on save.
class ConfigStore {
public:
    // True if the engine knows the language code ("auto" included)
    using LanguageCheck = std::function<bool(const std::string &)>;

    // Without a check any non-empty language is accepted
    explicit ConfigStore(std::string path, LanguageCheck language_ok = nullptr);

    // $XDG_CONFIG_HOME/whisper-dictate/config.json (~/.config fallback)
    static std::string default_path();

    // $XDG_DATA_HOME/whisper-dictate/models (~/.local/share fallback)
    static std::string default_models_dir();

    const std::string & path() const { return m_path; }

    // Read the file, merging it over the defaults. Writes a default file
    // when none exists. Invalid values fall back to their defaults with a
    // warning; never fails.
    dictate_config load();

    // Set one key and save immediately
    bool set(const std::string & key, const nlohmann::json & value);

    // Validate a raw JSON object into settings (no I/O)
    static dictate_config from_json(const nlohmann::json & j, const LanguageCheck & language_ok = nullptr);

    static nlohmann::json to_json(const dictate_config & cfg);

private:
    bool save();

    std::string    m_path;
    LanguageCheck  m_language_ok;
    nlohmann::json m_data = nlohmann::json::object();
};
