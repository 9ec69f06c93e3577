#include "config.h"
#include "hotkey.h"
#include "models.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

static std::string home_dir() {
    const char * home = getenv("HOME");
    return home ? home : ".";
}

static std::string xdg_dir(const char * var, const char * fallback) {
    const char * v = getenv(var);
    if (v && v[0] == '/') return v;
    return home_dir() + "/" + fallback;
}

static std::string expand_home(const std::string & path) {
    if (path == "~") return home_dir();
    if (path.rfind("~/", 0) == 0) return home_dir() + path.substr(1);
    return path;
}

std::string ConfigStore::default_path() {
    return xdg_dir("XDG_CONFIG_HOME", ".config") + "/whisper-dictate/config.json";
}

std::string ConfigStore::default_models_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share") + "/whisper-dictate/models";
}

dictate_config default_config() {
    dictate_config cfg;
    const int hw = (int)std::thread::hardware_concurrency();
    cfg.n_threads  = std::max(1, std::min(4, hw));
    cfg.models_dir = ConfigStore::default_models_dir();
    return cfg;
}

ConfigStore::ConfigStore(std::string path, LanguageCheck language_ok)
    : m_path(std::move(path)), m_language_ok(std::move(language_ok)) {}

// Typed lookup; missing keys and wrong types yield def
template <typename T>
static T get_or(const nlohmann::json & j, const char * key, const T & def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception &) {
        fprintf(stderr, "config: '%s' has the wrong type (%s), using default\n", key, it->type_name());
        return def;
    }
}

static int32_t get_int_in(const nlohmann::json & j, const char * key, int32_t def, int32_t lo, int32_t hi) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_number()) {
        fprintf(stderr, "config: '%s' must be a number, using default %d\n", key, def);
        return def;
    }
    const int32_t v = get_or<int32_t>(j, key, def);
    if (v < lo || v > hi) {
        fprintf(stderr, "config: '%s' = %d out of range [%d, %d], using default %d\n", key, v, lo, hi, def);
        return def;
    }
    return v;
}

static bool get_bool(const nlohmann::json & j, const char * key, bool def) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_boolean()) {
        fprintf(stderr, "config: '%s' must be true or false, using default %s\n", key, def ? "true" : "false");
        return def;
    }
    return get_or<bool>(j, key, def);
}

static std::string get_string(const nlohmann::json & j, const char * key, const std::string & def) {
    std::string v = get_or<std::string>(j, key, def);
    if (v.empty()) {
        fprintf(stderr, "config: '%s' is empty, using default '%s'\n", key, def.c_str());
        return def;
    }
    return v;
}

dictate_config ConfigStore::from_json(const nlohmann::json & j, const LanguageCheck & language_ok) {
    const dictate_config def = default_config();
    dictate_config cfg = def;

    if (!j.is_object()) {
        fprintf(stderr, "config: top level is not an object, using defaults\n");
        return cfg;
    }

    cfg.models_dir = expand_home(get_string(j, "models_dir", def.models_dir));

    cfg.model = get_string(j, "model", def.model);
    if (!is_known_model(cfg.model)) {
        fprintf(stderr, "config: unknown model '%s', using default '%s'\n", cfg.model.c_str(), def.model.c_str());
        cfg.model = def.model;
    }

    cfg.hotkey = get_string(j, "hotkey", def.hotkey);
    hotkey_spec spec;
    if (!parse_hotkey(cfg.hotkey, spec)) {
        fprintf(stderr, "config: invalid hotkey '%s', using default '%s'\n", cfg.hotkey.c_str(), def.hotkey.c_str());
        cfg.hotkey = def.hotkey;
    }

    cfg.auto_paste    = get_bool  (j, "auto_paste",    def.auto_paste);
    cfg.paste_command = get_string(j, "paste_command", def.paste_command);
    cfg.type_delay_ms = get_int_in(j, "type_delay_ms", def.type_delay_ms, 0, 1000);

    cfg.min_record_ms = get_int_in(j, "min_record_ms", def.min_record_ms, 0, 10000);
    cfg.max_record_ms = get_int_in(j, "max_record_ms", def.max_record_ms, 1000, 600000);
    if (cfg.max_record_ms <= cfg.min_record_ms) {
        fprintf(stderr, "config: max_record_ms (%d) must exceed min_record_ms (%d), using defaults\n",
                cfg.max_record_ms, cfg.min_record_ms);
        cfg.min_record_ms = def.min_record_ms;
        cfg.max_record_ms = def.max_record_ms;
    }

    cfg.language   = get_string(j, "language", def.language);
    if (language_ok && !language_ok(cfg.language)) {
        fprintf(stderr, "config: unknown language '%s', using default '%s'\n", cfg.language.c_str(), def.language.c_str());
        cfg.language = def.language;
    }
    cfg.n_threads  = get_int_in(j, "threads",  def.n_threads, 1, 256);
    cfg.use_gpu    = get_bool  (j, "use_gpu",    def.use_gpu);
    cfg.flash_attn = get_bool  (j, "flash_attn", def.flash_attn);
    cfg.translate  = get_bool  (j, "translate",  def.translate);

    cfg.capture_id = get_int_in(j, "capture_id", def.capture_id, -1, 1024);

    return cfg;
}

nlohmann::json ConfigStore::to_json(const dictate_config & cfg) {
    return {
        {"model",         cfg.model},
        {"hotkey",        cfg.hotkey},
        {"auto_paste",    cfg.auto_paste},
        {"paste_command", cfg.paste_command},
        {"min_record_ms", cfg.min_record_ms},
        {"max_record_ms", cfg.max_record_ms},
        {"type_delay_ms", cfg.type_delay_ms},
        {"language",      cfg.language},
        {"threads",       cfg.n_threads},
        {"use_gpu",       cfg.use_gpu},
        {"flash_attn",    cfg.flash_attn},
        {"translate",     cfg.translate},
        {"models_dir",    cfg.models_dir},
        {"capture_id",    cfg.capture_id},
    };
}

dictate_config ConfigStore::load() {
    m_data = to_json(default_config());

    std::ifstream in(m_path);
    if (!in) {
        fprintf(stderr, "config: %s not found, writing defaults\n", m_path.c_str());
        if (!save()) {
            fprintf(stderr, "config: continuing with in-memory defaults\n");
        }
        return from_json(m_data, m_language_ok);
    }

    nlohmann::json user;
    try {
        in >> user;
    } catch (const nlohmann::json::parse_error & e) {
        // Leave the broken file alone so the user can fix it
        fprintf(stderr, "config: cannot parse %s (%s), using defaults\n", m_path.c_str(), e.what());
        return from_json(m_data, m_language_ok);
    }

    if (!user.is_object()) {
        fprintf(stderr, "config: %s is not a JSON object, using defaults\n", m_path.c_str());
        return from_json(m_data, m_language_ok);
    }

    m_data.update(user);
    return from_json(m_data, m_language_ok);
}

bool ConfigStore::set(const std::string & key, const nlohmann::json & value) {
    m_data[key] = value;
    return save();
}

bool ConfigStore::save() {
    std::error_code ec;
    const fs::path parent = fs::path(m_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            fprintf(stderr, "config: cannot create %s: %s\n", parent.c_str(), ec.message().c_str());
            return false;
        }
    }

    std::ofstream out(m_path);
    if (!out) {
        fprintf(stderr, "config: cannot write %s\n", m_path.c_str());
        return false;
    }
    out << m_data.dump(2) << "\n";
    return (bool)out;
}
