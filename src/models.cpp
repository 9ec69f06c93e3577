#include "models.h"

#include <cstdio>
#include <stdexcept>
#include <sys/stat.h>

const char * model_engine_name(model_engine engine) {
    switch (engine) {
        case model_engine::whisper:   return "whisper";
        case model_engine::moonshine: return "moonshine";
    }
    return "?";
}

const std::vector<model_info> & available_models() {
    static const std::vector<model_info> models = {
        {"moonshine-tiny", model_engine::moonshine, "~190MB", "fastest",   "basic, English only"},
        {"moonshine-base", model_engine::moonshine, "~430MB", "very fast", "~92%, English only"},
        {"tiny",           model_engine::whisper,   "~273MB", "fastest",   "basic"},
        {"tiny.en",        model_engine::whisper,   "~273MB", "fastest",   "basic, English only"},
        {"base",           model_engine::whisper,   "~388MB", "very fast", "good"},
        {"base.en",        model_engine::whisper,   "~388MB", "very fast", "good, English only"},
        {"small",          model_engine::whisper,   "~852MB", "fast",      "better"},
        {"small.en",       model_engine::whisper,   "~852MB", "fast",      "better, English only"},
        {"medium",         model_engine::whisper,   "~2.1GB", "slow",      "high"},
        {"medium.en",      model_engine::whisper,   "~2.1GB", "slow",      "high, English only"},
        {"large-v3-turbo", model_engine::whisper,   "~1.7GB", "moderate",  "high"},
        {"large-v3",       model_engine::whisper,   "~3.9GB", "slowest",   "best"},
    };
    return models;
}

static const model_info * find_model(const std::string & model_id) {
    for (const auto & m : available_models()) {
        if (model_id == m.id) return &m;
    }
    return nullptr;
}

static bool has_suffix(const std::string & s, const std::string & suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool is_path(const std::string & model_id) {
    return model_id.find('/') != std::string::npos || has_suffix(model_id, ".bin");
}

static bool file_exists(const std::string & path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

static bool dir_exists(const std::string & path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_known_model(const std::string & model_id) {
    if (model_id.empty()) return false;
    if (is_path(model_id)) return file_exists(model_id);
    return find_model(model_id) != nullptr;
}

model_engine model_engine_of(const std::string & model_id) {
    if (is_path(model_id)) return model_engine::whisper;
    const model_info * m = find_model(model_id);
    return m ? m->engine : model_engine::whisper;
}

std::string model_path(const std::string & models_dir, const std::string & model_id) {
    if (is_path(model_id)) return model_id;
    if (model_engine_of(model_id) == model_engine::moonshine) {
        // Directory name of the sherpa-onnx release archive
        return models_dir + "/sherpa-onnx-" + model_id + "-en-int8";
    }
    return models_dir + "/ggml-" + model_id + ".bin";
}

bool is_model_downloaded(const std::string & models_dir, const std::string & model_id) {
    const std::string path = model_path(models_dir, model_id);
    if (model_engine_of(model_id) == model_engine::moonshine) {
        return dir_exists(path);
    }
    return file_exists(path);
}

ModelCache::ModelCache(Loader loader)
    : m_loader(std::move(loader)) {}

ModelCache::~ModelCache() {
    std::lock_guard<std::mutex> lock(m_preload_mutex);
    if (m_preload.joinable()) {
        m_preload.join();
    }
}

void ModelCache::set_status_callback(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_status = std::move(cb);
}

void ModelCache::status(const std::string & msg) {
    StatusCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cb = m_on_status;
    }
    if (cb) {
        cb(msg);
    } else {
        fprintf(stderr, "models: %s\n", msg.c_str());
    }
}

std::shared_ptr<ModelHandle> ModelCache::acquire(const std::string & model_id) {
    std::unique_lock<std::mutex> lock(m_mutex);

    if (m_current && m_current->id() == model_id) {
        return m_current;
    }

    // Drop our reference to the previous model; sessions may still hold it
    m_current.reset();

    auto it = m_live.find(model_id);
    if (it != m_live.end()) {
        if (auto alive = it->second.lock()) {
            m_current = alive;
            return m_current;
        }
        m_live.erase(it);
    }

    StatusCallback cb = m_on_status;
    if (cb) cb("Loading " + model_id + "...");

    // Loading holds the lock so a concurrent acquire of the same id waits
    // for this load instead of starting a second one
    std::shared_ptr<ModelHandle> handle = m_loader(model_id);
    if (!handle) {
        throw std::runtime_error("failed to load model " + model_id);
    }
    m_loads++;

    m_current = handle;
    m_live[model_id] = handle;

    if (cb) cb("Ready (" + model_id + ")");
    return handle;
}

void ModelCache::preload(const std::string & model_id) {
    std::lock_guard<std::mutex> lock(m_preload_mutex);
    if (m_preload.joinable()) {
        m_preload.join();
    }

    m_preload = std::thread([this, model_id]() {
        try {
            acquire(model_id);
        } catch (const std::exception & e) {
            status(std::string("Failed to load ") + model_id + ": " + e.what());
        }
    });
}

std::string ModelCache::current() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current ? m_current->id() : "";
}

int ModelCache::load_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loads;
}

ModelCache::Loader engine_loader(ModelCache::Loader whisper, ModelCache::Loader moonshine) {
    return [whisper, moonshine](const std::string & model_id) -> std::shared_ptr<ModelHandle> {
        const model_engine engine = model_engine_of(model_id);
        const ModelCache::Loader & loader = engine == model_engine::moonshine ? moonshine : whisper;
        if (!loader) {
            throw std::runtime_error(std::string("no ") + model_engine_name(engine) + " engine for model " + model_id);
        }
        return loader(model_id);
    };
}
