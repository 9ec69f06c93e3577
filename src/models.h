#pragma once

#include "transcriber.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Model used when the configured one is missing or unknown
static constexpr const char * DEFAULT_MODEL = "moonshine-base";

// Inference engine behind a model id
enum class model_engine {
    whisper,   // whisper.cpp, ggml-<id>.bin
    moonshine, // sherpa-onnx, sherpa-onnx-<id>-en-int8/ directory
};

const char * model_engine_name(model_engine engine);

struct model_info {
    const char * id;
    model_engine engine;
    const char * ram;
    const char * speed;
    const char * accuracy;
};

// Models known by name, for every engine
const std::vector<model_info> & available_models();

// A registry id, or a path to a ggml .bin file
bool is_known_model(const std::string & model_id);

// Registry engine for model_id; paths are whisper models
model_engine model_engine_of(const std::string & model_id);

// What backs model_id on disk: "<models_dir>/ggml-<id>.bin" for whisper
// ids, "<models_dir>/sherpa-onnx-<id>-en-int8" for moonshine ids, and
// model_id itself when it is a path
std::string model_path(const std::string & models_dir, const std::string & model_id);

bool is_model_downloaded(const std::string & models_dir, const std::string & model_id);

// Settings fixed when a model is loaded
struct model_load_params {
    std::string models_dir;
    int32_t     n_threads  = 4;
    bool        use_gpu    = true;
    bool        flash_attn = true;
};

// A loaded model. Sessions hold a shared reference while they use it.
class ModelHandle {
public:
    explicit ModelHandle(std::string id) : m_id(std::move(id)) {}
    virtual ~ModelHandle() = default;

    ModelHandle(const ModelHandle &) = delete;
    ModelHandle & operator=(const ModelHandle &) = delete;

    const std::string & id() const { return m_id; }

    // Raw engine output for mono PCM at DICTATE_SAMPLE_RATE. May be called
    // from several threads; the handle runs one inference at a time.
    // Throws std::runtime_error on inference failure.
    virtual std::string transcribe(const std::vector<float> & pcmf32, const decode_options & opts) = 0;

private:
    std::string m_id;
};

// Lazily loads model handles and keeps the current one alive.
//
// At most one handle per model id exists at any time: a handle still
// referenced by a session is reused instead of loading a second copy.
// Switching to another id drops the cache's reference only; the previous
// handle is freed once the last session using it lets go.
class ModelCache {
public:
    // Loads a model, throws std::runtime_error on failure
    using Loader = std::function<std::shared_ptr<ModelHandle>(const std::string & model_id)>;
    using StatusCallback = std::function<void(const std::string & msg)>;

    explicit ModelCache(Loader loader);
    ~ModelCache();

    ModelCache(const ModelCache &) = delete;
    ModelCache & operator=(const ModelCache &) = delete;

    // Called with progress lines ("Loading base.en..."); may run while the
    // cache is locked, so it must not call back into the cache
    void set_status_callback(StatusCallback cb);

    // Return the handle for model_id, loading it if needed (blocking)
    std::shared_ptr<ModelHandle> acquire(const std::string & model_id);

    // Load model_id on a background thread and make it current
    void preload(const std::string & model_id);

    // Id of the model the cache holds, "" if none
    std::string current() const;

    // Number of loader calls so far
    int load_count() const;

private:
    void status(const std::string & msg);

    Loader         m_loader;
    StatusCallback m_on_status;

    mutable std::mutex           m_mutex;
    std::shared_ptr<ModelHandle> m_current;
    std::map<std::string, std::weak_ptr<ModelHandle>> m_live;
    int                          m_loads = 0;

    std::mutex  m_preload_mutex;
    std::thread m_preload;
};

// Loader that hands each model id to the loader for its engine
ModelCache::Loader engine_loader(ModelCache::Loader whisper, ModelCache::Loader moonshine);
