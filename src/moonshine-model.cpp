#include "moonshine-model.h"

#include "sherpa-onnx/c-api/c-api.h"

#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>

namespace {

struct stream_deleter {
    void operator()(const SherpaOnnxOfflineStream * s) const { SherpaOnnxDestroyOfflineStream(s); }
};

struct result_deleter {
    void operator()(const SherpaOnnxOfflineRecognizerResult * r) const { SherpaOnnxDestroyOfflineRecognizerResult(r); }
};

using stream_ptr = std::unique_ptr<const SherpaOnnxOfflineStream, stream_deleter>;
using result_ptr = std::unique_ptr<const SherpaOnnxOfflineRecognizerResult, result_deleter>;

std::string require_file(const std::string & dir, const char * name) {
    const std::string path = dir + "/" + name;
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        throw std::runtime_error("moonshine model file missing: " + path);
    }
    return path;
}

} // namespace

MoonshineModel::MoonshineModel(const std::string & id, const SherpaOnnxOfflineRecognizer * recognizer)
    : ModelHandle(id), m_recognizer(recognizer) {}

MoonshineModel::~MoonshineModel() {
    if (m_recognizer) {
        SherpaOnnxDestroyOfflineRecognizer(m_recognizer);
    }
}

std::shared_ptr<ModelHandle> load_moonshine_model(const model_load_params & params, const std::string & model_id) {
    const std::string dir = model_path(params.models_dir, model_id);
    if (!is_model_downloaded(params.models_dir, model_id)) {
        throw std::runtime_error("model " + model_id + " not found at " + dir +
                                 " (unpack sherpa-onnx's " + dir.substr(dir.rfind('/') + 1) +
                                 ".tar.bz2 from its asr-models release there)");
    }

    const std::string preprocessor     = require_file(dir, "preprocess.onnx");
    const std::string encoder          = require_file(dir, "encode.int8.onnx");
    const std::string uncached_decoder = require_file(dir, "uncached_decode.int8.onnx");
    const std::string cached_decoder   = require_file(dir, "cached_decode.int8.onnx");
    const std::string tokens           = require_file(dir, "tokens.txt");

    // Zeroed config selects sherpa-onnx's defaults for everything unset
    SherpaOnnxOfflineRecognizerConfig config;
    memset(&config, 0, sizeof(config));

    config.feat_config.sample_rate = DICTATE_SAMPLE_RATE;
    config.feat_config.feature_dim = 80;

    config.model_config.moonshine.preprocessor     = preprocessor.c_str();
    config.model_config.moonshine.encoder          = encoder.c_str();
    config.model_config.moonshine.uncached_decoder = uncached_decoder.c_str();
    config.model_config.moonshine.cached_decoder   = cached_decoder.c_str();
    config.model_config.tokens                     = tokens.c_str();
    config.model_config.num_threads                = params.n_threads;
    config.model_config.provider                   = "cpu";
    config.model_config.debug                      = 0;

    config.decoding_method = "greedy_search";

    const SherpaOnnxOfflineRecognizer * recognizer = SherpaOnnxCreateOfflineRecognizer(&config);
    if (!recognizer) {
        throw std::runtime_error("sherpa-onnx could not load " + dir);
    }

    fprintf(stderr, "moonshine: loaded %s (%d threads)\n", dir.c_str(), params.n_threads);
    return std::make_shared<MoonshineModel>(model_id, recognizer);
}

std::string MoonshineModel::transcribe(const std::vector<float> & pcmf32, const decode_options & /*opts*/) {
    std::lock_guard<std::mutex> lock(m_mutex);

    stream_ptr stream(SherpaOnnxCreateOfflineStream(m_recognizer));
    if (!stream) {
        throw std::runtime_error("sherpa-onnx could not create a stream");
    }

    SherpaOnnxAcceptWaveformOffline(stream.get(), DICTATE_SAMPLE_RATE, pcmf32.data(), (int32_t)pcmf32.size());
    SherpaOnnxDecodeOfflineStream(m_recognizer, stream.get());

    result_ptr result(SherpaOnnxGetOfflineStreamResult(stream.get()));
    if (!result) {
        throw std::runtime_error("sherpa-onnx returned no result");
    }
    return result->text ? result->text : "";
}
