#include "whisper-model.h"

#include "whisper.h"

#include <cstdio>
#include <stdexcept>

WhisperModel::WhisperModel(const std::string & id, whisper_context * ctx)
    : ModelHandle(id), m_ctx(ctx) {}

WhisperModel::~WhisperModel() {
    if (m_ctx) {
        whisper_print_timings(m_ctx);
        whisper_free(m_ctx);
    }
}

std::shared_ptr<ModelHandle> load_whisper_model(const model_load_params & params, const std::string & model_id) {
    const std::string path = model_path(params.models_dir, model_id);
    if (!is_model_downloaded(params.models_dir, model_id)) {
        throw std::runtime_error("model " + model_id + " not found at " + path +
                                 " (download it with whisper.cpp's models/download-ggml-model.sh)");
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu    = params.use_gpu;
    cparams.flash_attn = params.flash_attn;

    struct whisper_context * ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        throw std::runtime_error("failed to initialize whisper context from " + path);
    }

    return std::make_shared<WhisperModel>(model_id, ctx);
}

std::string WhisperModel::transcribe(const std::vector<float> & pcmf32, const decode_options & opts) {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = opts.translate;
    wparams.single_segment   = false;
    wparams.max_tokens       = 0;
    wparams.language         = opts.language.c_str();
    wparams.n_threads        = opts.n_threads;
    wparams.audio_ctx        = opts.audio_ctx;
    wparams.no_context       = true;
    wparams.no_timestamps    = true;
    wparams.suppress_blank   = true;

    std::lock_guard<std::mutex> lock(m_mutex);

    if (whisper_full(m_ctx, wparams, pcmf32.data(), (int)pcmf32.size()) != 0) {
        throw std::runtime_error("whisper_full() failed");
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < n_segments; ++i) {
        result += whisper_full_get_segment_text(m_ctx, i);
    }
    return result;
}
