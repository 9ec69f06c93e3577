#pragma once

#include "models.h"
#include "transcriber.h"

#include <mutex>
#include <string>
#include <vector>

// Transcriber over a ModelCache. The cache's loader picks the engine from
// the model id, so this class never needs to know which one runs.
class ModelTranscriber : public Transcriber {
public:
    ModelTranscriber(ModelCache & cache, const decode_options & opts);

    ModelTranscriber(const ModelTranscriber &) = delete;
    ModelTranscriber & operator=(const ModelTranscriber &) = delete;

    // Takes effect from the next transcription
    void set_options(const decode_options & opts);

    std::string transcribe(const std::string & model_id, const std::vector<float> & pcmf32) override;

private:
    ModelCache &   m_cache;
    std::mutex     m_opts_mutex;
    decode_options m_opts;
};
