#pragma once

#include "models.h"
#include "transcriber.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

// whisper.cpp context for one ggml model file
class WhisperModel : public ModelHandle {
public:
    WhisperModel(const std::string & id, whisper_context * ctx);
    ~WhisperModel() override;

    std::string transcribe(const std::vector<float> & pcmf32, const decode_options & opts) override;

private:
    whisper_context * m_ctx = nullptr;
    std::mutex        m_mutex; // a context runs one inference at a time
};

// Loader for ModelCache. Throws std::runtime_error if the file is missing
// or whisper cannot initialize it.
std::shared_ptr<ModelHandle> load_whisper_model(const model_load_params & params, const std::string & model_id);
