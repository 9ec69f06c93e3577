#pragma once

#include "models.h"
#include "transcriber.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct SherpaOnnxOfflineRecognizer;

// Moonshine through sherpa-onnx's offline recognizer. The model directory
// is a sherpa-onnx release (preprocess.onnx, encode.int8.onnx,
// uncached_decode.int8.onnx, cached_decode.int8.onnx, tokens.txt).
class MoonshineModel : public ModelHandle {
public:
    MoonshineModel(const std::string & id, const SherpaOnnxOfflineRecognizer * recognizer);
    ~MoonshineModel() override;

    // English only: opts.language and opts.translate are ignored
    std::string transcribe(const std::vector<float> & pcmf32, const decode_options & opts) override;

private:
    const SherpaOnnxOfflineRecognizer * m_recognizer = nullptr;
    std::mutex                          m_mutex;
};

// Loader for ModelCache. Throws std::runtime_error if a model file is
// missing or sherpa-onnx rejects the model.
std::shared_ptr<ModelHandle> load_moonshine_model(const model_load_params & params, const std::string & model_id);
