#include "model-transcriber.h"

#include <cctype>
#include <memory>

static std::string trim(const std::string & s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b]))     b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

ModelTranscriber::ModelTranscriber(ModelCache & cache, const decode_options & opts)
    : m_cache(cache), m_opts(opts) {}

void ModelTranscriber::set_options(const decode_options & opts) {
    std::lock_guard<std::mutex> lock(m_opts_mutex);
    m_opts = opts;
}

std::string ModelTranscriber::transcribe(const std::string & model_id, const std::vector<float> & pcmf32) {
    if (pcmf32.empty()) return "";

    decode_options opts;
    {
        std::lock_guard<std::mutex> lock(m_opts_mutex);
        opts = m_opts;
    }

    // Held until this call returns, even if the cache switches models
    std::shared_ptr<ModelHandle> handle = m_cache.acquire(model_id);

    // Both engines tend to pad the text with spaces
    return trim(handle->transcribe(pcmf32, opts));
}
