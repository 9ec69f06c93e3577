#include "sdl-capture.h"

#include <cstdio>
#include <memory>
#include <stdexcept>

class SdlCaptureStream : public CaptureStream {
public:
    explicit SdlCaptureStream(SdlAudioCapture * owner) : m_owner(owner) {}

    ~SdlCaptureStream() override {
        if (m_owner) {
            m_owner->end_window();
        }
    }

    std::vector<float> stop() override {
        if (!m_owner) return {};
        SdlAudioCapture * owner = m_owner;
        m_owner = nullptr;
        return owner->end_window();
    }

private:
    SdlAudioCapture * m_owner;
};

SdlAudioCapture::~SdlAudioCapture() {
    if (m_dev) {
        SDL_PauseAudioDevice(m_dev, 1);
        SDL_CloseAudioDevice(m_dev);
        m_dev = 0;
    }
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
}

bool SdlAudioCapture::init(int capture_id, int sample_rate, int max_record_ms) {
    // Signals belong to the daemon, not SDL
    SDL_SetHint(SDL_HINT_NO_SIGNAL_HANDLERS, "1");

    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        fprintf(stderr, "audio: SDL init failed: %s\n", SDL_GetError());
        return false;
    }

    const int n_devices = SDL_GetNumAudioDevices(SDL_TRUE);
    if (capture_id >= n_devices) {
        fprintf(stderr, "audio: capture device %d does not exist (%d available)\n", capture_id, n_devices);
        return false;
    }

    SDL_AudioSpec want;
    SDL_AudioSpec have;
    SDL_zero(want);
    SDL_zero(have);

    want.freq     = sample_rate;
    want.format   = AUDIO_F32;
    want.channels = 1;
    want.samples  = 1024;
    want.callback = &SdlAudioCapture::sdl_callback;
    want.userdata = this;

    const char * name = capture_id >= 0 ? SDL_GetAudioDeviceName(capture_id, SDL_TRUE) : nullptr;

    // Some microphones (laptop DMICs) only open in stereo
    m_dev = SDL_OpenAudioDevice(name, SDL_TRUE, &want, &have, SDL_AUDIO_ALLOW_CHANNELS_CHANGE);
    if (m_dev == 0) {
        fprintf(stderr, "audio: couldn't open capture device: %s\n", SDL_GetError());
        return false;
    }

    m_channels    = have.channels > 0 ? have.channels : 1;
    m_max_samples = (size_t)sample_rate * (size_t)max_record_ms / 1000;

    fprintf(stderr, "audio: opened '%s' (%d Hz, %d channel%s, %d samples/buffer)\n",
            name ? name : "default", have.freq, m_channels, m_channels == 1 ? "" : "s", have.samples);

    SDL_PauseAudioDevice(m_dev, 0);
    return true;
}

bool SdlAudioCapture::list_devices() {
    SDL_SetHint(SDL_HINT_NO_SIGNAL_HANDLERS, "1");
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        fprintf(stderr, "audio: SDL init failed: %s\n", SDL_GetError());
        return false;
    }

    const int n = SDL_GetNumAudioDevices(SDL_TRUE);
    printf("capture devices (%d):\n", n);
    for (int i = 0; i < n; i++) {
        printf("  %d: %s\n", i, SDL_GetAudioDeviceName(i, SDL_TRUE));
    }

    SDL_QuitSubSystem(SDL_INIT_AUDIO);
    return true;
}

std::unique_ptr<CaptureStream> SdlAudioCapture::start() {
    if (m_dev == 0) {
        throw std::runtime_error("audio device not initialized");
    }
    if (SDL_GetAudioDeviceStatus(m_dev) != SDL_AUDIO_PLAYING) {
        throw std::runtime_error("audio device stopped (unplugged?)");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active) {
        throw std::runtime_error("a recording is already in progress");
    }
    m_buffer.clear();
    m_active = true;

    return std::make_unique<SdlCaptureStream>(this);
}

std::vector<float> SdlAudioCapture::end_window() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_active = false;

    std::vector<float> out;
    out.swap(m_buffer);
    return out;
}

void SDLCALL SdlAudioCapture::sdl_callback(void * userdata, Uint8 * stream, int len) {
    auto * self = static_cast<SdlAudioCapture *>(userdata);
    self->on_audio(reinterpret_cast<const float *>(stream), len / (int)sizeof(float));
}

void SdlAudioCapture::on_audio(const float * samples, int n_floats) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_active) return;

    const int n_frames = n_floats / m_channels;
    for (int i = 0; i < n_frames; i++) {
        if (m_buffer.size() >= m_max_samples) {
            return;
        }

        float acc = 0.0f;
        for (int c = 0; c < m_channels; c++) {
            acc += samples[i * m_channels + c];
        }
        m_buffer.push_back(acc / m_channels);
    }
}
