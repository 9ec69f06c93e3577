#pragma once

#include "audio-capture.h"

#include <SDL.h>

#include <cstdint>
#include <mutex>
#include <vector>

// SDL2 microphone capture, down-mixed to mono float PCM.
//
// The device is opened once and kept running: on PipeWire, SDL audio
// callbacks fail if the device is resumed after the evdev hotkey listener
// thread has started. A stream is a recording window over the running
// device.
class SdlAudioCapture : public AudioCapture {
public:
    SdlAudioCapture() = default;
    ~SdlAudioCapture() override;

    SdlAudioCapture(const SdlAudioCapture &) = delete;
    SdlAudioCapture & operator=(const SdlAudioCapture &) = delete;

    // Open capture device capture_id (-1 = default) at sample_rate and
    // start it. A recording keeps at most max_record_ms of audio.
    bool init(int capture_id, int sample_rate, int max_record_ms);

    std::unique_ptr<CaptureStream> start() override;

    // Print SDL capture devices to stdout
    static bool list_devices();

private:
    friend class SdlCaptureStream;

    static void SDLCALL sdl_callback(void * userdata, Uint8 * stream, int len);
    void on_audio(const float * samples, int n_floats);

    // Close the recording window; returns its samples
    std::vector<float> end_window();

    SDL_AudioDeviceID  m_dev         = 0;
    int                m_channels    = 1;
    size_t             m_max_samples = 0;

    std::mutex         m_mutex;
    bool               m_active      = false;
    std::vector<float> m_buffer;
};
