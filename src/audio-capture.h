#pragma once

#include <memory>
#include <vector>

// One recording. Destroying it without stop() releases the capture and
// discards the audio.
class CaptureStream {
public:
    virtual ~CaptureStream() = default;

    // End the recording and return its samples (mono float PCM)
    virtual std::vector<float> stop() = 0;
};

// Microphone. At most one stream is live at a time.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    // Begin a recording. Throws std::runtime_error if the device is
    // unavailable or a stream is already live.
    virtual std::unique_ptr<CaptureStream> start() = 0;
};
