#pragma once

#include "audio-capture.h"
#include "event-queue.h"
#include "notifier.h"
#include "paste-sink.h"
#include "transcriber.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class dictate_state {
    IDLE,
    RECORDING,
    TRANSCRIBING,
};

const char * dictate_state_name(dictate_state state);

// Settings a session snapshots when it starts
struct session_options {
    std::string model;
    bool        auto_paste    = true;
    std::string paste_command = "ctrl+shift+v";
    int32_t     min_record_ms = 300;
    int32_t     max_record_ms = 30000;
    int32_t     sample_rate   = DICTATE_SAMPLE_RATE;
};

// One press-to-release attempt
struct dictate_session {
    std::chrono::steady_clock::time_point start_time;
    session_options                       options;
    std::unique_ptr<CaptureStream>        stream;
    std::vector<float>                    audio;
    std::optional<std::string>            result_text;
};

// Push-to-talk lifecycle: IDLE -> RECORDING -> TRANSCRIBING -> IDLE.
//
// All on_* handlers run on the event queue's consumer thread. The only
// other thread is the transcription worker, which never touches the
// session and reports back by posting to the queue. At most one session
// exists; a hotkey-down while not IDLE is ignored, not queued, including
// one still waiting in the queue when the session ends.
//
// Every collaborator failure is turned into a notification here and the
// controller returns to IDLE.
class DictationController {
public:
    using StateCallback = std::function<void(dictate_state)>;

    DictationController(EventQueue & queue, AudioCapture & capture, Transcriber & backend,
                        PasteSink & paste, Notifier & notifier, session_options options);
    ~DictationController();

    DictationController(const DictationController &) = delete;
    DictationController & operator=(const DictationController &) = delete;

    // pressed_at is when the key went down; presses older than the last
    // return to IDLE are dropped
    void on_hotkey_down(std::chrono::steady_clock::time_point pressed_at = std::chrono::steady_clock::now());
    void on_hotkey_up();
    void on_transcription_complete(const std::string & text);
    void on_transcription_error(const std::string & cause);

    // Ends a recording that has run past max_record_ms
    void on_tick(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Start or stop recording (SIGUSR1); ignored while transcribing
    void toggle();

    // Applies from the next session
    void set_options(const session_options & options);
    const session_options & options() const { return m_options; }

    // Observer for transitions (status display); runs on the queue thread
    void set_state_callback(StateCallback cb) { m_on_state = std::move(cb); }

    dictate_state state() const { return m_state.load(); }

    // Text of the last successful transcription, kept for manual copy
    const std::string & last_text() const { return m_last_text; }

private:
    void set_state(dictate_state state);
    void finish_session();
    void deliver(const std::string & text);
    void launch_worker(std::vector<float> audio, const std::string & model);

    EventQueue &   m_queue;
    AudioCapture & m_capture;
    Transcriber &  m_backend;
    PasteSink &    m_paste;
    Notifier &     m_notifier;

    session_options                  m_options;
    std::unique_ptr<dictate_session> m_session;
    std::atomic<dictate_state>       m_state{dictate_state::IDLE};
    StateCallback                    m_on_state;
    std::string                      m_last_text;

    std::chrono::steady_clock::time_point m_idle_since{};

    std::thread m_worker;
};

// Notification text: at most max_len characters, "..." when cut
std::string preview_text(const std::string & text, size_t max_len = 100);
