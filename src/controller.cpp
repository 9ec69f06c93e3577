#include "controller.h"

#include <cstdio>
#include <exception>
#include <system_error>

const char * dictate_state_name(dictate_state state) {
    switch (state) {
        case dictate_state::IDLE:         return "idle";
        case dictate_state::RECORDING:    return "recording";
        case dictate_state::TRANSCRIBING: return "transcribing";
    }
    return "unknown";
}

std::string preview_text(const std::string & text, size_t max_len) {
    if (text.size() <= max_len) return text;

    // Don't cut a UTF-8 sequence in half
    size_t cut = max_len;
    while (cut > 0 && ((unsigned char)text[cut] & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut) + "...";
}

DictationController::DictationController(EventQueue & queue, AudioCapture & capture, Transcriber & backend,
                                         PasteSink & paste, Notifier & notifier, session_options options)
    : m_queue(queue), m_capture(capture), m_backend(backend),
      m_paste(paste), m_notifier(notifier), m_options(std::move(options)) {}

DictationController::~DictationController() {
    // An in-flight transcription runs to completion; its result event is
    // left in the queue unprocessed
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void DictationController::set_options(const session_options & options) {
    m_options = options;
}

void DictationController::set_state(dictate_state state) {
    if (m_state.load() == state) return;
    m_state = state;
    if (m_on_state) {
        m_on_state(state);
    }
}

void DictationController::finish_session() {
    // Releases the capture if it is still held
    m_session.reset();
    m_idle_since = std::chrono::steady_clock::now();
    set_state(dictate_state::IDLE);
}

void DictationController::on_hotkey_down(std::chrono::steady_clock::time_point pressed_at) {
    if (m_state.load() != dictate_state::IDLE) {
        // Key repeat, or a press while the previous attempt is transcribing
        return;
    }
    if (pressed_at < m_idle_since) {
        // Made during the last session (e.g. while the paste ran) and
        // dispatched only after it ended
        fprintf(stderr, "[ignoring press made while busy]\n");
        return;
    }

    auto session = std::make_unique<dictate_session>();
    session->options    = m_options;
    session->start_time = std::chrono::steady_clock::now();

    try {
        session->stream = m_capture.start();
    } catch (const std::exception & e) {
        fprintf(stderr, "[capture failed: %s]\n", e.what());
        m_notifier.notify(notify_level::error, "Recording failed", e.what(), 3000);
        return;
    }

    if (!session->stream) {
        m_notifier.notify(notify_level::error, "Recording failed", "microphone unavailable", 3000);
        return;
    }

    m_session = std::move(session);
    set_state(dictate_state::RECORDING);
    fprintf(stderr, "[recording...]\n");
}

void DictationController::on_hotkey_up() {
    if (m_state.load() != dictate_state::RECORDING || !m_session) {
        return;
    }

    try {
        m_session->audio = m_session->stream->stop();
    } catch (const std::exception & e) {
        fprintf(stderr, "[capture failed: %s]\n", e.what());
        m_notifier.notify(notify_level::error, "Recording failed", e.what(), 3000);
        finish_session();
        return;
    }
    m_session->stream.reset();

    const session_options & opts = m_session->options;
    const size_t n_samples   = m_session->audio.size();
    const size_t min_samples = (size_t)opts.min_record_ms * (size_t)opts.sample_rate / 1000;
    const int    audio_ms    = (int)(n_samples * 1000 / (size_t)opts.sample_rate);

    // Accidental taps end here: no transcription, no notification
    if (n_samples == 0) {
        fprintf(stderr, "[no audio captured]\n");
        finish_session();
        return;
    }
    if (n_samples < min_samples) {
        fprintf(stderr, "[recording too short (%d ms), skipping]\n", audio_ms);
        finish_session();
        return;
    }

    set_state(dictate_state::TRANSCRIBING);
    fprintf(stderr, "[transcribing %d ms of audio with %s...]\n", audio_ms, opts.model.c_str());

    try {
        launch_worker(std::move(m_session->audio), opts.model);
    } catch (const std::system_error & e) {
        on_transcription_error(std::string("cannot start transcription: ") + e.what());
    }
}

void DictationController::launch_worker(std::vector<float> audio, const std::string & model) {
    // The previous worker has already posted its result
    if (m_worker.joinable()) {
        m_worker.join();
    }

    m_worker = std::thread([this, audio = std::move(audio), model]() {
        std::string text;
        try {
            text = m_backend.transcribe(model, audio);
        } catch (const std::exception & e) {
            std::string cause = e.what();
            m_queue.post([this, cause]() { on_transcription_error(cause); });
            return;
        } catch (...) {
            m_queue.post([this]() { on_transcription_error("unknown transcription failure"); });
            return;
        }
        m_queue.post([this, text]() { on_transcription_complete(text); });
    });
}

void DictationController::on_transcription_complete(const std::string & text) {
    if (m_state.load() != dictate_state::TRANSCRIBING || !m_session) {
        return;
    }

    m_session->result_text = text;

    if (text.empty()) {
        fprintf(stderr, "[empty transcription]\n");
        m_notifier.notify(notify_level::warning, "No speech", "No speech detected", 2000);
    } else {
        fprintf(stderr, "[result: \"%s\"]\n", text.c_str());
        m_last_text = text;
        deliver(text);
    }

    // Only after the paste has completed or failed
    finish_session();
}

void DictationController::deliver(const std::string & text) {
    const session_options & opts = m_session->options;

    if (!opts.auto_paste) {
        bool copied = false;
        try {
            copied = m_paste.copy(text);
        } catch (const std::exception & e) {
            fprintf(stderr, "[copy failed: %s]\n", e.what());
        }
        m_notifier.notify(notify_level::info, copied ? "Transcribed (copied)" : "Transcribed",
                          preview_text(text), 3000);
        return;
    }

    bool pasted = false;
    std::string cause = "target window refused the paste";
    try {
        pasted = m_paste.paste(text, opts.paste_command);
    } catch (const std::exception & e) {
        cause = e.what();
    }

    if (pasted) {
        m_notifier.notify(notify_level::info, "Transcribed", preview_text(text), 3000);
    } else {
        fprintf(stderr, "[paste failed: %s]\n", cause.c_str());
        m_notifier.notify(notify_level::error, "Paste failed",
                          cause + ". Text left on the clipboard: " + preview_text(text), 3000);
    }
}

void DictationController::on_transcription_error(const std::string & cause) {
    if (m_state.load() != dictate_state::TRANSCRIBING) {
        return;
    }

    // The audio is gone; the user has moved on, so no retry
    fprintf(stderr, "[transcription failed: %s]\n", cause.c_str());
    m_notifier.notify(notify_level::error, "Error", cause, 3000);
    finish_session();
}

void DictationController::on_tick(std::chrono::steady_clock::time_point now) {
    if (m_state.load() != dictate_state::RECORDING || !m_session) {
        return;
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - m_session->start_time).count();
    if (elapsed_ms >= m_session->options.max_record_ms) {
        fprintf(stderr, "[max recording time reached]\n");
        on_hotkey_up();
    }
}

void DictationController::toggle() {
    switch (m_state.load()) {
        case dictate_state::IDLE:         on_hotkey_down(); break;
        case dictate_state::RECORDING:    on_hotkey_up();   break;
        case dictate_state::TRANSCRIBING: break;
    }
}
