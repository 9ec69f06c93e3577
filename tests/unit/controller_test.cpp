#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "controller.h"

// 0.5 s at 16 kHz, above the 300 ms minimum
static const size_t SPEECH_SAMPLES = 8000;

struct FakeCapture : public AudioCapture {
    int                start_calls = 0;
    int                live        = 0;
    bool               fail        = false;
    std::vector<float> buffer;

    struct Stream : public CaptureStream {
        explicit Stream(FakeCapture & owner) : m_owner(owner) {}
        ~Stream() override {
            if (!m_stopped) m_owner.live--;
        }
        std::vector<float> stop() override {
            m_stopped = true;
            m_owner.live--;
            std::vector<float> out;
            out.swap(m_owner.buffer);
            return out;
        }
        FakeCapture & m_owner;
        bool          m_stopped = false;
    };

    std::unique_ptr<CaptureStream> start() override {
        if (fail) throw std::runtime_error("permission denied");
        start_calls++;
        live++;
        buffer.clear();
        return std::make_unique<Stream>(*this);
    }

    void feed(size_t n) {
        buffer.insert(buffer.end(), n, 0.1f);
    }
};

struct FakeTranscriber : public Transcriber {
    std::string reply = "hello world";
    bool        fail  = false;

    std::mutex              mutex;
    std::condition_variable cv;
    bool                    hold  = false;
    int                     calls = 0;
    std::string             last_model;
    size_t                  last_samples = 0;

    std::string transcribe(const std::string & model_id, const std::vector<float> & pcmf32) override {
        std::unique_lock<std::mutex> lock(mutex);
        calls++;
        last_model   = model_id;
        last_samples = pcmf32.size();
        cv.wait(lock, [this] { return !hold; });
        if (fail) throw std::runtime_error("model load failure");
        return reply;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            hold = false;
        }
        cv.notify_all();
    }

    int call_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }
};

struct FakePaste : public PasteSink {
    bool fail = false;
    std::vector<std::pair<std::string, std::string>> pastes;
    std::vector<std::string> copies;
    std::function<void()> on_paste; // runs while the paste "blocks"

    bool paste(const std::string & text, const std::string & paste_command) override {
        pastes.emplace_back(text, paste_command);
        if (on_paste) on_paste();
        return !fail;
    }
    bool copy(const std::string & text) override {
        copies.push_back(text);
        return true;
    }
};

struct FakeNotifier : public Notifier {
    struct entry {
        notify_level level;
        std::string  title;
        std::string  body;
    };
    std::vector<entry> entries;

    void notify(notify_level level, const std::string & title, const std::string & body, int /*timeout_ms*/) override {
        entries.push_back({level, title, body});
    }

    int count(notify_level level) const {
        int n = 0;
        for (const auto & e : entries) {
            if (e.level == level) n++;
        }
        return n;
    }
};

struct fixture {
    EventQueue          queue;
    FakeCapture         capture;
    FakeTranscriber     backend;
    FakePaste           paste;
    FakeNotifier        notifier;
    DictationController controller;

    explicit fixture(session_options opts = default_options())
        : controller(queue, capture, backend, paste, notifier, opts) {}

    static session_options default_options() {
        session_options opts;
        opts.model         = "base.en";
        opts.auto_paste    = true;
        opts.paste_command = "ctrl+shift+v";
        opts.min_record_ms = 300;
        opts.max_record_ms = 30000;
        return opts;
    }

    // Run queued events until the controller is idle again
    void settle() {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (controller.state() != dictate_state::IDLE && std::chrono::steady_clock::now() < deadline) {
            queue.dispatch(std::chrono::milliseconds(10));
        }
        assert(controller.state() == dictate_state::IDLE);
    }

    void dictate(size_t samples) {
        controller.on_hotkey_down();
        capture.feed(samples);
        controller.on_hotkey_up();
        settle();
    }
};

static void test_repeated_hotkey_down_starts_one_session() {
    fixture f;
    f.controller.on_hotkey_down();
    f.controller.on_hotkey_down();
    f.controller.on_hotkey_down();

    assert(f.controller.state() == dictate_state::RECORDING);
    assert(f.capture.start_calls == 1);
    assert(f.capture.live == 1);
}

static void test_empty_recording_is_abandoned_silently() {
    fixture f;
    f.controller.on_hotkey_down();
    f.controller.on_hotkey_up();

    assert(f.controller.state() == dictate_state::IDLE);
    assert(f.queue.dispatch_pending() == 0);
    assert(f.backend.call_count() == 0);
    assert(f.notifier.entries.empty());
    assert(f.paste.pastes.empty());
    assert(f.capture.live == 0);
}

static void test_short_recording_is_abandoned_silently() {
    fixture f;
    f.controller.on_hotkey_down();
    f.capture.feed(160); // 10 ms
    f.controller.on_hotkey_up();

    assert(f.controller.state() == dictate_state::IDLE);
    assert(f.backend.call_count() == 0);
    assert(f.notifier.entries.empty());
}

static void test_dictation_pastes_transcribed_text() {
    fixture f;
    f.controller.on_hotkey_down();
    f.capture.feed(SPEECH_SAMPLES);
    f.controller.on_hotkey_up();

    assert(f.controller.state() == dictate_state::TRANSCRIBING);
    assert(f.capture.live == 0);

    f.settle();

    assert(f.backend.call_count() == 1);
    assert(f.backend.last_model == "base.en");
    assert(f.backend.last_samples == SPEECH_SAMPLES);
    assert(f.paste.pastes.size() == 1);
    assert(f.paste.pastes[0].first == "hello world");
    assert(f.paste.pastes[0].second == "ctrl+shift+v");
    assert(f.paste.copies.empty());
    assert(f.notifier.count(notify_level::error) == 0);
    assert(f.controller.last_text() == "hello world");
}

static void test_without_auto_paste_text_is_only_copied() {
    session_options opts = fixture::default_options();
    opts.auto_paste = false;
    fixture f(opts);

    f.dictate(SPEECH_SAMPLES);

    assert(f.paste.pastes.empty());
    assert(f.paste.copies.size() == 1);
    assert(f.paste.copies[0] == "hello world");
}

static void test_transcription_error_notifies_once() {
    fixture f;
    f.backend.fail = true;

    f.dictate(SPEECH_SAMPLES);

    assert(f.backend.call_count() == 1);
    assert(f.notifier.entries.size() == 1);
    assert(f.notifier.entries[0].level == notify_level::error);
    assert(f.notifier.entries[0].body == "model load failure");
    assert(f.paste.pastes.empty());
    assert(f.paste.copies.empty());
}

static void test_hotkey_down_while_transcribing_is_ignored() {
    fixture f;
    f.backend.hold = true;

    f.controller.on_hotkey_down();
    f.capture.feed(SPEECH_SAMPLES);
    f.controller.on_hotkey_up();
    assert(f.controller.state() == dictate_state::TRANSCRIBING);

    f.controller.on_hotkey_down();
    f.controller.on_hotkey_up();
    assert(f.controller.state() == dictate_state::TRANSCRIBING);
    assert(f.capture.start_calls == 1);

    f.backend.release();
    f.settle();
    assert(f.paste.pastes.size() == 1);

    // Nothing was queued: the next press starts a fresh session
    f.controller.on_hotkey_down();
    assert(f.controller.state() == dictate_state::RECORDING);
    assert(f.capture.start_calls == 2);
}

static void test_capture_error_stays_idle() {
    fixture f;
    f.capture.fail = true;

    f.controller.on_hotkey_down();

    assert(f.controller.state() == dictate_state::IDLE);
    assert(f.notifier.count(notify_level::error) == 1);
    assert(f.notifier.entries[0].body == "permission denied");

    f.controller.on_hotkey_up();
    assert(f.backend.call_count() == 0);
}

static void test_paste_failure_keeps_text() {
    fixture f;
    f.paste.fail = true;

    f.dictate(SPEECH_SAMPLES);

    assert(f.paste.pastes.size() == 1);
    assert(f.notifier.count(notify_level::error) == 1);
    assert(f.notifier.entries.back().title == "Paste failed");
    assert(f.notifier.entries.back().body.find("hello world") != std::string::npos);
    assert(f.controller.last_text() == "hello world");
}

static void test_empty_transcription_warns_without_paste() {
    fixture f;
    f.backend.reply = "";

    f.dictate(SPEECH_SAMPLES);

    assert(f.paste.pastes.empty());
    assert(f.notifier.entries.size() == 1);
    assert(f.notifier.entries[0].level == notify_level::warning);
}

static void test_max_duration_stops_recording() {
    session_options opts = fixture::default_options();
    opts.max_record_ms = 1000;
    fixture f(opts);

    f.controller.on_hotkey_down();
    f.capture.feed(SPEECH_SAMPLES);

    const auto now = std::chrono::steady_clock::now();
    f.controller.on_tick(now);
    assert(f.controller.state() == dictate_state::RECORDING);

    f.controller.on_tick(now + std::chrono::seconds(2));
    assert(f.controller.state() == dictate_state::TRANSCRIBING);

    // The real release arrives later and is ignored
    f.controller.on_hotkey_up();
    f.settle();
    assert(f.paste.pastes.size() == 1);
}

static void test_state_observer_sees_every_transition() {
    fixture f;
    std::vector<dictate_state> seen;
    f.controller.set_state_callback([&seen](dictate_state s) { seen.push_back(s); });

    f.dictate(SPEECH_SAMPLES);

    assert(seen.size() == 3);
    assert(seen[0] == dictate_state::RECORDING);
    assert(seen[1] == dictate_state::TRANSCRIBING);
    assert(seen[2] == dictate_state::IDLE);
}

static void test_toggle_starts_and_stops() {
    fixture f;
    f.controller.toggle();
    assert(f.controller.state() == dictate_state::RECORDING);
    f.capture.feed(SPEECH_SAMPLES);
    f.controller.toggle();
    assert(f.controller.state() == dictate_state::TRANSCRIBING);
    f.settle();
    assert(f.paste.pastes.size() == 1);
}

static void test_options_apply_from_next_session() {
    fixture f;
    f.controller.on_hotkey_down();
    f.capture.feed(SPEECH_SAMPLES);

    session_options changed = fixture::default_options();
    changed.model         = "small.en";
    changed.paste_command = "ctrl+v";
    f.controller.set_options(changed);

    f.controller.on_hotkey_up();
    f.settle();
    assert(f.backend.last_model == "base.en");
    assert(f.paste.pastes[0].second == "ctrl+shift+v");

    f.dictate(SPEECH_SAMPLES);
    assert(f.backend.last_model == "small.en");
    assert(f.paste.pastes[1].second == "ctrl+v");
}

static void test_stray_events_are_ignored() {
    fixture f;
    f.controller.on_hotkey_up();
    f.controller.on_transcription_complete("late");
    f.controller.on_transcription_error("late");

    assert(f.controller.state() == dictate_state::IDLE);
    assert(f.paste.pastes.empty());
    assert(f.notifier.entries.empty());
}

static void test_preview_text() {
    assert(preview_text("short") == "short");

    std::string long_text(150, 'a');
    std::string p = preview_text(long_text);
    assert(p.size() == 103);
    assert(p.substr(100) == "...");

    // Two-byte characters are never split
    std::string accents;
    for (int i = 0; i < 60; i++) accents += "\xc3\xa9";
    p = preview_text(accents, 101);
    assert(p == accents.substr(0, 100) + "...");
}

static void test_press_during_paste_is_dropped() {
    fixture f;
    f.paste.on_paste = [&f]() {
        // The hotkey thread posts while the queue thread is busy pasting
        const auto pressed_at = std::chrono::steady_clock::now();
        f.queue.post([&f, pressed_at]() { f.controller.on_hotkey_down(pressed_at); });
        f.queue.post([&f]() { f.controller.on_hotkey_up(); });
    };

    f.dictate(SPEECH_SAMPLES);
    f.paste.on_paste = nullptr;
    f.queue.dispatch_pending();

    assert(f.paste.pastes.size() == 1);
    assert(f.capture.start_calls == 1);
    assert(f.capture.live == 0);
    assert(f.controller.state() == dictate_state::IDLE);

    // The next real press works
    f.dictate(SPEECH_SAMPLES);
    assert(f.capture.start_calls == 2);
    assert(f.paste.pastes.size() == 2);
}

int main() {
    test_repeated_hotkey_down_starts_one_session();
    test_empty_recording_is_abandoned_silently();
    test_short_recording_is_abandoned_silently();
    test_dictation_pastes_transcribed_text();
    test_without_auto_paste_text_is_only_copied();
    test_transcription_error_notifies_once();
    test_hotkey_down_while_transcribing_is_ignored();
    test_capture_error_stays_idle();
    test_paste_failure_keeps_text();
    test_empty_transcription_warns_without_paste();
    test_max_duration_stops_recording();
    test_state_observer_sees_every_transition();
    test_toggle_starts_and_stops();
    test_options_apply_from_next_session();
    test_stray_events_are_ignored();
    test_preview_text();
    test_press_during_paste_is_dropped();

    fprintf(stderr, "controller_test: ok\n");
    return 0;
}
