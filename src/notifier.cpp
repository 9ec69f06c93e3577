#include "notifier.h"
#include "run-cmd.h"

#include <cstdio>
#include <utility>

static const char * urgency(notify_level level) {
    switch (level) {
        case notify_level::info:    return "low";
        case notify_level::warning: return "normal";
        case notify_level::error:   return "critical";
    }
    return "normal";
}

static const char * icon(notify_level level) {
    switch (level) {
        case notify_level::info:    return "audio-input-microphone";
        case notify_level::warning: return "dialog-warning";
        case notify_level::error:   return "dialog-error";
    }
    return "audio-input-microphone";
}

NotifySendNotifier::NotifySendNotifier(std::string app_name)
    : m_app_name(std::move(app_name)), m_available(have_program("notify-send")) {
    if (!m_available) {
        fprintf(stderr, "notify: notify-send not found, notifications go to stderr "
                        "(install with: sudo apt install libnotify-bin)\n");
    }
}

void NotifySendNotifier::notify(notify_level level, const std::string & title,
                                const std::string & body, int timeout_ms) {
    fprintf(stderr, "[%s] %s: %s\n", level == notify_level::error ? "error" : "notify", title.c_str(), body.c_str());

    if (!m_available) return;

    const std::string timeout = std::to_string(timeout_ms);
    const char * argv[] = {
        "notify-send",
        "-a", m_app_name.c_str(),
        "-u", urgency(level),
        "-t", timeout.c_str(),
        "-i", icon(level),
        "--", title.c_str(), body.c_str(),
        nullptr
    };

    int ret = run_cmd(argv, CMD_TIMEOUT_MS);
    if (ret != 0) {
        fprintf(stderr, "notify: notify-send failed (exit %d)\n", ret);
    }
}
