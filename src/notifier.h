#pragma once

#include <string>

enum class notify_level {
    info,
    warning,
    error,
};

// User-visible desktop notifications
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void notify(notify_level level, const std::string & title,
                        const std::string & body, int timeout_ms) = 0;
};

// notify-send (libnotify). Falls back to stderr when notify-send is
// missing or fails, so a notification is never lost silently.
class NotifySendNotifier : public Notifier {
public:
    explicit NotifySendNotifier(std::string app_name);

    void notify(notify_level level, const std::string & title,
                const std::string & body, int timeout_ms) override;

private:
    std::string m_app_name;
    bool        m_available;
};
