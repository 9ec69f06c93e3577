#pragma once

#include <string>

// Paste command that types the text instead of sending a paste keystroke
static constexpr const char * PASTE_COMMAND_TYPE = "type";

// Paste command that picks ctrl+shift+v for terminals and ctrl+v elsewhere
static constexpr const char * PASTE_COMMAND_AUTO = "auto";

// Delivers transcribed text to the focused window
class PasteSink {
public:
    virtual ~PasteSink() = default;

    // Deliver text using paste_command. Returns false on failure; the
    // text must still be on the clipboard when possible.
    virtual bool paste(const std::string & text, const std::string & paste_command) = 0;

    // Put text on the clipboard only
    virtual bool copy(const std::string & text) = 0;
};

// xclip + xdotool (X11)
class XdotoolPasteSink : public PasteSink {
public:
    XdotoolPasteSink() = default;

    // Non-copyable (no meaningful copy semantics)
    XdotoolPasteSink(const XdotoolPasteSink &) = delete;
    XdotoolPasteSink & operator=(const XdotoolPasteSink &) = delete;

    void set_type_delay_ms(int delay_ms) { m_type_delay_ms = delay_ms; }

    bool paste(const std::string & text, const std::string & paste_command) override;
    bool copy(const std::string & text) override;

    // Key combination sent to xdotool for paste_command, given the class
    // of the focused window ("" when unknown). Empty for "type".
    static std::string resolve_keys(const std::string & paste_command,
                                    const std::string & window_class);

    // Check if a window class name is a known terminal
    static bool is_terminal_class(const std::string & cls);

private:
    int m_type_delay_ms = 12;

    bool type_xdotool(const std::string & text);
    bool send_keys(const std::string & keys, const std::string & window_id);

    static std::string active_window();
    static std::string window_class(const std::string & window_id);
};
