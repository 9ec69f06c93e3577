#include "paste-sink.h"
#include "run-cmd.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <thread>

// Delay after setting clipboard before sending paste keystroke
static constexpr int CLIPBOARD_SET_DELAY_MS = 150;

bool XdotoolPasteSink::copy(const std::string & text) {
    const char * argv[] = {"xclip", "-selection", "clipboard", nullptr};
    int ret = run_cmd(argv, CMD_TIMEOUT_MS, &text);
    if (ret != 0) {
        fprintf(stderr, "paste: xclip write failed (exit %d)\n", ret);
        return false;
    }
    return true;
}

bool XdotoolPasteSink::paste(const std::string & text, const std::string & paste_command) {
    if (text.empty()) return true;

    // The clipboard keeps the text when the paste itself fails
    const bool copied = copy(text);

    std::this_thread::sleep_for(std::chrono::milliseconds(CLIPBOARD_SET_DELAY_MS));

    if (paste_command == PASTE_COMMAND_TYPE) {
        return type_xdotool(text);
    }

    // Clipboard paste needs the clipboard
    if (!copied) {
        return false;
    }

    std::string window_id = active_window();
    std::string cls;
    if (paste_command == PASTE_COMMAND_AUTO && !window_id.empty()) {
        cls = window_class(window_id);
    }

    return send_keys(resolve_keys(paste_command, cls), window_id);
}

std::string XdotoolPasteSink::resolve_keys(const std::string & paste_command,
                                           const std::string & window_class) {
    if (paste_command == PASTE_COMMAND_TYPE) {
        return "";
    }
    if (paste_command.empty() || paste_command == PASTE_COMMAND_AUTO) {
        return is_terminal_class(window_class) ? "ctrl+shift+v" : "ctrl+v";
    }
    return paste_command;
}

bool XdotoolPasteSink::type_xdotool(const std::string & text) {
    std::string delay_str = std::to_string(m_type_delay_ms);
    const char * argv[] = {
        "xdotool", "type", "--clearmodifiers",
        "--delay", delay_str.c_str(),
        "--", text.c_str(), nullptr
    };

    int ret = run_cmd(argv, CMD_TIMEOUT_MS);
    if (ret != 0) {
        fprintf(stderr, "paste: xdotool type failed (exit %d)\n", ret);
        return false;
    }
    return true;
}

bool XdotoolPasteSink::send_keys(const std::string & keys, const std::string & window_id) {
    int ret;
    if (!window_id.empty()) {
        const char * argv[] = {"xdotool", "key", "--clearmodifiers",
                               "--window", window_id.c_str(),
                               keys.c_str(), nullptr};
        ret = run_cmd(argv, CMD_TIMEOUT_MS);
    } else {
        const char * argv[] = {"xdotool", "key", "--clearmodifiers", keys.c_str(), nullptr};
        ret = run_cmd(argv, CMD_TIMEOUT_MS);
    }

    if (ret != 0) {
        fprintf(stderr, "paste: xdotool key %s failed (exit %d)\n", keys.c_str(), ret);
        return false;
    }
    return true;
}

std::string XdotoolPasteSink::active_window() {
    std::string window_id;
    const char * argv[] = {"xdotool", "getactivewindow", nullptr};
    if (run_cmd(argv, CMD_TIMEOUT_MS, nullptr, &window_id) != 0) {
        return "";
    }
    chomp(window_id);
    return window_id;
}

std::string XdotoolPasteSink::window_class(const std::string & window_id) {
    std::string cls;
    const char * argv[] = {"xdotool", "getwindowclassname", window_id.c_str(), nullptr};
    if (run_cmd(argv, CMD_TIMEOUT_MS, nullptr, &cls) != 0) {
        return "";
    }
    chomp(cls);
    return cls;
}

bool XdotoolPasteSink::is_terminal_class(const std::string & cls) {
    std::string lower = cls;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    static const char * terminals[] = {
        "alacritty",
        "kitty",
        "gnome-terminal",
        "gnome-terminal-server",
        "xterm",
        "uxterm",
        "konsole",
        "xfce4-terminal",
        "terminator",
        "tilix",
        "urxvt",
        "st-256color",
        "st",
        "foot",
        "wezterm",
        "terminal",
        "ghostty",
        "rio",
        "contour",
        "hyper",
        "tabby",
        "sakura",
        "guake",
        "tilda",
        "yakuake",
        "terminology",
        nullptr
    };

    for (int i = 0; terminals[i]; i++) {
        if (lower == terminals[i]) {
            return true;
        }
    }

    return false;
}
