#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Callback: key_down = true on press, false on release
using HotkeyCallback = std::function<void(bool key_down)>;

// Modifier flags
enum {
    MOD_CTRL  = 1 << 0,
    MOD_SHIFT = 1 << 1,
    MOD_ALT   = 1 << 2,
    MOD_SUPER = 1 << 3,
};

// Parsed hotkey
struct hotkey_spec {
    std::vector<int> key_codes;        // evdev codes that trigger (any of)
    unsigned int     modmask  = 0;     // required modifiers
    bool             bare_modifier = false; // the hotkey is itself a modifier ("alt", "ctrl_r")
};

// Parse a hotkey string (e.g. "f9", "ctrl+period", "super+shift+v", "alt_r").
// Returns false and prints the reason for unknown keys or modifiers.
bool parse_hotkey(const std::string & hotkey_str, hotkey_spec & out);

// Config name for an evdev key code ("f9", "a", "scroll_lock"), or "" if unknown
std::string evdev_key_name(int code);

// Turns raw evdev key events into hotkey press and release edges.
// Combinations need exactly their modifiers held; a bare modifier hotkey
// fires on its own key regardless of other modifiers.
class HotkeyMatcher {
public:
    enum edge { NONE = 0, DOWN, UP };

    explicit HotkeyMatcher(hotkey_spec spec = hotkey_spec()) : m_spec(std::move(spec)) {}

    // value as in input_event: 1 press, 0 release, 2 autorepeat
    edge feed(int code, int value);

    // Forget held keys (device lost). Returns UP if the hotkey was down.
    edge reset();

    bool active() const { return m_active; }

private:
    unsigned int held_mods() const;

    hotkey_spec  m_spec;
    unsigned int m_held   = 0; // one bit per modifier key, see modifier_bit()
    bool         m_active = false;
};

class HotkeyListener {
public:
    HotkeyListener();
    ~HotkeyListener();

    // Non-copyable, non-movable (owns thread + file descriptors)
    HotkeyListener(const HotkeyListener &) = delete;
    HotkeyListener & operator=(const HotkeyListener &) = delete;

    // Parse hotkey string and open keyboard devices
    bool init(const std::string & hotkey_str);

    // Parse hotkey string only; init() without the devices
    bool set_hotkey(const std::string & hotkey_str);

    // Start listening thread
    bool start(HotkeyCallback callback);

    // Stop listening thread and close devices. A hotkey still held gets
    // its release callback here.
    void stop();

    // Feed one EV_KEY event (listener thread, or a caller replaying events)
    void on_key(int code, int value);

    void set_callback(HotkeyCallback callback) { m_callback = std::move(callback); }

    // Block until a key is pressed on any keyboard and return its config
    // name. Returns "" on timeout or when no keyboard can be opened.
    // Must not be called while the listener is running.
    std::string capture_key(int timeout_ms);

private:
    void listen_thread();
    bool open_keyboards();
    void fire(int edge);

    struct Impl;
    std::unique_ptr<Impl> m_impl;

    std::thread      m_thread;
    std::atomic_bool m_running{false};
    HotkeyCallback   m_callback;
};
