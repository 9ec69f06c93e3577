#include "hotkey.h"

#include <linux/input.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <unistd.h>
#include <fcntl.h>
#include <dirent.h>
#include <errno.h>
#include <sys/ioctl.h>

// Modifier keys, one bit each in HotkeyMatcher::m_held
static const struct {
    int          code;
    unsigned int flag;
} modifier_keys[] = {
    {KEY_LEFTCTRL,  MOD_CTRL},  {KEY_RIGHTCTRL,  MOD_CTRL},
    {KEY_LEFTSHIFT, MOD_SHIFT}, {KEY_RIGHTSHIFT, MOD_SHIFT},
    {KEY_LEFTALT,   MOD_ALT},   {KEY_RIGHTALT,   MOD_ALT},
    {KEY_LEFTMETA,  MOD_SUPER}, {KEY_RIGHTMETA,  MOD_SUPER},
};

// Bit for a modifier key, 0 for any other key
static unsigned int modifier_bit(int code) {
    for (size_t i = 0; i < sizeof(modifier_keys) / sizeof(modifier_keys[0]); i++) {
        if (modifier_keys[i].code == code) return 1u << i;
    }
    return 0;
}

static bool is_modifier(int code) {
    return modifier_bit(code) != 0;
}

unsigned int HotkeyMatcher::held_mods() const {
    unsigned int mods = 0;
    for (size_t i = 0; i < sizeof(modifier_keys) / sizeof(modifier_keys[0]); i++) {
        if (m_held & (1u << i)) mods |= modifier_keys[i].flag;
    }
    return mods;
}

HotkeyMatcher::edge HotkeyMatcher::feed(int code, int value) {
    if (value != 0 && value != 1) return NONE; // autorepeat

    const bool pressed = value == 1;
    if (const unsigned int bit = modifier_bit(code)) {
        m_held = pressed ? (m_held | bit) : (m_held & ~bit);
    }

    const bool target = std::find(m_spec.key_codes.begin(), m_spec.key_codes.end(), code) != m_spec.key_codes.end();
    if (target) {
        if (pressed && !m_active && (m_spec.bare_modifier || held_mods() == m_spec.modmask)) {
            m_active = true;
            return DOWN;
        }
        if (!pressed && m_active) {
            m_active = false;
            return UP;
        }
        return NONE;
    }

    // Letting go of a required modifier ends the hold
    if (!pressed && m_active && !m_spec.bare_modifier && is_modifier(code) &&
        (held_mods() & m_spec.modmask) != m_spec.modmask) {
        m_active = false;
        return UP;
    }
    return NONE;
}

HotkeyMatcher::edge HotkeyMatcher::reset() {
    m_held = 0;
    if (m_active) {
        m_active = false;
        return UP;
    }
    return NONE;
}

struct HotkeyListener::Impl {
    std::vector<int> fds; // keyboard devices
    HotkeyMatcher    matcher;

    void close_all_fds() {
        for (int fd : fds) {
            close(fd);
        }
        fds.clear();
    }
};

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

struct key_name {
    const char * name;
    int          code;
};

// First entry for a code is its canonical config name
static const key_name named_keys[] = {
    {"space",        KEY_SPACE},
    {"period",       KEY_DOT},        {"dot", KEY_DOT}, {".", KEY_DOT},
    {"comma",        KEY_COMMA},      {",", KEY_COMMA},
    {"slash",        KEY_SLASH},      {"/", KEY_SLASH},
    {"backslash",    KEY_BACKSLASH},  {"\\", KEY_BACKSLASH},
    {"semicolon",    KEY_SEMICOLON},  {";", KEY_SEMICOLON},
    {"apostrophe",   KEY_APOSTROPHE}, {"'", KEY_APOSTROPHE},
    {"grave",        KEY_GRAVE},      {"`", KEY_GRAVE},
    {"minus",        KEY_MINUS},      {"-", KEY_MINUS},
    {"equal",        KEY_EQUAL},      {"=", KEY_EQUAL},
    {"leftbrace",    KEY_LEFTBRACE},  {"[", KEY_LEFTBRACE},
    {"rightbrace",   KEY_RIGHTBRACE}, {"]", KEY_RIGHTBRACE},
    {"enter",        KEY_ENTER},      {"return", KEY_ENTER},
    {"tab",          KEY_TAB},
    {"backspace",    KEY_BACKSPACE},
    {"escape",       KEY_ESC},        {"esc", KEY_ESC},
    {"delete",       KEY_DELETE},     {"del", KEY_DELETE},
    {"insert",       KEY_INSERT},     {"ins", KEY_INSERT},
    {"home",         KEY_HOME},
    {"end",          KEY_END},
    {"pageup",       KEY_PAGEUP},
    {"pagedown",     KEY_PAGEDOWN},
    {"up",           KEY_UP},
    {"down",         KEY_DOWN},
    {"left",         KEY_LEFT},
    {"right",        KEY_RIGHT},
    {"capslock",     KEY_CAPSLOCK},
    {"print",        KEY_SYSRQ},      {"sysrq", KEY_SYSRQ},
    {"pause",        KEY_PAUSE},
    {"scroll_lock",  KEY_SCROLLLOCK}, {"scrolllock", KEY_SCROLLLOCK},
    {"media_prev",   KEY_PREVIOUSSONG}, {"media_previous", KEY_PREVIOUSSONG},
    {"media_next",   KEY_NEXTSONG},
    {"media_play",   KEY_PLAYPAUSE},  {"media_play_pause", KEY_PLAYPAUSE},
    // Modifiers, usable on their own as a hotkey
    {"ctrl_l",       KEY_LEFTCTRL},
    {"ctrl_r",       KEY_RIGHTCTRL},
    {"shift_l",      KEY_LEFTSHIFT},
    {"shift_r",      KEY_RIGHTSHIFT},
    {"alt_l",        KEY_LEFTALT},
    {"alt_r",        KEY_RIGHTALT},   {"alt_gr", KEY_RIGHTALT},
    {"super_l",      KEY_LEFTMETA},
    {"super_r",      KEY_RIGHTMETA},
};

// Evdev codes for a bare key name; empty if unknown
static std::vector<int> name_to_evdev(const std::string & name) {
    const std::string lower = to_lower(name);

    // Letters
    if (lower.size() == 1 && lower[0] >= 'a' && lower[0] <= 'z') {
        static const int letter_codes[] = {
            KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
            KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
            KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z
        };
        return {letter_codes[lower[0] - 'a']};
    }

    // Digits
    if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '9') {
        if (lower[0] == '0') return {KEY_0};
        return {KEY_1 + (lower[0] - '1')};
    }

    // Unqualified modifiers match either side
    if (lower == "ctrl" || lower == "control") return {KEY_LEFTCTRL, KEY_RIGHTCTRL};
    if (lower == "shift")                      return {KEY_LEFTSHIFT, KEY_RIGHTSHIFT};
    if (lower == "alt")                        return {KEY_LEFTALT, KEY_RIGHTALT};
    if (lower == "super" || lower == "meta")   return {KEY_LEFTMETA, KEY_RIGHTMETA};

    for (const auto & k : named_keys) {
        if (lower == k.name) return {k.code};
    }

    // F-keys: KEY_F1..KEY_F10 are contiguous (59-68), KEY_F11=87, KEY_F12=88,
    // KEY_F13..KEY_F24 are contiguous again (183-194)
    static_assert(KEY_F1 + 9 == KEY_F10, "F1-F10 evdev keycode layout assumption violated");
    static_assert(KEY_F13 + 11 == KEY_F24, "F13-F24 evdev keycode layout assumption violated");
    if (lower.size() >= 2 && lower[0] == 'f') {
        int n = 0;
        for (size_t i = 1; i < lower.size(); i++) {
            if (!isdigit((unsigned char)lower[i])) return {};
            n = n * 10 + (lower[i] - '0');
        }
        if (n >= 1 && n <= 10) {
            // Some laptops (HP) send the previous-song key for F9
            if (n == 9) return {KEY_F9, KEY_PREVIOUSSONG};
            return {KEY_F1 + (n - 1)};
        }
        if (n == 11) return {KEY_F11};
        if (n == 12) return {KEY_F12};
        if (n >= 13 && n <= 24) return {KEY_F13 + (n - 13)};
    }

    return {};
}

std::string evdev_key_name(int code) {
    if (code >= KEY_F1 && code <= KEY_F10) return "f" + std::to_string(code - KEY_F1 + 1);
    if (code == KEY_F11) return "f11";
    if (code == KEY_F12) return "f12";
    if (code >= KEY_F13 && code <= KEY_F24) return "f" + std::to_string(code - KEY_F13 + 13);

    for (char c = 'a'; c <= 'z'; c++) {
        std::vector<int> codes = name_to_evdev(std::string(1, c));
        if (codes.size() == 1 && codes[0] == code) return std::string(1, c);
    }
    for (char c = '0'; c <= '9'; c++) {
        std::vector<int> codes = name_to_evdev(std::string(1, c));
        if (codes.size() == 1 && codes[0] == code) return std::string(1, c);
    }

    for (const auto & k : named_keys) {
        if (k.code == code) return k.name;
    }
    return "";
}

bool parse_hotkey(const std::string & hotkey_str, hotkey_spec & out) {
    // Split on '+' to get parts
    std::vector<std::string> parts;
    std::istringstream ss(hotkey_str);
    std::string part;
    while (std::getline(ss, part, '+')) {
        while (!part.empty() && std::isspace((unsigned char)part.front())) part.erase(part.begin());
        while (!part.empty() && std::isspace((unsigned char)part.back()))  part.pop_back();
        if (!part.empty()) {
            parts.push_back(part);
        }
    }

    if (parts.empty()) {
        fprintf(stderr, "hotkey: empty hotkey string\n");
        return false;
    }

    // Last part is the key, rest are modifiers
    const std::string key_name = parts.back();
    unsigned int modmask = 0;

    for (size_t i = 0; i + 1 < parts.size(); i++) {
        const std::string mod_lower = to_lower(parts[i]);

        if (mod_lower == "ctrl" || mod_lower == "control") {
            modmask |= MOD_CTRL;
        } else if (mod_lower == "shift") {
            modmask |= MOD_SHIFT;
        } else if (mod_lower == "alt") {
            modmask |= MOD_ALT;
        } else if (mod_lower == "super" || mod_lower == "super_l" || mod_lower == "super_r" || mod_lower == "mod4" || mod_lower == "meta") {
            modmask |= MOD_SUPER;
        } else {
            fprintf(stderr, "hotkey: unknown modifier '%s'\n", parts[i].c_str());
            return false;
        }
    }

    std::vector<int> codes = name_to_evdev(key_name);
    if (codes.empty()) {
        fprintf(stderr, "hotkey: unknown key '%s'\n", key_name.c_str());
        return false;
    }

    const bool bare_modifier = is_modifier(codes.front());
    if (bare_modifier && modmask != 0) {
        fprintf(stderr, "hotkey: modifier '%s' cannot be combined with other modifiers\n", key_name.c_str());
        return false;
    }

    out.key_codes     = codes;
    out.modmask       = modmask;
    out.bare_modifier = bare_modifier;
    return true;
}

HotkeyListener::HotkeyListener()
    : m_impl(std::make_unique<Impl>()) {}

HotkeyListener::~HotkeyListener() {
    stop();
}

template <size_t N>
static bool test_bit(const unsigned long (&bits)[N], int bit) {
    const size_t per_word = 8 * sizeof(unsigned long);
    return (bits[bit / per_word] >> (bit % per_word)) & 1;
}

// A device that reports letter keys, as opposed to mice, power buttons,
// lid switches and the like
static bool is_keyboard(int fd) {
    const size_t per_word = 8 * sizeof(unsigned long);

    unsigned long evbits[EV_MAX / per_word + 1] = {};
    if (ioctl(fd, EVIOCGBIT(0, sizeof(evbits)), evbits) < 0 || !test_bit(evbits, EV_KEY)) {
        return false;
    }

    unsigned long keybits[KEY_MAX / per_word + 1] = {};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keybits)), keybits) < 0) {
        return false;
    }
    return test_bit(keybits, KEY_A);
}

bool HotkeyListener::open_keyboards() {
    // Also used to rescan after a device disappears
    m_impl->close_all_fds();

    DIR * dir = opendir("/dev/input");
    if (!dir) {
        fprintf(stderr, "hotkey: cannot open /dev/input: %s\n", strerror(errno));
        return false;
    }

    while (struct dirent * ent = readdir(dir)) {
        if (strncmp(ent->d_name, "event", 5) != 0) continue;

        const std::string path = std::string("/dev/input/") + ent->d_name;
        const int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;

        if (!is_keyboard(fd)) {
            close(fd);
            continue;
        }

        char name[256] = "?";
        if (ioctl(fd, EVIOCGNAME(sizeof(name)), name) < 0) {
            strcpy(name, "?");
        }
        fprintf(stderr, "hotkey: listening on %s (%s)\n", path.c_str(), name);
        m_impl->fds.push_back(fd);
    }

    closedir(dir);
    return !m_impl->fds.empty();
}

bool HotkeyListener::set_hotkey(const std::string & hotkey_str) {
    hotkey_spec spec;
    if (!parse_hotkey(hotkey_str, spec)) {
        return false;
    }
    m_impl->matcher = HotkeyMatcher(spec);

    fprintf(stderr, "hotkey: '%s' -> %zu key code(s), modmask=0x%x%s\n",
            hotkey_str.c_str(), spec.key_codes.size(), spec.modmask,
            spec.bare_modifier ? " (bare modifier)" : "");
    return true;
}

bool HotkeyListener::init(const std::string & hotkey_str) {
    if (!set_hotkey(hotkey_str)) {
        return false;
    }

    if (!open_keyboards()) {
        fprintf(stderr, "hotkey: no readable keyboard under /dev/input\n");
        fprintf(stderr, "hotkey: add yourself to the 'input' group and log in again:\n");
        fprintf(stderr, "hotkey:   sudo usermod -aG input $USER\n");
        return false;
    }
    return true;
}

bool HotkeyListener::start(HotkeyCallback callback) {
    if (m_running || m_impl->fds.empty()) return false;

    m_callback = std::move(callback);
    m_running  = true;
    m_thread   = std::thread(&HotkeyListener::listen_thread, this);
    return true;
}

void HotkeyListener::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }

    m_impl->close_all_fds();

    // A hold in progress ends with the listener, or its release is lost
    fire(m_impl->matcher.reset());
}

void HotkeyListener::on_key(int code, int value) {
    fire(m_impl->matcher.feed(code, value));
}

void HotkeyListener::fire(int edge) {
    if (edge != HotkeyMatcher::NONE && m_callback) {
        m_callback(edge == HotkeyMatcher::DOWN);
    }
}

std::string HotkeyListener::capture_key(int timeout_ms) {
    if (m_running) return "";
    if (!open_keyboards()) {
        fprintf(stderr, "hotkey: no keyboard devices found (are you in the 'input' group?)\n");
        return "";
    }

    std::string result;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (result.empty() && std::chrono::steady_clock::now() < deadline) {
        usleep(20000);

        for (size_t i = 0; i < m_impl->fds.size() && result.empty(); i++) {
            struct input_event ev;
            while (result.empty() && read(m_impl->fds[i], &ev, sizeof(ev)) == (ssize_t)sizeof(ev)) {
                if (ev.type != EV_KEY || ev.value != 1) continue;

                result = evdev_key_name(ev.code);
                if (result.empty()) {
                    fprintf(stderr, "hotkey: key code %d has no name, try another key\n", ev.code);
                }
            }
        }
    }

    m_impl->close_all_fds();
    return result;
}

void HotkeyListener::listen_thread() {
    bool lost_device = false;

    while (m_running) {
        if (lost_device) {
            // Held keys are unknown once a device goes away; a hold in
            // progress ends here
            fire(m_impl->matcher.reset());

            fprintf(stderr, "hotkey: input devices changed, rescanning\n");
            if (open_keyboards()) {
                lost_device = false;
                fprintf(stderr, "hotkey: %zu keyboard(s) after rescan\n", m_impl->fds.size());
            } else {
                fprintf(stderr, "hotkey: no keyboards after rescan, retrying in 5 s\n");
                for (int j = 0; j < 50 && m_running; j++) {
                    usleep(100000);
                }
            }
            continue;
        }

        // Sleep-and-drain rather than poll(): poll on evdev fds disturbs
        // SDL2's PipeWire capture thread
        usleep(20000);

        for (int fd : m_impl->fds) {
            struct input_event ev;
            ssize_t n;
            while ((n = read(fd, &ev, sizeof(ev))) == (ssize_t)sizeof(ev)) {
                if (ev.type == EV_KEY) {
                    on_key(ev.code, ev.value);
                }
            }
            if (n < 0 && (errno == EIO || errno == ENODEV)) {
                fprintf(stderr, "hotkey: keyboard on fd %d went away\n", fd);
                lost_device = true;
            }
        }
    }
}
