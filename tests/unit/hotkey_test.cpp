#include <cassert>
#include <cstdio>
#include <linux/input.h>

#include "hotkey.h"

#include <vector>

static bool has_code(const hotkey_spec & spec, int code) {
    for (int c : spec.key_codes) {
        if (c == code) return true;
    }
    return false;
}

static void test_plain_keys() {
    hotkey_spec spec;
    assert(parse_hotkey("f12", spec));
    assert(spec.key_codes.size() == 1 && spec.key_codes[0] == KEY_F12);
    assert(spec.modmask == 0);
    assert(!spec.bare_modifier);

    assert(parse_hotkey("F1", spec) && spec.key_codes[0] == KEY_F1);
    assert(parse_hotkey("f13", spec) && spec.key_codes[0] == KEY_F13);
    assert(parse_hotkey("f24", spec) && spec.key_codes[0] == KEY_F24);
    assert(parse_hotkey("a", spec) && spec.key_codes[0] == KEY_A);
    assert(parse_hotkey("0", spec) && spec.key_codes[0] == KEY_0);
    assert(parse_hotkey("scroll_lock", spec) && spec.key_codes[0] == KEY_SCROLLLOCK);
    assert(parse_hotkey("media_previous", spec) && spec.key_codes[0] == KEY_PREVIOUSSONG);
}

static void test_f9_also_matches_previous_song() {
    hotkey_spec spec;
    assert(parse_hotkey("f9", spec));
    assert(spec.key_codes.size() == 2);
    assert(has_code(spec, KEY_F9));
    assert(has_code(spec, KEY_PREVIOUSSONG));
}

static void test_combinations() {
    hotkey_spec spec;
    assert(parse_hotkey("ctrl+period", spec));
    assert(spec.key_codes[0] == KEY_DOT);
    assert(spec.modmask == MOD_CTRL);

    assert(parse_hotkey("super + shift + v", spec));
    assert(spec.key_codes[0] == KEY_V);
    assert(spec.modmask == (MOD_SUPER | MOD_SHIFT));
}

static void test_bare_modifiers() {
    hotkey_spec spec;
    assert(parse_hotkey("alt", spec));
    assert(spec.bare_modifier);
    assert(has_code(spec, KEY_LEFTALT) && has_code(spec, KEY_RIGHTALT));

    assert(parse_hotkey("ctrl_r", spec));
    assert(spec.bare_modifier);
    assert(spec.key_codes.size() == 1 && spec.key_codes[0] == KEY_RIGHTCTRL);

    assert(parse_hotkey("alt_gr", spec) && spec.key_codes[0] == KEY_RIGHTALT);

    // A modifier key cannot itself take modifiers
    assert(!parse_hotkey("shift+alt_r", spec));
}

static void test_invalid_hotkeys_leave_output_alone() {
    hotkey_spec spec;
    assert(parse_hotkey("f10", spec));

    assert(!parse_hotkey("", spec));
    assert(!parse_hotkey("+", spec));
    assert(!parse_hotkey("f99", spec));
    assert(!parse_hotkey("notakey", spec));
    assert(!parse_hotkey("hyper+a", spec));

    assert(spec.key_codes.size() == 1 && spec.key_codes[0] == KEY_F10);
}

static void test_key_names() {
    assert(evdev_key_name(KEY_F9) == "f9");
    assert(evdev_key_name(KEY_F11) == "f11");
    assert(evdev_key_name(KEY_F20) == "f20");
    assert(evdev_key_name(KEY_Q) == "q");
    assert(evdev_key_name(KEY_7) == "7");
    assert(evdev_key_name(KEY_LEFTCTRL) == "ctrl_l");
    assert(evdev_key_name(KEY_SCROLLLOCK) == "scroll_lock");
    assert(evdev_key_name(KEY_PREVIOUSSONG) == "media_prev");
    assert(evdev_key_name(KEY_RESERVED) == "");

    // Captured names parse back to the same key
    const int codes[] = {KEY_F5, KEY_RIGHTALT, KEY_PAUSE, KEY_M};
    for (int code : codes) {
        hotkey_spec spec;
        assert(parse_hotkey(evdev_key_name(code), spec));
        assert(has_code(spec, code));
    }
}

static HotkeyMatcher matcher_for(const char * hotkey) {
    hotkey_spec spec;
    assert(parse_hotkey(hotkey, spec));
    return HotkeyMatcher(spec);
}

static void test_matcher_plain_key() {
    HotkeyMatcher m = matcher_for("f9");
    assert(m.feed(KEY_F9, 1) == HotkeyMatcher::DOWN);
    assert(m.feed(KEY_F9, 2) == HotkeyMatcher::NONE); // autorepeat
    assert(m.feed(KEY_F9, 1) == HotkeyMatcher::NONE);
    assert(m.active());
    assert(m.feed(KEY_F9, 0) == HotkeyMatcher::UP);
    assert(!m.active());

    // Laptop keyboards sending previous-song for F9
    assert(m.feed(KEY_PREVIOUSSONG, 1) == HotkeyMatcher::DOWN);
    assert(m.feed(KEY_PREVIOUSSONG, 0) == HotkeyMatcher::UP);

    // Other keys and stray releases do nothing
    assert(m.feed(KEY_A, 1) == HotkeyMatcher::NONE);
    assert(m.feed(KEY_F9, 0) == HotkeyMatcher::NONE);
}

static void test_matcher_needs_exact_modifiers() {
    HotkeyMatcher m = matcher_for("ctrl+period");
    assert(m.feed(KEY_DOT, 1) == HotkeyMatcher::NONE);
    assert(m.feed(KEY_DOT, 0) == HotkeyMatcher::NONE);

    assert(m.feed(KEY_RIGHTCTRL, 1) == HotkeyMatcher::NONE);
    assert(m.feed(KEY_LEFTSHIFT, 1) == HotkeyMatcher::NONE);
    assert(m.feed(KEY_DOT, 1) == HotkeyMatcher::NONE); // extra shift
    assert(m.feed(KEY_DOT, 0) == HotkeyMatcher::NONE);
    assert(m.feed(KEY_LEFTSHIFT, 0) == HotkeyMatcher::NONE);

    assert(m.feed(KEY_DOT, 1) == HotkeyMatcher::DOWN);
    assert(m.feed(KEY_DOT, 0) == HotkeyMatcher::UP);
}

static void test_matcher_modifier_release_ends_hold() {
    HotkeyMatcher m = matcher_for("super+shift+v");
    m.feed(KEY_LEFTMETA, 1);
    m.feed(KEY_RIGHTSHIFT, 1);
    assert(m.feed(KEY_V, 1) == HotkeyMatcher::DOWN);
    assert(m.feed(KEY_RIGHTSHIFT, 0) == HotkeyMatcher::UP);
    assert(m.feed(KEY_V, 0) == HotkeyMatcher::NONE);
}

static void test_matcher_bare_modifier() {
    HotkeyMatcher m = matcher_for("alt_r");
    assert(m.feed(KEY_LEFTALT, 1) == HotkeyMatcher::NONE);
    assert(m.feed(KEY_RIGHTALT, 1) == HotkeyMatcher::DOWN);
    assert(m.feed(KEY_LEFTALT, 0) == HotkeyMatcher::NONE);
    assert(m.feed(KEY_RIGHTALT, 0) == HotkeyMatcher::UP);
}

static void test_matcher_reset_releases() {
    HotkeyMatcher m = matcher_for("ctrl+space");
    m.feed(KEY_LEFTCTRL, 1);
    assert(m.feed(KEY_SPACE, 1) == HotkeyMatcher::DOWN);
    assert(m.reset() == HotkeyMatcher::UP);
    assert(m.reset() == HotkeyMatcher::NONE);

    // Ctrl is no longer considered held
    assert(m.feed(KEY_SPACE, 1) == HotkeyMatcher::NONE);
}

static void test_listener_stop_releases_held_hotkey() {
    std::vector<bool> edges;
    HotkeyListener l;
    l.set_callback([&edges](bool key_down) { edges.push_back(key_down); });
    assert(l.set_hotkey("f9"));

    l.on_key(KEY_F9, 1);
    assert(edges.size() == 1 && edges[0]);

    // Hotkey swapped mid-hold: the recording still gets its release
    l.stop();
    assert(edges.size() == 2 && !edges[1]);

    l.stop();
    assert(edges.size() == 2);
}

static void test_listener_stop_when_idle_is_silent() {
    int calls = 0;
    HotkeyListener l;
    l.set_callback([&calls](bool) { calls++; });
    assert(l.set_hotkey("ctrl+space"));

    l.on_key(KEY_SPACE, 1);
    l.on_key(KEY_SPACE, 0);
    l.stop();
    assert(calls == 0);
}

int main() {
    test_plain_keys();
    test_f9_also_matches_previous_song();
    test_combinations();
    test_bare_modifiers();
    test_invalid_hotkeys_leave_output_alone();
    test_key_names();
    test_matcher_plain_key();
    test_matcher_needs_exact_modifiers();
    test_matcher_modifier_release_ends_hold();
    test_matcher_bare_modifier();
    test_matcher_reset_releases();
    test_listener_stop_releases_held_hotkey();
    test_listener_stop_when_idle_is_silent();

    fprintf(stderr, "hotkey_test: ok\n");
    return 0;
}
