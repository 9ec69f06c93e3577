#include <cassert>
#include <cstdio>

#include "paste-sink.h"

static void test_terminal_classes() {
    assert(XdotoolPasteSink::is_terminal_class("Alacritty"));
    assert(XdotoolPasteSink::is_terminal_class("gnome-terminal-server"));
    assert(XdotoolPasteSink::is_terminal_class("kitty"));
    assert(XdotoolPasteSink::is_terminal_class("XTerm"));

    assert(!XdotoolPasteSink::is_terminal_class("firefox"));
    assert(!XdotoolPasteSink::is_terminal_class("code"));
    assert(!XdotoolPasteSink::is_terminal_class(""));
}

static void test_explicit_command_is_sent_as_is() {
    assert(XdotoolPasteSink::resolve_keys("ctrl+shift+v", "firefox") == "ctrl+shift+v");
    assert(XdotoolPasteSink::resolve_keys("ctrl+v", "kitty") == "ctrl+v");
    assert(XdotoolPasteSink::resolve_keys("shift+Insert", "") == "shift+Insert");
}

static void test_auto_follows_focused_window() {
    assert(XdotoolPasteSink::resolve_keys(PASTE_COMMAND_AUTO, "Alacritty") == "ctrl+shift+v");
    assert(XdotoolPasteSink::resolve_keys(PASTE_COMMAND_AUTO, "firefox") == "ctrl+v");
    assert(XdotoolPasteSink::resolve_keys(PASTE_COMMAND_AUTO, "") == "ctrl+v");
    assert(XdotoolPasteSink::resolve_keys("", "konsole") == "ctrl+shift+v");
}

static void test_type_sends_no_keys() {
    assert(XdotoolPasteSink::resolve_keys(PASTE_COMMAND_TYPE, "kitty").empty());
}

int main() {
    test_terminal_classes();
    test_explicit_command_is_sent_as_is();
    test_auto_follows_focused_window();
    test_type_sends_no_keys();

    fprintf(stderr, "paste_sink_test: ok\n");
    return 0;
}
