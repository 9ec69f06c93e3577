#pragma once

#include <string>

// Timeout for subprocess calls (xclip, xdotool, notify-send)
static constexpr int CMD_TIMEOUT_MS = 5000;

// Run a command with explicit argv (no shell involved).
// Optionally writes stdin_data to the child's stdin.
// Optionally captures child's stdout into stdout_data.
// Returns child exit status, or -1 on error/timeout.
int run_cmd(const char * const argv[], int timeout_ms,
            const std::string * stdin_data = nullptr,
            std::string * stdout_data = nullptr);

// True if `prog` resolves on PATH ('command -v', POSIX)
bool have_program(const char * prog);

// Strip trailing '\n' / '\r'
void chomp(std::string & s);
