#pragma once

#include "controller.h"

#include <cstdio>
#include <mutex>
#include <string>

// Status line for a state, as a tray tooltip would show it
std::string status_text(dictate_state state, const std::string & model, const std::string & hotkey);

// Presentation only: prints the status line on every controller
// transition, model load progress and configuration change.
class StatusView {
public:
    explicit StatusView(FILE * out = stderr) : m_out(out) {}

    void on_state(dictate_state state);

    // Model loading progress ("Loading base.en...")
    void on_model_status(const std::string & msg);

    void set_model(const std::string & model);
    void set_hotkey(const std::string & hotkey);

    std::string text() const;

private:
    void print_locked();

    FILE *             m_out;
    mutable std::mutex m_mutex;
    dictate_state      m_state = dictate_state::IDLE;
    std::string        m_model;
    std::string        m_hotkey;
};
