#include "status.h"

#include <algorithm>
#include <cctype>

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    return s;
}

std::string status_text(dictate_state state, const std::string & model, const std::string & hotkey) {
    const std::string key = to_upper(hotkey);
    switch (state) {
        case dictate_state::IDLE:         return "Ready - " + model + " (hold " + key + ")";
        case dictate_state::RECORDING:    return "Recording... (release " + key + ")";
        case dictate_state::TRANSCRIBING: return "Transcribing with " + model + "...";
    }
    return "";
}

void StatusView::on_state(dictate_state state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = state;
    print_locked();
}

void StatusView::on_model_status(const std::string & msg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    fprintf(m_out, "[status] %s\n", msg.c_str());
}

void StatusView::set_model(const std::string & model) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_model == model) return;
    m_model = model;
    print_locked();
}

void StatusView::set_hotkey(const std::string & hotkey) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_hotkey == hotkey) return;
    m_hotkey = hotkey;
    print_locked();
}

std::string StatusView::text() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return status_text(m_state, m_model, m_hotkey);
}

void StatusView::print_locked() {
    fprintf(m_out, "[status] %s\n", status_text(m_state, m_model, m_hotkey).c_str());
    fflush(m_out);
}
