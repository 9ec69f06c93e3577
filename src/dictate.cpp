// Push-to-talk dictation daemon for Linux
//
// Hold the hotkey and speak; on release the audio is transcribed with
// whisper.cpp or Moonshine and pasted into the focused window.
//
#include "whisper.h"
#include "ggml-backend.h"

#include "config.h"
#include "controller.h"
#include "event-queue.h"
#include "hotkey.h"
#include "model-transcriber.h"
#include "models.h"
#include "notifier.h"
#include "paste-sink.h"
#include "run-cmd.h"
#include "sdl-capture.h"
#include "status.h"
#include "whisper-model.h"
#if WHISPER_DICTATE_HAS_SHERPA_ONNX
#include "moonshine-model.h"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>
#include <fcntl.h>
#include <sys/file.h>

static_assert(std::atomic<bool>::is_always_lock_free,
              "std::atomic<bool> must be lock-free for signal handler safety");

// How long --set-hotkey waits for a key
static constexpr int CAPTURE_KEY_TIMEOUT_MS = 10000;

// command-line parameters
struct dictate_params {
    std::string    config_path = ConfigStore::default_path();
    dictate_config cfg         = default_config();

    // one-shot actions
    bool        list_models    = false;
    bool        list_devices   = false;
    bool        capture_hotkey = false;
    std::string set_model;

    // language given with -l; config file languages were checked on load
    bool        cli_language   = false;

    // daemon
    bool        daemonize      = false;
};

static bool parse_int(const char * s, int32_t & out) {
    try {
        size_t pos = 0;
        out = std::stoi(s, &pos);
        if (pos != strlen(s)) {
            fprintf(stderr, "error: invalid integer '%s'\n", s);
            return false;
        }
        return true;
    } catch (const std::logic_error &) {
        fprintf(stderr, "error: invalid integer '%s'\n", s);
        return false;
    }
}

static void dictate_print_usage(int /*argc*/, char ** argv, const dictate_params & params) {
    const dictate_config & cfg = params.cfg;
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "options (override %s for this run):\n", params.config_path.c_str());
    fprintf(stderr, "  -h,       --help              show this help message and exit\n");
    fprintf(stderr, "            --config FNAME       config file\n");
    fprintf(stderr, "  -m ID,    --model ID      [%-7s] model id or ggml .bin path\n",          cfg.model.c_str());
    fprintf(stderr, "  -t N,     --threads N     [%-7d] number of threads\n",                    cfg.n_threads);
    fprintf(stderr, "  -l LANG,  --language LANG [%-7s] spoken language\n",                      cfg.language.c_str());
    fprintf(stderr, "  -c ID,    --capture ID    [%-7d] capture device ID\n",                    cfg.capture_id);
    fprintf(stderr, "  -ng,      --no-gpu            disable GPU inference\n");
    fprintf(stderr, "  -fa,      --flash-attn        enable flash attention\n");
    fprintf(stderr, "  -nfa,     --no-flash-attn     disable flash attention\n");
    fprintf(stderr, "  -tr,      --translate         translate to English\n");
    fprintf(stderr, "            --hotkey KEY    [%-7s] push-to-talk hotkey\n",                   cfg.hotkey.c_str());
    fprintf(stderr, "            --paste-command C [%s] xdotool keys, 'auto' or 'type'\n",      cfg.paste_command.c_str());
    fprintf(stderr, "            --no-auto-paste      copy to clipboard only\n");
    fprintf(stderr, "            --min-record-ms N[%-6d] shorter recordings are dropped\n",     cfg.min_record_ms);
    fprintf(stderr, "            --max-record-ms N[%-6d] max recording time (ms)\n",            cfg.max_record_ms);
    fprintf(stderr, "            --type-delay-ms N[%-6d] keystroke delay for 'type' (ms)\n",    cfg.type_delay_ms);
    fprintf(stderr, "            --daemon             run as background daemon\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "actions:\n");
    fprintf(stderr, "            --list-models        list known models and exit\n");
    fprintf(stderr, "            --list-devices       list capture devices and exit\n");
    fprintf(stderr, "            --set-model ID       switch model and save it to the config\n");
    fprintf(stderr, "            --set-hotkey         press a key to make it the hotkey, save and exit\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "signals: USR1 toggles recording, HUP reloads the config file\n");
    fprintf(stderr, "\n");
}

// Applies command-line overrides on top of params.cfg
static bool dictate_params_parse(int argc, char ** argv, dictate_params & params) {
    dictate_config & cfg = params.cfg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // Helper: check that a value argument exists
        auto next_arg = [&]() -> const char * {
            if (++i >= argc) {
                fprintf(stderr, "error: missing value for %s\n", arg.c_str());
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "-h" || arg == "--help") {
            dictate_print_usage(argc, argv, params);
            exit(0);
        }
        else if (                 arg == "--config")         { auto v = next_arg(); if (!v) return false; params.config_path = v; }
        else if (arg == "-m"   || arg == "--model")          { auto v = next_arg(); if (!v) return false; cfg.model           = v; }
        else if (arg == "-t"   || arg == "--threads")        { auto v = next_arg(); if (!v || !parse_int(v, cfg.n_threads))     return false; }
        else if (arg == "-l"   || arg == "--language")       { auto v = next_arg(); if (!v) return false; cfg.language        = v; params.cli_language = true; }
        else if (arg == "-c"   || arg == "--capture")        { auto v = next_arg(); if (!v || !parse_int(v, cfg.capture_id))    return false; }
        else if (arg == "-ng"  || arg == "--no-gpu")         { cfg.use_gpu    = false; }
        else if (arg == "-fa"  || arg == "--flash-attn")     { cfg.flash_attn = true; }
        else if (arg == "-nfa" || arg == "--no-flash-attn")  { cfg.flash_attn = false; }
        else if (arg == "-tr"  || arg == "--translate")      { cfg.translate  = true; }
        else if (                 arg == "--hotkey")         { auto v = next_arg(); if (!v) return false; cfg.hotkey          = v; }
        else if (                 arg == "--paste-command")  { auto v = next_arg(); if (!v) return false; cfg.paste_command   = v; }
        else if (                 arg == "--no-auto-paste")  { cfg.auto_paste = false; }
        else if (                 arg == "--min-record-ms")  { auto v = next_arg(); if (!v || !parse_int(v, cfg.min_record_ms)) return false; }
        else if (                 arg == "--max-record-ms")  { auto v = next_arg(); if (!v || !parse_int(v, cfg.max_record_ms)) return false; }
        else if (                 arg == "--type-delay-ms")  { auto v = next_arg(); if (!v || !parse_int(v, cfg.type_delay_ms)) return false; }
        else if (                 arg == "--daemon")         { params.daemonize      = true; }
        else if (                 arg == "--list-models")    { params.list_models    = true; }
        else if (                 arg == "--list-devices")   { params.list_devices   = true; }
        else if (                 arg == "--set-model")      { auto v = next_arg(); if (!v) return false; params.set_model = v; }
        else if (                 arg == "--set-hotkey")     { params.capture_hotkey = true; }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            dictate_print_usage(argc, argv, params);
            exit(1);
        }
    }
    return true;
}

// Language codes whisper.cpp knows, plus "auto"
static bool is_known_language(const std::string & lang) {
    return lang == "auto" || whisper_lang_id(lang.c_str()) != -1;
}

// Command-line values are checked strictly; config file values were
// already replaced by defaults when invalid
static bool dictate_params_validate(const dictate_params & params) {
    const dictate_config & cfg = params.cfg;

    if (!is_known_model(cfg.model)) {
        fprintf(stderr, "error: unknown model '%s' (see --list-models)\n", cfg.model.c_str());
        return false;
    }
    hotkey_spec spec;
    if (!parse_hotkey(cfg.hotkey, spec)) {
        return false;
    }
    if (params.cli_language && !is_known_language(cfg.language)) {
        fprintf(stderr, "error: unknown language '%s'\n", cfg.language.c_str());
        return false;
    }
    if (cfg.n_threads < 1) {
        fprintf(stderr, "error: threads must be >= 1\n");
        return false;
    }
    if (cfg.min_record_ms < 0 || cfg.max_record_ms <= cfg.min_record_ms) {
        fprintf(stderr, "error: need 0 <= min-record-ms < max-record-ms\n");
        return false;
    }
    if (cfg.paste_command.empty()) {
        fprintf(stderr, "error: empty paste command\n");
        return false;
    }
    return true;
}

static model_load_params to_load_params(const dictate_config & cfg) {
    model_load_params lp;
    lp.models_dir = cfg.models_dir;
    lp.n_threads  = cfg.n_threads;
    lp.use_gpu    = cfg.use_gpu;
    lp.flash_attn = cfg.flash_attn;
    return lp;
}

static decode_options to_decode_options(const dictate_config & cfg) {
    decode_options opts;
    opts.language  = cfg.language;
    opts.translate = cfg.translate;
    opts.n_threads = cfg.n_threads;
    return opts;
}

static session_options to_session_options(const dictate_config & cfg) {
    session_options opts;
    opts.model         = cfg.model;
    opts.auto_paste    = cfg.auto_paste;
    opts.paste_command = cfg.paste_command;
    opts.min_record_ms = cfg.min_record_ms;
    opts.max_record_ms = cfg.max_record_ms;
    opts.sample_rate   = DICTATE_SAMPLE_RATE;
    return opts;
}

static bool engine_built_in(model_engine engine) {
#if WHISPER_DICTATE_HAS_SHERPA_ONNX
    (void)engine;
    return true;
#else
    return engine != model_engine::moonshine;
#endif
}

static void print_models(const dictate_config & cfg) {
    printf("models in %s:\n", cfg.models_dir.c_str());
    for (const auto & m : available_models()) {
        const bool current    = cfg.model == m.id;
        const bool downloaded = is_model_downloaded(cfg.models_dir, m.id);
        printf("  %c %-15s %-10s %-7s %-10s %-22s %s\n", current ? '*' : ' ', m.id, model_engine_name(m.engine),
               m.ram, m.speed, m.accuracy, downloaded ? "downloaded" : "-");
    }
}

static std::atomic<bool> g_running(true);
static std::atomic<bool> g_sigusr1(false);
static std::atomic<bool> g_sighup(false);

static void signal_handler(int /*sig*/) {
    g_running = false;
}

static void sigusr1_handler(int /*sig*/) {
    g_sigusr1 = true;
}

static void sighup_handler(int /*sig*/) {
    g_sighup = true;
}

int main(int argc, char ** argv) {
    ggml_backend_load_all();

    // --config must be known before the file is read
    dictate_params params;
    for (int i = 1; i + 1 < argc; i++) {
        if (strcmp(argv[i], "--config") == 0) {
            params.config_path = argv[i + 1];
        }
    }

    ConfigStore store(params.config_path, is_known_language);
    params.cfg = store.load();

    if (!dictate_params_parse(argc, argv, params)) {
        return 1;
    }

    if (params.list_models) {
        print_models(params.cfg);
        return 0;
    }

    if (params.list_devices) {
        return SdlAudioCapture::list_devices() ? 0 : 3;
    }

    if (params.capture_hotkey) {
        HotkeyListener capture;
        fprintf(stderr, "press the key to use as hotkey (%d s)...\n", CAPTURE_KEY_TIMEOUT_MS / 1000);
        const std::string name = capture.capture_key(CAPTURE_KEY_TIMEOUT_MS);
        if (name.empty()) {
            fprintf(stderr, "error: no key captured\n");
            return 1;
        }
        if (!store.set("hotkey", name)) {
            return 1;
        }
        printf("hotkey set to %s\n", name.c_str());
        return 0;
    }

    if (!params.set_model.empty()) {
        if (!is_known_model(params.set_model)) {
            fprintf(stderr, "error: unknown model '%s' (see --list-models)\n", params.set_model.c_str());
            return 1;
        }
        if (!store.set("model", params.set_model)) {
            return 1;
        }
        params.cfg.model = params.set_model;
        fprintf(stderr, "model switched to %s\n", params.set_model.c_str());
    }

    if (!dictate_params_validate(params)) {
        return 1;
    }

    if (!engine_built_in(model_engine_of(params.cfg.model))) {
        fprintf(stderr, "warning: built without sherpa-onnx, %s cannot load; pick a whisper model with --set-model\n",
                params.cfg.model.c_str());
    }

    // Check runtime dependencies
    if (!have_program("xclip")) {
        fprintf(stderr, "error: xclip not found. Install with: sudo apt install xclip\n");
        return 1;
    }
    if (params.cfg.auto_paste && !have_program("xdotool")) {
        fprintf(stderr, "error: xdotool not found. Install with: sudo apt install xdotool\n");
        return 1;
    }

    // Single-instance lock
    int lock_fd = open("/tmp/whisper-dictate.lock", O_CREAT | O_RDWR, 0600);
    if (lock_fd >= 0) {
        if (flock(lock_fd, LOCK_EX | LOCK_NB) != 0) {
            fprintf(stderr, "error: another whisper-dictate instance is already running\n");
            close(lock_fd);
            return 1;
        }
        // Keep lock_fd open for the lifetime of the process
    }

    // Daemonize before any SDL/X11 init
    if (params.daemonize) {
        pid_t pid = fork();
        if (pid < 0) {
            perror("fork");
            return 1;
        }
        if (pid > 0) {
            // Parent: print child PID and exit
            printf("%d\n", pid);
            return 0;
        }
        setsid();
        if (chdir("/") != 0) {
            perror("chdir");
        }
        if (!freopen("/dev/null", "r", stdin)) {
            perror("freopen stdin");
        }
        if (!freopen("/dev/null", "w", stdout)) {
            perror("freopen stdout");
        }
        // Keep stderr for logging
    }

    signal(SIGINT,  signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGUSR1, sigusr1_handler);
    signal(SIGHUP,  sighup_handler);

    StatusView status;
    status.set_hotkey(params.cfg.hotkey);
    status.set_model(params.cfg.model);

    // Model handles, loaded in the background so startup is instant
    std::mutex        load_mutex;
    model_load_params load_params = to_load_params(params.cfg);

    auto current_load_params = [&]() {
        std::lock_guard<std::mutex> lock(load_mutex);
        return load_params;
    };

    ModelCache cache(engine_loader(
        [&](const std::string & model_id) {
            return load_whisper_model(current_load_params(), model_id);
        },
#if WHISPER_DICTATE_HAS_SHERPA_ONNX
        [&](const std::string & model_id) {
            return load_moonshine_model(current_load_params(), model_id);
        }
#else
        nullptr
#endif
    ));
    cache.set_status_callback([&status](const std::string & msg) { status.on_model_status(msg); });
    cache.preload(params.cfg.model);

    ModelTranscriber transcriber(cache, to_decode_options(params.cfg));

    // Audio keeps running from here on; recordings are windows over it
    SdlAudioCapture audio;
    if (!audio.init(params.cfg.capture_id, DICTATE_SAMPLE_RATE, params.cfg.max_record_ms)) {
        fprintf(stderr, "error: audio.init() failed\n");
        return 3;
    }

    XdotoolPasteSink paste;
    paste.set_type_delay_ms(params.cfg.type_delay_ms);

    NotifySendNotifier notifier("whisper-dictate");

    EventQueue queue;
    DictationController controller(queue, audio, transcriber, paste, notifier, to_session_options(params.cfg));
    controller.set_state_callback([&status](dictate_state state) { status.on_state(state); });

    // Hotkey thread -> event queue -> controller
    HotkeyListener hotkey;
    auto start_hotkey = [&](const std::string & hotkey_str) -> bool {
        if (!hotkey.init(hotkey_str)) {
            fprintf(stderr, "warning: hotkey unavailable (see above for details)\n");
            return false;
        }
        bool ok = hotkey.start([&queue, &controller](bool key_down) {
            // Stamped here: the queue may be busy pasting when it runs
            const auto at = std::chrono::steady_clock::now();
            queue.post([&controller, key_down, at]() {
                if (key_down) {
                    controller.on_hotkey_down(at);
                } else {
                    controller.on_hotkey_up();
                }
            });
        });
        if (!ok) {
            fprintf(stderr, "warning: failed to start hotkey listener\n");
        }
        return ok;
    };

    bool hotkey_ok = start_hotkey(params.cfg.hotkey);
    if (!hotkey_ok) {
        fprintf(stderr, "\n");
        fprintf(stderr, "  Hotkey disabled. You can still toggle recording with:\n");
        fprintf(stderr, "    kill -USR1 %d\n", (int)getpid());
        fprintf(stderr, "\n");
        fprintf(stderr, "  To enable the hotkey, add yourself to the 'input' group:\n");
        fprintf(stderr, "    sudo usermod -aG input $USER\n");
        fprintf(stderr, "  Then log out and back in.\n");
    }

    auto reload = [&]() {
        fprintf(stderr, "[reloading %s]\n", store.path().c_str());

        dictate_params fresh;
        fresh.config_path = params.config_path;
        fresh.cfg = store.load();
        if (!dictate_params_parse(argc, argv, fresh) || !dictate_params_validate(fresh)) {
            fprintf(stderr, "[reload rejected, keeping current settings]\n");
            return;
        }

        const dictate_config old = params.cfg;
        params.cfg = fresh.cfg;

        {
            std::lock_guard<std::mutex> lock(load_mutex);
            load_params = to_load_params(params.cfg);
        }
        transcriber.set_options(to_decode_options(params.cfg));
        controller.set_options(to_session_options(params.cfg));
        paste.set_type_delay_ms(params.cfg.type_delay_ms);

        if (params.cfg.model != old.model) {
            status.set_model(params.cfg.model);
            notifier.notify(notify_level::info, "Switching Model", "Loading " + params.cfg.model + "...", 2000);
            cache.preload(params.cfg.model);
        }

        if (params.cfg.hotkey != old.hotkey) {
            // Releases a hold in progress, so a recording ends normally
            hotkey.stop();
            hotkey_ok = start_hotkey(params.cfg.hotkey);
            status.set_hotkey(params.cfg.hotkey);
            if (hotkey_ok) {
                notifier.notify(notify_level::info, "Hotkey Changed", "New hotkey: " + params.cfg.hotkey, 2000);
            }
        }
    };

    fprintf(stderr, "\n");
    fprintf(stderr, "whisper-dictate:\n");
    fprintf(stderr, "  config     = %s\n", store.path().c_str());
    fprintf(stderr, "  model      = %s (%s)\n", params.cfg.model.c_str(), model_engine_name(model_engine_of(params.cfg.model)));
    fprintf(stderr, "  language   = %s\n", params.cfg.language.c_str());
    fprintf(stderr, "  threads    = %d\n", params.cfg.n_threads);
    fprintf(stderr, "  hotkey     = %s%s\n", params.cfg.hotkey.c_str(), hotkey_ok ? "" : " (UNAVAILABLE)");
    fprintf(stderr, "  auto-paste = %s (%s)\n", params.cfg.auto_paste ? "yes" : "no", params.cfg.paste_command.c_str());
    fprintf(stderr, "  pid        = %d\n", (int)getpid());
    fprintf(stderr, "\n");

    if (hotkey_ok) {
        fprintf(stderr, "[ready] hold %s to record (or kill -USR1 %d)\n", params.cfg.hotkey.c_str(), (int)getpid());
    } else {
        fprintf(stderr, "[ready] send: kill -USR1 %d\n", (int)getpid());
    }

    while (g_running) {
        queue.dispatch(std::chrono::milliseconds(50));

        if (g_sigusr1.exchange(false)) {
            controller.toggle();
        }
        if (g_sighup.exchange(false)) {
            reload();
        }
        controller.on_tick();
    }

    // Cleanup
    hotkey.stop();

    fprintf(stderr, "\nwhisper-dictate: exiting\n");

    return 0;
}
