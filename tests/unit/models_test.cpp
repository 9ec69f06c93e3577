#include <cassert>
#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "models.h"

// Counts live instances so tests can see when a model is freed
struct FakeModel : public ModelHandle {
    explicit FakeModel(const std::string & id, int & live) : ModelHandle(id), m_live(live) { m_live++; }
    ~FakeModel() override { m_live--; }
    std::string transcribe(const std::vector<float> &, const decode_options &) override { return id(); }
    int & m_live;
};

static void test_registry() {
    const auto & models = available_models();
    assert(models.size() >= 8);

    bool has_default = false;
    for (const auto & m : models) {
        if (std::string(m.id) == DEFAULT_MODEL) has_default = true;
        assert(is_known_model(m.id));
    }
    assert(has_default);

    assert(is_known_model("moonshine-base"));
    assert(is_known_model("moonshine-tiny"));
    assert(model_engine_of("moonshine-base") == model_engine::moonshine);
    assert(model_engine_of("moonshine-tiny") == model_engine::moonshine);
    assert(model_engine_of("base.en") == model_engine::whisper);
    assert(model_engine_of("large-v3") == model_engine::whisper);
    assert(model_engine_of("/opt/ggml-custom.bin") == model_engine::whisper);

    assert(!is_known_model(""));
    assert(!is_known_model("moonshine-huge"));
    assert(!is_known_model("/nonexistent/ggml-custom.bin"));
}

static void test_model_path() {
    assert(model_path("/models", "base.en") == "/models/ggml-base.en.bin");
    assert(model_path("/models", "/opt/ggml-custom.bin") == "/opt/ggml-custom.bin");
    assert(model_path("/models", "moonshine-base") == "/models/sherpa-onnx-moonshine-base-en-int8");
    assert(model_path("/models", "moonshine-tiny") == "/models/sherpa-onnx-moonshine-tiny-en-int8");
    assert(!is_model_downloaded("/nonexistent", "tiny"));
    assert(!is_model_downloaded("/nonexistent", "moonshine-base"));
}

static void test_acquire_reuses_current_handle() {
    int live = 0;
    ModelCache cache([&live](const std::string & id) {
        return std::make_shared<FakeModel>(id, live);
    });

    assert(cache.current().empty());

    auto a = cache.acquire("base.en");
    auto b = cache.acquire("base.en");
    assert(a == b);
    assert(cache.load_count() == 1);
    assert(cache.current() == "base.en");
    assert(live == 1);
}

static void test_switch_frees_old_model_after_last_user() {
    int live = 0;
    ModelCache cache([&live](const std::string & id) {
        return std::make_shared<FakeModel>(id, live);
    });

    // A session still transcribing with the old model
    std::shared_ptr<ModelHandle> session = cache.acquire("base.en");

    auto small = cache.acquire("small.en");
    assert(cache.current() == "small.en");
    assert(small->id() == "small.en");
    assert(live == 2);

    // Switching back while the session holds base.en must not load a copy
    auto again = cache.acquire("base.en");
    assert(again == session);
    assert(cache.load_count() == 2);

    again.reset();
    small.reset();
    cache.acquire("tiny");
    assert(live == 2); // small.en freed, base.en still held by the session

    session.reset();
    assert(live == 1);
}

static void test_statuses_during_load() {
    int live = 0;
    ModelCache cache([&live](const std::string & id) {
        return std::make_shared<FakeModel>(id, live);
    });
    std::vector<std::string> lines;
    cache.set_status_callback([&lines](const std::string & msg) { lines.push_back(msg); });

    cache.acquire("tiny.en");
    assert(lines.size() == 2);
    assert(lines[0] == "Loading tiny.en...");
    assert(lines[1] == "Ready (tiny.en)");

    cache.acquire("tiny.en");
    assert(lines.size() == 2);
}

static void test_loader_failure_propagates() {
    ModelCache cache([](const std::string & id) -> std::shared_ptr<ModelHandle> {
        throw std::runtime_error("no such file: ggml-" + id + ".bin");
    });

    bool threw = false;
    try {
        cache.acquire("medium");
    } catch (const std::runtime_error & e) {
        threw = std::string(e.what()).find("ggml-medium.bin") != std::string::npos;
    }
    assert(threw);
    assert(cache.current().empty());
    assert(cache.load_count() == 0);
}

static void test_preload_loads_in_background() {
    int live = 0;
    ModelCache cache([&live](const std::string & id) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::make_shared<FakeModel>(id, live);
    });

    cache.preload("small");

    // A blocking acquire waits for the preload instead of loading twice
    auto h = cache.acquire("small");
    assert(h->id() == "small");
    assert(cache.load_count() == 1);
}

static void test_preload_failure_is_reported() {
    std::vector<std::string> lines;
    {
        ModelCache cache([](const std::string &) -> std::shared_ptr<ModelHandle> {
            throw std::runtime_error("out of memory");
        });
        cache.set_status_callback([&lines](const std::string & msg) { lines.push_back(msg); });

        cache.preload("large-v3");
        cache.preload("large-v3"); // joins the first attempt
    } // and the destructor joins the second

    bool reported = false;
    for (const auto & l : lines) {
        if (l.find("Failed to load large-v3") != std::string::npos) reported = true;
    }
    assert(reported);
    assert(lines.back() == "Failed to load large-v3: out of memory");
}

static void test_engine_loader_dispatches_on_engine() {
    int live = 0;
    std::vector<std::string> whisper_ids;
    std::vector<std::string> moonshine_ids;

    ModelCache::Loader loader = engine_loader(
        [&](const std::string & id) { whisper_ids.push_back(id); return std::make_shared<FakeModel>(id, live); },
        [&](const std::string & id) { moonshine_ids.push_back(id); return std::make_shared<FakeModel>(id, live); });

    loader("moonshine-base");
    loader("base.en");
    loader("/opt/ggml-custom.bin");
    loader("moonshine-tiny");

    assert(moonshine_ids.size() == 2);
    assert(moonshine_ids[0] == "moonshine-base" && moonshine_ids[1] == "moonshine-tiny");
    assert(whisper_ids.size() == 2);
    assert(whisper_ids[0] == "base.en" && whisper_ids[1] == "/opt/ggml-custom.bin");
}

static void test_engine_loader_without_engine_throws() {
    int live = 0;
    ModelCache cache(engine_loader(
        [&live](const std::string & id) { return std::make_shared<FakeModel>(id, live); },
        nullptr));

    bool threw = false;
    try {
        cache.acquire("moonshine-base");
    } catch (const std::runtime_error & e) {
        threw = std::string(e.what()).find("moonshine") != std::string::npos;
    }
    assert(threw);
    assert(cache.load_count() == 0);

    // Whisper models still load
    assert(cache.acquire("tiny")->id() == "tiny");
}

int main() {
    test_registry();
    test_model_path();
    test_acquire_reuses_current_handle();
    test_switch_frees_old_model_after_last_user();
    test_statuses_during_load();
    test_loader_failure_propagates();
    test_preload_loads_in_background();
    test_preload_failure_is_reported();
    test_engine_loader_dispatches_on_engine();
    test_engine_loader_without_engine_throws();

    fprintf(stderr, "models_test: ok\n");
    return 0;
}
