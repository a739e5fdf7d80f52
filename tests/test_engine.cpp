#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "common/hash.hpp"
#include "engine/engine.hpp"

#include <filesystem>
#include <thread>

using namespace arbor;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<const Observer> constant(const std::string& name, const Symbol& symbol) {
    return std::make_shared<FunctionObserver>(
        name, binaryAlphabet(), [symbol](const InformationUnit&) { return symbol; });
}

ObserverSet defaultObservers() {
    return {
        std::make_shared<ContainsObserver>("hello"),
        constant("never", "0"),
        std::make_shared<SeededObserver>("coin", binaryAlphabet(), 17),
    };
}

} // namespace

// ─── Submit ────────────────────────────────────────────────────

TEST(EngineTest, SubmitRunsThePipeline) {
    Engine engine;
    SubmitResult r = engine.submit("hello hello world", defaultObservers());

    EXPECT_EQ(r.emit.representative().value(), "hello");
    EXPECT_EQ(r.emit.cause, CollapseCause::FORCED);
    ASSERT_EQ(r.key.key.size(), 3u);
    EXPECT_EQ(r.key.key.substr(0, 2), "10");
    EXPECT_EQ(r.key.unit.kind(), UnitKind::COMBINED);

    EXPECT_EQ(r.name, Engine::defaultName(fnv1a64("hello hello world")));
    EXPECT_EQ(r.name.rfind("observation/", 0), 0u);
    EXPECT_EQ(r.name.size(), std::string("observation/").size() + 16);

    MemoryEntry e = engine.store().get(r.name);
    ASSERT_EQ(e.history.size(), 1u);
    EXPECT_NE(e.history[0].text.find("key=" + r.key.key), std::string::npos);
    EXPECT_NE(e.history[0].text.find("emit=hello"), std::string::npos);

    // The context is archived, not left live.
    EXPECT_EQ(engine.pipeline().liveCount(), 0u);
    EXPECT_TRUE(engine.pipeline().getResult(r.emit.context_id).has_value());
}

TEST(EngineTest, SubmitIsRepeatable) {
    Engine engine;
    SubmitResult a = engine.submit("hello there", defaultObservers());
    SubmitResult b = engine.submit("hello there", defaultObservers());

    EXPECT_EQ(a.key.key, b.key.key);
    EXPECT_EQ(a.name, b.name);
    // Same name, appended twice.
    EXPECT_EQ(engine.store().get(a.name).history.size(), 2u);
}

TEST(EngineTest, NamedSubmitWithParent) {
    Engine engine;
    SubmitOptions root;
    root.name = "sessions/42";
    engine.submit("session opened", defaultObservers(), root);

    SubmitOptions child;
    child.name = "sessions/42/event-1";
    child.parent = std::string("sessions/42");
    SubmitResult r = engine.submit("hello from the event", defaultObservers(), child);

    EXPECT_EQ(r.name, "sessions/42/event-1");
    EXPECT_EQ(engine.store().listChildren("sessions/42"),
              (std::set<std::string>{"sessions/42/event-1"}));
    EXPECT_TRUE(engine.store().verifyIntegrity().empty());
}

TEST(EngineTest, KeywordsSteerTheEmit) {
    Engine engine;
    SubmitOptions plain;
    plain.name = "plain";
    EXPECT_EQ(engine.submit("calm alert", defaultObservers(), plain)
                  .emit.representative().value(), "calm");

    SubmitOptions keyed;
    keyed.name = "keyed";
    keyed.keywords = {"ALERT"};
    EXPECT_EQ(engine.submit("calm alert", defaultObservers(), keyed)
                  .emit.representative().value(), "alert");
}

TEST(EngineTest, SourceIdentitySetsDefaultName) {
    Engine engine;
    SubmitOptions opts;
    opts.source = "sensor-9";
    SubmitResult r = engine.submit("reading 12", defaultObservers(), opts);
    EXPECT_EQ(r.name, Engine::defaultName(fnv1a64("sensor-9")));
}

// ─── Failures ──────────────────────────────────────────────────

TEST(EngineTest, ObserverFailurePersistsNothing) {
    Engine engine;
    ObserverSet observers = {
        constant("ok", "1"),
        std::make_shared<FunctionObserver>(
            "broken", binaryAlphabet(),
            [](const InformationUnit&) -> Symbol { throw std::runtime_error("offline"); }),
    };

    EXPECT_THROW(engine.submit("hello world", observers), std::runtime_error);
    EXPECT_EQ(engine.store().size(), 0u);
    EXPECT_EQ(engine.pipeline().liveCount(), 0u);
    EXPECT_EQ(engine.pipeline().stats().cancelled, 1u);
}

TEST(EngineTest, BadInputPersistsNothing) {
    Engine engine;
    EXPECT_THROW(engine.submit("   ", defaultObservers()), InvalidInputError);
    EXPECT_THROW(engine.submit("hello", {}), InvalidObserverError);
    EXPECT_THROW(engine.submit("caf\xe9 hello", defaultObservers()), InvalidInputError);
    EXPECT_EQ(engine.pipeline().stats().created, 0u);
    EXPECT_EQ(engine.store().size(), 0u);
}

TEST(EngineTest, LineageErrorCancelsContext) {
    Engine engine;
    SubmitOptions opts;
    opts.name = "loop";
    opts.parent = std::string("loop");
    EXPECT_THROW(engine.submit("hello", defaultObservers(), opts), InvalidLineageError);
    EXPECT_EQ(engine.pipeline().liveCount(), 0u);
    EXPECT_FALSE(engine.store().contains("loop"));
}

TEST(EngineTest, InvalidConfigRejected) {
    EngineConfig cfg;
    cfg.pipeline.context.mode.collapse_threshold = 0.0;
    EXPECT_THROW(Engine engine(cfg), ConfigError);
}

// ─── Retrieve ──────────────────────────────────────────────────

TEST(EngineTest, RetrieveExactOrPrefix) {
    Engine engine;
    for (const char* name : {"obs/a", "obs/b", "obs", "other"}) {
        SubmitOptions opts;
        opts.name = name;
        engine.submit("hello", defaultObservers(), opts);
    }

    auto exact = engine.retrieve("obs");
    ASSERT_EQ(exact.size(), 1u);
    EXPECT_EQ(exact[0].name, "obs");

    auto prefixed = engine.retrieve("obs/");
    ASSERT_EQ(prefixed.size(), 2u);
    EXPECT_EQ(prefixed[0].name, "obs/a");

    EXPECT_EQ(engine.retrieve("ob").size(), 3u);
    EXPECT_TRUE(engine.retrieve("missing").empty());
}

// ─── Concurrency and Durability ────────────────────────────────

TEST(EngineTest, ConcurrentSubmits) {
    Engine engine;
    engine.store().put("batch", "start");

    std::vector<std::thread> workers;
    for (int t = 0; t < 6; t++) {
        workers.emplace_back([&engine, t]() {
            for (int i = 0; i < 20; i++) {
                SubmitOptions opts;
                opts.name = "batch/" + std::to_string(t) + "-" + std::to_string(i);
                opts.parent = std::string("batch");
                engine.submit("hello item " + std::to_string(i), defaultObservers(), opts);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_TRUE(engine.store().verifyIntegrity().empty());
    EXPECT_EQ(engine.store().listChildren("batch").size(), 120u);
    EXPECT_EQ(engine.pipeline().liveCount(), 0u);
}

TEST(EngineTest, StoreSurvivesRestart) {
    fs::path dir = fs::temp_directory_path() / "arbor_engine_restart";
    fs::remove_all(dir);
    fs::create_directories(dir);

    EngineConfig cfg;
    cfg.store.log_path = (dir / "arbor.log").string();
    std::string name;
    {
        Engine engine(cfg);
        engine.open();
        name = engine.submit("hello world", defaultObservers()).name;
    }
    {
        Engine engine(cfg);
        engine.open();
        auto hits = engine.retrieve(name);
        ASSERT_EQ(hits.size(), 1u);
        EXPECT_EQ(hits[0].history.size(), 1u);
    }
    fs::remove_all(dir);
}
