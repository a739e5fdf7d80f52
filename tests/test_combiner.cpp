#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "observer/combiner.hpp"
#include "observer/observer.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <thread>

using namespace arbor;

namespace {

InformationUnit token(const std::string& text, uint64_t seed = 42) {
    InformationUnit u;
    u.id = 1;
    u.payload = TokenValue{text};
    u.weight = 0.3;
    u.origin_seed = seed;
    return u;
}

std::shared_ptr<const Observer> constant(const std::string& name, const Symbol& symbol) {
    return std::make_shared<FunctionObserver>(
        name, binaryAlphabet(), [symbol](const InformationUnit&) { return symbol; });
}

/// Stochastic observer that forgets to declare a seed.
class UnseededObserver : public Observer {
public:
    std::string name() const override { return "unseeded"; }
    const Alphabet& alphabet() const override { return alphabet_; }
    bool deterministic() const override { return false; }
    Symbol observe(const InformationUnit&) const override { return "0"; }

private:
    Alphabet alphabet_ = binaryAlphabet();
};

} // namespace

// ─── Keys ──────────────────────────────────────────────────────

TEST(CombinerTest, ThreeObserversGiveKeyInDeclaredOrder) {
    Combiner combiner;
    ObserverSet observers = {constant("a", "0"), constant("b", "1"), constant("c", "0")};

    CombinedKey first = combiner.combine(token("door"), observers);
    EXPECT_EQ(first.key, "010");
    EXPECT_EQ(first.symbols, (std::vector<Symbol>{"0", "1", "0"}));
    EXPECT_EQ(first.observer_names, (std::vector<std::string>{"a", "b", "c"}));

    CombinedKey second = combiner.combine(token("door"), observers);
    EXPECT_EQ(second.key, "010");
}

TEST(CombinerTest, DeterministicAcrossManyCalls) {
    Combiner combiner;
    ObserverSet observers = {
        std::make_shared<ContainsObserver>("o"),
        std::make_shared<SeededObserver>("coin", binaryAlphabet(), 1234),
        std::make_shared<SeededObserver>("die", Alphabet{"1", "2", "3", "4", "5", "6"}, 99),
        std::make_shared<FunctionObserver>(
            "long", binaryAlphabet(),
            [](const InformationUnit& u) { return u.value().size() > 3 ? "1" : "0"; }),
    };

    const InformationUnit unit = token("door", 7);
    const std::string expected = combiner.combine(unit, observers).key;
    ASSERT_EQ(expected.size(), 4u);
    for (int i = 0; i < 150; i++) {
        EXPECT_EQ(combiner.combine(unit, observers).key, expected) << "call " << i;
    }
}

TEST(CombinerTest, SerialAndParallelAgree) {
    CombinerConfig serial_cfg;
    serial_cfg.parallel = false;
    Combiner serial(serial_cfg);
    Combiner parallel;

    ObserverSet observers = {
        std::make_shared<SeededObserver>("s1", binaryAlphabet(), 1),
        std::make_shared<SeededObserver>("s2", binaryAlphabet(), 2),
        std::make_shared<ContainsObserver>("x"),
    };
    for (const char* text : {"alpha", "xray", "box", "zz"}) {
        EXPECT_EQ(serial.combine(token(text), observers).key,
                  parallel.combine(token(text), observers).key) << text;
    }
}

TEST(CombinerTest, SeededObserverDependsOnOriginSeed) {
    SeededObserver obs("s", Alphabet{"a", "b", "c", "d", "e", "f", "g", "h"}, 5);
    std::set<Symbol> seen;
    for (uint64_t seed = 0; seed < 64; seed++) {
        Symbol s = obs.observe(token("same", seed));
        EXPECT_EQ(s, obs.observe(token("same", seed)));
        seen.insert(s);
    }
    EXPECT_GT(seen.size(), 1u);
}

// ─── Agreement ─────────────────────────────────────────────────

TEST(CombinerTest, AgreementRaisesInitialWeight) {
    Combiner combiner;
    ObserverSet agree = {constant("a", "1"), constant("b", "1"), constant("c", "1")};
    ObserverSet split = {constant("a", "1"), constant("b", "0"), constant("c", "1")};

    CombinedKey full = combiner.combine(token("x"), agree);
    CombinedKey part = combiner.combine(token("x"), split);

    EXPECT_DOUBLE_EQ(full.agreement, 1.0);
    EXPECT_NEAR(part.agreement, 2.0 / 3.0, 1e-12);
    EXPECT_GT(full.unit.weight, part.unit.weight);
    EXPECT_NEAR(full.unit.weight, 0.01 + 0.1, 1e-12);

    EXPECT_EQ(full.unit.kind(), UnitKind::COMBINED);
    EXPECT_EQ(full.unit.value(), "111");
    EXPECT_EQ(full.unit.origin_seed, 42u);
}

// ─── Isolation and Failure ─────────────────────────────────────

TEST(CombinerTest, ObserversSeeTheirOwnSnapshot) {
    Combiner combiner;
    std::atomic<int> calls{0};
    auto probe = [&calls](const InformationUnit& u) -> Symbol {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return u.value() == "door" && u.weight == 0.3 ? "1" : "0";
    };
    ObserverSet observers;
    for (int i = 0; i < 6; i++) {
        observers.push_back(std::make_shared<FunctionObserver>(
            "p" + std::to_string(i), binaryAlphabet(), probe));
    }
    EXPECT_EQ(combiner.combine(token("door"), observers).key, "111111");
    EXPECT_EQ(calls.load(), 6);
}

TEST(CombinerTest, FailureRethrownAfterAllObserversJoin) {
    Combiner combiner;
    std::atomic<int> finished{0};
    auto slow = [&finished](const InformationUnit&) -> Symbol {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        finished++;
        return "1";
    };
    ObserverSet observers = {
        std::make_shared<FunctionObserver>(
            "broken", binaryAlphabet(),
            [](const InformationUnit&) -> Symbol { throw std::runtime_error("sensor offline"); }),
        std::make_shared<FunctionObserver>("slow1", binaryAlphabet(), slow),
        std::make_shared<FunctionObserver>("slow2", binaryAlphabet(), slow),
    };

    EXPECT_THROW(combiner.combine(token("x"), observers), std::runtime_error);
    EXPECT_EQ(finished.load(), 2);
}

TEST(CombinerTest, SymbolOutsideAlphabetRejected) {
    Combiner combiner;
    ObserverSet observers = {constant("ok", "1"), constant("bad", "maybe")};
    EXPECT_THROW(combiner.combine(token("x"), observers), InvalidSymbolError);
}

TEST(CombinerTest, InvalidObserverSetsRejected) {
    Combiner combiner;
    EXPECT_THROW(combiner.combine(token("x"), {}), InvalidObserverError);
    EXPECT_THROW(combiner.combine(token("x"), {nullptr}), InvalidObserverError);
    EXPECT_THROW(combiner.combine(token("x"), {std::make_shared<UnseededObserver>()}),
                 InvalidObserverError);

    auto dup = std::make_shared<FunctionObserver>(
        "dup", Alphabet{"a", "a"}, [](const InformationUnit&) { return "a"; });
    EXPECT_THROW(combiner.combine(token("x"), {dup}), InvalidObserverError);
    EXPECT_THROW(FunctionObserver("empty", binaryAlphabet(), nullptr), InvalidObserverError);
}
