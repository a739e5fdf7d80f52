#include <gtest/gtest.h>
#include "atomizer/atomizer.hpp"
#include "atomizer/atomize_strategy.hpp"
#include "common/errors.hpp"
#include "common/hash.hpp"

using namespace arbor;

namespace {

std::vector<std::string> values(const std::vector<InformationUnit>& units) {
    std::vector<std::string> out;
    for (const auto& u : units) out.push_back(u.value());
    return out;
}

} // namespace

// ─── Word Strategy ─────────────────────────────────────────────

TEST(AtomizerTest, WordSplitKeepsRepeats) {
    Atomizer atomizer;
    auto units = atomizer.atomize("hello hello world");

    ASSERT_EQ(units.size(), 3u);
    EXPECT_EQ(values(units), (std::vector<std::string>{"hello", "hello", "world"}));
    for (size_t i = 0; i < units.size(); i++) {
        EXPECT_EQ(units[i].id, i + 1);
        EXPECT_EQ(units[i].sequence_index, i);
        EXPECT_EQ(units[i].kind(), UnitKind::TOKEN);
        EXPECT_EQ(units[i].state, UnitState::UNRESOLVED);
        EXPECT_DOUBLE_EQ(units[i].weight, 0.01);
    }
}

TEST(AtomizerTest, WordTrimsPunctuationButKeepsCase) {
    Atomizer atomizer;
    auto units = atomizer.atomize("  \"Stop!\" said (Alice), don't.  ");
    EXPECT_EQ(values(units), (std::vector<std::string>{"Stop", "said", "Alice", "don't"}));
}

TEST(AtomizerTest, OriginSeedFromSourceIdentity) {
    Atomizer atomizer;
    auto a = atomizer.atomize("one two", "sensor-7");
    auto b = atomizer.atomize("three", "sensor-7");
    auto c = atomizer.atomize("one two");

    EXPECT_EQ(a[0].origin_seed, fnv1a64("sensor-7"));
    EXPECT_EQ(a[0].origin_seed, b[0].origin_seed);
    EXPECT_EQ(a[1].origin_seed, a[0].origin_seed);
    EXPECT_EQ(c[0].origin_seed, fnv1a64("one two"));
}

// ─── Sentence Strategy ─────────────────────────────────────────

TEST(AtomizerTest, SentenceSplit) {
    AtomizerConfig cfg;
    cfg.strategy = "sentence";
    Atomizer atomizer(cfg);

    auto units = atomizer.atomize("The pump failed. Restart it now! Is it up? 3.5 bar");
    ASSERT_EQ(units.size(), 4u);
    EXPECT_EQ(units[0].value(), "The pump failed.");
    EXPECT_EQ(units[1].value(), "Restart it now!");
    EXPECT_EQ(units[2].value(), "Is it up?");
    EXPECT_EQ(units[3].value(), "3.5 bar");
    EXPECT_EQ(units[0].kind(), UnitKind::SENTENCE);
    EXPECT_EQ(std::get<SentenceValue>(units[1].payload).token_count, 3u);
}

TEST(AtomizerTest, SentenceOfBareTerminatorsIsExhausted) {
    AtomizerConfig cfg;
    cfg.strategy = "sentence";
    Atomizer atomizer(cfg);
    EXPECT_THROW(atomizer.atomize("... ?!"), ExhaustedInputError);
}

// ─── Field Strategy ────────────────────────────────────────────

TEST(AtomizerTest, FieldSplit) {
    AtomizerConfig cfg;
    cfg.strategy = "field";
    Atomizer atomizer(cfg);

    auto units = atomizer.atomize("temp=21.5\n\nstatus: ok\n");
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0].kind(), UnitKind::FIELD);
    EXPECT_EQ(units[0].value(), "temp=21.5");
    EXPECT_EQ(std::get<FieldValue>(units[1].payload).key, "status");
    EXPECT_EQ(std::get<FieldValue>(units[1].payload).value, "ok");
}

TEST(AtomizerTest, FieldRejectsUnparseableLine) {
    AtomizerConfig cfg;
    cfg.strategy = "field";
    Atomizer atomizer(cfg);
    EXPECT_THROW(atomizer.atomize("temp=21\njust words\n"), InvalidInputError);
    EXPECT_THROW(atomizer.atomize("=value"), InvalidInputError);
}

// ─── Boundaries ────────────────────────────────────────────────

TEST(AtomizerTest, EmptyInputRejected) {
    Atomizer atomizer;
    EXPECT_THROW(atomizer.atomize(""), InvalidInputError);
    EXPECT_THROW(atomizer.atomize(" \t\n "), InvalidInputError);
}

TEST(AtomizerTest, NeverReturnsEmpty) {
    Atomizer atomizer;
    const std::vector<std::string> inputs = {
        "a", "!!!", "   x   ", "--- ...", "word.", "\n\n", "()", "ok, fine"};
    for (const auto& raw : inputs) {
        try {
            auto units = atomizer.atomize(raw);
            EXPECT_GE(units.size(), 1u) << "input: '" << raw << "'";
        } catch (const InvalidInputError&) {
            // Exhausted input is a kind of invalid input.
        }
    }
}

TEST(AtomizerTest, PunctuationOnlyIsExhausted) {
    Atomizer atomizer;
    EXPECT_THROW(atomizer.atomize("!!! ..."), ExhaustedInputError);
}

TEST(AtomizerTest, OversizedInputRejected) {
    AtomizerConfig cfg;
    cfg.max_input_bytes = 8;
    Atomizer atomizer(cfg);
    EXPECT_THROW(atomizer.atomize("this is far too long"), InvalidInputError);
}

TEST(AtomizerTest, MaxUnitsTruncates) {
    AtomizerConfig cfg;
    cfg.max_units = 2;
    Atomizer atomizer(cfg);
    auto units = atomizer.atomize("a b c d");
    EXPECT_EQ(values(units), (std::vector<std::string>{"a", "b"}));
}

TEST(AtomizerTest, ZeroLimitsRejected) {
    AtomizerConfig no_units;
    no_units.max_units = 0;
    EXPECT_THROW(Atomizer atomizer(no_units), InvalidInputError);
    EXPECT_THROW(Atomizer(no_units, makeAtomizeStrategy("word")), InvalidInputError);

    AtomizerConfig no_bytes;
    no_bytes.max_input_bytes = 0;
    EXPECT_THROW(Atomizer atomizer(no_bytes), InvalidInputError);
}

TEST(AtomizerTest, MalformedUtf8Rejected) {
    Atomizer atomizer;
    EXPECT_THROW(atomizer.atomize("caf\xe9 au lait"), InvalidInputError);
    auto units = atomizer.atomize("caf\xc3\xa9 au lait");
    EXPECT_EQ(units.front().value(), "caf\xc3\xa9");
}

TEST(AtomizerTest, UnknownStrategyRejected) {
    AtomizerConfig cfg;
    cfg.strategy = "paragraph";
    EXPECT_THROW(Atomizer atomizer(cfg), InvalidInputError);
    EXPECT_THROW(makeAtomizeStrategy("image"), InvalidInputError);
}

TEST(AtomizerTest, CustomStrategyInjected) {
    Atomizer atomizer(AtomizerConfig{}, std::make_unique<SentenceStrategy>());
    EXPECT_EQ(atomizer.config().strategy, "sentence");
    EXPECT_EQ(atomizer.atomize("One. Two.").size(), 2u);
}

// ─── Units ─────────────────────────────────────────────────────

TEST(AtomizerTest, IdentitySeparatesKinds) {
    InformationUnit token;
    token.payload = TokenValue{"a=b"};
    InformationUnit field;
    field.payload = FieldValue{"a", "b"};

    EXPECT_EQ(token.value(), field.value());
    EXPECT_NE(token.identityKey(), field.identityKey());
}

TEST(AtomizerTest, KindAndStateNamesRoundTrip) {
    for (auto kind : {UnitKind::TOKEN, UnitKind::SENTENCE, UnitKind::FIELD, UnitKind::COMBINED}) {
        EXPECT_TRUE(parseKind(kindName(kind)) == kind);
    }
    for (auto state : {UnitState::POS, UnitState::NEG, UnitState::NEUTRAL,
                       UnitState::UNRESOLVED, UnitState::CONTESTED}) {
        EXPECT_TRUE(parseState(stateName(state)) == state);
    }
    EXPECT_FALSE(parseKind("IMAGE").has_value());
}
