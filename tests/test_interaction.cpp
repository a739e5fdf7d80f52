#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "interaction/interaction.hpp"
#include "interaction/interaction_engine.hpp"

#include <cmath>
#include <limits>

using namespace arbor;

namespace {

ContextState stateWith(const std::vector<std::pair<std::string, double>>& tokens) {
    ContextState state;
    UnitMap& units = state.mutableUnits();
    uint64_t id = 1;
    for (const auto& [text, weight] : tokens) {
        InformationUnit u;
        u.id = id;
        u.payload = TokenValue{text};
        u.weight = weight;
        u.sequence_index = id - 1;
        units.emplace(id, u);
        id++;
    }
    return state;
}

} // namespace

// ─── Link ──────────────────────────────────────────────────────

TEST(InteractionTest, LinkCreatesThenExtendsGroup) {
    ContextState state = stateWith({{"a", 0.1}, {"b", 0.2}, {"c", 0.3}});
    InteractionEngine engine;

    ContextDelta d1 = engine.apply(state, Link{{1, 2}, 0.8, 0});
    ASSERT_EQ(state.groups.size(), 1u);
    uint64_t gid = d1.group_id;
    EXPECT_EQ(state.groups.at(gid).members, (std::vector<uint64_t>{1, 2}));
    EXPECT_DOUBLE_EQ(state.groups.at(gid).bond_strength, 0.8);

    ContextDelta d2 = engine.apply(state, Link{{2, 3}, 0.5, gid});
    EXPECT_EQ(d2.group_members_added, (std::vector<uint64_t>{3}));
    EXPECT_EQ(state.groups.at(gid).members, (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(state.log.size(), 2u);
}

TEST(InteractionTest, GroupWeightSumOrMax) {
    ContextState state = stateWith({{"a", 0.1}, {"b", 0.4}});
    InteractionEngine sum;
    sum.apply(state, Link{{1, 2}, 1.0, 0});
    const UnitGroup& g = state.groups.begin()->second;
    EXPECT_NEAR(sum.groupWeight(state, g), 0.5, 1e-12);

    InteractionConfig cfg;
    cfg.aggregation = Aggregation::MAX;
    InteractionEngine max(cfg);
    EXPECT_NEAR(max.groupWeight(state, g), 0.4, 1e-12);
}

TEST(InteractionTest, LinkRejectsBadArguments) {
    ContextState state = stateWith({{"a", 0.1}});
    InteractionEngine engine;
    EXPECT_THROW(engine.apply(state, Link{{}, 1.0, 0}), InvalidInteractionError);
    EXPECT_THROW(engine.apply(state, Link{{1}, 0.0, 0}), InvalidInteractionError);
    EXPECT_THROW(engine.apply(state, Link{{1}, 1.5, 0}), InvalidInteractionError);
    EXPECT_THROW(engine.apply(state, Link{{1, 9}, 1.0, 0}), UnknownUnitError);
    EXPECT_THROW(engine.apply(state, Link{{1}, 1.0, 42}), UnknownGroupError);
    EXPECT_TRUE(state.groups.empty());
    EXPECT_TRUE(state.log.empty());
}

// ─── Transform ─────────────────────────────────────────────────

TEST(InteractionTest, TransformKeepsIdAndWeight) {
    ContextState state = stateWith({{"colour", 0.3}});
    InteractionEngine engine;

    Transform t;
    t.unit_id = 1;
    t.payload = FieldValue{"colour", "red"};
    t.state = UnitState::POS;
    ContextDelta delta = engine.apply(state, t);

    const InformationUnit* u = state.findUnit(1);
    EXPECT_EQ(u->id, 1u);
    EXPECT_DOUBLE_EQ(u->weight, 0.3);
    EXPECT_EQ(u->kind(), UnitKind::FIELD);
    EXPECT_EQ(u->value(), "colour=red");
    EXPECT_EQ(u->state, UnitState::POS);

    ASSERT_EQ(delta.payload_changes.size(), 1u);
    EXPECT_TRUE(delta.payload_changes[0].before == UnitPayload(TokenValue{"colour"}));
    ASSERT_EQ(delta.state_changes.size(), 1u);
    EXPECT_EQ(delta.state_changes[0].before, UnitState::UNRESOLVED);
}

// ─── Invalidate ────────────────────────────────────────────────

TEST(InteractionTest, InvalidateAppliesPenalty) {
    ContextState state = stateWith({{"a", 0.5}, {"b", 1.0}});
    InteractionEngine engine;

    ContextDelta delta = engine.apply(state, Invalidate{{1, 2, 1}, "conflict"});
    EXPECT_EQ(state.findUnit(1)->state, UnitState::CONTESTED);
    EXPECT_NEAR(state.findUnit(1)->weight, 0.4, 1e-12);
    EXPECT_NEAR(state.findUnit(2)->weight, 0.8, 1e-12);
    // Duplicate id penalised once.
    EXPECT_EQ(delta.weight_changes.size(), 2u);
}

TEST(InteractionTest, InvalidatePenaltyConfigurable) {
    ContextState state = stateWith({{"a", 1.0}});
    InteractionConfig cfg;
    cfg.invalidate_penalty = 0.5;
    InteractionEngine engine(cfg);
    engine.apply(state, Invalidate{{1}, ""});
    EXPECT_NEAR(state.findUnit(1)->weight, 0.5, 1e-12);
}

// ─── Weight ────────────────────────────────────────────────────

TEST(InteractionTest, WeightAddsDelta) {
    ContextState state = stateWith({{"a", 0.1}});
    InteractionEngine engine;
    ContextDelta delta = engine.apply(state, Weight{1, 0.25, WeightReason::MANUAL});
    EXPECT_NEAR(state.findUnit(1)->weight, 0.35, 1e-12);
    ASSERT_EQ(delta.weight_changes.size(), 1u);
    EXPECT_DOUBLE_EQ(delta.weight_changes[0].before, 0.1);
}

TEST(InteractionTest, WeightRejectsNegativeAndNonFinite) {
    ContextState state = stateWith({{"a", 0.1}});
    InteractionEngine engine;
    EXPECT_THROW(engine.apply(state, Weight{1, -0.1, WeightReason::MANUAL}),
                 InvalidInteractionError);
    EXPECT_THROW(engine.apply(state, Weight{1, std::numeric_limits<double>::infinity(),
                                            WeightReason::MANUAL}),
                 InvalidInteractionError);
    EXPECT_THROW(engine.apply(state, Weight{1, std::nan(""), WeightReason::MANUAL}),
                 InvalidInteractionError);
    EXPECT_DOUBLE_EQ(state.findUnit(1)->weight, 0.1);
    EXPECT_TRUE(state.log.empty());
}

// ─── Unknown ids ───────────────────────────────────────────────

TEST(InteractionTest, UnknownUnitRejectedAndNotLogged) {
    ContextState state = stateWith({{"a", 0.1}});
    InteractionEngine engine;

    EXPECT_THROW(engine.apply(state, Weight{7, 0.1, WeightReason::MANUAL}), UnknownUnitError);
    EXPECT_THROW(engine.apply(state, Transform{7, TokenValue{"x"}, std::nullopt}),
                 UnknownUnitError);
    EXPECT_THROW(engine.apply(state, Invalidate{{1, 7}, ""}), UnknownUnitError);
    EXPECT_THROW(engine.apply(state, Emit{EmitTarget::UNIT, 7}), UnknownUnitError);
    EXPECT_THROW(engine.apply(state, Emit{EmitTarget::GROUP, 7}), UnknownGroupError);

    EXPECT_TRUE(state.log.empty());
    EXPECT_EQ(state.findUnit(1)->state, UnitState::UNRESOLVED);

    // The engine keeps working after a rejection.
    engine.apply(state, Weight{1, 0.1, WeightReason::MANUAL});
    EXPECT_EQ(state.log.size(), 1u);
}

// ─── Log ───────────────────────────────────────────────────────

TEST(InteractionTest, LogIsSequencedAndCarriesDeltas) {
    ContextState state = stateWith({{"a", 0.1}, {"b", 0.1}});
    InteractionEngine engine;
    engine.apply(state, Weight{1, 0.1, WeightReason::MANUAL});
    engine.apply(state, Link{{1, 2}, 1.0, 0});
    engine.apply(state, Emit{EmitTarget::UNIT, 1});

    ASSERT_EQ(state.log.size(), 3u);
    for (size_t i = 0; i < state.log.size(); i++) {
        EXPECT_EQ(state.log[i].seq, i + 1);
        EXPECT_GT(state.log[i].at, 0);
    }
    EXPECT_STREQ(interactionName(state.log[0].op), "weight");
    EXPECT_STREQ(interactionName(state.log[1].op), "link");
    EXPECT_TRUE(state.log[2].delta.emitted);
}

// ─── Contradictions ────────────────────────────────────────────

TEST(InteractionTest, FindContradictionsPairsOpposingStates) {
    ContextState state = stateWith({{"door", 0.2}, {"door", 0.2}, {"window", 0.2}});
    InteractionEngine engine;
    engine.apply(state, Transform{1, TokenValue{"door"}, UnitState::POS});
    engine.apply(state, Transform{3, TokenValue{"window"}, UnitState::NEG});
    EXPECT_TRUE(engine.findContradictions(state).empty());

    engine.apply(state, Transform{2, TokenValue{"door"}, UnitState::NEG});
    auto pairs = engine.findContradictions(state);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0], (std::pair<uint64_t, uint64_t>{1, 2}));
}

// ─── Copy-on-write ─────────────────────────────────────────────

TEST(InteractionTest, ForkCopySharesUntilWrite) {
    ContextState parent = stateWith({{"a", 0.1}});
    InteractionEngine engine;
    engine.apply(parent, Weight{1, 0.1, WeightReason::MANUAL});

    ContextState child = parent.forkCopy();
    EXPECT_TRUE(parent.sharesUnits());
    EXPECT_TRUE(child.log.empty());

    engine.apply(child, Weight{1, 0.5, WeightReason::MANUAL});
    EXPECT_FALSE(child.sharesUnits());
    EXPECT_FALSE(parent.sharesUnits());
    EXPECT_NEAR(parent.findUnit(1)->weight, 0.2, 1e-12);
    EXPECT_NEAR(child.findUnit(1)->weight, 0.7, 1e-12);
    EXPECT_EQ(parent.log.size(), 1u);
}
