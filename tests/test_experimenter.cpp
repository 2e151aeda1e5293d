#include <gtest/gtest.h>
#include "agent/experimenter.hpp"
#include "agent/experimenter_factory.hpp"

using namespace phenom;

// ─── Noop ─────────────────────────────────────────────────────

TEST(ExperimenterTest, NoopNeverActs) {
    NoopExperimenter noop;
    EXPECT_EQ(noop.name(), "noop");
    for (uint64_t step = 0; step < 500; step++) {
        ActResult result = noop.act(agent::StateVector{{1.0, 2.0, 3.0}}, 1.0, step);
        EXPECT_TRUE(std::holds_alternative<agent::Noop>(result.action));
        EXPECT_FALSE(result.discovery.has_value());
    }
}

// ─── Scripted ─────────────────────────────────────────────────

TEST(ExperimenterTest, ScriptedFlipsGridCentre) {
    ScriptedExperimenter scripted;
    AgentObservation grid = agent::GridView{40, 20};

    ActResult at_zero = scripted.act(grid, 0.0, 0);
    const auto* flip = std::get_if<agent::FlipCell>(&at_zero.action);
    ASSERT_NE(flip, nullptr);
    EXPECT_EQ(flip->row, 10);
    EXPECT_EQ(flip->col, 20);

    EXPECT_TRUE(std::holds_alternative<agent::Noop>(scripted.act(grid, 0.0, 30).action));
    EXPECT_TRUE(std::holds_alternative<agent::FlipCell>(scripted.act(grid, 0.0, 60).action));
}

TEST(ExperimenterTest, ScriptedKicksStateVector) {
    ScriptedExperimenter scripted;
    AgentObservation vec = agent::StateVector{{0.0, 0.0, 0.0}};

    int kicks = 0;
    for (uint64_t step = 0; step < 120; step++) {
        ActResult result = scripted.act(vec, 0.0, step);
        if (const auto* kick = std::get_if<agent::Perturb>(&result.action)) {
            EXPECT_EQ(step % 30, 0u);
            EXPECT_EQ(kick->axis, 0);
            EXPECT_DOUBLE_EQ(kick->delta, 2.0);
            kicks++;
        }
    }
    EXPECT_EQ(kicks, 4);  // 0, 30, 60, 90
}

TEST(ExperimenterTest, ScriptedIgnoresBlindWorlds) {
    ScriptedExperimenter scripted;
    ActResult result = scripted.act(agent::Blind{}, 0.0, 0);
    EXPECT_TRUE(std::holds_alternative<agent::Noop>(result.action));
}

TEST(ExperimenterTest, ScriptedReportsOnSchedule) {
    ScriptedExperimenter scripted;
    std::vector<uint64_t> reported;
    for (uint64_t step = 0; step <= 360; step++) {
        ActResult result = scripted.act(agent::Blind{}, 0.0, step);
        if (result.discovery) reported.push_back(step);
    }
    EXPECT_EQ(reported, (std::vector<uint64_t>{120, 240, 360}));

    ActResult at_240 = scripted.act(agent::Blind{}, 0.0, 240);
    ASSERT_TRUE(at_240.discovery.has_value());
    EXPECT_EQ(describe(*at_240.discovery), "Scientist: Tick 240 shows interesting stability.");
}

// ─── Factory ──────────────────────────────────────────────────

TEST(ExperimenterTest, FactoryBuildsEveryTag) {
    for (const auto& tag : experimenterTags()) {
        auto built = makeExperimenter(tag);
        ASSERT_NE(built, nullptr) << tag;
        EXPECT_EQ(built->name(), tag);
    }
    EXPECT_EQ(experimenterTags().size(), 3);
}

TEST(ExperimenterTest, FactoryRejectsUnknownTag) {
    EXPECT_EQ(makeExperimenter("oracle"), nullptr);
    EXPECT_EQ(makeExperimenter(""), nullptr);
}

TEST(ExperimenterTest, FactoryForwardsConfigAndSeed) {
    CuriosityConfig config;
    config.exploration_rate = 0.8;
    config.perturb_magnitude = 3.0;
    auto built = makeExperimenter("curious", config, 99);
    ASSERT_NE(built, nullptr);

    auto* curious = dynamic_cast<CuriousExperimenter*>(built.get());
    ASSERT_NE(curious, nullptr);
    EXPECT_DOUBLE_EQ(curious->config().exploration_rate, 0.8);
    EXPECT_DOUBLE_EQ(curious->config().perturb_magnitude, 3.0);

    CuriousExperimenter twin(config, 99);
    for (uint64_t step = 0; step < 50; step++) {
        AgentObservation obs = agent::StateVector{{0.3 * step, 1.0, -1.0}};
        built->act(obs, 0.0, step);
        twin.act(obs, 0.0, step);
        ASSERT_EQ(curious->lastAction(), twin.lastAction()) << "step " << step;
    }
}

TEST(ExperimenterTest, FactoryPropagatesBadConfig) {
    CuriosityConfig config;
    config.discount = 1.5;
    EXPECT_THROW(makeExperimenter("curious", config), std::invalid_argument);
    // Other tags ignore the config entirely.
    EXPECT_NE(makeExperimenter("noop", config), nullptr);
}
