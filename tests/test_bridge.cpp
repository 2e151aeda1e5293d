#include <gtest/gtest.h>
#include "session/bridge.hpp"

using namespace phenom;

TEST(BridgeTest, GridSummaryDropsPopulation) {
    AgentObservation obs = toAgentObservation(GridSummary{17, 64, 32});
    const auto* view = std::get_if<agent::GridView>(&obs);
    ASSERT_NE(view, nullptr);
    EXPECT_EQ(view->width, 64);
    EXPECT_EQ(view->height, 32);
}

TEST(BridgeTest, StateVecPassesThrough) {
    AgentObservation obs = toAgentObservation(StateVec{{1.5, -2.0, 30.0}});
    const auto* vec = std::get_if<agent::StateVector>(&obs);
    ASSERT_NE(vec, nullptr);
    EXPECT_EQ(vec->values, (Vec3{1.5, -2.0, 30.0}));
}

TEST(BridgeTest, EverythingElseIsBlind) {
    EXPECT_TRUE(std::holds_alternative<agent::Blind>(toAgentObservation(NoObservation{})));
    EXPECT_TRUE(std::holds_alternative<agent::Blind>(
        toAgentObservation(TextObservation{"the sky is green"})));
}

TEST(BridgeTest, ActionsTranslateVariantForVariant) {
    Action flip = toWorldAction(agent::FlipCell{3, 4});
    ASSERT_TRUE(std::holds_alternative<FlipCell>(flip));
    EXPECT_EQ(std::get<FlipCell>(flip).row, 3);
    EXPECT_EQ(std::get<FlipCell>(flip).col, 4);

    Action kick = toWorldAction(agent::Perturb{2, -1.25});
    ASSERT_TRUE(std::holds_alternative<Perturb>(kick));
    EXPECT_EQ(std::get<Perturb>(kick).axis, 2);
    EXPECT_DOUBLE_EQ(std::get<Perturb>(kick).delta, -1.25);

    Action set = toWorldAction(agent::SetParam{"rho", 99.5});
    ASSERT_TRUE(std::holds_alternative<SetParam>(set));
    EXPECT_EQ(std::get<SetParam>(set).name, "rho");
    EXPECT_DOUBLE_EQ(std::get<SetParam>(set).value, 99.5);

    EXPECT_TRUE(std::holds_alternative<Noop>(toWorldAction(agent::Noop{})));
}
