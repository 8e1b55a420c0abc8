// Ticket: 0001_foot_contact_solver

#include "lcs-sim/src/Contact/ContactState.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace lcs_sim
{

TEST(ContactStateTest, InitialHistoryHasEveryVertexInContact)
{
  const ContactState state = ContactState::initial();

  for (int i = 0; i < kNumVertices; ++i)
  {
    EXPECT_TRUE(state.previous[static_cast<size_t>(i)]);
    EXPECT_TRUE(state.current[static_cast<size_t>(i)]);
  }
  EXPECT_FALSE(state.hasImpact());
  EXPECT_EQ(state.currentContactCount(), kNumVertices);
}

TEST(ContactStateTest, ImpactIsFreeToContactTransitionOnly)
{
  ContactState state = ContactState::airborne();
  state.current[1] = true;   // touchdown
  state.current[5] = true;   // touchdown
  state.previous[6] = true;  // lift-off, not an impact

  EXPECT_TRUE(state.hasImpact());
  EXPECT_TRUE(state.isImpact(1));
  EXPECT_FALSE(state.isImpact(6));
  EXPECT_EQ(state.impactVertices(), (std::vector<int>{1, 5}));
  EXPECT_EQ(state.previousContactVertices(), (std::vector<int>{6}));
  EXPECT_EQ(state.currentContactCount(), 2);
}

TEST(ContactStateTest, SustainedContactIsNotAnImpact)
{
  ContactState state = ContactState::airborne();
  state.previous[0] = true;
  state.current[0] = true;

  EXPECT_FALSE(state.hasImpact());
  EXPECT_TRUE(state.impactVertices().empty());
}

TEST(ContactStateTest, CommitCopiesCurrentIntoPrevious)
{
  ContactState state = ContactState::initial();
  state.current.fill(false);
  state.current[2] = true;

  state.commit();

  EXPECT_EQ(state.previous, state.current);
  EXPECT_FALSE(state.hasImpact());
}

}  // namespace lcs_sim
