// Ticket: 0001_foot_contact_solver

#include "lcs-sim/src/Contact/ContactState.hpp"

#include <algorithm>

namespace lcs_sim
{

ContactState ContactState::initial()
{
  ContactState state;
  state.previous.fill(true);
  state.current.fill(true);
  return state;
}

ContactState ContactState::airborne()
{
  ContactState state;
  state.previous.fill(false);
  state.current.fill(false);
  return state;
}

bool ContactState::hasImpact() const
{
  for (int i = 0; i < kNumVertices; ++i)
  {
    if (isImpact(i))
    {
      return true;
    }
  }
  return false;
}

std::vector<int> ContactState::impactVertices() const
{
  std::vector<int> vertices;
  for (int i = 0; i < kNumVertices; ++i)
  {
    if (isImpact(i))
    {
      vertices.push_back(i);
    }
  }
  return vertices;
}

std::vector<int> ContactState::previousContactVertices() const
{
  std::vector<int> vertices;
  for (int i = 0; i < kNumVertices; ++i)
  {
    if (previous[static_cast<size_t>(i)])
    {
      vertices.push_back(i);
    }
  }
  return vertices;
}

int ContactState::currentContactCount() const
{
  return static_cast<int>(std::count(current.begin(), current.end(), true));
}

}  // namespace lcs_sim
