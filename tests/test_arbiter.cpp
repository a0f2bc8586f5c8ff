/**
 * @file test_arbiter.cpp
 * @brief Tests for agreed_head, make_poverty and escape_poverty.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "tipguard/health/arbiter.hpp"
#include "test_support.hpp"

using tipguard::health::HeadResult;
using tipguard::health::HeadResults;
using tipguard::health::Node;
using tipguard::health::NodeId;
using tipguard::health::NodeList;
using tipguard::health::NodeRegistry;
using tipguard::health::PoolState;
using tipguard::health::agreed_head;
using tipguard::health::escape_poverty;
using tipguard::health::make_poverty;
using tipguard::obs::EventKind;
using tipguard::test::RecordingObserver;
using tipguard::test::add_sim;

namespace {

/// Register @p n nodes into the active pool, returning their ids in order.
std::vector<NodeId> fill_active(NodeRegistry& reg, std::size_t n) {
  std::vector<NodeId> ids;
  for (std::size_t i = 0; i < n; ++i) {
    NodeId id = 0;
    add_sim(reg, "https://node" + std::to_string(i) + ".example", 0, &id);
    ids.push_back(id);
  }
  return ids;
}

/// Move every active node into the poverty pool, flagged erroring.
void park_all(NodeRegistry& reg) {
  reg.mutate([](PoolState& s) {
    for (auto& n : s.active) {
      n.is_erroring = true;
      s.poverty.push_back(n);
    }
    s.active.clear();
    return true;
  });
}

bool contains(const NodeList& pool, NodeId id) {
  return std::any_of(pool.begin(), pool.end(), [id](const Node& n) { return n.id == id; });
}

} // namespace

// ---------- agreed_head ----------

TEST(AgreedHead, MaxOfResponsive) {
  HeadResults heads{
    HeadResult::reported(0, 1, 18177557),
    HeadResult::reported(1, 2, 18193012),
    HeadResult::unresponsive(2, 3),
  };
  EXPECT_EQ(agreed_head(heads), 18193012u);
}

TEST(AgreedHead, EmptyOrSilent_IsZero) {
  EXPECT_EQ(agreed_head({}), 0u);
  EXPECT_EQ(agreed_head({HeadResult::unresponsive(0, 1), HeadResult::unresponsive(1, 2)}), 0u);
}

// ---------- make_poverty ----------

/**
 * @test MakePoverty_ScenarioA
 * @brief [18177557, 18193012, unresponsive] → one active, two in poverty.
 */
TEST(MakePoverty, ScenarioA) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 3);
  HeadResults heads{
    HeadResult::reported(0, ids[0], 18177557),
    HeadResult::reported(1, ids[1], 18193012),
    HeadResult::unresponsive(2, ids[2]),
  };

  auto agreed = make_poverty(reg, heads, obs);
  ASSERT_TRUE(agreed);
  EXPECT_EQ(*agreed, 18193012u);

  auto snap = reg.snapshot();
  ASSERT_EQ(snap->active.size(), 1u);
  EXPECT_EQ(snap->active[0].id, ids[1]);
  EXPECT_FALSE(snap->active[0].is_erroring);
  ASSERT_EQ(snap->poverty.size(), 2u);
  EXPECT_TRUE(contains(snap->poverty, ids[0]));
  EXPECT_TRUE(contains(snap->poverty, ids[2]));
  for (const auto& n : snap->poverty) EXPECT_TRUE(n.is_erroring);

  EXPECT_EQ(obs.snapshot().demotions, 2u);
  auto events = obs.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].kind, EventKind::Demoted);
  EXPECT_TRUE(events[0].responsive);
  EXPECT_EQ(events[0].reported_head, 18177557u);
  EXPECT_FALSE(events[1].responsive);
}

/**
 * @test MakePoverty_ResultOrderIrrelevant
 * @brief Shuffled results produce the same partition.
 */
TEST(MakePoverty, ResultOrderIrrelevant) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 4);
  HeadResults heads{
    HeadResult::reported(3, ids[3], 50),
    HeadResult::reported(0, ids[0], 49),
    HeadResult::reported(2, ids[2], 50),
    HeadResult::reported(1, ids[1], 10),
  };
  auto agreed = make_poverty(reg, heads, obs);
  ASSERT_TRUE(agreed);
  EXPECT_EQ(*agreed, 50u);

  auto snap = reg.snapshot();
  ASSERT_EQ(snap->active.size(), 2u);
  EXPECT_EQ(snap->active[0].id, ids[2]); // relative order kept
  EXPECT_EQ(snap->active[1].id, ids[3]);
  EXPECT_EQ(snap->poverty.size(), 2u);
}

/**
 * @test MakePoverty_Invariants
 * @brief Remaining nodes all reported the agreed head; membership is conserved.
 */
TEST(MakePoverty, Invariants) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 6);
  const std::uint64_t reported[] = {7, 9, 9, 3, 8, 9};
  HeadResults heads;
  for (std::size_t i = 0; i < ids.size(); ++i) heads.push_back(HeadResult::reported(i, ids[i], reported[i]));

  auto agreed = make_poverty(reg, heads, obs);
  ASSERT_TRUE(agreed);

  auto snap = reg.snapshot();
  EXPECT_EQ(snap->active.size() + snap->poverty.size(), ids.size());
  for (const auto& n : snap->active) {
    const auto it = std::find(ids.begin(), ids.end(), n.id);
    ASSERT_NE(it, ids.end());
    EXPECT_EQ(reported[it - ids.begin()], *agreed);
  }
  for (const auto& n : snap->poverty) {
    const auto it = std::find(ids.begin(), ids.end(), n.id);
    ASSERT_NE(it, ids.end());
    EXPECT_LT(reported[it - ids.begin()], *agreed);
  }
  EXPECT_EQ(snap->active.size(), 3u);
}

/**
 * @test MakePoverty_Idempotent
 * @brief Re-applying the same results is a no-op.
 */
TEST(MakePoverty, Idempotent) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 3);
  HeadResults heads{
    HeadResult::reported(0, ids[0], 18177557),
    HeadResult::reported(1, ids[1], 18193012),
    HeadResult::unresponsive(2, ids[2]),
  };
  ASSERT_TRUE(make_poverty(reg, heads, obs));
  const auto v = reg.version();
  const auto before = *reg.snapshot();

  auto again = make_poverty(reg, heads, obs);
  ASSERT_TRUE(again);
  EXPECT_EQ(*again, 18193012u);
  EXPECT_EQ(reg.version(), v);
  EXPECT_EQ(reg.snapshot()->active, before.active);
  EXPECT_EQ(reg.snapshot()->poverty, before.poverty);
  EXPECT_EQ(obs.snapshot().demotions, 2u);
}

/**
 * @test MakePoverty_ScenarioC
 * @brief A lone node is never demoted, whatever it reports.
 */
TEST(MakePoverty, ScenarioC) {
  for (auto r : {HeadResult::reported(0, 0, 18193012), HeadResult::reported(0, 0, 0),
                 HeadResult::unresponsive(0, 0)}) {
    NodeRegistry reg;
    RecordingObserver obs;
    auto ids = fill_active(reg, 1);
    r.node_id = ids[0];

    auto agreed = make_poverty(reg, HeadResults{r}, obs);
    ASSERT_TRUE(agreed);
    EXPECT_EQ(reg.active_size(), 1u);
    EXPECT_EQ(reg.poverty_size(), 0u);
    EXPECT_EQ(obs.snapshot().demotions, 0u);
  }
}

TEST(MakePoverty, EmptyPool) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto agreed = make_poverty(reg, {}, obs);
  ASSERT_TRUE(agreed);
  EXPECT_EQ(*agreed, 0u);
  EXPECT_EQ(reg.version(), 0u);
}

/**
 * @test MakePoverty_NobodyAnswered
 * @brief With no reference head, nobody is demoted.
 */
TEST(MakePoverty, NobodyAnswered) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 3);
  HeadResults heads{
    HeadResult::unresponsive(0, ids[0]),
    HeadResult::unresponsive(1, ids[1]),
    HeadResult::unresponsive(2, ids[2]),
  };
  auto agreed = make_poverty(reg, heads, obs);
  ASSERT_TRUE(agreed);
  EXPECT_EQ(*agreed, 0u);
  EXPECT_EQ(reg.active_size(), 3u);
}

/**
 * @test MakePoverty_GenesisHead_NotDemoted
 * @brief Reporting 0 when the agreed head is 0 is a genuine tie; only the
 *        silent node is demoted.
 */
TEST(MakePoverty, GenesisHead_NotDemoted) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 3);
  HeadResults heads{
    HeadResult::reported(0, ids[0], 0),
    HeadResult::reported(1, ids[1], 0),
    HeadResult::unresponsive(2, ids[2]),
  };
  auto agreed = make_poverty(reg, heads, obs);
  ASSERT_TRUE(agreed);
  EXPECT_EQ(*agreed, 0u);
  EXPECT_EQ(reg.active_size(), 2u);
  ASSERT_EQ(reg.poverty_size(), 1u);
  EXPECT_EQ(reg.poverty()[0].id, ids[2]);
}

/**
 * @test MakePoverty_SkipsNodesRemovedSincePoll
 * @brief A result for a node that left the active pool touches nothing.
 */
TEST(MakePoverty, SkipsNodesRemovedSincePoll) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 2);
  HeadResults heads{
    HeadResult::reported(0, ids[0], 5),
    HeadResult::reported(1, ids[1], 9),
  };
  ASSERT_EQ(reg.remove_node(ids[0]), tipguard::health::RegistryErr::Ok);

  auto agreed = make_poverty(reg, heads, obs);
  ASSERT_TRUE(agreed);
  EXPECT_EQ(reg.active_size(), 1u);
  EXPECT_EQ(reg.poverty_size(), 0u);
  EXPECT_EQ(obs.snapshot().demotions, 0u);
}

// ---------- escape_poverty ----------

/**
 * @test EscapePoverty_ScenarioB
 * @brief Poverty [18177557, 18193012] with agreed 18193012 → only the second escapes.
 */
TEST(EscapePoverty, ScenarioB) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 2);
  park_all(reg);
  NodeId healthy = 0;
  add_sim(reg, "https://healthy.example", 18193012, &healthy);

  HeadResults heads{
    HeadResult::reported(0, ids[0], 18177557),
    HeadResult::reported(1, ids[1], 18193012),
  };
  auto r = escape_poverty(reg, heads, 18193012, obs);
  ASSERT_TRUE(r);

  auto snap = reg.snapshot();
  ASSERT_EQ(snap->active.size(), 2u);
  EXPECT_EQ(snap->active[0].id, healthy);
  EXPECT_EQ(snap->active[1].id, ids[1]); // appended
  EXPECT_FALSE(snap->active[1].is_erroring);
  ASSERT_EQ(snap->poverty.size(), 1u);
  EXPECT_EQ(snap->poverty[0].id, ids[0]);
  EXPECT_TRUE(snap->poverty[0].is_erroring);

  auto events = obs.events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, EventKind::Promoted);
  EXPECT_EQ(events[0].node_id, ids[1]);
}

TEST(EscapePoverty, AheadOfAgreedHead_Promoted) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 1);
  park_all(reg);

  ASSERT_TRUE(escape_poverty(reg, {HeadResult::reported(0, ids[0], 101)}, 100, obs));
  EXPECT_EQ(reg.active_size(), 1u);
  EXPECT_EQ(reg.poverty_size(), 0u);
}

TEST(EscapePoverty, Unresponsive_Stays) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 1);
  park_all(reg);

  // Even with no reference head, silence is never a recovery.
  ASSERT_TRUE(escape_poverty(reg, {HeadResult::unresponsive(0, ids[0])}, 0, obs));
  EXPECT_EQ(reg.active_size(), 0u);
  EXPECT_EQ(reg.poverty_size(), 1u);
  EXPECT_EQ(obs.snapshot().promotions, 0u);
}

/**
 * @test EscapePoverty_Threshold
 * @brief Every node at or above T escapes; the rest stay.
 */
TEST(EscapePoverty, Threshold) {
  NodeRegistry reg;
  RecordingObserver obs;
  auto ids = fill_active(reg, 5);
  park_all(reg);
  const std::uint64_t reported[] = {99, 100, 101, 42, 100};
  HeadResults heads;
  for (std::size_t i = 0; i < ids.size(); ++i) heads.push_back(HeadResult::reported(i, ids[i], reported[i]));

  ASSERT_TRUE(escape_poverty(reg, heads, 100, obs));
  auto snap = reg.snapshot();
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const bool up = reported[i] >= 100;
    EXPECT_EQ(contains(snap->active, ids[i]), up) << i;
    EXPECT_EQ(contains(snap->poverty, ids[i]), !up) << i;
  }
}

TEST(EscapePoverty, EmptyResults_NoChange) {
  NodeRegistry reg;
  RecordingObserver obs;
  fill_active(reg, 2);
  park_all(reg);
  const auto v = reg.version();
  ASSERT_TRUE(escape_poverty(reg, {}, 0, obs));
  EXPECT_EQ(reg.version(), v);
  EXPECT_EQ(reg.poverty_size(), 2u);
}
