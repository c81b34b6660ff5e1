#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/dsl/dsl.hpp"
#include "finite/model/model.hpp"
#include "tests/common/reference_evaluator.hpp"

namespace fnt::dsl {
namespace {

using test::Fire;
using test::FireStatus;

class DslTest : public ::testing::Test {
 protected:
  // p0/p1 counters with increment and decrement actions for one role.
  static void DeclareCounter(Declaration& d) {
    auto user = d.Role("default");
    auto dec0 = d.Fn("DEC0", {.role = user});
    auto dec1 = d.Fn("DEC1", {.role = user});
    auto p0 = d.Arc(d.Cell("p0", {.initial = 0}), 1, dec0);
    auto p1 = d.Arc(d.Cell("p1", {.initial = 1}), 1, dec1);
    d.Arc(d.Fn("INC0", {.role = user}), 1, p0);
    d.Arc(d.Fn("INC1", {.role = user}), 1, p1);
  }

  static auto BuildCounter() -> model::Model {
    auto model = NewModel("Counter", DeclareCounter);
    EXPECT_TRUE(model);
    return std::move(*model);
  }

  static auto Constant(uint64_t value) -> model::ValueFn {
    return [value] { return value; };
  }
};

// =============================================================================
// Declaration
// =============================================================================

TEST_F(DslTest, NewModelDeclaresEverything) {
  auto model = BuildCounter();
  EXPECT_EQ(model.Schema(), "Counter");
  EXPECT_EQ(model.PlaceCount(), 2U);
  EXPECT_EQ(model.TransitionCount(), 4U);
  EXPECT_EQ(model.PendingArcs().size(), 4U);
  EXPECT_FALSE(model.IsFrozen());
}

TEST_F(DslTest, TxIsAnAliasOfArc) {
  auto model = NewModel("Tx", [](Declaration& d) {
    auto t = d.Fn("T");
    d.Tx(d.Cell("p", {.initial = 1}), 2, t);
  });
  ASSERT_TRUE(model);
  ASSERT_TRUE(model->Freeze());

  auto t = model->FindTransition("T");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ((*model)[*t].delta, (std::vector<int64_t>{-2}));
}

TEST_F(DslTest, DeclarationErrorSurfacesFromNewModel) {
  auto model = NewModel("Bad", [](Declaration& d) {
    auto p = d.Cell("p");
    auto t = d.Fn("T");
    d.Inhibitor(t, 1, p);
  });
  ASSERT_FALSE(model);
  EXPECT_EQ(model.error().Code(), ErrorCode::kMalformedArc);
}

TEST_F(DslTest, InhibitorCompilesToGuard) {
  auto model = NewModel("Gate", [](Declaration& d) {
    auto t = d.Fn("T");
    d.Inhibitor(d.Cell("busy"), 1, t);
    d.Arc(t, 1, d.Cell("done"));
  });
  ASSERT_TRUE(model);

  auto snapshot = StateMachine(*model);
  ASSERT_TRUE(snapshot);
  const auto& entry = snapshot->transitions.at("T");
  EXPECT_EQ(entry.delta, (std::vector<int64_t>{0, 1}));
  ASSERT_EQ(entry.guards.size(), 1U);

  auto open = Fire(*snapshot, {0, 0}, "T");
  EXPECT_EQ(open.status, FireStatus::kOk);
  EXPECT_EQ(open.state, (std::vector<int64_t>{0, 1}));

  auto blocked = Fire(*snapshot, {1, 0}, "T");
  EXPECT_EQ(blocked.status, FireStatus::kInhibited);
}

// =============================================================================
// Counter end to end
// =============================================================================

TEST_F(DslTest, CounterWithoutOverlay) {
  auto model = BuildCounter();
  auto snapshot = StateMachine(model);
  ASSERT_TRUE(snapshot);

  EXPECT_EQ(snapshot->InitialState(), (std::vector<int64_t>{0, 1}));
  EXPECT_EQ(
      snapshot->transitions.at("DEC0").delta, (std::vector<int64_t>{-1, 0}));
  EXPECT_EQ(
      snapshot->transitions.at("INC1").delta, (std::vector<int64_t>{0, 1}));

  auto underflow = Fire(*snapshot, snapshot->InitialState(), "DEC0");
  EXPECT_EQ(underflow.status, FireStatus::kUnderflow);
  EXPECT_EQ(underflow.role, "default");
}

TEST_F(DslTest, CounterWithOverlay) {
  auto model = BuildCounter();
  ASSERT_TRUE(model.Freeze());

  NewVar(model)->Capacity("p0").Bind(Constant(5));
  NewVar(model)->Initial("p0").Bind(Constant(1));
  NewVar(model)->Weight("INC0", "p0").Bind(Constant(2));

  auto snapshot = StateMachine(model);
  ASSERT_TRUE(snapshot) << snapshot.error().primary.message;

  const std::vector<int64_t> initial = snapshot->InitialState();
  EXPECT_EQ(initial, (std::vector<int64_t>{1, 1}));
  EXPECT_EQ(snapshot->places.at("p0").capacity, 5U);
  EXPECT_EQ(
      snapshot->transitions.at("INC0").delta, (std::vector<int64_t>{2, 0}));
  EXPECT_EQ(snapshot->transitions.at("INC0").role, "default");

  auto once = Fire(*snapshot, initial, "INC0", 1);
  EXPECT_EQ(once.status, FireStatus::kOk);
  EXPECT_EQ(once.state, (std::vector<int64_t>{3, 1}));

  auto twice = Fire(*snapshot, initial, "INC0", 2);
  EXPECT_EQ(twice.status, FireStatus::kOk);
  EXPECT_EQ(twice.state, (std::vector<int64_t>{5, 1}));

  auto thrice = Fire(*snapshot, initial, "INC0", 3);
  EXPECT_EQ(thrice.status, FireStatus::kOverflow);
  EXPECT_EQ(thrice.role, "default");
  EXPECT_EQ(thrice.state, (std::vector<int64_t>{7, 1}));
}

TEST_F(DslTest, VarsDeclaredInsideTheDeclaration) {
  auto model = NewModel("Inline", [](Declaration& d) {
    DeclareCounter(d);
    d.NewVar().Capacity("p0").Bind(Constant(5));
  });
  ASSERT_TRUE(model);

  auto snapshot = StateMachine(*model);
  ASSERT_TRUE(snapshot);
  EXPECT_EQ(snapshot->places.at("p0").capacity, 5U);
}

TEST_F(DslTest, StateMachineReportsUnboundVariable) {
  auto model = BuildCounter();
  NewVar(model)->Capacity("p0").Label("limit");

  auto snapshot = StateMachine(model);
  ASSERT_FALSE(snapshot);
  EXPECT_EQ(snapshot.error().Code(), ErrorCode::kUnboundVariable);
}

// =============================================================================
// Marshal / Unmarshal
// =============================================================================

TEST_F(DslTest, MarshalUnmarshalRoundTrip) {
  auto model = BuildCounter();
  auto bytes = Marshal(model);
  ASSERT_TRUE(bytes);
  EXPECT_TRUE(model.IsFrozen());

  auto restored = Unmarshal(*bytes);
  ASSERT_TRUE(restored);
  EXPECT_EQ(restored->Schema(), "Counter");

  auto again = Marshal(*restored);
  ASSERT_TRUE(again);
  EXPECT_EQ(*again, *bytes);
}

TEST_F(DslTest, StateMachineOnImportedModelSkipsOverlay) {
  auto model = BuildCounter();
  auto bytes = Marshal(model);
  ASSERT_TRUE(bytes);
  auto restored = Unmarshal(*bytes);
  ASSERT_TRUE(restored);

  auto snapshot = StateMachine(*restored);
  ASSERT_TRUE(snapshot);
  EXPECT_EQ(snapshot->ToBytes(), *bytes);
}

TEST_F(DslTest, NewVarOnImportedModelFails) {
  auto model = BuildCounter();
  auto bytes = Marshal(model);
  ASSERT_TRUE(bytes);
  auto restored = Unmarshal(*bytes);
  ASSERT_TRUE(restored);

  auto var = NewVar(*restored);
  ASSERT_FALSE(var);
  EXPECT_EQ(var.error().Code(), ErrorCode::kOverlayUnavailable);
}

TEST_F(DslTest, UnmarshalRejectsGarbage) {
  auto restored = Unmarshal("[]");
  ASSERT_FALSE(restored);
  EXPECT_EQ(restored.error().primary.kind, DiagKind::kHostError);
}

}  // namespace
}  // namespace fnt::dsl
