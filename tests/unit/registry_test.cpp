#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/model/model.hpp"

namespace fnt::model {
namespace {

class RegistryTest : public ::testing::Test {};

// =============================================================================
// Places
// =============================================================================

TEST_F(RegistryTest, PlacesGetContiguousOffsetsInDeclarationOrder) {
  Model model("Registry");
  auto a = model.DeclarePlace("a", {});
  auto b = model.DeclarePlace("b", {});
  auto c = model.DeclarePlace("c", {});
  ASSERT_TRUE(a && b && c);

  EXPECT_EQ(model[a->id].offset, 0U);
  EXPECT_EQ(model[b->id].offset, 1U);
  EXPECT_EQ(model[c->id].offset, 2U);
  EXPECT_EQ(model.PlaceCount(), 3U);
}

TEST_F(RegistryTest, PlaceSpecIsStored) {
  Model model("Registry");
  auto p = model.DeclarePlace(
      "p", {.initial = 3, .capacity = 9, .coords = Coords{.x = 4, .y = 7}});
  ASSERT_TRUE(p);

  const Place& place = model[p->id];
  EXPECT_EQ(place.name, "p");
  EXPECT_EQ(place.initial, 3U);
  EXPECT_EQ(place.capacity, 9U);
  ASSERT_TRUE(place.coords.has_value());
  EXPECT_EQ(place.coords->x, 4);
  EXPECT_EQ(place.coords->y, 7);
}

TEST_F(RegistryTest, RedeclaringPlaceKeepsOffsetAndOverwritesSpec) {
  Model model("Registry");
  auto first = model.DeclarePlace("p", {.initial = 1, .capacity = 2});
  ASSERT_TRUE(model.DeclarePlace("q", {}));
  auto second = model.DeclarePlace("p", {.initial = 5, .capacity = 0});
  ASSERT_TRUE(first && second);

  EXPECT_EQ(first->id, second->id);
  EXPECT_EQ(model.PlaceCount(), 2U);
  EXPECT_EQ(model[second->id].offset, 0U);
  EXPECT_EQ(model[second->id].initial, 5U);
  EXPECT_EQ(model[second->id].capacity, 0U);
}

TEST_F(RegistryTest, FindPlaceByName) {
  Model model("Registry");
  ASSERT_TRUE(model.DeclarePlace("p", {}));
  EXPECT_TRUE(model.FindPlace("p").has_value());
  EXPECT_FALSE(model.FindPlace("missing").has_value());
  EXPECT_FALSE(model.FindTransition("p").has_value());
}

// =============================================================================
// Transitions and roles
// =============================================================================

TEST_F(RegistryTest, RolesAreDeduplicatedByName) {
  Model model("Registry");
  auto first = model.DeclareRole("default");
  auto second = model.DeclareRole("default");
  auto other = model.DeclareRole("admin");
  ASSERT_TRUE(first && second && other);

  EXPECT_EQ(first->id, second->id);
  EXPECT_NE(first->id, other->id);
  EXPECT_EQ(model.Roles().size(), 2U);
}

TEST_F(RegistryTest, TransitionCarriesRole) {
  Model model("Registry");
  auto role = model.DeclareRole("default");
  ASSERT_TRUE(role);
  auto t = model.DeclareTransition("INC0", {.role = *role});
  ASSERT_TRUE(t);

  EXPECT_EQ(model.RoleName(model[t->id].role), "default");
  EXPECT_FALSE(model[t->id].delta.has_value());
}

TEST_F(RegistryTest, TransitionWithoutRoleHasEmptyRoleName) {
  Model model("Registry");
  auto t = model.DeclareTransition("T", {});
  ASSERT_TRUE(t);
  EXPECT_EQ(model.RoleName(model[t->id].role), "");
}

TEST_F(RegistryTest, RedeclaringTransitionOverwritesRole) {
  Model model("Registry");
  auto user = model.DeclareRole("user");
  auto admin = model.DeclareRole("admin");
  ASSERT_TRUE(user && admin);

  auto first = model.DeclareTransition("T", {.role = *user});
  auto second = model.DeclareTransition("T", {.role = *admin});
  ASSERT_TRUE(first && second);

  EXPECT_EQ(first->id, second->id);
  EXPECT_EQ(model.TransitionCount(), 1U);
  EXPECT_EQ(model.RoleName(model[second->id].role), "admin");
}

TEST_F(RegistryTest, RoleFromAnotherModelIsRejected) {
  Model owner("Owner");
  Model other("Other");
  auto role = owner.DeclareRole("default");
  ASSERT_TRUE(role);

  auto t = other.DeclareTransition("T", {.role = *role});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().Code(), ErrorCode::kUnresolvedReference);
}

TEST_F(RegistryTest, PlaceAndTransitionMayShareAName) {
  Model model("Registry");
  ASSERT_TRUE(model.DeclarePlace("x", {}));
  ASSERT_TRUE(model.DeclareTransition("x", {}));
  EXPECT_TRUE(model.FindPlace("x").has_value());
  EXPECT_TRUE(model.FindTransition("x").has_value());
}

// =============================================================================
// Arc ledger
// =============================================================================

TEST_F(RegistryTest, ArcsAreRecordedInOrder) {
  Model model("Registry");
  auto p = model.DeclarePlace("p", {});
  auto t = model.DeclareTransition("t", {});
  ASSERT_TRUE(p && t);

  ASSERT_TRUE(model.AddArc(*p, *t, 1));
  ASSERT_TRUE(model.AddArc(*t, *p, 2));

  auto arcs = model.PendingArcs();
  ASSERT_EQ(arcs.size(), 2U);
  EXPECT_EQ(arcs[0].weight, 1U);
  EXPECT_EQ(arcs[1].weight, 2U);
  EXPECT_EQ(arcs[0].kind, ArcKind::kNormal);
}

TEST_F(RegistryTest, ArcEndpointFromAnotherModelIsRejected) {
  Model model("Registry");
  Model other("Other");
  auto p = model.DeclarePlace("p", {});
  auto foreign = other.DeclareTransition("t", {});
  ASSERT_TRUE(p && foreign);

  auto added = model.AddArc(*p, *foreign, 1);
  ASSERT_FALSE(added);
  EXPECT_EQ(added.error().Code(), ErrorCode::kUnresolvedReference);
  EXPECT_TRUE(model.PendingArcs().empty());
}

TEST_F(RegistryTest, DefaultHandleIsRejected) {
  Model model("Registry");
  auto t = model.DeclareTransition("t", {});
  ASSERT_TRUE(t);

  auto added = model.AddArc(PlaceHandle{}, *t, 1);
  ASSERT_FALSE(added);
  EXPECT_EQ(added.error().Code(), ErrorCode::kUnresolvedReference);
}

TEST_F(RegistryTest, InhibitorFromTransitionIsRejectedImmediately) {
  Model model("Registry");
  auto p = model.DeclarePlace("p", {});
  auto t = model.DeclareTransition("t", {});
  ASSERT_TRUE(p && t);

  auto added = model.AddArc(*t, *p, 1, ArcKind::kInhibitor);
  ASSERT_FALSE(added);
  EXPECT_EQ(added.error().Code(), ErrorCode::kMalformedArc);
  EXPECT_FALSE(added.error().notes.empty());
}

TEST_F(RegistryTest, DescribeNamesTheNode) {
  Model model("Registry");
  auto p = model.DeclarePlace("p0", {});
  auto t = model.DeclareTransition("INC0", {});
  ASSERT_TRUE(p && t);

  EXPECT_EQ(model.Describe(*p), "place 'p0'");
  EXPECT_EQ(model.Describe(*t), "transition 'INC0'");
}

// =============================================================================
// Frozen models
// =============================================================================

TEST_F(RegistryTest, DeclarationsAfterFreezeFail) {
  Model model("Registry");
  auto p = model.DeclarePlace("p", {});
  auto t = model.DeclareTransition("t", {});
  ASSERT_TRUE(p && t);
  ASSERT_TRUE(model.Freeze());

  auto place = model.DeclarePlace("q", {});
  ASSERT_FALSE(place);
  EXPECT_EQ(place.error().Code(), ErrorCode::kAlreadyFrozen);

  auto transition = model.DeclareTransition("u", {});
  ASSERT_FALSE(transition);
  EXPECT_EQ(transition.error().Code(), ErrorCode::kAlreadyFrozen);

  auto role = model.DeclareRole("r");
  ASSERT_FALSE(role);
  EXPECT_EQ(role.error().Code(), ErrorCode::kAlreadyFrozen);

  auto arc = model.AddArc(*p, *t, 1);
  ASSERT_FALSE(arc);
  EXPECT_EQ(arc.error().Code(), ErrorCode::kAlreadyFrozen);

  EXPECT_EQ(model.PlaceCount(), 1U);
}

TEST_F(RegistryTest, ModelsHaveDistinctIds) {
  Model a("A");
  Model b("B");
  EXPECT_NE(a.Id(), b.Id());
}

// <math.h> declares a global ::finite(double) on glibc.
TEST_F(RegistryTest, BuildsAlongsideMathHeader) {
  Model model("Math");
  ASSERT_TRUE(model.DeclarePlace("p", {}));
  EXPECT_EQ(model.PlaceCount(), 1U);
  EXPECT_TRUE(std::isfinite(1.0));
}

TEST_F(RegistryTest, AssertFrozenReportsNotFrozen) {
  Model model("Registry");
  auto ok = model.AssertFrozen();
  ASSERT_FALSE(ok);
  EXPECT_EQ(ok.error().Code(), ErrorCode::kNotFrozen);

  ASSERT_TRUE(model.Freeze());
  EXPECT_TRUE(model.AssertFrozen());
}

}  // namespace
}  // namespace fnt::model
