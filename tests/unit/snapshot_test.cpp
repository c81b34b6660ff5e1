#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/model/dumper.hpp"
#include "finite/model/model.hpp"
#include "finite/model/snapshot.hpp"

namespace fnt::model {
namespace {

class SnapshotTest : public ::testing::Test {
 protected:
  // Two places, one transfer transition, one inhibited transition.
  static auto BuildFrozen() -> Model {
    Model model("Pipe");
    auto role = *model.DeclareRole("worker");
    auto in = *model.DeclarePlace("in", {.initial = 2, .capacity = 0});
    auto out = *model.DeclarePlace("out", {.initial = 0, .capacity = 3});
    auto transfer = *model.DeclareTransition("MOVE", {.role = role});
    auto fill = *model.DeclareTransition("FILL", {});
    EXPECT_TRUE(model.AddArc(in, transfer, 1));
    EXPECT_TRUE(model.AddArc(transfer, out, 1));
    EXPECT_TRUE(model.AddArc(fill, in, 1));
    EXPECT_TRUE(model.AddArc(out, fill, 3, ArcKind::kInhibitor));
    EXPECT_TRUE(model.Freeze());
    return model;
  }

  static constexpr const char* kPipeBytes =
      R"({"places":{"in":{"capacity":0,"initial":2,"offset":0},)"
      R"("out":{"capacity":3,"initial":0,"offset":1}},"schema":"Pipe",)"
      R"("transitions":{"FILL":{"delta":[1,0],)"
      R"("guards":[{"offset":1,"weight":3}],"role":""},)"
      R"("MOVE":{"delta":[-1,1],"role":"worker"}}})";
};

// =============================================================================
// Export
// =============================================================================

TEST_F(SnapshotTest, ExportRequiresFrozenModel) {
  Model model("Open");
  auto snapshot = model.Export();
  ASSERT_FALSE(snapshot);
  EXPECT_EQ(snapshot.error().Code(), ErrorCode::kNotFrozen);
}

TEST_F(SnapshotTest, ExportProjectsPlacesAndTransitions) {
  Model model = BuildFrozen();
  auto snapshot = model.Export();
  ASSERT_TRUE(snapshot);

  EXPECT_EQ(snapshot->schema, "Pipe");
  ASSERT_EQ(snapshot->PlaceCount(), 2U);
  EXPECT_EQ(snapshot->places.at("out").offset, 1U);
  EXPECT_EQ(snapshot->places.at("out").capacity, 3U);
  EXPECT_EQ(
      snapshot->transitions.at("MOVE").delta, (std::vector<int64_t>{-1, 1}));
  EXPECT_EQ(snapshot->transitions.at("MOVE").role, "worker");
  EXPECT_EQ(snapshot->transitions.at("FILL").role, "");
  EXPECT_TRUE(snapshot->transitions.at("MOVE").guards.empty());
  ASSERT_EQ(snapshot->transitions.at("FILL").guards.size(), 1U);
}

TEST_F(SnapshotTest, HelpersFollowOffsetOrder) {
  auto snapshot = BuildFrozen().Export();
  ASSERT_TRUE(snapshot);

  EXPECT_EQ(snapshot->InitialState(), (std::vector<int64_t>{2, 0}));
  EXPECT_EQ(snapshot->Capacities(), (std::vector<uint64_t>{0, 3}));
  EXPECT_EQ(
      snapshot->OrderedPlaceNames(), (std::vector<std::string>{"in", "out"}));
}

// =============================================================================
// Bytes
// =============================================================================

TEST_F(SnapshotTest, BytesAreCompactWithSortedKeys) {
  auto snapshot = BuildFrozen().Export();
  ASSERT_TRUE(snapshot);
  EXPECT_EQ(snapshot->ToBytes(), kPipeBytes);
}

TEST_F(SnapshotTest, ExportImportExportIsByteIdentical) {
  Model model = BuildFrozen();
  auto first = model.Export();
  ASSERT_TRUE(first);
  const std::string bytes = first->ToBytes();

  auto imported = Model::FromBytes(bytes);
  ASSERT_TRUE(imported) << imported.error().primary.message;
  auto second = imported->Export();
  ASSERT_TRUE(second);

  EXPECT_EQ(*first, *second);
  EXPECT_EQ(second->ToBytes(), bytes);
}

TEST_F(SnapshotTest, ImportedModelIsFrozenAndEmptyOfPendingState) {
  auto imported = Model::FromBytes(kPipeBytes);
  ASSERT_TRUE(imported);

  EXPECT_TRUE(imported->IsFrozen());
  EXPECT_TRUE(imported->IsImported());
  EXPECT_TRUE(imported->PendingArcs().empty());
  EXPECT_TRUE(imported->Vars().empty());
  EXPECT_TRUE(imported->Freeze());

  auto place = imported->DeclarePlace("extra", {});
  ASSERT_FALSE(place);
  EXPECT_EQ(place.error().Code(), ErrorCode::kAlreadyFrozen);
}

TEST_F(SnapshotTest, ImportRestoresOffsetsAndRoles) {
  auto imported = Model::FromBytes(kPipeBytes);
  ASSERT_TRUE(imported);

  auto out = imported->FindPlace("out");
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ((*imported)[*out].offset, 1U);

  auto move = imported->FindTransition("MOVE");
  ASSERT_TRUE(move.has_value());
  EXPECT_EQ(imported->RoleName((*imported)[*move].role), "worker");
}

// =============================================================================
// Malformed input
// =============================================================================

void ExpectMalformed(const std::string& bytes, const std::string& fragment) {
  auto snapshot = Snapshot::FromBytes(bytes);
  ASSERT_FALSE(snapshot) << "accepted: " << bytes;
  EXPECT_EQ(snapshot.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(snapshot.error().primary.message.find(fragment), std::string::npos)
      << snapshot.error().primary.message;
}

TEST_F(SnapshotTest, RejectsInvalidJson) {
  ExpectMalformed("{not json", "malformed snapshot");
}

TEST_F(SnapshotTest, RejectsMissingSchema) {
  ExpectMalformed(R"({"places":{},"transitions":{}})", "'schema'");
}

TEST_F(SnapshotTest, RejectsNegativeInitial) {
  ExpectMalformed(
      R"({"schema":"X","places":{"p":{"offset":0,"initial":-1,)"
      R"("capacity":0}},"transitions":{}})",
      "'initial'");
}

TEST_F(SnapshotTest, RejectsDuplicateOffsets) {
  ExpectMalformed(
      R"({"schema":"X","places":{)"
      R"("a":{"offset":0,"initial":0,"capacity":0},)"
      R"("b":{"offset":0,"initial":0,"capacity":0}},"transitions":{}})",
      "reuses offset");
}

TEST_F(SnapshotTest, RejectsGapInOffsets) {
  ExpectMalformed(
      R"({"schema":"X","places":{)"
      R"("a":{"offset":1,"initial":0,"capacity":0}},"transitions":{}})",
      "offset 1");
}

TEST_F(SnapshotTest, RejectsShortDelta) {
  ExpectMalformed(
      R"({"schema":"X","places":{)"
      R"("a":{"offset":0,"initial":0,"capacity":0},)"
      R"("b":{"offset":1,"initial":0,"capacity":0}},)"
      R"("transitions":{"T":{"delta":[1],"role":""}}})",
      "delta slots");
}

TEST_F(SnapshotTest, RejectsGuardOutOfRange) {
  ExpectMalformed(
      R"({"schema":"X","places":{)"
      R"("a":{"offset":0,"initial":0,"capacity":0}},)"
      R"("transitions":{"T":{"delta":[0],"role":"",)"
      R"("guards":[{"offset":4,"weight":1}]}}})",
      "guards unknown offset");
}

// =============================================================================
// Dumper
// =============================================================================

TEST_F(SnapshotTest, DumperListsPlacesInOffsetOrder) {
  auto snapshot = BuildFrozen().Export();
  ASSERT_TRUE(snapshot);

  std::ostringstream out;
  Dumper dumper(&out);
  dumper.Dump(*snapshot);

  const std::string expected =
      "Model Pipe {\n"
      "  places (2) {\n"
      "    [0] in initial=2 capacity=unbounded\n"
      "    [1] out initial=0 capacity=3\n"
      "  }\n"
      "  transitions (2) {\n"
      "    FILL role=\"\" delta=[1, 0]\n"
      "      inhibited by out >= 3\n"
      "    MOVE role=\"worker\" delta=[-1, 1]\n"
      "  }\n"
      "}\n";
  EXPECT_EQ(out.str(), expected);
}

}  // namespace
}  // namespace fnt::model
