#include <gtest/gtest.h>
#include "sync/ConflictDetector.hpp"

#include <optional>
#include <string>

using namespace osync::sync;
using namespace osync::sync::model;

namespace {

const std::optional<std::string> NONE = std::nullopt;
const std::optional<std::string> H0 = "h0";
const std::optional<std::string> H1 = "h1";
const std::optional<std::string> H2 = "h2";

Snapshot snap(std::initializer_list<std::pair<std::string, std::string>> entries) {
    Snapshot s;
    for (const auto& [path, hash] : entries) s.insert({path, hash, 0, 0});
    return s;
}

}

TEST(ConflictDetectorTest, IdenticalEverywhereIsUnchanged) {
    EXPECT_EQ(ConflictDetector::classify(H0, H0, H0), ChangeType::Unchanged);
}

TEST(ConflictDetectorTest, LocalEditIsLocalOnly) {
    EXPECT_EQ(ConflictDetector::classify(H1, H0, H0), ChangeType::LocalOnlyChanged);
}

TEST(ConflictDetectorTest, MirrorEditIsMirrorOnly) {
    EXPECT_EQ(ConflictDetector::classify(H0, H1, H0), ChangeType::MirrorOnlyChanged);
}

TEST(ConflictDetectorTest, DivergentEditsConflict) {
    EXPECT_EQ(ConflictDetector::classify(H1, H2, H0), ChangeType::Conflict);
}

TEST(ConflictDetectorTest, ConvergedEditsAreUnchanged) {
    EXPECT_EQ(ConflictDetector::classify(H1, H1, H0), ChangeType::Unchanged);
}

TEST(ConflictDetectorTest, NewOnOneSideIsAdded) {
    EXPECT_EQ(ConflictDetector::classify(H1, NONE, NONE), ChangeType::Added);
    EXPECT_EQ(ConflictDetector::classify(NONE, H1, NONE), ChangeType::Added);
}

TEST(ConflictDetectorTest, SameNewFileOnBothSidesIsUnchanged) {
    EXPECT_EQ(ConflictDetector::classify(H1, H1, NONE), ChangeType::Unchanged);
}

TEST(ConflictDetectorTest, DifferentNewFilesOnBothSidesConflict) {
    EXPECT_EQ(ConflictDetector::classify(H1, H2, NONE), ChangeType::Conflict);
}

TEST(ConflictDetectorTest, LocalDeletionIsLocalOnly) {
    EXPECT_EQ(ConflictDetector::classify(NONE, H0, H0), ChangeType::LocalOnlyChanged);
}

TEST(ConflictDetectorTest, MirrorDeletionIsMirrorOnly) {
    EXPECT_EQ(ConflictDetector::classify(H0, NONE, H0), ChangeType::MirrorOnlyChanged);
}

TEST(ConflictDetectorTest, DeletionAgainstEditConflicts) {
    EXPECT_EQ(ConflictDetector::classify(NONE, H1, H0), ChangeType::Conflict);
    EXPECT_EQ(ConflictDetector::classify(H1, NONE, H0), ChangeType::Conflict);
}

TEST(ConflictDetectorTest, GoneEverywhereButBaselineIsDeleted) {
    EXPECT_EQ(ConflictDetector::classify(NONE, NONE, H0), ChangeType::Deleted);
}

TEST(ConflictDetectorTest, ConflictIsSymmetric) {
    for (const auto& [a, b] : {std::pair{H1, H2}, std::pair{NONE, H1}, std::pair{H1, NONE}}) {
        EXPECT_EQ(ConflictDetector::classify(a, b, H0), ConflictDetector::classify(b, a, H0));
    }
}

TEST(ConflictDetectorTest, ClassifiesUnionOfAllThreeSnapshots) {
    const auto local = snap({{"filament/a.json", "h1"}, {"filament/new.json", "n"}, {"machine/m.json", "h0"}});
    const auto mirror = snap({{"filament/a.json", "h0"}, {"process/p.json", "p2"}, {"machine/m.json", "h0"}});
    const auto baseline = snap({{"filament/a.json", "h0"}, {"process/p.json", "p1"}, {"machine/m.json", "h0"},
                                {"filament/gone.json", "g"}});

    const auto changes = ConflictDetector::classify(local, mirror, baseline);

    ASSERT_EQ(changes.size(), 5u);
    EXPECT_EQ(changes.find("filament/a.json")->type, ChangeType::LocalOnlyChanged);
    EXPECT_EQ(changes.find("filament/new.json")->type, ChangeType::Added);
    EXPECT_TRUE(changes.find("filament/new.json")->flowsToMirror());
    EXPECT_EQ(changes.find("process/p.json")->type, ChangeType::Conflict);
    EXPECT_EQ(changes.find("machine/m.json")->type, ChangeType::Unchanged);
    EXPECT_EQ(changes.find("filament/gone.json")->type, ChangeType::Deleted);

    EXPECT_TRUE(changes.hasConflicts());
    EXPECT_EQ(changes.conflicts(), std::vector<std::string>{"process/p.json"});
    EXPECT_EQ(changes.pending(), 4u);
}

TEST(ConflictDetectorTest, MirrorSideAdditionFlowsToLocal) {
    const auto changes = ConflictDetector::classify(snap({}), snap({{"filament/x.json", "x"}}), snap({}));
    const auto* c = changes.find("filament/x.json");

    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->type, ChangeType::Added);
    EXPECT_TRUE(c->flowsToLocal());
    EXPECT_FALSE(c->flowsToMirror());
}

TEST(ConflictDetectorTest, ClassificationIsPure) {
    const auto local = snap({{"filament/a.json", "h1"}});
    const auto mirror = snap({{"filament/a.json", "h0"}});
    const auto baseline = snap({{"filament/a.json", "h0"}});

    EXPECT_EQ(ConflictDetector::classify(local, mirror, baseline), ConflictDetector::classify(local, mirror, baseline));
}

TEST(ConflictDetectorTest, ChangeTypeNames) {
    EXPECT_EQ(toString(ChangeType::LocalOnlyChanged), "local-changed");
    EXPECT_EQ(toString(ChangeType::MirrorOnlyChanged), "mirror-changed");
    EXPECT_EQ(toString(ChangeType::Conflict), "conflict");
}
