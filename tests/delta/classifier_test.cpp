#include "deltacode/delta/classifier.hpp"

#include <gtest/gtest.h>

using deltacode::delta::DeltaClassifier;
using deltacode::delta::DeltaKind;
using deltacode::delta::MatchedPair;
using deltacode::inventory::AttributeMap;
using deltacode::inventory::FileRecord;
using deltacode::inventory::PathUtils;

namespace {

FileRecord make_record(const std::string& path, std::uint64_t size, const std::string& fingerprint,
                       AttributeMap attributes = {}) {
    return FileRecord(PathUtils::split(path), size, fingerprint, std::move(attributes));
}

} // namespace

class DeltaClassifierTest : public ::testing::Test {
protected:
    DeltaClassifier classifier{std::vector<std::string>{"license", "copyright"}};
};

TEST_F(DeltaClassifierTest, MovedCarriesSegmentPathDistance) {
    const auto old_record = make_record("a/b.txt", 10, "X");
    const auto new_record = make_record("a/c.txt", 10, "X");

    auto delta = classifier.classify(MatchedPair{DeltaKind::Moved, &old_record, &new_record});

    EXPECT_EQ(delta.kind, DeltaKind::Moved);
    EXPECT_EQ(delta.old_record, &old_record);
    EXPECT_EQ(delta.new_record, &new_record);
    EXPECT_DOUBLE_EQ(delta.factor("size_delta"), 0.0);
    EXPECT_DOUBLE_EQ(delta.factor("path_delta"), 1.0);
    EXPECT_DOUBLE_EQ(delta.factor("license_changed"), 0.0);
    EXPECT_DOUBLE_EQ(delta.factor("copyright_changed"), 0.0);
    EXPECT_DOUBLE_EQ(delta.score, 0.0);
}

TEST_F(DeltaClassifierTest, ModifiedCarriesAbsoluteSizeDifference) {
    const auto old_record = make_record("a.txt", 20, "X");
    const auto new_record = make_record("a.txt", 10, "Y");

    auto delta = classifier.classify(MatchedPair{DeltaKind::Modified, &old_record, &new_record});

    EXPECT_DOUBLE_EQ(delta.factor("size_delta"), 10.0);
    EXPECT_DOUBLE_EQ(delta.factor("path_delta"), 0.0);
}

TEST_F(DeltaClassifierTest, AddedAndRemovedUseFullSize) {
    const auto record = make_record("lib/new.c", 300, "N", {{"license", "mit"}});

    auto added = classifier.classify(MatchedPair{DeltaKind::Added, nullptr, &record});
    EXPECT_DOUBLE_EQ(added.factor("size_delta"), 300.0);
    EXPECT_DOUBLE_EQ(added.factor("path_delta"), 0.0);
    EXPECT_DOUBLE_EQ(added.factor("license_changed"), 1.0);
    EXPECT_DOUBLE_EQ(added.factor("copyright_changed"), 0.0);

    auto removed = classifier.classify(MatchedPair{DeltaKind::Removed, &record, nullptr});
    EXPECT_DOUBLE_EQ(removed.factor("size_delta"), 300.0);
    EXPECT_DOUBLE_EQ(removed.factor("license_changed"), 1.0);
}

TEST_F(DeltaClassifierTest, AttributeChangesAreDetected) {
    const auto old_record = make_record("a.c", 5, "X", {{"license", "gpl-2.0"}, {"copyright", "Acme"}});
    const auto relicensed = make_record("a.c", 5, "Y", {{"license", "mit"}, {"copyright", "Acme"}});
    const auto dropped = make_record("a.c", 5, "Z", {{"license", "gpl-2.0"}});

    auto first = classifier.classify(MatchedPair{DeltaKind::Modified, &old_record, &relicensed});
    EXPECT_DOUBLE_EQ(first.factor("license_changed"), 1.0);
    EXPECT_DOUBLE_EQ(first.factor("copyright_changed"), 0.0);

    auto second = classifier.classify(MatchedPair{DeltaKind::Modified, &old_record, &dropped});
    EXPECT_DOUBLE_EQ(second.factor("license_changed"), 0.0);
    EXPECT_DOUBLE_EQ(second.factor("copyright_changed"), 1.0);
}

TEST_F(DeltaClassifierTest, EveryTrackedAttributeGetsAFactor) {
    const auto record = make_record("a.txt", 1, "X");
    auto delta = classifier.classify(MatchedPair{DeltaKind::Unmodified, &record, &record});

    ASSERT_EQ(delta.factors.size(), 4u);
    EXPECT_EQ(delta.factors.count("license_changed"), 1u);
    EXPECT_EQ(delta.factors.count("copyright_changed"), 1u);
    for (const auto& [name, value] : delta.factors) {
        EXPECT_DOUBLE_EQ(value, 0.0) << name;
    }
}

TEST(DeltaClassifierUntrackedTest, NoTrackedAttributesMeansOnlySizeAndPath) {
    DeltaClassifier classifier(std::vector<std::string>{});
    const auto old_record = make_record("a.txt", 1, "X", {{"license", "mit"}});
    const auto new_record = make_record("a.txt", 2, "Y", {{"license", "bsd"}});

    auto delta = classifier.classify(MatchedPair{DeltaKind::Modified, &old_record, &new_record});
    EXPECT_EQ(delta.factors.size(), 2u);
    EXPECT_EQ(delta.factors.count("license_changed"), 0u);
}

TEST_F(DeltaClassifierTest, ClassifyAllPreservesOrder) {
    const auto a = make_record("a", 1, "A");
    const auto b = make_record("b", 2, "B");

    auto deltas = classifier.classify_all({
        MatchedPair{DeltaKind::Added, nullptr, &a},
        MatchedPair{DeltaKind::Removed, &b, nullptr},
    });

    ASSERT_EQ(deltas.size(), 2u);
    EXPECT_EQ(deltas[0].kind, DeltaKind::Added);
    EXPECT_EQ(deltas[1].kind, DeltaKind::Removed);
}
