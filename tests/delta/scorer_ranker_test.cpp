#include "deltacode/delta/ranker.hpp"
#include "deltacode/delta/scorer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using deltacode::delta::Delta;
using deltacode::delta::DeltaKind;
using deltacode::delta::FactorMap;
using deltacode::delta::Ranker;
using deltacode::delta::Scorer;
using deltacode::delta::ScoringWeights;
using deltacode::inventory::FileRecord;
using deltacode::inventory::PathUtils;

namespace {

FileRecord make_record(const std::string& path) {
    return FileRecord(PathUtils::split(path), 1, "X");
}

Delta make_delta(DeltaKind kind, const FileRecord* old_record, const FileRecord* new_record,
                 FactorMap factors, double score = 0.0) {
    Delta d;
    d.kind = kind;
    d.old_record = old_record;
    d.new_record = new_record;
    d.factors = std::move(factors);
    d.score = score;
    return d;
}

} // namespace

TEST(ScoringWeightsTest, DefaultTable) {
    const auto weights = ScoringWeights::defaults();
    EXPECT_DOUBLE_EQ(weights.weight_for("size_delta"), 0.001);
    EXPECT_DOUBLE_EQ(weights.weight_for("path_delta"), 1.0);
    EXPECT_DOUBLE_EQ(weights.weight_for("license_changed"), 30.0);
    EXPECT_DOUBLE_EQ(weights.weight_for("copyright_changed"), 20.0);
    EXPECT_DOUBLE_EQ(weights.weight_for("holder_changed"), 10.0);
    EXPECT_DOUBLE_EQ(weights.weight_for("unknown_factor"), 0.0);
}

TEST(ScorerTest, ScoreIsWeightedSum) {
    Scorer scorer(ScoringWeights::defaults());
    const auto record = make_record("a.txt");

    auto d = make_delta(DeltaKind::Modified, &record, &record,
                        {{"size_delta", 1000.0}, {"path_delta", 0.0},
                         {"license_changed", 1.0}, {"copyright_changed", 0.0}});
    EXPECT_DOUBLE_EQ(scorer.score(d), 31.0);
}

TEST(ScorerTest, WeightForUntrackedAttributeIsHarmless) {
    auto weights = ScoringWeights::defaults();
    weights.weights["ecc_changed"] = 500.0;
    Scorer scorer(weights);
    const auto record = make_record("a.txt");

    auto d = make_delta(DeltaKind::Moved, &record, &record, {{"size_delta", 0.0}, {"path_delta", 2.0}});
    EXPECT_DOUBLE_EQ(scorer.score(d), 2.0);
}

TEST(ScorerTest, ApplyFillsEveryScore) {
    Scorer scorer(ScoringWeights::defaults());
    const auto record = make_record("a.txt");
    std::vector<Delta> deltas{
        make_delta(DeltaKind::Added, nullptr, &record, {{"size_delta", 2000.0}}),
        make_delta(DeltaKind::Moved, &record, &record, {{"path_delta", 3.0}}),
    };

    scorer.apply(deltas);
    EXPECT_DOUBLE_EQ(deltas[0].score, 2.0);
    EXPECT_DOUBLE_EQ(deltas[1].score, 3.0);
}

TEST(RankerTest, CanonicalKeyUsesNameOrderAndFixedPrecision) {
    FactorMap factors{{"size_delta", 0.0}, {"path_delta", 1.0}};
    EXPECT_EQ(Ranker::canonical_key(factors), "path_delta=1.000000;size_delta=0.000000;");
    EXPECT_EQ(Ranker::canonical_key({}), "");
}

TEST(RankerTest, HigherScoreRanksFirst) {
    const auto a = make_record("a");
    const auto b = make_record("b");
    std::vector<Delta> deltas{
        make_delta(DeltaKind::Added, nullptr, &a, {{"size_delta", 1.0}}, 1.0),
        make_delta(DeltaKind::Added, nullptr, &b, {{"size_delta", 5.0}}, 5.0),
    };

    Ranker::rank(deltas);
    EXPECT_EQ(deltas[0].new_record, &b);
    EXPECT_EQ(deltas[1].new_record, &a);
}

TEST(RankerTest, EqualScoresOrderByFactorKey) {
    const auto a = make_record("a");
    const auto b = make_record("b");
    // Same score; "path_delta=..." sorts before "size_delta=..."
    std::vector<Delta> deltas{
        make_delta(DeltaKind::Added, nullptr, &a, {{"size_delta", 1000.0}}, 1.0),
        make_delta(DeltaKind::Moved, &b, &b, {{"path_delta", 1.0}}, 1.0),
    };

    Ranker::rank(deltas);
    EXPECT_EQ(deltas[0].kind, DeltaKind::Moved);
    EXPECT_EQ(deltas[1].kind, DeltaKind::Added);
}

TEST(RankerTest, EqualKeysOrderByPrimaryPathThenOldPath) {
    const auto a = make_record("a.txt");
    const auto b = make_record("b.txt");
    const auto c = make_record("c.txt");
    const FactorMap factors{{"size_delta", 0.0}};

    std::vector<Delta> deltas{
        make_delta(DeltaKind::Moved, &b, &c, factors),
        make_delta(DeltaKind::Added, nullptr, &c, factors),
        make_delta(DeltaKind::Unmodified, &a, &a, factors),
    };

    Ranker::rank(deltas);
    EXPECT_EQ(deltas[0].new_record, &a);
    // Same primary path c.txt: absent old side first
    EXPECT_EQ(deltas[1].kind, DeltaKind::Added);
    EXPECT_EQ(deltas[2].kind, DeltaKind::Moved);
}

TEST(RankerTest, OrderIsIndependentOfInputOrder) {
    const auto a = make_record("a");
    const auto b = make_record("b");
    const auto c = make_record("c");
    std::vector<Delta> deltas{
        make_delta(DeltaKind::Added, nullptr, &a, {{"size_delta", 1.0}}, 2.0),
        make_delta(DeltaKind::Removed, &b, nullptr, {{"size_delta", 1.0}}, 2.0),
        make_delta(DeltaKind::Moved, &c, &a, {{"path_delta", 1.0}}, 1.0),
        make_delta(DeltaKind::Unmodified, &c, &c, {{"size_delta", 0.0}}, 0.0),
    };

    auto expected = deltas;
    Ranker::rank(expected);

    std::sort(deltas.begin(), deltas.end(), [](const Delta& lhs, const Delta& rhs) {
        return lhs.primary().path_string() > rhs.primary().path_string();
    });
    do {
        auto shuffled = deltas;
        Ranker::rank(shuffled);
        for (std::size_t i = 0; i < expected.size(); ++i) {
            EXPECT_EQ(shuffled[i].kind, expected[i].kind);
            EXPECT_EQ(shuffled[i].old_record, expected[i].old_record);
            EXPECT_EQ(shuffled[i].new_record, expected[i].new_record);
        }
    } while (std::next_permutation(deltas.begin(), deltas.end(), &Ranker::ranks_before));

    for (std::size_t i = 0; i + 1 < expected.size(); ++i) {
        EXPECT_TRUE(Ranker::ranks_before(expected[i], expected[i + 1]));
        EXPECT_FALSE(Ranker::ranks_before(expected[i + 1], expected[i]));
    }
}
