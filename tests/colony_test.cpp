#include "acolib/core/colony.hpp"
#include "acolib/core/tsproblem.hpp"

#include <gtest/gtest.h>

using namespace acolib::core;

namespace {

    // Every node i offers the listed (quality, target) pairs, in order.
    class FixedTraversal : public ITraversal {
    public:
        using Offers = std::vector<std::vector<std::pair<double, TNode>>>;

        FixedTraversal(TNode start, Offers offers) : start_(start), offers_(std::move(offers)) {}

        TNode reset() override {
            resets++;
            return start_;
        }

        void targets(TNode node, const TargetSink& sink) const override {
            if (node >= offers_.size()) return;
            for (const auto& [quality, target] : offers_[node]) {
                sink(quality, target);
            }
        }

        void walkTo(TNode node) override { walked.push_back(node); }

        int resets = 0;
        std::vector<TNode> walked;

    private:
        TNode start_;
        Offers offers_;
    };

    // 0 -> 1 -> ... -> n-1, quality 1 per edge
    class ChainTraversal : public ITraversal {
    public:
        explicit ChainTraversal(TNode n) : n_(n) {}

        TNode reset() override { return 0; }

        void targets(TNode node, const TargetSink& sink) const override {
            if (node + 1 < n_) sink(1.0, node + 1);
        }

        void walkTo(TNode) override {}

    private:
        TNode n_;
    };

    class AdditiveScoring : public IScoring {
    public:
        double edgeQuality(double quality, double pheromone) const override { return quality + pheromone; }
        double pheromonesDeposited(double totalQuality) const override { return totalQuality; }
    };

    // pheromone repels instead of attracting
    class RepellingScoring : public IScoring {
    public:
        double edgeQuality(double quality, double pheromone) const override { return quality - pheromone; }
        double pheromonesDeposited(double totalQuality) const override { return totalQuality; }
    };

    class NaNScoring : public IScoring {
    public:
        double edgeQuality(double quality, double pheromone) const override {
            return (quality == 2.0) ? std::numeric_limits<double>::quiet_NaN() : quality + pheromone;
        }
        double pheromonesDeposited(double totalQuality) const override { return totalQuality; }
    };

    FixedTraversal SingleEdge() {
        return FixedTraversal(0, {{{10.0, 1}}, {}});
    }

    std::vector<TNode> Nodes(const TPathView& view) {
        return std::vector<TNode>(view.nodes.begin(), view.nodes.end());
    }

} // namespace

TEST(EdgeKeyTest, CanonicalizationIsOrderIndependent) {
    EXPECT_EQ(TEdgeKey::make(3, 7), TEdgeKey::make(7, 3));
    EXPECT_EQ(TEdgeKey::make(3, 7).lo, 3u);
    EXPECT_EQ(TEdgeKey::make(7, 3).hi, 7u);
    EXPECT_EQ(TEdgeKeyHash{}(TEdgeKey::make(1, 9)), TEdgeKeyHash{}(TEdgeKey::make(9, 1)));
}

TEST(ColonyTest, NewColonyHasNoBestPath) {
    Colony colony;
    EXPECT_FALSE(colony.bestPath().has_value());
    EXPECT_EQ(colony.edgeCount(), 0u);
    EXPECT_FALSE(colony.useSecondBuffer());
}

TEST(ColonyTest, ThreeAntsOnSingleEdge) {
    Colony colony;
    FixedTraversal traversal = SingleEdge();
    AdditiveScoring scoring;

    colony.runGeneration(3, traversal, scoring);

    EXPECT_EQ(traversal.resets, 3);
    EXPECT_DOUBLE_EQ(colony.trailLevel(0, 1), 30.0);

    auto best = colony.bestPath();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->quality, 10.0);
    EXPECT_EQ(best->start, 0u);
    EXPECT_EQ(Nodes(*best), std::vector<TNode>({1}));
}

TEST(ColonyTest, BestPathRemembersStartNode) {
    Colony colony;
    // 2 -> 0 -> 1
    FixedTraversal traversal(2, {{{4.0, 1}}, {}, {{3.0, 0}}});
    AdditiveScoring scoring;

    colony.runGeneration(1, traversal, scoring);

    auto best = colony.bestPath();
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->start, 2u);
    EXPECT_EQ(Nodes(*best), std::vector<TNode>({0, 1}));
    EXPECT_DOUBLE_EQ(colony.trailLevel(2, 0), 7.0);
}

TEST(ColonyTest, PheromoneAccumulatesPerAnt) {
    for (std::size_t ants : {1u, 4u, 11u}) {
        Colony colony;
        FixedTraversal traversal = SingleEdge();
        AdditiveScoring scoring;

        colony.runGeneration(ants, traversal, scoring);
        EXPECT_DOUBLE_EQ(colony.trailLevel(0, 1), ants * scoring.pheromonesDeposited(10.0));
    }
}

TEST(ColonyTest, EdgeReadInEitherOrderAddressesSameRecord) {
    Colony colony;
    FixedTraversal traversal = SingleEdge();
    AdditiveScoring scoring;

    colony.runGeneration(2, traversal, scoring);

    EXPECT_EQ(colony.edgeCount(), 1u);
    EXPECT_EQ(colony.findEdge(0, 1), colony.findEdge(1, 0));
    EXPECT_DOUBLE_EQ(colony.trailLevel(1, 0), colony.trailLevel(0, 1));
    EXPECT_EQ(colony.findEdge(0, 2), nullptr);
    EXPECT_DOUBLE_EQ(colony.trailLevel(0, 2), 0.0);
}

TEST(ColonyTest, EmptyGenerationOnlyFlipsBuffer) {
    Colony colony;
    FixedTraversal traversal = SingleEdge();
    AdditiveScoring scoring;

    colony.runGeneration(0, traversal, scoring);

    EXPECT_TRUE(colony.useSecondBuffer());
    EXPECT_EQ(colony.edgeCount(), 0u);
    EXPECT_EQ(traversal.resets, 0);
    EXPECT_FALSE(colony.bestPath().has_value());
}

TEST(ColonyTest, EmptyGenerationCarriesTrailForward) {
    Colony colony;
    FixedTraversal traversal = SingleEdge();
    AdditiveScoring scoring;

    colony.runGeneration(3, traversal, scoring);
    const TEdge* e = colony.findEdge(0, 1);
    ASSERT_NE(e, nullptr);
    EXPECT_DOUBLE_EQ(e->level[0], 30.0);
    EXPECT_DOUBLE_EQ(e->level[1], 0.0);
    EXPECT_TRUE(colony.useSecondBuffer());

    colony.runGeneration(0, traversal, scoring);
    EXPECT_DOUBLE_EQ(e->level[0], 30.0);
    EXPECT_DOUBLE_EQ(e->level[1], 30.0);
    EXPECT_FALSE(colony.useSecondBuffer());
    EXPECT_DOUBLE_EQ(colony.trailLevel(0, 1), 30.0);
}

TEST(ColonyTest, DepositsStartFromPreviousGeneration) {
    Colony colony;
    FixedTraversal traversal = SingleEdge();
    AdditiveScoring scoring;

    colony.runGeneration(3, traversal, scoring);
    colony.runGeneration(2, traversal, scoring);

    const TEdge* e = colony.findEdge(0, 1);
    ASSERT_NE(e, nullptr);
    EXPECT_DOUBLE_EQ(e->level[0], 30.0);
    EXPECT_DOUBLE_EQ(e->level[1], 50.0);
    EXPECT_DOUBLE_EQ(colony.trailLevel(0, 1), 50.0);
}

TEST(ColonyTest, DepositsFollowWholeWalk) {
    Colony colony;
    ChainTraversal traversal(4);
    AdditiveScoring scoring;

    colony.runGeneration(1, traversal, scoring);

    auto best = colony.bestPath();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->quality, 3.0);
    EXPECT_EQ(Nodes(*best), std::vector<TNode>({1, 2, 3}));

    EXPECT_DOUBLE_EQ(colony.trailLevel(0, 1), 3.0);
    EXPECT_DOUBLE_EQ(colony.trailLevel(1, 2), 3.0);
    EXPECT_DOUBLE_EQ(colony.trailLevel(2, 3), 3.0);
    EXPECT_EQ(colony.edgeCount(), 3u);
}

TEST(ColonyTest, AntWithoutMovesDepositsNothing) {
    Colony colony;
    FixedTraversal traversal(5, {});
    AdditiveScoring scoring;

    colony.runGeneration(2, traversal, scoring);

    EXPECT_EQ(colony.edgeCount(), 0u);
    EXPECT_TRUE(traversal.walked.empty());
    // zero quality never beats the sentinel
    EXPECT_FALSE(colony.bestPath().has_value());
}

TEST(ColonyTest, ZeroQualityPathIsNotRecorded) {
    Colony colony;
    FixedTraversal traversal(0, {{{0.0, 1}}, {}});
    AdditiveScoring scoring;

    colony.runGeneration(1, traversal, scoring);

    EXPECT_FALSE(colony.bestPath().has_value());
    EXPECT_EQ(traversal.walked, std::vector<TNode>({1}));
}

TEST(ColonyTest, FirstEnumeratedCandidateWinsTies) {
    Colony colony;
    FixedTraversal traversal(0, {{{1.0, 2}, {1.0, 1}}, {}, {}});
    RepellingScoring scoring;

    colony.runGeneration(1, traversal, scoring);

    EXPECT_EQ(traversal.walked, std::vector<TNode>({2}));
    // both candidates were looked at
    EXPECT_EQ(colony.edgeCount(), 2u);
}

TEST(ColonyTest, EarlierAntsInfluenceLaterAnts) {
    Colony colony;
    FixedTraversal traversal(0, {{{1.0, 1}, {1.5, 2}}, {}, {}});
    RepellingScoring scoring;

    colony.runGeneration(2, traversal, scoring);

    // first ant takes 2, its deposit pushes the second ant to 1
    EXPECT_EQ(traversal.walked, std::vector<TNode>({2, 1}));
    EXPECT_DOUBLE_EQ(colony.trailLevel(0, 2), 1.5);
    EXPECT_DOUBLE_EQ(colony.trailLevel(0, 1), 1.0);

    auto best = colony.bestPath();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->quality, 1.5);
    EXPECT_EQ(Nodes(*best), std::vector<TNode>({2}));
}

TEST(ColonyTest, SelectionUsesVisitScoreButAccumulatesRawQuality) {
    Colony colony;
    // the trail left on edge 0-1 outweighs the better raw quality of edge 0-2
    FixedTraversal first(0, {{{2.0, 1}}, {}});
    AdditiveScoring scoring;
    colony.runGeneration(1, first, scoring);
    colony.runGeneration(0, first, scoring);

    FixedTraversal second(0, {{{3.0, 2}, {2.0, 1}}, {}, {}});
    colony.runGeneration(1, second, scoring);

    EXPECT_EQ(second.walked, std::vector<TNode>({1}));
    auto best = colony.bestPath();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->quality, 2.0);
}

TEST(ColonyTest, NaNScoreDoesNotDisplaceMaximum) {
    Colony colony;
    FixedTraversal traversal(0, {{{1.0, 1}, {2.0, 2}}, {}, {}});
    NaNScoring scoring;

    colony.runGeneration(1, traversal, scoring);

    EXPECT_EQ(traversal.walked, std::vector<TNode>({1}));
}

TEST(ColonyTest, BestPathKeptWhenLaterAntsAreWorse) {
    Colony colony;
    AdditiveScoring scoring;

    ChainTraversal longChain(5);
    colony.runGeneration(1, longChain, scoring);

    ChainTraversal shortChain(2);
    colony.runGeneration(3, shortChain, scoring);

    auto best = colony.bestPath();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->quality, 4.0);
    EXPECT_EQ(Nodes(*best), std::vector<TNode>({1, 2, 3, 4}));
}

TEST(ColonyTest, BestQualityNeverDecreases) {
    const std::vector<TCity> cities = GenerateCities(12, 7);
    EuclideanTour tour(cities, 11);
    PowerLawScoring scoring(TScoringParams{1.0, 2.0, 1.0});
    Colony colony;

    double previous = 0.0;
    for (int g = 0; g < 25; g++) {
        colony.runGeneration(6, tour, scoring);
        auto best = colony.bestPath();
        ASSERT_TRUE(best.has_value());
        EXPECT_GE(best->quality, previous);
        previous = best->quality;
    }
}

TEST(ColonyTest, DeterministicPoliciesGiveIdenticalColonies) {
    const std::vector<TCity> cities = GenerateCities(10, 3);
    PowerLawScoring scoring(TScoringParams{1.0, 2.0, 0.5});

    EuclideanTour tourA(cities, 42);
    EuclideanTour tourB(cities, 42);
    Colony a;
    Colony b;

    for (int g = 0; g < 10; g++) {
        a.runGeneration(5, tourA, scoring);
        b.runGeneration(5, tourB, scoring);
    }

    ASSERT_TRUE(a.bestPath().has_value());
    ASSERT_TRUE(b.bestPath().has_value());
    EXPECT_DOUBLE_EQ(a.bestPath()->quality, b.bestPath()->quality);
    EXPECT_EQ(Nodes(*a.bestPath()), Nodes(*b.bestPath()));

    EXPECT_EQ(a.edgeCount(), b.edgeCount());
    for (TNode i = 0; i < cities.size(); i++) {
        for (TNode j = i + 1; j < cities.size(); j++) {
            const TEdge* ea = a.findEdge(i, j);
            const TEdge* eb = b.findEdge(i, j);
            ASSERT_EQ(ea == nullptr, eb == nullptr);
            if (ea) {
                EXPECT_EQ(ea->level, eb->level);
            }
        }
    }
}
