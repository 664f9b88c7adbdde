#pragma once

#include "acolib/core/common.hpp"

namespace acolib::core {

    // Opaque node index. The colony never interprets its meaning.
    using TNode = std::size_t;

    //--------------------------------------------------------------------------
    // Struct: TEdgeKey
    // Description: Canonical identity of an unordered node pair {a, b}
    //--------------------------------------------------------------------------
    struct TEdgeKey
    {
        TNode lo = 0;                           // smaller endpoint
        TNode hi = 0;                           // larger endpoint

        static TEdgeKey make(TNode a, TNode b) {
            return (a < b) ? TEdgeKey{a, b} : TEdgeKey{b, a};
        }

        bool operator==(const TEdgeKey&) const = default;
    };

    struct TEdgeKeyHash
    {
        std::size_t operator()(const TEdgeKey& k) const noexcept {
            std::size_t h = std::hash<TNode>{}(k.lo);
            return h ^ (std::hash<TNode>{}(k.hi) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };

    //--------------------------------------------------------------------------
    // Struct: TEdge
    // Description: Double-buffered pheromone level of one edge. The active
    // slot is chosen by the colony-wide flag, the other slot holds the trail
    // of the previous generation.
    //--------------------------------------------------------------------------
    struct TEdge
    {
        std::array<double, 2> level{0.0, 0.0};

        double  pheromone(bool useSecond) const { return level[useSecond ? 1 : 0]; }
        double& pheromone(bool useSecond)       { return level[useSecond ? 1 : 0]; }

        // Seeds the slot about to become active with the residual trail.
        void carryForward(bool intoSecond) {
            if (intoSecond) level[1] = level[0];
            else            level[0] = level[1];
        }
    };

    //--------------------------------------------------------------------------
    // Struct: TBestPath
    // Description: Best path found across all generations. A quality of 0
    // means that no path was recorded yet.
    //--------------------------------------------------------------------------
    struct TBestPath
    {
        double quality = 0.0;                   // cumulative raw quality
        TNode start = 0;                        // node the ant was reset to
        std::vector<TNode> nodes;               // nodes reached by the ant's moves
    };

    // Read-only view returned by Colony::bestPath()
    struct TPathView
    {
        double quality;
        TNode start;
        std::span<const TNode> nodes;
    };

    //--------------------------------------------------------------------------
    // Struct: TScoringParams
    // Description: Parameters of the power-law scoring policy
    //--------------------------------------------------------------------------
    struct TScoringParams
    {
        double alpha = 1.0;                     // pheromone exponent
        double beta = 2.0;                      // raw quality exponent
        double q = 1.0;                         // deposit factor
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration variables of the driver
    //--------------------------------------------------------------------------
    struct TRunData
    {
        int MAXRUNS = 1;                        // number of independent runs
        int generations = 200;                  // generations per run
        int ants = 20;                          // ants per generation
        int debug = 0;                          // 1 - log improvements on screen
        int cities = 30;                        // size of the generated instance
        bool closeTour = true;                  // return to the start city
        long long seed = -1;                    // -1 - time based seed
        TScoringParams scoring;
    };

} // namespace acolib::core
