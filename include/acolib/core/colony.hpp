/**
 * ACO Library - Colony
 * Owns the pheromone trails and the best path found so far
 */

#pragma once

#include "acolib/core/data.hpp"
#include "acolib/core/itraversal.hpp"
#include "acolib/core/iscoring.hpp"

namespace acolib::core {

    /**
    * @brief Generic ant colony simulation over a lazily discovered graph
    *
    * Edges are created the first time an ant looks at them. Each edge keeps
    * two pheromone slots; a colony-wide flag selects the active one and is
    * flipped once per generation.
    */
    class Colony {
    public:
        using EdgeTable = std::unordered_map<TEdgeKey, TEdge, TEdgeKeyHash>;

        Colony() = default;

        // -------------------------------------------------------------------------
        // SIMULATION
        // -------------------------------------------------------------------------

        /**
        * @brief Runs one generation of `antCount` ants
        *
        * Ants are simulated one after the other; deposits of earlier ants are
        * visible to later ants of the same generation.
        */
        void runGeneration(std::size_t antCount, ITraversal& traversal, const IScoring& scoring);

        /**
        * @brief Best path ever found, or std::nullopt if none was recorded
        */
        std::optional<TPathView> bestPath() const;

        // -------------------------------------------------------------------------
        // INSPECTION
        // -------------------------------------------------------------------------
        std::size_t edgeCount() const { return edges_.size(); }

        bool useSecondBuffer() const { return useSecondBuffer_; }

        // Does not create the edge.
        const TEdge* findEdge(TNode a, TNode b) const;

        // Level written by the most recent generation (0 for unknown edges).
        double trailLevel(TNode a, TNode b) const;

    private:
        void carryForward();
        TNode walkAnt(ITraversal& traversal, const IScoring& scoring, double& totalQuality);
        void depositPheromones(TNode start, double amount);

        TEdge& edge(TNode a, TNode b);

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        EdgeTable edges_;
        bool useSecondBuffer_ = false;
        TBestPath best_;
        std::vector<TNode> pathBuf_;            // scratch path of the current ant
    };

} // namespace acolib::core
