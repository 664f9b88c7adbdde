#include "acolib/core/colony.hpp"

namespace acolib::core {

    // -----------------------------------------------------------------------------
    // Generation loop
    // -----------------------------------------------------------------------------

    void Colony::runGeneration(std::size_t antCount, ITraversal& traversal, const IScoring& scoring)
    {
        carryForward();

        for (std::size_t ant = 0; ant < antCount; ant++)
        {
            pathBuf_.clear();

            double totalQuality = 0.0;
            TNode start = walkAnt(traversal, scoring, totalQuality);

            double deposit = scoring.pheromonesDeposited(totalQuality);

            // an ant that never moved records its terminal node and lays nothing
            if (pathBuf_.empty()) {
                pathBuf_.push_back(start);
            }
            else {
                depositPheromones(start, deposit);
            }

            // strict improvement only, ties keep the older path
            if (totalQuality > best_.quality) {
                best_.quality = totalQuality;
                best_.start = start;
                std::swap(best_.nodes, pathBuf_);
            }
        }

        useSecondBuffer_ = !useSecondBuffer_;
    }

    void Colony::carryForward()
    {
        for (auto& [key, e] : edges_) {
            e.carryForward(useSecondBuffer_);
        }
    }

    TNode Colony::walkAnt(ITraversal& traversal, const IScoring& scoring, double& totalQuality)
    {
        const TNode start = traversal.reset();
        TNode current = start;

        while (true)
        {
            bool found = false;
            double bestVisit = 0.0;
            double bestQuality = 0.0;
            TNode choice = current;

            traversal.targets(current, [&](double quality, TNode target) {
                double pheromone = edge(current, target).pheromone(useSecondBuffer_);
                double visit = scoring.edgeQuality(quality, pheromone);

                // first enumerated candidate wins ties; a NaN never displaces a maximum
                if (!found || visit > bestVisit) {
                    found = true;
                    bestVisit = visit;
                    bestQuality = quality;
                    choice = target;
                }
            });

            // dead end, the walk is over
            if (!found) break;

            totalQuality += bestQuality;
            current = choice;
            traversal.walkTo(current);
            pathBuf_.push_back(current);
        }

        return start;
    }

    void Colony::depositPheromones(TNode start, double amount)
    {
        TNode from = start;
        for (TNode to : pathBuf_) {
            edge(from, to).pheromone(useSecondBuffer_) += amount;
            from = to;
        }
    }

    // -----------------------------------------------------------------------------
    // Accessors
    // -----------------------------------------------------------------------------

    std::optional<TPathView> Colony::bestPath() const
    {
        if (best_.quality > 0.0) {
            return TPathView{best_.quality, best_.start, std::span<const TNode>(best_.nodes)};
        }
        return std::nullopt;
    }

    TEdge& Colony::edge(TNode a, TNode b)
    {
        return edges_[TEdgeKey::make(a, b)];
    }

    const TEdge* Colony::findEdge(TNode a, TNode b) const
    {
        auto it = edges_.find(TEdgeKey::make(a, b));
        return (it != edges_.end()) ? &it->second : nullptr;
    }

    double Colony::trailLevel(TNode a, TNode b) const
    {
        const TEdge* e = findEdge(a, b);
        return e ? e->pheromone(!useSecondBuffer_) : 0.0;
    }

} // namespace acolib::core
