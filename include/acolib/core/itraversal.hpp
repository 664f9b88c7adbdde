#pragma once
#include "acolib/core/data.hpp"

namespace acolib::core {

    // Receives one (raw quality, target node) pair per reachable node
    using TargetSink = std::function<void(double quality, TNode target)>;

    // Abstract interface: where an ant currently stands and what the graph looks like
    class ITraversal {
        public:
            virtual ~ITraversal() = default;

            // Re-initializes the position and returns the ant's start node.
            virtual TNode reset() = 0;

            // Streams the nodes reachable from `node` and the raw quality of
            // visiting each. `node` is the node the traversal currently stands at.
            virtual void targets(TNode node, const TargetSink& sink) const = 0;

            // Moves to one of the nodes enumerated by the last targets() call.
            virtual void walkTo(TNode node) = 0;
    };

}
