#pragma once
#include "acolib/core/data.hpp"

namespace acolib::core {

    // Abstract interface: pure functions combining quality and pheromone
    class IScoring {
        public:
            virtual ~IScoring() = default;

            // Visit score of a candidate move. Must be deterministic.
            virtual double edgeQuality(double quality, double pheromone) const = 0;

            // Pheromone laid on every edge of a path with the given
            // cumulative raw quality. Must be non-negative.
            virtual double pheromonesDeposited(double totalQuality) const = 0;
    };

}
