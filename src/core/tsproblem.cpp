#include "acolib/core/tsproblem.hpp"

namespace acolib::core {

    namespace {
        // keeps coincident cities from producing infinite qualities
        constexpr double MIN_DISTANCE = 1e-9;
    }

    std::vector<TCity> GenerateCities(int count, unsigned int seed)
    {
        std::mt19937 gen(seed);
        std::uniform_real_distribution<double> coord(0.0, 1000.0);

        std::vector<TCity> cities(count);
        for (auto& c : cities) {
            c.x = coord(gen);
            c.y = coord(gen);
        }
        return cities;
    }

    double Distance(const TCity& a, const TCity& b)
    {
        return std::hypot(a.x - b.x, a.y - b.y);
    }

    // -----------------------------------------------------------------------------
    // EuclideanTour
    // -----------------------------------------------------------------------------

    EuclideanTour::EuclideanTour(std::vector<TCity> cities, unsigned int seed, bool closeTour)
        : cities_(std::move(cities)), rng_(seed), closeTour_(closeTour),
          visited_(cities_.size(), 0)
    {
        if (cities_.empty()) {
            throw std::invalid_argument("EuclideanTour requires at least one city");
        }
    }

    TNode EuclideanTour::reset()
    {
        std::fill(visited_.begin(), visited_.end(), 0);
        std::uniform_int_distribution<TNode> pick(0, cities_.size() - 1);

        start_ = pick(rng_);
        visited_[start_] = 1;
        numVisited_ = 1;
        closed_ = false;
        return start_;
    }

    void EuclideanTour::targets(TNode node, const TargetSink& sink) const
    {
        const TCity& from = cities_.at(node);

        if (numVisited_ < cities_.size()) {
            for (TNode j = 0; j < cities_.size(); j++) {
                if (visited_[j]) continue;
                sink(1.0 / std::max(Distance(from, cities_[j]), MIN_DISTANCE), j);
            }
            return;
        }

        // every city seen: go back home once
        if (closeTour_ && !closed_ && node != start_) {
            sink(1.0 / std::max(Distance(from, cities_[start_]), MIN_DISTANCE), start_);
        }
    }

    void EuclideanTour::walkTo(TNode node)
    {
        if (node >= cities_.size()) {
            throw std::invalid_argument("walkTo: city " + std::to_string(node) + " does not exist");
        }

        if (node == start_ && numVisited_ == cities_.size()) {
            closed_ = true;
        }
        else if (!visited_[node]) {
            visited_[node] = 1;
            numVisited_++;
        }
    }

    double EuclideanTour::TourLength(TNode start, std::span<const TNode> path) const
    {
        double length = 0.0;
        TNode from = start;
        for (TNode to : path) {
            length += Distance(cities_.at(from), cities_.at(to));
            from = to;
        }
        return length;
    }

    // -----------------------------------------------------------------------------
    // PowerLawScoring
    // -----------------------------------------------------------------------------

    double PowerLawScoring::edgeQuality(double quality, double pheromone) const
    {
        return std::pow(quality, params_.beta) * std::pow(1.0 + pheromone, params_.alpha);
    }

    double PowerLawScoring::pheromonesDeposited(double totalQuality) const
    {
        return params_.q * totalQuality;
    }

} // namespace acolib::core
