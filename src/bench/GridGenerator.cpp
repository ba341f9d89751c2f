#include "meetpoint/bench/GridGenerator.hpp"

#include <algorithm>
#include <iterator>
#include <random>
#include <utility>
#include <vector>

namespace meetpoint::bench {

namespace {

double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

} // namespace

pf::CellGrid generate_grid(const GridSpec& spec)
{
    if (spec.rows <= 0 || spec.cols <= 0)
        return {};

    const std::size_t total = static_cast<std::size_t>(spec.rows) * static_cast<std::size_t>(spec.cols);
    std::vector<pf::CellKind> kinds(total, pf::CellKind::Empty);
    std::mt19937 rng(spec.seed);

    std::vector<pf::NodeId> all(total);
    for (std::size_t i = 0; i < total; ++i) all[i] = static_cast<pf::NodeId>(i);

    const auto numHouses = static_cast<std::size_t>(static_cast<double>(total) * clamp01(spec.house_density));
    std::vector<pf::NodeId> picked;
    picked.reserve(numHouses);
    std::sample(all.begin(), all.end(), std::back_inserter(picked), numHouses, rng);
    for (pf::NodeId id : picked) kinds[id] = pf::CellKind::House;

    if (spec.obstacle_density > 0.0) {
        std::vector<pf::NodeId> stillEmpty;
        stillEmpty.reserve(total - picked.size());
        for (pf::NodeId id : all)
            if (kinds[id] == pf::CellKind::Empty) stillEmpty.push_back(id);

        const auto numObstacles = static_cast<std::size_t>(static_cast<double>(stillEmpty.size()) * clamp01(spec.obstacle_density));
        picked.clear();
        std::sample(stillEmpty.begin(), stillEmpty.end(), std::back_inserter(picked), numObstacles, rng);
        for (pf::NodeId id : picked) kinds[id] = pf::CellKind::Obstacle;
    }

    return pf::CellGrid(spec.rows, spec.cols, std::move(kinds));
}

} // namespace meetpoint::bench
