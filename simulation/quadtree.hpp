#ifndef KGVIZ_SIMULATION_QUADTREE_HPP
#define KGVIZ_SIMULATION_QUADTREE_HPP

#include "simulation_node.hpp"
#include <math/vec2.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace kgviz {

// Region quadtree over node positions, aggregating charge per cell
// for Barnes-Hut approximation of the many-body force.
class QuadTree {
public:
    static constexpr int32_t NO_CELL = -1;
    static constexpr int MAX_DEPTH = 32;

    struct Cell {
        Vec2 min;
        Vec2 max;
        Vec2 center_of_charge;
        float charge = 0.0f;                         // Sum of node strengths below
        std::array<int32_t, 4> children{NO_CELL, NO_CELL, NO_CELL, NO_CELL};
        std::vector<NodeIndex> points;               // Leaf contents

        bool is_leaf() const { return children[0] == NO_CELL; }
        float width() const { return max.x - min.x; }
    };

    // Build over all nodes, each carrying the same strength
    static QuadTree build(const std::vector<SimulationNode>& nodes, float strength);

    bool empty() const { return cells_.empty(); }
    size_t cell_count() const { return cells_.size(); }
    const Cell& root() const { return cells_.front(); }
    const Cell& cell(int32_t index) const { return cells_.at(static_cast<size_t>(index)); }

private:
    void insert(NodeIndex point, const Vec2& position);
    void subdivide(int32_t index);
    int quadrant(const Cell& cell, const Vec2& position) const;
    void accumulate(int32_t index, float strength);

    std::vector<Cell> cells_;
    std::vector<Vec2> positions_;
};

}  // namespace kgviz

#endif // KGVIZ_SIMULATION_QUADTREE_HPP
