#include "quadtree.hpp"
#include <algorithm>
#include <cmath>

namespace kgviz {

QuadTree QuadTree::build(const std::vector<SimulationNode>& nodes, float strength) {
    QuadTree tree;
    if (nodes.empty()) {
        return tree;
    }

    tree.positions_.reserve(nodes.size());
    Vec2 lo = nodes.front().position;
    Vec2 hi = nodes.front().position;
    for (const auto& node : nodes) {
        tree.positions_.push_back(node.position);
        lo.x = std::min(lo.x, node.position.x);
        lo.y = std::min(lo.y, node.position.y);
        hi.x = std::max(hi.x, node.position.x);
        hi.y = std::max(hi.y, node.position.y);
    }

    // Square root cell, padded so points on the max edge stay inside
    float side = std::max({hi.x - lo.x, hi.y - lo.y, 1.0f}) + 1.0f;
    Cell root;
    root.min = lo;
    root.max = lo + Vec2(side, side);
    tree.cells_.push_back(root);

    for (const auto& node : nodes) {
        tree.insert(node.index, node.position);
    }

    tree.accumulate(0, strength);
    return tree;
}

int QuadTree::quadrant(const Cell& cell, const Vec2& position) const {
    Vec2 mid = (cell.min + cell.max) * 0.5f;
    int right = position.x >= mid.x ? 1 : 0;
    int bottom = position.y >= mid.y ? 1 : 0;
    return right + 2 * bottom;
}

void QuadTree::insert(NodeIndex point, const Vec2& position) {
    int32_t index = 0;
    int depth = 0;

    while (true) {
        if (!cells_[index].is_leaf()) {
            index = cells_[index].children[quadrant(cells_[index], position)];
            ++depth;
            continue;
        }

        // Coincident points share a leaf; so does everything past max depth
        const auto& points = cells_[index].points;
        if (points.empty() || depth >= MAX_DEPTH ||
            positions_[points.front()] == position) {
            cells_[index].points.push_back(point);
            return;
        }

        subdivide(index);
    }
}

void QuadTree::subdivide(int32_t index) {
    Vec2 lo = cells_[index].min;
    Vec2 hi = cells_[index].max;
    Vec2 mid = (lo + hi) * 0.5f;

    std::array<int32_t, 4> children{};
    for (int q = 0; q < 4; ++q) {
        Cell child;
        child.min = Vec2((q & 1) ? mid.x : lo.x, (q & 2) ? mid.y : lo.y);
        child.max = Vec2((q & 1) ? hi.x : mid.x, (q & 2) ? hi.y : mid.y);
        children[q] = static_cast<int32_t>(cells_.size());
        cells_.push_back(std::move(child));
    }

    // Existing points of a splittable leaf are coincident: one child takes all
    std::vector<NodeIndex> points = std::move(cells_[index].points);
    cells_[index].points.clear();
    cells_[index].children = children;
    for (NodeIndex point : points) {
        int q = quadrant(cells_[index], positions_[point]);
        cells_[children[q]].points.push_back(point);
    }
}

void QuadTree::accumulate(int32_t index, float strength) {
    Cell& cell = cells_[index];

    if (cell.is_leaf()) {
        if (cell.points.empty()) {
            return;
        }
        Vec2 sum;
        for (NodeIndex point : cell.points) {
            sum += positions_[point];
        }
        cell.center_of_charge = sum / static_cast<float>(cell.points.size());
        cell.charge = strength * static_cast<float>(cell.points.size());
        return;
    }

    std::array<int32_t, 4> children = cell.children;
    Vec2 weighted;
    float total_weight = 0.0f;
    float charge = 0.0f;
    for (int32_t child : children) {
        accumulate(child, strength);
        const Cell& c = cells_[child];
        float weight = std::abs(c.charge);
        weighted += c.center_of_charge * weight;
        total_weight += weight;
        charge += c.charge;
    }

    Cell& self = cells_[index];
    self.charge = charge;
    if (total_weight > 0.0f) {
        self.center_of_charge = weighted / total_weight;
    } else {
        self.center_of_charge = (self.min + self.max) * 0.5f;
    }
}

}  // namespace kgviz
