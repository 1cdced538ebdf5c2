#include "forces.hpp"
#include "quadtree.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace kgviz {

Vec2 Jiggle::direction() {
    std::uniform_real_distribution<float> angle_dist(0.0f, 2.0f * std::numbers::pi_v<float>);
    float angle = angle_dist(rng_);
    return {std::cos(angle), std::sin(angle)};
}

Vec2 Jiggle::offset(float amplitude) {
    std::uniform_real_distribution<float> dist(-amplitude, amplitude);
    float x = dist(rng_);
    float y = dist(rng_);
    return {x, y};
}

Vec2 nondegenerate(const Vec2& delta, float min_distance, Jiggle& jiggle) {
    if (delta.length_squared() > 0.0f) {
        return delta;
    }
    return jiggle.direction() * min_distance;
}

void apply_link_force(std::vector<SimulationNode>& nodes,
                      const std::vector<SimulationLink>& links,
                      float alpha,
                      int iterations,
                      float min_distance,
                      Jiggle& jiggle) {
    for (int iter = 0; iter < iterations; ++iter) {
        for (const auto& link : links) {
            auto& source = nodes[link.source];
            auto& target = nodes[link.target];

            Vec2 delta = (target.position + target.velocity) -
                         (source.position + source.velocity);
            delta = nondegenerate(delta, min_distance, jiggle);

            float length = delta.length();
            float correction = (length - link.distance) / length * alpha * link.strength;
            delta *= correction;

            target.velocity -= delta * link.bias;
            source.velocity += delta * (1.0f - link.bias);
        }
    }
}

namespace {

void accumulate_exact(std::vector<SimulationNode>& nodes,
                      float strength,
                      float min_distance_sq,
                      float min_distance,
                      float alpha,
                      Jiggle& jiggle) {
    for (auto& node : nodes) {
        for (const auto& other : nodes) {
            if (other.index == node.index) {
                continue;
            }
            Vec2 delta = nondegenerate(other.position - node.position, min_distance, jiggle);
            float l = std::max(delta.length_squared(), min_distance_sq);
            node.velocity += delta * (strength * alpha / l);
        }
    }
}

void accumulate_barnes_hut(std::vector<SimulationNode>& nodes,
                           float strength,
                           float theta,
                           float min_distance_sq,
                           float min_distance,
                           float alpha,
                           Jiggle& jiggle) {
    QuadTree tree = QuadTree::build(nodes, strength);
    if (tree.empty()) {
        return;
    }

    const float theta_sq = theta * theta;
    std::vector<int32_t> stack;

    for (auto& node : nodes) {
        stack.clear();
        stack.push_back(0);

        while (!stack.empty()) {
            const QuadTree::Cell& cell = tree.cell(stack.back());
            stack.pop_back();

            if (cell.charge == 0.0f) {
                continue;
            }

            if (!cell.is_leaf()) {
                Vec2 delta = cell.center_of_charge - node.position;
                float w = cell.width();
                float l = delta.length_squared();

                // Far enough away: treat the whole cell as one body
                if (w * w / theta_sq < l) {
                    l = std::max(l, min_distance_sq);
                    node.velocity += delta * (cell.charge * alpha / l);
                    continue;
                }

                for (int32_t child : cell.children) {
                    stack.push_back(child);
                }
                continue;
            }

            for (NodeIndex point : cell.points) {
                if (point == node.index) {
                    continue;
                }
                Vec2 delta = nondegenerate(nodes[point].position - node.position,
                                           min_distance, jiggle);
                float l = std::max(delta.length_squared(), min_distance_sq);
                node.velocity += delta * (strength * alpha / l);
            }
        }
    }
}

}  // namespace

void apply_many_body_force(std::vector<SimulationNode>& nodes,
                           float strength,
                           float theta,
                           float min_distance,
                           float alpha,
                           Jiggle& jiggle) {
    if (nodes.size() < 2 || strength == 0.0f) {
        return;
    }

    const float min_distance_sq = min_distance * min_distance;
    if (theta <= 0.0f) {
        accumulate_exact(nodes, strength, min_distance_sq, min_distance, alpha, jiggle);
    } else {
        accumulate_barnes_hut(nodes, strength, theta, min_distance_sq, min_distance, alpha, jiggle);
    }
}

void apply_center_force(std::vector<SimulationNode>& nodes,
                        const Vec2& center,
                        float strength) {
    if (nodes.empty()) {
        return;
    }

    Vec2 sum;
    for (const auto& node : nodes) {
        sum += node.position;
    }
    Vec2 shift = (sum / static_cast<float>(nodes.size()) - center) * strength;

    for (auto& node : nodes) {
        node.position -= shift;
    }
}

void apply_collision_force(std::vector<SimulationNode>& nodes,
                           float padding,
                           float strength,
                           int iterations,
                           float min_distance,
                           Jiggle& jiggle) {
    for (int iter = 0; iter < iterations; ++iter) {
        for (size_t i = 0; i < nodes.size(); ++i) {
            auto& a = nodes[i];
            const float ra = a.radius + padding;

            for (size_t j = i + 1; j < nodes.size(); ++j) {
                auto& b = nodes[j];
                const float rb = b.radius + padding;
                const float reach = ra + rb;

                Vec2 delta = (a.position + a.velocity) - (b.position + b.velocity);
                if (delta.length_squared() >= reach * reach) {
                    continue;
                }

                delta = nondegenerate(delta, min_distance, jiggle);
                float length = delta.length();
                delta *= (reach - length) / length * strength;

                // Share of the push taken by a: the larger b, the more a moves
                float share = (rb * rb) / (ra * ra + rb * rb);
                a.velocity += delta * share;
                b.velocity -= delta * (1.0f - share);
            }
        }
    }
}

void apply_cluster_force(std::vector<SimulationNode>& nodes,
                         const TypeAnchors& anchors,
                         const Vec2& fallback,
                         float strength,
                         float alpha) {
    for (auto& node : nodes) {
        auto it = anchors.find(node.type);
        const Vec2& anchor = it != anchors.end() ? it->second : fallback;
        node.velocity += (anchor - node.position) * (strength * alpha);
    }
}

}  // namespace kgviz
