#ifndef KGVIZ_SIMULATION_FORCES_HPP
#define KGVIZ_SIMULATION_FORCES_HPP

#include "simulation_node.hpp"
#include <layout/type_anchors.hpp>
#include <math/vec2.hpp>
#include <cstdint>
#include <random>
#include <vector>

namespace kgviz {

// Seeded source of directions used to separate coincident nodes, so a
// run is reproducible for a given seed.
class Jiggle {
public:
    explicit Jiggle(uint32_t seed = 42) : rng_(seed) {}

    // Uniformly distributed unit vector
    Vec2 direction();

    // Uniform offset in [-amplitude, amplitude]^2
    Vec2 offset(float amplitude);

private:
    std::mt19937 rng_;
};

// Replace a zero separation vector by a random direction of length
// min_distance; non-zero vectors are returned unchanged.
Vec2 nondegenerate(const Vec2& delta, float min_distance, Jiggle& jiggle);

// Spring force: each link pulls its endpoints toward link.distance.
// Uses predicted positions (position + velocity), scaled by alpha.
void apply_link_force(std::vector<SimulationNode>& nodes,
                      const std::vector<SimulationLink>& links,
                      float alpha,
                      int iterations,
                      float min_distance,
                      Jiggle& jiggle);

// Many-body force: v += delta * strength * alpha / max(d^2, min_distance^2).
// Negative strength repels. theta > 0 enables Barnes-Hut approximation.
void apply_many_body_force(std::vector<SimulationNode>& nodes,
                           float strength,
                           float theta,
                           float min_distance,
                           float alpha,
                           Jiggle& jiggle);

// Centering: translate all nodes so their centroid moves toward center
void apply_center_force(std::vector<SimulationNode>& nodes,
                        const Vec2& center,
                        float strength);

// Collision: nodes closer than (radius_a + padding) + (radius_b + padding)
// are pushed apart, larger nodes moving less. Not scaled by alpha.
void apply_collision_force(std::vector<SimulationNode>& nodes,
                           float padding,
                           float strength,
                           int iterations,
                           float min_distance,
                           Jiggle& jiggle);

// Cluster force: pull each node toward its type anchor on both axes.
// Nodes whose type has no anchor are pulled toward fallback.
void apply_cluster_force(std::vector<SimulationNode>& nodes,
                         const TypeAnchors& anchors,
                         const Vec2& fallback,
                         float strength,
                         float alpha);

}  // namespace kgviz

#endif // KGVIZ_SIMULATION_FORCES_HPP
