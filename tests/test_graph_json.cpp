#include <gtest/gtest.h>
#include <serialization/graph_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/layout_json.hpp>
#include <filter/type_filter.hpp>
#include "test_helpers.hpp"
#include <stdexcept>

using namespace kgviz;
using Json = nlohmann::json;

namespace {

Json backend_payload() {
    return Json::parse(R"({
        "nodes": [
            {"id": "m1", "label": "Transformer", "node_type": "method", "size": 2.5,
             "metadata": {"confidence": 0.87, "section_id": "sec-3"}},
            {"id": "d1", "label": "WMT14", "node_type": "dataset"},
            {"id": 7, "node_type": "metric"}
        ],
        "edges": [
            {"source": "m1", "target": "d1", "relation": "evaluates_on", "weight": 2},
            {"source": "m1", "target": 7, "relation": "uses", "label": "measured by"},
            {"source": "m1", "target": "missing", "relation": "uses"},
            {"target": "d1", "relation": "uses"}
        ]
    })");
}

}  // namespace

TEST(GraphJsonTest, ReadsBackendPayload) {
    GraphData graph = graph_from_json(backend_payload());

    ASSERT_EQ(graph.node_count(), 3u);
    const GraphNode& m1 = graph.node("m1");
    EXPECT_EQ(m1.label, "Transformer");
    EXPECT_EQ(m1.type, "method");
    EXPECT_FLOAT_EQ(m1.size, 2.5f);
    ASSERT_TRUE(m1.confidence().has_value());
    EXPECT_DOUBLE_EQ(*m1.confidence(), 0.87);
    EXPECT_EQ(std::get<std::string>(m1.metadata.at("section_id")), "sec-3");
}

TEST(GraphJsonTest, MissingSizeUsesTypeDefault) {
    GraphData graph = graph_from_json(backend_payload());
    EXPECT_FLOAT_EQ(graph.node("d1").size, 2.0f);
    EXPECT_FLOAT_EQ(graph.node("7").size, 1.5f);
}

TEST(GraphJsonTest, NumericIdsAndDefaultLabel) {
    GraphData graph = graph_from_json(backend_payload());
    ASSERT_TRUE(graph.has_node("7"));
    EXPECT_EQ(graph.node("7").label, "7");
    EXPECT_FALSE(graph.node("7").confidence().has_value());
}

TEST(GraphJsonTest, DropsDanglingAndIncompleteEdges) {
    GraphData graph = graph_from_json(backend_payload());

    ASSERT_EQ(graph.edge_count(), 2u);
    EXPECT_EQ(graph.edges()[0].relation, "evaluates_on");
    EXPECT_FLOAT_EQ(graph.edges()[0].weight, 2.0f);
    EXPECT_EQ(graph.edges()[1].target, "7");
    EXPECT_EQ(graph.edges()[1].display_text(), "measured by");
    EXPECT_EQ(graph.edges()[0].display_text(), "evaluates_on");
}

TEST(GraphJsonTest, AcceptsPlainTypeKey) {
    Json j = {{"nodes", {{{"id", "a"}, {"type", "theory"}}}}};
    GraphData graph = graph_from_json(j);
    EXPECT_EQ(graph.node("a").type, "theory");
    EXPECT_FLOAT_EQ(graph.node("a").size, 2.0f);
    EXPECT_TRUE(graph.edges().empty());
}

TEST(GraphJsonTest, UnwrapsNestedPayloads) {
    Json envelope = {{"version", "0.1.0"}, {"data", backend_payload()}};
    EXPECT_EQ(graph_from_json(envelope).node_count(), 3u);

    Json exported = {{"paper", "x"}, {"knowledge_graph", backend_payload()}};
    EXPECT_EQ(graph_from_json(exported).node_count(), 3u);
}

TEST(GraphJsonTest, RejectsMalformedPayloads) {
    EXPECT_THROW(graph_from_json(Json::object()), std::runtime_error);
    EXPECT_THROW(graph_from_json(Json{{"nodes", "none"}}), std::runtime_error);
    EXPECT_THROW(graph_from_json(Json{{"nodes", {{{"label", "no id"}}}}}), std::runtime_error);
    EXPECT_THROW(graph_from_json(Json{{"nodes", {{{"id", true}}}}}), std::runtime_error);
}

TEST(GraphJsonTest, WritesBackendShape) {
    GraphData graph = graph_from_json(backend_payload());
    Json out = graph_to_json(graph);

    ASSERT_EQ(out["nodes"].size(), 3u);
    EXPECT_EQ(out["nodes"][0]["node_type"], "method");
    EXPECT_DOUBLE_EQ(out["nodes"][0]["metadata"]["confidence"].get<double>(), 0.87);
    EXPECT_EQ(out["edges"][1]["label"], "measured by");
    EXPECT_FALSE(out["edges"][0].contains("label"));

    GraphData reread = graph_from_json(out);
    EXPECT_EQ(reread.node_count(), graph.node_count());
    EXPECT_EQ(reread.edge_count(), graph.edge_count());
}

TEST(SerializedDataTest, RequiresDataSection) {
    Json j = {{"version", "1.0"}, {"step", "layout"}};
    EXPECT_THROW(j.get<kgviz::json::SerializedData>(), std::runtime_error);

    j["data"] = {{"nodes", Json::array()}};
    auto envelope = j.get<kgviz::json::SerializedData>();
    EXPECT_EQ(envelope.step, "layout");
    EXPECT_TRUE(envelope.timestamp.empty());
    EXPECT_TRUE(envelope.config.is_null());
}

TEST(SerializedDataTest, RejectsOtherMajorVersion) {
    Json j = {{"version", "2.3"}, {"step", "layout"}, {"data", Json::object()}};
    EXPECT_THROW(j.get<kgviz::json::SerializedData>(), std::runtime_error);

    j["version"] = "1.7";
    EXPECT_NO_THROW(j.get<kgviz::json::SerializedData>());
}

TEST(SerializedDataTest, EnvelopeCarriesStepAndSource) {
    auto envelope = kgviz::json::make_envelope("layout", "paper.json");
    envelope.data = {{"nodes", Json::array()}};
    Json j = envelope;

    EXPECT_EQ(j["version"], kgviz::json::FORMAT_VERSION);
    EXPECT_EQ(j["source_file"], "paper.json");
    EXPECT_FALSE(j["timestamp"].get<std::string>().empty());
    EXPECT_FALSE(j.contains("stats"));
}

TEST(LayoutJsonTest, SnapshotContainsNodes) {
    CanvasSize canvas;
    GraphData graph = test::paper_graph();
    VisibleGraph visible = TypeFilter(graph).apply(graph);
    ForceSimulation simulation(SimulationConfig{}, canvas);
    simulation.set_graph(visible, compute_type_anchors(visible.nodes, canvas));
    simulation.run_until_converged();

    Json layout = layout_to_json(simulation);

    ASSERT_EQ(layout["nodes"].size(), 5u);
    EXPECT_EQ(layout["nodes"][0]["id"], "p1");
    EXPECT_EQ(layout["nodes"][0]["position"].size(), 2u);
    EXPECT_FALSE(layout["nodes"][0]["pinned"].get<bool>());
    EXPECT_TRUE(layout["converged"].get<bool>());
    EXPECT_EQ(layout["canvas"]["width"], 900.0f);
    EXPECT_TRUE(layout["anchors"].contains("method"));
}
