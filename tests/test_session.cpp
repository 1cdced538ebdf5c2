#include <gtest/gtest.h>
#include <session/graph_session.hpp>
#include "test_helpers.hpp"
#include <stdexcept>

using namespace kgviz;
using namespace kgviz::test;

class SessionTest : public ::testing::Test {
protected:
    CountingOverlayHost overlays;
    VizConfig config;
    SessionCallbacks callbacks;

    std::vector<std::pair<std::string, bool>> toggles;
    std::vector<std::optional<NodeKey>> hovers;
    std::vector<DragPhase> drags;
    std::vector<float> alphas;

    void SetUp() override {
        callbacks.on_type_toggled = [this](const std::string& type, bool active) {
            toggles.emplace_back(type, active);
        };
        callbacks.on_node_hovered = [this](const std::optional<NodeKey>& id) {
            hovers.push_back(id);
        };
        callbacks.on_node_dragged = [this](const NodeKey&, DragPhase phase, const Vec2&) {
            drags.push_back(phase);
        };
        callbacks.on_tick = [this](float alpha) {
            alphas.push_back(alpha);
        };
    }

    static GraphData graph_with_confidence() {
        GraphData graph;
        GraphNode node = make_node("m1", "method", 2.5f);
        node.label = "Transformer";
        node.metadata["confidence"] = 0.87;
        graph.add_node(node);
        graph.add_node(make_node("d1", "dataset", 2.0f));
        graph.add_edge(make_edge("m1", "d1", "evaluates_on"));
        return graph;
    }

    static Vec2 screen_of(const GraphSession& session, const NodeKey& id) {
        return session.controller().transform().apply(session.simulation().position(id));
    }
};

TEST_F(SessionTest, TooltipAcquiredOnceAndReleased) {
    {
        GraphSession session(paper_graph(), overlays, config, callbacks);
        EXPECT_EQ(overlays.created, 1);
        EXPECT_EQ(overlays.destroyed, 0);
        ASSERT_NE(session.tooltip(), nullptr);
        EXPECT_FALSE(session.tooltip()->visible());
    }
    EXPECT_EQ(overlays.created, 1);
    EXPECT_EQ(overlays.destroyed, 1);
    EXPECT_TRUE(overlays.live.empty());
}

TEST_F(SessionTest, TooltipReleasedWhenUnwinding) {
    EXPECT_THROW({
        GraphSession session(paper_graph(), overlays, config, callbacks);
        session.run_until_converged();
        throw std::runtime_error("host failure");
    }, std::runtime_error);

    EXPECT_EQ(overlays.destroyed, 1);
    EXPECT_TRUE(overlays.live.empty());
}

TEST_F(SessionTest, SetDataReplacesTooltipAndState) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    session.run_until_converged();

    session.set_data(disjoint_clusters());

    EXPECT_EQ(overlays.created, 2);
    EXPECT_EQ(overlays.destroyed, 1);
    EXPECT_EQ(overlays.live.size(), 1u);
    EXPECT_EQ(session.simulation().node_count(), 6u);
    EXPECT_FALSE(session.simulation().has_node("m1"));
    EXPECT_TRUE(session.running());
    EXPECT_FLOAT_EQ(session.simulation().alpha(), 1.0f);
    EXPECT_EQ(session.filter().all_types().size(), 2u);
}

TEST_F(SessionTest, StartsRunningWithAllTypes) {
    GraphSession session(paper_graph(), overlays, config, callbacks);

    EXPECT_TRUE(session.running());
    EXPECT_FALSE(session.empty());
    EXPECT_EQ(session.anchors().size(), 4u);
    for (const auto& type : session.data().types()) {
        EXPECT_TRUE(session.is_type_active(type));
    }
}

TEST_F(SessionTest, ToggleTypeRefiltersAndReheats) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    session.run_until_converged();
    ASSERT_FALSE(session.running());

    EXPECT_FALSE(session.toggle_type("method"));

    EXPECT_EQ(session.visible().nodes.size(), 3u);
    EXPECT_TRUE(session.visible().edges.empty());
    EXPECT_EQ(session.anchors().size(), 3u);
    EXPECT_EQ(session.anchors().count("method"), 0u);
    EXPECT_EQ(session.simulation().node_count(), 3u);
    EXPECT_TRUE(session.running());
    EXPECT_FLOAT_EQ(session.simulation().alpha(), 1.0f);

    ASSERT_EQ(toggles.size(), 1u);
    EXPECT_EQ(toggles[0].first, "method");
    EXPECT_FALSE(toggles[0].second);

    EXPECT_TRUE(session.toggle_type("method"));
    EXPECT_EQ(session.visible().nodes.size(), 5u);
    EXPECT_EQ(toggles.size(), 2u);
}

TEST_F(SessionTest, SetTypeActiveWithoutChangeIsSilent) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    EXPECT_TRUE(session.set_type_active("method", true));
    EXPECT_TRUE(toggles.empty());
}

TEST_F(SessionTest, HidingEverythingIsEmpty) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    std::vector<std::string> types = session.data().types();
    for (const auto& type : types) {
        session.set_type_active(type, false);
    }

    EXPECT_TRUE(session.empty());
    RecordingCanvas canvas;
    EXPECT_EQ(session.render(canvas), RenderStatus::Empty);
    EXPECT_TRUE(canvas.has_text(config.render.empty_message));
}

TEST_F(SessionTest, HoverShowsTooltip) {
    GraphSession session(graph_with_confidence(), overlays, config, callbacks);
    session.run_until_converged();

    Vec2 pointer = screen_of(session, "m1");
    session.pointer_move(pointer);

    ASSERT_EQ(hovers.size(), 1u);
    EXPECT_EQ(hovers[0], std::optional<NodeKey>("m1"));

    const Tooltip* tooltip = session.tooltip();
    ASSERT_NE(tooltip, nullptr);
    EXPECT_TRUE(tooltip->visible());
    EXPECT_EQ(tooltip->content().title, "Transformer");
    EXPECT_EQ(tooltip->content().subtitle, "Method \xC2\xB7 87%");
    EXPECT_FLOAT_EQ(tooltip->content().position.x, pointer.x + 12.0f);
    EXPECT_FLOAT_EQ(tooltip->content().position.y, pointer.y - 10.0f);
    EXPECT_TRUE(overlays.any_visible());

    session.pointer_leave();
    EXPECT_FALSE(session.tooltip()->visible());
    EXPECT_FALSE(overlays.any_visible());
    EXPECT_FALSE(hovers.back().has_value());
}

TEST_F(SessionTest, TooltipWithoutConfidence) {
    GraphSession session(graph_with_confidence(), overlays, config, callbacks);
    session.run_until_converged();

    session.pointer_move(screen_of(session, "d1"));
    ASSERT_TRUE(session.tooltip()->visible());
    EXPECT_EQ(session.tooltip()->content().subtitle, "Dataset");
}

TEST_F(SessionTest, DragReportsPhases) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    session.run_until_converged();

    session.pointer_down(screen_of(session, "d1"));
    session.pointer_move(Vec2(100.0f, 100.0f));
    session.pointer_up(Vec2(100.0f, 100.0f));

    std::vector<DragPhase> expected{DragPhase::Start, DragPhase::Move, DragPhase::End};
    EXPECT_EQ(drags, expected);
}

TEST_F(SessionTest, HidingDraggedNodeEndsDrag) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    session.run_until_converged();

    session.pointer_down(screen_of(session, "m1"));
    session.toggle_type("method");

    std::vector<DragPhase> expected{DragPhase::Start, DragPhase::End};
    EXPECT_EQ(drags, expected);
    EXPECT_EQ(session.controller().mode(), PointerMode::Idle);

    // Later pointer motion is plain hover
    session.pointer_move(Vec2(10.0f, 10.0f));
    EXPECT_EQ(drags.size(), 2u);
}

TEST_F(SessionTest, TickCallbackReportsAlpha) {
    GraphSession session(paper_graph(), overlays, config, callbacks);

    EXPECT_TRUE(session.on_frame());
    session.step();

    ASSERT_EQ(alphas.size(), 2u);
    EXPECT_LT(alphas[1], alphas[0]);
    EXPECT_FLOAT_EQ(alphas[1], session.simulation().alpha());
}

TEST_F(SessionTest, StopHaltsFrames) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    session.stop();
    EXPECT_FALSE(session.on_frame());
    EXPECT_TRUE(alphas.empty());
}

TEST_F(SessionTest, ResizeMovesAnchors) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    Vec2 before = session.anchors().at("method");

    session.resize(CanvasSize{1800.0f, 1200.0f});

    Vec2 after = session.anchors().at("method");
    EXPECT_NE(before, after);
    EXPECT_EQ(session.simulation().canvas().width, 1800.0f);
    EXPECT_EQ(session.simulation().anchors().at("method"), after);
}

TEST_F(SessionTest, RenderDrawsLegendForAllTypes) {
    GraphSession session(paper_graph(), overlays, config, callbacks);
    session.toggle_type("metric");
    session.run_until_converged();

    auto legend = session.legend();
    ASSERT_EQ(legend.size(), 4u);
    EXPECT_EQ(legend[0].label, "Research Problem");
    EXPECT_FALSE(legend[3].active);

    RecordingCanvas canvas;
    EXPECT_EQ(session.render(canvas), RenderStatus::Drawn);
    EXPECT_TRUE(canvas.has_text("Metric"));
    EXPECT_EQ(session.scene().node_count(), 4u);
}
