#include <gtest/gtest.h>
#include "graph/graph.hpp"

#include <algorithm>
#include <string>

using namespace pathgraph;

using StrGraph = Graph<std::string, std::string>;

namespace {

// A - B, B - C, C - A
void buildTriangle(StrGraph& g) {
    g.insertVertex("A");
    g.insertVertex("B");
    g.insertVertex("C");
    g.insertEdge("A", "B", "A - B");
    g.insertEdge("B", "C", "B - C");
    g.insertEdge("C", "A", "C - A");
}

} // namespace

// ─── Vertex CRUD ───────────────────────────────────────────────

TEST(GraphTest, CreateGraph) {
    StrGraph g;
    g.insertVertex("A");
    g.insertVertex("B");
    g.insertEdge("A", "B", "PATH");

    EXPECT_EQ(g.numVertices(), 2);
    EXPECT_EQ(g.numEdges(), 1);
    EXPECT_FALSE(g.directed());
}

TEST(GraphTest, InsertVertexThenLookup) {
    StrGraph g;
    auto a = g.insertVertex("A");
    EXPECT_EQ(a.element(), "A");

    auto found = g.vertex("A");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, a);
    EXPECT_EQ(found->id(), a.id());
    EXPECT_TRUE(g.hasVertex(a));
    EXPECT_FALSE(g.vertex("D").has_value());
}

TEST(GraphTest, DuplicateVertexRejected) {
    StrGraph g;
    g.insertVertex("A");
    EXPECT_THROW(g.insertVertex("A"), DuplicateVertexError);
    EXPECT_THROW(g.insertVertex("A"), InvalidVertexError);
    EXPECT_EQ(g.numVertices(), 1);
}

TEST(GraphTest, VerticesInInsertionOrder) {
    StrGraph g;
    g.insertVertex("C");
    g.insertVertex("A");
    g.insertVertex("B");

    auto vs = g.vertices();
    ASSERT_EQ(vs.size(), 3);
    EXPECT_EQ(vs[0].element(), "C");
    EXPECT_EQ(vs[1].element(), "A");
    EXPECT_EQ(vs[2].element(), "B");
}

TEST(GraphTest, RemoveVertexCascadesEdges) {
    StrGraph g;
    buildTriangle(g);
    g.insertVertex("D");
    g.insertEdge("C", "D", "C - D");
    ASSERT_EQ(g.numEdges(), 4);

    std::string removed = g.removeVertex(*g.vertex("C"));
    EXPECT_EQ(removed, "C");
    EXPECT_EQ(g.numVertices(), 3);
    EXPECT_EQ(g.numEdges(), 1);  // C had three incident edges
    EXPECT_FALSE(g.hasEdge("B - C"));
    EXPECT_FALSE(g.hasEdge("C - A"));
    EXPECT_FALSE(g.hasEdge("C - D"));
    EXPECT_TRUE(g.hasEdge("A - B"));
    EXPECT_FALSE(g.vertex("C").has_value());
}

TEST(GraphTest, RemoveVertexTwiceFails) {
    StrGraph g;
    auto a = g.insertVertex("A");
    g.removeVertex(a);
    EXPECT_THROW(g.removeVertex(a), InvalidVertexError);
}

TEST(GraphTest, ReinsertedElementInvalidatesOldHandle) {
    StrGraph g;
    auto old_a = g.insertVertex("A");
    g.removeVertex(old_a);
    auto new_a = g.insertVertex("A");

    EXPECT_EQ(old_a, new_a);  // same element
    EXPECT_FALSE(g.hasVertex(old_a));
    EXPECT_TRUE(g.hasVertex(new_a));
    EXPECT_THROW(g.removeVertex(old_a), InvalidVertexError);
}

// ─── Edge CRUD ─────────────────────────────────────────────────

TEST(GraphTest, InsertEdgeStoresFields) {
    StrGraph g;
    auto a = g.insertVertex("A");
    auto b = g.insertVertex("B");
    auto e = g.insertEdge(a, b, "A - B", 2.5, {{"color", "red"}});

    EXPECT_EQ(e.endpointA(), a);
    EXPECT_EQ(e.endpointB(), b);
    EXPECT_FALSE(e.directed());
    EXPECT_DOUBLE_EQ(e.weight(), 2.5);
    EXPECT_EQ(e.element(), "A - B");
    EXPECT_EQ(e.property("color"), "red");
    EXPECT_FALSE(e.hasProperty("size"));
    EXPECT_EQ(e.property("size", "n/a"), "n/a");
}

TEST(GraphTest, InsertEdgeDefaultWeight) {
    StrGraph g;
    g.insertVertex("A");
    g.insertVertex("B");
    auto e = g.insertEdge("A", "B", "A - B");
    EXPECT_DOUBLE_EQ(e.weight(), 1.0);
}

TEST(GraphTest, DuplicateEdgeElementRejectedAcrossPairs) {
    StrGraph g;
    buildTriangle(g);
    EXPECT_THROW(g.insertEdge("B", "C", "A - B"), DuplicateEdgeError);
    EXPECT_THROW(g.insertEdge("A", "C", "A - B"), InvalidEdgeError);
    EXPECT_EQ(g.numEdges(), 3);
}

TEST(GraphTest, InsertEdgeWithUnknownVertexElement) {
    StrGraph g;
    g.insertVertex("A");
    g.insertVertex("B");
    EXPECT_THROW(g.insertEdge("X", "B", "X - B"), InvalidVertexError);
    EXPECT_THROW(g.insertEdge("A", "X", "A - X"), InvalidVertexError);
    EXPECT_EQ(g.numEdges(), 0);
}

TEST(GraphTest, InsertEdgeWithForeignVertex) {
    StrGraph g;
    auto a = g.insertVertex("A");
    g.insertVertex("B");

    StrGraph other;
    auto foreign_b = other.insertVertex("B");

    EXPECT_THROW(g.insertEdge(a, foreign_b, "A - B"), InvalidVertexError);
    EXPECT_THROW(g.insertEdge(foreign_b, a, "B - A"), InvalidVertexError);
    EXPECT_FALSE(g.hasVertex(foreign_b));
    EXPECT_EQ(g.numEdges(), 0);
}

TEST(GraphTest, RemoveEdgeByHandle) {
    StrGraph g;
    buildTriangle(g);
    auto e = *g.findEdge("A - B");

    EXPECT_EQ(g.removeEdge(e), "A - B");
    EXPECT_EQ(g.numEdges(), 2);
    EXPECT_FALSE(g.areAdjacent("A", "B"));
    EXPECT_THROW(g.removeEdge(e), InvalidEdgeError);
}

TEST(GraphTest, RemoveEdgeByEndpointsEitherOrder) {
    StrGraph g;
    buildTriangle(g);

    auto removed = g.removeEdge("B", "A");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, "A - B");
    EXPECT_FALSE(g.areAdjacent("A", "B"));
    EXPECT_FALSE(g.areAdjacent("B", "A"));
    EXPECT_EQ(g.numVertices(), 3);
    EXPECT_EQ(g.numEdges(), 2);
}

TEST(GraphTest, RemoveEdgeByEndpointsNoneFound) {
    StrGraph g;
    g.insertVertex("A");
    g.insertVertex("B");
    EXPECT_FALSE(g.removeEdge("A", "B").has_value());
    EXPECT_FALSE(g.removeEdge("A", "Z").has_value());
}

TEST(GraphTest, RemoveEdgeFromForeignGraph) {
    StrGraph g;
    buildTriangle(g);
    StrGraph other;
    buildTriangle(other);

    auto foreign = *other.findEdge("A - B");
    EXPECT_THROW(g.removeEdge(foreign), InvalidEdgeError);
    EXPECT_EQ(g.numEdges(), 3);
}

// ─── Replace ───────────────────────────────────────────────────

TEST(GraphTest, ReplaceVertexRewiresEdges) {
    StrGraph g;
    buildTriangle(g);
    g.insertEdge("B", "C", "B = C", 4.0);
    auto c = *g.vertex("C");

    EXPECT_EQ(g.replace(c, "D"), "C");
    EXPECT_EQ(g.numVertices(), 3);
    EXPECT_EQ(g.numEdges(), 4);
    EXPECT_TRUE(g.areAdjacent("A", "B"));
    EXPECT_TRUE(g.areAdjacent("D", "A"));
    EXPECT_TRUE(g.areAdjacent("B", "D"));
    EXPECT_FALSE(g.vertex("C").has_value());

    auto d = *g.vertex("D");
    EXPECT_NE(d.id(), c.id());
    auto heavy = *g.findEdge("B = C");
    EXPECT_EQ(heavy.endpointA().element(), "B");
    EXPECT_EQ(heavy.endpointB(), d);
    EXPECT_DOUBLE_EQ(heavy.weight(), 4.0);
}

TEST(GraphTest, ReplaceVertexStaleHandle) {
    StrGraph g;
    buildTriangle(g);
    auto c = *g.vertex("C");
    g.replace(c, "D");

    EXPECT_FALSE(g.hasVertex(c));
    EXPECT_THROW(g.incidentEdges(c), InvalidVertexError);
    EXPECT_THROW(g.replace(c, "E"), InvalidVertexError);
}

TEST(GraphTest, ReplaceVertexDuplicateRejected) {
    StrGraph g;
    buildTriangle(g);
    EXPECT_THROW(g.replace(*g.vertex("C"), "A"), DuplicateVertexError);
    EXPECT_TRUE(g.vertex("C").has_value());
    EXPECT_EQ(g.numEdges(), 3);
}

TEST(GraphTest, ReplaceEdgeKeepsEndpointsAndWeight) {
    StrGraph g;
    g.insertVertex("A");
    g.insertVertex("B");
    g.insertVertex("C");
    g.insertEdge("A", "B", "A - B");
    g.insertEdge("B", "C", "B - C");
    auto edge = g.insertEdge("C", "A", "C - A", 0.7, {{"kind", "road"}});

    EXPECT_EQ(g.replace(edge, "X - A"), "C - A");
    EXPECT_FALSE(g.hasEdge("C - A"));

    auto renamed = g.findEdge("X - A");
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(renamed->endpointA().element(), "C");
    EXPECT_EQ(renamed->endpointB().element(), "A");
    EXPECT_DOUBLE_EQ(renamed->weight(), 0.7);
    EXPECT_EQ(renamed->property("kind"), "road");
    EXPECT_EQ(g.numEdges(), 3);
    EXPECT_TRUE(g.areAdjacent("C", "A"));
}

TEST(GraphTest, ReplaceEdgeDuplicateRejected) {
    StrGraph g;
    buildTriangle(g);
    EXPECT_THROW(g.replace(*g.findEdge("C - A"), "A - B"), DuplicateEdgeError);
    EXPECT_TRUE(g.hasEdge("C - A"));
}

// ─── Adjacency Queries ────────────────────────────────────────

TEST(GraphTest, AreAdjacentIsSymmetric) {
    StrGraph g;
    buildTriangle(g);
    g.insertVertex("D");

    for (const auto& u : g.vertices()) {
        for (const auto& v : g.vertices()) {
            EXPECT_EQ(g.areAdjacent(u, v), g.areAdjacent(v, u));
        }
    }
    EXPECT_TRUE(g.areAdjacent("A", "B"));
    EXPECT_TRUE(g.areAdjacent("B", "A"));
    EXPECT_FALSE(g.areAdjacent("A", "D"));
    EXPECT_THROW(g.areAdjacent("A", "Z"), InvalidVertexError);
}

TEST(GraphTest, IncidentEdges) {
    StrGraph g;
    buildTriangle(g);
    g.insertVertex("D");

    auto edges = g.incidentEdges(*g.vertex("A"));
    ASSERT_EQ(edges.size(), 2);
    for (const auto& e : edges) EXPECT_TRUE(e.contains(*g.vertex("A")));
    EXPECT_TRUE(g.incidentEdges(*g.vertex("D")).empty());
}

TEST(GraphTest, SelfLoopCountedOnce) {
    StrGraph g;
    auto a = g.insertVertex("A");
    g.insertEdge(a, a, "A - A");

    EXPECT_EQ(g.incidentEdges(a).size(), 1);
    EXPECT_TRUE(g.areAdjacent(a, a));
    g.removeVertex(a);
    EXPECT_EQ(g.numEdges(), 0);
}

TEST(GraphTest, Opposite) {
    StrGraph g;
    buildTriangle(g);

    EXPECT_EQ(*g.opposite("A", "A - B"), *g.vertex("B"));
    EXPECT_EQ(*g.opposite("B", "A - B"), *g.vertex("A"));
    EXPECT_FALSE(g.opposite("C", "A - B").has_value());

    auto ab = *g.findEdge("A - B");
    EXPECT_EQ(*g.opposite(*g.vertex("A"), ab), *g.vertex("B"));
    EXPECT_THROW(g.opposite("Z", "A - B"), InvalidVertexError);
    EXPECT_THROW(g.opposite("A", "nope"), InvalidEdgeError);
}

TEST(GraphTest, EdgePicksLightestParallelEdge) {
    StrGraph g;
    auto a = g.insertVertex("A");
    auto b = g.insertVertex("B");
    g.insertEdge(a, b, "slow", 3.0);
    g.insertEdge(b, a, "fast", 0.5);
    g.insertEdge(a, b, "medium", 1.0);

    auto e = g.edge(a, b);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->element(), "fast");
    EXPECT_EQ(g.edge(b, a)->element(), "fast");
}

TEST(GraphTest, EdgeTieGoesToFirstInserted) {
    StrGraph g;
    auto a = g.insertVertex("A");
    auto b = g.insertVertex("B");
    g.insertEdge(a, b, "first", 1.0);
    g.insertEdge(a, b, "second", 1.0);
    EXPECT_EQ(g.edge(a, b)->element(), "first");
}

TEST(GraphTest, EdgeNoneWhenNotAdjacent) {
    StrGraph g;
    auto a = g.insertVertex("A");
    auto b = g.insertVertex("B");
    EXPECT_FALSE(g.edge(a, b).has_value());
}

// ─── Counting ──────────────────────────────────────────────────

TEST(GraphTest, CountsTrackInsertsAndRemovals) {
    StrGraph g;
    for (int i = 0; i < 10; i++) g.insertVertex(std::to_string(i));
    for (int i = 0; i < 9; i++) {
        g.insertEdge(std::to_string(i), std::to_string(i + 1), "e" + std::to_string(i));
    }
    EXPECT_EQ(g.numVertices(), 10);
    EXPECT_EQ(g.numEdges(), 9);

    // Failed calls do not count.
    EXPECT_THROW(g.insertVertex("3"), InvalidVertexError);
    EXPECT_THROW(g.insertEdge("0", "1", "e0"), InvalidEdgeError);
    EXPECT_EQ(g.numVertices(), 10);
    EXPECT_EQ(g.numEdges(), 9);

    g.removeVertex(*g.vertex("5"));  // two incident edges
    g.removeEdge(*g.findEdge("e0"));
    EXPECT_EQ(g.numVertices(), 9);
    EXPECT_EQ(g.numEdges(), 6);
}

// ─── Clone ─────────────────────────────────────────────────────

TEST(GraphTest, CloneIsIndependent) {
    StrGraph g;
    buildTriangle(g);
    auto copy = g.clone();

    EXPECT_EQ(copy->numVertices(), 3);
    EXPECT_EQ(copy->numEdges(), 3);
    EXPECT_FALSE(copy->directed());

    copy->removeVertex(*copy->vertex("A"));
    EXPECT_EQ(g.numVertices(), 3);
    EXPECT_EQ(g.numEdges(), 3);
    EXPECT_EQ(copy->numEdges(), 1);

    // Handles from the source graph are foreign to the copy.
    EXPECT_FALSE(copy->hasVertex(*g.vertex("B")));
}

TEST(GraphTest, ToStringListsContents) {
    StrGraph g;
    buildTriangle(g);
    std::string text = g.toString();
    EXPECT_EQ(text.rfind("Graph with 3 vertices and 3 edges:", 0), 0u);
    EXPECT_NE(text.find("A -- B"), std::string::npos);
    EXPECT_NE(text.find("C - A"), std::string::npos);
}
