#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

import Core;
import TSpline;

#include "TestTSplineBuilders.h"

using namespace TSpline;

namespace
{
    LocalKnots Knots5(double a, double b, double c, double d, double e)
    {
        return LocalKnots{a, b, c, d, e};
    }

    void ExpectNonDecreasing(const LocalKnots& k, std::uint32_t v)
    {
        for (std::size_t i = 1; i < k.size(); ++i)
            EXPECT_LE(k[i - 1], k[i]) << "vertex " << v << " entry " << i;
    }
}

// -----------------------------------------------------------------------------
// Ray walks
// -----------------------------------------------------------------------------

TEST(KnotInference, TraceAlongEdges)
{
    TMesh mesh = MakeGridMesh(4, 4);
    auto trace = Knots::TraceKnots(mesh, VertexAt(mesh, 2.0, 2.0), Axis::S, Sign::Positive, 2);
    ASSERT_TRUE(trace.has_value()) << trace.error().Message;

    ASSERT_EQ(trace->Knots.size(), 2u);
    EXPECT_DOUBLE_EQ(trace->Knots[0], 3.0);
    EXPECT_DOUBLE_EQ(trace->Knots[1], 4.0);
    EXPECT_FALSE(trace->HitBoundary);
    EXPECT_DOUBLE_EQ(trace->Reached, 4.0);
}

TEST(KnotInference, TraceStopsAtBoundary)
{
    TMesh mesh = MakeGridMesh(4, 4);
    auto trace = Knots::TraceKnots(mesh, VertexAt(mesh, 1.0, 2.0), Axis::S, Sign::Negative, 2);
    ASSERT_TRUE(trace.has_value());

    ASSERT_EQ(trace->Knots.size(), 1u);
    EXPECT_DOUBLE_EQ(trace->Knots[0], 0.0);
    EXPECT_TRUE(trace->HitBoundary);
}

TEST(KnotInference, TraceCrossesFaceFromJunction)
{
    TMesh mesh = MakeTJunctionMesh();
    auto trace = Knots::TraceKnots(mesh, VertexAt(mesh, 1.0, 1.0), Axis::S, Sign::Negative, 2);
    ASSERT_TRUE(trace.has_value()) << trace.error().Message;

    ASSERT_EQ(trace->Knots.size(), 1u);
    EXPECT_DOUBLE_EQ(trace->Knots[0], 0.0);
    EXPECT_TRUE(trace->HitBoundary);
    EXPECT_EQ(trace->EndPoint, glm::dvec2(0.0, 1.0));
}

TEST(KnotInference, TraceRejectsStaleHandle)
{
    TMesh mesh = MakeGridMesh(2, 2);
    auto trace = Knots::TraceKnots(mesh, VertexHandle(0, 7), Axis::S, Sign::Positive, 2);
    ASSERT_FALSE(trace.has_value());
    EXPECT_EQ(trace.error().Code, Core::ErrorCode::InvalidIndex);
}

// -----------------------------------------------------------------------------
// Local knot vectors
// -----------------------------------------------------------------------------

TEST(KnotInference, UnitSquareCorners)
{
    TMesh mesh = MakeUnitSquareMesh();

    auto origin = Knots::InferLocalKnots(mesh, VertexAt(mesh, 0.0, 0.0));
    ASSERT_TRUE(origin.has_value());
    EXPECT_EQ(origin->S, Knots5(0, 0, 0, 1, 1));
    EXPECT_EQ(origin->T, Knots5(0, 0, 0, 1, 1));

    auto right = Knots::InferLocalKnots(mesh, VertexAt(mesh, 1.0, 0.0));
    ASSERT_TRUE(right.has_value());
    EXPECT_EQ(right->S, Knots5(0, 0, 1, 1, 1));
    EXPECT_EQ(right->T, Knots5(0, 0, 0, 1, 1));
}

TEST(KnotInference, GridInteriorAndBoundary)
{
    TMesh mesh = MakeGridMesh(4, 4);

    EXPECT_EQ(Knots::InferLocalKnots(mesh, VertexAt(mesh, 2.0, 2.0))->S, Knots5(0, 1, 2, 3, 4));
    EXPECT_EQ(Knots::InferLocalKnots(mesh, VertexAt(mesh, 3.0, 2.0))->S, Knots5(1, 2, 3, 4, 4));
    EXPECT_EQ(Knots::InferLocalKnots(mesh, VertexAt(mesh, 4.0, 2.0))->S, Knots5(2, 3, 4, 4, 4));
    EXPECT_EQ(Knots::InferLocalKnots(mesh, VertexAt(mesh, 0.0, 2.0))->S, Knots5(0, 0, 0, 1, 2));
    EXPECT_EQ(Knots::InferLocalKnots(mesh, VertexAt(mesh, 1.0, 3.0))->S, Knots5(0, 0, 1, 2, 3));
    EXPECT_EQ(Knots::InferLocalKnots(mesh, VertexAt(mesh, 1.0, 3.0))->T, Knots5(1, 2, 3, 4, 4));
}

TEST(KnotInference, GridRowsAreSlicesOfClampedVector)
{
    // Vertex i of every row and column of Grid(n, n) carries the five knots
    // starting at index i of {0, 0, 0, 1, .., n - 1, n, n, n}.
    const std::size_t n = 5;
    const std::vector<double> global{0, 0, 0, 1, 2, 3, 4, 5, 5, 5};

    TMesh mesh = MakeGridMesh(n, n);
    for (std::size_t j = 0; j <= n; ++j)
    {
        for (std::size_t i = 0; i <= n; ++i)
        {
            auto knots = Knots::InferLocalKnots(mesh, VertexAt(mesh, static_cast<double>(i), static_cast<double>(j)));
            ASSERT_TRUE(knots.has_value()) << knots.error().Message;
            EXPECT_EQ(knots->S, Knots5(global[i], global[i + 1], global[i + 2], global[i + 3], global[i + 4]))
                << "at (" << i << ", " << j << ")";
            EXPECT_EQ(knots->T, Knots5(global[j], global[j + 1], global[j + 2], global[j + 3], global[j + 4]))
                << "at (" << i << ", " << j << ")";
        }
    }
}

TEST(KnotInference, KnotsAreMonotoneAndCentred)
{
    TMesh mesh = MakeGridMesh(5, 3);
    ASSERT_TRUE(mesh.SplitFace(FaceAt(mesh, 2.5, 1.5), Axis::S, 1.25).has_value());

    for (std::uint32_t v = 0; v < mesh.VertexCount(); ++v)
    {
        auto knots = Knots::InferLocalKnots(mesh, v);
        ASSERT_TRUE(knots.has_value()) << "vertex " << v << ": " << knots.error().Message;
        ExpectNonDecreasing(knots->S, v);
        ExpectNonDecreasing(knots->T, v);
        EXPECT_DOUBLE_EQ(knots->S[2], mesh.Param(v).x);
        EXPECT_DOUBLE_EQ(knots->T[2], mesh.Param(v).y);
    }
}

TEST(KnotInference, TJunctionMesh)
{
    TMesh mesh = MakeTJunctionMesh();

    struct Expectation
    {
        glm::dvec2 Param;
        LocalKnots S;
        LocalKnots T;
    };
    const Expectation expected[] = {
        {{0.0, 0.0}, Knots5(0, 0, 0, 1, 2), Knots5(0, 0, 0, 2, 2)},
        {{1.0, 0.0}, Knots5(0, 0, 1, 2, 2), Knots5(0, 0, 0, 1, 2)},
        {{2.0, 0.0}, Knots5(0, 1, 2, 2, 2), Knots5(0, 0, 0, 1, 2)},
        {{1.0, 1.0}, Knots5(0, 0, 1, 2, 2), Knots5(0, 0, 1, 2, 2)},
        {{2.0, 1.0}, Knots5(0, 1, 2, 2, 2), Knots5(0, 0, 1, 2, 2)},
        {{0.0, 2.0}, Knots5(0, 0, 0, 1, 2), Knots5(0, 0, 2, 2, 2)},
        {{1.0, 2.0}, Knots5(0, 0, 1, 2, 2), Knots5(0, 1, 2, 2, 2)},
        {{2.0, 2.0}, Knots5(0, 1, 2, 2, 2), Knots5(0, 1, 2, 2, 2)},
    };

    for (const Expectation& e : expected)
    {
        auto knots = Knots::InferLocalKnots(mesh, VertexAt(mesh, e.Param.x, e.Param.y));
        ASSERT_TRUE(knots.has_value()) << knots.error().Message;
        EXPECT_EQ(knots->S, e.S) << "at (" << e.Param.x << ", " << e.Param.y << ")";
        EXPECT_EQ(knots->T, e.T) << "at (" << e.Param.x << ", " << e.Param.y << ")";
    }
}

TEST(KnotInference, CollinearRunIsSkipped)
{
    TMesh mesh = MakeGridMesh(4, 4);
    const HalfedgeHandle h = *mesh.FindEdge(VertexAt(mesh, 2.0, 2.0), VertexAt(mesh, 3.0, 2.0));
    auto w = mesh.SplitEdge(h, 2.5);
    ASSERT_TRUE(w.has_value());

    // The two-valent vertex has no T spoke, so it is not a knot of its row.
    EXPECT_EQ(Knots::InferLocalKnots(mesh, VertexAt(mesh, 2.0, 2.0))->S, Knots5(0, 1, 2, 3, 4));

    // Its own T knots come from the faces above and below.
    auto knots = Knots::InferLocalKnots(mesh, *w);
    ASSERT_TRUE(knots.has_value()) << knots.error().Message;
    EXPECT_EQ(knots->S, Knots5(1, 2, 2.5, 3, 4));
    EXPECT_EQ(knots->T, Knots5(0, 1, 2, 3, 4));
}

// -----------------------------------------------------------------------------
// Folded meshes
// -----------------------------------------------------------------------------
// Topology checks do not look for overlapping faces, so a sheet folded back
// onto itself along a shared side is accepted. Walks that reach the fold
// cannot tell the layers apart.

TEST(KnotInference, DoubledSpokeIsAmbiguous)
{
    // Two unit squares glued along s = 0, the second laid over the first:
    // vertex 0 has two +S edges, to 1 and to 4, which share a parameter.
    std::vector<ControlPoint> vertices;
    for (const glm::dvec2 p : {glm::dvec2(0, 0), glm::dvec2(1, 0), glm::dvec2(1, 1), glm::dvec2(0, 1),
                               glm::dvec2(1, 0), glm::dvec2(1, 1)})
    {
        ControlPoint cp;
        cp.Param = p;
        cp.Geometry = glm::dvec4(p, 0.0, 1.0);
        vertices.push_back(cp);
    }
    const std::vector<std::vector<std::uint32_t>> faces{{0, 1, 2, 3}, {0, 3, 5, 4}};
    auto mesh = TMesh::FromFaces(std::move(vertices), faces);
    ASSERT_TRUE(mesh.has_value()) << mesh.error().Message;

    auto spoke = mesh->FindSpoke(0, Axis::S, Sign::Positive);
    ASSERT_FALSE(spoke.has_value());
    EXPECT_EQ(spoke.error().Code, Core::ErrorCode::AmbiguousTraversal);
    EXPECT_EQ(spoke.error().Halfedges.size(), 2u);

    auto trace = Knots::TraceKnots(*mesh, 0u, Axis::S, Sign::Positive, 2);
    ASSERT_FALSE(trace.has_value());
    EXPECT_EQ(trace.error().Code, Core::ErrorCode::AmbiguousTraversal);

    Knots::KnotCache cache;
    auto rebuilt = cache.Rebuild(*mesh);
    ASSERT_FALSE(rebuilt.has_value());
    EXPECT_EQ(rebuilt.error().Code, Core::ErrorCode::AmbiguousTraversal);
}

TEST(KnotInference, OverlappingFacesAreAmbiguous)
{
    // Two 1 x 2 rectangles glued along s = 0, which carries a midpoint at
    // (0, 1). The midpoint has no +S edge, and both layers admit its ray.
    std::vector<ControlPoint> vertices;
    for (const glm::dvec2 p : {glm::dvec2(0, 0), glm::dvec2(1, 0), glm::dvec2(1, 2), glm::dvec2(0, 2),
                               glm::dvec2(0, 1), glm::dvec2(1, 0), glm::dvec2(1, 2)})
    {
        ControlPoint cp;
        cp.Param = p;
        cp.Geometry = glm::dvec4(p, 0.0, 1.0);
        vertices.push_back(cp);
    }
    const std::vector<std::vector<std::uint32_t>> faces{{0, 1, 2, 3, 4}, {0, 4, 3, 6, 5}};
    auto mesh = TMesh::FromFaces(std::move(vertices), faces);
    ASSERT_TRUE(mesh.has_value()) << mesh.error().Message;

    auto none = mesh->FindSpoke(4, Axis::S, Sign::Positive);
    ASSERT_TRUE(none.has_value()) << none.error().Message;
    EXPECT_FALSE(none->has_value());

    auto trace = Knots::TraceKnots(*mesh, 4u, Axis::S, Sign::Positive, 2);
    ASSERT_FALSE(trace.has_value());
    EXPECT_EQ(trace.error().Code, Core::ErrorCode::AmbiguousTraversal);
    EXPECT_EQ(trace.error().Faces.size(), 2u);
    ASSERT_EQ(trace.error().Vertices.size(), 1u);
    EXPECT_EQ(trace.error().Vertices.front(), mesh->VertexHandleOf(4));

    // The -S side is open, so that walk ends cleanly at the boundary.
    auto back = Knots::TraceKnots(*mesh, 4u, Axis::S, Sign::Negative, 2);
    ASSERT_TRUE(back.has_value()) << back.error().Message;
    EXPECT_TRUE(back->HitBoundary);
    EXPECT_TRUE(back->Knots.empty());
}

// -----------------------------------------------------------------------------
// KnotCache
// -----------------------------------------------------------------------------

TEST(KnotCache, RebuildCoversEveryVertex)
{
    TMesh mesh = MakeGridMesh(3, 3);
    Knots::KnotCache cache;
    ASSERT_TRUE(cache.Rebuild(mesh).has_value());

    EXPECT_EQ(cache.Size(), mesh.VertexCount());
    EXPECT_EQ(cache.LastRefreshCount(), mesh.VertexCount());
    EXPECT_EQ(mesh.DirtyCount(), 0u);

    auto knots = cache.Get(mesh, VertexAt(mesh, 1.0, 1.0));
    ASSERT_TRUE(knots.has_value());
    EXPECT_EQ(knots->S, Knots5(0, 0, 1, 2, 3));
}

TEST(KnotCache, StaleEntryIsReported)
{
    TMesh mesh = MakeGridMesh(3, 3);
    Knots::KnotCache cache;
    ASSERT_TRUE(cache.Rebuild(mesh).has_value());

    ASSERT_TRUE(mesh.SplitFace(FaceAt(mesh, 1.5, 1.5), Axis::T, 1.5).has_value());
    auto stale = cache.Get(mesh, VertexAt(mesh, 1.0, 1.0));
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().Code, Core::ErrorCode::InvalidState);

    ASSERT_TRUE(cache.Refresh(mesh).has_value());
    EXPECT_TRUE(cache.Get(mesh, VertexAt(mesh, 1.0, 1.0)).has_value());
}

TEST(KnotCache, IncrementalRefreshMatchesRebuild)
{
    TMesh mesh = MakeGridMesh(12, 12);
    Knots::KnotCache cache;
    ASSERT_TRUE(cache.Rebuild(mesh).has_value());

    ASSERT_TRUE(mesh.SplitFace(FaceAt(mesh, 9.5, 9.5), Axis::T, 9.5).has_value());
    ASSERT_TRUE(mesh.SplitFace(FaceAt(mesh, 9.75, 9.5), Axis::S, 9.25).has_value());
    ASSERT_TRUE(cache.Refresh(mesh).has_value());
    EXPECT_LT(cache.LastRefreshCount(), mesh.VertexCount());

    TMesh copy = mesh;
    Knots::KnotCache full;
    ASSERT_TRUE(full.Rebuild(copy).has_value());

    ASSERT_EQ(cache.Size(), full.Size());
    for (std::uint32_t v = 0; v < mesh.VertexCount(); ++v)
        EXPECT_EQ(cache.At(v), full.At(v)) << "vertex " << v;
}

TEST(KnotCache, ParallelRefreshMatchesSerial)
{
    Core::Tasks::Scheduler::Initialize(4);

    TMesh a = MakeGridMesh(20, 20);
    TMesh b = a;

    Knots::KnotInferenceParams parallel;
    parallel.ParallelThreshold = 1;
    parallel.ChunkSize = 16;
    Knots::KnotInferenceParams serial;
    serial.Parallel = false;

    Knots::KnotCache pc;
    Knots::KnotCache sc;
    ASSERT_TRUE(pc.Rebuild(a, parallel).has_value());
    ASSERT_TRUE(sc.Rebuild(b, serial).has_value());
    EXPECT_EQ(pc, sc);

    Core::Tasks::Scheduler::Shutdown();
}

TEST(KnotCache, InvalidateForcesRecompute)
{
    TMesh mesh = MakeGridMesh(3, 3);
    Knots::KnotCache cache;
    ASSERT_TRUE(cache.Rebuild(mesh).has_value());

    const VertexHandle v = VertexAt(mesh, 1.0, 2.0);
    const KnotVectors before = cache.Get(mesh, v).value();

    cache.Invalidate(v.Index);
    auto stale = cache.Get(mesh, v);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().Code, Core::ErrorCode::InvalidState);

    ASSERT_TRUE(cache.Refresh(mesh).has_value());
    EXPECT_EQ(cache.LastRefreshCount(), 1u);
    EXPECT_EQ(cache.Get(mesh, v).value(), before);

    cache.InvalidateAll();
    ASSERT_TRUE(cache.Refresh(mesh).has_value());
    EXPECT_EQ(cache.LastRefreshCount(), mesh.VertexCount());
}
