#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <format>
#include <vector>

#include <glm/glm.hpp>

import Core;
import TSpline;

#include "TestTSplineBuilders.h"

using namespace TSpline;

namespace
{
    void ExpectConsistent(const TMesh& mesh)
    {
        for (std::uint32_t h = 0; h < mesh.HalfedgeCount(); ++h)
        {
            const HalfEdge& he = mesh.EdgeData(h);
            EXPECT_EQ(mesh.EdgeData(he.Next).Prev, h) << "half-edge " << h;
            EXPECT_EQ(mesh.EdgeData(he.Prev).Next, h) << "half-edge " << h;
            if (he.HasTwin())
            {
                EXPECT_EQ(mesh.EdgeData(he.Twin).Twin, h) << "half-edge " << h;
                EXPECT_EQ(mesh.EdgeData(he.Twin).Origin, mesh.Destination(h)) << "half-edge " << h;
            }
        }
        for (std::uint32_t f = 0; f < mesh.FaceCount(); ++f)
        {
            auto loop = mesh.FaceLoop(f);
            ASSERT_TRUE(loop.has_value()) << "face " << f;
            for (std::uint32_t h : *loop)
                EXPECT_EQ(mesh.EdgeData(h).Face, f);
        }
    }
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------

TEST(TMesh, UnitSquareCounts)
{
    TMesh mesh = MakeUnitSquareMesh();
    EXPECT_EQ(mesh.VertexCount(), 4u);
    EXPECT_EQ(mesh.FaceCount(), 1u);
    EXPECT_EQ(mesh.HalfedgeCount(), 8u); // four face half-edges plus boundary twins
    ExpectConsistent(mesh);

    const Bounds bounds = mesh.ParameterBounds();
    EXPECT_EQ(bounds.Min, glm::dvec2(0.0, 0.0));
    EXPECT_EQ(bounds.Max, glm::dvec2(1.0, 1.0));
}

TEST(TMesh, GridCounts)
{
    TMesh mesh = MakeGridMesh(3, 2);
    EXPECT_EQ(mesh.VertexCount(), 12u);
    EXPECT_EQ(mesh.FaceCount(), 6u);
    // 3 * 3 horizontal + 4 * 2 vertical edges, two half-edges each
    EXPECT_EQ(mesh.HalfedgeCount(), 34u);
    ExpectConsistent(mesh);
}

TEST(TMesh, GridRejectsEmpty)
{
    auto mesh = Shapes::Grid(0, 3);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error().Code, Core::ErrorCode::InvalidArgument);
}

TEST(TMesh, CreateFromDescription)
{
    auto mesh = TMesh::Create(MakeUnitSquareDescription());
    ASSERT_TRUE(mesh.has_value()) << mesh.error().Message;
    EXPECT_EQ(mesh->FaceCount(), 1u);
    EXPECT_EQ(mesh->DirtyCount(), 4u);
    ExpectConsistent(*mesh);

    // Outgoing half-edges are derived when the importer leaves them out.
    for (std::uint32_t v = 0; v < mesh->VertexCount(); ++v)
        EXPECT_EQ(mesh->EdgeData(mesh->VertexData(v).Outgoing).Origin, v);
}

TEST(TMesh, CreateRejectsOutOfRangeIndex)
{
    TMeshDescription desc = MakeUnitSquareDescription();
    desc.Halfedges[2].Origin = 9;

    auto mesh = TMesh::Create(std::move(desc));
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error().Code, Core::ErrorCode::InvalidIndex);
    ASSERT_EQ(mesh.error().Halfedges.size(), 1u);
    EXPECT_EQ(mesh.error().Halfedges[0].Index, 2u);
}

TEST(TMesh, CreateRejectsAsymmetricTwin)
{
    TMeshDescription desc = MakeUnitSquareDescription();
    desc.Halfedges[0].Twin = 5;

    auto mesh = TMesh::Create(std::move(desc));
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error().Code, Core::ErrorCode::TopologyCorrupt);
}

TEST(TMesh, CreateRejectsKnotIntervalMismatch)
{
    TMeshDescription desc = MakeUnitSquareDescription();
    desc.Halfedges[0].KnotInterval = 2.0;

    auto mesh = TMesh::Create(std::move(desc));
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error().Code, Core::ErrorCode::TopologyCorrupt);
}

TEST(TMesh, CreateRejectsOpenLoop)
{
    TMeshDescription desc = MakeUnitSquareDescription();
    // 3 -> 0 now continues into the boundary loop.
    desc.Halfedges[3].Next = 7;

    auto mesh = TMesh::Create(std::move(desc));
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error().Code, Core::ErrorCode::TopologyCorrupt);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

TEST(TMesh, SpokesOfCornerAndInterior)
{
    TMesh mesh = MakeGridMesh(2, 2);

    auto corner = mesh.Spokes(VertexAt(mesh, 0.0, 0.0));
    ASSERT_TRUE(corner.has_value());
    EXPECT_EQ(corner->size(), 2u);
    EXPECT_TRUE(mesh.IsBoundary(VertexAt(mesh, 0.0, 0.0)).value());

    const VertexHandle centre = VertexAt(mesh, 1.0, 1.0);
    EXPECT_EQ(mesh.Valence(centre).value(), 4u);
    EXPECT_FALSE(mesh.IsBoundary(centre).value());

    auto right = mesh.FindSpoke(centre.Index, Axis::S, Sign::Positive);
    ASSERT_TRUE(right.has_value());
    ASSERT_TRUE(right->has_value());
    EXPECT_EQ((*right)->Neighbor, VertexAt(mesh, 2.0, 1.0).Index);
    EXPECT_DOUBLE_EQ((*right)->Delta, 1.0);
}

TEST(TMesh, FindSpokeAbsentDirection)
{
    TMesh mesh = MakeTJunctionMesh();
    auto left = mesh.FindSpoke(VertexAt(mesh, 1.0, 1.0).Index, Axis::S, Sign::Negative);
    ASSERT_TRUE(left.has_value());
    EXPECT_FALSE(left->has_value());
}

TEST(TMesh, TJunctionFlag)
{
    TMesh mesh = MakeTJunctionMesh();
    for (std::uint32_t v = 0; v < mesh.VertexCount(); ++v)
        EXPECT_EQ(mesh.VertexData(v).IsTJunction, v == 3) << "vertex " << v;

    // The tall left face carries the junction on its right side.
    auto boundary = mesh.FaceBoundary(FaceAt(mesh, 0.5, 1.0));
    ASSERT_TRUE(boundary.has_value());
    EXPECT_EQ(boundary->size(), 5u);
}

TEST(TMesh, FindEdgeAndDestination)
{
    TMesh mesh = MakeUnitSquareMesh();
    const VertexHandle a = VertexAt(mesh, 0.0, 0.0);
    const VertexHandle b = VertexAt(mesh, 1.0, 0.0);
    const VertexHandle c = VertexAt(mesh, 1.0, 1.0);

    auto ab = mesh.FindEdge(a, b);
    ASSERT_TRUE(ab.has_value());
    EXPECT_EQ(mesh.Edge(*ab)->Origin, a.Index);
    EXPECT_EQ(mesh.DestinationOf(*ab).value(), b);

    EXPECT_FALSE(mesh.FindEdge(a, c).has_value());
}

TEST(TMesh, TwinlessBoundaryDestination)
{
    // Same square without the boundary loop: the face half-edges have no twins.
    TMeshDescription desc = MakeUnitSquareDescription();
    desc.Halfedges.resize(4);
    for (HalfEdge& he : desc.Halfedges)
        he.Twin = InvalidIndex;

    auto mesh = TMesh::Create(desc);
    ASSERT_TRUE(mesh.has_value()) << mesh.error().Message;
    EXPECT_EQ(mesh->Valence(mesh->VertexHandleOf(0)).value(), 2u);

    const HalfedgeHandle h = mesh->HalfedgeHandleOf(0);
    auto strict = mesh->DestinationOf(h);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().Code, Core::ErrorCode::BoundaryEdge);
    ASSERT_EQ(strict.error().Halfedges.size(), 1u);

    auto tolerant = mesh->DestinationOf(h, BoundaryPolicy::Tolerant);
    ASSERT_TRUE(tolerant.has_value());
    EXPECT_EQ(tolerant->Index, 1u);
}

TEST(TMesh, FaceContainingIsStrict)
{
    TMesh mesh = MakeGridMesh(2, 2);
    EXPECT_TRUE(mesh.FaceContaining(glm::dvec2(1.5, 0.5)).has_value());
    EXPECT_FALSE(mesh.FaceContaining(glm::dvec2(1.0, 0.5)).has_value());
    EXPECT_FALSE(mesh.FaceContaining(glm::dvec2(3.0, 0.5)).has_value());
}

// -----------------------------------------------------------------------------
// Mutation
// -----------------------------------------------------------------------------

TEST(TMesh, SplitEdgeRetiresHalfedge)
{
    TMesh mesh = MakeGridMesh(2, 2);
    const std::size_t vertices = mesh.VertexCount();
    const std::size_t halfedges = mesh.HalfedgeCount();

    const HalfedgeHandle h = *mesh.FindEdge(VertexAt(mesh, 0.0, 0.0), VertexAt(mesh, 1.0, 0.0));
    auto w = mesh.SplitEdge(h, 0.25);
    ASSERT_TRUE(w.has_value()) << w.error().Message;

    EXPECT_EQ(mesh.VertexCount(), vertices + 1);
    EXPECT_EQ(mesh.HalfedgeCount(), halfedges + 2);
    EXPECT_EQ(mesh.Param(w->Index), glm::dvec2(0.25, 0.0));
    EXPECT_EQ(mesh.Valence(*w).value(), 2u);
    EXPECT_FALSE(mesh.VertexData(w->Index).IsTJunction);

    // The old handle is stale; the slot lives on under a new generation.
    EXPECT_FALSE(mesh.Contains(h));
    auto stale = mesh.Edge(h);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().Code, Core::ErrorCode::InvalidIndex);
    EXPECT_EQ(mesh.HalfedgeHandleOf(h.Index).Generation, h.Generation + 1);

    const HalfEdge& head = mesh.EdgeData(h.Index);
    EXPECT_DOUBLE_EQ(head.KnotInterval, 0.25);
    EXPECT_DOUBLE_EQ(mesh.EdgeData(head.Next).KnotInterval, 0.75);
    ExpectConsistent(mesh);
}

TEST(TMesh, HandleIterationTracksGenerations)
{
    TMesh mesh = MakeGridMesh(2, 2);
    const HalfedgeHandle h = *mesh.FindEdge(VertexAt(mesh, 1.0, 0.0), VertexAt(mesh, 2.0, 0.0));
    ASSERT_TRUE(mesh.SplitEdge(h, 1.5).has_value());

    const std::vector<VertexHandle> vertices = mesh.VertexHandles();
    const std::vector<HalfedgeHandle> halfedges = mesh.HalfedgeHandles();
    const std::vector<FaceHandle> faces = mesh.FaceHandles();
    ASSERT_EQ(vertices.size(), mesh.VertexCount());
    ASSERT_EQ(halfedges.size(), mesh.HalfedgeCount());
    ASSERT_EQ(faces.size(), mesh.FaceCount());

    for (const VertexHandle v : vertices)
        EXPECT_TRUE(mesh.Vertex(v).has_value());
    for (const HalfedgeHandle e : halfedges)
        EXPECT_TRUE(mesh.Edge(e).has_value());
    for (const FaceHandle f : faces)
        EXPECT_TRUE(mesh.FaceBoundary(f).has_value());

    EXPECT_EQ(halfedges[h.Index].Generation, h.Generation + 1);
    EXPECT_EQ(std::format("{}", vertices.back()), std::format("{}@1", mesh.VertexCount() - 1));
}

TEST(TMesh, SplitEdgeRejectsEndpoint)
{
    TMesh mesh = MakeUnitSquareMesh();
    const HalfedgeHandle h = *mesh.FindEdge(VertexAt(mesh, 0.0, 0.0), VertexAt(mesh, 1.0, 0.0));

    auto w = mesh.SplitEdge(h, 1.0);
    ASSERT_FALSE(w.has_value());
    EXPECT_EQ(w.error().Code, Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(mesh.VertexCount(), 4u);
    EXPECT_TRUE(mesh.Contains(h));
}

TEST(TMesh, ConnectVerticesSplitsFace)
{
    TMesh mesh = MakeUnitSquareMesh();
    const FaceHandle face = FaceAt(mesh, 0.5, 0.5);

    auto bottom = mesh.SplitEdge(*mesh.FindEdge(VertexAt(mesh, 0.0, 0.0), VertexAt(mesh, 1.0, 0.0)), 0.5);
    auto top = mesh.SplitEdge(*mesh.FindEdge(VertexAt(mesh, 1.0, 1.0), VertexAt(mesh, 0.0, 1.0)), 0.5);
    ASSERT_TRUE(bottom.has_value());
    ASSERT_TRUE(top.has_value());

    auto edge = mesh.ConnectVertices(face, *bottom, *top);
    ASSERT_TRUE(edge.has_value()) << edge.error().Message;
    EXPECT_EQ(mesh.FaceCount(), 2u);
    EXPECT_EQ(mesh.Edge(*edge)->Direction, Axis::T);
    EXPECT_FALSE(mesh.Contains(face));

    EXPECT_TRUE(mesh.FaceContaining(glm::dvec2(0.25, 0.5)).has_value());
    EXPECT_TRUE(mesh.FaceContaining(glm::dvec2(0.75, 0.5)).has_value());
    EXPECT_FALSE(mesh.FaceContaining(glm::dvec2(0.5, 0.5)).has_value());
    ExpectConsistent(mesh);
}

TEST(TMesh, ConnectVerticesRejectsDiagonal)
{
    TMesh mesh = MakeUnitSquareMesh();
    auto edge = mesh.ConnectVertices(FaceAt(mesh, 0.5, 0.5), VertexAt(mesh, 0.0, 0.0), VertexAt(mesh, 1.0, 1.0));
    ASSERT_FALSE(edge.has_value());
    EXPECT_EQ(edge.error().Code, Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(mesh.FaceCount(), 1u);
}

TEST(TMesh, SplitFaceHorizontal)
{
    TMesh mesh = MakeUnitSquareMesh();
    auto edge = mesh.SplitFace(FaceAt(mesh, 0.5, 0.5), Axis::S, 0.5);
    ASSERT_TRUE(edge.has_value()) << edge.error().Message;

    EXPECT_EQ(mesh.FaceCount(), 2u);
    EXPECT_EQ(mesh.VertexCount(), 6u);
    EXPECT_TRUE(mesh.FindVertex(glm::dvec2(0.0, 0.5)).has_value());
    EXPECT_TRUE(mesh.FindVertex(glm::dvec2(1.0, 0.5)).has_value());
    ExpectConsistent(mesh);
}

TEST(TMesh, SplitFaceVertical)
{
    TMesh mesh = MakeUnitSquareMesh();
    auto edge = mesh.SplitFace(FaceAt(mesh, 0.5, 0.5), Axis::T, 0.5);
    ASSERT_TRUE(edge.has_value()) << edge.error().Message;

    EXPECT_EQ(mesh.FaceCount(), 2u);
    EXPECT_EQ(mesh.VertexCount(), 6u);
    EXPECT_TRUE(mesh.FindVertex(glm::dvec2(0.5, 0.0)).has_value());
    EXPECT_TRUE(mesh.FindVertex(glm::dvec2(0.5, 1.0)).has_value());
}

TEST(TMesh, SplitFaceRejectsSide)
{
    TMesh mesh = MakeUnitSquareMesh();
    auto edge = mesh.SplitFace(FaceAt(mesh, 0.5, 0.5), Axis::S, 1.0);
    ASSERT_FALSE(edge.has_value());
    EXPECT_EQ(edge.error().Code, Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(mesh.FaceCount(), 1u);
}

TEST(TMesh, InsertTJunctionCrossesFace)
{
    // A junction at (2, 1.5) after splitting one grid cell; extend it to s = 1.
    TMesh mesh = MakeGridMesh(4, 4);
    ASSERT_TRUE(mesh.SplitFace(FaceAt(mesh, 2.5, 1.5), Axis::S, 1.5).has_value());

    const VertexHandle junction = VertexAt(mesh, 2.0, 1.5);
    EXPECT_TRUE(mesh.VertexData(junction.Index).IsTJunction);

    auto edge = mesh.InsertTJunction(FaceAt(mesh, 1.5, 1.5), junction, Axis::S);
    ASSERT_TRUE(edge.has_value()) << edge.error().Message;

    EXPECT_FALSE(mesh.VertexData(junction.Index).IsTJunction);
    auto created = mesh.FindVertex(glm::dvec2(1.0, 1.5));
    ASSERT_TRUE(created.has_value());
    EXPECT_TRUE(mesh.VertexData(created->Index).IsTJunction);
    ExpectConsistent(mesh);
}

TEST(TMesh, InsertTJunctionRejectsForeignVertex)
{
    TMesh mesh = MakeGridMesh(2, 2);
    auto edge = mesh.InsertTJunction(FaceAt(mesh, 0.5, 0.5), VertexAt(mesh, 2.0, 2.0), Axis::S);
    ASSERT_FALSE(edge.has_value());
    EXPECT_EQ(edge.error().Code, Core::ErrorCode::InvalidArgument);
}

TEST(TMesh, RejectedTJunctionLeavesMeshUntouched)
{
    TMesh mesh = MakeGridMesh(4, 4);
    ASSERT_TRUE(mesh.SplitFace(FaceAt(mesh, 2.5, 1.5), Axis::S, 1.5).has_value());
    const TMesh before = mesh;

    const FaceHandle face = FaceAt(mesh, 1.5, 1.5);
    const VertexHandle junction = VertexAt(mesh, 2.0, 1.5);

    // Anchor outside the face, anchor at a corner, and a line that would not
    // cross the face.
    EXPECT_FALSE(mesh.InsertTJunction(face, VertexAt(mesh, 4.0, 4.0), Axis::S).has_value());
    EXPECT_FALSE(mesh.InsertTJunction(face, VertexAt(mesh, 1.0, 1.0), Axis::S).has_value());
    EXPECT_FALSE(mesh.InsertTJunction(face, junction, Axis::T).has_value());
    EXPECT_EQ(mesh, before);
    EXPECT_EQ(mesh.VertexCount(), before.VertexCount());
    EXPECT_EQ(mesh.HalfedgeCount(), before.HalfedgeCount());

    ASSERT_TRUE(mesh.InsertTJunction(face, junction, Axis::S).has_value());
    EXPECT_NE(mesh, before);
    EXPECT_EQ(mesh.VertexCount(), before.VertexCount() + 1);
    ExpectConsistent(mesh);
}

TEST(TMesh, SetControlPointRequiresPositiveWeight)
{
    TMesh mesh = MakeUnitSquareMesh();
    const VertexHandle v = VertexAt(mesh, 1.0, 1.0);

    EXPECT_TRUE(mesh.SetControlPoint(v, glm::dvec4(1.0, 1.0, 2.0, 0.5)).has_value());
    EXPECT_EQ(mesh.Vertex(v)->Geometry, glm::dvec4(1.0, 1.0, 2.0, 0.5));

    auto bad = mesh.SetControlPoint(v, glm::dvec4(1.0, 1.0, 2.0, 0.0));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().Code, Core::ErrorCode::InvalidArgument);

    auto stale = mesh.SetControlPoint(VertexHandle(v.Index, v.Generation + 1), glm::dvec4(0.0, 0.0, 0.0, 1.0));
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().Code, Core::ErrorCode::InvalidIndex);
}

// -----------------------------------------------------------------------------
// Dirty tracking
// -----------------------------------------------------------------------------

TEST(TMesh, DirtySetStaysLocal)
{
    TMesh mesh = MakeGridMesh(12, 12);
    mesh.ClearDirty();
    EXPECT_EQ(mesh.DirtyCount(), 0u);

    const HalfedgeHandle h = *mesh.FindEdge(VertexAt(mesh, 10.0, 10.0), VertexAt(mesh, 11.0, 10.0));
    auto w = mesh.SplitEdge(h, 10.5);
    ASSERT_TRUE(w.has_value());

    EXPECT_TRUE(mesh.IsDirty(w->Index));
    EXPECT_TRUE(mesh.IsDirty(VertexAt(mesh, 10.0, 10.0).Index));
    EXPECT_TRUE(mesh.IsDirty(VertexAt(mesh, 4.0, 4.0).Index));
    EXPECT_FALSE(mesh.IsDirty(VertexAt(mesh, 0.0, 0.0).Index));
    EXPECT_FALSE(mesh.IsDirty(VertexAt(mesh, 2.0, 12.0).Index));
    EXPECT_LT(mesh.DirtyCount(), mesh.VertexCount());

    const auto dirty = mesh.DirtyVertices();
    EXPECT_EQ(dirty.size(), mesh.DirtyCount());
    EXPECT_NE(std::find(dirty.begin(), dirty.end(), *w), dirty.end());
}

TEST(TMesh, CopiesCompareEqual)
{
    TMesh mesh = MakeGridMesh(3, 3);
    TMesh copy = mesh;
    EXPECT_EQ(copy, mesh);

    ASSERT_TRUE(copy.SplitFace(FaceAt(copy, 1.5, 1.5), Axis::T, 1.5).has_value());
    EXPECT_NE(copy, mesh);
    EXPECT_EQ(mesh.FaceCount(), 9u);
}
