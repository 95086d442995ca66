module;

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <format>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module TSpline:TMesh.Impl;

import Core;
import :Types;
import :Error;
import :TMesh;

namespace TSpline
{
    namespace
    {
        [[nodiscard]] Error Corrupt(std::string message)
        {
            return MakeError(Core::ErrorCode::TopologyCorrupt, std::move(message));
        }

        [[nodiscard]] unsigned DirectionBit(Axis axis, Sign sign)
        {
            const unsigned base = axis == Axis::S ? 0u : 2u;
            return 1u << (base + (sign == Sign::Positive ? 0u : 1u));
        }
    }

    // =========================================================================
    // Construction
    // =========================================================================

    Expected<TMesh> TMesh::Create(TMeshDescription description)
    {
        TMesh mesh;
        mesh.m_Tolerance = description.Tolerance;

        mesh.m_Vertices.Reserve(description.Vertices.size());
        mesh.m_Halfedges.Reserve(description.Halfedges.size());
        mesh.m_Faces.Reserve(description.Faces.size());

        for (ControlPoint& cp : description.Vertices)
        {
            cp.IsTJunction = false;
            (void)mesh.m_Vertices.Add(cp);
        }
        for (const HalfEdge& he : description.Halfedges)
            (void)mesh.m_Halfedges.Add(he);
        for (const MeshFace& face : description.Faces)
            (void)mesh.m_Faces.Add(face);

        // Derive missing outgoing half-edges before the circulation checks.
        const auto nV = static_cast<std::uint32_t>(mesh.VertexCount());
        const auto nH = static_cast<std::uint32_t>(mesh.HalfedgeCount());
        for (std::uint32_t h = 0; h < nH; ++h)
        {
            const std::uint32_t origin = mesh.m_Halfedges[h].Origin;
            if (origin < nV && mesh.m_Vertices[origin].Outgoing == InvalidIndex)
                mesh.m_Vertices[origin].Outgoing = h;
        }

        if (auto valid = mesh.ValidateTopology(); !valid)
        {
            Core::Log::Warn("TMesh::Create rejected topology ({}): {}",
                            Core::ErrorCodeToString(valid.error().Code), valid.error().Message);
            return std::unexpected(std::move(valid.error()));
        }

        for (std::uint32_t v = 0; v < nV; ++v)
            mesh.RefreshJunctionFlag(v);
        mesh.MarkAllDirty();

        Core::Log::Debug("TMesh created: {} vertices, {} half-edges, {} faces",
                         mesh.VertexCount(), mesh.HalfedgeCount(), mesh.FaceCount());
        return mesh;
    }

    Expected<TMesh> TMesh::FromFaces(std::vector<ControlPoint> vertices,
                                     std::span<const std::vector<std::uint32_t>> faces,
                                     double tolerance)
    {
        TMeshDescription desc;
        desc.Tolerance = tolerance;
        desc.Vertices = std::move(vertices);
        for (ControlPoint& cp : desc.Vertices)
            cp.Outgoing = InvalidIndex;

        const auto nV = static_cast<std::uint32_t>(desc.Vertices.size());
        std::map<std::pair<std::uint32_t, std::uint32_t>, std::uint32_t> directed;

        for (std::size_t fi = 0; fi < faces.size(); ++fi)
        {
            const std::vector<std::uint32_t>& loop = faces[fi];
            const auto n = static_cast<std::uint32_t>(loop.size());
            if (n < 3)
                return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                                 std::format("face {} has {} vertices", fi, n)));

            const auto first = static_cast<std::uint32_t>(desc.Halfedges.size());
            for (std::uint32_t k = 0; k < n; ++k)
            {
                const std::uint32_t a = loop[k];
                const std::uint32_t b = loop[(k + 1) % n];
                if (a >= nV || b >= nV)
                    return std::unexpected(MakeError(Core::ErrorCode::InvalidIndex,
                                                     std::format("face {} references vertex {} of {}", fi, std::max(a, b), nV)));

                const glm::dvec2 d = desc.Vertices[b].Param - desc.Vertices[a].Param;
                HalfEdge he;
                if (std::abs(d.y) <= tolerance && std::abs(d.x) > tolerance)
                {
                    he.Direction = Axis::S;
                    he.KnotInterval = std::abs(d.x);
                }
                else if (std::abs(d.x) <= tolerance && std::abs(d.y) > tolerance)
                {
                    he.Direction = Axis::T;
                    he.KnotInterval = std::abs(d.y);
                }
                else
                {
                    return std::unexpected(Corrupt(std::format("face {} edge {}->{} is not axis aligned", fi, a, b)));
                }

                he.Origin = a;
                he.Face = static_cast<std::uint32_t>(fi);
                he.Next = first + (k + 1) % n;
                he.Prev = first + (k + n - 1) % n;

                const auto index = static_cast<std::uint32_t>(desc.Halfedges.size());
                if (!directed.emplace(std::make_pair(a, b), index).second)
                    return std::unexpected(Corrupt(std::format("edge {}->{} used twice with the same orientation", a, b)));
                desc.Halfedges.push_back(he);
            }
            desc.Faces.push_back(MeshFace{first});
        }

        // Pair interior half-edges, give the rest a faceless boundary twin.
        const auto interiorCount = static_cast<std::uint32_t>(desc.Halfedges.size());
        std::unordered_map<std::uint32_t, std::uint32_t> boundaryFrom;
        for (std::uint32_t h = 0; h < interiorCount; ++h)
        {
            const std::uint32_t a = desc.Halfedges[h].Origin;
            const std::uint32_t b = desc.Halfedges[desc.Halfedges[h].Next].Origin;

            if (auto it = directed.find({b, a}); it != directed.end())
            {
                desc.Halfedges[h].Twin = it->second;
                continue;
            }

            HalfEdge boundary;
            boundary.Origin = b;
            boundary.Twin = h;
            boundary.Direction = desc.Halfedges[h].Direction;
            boundary.KnotInterval = desc.Halfedges[h].KnotInterval;

            const auto index = static_cast<std::uint32_t>(desc.Halfedges.size());
            desc.Halfedges[h].Twin = index;
            if (!boundaryFrom.emplace(b, index).second)
                return std::unexpected(Corrupt(std::format("vertex {} is a non-manifold boundary vertex", b)));
            desc.Halfedges.push_back(boundary);
        }

        // Link the boundary loops: the boundary half-edge ending at a vertex is
        // followed by the one leaving it.
        for (std::uint32_t h = interiorCount; h < desc.Halfedges.size(); ++h)
        {
            const std::uint32_t end = desc.Halfedges[desc.Halfedges[h].Twin].Origin;
            auto it = boundaryFrom.find(end);
            if (it == boundaryFrom.end())
                return std::unexpected(Corrupt(std::format("boundary loop is open at vertex {}", end)));
            desc.Halfedges[h].Next = it->second;
            desc.Halfedges[it->second].Prev = h;
        }

        return Create(std::move(desc));
    }

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    Result TMesh::ValidateTopology() const
    {
        const auto nV = static_cast<std::uint32_t>(VertexCount());
        const auto nH = static_cast<std::uint32_t>(HalfedgeCount());
        const auto nF = static_cast<std::uint32_t>(FaceCount());

        // 1. Index ranges
        for (std::uint32_t h = 0; h < nH; ++h)
        {
            const HalfEdge& he = m_Halfedges[h];
            const bool bad = he.Origin >= nV || he.Next >= nH || he.Prev >= nH ||
                             (he.HasTwin() && he.Twin >= nH) || (he.HasFace() && he.Face >= nF);
            if (bad)
                return std::unexpected(MakeError(Core::ErrorCode::InvalidIndex,
                                                 std::format("half-edge {} references an index out of range", h))
                                           .With(HalfedgeHandleOf(h)));
        }
        for (std::uint32_t f = 0; f < nF; ++f)
        {
            if (m_Faces[f].Halfedge >= nH)
                return std::unexpected(MakeError(Core::ErrorCode::InvalidIndex,
                                                 std::format("face {} references half-edge {}", f, m_Faces[f].Halfedge))
                                           .With(FaceHandleOf(f)));
        }
        for (std::uint32_t v = 0; v < nV; ++v)
        {
            const std::uint32_t out = m_Vertices[v].Outgoing;
            if (out != InvalidIndex && out >= nH)
                return std::unexpected(MakeError(Core::ErrorCode::InvalidIndex,
                                                 std::format("vertex {} references half-edge {}", v, out))
                                           .With(VertexHandleOf(v)));
            if (out != InvalidIndex && m_Halfedges[out].Origin != v)
                return std::unexpected(Corrupt(std::format("vertex {} outgoing half-edge {} starts elsewhere", v, out))
                                           .With(VertexHandleOf(v)));
        }

        // 2. Local pairing
        for (std::uint32_t h = 0; h < nH; ++h)
        {
            const HalfEdge& he = m_Halfedges[h];
            const HalfEdge& next = m_Halfedges[he.Next];

            if (next.Prev != h)
                return std::unexpected(Corrupt(std::format("prev(next({})) != {}", h, h)).With(HalfedgeHandleOf(h)));
            if (next.Face != he.Face)
                return std::unexpected(Corrupt(std::format("half-edge {} and its successor disagree on the face", h))
                                           .With(HalfedgeHandleOf(h)));
            if (next.Origin == he.Origin)
                return std::unexpected(Corrupt(std::format("half-edge {} is degenerate", h)).With(HalfedgeHandleOf(h)));

            if (he.HasTwin())
            {
                const HalfEdge& twin = m_Halfedges[he.Twin];
                if (he.Twin == h || twin.Twin != h)
                    return std::unexpected(Corrupt(std::format("twin({}) is not symmetric", h)).With(HalfedgeHandleOf(h)));
                if (twin.Origin != next.Origin || m_Halfedges[twin.Next].Origin != he.Origin)
                    return std::unexpected(Corrupt(std::format("half-edge {} and its twin do not share endpoints", h))
                                               .With(HalfedgeHandleOf(h)));
            }
        }

        // 3. Loop closure, one loop per face
        std::vector<std::uint32_t> loopId(nH, InvalidIndex);
        std::uint32_t loops = 0;
        for (std::uint32_t start = 0; start < nH; ++start)
        {
            if (loopId[start] != InvalidIndex)
                continue;

            std::uint32_t h = start;
            std::uint32_t steps = 0;
            do
            {
                loopId[h] = loops;
                h = m_Halfedges[h].Next;
                if (++steps > nH)
                    return std::unexpected(Corrupt(std::format("loop through half-edge {} does not close", start))
                                               .With(HalfedgeHandleOf(start)));
            } while (h != start);
            ++loops;
        }
        for (std::uint32_t h = 0; h < nH; ++h)
        {
            const HalfEdge& he = m_Halfedges[h];
            if (he.HasFace() && loopId[h] != loopId[m_Faces[he.Face].Halfedge])
                return std::unexpected(Corrupt(std::format("face {} is split over several loops", he.Face))
                                           .With(FaceHandleOf(he.Face)));
        }
        for (std::uint32_t f = 0; f < nF; ++f)
        {
            if (m_Halfedges[m_Faces[f].Halfedge].Face != f)
                return std::unexpected(Corrupt(std::format("face {} half-edge belongs to another face", f))
                                           .With(FaceHandleOf(f)));
        }

        // 4. Parametric consistency of every edge
        for (std::uint32_t h = 0; h < nH; ++h)
        {
            const HalfEdge& he = m_Halfedges[h];
            const glm::dvec2 d = Param(Destination(h)) - Param(he.Origin);
            const double along = Coordinate(d, he.Direction);
            const double across = Coordinate(d, Perpendicular(he.Direction));
            if (std::abs(across) > m_Tolerance || std::abs(std::abs(along) - he.KnotInterval) > m_Tolerance ||
                he.KnotInterval <= m_Tolerance)
            {
                return std::unexpected(Corrupt(std::format("half-edge {} ({}, interval {}) does not match its parametric offset ({}, {})",
                                                           h, ToString(he.Direction), he.KnotInterval, d.x, d.y))
                                           .With(HalfedgeHandleOf(h)));
            }
        }

        // 5. Faces are rectangles: every corner lies on the bounding box.
        for (std::uint32_t f = 0; f < nF; ++f)
        {
            const Bounds box = FaceBounds(f);
            const glm::dvec2 e = box.Extent();
            if (e.x <= m_Tolerance || e.y <= m_Tolerance)
                return std::unexpected(Corrupt(std::format("face {} has an empty parameter rectangle", f)).With(FaceHandleOf(f)));

            std::uint32_t h = m_Faces[f].Halfedge;
            do
            {
                const glm::dvec2& p = Param(m_Halfedges[h].Origin);
                const bool onSide = std::abs(p.x - box.Min.x) <= m_Tolerance || std::abs(p.x - box.Max.x) <= m_Tolerance ||
                                    std::abs(p.y - box.Min.y) <= m_Tolerance || std::abs(p.y - box.Max.y) <= m_Tolerance;
                if (!onSide)
                    return std::unexpected(Corrupt(std::format("face {} is not an axis-aligned rectangle", f))
                                               .With(FaceHandleOf(f)));
                h = m_Halfedges[h].Next;
            } while (h != m_Faces[f].Halfedge);
        }

        // 6. Every incident edge must be reachable by circulation, and a vertex
        //    whose spokes are all paired has as many incoming as outgoing
        //    half-edges.
        std::vector<std::uint32_t> incidentEdges(nV, 0);
        std::vector<std::uint32_t> outgoing(nV, 0);
        std::vector<std::uint32_t> incoming(nV, 0);
        for (std::uint32_t h = 0; h < nH; ++h)
        {
            const HalfEdge& he = m_Halfedges[h];
            ++outgoing[he.Origin];
            ++incoming[Destination(h)];
            if (he.HasTwin() && he.Twin < h)
                continue;
            ++incidentEdges[he.Origin];
            ++incidentEdges[Destination(h)];
        }
        for (std::uint32_t v = 0; v < nV; ++v)
        {
            const std::vector<Spoke> spokes = Spokes(v);
            if (spokes.size() != incidentEdges[v])
                return std::unexpected(Corrupt(std::format("vertex {} has {} incident edges but {} are reachable by circulation",
                                                           v, incidentEdges[v], spokes.size()))
                                           .With(VertexHandleOf(v)));

            const bool paired = std::all_of(spokes.begin(), spokes.end(), [&](const Spoke& s)
            {
                return s.Outgoing && m_Halfedges[s.Halfedge].HasTwin();
            });
            if (paired && outgoing[v] != incoming[v])
                return std::unexpected(Corrupt(std::format("vertex {} has {} outgoing but {} incoming half-edges",
                                                           v, outgoing[v], incoming[v]))
                                           .With(VertexHandleOf(v)));
        }

        return {};
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    std::vector<VertexHandle> TMesh::VertexHandles() const
    {
        std::vector<VertexHandle> result;
        result.reserve(VertexCount());
        for (std::uint32_t i = 0; i < VertexCount(); ++i)
            result.push_back(m_Vertices.HandleOf(i));
        return result;
    }

    std::vector<HalfedgeHandle> TMesh::HalfedgeHandles() const
    {
        std::vector<HalfedgeHandle> result;
        result.reserve(HalfedgeCount());
        for (std::uint32_t i = 0; i < HalfedgeCount(); ++i)
            result.push_back(m_Halfedges.HandleOf(i));
        return result;
    }

    std::vector<FaceHandle> TMesh::FaceHandles() const
    {
        std::vector<FaceHandle> result;
        result.reserve(FaceCount());
        for (std::uint32_t i = 0; i < FaceCount(); ++i)
            result.push_back(m_Faces.HandleOf(i));
        return result;
    }

    Expected<ControlPoint> TMesh::Vertex(VertexHandle v) const
    {
        auto cp = m_Vertices.Get(v);
        if (!cp)
            return std::unexpected(MakeError(cp.error(), std::format("vertex {} is not live", v)).With(v));
        return **cp;
    }

    Expected<HalfEdge> TMesh::Edge(HalfedgeHandle h) const
    {
        auto he = m_Halfedges.Get(h);
        if (!he)
            return std::unexpected(MakeError(he.error(), std::format("half-edge {} is not live", h)).With(h));
        return **he;
    }

    Expected<MeshFace> TMesh::Face(FaceHandle f) const
    {
        auto face = m_Faces.Get(f);
        if (!face)
            return std::unexpected(MakeError(face.error(), std::format("face {} is not live", f)).With(f));
        return **face;
    }

    // =========================================================================
    // Traversal
    // =========================================================================

    Expected<std::vector<std::uint32_t>> TMesh::FaceLoop(std::uint32_t f) const
    {
        if (f >= FaceCount())
            return std::unexpected(MakeError(Core::ErrorCode::InvalidIndex, std::format("face index {} out of range", f)));

        std::vector<std::uint32_t> loop;
        const std::uint32_t start = m_Faces[f].Halfedge;
        std::uint32_t h = start;
        do
        {
            loop.push_back(h);
            if (loop.size() > HalfedgeCount())
                return std::unexpected(Corrupt(std::format("boundary of face {} does not close", f)).With(FaceHandleOf(f)));
            h = m_Halfedges[h].Next;
        } while (h != start);
        return loop;
    }

    Expected<std::vector<HalfedgeHandle>> TMesh::FaceBoundary(FaceHandle f) const
    {
        if (auto face = Face(f); !face)
            return std::unexpected(std::move(face.error()));

        auto loop = FaceLoop(f.Index);
        if (!loop)
            return std::unexpected(std::move(loop.error()));

        std::vector<HalfedgeHandle> result;
        result.reserve(loop->size());
        for (std::uint32_t h : *loop)
            result.push_back(HalfedgeHandleOf(h));
        return result;
    }

    std::uint32_t TMesh::Destination(std::uint32_t h) const
    {
        return m_Halfedges[m_Halfedges[h].Next].Origin;
    }

    Expected<VertexHandle> TMesh::DestinationOf(HalfedgeHandle h, BoundaryPolicy policy) const
    {
        auto he = Edge(h);
        if (!he)
            return std::unexpected(std::move(he.error()));

        if (he->HasTwin())
            return VertexHandleOf(m_Halfedges[he->Twin].Origin);

        if (policy == BoundaryPolicy::Tolerant)
            return VertexHandleOf(Destination(h.Index));

        return std::unexpected(MakeError(Core::ErrorCode::BoundaryEdge,
                                         std::format("half-edge {} has no twin", h.Index)).With(h));
    }

    std::optional<HalfedgeHandle> TMesh::FindEdge(VertexHandle a, VertexHandle b) const
    {
        if (!Contains(a) || !Contains(b))
            return std::nullopt;

        for (const Spoke& spoke : Spokes(a.Index))
        {
            if (spoke.Neighbor == b.Index)
                return HalfedgeHandleOf(spoke.Halfedge);
        }
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Spokes
    // -------------------------------------------------------------------------

    Spoke TMesh::MakeSpoke(std::uint32_t v, std::uint32_t h, bool outgoing) const
    {
        const HalfEdge& he = m_Halfedges[h];
        Spoke spoke;
        spoke.Halfedge = h;
        spoke.Outgoing = outgoing;
        spoke.Neighbor = outgoing ? Destination(h) : he.Origin;
        spoke.Direction = he.Direction;
        spoke.Delta = Coordinate(Param(spoke.Neighbor), he.Direction) - Coordinate(Param(v), he.Direction);
        return spoke;
    }

    std::vector<Spoke> TMesh::Spokes(std::uint32_t v) const
    {
        std::vector<Spoke> result;
        const std::uint32_t start = m_Vertices[v].Outgoing;
        if (start == InvalidIndex)
            return result;

        const std::size_t guard = HalfedgeCount() + 1;

        // Rotate twin -> next until the fan closes or hits a twinless spoke.
        bool closed = false;
        std::uint32_t h = start;
        for (std::size_t i = 0; i < guard; ++i)
        {
            result.push_back(MakeSpoke(v, h, true));
            const std::uint32_t twin = m_Halfedges[h].Twin;
            if (twin == InvalidIndex)
                break;
            h = m_Halfedges[twin].Next;
            if (h == start)
            {
                closed = true;
                break;
            }
        }
        if (closed)
            return result;

        // Open fan: continue the other way round from the start.
        h = start;
        for (std::size_t i = 0; i < guard; ++i)
        {
            const std::uint32_t incoming = m_Halfedges[h].Prev;
            const std::uint32_t twin = m_Halfedges[incoming].Twin;
            if (twin == InvalidIndex)
            {
                result.push_back(MakeSpoke(v, incoming, false));
                break;
            }
            h = twin;
            if (h == start)
                break;
            result.push_back(MakeSpoke(v, h, true));
        }
        return result;
    }

    Expected<std::vector<Spoke>> TMesh::Spokes(VertexHandle v) const
    {
        if (auto cp = Vertex(v); !cp)
            return std::unexpected(std::move(cp.error()));
        return Spokes(v.Index);
    }

    Expected<std::size_t> TMesh::Valence(VertexHandle v) const
    {
        auto spokes = Spokes(v);
        if (!spokes)
            return std::unexpected(std::move(spokes.error()));
        return spokes->size();
    }

    bool TMesh::IsBoundaryVertex(std::uint32_t v) const
    {
        const std::vector<Spoke> spokes = Spokes(v);
        if (spokes.empty())
            return true;

        for (const Spoke& spoke : spokes)
        {
            const HalfEdge& he = m_Halfedges[spoke.Halfedge];
            if (!spoke.Outgoing || !he.HasTwin())
                return true;
            if (!he.HasFace() || !m_Halfedges[he.Twin].HasFace())
                return true;
        }
        return false;
    }

    Expected<bool> TMesh::IsBoundary(VertexHandle v) const
    {
        if (auto cp = Vertex(v); !cp)
            return std::unexpected(std::move(cp.error()));
        return IsBoundaryVertex(v.Index);
    }

    bool TMesh::HasSpokeAlong(std::uint32_t v, Axis axis) const
    {
        const std::vector<Spoke> spokes = Spokes(v);
        return std::any_of(spokes.begin(), spokes.end(), [axis](const Spoke& s) { return s.Direction == axis; });
    }

    Expected<std::optional<Spoke>> TMesh::FindSpoke(std::uint32_t v, Axis axis, Sign sign) const
    {
        std::optional<Spoke> found;
        for (const Spoke& spoke : Spokes(v))
        {
            const glm::dvec2 d = Param(spoke.Neighbor) - Param(v);
            if (std::abs(Coordinate(d, Perpendicular(spoke.Direction))) > m_Tolerance)
            {
                return std::unexpected(MakeError(Core::ErrorCode::AmbiguousTraversal,
                                                 std::format("spoke {} of vertex {} is tagged {} but is not aligned with it",
                                                             spoke.Halfedge, v, ToString(spoke.Direction)))
                                           .With(VertexHandleOf(v)).With(HalfedgeHandleOf(spoke.Halfedge)));
            }

            if (spoke.Direction != axis || spoke.Side() != sign)
                continue;

            if (found)
            {
                return std::unexpected(MakeError(Core::ErrorCode::AmbiguousTraversal,
                                                 std::format("vertex {} has two spokes along {}{}", v,
                                                             sign == Sign::Positive ? "+" : "-", ToString(axis)))
                                           .With(VertexHandleOf(v))
                                           .With(HalfedgeHandleOf(found->Halfedge))
                                           .With(HalfedgeHandleOf(spoke.Halfedge)));
            }
            found = spoke;
        }
        return found;
    }

    // =========================================================================
    // Geometry queries
    // =========================================================================

    std::vector<std::uint32_t> TMesh::IncidentFaces(std::uint32_t v) const
    {
        std::vector<std::uint32_t> faces;
        auto add = [&faces](std::uint32_t f)
        {
            if (f != InvalidIndex && std::find(faces.begin(), faces.end(), f) == faces.end())
                faces.push_back(f);
        };

        for (const Spoke& spoke : Spokes(v))
        {
            const HalfEdge& he = m_Halfedges[spoke.Halfedge];
            add(he.Face);
            if (he.HasTwin())
                add(m_Halfedges[he.Twin].Face);
        }
        return faces;
    }

    Bounds TMesh::FaceBounds(std::uint32_t f) const
    {
        Bounds box;
        const std::uint32_t start = m_Faces[f].Halfedge;
        std::uint32_t h = start;
        std::size_t steps = 0;
        do
        {
            box.Add(Param(m_Halfedges[h].Origin));
            h = m_Halfedges[h].Next;
        } while (h != start && ++steps <= HalfedgeCount());
        return box;
    }

    Bounds TMesh::ParameterBounds() const
    {
        Bounds box;
        for (const ControlPoint& cp : m_Vertices)
            box.Add(cp.Param);
        return box;
    }

    std::optional<FaceHandle> TMesh::FaceContaining(const glm::dvec2& p) const
    {
        for (std::uint32_t f = 0; f < FaceCount(); ++f)
        {
            const Bounds box = FaceBounds(f);
            if (p.x > box.Min.x + m_Tolerance && p.x < box.Max.x - m_Tolerance &&
                p.y > box.Min.y + m_Tolerance && p.y < box.Max.y - m_Tolerance)
            {
                return FaceHandleOf(f);
            }
        }
        return std::nullopt;
    }

    std::optional<VertexHandle> TMesh::FindVertex(const glm::dvec2& p) const
    {
        for (std::uint32_t v = 0; v < VertexCount(); ++v)
        {
            const glm::dvec2 d = Param(v) - p;
            if (std::abs(d.x) <= m_Tolerance && std::abs(d.y) <= m_Tolerance)
                return VertexHandleOf(v);
        }
        return std::nullopt;
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    Expected<VertexHandle> TMesh::SplitEdge(HalfedgeHandle h, double coordinate)
    {
        auto he = Edge(h);
        if (!he)
            return std::unexpected(std::move(he.error()));

        const std::uint32_t origin = he->Origin;
        const std::uint32_t dest = Destination(h.Index);
        const double a = Coordinate(Param(origin), he->Direction);
        const double b = Coordinate(Param(dest), he->Direction);
        if (!(coordinate > std::min(a, b) + m_Tolerance && coordinate < std::max(a, b) - m_Tolerance))
        {
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("split coordinate {} is outside the open span ({}, {}) of half-edge {}",
                                                         coordinate, std::min(a, b), std::max(a, b), h.Index))
                                       .With(h));
        }

        const std::uint32_t w = SplitEdgeAt(h.Index, coordinate);
        const std::uint32_t seeds[] = {origin, dest, w};
        MarkDirtyAround(seeds);

        Core::Log::Debug("SplitEdge: half-edge {} split at {} -> vertex {}", h.Index, coordinate, w);
        return VertexHandleOf(w);
    }

    std::uint32_t TMesh::SplitEdgeAt(std::uint32_t h, double coordinate)
    {
        const HalfEdge e = m_Halfedges[h];
        const std::uint32_t origin = e.Origin;
        const std::uint32_t dest = Destination(h);
        const double a = Coordinate(Param(origin), e.Direction);
        const double b = Coordinate(Param(dest), e.Direction);
        const double alpha = (coordinate - a) / (b - a);

        ControlPoint point;
        point.Geometry = glm::mix(m_Vertices[origin].Geometry, m_Vertices[dest].Geometry, alpha);
        point.Param = glm::mix(Param(origin), Param(dest), alpha);
        if (e.Direction == Axis::S)
            point.Param.x = coordinate;
        else
            point.Param.y = coordinate;
        const std::uint32_t w = m_Vertices.Add(point).Index;

        // origin -> w keeps slot h, w -> dest is new
        HalfEdge tail;
        tail.Origin = w;
        tail.Face = e.Face;
        tail.Next = e.Next;
        tail.Prev = h;
        tail.Direction = e.Direction;
        tail.KnotInterval = std::abs(b - coordinate);
        const std::uint32_t h2 = m_Halfedges.Add(tail).Index;

        m_Halfedges[e.Next].Prev = h2;
        m_Halfedges[h].Next = h2;
        m_Halfedges[h].KnotInterval = std::abs(coordinate - a);
        m_Vertices[w].Outgoing = h2;

        if (e.HasTwin())
        {
            // dest -> w keeps the twin slot, w -> origin is new
            const HalfEdge t = m_Halfedges[e.Twin];
            HalfEdge twinTail;
            twinTail.Origin = w;
            twinTail.Face = t.Face;
            twinTail.Next = t.Next;
            twinTail.Prev = e.Twin;
            twinTail.Direction = e.Direction;
            twinTail.KnotInterval = std::abs(coordinate - a);
            const std::uint32_t t2 = m_Halfedges.Add(twinTail).Index;

            m_Halfedges[t.Next].Prev = t2;
            m_Halfedges[e.Twin].Next = t2;
            m_Halfedges[e.Twin].KnotInterval = std::abs(b - coordinate);

            m_Halfedges[h].Twin = t2;
            m_Halfedges[t2].Twin = h;
            m_Halfedges[h2].Twin = e.Twin;
            m_Halfedges[e.Twin].Twin = h2;

            m_Halfedges.Retire(e.Twin);
        }
        m_Halfedges.Retire(h);

        RefreshJunctionFlag(w);
        return w;
    }

    std::optional<std::uint32_t> TMesh::LoopHalfedgeFrom(std::span<const std::uint32_t> loop, std::uint32_t v) const
    {
        for (std::uint32_t h : loop)
        {
            if (m_Halfedges[h].Origin == v)
                return h;
        }
        return std::nullopt;
    }

    Expected<std::uint32_t> TMesh::CheckedConnect(std::uint32_t f, std::uint32_t a, std::uint32_t b) const
    {
        if (a == b)
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument, "cannot connect a vertex to itself")
                                       .With(VertexHandleOf(a)));

        const glm::dvec2 d = Param(b) - Param(a);
        Axis axis = Axis::S;
        if (std::abs(d.y) <= m_Tolerance)
            axis = Axis::S;
        else if (std::abs(d.x) <= m_Tolerance)
            axis = Axis::T;
        else
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("vertices {} and {} are not axis aligned", a, b))
                                       .With(VertexHandleOf(a)).With(VertexHandleOf(b)));

        const Bounds box = FaceBounds(f);
        const Axis across = Perpendicular(axis);
        const double line = Coordinate(Param(a), across);
        if (!(line > Coordinate(box.Min, across) + m_Tolerance && line < Coordinate(box.Max, across) - m_Tolerance))
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("segment {}-{} runs along the boundary of face {}", a, b, f))
                                       .With(FaceHandleOf(f)));

        auto loop = FaceLoop(f);
        if (!loop)
            return std::unexpected(std::move(loop.error()));

        const auto ha = LoopHalfedgeFrom(*loop, a);
        const auto hb = LoopHalfedgeFrom(*loop, b);
        if (!ha || !hb)
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("vertices {} and {} are not both on face {}", a, b, f))
                                       .With(FaceHandleOf(f)));

        for (const Spoke& spoke : Spokes(a))
        {
            if (spoke.Neighbor == b)
                return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                                 std::format("vertices {} and {} are already connected", a, b))
                                           .With(HalfedgeHandleOf(spoke.Halfedge)));
        }

        return *ha;
    }

    std::uint32_t TMesh::ConnectAt(std::uint32_t f, std::uint32_t ha, std::uint32_t hb, Axis axis)
    {
        const std::uint32_t a = m_Halfedges[ha].Origin;
        const std::uint32_t b = m_Halfedges[hb].Origin;
        const std::uint32_t pa = m_Halfedges[ha].Prev;
        const std::uint32_t pb = m_Halfedges[hb].Prev;
        const double interval = std::abs(Coordinate(Param(b), axis) - Coordinate(Param(a), axis));

        HalfEdge forward;
        forward.Origin = a;
        forward.Face = f;
        forward.Next = hb;
        forward.Prev = pa;
        forward.Direction = axis;
        forward.KnotInterval = interval;

        HalfEdge backward;
        backward.Origin = b;
        backward.Next = ha;
        backward.Prev = pb;
        backward.Direction = axis;
        backward.KnotInterval = interval;

        const std::uint32_t n1 = m_Halfedges.Add(forward).Index;
        const std::uint32_t n2 = m_Halfedges.Add(backward).Index;
        m_Halfedges[n1].Twin = n2;
        m_Halfedges[n2].Twin = n1;

        m_Halfedges[pa].Next = n1;
        m_Halfedges[hb].Prev = n1;
        m_Halfedges[pb].Next = n2;
        m_Halfedges[ha].Prev = n2;

        // The loop through n1 keeps the face slot, the loop through n2 is new.
        const std::uint32_t g = m_Faces.Add(MeshFace{n2}).Index;
        std::uint32_t h = n2;
        do
        {
            m_Halfedges[h].Face = g;
            h = m_Halfedges[h].Next;
        } while (h != n2);

        m_Faces[f].Halfedge = n1;
        m_Faces.Retire(f);

        RefreshJunctionFlag(a);
        RefreshJunctionFlag(b);
        return n1;
    }

    Expected<HalfedgeHandle> TMesh::ConnectVertices(FaceHandle f, VertexHandle a, VertexHandle b)
    {
        if (auto face = Face(f); !face)
            return std::unexpected(std::move(face.error()));
        if (auto va = Vertex(a); !va)
            return std::unexpected(std::move(va.error()));
        if (auto vb = Vertex(b); !vb)
            return std::unexpected(std::move(vb.error()));

        auto ha = CheckedConnect(f.Index, a.Index, b.Index);
        if (!ha)
            return std::unexpected(std::move(ha.error()));

        auto loop = FaceLoop(f.Index);
        if (!loop)
            return std::unexpected(std::move(loop.error()));
        const std::uint32_t hb = *LoopHalfedgeFrom(*loop, b.Index);

        const Axis axis = std::abs(Param(a.Index).y - Param(b.Index).y) <= m_Tolerance ? Axis::S : Axis::T;
        const std::uint32_t n1 = ConnectAt(f.Index, *ha, hb, axis);

        const std::uint32_t seeds[] = {a.Index, b.Index};
        MarkDirtyAround(seeds);
        return HalfedgeHandleOf(n1);
    }

    Expected<TMesh::BoundaryPoint> TMesh::FindBoundaryPoint(std::uint32_t f, const glm::dvec2& p) const
    {
        auto loop = FaceLoop(f);
        if (!loop)
            return std::unexpected(std::move(loop.error()));

        for (std::uint32_t h : *loop)
        {
            const glm::dvec2 d = Param(m_Halfedges[h].Origin) - p;
            if (std::abs(d.x) <= m_Tolerance && std::abs(d.y) <= m_Tolerance)
                return BoundaryPoint{m_Halfedges[h].Origin, InvalidIndex, 0.0};
        }

        for (std::uint32_t h : *loop)
        {
            const HalfEdge& he = m_Halfedges[h];
            const Axis axis = he.Direction;
            const glm::dvec2& p0 = Param(he.Origin);
            const glm::dvec2& p1 = Param(Destination(h));
            if (std::abs(Coordinate(p0, Perpendicular(axis)) - Coordinate(p, Perpendicular(axis))) > m_Tolerance)
                continue;

            const double along = Coordinate(p, axis);
            const double lo = std::min(Coordinate(p0, axis), Coordinate(p1, axis));
            const double hi = std::max(Coordinate(p0, axis), Coordinate(p1, axis));
            if (along > lo && along < hi)
                return BoundaryPoint{InvalidIndex, h, along};
        }

        return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                         std::format("point ({}, {}) is not on the boundary of face {}", p.x, p.y, f))
                                   .With(FaceHandleOf(f)));
    }

    std::uint32_t TMesh::Realize(const BoundaryPoint& point)
    {
        if (point.Vertex != InvalidIndex)
            return point.Vertex;
        return SplitEdgeAt(point.Halfedge, point.Along);
    }

    Expected<HalfedgeHandle> TMesh::InsertTJunction(FaceHandle f, VertexHandle anchor, Axis axis)
    {
        if (auto face = Face(f); !face)
            return std::unexpected(std::move(face.error()));
        if (auto cp = Vertex(anchor); !cp)
            return std::unexpected(std::move(cp.error()));

        auto loop = FaceLoop(f.Index);
        if (!loop)
            return std::unexpected(std::move(loop.error()));
        if (!LoopHalfedgeFrom(*loop, anchor.Index))
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("vertex {} is not on face {}", anchor.Index, f.Index))
                                       .With(anchor).With(f));

        const Bounds box = FaceBounds(f.Index);
        const glm::dvec2 p = Param(anchor.Index);
        const double along = Coordinate(p, axis);
        const double across = Coordinate(p, Perpendicular(axis));

        double target = 0.0;
        if (std::abs(along - Coordinate(box.Min, axis)) <= m_Tolerance)
            target = Coordinate(box.Max, axis);
        else if (std::abs(along - Coordinate(box.Max, axis)) <= m_Tolerance)
            target = Coordinate(box.Min, axis);
        else
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("vertex {} does not lie on a side of face {} crossed by a {} line",
                                                         anchor.Index, f.Index, ToString(axis)))
                                       .With(anchor).With(f));

        if (!(across > Coordinate(box.Min, Perpendicular(axis)) + m_Tolerance &&
              across < Coordinate(box.Max, Perpendicular(axis)) - m_Tolerance))
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("a {} line through vertex {} runs along the boundary of face {}",
                                                         ToString(axis), anchor.Index, f.Index))
                                       .With(anchor).With(f));

        auto opposite = FindBoundaryPoint(f.Index, MakePoint(axis, target, across));
        if (!opposite)
            return std::unexpected(std::move(opposite.error()));

        // Every rejection happens before the far side is split. A far vertex
        // that already exists goes through the full connection checks; a
        // point inside a side becomes a fresh vertex on the loop, aligned with
        // the anchor and off the face boundary, which the checks above cover.
        if (opposite->Vertex != InvalidIndex)
        {
            if (auto ok = CheckedConnect(f.Index, anchor.Index, opposite->Vertex); !ok)
                return std::unexpected(std::move(ok.error()));
        }

        const std::uint32_t b = Realize(*opposite);

        auto updated = FaceLoop(f.Index);
        if (!updated)
            return std::unexpected(std::move(updated.error()));
        const auto ha = LoopHalfedgeFrom(*updated, anchor.Index);
        const auto hb = LoopHalfedgeFrom(*updated, b);
        if (!ha || !hb)
            return std::unexpected(Corrupt(std::format("junction line of face {} left its boundary", f.Index)).With(f));
        const std::uint32_t n1 = ConnectAt(f.Index, *ha, *hb, axis);

        const std::uint32_t seeds[] = {anchor.Index, b};
        MarkDirtyAround(seeds);

        Core::Log::Debug("InsertTJunction: face {} cut along {} from vertex {} to vertex {}",
                         f.Index, ToString(axis), anchor.Index, b);
        return HalfedgeHandleOf(n1);
    }

    Expected<HalfedgeHandle> TMesh::SplitFace(FaceHandle f, Axis axis, double coordinate)
    {
        if (auto face = Face(f); !face)
            return std::unexpected(std::move(face.error()));

        const Bounds box = FaceBounds(f.Index);
        const Axis across = Perpendicular(axis);
        if (!(coordinate > Coordinate(box.Min, across) + m_Tolerance &&
              coordinate < Coordinate(box.Max, across) - m_Tolerance))
        {
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("split coordinate {} is outside face {} ({} range [{}, {}])",
                                                         coordinate, f.Index, ToString(across),
                                                         Coordinate(box.Min, across), Coordinate(box.Max, across)))
                                       .With(f));
        }

        // Locate both ends before touching anything.
        auto first = FindBoundaryPoint(f.Index, MakePoint(axis, Coordinate(box.Min, axis), coordinate));
        if (!first)
            return std::unexpected(std::move(first.error()));
        auto second = FindBoundaryPoint(f.Index, MakePoint(axis, Coordinate(box.Max, axis), coordinate));
        if (!second)
            return std::unexpected(std::move(second.error()));

        const std::uint32_t a = Realize(*first);
        const std::uint32_t b = Realize(*second);

        auto loop = FaceLoop(f.Index);
        if (!loop)
            return std::unexpected(std::move(loop.error()));
        const auto ha = LoopHalfedgeFrom(*loop, a);
        const auto hb = LoopHalfedgeFrom(*loop, b);
        if (!ha || !hb)
            return std::unexpected(Corrupt(std::format("split points of face {} left its boundary", f.Index)).With(f));

        const std::uint32_t n1 = ConnectAt(f.Index, *ha, *hb, axis);

        const std::uint32_t seeds[] = {a, b};
        MarkDirtyAround(seeds);

        Core::Log::Debug("SplitFace: face {} split along {} at {}", f.Index, ToString(axis), coordinate);
        return HalfedgeHandleOf(n1);
    }

    Result TMesh::SetControlPoint(VertexHandle v, const glm::dvec4& geometry)
    {
        auto cp = m_Vertices.Get(v);
        if (!cp)
            return std::unexpected(MakeError(cp.error(), std::format("vertex {} is not live", v)).With(v));

        const bool finite = std::isfinite(geometry.x) && std::isfinite(geometry.y) &&
                            std::isfinite(geometry.z) && std::isfinite(geometry.w);
        if (!finite || geometry.w <= 0.0)
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("control point {} needs finite coordinates and a positive weight (w = {})",
                                                         v.Index, geometry.w))
                                       .With(v));

        (*cp)->Geometry = geometry;
        return {};
    }

    // -------------------------------------------------------------------------
    // Junction flags and dirty tracking
    // -------------------------------------------------------------------------

    void TMesh::RefreshJunctionFlag(std::uint32_t v)
    {
        bool junction = false;
        const std::vector<Spoke> spokes = Spokes(v);
        if (spokes.size() == 3 && !IsBoundaryVertex(v))
        {
            unsigned mask = 0;
            for (const Spoke& spoke : spokes)
                mask |= DirectionBit(spoke.Direction, spoke.Side());
            junction = std::popcount(mask) == 3;
        }
        m_Vertices[v].IsTJunction = junction;
    }

    void TMesh::MarkDirtyAround(std::span<const std::uint32_t> seeds)
    {
        const std::size_t nV = VertexCount();
        m_Dirty.resize(nV, 0);

        std::vector<std::uint32_t> depth(nV, InvalidIndex);
        std::deque<std::uint32_t> queue;
        for (std::uint32_t s : seeds)
        {
            if (depth[s] == InvalidIndex)
            {
                depth[s] = 0;
                queue.push_back(s);
            }
        }

        while (!queue.empty())
        {
            const std::uint32_t v = queue.front();
            queue.pop_front();
            m_Dirty[v] = 1;
            if (depth[v] >= DirtyRadius)
                continue;

            for (std::uint32_t f : IncidentFaces(v))
            {
                const std::uint32_t start = m_Faces[f].Halfedge;
                std::uint32_t h = start;
                do
                {
                    const std::uint32_t u = m_Halfedges[h].Origin;
                    if (depth[u] == InvalidIndex)
                    {
                        depth[u] = depth[v] + 1;
                        queue.push_back(u);
                    }
                    h = m_Halfedges[h].Next;
                } while (h != start);
            }
        }
    }

    std::vector<VertexHandle> TMesh::DirtyVertices() const
    {
        std::vector<VertexHandle> result;
        for (std::uint32_t v = 0; v < m_Dirty.size(); ++v)
        {
            if (m_Dirty[v])
                result.push_back(VertexHandleOf(v));
        }
        return result;
    }

    std::size_t TMesh::DirtyCount() const
    {
        return static_cast<std::size_t>(std::count(m_Dirty.begin(), m_Dirty.end(), std::uint8_t{1}));
    }

    void TMesh::ClearDirty()
    {
        m_Dirty.assign(VertexCount(), 0);
    }

    void TMesh::MarkAllDirty()
    {
        m_Dirty.assign(VertexCount(), 1);
    }
}
