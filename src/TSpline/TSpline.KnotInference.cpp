module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module TSpline:KnotInference.Impl;

import Core;
import :Types;
import :Error;
import :TMesh;
import :KnotInference;

namespace TSpline::Knots
{
    namespace
    {
        // Where a ray leaves a face: either at a vertex or through the
        // interior of a boundary half-edge of that face.
        struct FaceExit
        {
            std::uint32_t Vertex{InvalidIndex};
            std::uint32_t Halfedge{InvalidIndex};
        };

        Expected<FaceExit> ExitFace(const TMesh& mesh, std::uint32_t f, Axis axis, double exit, double fixed)
        {
            auto loop = mesh.FaceLoop(f);
            if (!loop)
                return std::unexpected(std::move(loop.error()));

            const double tol = mesh.Tolerance();
            const Axis perp = Perpendicular(axis);
            for (std::uint32_t h : *loop)
            {
                const glm::dvec2& p = mesh.Param(mesh.EdgeData(h).Origin);
                if (std::abs(Coordinate(p, axis) - exit) <= tol && std::abs(Coordinate(p, perp) - fixed) <= tol)
                    return FaceExit{mesh.EdgeData(h).Origin, InvalidIndex};
            }

            for (std::uint32_t h : *loop)
            {
                const HalfEdge& he = mesh.EdgeData(h);
                if (he.Direction != perp)
                    continue;

                const glm::dvec2& p0 = mesh.Param(he.Origin);
                const glm::dvec2& p1 = mesh.Param(mesh.Destination(h));
                if (std::abs(Coordinate(p0, axis) - exit) > tol)
                    continue;

                const double lo = std::min(Coordinate(p0, perp), Coordinate(p1, perp));
                const double hi = std::max(Coordinate(p0, perp), Coordinate(p1, perp));
                if (fixed > lo && fixed < hi)
                    return FaceExit{InvalidIndex, h};
            }

            return std::unexpected(MakeError(Core::ErrorCode::TopologyCorrupt,
                                             std::format("ray along {} at {} found no exit from face {}", ToString(axis), fixed, f))
                                       .With(mesh.FaceHandleOf(f)));
        }
    }

    Expected<TraceResult> TraceKnots(const TMesh& mesh, std::uint32_t v, Axis axis, Sign sign, std::size_t count)
    {
        if (v >= mesh.VertexCount())
            return std::unexpected(MakeError(Core::ErrorCode::InvalidIndex, std::format("vertex index {} out of range", v)));

        const double tol = mesh.Tolerance();
        const double dir = ToDouble(sign);
        const Axis perp = Perpendicular(axis);
        const double fixed = Coordinate(mesh.Param(v), perp);

        TraceResult result;
        double c = Coordinate(mesh.Param(v), axis);
        std::uint32_t vertex = v;
        std::uint32_t crossed = InvalidIndex;

        const std::size_t guard = mesh.HalfedgeCount() + mesh.FaceCount() + 1;
        std::size_t steps = 0;

        while (result.Knots.size() < count)
        {
            if (++steps > guard)
                return std::unexpected(MakeError(Core::ErrorCode::TopologyCorrupt,
                                                 std::format("knot walk from vertex {} did not terminate", v))
                                           .With(mesh.VertexHandleOf(v)));

            std::uint32_t face = InvalidIndex;
            if (vertex != InvalidIndex)
            {
                auto spoke = mesh.FindSpoke(vertex, axis, sign);
                if (!spoke)
                    return std::unexpected(std::move(spoke.error()));

                if (*spoke)
                {
                    c += dir * mesh.EdgeData((*spoke)->Halfedge).KnotInterval;
                    vertex = (*spoke)->Neighbor;
                    if (mesh.HasSpokeAlong(vertex, perp))
                        result.Knots.push_back(c);
                    continue;
                }

                // No edge in the ray direction: find the face the ray enters.
                std::vector<std::uint32_t> admitted;
                for (std::uint32_t f : mesh.IncidentFaces(vertex))
                {
                    const Bounds box = mesh.FaceBounds(f);
                    const double entry = sign == Sign::Positive ? Coordinate(box.Min, axis) : Coordinate(box.Max, axis);
                    if (std::abs(entry - c) <= tol &&
                        fixed > Coordinate(box.Min, perp) + tol && fixed < Coordinate(box.Max, perp) - tol)
                    {
                        admitted.push_back(f);
                    }
                }

                if (admitted.empty())
                {
                    result.HitBoundary = true;
                    break;
                }
                if (admitted.size() > 1)
                {
                    Error error = MakeError(Core::ErrorCode::AmbiguousTraversal,
                                            std::format("{} faces admit the {}{} ray from vertex {}", admitted.size(),
                                                        sign == Sign::Positive ? "+" : "-", ToString(axis), vertex));
                    error.Vertices.push_back(mesh.VertexHandleOf(vertex));
                    for (std::uint32_t f : admitted)
                        error.Faces.push_back(mesh.FaceHandleOf(f));
                    return std::unexpected(std::move(error));
                }
                face = admitted.front();
            }
            else
            {
                // Continue through the crossed edge into the neighbouring face.
                const HalfEdge& he = mesh.EdgeData(crossed);
                if (!he.HasTwin() || !mesh.EdgeData(he.Twin).HasFace())
                {
                    result.HitBoundary = true;
                    break;
                }
                face = mesh.EdgeData(he.Twin).Face;
            }

            const Bounds box = mesh.FaceBounds(face);
            const double exit = sign == Sign::Positive ? Coordinate(box.Max, axis) : Coordinate(box.Min, axis);
            if ((exit - c) * dir <= tol)
                return std::unexpected(MakeError(Core::ErrorCode::TopologyCorrupt,
                                                 std::format("face {} does not extend past {} along {}", face, c, ToString(axis)))
                                           .With(mesh.FaceHandleOf(face)));

            auto next = ExitFace(mesh, face, axis, exit, fixed);
            if (!next)
                return std::unexpected(std::move(next.error()));

            c = exit;
            result.Knots.push_back(c);
            vertex = next->Vertex;
            crossed = next->Halfedge;
        }

        result.Reached = c;
        result.EndPoint = MakePoint(axis, c, fixed);
        return result;
    }

    Expected<TraceResult> TraceKnots(const TMesh& mesh, VertexHandle v, Axis axis, Sign sign, std::size_t count)
    {
        if (auto cp = mesh.Vertex(v); !cp)
            return std::unexpected(std::move(cp.error()));
        return TraceKnots(mesh, v.Index, axis, sign, count);
    }

    Expected<KnotVectors> InferLocalKnots(const TMesh& mesh, std::uint32_t v)
    {
        KnotVectors knots;
        for (Axis axis : {Axis::S, Axis::T})
        {
            auto pos = TraceKnots(mesh, v, axis, Sign::Positive, KnotsPerSide);
            if (!pos)
                return std::unexpected(std::move(pos.error()));
            auto neg = TraceKnots(mesh, v, axis, Sign::Negative, KnotsPerSide);
            if (!neg)
                return std::unexpected(std::move(neg.error()));

            // Slots a walk could not fill repeat the coordinate where it
            // stopped; a walk that starts on the boundary stops at c itself.
            const auto slot = [](const TraceResult& trace, std::size_t i)
            {
                return i < trace.Knots.size() ? trace.Knots[i] : trace.Reached;
            };

            LocalKnots& k = knots[axis];
            k[0] = slot(*neg, 1);
            k[1] = slot(*neg, 0);
            k[2] = Coordinate(mesh.Param(v), axis);
            k[3] = slot(*pos, 0);
            k[4] = slot(*pos, 1);
        }
        return knots;
    }

    Expected<KnotVectors> InferLocalKnots(const TMesh& mesh, VertexHandle v)
    {
        if (auto cp = mesh.Vertex(v); !cp)
            return std::unexpected(std::move(cp.error()));
        return InferLocalKnots(mesh, v.Index);
    }

    // =========================================================================
    // KnotCache
    // =========================================================================

    Result KnotCache::Refresh(TMesh& mesh, const KnotInferenceParams& params)
    {
        const std::size_t n = mesh.VertexCount();
        m_Knots.resize(n);
        m_Valid.resize(n, 0);

        std::vector<std::uint32_t> pending;
        for (std::uint32_t v = 0; v < n; ++v)
        {
            if (mesh.IsDirty(v) || !m_Valid[v])
                pending.push_back(v);
        }

        std::vector<Expected<KnotVectors>> results(pending.size());
        const auto compute = [&](std::size_t begin, std::size_t end)
        {
            for (std::size_t i = begin; i < end; ++i)
                results[i] = InferLocalKnots(mesh, pending[i]);
        };

        const bool parallel = params.Parallel && pending.size() >= params.ParallelThreshold;
        if (parallel)
            Core::Tasks::ParallelFor(0, pending.size(), params.ChunkSize, compute);
        else
            compute(0, pending.size());

        for (std::size_t i = 0; i < pending.size(); ++i)
        {
            if (!results[i])
            {
                m_Valid[pending[i]] = 0;
                Core::Log::Warn("Knot inference failed at vertex {}: {}", pending[i], results[i].error().Message);
                return std::unexpected(std::move(results[i].error()));
            }
            m_Knots[pending[i]] = *results[i];
            m_Valid[pending[i]] = 1;
        }

        m_LastRefreshCount = pending.size();
        mesh.ClearDirty();
        Core::Log::Debug("KnotCache refreshed {} of {} vertices{}", pending.size(), n, parallel ? " (parallel)" : "");
        return {};
    }

    Result KnotCache::Rebuild(TMesh& mesh, const KnotInferenceParams& params)
    {
        InvalidateAll();
        return Refresh(mesh, params);
    }

    Expected<KnotVectors> KnotCache::Get(const TMesh& mesh, VertexHandle v) const
    {
        if (auto cp = mesh.Vertex(v); !cp)
            return std::unexpected(std::move(cp.error()));
        if (!IsValid(v.Index) || mesh.IsDirty(v.Index))
            return std::unexpected(MakeError(Core::ErrorCode::InvalidState,
                                             std::format("knot vectors of vertex {} are stale", v.Index))
                                       .With(v));
        return m_Knots[v.Index];
    }

    void KnotCache::Invalidate(std::uint32_t v)
    {
        if (v < m_Valid.size())
            m_Valid[v] = 0;
    }

    void KnotCache::InvalidateAll()
    {
        std::fill(m_Valid.begin(), m_Valid.end(), std::uint8_t{0});
    }
}
