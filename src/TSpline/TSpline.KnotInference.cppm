module;

#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

export module TSpline:KnotInference;

import Core;
import :Types;
import :Error;
import :TMesh;

export namespace TSpline::Knots
{
    // =========================================================================
    // Local knot inference
    // =========================================================================
    //
    // The knot vector of control point P along an axis is read off the T-mesh
    // by casting a ray from P in each direction and recording the coordinates
    // of the first perpendicular edges it meets:
    //
    //   - Along an existing edge the ray advances by the edge's knot interval;
    //     the vertex it arrives at records a knot only if it has a
    //     perpendicular spoke (a straight run of collinear edges is skipped).
    //   - Where P (or the vertex reached) has no edge in the ray direction,
    //     the ray crosses the face whose rectangle it enters and exits at the
    //     opposite side, which is always a knot. The walk continues from the
    //     exit vertex, or through the crossed edge into the neighbouring face.
    //
    // The walk stops after `count` knots or at the mesh boundary. For the
    // cubic case two knots per side give [k0, k1, P, k3, k4].
    //
    // Missing knots repeat the last reached coordinate, so a vertex on the
    // mesh boundary keeps both knots on its open side:
    //   [c, c, c, k3, k4]   (nothing on the negative side)
    //   [k0, k1, c, c, c]   (nothing on the positive side)
    // On a rectangular grid these are consecutive slices of the global vector
    // {0, 0, 0, 1, .., n - 1, n, n, n}.

    struct KnotInferenceParams
    {
        // Refresh dirty vertices through Core::Tasks when there are at least
        // this many of them and the scheduler is running.
        bool Parallel{true};
        std::size_t ParallelThreshold{256};
        std::size_t ChunkSize{64};
    };

    struct TraceResult
    {
        std::vector<double> Knots{};  // knot coordinates in walk order
        double Reached{0.0};          // coordinate where the walk stopped
        bool HitBoundary{false};
        glm::dvec2 EndPoint{0.0};
    };

    [[nodiscard]] Expected<TraceResult> TraceKnots(const TMesh& mesh, std::uint32_t v, Axis axis, Sign sign,
                                                   std::size_t count);
    [[nodiscard]] Expected<TraceResult> TraceKnots(const TMesh& mesh, VertexHandle v, Axis axis, Sign sign,
                                                   std::size_t count);

    [[nodiscard]] Expected<KnotVectors> InferLocalKnots(const TMesh& mesh, std::uint32_t v);
    [[nodiscard]] Expected<KnotVectors> InferLocalKnots(const TMesh& mesh, VertexHandle v);

    // -------------------------------------------------------------------------
    // KnotCache - derived per-vertex knot vectors
    // -------------------------------------------------------------------------
    // Refresh() recomputes the vertices the mesh reports dirty plus any entry
    // invalidated locally, then clears the mesh's dirty set.
    class KnotCache
    {
    public:
        [[nodiscard]] Result Refresh(TMesh& mesh, const KnotInferenceParams& params = {});
        [[nodiscard]] Result Rebuild(TMesh& mesh, const KnotInferenceParams& params = {});

        [[nodiscard]] Expected<KnotVectors> Get(const TMesh& mesh, VertexHandle v) const;
        [[nodiscard]] const KnotVectors& At(std::uint32_t v) const { return m_Knots[v]; }
        [[nodiscard]] bool IsValid(std::uint32_t v) const { return v < m_Valid.size() && m_Valid[v] != 0; }

        void Invalidate(std::uint32_t v);
        void InvalidateAll();

        [[nodiscard]] std::size_t Size() const noexcept { return m_Knots.size(); }
        [[nodiscard]] std::size_t LastRefreshCount() const noexcept { return m_LastRefreshCount; }

        bool operator==(const KnotCache&) const = default;

    private:
        std::vector<KnotVectors> m_Knots;
        std::vector<std::uint8_t> m_Valid;
        std::size_t m_LastRefreshCount{0};
    };
}
