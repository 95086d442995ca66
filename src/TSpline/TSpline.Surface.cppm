module;

#include <cstdint>
#include <functional>
#include <memory>
#include <variant>

#include <glm/glm.hpp>

export module TSpline:Surface;

import Core;
import :Types;
import :Error;
import :TMesh;
import :KnotInference;
import :Validation;
import :Evaluator;
import :Nurbs;

export namespace TSpline
{
    // What Surface::Apply does with an edit that leaves the mesh
    // non analysis-suitable.
    enum class RefinementPolicy : std::uint8_t
    {
        Reject,   // fail with AstsViolation, surface unchanged
        Propagate // extend offending T-junctions across their faces until valid
    };

    struct SurfaceConfig
    {
        RefinementPolicy Policy{RefinementPolicy::Reject};
        std::uint32_t MaxPropagationSteps{64};

        Knots::KnotInferenceParams KnotInference{};
        Asts::AstsParams Validation{};
        EvaluatorParams Evaluation{};
    };

    using Mutation = std::function<Result(TMesh&)>;

    // =========================================================================
    // Surface - T-mesh plus its derived knot state
    // =========================================================================
    //
    // Holds a T-mesh that is always analysis-suitable and a knot cache that is
    // always current. Topology edits go through Apply(), which works on a
    // private copy and only swaps it in once the knots are refreshed and the
    // ASTS check passes, so a failed edit leaves the surface exactly as it
    // was.
    //
    // Readers take a Snapshot() and evaluate it on any thread; later edits
    // do not affect snapshots already handed out.
    class Surface
    {
    public:
        [[nodiscard]] static Expected<Surface> Create(TMesh mesh, const SurfaceConfig& config = {});

        [[nodiscard]] const TMesh& Mesh() const noexcept { return m_Mesh; }
        [[nodiscard]] const Knots::KnotCache& Cache() const noexcept { return m_Knots; }
        [[nodiscard]] const SurfaceConfig& Config() const noexcept { return m_Config; }

        // Refresh dirty knot vectors and re-run the ASTS check.
        [[nodiscard]] Result Revalidate();

        [[nodiscard]] Result Apply(const Mutation& mutation);

        // Apply() wrappers for the single-step primitives. Handles returned
        // here refer to the mesh after any propagation.
        [[nodiscard]] Expected<VertexHandle> SplitEdge(HalfedgeHandle h, double coordinate);
        [[nodiscard]] Expected<HalfedgeHandle> ConnectVertices(FaceHandle f, VertexHandle a, VertexHandle b);
        [[nodiscard]] Expected<HalfedgeHandle> InsertTJunction(FaceHandle f, VertexHandle anchor, Axis axis);
        [[nodiscard]] Expected<HalfedgeHandle> SplitFace(FaceHandle f, Axis axis, double coordinate);

        // Geometry only; topology and knots are unaffected.
        [[nodiscard]] Result SetControlPoint(VertexHandle v, const glm::dvec4& geometry);

        // Number of junction extensions the last successful edit needed.
        [[nodiscard]] std::uint32_t LastPropagationSteps() const noexcept { return m_LastPropagationSteps; }

        [[nodiscard]] Expected<std::shared_ptr<const SurfaceSnapshot>> Snapshot() const;
        [[nodiscard]] Expected<Evaluator> MakeEvaluator() const;

    private:
        Surface(TMesh mesh, Knots::KnotCache knots, const SurfaceConfig& config);

        // Refresh knots and validate, extending junctions under Propagate.
        [[nodiscard]] Result Settle(TMesh& mesh, Knots::KnotCache& knots, std::uint32_t& steps) const;

        TMesh m_Mesh;
        Knots::KnotCache m_Knots;
        SurfaceConfig m_Config;
        std::uint32_t m_LastPropagationSteps{0};
    };

    // -------------------------------------------------------------------------
    // AnySurface - closed set of evaluable surface kinds
    // -------------------------------------------------------------------------
    using AnySurface = std::variant<Evaluator, Nurbs::Surface>;

    [[nodiscard]] Expected<glm::dvec3> Evaluate(const AnySurface& surface, double u, double v);
    [[nodiscard]] Expected<SurfacePoint> EvaluateDerivatives(const AnySurface& surface, double u, double v);
    [[nodiscard]] Bounds Domain(const AnySurface& surface);
}
