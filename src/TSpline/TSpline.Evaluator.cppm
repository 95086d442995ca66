module;

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <glm/glm.hpp>

export module TSpline:Evaluator;

import Core;
import :Types;
import :Error;
import :TMesh;
import :KnotInference;

export namespace TSpline
{
    struct EvaluatorParams
    {
        // |sum w B| below this is reported as DegenerateParameter.
        double DenominatorTolerance{1e-9};

        // Upper bound on the support grid resolution per axis. The grid aims
        // for about sqrt(N) cells per axis for N control points.
        std::size_t MaxBucketsPerAxis{256};
    };

    // -------------------------------------------------------------------------
    // SupportIndex - uniform bucket grid over blending-function supports
    // -------------------------------------------------------------------------
    // The support of control point i is the rectangle [S0, S4] x [T0, T4] of
    // its local knot vectors. Every support is registered in each cell it
    // overlaps (closed ranges); a query returns the candidates of one cell,
    // already filtered by rectangle containment.
    class SupportIndex
    {
    public:
        void Build(const TMesh& mesh, const Knots::KnotCache& knots, const EvaluatorParams& params = {});
        void Clear();

        void Query(const glm::dvec2& p, std::vector<std::uint32_t>& out) const;

        [[nodiscard]] const Bounds& Support(std::uint32_t v) const { return m_Supports[v]; }
        [[nodiscard]] const Bounds& Extent() const noexcept { return m_Extent; }
        [[nodiscard]] std::size_t BucketsS() const noexcept { return m_CountS; }
        [[nodiscard]] std::size_t BucketsT() const noexcept { return m_CountT; }
        [[nodiscard]] std::size_t SupportCount() const noexcept { return m_Supports.size(); }

    private:
        [[nodiscard]] std::size_t CellCoordinate(double value, Axis axis) const;

        Bounds m_Extent{};
        std::size_t m_CountS{0};
        std::size_t m_CountT{0};
        std::vector<Bounds> m_Supports;
        std::vector<std::uint32_t> m_CellStart; // CSR offsets, m_CountS * m_CountT + 1
        std::vector<std::uint32_t> m_CellItems;
    };

    // -------------------------------------------------------------------------
    // SurfaceSnapshot - immutable state shared by concurrent evaluators
    // -------------------------------------------------------------------------
    struct SurfaceSnapshot
    {
        TMesh Mesh{};
        Knots::KnotCache Knots{};
        SupportIndex Support{};
        EvaluatorParams Params{};

        // Rectangle on which the blending functions sum to one for unit
        // weights: the parameter extent minus the band between each side of
        // the mesh and its first interior knot line.
        Bounds Domain{};

        // Takes a mesh whose knot cache is current for every vertex. Fails
        // with DegenerateParameter when the domain has no area, as for a
        // mesh only one or two cells wide.
        [[nodiscard]] static Expected<std::shared_ptr<const SurfaceSnapshot>> Create(
            TMesh mesh, Knots::KnotCache knots, const EvaluatorParams& params = {});

        // Infers all knot vectors first.
        [[nodiscard]] static Expected<std::shared_ptr<const SurfaceSnapshot>> FromMesh(
            TMesh mesh, const EvaluatorParams& params = {}, const Knots::KnotInferenceParams& knotParams = {});
    };

    // =========================================================================
    // Evaluator - rational T-spline surface
    // =========================================================================
    //
    //            sum_i  w_i B_i(s, t) P_i
    //   S(s,t) = ----------------------- ,   B_i(s, t) = N[S_i](s) N[T_i](t)
    //            sum_i  w_i B_i(s, t)
    //
    // where N[k] is the cubic B-spline over the local knot vector k. The
    // evaluator is a cheap handle: copies share the snapshot, and every method
    // is const and safe to call from several threads.
    class Evaluator
    {
    public:
        explicit Evaluator(std::shared_ptr<const SurfaceSnapshot> snapshot);

        [[nodiscard]] Expected<glm::dvec3> Evaluate(double u, double v) const;
        [[nodiscard]] Expected<SurfacePoint> EvaluateDerivatives(double u, double v) const;

        // Denominator of the rational sum. Equals 1 wherever the blending
        // functions form a partition of unity and all weights are 1.
        [[nodiscard]] Expected<double> WeightSum(double u, double v) const;

        [[nodiscard]] const Bounds& Domain() const noexcept { return m_Snapshot->Domain; }
        [[nodiscard]] const SurfaceSnapshot& Snapshot() const noexcept { return *m_Snapshot; }
        [[nodiscard]] const std::shared_ptr<const SurfaceSnapshot>& SharedSnapshot() const noexcept { return m_Snapshot; }

    private:
        struct Accumulated
        {
            glm::dvec3 A{0.0};
            glm::dvec3 Au{0.0};
            glm::dvec3 Av{0.0};
            double W{0.0};
            double Wu{0.0};
            double Wv{0.0};
        };

        [[nodiscard]] Expected<Accumulated> Accumulate(double u, double v, bool derivatives) const;
        [[nodiscard]] Result CheckDenominator(const Accumulated& acc, double u, double v) const;

        std::shared_ptr<const SurfaceSnapshot> m_Snapshot;
    };
}
