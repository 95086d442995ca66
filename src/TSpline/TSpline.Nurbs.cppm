module;

#include <cstddef>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

export module TSpline:Nurbs;

import Core;
import :Types;
import :Error;

export namespace TSpline::Nurbs
{
    // =========================================================================
    // Tensor-product rational B-spline surface
    // =========================================================================
    //
    // Global knot vectors U (CountU + DegreeU + 1 entries) and V, control net
    // stored row by row: ControlNet[i + CountU * j] is the point with u-index i
    // and v-index j. Each entry is (x, y, z, weight), the same convention as a
    // T-spline control point, so a T-mesh without T-junctions and a NURBS net
    // over the same knots describe the same surface.
    //
    // Span search and basis functions follow Piegl & Tiller, "The NURBS Book",
    // algorithms A2.1 and A2.2.

    struct SurfaceDescription
    {
        int DegreeU{Degree};
        int DegreeV{Degree};
        std::size_t CountU{0};
        std::size_t CountV{0};
        std::vector<glm::dvec4> ControlNet{};
        std::vector<double> KnotsU{};
        std::vector<double> KnotsV{};
    };

    class Surface
    {
    public:
        [[nodiscard]] static Expected<Surface> Create(SurfaceDescription description);

        [[nodiscard]] Expected<glm::dvec3> Evaluate(double u, double v) const;
        [[nodiscard]] Expected<SurfacePoint> EvaluateDerivatives(double u, double v) const;

        [[nodiscard]] Bounds Domain() const;

        [[nodiscard]] int DegreeU() const noexcept { return m_Desc.DegreeU; }
        [[nodiscard]] int DegreeV() const noexcept { return m_Desc.DegreeV; }
        [[nodiscard]] std::size_t CountU() const noexcept { return m_Desc.CountU; }
        [[nodiscard]] std::size_t CountV() const noexcept { return m_Desc.CountV; }
        [[nodiscard]] const glm::dvec4& NetPoint(std::size_t i, std::size_t j) const
        {
            return m_Desc.ControlNet[i + m_Desc.CountU * j];
        }

    private:
        explicit Surface(SurfaceDescription description) : m_Desc(std::move(description)) {}

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

        SurfaceDescription m_Desc;
    };

    // Exposed for tests and for building reference nets.
    [[nodiscard]] int FindSpan(double u, int degree, std::size_t count, const std::vector<double>& knots);
    void BasisFunctions(int span, double u, int degree, const std::vector<double>& knots, std::vector<double>& out);
    void BasisDerivatives(int span, double u, int degree, const std::vector<double>& knots, std::vector<double>& out);
}
