module;

#include <cmath>
#include <cstddef>
#include <expected>
#include <format>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module TSpline:Nurbs.Impl;

import Core;
import :Types;
import :Error;
import :Nurbs;

namespace TSpline::Nurbs
{
    namespace
    {
        Result CheckKnots(const std::vector<double>& knots, std::size_t count, int degree, const char* name)
        {
            if (knots.size() != count + static_cast<std::size_t>(degree) + 1)
                return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                                 std::format("knot vector {} has {} entries, expected {}",
                                                             name, knots.size(), count + degree + 1)));
            for (std::size_t i = 1; i < knots.size(); ++i)
            {
                if (!(knots[i] >= knots[i - 1]))
                    return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                                     std::format("knot vector {} decreases at index {}", name, i)));
            }
            if (!(knots[count] > knots[static_cast<std::size_t>(degree)]))
                return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                                 std::format("knot vector {} spans an empty domain", name)));
            return {};
        }
    }

    // A2.1
    int FindSpan(double u, int degree, std::size_t count, const std::vector<double>& knots)
    {
        const int n = static_cast<int>(count) - 1;
        if (u >= knots[static_cast<std::size_t>(n + 1)]) return n;
        if (u <= knots[static_cast<std::size_t>(degree)]) return degree;

        int low = degree;
        int high = n + 1;
        int mid = (low + high) / 2;
        while (u < knots[static_cast<std::size_t>(mid)] || u >= knots[static_cast<std::size_t>(mid + 1)])
        {
            if (u < knots[static_cast<std::size_t>(mid)])
                high = mid;
            else
                low = mid;
            mid = (low + high) / 2;
        }
        return mid;
    }

    // A2.2
    void BasisFunctions(int span, double u, int degree, const std::vector<double>& knots, std::vector<double>& out)
    {
        const auto p = static_cast<std::size_t>(degree);
        out.assign(p + 1, 0.0);
        std::vector<double> left(p + 1, 0.0);
        std::vector<double> right(p + 1, 0.0);
        out[0] = 1.0;
        for (std::size_t j = 1; j <= p; ++j)
        {
            left[j] = u - knots[static_cast<std::size_t>(span) + 1 - j];
            right[j] = knots[static_cast<std::size_t>(span) + j] - u;
            double saved = 0.0;
            for (std::size_t r = 0; r < j; ++r)
            {
                const double denom = right[r + 1] + left[j - r];
                const double temp = denom != 0.0 ? out[r] / denom : 0.0;
                out[r] = saved + right[r + 1] * temp;
                saved = left[j - r] * temp;
            }
            out[j] = saved;
        }
    }

    // First derivatives of the p + 1 non-zero functions on `span`, from the
    // degree p - 1 functions on the same span:
    //   N'_{i,p} = p N_{i,p-1} / (U[i+p] - U[i]) - p N_{i+1,p-1} / (U[i+p+1] - U[i+1])
    void BasisDerivatives(int span, double u, int degree, const std::vector<double>& knots, std::vector<double>& out)
    {
        const auto p = static_cast<std::size_t>(degree);
        out.assign(p + 1, 0.0);
        if (degree == 0)
            return;

        std::vector<double> lower;
        BasisFunctions(span, u, degree - 1, knots, lower);

        for (std::size_t r = 0; r <= p; ++r)
        {
            const std::size_t i = static_cast<std::size_t>(span) - p + r;
            double d = 0.0;
            if (r >= 1)
            {
                const double den = knots[i + p] - knots[i];
                if (den != 0.0)
                    d += lower[r - 1] / den;
            }
            if (r < p)
            {
                const double den = knots[i + p + 1] - knots[i + 1];
                if (den != 0.0)
                    d -= lower[r] / den;
            }
            out[r] = static_cast<double>(degree) * d;
        }
    }

    Expected<Surface> Surface::Create(SurfaceDescription description)
    {
        const SurfaceDescription& d = description;
        if (d.DegreeU < 1 || d.DegreeV < 1)
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("degrees must be positive (got {}, {})", d.DegreeU, d.DegreeV)));
        if (d.CountU < static_cast<std::size_t>(d.DegreeU) + 1 || d.CountV < static_cast<std::size_t>(d.DegreeV) + 1)
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("control net {}x{} too small for degree ({}, {})",
                                                         d.CountU, d.CountV, d.DegreeU, d.DegreeV)));
        if (d.ControlNet.size() != d.CountU * d.CountV)
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("control net has {} points, expected {}",
                                                         d.ControlNet.size(), d.CountU * d.CountV)));
        if (auto ok = CheckKnots(d.KnotsU, d.CountU, d.DegreeU, "U"); !ok)
            return std::unexpected(std::move(ok.error()));
        if (auto ok = CheckKnots(d.KnotsV, d.CountV, d.DegreeV, "V"); !ok)
            return std::unexpected(std::move(ok.error()));

        for (std::size_t k = 0; k < d.ControlNet.size(); ++k)
        {
            if (!(d.ControlNet[k].w > 0.0))
                return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                                 std::format("control point {} has non-positive weight {}", k, d.ControlNet[k].w)));
        }

        return Surface(std::move(description));
    }

    Bounds Surface::Domain() const
    {
        Bounds box;
        box.Add(glm::dvec2(m_Desc.KnotsU[static_cast<std::size_t>(m_Desc.DegreeU)],
                           m_Desc.KnotsV[static_cast<std::size_t>(m_Desc.DegreeV)]));
        box.Add(glm::dvec2(m_Desc.KnotsU[m_Desc.CountU], m_Desc.KnotsV[m_Desc.CountV]));
        return box;
    }

    Expected<Surface::Accumulated> Surface::Accumulate(double u, double v, bool derivatives) const
    {
        if (!Domain().Contains(glm::dvec2(u, v)))
            return std::unexpected(MakeError(Core::ErrorCode::DegenerateParameter,
                                             std::format("({}, {}) is outside the NURBS domain", u, v)));

        const int spanU = FindSpan(u, m_Desc.DegreeU, m_Desc.CountU, m_Desc.KnotsU);
        const int spanV = FindSpan(v, m_Desc.DegreeV, m_Desc.CountV, m_Desc.KnotsV);

        std::vector<double> nu, nv, du, dv;
        BasisFunctions(spanU, u, m_Desc.DegreeU, m_Desc.KnotsU, nu);
        BasisFunctions(spanV, v, m_Desc.DegreeV, m_Desc.KnotsV, nv);
        if (derivatives)
        {
            BasisDerivatives(spanU, u, m_Desc.DegreeU, m_Desc.KnotsU, du);
            BasisDerivatives(spanV, v, m_Desc.DegreeV, m_Desc.KnotsV, dv);
        }

        Accumulated acc;
        for (int b = 0; b <= m_Desc.DegreeV; ++b)
        {
            const auto j = static_cast<std::size_t>(spanV - m_Desc.DegreeV + b);
            for (int a = 0; a <= m_Desc.DegreeU; ++a)
            {
                const auto i = static_cast<std::size_t>(spanU - m_Desc.DegreeU + a);
                const glm::dvec4& cp = NetPoint(i, j);
                const glm::dvec3 xyz(cp);

                const double c = nu[static_cast<std::size_t>(a)] * nv[static_cast<std::size_t>(b)] * cp.w;
                acc.A += c * xyz;
                acc.W += c;

                if (derivatives)
                {
                    const double cu = du[static_cast<std::size_t>(a)] * nv[static_cast<std::size_t>(b)] * cp.w;
                    const double cv = nu[static_cast<std::size_t>(a)] * dv[static_cast<std::size_t>(b)] * cp.w;
                    acc.Au += cu * xyz;
                    acc.Wu += cu;
                    acc.Av += cv * xyz;
                    acc.Wv += cv;
                }
            }
        }

        if (std::abs(acc.W) < ParamTolerance)
            return std::unexpected(MakeError(Core::ErrorCode::DegenerateParameter,
                                             std::format("zero weight sum at ({}, {})", u, v)));
        return acc;
    }

    Expected<glm::dvec3> Surface::Evaluate(double u, double v) const
    {
        auto acc = Accumulate(u, v, false);
        if (!acc)
            return std::unexpected(std::move(acc.error()));
        return acc->A / acc->W;
    }

    Expected<SurfacePoint> Surface::EvaluateDerivatives(double u, double v) const
    {
        auto acc = Accumulate(u, v, true);
        if (!acc)
            return std::unexpected(std::move(acc.error()));

        SurfacePoint point;
        point.Position = acc->A / acc->W;
        point.DerivativeS = (acc->Au - acc->Wu * point.Position) / acc->W;
        point.DerivativeT = (acc->Av - acc->Wv * point.Position) / acc->W;

        const glm::dvec3 n = glm::cross(point.DerivativeS, point.DerivativeT);
        const double len = glm::length(n);
        if (len > ParamTolerance)
            point.Normal = n / len;
        return point;
    }
}
