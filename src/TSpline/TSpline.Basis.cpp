module;

#include <array>
#include <cstddef>

module TSpline:Basis.Impl;

import :Types;
import :Basis;

namespace TSpline::Basis
{
    namespace
    {
        // numerator / denominator with 0/0 (and x/0) taken as 0
        inline double Ratio(double numerator, double denominator)
        {
            return denominator == 0.0 ? 0.0 : numerator / denominator;
        }

        // Runs the triangular recursion up to `level` in place. On return
        // n[0 .. Degree - level] hold N_{i,level}(u).
        std::array<double, Degree + 1> Triangle(double u, const LocalKnots& k, int level)
        {
            std::array<double, Degree + 1> n{};

            int last = -1;
            for (int j = 0; j <= Degree; ++j)
            {
                if (k[j] < k[j + 1])
                    last = j;
            }
            if (last < 0)
                return n;

            for (int j = 0; j <= Degree; ++j)
            {
                const bool inside = k[j] <= u && u < k[j + 1];
                const bool closedEnd = j == last && u == k[Degree + 1];
                n[j] = (inside || closedEnd) ? 1.0 : 0.0;
            }

            for (int p = 1; p <= level; ++p)
            {
                for (int i = 0; i + p <= Degree; ++i)
                {
                    n[i] = Ratio(u - k[i], k[i + p] - k[i]) * n[i] +
                           Ratio(k[i + p + 1] - u, k[i + p + 1] - k[i + 1]) * n[i + 1];
                }
            }
            return n;
        }

        bool OutsideSupport(double u, const LocalKnots& k)
        {
            return u < k[0] || u > k[Degree + 1];
        }
    }

    double Cubic(double u, const LocalKnots& knots)
    {
        if (OutsideSupport(u, knots))
            return 0.0;
        return Triangle(u, knots, Degree)[0];
    }

    double CubicDerivative(double u, const LocalKnots& knots)
    {
        if (OutsideSupport(u, knots))
            return 0.0;

        // N'_{0,3} = 3 (N_{0,2} / (k3 - k0) - N_{1,2} / (k4 - k1))
        const auto n = Triangle(u, knots, Degree - 1);
        return Degree * (Ratio(n[0], knots[Degree] - knots[0]) - Ratio(n[1], knots[Degree + 1] - knots[1]));
    }

    BasisValue CubicWithDerivative(double u, const LocalKnots& knots)
    {
        BasisValue result;
        if (OutsideSupport(u, knots))
            return result;

        auto n = Triangle(u, knots, Degree - 1);
        result.Derivative = Degree * (Ratio(n[0], knots[Degree] - knots[0]) - Ratio(n[1], knots[Degree + 1] - knots[1]));
        result.Value = Ratio(u - knots[0], knots[Degree] - knots[0]) * n[0] +
                       Ratio(knots[Degree + 1] - u, knots[Degree + 1] - knots[1]) * n[1];
        return result;
    }
}
