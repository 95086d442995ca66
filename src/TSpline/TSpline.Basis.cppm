module;

export module TSpline:Basis;

import :Types;

export namespace TSpline::Basis
{
    // Cubic B-spline basis function over a 5-entry local knot vector
    // (Cox-de Boor recursion, 0/0 := 0).
    //
    // The support is [k0, k4]. Each degree-0 piece is half-open except the
    // last non-empty one, which also includes k4, so a function whose knot
    // vector ends in a repeated knot takes its limit value at the boundary of
    // the parameter domain.
    struct BasisValue
    {
        double Value{0.0};
        double Derivative{0.0};
    };

    [[nodiscard]] double Cubic(double u, const LocalKnots& knots);
    [[nodiscard]] double CubicDerivative(double u, const LocalKnots& knots);
    [[nodiscard]] BasisValue CubicWithDerivative(double u, const LocalKnots& knots);
}
