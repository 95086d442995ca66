module;

#include <cstddef>

export module TSpline:Shapes;

import :Types;
import :Error;
import :TMesh;

export namespace TSpline::Shapes
{
    // Small canonical T-meshes. Control points sit at (s, t, 0) with unit
    // weight, so the surface is the parameter plane itself until moved.

    // One face over [0, 1] x [0, 1].
    [[nodiscard]] Expected<TMesh> UnitSquare();

    // Three faces over [0, 2] x [0, 2]: a tall left face and two stacked
    // right faces. The vertex at (1, 1) is a T-junction whose missing spoke
    // points in -S.
    [[nodiscard]] Expected<TMesh> TJunction();

    // ns x nt unit cells scaled by `spacing`, vertex (i, j) at index
    // i + (ns + 1) * j.
    [[nodiscard]] Expected<TMesh> Grid(std::size_t ns, std::size_t nt, double spacing = 1.0);
}
