module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module TSpline:Shapes.Impl;

import Core;
import :Types;
import :Error;
import :TMesh;
import :Shapes;

namespace TSpline::Shapes
{
    namespace
    {
        ControlPoint MakeControlPoint(double s, double t)
        {
            ControlPoint cp;
            cp.Param = glm::dvec2(s, t);
            cp.Geometry = glm::dvec4(s, t, 0.0, 1.0);
            return cp;
        }
    }

    Expected<TMesh> UnitSquare()
    {
        std::vector<ControlPoint> vertices{
            MakeControlPoint(0.0, 0.0),
            MakeControlPoint(1.0, 0.0),
            MakeControlPoint(1.0, 1.0),
            MakeControlPoint(0.0, 1.0),
        };
        const std::vector<std::vector<std::uint32_t>> faces{{0, 1, 2, 3}};
        return TMesh::FromFaces(std::move(vertices), faces);
    }

    Expected<TMesh> TJunction()
    {
        std::vector<ControlPoint> vertices{
            MakeControlPoint(0.0, 0.0), // 0
            MakeControlPoint(1.0, 0.0), // 1
            MakeControlPoint(2.0, 0.0), // 2
            MakeControlPoint(1.0, 1.0), // 3  T-junction
            MakeControlPoint(2.0, 1.0), // 4
            MakeControlPoint(0.0, 2.0), // 5
            MakeControlPoint(1.0, 2.0), // 6
            MakeControlPoint(2.0, 2.0), // 7
        };
        const std::vector<std::vector<std::uint32_t>> faces{
            {0, 1, 3, 6, 5},
            {1, 2, 4, 3},
            {3, 4, 7, 6},
        };
        return TMesh::FromFaces(std::move(vertices), faces);
    }

    Expected<TMesh> Grid(std::size_t ns, std::size_t nt, double spacing)
    {
        if (ns == 0 || nt == 0 || !(spacing > 0.0))
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("grid {}x{} with spacing {} is empty", ns, nt, spacing)));

        const std::size_t row = ns + 1;
        std::vector<ControlPoint> vertices;
        vertices.reserve(row * (nt + 1));
        for (std::size_t j = 0; j <= nt; ++j)
            for (std::size_t i = 0; i <= ns; ++i)
                vertices.push_back(MakeControlPoint(static_cast<double>(i) * spacing,
                                                    static_cast<double>(j) * spacing));

        std::vector<std::vector<std::uint32_t>> faces;
        faces.reserve(ns * nt);
        for (std::size_t j = 0; j < nt; ++j)
        {
            for (std::size_t i = 0; i < ns; ++i)
            {
                const auto a = static_cast<std::uint32_t>(i + row * j);
                const auto r = static_cast<std::uint32_t>(row);
                faces.push_back({a, a + 1, a + 1 + r, a + r});
            }
        }
        return TMesh::FromFaces(std::move(vertices), faces);
    }
}
