module;

#include <algorithm>
#include <cstdint>
#include <expected>
#include <format>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module TSpline:Validation.Impl;

import Core;
import :Types;
import :Error;
import :TMesh;
import :KnotInference;
import :Validation;

namespace TSpline::Asts
{
    std::optional<TJunction> ClassifyJunction(const TMesh& mesh, std::uint32_t v)
    {
        if (v >= mesh.VertexCount() || !mesh.VertexData(v).IsTJunction)
            return std::nullopt;

        bool present[2][2] = {{false, false}, {false, false}};
        for (const Spoke& spoke : mesh.Spokes(v))
        {
            const int axis = spoke.Direction == Axis::S ? 0 : 1;
            const int side = spoke.Side() == Sign::Positive ? 0 : 1;
            present[axis][side] = true;
        }

        for (Axis axis : {Axis::S, Axis::T})
        {
            for (Sign sign : {Sign::Positive, Sign::Negative})
            {
                if (!present[axis == Axis::S ? 0 : 1][sign == Sign::Positive ? 0 : 1])
                    return TJunction{mesh.VertexHandleOf(v), axis, sign};
            }
        }
        return std::nullopt;
    }

    std::vector<TJunction> FindTJunctions(const TMesh& mesh)
    {
        std::vector<TJunction> result;
        for (std::uint32_t v = 0; v < mesh.VertexCount(); ++v)
        {
            if (auto junction = ClassifyJunction(mesh, v))
                result.push_back(*junction);
        }
        return result;
    }

    Expected<Extension> ExtendJunction(const TMesh& mesh, const TJunction& junction, const AstsParams& params)
    {
        const std::uint32_t v = junction.Vertex.Index;
        auto forward = Knots::TraceKnots(mesh, junction.Vertex, junction.Orientation, junction.Direction,
                                         params.FaceExtensionCrossings);
        if (!forward)
            return std::unexpected(std::move(forward.error()));

        Extension extension;
        extension.Junction = junction;
        extension.Span.Start = mesh.Param(v);
        extension.Span.End = forward->EndPoint;

        if (params.EdgeExtensionCrossings > 0)
        {
            auto backward = Knots::TraceKnots(mesh, junction.Vertex, junction.Orientation, Opposite(junction.Direction),
                                              params.EdgeExtensionCrossings);
            if (!backward)
                return std::unexpected(std::move(backward.error()));
            extension.Span.Start = backward->EndPoint;
        }
        return extension;
    }

    Expected<std::vector<Extension>> CollectExtensions(const TMesh& mesh, const AstsParams& params)
    {
        std::vector<Extension> result;
        for (const TJunction& junction : FindTJunctions(mesh))
        {
            auto extension = ExtendJunction(mesh, junction, params);
            if (!extension)
                return std::unexpected(std::move(extension.error()));
            result.push_back(*extension);
        }
        return result;
    }

    Expected<std::vector<AstsConflict>> FindConflicts(const TMesh& mesh, const AstsParams& params)
    {
        auto extensions = CollectExtensions(mesh, params);
        if (!extensions)
            return std::unexpected(std::move(extensions.error()));

        std::vector<const Extension*> horizontal;
        std::vector<const Extension*> vertical;
        for (const Extension& e : *extensions)
            (e.Junction.Orientation == Axis::S ? horizontal : vertical).push_back(&e);

        std::vector<AstsConflict> conflicts;
        for (const Extension* h : horizontal)
        {
            for (const Extension* v : vertical)
            {
                if (Intersects(h->Span, v->Span, params.Tolerance))
                    conflicts.push_back(AstsConflict{h->Junction.Vertex, v->Junction.Vertex, h->Span, v->Span});
            }
        }
        return conflicts;
    }

    Result Validate(const TMesh& mesh, const AstsParams& params)
    {
        auto conflicts = FindConflicts(mesh, params);
        if (!conflicts)
            return std::unexpected(std::move(conflicts.error()));
        if (conflicts->empty())
            return {};

        const AstsConflict& first = conflicts->front();
        Error error = MakeError(Core::ErrorCode::AstsViolation,
                                std::format("{} crossing T-junction extension pair(s); first: horizontal at vertex {} ({}, {}) "
                                            "crosses vertical at vertex {} ({}, {})",
                                            conflicts->size(),
                                            first.Horizontal.Index, mesh.Param(first.Horizontal.Index).x, mesh.Param(first.Horizontal.Index).y,
                                            first.Vertical.Index, mesh.Param(first.Vertical.Index).x, mesh.Param(first.Vertical.Index).y));
        for (const AstsConflict& conflict : *conflicts)
        {
            for (VertexHandle v : {conflict.Horizontal, conflict.Vertical})
            {
                if (std::find(error.Vertices.begin(), error.Vertices.end(), v) == error.Vertices.end())
                    error.Vertices.push_back(v);
            }
        }
        error.Conflicts = std::move(*conflicts);
        return std::unexpected(std::move(error));
    }
}
