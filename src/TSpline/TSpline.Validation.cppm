module;

#include <cstdint>
#include <optional>
#include <vector>

export module TSpline:Validation;

import Core;
import :Types;
import :Error;
import :TMesh;

export namespace TSpline::Asts
{
    // =========================================================================
    // Analysis-suitability (ASTS) check
    // =========================================================================
    //
    // A T-junction is an interior vertex with exactly three spokes pointing in
    // three distinct directions. The direction with no spoke is where its
    // extension goes; the axis of that direction is the junction's
    // orientation (S = horizontal, T = vertical).
    //
    // The extension of a junction is the parameter-space segment obtained by
    // walking from the junction in the missing direction across
    // FaceExtensionCrossings perpendicular edges, optionally prolonged
    // backwards along the existing edge by EdgeExtensionCrossings edges.
    //
    // A T-mesh is analysis-suitable when no horizontal extension intersects a
    // vertical one (touching counts).

    struct AstsParams
    {
        std::uint32_t FaceExtensionCrossings{1};
        std::uint32_t EdgeExtensionCrossings{0};
        double Tolerance{ParamTolerance};
    };

    struct TJunction
    {
        VertexHandle Vertex{};
        Axis Orientation{Axis::S};
        Sign Direction{Sign::Positive};

        bool operator==(const TJunction&) const = default;
    };

    struct Extension
    {
        TJunction Junction{};
        Segment Span{};
    };

    [[nodiscard]] std::optional<TJunction> ClassifyJunction(const TMesh& mesh, std::uint32_t v);
    [[nodiscard]] std::vector<TJunction> FindTJunctions(const TMesh& mesh);

    [[nodiscard]] Expected<Extension> ExtendJunction(const TMesh& mesh, const TJunction& junction,
                                                     const AstsParams& params = {});
    [[nodiscard]] Expected<std::vector<Extension>> CollectExtensions(const TMesh& mesh, const AstsParams& params = {});

    // Every crossing horizontal/vertical pair; empty when the mesh is valid.
    [[nodiscard]] Expected<std::vector<AstsConflict>> FindConflicts(const TMesh& mesh, const AstsParams& params = {});

    // Success, or AstsViolation carrying the conflict list and the offending
    // junctions.
    [[nodiscard]] Result Validate(const TMesh& mesh, const AstsParams& params = {});
}
