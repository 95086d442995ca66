module;

#include <expected>
#include <string>
#include <utility>
#include <vector>

export module TSpline:Error;

import Core;
import :Types;

export namespace TSpline
{
    // One crossing pair of T-junction extensions.
    struct AstsConflict
    {
        VertexHandle Horizontal{};
        VertexHandle Vertical{};
        Segment HorizontalExtension{};
        Segment VerticalExtension{};

        bool operator==(const AstsConflict&) const = default;
    };

    // -------------------------------------------------------------------------
    // Error - classification plus the mesh elements that caused it
    // -------------------------------------------------------------------------
    // Code is the shared Core::ErrorCode. The element lists are filled where
    // the failing operation knows them, so a command layer can highlight the
    // offending vertices/edges without re-running diagnostics.
    struct Error
    {
        Core::ErrorCode Code{Core::ErrorCode::Unknown};
        std::string Message{};
        std::vector<VertexHandle> Vertices{};
        std::vector<HalfedgeHandle> Halfedges{};
        std::vector<FaceHandle> Faces{};
        std::vector<AstsConflict> Conflicts{};

        Error&& With(VertexHandle v) &&
        {
            Vertices.push_back(v);
            return std::move(*this);
        }

        Error&& With(HalfedgeHandle h) &&
        {
            Halfedges.push_back(h);
            return std::move(*this);
        }

        Error&& With(FaceHandle f) &&
        {
            Faces.push_back(f);
            return std::move(*this);
        }
    };

    template<typename T>
    using Expected = std::expected<T, Error>;

    using Result = Expected<Core::Unit>;

    [[nodiscard]] inline Error MakeError(Core::ErrorCode code, std::string message)
    {
        Error error;
        error.Code = code;
        error.Message = std::move(message);
        return error;
    }
}
