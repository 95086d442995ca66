module;

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

export module TSpline:Tessellation;

import Core;
import :Types;
import :Error;
import :Surface;

export namespace TSpline
{
    struct TessellationParams
    {
        // Samples per axis, corners included.
        std::size_t ResolutionS{32};
        std::size_t ResolutionT{32};

        // Parameter rectangle to sample; the surface domain when empty.
        std::optional<Bounds> Region{};

        // Rows per scheduler task.
        std::size_t RowsPerChunk{4};

        bool ComputeNormals{false};

        // Checked between samples. Once set, the remaining samples are skipped
        // and Tessellate returns Cancelled.
        const std::atomic<bool>* Cancel{nullptr};
    };

    struct TessellationResult
    {
        std::size_t ResolutionS{0};
        std::size_t ResolutionT{0};
        Bounds Region{};

        // Row-major, index i + ResolutionS * j.
        std::vector<glm::dvec3> Points{};
        std::vector<glm::dvec3> Normals{};   // empty unless ComputeNormals
        std::vector<std::uint8_t> Valid{};   // 0 where evaluation failed
        std::size_t Failures{0};

        [[nodiscard]] const glm::dvec3& At(std::size_t i, std::size_t j) const { return Points[i + ResolutionS * j]; }
    };

    // -------------------------------------------------------------------------
    // Tessellate a surface on a regular parameter grid
    // -------------------------------------------------------------------------
    //
    // Rows are split into chunks and evaluated through Core::Tasks (inline when
    // the scheduler is not running). Each chunk writes only its own rows.
    // A sample that fails to evaluate is left at the origin, flagged in Valid
    // and counted in Failures; it does not abort the grid.
    //
    // Returns:
    //   - InvalidArgument for a zero resolution or an empty region
    //   - Cancelled if the cancel flag was raised
    [[nodiscard]] Expected<TessellationResult> Tessellate(const AnySurface& surface, const TessellationParams& params = {});
}
