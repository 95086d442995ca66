module;

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module TSpline:Tessellation.Impl;

import Core;
import :Types;
import :Error;
import :Surface;
import :Tessellation;

namespace TSpline
{
    Expected<TessellationResult> Tessellate(const AnySurface& surface, const TessellationParams& params)
    {
        if (params.ResolutionS == 0 || params.ResolutionT == 0)
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument,
                                             std::format("tessellation resolution {}x{} is empty",
                                                         params.ResolutionS, params.ResolutionT)));

        const Bounds region = params.Region.value_or(Domain(surface));
        if (region.IsEmpty())
            return std::unexpected(MakeError(Core::ErrorCode::InvalidArgument, "tessellation region is empty"));

        TessellationResult result;
        result.ResolutionS = params.ResolutionS;
        result.ResolutionT = params.ResolutionT;
        result.Region = region;

        const std::size_t count = params.ResolutionS * params.ResolutionT;
        result.Points.assign(count, glm::dvec3(0.0));
        result.Valid.assign(count, 0);
        if (params.ComputeNormals)
            result.Normals.assign(count, glm::dvec3(0.0));

        std::atomic<std::size_t> failures{0};
        std::atomic<bool> cancelled{false};

        const auto rows = [&](std::size_t rowBegin, std::size_t rowEnd)
        {
            std::size_t localFailures = 0;
            for (std::size_t j = rowBegin; j < rowEnd; ++j)
            {
                for (std::size_t i = 0; i < params.ResolutionS; ++i)
                {
                    if (params.Cancel && params.Cancel->load(std::memory_order_relaxed))
                    {
                        cancelled.store(true, std::memory_order_relaxed);
                        failures.fetch_add(localFailures, std::memory_order_relaxed);
                        return;
                    }

                    const std::size_t k = i + params.ResolutionS * j;
                    const glm::dvec2 p = region.Interpolate(i, j, params.ResolutionS, params.ResolutionT);

                    if (params.ComputeNormals)
                    {
                        auto sample = EvaluateDerivatives(surface, p.x, p.y);
                        if (!sample)
                        {
                            ++localFailures;
                            continue;
                        }
                        result.Points[k] = sample->Position;
                        result.Normals[k] = sample->Normal;
                    }
                    else
                    {
                        auto sample = Evaluate(surface, p.x, p.y);
                        if (!sample)
                        {
                            ++localFailures;
                            continue;
                        }
                        result.Points[k] = *sample;
                    }
                    result.Valid[k] = 1;
                }
            }
            failures.fetch_add(localFailures, std::memory_order_relaxed);
        };

        Core::Tasks::ParallelFor(0, params.ResolutionT, params.RowsPerChunk, rows);

        if (cancelled.load())
        {
            Core::Log::Info("Tessellation cancelled");
            return std::unexpected(MakeError(Core::ErrorCode::Cancelled, "tessellation cancelled"));
        }

        result.Failures = failures.load();
        if (result.Failures > 0)
            Core::Log::Warn("Tessellation {}x{}: {} of {} samples failed",
                            params.ResolutionS, params.ResolutionT, result.Failures, count);
        else
            Core::Log::Debug("Tessellation {}x{} complete", params.ResolutionS, params.ResolutionT);
        return result;
    }
}
