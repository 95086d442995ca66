#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <utility>

#include <glm/glm.hpp>

import Core;
import TSpline;

using namespace Core;
using namespace TSpline;

namespace
{
    // Sandbox [resolution] [--verbose | --quiet]
    std::size_t ParseArguments(int argc, char** argv)
    {
        std::size_t resolution = 16;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg(argv[i]);
            if (arg == "--verbose")
            {
                Log::SetMinimumLevel(Log::Level::Debug);
                continue;
            }
            if (arg == "--quiet")
            {
                Log::SetMinimumLevel(Log::Level::Warning);
                continue;
            }

            std::size_t value = 0;
            const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
            if (ec != std::errc{} || ptr != arg.data() + arg.size() || value == 0)
                Log::Warn("Ignoring argument '{}'", arg);
            else
                resolution = value;
        }
        return resolution;
    }

    void Report(std::string_view what, const Error& error)
    {
        Log::Error("{} failed: {} ({})", what, error.Message, ErrorCodeToString(error.Code));
    }
}

int main(int argc, char** argv)
{
    const std::size_t resolution = ParseArguments(argc, argv);

    Tasks::Scheduler::Initialize();
    Log::Info("Sandbox Started!");

    // The canonical three-face mesh with a single T-junction.
    auto canonical = Shapes::TJunction().and_then([](TMesh mesh) { return Surface::Create(std::move(mesh)); });
    if (!canonical)
    {
        Report("T-junction surface", canonical.error());
        Tasks::Scheduler::Shutdown();
        return EXIT_FAILURE;
    }
    if (auto valid = canonical->Revalidate(); !valid)
        Report("Revalidate", valid.error());
    else
        Log::Info("T-junction surface: {} vertices, {} junction(s), analysis-suitable",
                  canonical->Mesh().VertexCount(), Asts::FindTJunctions(canonical->Mesh()).size());

    // A 4x4 grid, lifted into a bump, with a horizontal cut that forces a
    // pair of T-junctions.
    auto grid = Shapes::Grid(4, 4);
    if (!grid)
    {
        Report("Grid", grid.error());
        Tasks::Scheduler::Shutdown();
        return EXIT_FAILURE;
    }

    SurfaceConfig config;
    config.Policy = RefinementPolicy::Propagate;

    auto surface = Surface::Create(std::move(*grid), config);
    if (!surface)
    {
        Report("Surface::Create", surface.error());
        Tasks::Scheduler::Shutdown();
        return EXIT_FAILURE;
    }

    const TMesh& mesh = surface->Mesh();
    if (auto centre = mesh.FindVertex(glm::dvec2(2.0, 2.0)))
    {
        if (auto moved = surface->SetControlPoint(*centre, glm::dvec4(2.0, 2.0, 1.5, 1.0)); !moved)
            Report("SetControlPoint", moved.error());
    }

    if (auto face = mesh.FaceContaining(glm::dvec2(2.5, 1.5)))
    {
        if (auto cut = surface->SplitFace(*face, Axis::S, 1.5); !cut)
            Report("SplitFace", cut.error());
    }
    if (auto face = surface->Mesh().FaceContaining(glm::dvec2(1.5, 2.5)))
    {
        if (auto cut = surface->SplitFace(*face, Axis::T, 1.5); !cut)
            Report("SplitFace", cut.error());
        else
            Log::Info("Crossing cut settled after {} propagation step(s)", surface->LastPropagationSteps());
    }

    Log::Info("T-mesh: {} vertices, {} faces, {} T-junctions",
              surface->Mesh().VertexCount(), surface->Mesh().FaceCount(),
              Asts::FindTJunctions(surface->Mesh()).size());

    auto evaluator = surface->MakeEvaluator();
    if (!evaluator)
    {
        Report("MakeEvaluator", evaluator.error());
        Tasks::Scheduler::Shutdown();
        return EXIT_FAILURE;
    }

    TessellationParams params;
    params.ResolutionS = resolution;
    params.ResolutionT = resolution;
    params.ComputeNormals = true;

    auto grid3d = Tessellate(AnySurface(std::move(*evaluator)), params);
    Tasks::Scheduler::Shutdown();
    if (!grid3d)
    {
        Report("Tessellate", grid3d.error());
        return EXIT_FAILURE;
    }

    double peak = 0.0;
    for (const glm::dvec3& p : grid3d->Points)
        peak = glm::max(peak, p.z);

    Log::Info("Tessellated {}x{} samples over [{}, {}] x [{}, {}], {} failed, peak height {:.4f}",
              grid3d->ResolutionS, grid3d->ResolutionT,
              grid3d->Region.Min.x, grid3d->Region.Max.x, grid3d->Region.Min.y, grid3d->Region.Max.y,
              grid3d->Failures, peak);
    return grid3d->Failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
