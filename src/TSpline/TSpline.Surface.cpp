module;

#include <cmath>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <utility>
#include <variant>

#include <glm/glm.hpp>

module TSpline:Surface.Impl;

import Core;
import :Types;
import :Error;
import :TMesh;
import :KnotInference;
import :Validation;
import :Evaluator;
import :Nurbs;
import :Surface;

namespace TSpline
{
    namespace
    {
        // Carry the junction's missing edge straight across the face it points
        // into. The junction becomes a regular vertex and the far end of the
        // new edge is the (possibly new) T-junction.
        Expected<HalfedgeHandle> ExtendAcrossFace(TMesh& mesh, VertexHandle junction)
        {
            const auto classified = Asts::ClassifyJunction(mesh, junction.Index);
            if (!classified)
                return std::unexpected(MakeError(Core::ErrorCode::InvalidState,
                                                 std::format("vertex {} is not a T-junction", junction.Index))
                                           .With(junction));

            const Axis axis = classified->Orientation;
            const Axis perp = Perpendicular(axis);
            const glm::dvec2 p = mesh.Param(junction.Index);
            const double along = Coordinate(p, axis);
            const double across = Coordinate(p, perp);
            const double tol = mesh.Tolerance();

            for (const std::uint32_t f : mesh.IncidentFaces(junction.Index))
            {
                const Bounds box = mesh.FaceBounds(f);
                const double entry = classified->Direction == Sign::Positive ? Coordinate(box.Min, axis)
                                                                             : Coordinate(box.Max, axis);
                if (std::abs(entry - along) > tol)
                    continue;
                if (!(across > Coordinate(box.Min, perp) + tol && across < Coordinate(box.Max, perp) - tol))
                    continue;
                return mesh.InsertTJunction(mesh.FaceHandleOf(f), junction, axis);
            }

            return std::unexpected(MakeError(Core::ErrorCode::TopologyCorrupt,
                                             std::format("no face admits the extension of T-junction {}", junction.Index))
                                       .With(junction));
        }
    }

    Surface::Surface(TMesh mesh, Knots::KnotCache knots, const SurfaceConfig& config)
        : m_Mesh(std::move(mesh)), m_Knots(std::move(knots)), m_Config(config)
    {
    }

    Expected<Surface> Surface::Create(TMesh mesh, const SurfaceConfig& config)
    {
        Surface surface(std::move(mesh), Knots::KnotCache{}, config);
        surface.m_Mesh.MarkAllDirty();
        if (auto ok = surface.Settle(surface.m_Mesh, surface.m_Knots, surface.m_LastPropagationSteps); !ok)
        {
            Core::Log::Warn("Surface rejected: {}", ok.error().Message);
            return std::unexpected(std::move(ok.error()));
        }
        return surface;
    }

    Result Surface::Settle(TMesh& mesh, Knots::KnotCache& knots, std::uint32_t& steps) const
    {
        steps = 0;
        for (;;)
        {
            if (auto ok = knots.Refresh(mesh, m_Config.KnotInference); !ok)
                return ok;

            auto valid = Asts::Validate(mesh, m_Config.Validation);
            if (valid)
                return {};

            Error& error = valid.error();
            if (error.Code != Core::ErrorCode::AstsViolation || m_Config.Policy == RefinementPolicy::Reject)
                return valid;

            if (steps >= m_Config.MaxPropagationSteps)
            {
                error.Message = std::format("{} (still invalid after {} propagation steps)", error.Message, steps);
                return valid;
            }

            // Extend the first conflict's horizontal junction; if that one
            // cannot be extended try the vertical one.
            const AstsConflict& conflict = error.Conflicts.front();
            auto extended = ExtendAcrossFace(mesh, conflict.Horizontal);
            if (!extended)
                extended = ExtendAcrossFace(mesh, conflict.Vertical);
            if (!extended)
                return std::unexpected(std::move(extended.error()));

            ++steps;
            Core::Log::Debug("ASTS propagation step {}: extended junction {}", steps, extended->Index);
        }
    }

    Result Surface::Revalidate()
    {
        if (auto ok = m_Knots.Refresh(m_Mesh, m_Config.KnotInference); !ok)
            return ok;
        return Asts::Validate(m_Mesh, m_Config.Validation);
    }

    Result Surface::Apply(const Mutation& mutation)
    {
        TMesh mesh = m_Mesh;
        Knots::KnotCache knots = m_Knots;

        if (auto ok = mutation(mesh); !ok)
        {
            Core::Log::Warn("Mutation failed ({}): {}", Core::ErrorCodeToString(ok.error().Code), ok.error().Message);
            return ok;
        }

        std::uint32_t steps = 0;
        if (auto ok = Settle(mesh, knots, steps); !ok)
        {
            Core::Log::Warn("Mutation rejected ({}): {}", Core::ErrorCodeToString(ok.error().Code), ok.error().Message);
            return ok;
        }

        m_Mesh = std::move(mesh);
        m_Knots = std::move(knots);
        m_LastPropagationSteps = steps;
        if (steps > 0)
            Core::Log::Info("Mutation applied after {} propagation step(s)", steps);
        return {};
    }

    Expected<VertexHandle> Surface::SplitEdge(HalfedgeHandle h, double coordinate)
    {
        VertexHandle created{};
        auto ok = Apply([&](TMesh& mesh) -> Result
        {
            auto v = mesh.SplitEdge(h, coordinate);
            if (!v)
                return std::unexpected(std::move(v.error()));
            created = *v;
            return {};
        });
        if (!ok)
            return std::unexpected(std::move(ok.error()));
        return created;
    }

    Expected<HalfedgeHandle> Surface::ConnectVertices(FaceHandle f, VertexHandle a, VertexHandle b)
    {
        HalfedgeHandle created{};
        auto ok = Apply([&](TMesh& mesh) -> Result
        {
            auto h = mesh.ConnectVertices(f, a, b);
            if (!h)
                return std::unexpected(std::move(h.error()));
            created = *h;
            return {};
        });
        if (!ok)
            return std::unexpected(std::move(ok.error()));
        return created;
    }

    Expected<HalfedgeHandle> Surface::InsertTJunction(FaceHandle f, VertexHandle anchor, Axis axis)
    {
        HalfedgeHandle created{};
        auto ok = Apply([&](TMesh& mesh) -> Result
        {
            auto h = mesh.InsertTJunction(f, anchor, axis);
            if (!h)
                return std::unexpected(std::move(h.error()));
            created = *h;
            return {};
        });
        if (!ok)
            return std::unexpected(std::move(ok.error()));
        return created;
    }

    Expected<HalfedgeHandle> Surface::SplitFace(FaceHandle f, Axis axis, double coordinate)
    {
        HalfedgeHandle created{};
        auto ok = Apply([&](TMesh& mesh) -> Result
        {
            auto h = mesh.SplitFace(f, axis, coordinate);
            if (!h)
                return std::unexpected(std::move(h.error()));
            created = *h;
            return {};
        });
        if (!ok)
            return std::unexpected(std::move(ok.error()));
        return created;
    }

    Result Surface::SetControlPoint(VertexHandle v, const glm::dvec4& geometry)
    {
        return m_Mesh.SetControlPoint(v, geometry);
    }

    Expected<std::shared_ptr<const SurfaceSnapshot>> Surface::Snapshot() const
    {
        return SurfaceSnapshot::Create(m_Mesh, m_Knots, m_Config.Evaluation);
    }

    Expected<Evaluator> Surface::MakeEvaluator() const
    {
        auto snapshot = Snapshot();
        if (!snapshot)
            return std::unexpected(std::move(snapshot.error()));
        return Evaluator(std::move(*snapshot));
    }

    // -------------------------------------------------------------------------
    // AnySurface
    // -------------------------------------------------------------------------

    Expected<glm::dvec3> Evaluate(const AnySurface& surface, double u, double v)
    {
        return std::visit([u, v](const auto& s) { return s.Evaluate(u, v); }, surface);
    }

    Expected<SurfacePoint> EvaluateDerivatives(const AnySurface& surface, double u, double v)
    {
        return std::visit([u, v](const auto& s) { return s.EvaluateDerivatives(u, v); }, surface);
    }

    Bounds Domain(const AnySurface& surface)
    {
        return std::visit([](const auto& s) -> Bounds { return s.Domain(); }, surface);
    }
}
