module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module TSpline:Evaluator.Impl;

import Core;
import :Types;
import :Error;
import :TMesh;
import :KnotInference;
import :Basis;
import :Evaluator;

namespace TSpline
{
    // -------------------------------------------------------------------------
    // SupportIndex
    // -------------------------------------------------------------------------

    void SupportIndex::Clear()
    {
        m_Extent = {};
        m_CountS = 0;
        m_CountT = 0;
        m_Supports.clear();
        m_CellStart.clear();
        m_CellItems.clear();
    }

    std::size_t SupportIndex::CellCoordinate(double value, Axis axis) const
    {
        const std::size_t count = axis == Axis::S ? m_CountS : m_CountT;
        const double lo = Coordinate(m_Extent.Min, axis);
        const double size = Coordinate(m_Extent.Extent(), axis);
        if (size <= 0.0 || count <= 1)
            return 0;

        const double cell = std::floor((value - lo) / size * static_cast<double>(count));
        if (cell <= 0.0)
            return 0;
        return std::min(count - 1, static_cast<std::size_t>(cell));
    }

    void SupportIndex::Build(const TMesh& mesh, const Knots::KnotCache& knots, const EvaluatorParams& params)
    {
        Clear();

        const std::size_t n = mesh.VertexCount();
        m_Supports.resize(n);

        std::vector<std::uint32_t> active;
        active.reserve(n);
        for (std::uint32_t v = 0; v < n; ++v)
        {
            const KnotVectors& k = knots.At(v);
            Bounds support;
            support.Add(glm::dvec2(k.S.front(), k.T.front()));
            support.Add(glm::dvec2(k.S.back(), k.T.back()));
            m_Supports[v] = support;

            // A support without area carries an identically zero function.
            const glm::dvec2 e = support.Extent();
            if (e.x <= 0.0 || e.y <= 0.0)
                continue;
            m_Extent.Add(support);
            active.push_back(v);
        }

        if (active.empty())
        {
            m_CellStart.assign(1, 0u);
            return;
        }

        const auto target = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(active.size()))));
        const std::size_t cap = std::max<std::size_t>(1, params.MaxBucketsPerAxis);
        m_CountS = std::clamp<std::size_t>(target, 1, cap);
        m_CountT = m_CountS;

        const auto cellRange = [&](const Bounds& b, std::size_t& s0, std::size_t& s1, std::size_t& t0, std::size_t& t1)
        {
            s0 = CellCoordinate(b.Min.x, Axis::S);
            s1 = CellCoordinate(b.Max.x, Axis::S);
            t0 = CellCoordinate(b.Min.y, Axis::T);
            t1 = CellCoordinate(b.Max.y, Axis::T);
        };

        // Two passes: count, then fill.
        std::vector<std::uint32_t> counts(m_CountS * m_CountT, 0u);
        for (const std::uint32_t v : active)
        {
            std::size_t s0, s1, t0, t1;
            cellRange(m_Supports[v], s0, s1, t0, t1);
            for (std::size_t j = t0; j <= t1; ++j)
                for (std::size_t i = s0; i <= s1; ++i)
                    ++counts[i + m_CountS * j];
        }

        m_CellStart.assign(counts.size() + 1, 0u);
        for (std::size_t c = 0; c < counts.size(); ++c)
            m_CellStart[c + 1] = m_CellStart[c] + counts[c];

        m_CellItems.resize(m_CellStart.back());
        std::vector<std::uint32_t> cursor(m_CellStart.begin(), m_CellStart.end() - 1);
        for (const std::uint32_t v : active)
        {
            std::size_t s0, s1, t0, t1;
            cellRange(m_Supports[v], s0, s1, t0, t1);
            for (std::size_t j = t0; j <= t1; ++j)
                for (std::size_t i = s0; i <= s1; ++i)
                    m_CellItems[cursor[i + m_CountS * j]++] = v;
        }

        Core::Log::Debug("SupportIndex: {} supports in a {}x{} grid ({} entries)",
                         active.size(), m_CountS, m_CountT, m_CellItems.size());
    }

    void SupportIndex::Query(const glm::dvec2& p, std::vector<std::uint32_t>& out) const
    {
        out.clear();
        if (m_CountS == 0 || !m_Extent.Contains(p))
            return;

        const std::size_t cell = CellCoordinate(p.x, Axis::S) + m_CountS * CellCoordinate(p.y, Axis::T);
        for (std::uint32_t k = m_CellStart[cell]; k < m_CellStart[cell + 1]; ++k)
        {
            const std::uint32_t v = m_CellItems[k];
            if (m_Supports[v].Contains(p))
                out.push_back(v);
        }
    }

    // -------------------------------------------------------------------------
    // SurfaceSnapshot
    // -------------------------------------------------------------------------

    namespace
    {
        // Boundary vertices carry repeated knots on their open side, so next
        // to each side of the mesh the blending functions fall short of one.
        // The domain starts at the first interior knot line: k3 of the
        // vertices on the low side, k1 of those on the high side.
        Bounds FullSupportDomain(const TMesh& mesh, const Knots::KnotCache& knots)
        {
            const Bounds extent = mesh.ParameterBounds();
            const double tol = mesh.Tolerance();

            Bounds domain = extent;
            for (std::uint32_t v = 0; v < mesh.VertexCount(); ++v)
            {
                const glm::dvec2& p = mesh.Param(v);
                for (const Axis axis : {Axis::S, Axis::T})
                {
                    const int i = axis == Axis::S ? 0 : 1;
                    const LocalKnots& k = knots.At(v)[axis];
                    if (std::abs(p[i] - extent.Min[i]) <= tol)
                        domain.Min[i] = std::max(domain.Min[i], k[3]);
                    if (std::abs(p[i] - extent.Max[i]) <= tol)
                        domain.Max[i] = std::min(domain.Max[i], k[1]);
                }
            }
            return domain;
        }
    }

    Expected<std::shared_ptr<const SurfaceSnapshot>> SurfaceSnapshot::Create(
        TMesh mesh, Knots::KnotCache knots, const EvaluatorParams& params)
    {
        if (knots.Size() != mesh.VertexCount())
            return std::unexpected(MakeError(Core::ErrorCode::InvalidState,
                                             std::format("knot cache holds {} entries for {} vertices",
                                                         knots.Size(), mesh.VertexCount())));
        for (std::uint32_t v = 0; v < mesh.VertexCount(); ++v)
        {
            if (!knots.IsValid(v) || mesh.IsDirty(v))
                return std::unexpected(MakeError(Core::ErrorCode::InvalidState,
                                                 std::format("knot vectors of vertex {} are stale", v))
                                           .With(mesh.VertexHandleOf(v)));
        }

        const Bounds domain = FullSupportDomain(mesh, knots);
        if (domain.Area() <= 0.0)
            return std::unexpected(MakeError(Core::ErrorCode::DegenerateParameter,
                                             std::format("no region of the {}-vertex mesh is covered by a full set of "
                                                         "blending functions", mesh.VertexCount())));

        auto snapshot = std::make_shared<SurfaceSnapshot>();
        snapshot->Mesh = std::move(mesh);
        snapshot->Knots = std::move(knots);
        snapshot->Params = params;
        snapshot->Domain = domain;
        snapshot->Support.Build(snapshot->Mesh, snapshot->Knots, params);
        return std::shared_ptr<const SurfaceSnapshot>(std::move(snapshot));
    }

    Expected<std::shared_ptr<const SurfaceSnapshot>> SurfaceSnapshot::FromMesh(
        TMesh mesh, const EvaluatorParams& params, const Knots::KnotInferenceParams& knotParams)
    {
        Knots::KnotCache knots;
        if (auto ok = knots.Rebuild(mesh, knotParams); !ok)
            return std::unexpected(std::move(ok.error()));
        return Create(std::move(mesh), std::move(knots), params);
    }

    // -------------------------------------------------------------------------
    // Evaluator
    // -------------------------------------------------------------------------

    Evaluator::Evaluator(std::shared_ptr<const SurfaceSnapshot> snapshot)
        : m_Snapshot(std::move(snapshot))
    {
    }

    Expected<Evaluator::Accumulated> Evaluator::Accumulate(double u, double v, bool derivatives) const
    {
        const SurfaceSnapshot& snap = *m_Snapshot;
        if (!std::isfinite(u) || !std::isfinite(v) || !snap.Domain.Contains(glm::dvec2(u, v), snap.Mesh.Tolerance()))
            return std::unexpected(MakeError(Core::ErrorCode::DegenerateParameter,
                                             std::format("({}, {}) is outside the parameter domain [{}, {}] x [{}, {}]",
                                                         u, v, snap.Domain.Min.x, snap.Domain.Max.x,
                                                         snap.Domain.Min.y, snap.Domain.Max.y)));

        // Snap points within tolerance of the domain edge onto it.
        u = std::clamp(u, snap.Domain.Min.x, snap.Domain.Max.x);
        v = std::clamp(v, snap.Domain.Min.y, snap.Domain.Max.y);
        const glm::dvec2 p(u, v);

        thread_local std::vector<std::uint32_t> candidates;
        snap.Support.Query(p, candidates);

        Accumulated acc;
        for (const std::uint32_t i : candidates)
        {
            const KnotVectors& k = snap.Knots.At(i);
            const glm::dvec4& g = snap.Mesh.VertexData(i).Geometry;
            const glm::dvec3 xyz(g);

            if (!derivatives)
            {
                const double bs = Basis::Cubic(u, k.S);
                if (bs == 0.0)
                    continue;
                const double c = g.w * bs * Basis::Cubic(v, k.T);
                acc.A += c * xyz;
                acc.W += c;
                continue;
            }

            const Basis::BasisValue bs = Basis::CubicWithDerivative(u, k.S);
            const Basis::BasisValue bt = Basis::CubicWithDerivative(v, k.T);

            const double c = g.w * bs.Value * bt.Value;
            const double cu = g.w * bs.Derivative * bt.Value;
            const double cv = g.w * bs.Value * bt.Derivative;
            acc.A += c * xyz;
            acc.W += c;
            acc.Au += cu * xyz;
            acc.Wu += cu;
            acc.Av += cv * xyz;
            acc.Wv += cv;
        }

        return acc;
    }

    Result Evaluator::CheckDenominator(const Accumulated& acc, double u, double v) const
    {
        if (std::abs(acc.W) < m_Snapshot->Params.DenominatorTolerance)
            return std::unexpected(MakeError(Core::ErrorCode::DegenerateParameter,
                                             std::format("weight sum {} at ({}, {}) is below tolerance", acc.W, u, v)));
        return {};
    }

    Expected<glm::dvec3> Evaluator::Evaluate(double u, double v) const
    {
        auto acc = Accumulate(u, v, false);
        if (!acc)
            return std::unexpected(std::move(acc.error()));
        if (auto ok = CheckDenominator(*acc, u, v); !ok)
            return std::unexpected(std::move(ok.error()));
        return acc->A / acc->W;
    }

    Expected<SurfacePoint> Evaluator::EvaluateDerivatives(double u, double v) const
    {
        auto acc = Accumulate(u, v, true);
        if (!acc)
            return std::unexpected(std::move(acc.error()));
        if (auto ok = CheckDenominator(*acc, u, v); !ok)
            return std::unexpected(std::move(ok.error()));

        SurfacePoint point;
        point.Position = acc->A / acc->W;
        point.DerivativeS = (acc->Au - acc->Wu * point.Position) / acc->W;
        point.DerivativeT = (acc->Av - acc->Wv * point.Position) / acc->W;

        const glm::dvec3 n = glm::cross(point.DerivativeS, point.DerivativeT);
        const double len = glm::length(n);
        if (len > ParamTolerance)
            point.Normal = n / len;
        return point;
    }

    Expected<double> Evaluator::WeightSum(double u, double v) const
    {
        auto acc = Accumulate(u, v, false);
        if (!acc)
            return std::unexpected(std::move(acc.error()));
        return acc->W;
    }
}
