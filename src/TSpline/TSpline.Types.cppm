module;

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <glm/glm.hpp>

export module TSpline:Types;

import Core;

export namespace TSpline
{
    // Polynomial degree of every blending function in the kernel.
    inline constexpr int Degree = 3;

    // A cubic local knot vector has p + 2 entries, the centre one being the
    // control point's own coordinate.
    inline constexpr std::size_t KnotCount = Degree + 2;
    inline constexpr std::size_t KnotsPerSide = (KnotCount - 1) / 2;

    // Radius (in face-adjacency hops) of the neighbourhood whose knot vectors
    // can change after a local topology edit.
    inline constexpr std::uint32_t DirtyRadius = 2 * Degree + 1;

    inline constexpr std::uint32_t InvalidIndex = std::numeric_limits<std::uint32_t>::max();

    // Tolerance for comparing parameter-space coordinates.
    inline constexpr double ParamTolerance = 1e-9;

    struct VertexTag {};
    struct HalfedgeTag {};
    struct FaceTag {};

    using VertexHandle = Core::StrongHandle<VertexTag>;
    using HalfedgeHandle = Core::StrongHandle<HalfedgeTag>;
    using FaceHandle = Core::StrongHandle<FaceTag>;

    // S runs horizontally (x of a parameter point), T vertically (y).
    enum class Axis : std::uint8_t
    {
        S,
        T
    };

    enum class Sign : std::int8_t
    {
        Negative = -1,
        Positive = 1
    };

    [[nodiscard]] constexpr Axis Perpendicular(Axis axis) noexcept
    {
        return axis == Axis::S ? Axis::T : Axis::S;
    }

    [[nodiscard]] constexpr Sign Opposite(Sign sign) noexcept
    {
        return sign == Sign::Positive ? Sign::Negative : Sign::Positive;
    }

    [[nodiscard]] constexpr double ToDouble(Sign sign) noexcept
    {
        return sign == Sign::Positive ? 1.0 : -1.0;
    }

    [[nodiscard]] constexpr const char* ToString(Axis axis) noexcept
    {
        return axis == Axis::S ? "S" : "T";
    }

    [[nodiscard]] inline double Coordinate(const glm::dvec2& p, Axis axis) noexcept
    {
        return axis == Axis::S ? p.x : p.y;
    }

    [[nodiscard]] inline glm::dvec2 MakePoint(Axis axis, double along, double across) noexcept
    {
        return axis == Axis::S ? glm::dvec2(along, across) : glm::dvec2(across, along);
    }

    using LocalKnots = std::array<double, KnotCount>;

    struct KnotVectors
    {
        LocalKnots S{};
        LocalKnots T{};

        [[nodiscard]] const LocalKnots& operator[](Axis axis) const noexcept { return axis == Axis::S ? S : T; }
        [[nodiscard]] LocalKnots& operator[](Axis axis) noexcept { return axis == Axis::S ? S : T; }

        bool operator==(const KnotVectors&) const = default;
    };

    // Position, first partials and unit normal of a surface at (s, t). The
    // normal is zero where the partials are parallel.
    struct SurfacePoint
    {
        glm::dvec3 Position{0.0};
        glm::dvec3 DerivativeS{0.0};
        glm::dvec3 DerivativeT{0.0};
        glm::dvec3 Normal{0.0};
    };

    // -------------------------------------------------------------------------
    // Bounds - axis-aligned rectangle in parameter space
    // -------------------------------------------------------------------------
    struct Bounds
    {
        glm::dvec2 Min{std::numeric_limits<double>::max()};
        glm::dvec2 Max{std::numeric_limits<double>::lowest()};

        void Add(const glm::dvec2& p) noexcept
        {
            Min = glm::min(Min, p);
            Max = glm::max(Max, p);
        }

        void Add(const Bounds& other) noexcept
        {
            if (other.IsEmpty())
                return;
            Add(other.Min);
            Add(other.Max);
        }

        [[nodiscard]] bool IsEmpty() const noexcept { return Min.x > Max.x || Min.y > Max.y; }
        [[nodiscard]] glm::dvec2 Extent() const noexcept { return IsEmpty() ? glm::dvec2(0.0) : Max - Min; }
        [[nodiscard]] glm::dvec2 Center() const noexcept { return (Min + Max) * 0.5; }

        [[nodiscard]] double Area() const noexcept
        {
            const glm::dvec2 e = Extent();
            return e.x * e.y;
        }

        [[nodiscard]] bool Contains(const glm::dvec2& p, double tolerance = 0.0) const noexcept
        {
            return p.x >= Min.x - tolerance && p.x <= Max.x + tolerance &&
                   p.y >= Min.y - tolerance && p.y <= Max.y + tolerance;
        }

        [[nodiscard]] bool Overlaps(const Bounds& other) const noexcept
        {
            return Min.x <= other.Max.x && other.Min.x <= Max.x &&
                   Min.y <= other.Max.y && other.Min.y <= Max.y;
        }

        // Grid sample (i, j) of a resS by resT lattice that
        // spans the rectangle corner to corner.
        [[nodiscard]] glm::dvec2 Interpolate(std::size_t i, std::size_t j, std::size_t resS, std::size_t resT) const noexcept
        {
            const double fs = resS > 1 ? static_cast<double>(i) / static_cast<double>(resS - 1) : 0.5;
            const double ft = resT > 1 ? static_cast<double>(j) / static_cast<double>(resT - 1) : 0.5;
            return {Min.x + fs * (Max.x - Min.x), Min.y + ft * (Max.y - Min.y)};
        }

        bool operator==(const Bounds&) const = default;
    };

    // -------------------------------------------------------------------------
    // Segment - closed parameter-space segment (T-junction extensions)
    // -------------------------------------------------------------------------
    struct Segment
    {
        glm::dvec2 Start{0.0};
        glm::dvec2 End{0.0};

        bool operator==(const Segment&) const = default;
    };

    // Closed-segment intersection via orientation predicates. Touching at an
    // endpoint and collinear overlap both count as intersecting.
    [[nodiscard]] bool Intersects(const Segment& a, const Segment& b, double tolerance = ParamTolerance);
}
