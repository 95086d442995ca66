module;

#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

module TSpline:Types.Impl;

import :Types;

namespace TSpline
{
    namespace
    {
        // 0 collinear, 1 clockwise, 2 counter-clockwise
        int Orientation(const glm::dvec2& p, const glm::dvec2& q, const glm::dvec2& r, double tolerance)
        {
            const double cross = (q.y - p.y) * (r.x - q.x) - (q.x - p.x) * (r.y - q.y);
            if (std::abs(cross) < tolerance)
                return 0;
            return cross > 0.0 ? 1 : 2;
        }

        // q collinear with p-r: does q lie within the bounding box of p-r?
        bool OnSegment(const glm::dvec2& p, const glm::dvec2& q, const glm::dvec2& r, double tolerance)
        {
            return q.x <= std::max(p.x, r.x) + tolerance && q.x >= std::min(p.x, r.x) - tolerance &&
                   q.y <= std::max(p.y, r.y) + tolerance && q.y >= std::min(p.y, r.y) - tolerance;
        }
    }

    bool Intersects(const Segment& a, const Segment& b, double tolerance)
    {
        const int o1 = Orientation(a.Start, a.End, b.Start, tolerance);
        const int o2 = Orientation(a.Start, a.End, b.End, tolerance);
        const int o3 = Orientation(b.Start, b.End, a.Start, tolerance);
        const int o4 = Orientation(b.Start, b.End, a.End, tolerance);

        if (o1 != o2 && o3 != o4)
            return true;

        if (o1 == 0 && OnSegment(a.Start, b.Start, a.End, tolerance)) return true;
        if (o2 == 0 && OnSegment(a.Start, b.End, a.End, tolerance)) return true;
        if (o3 == 0 && OnSegment(b.Start, a.Start, b.End, tolerance)) return true;
        if (o4 == 0 && OnSegment(b.Start, a.End, b.End, tolerance)) return true;

        return false;
    }
}
