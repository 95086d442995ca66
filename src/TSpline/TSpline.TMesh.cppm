module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module TSpline:TMesh;

import Core;
import :Types;
import :Error;

export namespace TSpline
{
    enum class BoundaryPolicy : std::uint8_t
    {
        Strict,   // a half-edge without twin has no destination
        Tolerant  // fall back to the origin of the next half-edge
    };

    // -------------------------------------------------------------------------
    // Records
    // -------------------------------------------------------------------------
    // Cross references are raw slot indices into the owning mesh's arenas.
    // InvalidIndex marks an absent twin / face.

    struct ControlPoint
    {
        glm::dvec4 Geometry{0.0, 0.0, 0.0, 1.0}; // xyz position, w weight
        glm::dvec2 Param{0.0};                   // (s, t)
        std::uint32_t Outgoing{InvalidIndex};
        bool IsTJunction{false};

        bool operator==(const ControlPoint&) const = default;
    };

    struct HalfEdge
    {
        std::uint32_t Origin{InvalidIndex};
        std::uint32_t Twin{InvalidIndex};
        std::uint32_t Face{InvalidIndex};
        std::uint32_t Next{InvalidIndex};
        std::uint32_t Prev{InvalidIndex};
        Axis Direction{Axis::S};
        double KnotInterval{0.0};

        [[nodiscard]] bool HasTwin() const noexcept { return Twin != InvalidIndex; }
        [[nodiscard]] bool HasFace() const noexcept { return Face != InvalidIndex; }

        bool operator==(const HalfEdge&) const = default;
    };

    struct MeshFace
    {
        std::uint32_t Halfedge{InvalidIndex};

        bool operator==(const MeshFace&) const = default;
    };

    // Connection of a vertex to one neighbour. Outgoing spokes are half-edges
    // leaving the vertex; a twinless half-edge that only arrives at the vertex
    // is reported with Outgoing == false.
    struct Spoke
    {
        std::uint32_t Halfedge{InvalidIndex};
        std::uint32_t Neighbor{InvalidIndex};
        bool Outgoing{true};
        Axis Direction{Axis::S};
        double Delta{0.0}; // signed parametric offset to Neighbor along Direction

        [[nodiscard]] Sign Side() const noexcept { return Delta >= 0.0 ? Sign::Positive : Sign::Negative; }
    };

    // Fully formed topology handed over by an importer. Vertex Outgoing may be
    // left as InvalidIndex, in which case it is derived.
    struct TMeshDescription
    {
        std::vector<ControlPoint> Vertices{};
        std::vector<HalfEdge> Halfedges{};
        std::vector<MeshFace> Faces{};
        double Tolerance{ParamTolerance};
    };

    // =========================================================================
    // TMesh - half-edge topology store of a T-spline control mesh
    // =========================================================================
    //
    // Faces are axis-aligned rectangles in (s, t) parameter space. A face can
    // have more than four boundary vertices when T-junctions hang on its sides.
    // Boundary loops may be represented either by faceless half-edges (every
    // edge has a twin) or by leaving the twin absent.
    //
    // Every mutation leaves the mesh satisfying all construction invariants,
    // bumps the generation of the slots it rewrites and marks the vertices
    // whose local knot vectors may have changed as dirty.
    class TMesh
    {
    public:
        TMesh() = default;

        // Construction
        [[nodiscard]] static Expected<TMesh> Create(TMeshDescription description);

        // Build half-edges from counter-clockwise face loops (vertex indices).
        // Unpaired edges get faceless boundary twins.
        [[nodiscard]] static Expected<TMesh> FromFaces(std::vector<ControlPoint> vertices,
                                                       std::span<const std::vector<std::uint32_t>> faces,
                                                       double tolerance = ParamTolerance);

        // Sizes
        [[nodiscard]] std::size_t VertexCount() const noexcept { return m_Vertices.Size(); }
        [[nodiscard]] std::size_t HalfedgeCount() const noexcept { return m_Halfedges.Size(); }
        [[nodiscard]] std::size_t FaceCount() const noexcept { return m_Faces.Size(); }
        [[nodiscard]] double Tolerance() const noexcept { return m_Tolerance; }

        // Stable iteration
        [[nodiscard]] std::vector<VertexHandle> VertexHandles() const;
        [[nodiscard]] std::vector<HalfedgeHandle> HalfedgeHandles() const;
        [[nodiscard]] std::vector<FaceHandle> FaceHandles() const;

        [[nodiscard]] VertexHandle VertexHandleOf(std::uint32_t index) const { return m_Vertices.HandleOf(index); }
        [[nodiscard]] HalfedgeHandle HalfedgeHandleOf(std::uint32_t index) const { return m_Halfedges.HandleOf(index); }
        [[nodiscard]] FaceHandle FaceHandleOf(std::uint32_t index) const { return m_Faces.HandleOf(index); }

        [[nodiscard]] bool Contains(VertexHandle v) const noexcept { return m_Vertices.Contains(v); }
        [[nodiscard]] bool Contains(HalfedgeHandle h) const noexcept { return m_Halfedges.Contains(h); }
        [[nodiscard]] bool Contains(FaceHandle f) const noexcept { return m_Faces.Contains(f); }

        // Checked lookup
        [[nodiscard]] Expected<ControlPoint> Vertex(VertexHandle v) const;
        [[nodiscard]] Expected<HalfEdge> Edge(HalfedgeHandle h) const;
        [[nodiscard]] Expected<MeshFace> Face(FaceHandle f) const;

        // Raw index access for the engines. Index must be < the matching count.
        [[nodiscard]] const ControlPoint& VertexData(std::uint32_t v) const { return m_Vertices[v]; }
        [[nodiscard]] const HalfEdge& EdgeData(std::uint32_t h) const { return m_Halfedges[h]; }
        [[nodiscard]] const MeshFace& FaceData(std::uint32_t f) const { return m_Faces[f]; }
        [[nodiscard]] const glm::dvec2& Param(std::uint32_t v) const { return m_Vertices[v].Param; }

        // Traversal
        [[nodiscard]] Expected<std::vector<HalfedgeHandle>> FaceBoundary(FaceHandle f) const;
        [[nodiscard]] Expected<std::vector<std::uint32_t>> FaceLoop(std::uint32_t f) const;
        [[nodiscard]] Expected<VertexHandle> DestinationOf(HalfedgeHandle h,
                                                           BoundaryPolicy policy = BoundaryPolicy::Strict) const;
        [[nodiscard]] std::uint32_t Destination(std::uint32_t h) const;

        // Returns the half-edge joining a and b, oriented a -> b unless the
        // connection only exists as a twinless half-edge b -> a.
        [[nodiscard]] std::optional<HalfedgeHandle> FindEdge(VertexHandle a, VertexHandle b) const;

        // Spokes
        [[nodiscard]] std::vector<Spoke> Spokes(std::uint32_t v) const;
        [[nodiscard]] Expected<std::vector<Spoke>> Spokes(VertexHandle v) const;
        [[nodiscard]] Expected<std::size_t> Valence(VertexHandle v) const;
        [[nodiscard]] Expected<bool> IsBoundary(VertexHandle v) const;
        [[nodiscard]] bool IsBoundaryVertex(std::uint32_t v) const;
        [[nodiscard]] bool HasSpokeAlong(std::uint32_t v, Axis axis) const;

        // The unique spoke of v pointing along (axis, sign), if any.
        // AmbiguousTraversal when more than one qualifies or a spoke's axis
        // tag disagrees with its parametric offset.
        [[nodiscard]] Expected<std::optional<Spoke>> FindSpoke(std::uint32_t v, Axis axis, Sign sign) const;

        // Geometry queries
        [[nodiscard]] std::vector<std::uint32_t> IncidentFaces(std::uint32_t v) const;
        [[nodiscard]] Bounds FaceBounds(std::uint32_t f) const;
        [[nodiscard]] Bounds ParameterBounds() const;
        [[nodiscard]] std::optional<FaceHandle> FaceContaining(const glm::dvec2& p) const;
        [[nodiscard]] std::optional<VertexHandle> FindVertex(const glm::dvec2& p) const;

        // Mutation
        [[nodiscard]] Expected<VertexHandle> SplitEdge(HalfedgeHandle h, double coordinate);
        [[nodiscard]] Expected<HalfedgeHandle> ConnectVertices(FaceHandle f, VertexHandle a, VertexHandle b);
        [[nodiscard]] Expected<HalfedgeHandle> InsertTJunction(FaceHandle f, VertexHandle anchor, Axis axis);
        [[nodiscard]] Expected<HalfedgeHandle> SplitFace(FaceHandle f, Axis axis, double coordinate);
        [[nodiscard]] Result SetControlPoint(VertexHandle v, const glm::dvec4& geometry);

        // Dirty tracking
        [[nodiscard]] bool IsDirty(std::uint32_t v) const { return v < m_Dirty.size() && m_Dirty[v] != 0; }
        [[nodiscard]] std::vector<VertexHandle> DirtyVertices() const;
        [[nodiscard]] std::size_t DirtyCount() const;
        void ClearDirty();
        void MarkAllDirty();

        bool operator==(const TMesh&) const = default;

    private:
        struct BoundaryPoint
        {
            std::uint32_t Vertex{InvalidIndex};   // existing vertex at the point
            std::uint32_t Halfedge{InvalidIndex}; // otherwise the half-edge to split
            double Along{0.0};                    // coordinate along the half-edge's axis
        };

        [[nodiscard]] Result ValidateTopology() const;
        [[nodiscard]] Spoke MakeSpoke(std::uint32_t v, std::uint32_t h, bool outgoing) const;
        [[nodiscard]] std::optional<std::uint32_t> LoopHalfedgeFrom(std::span<const std::uint32_t> loop, std::uint32_t v) const;
        [[nodiscard]] Expected<BoundaryPoint> FindBoundaryPoint(std::uint32_t f, const glm::dvec2& p) const;
        [[nodiscard]] Expected<std::uint32_t> CheckedConnect(std::uint32_t f, std::uint32_t a, std::uint32_t b) const;

        std::uint32_t Realize(const BoundaryPoint& point);
        std::uint32_t SplitEdgeAt(std::uint32_t h, double coordinate);
        std::uint32_t ConnectAt(std::uint32_t f, std::uint32_t ha, std::uint32_t hb, Axis axis);
        void RefreshJunctionFlag(std::uint32_t v);
        void MarkDirtyAround(std::span<const std::uint32_t> seeds);

        Core::SlotArena<ControlPoint, VertexHandle> m_Vertices;
        Core::SlotArena<HalfEdge, HalfedgeHandle> m_Halfedges;
        Core::SlotArena<MeshFace, FaceHandle> m_Faces;
        std::vector<std::uint8_t> m_Dirty;
        double m_Tolerance{ParamTolerance};
    };
}
