module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // Every fallible kernel operation follows the same pattern:
    //
    // 1. std::expected<T, E>  - For FALLIBLE operations where the caller MUST
    //                          react to failure:
    //                          - Topology construction and mutation
    //                          - Knot inference (ambiguous or corrupt walks)
    //                          - Evaluation at degenerate parameters
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a normal outcome:
    //                          - Edge lookup between two vertices
    //                          - Face containing a parameter point
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation.
    //
    // 4. Assertions          - For INVARIANTS whose violation is a bug in the
    //                          kernel itself, never for caller input.
    //
    // Core::ErrorCode is the shared error taxonomy. Modules that need to attach
    // diagnostics (offending vertices, conflicting segments) wrap the code in
    // their own error struct and keep the code as the classification.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Argument and state errors (100-199)
        InvalidArgument = 100,
        InvalidState = 101,
        OutOfRange = 102,

        // Topology errors (200-299)
        InvalidIndex = 200,
        TopologyCorrupt = 201,
        BoundaryEdge = 202,

        // Knot inference and analysis suitability (300-399)
        AmbiguousTraversal = 300,
        AstsViolation = 301,

        // Evaluation errors (400-499)
        DegenerateParameter = 400,

        // Threading errors (600-699)
        Cancelled = 600,
        ThreadViolation = 601,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:             return "Success";
            case ErrorCode::InvalidArgument:     return "InvalidArgument";
            case ErrorCode::InvalidState:        return "InvalidState";
            case ErrorCode::OutOfRange:          return "OutOfRange";
            case ErrorCode::InvalidIndex:        return "InvalidIndex";
            case ErrorCode::TopologyCorrupt:     return "TopologyCorrupt";
            case ErrorCode::BoundaryEdge:        return "BoundaryEdge";
            case ErrorCode::AmbiguousTraversal:  return "AmbiguousTraversal";
            case ErrorCode::AstsViolation:       return "AstsViolation";
            case ErrorCode::DegenerateParameter: return "DegenerateParameter";
            case ErrorCode::Cancelled:           return "Cancelled";
            case ErrorCode::ThreadViolation:     return "ThreadViolation";
            default:                             return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit
    {
        constexpr bool operator==(const Unit&) const = default;
    };
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
