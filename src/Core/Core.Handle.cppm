module;
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <limits>
#include <string_view>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - generational slot reference
    // -------------------------------------------------------------------------
    // Index addresses a slot in a SlotArena. Generation is the version of the
    // slot the handle was issued for; a mutation that rewrites a slot (an edge
    // split in two, a face cut by a new edge) bumps it, and every handle
    // issued earlier no longer resolves.
    //
    // Distinct tags give vertex, half-edge and face handles distinct types:
    //
    //   using VertexHandle = Core::StrongHandle<struct VertexTag>;
    //   using FaceHandle   = Core::StrongHandle<struct FaceTag>;
    //
    // Handles format as "index@generation" ("invalid" for the default).
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;
        constexpr StrongHandle(uint32_t index, uint32_t generation) : Index(index), Generation(generation) {}

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            // splitmix64 over the packed (generation, index) pair.
            uint64_t x = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;
            x += 0x9e3779b97f4a7c15ull;
            x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
            x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
            return static_cast<std::size_t>(x ^ (x >> 31));
        }
    };

    template <typename Tag>
    struct formatter<Core::StrongHandle<Tag>> : formatter<std::string_view>
    {
        auto format(const Core::StrongHandle<Tag>& h, format_context& ctx) const
        {
            if (!h.IsValid())
                return formatter<std::string_view>::format("invalid", ctx);
            return std::format_to(ctx.out(), "{}@{}", h.Index, h.Generation);
        }
    };
}
