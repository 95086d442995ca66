module;

#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <utility>
#include <vector>

export module Core:SlotArena;
import :Error;

export namespace Core
{
    // Concept to ensure the Handle type carries an index and a generation
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    } && std::constructible_from<H, uint32_t, uint32_t>;

    // -------------------------------------------------------------------------
    // SlotArena - dense, copyable, generation-checked storage
    // -------------------------------------------------------------------------
    // Slots are appended and never recycled, so a slot index stays stable for
    // the lifetime of the arena and can be used as a raw connectivity index.
    // Retire() does not free a slot; it bumps the slot's generation so that
    // public handles issued against the old contents resolve to InvalidIndex.
    //
    // Unlike the shared resource pools used for GPU objects this arena has no
    // locking: it is owned by one mesh, and a mesh is copied (not shared) when
    // another thread needs to read it.
    // -------------------------------------------------------------------------
    template <typename T, GenerationalHandle Handle>
    class SlotArena
    {
    public:
        SlotArena() = default;

        Handle Add(T value)
        {
            const auto index = static_cast<uint32_t>(m_Data.size());
            m_Data.push_back(std::move(value));
            m_Generations.push_back(1u);
            return Handle{index, 1u};
        }

        void Reserve(std::size_t count)
        {
            m_Data.reserve(count);
            m_Generations.reserve(count);
        }

        void Clear()
        {
            m_Data.clear();
            m_Generations.clear();
        }

        // Invalidate outstanding handles to slot `index`. Contents are kept.
        void Retire(uint32_t index)
        {
            assert(index < m_Data.size());
            ++m_Generations[index];
        }

        [[nodiscard]] bool Contains(Handle handle) const noexcept
        {
            return handle.Index < m_Data.size() && m_Generations[handle.Index] == handle.Generation;
        }

        [[nodiscard]] Core::Expected<const T*> Get(Handle handle) const
        {
            if (!Contains(handle))
                return std::unexpected(Core::ErrorCode::InvalidIndex);
            return &m_Data[handle.Index];
        }

        [[nodiscard]] Core::Expected<T*> Get(Handle handle)
        {
            if (!Contains(handle))
                return std::unexpected(Core::ErrorCode::InvalidIndex);
            return &m_Data[handle.Index];
        }

        // Current handle for a raw slot index.
        [[nodiscard]] Handle HandleOf(uint32_t index) const
        {
            assert(index < m_Data.size());
            return Handle{index, m_Generations[index]};
        }

        // Hot-path access by raw index. Caller guarantees index < Size().
        [[nodiscard]] T& operator[](uint32_t index)
        {
            assert(index < m_Data.size());
            return m_Data[index];
        }

        [[nodiscard]] const T& operator[](uint32_t index) const
        {
            assert(index < m_Data.size());
            return m_Data[index];
        }

        [[nodiscard]] std::size_t Size() const noexcept { return m_Data.size(); }
        [[nodiscard]] bool Empty() const noexcept { return m_Data.empty(); }

        [[nodiscard]] auto begin() const noexcept { return m_Data.begin(); }
        [[nodiscard]] auto end() const noexcept { return m_Data.end(); }

        bool operator==(const SlotArena&) const = default;

    private:
        std::vector<T> m_Data;
        std::vector<uint32_t> m_Generations;
    };
}
