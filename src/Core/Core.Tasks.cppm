module;

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

export module Core:Tasks;
import :Logging;

export namespace Core::Tasks
{
    // Type-erased, move-only callable stored inline. ParallelFor chunks
    // capture a pointer to the body plus their range, which fits easily;
    // anything larger fails at compile time instead of allocating.
    class LocalTask
    {
        static constexpr std::size_t STORAGE_SIZE = 64;

        struct Concept
        {
            virtual ~Concept() = default;
            virtual void Execute() = 0;
            virtual Concept* RelocateTo(void* dest) noexcept = 0;
        };

        template <typename T>
        struct Model final : Concept
        {
            T Payload;

            explicit Model(T&& p) : Payload(std::move(p)) {}
            explicit Model(const T& p) : Payload(p) {}

            void Execute() override { Payload(); }

            Concept* RelocateTo(void* dest) noexcept override
            {
                return std::construct_at(static_cast<Model*>(dest), std::move(Payload));
            }
        };

        alignas(std::max_align_t) std::byte m_Storage[STORAGE_SIZE];
        Concept* m_Callable = nullptr; // lives in m_Storage

        void Reset() noexcept;
        void TakeFrom(LocalTask& other) noexcept;

    public:
        LocalTask() = default;

        template <typename F>
            requires (!std::is_same_v<std::decay_t<F>, LocalTask> && std::is_invocable_v<std::decay_t<F>&>)
        LocalTask(F&& f)
        {
            using Type = std::decay_t<F>;
            static_assert(sizeof(Model<Type>) <= STORAGE_SIZE, "task captures exceed inline storage");
            static_assert(std::is_nothrow_move_constructible_v<Type>, "task payload must be nothrow movable");

            m_Callable = std::construct_at(reinterpret_cast<Model<Type>*>(m_Storage), std::forward<F>(f));
        }

        ~LocalTask() { Reset(); }

        LocalTask(LocalTask&& other) noexcept { TakeFrom(other); }
        LocalTask& operator=(LocalTask&& other) noexcept;

        LocalTask(const LocalTask&) = delete;
        LocalTask& operator=(const LocalTask&) = delete;

        void operator()();

        [[nodiscard]] bool Valid() const { return m_Callable != nullptr; }
    };

    // -------------------------------------------------------------------------
    // Scheduler - process-wide worker pool
    // -------------------------------------------------------------------------
    // When the pool has not been initialized, Dispatch runs the task inline on
    // the calling thread and WaitForAll returns immediately. Kernel code can
    // therefore always go through the scheduler; callers that want parallel
    // tessellation or knot refresh call Initialize once at startup.
    class Scheduler
    {
    public:
        static void Initialize(unsigned threadCount = 0);
        static void Shutdown();

        [[nodiscard]] static bool IsInitialized();
        [[nodiscard]] static unsigned WorkerCount();

        template <typename F>
        static void Dispatch(F&& task)
        {
            DispatchInternal(LocalTask(std::forward<F>(task)));
        }

        static void WaitForAll();

    private:
        static void DispatchInternal(LocalTask&& task);
        static void WorkerEntry(unsigned threadIndex);
    };

    // Split [begin, end) into chunks of at most `grain` items and run
    // fn(chunkBegin, chunkEnd) for each through the Scheduler. Blocks until
    // every chunk has finished.
    template <typename F>
    void ParallelFor(std::size_t begin, std::size_t end, std::size_t grain, F&& fn)
    {
        if (begin >= end)
            return;
        if (grain == 0)
            grain = 1;

        if (!Scheduler::IsInitialized() || end - begin <= grain)
        {
            for (std::size_t chunk = begin; chunk < end; chunk += grain)
                fn(chunk, std::min(end, chunk + grain));
            return;
        }

        auto* body = &fn;
        for (std::size_t chunk = begin; chunk < end; chunk += grain)
        {
            const std::size_t chunkEnd = std::min(end, chunk + grain);
            Scheduler::Dispatch([body, chunk, chunkEnd]() { (*body)(chunk, chunkEnd); });
        }
        Scheduler::WaitForAll();
    }
}
