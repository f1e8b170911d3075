#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <unordered_map>

#include "os/Os.hpp"

namespace Simulations
{

// Runnable processes ordered by (vruntime, pid). All operations but iteration are O(log n).
class [[nodiscard]] RunQueue final
{
  public:
    using ProcessPtr = std::shared_ptr<Os::Process>;

    struct [[nodiscard]] Key final
    {
        Os::VirtualRuntime vruntime;
        std::size_t        pid;

        auto operator<=>(const Key&) const = default;
    };

    // Returns false when a process with the same pid is already queued.
    [[nodiscard]] auto insert(const ProcessPtr& process) -> bool;

    // Returns nullptr when the queue is empty.
    [[nodiscard]] auto pop_min() -> ProcessPtr;
    [[nodiscard]] auto peek_min() const -> std::shared_ptr<const Os::Process>;

    [[nodiscard]] auto rekey(const std::size_t pid, const Os::VirtualRuntime vruntime) -> bool;
    [[nodiscard]] auto remove(const std::size_t pid) -> ProcessPtr;

    [[nodiscard]] auto contains(const std::size_t pid) const -> bool { return keys.contains(pid); }
    [[nodiscard]] auto is_empty() const -> bool { return queue.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return queue.size(); }
    [[nodiscard]] auto total_weight() const -> std::uint64_t { return load; }
    [[nodiscard]] auto min_vruntime() const -> std::optional<Os::VirtualRuntime>;

    [[nodiscard]] auto processes() const { return queue | std::views::values; }

    void clear();

  private:
    std::map<Key, ProcessPtr>            queue;
    std::unordered_map<std::size_t, Key> keys;
    std::uint64_t                        load = 0;
};

} // namespace Simulations
