#include "RunQueue.hpp"

#include <cassert>
#include <print>
#include <utility>

namespace Simulations
{

auto RunQueue::insert(const ProcessPtr& process) -> bool
{
    assert(process != nullptr && "cannot queue a null process");

    if (keys.contains(process->pid)) {
        std::println(stderr, "[ERROR] (runqueue) process with pid {} is already queued", process->pid);
        return false;
    }

    const auto key = Key { .vruntime = process->vruntime, .pid = process->pid };
    queue.emplace(key, process);
    keys.emplace(process->pid, key);
    load += process->weight;

    return true;
}

auto RunQueue::pop_min() -> ProcessPtr
{
    if (queue.empty()) { return nullptr; }

    auto node    = queue.extract(queue.begin());
    auto process = std::move(node.mapped());
    keys.erase(process->pid);
    load -= process->weight;

    return process;
}

auto RunQueue::peek_min() const -> std::shared_ptr<const Os::Process>
{
    if (queue.empty()) { return nullptr; }

    return queue.begin()->second;
}

auto RunQueue::rekey(const std::size_t pid, const Os::VirtualRuntime vruntime) -> bool
{
    const auto key_it = keys.find(pid);
    if (key_it == keys.end()) {
        std::println(stderr, "[ERROR] (runqueue) cannot rekey pid {}: not queued", pid);
        return false;
    }

    auto node               = queue.extract(key_it->second);
    node.mapped()->vruntime = vruntime;
    node.key()              = Key { .vruntime = vruntime, .pid = pid };
    key_it->second          = node.key();
    queue.insert(std::move(node));

    return true;
}

auto RunQueue::remove(const std::size_t pid) -> ProcessPtr
{
    const auto key_it = keys.find(pid);
    if (key_it == keys.end()) { return nullptr; }

    auto node    = queue.extract(key_it->second);
    auto process = std::move(node.mapped());
    keys.erase(key_it);
    load -= process->weight;

    return process;
}

auto RunQueue::min_vruntime() const -> std::optional<Os::VirtualRuntime>
{
    if (queue.empty()) { return std::nullopt; }

    return queue.begin()->first.vruntime;
}

void RunQueue::clear()
{
    queue.clear();
    keys.clear();
    load = 0;
}

} // namespace Simulations
