#include "vault/memory_vault.hpp"

namespace vault
{

std::optional<std::string> MemoryVault::get(std::string_view key)
{
    std::lock_guard lock(mtx);
    auto it = entries.find(key);
    if (it == entries.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void MemoryVault::set(std::string_view key, std::string_view value)
{
    std::lock_guard lock(mtx);
    entries.insert_or_assign(std::string(key), std::string(value));
}

void MemoryVault::remove(std::string_view key)
{
    std::lock_guard lock(mtx);
    if (auto it = entries.find(key); it != entries.end())
    {
        entries.erase(it);
    }
}

void MemoryVault::clear()
{
    std::lock_guard lock(mtx);
    entries.clear();
}

size_t MemoryVault::size() const
{
    std::lock_guard lock(mtx);
    return entries.size();
}

} // namespace vault
