// src/placement/Ledger.cpp
#include "placement/Ledger.hpp"

#include "roomscatter/Providers.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace roomscatter::placement {

std::uint64_t Ledger::append(PlacedItem item)
{
    item.id = nextId_++;
    items_.push_back(std::move(item));
    return items_.back().id;
}

std::size_t Ledger::drain(IInstantiationService& svc)
{
    std::vector<PlacedItem> released;
    released.swap(items_);

    for (const PlacedItem& it : released) {
        try {
            svc.destroy(it.instance);
        } catch (const std::exception& e) {
            spdlog::warn("Ledger: destroy failed for item #{} ({}): {}", it.id, it.item, e.what());
        }
    }
    return released.size();
}

std::size_t Ledger::countFor(const std::string& categoryId) const noexcept
{
    return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(),
        [&](const PlacedItem& it) { return it.categoryId == categoryId; }));
}

} // namespace roomscatter::placement
