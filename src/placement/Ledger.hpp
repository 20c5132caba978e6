// src/placement/Ledger.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "placement/PlacementTypes.hpp"

namespace roomscatter {
class IInstantiationService;
}

namespace roomscatter::placement {

// Authoritative record of committed items, in placement order.
class Ledger {
public:
    using const_iterator = std::vector<PlacedItem>::const_iterator;

    // Takes ownership of `item`; assigns and returns its id.
    std::uint64_t append(PlacedItem item);

    // Empties the ledger, then destroys every instance it held through `svc`.
    // The ledger is already empty when the first destroy() runs.
    // Returns the number of entries released.
    std::size_t drain(IInstantiationService& svc);

    // Forget all entries without touching instances.
    void clear() noexcept { items_.clear(); }

    [[nodiscard]] bool        empty() const noexcept { return items_.empty(); }
    [[nodiscard]] std::size_t size()  const noexcept { return items_.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
    [[nodiscard]] const_iterator end()   const noexcept { return items_.end(); }

    [[nodiscard]] const PlacedItem& operator[](std::size_t i) const { return items_[i]; }
    [[nodiscard]] const std::vector<PlacedItem>& items() const noexcept { return items_; }

    [[nodiscard]] std::size_t countFor(const std::string& categoryId) const noexcept;

private:
    std::vector<PlacedItem> items_;
    std::uint64_t           nextId_ = 1;
};

} // namespace roomscatter::placement
