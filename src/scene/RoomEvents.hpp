// src/scene/RoomEvents.hpp
#pragma once
// Events exchanged over entt::dispatcher between a room source and the populator.

namespace roomscatter::evt {

// A room has been discovered (or replaced); query IRegionProvider for bounds.
struct RegionReady {};

// Operator action: tear down every placed item and plan again.
struct ResetRequested {};

} // namespace roomscatter::evt
