#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem: Render-phase system; drives the debug overlay.
//
// No Register(), no lifecycle hooks.
// Toggle visibility with F3; clicking a section title collapses it. Records
// the drawn rectangle in DebugPanel::bounds so camera input is not taken
// while the pointer is over the overlay.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
