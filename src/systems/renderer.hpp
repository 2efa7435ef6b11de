#pragma once
#include <ecs/ecs.hpp>

// Draws the scene from MainCamera: meshes (honouring MeshRenderer::visible),
// gravity zone outlines, the player's orientation gizmo and the help text.
class RenderSystem {
public:
    static void Update(ecs::World& world);
};
