#include "gravity_field.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace gravity {

bool GravityZone::contains(JPH::Vec3Arg point) const {
    JPH::Vec3 local = point - center;
    if (shape == ZoneShape::Sphere) return local.LengthSq() <= radius * radius;

    local = rotation.Conjugated() * local;
    JPH::Vec3 a = local.Abs();
    return a.GetX() <= half_extents.GetX() && a.GetY() <= half_extents.GetY() &&
           a.GetZ() <= half_extents.GetZ();
}

JPH::Vec3 GravityZone::up_at(JPH::Vec3Arg point) const {
    if (mode == ZoneMode::Point) {
        return sanitize_up(point - center, -direction);
    }
    return sanitize_up(-direction);
}

GravityField::GravityField(GravityFieldConfig config) : config_(config) {}

void GravityField::add_listener(GravityTransitionListener* listener) {
    if (!listener) return;
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void GravityField::remove_listener(GravityTransitionListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

const GravityZone* GravityField::find_zone(JPH::Vec3Arg position) const {
    const GravityZone* best = nullptr;
    for (const auto& zone : zones_) {
        if (!zone.contains(position)) continue;
        if (!best || zone.priority > best->priority) best = &zone;
    }
    return best;
}

void GravityField::update(JPH::Vec3Arg position) {
    const GravityZone* zone = find_zone(position);

    if (!zone) {
        if (active_zone_ != kNoZone) {
            std::cout << "[Gravity] Left zone " << active_zone_ << ", entering zero-g" << std::endl;
        }
        active_zone_ = kNoZone;
        strength_    = 0.0f;
        frame_.unconstrained = true;
        initialized_ = true;
        return;
    }

    JPH::Vec3 up       = zone->up_at(position);
    bool      switched = zone->id != active_zone_;
    active_zone_ = zone->id;
    strength_    = zone->strength > 0.0f ? zone->strength : config_.default_strength;

    // The first resolved zone is the starting gravity, not a transition.
    if (!initialized_) {
        initialized_ = true;
        publish(up, false, false);
        return;
    }

    bool fire = switched && frame_.up.Dot(up) < config_.transition_dot;
    if (fire) {
        std::cout << "[Gravity] Transition to zone " << zone->id << " (dot "
                  << frame_.up.Dot(up) << ")" << std::endl;
    }
    publish(up, false, fire);
}

void GravityField::publish(JPH::Vec3Arg up, bool unconstrained, bool fire) {
    if (!fire) {
        frame_ = OrientationFrame::make(up, unconstrained);
        return;
    }

    transitioning_ = true;
    for (auto* l : listeners_) l->on_gravity_transition_started();

    frame_ = OrientationFrame::make(up, unconstrained);
    ++transition_count_;

    for (auto* l : listeners_) l->on_gravity_transition_completed();
    transitioning_ = false;
}

void GravityField::freeze_up(JPH::Vec3Arg up) {
    frame_.up = sanitize_up(up, frame_.up);
}

JPH::Vec3 GravityField::gravity() const {
    if (frame_.unconstrained) return JPH::Vec3::sZero();
    return -frame_.up * strength_;
}

JPH::Vec3 GravityField::gravity_at(JPH::Vec3Arg point) const {
    const GravityZone* zone = find_zone(point);
    if (!zone) return JPH::Vec3::sZero();
    float strength = zone->strength > 0.0f ? zone->strength : config_.default_strength;
    return -zone->up_at(point) * strength;
}

} // namespace gravity
