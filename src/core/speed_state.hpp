#pragma once
#include "locomotion.hpp"
#include <memory>

namespace gravity {

// Published by whatever makes the character fast (boost, dash). The camera
// widens its field of view while is_boosted() holds.
class SpeedStateProvider {
public:
    virtual ~SpeedStateProvider() = default;
    virtual bool is_boosted() const = 0;
};

// Set explicitly by an ability.
class FlagSpeedState final : public SpeedStateProvider {
public:
    bool is_boosted() const override { return boosted_; }
    void set_boosted(bool boosted) { boosted_ = boosted; }

private:
    bool boosted_ = false;
};

// Boosted while the tracked resolver's horizontal speed exceeds a threshold.
// Not boosted once the resolver is gone.
class VelocityThresholdSpeedState final : public SpeedStateProvider {
public:
    explicit VelocityThresholdSpeedState(float threshold = 12.0f) : threshold_(threshold) {}

    bool is_boosted() const override {
        auto resolver = resolver_.lock();
        return resolver && resolver->horizontal_speed() > threshold_;
    }

    void track(const std::shared_ptr<const LocomotionResolver>& resolver) { resolver_ = resolver; }

    float threshold() const { return threshold_; }
    void  set_threshold(float threshold) { threshold_ = threshold; }

private:
    std::weak_ptr<const LocomotionResolver> resolver_;
    float threshold_;
};

} // namespace gravity
