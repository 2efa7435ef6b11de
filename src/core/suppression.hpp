#pragma once

namespace gravity {

// Reference-counted suppression flag. Each set_suppressed(true) must be paired
// with a set_suppressed(false) from the same caller; the owner is suppressed
// while any caller holds it.
class SuppressionCounter {
public:
    void set_suppressed(bool suppressed) {
        if (suppressed) {
            ++count_;
        } else if (count_ > 0) {
            --count_;
        }
    }

    bool is_suppressed() const { return count_ > 0; }
    int  count()         const { return count_; }
    void clear()               { count_ = 0; }

private:
    int count_ = 0;
};

} // namespace gravity
