#pragma once
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel: extensible provider registry for the debug overlay.
//
// Stored as a World resource. Call watch(section, label, fn) at startup to
// register a provider; DebugSystem calls every provider of each expanded
// section per render frame and draws the results as a sectioned text
// overlay. Clicking a section title collapses it.
//
// Zero engine dependencies, safe to include in any target.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
        bool             collapsed = false;
    };

    struct Rect {
        float x = 0, y = 0, width = 0, height = 0;
    };

    bool visible = false;

    // Screen area drawn last frame; DebugSystem keeps it current.
    Rect bounds;

    // True when the overlay is showing and covers the screen point.
    bool contains(float px, float py) const {
        return visible &&
               px >= bounds.x && px <= bounds.x + bounds.width &&
               py >= bounds.y && py <= bounds.y + bounds.height;
    }

    // Register a named provider under a section heading.
    // Creates the section if it does not already exist.
    void watch(const std::string& section,
               const std::string& label,
               Provider fn) {
        for (auto& s : sections_) {
            if (s.title == section) {
                s.rows.push_back({label, std::move(fn)});
                return;
            }
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    // Flips a section between collapsed and expanded. False if no such section.
    bool toggle(const std::string& section) {
        for (auto& s : sections_) {
            if (s.title == section) {
                s.collapsed = !s.collapsed;
                return true;
            }
        }
        return false;
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    std::vector<Section> sections_;
};
