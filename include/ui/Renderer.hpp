#pragma once

#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace glance::ui {

constexpr int kOverlayWidth = 34;     // columns, borders included
constexpr int kOverlayRightMargin = 2;
constexpr int kOverlayTopMargin = 1;

struct OverlayStyle {
  bool truecolor{false};
};

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

// Panel rows for one Snapshot, borders included
std::vector<std::string> render_overlay(const glance::model::Snapshot& s, const OverlayStyle& style);

// Cursor-addressed frame placing `box` at the top-right of a `cols` wide
// terminal. Clears the screen first.
std::string compose_frame(const std::vector<std::string>& box, int cols);

} // namespace glance::ui
