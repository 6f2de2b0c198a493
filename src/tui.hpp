#ifndef TUI_HPP
#define TUI_HPP

// import lvb
#include "lvb/snapshot.hpp"

namespace tui {
/// Runs the browser until the user quits.
void init(const lvb::StorageSnapshot& snapshot) noexcept;
}  // namespace tui

#endif  // TUI_HPP
