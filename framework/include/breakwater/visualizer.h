#ifndef BREAKWATER_VISUALIZER_H
#define BREAKWATER_VISUALIZER_H

#include <breakwater/breaker.h>
#include <string>

namespace breakwater {

struct RenderOptions {
    bool color = true;      // ANSI escape codes for the state badge
    size_t bar_width = 20;  // width of the span progress and bucket bars
};

/**
 * @brief Draws one text frame: state badge, error rate against threshold,
 * trial progress while half-open, and one row per bucket. The current bucket
 * is marked with '>' and carries a progress bar for the running span.
 *
 * Purely presentational; reads the breaker without applying transitions.
 */
std::string render(const Breaker& breaker, TimePoint now, const RenderOptions& options = {});

/**
 * @brief State badge alone, e.g. "[ OPEN ]".
 */
std::string render_state(StateKind state, bool color);

} // namespace breakwater

#endif // BREAKWATER_VISUALIZER_H
