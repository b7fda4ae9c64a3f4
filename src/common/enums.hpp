#pragma once

#include <optional>

namespace taskheader {

// Canonical workflow-state categories. Linear teams define any number of
// named states, but each one maps onto exactly one of these.
enum class StateCategory {
    Backlog,
    Unstarted,
    Started,
    Completed,
    Canceled
};

// Completed and canceled issues are both rendered as checked boxes.
inline bool isClosedCategory(const std::optional<StateCategory> &category)
{
    return category.has_value()
        && (*category == StateCategory::Completed
            || *category == StateCategory::Canceled);
}

} // namespace taskheader
