#pragma once

#include "core/status.hpp"
#include "replay/capture_file.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace draftlink::replay {

/// The replay's only mutable state: which step is current
/// Thread-safe; steps never change after construction.
class ReplayCursor {
public:
    /// @param steps At least one step
    explicit ReplayCursor(std::vector<Step> steps);

    [[nodiscard]] std::size_t size() const noexcept { return steps_.size(); }

    [[nodiscard]] const Step& step(std::size_t index) const { return steps_.at(index); }

    [[nodiscard]] std::size_t index() const;

    [[nodiscard]] const Step& current() const;

    /// Move to index
    /// @return The new current step, or "index out of range (0-N)" with the cursor unchanged
    [[nodiscard]] Result<const Step*, std::string> set_index(std::int64_t index);

    /// Move by delta steps (next = +1, prev = -1)
    [[nodiscard]] Result<const Step*, std::string> advance(std::int64_t delta);

    /// Back to step 0
    const Step& reset();

private:
    std::vector<Step> steps_;
    mutable std::mutex mutex_;
    std::size_t index_{0};
};

}  // namespace draftlink::replay
