#include "replay/replay_cursor.hpp"
#include <stdexcept>

namespace draftlink::replay {

ReplayCursor::ReplayCursor(std::vector<Step> steps)
    : steps_(std::move(steps))
{
    if (steps_.empty()) {
        throw std::invalid_argument("replay needs at least one step");
    }
}

std::size_t ReplayCursor::index() const {
    std::lock_guard lock(mutex_);
    return index_;
}

const Step& ReplayCursor::current() const {
    std::lock_guard lock(mutex_);
    return steps_[index_];
}

Result<const Step*, std::string> ReplayCursor::set_index(std::int64_t index) {
    if (index < 0 || static_cast<std::size_t>(index) >= steps_.size()) {
        return Result<const Step*, std::string>::Err(
            "index out of range (0-" + std::to_string(steps_.size() - 1) + ")");
    }

    std::lock_guard lock(mutex_);
    index_ = static_cast<std::size_t>(index);
    return Result<const Step*, std::string>::Ok(&steps_[index_]);
}

Result<const Step*, std::string> ReplayCursor::advance(std::int64_t delta) {
    std::int64_t target = 0;
    {
        std::lock_guard lock(mutex_);
        target = static_cast<std::int64_t>(index_) + delta;
    }
    return set_index(target);
}

const Step& ReplayCursor::reset() {
    std::lock_guard lock(mutex_);
    index_ = 0;
    return steps_[0];
}

}  // namespace draftlink::replay
