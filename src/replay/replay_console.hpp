#pragma once

#include "replay/replay_cursor.hpp"
#include <functional>
#include <iosfwd>
#include <string_view>

namespace draftlink::replay {

/// Line-oriented operator console driving the replay cursor
///
/// Commands: next, prev, jump <n>, send <n>, reset, inspect, current, help,
/// quit, exit. Moves broadcast the new step; reset only inspects.
class ReplayConsole {
public:
    using Broadcast = std::function<void(const Step&)>;

    ReplayConsole(ReplayCursor& cursor, Broadcast broadcast, std::ostream& out);

    /// Run one command line
    /// @return false when the operator asked to quit
    bool execute(std::string_view line);

    /// Prompt and execute lines until EOF or quit
    void run(std::istream& in);

    static void print_help(std::ostream& out);

private:
    void move(Result<const Step*, std::string> moved);
    void jump(std::string_view argument);
    void inspect();

    ReplayCursor& cursor_;
    Broadcast broadcast_;
    std::ostream& out_;
};

}  // namespace draftlink::replay
