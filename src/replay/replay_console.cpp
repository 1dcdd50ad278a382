#include "replay/replay_console.hpp"
#include <charconv>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace draftlink::replay {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

}  // namespace

ReplayConsole::ReplayConsole(ReplayCursor& cursor, Broadcast broadcast, std::ostream& out)
    : cursor_(cursor)
    , broadcast_(std::move(broadcast))
    , out_(out)
{}

void ReplayConsole::print_help(std::ostream& out) {
    out << "Commands:\n"
        << "  next            advance to the next step and broadcast\n"
        << "  prev            go back one step and broadcast\n"
        << "  jump <n>        jump to step n (0-based) and broadcast\n"
        << "  send <n>        alias for jump\n"
        << "  reset           reset index to 0 (no broadcast)\n"
        << "  inspect/current show current step summary\n"
        << "  quit            exit\n";
}

bool ReplayConsole::execute(std::string_view raw_line) {
    auto line = trim(raw_line);

    if (line.empty() || line == "help") {
        print_help(out_);
    } else if (line == "next") {
        move(cursor_.advance(1));
    } else if (line == "prev") {
        move(cursor_.advance(-1));
    } else if (starts_with(line, "jump ")) {
        jump(trim(line.substr(5)));
    } else if (starts_with(line, "send ")) {
        jump(trim(line.substr(5)));
    } else if (line == "reset") {
        cursor_.reset();
        inspect();
    } else if (line == "inspect" || line == "current") {
        inspect();
    } else if (line == "quit" || line == "exit") {
        return false;
    } else {
        out_ << "Unknown command, type 'help'\n";
    }

    out_.flush();
    return true;
}

void ReplayConsole::run(std::istream& in) {
    std::string line;
    for (;;) {
        out_ << "> " << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        if (!execute(line)) {
            break;
        }
    }
}

void ReplayConsole::move(Result<const Step*, std::string> moved) {
    if (moved.is_err()) {
        out_ << moved.error() << '\n';
        return;
    }

    const Step& step = *moved.value();
    if (broadcast_) {
        broadcast_(step);
    }
    out_ << "sent step " << step.index << " | " << step.summary << '\n';
}

void ReplayConsole::jump(std::string_view argument) {
    std::int64_t index = 0;
    auto [end, ec] = std::from_chars(argument.data(), argument.data() + argument.size(), index);
    if (ec != std::errc() || end != argument.data() + argument.size()) {
        out_ << "invalid index \"" << argument << "\"\n";
        return;
    }
    move(cursor_.set_index(index));
}

void ReplayConsole::inspect() {
    const Step& step = cursor_.current();
    out_ << "step " << step.index << " @ " << step_time_text(step) << " | " << step.summary << '\n';
}

}  // namespace draftlink::replay
