#include <array>
#include <ostream>
#include <string_view>

#include "SessionState.h"

using namespace std;

std::ostream& operator<<(std::ostream& os, SessionState::Kind kind)
{
    static constexpr auto names = to_array<string_view>({
        "Idle",
        "Recording",
        "Processing",
        "Error"
    });

    return os << names.at(static_cast<size_t>(kind));
}

std::ostream& operator<<(std::ostream& os, const SessionState& state)
{
    os << state.kind;
    if (state.is(SessionState::Kind::Error)) {
        os << '(' << state.message << ')';
    }
    return os;
}
