#pragma once

#include <iosfwd>
#include <string>

#include <QMetaType>

/*! State of the recording pipeline. The message is only set for Error. */
struct SessionState {
    enum class Kind {
        Idle,
        Recording,
        Processing,
        Error
    };

    Kind kind{Kind::Idle};
    std::string message;

    static SessionState idle() {
        return {};
    }

    static SessionState recording() {
        return {Kind::Recording, {}};
    }

    static SessionState processing() {
        return {Kind::Processing, {}};
    }

    static SessionState error(std::string message) {
        return {Kind::Error, std::move(message)};
    }

    bool is(Kind k) const noexcept {
        return kind == k;
    }

    bool operator==(const SessionState&) const = default;
};

std::ostream& operator<<(std::ostream& os, SessionState::Kind kind);
std::ostream& operator<<(std::ostream& os, const SessionState& state);

Q_DECLARE_METATYPE(SessionState)
