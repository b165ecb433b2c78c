#include <format>

#include "RecordingSession.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const RecordingSession& s, bool json) {
    if (json) {
        return make_pair(true, format(R"("session":"{}", "model":"{}", "language":"{}")",
                                      s.shortId(), s.model_id, s.language.toString()));
    }

    return make_pair(false, format("Session{{id={}, model={}, language={}}}",
                                   s.shortId(), s.model_id, s.language.toString()));
}
} // logfault ns

std::string RecordingSession::shortId() const
{
    return id.toString(QUuid::WithoutBraces).left(8).toStdString();
}
