#include <algorithm>
#include <cctype>
#include <format>
#include <ostream>

#include "Transcription.h"

using namespace std;

namespace {

constexpr string_view specific_prefix = "specific:";
constexpr string_view pinned_prefix = "pinned:";

// ISO 639-1 style codes as whisper knows them ("en", "de", "yue", "haw")
bool isLanguageCode(string_view code) {
    if (code.size() < 2 || code.size() > 3) {
        return false;
    }
    return ranges::all_of(code, [](char ch) {
        return islower(static_cast<unsigned char>(ch)) != 0;
    });
}

} // anon ns

optional<TranscriptionLanguage> TranscriptionLanguage::parse(string_view text)
{
    if (text.empty() || text == "auto") {
        return autoDetect();
    }

    Mode mode = Mode::Specific;
    if (text.starts_with(specific_prefix)) {
        text.remove_prefix(specific_prefix.size());
    } else if (text.starts_with(pinned_prefix)) {
        text.remove_prefix(pinned_prefix.size());
        mode = Mode::Pinned;
    }

    if (!isLanguageCode(text)) {
        return {};
    }

    return TranscriptionLanguage{mode, string{text}};
}

TranscriptionLanguage TranscriptionLanguage::transition(const TranscriptionLanguage &current,
                                                        const TranscriptionLanguage &requested)
{
    if (current.isPinned() && requested.mode() == Mode::Specific) {
        return current;
    }
    return requested;
}

string TranscriptionLanguage::toString() const
{
    switch(mode_) {
    case Mode::AutoDetect:
        return "auto";
    case Mode::Specific:
        return format("{}{}", specific_prefix, code_);
    case Mode::Pinned:
        return format("{}{}", pinned_prefix, code_);
    }
    return "auto";
}

std::ostream& operator<<(std::ostream& os, const TranscriptionLanguage& language)
{
    return os << language.toString();
}
