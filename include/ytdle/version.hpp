#pragma once

namespace ytdle {

inline const char* appVersion() {
#ifdef YTDLE_APP_VERSION
    return YTDLE_APP_VERSION;
#else
    return "0.0.0";
#endif
}

} // namespace ytdle
