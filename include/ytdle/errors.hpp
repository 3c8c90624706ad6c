#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace ytdle {

// Failure taxonomy for one fetch attempt. The first four are recoverable and
// handled by the retry policy; the rest end the job.
enum class ErrorCode {
    None,
    TransientNetworkError,
    FormatUnavailable,
    MergeCodecMissing,
    StalledTransfer,
    InvalidInput,
    AccessDenied,
    DiskWriteError,
    RetryCeilingExceeded,
    InternalFault
};

struct ErrorInfo {
    ErrorCode code{ErrorCode::None};
    bool recoverable{false};
    std::string userMessage;
    std::string detail;
};

// Result of a control-plane or submission call. Never thrown.
enum class ControlResult {
    Ok,
    NotFound,
    InvalidTransition,
    EngineClosed,
    DuplicateId
};

inline bool isRecoverable(ErrorCode c) {
    switch (c) {
        case ErrorCode::TransientNetworkError:
        case ErrorCode::FormatUnavailable:
        case ErrorCode::MergeCodecMissing:
        case ErrorCode::StalledTransfer:
            return true;
        default:
            return false;
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::TransientNetworkError: return "TransientNetworkError";
        case ErrorCode::FormatUnavailable: return "FormatUnavailable";
        case ErrorCode::MergeCodecMissing: return "MergeCodecMissing";
        case ErrorCode::StalledTransfer: return "StalledTransfer";
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::AccessDenied: return "AccessDenied";
        case ErrorCode::DiskWriteError: return "DiskWriteError";
        case ErrorCode::RetryCeilingExceeded: return "RetryCeilingExceeded";
        case ErrorCode::InternalFault: return "InternalFault";
        default: return "Unknown";
    }
}

inline ErrorCode errorCodeFromLabel(const std::string& label) {
    static const ErrorCode kAll[] = {
        ErrorCode::TransientNetworkError, ErrorCode::FormatUnavailable, ErrorCode::MergeCodecMissing,
        ErrorCode::StalledTransfer, ErrorCode::InvalidInput, ErrorCode::AccessDenied,
        ErrorCode::DiskWriteError, ErrorCode::RetryCeilingExceeded, ErrorCode::InternalFault};
    for (ErrorCode c : kAll) {
        if (label == errorCodeLabel(c)) return c;
    }
    return ErrorCode::None;
}

inline const char* controlResultLabel(ControlResult r) {
    switch (r) {
        case ControlResult::Ok: return "Ok";
        case ControlResult::NotFound: return "NotFound";
        case ControlResult::InvalidTransition: return "InvalidTransition";
        case ControlResult::EngineClosed: return "EngineClosed";
        case ControlResult::DuplicateId: return "DuplicateId";
        default: return "Unknown";
    }
}

inline std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

// Pull the status out of "HTTP Error 403: Forbidden" style messages.
inline int parseHttpStatusFromMessage(const std::string& msg) {
    const std::string l = toLowerCopy(msg);
    auto pos = l.find("http error ");
    if (pos == std::string::npos) pos = l.find("http ");
    if (pos == std::string::npos) return 0;
    pos = l.find_first_of("0123456789", pos);
    if (pos == std::string::npos) return 0;
    int code = 0;
    int digits = 0;
    while (pos < l.size() && std::isdigit(static_cast<unsigned char>(l[pos])) && digits < 3) {
        code = code * 10 + (l[pos] - '0');
        ++pos;
        ++digits;
    }
    return digits == 3 ? code : 0;
}

inline ErrorInfo makeError(ErrorCode code, const std::string& detail) {
    ErrorInfo out;
    out.code = code;
    out.recoverable = isRecoverable(code);
    out.detail = detail;
    switch (code) {
        case ErrorCode::TransientNetworkError: out.userMessage = "Network error while downloading."; break;
        case ErrorCode::FormatUnavailable: out.userMessage = "Requested format is not available."; break;
        case ErrorCode::MergeCodecMissing: out.userMessage = "Media toolchain could not merge or convert the download."; break;
        case ErrorCode::StalledTransfer: out.userMessage = "Transfer stalled."; break;
        case ErrorCode::InvalidInput: out.userMessage = "Invalid or unsupported URL."; break;
        case ErrorCode::AccessDenied: out.userMessage = "Access denied by the source."; break;
        case ErrorCode::DiskWriteError: out.userMessage = "Failed to write to storage."; break;
        case ErrorCode::RetryCeilingExceeded: out.userMessage = "Download failed after all attempts."; break;
        case ErrorCode::InternalFault: out.userMessage = "Internal engine error."; break;
        default: break;
    }
    return out;
}

// Classify the error text reported by the fetch tool (last "ERROR:" line or
// exit summary). Order matters: storage, rate-limit, toolchain and access
// problems are checked before the broader URL/format/network keywords.
inline ErrorInfo classifyError(const std::string& detail) {
    const std::string l = toLowerCopy(detail);
    const int http = parseHttpStatusFromMessage(detail);
    auto has = [&](const char* needle) { return l.find(needle) != std::string::npos; };

    if (has("no space left") || has("disk full") || has("errno 28") || has("read-only file system") ||
        has("permission denied") || has("unable to write") || has("unable to open for writing") ||
        has("unable to rename")) {
        return makeError(ErrorCode::DiskWriteError, detail);
    }
    if (http == 429 || has("too many requests") || has("rate limit")) {
        return makeError(ErrorCode::TransientNetworkError, detail);
    }
    if (has("ffmpeg") || has("ffprobe") || has("merging") || has("postprocessing") || has("codec") ||
        has("conversion failed")) {
        return makeError(ErrorCode::MergeCodecMissing, detail);
    }
    if (http == 401 || http == 403 || has("sign in") || has("login required") || has("log in") ||
        has("private video") || has("members-only") || has("geo") || has("not available in your country") ||
        has("authentication") || has("forbidden")) {
        return makeError(ErrorCode::AccessDenied, detail);
    }
    if (http == 404 || has("unsupported url") || has("is not a valid url") || has("invalid url") ||
        has("no such video") || has("video unavailable") || has("not found") || has("does not exist")) {
        return makeError(ErrorCode::InvalidInput, detail);
    }
    if (http >= 500 && http < 600) {
        return makeError(ErrorCode::TransientNetworkError, detail);
    }
    if (has("requested format") || has("format is not available") || has("format not available") ||
        has("no video formats") || has("no formats found")) {
        return makeError(ErrorCode::FormatUnavailable, detail);
    }
    if (has("stalled") || has("no output for")) {
        return makeError(ErrorCode::StalledTransfer, detail);
    }
    if (has("timed out") || has("timeout") || has("connection") ||
        has("network") || has("name resolution") || has("resolve") || has("incomplete read") ||
        has("reset by peer") || has("unable to download")) {
        return makeError(ErrorCode::TransientNetworkError, detail);
    }
    // Unknown non-zero exits are treated as transient so the policy gets a chance.
    return makeError(ErrorCode::TransientNetworkError, detail);
}

} // namespace ytdle
