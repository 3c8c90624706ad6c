#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "ytdle/errors.hpp"

TEST_CASE("classifyError maps access problems and HTTP status") {
    ytdle::ErrorInfo info = ytdle::classifyError("ERROR: unable to download video data: HTTP Error 403: Forbidden");
    REQUIRE(info.code == ytdle::ErrorCode::AccessDenied);
    REQUIRE_FALSE(info.recoverable);
    REQUIRE_FALSE(info.userMessage.empty());
    REQUIRE(ytdle::classifyError("Sign in to confirm your age").code == ytdle::ErrorCode::AccessDenied);
    REQUIRE(ytdle::classifyError("This video is not available in your country").code ==
            ytdle::ErrorCode::AccessDenied);
}

TEST_CASE("classifyError maps invalid input") {
    REQUIRE(ytdle::classifyError("[generic] Unsupported URL: https://example.com").code == ytdle::ErrorCode::InvalidInput);
    REQUIRE(ytdle::classifyError("HTTP Error 404: Not Found").code == ytdle::ErrorCode::InvalidInput);
    REQUIRE_FALSE(ytdle::classifyError("Video unavailable").recoverable);
}

TEST_CASE("classifyError keeps toolchain failures recoverable") {
    ytdle::ErrorInfo info = ytdle::classifyError("ffmpeg not found. Please install or provide the path");
    REQUIRE(info.code == ytdle::ErrorCode::MergeCodecMissing);
    REQUIRE(info.recoverable);
    REQUIRE(ytdle::classifyError("Postprocessing: Conversion failed!").code == ytdle::ErrorCode::MergeCodecMissing);
}

TEST_CASE("classifyError maps format and network problems") {
    REQUIRE(ytdle::classifyError("Requested format is not available. Use --list-formats").code ==
            ytdle::ErrorCode::FormatUnavailable);
    REQUIRE(ytdle::classifyError("HTTP Error 503: Service Unavailable").code == ytdle::ErrorCode::TransientNetworkError);
    REQUIRE(ytdle::classifyError("HTTP Error 429: Too Many Requests").code == ytdle::ErrorCode::TransientNetworkError);
    REQUIRE(ytdle::classifyError("<urlopen error [Errno -3] Temporary failure in name resolution>").code ==
            ytdle::ErrorCode::TransientNetworkError);
    REQUIRE(ytdle::classifyError("Read timed out").recoverable);
}

TEST_CASE("server errors mentioning information are not format problems") {
    ytdle::ErrorInfo info = ytdle::classifyError(
        "unable to download video data: HTTP Error 503: Service Unavailable. See the site status page for more information");
    REQUIRE(info.code == ytdle::ErrorCode::TransientNetworkError);
    REQUIRE(ytdle::classifyError("Server returned information about the upload").code ==
            ytdle::ErrorCode::TransientNetworkError);
    REQUIRE(ytdle::classifyError("[youtube] abc: No video formats found!").code == ytdle::ErrorCode::FormatUnavailable);
}

TEST_CASE("classifyError maps storage failures as fatal") {
    ytdle::ErrorInfo info = ytdle::classifyError("[Errno 28] No space left on device");
    REQUIRE(info.code == ytdle::ErrorCode::DiskWriteError);
    REQUIRE_FALSE(info.recoverable);
    REQUIRE(ytdle::classifyError("unable to open for writing: [Errno 13] Permission denied").code ==
            ytdle::ErrorCode::DiskWriteError);
}

TEST_CASE("unknown failures are treated as transient") {
    ytdle::ErrorInfo info = ytdle::classifyError("exited with code 1");
    REQUIRE(info.code == ytdle::ErrorCode::TransientNetworkError);
    REQUIRE(info.recoverable);
    REQUIRE(info.detail == "exited with code 1");
}

TEST_CASE("HTTP status extraction") {
    REQUIRE(ytdle::parseHttpStatusFromMessage("HTTP Error 502: Bad Gateway") == 502);
    REQUIRE(ytdle::parseHttpStatusFromMessage("http 401 unauthorized") == 401);
    REQUIRE(ytdle::parseHttpStatusFromMessage("no status here") == 0);
}

TEST_CASE("error code labels round-trip and flag recoverability") {
    REQUIRE(ytdle::errorCodeFromLabel("StalledTransfer") == ytdle::ErrorCode::StalledTransfer);
    REQUIRE(ytdle::errorCodeFromLabel("bogus") == ytdle::ErrorCode::None);
    REQUIRE(ytdle::isRecoverable(ytdle::ErrorCode::StalledTransfer));
    REQUIRE_FALSE(ytdle::isRecoverable(ytdle::ErrorCode::RetryCeilingExceeded));
    REQUIRE_FALSE(ytdle::isRecoverable(ytdle::ErrorCode::InternalFault));
    REQUIRE(std::string(ytdle::controlResultLabel(ytdle::ControlResult::DuplicateId)) == "DuplicateId");
}
