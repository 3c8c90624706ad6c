#include <catch2/catch.hpp>
#include "ytdle/fetch_output.hpp"

#include <algorithm>

namespace {

bool hasArg(const std::vector<std::string>& args, const std::string& a) {
    return std::find(args.begin(), args.end(), a) != args.end();
}

std::string argAfter(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) return "";
    return *(it + 1);
}

} // namespace

TEST_CASE("template progress line yields exact byte counts") {
    auto l = ytdle::parseFetchLine("[ytdle-progress] 1048576 4194304 NA 524288.5 6");
    REQUIRE(l.kind == ytdle::FetchLine::Kind::Progress);
    REQUIRE(l.bytesDownloaded == 1048576u);
    REQUIRE(l.bytesTotal == 4194304u);
    REQUIRE(l.speedBytesPerSec.has_value());
    REQUIRE(*l.speedBytesPerSec == Approx(524288.5));
    REQUIRE(l.etaSeconds == 6);
}

TEST_CASE("template progress falls back to the size estimate and tolerates NA") {
    auto l = ytdle::parseFetchLine("[ytdle-progress] 2048 NA 8192 NA NA");
    REQUIRE(l.kind == ytdle::FetchLine::Kind::Progress);
    REQUIRE(l.bytesDownloaded == 2048u);
    REQUIRE(l.bytesTotal == 8192u);
    REQUIRE_FALSE(l.speedBytesPerSec.has_value());
    REQUIRE_FALSE(l.etaSeconds.has_value());
}

TEST_CASE("classic download progress line is parsed") {
    auto l = ytdle::parseFetchLine("[download]  45.3% of 150.23MiB at 10.50MiB/s ETA 00:09");
    REQUIRE(l.kind == ytdle::FetchLine::Kind::Progress);
    REQUIRE(l.bytesTotal.has_value());
    REQUIRE(*l.bytesTotal == static_cast<uint64_t>(150.23 * 1024 * 1024));
    REQUIRE(l.bytesDownloaded.has_value());
    REQUIRE(*l.bytesDownloaded < *l.bytesTotal);
    REQUIRE(*l.speedBytesPerSec == Approx(10.5 * 1024 * 1024));
    REQUIRE(l.etaSeconds == 9);
}

TEST_CASE("destination lines are recognized and final outputs flagged") {
    auto dl = ytdle::parseFetchLine("[download] Destination: /tmp/out/Song.webm");
    REQUIRE(dl.kind == ytdle::FetchLine::Kind::Destination);
    REQUIRE(dl.text == "/tmp/out/Song.webm");
    REQUIRE_FALSE(dl.finalOutput);

    auto audio = ytdle::parseFetchLine("[ExtractAudio] Destination: /tmp/out/Song.mp3");
    REQUIRE(audio.kind == ytdle::FetchLine::Kind::Destination);
    REQUIRE(audio.text == "/tmp/out/Song.mp3");
    REQUIRE(audio.finalOutput);

    auto merge = ytdle::parseFetchLine("[Merger] Merging formats into \"/tmp/out/Clip.mp4\"");
    REQUIRE(merge.kind == ytdle::FetchLine::Kind::Destination);
    REQUIRE(merge.text == "/tmp/out/Clip.mp4");
    REQUIRE(merge.finalOutput);

    auto already = ytdle::parseFetchLine("[download] /tmp/out/Clip.mp4 has already been downloaded");
    REQUIRE(already.kind == ytdle::FetchLine::Kind::Destination);
    REQUIRE(already.text == "/tmp/out/Clip.mp4");
    REQUIRE(already.finalOutput);
}

TEST_CASE("error and warning lines carry their message") {
    auto e = ytdle::parseFetchLine("ERROR: [generic] Unsupported URL: https://x");
    REQUIRE(e.kind == ytdle::FetchLine::Kind::Error);
    REQUIRE(e.text == "[generic] Unsupported URL: https://x");
    auto w = ytdle::parseFetchLine("WARNING: falling back");
    REQUIRE(w.kind == ytdle::FetchLine::Kind::Warning);
    REQUIRE(ytdle::parseFetchLine("[youtube] abc: Downloading webpage").kind == ytdle::FetchLine::Kind::Other);
    REQUIRE(ytdle::parseFetchLine("").kind == ytdle::FetchLine::Kind::Other);
}

TEST_CASE("size and clock helpers") {
    REQUIRE(*ytdle::parseSizeWithUnit("1.5KiB") == Approx(1536.0));
    REQUIRE(*ytdle::parseSizeWithUnit("2MB") == Approx(2000000.0));
    REQUIRE_FALSE(ytdle::parseSizeWithUnit("12furlongs").has_value());
    REQUIRE(ytdle::parseClock("01:02:03") == 3723);
    REQUIRE(ytdle::parseClock("00:09") == 9);
    REQUIRE_FALSE(ytdle::parseClock("Unknown").has_value());
}

TEST_CASE("format selectors follow the quality and relaxed flag") {
    using ytdle::MediaFormat;
    REQUIRE(ytdle::buildFormatSelector(MediaFormat::Audio, "192k", false) == "bestaudio/best");
    REQUIRE(ytdle::buildFormatSelector(MediaFormat::Video, "best", false) == "bv*+ba/best");
    REQUIRE(ytdle::buildFormatSelector(MediaFormat::Video, "best", true) == "best[ext=mp4]/best");
    REQUIRE(ytdle::buildFormatSelector(MediaFormat::Video, "1080p", false) ==
            "bv*[height<=1080]+ba/b[height<=1080]/best[height<=1080]/best");
    REQUIRE(ytdle::buildFormatSelector(MediaFormat::Video, "720", true) ==
            "best[height<=720][ext=mp4]/best[height<=720]/best");
}

TEST_CASE("splitShellArgs honours quotes and rejects unbalanced input") {
    std::vector<std::string> out;
    std::string err;
    REQUIRE(ytdle::splitShellArgs("-vcodec libx264 -metadata 'title=My Song' \"a\\\"b\"", out, err));
    REQUIRE(out == std::vector<std::string>{"-vcodec", "libx264", "-metadata", "title=My Song", "a\"b"});
    REQUIRE_FALSE(ytdle::splitShellArgs("-metadata 'broken", out, err));
    REQUIRE_FALSE(err.empty());
    REQUIRE(ytdle::quoteShellArg("title=My Song") == "'title=My Song'");
    REQUIRE(ytdle::quoteShellArg("-vcodec") == "-vcodec");
}

TEST_CASE("audio arguments extract mp3 at the requested bitrate") {
    ytdle::FetchArgsInput in;
    in.request.url = "https://example.com/watch?v=1";
    in.request.format = ytdle::MediaFormat::Audio;
    in.request.outputDir = "/music/";
    in.request.cookieFile = "/tmp/cookies.txt";
    in.request.cookiesFromBrowser = "firefox";
    in.request.checkCertificate = false;
    in.quality = "128k";
    std::vector<std::string> args;
    std::string err;
    REQUIRE(ytdle::buildFetchArgs(in, args, err));

    REQUIRE(args.front() == "yt-dlp");
    REQUIRE(hasArg(args, "--newline"));
    REQUIRE(hasArg(args, "--continue"));
    REQUIRE(argAfter(args, "-o") == "/music/%(title).150s.%(ext)s");
    REQUIRE(argAfter(args, "-f") == "bestaudio/best");
    REQUIRE(argAfter(args, "--audio-quality") == "128K");
    REQUIRE(argAfter(args, "--audio-format") == "mp3");
    REQUIRE(hasArg(args, "--embed-thumbnail"));
    REQUIRE(hasArg(args, "--no-playlist"));
    REQUIRE(hasArg(args, "--no-check-certificates"));
    REQUIRE(argAfter(args, "--cookies-from-browser") == "firefox");
    REQUIRE_FALSE(hasArg(args, "--cookies"));
    REQUIRE_FALSE(hasArg(args, "--downloader"));
    REQUIRE(args[args.size() - 2] == "--");
    REQUIRE(args.back() == "https://example.com/watch?v=1");
}

TEST_CASE("video arguments merge to mp4 and route through the accelerator") {
    ytdle::FetchArgsInput in;
    in.fetchTool = "/opt/yt-dlp";
    in.request.url = "https://example.com/v";
    in.request.format = ytdle::MediaFormat::Video;
    in.request.playlist = true;
    in.request.restrictFilenames = true;
    in.request.acceleratorConnections = 8;
    in.request.ffmpegArgs = "-threads 2";
    in.request.ffmpegAddArgs = "-metadata 'comment=x y'";
    in.quality = "720p";
    in.relaxed = true;
    in.acceleratorPath = "/usr/bin/aria2c";
    in.ffmpegLocation = "/usr/bin/ffmpeg";
    std::vector<std::string> args;
    std::string err;
    REQUIRE(ytdle::buildFetchArgs(in, args, err));

    REQUIRE(args.front() == "/opt/yt-dlp");
    REQUIRE(argAfter(args, "-f") == "best[height<=720][ext=mp4]/best[height<=720]/best");
    REQUIRE(argAfter(args, "--merge-output-format") == "mp4");
    REQUIRE(hasArg(args, "--yes-playlist"));
    REQUIRE(hasArg(args, "--restrict-filenames"));
    REQUIRE(argAfter(args, "--ffmpeg-location") == "/usr/bin/ffmpeg");
    REQUIRE(argAfter(args, "--downloader") == "/usr/bin/aria2c");
    REQUIRE(argAfter(args, "--downloader-args") ==
            "aria2c:-x 8 -s 8 -k 1M --file-allocation=none --optimize-concurrent-downloads=true");
    REQUIRE(argAfter(args, "--postprocessor-args") == "ffmpeg:-threads 2 -metadata 'comment=x y'");
}

TEST_CASE("override post-processor args replace the base ones") {
    ytdle::FetchArgsInput in;
    in.request.url = "https://example.com/v";
    in.request.format = ytdle::MediaFormat::Video;
    in.request.ffmpegArgs = "-threads 2";
    in.request.ffmpegAddArgs = "-an";
    in.request.ffmpegOverrideArgs = "-c copy";
    in.quality = "best";
    std::vector<std::string> args;
    std::string err;
    REQUIRE(ytdle::buildFetchArgs(in, args, err));
    REQUIRE(argAfter(args, "--postprocessor-args") == "ffmpeg:-c copy");

    in.request.ffmpegOverrideArgs = "'unterminated";
    REQUIRE_FALSE(ytdle::buildFetchArgs(in, args, err));
}
