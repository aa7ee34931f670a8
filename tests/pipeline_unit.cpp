// End-to-end runs of split_tracks with in-process fakes for download and encoding.
#include <atomic>
#include <string>
#include <vector>

#include "test_utils.hpp"
#include "tracksplit.hpp"

using namespace tracksplit;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check("pipeline_unit", cond, msg);
}

const char *kUrl = "https://example.com/watch?v=abc";

Config config_for(const std::filesystem::path &dir) {
    Config c;
    c.output_dir = dir;
    c.jobs = 2;
    return c;
}

bool test_end_to_end() {
    test_utils::TempDir dir("pipeline-ok");
    // 300 s at 100 Hz.
    test_utils::FakeSource source(test_utils::make_pcm(100, 2, 30000));
    test_utils::FakeEncoder enc;
    const auto out_dir = dir.path() / "output";
    auto run = split_tracks(kUrl, "0:00:00 - A\n0:01:30 - B\n0:03:00 - C\n", config_for(out_dir),
                            source, enc);
    bool ok = check(run.status.ok, "run succeeds: " + run.status.message);
    ok &= check(run.exit_code == 0, "exit code 0");
    ok &= check(source.calls == 1, "source fetched exactly once");
    ok &= check(source.last_url == kUrl, "url handed to the source");
    ok &= check(run.entries.size() == 3, "entries returned");
    ok &= check(run.report && run.report->succeeded() == 3, "three tracks saved");
    ok &= check(std::filesystem::exists(out_dir / "01 - A.mp3"), "01 - A.mp3 written");
    ok &= check(std::filesystem::exists(out_dir / "02 - B.mp3"), "02 - B.mp3 written");
    ok &= check(std::filesystem::exists(out_dir / "03 - C.mp3"), "03 - C.mp3 written");
    ok &= check(test_utils::count_files(out_dir) == 3, "no stray files");
    if (run.report && run.report->results.size() == 3) {
        const auto &c = run.report->results[2].segment;
        ok &= check(c.start == std::chrono::seconds(180) && c.end == std::chrono::seconds(300),
                    "last track runs to the end");
    }
    return ok;
}

bool test_parse_error_skips_download() {
    test_utils::TempDir dir("pipeline-parse");
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 100));
    test_utils::FakeEncoder enc;
    auto run = split_tracks(kUrl, "0:00 - A\nbroken line\n", config_for(dir.path() / "out"), source,
                            enc);
    bool ok = check(!run.status.ok && run.status.kind == ErrorKind::Parse, "parse error reported");
    ok &= check(run.exit_code == 1, "validation exit code");
    ok &= check(source.calls == 0, "nothing downloaded for a bad tracklist");
    ok &= check(!run.report, "no report without a plan");

    auto order = split_tracks(kUrl, "0:10 - A\n0:05 - B\n", config_for(dir.path() / "out"), source,
                              enc);
    ok &= check(order.status.kind == ErrorKind::Order && order.exit_code == 1,
                "order error exits 1");
    ok &= check(source.calls == 0, "nothing downloaded for an unordered tracklist");
    return ok;
}

bool test_range_error() {
    test_utils::TempDir dir("pipeline-range");
    // 5 s source.
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 500));
    test_utils::FakeEncoder enc;
    const auto out_dir = dir.path() / "out";
    auto run = split_tracks(kUrl, "0:00 - A\n0:10 - B\n", config_for(out_dir), source, enc);
    bool ok = check(!run.status.ok && run.status.kind == ErrorKind::Range, "range error reported");
    ok &= check(run.exit_code == 1, "range error exits 1");
    ok &= check(source.calls == 1, "range is checked against the fetched source");
    ok &= check(enc.calls().empty(), "nothing encoded");
    ok &= check(!std::filesystem::exists(out_dir), "output directory not created");

    auto only = split_tracks(kUrl, "0:00:10 - Only\n", config_for(out_dir), source, enc);
    ok &= check(only.status.kind == ErrorKind::Range && only.exit_code == 1,
                "single entry past the end is a range error");
    ok &= check(test_utils::count_files(out_dir) == 0, "no files written");
    return ok;
}

bool test_download_error() {
    test_utils::TempDir dir("pipeline-download");
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 500));
    source.fail_with = "video unavailable";
    test_utils::FakeEncoder enc;
    auto run = split_tracks(kUrl, "0:00 - A\n", config_for(dir.path()), source, enc);
    bool ok = check(run.status.kind == ErrorKind::Download, "download error reported");
    ok &= check(run.exit_code == 2, "download exit code");
    ok &= check(run.status.message == "video unavailable", "source message kept");
    ok &= check(enc.calls().empty(), "nothing encoded");
    return ok;
}

bool test_partial_and_total_failure() {
    test_utils::TempDir dir("pipeline-partial");
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 3000));
    test_utils::FakeEncoder enc;
    enc.fail_if = [](const std::filesystem::path &p) {
        return p.filename().string().rfind("02 - ", 0) == 0;
    };
    auto run = split_tracks(kUrl, "0:00 - A\n0:10 - B\n0:20 - C\n", config_for(dir.path() / "a"),
                            source, enc);
    bool ok = check(run.exit_code == 3, "partial failure exits 3");
    ok &= check(run.report && run.report->failed() == 1, "one failure in the report");
    ok &= check(run.status.kind == ErrorKind::Encode, "status reports the export failure");

    test_utils::FakeEncoder broken;
    broken.fail_if = [](const std::filesystem::path &) { return true; };
    auto none = split_tracks(kUrl, "0:00 - A\n0:10 - B\n", config_for(dir.path() / "b"), source,
                             broken);
    ok &= check(none.exit_code == 4, "total failure exits 4");
    ok &= check(none.report.has_value(), "report kept even when every export fails");
    return ok;
}

bool test_sanitized_names() {
    test_utils::TempDir dir("pipeline-names");
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 3000));
    test_utils::FakeEncoder enc;
    const auto out_dir = dir.path() / "out";
    auto run = split_tracks(kUrl, "0:00 - A/B: Part One\n0:10 | ...\n", config_for(out_dir), source,
                            enc);
    bool ok = check(run.exit_code == 0, "run succeeds");
    ok &= check(std::filesystem::exists(out_dir / "01 - A B Part One.mp3"),
                "illegal characters replaced in the file name");
    ok &= check(std::filesystem::exists(out_dir / "02 - Track 2.mp3"), "empty label fallback");
    return ok;
}

bool test_long_unicode_labels() {
    test_utils::TempDir dir("pipeline-unicode");
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 3000));
    test_utils::FakeEncoder enc;
    const auto out_dir = dir.path() / "out";
    std::string cjk, emoji;
    for (int i = 0; i < 100; ++i) {
        cjk += "\xE6\x9D\xB1";
        emoji += "\xF0\x9F\x98\x80";
    }
    auto run = split_tracks(kUrl, "0:00 - " + cjk + "\n0:10 - " + emoji + "\n", config_for(out_dir),
                            source, enc);
    bool ok = check(run.exit_code == 0, "100-character unicode labels export");
    ok &= check(run.report && run.report->succeeded() == 2, "both tracks saved");
    ok &= check(test_utils::count_files(out_dir) == 2, "two files on disk");
    if (run.report && run.report->results.size() == 2) {
        for (const auto &r : run.report->results) {
            ok &= check(std::filesystem::path(r.path).filename().string().size() <= 255,
                        "file name within NAME_MAX");
        }
    }
    return ok;
}

bool test_interrupt_before_download() {
    test_utils::TempDir dir("pipeline-abort");
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 3000));
    test_utils::FakeEncoder enc;
    std::atomic<bool> abort{true};
    auto run = split_tracks(kUrl, "0:00 - A\n", config_for(dir.path()), source, enc, &abort);
    bool ok = check(!run.status.ok, "interrupted run fails");
    ok &= check(source.calls == 0, "no download after an interrupt");
    return ok;
}

bool test_tracklist_file() {
    test_utils::TempDir dir("pipeline-file");
    test_utils::FakeSource source(test_utils::make_pcm(100, 1, 3000));
    test_utils::FakeEncoder enc;
    const auto list = dir.path() / "list.txt";
    const std::string body = "# set\n0:00 - One\n0:15 - Two\n";
    bool ok = check(write_file(list, std::vector<uint8_t>(body.begin(), body.end())).ok,
                    "tracklist written");
    auto run = split_tracks_from_file(kUrl, list.string(), config_for(dir.path() / "out"), source,
                                      enc);
    ok &= check(run.exit_code == 0 && run.report && run.report->succeeded() == 2,
                "tracklist file drives the run");
    auto missing = split_tracks_from_file(kUrl, (dir.path() / "nope.txt").string(),
                                          config_for(dir.path() / "out"), source, enc);
    ok &= check(missing.exit_code == 1 && source.calls == 1, "missing tracklist exits 1");
    ok &= check(!version_string().empty(), "version string available");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_end_to_end();
    ok &= test_parse_error_skips_download();
    ok &= test_range_error();
    ok &= test_download_error();
    ok &= test_partial_and_total_failure();
    ok &= test_sanitized_names();
    ok &= test_long_unicode_labels();
    ok &= test_interrupt_before_download();
    ok &= test_tracklist_file();
    return ok ? 0 : 1;
}
