// Exporter behavior with a fake encoder: ordering, partial failure, interrupts, reporting.
#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "exporter.hpp"
#include "sanitizer.hpp"
#include "test_utils.hpp"

using namespace tracksplit;
using std::chrono::milliseconds;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check("exporter_unit", cond, msg);
}

// Contiguous segments over `bounds` (in ms), named like the planner does.
std::vector<Segment> make_segments(const std::vector<int> &bounds) {
    std::vector<Segment> out;
    TrackNamer namer(bounds.size() - 1);
    for (size_t i = 0; i + 1 < bounds.size(); ++i) {
        Segment s;
        s.index = i;
        s.start = milliseconds(bounds[i]);
        s.end = milliseconds(bounds[i + 1]);
        s.name = namer.name_for(i, "Song " + std::to_string(i + 1));
        s.source_line = static_cast<int>(i + 1);
        out.push_back(s);
    }
    return out;
}

Config config_for(const std::filesystem::path &dir, unsigned jobs = 1) {
    Config c;
    c.output_dir = dir;
    c.jobs = jobs;
    return c;
}

bool is_second_track(const std::filesystem::path &p) {
    return p.filename().string().rfind("02 - ", 0) == 0;
}

bool test_partial_failure() {
    test_utils::TempDir dir("export-partial");
    const auto pcm = test_utils::make_pcm(100, 1, 300);
    test_utils::FakeEncoder enc;
    enc.fail_if = is_second_track;
    const Config cfg = config_for(dir.path() / "out");
    Exporter exporter(cfg, enc);
    auto report = exporter.export_segments(pcm, make_segments({0, 1000, 2000, 3000}));

    bool ok = check(report.results.size() == 3, "one result per segment");
    if (report.results.size() != 3) {
        return false;
    }
    ok &= check(report.results[0].outcome == ExportOutcome::Success, "track 1 succeeds");
    ok &= check(report.results[1].outcome == ExportOutcome::Failure, "track 2 fails");
    ok &= check(report.results[2].outcome == ExportOutcome::Success,
                "track 3 still exported after a failure");
    ok &= check(report.results[1].reason.find("simulated") != std::string::npos,
                "failure reason kept");
    ok &= check(exit_code_for(report) == 3, "partial failure exit code");
    ok &= check(test_utils::count_files(cfg.output_dir) == 2, "two files written");
    ok &= check(std::filesystem::exists(cfg.output_dir / "01 - Song 1.mp3"), "first file named");
    ok &= check(!std::filesystem::exists(cfg.output_dir / "02 - Song 2.mp3.part"),
                "no partial file for the failed track");
    return ok;
}

bool test_all_fail() {
    test_utils::TempDir dir("export-fail");
    const auto pcm = test_utils::make_pcm(100, 1, 300);
    test_utils::FakeEncoder enc;
    enc.fail_if = [](const std::filesystem::path &) { return true; };
    const Config cfg = config_for(dir.path());
    auto report = Exporter(cfg, enc).export_segments(pcm, make_segments({0, 1000, 3000}));
    bool ok = check(report.failed() == 2 && report.succeeded() == 0, "both tracks fail");
    ok &= check(exit_code_for(report) == 4, "all-failed exit code");
    ok &= check(test_utils::count_files(dir.path()) == 0, "nothing written");
    return ok;
}

bool test_parallel_order() {
    test_utils::TempDir dir("export-parallel");
    const auto pcm = test_utils::make_pcm(100, 2, 1200);
    test_utils::FakeEncoder enc;
    // Earlier tracks take longer so completion order differs from index order.
    enc.hook = [](const std::filesystem::path &p) {
        const int idx = std::stoi(p.filename().string().substr(0, 2));
        std::this_thread::sleep_for(milliseconds(2 * (13 - idx)));
    };
    std::vector<int> bounds;
    for (int i = 0; i <= 12; ++i) {
        bounds.push_back(i * 1000);
    }
    const auto segments = make_segments(bounds);
    const Config cfg = config_for(dir.path(), 4);
    Exporter exporter(cfg, enc);
    bool ok = check(exporter.worker_count(segments.size()) == 4, "four workers requested");
    auto report = exporter.export_segments(pcm, segments);
    ok &= check(report.results.size() == 12 && report.succeeded() == 12, "all twelve exported");
    for (size_t i = 0; i < report.results.size(); ++i) {
        ok &= check(report.results[i].segment.index == i, "result " + std::to_string(i) + " in order");
        ok &= check(report.results[i].path ==
                        (dir.path() / (segments[i].name + ".mp3")).string(),
                    "result " + std::to_string(i) + " path");
    }
    ok &= check(enc.calls().size() == 12, "each segment encoded exactly once");
    ok &= check(exit_code_for(report) == 0, "success exit code");
    ok &= check(Exporter(config_for(dir.path(), 8), enc).worker_count(3) == 3,
                "no more workers than segments");
    return ok;
}

bool test_abort_before_start() {
    test_utils::TempDir dir("export-abort");
    const auto pcm = test_utils::make_pcm(100, 1, 300);
    test_utils::FakeEncoder enc;
    std::atomic<bool> abort{true};
    Config cfg = config_for(dir.path(), 2);
    cfg.keep_original = true;
    auto report = Exporter(cfg, enc, &abort).export_segments(pcm, make_segments({0, 1000, 3000}));
    bool ok = check(report.cancelled() == 2, "every track cancelled");
    ok &= check(enc.calls().empty(), "encoder never called");
    ok &= check(report.original && report.original->outcome == ExportOutcome::Cancelled,
                "original cancelled too");
    ok &= check(exit_code_for(report) == 4, "nothing exported means exit 4");
    return ok;
}

bool test_abort_mid_run() {
    test_utils::TempDir dir("export-interrupt");
    const auto pcm = test_utils::make_pcm(100, 1, 300);
    test_utils::FakeEncoder enc;
    std::atomic<bool> abort{false};
    // Raised while track 1 is running: it completes, the rest are never started.
    enc.hook = [&abort](const std::filesystem::path &) { abort.store(true); };
    auto report = Exporter(config_for(dir.path(), 1), enc, &abort)
                      .export_segments(pcm, make_segments({0, 1000, 2000, 3000}));
    bool ok = check(report.results.size() == 3, "three results");
    if (report.results.size() != 3) {
        return false;
    }
    ok &= check(report.results[0].outcome == ExportOutcome::Success, "in-flight track completes");
    ok &= check(report.results[1].outcome == ExportOutcome::Cancelled &&
                    report.results[2].outcome == ExportOutcome::Cancelled,
                "remaining tracks cancelled");
    ok &= check(enc.calls().size() == 1, "only one encode started");
    ok &= check(exit_code_for(report) == 3, "interrupted run is a partial failure");
    ok &= check(test_utils::count_files(dir.path()) == 1, "only the finished file exists");
    return ok;
}

bool test_keep_original() {
    test_utils::TempDir dir("export-original");
    const auto pcm = test_utils::make_pcm(100, 1, 300);
    test_utils::FakeEncoder enc;
    Config cfg = config_for(dir.path());
    cfg.keep_original = true;
    cfg.quality_kbps = 192;
    auto report = Exporter(cfg, enc).export_segments(pcm, make_segments({0, 1000, 2500}));
    bool ok = check(report.original.has_value(), "original result present");
    ok &= check(report.original && report.original->succeeded(), "original exported");
    ok &= check(std::filesystem::exists(dir.path() / "original.mp3"), "original.mp3 written");
    const auto calls = enc.calls();
    ok &= check(calls.size() == 3, "two tracks plus original");
    if (calls.size() == 3) {
        ok &= check(calls[0].range.begin == 0 && calls[0].range.end == 100, "track 1 frames");
        ok &= check(calls[1].range.begin == 100 && calls[1].range.end == 250, "track 2 frames");
        ok &= check(calls[2].range.begin == 0 && calls[2].range.end == 300,
                    "original covers the whole source");
        ok &= check(calls[0].quality_kbps == 192, "quality passed through");
    }
    ok &= check(exit_code_for(report) == 0, "original does not change the exit code");
    return ok;
}

bool test_output_dir_failure() {
    test_utils::TempDir dir("export-blocked");
    const auto blocker = dir.path() / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    const auto pcm = test_utils::make_pcm(100, 1, 300);
    test_utils::FakeEncoder enc;
    auto report = Exporter(config_for(blocker / "out"), enc)
                      .export_segments(pcm, make_segments({0, 1000, 3000}));
    bool ok = check(report.failed() == 2, "every track fails when the directory is unusable");
    ok &= check(enc.calls().empty(), "encoder not called");
    ok &= check(!report.results.empty() &&
                    report.results[0].reason.find("cannot create directory") != std::string::npos,
                "reason names the directory problem");
    ok &= check(exit_code_for(report) == 4, "exit 4");
    return ok;
}

bool test_report_json_and_summary() {
    test_utils::TempDir dir("export-json");
    const auto pcm = test_utils::make_pcm(100, 1, 300);
    test_utils::FakeEncoder enc;
    enc.fail_if = is_second_track;
    auto report = Exporter(config_for(dir.path()), enc)
                      .export_segments(pcm, make_segments({0, 1000, 2000, 3000}));
    const auto j = report_to_json(report);
    bool ok = check(j["total"] == 3 && j["succeeded"] == 2 && j["failed"] == 1, "counts");
    ok &= check(j["exit_code"] == 3, "exit code in report");
    ok &= check(j["segments"].size() == 3, "segment entries");
    ok &= check(j["segments"][1]["index"] == 2 && j["segments"][1]["outcome"] == "failure",
                "failed segment entry");
    ok &= check(j["segments"][2]["start_ms"] == 2000 && j["segments"][2]["end_ms"] == 3000,
                "segment times in ms");
    ok &= check(j["segments"][0].contains("path") && !j["segments"][0].contains("reason"),
                "successful entry has a path");
    ok &= check(!j.contains("original"), "no original entry unless requested");

    std::ostringstream oss;
    print_summary(oss, report);
    ok &= check(oss.str().find("2/3 tracks saved, 1 failed") != std::string::npos,
                "summary line: " + oss.str());
    return ok;
}

bool test_worker_start_failure() {
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    const std::function<void()> work = [&]() {
        while (next.fetch_add(1) < 50) {
            std::this_thread::sleep_for(milliseconds(1));
            ++done;
        }
    };
    // The first thread starts, the second hits a resource limit.
    unsigned attempts = 0;
    exporter_detail::ThreadStarter flaky = [&attempts](const std::function<void()> &fn) {
        if (attempts++ >= 1) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread");
        }
        return std::thread(fn);
    };
    const unsigned started = exporter_detail::run_workers(4, work, flaky);
    bool ok = check(started == 1, "only one worker thread started");
    ok &= check(done.load() == 50, "calling thread picks up the remaining work");

    next = 0;
    done = 0;
    ok &= check(exporter_detail::run_workers(3, work) == 3, "default starter runs every worker");
    ok &= check(done.load() == 50, "all work done by the pool");
    return ok;
}

bool test_empty_batch() {
    test_utils::TempDir dir("export-empty");
    const auto pcm = test_utils::make_pcm(100, 1, 10);
    test_utils::FakeEncoder enc;
    auto report = Exporter(config_for(dir.path()), enc).export_segments(pcm, {});
    return check(report.results.empty() && exit_code_for(report) == 0,
                 "empty batch is trivially successful");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_partial_failure();
    ok &= test_all_fail();
    ok &= test_parallel_order();
    ok &= test_abort_before_start();
    ok &= test_abort_mid_run();
    ok &= test_keep_original();
    ok &= test_output_dir_failure();
    ok &= test_report_json_and_summary();
    ok &= test_worker_start_failure();
    ok &= test_empty_batch();
    return ok ? 0 : 1;
}
