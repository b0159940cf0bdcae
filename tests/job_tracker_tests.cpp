// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scribe/core/job_tracker.hpp>
#include "test_support.hpp"

using namespace scribe::core;
using namespace scribe::test;
using namespace std::chrono_literals;

TEST_CASE("JobTracker returns on the first terminal status", "[tracker]") {
    FakeTransport transport;

    SECTION("Succeeded") {
        transport.poll_results = {report(JobStatus::queued), report(JobStatus::running),
                                  report(JobStatus::succeeded, "s3://bucket/transcript.txt")};

        JobTracker tracker(transport);
        std::vector<JobStatus> seen;
        tracker.callback([&](const TranscriptionJob& job) { seen.push_back(job.status); });

        auto job = tracker.await("job-1", 5ms, 5s);
        REQUIRE(job.has_value());
        CHECK(job->id == "job-1");
        CHECK(job->status == JobStatus::succeeded);
        CHECK(job->terminal());
        CHECK(job->result_ref == std::optional<std::string>("s3://bucket/transcript.txt"));
        CHECK(job->polls == 3);
        CHECK(seen == std::vector<JobStatus>{JobStatus::queued, JobStatus::running, JobStatus::succeeded});
        CHECK(transport.poll_times().size() == 3);
    }

    SECTION("Failed is a remote failure") {
        auto failed = report(JobStatus::failed);
        failed.error = "unsupported codec";
        transport.poll_results = {report(JobStatus::running), failed};

        JobTracker tracker(transport);
        auto job = tracker.await("job-2", 5ms, 5s);
        REQUIRE_FALSE(job.has_value());
        CHECK(job.error().kind == TrackErrorKind::remote_failure);
        CHECK(job.error().code == TransferErrc::job_failed);
        CHECK(job.error().detail == "unsupported codec");
        REQUIRE(job.error().last.has_value());
        CHECK(job.error().last->status == JobStatus::failed);
    }

    SECTION("Cancelled is reported distinctly") {
        transport.poll_results = {report(JobStatus::cancelled)};

        JobTracker tracker(transport);
        auto job = tracker.await("job-3", 5ms, 5s);
        REQUIRE_FALSE(job.has_value());
        CHECK(job.error().kind == TrackErrorKind::remote_cancelled);
        CHECK(job.error().code == TransferErrc::job_cancelled);
        CHECK(transport.poll_times().size() == 1);
    }
}

TEST_CASE("JobTracker polls at the configured interval", "[tracker]") {
    FakeTransport transport;
    transport.poll_results = {report(JobStatus::running), report(JobStatus::running),
                              report(JobStatus::succeeded)};

    JobTracker tracker(transport);
    auto job = tracker.await("job-1", 30ms, 5s);
    REQUIRE(job.has_value());

    auto times = transport.poll_times();
    REQUIRE(times.size() == 3);
    for (std::size_t i = 1; i < times.size(); ++i) {
        CHECK(times[i] - times[i - 1] >= 30ms);
    }
}

TEST_CASE("JobTracker backs off on transient errors", "[tracker]") {
    FakeTransport transport;
    transport.poll_results = {std::unexpected(transient_error()), std::unexpected(transient_error()),
                              std::unexpected(transient_error()), report(JobStatus::succeeded)};

    JobTracker tracker(transport);
    tracker.max_interval(80ms);
    auto job = tracker.await("job-1", 10ms, 10s);
    REQUIRE(job.has_value());

    auto times = transport.poll_times();
    REQUIRE(times.size() == 4);

    SECTION("Gaps never shrink while errors continue") {
        auto gap1 = times[1] - times[0];
        auto gap2 = times[2] - times[1];
        auto gap3 = times[3] - times[2];
        CHECK(gap1 >= 20ms);
        CHECK(gap2 >= 40ms);
        CHECK(gap3 >= 80ms);
    }

    SECTION("Failed polls are counted") {
        CHECK(job->polls == 4);
    }
}

TEST_CASE("JobTracker caps the wait between failed polls", "[tracker]") {
    FakeTransport transport;
    for (int i = 0; i < 6; ++i) {
        transport.poll_results.push_back(std::unexpected(transient_error()));
    }
    transport.poll_results.push_back(report(JobStatus::succeeded));

    JobTracker tracker(transport);
    tracker.max_interval(40ms);
    auto job = tracker.await("job-1", 10ms, 10s);
    REQUIRE(job.has_value());

    auto times = transport.poll_times();
    REQUIRE(times.size() == 7);
    // Uncapped doubling would reach 640 ms by the last gap
    for (std::size_t i = 3; i < times.size(); ++i) {
        CHECK(times[i] - times[i - 1] >= 40ms);
        CHECK(times[i] - times[i - 1] < 250ms);
    }
}

TEST_CASE("JobTracker honours Retry-After on rate limiting", "[tracker]") {
    FakeTransport transport;
    transport.poll_results = {std::unexpected(rate_limited_error(60ms)), report(JobStatus::succeeded)};

    JobTracker tracker(transport);
    auto job = tracker.await("job-1", 5ms, 5s);
    REQUIRE(job.has_value());

    auto times = transport.poll_times();
    REQUIRE(times.size() == 2);
    CHECK(times[1] - times[0] >= 60ms);
}

TEST_CASE("JobTracker surfaces permanent transport errors", "[tracker]") {
    FakeTransport transport;
    transport.poll_results = {report(JobStatus::running), std::unexpected(permanent_error(404))};

    JobTracker tracker(transport);
    auto job = tracker.await("gone", 5ms, 5s);
    REQUIRE_FALSE(job.has_value());
    CHECK(job.error().kind == TrackErrorKind::transport);
    CHECK(job.error().code == TransferErrc::not_found);
    CHECK(job.error().http_status == 404);
    CHECK(job.error().error_class == ErrorClass::permanent);
    CHECK(job.error().job_id == "gone");
    CHECK(transport.poll_times().size() == 2);
}

TEST_CASE("JobTracker gives up after max_wait", "[tracker]") {
    FakeTransport transport;
    transport.default_poll_status = JobStatus::running;

    JobTracker tracker(transport);
    const auto start = std::chrono::steady_clock::now();
    auto job = tracker.await("slow", 20ms, 100ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(job.has_value());
    CHECK(job.error().kind == TrackErrorKind::timeout);
    CHECK(job.error().code == TransferErrc::poll_timeout);
    CHECK(elapsed >= 100ms);
    CHECK(elapsed < 2s);
    REQUIRE(job.error().last.has_value());
    CHECK(job.error().last->status == JobStatus::running);
    CHECK(transport.poll_times().size() >= 2);
}

TEST_CASE("JobTracker enforces max_wait during a slow poll", "[tracker]") {
    FakeTransport transport;
    transport.poll_latency = 1500ms;

    JobTracker tracker(transport);
    const auto start = std::chrono::steady_clock::now();
    auto job = tracker.await("slow", 20ms, 100ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(job.has_value());
    CHECK(job.error().kind == TrackErrorKind::timeout);
    CHECK(job.error().code == TransferErrc::poll_timeout);
    CHECK(elapsed >= 100ms);
    CHECK(elapsed < 1s);
    CHECK(transport.poll_times().size() == 1);
}

TEST_CASE("JobTracker accepts a max_wait beyond the clock range", "[tracker]") {
    FakeTransport transport;
    transport.poll_results = {report(JobStatus::running), report(JobStatus::succeeded)};

    JobTracker tracker(transport);
    auto job = tracker.await("job-1", 5ms,
                             std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(10'000'000'000)));
    REQUIRE(job.has_value());
    CHECK(job->polls == 2);

    transport.default_poll_status = JobStatus::succeeded;
    auto forever = tracker.await("job-1", 5ms, std::chrono::milliseconds::max());
    CHECK(forever.has_value());
}

TEST_CASE("JobTracker stops on request", "[tracker][cancel]") {
    FakeTransport transport;
    std::stop_source stop;

    SECTION("Stop during the wait") {
        JobTracker tracker(transport);
        std::jthread stopper([&] {
            std::this_thread::sleep_for(50ms);
            stop.request_stop();
        });

        const auto start = std::chrono::steady_clock::now();
        auto job = tracker.await("job-1", 10s, 60s, stop.get_token());
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(job.has_value());
        CHECK(job.error().kind == TrackErrorKind::client_cancelled);
        CHECK(job.error().code == TransferErrc::cancelled);
        CHECK(elapsed < 5s);
        CHECK(transport.poll_times().size() == 1);
    }

    SECTION("Stop during a slow poll") {
        transport.poll_latency = 10s;
        JobTracker tracker(transport);
        std::jthread stopper([&] {
            std::this_thread::sleep_for(50ms);
            stop.request_stop();
        });

        const auto start = std::chrono::steady_clock::now();
        auto job = tracker.await("job-1", 5ms, 60s, stop.get_token());
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(job.has_value());
        CHECK(job.error().kind == TrackErrorKind::client_cancelled);
        CHECK(elapsed < 5s);
    }

    SECTION("Stop before the first poll") {
        stop.request_stop();
        JobTracker tracker(transport);
        auto job = tracker.await("job-1", 5ms, 5s, stop.get_token());
        REQUIRE_FALSE(job.has_value());
        CHECK(job.error().kind == TrackErrorKind::client_cancelled);
        CHECK(transport.poll_times().empty());
    }
}

TEST_CASE("TrackError::message", "[tracker]") {
    TrackError error;
    error.kind = TrackErrorKind::timeout;
    error.code = make_error_code(TransferErrc::poll_timeout);
    error.job_id = "abc";
    error.elapsed = 600s;
    auto text = error.message();
    CHECK_THAT(text, Catch::Matchers::ContainsSubstring("abc"));
    CHECK_THAT(text, Catch::Matchers::ContainsSubstring("600s"));
}
