#include "stats.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <sstream>

using namespace tollgate;

TEST(StatisticsTest, TracksTimingAndCacheRatio) {
    Statistics stats;
    stats.record_response(Seconds(0.2), 100);
    stats.record_response(Seconds(0.4), 300);
    stats.record_cache_hit();
    stats.record_cache_hit();

    RequestMetrics m = stats.snapshot();
    EXPECT_EQ(m.total_requests, 4u);
    EXPECT_EQ(m.network_requests, 2u);
    EXPECT_EQ(m.cached_responses, 2u);
    EXPECT_EQ(m.bytes_received, 400u);
    EXPECT_DOUBLE_EQ(m.avg_response_time_seconds, 0.3);
    EXPECT_DOUBLE_EQ(m.fastest_request_seconds, 0.2);
    EXPECT_DOUBLE_EQ(m.slowest_request_seconds, 0.4);
    EXPECT_DOUBLE_EQ(m.cache_hit_ratio, 0.5);
}

TEST(StatisticsTest, Percentiles) {
    Statistics stats;
    for (int i = 1; i <= 100; ++i) {
        stats.record_response(Seconds(i / 100.0), 0);
    }

    RequestMetrics m = stats.snapshot();
    EXPECT_NEAR(m.p50_seconds, 0.50, 0.011);
    EXPECT_NEAR(m.p90_seconds, 0.90, 0.011);
    EXPECT_NEAR(m.p99_seconds, 0.99, 0.011);
}

TEST(StatisticsTest, SampleBufferIsBounded) {
    Statistics stats;
    for (size_t i = 0; i < Statistics::MAX_TIMING_SAMPLES; ++i) {
        stats.record_response(Seconds(10.0), 0);
    }
    for (size_t i = 0; i < Statistics::MAX_TIMING_SAMPLES; ++i) {
        stats.record_response(Seconds(1.0), 0);
    }

    RequestMetrics m = stats.snapshot();
    // Old samples have aged out of the percentiles, not out of the totals
    EXPECT_DOUBLE_EQ(m.p99_seconds, 1.0);
    EXPECT_DOUBLE_EQ(m.slowest_request_seconds, 10.0);
    EXPECT_EQ(m.network_requests, 2 * Statistics::MAX_TIMING_SAMPLES);
}

TEST(StatisticsTest, SnapshotIsIdempotent) {
    Statistics stats;
    stats.record_response(Seconds(0.1), 10);
    stats.record_cache_hit();
    stats.record_deduplicated();
    stats.record_batched(3);
    stats.record_error("read timeout");

    nlohmann::json first = stats.snapshot();
    nlohmann::json second = stats.snapshot();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first["errors"]["read timeout"], 1);
    EXPECT_EQ(first["batched_requests"], 3);
}

TEST(StatisticsTest, ResetClearsEverything) {
    Statistics stats;
    stats.record_response(Seconds(0.1), 10);
    stats.record_error("parse");
    stats.reset();

    RequestMetrics m = stats.snapshot();
    EXPECT_EQ(m.total_requests, 0u);
    EXPECT_EQ(m.total_errors, 0u);
    EXPECT_TRUE(m.error_counts.empty());
    EXPECT_DOUBLE_EQ(m.fastest_request_seconds, 0.0);
    EXPECT_DOUBLE_EQ(m.p50_seconds, 0.0);
}

TEST(ReportPrinterTest, PlainOutputHasNoEscapes) {
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.title("report");
    printer.begin_section("Requests");
    printer.line("Total:", "12");
    printer.line("Cached:", "3", true);
    printer.table({"p50", "p90", "p99"}, {"1.0 ms", "2.0 ms", "3.0 ms"});
    printer.end_section();

    std::string text = out.str();
    EXPECT_EQ(text.find('\033'), std::string::npos);
    EXPECT_NE(text.find("╟─ Total:"), std::string::npos);
    EXPECT_NE(text.find("╙─ Cached:"), std::string::npos);
    EXPECT_NE(text.find("p90"), std::string::npos);
    EXPECT_NE(text.find("2.0 ms"), std::string::npos);
}

TEST(ReportPrinterTest, ColoredOutputUsesAnsi) {
    std::ostringstream out;
    ReportPrinter printer(out, true);
    printer.line("Total:", "12");
    EXPECT_NE(out.str().find("\033[92m"), std::string::npos);
}

TEST(ReportPrinterTest, FixedFormatting) {
    EXPECT_EQ(ReportPrinter::fixed(1.23456, 2, " s"), "1.23 s");
    EXPECT_EQ(ReportPrinter::fixed(10.0, 0), "10");
}
