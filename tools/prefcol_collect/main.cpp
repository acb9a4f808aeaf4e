// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief prefcol_collect - feeds preference comparisons into the collector
///
/// Architecture:
///   JSONL input / sample comparison -> Collector -> HttpRemoteClient -> store
///
/// Usage:
///   prefcol_collect --config=collector.yaml --input=comparisons.jsonl
///   prefcol_collect --domain=procurement --api_key=KEY --test_submit
///   cat comparisons.jsonl | prefcol_collect --input=-
///   prefcol_collect --health

#include "collector.hpp"
#include "collector_settings.hpp"
#include "jsonl_reader.hpp"
#include "shutdown_signals.hpp"
#include "prefcol/http_remote_client.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

// Command line flags
DEFINE_string(config, "", "YAML configuration file");
DEFINE_string(domain, "", "Domain for collected comparisons (overrides config)");
DEFINE_string(api_url, "", "Preference store base URL (overrides config)");
DEFINE_string(api_key, "", "Preference store API key (overrides config)");
DEFINE_int32(batch_size, 0, "Queue depth that forces a flush (0 = keep config)");
DEFINE_double(flush_interval, 0, "Seconds between background flushes (0 = keep config)");
DEFINE_bool(no_quality_gate, false, "Bypass quality validation");
DEFINE_string(input, "", "JSON Lines file of comparisons, '-' for stdin");
DEFINE_bool(test_submit, false, "Submit a built-in sample comparison and flush");
DEFINE_bool(health, false, "Check the preference store health endpoint and exit");

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int sig) {
    LOG(INFO) << "Received signal " << sig << ", shutting down...";
    g_running = false;
}

prefcol::pipeline::CollectorSettings build_settings() {
    prefcol::pipeline::CollectorSettings settings;

    if (!FLAGS_config.empty()) {
        prefcol::pipeline::load_settings_file(FLAGS_config, settings);
    }
    prefcol::pipeline::apply_environment(settings);

    if (!FLAGS_domain.empty()) settings.domain = FLAGS_domain;
    if (!FLAGS_api_url.empty()) settings.remote.base_url = FLAGS_api_url;
    if (!FLAGS_api_key.empty()) settings.remote.api_key = FLAGS_api_key;
    if (FLAGS_batch_size > 0) settings.collector.batch_size = static_cast<size_t>(FLAGS_batch_size);
    if (FLAGS_flush_interval > 0) {
        settings.collector.flush_interval =
            std::chrono::milliseconds(static_cast<int64_t>(FLAGS_flush_interval * 1000.0));
    }
    if (FLAGS_no_quality_gate) settings.collector.quality_gate_enabled = false;

    // A one-shot test submission is flushed explicitly
    if (FLAGS_test_submit) settings.collector.auto_flush = false;

    prefcol::pipeline::validate_settings(settings);
    return settings;
}

void log_settings(const prefcol::pipeline::CollectorSettings& settings) {
    LOG(INFO) << "=== Preference Collector Configuration ===";
    LOG(INFO) << "Domain: " << settings.domain;
    LOG(INFO) << "Store: " << settings.remote.base_url
              << (settings.remote.api_key.empty() ? " (no API key)" : " (API key set)");
    LOG(INFO) << "Batching: " << settings.collector.batch_size << " records, "
              << settings.collector.flush_interval.count() << "ms interval"
              << (settings.collector.auto_flush ? "" : " (background flush off)");
    LOG(INFO) << "Quality gate: " << (settings.collector.quality_gate_enabled ? "on" : "off");
}

bool submit_sample(prefcol::pipeline::Collector& collector) {
    return collector.submit(
        "What is the difference between FFP and CPFF contracts?",
        "FFP (Firm Fixed Price) places cost risk on the contractor - the price is set at "
        "award and doesn't change regardless of actual costs. CPFF (Cost Plus Fixed Fee) "
        "places cost risk on the government - they reimburse allowable costs plus a fixed "
        "fee. FFP is preferred when requirements are well-defined; CPFF is used for R&D or "
        "uncertain scope.",
        "FFP means fixed price, so the contractor carries the cost risk. CPFF means cost "
        "plus a fixed fee, so the government reimburses costs and carries the risk. They "
        "are different contract types suited to different levels of scope certainty.",
        prefcol::pipeline::ChosenSide::A,
        "test_user",
        "far_dfars");
}

void print_stats(const prefcol::pipeline::CollectorStats& stats) {
    std::cout << "\nStatistics:\n"
              << "  collected: " << stats.collected << "\n"
              << "  submitted: " << stats.submitted << "\n"
              << "  rejected_quality: " << stats.rejected_quality << "\n"
              << "  rejected_duplicate: " << stats.rejected_duplicate << "\n"
              << "  failed: " << stats.failed << "\n"
              << "  queue_depth: " << stats.queue_depth << "\n"
              << "  acceptance_rate: " << std::fixed << std::setprecision(3)
              << stats.acceptance_rate() << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    // Initialize logging and flags
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Preference Collector - validates, deduplicates and uploads preference comparisons");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    if (!prefcol::pipeline::install_shutdown_handler(signal_handler)) {
        return 1;
    }

    prefcol::pipeline::CollectorSettings settings;
    try {
        settings = build_settings();
    } catch (const prefcol::pipeline::ConfigError& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return 1;
    }
    log_settings(settings);

    auto client = std::make_shared<prefcol::HttpRemoteClient>(settings.remote);

    if (FLAGS_health) {
        const bool ok = client->healthy();
        std::cout << "Preference store " << client->base_url() << ": "
                  << (ok ? "healthy" : "unavailable") << "\n";
        return ok ? 0 : 1;
    }

    if (settings.remote.api_key.empty()) {
        LOG(WARNING) << "No API key configured; set PREFCOL_API_KEY or pass --api_key";
    }

    prefcol::pipeline::Collector collector(settings.domain, client, settings.collector);

    if (FLAGS_test_submit) {
        LOG(INFO) << "Submitting test preference for " << settings.domain << "...";
        if (submit_sample(collector)) {
            size_t sent = collector.flush();
            std::cout << "[OK] Submitted " << sent << " preference(s)\n";
        } else {
            std::cout << "[FAILED] Preference rejected: "
                      << collector.last_rejection_reason() << "\n";
        }
    }

    if (!FLAGS_input.empty()) {
        std::ifstream file;
        std::istream* input = &std::cin;
        if (FLAGS_input != "-") {
            file.open(FLAGS_input);
            if (!file) {
                LOG(ERROR) << "Cannot open input file: " << FLAGS_input;
                collector.stop();
                return 1;
            }
            input = &file;
        }

        auto read = prefcol::pipeline::read_comparisons(
            *input,
            [&collector](const prefcol::pipeline::ComparisonSubmission& submission) {
                collector.submit(submission);
            },
            [] { return g_running.load(); });

        LOG(INFO) << "Read " << read.lines << " lines: " << read.decoded
                  << " comparisons, " << read.malformed << " malformed";
    }

    LOG(INFO) << "Shutting down...";
    collector.stop();
    print_stats(collector.stats());

    gflags::ShutDownCommandLineFlags();
    return 0;
}
