// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "pipeline.h"
#include "recognition.h"
#include "summarize.h"
#include "util.h"

#include <string>

namespace meetscribe {

constexpr const char* RECOGNITION_KEY_ENV = "MEETSCRIBE_RECOGNITION_API_KEY";
constexpr const char* SUMMARY_KEY_ENV = "MEETSCRIBE_SUMMARY_API_KEY";

struct Config {
    // Segmentation
    double max_chunk_seconds = 300.0;
    double silence_margin_db = 14.0;
    int min_silence_ms = 1000;
    int keep_silence_ms = 500;

    // Recognition service
    std::string recognition_url = "https://speech.googleapis.com/v1";
    std::string recognition_api_key;
    std::string recognition_model = "video";
    int max_speakers = 10;
    int wait_timeout_seconds = 900;
    int poll_interval_ms = 2000;
    int max_attempts = 3;
    int max_poll_attempts = 5;
    int backoff_ms = 1000;
    int request_timeout_seconds = 120;

    // Pipeline
    int max_in_flight = 4;

    // Summarization
    std::string summary_url;  // empty = offline summary only
    std::string summary_api_key;
    std::string summary_model = "gemini-pro";
    bool no_summary = false;

    // Logging
    std::string log_level_str;  // "none", "error", "warn", "info" (default: "none")
    fs::path log_dir;           // empty = default (~/.local/share/meetscribe/logs/)
};

/// Load config. Uses path if provided, otherwise ~/.config/meetscribe/config.yaml.
/// API keys come from the environment unless the file sets them.
Config load_config(const fs::path& config_path = {});

/// Save config. Uses path if provided, otherwise ~/.config/meetscribe/config.yaml.
/// API keys are never written.
void save_config(const Config& cfg, const fs::path& config_path = {});

// Per-component option structs derived from a loaded Config

SegmenterOptions segmenter_options(const Config& cfg);
TranscriberOptions transcriber_options(const Config& cfg);
HttpRecognitionOptions recognition_options(const Config& cfg);
PipelineOptions pipeline_options(const Config& cfg);
SummaryOptions summary_options(const Config& cfg);

} // namespace meetscribe
