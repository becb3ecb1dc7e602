// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "config.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace meetscribe {

namespace {

// Shortest poll interval passed on to the transcriber
constexpr int MIN_POLL_INTERVAL_MS = 100;

// Simple YAML parser: handles flat key: value and one level of nesting.

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                           (s.front() == '\'' && s.back() == '\'')))
        return s.substr(1, s.size() - 2);
    return s;
}

struct YamlEntry {
    std::string key;
    std::string value;
    int indent;
};

std::vector<YamlEntry> parse_yaml(const std::string& text) {
    std::vector<YamlEntry> entries;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        // Skip comments and empty lines
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        // Count leading spaces
        int indent = 0;
        while (indent < (int)line.size() && line[indent] == ' ') indent++;

        auto colon = trimmed.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(trimmed.substr(0, colon));
        std::string val = trim(trimmed.substr(colon + 1));
        entries.push_back({key, unquote(val), indent});
    }
    return entries;
}

std::string get_val(const std::vector<YamlEntry>& entries,
                    const std::string& section, const std::string& key,
                    const std::string& def = "") {
    bool in_section = section.empty();
    for (const auto& e : entries) {
        if (!section.empty()) {
            if (e.indent == 0 && e.key == section && e.value.empty())
                in_section = true;
            else if (e.indent == 0 && e.key != section)
                in_section = false;
        }
        if (in_section && e.indent > 0 && e.key == key)
            return e.value;
    }
    return def;
}

bool get_bool(const std::vector<YamlEntry>& entries,
              const std::string& section, const std::string& key,
              bool def = false) {
    std::string val = get_val(entries, section, key, def ? "true" : "false");
    return val == "true" || val == "yes" || val == "1";
}

int get_int(const std::vector<YamlEntry>& entries,
            const std::string& section, const std::string& key, int def) {
    std::string val = get_val(entries, section, key, "");
    return val.empty() ? def : std::atoi(val.c_str());
}

double get_double(const std::vector<YamlEntry>& entries,
                  const std::string& section, const std::string& key, double def) {
    std::string val = get_val(entries, section, key, "");
    return val.empty() ? def : std::atof(val.c_str());
}

fs::path resolve_path(const fs::path& config_path) {
    return config_path.empty() ? config_dir() / "config.yaml" : config_path;
}

} // anonymous namespace

Config load_config(const fs::path& config_path) {
    Config cfg;
    fs::path path = resolve_path(config_path);

    if (const char* key = std::getenv(RECOGNITION_KEY_ENV))
        cfg.recognition_api_key = key;
    if (const char* key = std::getenv(SUMMARY_KEY_ENV))
        cfg.summary_api_key = key;

    if (!fs::exists(path))
        return cfg;

    std::ifstream in(path);
    if (!in) return cfg;

    std::ostringstream buf;
    buf << in.rdbuf();
    auto entries = parse_yaml(buf.str());

    // Segmenter section
    cfg.max_chunk_seconds = get_double(entries, "segmenter", "max_chunk_seconds", cfg.max_chunk_seconds);
    cfg.silence_margin_db = get_double(entries, "segmenter", "silence_margin_db", cfg.silence_margin_db);
    cfg.min_silence_ms = get_int(entries, "segmenter", "min_silence_ms", cfg.min_silence_ms);
    cfg.keep_silence_ms = get_int(entries, "segmenter", "keep_silence_ms", cfg.keep_silence_ms);

    // Recognition section
    cfg.recognition_url = get_val(entries, "recognition", "api_url", cfg.recognition_url);
    std::string file_key = get_val(entries, "recognition", "api_key", "");
    if (!file_key.empty())
        cfg.recognition_api_key = file_key;
    cfg.recognition_model = get_val(entries, "recognition", "model", cfg.recognition_model);
    cfg.max_speakers = get_int(entries, "recognition", "max_speakers", cfg.max_speakers);
    cfg.wait_timeout_seconds = get_int(entries, "recognition", "wait_timeout", cfg.wait_timeout_seconds);
    cfg.poll_interval_ms = get_int(entries, "recognition", "poll_interval_ms", cfg.poll_interval_ms);
    cfg.max_attempts = get_int(entries, "recognition", "max_attempts", cfg.max_attempts);
    cfg.max_poll_attempts = get_int(entries, "recognition", "max_poll_attempts",
                                    cfg.max_poll_attempts);
    cfg.backoff_ms = get_int(entries, "recognition", "backoff_ms", cfg.backoff_ms);
    cfg.request_timeout_seconds = get_int(entries, "recognition", "request_timeout",
                                          cfg.request_timeout_seconds);

    // Pipeline section
    cfg.max_in_flight = get_int(entries, "pipeline", "max_in_flight", cfg.max_in_flight);

    // Summary section
    cfg.summary_url = get_val(entries, "summary", "api_url", cfg.summary_url);
    file_key = get_val(entries, "summary", "api_key", "");
    if (!file_key.empty())
        cfg.summary_api_key = file_key;
    cfg.summary_model = get_val(entries, "summary", "model", cfg.summary_model);
    cfg.no_summary = get_bool(entries, "summary", "disabled", false);

    // Logging section
    cfg.log_level_str = get_val(entries, "logging", "level", cfg.log_level_str);
    std::string dir = get_val(entries, "logging", "directory", "");
    if (!dir.empty()) cfg.log_dir = dir;

    return cfg;
}

void save_config(const Config& cfg, const fs::path& config_path) {
    fs::path path = resolve_path(config_path);
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out)
        throw MeetscribeError("Cannot write config: " + path.string());

    out << "# meetscribe configuration\n\n"
        << "segmenter:\n"
        << "  max_chunk_seconds: " << cfg.max_chunk_seconds << "\n"
        << "  silence_margin_db: " << cfg.silence_margin_db << "\n"
        << "  min_silence_ms: " << cfg.min_silence_ms << "\n"
        << "  keep_silence_ms: " << cfg.keep_silence_ms << "\n";

    out << "\nrecognition:\n"
        << "  api_url: \"" << cfg.recognition_url << "\"\n"
        << "  model: " << cfg.recognition_model << "\n"
        << "  max_speakers: " << cfg.max_speakers << "\n"
        << "  wait_timeout: " << cfg.wait_timeout_seconds << "\n"
        << "  poll_interval_ms: " << cfg.poll_interval_ms << "\n"
        << "  max_attempts: " << cfg.max_attempts << "\n"
        << "  max_poll_attempts: " << cfg.max_poll_attempts << "\n"
        << "  backoff_ms: " << cfg.backoff_ms << "\n"
        << "  request_timeout: " << cfg.request_timeout_seconds << "\n";

    out << "\npipeline:\n"
        << "  max_in_flight: " << cfg.max_in_flight << "\n";

    out << "\nsummary:\n";
    if (!cfg.summary_url.empty())
        out << "  api_url: \"" << cfg.summary_url << "\"\n";
    out << "  model: " << cfg.summary_model << "\n";
    if (cfg.no_summary)
        out << "  disabled: true\n";

    if (!cfg.log_level_str.empty() || !cfg.log_dir.empty()) {
        out << "\nlogging:\n";
        if (!cfg.log_level_str.empty())
            out << "  level: " << cfg.log_level_str << "\n";
        if (!cfg.log_dir.empty())
            out << "  directory: \"" << cfg.log_dir.string() << "\"\n";
    }

    if (!out)
        throw MeetscribeError("Failed writing config: " + path.string());
}

SegmenterOptions segmenter_options(const Config& cfg) {
    SegmenterOptions o;
    o.max_chunk_seconds = cfg.max_chunk_seconds;
    o.silence_margin_db = cfg.silence_margin_db;
    o.min_silence_ms = cfg.min_silence_ms;
    o.keep_silence_ms = cfg.keep_silence_ms;
    return o;
}

TranscriberOptions transcriber_options(const Config& cfg) {
    TranscriberOptions o;
    o.model = cfg.recognition_model;
    o.max_speakers = cfg.max_speakers;
    o.wait_timeout = std::chrono::seconds(cfg.wait_timeout_seconds);
    o.poll_interval = std::chrono::milliseconds(std::max(cfg.poll_interval_ms,
                                                         MIN_POLL_INTERVAL_MS));
    o.max_attempts = cfg.max_attempts;
    o.max_poll_attempts = cfg.max_poll_attempts;
    o.initial_backoff = std::chrono::milliseconds(cfg.backoff_ms);
    return o;
}

HttpRecognitionOptions recognition_options(const Config& cfg) {
    HttpRecognitionOptions o;
    o.base_url = cfg.recognition_url;
    o.api_key = cfg.recognition_api_key;
    o.request_timeout_seconds = cfg.request_timeout_seconds;
    return o;
}

PipelineOptions pipeline_options(const Config& cfg) {
    PipelineOptions o;
    o.segmenter = segmenter_options(cfg);
    o.max_in_flight = cfg.max_in_flight;
    return o;
}

SummaryOptions summary_options(const Config& cfg) {
    SummaryOptions o;
    o.api_url = cfg.summary_url;
    o.api_key = cfg.summary_api_key;
    o.model = cfg.summary_model;
    o.disabled = cfg.no_summary;
    return o;
}

} // namespace meetscribe
