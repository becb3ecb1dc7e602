// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "transcribe.h"
#include "audio_file.h"
#include "log.h"

#include <algorithm>
#include <thread>

namespace meetscribe {

namespace {

// Sleep in short slices so a stop request is honoured promptly.
// Returns false if stop was requested before the full duration elapsed.
bool sleep_unless_stopped(std::chrono::milliseconds duration, const StopToken& stop) {
    const auto slice = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop.stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
    return false;
}

} // anonymous namespace

int local_speaker_count(const std::vector<WordSpan>& words) {
    int count = 0;
    for (const auto& w : words)
        count = std::max(count, w.speaker);
    return count;
}

ChunkTranscriber::ChunkTranscriber(RecognitionService& service, TranscriberOptions opts)
    : service_(service), opts_(std::move(opts)) {
    if (opts_.max_attempts < 1)
        opts_.max_attempts = 1;
    if (opts_.max_poll_attempts < 1)
        opts_.max_poll_attempts = 1;
    if (opts_.poll_interval < std::chrono::milliseconds(1))
        opts_.poll_interval = std::chrono::milliseconds(1);
    if (opts_.max_speakers < 1)
        throw MeetscribeError("max_speakers must be at least 1");
}

std::vector<WordSpan> ChunkTranscriber::wait_for(const std::string& operation, int chunk_index,
                                                 const StopToken& stop) const {
    auto deadline = Clock::now() + opts_.wait_timeout;
    int failed_polls = 0;
    auto backoff = opts_.initial_backoff;
    for (;;) {
        if (stop.stop_requested())
            throw CancelledError("Chunk " + std::to_string(chunk_index) + " cancelled");

        auto wait = opts_.poll_interval;
        try {
            auto words = service_.poll(operation);
            if (words)
                return std::move(*words);
            failed_polls = 0;
            backoff = opts_.initial_backoff;
        } catch (const RemoteRejected&) {
            throw;
        } catch (const RemoteError& e) {
            // A failed poll request leaves the operation running: poll it again
            if (!e.request_failed() || ++failed_polls >= opts_.max_poll_attempts)
                throw;
            log_warn("Chunk %d: poll %d of %s failed (%s), retrying in %lldms",
                     chunk_index, failed_polls, operation.c_str(), e.what(),
                     static_cast<long long>(backoff.count()));
            wait = backoff;
            backoff = std::chrono::milliseconds(
                static_cast<long long>(backoff.count() * opts_.backoff_multiplier));
        }

        auto now = Clock::now();
        if (now >= deadline)
            throw RemoteTimeout("Chunk " + std::to_string(chunk_index) +
                                ": recognition did not finish within " +
                                std::to_string(opts_.wait_timeout.count() / 1000) + "s");

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!sleep_unless_stopped(std::min(wait, remaining), stop))
            throw CancelledError("Chunk " + std::to_string(chunk_index) + " cancelled");
    }
}

ChunkResult ChunkTranscriber::transcribe(const AudioChunk& chunk, const std::string& language,
                                         const StopToken& stop) const {
    RecognitionConfig config;
    config.language = language;
    config.sample_rate = chunk.sample_rate;
    config.model = opts_.model;
    config.max_speakers = opts_.max_speakers;

    std::string audio = encode_flac(chunk.samples, chunk.sample_rate);

    auto backoff = opts_.initial_backoff;
    for (int attempt = 1;; ++attempt) {
        if (stop.stop_requested())
            throw CancelledError("Chunk " + std::to_string(chunk.index) + " cancelled");

        bool submitted = false;
        try {
            std::string operation = service_.submit(audio, config);
            submitted = true;
            log_info("Chunk %d: submitted (%.1fs audio, attempt %d, operation %s)",
                     chunk.index, chunk.duration(), attempt, operation.c_str());

            ChunkResult result;
            result.chunk_index = chunk.index;
            result.words = wait_for(operation, chunk.index, stop);
            result.speaker_count = local_speaker_count(result.words);

            log_info("Chunk %d: %zu words, %d speakers",
                     chunk.index, result.words.size(), result.speaker_count);
            return result;
        } catch (const RemoteRejected&) {
            throw;
        } catch (const RemoteError& e) {
            // Poll requests were already retried against the same operation
            if (submitted && e.request_failed()) {
                log_error("Chunk %d: giving up on polling: %s", chunk.index, e.what());
                throw;
            }
            if (attempt >= opts_.max_attempts) {
                log_error("Chunk %d: giving up after %d attempts: %s",
                          chunk.index, attempt, e.what());
                throw;
            }
            log_warn("Chunk %d: attempt %d failed (%s), retrying in %lldms",
                     chunk.index, attempt, e.what(),
                     static_cast<long long>(backoff.count()));
        }

        if (!sleep_unless_stopped(backoff, stop))
            throw CancelledError("Chunk " + std::to_string(chunk.index) + " cancelled");
        backoff = std::chrono::milliseconds(
            static_cast<long long>(backoff.count() * opts_.backoff_multiplier));
    }
}

ChunkResult ChunkTranscriber::transcribe(const AudioChunk& chunk,
                                         const std::string& language) const {
    StopToken never;
    return transcribe(chunk, language, never);
}

} // namespace meetscribe
