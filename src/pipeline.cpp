// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "pipeline.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace meetscribe {

TranscriptionOrchestrator::TranscriptionOrchestrator(const ChunkTranscriber& transcriber,
                                                     PipelineOptions opts)
    : transcriber_(transcriber), opts_(std::move(opts)) {
    if (opts_.max_in_flight < 1)
        opts_.max_in_flight = 1;
}

std::vector<ChunkResult> TranscriptionOrchestrator::transcribe_chunks(
    const std::vector<AudioChunk>& chunks, const std::string& language,
    StopToken& stop) const {
    const size_t n = chunks.size();
    std::vector<ChunkResult> ordered;
    if (n == 0) return ordered;

    // Job-local token: set by the first fatal chunk error or forwarded from
    // the caller's token, observed by every worker and in-flight call.
    StopToken job_stop;

    std::mutex mutex;
    std::condition_variable done_cv;
    std::vector<std::optional<ChunkResult>> slots(n);
    std::exception_ptr first_error;
    std::atomic<size_t> next{0};
    size_t workers_done = 0;

    auto worker = [&] {
        while (!job_stop.stop_requested()) {
            size_t i = next.fetch_add(1);
            if (i >= n) break;
            try {
                ChunkResult r = transcriber_.transcribe(chunks[i], language, job_stop);
                std::lock_guard<std::mutex> lock(mutex);
                slots[i] = std::move(r);
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                    job_stop.request();
                }
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++workers_done;
        }
        done_cv.notify_all();
    };

    size_t n_workers = std::min(n, static_cast<size_t>(opts_.max_in_flight));
    log_info("Transcribing %zu chunks with %zu workers", n, n_workers);

    std::vector<std::thread> threads;
    threads.reserve(n_workers);
    try {
        for (size_t i = 0; i < n_workers; ++i)
            threads.emplace_back(worker);
    } catch (...) {
        job_stop.request();
        for (auto& t : threads) t.join();
        throw;
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        while (workers_done < n_workers) {
            done_cv.wait_for(lock, std::chrono::milliseconds(50));
            if (stop.stop_requested())
                job_stop.request();
        }
    }
    for (auto& t : threads) t.join();

    if (stop.stop_requested())
        throw CancelledError("Job cancelled");
    if (first_error)
        std::rethrow_exception(first_error);

    ordered.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (!slots[i])
            throw AssemblyError("Chunk " + std::to_string(i) + " produced no result");
        ordered.push_back(std::move(*slots[i]));
    }
    return ordered;
}

TranscriptResult TranscriptionOrchestrator::run(const AudioBuffer& audio,
                                                const std::string& language,
                                                StopToken& stop,
                                                PhaseCallback on_phase) const {
    auto phase = [&](const std::string& name) {
        if (on_phase) on_phase(name);
    };

    require_supported_language(language);

    phase("segmenting");
    auto chunks = split_audio(audio, opts_.segmenter);
    if (stop.stop_requested())
        throw CancelledError("Job cancelled");

    phase("transcribing");
    auto results = transcribe_chunks(chunks, language, stop);

    phase("assembling");
    auto transcript = merge_chunks(std::move(results));

    phase("complete");
    return transcript;
}

TranscriptResult TranscriptionOrchestrator::run(const std::string& audio_bytes,
                                                const std::string& language,
                                                StopToken& stop,
                                                PhaseCallback on_phase) const {
    require_supported_language(language);
    AudioBuffer audio = decode_audio(audio_bytes);
    return run(audio, language, stop, std::move(on_phase));
}

StatusUpdate run_job(const TranscriptionOrchestrator& orchestrator,
                     const JobDescriptor& job,
                     const std::string& audio_bytes,
                     JobSink& sink,
                     const SummarizeFn& summarize,
                     const SystemClock& clock,
                     StopToken& stop) {
    log_info("Job %s: processing %s (%s, %zu bytes)", job.id.c_str(),
             job.original_filename.c_str(), job.language.c_str(), audio_bytes.size());
    sink.update(job.id, SetProcessing{});

    TranscriptResult result;
    try {
        result = orchestrator.run(audio_bytes, job.language, stop);
    } catch (const std::exception& e) {
        SetError err{error_kind(e)};
        log_error("Job %s failed (%s): %s", job.id.c_str(), error_kind_name(err.kind), e.what());
        sink.update(job.id, err);
        return err;
    }

    std::string summary;
    if (summarize) {
        try {
            summary = summarize(result.text, job.language);
        } catch (const std::exception& e) {
            log_warn("Job %s: summarizer failed (%s), using basic summary", job.id.c_str(), e.what());
            summary = basic_summary(result.text, job.language);
        }
    }

    SetDone done;
    done.transcript_text = std::move(result.text);
    done.summary_text = std::move(summary);
    done.duration_seconds = result.duration_seconds;
    done.speaker_count = result.speaker_count;
    done.audio_uri = job.audio_uri;

    sink.update(job.id, done);
    sink.record_usage(job.caller, usage_period(clock ? clock() : std::chrono::system_clock::now()),
                      done.duration_seconds);

    log_info("Job %s done: %ds, %d speakers", job.id.c_str(), done.duration_seconds,
             done.speaker_count);
    return done;
}

} // namespace meetscribe
