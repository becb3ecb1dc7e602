// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "audio_file.h"
#include "log.h"

#include <sndfile.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <sstream>

namespace meetscribe {

namespace {

// In-memory file for libsndfile's virtual IO. Reads from `data`; writes grow it.
struct MemoryFile {
    std::string data;
    sf_count_t pos = 0;
};

sf_count_t vio_get_filelen(void* user) {
    return static_cast<sf_count_t>(static_cast<MemoryFile*>(user)->data.size());
}

sf_count_t vio_seek(sf_count_t offset, int whence, void* user) {
    auto* mf = static_cast<MemoryFile*>(user);
    sf_count_t base = 0;
    switch (whence) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = mf->pos; break;
        case SEEK_END: base = static_cast<sf_count_t>(mf->data.size()); break;
        default: return -1;
    }
    sf_count_t target = base + offset;
    if (target < 0) return -1;
    mf->pos = target;
    return mf->pos;
}

sf_count_t vio_read(void* ptr, sf_count_t count, void* user) {
    auto* mf = static_cast<MemoryFile*>(user);
    sf_count_t size = static_cast<sf_count_t>(mf->data.size());
    if (mf->pos >= size) return 0;
    sf_count_t n = std::min(count, size - mf->pos);
    std::memcpy(ptr, mf->data.data() + mf->pos, static_cast<size_t>(n));
    mf->pos += n;
    return n;
}

sf_count_t vio_write(const void* ptr, sf_count_t count, void* user) {
    auto* mf = static_cast<MemoryFile*>(user);
    size_t end = static_cast<size_t>(mf->pos + count);
    if (end > mf->data.size())
        mf->data.resize(end);
    std::memcpy(&mf->data[static_cast<size_t>(mf->pos)], ptr, static_cast<size_t>(count));
    mf->pos += count;
    return count;
}

sf_count_t vio_tell(void* user) {
    return static_cast<MemoryFile*>(user)->pos;
}

SF_VIRTUAL_IO make_vio() {
    SF_VIRTUAL_IO vio{};
    vio.get_filelen = vio_get_filelen;
    vio.seek = vio_seek;
    vio.read = vio_read;
    vio.write = vio_write;
    vio.tell = vio_tell;
    return vio;
}

std::string encode(const std::vector<float>& samples, int sample_rate, int channels,
                   int format, const char* label) {
    MemoryFile mf;
    SF_VIRTUAL_IO vio = make_vio();

    SF_INFO info = {};
    info.samplerate = sample_rate;
    info.channels = channels;
    info.format = format;

    SNDFILE* sf = sf_open_virtual(&vio, SFM_WRITE, &info, &mf);
    if (!sf)
        throw MeetscribeError(std::string("Failed to open ") + label + " encoder (" +
                              sf_strerror(nullptr) + ")");

    sf_count_t written = sf_write_float(sf, samples.data(),
                                        static_cast<sf_count_t>(samples.size()));
    sf_close(sf);

    if (written != static_cast<sf_count_t>(samples.size()))
        throw MeetscribeError(std::string(label) + " encode incomplete");

    return std::move(mf.data);
}

} // anonymous namespace

std::vector<float> downmix(const std::vector<float>& interleaved, int channels) {
    if (channels <= 1) return interleaved;

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0;
        for (int ch = 0; ch < channels; ++ch)
            sum += interleaved[i * channels + ch];
        mono[i] = sum / channels;
    }
    return mono;
}

std::vector<float> resample_linear(const std::vector<float>& input,
                                   int input_rate, int output_rate) {
    if (input_rate == output_rate || input.empty())
        return input;
    if (input_rate <= 0 || output_rate <= 0)
        throw MeetscribeError("Invalid sample rate for resampling");

    double ratio = static_cast<double>(output_rate) / input_rate;
    size_t out_size = static_cast<size_t>(std::llround(input.size() * ratio));
    std::vector<float> output(out_size);

    for (size_t i = 0; i < out_size; ++i) {
        double src = i / ratio;
        size_t i0 = static_cast<size_t>(src);
        if (i0 + 1 >= input.size()) {
            output[i] = input.back();
            continue;
        }
        double frac = src - static_cast<double>(i0);
        output[i] = static_cast<float>(input[i0] * (1.0 - frac) + input[i0 + 1] * frac);
    }
    return output;
}

AudioBuffer decode_audio(const std::string& bytes) {
    if (bytes.empty())
        throw DecodeError("Audio input is empty");

    MemoryFile mf;
    mf.data = bytes;
    SF_VIRTUAL_IO vio = make_vio();

    SF_INFO info = {};
    SNDFILE* sf = sf_open_virtual(&vio, SFM_READ, &info, &mf);
    if (!sf)
        throw DecodeError(std::string("Unsupported or malformed audio (") +
                          sf_strerror(nullptr) + ")");

    if (info.channels <= 0 || info.samplerate <= 0) {
        sf_close(sf);
        throw DecodeError("Audio stream reports no channels or sample rate");
    }

    // Read all frames as float (libsndfile handles format conversion)
    std::vector<float> interleaved(static_cast<size_t>(info.frames) * info.channels);
    sf_count_t read = sf_readf_float(sf, interleaved.data(), info.frames);
    sf_close(sf);

    if (read < 0)
        throw DecodeError("Failed to read audio frames");
    interleaved.resize(static_cast<size_t>(read) * info.channels);

    AudioBuffer buf;
    buf.source_sample_rate = info.samplerate;
    buf.source_channels = info.channels;
    buf.samples = resample_linear(downmix(interleaved, info.channels),
                                  info.samplerate, SAMPLE_RATE);

    log_info("Decoded audio: %.1fs (%dHz x%d -> %dHz mono, %zu samples)",
             buf.duration(), info.samplerate, info.channels, SAMPLE_RATE,
             buf.samples.size());
    return buf;
}

std::string read_file_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw MeetscribeError("Cannot read file: " + path.string());
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

AudioBuffer read_audio_file(const fs::path& path) {
    if (!fs::exists(path) || fs::file_size(path) == 0)
        throw DecodeError("Audio file is missing or empty: " + path.string());
    return decode_audio(read_file_bytes(path));
}

std::string encode_flac(const std::vector<float>& samples, int sample_rate) {
    return encode(samples, sample_rate, 1, SF_FORMAT_FLAC | SF_FORMAT_PCM_16, "FLAC");
}

std::string encode_wav(const std::vector<float>& samples, int sample_rate, int channels) {
    return encode(samples, sample_rate, channels, SF_FORMAT_WAV | SF_FORMAT_PCM_16, "WAV");
}

} // namespace meetscribe
