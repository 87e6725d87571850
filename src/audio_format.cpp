#include "audio_format.h"
#include "errors.h"
#include <cstring>

namespace {

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

const uint16_t kWaveFormatPcm = 1;
const uint16_t kWaveFormatExtensible = 0xFFFE;

} // namespace

bool parse_audio_encoding(const std::string& name, AudioEncoding& encoding) {
    if (name == "pcm_s16le" || name == "pcm") {
        encoding = AudioEncoding::PCM_S16LE;
        return true;
    }
    if (name == "wav") {
        encoding = AudioEncoding::WAV;
        return true;
    }
    return false;
}

const char* to_string(AudioEncoding encoding) {
    switch (encoding) {
    case AudioEncoding::PCM_S16LE:
        return "pcm_s16le";
    case AudioEncoding::WAV:
        return "wav";
    }
    return "unknown";
}

AudioChunk decode_audio(const std::string& payload, AudioEncoding encoding) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(payload.data());
    if (encoding == AudioEncoding::WAV) {
        return decode_wav(data, payload.size());
    }
    return decode_pcm_s16le(data, payload.size());
}

AudioChunk decode_pcm_s16le(const uint8_t* data, size_t size) {
    if (size % 2 != 0) {
        throw FormatError("pcm_s16le payload has odd length " + std::to_string(size));
    }

    AudioChunk chunk;
    chunk.samples.reserve(size / 2);
    // 每两个字节是一个 int16
    for (size_t i = 0; i + 1 < size; i += 2) {
        chunk.samples.push_back(static_cast<int16_t>(data[i] | (data[i + 1] << 8)));
    }
    return chunk;
}

AudioChunk decode_wav(const uint8_t* data, size_t size) {
    if (size < 12 || std::memcmp(data, "RIFF", 4) != 0 || std::memcmp(data + 8, "WAVE", 4) != 0) {
        throw FormatError("payload is not a RIFF/WAVE container");
    }

    bool have_fmt = false;
    uint16_t format_tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;

    size_t pos = 12;
    while (pos + 8 <= size) {
        const uint8_t* header = data + pos;
        uint32_t chunk_size = read_u32(header + 4);
        size_t body = pos + 8;
        size_t available = size - body;

        if (std::memcmp(header, "fmt ", 4) == 0) {
            if (chunk_size < 16 || available < 16) {
                throw FormatError("truncated WAV fmt chunk");
            }
            format_tag = read_u16(data + body);
            channels = read_u16(data + body + 2);
            sample_rate = read_u32(data + body + 4);
            bits = read_u16(data + body + 14);
            have_fmt = true;
        } else if (std::memcmp(header, "data", 4) == 0) {
            if (!have_fmt) {
                throw FormatError("WAV data chunk precedes fmt chunk");
            }
            if (format_tag != kWaveFormatPcm && format_tag != kWaveFormatExtensible) {
                throw FormatError("unsupported WAV format tag " + std::to_string(format_tag));
            }
            if (bits != 16) {
                throw FormatError("unsupported WAV sample width " + std::to_string(bits) + " bits");
            }
            // 流式写入的文件头里 data 长度可能是占位值
            size_t data_size = chunk_size < available ? chunk_size : available;
            data_size -= data_size % 2;
            AudioChunk chunk = decode_pcm_s16le(data + body, data_size);
            chunk.sample_rate = static_cast<int>(sample_rate);
            chunk.channels = channels;
            return chunk;
        }

        // RIFF 子块按偶数字节对齐
        size_t advance = 8 + static_cast<size_t>(chunk_size) + (chunk_size & 1);
        if (advance > size - pos) {
            break;
        }
        pos += advance;
    }
    throw FormatError("WAV container has no data chunk");
}

void check_format(const AudioChunk& chunk, int sample_rate, int channels) {
    if (chunk.sample_rate != sample_rate || chunk.channels != channels) {
        throw FormatError("audio format mismatch: got " + std::to_string(chunk.sample_rate) + " Hz/" +
                          std::to_string(chunk.channels) + " ch, expected " + std::to_string(sample_rate) +
                          " Hz/" + std::to_string(channels) + " ch");
    }
}

std::vector<float> to_float(const int16_t* samples, size_t count) {
    std::vector<float> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(samples[i] / 32768.0f);
    }
    return out;
}
