#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// 会话固定的采样格式: 16kHz, 单声道, 16bit 有符号 PCM
constexpr int kSampleRate = 16000;
constexpr int kChannels = 1;

// 二进制消息的编码方式, 在 start 时确定
enum class AudioEncoding {
    PCM_S16LE,
    WAV
};

bool parse_audio_encoding(const std::string& name, AudioEncoding& encoding);
const char* to_string(AudioEncoding encoding);

struct AudioChunk {
    std::vector<int16_t> samples;
    int sample_rate = kSampleRate;
    int channels = kChannels;
};

inline int64_t ms_to_samples(int64_t ms, int sample_rate = kSampleRate) {
    return ms * sample_rate / 1000;
}

inline int64_t samples_to_ms(int64_t samples, int sample_rate = kSampleRate) {
    return samples * 1000 / sample_rate;
}

// 解码一条二进制消息. 数据损坏或格式不支持时抛出 FormatError
AudioChunk decode_audio(const std::string& payload, AudioEncoding encoding);

// PCM 16bit Little Endian
AudioChunk decode_pcm_s16le(const uint8_t* data, size_t size);

// RIFF/WAVE 容器, 仅支持 PCM 16bit; 采样率和声道数按文件头原样返回
AudioChunk decode_wav(const uint8_t* data, size_t size);

// 采样率或声道数与期望不符时抛出 FormatError
void check_format(const AudioChunk& chunk, int sample_rate, int channels);

std::vector<float> to_float(const int16_t* samples, size_t count);
