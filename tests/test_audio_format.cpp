#include <gtest/gtest.h>
#include "audio_format.h"
#include "errors.h"
#include "test_helpers.h"

TEST(AudioFormatTest, DecodesLittleEndianPcm) {
    const std::string bytes("\x01\x00\xff\x7f\x00\x80\xff\xff", 8);
    AudioChunk chunk = decode_pcm_s16le(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());

    ASSERT_EQ(chunk.samples.size(), 4u);
    EXPECT_EQ(chunk.samples[0], 1);
    EXPECT_EQ(chunk.samples[1], 32767);
    EXPECT_EQ(chunk.samples[2], -32768);
    EXPECT_EQ(chunk.samples[3], -1);
    EXPECT_EQ(chunk.sample_rate, kSampleRate);
    EXPECT_EQ(chunk.channels, kChannels);
}

TEST(AudioFormatTest, OddLengthPcmIsRejected) {
    EXPECT_THROW(decode_audio(std::string("\x01\x02\x03", 3), AudioEncoding::PCM_S16LE), FormatError);
}

TEST(AudioFormatTest, EmptyPcmDecodesToEmptyChunk) {
    AudioChunk chunk = decode_audio(std::string(), AudioEncoding::PCM_S16LE);
    EXPECT_TRUE(chunk.samples.empty());
}

TEST(AudioFormatTest, DecodesWavContainer) {
    std::vector<int16_t> samples = make_tone(100);
    AudioChunk chunk = decode_audio(make_wav(samples), AudioEncoding::WAV);

    EXPECT_EQ(chunk.samples, samples);
    EXPECT_EQ(chunk.sample_rate, 16000);
    EXPECT_EQ(chunk.channels, 1);
    EXPECT_NO_THROW(check_format(chunk, kSampleRate, kChannels));
}

TEST(AudioFormatTest, WavHeaderFormatIsReportedAsIs) {
    AudioChunk chunk = decode_audio(make_wav(make_tone(50), 8000, 2), AudioEncoding::WAV);

    EXPECT_EQ(chunk.sample_rate, 8000);
    EXPECT_EQ(chunk.channels, 2);
    EXPECT_THROW(check_format(chunk, kSampleRate, kChannels), FormatError);
}

TEST(AudioFormatTest, SkipsUnknownChunksBeforeData) {
    std::vector<int16_t> samples = make_tone(20);
    std::string wav = make_wav(samples);
    // RIFF 头 + fmt 块之后插入一个奇数长度的 LIST 块
    std::string list("LIST\x03\x00\x00\x00" "abc\x00", 12);
    wav.insert(12 + 8 + 16, list);

    AudioChunk chunk = decode_audio(wav, AudioEncoding::WAV);
    EXPECT_EQ(chunk.samples, samples);
}

TEST(AudioFormatTest, StreamingPlaceholderDataSizeIsClamped) {
    std::vector<int16_t> samples = make_tone(20);
    std::string wav = make_wav(samples);
    // data 长度写成 0xFFFFFFFF
    size_t data_size_offset = 12 + 8 + 16 + 4;
    wav.replace(data_size_offset, 4, std::string("\xff\xff\xff\xff", 4));

    AudioChunk chunk = decode_audio(wav, AudioEncoding::WAV);
    EXPECT_EQ(chunk.samples, samples);
}

TEST(AudioFormatTest, RejectsNonWavPayload) {
    EXPECT_THROW(decode_audio(to_pcm_bytes(make_tone(20)), AudioEncoding::WAV), FormatError);
    EXPECT_THROW(decode_audio(std::string("RIFF"), AudioEncoding::WAV), FormatError);
}

TEST(AudioFormatTest, RejectsUnsupportedSampleWidth) {
    EXPECT_THROW(decode_audio(make_wav(make_tone(20), kSampleRate, 1, 24), AudioEncoding::WAV), FormatError);
}

TEST(AudioFormatTest, RejectsWavWithoutDataChunk) {
    std::string wav = make_wav(make_tone(20));
    wav.resize(12 + 8 + 16);
    EXPECT_THROW(decode_audio(wav, AudioEncoding::WAV), FormatError);
}

TEST(AudioFormatTest, ParsesEncodingNames) {
    AudioEncoding encoding = AudioEncoding::WAV;
    EXPECT_TRUE(parse_audio_encoding("pcm_s16le", encoding));
    EXPECT_EQ(encoding, AudioEncoding::PCM_S16LE);
    EXPECT_TRUE(parse_audio_encoding("wav", encoding));
    EXPECT_EQ(encoding, AudioEncoding::WAV);
    EXPECT_FALSE(parse_audio_encoding("mp3", encoding));
    EXPECT_EQ(encoding, AudioEncoding::WAV);
    EXPECT_STREQ(to_string(AudioEncoding::PCM_S16LE), "pcm_s16le");
}

TEST(AudioFormatTest, SampleDurationConversions) {
    EXPECT_EQ(ms_to_samples(1000), 16000);
    EXPECT_EQ(ms_to_samples(20), 320);
    EXPECT_EQ(samples_to_ms(4800), 300);
    EXPECT_EQ(samples_to_ms(160, 8000), 20);
}
