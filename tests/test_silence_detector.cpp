#include <gtest/gtest.h>
#include "errors.h"
#include "frame_classifier.h"
#include "silence_detector.h"
#include "test_helpers.h"

TEST(EnergyFrameClassifierTest, ToneIsVoicedSilenceIsNot) {
    EnergyFrameClassifier classifier;
    ASSERT_EQ(classifier.frame_samples(), 320u);

    std::vector<int16_t> tone = make_tone(20);
    EXPECT_TRUE(classifier.is_voiced(tone.data()));
    EXPECT_GT(classifier.last_rms(), 0.1f);

    std::vector<int16_t> silence = make_silence(20);
    EXPECT_FALSE(classifier.is_voiced(silence.data()));
    EXPECT_FLOAT_EQ(classifier.last_rms(), 0.0f);
}

TEST(EnergyFrameClassifierTest, QuietToneIsBelowThreshold) {
    EnergyFrameClassifier classifier;
    std::vector<int16_t> quiet = make_tone(20, 0.005);
    EXPECT_FALSE(classifier.is_voiced(quiet.data()));
}

TEST(EnergyFrameClassifierTest, HighZeroCrossingNoiseIsNotVoiced) {
    EnergyFrameClassifier classifier;
    std::vector<int16_t> hiss(320);
    for (size_t i = 0; i < hiss.size(); ++i) {
        hiss[i] = (i % 2 == 0) ? 8000 : -8000;
    }
    EXPECT_FALSE(classifier.is_voiced(hiss.data()));
    EXPECT_GT(classifier.last_zero_crossing_rate(), 0.9f);
}

TEST(ClassifierFactoryTest, UnknownBackendIsRejected) {
    VadConfig config;
    config.backend = "webrtc";
    EXPECT_THROW(make_classifier_factory(config), ConfigError);
}

TEST(ClassifierFactoryTest, EnergyFactoryCreatesIndependentInstances) {
    ClassifierFactory factory = make_classifier_factory(VadConfig());
    std::unique_ptr<IFrameClassifier> a = factory();
    std::unique_ptr<IFrameClassifier> b = factory();
    ASSERT_TRUE(a && b);
    EXPECT_NE(a.get(), b.get());
}

class SilenceDetectorTest : public ::testing::Test {
protected:
    SilenceDetectorTest()
        : detector(std::make_unique<EnergyFrameClassifier>(), static_cast<size_t>(ms_to_samples(300))) {}

    SilenceDetector detector;
};

TEST_F(SilenceDetectorTest, PureSilenceIsNeverABoundary) {
    SilenceAnalysis a = detector.feed(make_silence(2000));
    EXPECT_TRUE(a.is_silence);
    EXPECT_FALSE(a.boundary);
    EXPECT_FALSE(detector.has_voice());
    EXPECT_EQ(a.trailing_silence_samples, 32000u);
}

TEST_F(SilenceDetectorTest, BoundaryAfterMinimumTrailingSilence) {
    SilenceAnalysis a = detector.feed(make_tone(1000));
    EXPECT_FALSE(a.is_silence);
    EXPECT_EQ(a.voiced_samples, 16000u);
    EXPECT_EQ(a.trailing_silence_samples, 0u);

    a = detector.feed(make_silence(200));
    EXPECT_TRUE(a.is_silence);
    EXPECT_FALSE(a.boundary);
    EXPECT_EQ(a.trailing_silence_samples, 3200u);

    a = detector.feed(make_silence(100));
    EXPECT_TRUE(a.boundary);
    EXPECT_EQ(a.trailing_silence_samples, 4800u);
}

TEST_F(SilenceDetectorTest, SpeechResetsTrailingSilence) {
    detector.feed(make_tone(500));
    detector.feed(make_silence(200));
    SilenceAnalysis a = detector.feed(make_tone(100));
    EXPECT_EQ(a.trailing_silence_samples, 0u);
    EXPECT_FALSE(a.boundary);
}

TEST_F(SilenceDetectorTest, PartialFramesAreCarriedOver) {
    std::vector<int16_t> tone = make_tone(100);
    // 100 个采样一批, 不足一帧的部分等下次凑齐
    for (size_t i = 0; i < tone.size(); i += 100) {
        detector.feed(tone.data() + i, 100);
    }
    EXPECT_EQ(detector.current().voiced_samples, 1600u);
    EXPECT_EQ(detector.pending_samples(), 0u);

    detector.feed(tone.data(), 50);
    EXPECT_EQ(detector.pending_samples(), 50u);
    EXPECT_EQ(detector.current().voiced_samples, 1600u);
}

TEST_F(SilenceDetectorTest, MarkBoundaryForgetsEarlierSpeech) {
    detector.feed(make_tone(500));
    detector.feed(make_silence(400));
    ASSERT_TRUE(detector.current().boundary);

    detector.mark_boundary();
    EXPECT_FALSE(detector.has_voice());
    EXPECT_FALSE(detector.current().boundary);

    SilenceAnalysis a = detector.feed(make_silence(400));
    EXPECT_FALSE(a.boundary);
}

TEST(SilenceDetectorConfigTest, RequiresClassifier) {
    EXPECT_THROW(SilenceDetector(nullptr, 4800), ConfigError);
}
