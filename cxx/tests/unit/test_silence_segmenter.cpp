#include <gtest/gtest.h>
#include "SilenceSegmenter.hpp"
#include "TestHelper.hpp"

using namespace wavchunk;

class SilenceSegmenterTest : public ::testing::Test {
protected:
    SilenceSegmenter segmenter{300, -40.0};
};

TEST_F(SilenceSegmenterTest, AllSilenceYieldsNothing) {
    auto audio = test::silence(2000);
    auto ranges = segmenter.detect_silence(audio);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], (TimeRange{0, 2000}));

    EXPECT_TRUE(segmenter.detect_nonsilent(audio).empty());
    EXPECT_TRUE(segmenter.split(audio).empty());
}

TEST_F(SilenceSegmenterTest, EmptyInputYieldsNothing) {
    EXPECT_TRUE(segmenter.split(AudioBuffer()).empty());
    EXPECT_TRUE(segmenter.split(AudioBuffer(test::kSampleRate, 1)).empty());
}

TEST_F(SilenceSegmenterTest, SplitsOnLongSilence) {
    auto audio = test::join({test::tone(1000), test::silence(500), test::tone(800)});

    auto silent = segmenter.detect_silence(audio);
    ASSERT_EQ(silent.size(), 1u);
    EXPECT_EQ(silent[0], (TimeRange{1000, 1500}));

    auto phrases = segmenter.split(audio);
    ASSERT_EQ(phrases.size(), 2u);
    EXPECT_EQ(phrases[0].duration_ms(), 1000);
    EXPECT_EQ(phrases[1].duration_ms(), 800);
}

TEST_F(SilenceSegmenterTest, TrimsLeadingAndTrailingSilence) {
    auto audio = test::join({test::silence(500), test::tone(1000), test::silence(700)});

    auto spans = segmenter.detect_nonsilent(audio);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0], (TimeRange{500, 1500}));
}

TEST_F(SilenceSegmenterTest, ShortPauseDoesNotSplit) {
    auto audio = test::join({test::tone(1000), test::silence(200), test::tone(1000)});

    EXPECT_TRUE(segmenter.detect_silence(audio).empty());
    auto phrases = segmenter.split(audio);
    ASSERT_EQ(phrases.size(), 1u);
    EXPECT_EQ(phrases[0].duration_ms(), 2200);
}

TEST_F(SilenceSegmenterTest, PauseOfExactlyMinimumLengthSplits) {
    auto audio = test::join({test::tone(600), test::silence(300), test::tone(600)});

    auto phrases = segmenter.split(audio);
    ASSERT_EQ(phrases.size(), 2u);
    EXPECT_EQ(phrases[0].duration_ms(), 600);
    EXPECT_EQ(phrases[1].duration_ms(), 600);
}

TEST_F(SilenceSegmenterTest, ThresholdDecidesWhatIsSilent) {
    auto quiet = test::dc(1000, 0.005f);   // about -46 dBFS

    EXPECT_TRUE(SilenceSegmenter(300, -40.0).split(quiet).empty());
    EXPECT_EQ(SilenceSegmenter(300, -50.0).split(quiet).size(), 1u);
}

TEST_F(SilenceSegmenterTest, InputShorterThanMinimumSilence) {
    EXPECT_TRUE(segmenter.split(test::silence(200)).empty());

    auto phrases = segmenter.split(test::tone(200));
    ASSERT_EQ(phrases.size(), 1u);
    EXPECT_EQ(phrases[0].duration_ms(), 200);
}

TEST_F(SilenceSegmenterTest, PhrasesPreserveFormatAndOrder) {
    auto audio = test::join({test::tone(400, 0.4f, 440.0, 44100, 2),
                             test::silence(400, 44100, 2),
                             test::tone(600, 0.8f, 440.0, 44100, 2)});

    auto phrases = segmenter.split(audio);
    ASSERT_EQ(phrases.size(), 2u);
    for (const auto& p : phrases) {
        EXPECT_EQ(p.sample_rate(), 44100);
        EXPECT_EQ(p.channels(), 2);
    }
    EXPECT_LT(phrases[0].rms(), phrases[1].rms());
}

TEST_F(SilenceSegmenterTest, OutputNeverLongerThanInput) {
    auto audio = test::join({test::silence(150), test::tone(700), test::silence(350),
                             test::tone(90), test::silence(1000), test::tone(1300),
                             test::silence(299), test::tone(50)});

    auto phrases = segmenter.split(audio);
    EXPECT_LE(test::total_ms(phrases), audio.duration_ms());
    EXPECT_EQ(phrases.size(), 3u);
}
