#include <gtest/gtest.h>
#include "WavFile.hpp"
#include "TestHelper.hpp"
#include <cmath>
#include <fstream>

using namespace wavchunk;

class WavFileTest : public ::testing::Test {
protected:
    test::ScratchDir dir{"wav"};
};

TEST_F(WavFileTest, Pcm16RoundTrip) {
    auto original = test::tone(250, 0.5f, 440.0, 22050, 1);
    const std::string path = dir.file("tone.wav");
    ASSERT_TRUE(WavFile::save(path, original));

    AudioBuffer loaded;
    SampleFormat format = SampleFormat::Float;
    ASSERT_TRUE(WavFile::load(path, loaded, &format));
    EXPECT_EQ(format, SampleFormat::Pcm16);
    EXPECT_EQ(loaded.sample_rate(), 22050);
    EXPECT_EQ(loaded.channels(), 1);
    ASSERT_EQ(loaded.frames(), original.frames());

    auto a = original.samples();
    auto b = loaded.samples();
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_NEAR(a[i], b[i], 1.0f / 16384.0f);
    }
}

TEST_F(WavFileTest, EncodingIsReported) {
    auto original = test::tone(100, 0.25f, 440.0, 48000, 2);

    const std::pair<SampleFormat, const char*> cases[] = {
        {SampleFormat::Pcm24, "p24.wav"},
        {SampleFormat::Pcm32, "p32.wav"},
        {SampleFormat::Float, "f32.wav"},
    };
    for (const auto& [fmt, name] : cases) {
        ASSERT_TRUE(WavFile::save(dir.file(name), original, fmt)) << name;

        AudioBuffer loaded;
        SampleFormat format = SampleFormat::Pcm16;
        ASSERT_TRUE(WavFile::load(dir.file(name), loaded, &format)) << name;
        EXPECT_EQ(format, fmt) << name;
        EXPECT_EQ(loaded.channels(), 2);
        EXPECT_EQ(loaded.frames(), original.frames());
        EXPECT_NEAR(loaded.rms(), original.rms(), 1e-4f);
    }
}

TEST_F(WavFileTest, NarrowAndCompandedEncodingsAreReported) {
    auto original = test::tone(100, 0.25f, 440.0, 8000, 1);

    struct Case {
        SampleFormat format;
        const char* name;
        float tolerance;
    };
    const Case cases[] = {
        {SampleFormat::Pcm8, "u8.wav", 1e-2f},
        {SampleFormat::Double, "f64.wav", 1e-6f},
        {SampleFormat::Ulaw, "ulaw.wav", 1e-2f},
        {SampleFormat::Alaw, "alaw.wav", 1e-2f},
    };
    for (const auto& c : cases) {
        ASSERT_TRUE(WavFile::save(dir.file(c.name), original, c.format)) << c.name;

        AudioBuffer loaded;
        SampleFormat format = SampleFormat::Pcm16;
        ASSERT_TRUE(WavFile::load(dir.file(c.name), loaded, &format)) << c.name;
        EXPECT_EQ(format, c.format) << c.name;
        EXPECT_EQ(loaded.frames(), original.frames()) << c.name;
        EXPECT_NEAR(loaded.rms(), original.rms(), c.tolerance) << c.name;
    }
}

TEST_F(WavFileTest, OverRangeSamplesAreClipped) {
    AudioBuffer loud(std::vector<float>{1.5f, -1.5f, 0.0f, 0.5f}, 8000, 1);
    ASSERT_TRUE(WavFile::save(dir.file("loud.wav"), loud));

    AudioBuffer loaded;
    ASSERT_TRUE(WavFile::load(dir.file("loud.wav"), loaded));
    auto s = loaded.samples();
    EXPECT_GT(s[0], 0.99f);
    EXPECT_LT(s[1], -0.99f);
}

TEST_F(WavFileTest, MissingFileFails) {
    AudioBuffer loaded;
    std::string error;
    EXPECT_FALSE(WavFile::load(dir.file("absent.wav"), loaded, nullptr, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_TRUE(loaded.empty());
}

TEST_F(WavFileTest, GarbageFileFails) {
    const std::string path = dir.file("garbage.wav");
    std::ofstream(path, std::ios::binary) << "this is not a RIFF header at all";

    AudioBuffer loaded;
    std::string error;
    EXPECT_FALSE(WavFile::load(path, loaded, nullptr, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(WavFileTest, UnwritableDestinationFails) {
    std::string error;
    EXPECT_FALSE(WavFile::save(dir.file("no/such/dir/out.wav"), test::tone(50), SampleFormat::Pcm16, &error));
    EXPECT_FALSE(error.empty());
}
