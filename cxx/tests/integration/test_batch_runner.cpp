#include <gtest/gtest.h>
#include "BatchRunner.hpp"
#include "Logger.hpp"
#include "WavFile.hpp"
#include "TestHelper.hpp"
#include <filesystem>
#include <fstream>

using namespace wavchunk;
namespace fs = std::filesystem;

class BatchRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ChunkLogger::instance().set_quiet(true);
        config.output_dir = (out.path() / "chunks").string();
        config.workers = 2;
    }

    void TearDown() override {
        ChunkLogger::instance().set_quiet(false);
    }

    std::string write_wav(const std::string& name, const AudioBuffer& audio) {
        const std::string path = in.file(name);
        EXPECT_TRUE(WavFile::save(path, audio));
        return path;
    }

    test::ScratchDir in{"batch_in"};
    test::ScratchDir out{"batch_out"};
    ChunkerConfig config;
};

TEST_F(BatchRunnerTest, MixedBatchReportsPerFile) {
    const std::string speech = write_wav("speech.wav",
        test::join({test::tone(3000), test::silence(600), test::tone(7000)}));
    const std::string quiet = write_wav("quiet.wav", test::silence(2000));
    const std::string broken = in.file("broken.wav");
    std::ofstream(broken, std::ios::binary) << "RIFF....WAVEjunk";

    auto reports = BatchRunner(config).run({speech, quiet, broken});
    ASSERT_EQ(reports.size(), 3u);

    EXPECT_EQ(reports[0].input_path, speech);
    EXPECT_EQ(reports[0].status, FileReport::Status::Ok);
    ASSERT_FALSE(reports[0].outputs.empty());
    EXPECT_EQ(fs::path(reports[0].outputs[0]).filename().string(), "speech_part001.wav");
    for (size_t i = 0; i < reports[0].outputs.size(); ++i) {
        EXPECT_TRUE(fs::exists(reports[0].outputs[i]));
        AudioBuffer chunk;
        ASSERT_TRUE(WavFile::load(reports[0].outputs[i], chunk));
        EXPECT_EQ(chunk.duration_ms(), reports[0].durations_ms[i]);
        EXPECT_GE(chunk.duration_ms(), config.min_ms());
    }

    EXPECT_EQ(reports[1].status, FileReport::Status::Empty);
    EXPECT_TRUE(reports[1].outputs.empty());

    EXPECT_EQ(reports[2].status, FileReport::Status::InvalidAudioInput);
    EXPECT_FALSE(reports[2].error.empty());

    auto summary = BatchRunner::summarize(reports);
    EXPECT_EQ(summary.files, 3u);
    EXPECT_EQ(summary.chunks, reports[0].outputs.size());
    EXPECT_EQ(summary.empty, 1u);
    EXPECT_EQ(summary.failed, 1u);
}

TEST_F(BatchRunnerTest, FailureInsideOneFileLeavesOthersRunning) {
    // Padding the short file to this length cannot be allocated
    config.ideal_pad_sec = 1e9;

    const std::string good = write_wav("good.wav", test::tone(1500));
    const std::string bad = write_wav("bad.wav", test::tone(300));
    const std::string later = write_wav("later.wav", test::tone(2000));

    auto reports = BatchRunner(config).run({good, bad, later});
    ASSERT_EQ(reports.size(), 3u);

    EXPECT_EQ(reports[0].status, FileReport::Status::Ok);
    EXPECT_EQ(reports[0].outputs.size(), 1u);

    EXPECT_TRUE(reports[1].failed());
    EXPECT_EQ(reports[1].input_path, bad);
    EXPECT_FALSE(reports[1].error.empty());
    EXPECT_TRUE(reports[1].outputs.empty());

    EXPECT_EQ(reports[2].status, FileReport::Status::Ok);
    EXPECT_EQ(reports[2].outputs.size(), 1u);

    EXPECT_EQ(BatchRunner::summarize(reports).failed, 1u);
}

TEST_F(BatchRunnerTest, UnusableOutputDirectoryIsWriteFailure) {
    const std::string path = write_wav("speech.wav", test::tone(1500));
    const std::string blocker = out.file("occupied");
    std::ofstream(blocker) << "x";
    config.output_dir = blocker;

    auto reports = BatchRunner(config).run({path});
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].status, FileReport::Status::WriteFailed);
    EXPECT_FALSE(reports[0].error.empty());
}

TEST_F(BatchRunnerTest, ChunksKeepInputEncoding) {
    const std::string path = in.file("phone.wav");
    ASSERT_TRUE(WavFile::save(path, test::tone(1500, 0.5f, 440.0, 8000, 1), SampleFormat::Ulaw));

    auto reports = BatchRunner(config).run({path});
    ASSERT_EQ(reports[0].outputs.size(), 1u);

    AudioBuffer chunk;
    SampleFormat format = SampleFormat::Pcm16;
    ASSERT_TRUE(WavFile::load(reports[0].outputs[0], chunk, &format));
    EXPECT_EQ(format, SampleFormat::Ulaw);
    EXPECT_EQ(chunk.sample_rate(), 8000);
}

TEST_F(BatchRunnerTest, ExportsAreLogged) {
    const std::string path = write_wav("short.wav", test::tone(1500));
    ChunkLogger::instance().clear_history();

    auto reports = BatchRunner(config).run({path});
    ASSERT_EQ(reports[0].outputs.size(), 1u);

    bool found = false;
    for (const auto& entry : ChunkLogger::instance().history()) {
        if (entry.tag == "Export") {
            found = true;
            EXPECT_NE(entry.message.find("short_part001.wav"), std::string::npos);
            EXPECT_NE(entry.message.find("(length=1500 ms)"), std::string::npos);
            EXPECT_DOUBLE_EQ(entry.value.value_or(0.0), 1500.0);
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(BatchRunnerTest, ManyFilesKeepInputOrder) {
    std::vector<std::string> files;
    for (int i = 0; i < 6; ++i) {
        files.push_back(write_wav("f" + std::to_string(i) + ".wav", test::tone(1200 + 100 * i)));
    }
    config.workers = 4;

    auto reports = BatchRunner(config).run(files);
    ASSERT_EQ(reports.size(), files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(reports[i].input_path, files[i]);
        ASSERT_EQ(reports[i].durations_ms.size(), 1u);
        EXPECT_EQ(reports[i].durations_ms[0], 1200 + 100 * static_cast<int64_t>(i));
    }
}

TEST_F(BatchRunnerTest, ListsWavFilesSorted) {
    write_wav("b.wav", test::tone(100));
    write_wav("A.WAV", test::tone(100));
    std::ofstream(in.file("notes.txt")) << "x";
    fs::create_directories(in.path() / "nested.wav");

    auto files = BatchRunner::list_wav_files(in.path().string());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "A.WAV");
    EXPECT_EQ(fs::path(files[1]).filename().string(), "b.wav");

    EXPECT_TRUE(BatchRunner::list_wav_files(in.file("missing")).empty());
}

TEST_F(BatchRunnerTest, WorkerCount) {
    config.workers = 3;
    BatchRunner runner(config);
    EXPECT_EQ(runner.worker_count(10), 3u);
    EXPECT_EQ(runner.worker_count(2), 2u);
    EXPECT_EQ(runner.worker_count(0), 1u);

    config.workers = 0;
    EXPECT_GE(BatchRunner(config).worker_count(64), 1u);
}

TEST_F(BatchRunnerTest, EmptyBatch) {
    EXPECT_TRUE(BatchRunner(config).run({}).empty());
    auto summary = BatchRunner::summarize({});
    EXPECT_EQ(summary.files, 0u);
}
