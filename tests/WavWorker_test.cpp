#include "SavingWorkers/WavWorker.hpp"

#include <gtest/gtest.h>
#include <sndfile.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace push_to_talk;

namespace {

uint32_t ReadLE32(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

uint16_t ReadLE16(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

AudioClip MakeRamp(size_t frames, unsigned int sampleRate, unsigned int channels) {
    AudioClip clip;
    clip.sampleRate = sampleRate;
    clip.channels = channels;
    clip.samples.resize(frames * channels);
    for (size_t i = 0; i < clip.samples.size(); ++i) {
        clip.samples[i] = static_cast<int16_t>((i % 200) - 100);
    }
    return clip;
}

} // namespace

TEST(WavWorkerTest, EncodesPcm16Header) {
    WavWorker worker;
    worker.SetClip(MakeRamp(11025, 44100, 1));

    std::vector<uint8_t> wav = worker.Encode();

    ASSERT_GE(wav.size(), 44u + 11025u * 2u);
    EXPECT_EQ(std::memcmp(wav.data(), "RIFF", 4), 0);
    EXPECT_EQ(std::memcmp(wav.data() + 8, "WAVE", 4), 0);
    EXPECT_EQ(std::memcmp(wav.data() + 12, "fmt ", 4), 0);
    EXPECT_EQ(ReadLE16(wav, 20), 1);      // PCM
    EXPECT_EQ(ReadLE16(wav, 22), 1);      // mono
    EXPECT_EQ(ReadLE32(wav, 24), 44100u);
    EXPECT_EQ(ReadLE16(wav, 34), 16);     // bits per sample
    EXPECT_EQ(ReadLE32(wav, 4), wav.size() - 8);
}

TEST(WavWorkerTest, EncodeWithoutSampleRateThrows) {
    WavWorker worker;
    worker.SetAudioData(std::vector<int16_t>(100, 1));

    EXPECT_THROW(worker.Encode(), SavingWorkerException);
    EXPECT_THROW(worker.Save(), SavingWorkerException);
}

TEST(WavWorkerTest, EmptyAudioGivesNothing) {
    WavWorker worker(::testing::TempDir() + "ptt_empty.wav");
    worker.SetSampleRate(16000);

    EXPECT_TRUE(worker.Encode().empty());
    EXPECT_FALSE(worker.Save());
}

TEST(WavWorkerTest, SaveWritesReadableStereoFile) {
    const std::string path = ::testing::TempDir() + "ptt_stereo.wav";
    const AudioClip clip = MakeRamp(4800, 48000, 2);

    WavWorker worker(path);
    worker.SetClip(clip);
    ASSERT_TRUE(worker.Save());

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(info.samplerate, 48000);
    EXPECT_EQ(info.channels, 2);
    EXPECT_EQ(info.frames, 4800);
    EXPECT_EQ(info.format & SF_FORMAT_SUBMASK, SF_FORMAT_PCM_16);

    std::vector<int16_t> samples(clip.samples.size());
    EXPECT_EQ(sf_readf_short(file, samples.data(), info.frames), info.frames);
    sf_close(file);
    EXPECT_EQ(samples, clip.samples);

    std::remove(path.c_str());
}

TEST(WavWorkerTest, SaveWithoutFilenameFails) {
    WavWorker worker;
    worker.SetClip(MakeRamp(10, 8000, 1));
    EXPECT_FALSE(worker.Save());
}
