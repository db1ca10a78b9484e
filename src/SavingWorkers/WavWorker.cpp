#include "WavWorker.hpp"
#include "../common/debug_log.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace push_to_talk {

namespace {

// Growable in-memory file for sf_open_virtual
struct MemoryFile {
    std::vector<uint8_t> bytes;
    sf_count_t position = 0;
};

sf_count_t MemoryGetLength(void* userData) {
    return static_cast<sf_count_t>(static_cast<MemoryFile*>(userData)->bytes.size());
}

sf_count_t MemorySeek(sf_count_t offset, int whence, void* userData) {
    auto* file = static_cast<MemoryFile*>(userData);
    sf_count_t target = 0;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = file->position + offset; break;
        case SEEK_END: target = static_cast<sf_count_t>(file->bytes.size()) + offset; break;
        default: return -1;
    }
    if (target < 0) {
        return -1;
    }
    file->position = target;
    return file->position;
}

sf_count_t MemoryRead(void* ptr, sf_count_t count, void* userData) {
    auto* file = static_cast<MemoryFile*>(userData);
    const sf_count_t size = static_cast<sf_count_t>(file->bytes.size());
    if (file->position >= size) {
        return 0;
    }
    const sf_count_t available = std::min(count, size - file->position);
    std::memcpy(ptr, file->bytes.data() + file->position, static_cast<size_t>(available));
    file->position += available;
    return available;
}

sf_count_t MemoryWrite(const void* ptr, sf_count_t count, void* userData) {
    auto* file = static_cast<MemoryFile*>(userData);
    const size_t end = static_cast<size_t>(file->position + count);
    if (file->bytes.size() < end) {
        file->bytes.resize(end);
    }
    std::memcpy(file->bytes.data() + file->position, ptr, static_cast<size_t>(count));
    file->position += count;
    return count;
}

sf_count_t MemoryTell(void* userData) {
    return static_cast<MemoryFile*>(userData)->position;
}

SF_INFO MakeInfo(unsigned int sampleRate, unsigned int channels) {
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));
    sfinfo.samplerate = static_cast<int>(sampleRate);
    sfinfo.channels = static_cast<int>(channels);
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;
    return sfinfo;
}

} // namespace

WavWorker::WavWorker(std::string filename)
    : _filename(std::move(filename)) {
}

void WavWorker::SetClip(AudioClip clip) {
    SetSampleRate(clip.sampleRate);
    SetChannels(clip.channels);
    SetAudioData(std::move(clip.samples));
}

void WavWorker::CheckFormat() const {
    if (!_setter_called || _sampleRate == 0) {
        throw SavingWorkerException("Sample rate must be specified");
    }
    if (_channels == 0) {
        throw SavingWorkerException("Channel count must be positive");
    }
}

std::vector<uint8_t> WavWorker::Encode() const {
    CheckFormat();
    if (_audioData.empty()) {
        PTT_DEBUG_LOG("No audio data to encode!" << PTT_DEBUG_LOG_ENDL);
        return {};
    }

    SF_VIRTUAL_IO io;
    io.get_filelen = &MemoryGetLength;
    io.seek = &MemorySeek;
    io.read = &MemoryRead;
    io.write = &MemoryWrite;
    io.tell = &MemoryTell;

    MemoryFile file;
    SF_INFO sfinfo = MakeInfo(_sampleRate, _channels);

    SNDFILE* outfile = sf_open_virtual(&io, SFM_WRITE, &sfinfo, &file);
    if (!outfile) {
        std::cerr << "Error: could not open in-memory WAV: " << sf_strerror(nullptr) << std::endl;
        return {};
    }

    const sf_count_t frames = static_cast<sf_count_t>(_audioData.size() / _channels);
    sf_count_t framesWritten = sf_writef_short(outfile, _audioData.data(), frames);
    sf_close(outfile);

    if (framesWritten != frames) {
        std::cerr << "Error: wrote " << framesWritten << " frames, expected " << frames << std::endl;
        return {};
    }

    return std::move(file.bytes);
}

bool WavWorker::Save() {
    CheckFormat();
    if (_audioData.empty()) {
        PTT_DEBUG_LOG("No audio data to save!" << PTT_DEBUG_LOG_ENDL);
        return false;
    }
    if (_filename.empty()) {
        std::cerr << "Error: no output filename set" << std::endl;
        return false;
    }

    SF_INFO sfinfo = MakeInfo(_sampleRate, _channels);

    SNDFILE* outfile = sf_open(_filename.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        std::cerr << "Error: could not open output file: " << _filename << std::endl;
        return false;
    }

    const sf_count_t frames = static_cast<sf_count_t>(_audioData.size() / _channels);
    sf_count_t framesWritten = sf_writef_short(outfile, _audioData.data(), frames);
    sf_close(outfile);

    if (framesWritten != frames) {
        std::cerr << "Error: wrote " << framesWritten << " frames, expected " << frames << std::endl;
        return false;
    }

    PTT_DEBUG_LOG("Successfully saved " << _audioData.size() << " samples to " << _filename << PTT_DEBUG_LOG_ENDL);
    return true;
}

} // namespace push_to_talk
