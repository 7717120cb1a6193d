#pragma once
#include <string>
#include <memory>
#include <QString>
#include "IDecoder.h"

// FFmpeg backend: demux, decode and convert any supported source to
// interleaved float32 at the requested output rate and channel count.
class AudioDecoder : public IDecoder {
public:
    AudioDecoder();
    ~AudioDecoder() override;

    AudioDecoder(const AudioDecoder&) = delete;
    AudioDecoder& operator=(const AudioDecoder&) = delete;

    void setOutputFormat(int sampleRate, int channels) override;

    bool open(const std::string& filePath) override;
    void close() override;
    bool isOpen() const override;

    int read(float* buf, int maxFrames) override;
    bool seek(int64_t frame) override;

    AudioStreamFormat format() const override;
    int64_t currentFrame() const override;

    QString errorString() const override;

    // Returns the FFmpeg codec name (e.g. "flac", "alac", "mp3") or empty if not loaded
    QString codecName() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};
