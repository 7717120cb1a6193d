#pragma once

#include <functional>
#include <memory>
#include <string>
#include <QString>
#include "AudioFormat.h"

struct Track;

// Decoder adapter seam. A backend turns one source into interleaved
// float32 frames at the output format chosen by setOutputFormat().
// AudioDecoder (FFmpeg) is the shipped backend; tests plug in fakes.
class IDecoder {
public:
    virtual ~IDecoder() = default;

    // Must be called before open(); 0 keeps the source value.
    virtual void setOutputFormat(int sampleRate, int channels) = 0;

    virtual bool open(const std::string& filePath) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Read up to maxFrames interleaved frames into buf.
    // Returns frames read, 0 at end-of-stream, -1 on a decode error
    // (errorString() describes it).
    virtual int read(float* buf, int maxFrames) = 0;

    // Seek to an absolute frame at the output rate.
    virtual bool seek(int64_t frame) = 0;

    virtual AudioStreamFormat format() const = 0;
    virtual int64_t currentFrame() const = 0;

    virtual QString errorString() const = 0;
    virtual QString codecName() const { return QString(); }
};

// Chosen at startup; the core never names the concrete decoder type.
using DecoderFactory = std::function<std::unique_ptr<IDecoder>(const Track&)>;
