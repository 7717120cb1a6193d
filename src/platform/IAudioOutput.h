#pragma once

#include <functional>
#include <string>
#include "../core/audio/AudioFormat.h"

// Output device seam. The device (or a clock standing in for one)
// calls the render callback with an interleaved float32 buffer on its
// own thread; the callback must fill every frame and never block.
class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    IAudioOutput(const IAudioOutput&) = delete;
    IAudioOutput& operator=(const IAudioOutput&) = delete;

    using RenderCallback = std::function<int(float*, int)>;

    // Lifecycle
    virtual bool open(const AudioStreamFormat& format, int bufferFrames) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual void close() = 0;
    virtual bool isRunning() const = 0;

    // Callback
    virtual void setRenderCallback(RenderCallback cb) = 0;

    virtual std::string deviceName() const = 0;

protected:
    IAudioOutput() = default;
};
