#pragma once

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include "IAudioOutput.h"

// Headless output: a steady-clock thread pulls one buffer per period
// from the render callback and discards it. Used with --null-output
// and for tests that want real-time pacing without a sound card.
class NullAudioOutput : public IAudioOutput {
public:
    NullAudioOutput() = default;
    ~NullAudioOutput() override;

    bool open(const AudioStreamFormat& format, int bufferFrames) override;
    bool start() override;
    void stop() override;
    void close() override;
    bool isRunning() const override { return m_running.load(std::memory_order_acquire); }

    void setRenderCallback(RenderCallback cb) override;

    std::string deviceName() const override { return "null"; }

    // Frames pulled since open()
    int64_t framesRendered() const { return m_framesRendered.load(std::memory_order_relaxed); }

private:
    void run();

    AudioStreamFormat m_format;
    int m_bufferFrames = 1024;
    bool m_open = false;

    std::mutex m_callbackMutex;
    RenderCallback m_callback;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<int64_t> m_framesRendered{0};
    std::vector<float> m_buffer;
};
