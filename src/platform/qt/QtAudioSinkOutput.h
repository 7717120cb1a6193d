#pragma once

#include <QIODevice>
#include <QObject>
#include <memory>
#include <mutex>
#include <vector>
#include "../IAudioOutput.h"

class QAudioSink;

// Qt Multimedia output. QAudioSink runs in pull mode and reads from a
// QIODevice that forwards every read to the render callback.
class QtAudioSinkOutput : public IAudioOutput {
public:
    QtAudioSinkOutput();
    ~QtAudioSinkOutput() override;

    bool open(const AudioStreamFormat& format, int bufferFrames) override;
    bool start() override;
    void stop() override;
    void close() override;
    bool isRunning() const override { return m_running; }

    void setRenderCallback(RenderCallback cb) override;

    std::string deviceName() const override { return m_deviceName; }

private:
    class RenderDevice;

    std::unique_ptr<RenderDevice> m_source;
    std::unique_ptr<QAudioSink> m_sink;
    std::string m_deviceName;
    bool m_running = false;
};
