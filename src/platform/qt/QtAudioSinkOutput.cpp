#include "QtAudioSinkOutput.h"

#include <QAudioDevice>
#include <QAudioFormat>
#include <QAudioSink>
#include <QDebug>
#include <QMediaDevices>
#include <cstring>

// Read-only device whose readData() pulls float frames from the engine.
class QtAudioSinkOutput::RenderDevice : public QIODevice {
public:
    void setChannels(int channels) { m_channels = channels > 0 ? channels : 2; }

    void setCallback(RenderCallback cb)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callback = std::move(cb);
    }

    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override { return 1 << 20; }

protected:
    qint64 readData(char* data, qint64 maxSize) override
    {
        const qint64 frameBytes = qint64(sizeof(float)) * m_channels;
        const int frames = int(maxSize / frameBytes);
        if (frames <= 0) return 0;

        float* buf = reinterpret_cast<float*>(data);
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_callback)
            m_callback(buf, frames);
        else
            std::memset(buf, 0, size_t(frames) * frameBytes);
        return frames * frameBytes;
    }

    qint64 writeData(const char*, qint64) override { return -1; }

private:
    std::mutex m_mutex;
    RenderCallback m_callback;
    int m_channels = 2;
};

QtAudioSinkOutput::QtAudioSinkOutput()
    : m_source(std::make_unique<RenderDevice>())
{
}

QtAudioSinkOutput::~QtAudioSinkOutput()
{
    close();
}

bool QtAudioSinkOutput::open(const AudioStreamFormat& format, int bufferFrames)
{
    close();

    QAudioDevice device = QMediaDevices::defaultAudioOutput();
    if (device.isNull()) {
        qWarning() << "[Output] No audio output device";
        return false;
    }

    QAudioFormat fmt;
    fmt.setSampleRate(int(format.sampleRate));
    fmt.setChannelCount(format.channels);
    fmt.setSampleFormat(QAudioFormat::Float);
    if (!device.isFormatSupported(fmt)) {
        qWarning() << "[Output]" << device.description() << "does not accept"
                   << fmt.sampleRate() << "Hz float" << fmt.channelCount() << "ch";
        return false;
    }

    m_sink = std::make_unique<QAudioSink>(device, fmt);
    m_sink->setBufferSize(qsizetype(bufferFrames) * fmt.bytesPerFrame() * 4);
    m_source->setChannels(format.channels);
    m_deviceName = device.description().toStdString();
    qDebug() << "[Output] QAudioSink on" << device.description() << fmt.sampleRate()
             << "Hz" << fmt.channelCount() << "ch";
    return true;
}

bool QtAudioSinkOutput::start()
{
    if (!m_sink) return false;
    if (m_running) return true;

    if (!m_source->isOpen() && !m_source->open(QIODevice::ReadOnly))
        return false;
    m_sink->start(m_source.get());
    if (m_sink->error() != QAudio::NoError) {
        qWarning() << "[Output] QAudioSink failed to start:" << m_sink->error();
        return false;
    }
    m_running = true;
    return true;
}

void QtAudioSinkOutput::stop()
{
    if (m_sink && m_running)
        m_sink->stop();
    m_running = false;
}

void QtAudioSinkOutput::close()
{
    stop();
    m_sink.reset();
    if (m_source->isOpen())
        m_source->close();
}

void QtAudioSinkOutput::setRenderCallback(RenderCallback cb)
{
    m_source->setCallback(std::move(cb));
}
