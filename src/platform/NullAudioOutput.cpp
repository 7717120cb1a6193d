#include "NullAudioOutput.h"
#include <QDebug>
#include <chrono>

NullAudioOutput::~NullAudioOutput()
{
    close();
}

bool NullAudioOutput::open(const AudioStreamFormat& format, int bufferFrames)
{
    if (format.sampleRate <= 0 || format.channels <= 0 || bufferFrames <= 0)
        return false;
    m_format = format;
    m_bufferFrames = bufferFrames;
    m_buffer.assign(size_t(bufferFrames) * format.channels, 0.0f);
    m_framesRendered.store(0, std::memory_order_relaxed);
    m_open = true;
    qDebug() << "[Output] Null output:" << format.sampleRate << "Hz" << format.channels
             << "ch," << bufferFrames << "frames per period";
    return true;
}

bool NullAudioOutput::start()
{
    if (!m_open) return false;
    if (m_running.exchange(true, std::memory_order_acq_rel)) return true;
    m_thread = std::thread(&NullAudioOutput::run, this);
    return true;
}

void NullAudioOutput::stop()
{
    m_running.store(false, std::memory_order_release);
    if (m_thread.joinable())
        m_thread.join();
}

void NullAudioOutput::close()
{
    stop();
    m_open = false;
}

void NullAudioOutput::setRenderCallback(RenderCallback cb)
{
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_callback = std::move(cb);
}

void NullAudioOutput::run()
{
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(m_bufferFrames / m_format.sampleRate));

    auto next = clock::now();
    while (m_running.load(std::memory_order_acquire)) {
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            if (m_callback)
                m_callback(m_buffer.data(), m_bufferFrames);
        }
        m_framesRendered.fetch_add(m_bufferFrames, std::memory_order_relaxed);

        // Absolute deadlines so callback time does not accumulate as drift
        next += period;
        std::this_thread::sleep_until(next);
    }
}
