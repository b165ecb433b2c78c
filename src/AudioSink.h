#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <span>
#include <vector>

#include <QAudioFormat>
#include <QIODevice>

#include "AudioRingBuffer.h"

/*! Write-only QIODevice that receives PCM from the audio source.
 *
 *  Incoming data is converted to 16 kHz mono float and handed over to the
 *  ring buffer in blocks of ~50 ms. Writes are dropped unless the shared
 *  capturing flag is set.
 */
class AudioSink : public QIODevice
{
    Q_OBJECT
public:
    using chunk_ready_t = std::function<void()>;

    static constexpr int output_rate = 16000;
    static constexpr size_t block_samples = output_rate / 20;

    AudioSink(AudioRingBuffer& ring, const std::atomic_bool& capturing,
              chunk_ready_t onChunkReady, QObject *parent = nullptr);

    /*! Sets the format the data arrives in. Resets the conversion state. */
    void setInputFormat(const QAudioFormat& format);

    QAudioFormat inputFormat() const;

    /*! Pushes a partially filled block to the ring buffer. */
    void flush();

    bool open(OpenMode mode) override;

    void close() override;

    bool isSequential() const override {
        return true;
    }

protected:
    qint64 readData(char *, qint64) override {
        return -1;
    }

    qint64 writeData(const char *data, qint64 len) override;

private:
    void appendFrames(std::span<const char> frames);
    void appendSample(float sample);
    void resetConversion();
    void pushBlock();

    AudioRingBuffer& ring_;
    const std::atomic_bool& capturing_;
    const chunk_ready_t on_chunk_ready_;

    mutable std::mutex mutex_;
    QAudioFormat format_;
    QByteArray partial_frame_;
    std::vector<float> block_;
    double step_{1.0};      // input samples per output sample
    double phase_{};        // position between prev_ and the next input sample
    float prev_{};
    uint64_t pushed_blocks_{};
};
