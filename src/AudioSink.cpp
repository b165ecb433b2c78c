#include <cassert>

#include "AudioSink.h"
#include "logging.h"

using namespace std;

AudioSink::AudioSink(AudioRingBuffer &ring, const std::atomic_bool &capturing,
                     chunk_ready_t onChunkReady, QObject *parent)
    : QIODevice(parent)
    , ring_{ring}
    , capturing_{capturing}
    , on_chunk_ready_{std::move(onChunkReady)}
{
    QAudioFormat format;
    format.setSampleRate(output_rate);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Float);
    setInputFormat(format);
}

void AudioSink::setInputFormat(const QAudioFormat &format)
{
    LOG_DEBUG_N << "Input format: " << format.sampleRate() << " Hz, "
                << format.channelCount() << " channel(s), "
                << format.bytesPerSample() << " bytes per sample";

    lock_guard lock{mutex_};
    format_ = format;
    resetConversion();
}

QAudioFormat AudioSink::inputFormat() const
{
    lock_guard lock{mutex_};
    return format_;
}

void AudioSink::flush()
{
    bool pushed = false;
    {
        lock_guard lock{mutex_};
        if (!block_.empty()) {
            pushBlock();
            pushed = true;
        }
    }

    if (pushed && on_chunk_ready_) {
        on_chunk_ready_();
    }
}

bool AudioSink::open(OpenMode mode)
{
    if (!(mode & WriteOnly)) {
        LOG_ERROR_N << "AudioSink can only be opened in WriteOnly mode";
        return false;
    }

    {
        lock_guard lock{mutex_};
        resetConversion();
    }

    const auto res = QIODevice::open(mode);
    if (!res) {
        LOG_ERROR_N << "Failed to open AudioSink";
    }
    return res;
}

void AudioSink::close()
{
    LOG_TRACE_N << "Closing AudioSink";
    QIODevice::close();
}

qint64 AudioSink::writeData(const char *data, qint64 len)
{
    if (!capturing_.load(memory_order_acquire)) {
        return len;
    }

    uint64_t blocks_before = 0;
    uint64_t blocks_after = 0;
    {
        lock_guard lock{mutex_};
        blocks_before = pushed_blocks_;

        if (partial_frame_.isEmpty()) {
            appendFrames({data, static_cast<size_t>(len)});
        } else {
            partial_frame_.append(data, len);
            const auto frames = std::move(partial_frame_);
            partial_frame_.clear();
            appendFrames({frames.constData(), static_cast<size_t>(frames.size())});
        }

        blocks_after = pushed_blocks_;
    }

    if (blocks_after != blocks_before && on_chunk_ready_) {
        on_chunk_ready_();
    }

    return len;
}

void AudioSink::appendFrames(std::span<const char> frames)
{
    const auto frame_size = static_cast<size_t>(format_.bytesPerFrame());
    const auto sample_size = static_cast<size_t>(format_.bytesPerSample());
    const auto channels = format_.channelCount();
    if (frame_size == 0 || channels <= 0) {
        LOG_WARN_N << "Dropping audio in an invalid format";
        return;
    }

    const auto whole = frames.size() - (frames.size() % frame_size);
    for (size_t offset = 0; offset < whole; offset += frame_size) {
        const char *frame = frames.data() + offset;

        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += format_.normalizedSampleValue(frame + ch * sample_size);
        }
        appendSample(sum / static_cast<float>(channels));
    }

    if (whole < frames.size()) {
        partial_frame_.append(frames.data() + whole, static_cast<qsizetype>(frames.size() - whole));
    }
}

void AudioSink::appendSample(float sample)
{
    if (step_ == 1.0) {
        block_.push_back(sample);
    } else {
        // Linear interpolation between the previous and the current input sample
        while (phase_ < 1.0) {
            block_.push_back(prev_ + (sample - prev_) * static_cast<float>(phase_));
            phase_ += step_;
        }
        phase_ -= 1.0;
        prev_ = sample;
    }

    if (block_.size() >= block_samples) {
        pushBlock();
    }
}

void AudioSink::resetConversion()
{
    partial_frame_.clear();
    block_.clear();
    block_.reserve(block_samples + 8);
    phase_ = 0.0;
    prev_ = 0.0f;

    const auto rate = format_.sampleRate();
    step_ = rate > 0 ? static_cast<double>(rate) / output_rate : 1.0;
}

void AudioSink::pushBlock()
{
    assert(!block_.empty());
    ring_.push(std::move(block_));
    ++pushed_blocks_;
    block_ = {};
    block_.reserve(block_samples + 8);
}
