#include <cstdint>
#include <memory>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <QSignalSpy>

#include "AudioCaptureEngine.h"
#include "AudioRingBuffer.h"
#include "LevelStream.h"
#include "fakes.h"

using namespace test;
using Kind = DictationError::Kind;

namespace {

template <typename T>
T run(QCoro::Task<T>&& task) {
    return QCoro::waitFor(std::move(task));
}

Kind kindOf(auto&& fn) {
    try {
        fn();
    } catch (const DictationError& ex) {
        return ex.kind();
    }
    FAIL("No DictationError was thrown");
    return Kind::AudioRecordingFailed;
}

} // anon ns

TEST_CASE("AudioRingBuffer", "[audio]") {
    AudioRingBuffer ring{3};

    SECTION("DrainReturnsOldestFirst") {
        ring.push({1.0f});
        ring.push({2.0f});
        const auto chunks = ring.drain();
        REQUIRE(chunks.size() == 2);
        REQUIRE(chunks[0].front() == 1.0f);
        REQUIRE(chunks[1].front() == 2.0f);
        REQUIRE(ring.size() == 0);
    }

    SECTION("DropsOldestWhenFull") {
        for (int i = 0; i < 5; ++i) {
            ring.push({static_cast<float>(i)});
        }
        REQUIRE(ring.size() == 3);
        REQUIRE(ring.droppedChunks() == 2);
        REQUIRE(ring.drain().front().front() == 2.0f);
    }
}

TEST_CASE("LevelStream", "[audio]") {
    LevelStream stream;

    SECTION("ClampsLevels") {
        stream.push(1.5f);
        stream.push(-0.5f);
        const auto levels = stream.takeAll();
        REQUIRE(levels == std::vector<float>{1.0f, 0.0f});
    }

    SECTION("IgnoresLevelsAfterClose") {
        QSignalSpy closed{&stream, &LevelStream::closed};
        stream.push(0.5f);
        stream.close();
        stream.close();
        stream.push(0.7f);
        REQUIRE(stream.isClosed());
        REQUIRE(stream.totalCount() == 1);
        REQUIRE(closed.count() == 1);
    }
}

TEST_CASE("AudioCaptureEngine", "[audio]") {
    FakeAudioBackend backend;
    AudioCaptureEngine engine{backend};

    SECTION("ListsDevices") {
        const auto devices = engine.listInputDevices();
        REQUIRE(devices.size() == 1);
        REQUIRE(devices.front().id == "mic-1");
    }

    SECTION("SetUnknownDeviceThrows") {
        REQUIRE(kindOf([&] { engine.setDevice("nope"); }) == Kind::DeviceUnavailable);
        REQUIRE(engine.selectedDeviceId().empty());
        engine.setDevice("mic-1");
        REQUIRE(engine.selectedDeviceId() == "mic-1");
    }

    SECTION("StopWithoutCaptureReturnsEmptyBuffer") {
        const auto buffer = run(engine.stopCapture());
        REQUIRE(buffer.empty());
        REQUIRE(buffer.sample_rate == 16000);
    }

    SECTION("StopWithZeroSamplesReturnsEmptyBuffer") {
        auto stream = run(engine.startCapture());
        REQUIRE(stream);
        REQUIRE(engine.phase() == AudioCaptureEngine::Phase::Capturing);

        const auto buffer = run(engine.stopCapture());
        REQUIRE(buffer.empty());
        REQUIRE(engine.phase() == AudioCaptureEngine::Phase::Idle);
        REQUIRE(stream->isClosed());
        REQUIRE_FALSE(backend.isOpen());
    }

    SECTION("CollectsSamples") {
        auto stream = run(engine.startCapture());
        REQUIRE(engine.isCapturing());
        REQUIRE(backend.open_device.id == "mic-1");

        const auto samples = tone(16000);
        backend.feed(samples);

        const auto buffer = run(engine.stopCapture());
        REQUIRE(buffer.samples.size() == samples.size());
        REQUIRE(buffer.samples == samples);
        REQUIRE_THAT(buffer.durationSeconds(), Catch::Matchers::WithinAbs(1.0, 0.001));
    }

    SECTION("PublishesLevels") {
        auto stream = run(engine.startCapture());
        backend.feed(tone(8000, 0.8f));

        REQUIRE(waitUntil([&] { return stream->totalCount() > 0; }));
        for (const auto level : stream->takeAll()) {
            REQUIRE(level >= 0.0f);
            REQUIRE(level <= 1.0f);
        }

        run(engine.stopCapture());
        REQUIRE(stream->isClosed());
    }

    SECTION("ConvertsToWhisperFormat") {
        QAudioFormat format;
        format.setSampleRate(48000);
        format.setChannelCount(2);
        format.setSampleFormat(QAudioFormat::Int16);
        backend.format = format;

        run(engine.startCapture());

        // One second of stereo 16 bit PCM at half amplitude
        std::vector<int16_t> pcm(48000 * 2, 16384);
        backend.feedRaw(QByteArray{reinterpret_cast<const char *>(pcm.data()),
                                   static_cast<qsizetype>(pcm.size() * sizeof(int16_t))});

        const auto buffer = run(engine.stopCapture());
        REQUIRE(buffer.samples.size() >= 15998);
        REQUIRE(buffer.samples.size() <= 16002);
        REQUIRE_THAT(buffer.samples.back(), Catch::Matchers::WithinAbs(0.5, 0.01));
    }

    SECTION("CancelIsIdempotent") {
        auto stream = run(engine.startCapture());
        backend.feed(tone(1600));

        engine.cancelCapture();
        engine.cancelCapture();

        REQUIRE(backend.closes == 1);
        REQUIRE(engine.phase() == AudioCaptureEngine::Phase::Idle);
        REQUIRE(waitUntil([&] { return stream->isClosed(); }));

        // The discarded samples do not leak into the next capture
        run(engine.startCapture());
        REQUIRE(run(engine.stopCapture()).empty());
    }

    SECTION("CancelWhenIdleDoesNothing") {
        engine.cancelCapture();
        REQUIRE(backend.closes == 0);
    }

    SECTION("SecondStartFails") {
        run(engine.startCapture());
        REQUIRE(kindOf([&] { run(engine.startCapture()); }) == Kind::AudioRecordingFailed);
        REQUIRE(engine.isCapturing());
    }

    SECTION("OpenFailure") {
        backend.fail_open = true;
        REQUIRE(kindOf([&] { run(engine.startCapture()); }) == Kind::AudioRecordingFailed);
        REQUIRE(engine.phase() == AudioCaptureEngine::Phase::Idle);
        REQUIRE_FALSE(engine.isCapturing());
    }

    SECTION("SelectedDeviceGoneUsesDefault") {
        backend.addDevice({"usb", "USB headset", false});
        engine.setDevice("usb");
        backend.removeDevice("usb");

        run(engine.startCapture());
        REQUIRE(engine.activeDevice().id == "mic-1");
    }
}

TEST_CASE("AudioCaptureEngine without devices", "[audio]") {
    FakeAudioBackend backend{{}};
    AudioCaptureEngine engine{backend};

    REQUIRE(kindOf([&] { run(engine.startCapture()); }) == Kind::NoDeviceAvailable);
    REQUIRE(engine.phase() == AudioCaptureEngine::Phase::Idle);
}

TEST_CASE("AudioCaptureEngine device loss", "[audio]") {
    FakeAudioBackend backend{{{"usb", "USB headset", false}, {"mic-1", "Built-in microphone", true}}};
    AudioCaptureEngine engine{backend};
    QSignalSpy failed{&engine, &AudioCaptureEngine::captureFailed};
    QSignalSpy fallback{&engine, &AudioCaptureEngine::deviceFallback};

    SECTION("FallsBackToDefault") {
        engine.setDevice("usb");
        run(engine.startCapture());
        backend.feed(tone(1600));

        backend.removeDevice("usb");
        REQUIRE(fallback.count() == 1);
        REQUIRE(failed.count() == 0);
        REQUIRE(engine.isCapturing());
        REQUIRE(engine.activeDevice().id == "mic-1");
        REQUIRE(backend.open_device.id == "mic-1");

        backend.feed(tone(1600));
        const auto buffer = run(engine.stopCapture());
        REQUIRE(buffer.samples.size() == 3200);
    }

    SECTION("FailsWithoutDefault") {
        engine.setDevice("mic-1");
        auto stream = run(engine.startCapture());

        backend.removeDevice("mic-1");
        backend.removeDevice("usb");

        REQUIRE(failed.count() == 1);
        REQUIRE(failed.first().first().toString().contains("disconnected"));
        REQUIRE_FALSE(engine.isCapturing());
        REQUIRE(engine.phase() == AudioCaptureEngine::Phase::Idle);
        REQUIRE(waitUntil([&] { return stream->isClosed(); }));
    }

    SECTION("StreamErrorTriggersFallback") {
        engine.setDevice("usb");
        run(engine.startCapture());

        emit backend.streamError("device error");
        REQUIRE(fallback.count() == 1);
        REQUIRE(engine.activeDevice().id == "mic-1");
    }
}
