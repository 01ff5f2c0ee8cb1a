#ifndef SENSORSCOPE_SESSION_STREAMSESSION_H
#define SENSORSCOPE_SESSION_STREAMSESSION_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QMutex>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "scope/Config.h"
#include "scope/Device.h"
#include "scope/FrameDecoder.h"
#include "scope/RateQuantizer.h"
#include "scope/StreamRegistry.h"

// Producer side of a streaming session: owns the device collaborator, decodes
// its frames and appends them to the registry. ingest() runs on the device's
// thread; everything else is called from the thread the session lives in.
class StreamSession : public QObject {
    Q_OBJECT
public:
    explicit StreamSession(const scope::SessionConfig& cfg, QObject* parent = nullptr);
    ~StreamSession();

    void setDevice(std::unique_ptr<scope::IDevice> device);
    scope::IDevice* device() const { return device_.get(); }

    bool start();
    void stop();
    bool streaming() const { return streaming_.load(); }

    void ingest(const scope::Frame& frame);
    // Transport-level drop: input that never became a frame.
    void dropInput(const std::string& why);

    // At most one tickAppended is in flight; the receiver calls this before
    // reading the buffers so the next tick notifies again.
    void tickConsumed() { tickPending_.store(false); }

    // Quantizes, writes the applied rate to the device inside a best-effort
    // stop/start bracket and hard-resets the buffers.
    // Throws scope::InvalidSamplingRate for requestedHz <= 0.
    scope::QuantizedRate applySamplingRate(double requestedHz);
    void setTimeWindow(double seconds);

    scope::SamplingRateState rateState() const;

    scope::Series snapshot(const QString& channel) const;
    bool extent(const QStringList& channels, float& lo, float& hi) const;
    const scope::StreamRegistry& registry() const { return registry_; }

    QStringList enabledChannels() const;
    QStringList groupMembers(const QString& group) const;
    const scope::SensorSet& sensors() const { return sensors_; }

    qulonglong framesOk() const { return ok_.load(); }
    qulonglong framesBad() const { return bad_.load(); }

signals:
    void tickAppended(int tMs);
    void buffersReset();
    void samplingRateApplied(double requestedHz, double appliedHz);
    void statusText(QString text);
    void statsUpdated(qulonglong ok, qulonglong bad);

private:
    void maybeEmitStats();
    void stopDeviceQuietly();
    void startDeviceQuietly();

private:
    scope::SensorSet sensors_;
    scope::FrameDecoder decoder_;
    scope::StreamRegistry registry_;

    std::unique_ptr<scope::IDevice> device_;
    std::atomic<bool> streaming_{false};

    scope::SamplingRateState rate_;
    mutable QMutex rateMu_;

    std::atomic<qulonglong> ok_{0};
    std::atomic<qulonglong> bad_{0};
    std::atomic<uint64_t> lastStatsNs_{0};
    std::atomic<bool> tickPending_{false};
};

#endif
