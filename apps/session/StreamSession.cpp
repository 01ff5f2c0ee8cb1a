#include "StreamSession.h"
#include "Logging.h"

#include <QMutexLocker>

#include <chrono>
#include <exception>

static inline uint64_t now_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

static QStringList toQStringList(const std::vector<std::string>& v) {
    QStringList out;
    out.reserve((int)v.size());
    for (const auto& s : v) out.push_back(QString::fromStdString(s));
    return out;
}

StreamSession::StreamSession(const scope::SessionConfig& cfg, QObject* parent)
    : QObject(parent),
      sensors_(cfg.sensors),
      decoder_(cfg.sensors),
      registry_(scope::enabled_channels(cfg.sensors), (double)cfg.time_window_s,
                scope::quantize_rate(cfg.sampling_rate_hz).applied_hz) {
    rate_.requested_hz = cfg.sampling_rate_hz;
    rate_.applied_hz = registry_.sampling_rate();

    qCInfo(lcSession) << "session:" << registry_.channels().size() << "channels,"
                      << rate_.applied_hz << "Hz," << cfg.time_window_s << "s window, capacity"
                      << registry_.capacity();
}

StreamSession::~StreamSession() {
    if (device_) {
        stopDeviceQuietly();
        device_->set_frame_handler(nullptr);
        device_->set_drop_handler(nullptr);
        try {
            if (device_->is_connected()) device_->disconnect();
        } catch (const std::exception& e) {
            qCWarning(lcSession) << "disconnect on shutdown failed:" << e.what();
        }
    }
}

void StreamSession::setDevice(std::unique_ptr<scope::IDevice> device) {
    if (device_) {
        stopDeviceQuietly();
        device_->set_frame_handler(nullptr);
        device_->set_drop_handler(nullptr);
    }

    device_ = std::move(device);
    if (!device_) return;

    device_->set_frame_handler([this](const scope::Frame& f) { ingest(f); });
    device_->set_drop_handler([this](const std::string& why) { dropInput(why); });
}

bool StreamSession::start() {
    if (!device_) {
        emit statusText("No device");
        return false;
    }

    try {
        if (!device_->is_connected()) {
            emit statusText("Connecting...");
            device_->connect();
        }
        device_->set_sampling_rate(rateState().applied_hz);
        device_->start_streaming();
    } catch (const std::exception& e) {
        qCWarning(lcSession) << "start failed:" << e.what();
        emit statusText(QString("Start failed: %1").arg(e.what()));
        return false;
    }

    streaming_.store(true);
    emit statusText("Streaming");
    return true;
}

void StreamSession::stop() {
    if (!device_ || !streaming_.load()) return;
    stopDeviceQuietly();
    streaming_.store(false);
    emit statusText("Stopped");
}

void StreamSession::ingest(const scope::Frame& frame) {
    std::string why;
    auto values = decoder_.decode(frame, &why);
    if (!values) {
        bad_.fetch_add(1);
        qCWarning(lcSession) << "dropping tick:" << why.c_str();
        return;
    }

    int32_t t = registry_.append_tick(*values);
    if (t < 0) {
        bad_.fetch_add(1);
        qCWarning(lcSession) << "dropping tick: channel count mismatch";
        return;
    }
    ok_.fetch_add(1);

    if (!tickPending_.exchange(true)) emit tickAppended((int)t);

    maybeEmitStats();
}

void StreamSession::dropInput(const std::string& why) {
    bad_.fetch_add(1);
    qCDebug(lcSession) << "dropping input:" << why.c_str();
    maybeEmitStats();
}

void StreamSession::maybeEmitStats() {
    uint64_t n = now_ns();
    uint64_t last = lastStatsNs_.load();
    if (n - last > 500000000ULL && lastStatsNs_.compare_exchange_strong(last, n)) {
        emit statsUpdated(ok_.load(), bad_.load());
    }
}

scope::QuantizedRate StreamSession::applySamplingRate(double requestedHz) {
    scope::QuantizedRate q = scope::quantize_rate(requestedHz);

    bool wasStreaming = streaming_.load();
    if (device_ && wasStreaming) stopDeviceQuietly();

    if (device_) {
        try {
            device_->set_sampling_rate(q.applied_hz);
        } catch (const std::exception& e) {
            qCWarning(lcSession) << "writing sampling rate failed:" << e.what();
            emit statusText("Sampling rate write failed");
        }
    }

    {
        QMutexLocker lk(&rateMu_);
        rate_.requested_hz = requestedHz;
        rate_.applied_hz = q.applied_hz;
    }

    // Timestamps taken under the old rate are meaningless under the new one.
    registry_.reset_for_rate(q.applied_hz);

    if (device_ && wasStreaming) startDeviceQuietly();

    qCInfo(lcSession) << "sampling rate" << requestedHz << "Hz -> divider" << (qlonglong)q.divider
                      << "->" << q.applied_hz << "Hz";

    emit buffersReset();
    emit samplingRateApplied(requestedHz, q.applied_hz);
    return q;
}

void StreamSession::setTimeWindow(double seconds) {
    registry_.set_time_window(seconds);
    qCDebug(lcSession) << "time window" << seconds << "s, capacity" << registry_.capacity();
}

scope::SamplingRateState StreamSession::rateState() const {
    QMutexLocker lk(&rateMu_);
    return rate_;
}

scope::Series StreamSession::snapshot(const QString& channel) const {
    return registry_.snapshot(channel.toStdString());
}

bool StreamSession::extent(const QStringList& channels, float& lo, float& hi) const {
    std::vector<std::string> names;
    names.reserve((size_t)channels.size());
    for (const auto& c : channels) names.push_back(c.toStdString());
    return registry_.extent(names, lo, hi);
}

QStringList StreamSession::enabledChannels() const {
    return toQStringList(registry_.channels());
}

QStringList StreamSession::groupMembers(const QString& group) const {
    return toQStringList(scope::group_members(group.toStdString()));
}

// The device may already be in the requested state, so bracket failures are
// logged and otherwise ignored; a real disconnect shows up in is_connected().
void StreamSession::stopDeviceQuietly() {
    try {
        device_->stop_streaming();
    } catch (const std::exception& e) {
        qCWarning(lcSession) << "stop_streaming ignored:" << e.what();
    }
}

void StreamSession::startDeviceQuietly() {
    try {
        device_->start_streaming();
    } catch (const std::exception& e) {
        qCWarning(lcSession) << "start_streaming ignored:" << e.what();
    }
}
