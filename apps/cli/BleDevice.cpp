#include "BleDevice.h"
#include "Logging.h"

#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

static inline bool starts_with(const std::string& s, const std::string& pfx) {
    return s.size() >= pfx.size() && std::memcmp(s.data(), pfx.data(), pfx.size()) == 0;
}

static std::optional<std::pair<SimpleBLE::BluetoothUUID, SimpleBLE::BluetoothUUID>>
pick_first_notify_char(SimpleBLE::Peripheral& p) {
    auto services = p.services();
    for (auto& s : services) {
        auto chars = s.characteristics();
        for (auto& c : chars) {
            if (c.can_notify()) return std::make_pair(s.uuid(), c.uuid());
        }
    }
    return std::nullopt;
}

static std::optional<std::pair<SimpleBLE::BluetoothUUID, SimpleBLE::BluetoothUUID>>
pick_first_write_char(SimpleBLE::Peripheral& p) {
    auto services = p.services();
    for (auto& s : services) {
        auto chars = s.characteristics();
        for (auto& c : chars) {
            if (c.can_write_request()) return std::make_pair(s.uuid(), c.uuid());
        }
    }
    return std::nullopt;
}

BleDevice::BleDevice(std::string prefix, int scan_ms)
    : prefix_(std::move(prefix)), scan_ms_(scan_ms) {}

BleDevice::~BleDevice() {
    try {
        disconnect();
    } catch (const std::exception& e) {
        qCWarning(lcDevice) << "disconnect failed:" << e.what();
    }
}

void BleDevice::connect() {
    if (connected_.load()) return;

    if (!SimpleBLE::Adapter::bluetooth_enabled())
        throw std::runtime_error("Bluetooth not enabled or permission missing");

    auto adapters = SimpleBLE::Adapter::get_adapters();
    if (adapters.empty()) throw std::runtime_error("No Bluetooth adapter");
    auto adapter = adapters[0];

    qCInfo(lcDevice) << "adapter" << adapter.identifier().c_str() << adapter.address().c_str();

    SimpleBLE::Peripheral chosen;
    bool found = false;

    for (int attempt = 0; attempt < 5 && !found; ++attempt) {
        adapter.scan_for(scan_ms_);
        auto results = adapter.scan_get_results();

        int best_rssi = -32768;
        for (auto& p : results) {
            if (!starts_with(p.identifier(), prefix_)) continue;
            int rssi = p.rssi();
            if (!found || rssi > best_rssi) {
                chosen = p;
                best_rssi = rssi;
                found = true;
            }
        }

        if (!found) qCInfo(lcDevice) << "scanning... no" << prefix_.c_str() << "device yet";
    }

    if (!found) throw std::runtime_error("No device named " + prefix_ + "*");

    qCInfo(lcDevice) << "chosen" << chosen.identifier().c_str() << chosen.address().c_str()
                     << "rssi" << chosen.rssi();

    chosen.connect();

    auto pair = pick_first_notify_char(chosen);
    if (!pair) {
        chosen.disconnect();
        throw std::runtime_error("No notify characteristic");
    }

    peripheral_ = chosen;
    svc_ = pair->first;
    chr_ = pair->second;
    cmd_ = pick_first_write_char(chosen);

    framer_.clear();
    connected_.store(true);
}

void BleDevice::disconnect() {
    if (!connected_.load()) return;

    stop_streaming();
    if (peripheral_) peripheral_->disconnect();

    peripheral_.reset();
    svc_.reset();
    chr_.reset();
    cmd_.reset();
    connected_.store(false);
}

void BleDevice::start_streaming() {
    if (!connected_.load()) throw std::runtime_error("start_streaming: not connected");
    if (streaming_.exchange(true)) return;

    framer_.clear();
    peripheral_->notify(*svc_, *chr_, [this](SimpleBLE::ByteArray payload) {
        if (!streaming_.load()) return;
        on_payload(std::string(payload.begin(), payload.end()));
    });
}

void BleDevice::stop_streaming() {
    if (!streaming_.exchange(false)) return;
    if (peripheral_ && svc_ && chr_) peripheral_->unsubscribe(*svc_, *chr_);
}

void BleDevice::set_sampling_rate(double hz) {
    rate_hz_.store(hz);
    if (!connected_.load() || !cmd_) {
        qCDebug(lcDevice) << "no command characteristic, rate" << hz << "kept locally";
        return;
    }

    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << "rate " << hz << "\n";
    peripheral_->write_request(cmd_->first, cmd_->second, SimpleBLE::ByteArray(os.str()));
}

void BleDevice::set_frame_handler(FrameHandler handler) {
    std::lock_guard<std::mutex> lk(handlerMu_);
    handler_ = std::move(handler);
}

void BleDevice::set_drop_handler(DropHandler handler) {
    std::lock_guard<std::mutex> lk(handlerMu_);
    drop_ = std::move(handler);
}

void BleDevice::on_payload(const std::string& chunk) {
    auto lines = framer_.push(chunk);

    for (auto& line : lines) {
        auto f = parser_.parse_line(line);

        std::lock_guard<std::mutex> lk(handlerMu_);
        if (!f) {
            qCWarning(lcDevice) << "unparsable line:" << line.c_str();
            if (drop_) drop_("unparsable line");
            continue;
        }
        if (handler_) handler_(*f);
    }
}
