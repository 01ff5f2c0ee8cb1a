#ifndef SENSORSCOPE_CLI_BLEDEVICE_H
#define SENSORSCOPE_CLI_BLEDEVICE_H

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include <simpleble/SimpleBLE.h>

#include "scope/Device.h"
#include "scope/Framer.h"
#include "scope/Parser.h"

// SimpleBLE transport: picks the strongest advertiser whose name starts with
// prefix, subscribes to its first notify characteristic and turns the CSV text
// lines into frames. The rate is sent as "rate <hz>\n" when the peripheral
// exposes a writable characteristic.
class BleDevice : public scope::IDevice {
public:
    BleDevice(std::string prefix, int scan_ms);
    ~BleDevice() override;

    void connect() override;
    void disconnect() override;
    bool is_connected() const override { return connected_.load(); }

    void start_streaming() override;
    void stop_streaming() override;

    double sampling_rate() const override { return rate_hz_.load(); }
    void set_sampling_rate(double hz) override;

    void set_frame_handler(FrameHandler handler) override;
    void set_drop_handler(DropHandler handler) override;

private:
    void on_payload(const std::string& chunk);

private:
    std::string prefix_;
    int scan_ms_ = 3000;

    std::optional<SimpleBLE::Peripheral> peripheral_;
    std::optional<SimpleBLE::BluetoothUUID> svc_;
    std::optional<SimpleBLE::BluetoothUUID> chr_;
    std::optional<std::pair<SimpleBLE::BluetoothUUID, SimpleBLE::BluetoothUUID>> cmd_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> streaming_{false};
    std::atomic<double> rate_hz_{51.2};

    scope::LineFramer framer_;
    scope::CsvFrameParser parser_;

    std::mutex handlerMu_;
    FrameHandler handler_;
    DropHandler drop_;
};

#endif
