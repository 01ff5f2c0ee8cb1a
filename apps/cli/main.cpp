#include <QCoreApplication>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QTimer>

#include "BleDevice.h"
#include "Logging.h"
#include "PlotController.h"
#include "SimulatedDevice.h"
#include "StreamSession.h"

#include "scope/Channels.h"
#include "scope/Config.h"

#include <atomic>
#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

struct Args {
    std::string prefix = "Shimmer";
    int scan_ms = 3000;
    bool simulate = false;

    scope::SessionConfig session;

    int render_ms = 1000;
    std::string log_rules;
};

static scope::SensorSet parse_sensors(const std::string& list) {
    scope::SensorSet s = scope::SensorSet::none();
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        scope::Sensor which;
        if (!scope::parse_sensor(item, which)) {
            std::cerr << "Unknown sensor: " << item << " (lna, wra, gyro, mag, bmp, battery, a6, a7, a15)\n";
            std::exit(2);
        }
        s.set(which, true);
    }
    return s;
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string k = argv[i];

        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (k == "--prefix") a.prefix = need("--prefix");
        else if (k == "--scan_ms") a.scan_ms = std::atoi(need("--scan_ms"));
        else if (k == "--simulate") a.simulate = true;

        else if (k == "--rate") a.session.sampling_rate_hz = std::strtod(need("--rate"), nullptr);
        else if (k == "--window") a.session.time_window_s = std::atoi(need("--window"));
        else if (k == "--labels") a.session.label_interval = std::atoi(need("--labels"));

        else if (k == "--param") a.session.parameter = need("--param");
        else if (k == "--auto_y") a.session.auto_y = true;
        else if (k == "--ymin") { a.session.y_min = std::strtod(need("--ymin"), nullptr); a.session.y_from_parameter = false; }
        else if (k == "--ymax") { a.session.y_max = std::strtod(need("--ymax"), nullptr); a.session.y_from_parameter = false; }
        else if (k == "--sensors") a.session.sensors = parse_sensors(need("--sensors"));

        else if (k == "--render_ms") a.render_ms = std::atoi(need("--render_ms"));
        else if (k == "--log") a.log_rules = need("--log");
        else {
            std::cerr << "Unknown arg: " << k << "\n";
            std::exit(2);
        }
    }

    const auto& lim = a.session.limits;
    if (!(a.session.sampling_rate_hz >= lim.rate_min_hz && a.session.sampling_rate_hz <= lim.rate_max_hz)) {
        std::cerr << "--rate must be within " << lim.rate_min_hz << ".." << lim.rate_max_hz << " Hz\n";
        std::exit(2);
    }
    if (a.session.time_window_s < lim.window_min_s || a.session.time_window_s > lim.window_max_s) {
        std::cerr << "--window must be within " << lim.window_min_s << ".." << lim.window_max_s << " s\n";
        std::exit(2);
    }
    if (a.session.label_interval < lim.label_min || a.session.label_interval > lim.label_max) {
        std::cerr << "--labels must be within " << lim.label_min << ".." << lim.label_max << "\n";
        std::exit(2);
    }
    if (a.render_ms < 20) a.render_ms = 20;
    return a;
}

static void print_help() {
    std::cout << "commands:\n"
                 "  rate <hz>            sampling rate\n"
                 "  window <s>           time window\n"
                 "  labels <n>           label interval\n"
                 "  ymin <v> | ymax <v>  manual Y bounds\n"
                 "  yaxis <min> <max>    both Y bounds\n"
                 "  auto on|off          auto Y range\n"
                 "  param <name>         selected parameter\n"
                 "  params               list parameters\n"
                 "  status               session state\n"
                 "  quit\n";
}

static void print_status(const PlotController& ctl, const StreamSession& session) {
    auto rate = session.rateState();
    auto r = ctl.axisRange();
    std::cout << "param=" << ctl.selectedParameter().toStdString()
              << " rate=" << rate.requested_hz << "->" << rate.applied_hz << "Hz"
              << " window=" << ctl.timeWindow() << "s"
              << " labels=" << ctl.labelInterval()
              << " y=[" << r.min << "," << r.max << "]" << (ctl.autoRange() ? " auto" : "")
              << " ok=" << session.framesOk() << " bad=" << session.framesBad() << "\n";
}

// Runs on the Qt thread, posted from the console thread.
static void run_command(const std::string& line, PlotController& ctl, StreamSession& session) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty()) return;

    std::string rest;
    std::getline(in, rest);
    size_t b = rest.find_first_not_of(" \t");
    rest = (b == std::string::npos) ? std::string() : rest.substr(b);
    const QString arg = QString::fromStdString(rest);

    using F = PlotController::Field;

    if (cmd == "rate") ctl.commitText(F::SamplingRate, arg);
    else if (cmd == "window") ctl.commitText(F::TimeWindow, arg);
    else if (cmd == "labels") ctl.commitText(F::LabelInterval, arg);
    else if (cmd == "ymin") ctl.commitText(F::YMin, arg);
    else if (cmd == "ymax") ctl.commitText(F::YMax, arg);
    else if (cmd == "yaxis") {
        std::istringstream v(rest);
        v.imbue(std::locale::classic());
        double lo = 0.0, hi = 0.0;
        if (!(v >> lo >> hi)) {
            std::cout << "usage: yaxis <min> <max>\n";
            return;
        }
        ctl.setYAxis(lo, hi);
    }
    else if (cmd == "auto") {
        if (rest == "on") ctl.setAutoRange(true);
        else if (rest == "off") ctl.setAutoRange(false);
        else std::cout << "usage: auto on|off\n";
    }
    else if (cmd == "param") {
        if (!ctl.setSelectedParameter(arg)) std::cout << "unknown parameter: " << rest << "\n";
    }
    else if (cmd == "params") {
        for (const auto& p : ctl.selectableParameters()) std::cout << "  " << p.toStdString() << "\n";
    }
    else if (cmd == "status") print_status(ctl, session);
    else if (cmd == "help") print_help();
    else if (cmd == "quit" || cmd == "q") QCoreApplication::quit();
    else std::cout << "unknown command: " << cmd << " (help)\n";
}

static void render(const PlotController& ctl, const StreamSession& session) {
    auto r = ctl.axisRange();
    std::cout << ctl.chartTitle().toStdString() << " [" << ctl.axisUnit().toStdString() << "]"
              << " y=[" << r.min << "," << r.max << "]";

    for (const auto& ch : ctl.currentChannels()) {
        auto s = session.snapshot(ch);
        std::cout << " | " << ch.toStdString() << " n=" << s.values.size();
        if (!s.values.empty()) std::cout << " t=" << s.timestamps_ms.back() << "ms v=" << s.values.back();
    }
    std::cout << "\n";
}

int main(int argc, char** argv) {
    Args args = parse_args(argc, argv);

    QCoreApplication app(argc, argv);
    // The frame parser uses strtof; keep '.' as the decimal point whatever the user locale.
    std::setlocale(LC_NUMERIC, "C");

    if (!args.log_rules.empty()) QLoggingCategory::setFilterRules(QString::fromStdString(args.log_rules));

    StreamSession session(args.session);
    PlotController ctl(&session, args.session);

    QObject::connect(&session, &StreamSession::statusText, [](const QString& s) {
        std::cout << "[status] " << s.toStdString() << "\n";
    });
    QObject::connect(&session, &StreamSession::statsUpdated, [](qulonglong ok, qulonglong bad) {
        qCDebug(lcCli) << "frames ok" << ok << "bad" << bad;
    });
    QObject::connect(&ctl, &PlotController::validationMessageChanged, [](const QString& m) {
        if (!m.isEmpty()) std::cout << "[invalid] " << m.toStdString() << "\n";
    });
    QObject::connect(&session, &StreamSession::samplingRateApplied, [](double req, double applied) {
        std::cout << "[rate] requested " << req << " Hz, applied " << applied << " Hz\n";
    });

    if (args.simulate) session.setDevice(std::make_unique<SimulatedDevice>(args.session.sensors));
    else session.setDevice(std::make_unique<BleDevice>(args.prefix, args.scan_ms));

    if (!session.start()) {
        std::cerr << "Could not start streaming\n";
        return 1;
    }

    QTimer renderTimer;
    renderTimer.setInterval(args.render_ms);
    QObject::connect(&renderTimer, &QTimer::timeout, [&]() { render(ctl, session); });
    renderTimer.start();

    std::atomic<bool> quit{false};
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() { quit.store(true); });

    std::thread input_thread([&]() {
        std::string line;
        while (!quit.load() && std::getline(std::cin, line)) {
            if (line == "quit" || line == "q") quit.store(true);
            QMetaObject::invokeMethod(&ctl, [line, &ctl, &session]() { run_command(line, ctl, session); },
                                      Qt::QueuedConnection);
        }
        qCDebug(lcCli) << "console closed";
    });

    print_help();
    print_status(ctl, session);

    int rc = app.exec();

    session.stop();
    // Blocked in getline until the next line or EOF.
    if (input_thread.joinable()) input_thread.join();

    std::cout << "Done\n";
    return rc;
}
