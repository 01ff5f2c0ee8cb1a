#include "PlotController.h"
#include "Logging.h"
#include "StreamSession.h"

#include "scope/AutoRange.h"
#include "scope/NumericInput.h"

static QString num(double v) {
    return QString::fromStdString(scope::format_number(v));
}

static QStringList toQStringList(const std::vector<std::string>& v) {
    QStringList out;
    for (const auto& s : v) out.push_back(QString::fromStdString(s));
    return out;
}

PlotController::PlotController(StreamSession* session, const scope::SessionConfig& cfg, QObject* parent)
    : QObject(parent), session_(session), limits_(cfg.limits), defaults_(cfg.defaults) {
    const QStringList params = selectableParameters();
    param_ = QString::fromStdString(cfg.parameter);
    if (!params.contains(param_)) param_ = params.isEmpty() ? QString() : params.front();
    mode_ = scope::is_group(param_.toStdString()) ? ChartMode::Multi : ChartMode::Single;

    scope::AxisRange y{cfg.y_min, cfg.y_max};
    if (cfg.y_from_parameter || !y.valid()) y = scope::fallback_range(param_.toStdString());
    applyManualRange(y);
    syncYTexts();

    setFieldValue(Field::TimeWindow, (double)cfg.time_window_s);
    setFieldValue(Field::LabelInterval, (double)cfg.label_interval);
    setFieldValue(Field::SamplingRate, session_->rateState().requested_hz);

    autoY_ = cfg.auto_y;
    if (autoY_) {
        auto_ = computeAutoRange();
        syncYTexts();
    }

    connect(session_, &StreamSession::tickAppended, this, &PlotController::onTick);
}

PlotController::FieldResult PlotController::commitText(Field field, const QString& text) {
    if (field == Field::YMin || field == Field::YMax) return commitYBound(field, text);

    slot(field).text = text;

    const std::string s = text.toStdString();
    const bool integral = (field != Field::SamplingRate);
    const scope::ParsedInput p = integral ? scope::parse_integer(s) : scope::parse_decimal(s);

    switch (p.kind) {
        case scope::InputKind::Empty: {
            FieldResult r = FieldResult::Rejected;
            if (field == Field::TimeWindow) r = acceptTimeWindow((double)defaults_.window_s);
            else if (field == Field::LabelInterval) r = acceptLabelInterval((double)defaults_.label_interval);
            else r = acceptSamplingRate(defaults_.rate_hz);
            return r == FieldResult::Committed ? FieldResult::Defaulted : r;
        }
        case scope::InputKind::PartialSign:
            setMessage(QString());
            return FieldResult::Pending;
        case scope::InputKind::Invalid:
            if (field == Field::TimeWindow)
                return reject(field, "Time Window must be a valid positive number.");
            if (field == Field::LabelInterval)
                return reject(field, "Label interval must be a valid positive number (no letters or special characters allowed).");
            return reject(field, "Sampling rate must be a valid number (no letters or special characters allowed).");
        case scope::InputKind::Number:
            break;
    }

    if (field == Field::TimeWindow) return acceptTimeWindow(p.value);
    if (field == Field::LabelInterval) return acceptLabelInterval(p.value);
    return acceptSamplingRate(p.value);
}

PlotController::FieldResult PlotController::setTimeWindow(int seconds) {
    return acceptTimeWindow((double)seconds);
}

PlotController::FieldResult PlotController::setLabelInterval(int interval) {
    return acceptLabelInterval((double)interval);
}

PlotController::FieldResult PlotController::setSamplingRate(double hz) {
    return acceptSamplingRate(hz);
}

PlotController::FieldResult PlotController::setYAxis(double min, double max) {
    if (autoY_) {
        syncYTexts();
        return FieldResult::Ignored;
    }

    if (min < limits_.y_min || min > limits_.y_max)
        return reject(Field::YMin, QString("Y Min out of range (%1 to %2).").arg(num(limits_.y_min), num(limits_.y_max)));
    if (max < limits_.y_min || max > limits_.y_max)
        return reject(Field::YMax, QString("Y Max out of range (%1 to %2).").arg(num(limits_.y_min), num(limits_.y_max)));
    if (!(min < max)) {
        reject(Field::YMax, "Y Min must be less than Y Max.");
        return reject(Field::YMin, "Y Min must be less than Y Max.");
    }

    applyManualRange(scope::AxisRange{min, max});
    setMessage(QString());
    emit axisRangeChanged(manual_.min, manual_.max);
    emit refreshRequested();
    return FieldResult::Committed;
}

void PlotController::setAutoRange(bool on) {
    if (on == autoY_) return;
    autoY_ = on;

    // The manual range stays in manual_ and is authoritative again once auto is off.
    if (autoY_) auto_ = computeAutoRange();

    syncYTexts();
    setMessage(QString());

    const scope::AxisRange r = axisRange();
    qCInfo(lcController) << "auto range" << (on ? "on" : "off") << "->" << r.min << r.max;
    emit axisRangeChanged(r.min, r.max);
    emit refreshRequested();
}

bool PlotController::setSelectedParameter(const QString& name) {
    if (!selectableParameters().contains(name)) {
        qCDebug(lcController) << "unknown parameter" << name;
        return false;
    }

    param_ = name;
    mode_ = scope::is_group(param_.toStdString()) ? ChartMode::Multi : ChartMode::Single;

    applyManualRange(scope::fallback_range(param_.toStdString()));
    if (autoY_) auto_ = computeAutoRange();
    syncYTexts();
    setMessage(QString());

    const scope::AxisRange r = axisRange();
    emit axisRangeChanged(r.min, r.max);
    emit refreshRequested();
    return true;
}

QString PlotController::fieldText(Field field) const {
    return slot(field).text;
}

double PlotController::lastValid(Field field) const {
    return slot(field).lastValid;
}

QStringList PlotController::currentChannels() const {
    if (param_.isEmpty()) return {};
    if (mode_ == ChartMode::Multi) return session_->groupMembers(param_);
    return {param_};
}

QStringList PlotController::selectableParameters() const {
    return toQStringList(scope::selectable_parameters(session_->sensors()));
}

QString PlotController::axisLabel() const {
    if (mode_ == ChartMode::Multi) return param_;
    const auto* c = scope::find_channel(param_.toStdString());
    return c ? QString::fromUtf8(c->label.data(), (int)c->label.size()) : QString("Value");
}

QString PlotController::axisUnit() const {
    std::string key = param_.toStdString();
    if (mode_ == ChartMode::Multi) {
        auto members = scope::group_members(key);
        key = members.empty() ? std::string() : members.front();
    }
    const auto* c = scope::find_channel(key);
    return c ? QString::fromUtf8(c->unit.data(), (int)c->unit.size()) : QString("Unit");
}

QString PlotController::chartTitle() const {
    if (mode_ == ChartMode::Multi) return QString("Real-time %1 (X,Y,Z)").arg(param_);
    return QString("Real-time %1").arg(axisLabel());
}

void PlotController::onTick() {
    session_->tickConsumed();
    if (autoY_) {
        const scope::AxisRange cand = computeAutoRange();
        if (scope::range_changed(auto_, cand)) {
            auto_ = cand;
            syncYTexts();
            emit axisRangeChanged(auto_.min, auto_.max);
        }
    }
    emit refreshRequested();
}

PlotController::FieldResult PlotController::commitYBound(Field field, const QString& text) {
    if (autoY_) {
        syncYTexts();
        return FieldResult::Ignored;
    }

    slot(field).text = text;
    const scope::ParsedInput p = scope::parse_decimal(text.toStdString());

    switch (p.kind) {
        case scope::InputKind::Empty: {
            const scope::AxisRange d = scope::fallback_range(param_.toStdString());
            scope::AxisRange r = manual_;
            if (field == Field::YMin) r.min = d.min;
            else r.max = d.max;
            // A default that would cross the other bound resets both.
            if (!r.valid()) r = d;

            applyManualRange(r);
            setMessage(QString());
            emit axisRangeChanged(manual_.min, manual_.max);
            emit refreshRequested();
            return FieldResult::Defaulted;
        }
        case scope::InputKind::PartialSign:
            setMessage(QString());
            return FieldResult::Pending;
        case scope::InputKind::Invalid:
            return reject(field, field == Field::YMin
                ? "Y Min must be a valid number (no letters or special characters allowed)."
                : "Y Max must be a valid number (no letters or special characters allowed).");
        case scope::InputKind::Number:
            break;
    }
    return acceptYBound(field, p.value);
}

PlotController::FieldResult PlotController::acceptYBound(Field field, double v) {
    const bool isMin = (field == Field::YMin);

    if (v < limits_.y_min || v > limits_.y_max) {
        return reject(field, QString("%1 out of range (%2 to %3).")
                                 .arg(QString(isMin ? "Y Min" : "Y Max"), num(limits_.y_min), num(limits_.y_max)));
    }
    if (isMin && v >= manual_.max) return reject(field, "Y Min cannot be greater than or equal to Y Max.");
    if (!isMin && v <= manual_.min) return reject(field, "Y Max cannot be less than or equal to Y Min.");

    if (isMin) manual_.min = v;
    else manual_.max = v;
    setFieldValue(field, v);
    setMessage(QString());

    emit axisRangeChanged(manual_.min, manual_.max);
    emit refreshRequested();
    return FieldResult::Committed;
}

PlotController::FieldResult PlotController::acceptTimeWindow(double v) {
    if (v > limits_.window_max_s)
        return reject(Field::TimeWindow, QString("Time Window too large. Maximum %1 s.").arg(limits_.window_max_s));
    if (v < limits_.window_min_s)
        return reject(Field::TimeWindow, QString("Time Window too small. Minimum %1 s.").arg(limits_.window_min_s));

    setFieldValue(Field::TimeWindow, v);
    session_->setTimeWindow(v);
    setMessage(QString());

    // Eviction may have removed the extremes.
    onTick();
    return FieldResult::Committed;
}

PlotController::FieldResult PlotController::acceptLabelInterval(double v) {
    if (v > limits_.label_max)
        return reject(Field::LabelInterval, QString("Label interval too high. Maximum %1.").arg(limits_.label_max));
    if (v < limits_.label_min)
        return reject(Field::LabelInterval, QString("Label interval too low. Minimum %1.").arg(limits_.label_min));

    setFieldValue(Field::LabelInterval, v);
    setMessage(QString());
    emit refreshRequested();
    return FieldResult::Committed;
}

PlotController::FieldResult PlotController::acceptSamplingRate(double v) {
    if (v > limits_.rate_max_hz)
        return reject(Field::SamplingRate, QString("Sampling rate too high. Maximum %1 Hz.").arg(num(limits_.rate_max_hz)));
    if (v < limits_.rate_min_hz)
        return reject(Field::SamplingRate, QString("Sampling rate too low. Minimum %1 Hz.").arg(num(limits_.rate_min_hz)));
    if (!(v >= limits_.rate_min_hz && v <= limits_.rate_max_hz))
        return reject(Field::SamplingRate, "Sampling rate must be a valid number (no letters or special characters allowed).");

    session_->applySamplingRate(v);
    setFieldValue(Field::SamplingRate, v);
    setMessage(QString());

    onTick();
    return FieldResult::Committed;
}

PlotController::FieldResult PlotController::reject(Field field, const QString& message) {
    qCDebug(lcController) << "rejected" << field << ":" << message;
    setMessage(message);

    auto& f = slot(field);
    if (field == Field::YMin || field == Field::YMax) {
        f.text = num(field == Field::YMin ? manual_.min : manual_.max);
    } else {
        f.text = num(f.lastValid);
    }
    emit fieldTextChanged(field, f.text);
    return FieldResult::Rejected;
}

void PlotController::setMessage(const QString& message) {
    if (message == message_) return;
    message_ = message;
    emit validationMessageChanged(message_);
}

void PlotController::setFieldValue(Field field, double v) {
    auto& f = slot(field);
    f.lastValid = v;
    f.text = num(v);
    emit fieldTextChanged(field, f.text);
}

void PlotController::syncYTexts() {
    const scope::AxisRange r = axisRange();

    slot(Field::YMin).text = num(r.min);
    slot(Field::YMax).text = num(r.max);
    emit fieldTextChanged(Field::YMin, slot(Field::YMin).text);
    emit fieldTextChanged(Field::YMax, slot(Field::YMax).text);
}

void PlotController::applyManualRange(const scope::AxisRange& r) {
    manual_ = r;
    slot(Field::YMin).lastValid = r.min;
    slot(Field::YMax).lastValid = r.max;
    if (!autoY_) syncYTexts();
}

scope::AxisRange PlotController::computeAutoRange() const {
    float lo = 0.0f, hi = 0.0f;
    if (!session_->extent(currentChannels(), lo, hi)) return scope::fallback_range(param_.toStdString());
    return scope::auto_range_for_extent((double)lo, (double)hi);
}
