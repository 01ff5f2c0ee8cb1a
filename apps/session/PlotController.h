#ifndef SENSORSCOPE_SESSION_PLOTCONTROLLER_H
#define SENSORSCOPE_SESSION_PLOTCONTROLLER_H

#include <QObject>
#include <QString>
#include <QStringList>

#include "scope/Channels.h"
#include "scope/Config.h"

class StreamSession;

// Mediates every user-editable plot setting. Text commits are parsed and checked
// against FieldLimits; a rejected commit leaves the committed value untouched
// and puts the field text back to the last valid value.
class PlotController : public QObject {
    Q_OBJECT
public:
    enum class Field : int {
        YMin = 0,
        YMax,
        TimeWindow,
        LabelInterval,
        SamplingRate,
    };
    Q_ENUM(Field)

    enum class FieldResult : int {
        Committed,
        Defaulted,   // empty input, static default applied
        Pending,     // lone sign, still typing
        Rejected,
        Ignored,     // Y bounds while auto range owns the axis
    };
    Q_ENUM(FieldResult)

    enum class ChartMode : int {
        Single,
        Multi,
    };
    Q_ENUM(ChartMode)

    PlotController(StreamSession* session, const scope::SessionConfig& cfg, QObject* parent = nullptr);

    FieldResult commitText(Field field, const QString& text);

    FieldResult setTimeWindow(int seconds);
    FieldResult setLabelInterval(int interval);
    FieldResult setYAxis(double min, double max);
    FieldResult setSamplingRate(double hz);
    void setAutoRange(bool on);
    bool setSelectedParameter(const QString& name);

    QString fieldText(Field field) const;
    double lastValid(Field field) const;
    QString validationMessage() const { return message_; }

    scope::AxisRange axisRange() const { return autoY_ ? auto_ : manual_; }
    scope::AxisRange manualRange() const { return manual_; }
    bool autoRange() const { return autoY_; }

    int timeWindow() const { return (int)lastValid(Field::TimeWindow); }
    int labelInterval() const { return (int)lastValid(Field::LabelInterval); }
    double requestedRate() const { return lastValid(Field::SamplingRate); }

    QString selectedParameter() const { return param_; }
    ChartMode chartMode() const { return mode_; }
    QStringList currentChannels() const;
    QStringList selectableParameters() const;

    QString axisLabel() const;
    QString axisUnit() const;
    QString chartTitle() const;

public slots:
    void onTick();

signals:
    void refreshRequested();
    void validationMessageChanged(QString message);
    void fieldTextChanged(PlotController::Field field, QString text);
    void axisRangeChanged(double min, double max);

private:
    struct EditableField {
        QString text;
        double lastValid = 0.0;
    };

    FieldResult commitYBound(Field field, const QString& text);
    FieldResult acceptYBound(Field field, double v);
    FieldResult acceptTimeWindow(double v);
    FieldResult acceptLabelInterval(double v);
    FieldResult acceptSamplingRate(double v);

    FieldResult reject(Field field, const QString& message);
    void setMessage(const QString& message);
    void setFieldValue(Field field, double v);
    void syncYTexts();
    void applyManualRange(const scope::AxisRange& r);

    scope::AxisRange computeAutoRange() const;

    EditableField& slot(Field f) { return fields_[(int)f]; }
    const EditableField& slot(Field f) const { return fields_[(int)f]; }

private:
    StreamSession* session_ = nullptr;
    scope::FieldLimits limits_;
    scope::FieldDefaults defaults_;

    EditableField fields_[5];
    QString message_;

    scope::AxisRange manual_;
    scope::AxisRange auto_;
    bool autoY_ = false;

    QString param_;
    ChartMode mode_ = ChartMode::Single;
};

#endif
