#include "steps/ProjectMetrics.h"

#include <QDebug>
#include <QDir>
#include <QJsonDocument>
#include <QSaveFile>

namespace {

constexpr int kReportInnerWidth = 56;
constexpr int kReportNameWidth = 30;

QString boxLine(const QString& content)
{
    return QStringLiteral("║ %1 ║").arg(content.leftJustified(kReportInnerWidth - 2, QLatin1Char(' '), true));
}

double secondsSinceEpoch(const QDateTime& time)
{
    return static_cast<double>(time.toMSecsSinceEpoch()) / 1000.0;
}

} // namespace

QJsonObject StepMetrics::toJson() const
{
    QJsonObject object;
    object[QStringLiteral("step_name")] = stepName;
    object[QStringLiteral("start_time")] = secondsSinceEpoch(startTime);
    object[QStringLiteral("end_time")] = endTime.isValid() ? QJsonValue(secondsSinceEpoch(endTime))
                                                           : QJsonValue(QJsonValue::Null);
    object[QStringLiteral("status")] = status;
    object[QStringLiteral("duration")] = hasDuration() ? QJsonValue(durationSeconds)
                                                       : QJsonValue(QJsonValue::Null);
    object[QStringLiteral("commands_executed")] = commandsExecuted;
    object[QStringLiteral("messages_sent")] = messagesSent;
    return object;
}

ProjectMetrics::ProjectMetrics(const QString& projectName, const QString& directory)
    : m_projectName(projectName)
    , m_directory(directory)
{
    m_metricsFile = QDir(m_directory).filePath(
        QStringLiteral("project_metrics_%1.json")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss"))));
}

void ProjectMetrics::startStep(const QString& stepName)
{
    if (!m_currentStep.isEmpty()) {
        endStep();
    }

    m_currentStep = stepName;

    StepMetrics metrics;
    metrics.stepName = stepName;
    metrics.startTime = QDateTime::currentDateTime();
    metrics.status = QStringLiteral("\U0001F504");

    if (StepMetrics* existing = findStep(stepName)) {
        *existing = metrics;
    } else {
        m_steps.append(metrics);
    }
}

void ProjectMetrics::endStep(const QString& status)
{
    StepMetrics* metrics = findStep(m_currentStep);
    if (!metrics) {
        return;
    }

    metrics->endTime = QDateTime::currentDateTime();
    metrics->status = status;
    metrics->durationSeconds = metrics->startTime.msecsTo(metrics->endTime) / 1000.0;
    m_currentStep.clear();
    save();
}

void ProjectMetrics::updateStepMetrics(int commandsExecuted, int messagesSent)
{
    StepMetrics* metrics = findStep(m_currentStep);
    if (!metrics) {
        return;
    }

    metrics->commandsExecuted = commandsExecuted;
    metrics->messagesSent = messagesSent;
    save();
}

const StepMetrics* ProjectMetrics::step(const QString& stepName) const
{
    for (const StepMetrics& metrics : m_steps) {
        if (metrics.stepName == stepName) {
            return &metrics;
        }
    }
    return nullptr;
}

double ProjectMetrics::totalDuration() const
{
    double total = 0.0;
    for (const StepMetrics& metrics : m_steps) {
        if (metrics.hasDuration()) {
            total += metrics.durationSeconds;
        }
    }
    return total;
}

QString ProjectMetrics::generateReport() const
{
    const QString border = QString(kReportInnerWidth, QChar(0x2550));

    QStringList lines;
    lines << QStringLiteral("╔%1╗").arg(border);
    lines << boxLine(QStringLiteral("Project: %1").arg(m_projectName));
    lines << QStringLiteral("╠%1╣").arg(border);
    lines << boxLine(QStringLiteral("Step Metrics:"));

    for (const StepMetrics& metrics : m_steps) {
        const QString duration = metrics.hasDuration() && metrics.durationSeconds > 0.0
            ? QStringLiteral("%1s").arg(metrics.durationSeconds, 0, 'f', 1)
            : QStringLiteral("In Progress");
        lines << boxLine(QStringLiteral("%1 %2 %3")
                             .arg(metrics.status,
                                  metrics.stepName.left(kReportNameWidth)
                                      .leftJustified(kReportNameWidth),
                                  duration.leftJustified(10)));
    }

    lines << QStringLiteral("╠%1╣").arg(border);
    lines << boxLine(QStringLiteral("Total Duration: %1 seconds").arg(totalDuration(), 0, 'f', 1));
    lines << QStringLiteral("╚%1╝").arg(border);
    return lines.join(QLatin1Char('\n'));
}

QJsonObject ProjectMetrics::toJson() const
{
    QJsonObject steps;
    for (const StepMetrics& metrics : m_steps) {
        steps[metrics.stepName] = metrics.toJson();
    }

    QJsonObject root;
    root[QStringLiteral("project_name")] = m_projectName;
    root[QStringLiteral("total_duration")] = totalDuration();
    root[QStringLiteral("steps")] = steps;
    return root;
}

bool ProjectMetrics::save()
{
    if (!QDir().mkpath(m_directory)) {
        m_lastError = QStringLiteral("Cannot create metrics directory %1").arg(m_directory);
        qWarning() << "ProjectMetrics:" << m_lastError;
        return false;
    }

    QSaveFile file(m_metricsFile);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        m_lastError = file.errorString();
        qWarning() << "ProjectMetrics: Failed to open" << m_metricsFile << m_lastError;
        return false;
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        m_lastError = file.errorString();
        qWarning() << "ProjectMetrics: Failed to write" << m_metricsFile << m_lastError;
        return false;
    }

    m_lastError.clear();
    return true;
}

StepMetrics* ProjectMetrics::findStep(const QString& stepName)
{
    if (stepName.isEmpty()) {
        return nullptr;
    }
    for (StepMetrics& metrics : m_steps) {
        if (metrics.stepName == stepName) {
            return &metrics;
        }
    }
    return nullptr;
}
