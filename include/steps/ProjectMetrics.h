#ifndef PROJECTMETRICS_H
#define PROJECTMETRICS_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

struct StepMetrics {
    QString stepName;
    QDateTime startTime;
    QDateTime endTime;          ///< Invalid while the step runs
    QString status;             ///< ✓, ❌ or 🔄
    double durationSeconds = -1.0;
    int commandsExecuted = 0;
    int messagesSent = 0;

    bool hasDuration() const { return durationSeconds >= 0.0; }
    QJsonObject toJson() const;
};

/**
 * @brief Per-step timing and counters for one automation run.
 *
 * Every change is written to logs/project_metrics_<timestamp>.json so a
 * crashed run still leaves its numbers behind.
 */
class ProjectMetrics
{
public:
    explicit ProjectMetrics(const QString& projectName,
                            const QString& directory = QStringLiteral("logs"));

    void startStep(const QString& stepName);
    void endStep(const QString& status = QStringLiteral("✓"));
    void updateStepMetrics(int commandsExecuted, int messagesSent);

    QString projectName() const { return m_projectName; }
    QString currentStep() const { return m_currentStep; }
    bool hasCurrentStep() const { return !m_currentStep.isEmpty(); }
    const QVector<StepMetrics>& steps() const { return m_steps; }
    const StepMetrics* step(const QString& stepName) const;

    double totalDuration() const;
    QString generateReport() const;

    QString metricsFilePath() const { return m_metricsFile; }
    QJsonObject toJson() const;
    bool save();
    QString lastError() const { return m_lastError; }

private:
    StepMetrics* findStep(const QString& stepName);

    QString m_projectName;
    QString m_directory;
    QString m_metricsFile;
    QString m_currentStep;
    QVector<StepMetrics> m_steps;
    QString m_lastError;
};

#endif // PROJECTMETRICS_H
