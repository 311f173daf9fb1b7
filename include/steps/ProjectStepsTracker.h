#ifndef PROJECTSTEPSTRACKER_H
#define PROJECTSTEPSTRACKER_H

#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QStringList>

/**
 * @brief Result of checking a steps file.
 *
 * Issues block automation, warnings do not.
 */
struct StepsDiagnostics {
    bool hasSections = false;
    bool hasSubsections = false;
    bool hasInProgressMarkers = false;
    bool hasIncompleteMarkers = false;
    int totalSteps = 0;
    int completed = 0;
    int inProgress = 0;
    int incomplete = 0;
    QString readError;
    QStringList issues;
    QStringList warnings;

    bool isValid() const { return issues.isEmpty(); }
};

/**
 * @brief Watches a markdown steps file and reports the step being worked on.
 *
 * The file is edited by the agent being watched, so it is polled rather than
 * loaded once. Steps are lines carrying one of the status markers; `## ` and
 * `### ` headings give the section path.
 */
class ProjectStepsTracker : public QObject
{
    Q_OBJECT

public:
    static const QString kCompleteMarker;
    static const QString kIncompleteMarker;
    static const QString kInProgressMarker;
    static constexpr int kDefaultCheckIntervalMs = 1000;

    explicit ProjectStepsTracker(const QString& filePath = QString(), QObject* parent = nullptr);

    void setFilePath(const QString& filePath);
    QString filePath() const { return m_filePath; }

    void setCheckIntervalMs(int intervalMs) { m_checkIntervalMs = intervalMs; }
    int checkIntervalMs() const { return m_checkIntervalMs; }

    /**
     * @brief Re-read the file if the check interval has elapsed.
     * @return true when the current step changed
     */
    bool refresh();

    QString currentStep() const { return m_currentStep; }
    bool fileExists() const;

    StepsDiagnostics validate() const;

    static QString parseCurrentStep(const QString& content);
    static StepsDiagnostics validateContent(const QString& content);
    static QStringList splitStepPath(const QString& path);

signals:
    void currentStepChanged(const QString& step);

private:
    bool readFile(QString* content, QString* error) const;

    QString m_filePath;
    QString m_lastContent;
    QString m_currentStep;
    QElapsedTimer m_lastCheck;
    int m_checkIntervalMs = kDefaultCheckIntervalMs;
    bool m_hasContent = false;
};

#endif // PROJECTSTEPSTRACKER_H
