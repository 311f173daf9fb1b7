#include "steps/ProjectStepsTracker.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

const QString ProjectStepsTracker::kCompleteMarker = QStringLiteral("✓");
const QString ProjectStepsTracker::kIncompleteMarker = QStringLiteral("❌");
const QString ProjectStepsTracker::kInProgressMarker = QStringLiteral("\U0001F504");

namespace {

const QString kStepPathSeparator = QStringLiteral(" > ");

QString cleanStepText(QString line)
{
    line.remove(ProjectStepsTracker::kInProgressMarker);
    line.remove(ProjectStepsTracker::kIncompleteMarker);
    line.remove(ProjectStepsTracker::kCompleteMarker);

    int start = 0;
    int end = line.size();
    auto isStrippable = [](QChar c) { return c == QLatin1Char('-') || c == QLatin1Char(' '); };
    while (start < end && isStrippable(line.at(start))) {
        ++start;
    }
    while (end > start && isStrippable(line.at(end - 1))) {
        --end;
    }
    return line.mid(start, end - start).trimmed();
}

} // namespace

ProjectStepsTracker::ProjectStepsTracker(const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
{
}

void ProjectStepsTracker::setFilePath(const QString& filePath)
{
    if (m_filePath == filePath) {
        return;
    }
    m_filePath = filePath;
    m_lastContent.clear();
    m_hasContent = false;
    m_lastCheck.invalidate();
    if (!m_currentStep.isEmpty()) {
        m_currentStep.clear();
        emit currentStepChanged(m_currentStep);
    }
}

bool ProjectStepsTracker::fileExists() const
{
    return !m_filePath.isEmpty() && QFileInfo::exists(m_filePath);
}

bool ProjectStepsTracker::refresh()
{
    if (m_lastCheck.isValid() && m_lastCheck.elapsed() < m_checkIntervalMs) {
        return false;
    }
    m_lastCheck.start();

    QString content;
    QString error;
    QString step;
    if (readFile(&content, &error)) {
        if (m_hasContent && content == m_lastContent) {
            return false;
        }
        m_lastContent = content;
        m_hasContent = true;
        step = parseCurrentStep(content);
    } else {
        m_lastContent.clear();
        m_hasContent = false;
    }

    if (step == m_currentStep) {
        return false;
    }
    m_currentStep = step;
    if (!step.isEmpty()) {
        qInfo().noquote() << QStringLiteral("Current step: %1").arg(step);
    }
    emit currentStepChanged(m_currentStep);
    return true;
}

StepsDiagnostics ProjectStepsTracker::validate() const
{
    QString content;
    QString error;
    if (!readFile(&content, &error)) {
        StepsDiagnostics diagnostics;
        diagnostics.readError = error;
        diagnostics.issues << QStringLiteral("Error reading file: %1").arg(error);
        return diagnostics;
    }
    return validateContent(content);
}

QString ProjectStepsTracker::parseCurrentStep(const QString& content)
{
    QString mainSection;
    QString subsection;
    QString firstIncomplete;

    const QStringList lines = content.split(QLatin1Char('\n'));
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty()) {
            continue;
        }

        if (line.startsWith(QLatin1String("## "))) {
            mainSection = line.mid(3).trimmed();
            subsection.clear();
        } else if (line.startsWith(QLatin1String("### "))) {
            subsection = line.mid(4).trimmed();
        }

        // Headings can carry markers too and then count as steps.
        const bool inProgress = line.contains(kInProgressMarker);
        const bool incomplete = !inProgress && line.contains(kIncompleteMarker);
        if (!inProgress && !incomplete) {
            continue;
        }

        QStringList path;
        path << mainSection;
        if (!subsection.isEmpty()) {
            path << subsection;
        }
        path << cleanStepText(line);
        const QString joined = path.join(kStepPathSeparator);

        if (inProgress) {
            return joined;
        }
        if (firstIncomplete.isEmpty()) {
            firstIncomplete = joined;
        }
    }
    return firstIncomplete;
}

StepsDiagnostics ProjectStepsTracker::validateContent(const QString& content)
{
    StepsDiagnostics diagnostics;

    const QStringList lines = content.split(QLatin1Char('\n'));
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.startsWith(QLatin1String("## "))) {
            diagnostics.hasSections = true;
        } else if (line.startsWith(QLatin1String("### "))) {
            diagnostics.hasSubsections = true;
        } else if (line.contains(kCompleteMarker)) {
            ++diagnostics.completed;
            ++diagnostics.totalSteps;
        } else if (line.contains(kIncompleteMarker)) {
            diagnostics.hasIncompleteMarkers = true;
            ++diagnostics.incomplete;
            ++diagnostics.totalSteps;
        } else if (line.contains(kInProgressMarker)) {
            diagnostics.hasInProgressMarkers = true;
            ++diagnostics.inProgress;
            ++diagnostics.totalSteps;
        }
    }

    if (!diagnostics.hasSections) {
        diagnostics.issues << QStringLiteral(
            "No sections (##) found. File should have sections marked with ##");
    }
    if (!diagnostics.hasInProgressMarkers && !diagnostics.hasIncompleteMarkers) {
        diagnostics.issues << QStringLiteral("No progress (%1) or incomplete (%2) markers found")
                                  .arg(kInProgressMarker, kIncompleteMarker);
    }
    if (diagnostics.inProgress > 1) {
        diagnostics.warnings << QStringLiteral("Multiple in-progress (%1) steps found: %2")
                                    .arg(kInProgressMarker)
                                    .arg(diagnostics.inProgress);
    }
    return diagnostics;
}

QStringList ProjectStepsTracker::splitStepPath(const QString& path)
{
    if (path.isEmpty()) {
        return QStringList();
    }
    return path.split(kStepPathSeparator);
}

bool ProjectStepsTracker::readFile(QString* content, QString* error) const
{
    if (m_filePath.isEmpty()) {
        *error = QStringLiteral("No steps file configured");
        return false;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        *error = QStringLiteral("%1: %2").arg(m_filePath, file.errorString());
        return false;
    }
    *content = QString::fromUtf8(file.readAll());
    return true;
}
