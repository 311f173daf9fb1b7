#include "automation/AutomationSession.h"
#include "input/IKeySynthesizer.h"
#include "settings/WatchSettingsManager.h"

#include <QDebug>
#include <QThread>

SessionConfig SessionConfig::fromSettings()
{
    const auto& settings = WatchSettingsManager::instance();

    SessionConfig config;
    config.acceptPhrases = settings.loadAcceptPhrases();
    config.completedPhrases = settings.loadCompletedPhrases();
    config.acceptChord = KeyChord::fromString(settings.loadAcceptChord());
    config.chatFocusChord = KeyChord::fromString(settings.loadChatFocusChord());
    config.actionDelayMs = settings.loadActionDelayMs();
    config.keyStepDelayMs = settings.loadKeyStepDelayMs();
    config.continueMessage = settings.loadContinueMessage();
    config.nextStepMessage = settings.loadNextStepMessage();
    config.completeStepMessage = settings.loadCompleteStepMessage();

    if (!config.acceptChord.isValid()) {
        qWarning() << "SessionConfig: Invalid accept chord" << settings.loadAcceptChord()
                   << "- using" << WatchSettingsManager::kDefaultAcceptChord;
        config.acceptChord = KeyChord::fromString(WatchSettingsManager::kDefaultAcceptChord);
    }
    if (!config.chatFocusChord.isValid()) {
        qWarning() << "SessionConfig: Invalid chat focus chord" << settings.loadChatFocusChord()
                   << "- using" << WatchSettingsManager::kDefaultChatFocusChord;
        config.chatFocusChord = KeyChord::fromString(WatchSettingsManager::kDefaultChatFocusChord);
    }
    return config;
}

AutomationSession::AutomationSession(IKeySynthesizer *synthesizer,
                                     const SessionConfig &config,
                                     QObject *parent)
    : QObject(parent)
    , m_synthesizer(synthesizer)
{
    setConfig(config);
}

void AutomationSession::setConfig(const SessionConfig &config)
{
    m_config = config;
    m_classifier = ButtonClassifier(config.acceptPhrases, config.completedPhrases);
}

ButtonKind AutomationSession::handleText(const QString &text)
{
    if (text.isEmpty()) {
        return ButtonKind::None;
    }

    if (!m_seenTexts.contains(text)) {
        m_seenTexts.insert(text);
        report(QStringLiteral("New text detected: '%1'").arg(text));
    }

    const ButtonMatch match = m_classifier.classify(text);
    const bool isNewText = text != m_lastText;
    ButtonKind handled = ButtonKind::None;

    if (match.accept && isNewText) {
        report(QStringLiteral("Found button: '%1'").arg(text));
        wait(m_config.actionDelayMs);

        if (pressAcceptChord()) {
            ++m_commandsExecuted;
            m_waitingForCompletion = true;
            report(QStringLiteral("Pressed %1").arg(m_config.acceptChord.toString()));
            emit countersChanged(m_commandsExecuted, m_messagesSent);
        }
        handled = ButtonKind::Accept;
    } else if (match.completed && m_waitingForCompletion) {
        report(QStringLiteral("Task completed, continuing implementation"));
        wait(m_config.messageSettleMs);
        sendMessage(MessageKind::Continue);
        m_waitingForCompletion = false;
        handled = ButtonKind::Completed;
    } else if (match.generating) {
        if (isNewText) {
            report(QStringLiteral("Waiting for generation..."));
        }
        handled = ButtonKind::Generating;
    } else if (match.cancel) {
        if (isNewText) {
            report(QStringLiteral("Cancel/Skip button detected, waiting..."));
        }
        handled = ButtonKind::Cancel;
    }

    m_lastText = text;
    return handled;
}

bool AutomationSession::sendMessage(MessageKind kind)
{
    if (!m_synthesizer) {
        reportError(QStringLiteral("No keyboard backend available to send %1 message")
                        .arg(messageLabel(kind)));
        return false;
    }

    const QString text = messageText(kind);
    if (text.isEmpty()) {
        reportError(QStringLiteral("The %1 message is empty").arg(messageLabel(kind)));
        return false;
    }

    if (!m_synthesizer->pressChord(m_config.chatFocusChord, m_config.keyStepDelayMs)) {
        reportError(QStringLiteral("Error focusing chat: %1").arg(m_synthesizer->lastError()));
        return false;
    }
    wait(m_config.messageSettleMs);

    if (!m_synthesizer->typeText(text)) {
        reportError(QStringLiteral("Error typing %1 message: %2")
                        .arg(messageLabel(kind), m_synthesizer->lastError()));
        return false;
    }
    wait(m_config.messageSettleMs);

    if (!m_synthesizer->pressKey(Qt::Key_Return)) {
        reportError(QStringLiteral("Error submitting %1 message: %2")
                        .arg(messageLabel(kind), m_synthesizer->lastError()));
        return false;
    }

    ++m_messagesSent;
    report(QStringLiteral("Sent %1 message").arg(messageLabel(kind)));
    emit countersChanged(m_commandsExecuted, m_messagesSent);
    return true;
}

void AutomationSession::reset()
{
    m_lastText.clear();
    m_lastStatus.clear();
    m_seenTexts.clear();
    m_waitingForCompletion = false;
    m_commandsExecuted = 0;
    m_messagesSent = 0;
    emit countersChanged(m_commandsExecuted, m_messagesSent);
}

QString AutomationSession::messageLabel(MessageKind kind)
{
    switch (kind) {
    case MessageKind::Continue:     return QStringLiteral("continue");
    case MessageKind::NextStep:     return QStringLiteral("next step");
    case MessageKind::CompleteStep: return QStringLiteral("complete step");
    }
    return QString();
}

bool AutomationSession::pressAcceptChord()
{
    if (!m_synthesizer) {
        reportError(QStringLiteral("No keyboard backend available to press %1")
                        .arg(m_config.acceptChord.toString()));
        return false;
    }

    if (!m_synthesizer->pressChord(m_config.acceptChord, m_config.keyStepDelayMs)) {
        reportError(QStringLiteral("Error pressing %1: %2")
                        .arg(m_config.acceptChord.toString(), m_synthesizer->lastError()));
        return false;
    }
    return true;
}

QString AutomationSession::messageText(MessageKind kind) const
{
    switch (kind) {
    case MessageKind::Continue:     return m_config.continueMessage;
    case MessageKind::NextStep:     return m_config.nextStepMessage;
    case MessageKind::CompleteStep: return m_config.completeStepMessage;
    }
    return QString();
}

void AutomationSession::report(const QString &status)
{
    m_lastStatus = status;
    qInfo().noquote() << status;
    emit statusChanged(status);
}

void AutomationSession::reportError(const QString &status)
{
    m_lastStatus = status;
    qWarning().noquote() << status;
    emit statusChanged(status);
    emit errorOccurred(status);
}

void AutomationSession::wait(int ms)
{
    if (ms > 0) {
        QThread::msleep(static_cast<unsigned long>(ms));
    }
}
