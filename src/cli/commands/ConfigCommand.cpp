#include "cli/commands/ConfigCommand.h"

#include "cli/commands/RunCommand.h"
#include "settings/Settings.h"

#include <QRect>
#include <QSettings>
#include <QTextStream>

namespace CommandWatch {
namespace CLI {

namespace {

enum class ValueKind {
    Text,
    Integer,
    PhraseList,
    Region
};

ValueKind kindForKey(const QString& key)
{
    static const QStringList integerKeys = {
        QStringLiteral("watch/pollIntervalMs"),
        QStringLiteral("watch/actionDelayMs"),
        QStringLiteral("watch/keyStepDelayMs"),
        QStringLiteral("watch/countdownSeconds"),
        QStringLiteral("OCR/upscaleFactor"),
        QStringLiteral("OCR/minConfidence")
    };
    static const QStringList phraseKeys = {
        QStringLiteral("detection/acceptPhrases"),
        QStringLiteral("detection/completedPhrases")
    };

    if (key == QLatin1String("watch/region")) {
        return ValueKind::Region;
    }
    if (integerKeys.contains(key)) {
        return ValueKind::Integer;
    }
    if (phraseKeys.contains(key)) {
        return ValueKind::PhraseList;
    }
    return ValueKind::Text;
}

QString displayValue(const QVariant& value)
{
    if (value.typeId() == QMetaType::QStringList) {
        return value.toStringList().join(", ");
    }
    if (value.typeId() == QMetaType::QRect) {
        const QRect rect = value.toRect();
        return QString("%1,%2,%3,%4").arg(rect.x()).arg(rect.y()).arg(rect.width()).arg(rect.height());
    }
    return value.toString();
}

} // namespace

QVariant ConfigCommand::parseValue(const QString& key, const QString& text, QString* error)
{
    switch (kindForKey(key)) {
    case ValueKind::Integer: {
        bool ok = false;
        const int value = text.trimmed().toInt(&ok);
        if (!ok) {
            *error = QString("%1 expects a whole number, got '%2'").arg(key, text);
            return QVariant();
        }
        return value;
    }
    case ValueKind::PhraseList: {
        QStringList phrases;
        for (const QString& part : text.split(',')) {
            const QString phrase = part.trimmed();
            if (!phrase.isEmpty()) {
                phrases.append(phrase);
            }
        }
        if (phrases.isEmpty()) {
            *error = QString("%1 expects a comma separated list of phrases").arg(key);
            return QVariant();
        }
        return phrases;
    }
    case ValueKind::Region: {
        const QRect region = RunCommand::parseRegion(text);
        if (!region.isValid()) {
            *error = QString("%1 expects x,y,width,height, got '%2'").arg(key, text);
            return QVariant();
        }
        return region;
    }
    case ValueKind::Text:
        break;
    }
    return text;
}

ConfigCommand::ConfigCommand()
    : CLICommand(QStringLiteral("config"), QStringLiteral("List, get, set or reset stored settings"))
{
}

void ConfigCommand::addOptions(QCommandLineParser& parser)
{
    parser.addOption({"list", "Print every stored key (the default)"});
    parser.addOption({"get", "Print the value stored under <key>", "key"});
    parser.addOption({"set", "Store the positional value under <key>", "key"});
    parser.addOption({"reset", "Remove every stored key"});
    parser.addPositionalArgument("value", "New value for --set");
}

CLIResult ConfigCommand::run(const QCommandLineParser& parser)
{
    QSettings settings = getSettings();

    if (parser.isSet("get")) {
        const QString key = parser.value("get");
        if (!settings.contains(key)) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("No stored value for %1").arg(key));
        }
        return CLIResult::success(displayValue(settings.value(key)));
    }

    if (parser.isSet("set")) {
        const QString key = parser.value("set");
        const QStringList values = parser.positionalArguments();
        if (values.size() != 1) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    "--set takes exactly one value");
        }
        QString parseError;
        const QVariant value = parseValue(key, values.first(), &parseError);
        if (!value.isValid()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, parseError);
        }
        settings.setValue(key, value);
        settings.sync();
        if (settings.status() != QSettings::NoError) {
            return CLIResult::error(CLIResult::Code::FileError,
                                    QString("Could not write %1").arg(settings.fileName()));
        }
        return CLIResult::success(QString("%1 = %2").arg(key, displayValue(value)));
    }

    if (parser.isSet("reset")) {
        settings.clear();
        settings.sync();
        return CLIResult::success(QString("Cleared %1").arg(settings.fileName()));
    }

    return listAll(settings);
}

CLIResult ConfigCommand::listAll(const QSettings& settings)
{
    QStringList keys = settings.allKeys();
    keys.sort();

    QString output;
    QTextStream out(&output);
    out << settings.fileName() << "\n";
    if (keys.isEmpty()) {
        out << "  (nothing stored, defaults apply)\n";
    }
    for (const QString& key : keys) {
        out << "  " << key << " = " << displayValue(settings.value(key)) << "\n";
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace CommandWatch
