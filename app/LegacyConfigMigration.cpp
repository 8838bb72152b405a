#include "LegacyConfigMigration.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStringList>

namespace iftpfm {

namespace {

// host_from,port_from,login_from,password_from,path_from,
// host_to,port_to,login_to,password_to,path_to,age[,filename_regexp]
bool convertLine(const QString& line, int lineNo, QString& json, QString& err) {
    const QStringList f = line.split(QLatin1Char(','));
    if (f.size() != 11 && f.size() != 12) {
        err = QStringLiteral("line %1: expected 12 fields, found %2").arg(lineNo).arg(f.size());
        return false;
    }
    bool okFrom = false;
    bool okTo = false;
    bool okAge = false;
    const uint portFrom = f[1].trimmed().toUInt(&okFrom);
    const uint portTo = f[6].trimmed().toUInt(&okTo);
    const qulonglong age = f[10].trimmed().toULongLong(&okAge);
    if (!okFrom || portFrom == 0 || portFrom > 65535) {
        err = QStringLiteral("line %1: invalid port_from '%2'").arg(lineNo).arg(f[1]);
        return false;
    }
    if (!okTo || portTo == 0 || portTo > 65535) {
        err = QStringLiteral("line %1: invalid port_to '%2'").arg(lineNo).arg(f[6]);
        return false;
    }
    if (!okAge) {
        err = QStringLiteral("line %1: invalid age '%2'").arg(lineNo).arg(f[10]);
        return false;
    }

    QJsonObject o;
    o.insert(QStringLiteral("host_from"), f[0]);
    o.insert(QStringLiteral("port_from"), static_cast<int>(portFrom));
    o.insert(QStringLiteral("login_from"), f[2]);
    o.insert(QStringLiteral("password_from"), f[3]);
    o.insert(QStringLiteral("path_from"), f[4]);
    o.insert(QStringLiteral("proto_from"), QStringLiteral("ftp"));
    o.insert(QStringLiteral("host_to"), f[5]);
    o.insert(QStringLiteral("port_to"), static_cast<int>(portTo));
    o.insert(QStringLiteral("login_to"), f[7]);
    o.insert(QStringLiteral("password_to"), f[8]);
    o.insert(QStringLiteral("path_to"), f[9]);
    o.insert(QStringLiteral("proto_to"), QStringLiteral("ftp"));
    o.insert(QStringLiteral("age"), static_cast<double>(age));
    o.insert(QStringLiteral("filename_regexp"), f.size() == 12 ? f[11] : QStringLiteral(".*"));
    json = QString::fromUtf8(QJsonDocument(o).toJson(QJsonDocument::Compact));
    return true;
}

} // namespace

bool migrateLegacyConfig(const QString& csv, QString& jsonl, QString& err, int* converted) {
    QStringList lines = csv.split(QLatin1Char('\n'));
    if (!lines.isEmpty() && lines.back().isEmpty())
        lines.removeLast();

    QStringList out;
    int count = 0;
    int lineNo = 0;
    for (QString line : lines) {
        ++lineNo;
        if (line.endsWith(QLatin1Char('\r')))
            line.chop(1);
        const QString trimmed = line.trimmed();
        if (trimmed.isEmpty() || trimmed.startsWith(QLatin1Char('#'))) {
            out << line;
            continue;
        }
        QString json;
        if (!convertLine(trimmed, lineNo, json, err))
            return false;
        out << json;
        ++count;
    }
    jsonl = out.isEmpty() ? QString() : out.join(QLatin1Char('\n')) + QLatin1Char('\n');
    if (converted)
        *converted = count;
    return true;
}

bool migrateLegacyConfigFile(const QString& inputPath, const QString& outputPath,
                             QString& err, int* converted) {
    QFile in(inputPath);
    if (!in.open(QIODevice::ReadOnly | QIODevice::Text)) {
        err = QStringLiteral("cannot open %1: %2").arg(inputPath, in.errorString());
        return false;
    }
    QString jsonl;
    if (!migrateLegacyConfig(QString::fromUtf8(in.readAll()), jsonl, err, converted))
        return false;

    QSaveFile out(outputPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Text)) {
        err = QStringLiteral("cannot create %1: %2").arg(outputPath, out.errorString());
        return false;
    }
    out.write(jsonl.toUtf8());
    if (!out.commit()) {
        err = QStringLiteral("cannot write %1: %2").arg(outputPath, out.errorString());
        return false;
    }
    return true;
}

} // namespace iftpfm
