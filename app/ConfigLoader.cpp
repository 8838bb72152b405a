#include "ConfigLoader.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <cmath>
#include <regex>

namespace iftpfm {

namespace {

QString fieldError(int lineNo, const QString& field, const QString& what) {
    return QStringLiteral("line %1: %2 %3").arg(lineNo).arg(field, what);
}

bool requireString(const QJsonObject& obj, const QString& key, int lineNo,
                   std::string& out, QString& err) {
    const QJsonValue v = obj.value(key);
    if (!v.isString() || v.toString().isEmpty()) {
        err = fieldError(lineNo, key, QStringLiteral("must be a non-empty string"));
        return false;
    }
    out = v.toString().toStdString();
    return true;
}

bool optionalString(const QJsonObject& obj, const QString& key, int lineNo,
                    std::optional<std::string>& out, QString& err) {
    if (!obj.contains(key) || obj.value(key).isNull())
        return true;
    const QJsonValue v = obj.value(key);
    if (!v.isString()) {
        err = fieldError(lineNo, key, QStringLiteral("must be a string"));
        return false;
    }
    out = v.toString().toStdString();
    return true;
}

bool integerValue(const QJsonValue& v, double minimum, double maximum, qint64& out) {
    if (!v.isDouble())
        return false;
    const double d = v.toDouble();
    if (std::floor(d) != d || d < minimum || d > maximum)
        return false;
    out = static_cast<qint64>(d);
    return true;
}

bool parseSide(const QJsonObject& obj, const QString& suffix, int lineNo,
               Endpoint& ep, QString& err) {
    const QString protoKey = QStringLiteral("proto") + suffix;
    if (obj.contains(protoKey)) {
        const QJsonValue v = obj.value(protoKey);
        if (!v.isString() || !parseProtocol(v.toString().toStdString(), ep.protocol)) {
            err = fieldError(lineNo, protoKey, QStringLiteral("must be \"ftp\", \"ftps\" or \"sftp\""));
            return false;
        }
    } else {
        ep.protocol = Protocol::Ftp;
    }

    if (!requireString(obj, QStringLiteral("host") + suffix, lineNo, ep.host, err) ||
        !requireString(obj, QStringLiteral("login") + suffix, lineNo, ep.login, err) ||
        !requireString(obj, QStringLiteral("path") + suffix, lineNo, ep.path, err))
        return false;

    const QString portKey = QStringLiteral("port") + suffix;
    qint64 port = 0;
    if (!integerValue(obj.value(portKey), 1, 65535, port)) {
        err = fieldError(lineNo, portKey, QStringLiteral("must be an integer in 1..65535"));
        return false;
    }
    ep.port = static_cast<std::uint16_t>(port);

    const QString pwKey = QStringLiteral("password") + suffix;
    const QString keyKey = QStringLiteral("keyfile") + suffix;
    // keyfile_pass_* is the spelling older configurations use.
    const QString shortPassphraseKey = QStringLiteral("keyfile_pass") + suffix;
    QString passphraseKey = QStringLiteral("keyfile_passphrase") + suffix;
    if (obj.contains(shortPassphraseKey)) {
        if (obj.contains(passphraseKey)) {
            err = fieldError(lineNo, shortPassphraseKey,
                             QStringLiteral("conflicts with ") + passphraseKey);
            return false;
        }
        passphraseKey = shortPassphraseKey;
    }
    Credential& cred = ep.credential;
    if (!optionalString(obj, pwKey, lineNo, cred.password, err) ||
        !optionalString(obj, keyKey, lineNo, cred.key_path, err) ||
        !optionalString(obj, passphraseKey, lineNo, cred.key_passphrase, err))
        return false;

    if (cred.key_passphrase && !cred.key_path) {
        err = fieldError(lineNo, passphraseKey, QStringLiteral("given without ") + keyKey);
        return false;
    }
    if (ep.protocol == Protocol::Sftp) {
        if (cred.password.has_value() == cred.key_path.has_value()) {
            err = QStringLiteral("line %1: sftp needs exactly one of %2 and %3")
                      .arg(lineNo)
                      .arg(pwKey, keyKey);
            return false;
        }
    } else {
        if (!cred.password) {
            err = fieldError(lineNo, pwKey,
                             QStringLiteral("is required for %1").arg(QString::fromLatin1(protocolName(ep.protocol))));
            return false;
        }
        if (cred.key_path) {
            err = fieldError(lineNo, keyKey, QStringLiteral("is only supported for sftp"));
            return false;
        }
    }
    return true;
}

} // namespace

bool parseConfigObject(const QJsonObject& obj, int lineNo, ConfigEntry& out, QString& err) {
    ConfigEntry entry;
    if (!parseSide(obj, QStringLiteral("_from"), lineNo, entry.from, err) ||
        !parseSide(obj, QStringLiteral("_to"), lineNo, entry.to, err))
        return false;

    qint64 age = 0;
    if (!integerValue(obj.value(QStringLiteral("age")), 0, 9007199254740992.0, age)) {
        err = fieldError(lineNo, QStringLiteral("age"), QStringLiteral("must be a non-negative integer"));
        return false;
    }
    entry.min_age_seconds = static_cast<std::uint64_t>(age);

    std::string pattern;
    if (!requireString(obj, QStringLiteral("filename_regexp"), lineNo, pattern, err))
        return false;
    try {
        entry.pattern = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        err = fieldError(lineNo, QStringLiteral("filename_regexp"),
                         QStringLiteral("is not a valid regular expression: %1").arg(QString::fromLatin1(e.what())));
        return false;
    }
    entry.pattern_text = pattern;
    out = std::move(entry);
    return true;
}

bool parseConfigText(const QByteArray& text, std::vector<ConfigEntry>& out, QString& err) {
    out.clear();
    const QList<QByteArray> lines = text.split('\n');
    int lineNo = 0;
    for (const QByteArray& raw : lines) {
        ++lineNo;
        const QByteArray line = raw.trimmed();
        if (line.isEmpty() || line.startsWith('#'))
            continue;
        QJsonParseError perr;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &perr);
        if (perr.error != QJsonParseError::NoError) {
            err = QStringLiteral("invalid JSON on line %1: %2").arg(lineNo).arg(perr.errorString());
            return false;
        }
        if (!doc.isObject()) {
            err = QStringLiteral("invalid JSON on line %1: expected an object").arg(lineNo);
            return false;
        }
        ConfigEntry entry;
        if (!parseConfigObject(doc.object(), lineNo, entry, err))
            return false;
        out.push_back(std::move(entry));
    }
    return true;
}

bool loadConfigFile(const QString& path, std::vector<ConfigEntry>& out, QString& err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("cannot open config file %1: %2").arg(path, f.errorString());
        return false;
    }
    return parseConfigText(f.readAll(), out, err);
}

} // namespace iftpfm
