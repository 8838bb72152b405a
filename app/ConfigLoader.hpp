// JSON Lines configuration: one transfer entry per line.
#pragma once
#include "iftpfm/TransferTypes.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <vector>

namespace iftpfm {

// Validates one parsed object; lineNo is only used in messages.
bool parseConfigObject(const QJsonObject& obj, int lineNo, ConfigEntry& out, QString& err);

// Whole-file parse. Any invalid line rejects the file.
bool parseConfigText(const QByteArray& text, std::vector<ConfigEntry>& out, QString& err);

bool loadConfigFile(const QString& path, std::vector<ConfigEntry>& out, QString& err);

} // namespace iftpfm
