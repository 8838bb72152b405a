// Conversion of the legacy comma-separated configuration to JSON Lines.
#pragma once
#include <QString>

namespace iftpfm {

// Converts the whole CSV text. Comment and blank lines are copied as they
// are; every other line becomes one JSON object with proto_from/proto_to
// set to "ftp". Stops at the first malformed line.
bool migrateLegacyConfig(const QString& csv, QString& jsonl, QString& err, int* converted = nullptr);

bool migrateLegacyConfigFile(const QString& inputPath, const QString& outputPath,
                             QString& err, int* converted = nullptr);

} // namespace iftpfm
