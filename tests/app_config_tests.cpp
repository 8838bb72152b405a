// Configuration loading, command-line parsing, legacy migration and log line
// formatting of the command-line tool.
#include "AppLogging.hpp"
#include "CliOptions.hpp"
#include "ConfigLoader.hpp"
#include "LegacyConfigMigration.hpp"

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QFile>
#include <QStringList>
#include <QTemporaryDir>
#include <QTime>
#include <QtGlobal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

const char kFtpLine[] =
    R"({"host_from":"src.example","port_from":21,"login_from":"u1","password_from":"p1",)"
    R"("path_from":"/out","host_to":"dst.example","port_to":2121,"login_to":"u2",)"
    R"("password_to":"p2","path_to":"/in","age":300,"filename_regexp":".*\\.txt"})";

bool parseOne(const QByteArray &line, iftpfm::ConfigEntry &entry, QString &err) {
    std::vector<iftpfm::ConfigEntry> entries;
    if (!iftpfm::parseConfigText(line, entries, err))
        return false;
    if (entries.size() != 1) {
        err = QStringLiteral("expected one entry");
        return false;
    }
    entry = entries.front();
    return true;
}

QByteArray withField(const QByteArray &line, const QByteArray &from, const QByteArray &to) {
    QByteArray copy = line;
    return copy.replace(from, to);
}

void test_valid_ftp_entry(TestContext &t) {
    iftpfm::ConfigEntry e;
    QString err;
    t.check(parseOne(kFtpLine, e, err), "plain ftp entry parses: " + err.toStdString());
    t.check(e.from.protocol == iftpfm::Protocol::Ftp && e.to.protocol == iftpfm::Protocol::Ftp,
            "protocol defaults to ftp");
    t.check(e.from.host == "src.example" && e.from.port == 21, "source endpoint");
    t.check(e.to.port == 2121 && e.to.path == "/in", "destination endpoint");
    t.check(e.from.credential.password == std::string("p1"), "source password");
    t.check(e.min_age_seconds == 300, "age");
    t.check(e.matches("report.txt"), "regex matches a .txt name");
    t.check(e.matches("report.txt.bak"), "regex may match inside the name");
    t.check(!e.matches("report.csv"), "regex rejects names without a match");
}

void test_sftp_credentials(TestContext &t) {
    const QByteArray keyed = withField(
        withField(kFtpLine, R"("password_from":"p1")",
                  R"("keyfile_from":"/home/u/.ssh/id_ed25519","keyfile_passphrase_from":"s3")"),
        R"("path_from")", R"("proto_from":"sftp","path_from")");
    iftpfm::ConfigEntry e;
    QString err;
    t.check(parseOne(keyed, e, err), "sftp with key file parses: " + err.toStdString());
    t.check(e.from.protocol == iftpfm::Protocol::Sftp, "proto_from honoured");
    t.check(e.from.credential.key_path == std::string("/home/u/.ssh/id_ed25519"), "key path");
    t.check(e.from.credential.key_passphrase == std::string("s3"), "key passphrase");
    t.check(!e.from.credential.password, "no password alongside the key");

    const QByteArray both = withField(keyed, R"("login_from")", R"("password_from":"x","login_from")");
    t.check(!parseOne(both, e, err), "sftp with password and key file is rejected");
    t.check(err.contains(QStringLiteral("exactly one")), "both-credentials error explained");

    const QByteArray neither = withField(
        withField(kFtpLine, R"("password_from":"p1",)", ""),
        R"("path_from")", R"("proto_from":"sftp","path_from")");
    t.check(!parseOne(neither, e, err), "sftp without credentials is rejected");

    const QByteArray ftpKey = withField(kFtpLine, R"("password_to":"p2")",
                                        R"("password_to":"p2","keyfile_to":"/k")");
    t.check(!parseOne(ftpKey, e, err), "key file on an ftp side is rejected");
    t.check(err.contains(QStringLiteral("keyfile_to")), "error names keyfile_to");

    const QByteArray orphanPhrase = withField(kFtpLine, R"("password_to":"p2")",
                                              R"("password_to":"p2","keyfile_passphrase_to":"x")");
    t.check(!parseOne(orphanPhrase, e, err), "passphrase without key file is rejected");

    const QByteArray shortPhrase = withField(keyed, "keyfile_passphrase_from", "keyfile_pass_from");
    t.check(parseOne(shortPhrase, e, err), "keyfile_pass_from accepted: " + err.toStdString());
    t.check(e.from.credential.key_passphrase == std::string("s3"),
            "keyfile_pass_from sets the passphrase");

    const QByteArray bothPhrases = withField(keyed, R"("login_from")",
                                             R"("keyfile_pass_from":"s4","login_from")");
    t.check(!parseOne(bothPhrases, e, err), "both passphrase spellings are rejected");
    t.check(err.contains(QStringLiteral("keyfile_pass_from")), "conflict names keyfile_pass_from");

    const QByteArray ftpsNoPassword = withField(
        withField(kFtpLine, R"("password_to":"p2",)", ""),
        R"("path_to")", R"("proto_to":"ftps","path_to")");
    t.check(!parseOne(ftpsNoPassword, e, err), "ftps without password is rejected");
    t.check(err.contains(QStringLiteral("password_to")), "error names password_to");
}

void test_invalid_fields(TestContext &t) {
    iftpfm::ConfigEntry e;
    QString err;
    t.check(!parseOne(withField(kFtpLine, R"("port_from":21,)", ""), e, err),
            "missing port rejected");
    t.check(err.startsWith(QStringLiteral("line 1: port_from")), "missing port message");
    t.check(!parseOne(withField(kFtpLine, "2121", "70000"), e, err), "port above 65535 rejected");
    t.check(!parseOne(withField(kFtpLine, R"("port_from":21)", R"("port_from":"21")"), e, err),
            "port given as string rejected");
    t.check(!parseOne(withField(kFtpLine, R"("age":300)", R"("age":-1)"), e, err),
            "negative age rejected");
    t.check(!parseOne(withField(kFtpLine, R"("age":300)", R"("age":1.5)"), e, err),
            "fractional age rejected");
    t.check(parseOne(withField(kFtpLine, R"("age":300)", R"("age":0)"), e, err) &&
                e.min_age_seconds == 0,
            "age 0 accepted");
    t.check(!parseOne(withField(kFtpLine, R"("host_to":"dst.example")", R"("host_to":"")"), e, err),
            "empty host rejected");
    t.check(!parseOne(withField(kFtpLine, R"("path_from")", R"("proto_from":"scp","path_from")"), e, err),
            "unknown protocol rejected");
    t.check(!parseOne(withField(kFtpLine, R"(".*\\.txt")", R"("[unclosed")"), e, err),
            "invalid regular expression rejected");
    t.check(err.contains(QStringLiteral("filename_regexp")), "regex error names the field");
}

void test_whole_file(TestContext &t) {
    QByteArray text;
    text += "# nightly moves\n\n";
    text += kFtpLine;
    text += "\n   \n";
    text += withField(kFtpLine, "src.example", "other.example");
    text += "\n";
    std::vector<iftpfm::ConfigEntry> entries;
    QString err;
    t.check(iftpfm::parseConfigText(text, entries, err), "comments and blanks skipped: " + err.toStdString());
    t.check(entries.size() == 2, "two entries loaded");
    t.check(entries.size() == 2 && entries[1].from.host == "other.example", "file order kept");

    QByteArray broken = kFtpLine;
    broken += "\n{not json\n";
    t.check(!iftpfm::parseConfigText(broken, entries, err), "invalid JSON rejects the file");
    t.check(err.startsWith(QStringLiteral("invalid JSON on line 2")), "line number reported");

    t.check(!iftpfm::parseConfigText("[1,2]\n", entries, err), "non-object line rejected");

    QTemporaryDir dir;
    t.check(dir.isValid(), "temporary dir");
    const QString path = dir.filePath(QStringLiteral("config.jsonl"));
    QFile f(path);
    t.check(f.open(QIODevice::WriteOnly) && f.write(text) == text.size(), "config written");
    f.close();
    t.check(iftpfm::loadConfigFile(path, entries, err) && entries.size() == 2, "file loads");
    t.check(!iftpfm::loadConfigFile(dir.filePath(QStringLiteral("missing.jsonl")), entries, err),
            "missing file reported");
    t.check(err.contains(QStringLiteral("cannot open config file")), "missing file message");
}

QStringList args(std::initializer_list<const char *> list) {
    QStringList out{QStringLiteral("iftpfm")};
    for (const char *a : list)
        out << QString::fromLatin1(a);
    return out;
}

void test_command_line(TestContext &t) {
    qunsetenv("IFTPFM_DEBUG");
    iftpfm::CliOptions o;
    QString msg;
    t.check(iftpfm::parseCommandLine(args({"jobs.jsonl"}), o, msg) == iftpfm::CliStatus::Run,
            "config path alone runs");
    t.check(o.configPath == QStringLiteral("jobs.jsonl"), "config path stored");
    t.check(o.workers == 1 && !o.deleteSource && !o.randomize && !o.debug, "defaults");
    t.check(o.ramThreshold == iftpfm::kDefaultRamThreshold, "default RAM threshold");
    t.check(o.logFile.isEmpty(), "stdout logging by default");

    iftpfm::CliOptions full;
    t.check(iftpfm::parseCommandLine(
                args({"-d", "-r", "-p", "4", "-g", "5", "-t", "7", "-T", "/var/tmp",
                      "--ram-threshold", "0", "--known-hosts-policy", "accept-new",
                      "--lock-file", "/tmp/x.pid", "--debug", "-l", "/tmp/iftpfm.log",
                      "jobs.jsonl"}),
                full, msg) == iftpfm::CliStatus::Run,
            "all options accepted: " + msg.toStdString());
    t.check(full.deleteSource && full.randomize && full.debug, "flags set");
    t.check(full.workers == 4 && full.graceSeconds == 5 && full.connectTimeoutSeconds == 7,
            "numeric options");
    t.check(full.scratchDir == QStringLiteral("/var/tmp") && full.ramThreshold == 0,
            "buffer options");
    t.check(full.knownHostsPolicy == iftpfm::KnownHostsPolicy::AcceptNew, "known hosts policy");
    t.check(full.lockPath == QStringLiteral("/tmp/x.pid"), "lock file");
    t.check(full.logFile == QStringLiteral("/tmp/iftpfm.log"), "log file");

    iftpfm::CliOptions bad;
    t.check(iftpfm::parseCommandLine(args({}), bad, msg) == iftpfm::CliStatus::ExitError,
            "missing config is an error");
    t.check(msg == QStringLiteral("missing configuration file"), "missing config message");
    t.check(iftpfm::parseCommandLine(args({"-l", "a.log", "-s", "c"}), bad, msg) ==
                iftpfm::CliStatus::ExitError,
            "-l with -s is an error");
    t.check(msg.contains(QStringLiteral("mutually exclusive")), "-l/-s message");
    t.check(iftpfm::parseCommandLine(args({"-p", "0", "c"}), bad, msg) ==
                iftpfm::CliStatus::ExitError,
            "zero workers rejected");
    t.check(iftpfm::parseCommandLine(args({"-p", "many", "c"}), bad, msg) ==
                iftpfm::CliStatus::ExitError,
            "non-numeric workers rejected");
    t.check(iftpfm::parseCommandLine(args({"--known-hosts-policy", "maybe", "c"}), bad, msg) ==
                iftpfm::CliStatus::ExitError,
            "unknown host key policy rejected");
    t.check(iftpfm::parseCommandLine(args({"--bogus", "c"}), bad, msg) ==
                iftpfm::CliStatus::ExitError,
            "unknown option rejected");

    t.check(iftpfm::parseCommandLine(args({"-v"}), bad, msg) == iftpfm::CliStatus::ExitOk,
            "-v exits successfully");
    t.check(msg.startsWith(QStringLiteral("iftpfm version ")), "version text");
    t.check(iftpfm::parseCommandLine(args({"-h"}), bad, msg) == iftpfm::CliStatus::ExitOk,
            "-h exits successfully");
    t.check(msg.contains(QStringLiteral("--ram-threshold")), "help lists options");
}

void test_migration(TestContext &t) {
    const QString csv = QStringLiteral(
        "# legacy\n"
        "a.example,21,u1,p1,/out,b.example,2121,u2,p2,/in,60,.*\\.csv\n"
        "\n"
        "c.example,21,u3,p3,/x,d.example,21,u4,p4,/y,0\n");
    QString jsonl;
    QString err;
    int converted = -1;
    t.check(iftpfm::migrateLegacyConfig(csv, jsonl, err, &converted), "migration succeeds");
    t.check(converted == 2, "two data lines converted");
    t.check(jsonl.startsWith(QStringLiteral("# legacy\n")), "comment preserved");
    t.check(jsonl.endsWith(QLatin1Char('\n')), "output ends with a newline");

    std::vector<iftpfm::ConfigEntry> entries;
    t.check(iftpfm::parseConfigText(jsonl.toUtf8(), entries, err),
            "migrated output loads as configuration: " + err.toStdString());
    t.check(entries.size() == 2, "both migrated entries load");
    if (entries.size() == 2) {
        t.check(entries[0].to.port == 2121 && entries[0].min_age_seconds == 60, "fields carried");
        t.check(entries[0].matches("x.csv") && !entries[0].matches("x.txt"), "regex carried");
        t.check(entries[1].pattern_text == ".*", "missing regex defaults to .*");
        t.check(entries[1].from.protocol == iftpfm::Protocol::Ftp, "legacy entries are ftp");
    }

    t.check(!iftpfm::migrateLegacyConfig(QStringLiteral("a,b,c\n"), jsonl, err),
            "short line rejected");
    t.check(err == QStringLiteral("line 1: expected 12 fields, found 3"), "field count message");
    t.check(!iftpfm::migrateLegacyConfig(
                QStringLiteral("a,99999,u,p,/o,b,21,u,p,/i,0,.*\n"), jsonl, err),
            "bad port rejected");

    QTemporaryDir dir;
    const QString in = dir.filePath(QStringLiteral("old.csv"));
    const QString out = dir.filePath(QStringLiteral("new.jsonl"));
    QFile f(in);
    t.check(f.open(QIODevice::WriteOnly) && f.write(csv.toUtf8()) > 0, "csv written");
    f.close();
    t.check(iftpfm::migrateLegacyConfigFile(in, out, err, &converted) && converted == 2,
            "file migration succeeds");
    t.check(iftpfm::loadConfigFile(out, entries, err) && entries.size() == 2,
            "migrated file loads");
}

void test_log_format(TestContext &t) {
    const QDateTime when(QDate(2024, 1, 2), QTime(3, 4, 5));
    t.check(iftpfm::formatLogLine(when, 2, QStringLiteral("hello")) ==
                QStringLiteral("2024-01-02 03:04:05 [T2] hello"),
            "log line layout");
    t.check(iftpfm::formatLogLine(when, 0, QStringLiteral("x")).contains(QStringLiteral("[T0]")),
            "main thread is T0");

    iftpfm::LogEvent ev;
    ev.entry = "ftp://a:21/in -> ftp://b:21/out";
    ev.file = "a.txt";
    ev.message = "Transferred";
    t.check(iftpfm::describeEvent(ev) ==
                QStringLiteral("ftp://a:21/in -> ftp://b:21/out: a.txt: Transferred"),
            "event text includes entry and file");
    ev.entry.clear();
    ev.file.clear();
    t.check(iftpfm::describeEvent(ev) == QStringLiteral("Transferred"), "bare event text");

    iftpfm::setLogWorker(3);
    t.check(iftpfm::logWorker() == 3, "worker number is stored per thread");
    iftpfm::setLogWorker(0);
}

} // namespace

int main() {
    TestContext t;
    test_valid_ftp_entry(t);
    test_sftp_credentials(t);
    test_invalid_fields(t);
    test_whole_file(t);
    test_command_line(t);
    test_migration(t);
    test_log_format(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] app_config_tests\n";
    return EXIT_SUCCESS;
}
