// iftpfm-migrate: legacy CSV configuration to JSON Lines.
#include "LegacyConfigMigration.hpp"

#include <QCoreApplication>
#include <QStringList>
#include <QTextStream>
#include <cstdio>

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = app.arguments();
    if (args.size() != 3) {
        err << "Usage: " << args.value(0) << " <input.csv> <output.jsonl>\n\n"
            << "CSV format:\n"
            << "  host_from,port_from,login_from,password_from,path_from,"
               "host_to,port_to,login_to,password_to,path_to,age,filename_regexp\n";
        return 1;
    }

    QString why;
    int converted = 0;
    if (!iftpfm::migrateLegacyConfigFile(args[1], args[2], why, &converted)) {
        err << "Error: " << why << "\n";
        return 1;
    }
    out << "Successfully converted " << converted << " lines from " << args[1] << " to "
        << args[2] << "\n";
    return 0;
}
