#include <QCoreApplication>
#include <QTextStream>
#include "cli/CLIHandler.h"
#include "settings/Settings.h"
#include "version.h"

using RotoRect::CLI::CLIHandler;
using RotoRect::CLI::CLIResult;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(ROTORECT_APP_NAME);
    app.setOrganizationName(RotoRect::kOrganizationName);
    app.setApplicationVersion(ROTORECT_VERSION);

    CLIHandler handler;
    const CLIResult result = handler.process(app.arguments());

    if (result.isSuccess()) {
        QTextStream out(stdout);
        if (!result.message.isEmpty()) {
            out << result.message;
            if (!result.message.endsWith('\n')) {
                out << '\n';
            }
        }
    } else {
        QTextStream err(stderr);
        err << "Error: " << result.message;
        if (!result.message.endsWith('\n')) {
            err << '\n';
        }
    }

    return static_cast<int>(result.code);
}
