#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

#include "cli_runner.h"
#include "strip_header_command.h"
#include "core/tool_config.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("strip_header");
    app.setApplicationVersion(datool::TOOL_VERSION);

    QTextStream out(stdout);
    QTextStream err(stderr);

    datool::StripHeaderCommand command;
    datool::CliRunner runner(command, out, err);
    return runner.run(app.arguments());
}
