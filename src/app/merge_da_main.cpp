#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

#include "cli_runner.h"
#include "merge_da_command.h"
#include "core/tool_config.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("merge_da");
    app.setApplicationVersion(datool::TOOL_VERSION);

    QTextStream out(stdout);
    QTextStream err(stderr);

    datool::MergeDaCommand command;
    datool::CliRunner runner(command, out, err);
    return runner.run(app.arguments());
}
