#pragma once

#include <QString>
#include <QStringList>

class QTextStream;

namespace datool {

class DaCommand;

enum ExitCode {
    ExitSuccess = 0,
    ExitFailure = 1
};

// Drives one DA command: parse arguments, validate, execute, report
class CliRunner {
public:
    CliRunner(DaCommand& command, QTextStream& out, QTextStream& err);

    // arguments[0] is the program path, as in QCoreApplication::arguments()
    int run(const QStringList& arguments);

    QString usage(qint64 headerLength) const;
    QString versionLine() const;

private:
    int invalidArguments(const QString& message);

    DaCommand& m_command;
    QTextStream& m_out;
    QTextStream& m_err;
    QString m_programName;
};

} // namespace datool
