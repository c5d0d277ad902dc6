#include "cli_runner.h"
#include "da_command.h"
#include "core/logger.h"
#include "core/tool_config.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QTextStream>

namespace datool {

static constexpr char LOG_TAG[] = "CLI";

CliRunner::CliRunner(DaCommand& command, QTextStream& out, QTextStream& err)
    : m_command(command)
    , m_out(out)
    , m_err(err)
    , m_programName(command.name())
{
}

int CliRunner::run(const QStringList& arguments)
{
    if (!arguments.isEmpty() && !arguments.first().isEmpty())
        m_programName = QFileInfo(arguments.first()).fileName();

    QCommandLineParser parser;
    parser.setSingleDashWordOptionStyle(QCommandLineParser::ParseAsCompactedShortOptions);

    const QCommandLineOption helpOption(QStringList{"h", "help"}, "Display this help message and exit");
    const QCommandLineOption versionOption(QStringList{"v", "version"}, "Display version information and exit");
    const QCommandLineOption headerLengthOption("header-length", "Header size in bytes", "N");
    const QCommandLineOption strictOption("strict", "Fail if SOURCE_DA is shorter than the header");
    const QCommandLineOption quietOption(QStringList{"q", "quiet"}, "Suppress confirmation messages");
    const QCommandLineOption verboseOption("verbose", "Print debug diagnostics to stderr");
    const QCommandLineOption logDirOption("log-dir", "Also write diagnostics to a log file in DIR", "DIR");

    parser.addOptions({helpOption, versionOption, headerLengthOption, strictOption,
                       quietOption, verboseOption, logDirOption});
    parser.addPositionalArgument("args", m_command.synopsis());

    // Bare invocation behaves like --help
    if (arguments.size() <= 1) {
        m_out << usage(DA_HEADER_LENGTH);
        m_out.flush();
        return ExitSuccess;
    }

    if (!parser.parse(arguments))
        return invalidArguments(parser.errorText());

    ToolConfig config;
    const bool headerLengthSet = parser.isSet(headerLengthOption);
    const bool headerLengthValid = !headerLengthSet
        || ToolConfig::parseHeaderLength(parser.value(headerLengthOption),
                                         config.layout.headerLength);

    if (parser.isSet(helpOption)) {
        m_out << usage(config.layout.headerLength);
        m_out.flush();
        return ExitSuccess;
    }

    if (parser.isSet(versionOption)) {
        m_out << versionLine() << Qt::endl;
        return ExitSuccess;
    }

    if (!headerLengthValid)
        return invalidArguments(QString("Invalid header length '%1'.")
                                    .arg(parser.value(headerLengthOption)));

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != m_command.positionalCount())
        return invalidArguments("Invalid number of arguments.");

    config.strict = parser.isSet(strictOption);
    config.quiet = parser.isSet(quietOption);
    config.verbose = parser.isSet(verboseOption);
    config.logDir = parser.value(logDirOption);
    if (!config.applyToLogger())
        m_err << QString("WARNING: Cannot create a log file in '%1'.").arg(config.logDir) << Qt::endl;

    LOG_DEBUG_CAT(LOG_TAG, QString("%1 %2, header length %3")
                               .arg(m_programName, positional.join(' '))
                               .arg(config.layout.headerLength));

    const DaError result = m_command.execute(positional, config, m_out);
    m_out.flush();

    if (result != DaError::None) {
        LOG_ERROR_CAT(LOG_TAG, QString("%1 failed with %2").arg(m_programName, daErrorName(result)));
        m_err << "ERROR: " << m_command.errorString() << Qt::endl;
        return ExitFailure;
    }
    return ExitSuccess;
}

QString CliRunner::usage(qint64 headerLength) const
{
    QString text;
    QTextStream s(&text);
    s << "USAGE: " << m_programName << " [OPTION]... " << m_command.synopsis() << "\n"
      << m_command.summary() << "\n"
      << "\n"
      << "EXAMPLE:\n"
      << "  " << m_programName << " " << m_command.example() << "\n"
      << "\n"
      << "OPTIONS:\n"
      << "  -h, --help             Display this help message and exit\n"
      << "  -v, --version          Display version information and exit\n"
      << "      --header-length N  Header size in bytes, decimal or 0x-prefixed hex\n"
      << "                         (default: 0x" << QString::number(DA_HEADER_LENGTH, 16).toUpper() << ")\n"
      << "      --strict           Fail if SOURCE_DA is shorter than the header\n"
      << "  -q, --quiet            Suppress confirmation messages\n"
      << "      --verbose          Print debug diagnostics to stderr\n"
      << "      --log-dir DIR      Also write diagnostics to a log file in DIR\n"
      << "\n"
      << "DESCRIPTION:\n"
      << "  " << m_command.description(headerLength) << "\n"
      << "\n";
    s.flush();
    return text;
}

QString CliRunner::versionLine() const
{
    return QString("%1 version %2").arg(m_programName, QString::fromLatin1(TOOL_VERSION));
}

int CliRunner::invalidArguments(const QString& message)
{
    m_err << "ERROR: " << message << Qt::endl;
    m_err << QString("Try '%1 --help' for more information.").arg(m_programName) << Qt::endl;
    LOG_DEBUG_CAT(LOG_TAG, QString("%1: %2").arg(daErrorName(DaError::InvalidArguments), message));
    return ExitFailure;
}

} // namespace datool
