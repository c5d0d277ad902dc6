/**
 * @file test_cli_runner.cpp
 * @brief Unit tests for the strip_header and merge_da command line front end
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QTemporaryDir>
#include <QTextStream>

#include "app/cli_runner.h"
#include "app/merge_da_command.h"
#include "app/strip_header_command.h"
#include "core/logger.h"
#include "test.hpp"

using namespace datool;

namespace
{

  /**
   * @brief Runs a command with captured stdout and stderr
   */
  struct Invocation
  {
    QString out;
    QString err;
    int code = -1;

    Invocation(DaCommand& command, QStringList const& args)
    {
      Logger::instance().setConsoleEnabled(false);
      QTextStream out_stream(&out);
      QTextStream err_stream(&err);
      CliRunner runner(command, out_stream, err_stream);
      code = runner.run(args);
      out_stream.flush();
      err_stream.flush();
    }
  };

} // namespace

TEST_CASE("no arguments prints usage and exits 0")
{
  StripHeaderCommand strip;
  Invocation run(strip, {"/usr/bin/strip_header"});

  CHECK(run.code == 0);
  CHECK(run.out.startsWith("USAGE: strip_header [OPTION]... SOURCE_DA OUTPUT_BODY"));
  CHECK(run.out.contains("14812"));
  CHECK(run.err.isEmpty());

  MergeDaCommand merge;
  Invocation bare_merge(merge, {"/usr/bin/merge_da"});

  CHECK(bare_merge.code == 0);
  CHECK(bare_merge.out.startsWith("USAGE: merge_da [OPTION]... SOURCE_DA BODY_DA OUTPUT_DA"));
  CHECK(bare_merge.out.contains("14812"));
  CHECK(bare_merge.err.isEmpty());
}

TEST_CASE("help flags print usage and create no output")
{
  QTemporaryDir dir;
  MergeDaCommand merge;

  for (QString const& flag : {QString("-h"), QString("--help")})
  {
    Invocation run(merge, {"merge_da", flag, "a", "b", dir.filePath("out.bin")});
    CHECK(run.code == 0);
    CHECK(run.out.startsWith("USAGE: merge_da [OPTION]... SOURCE_DA BODY_DA OUTPUT_DA"));
    CHECK(run.out.contains("EXAMPLE:"));
    CHECK(run.out.contains("--header-length"));
  }

  StripHeaderCommand strip;
  for (QString const& flag : {QString("-h"), QString("--help")})
  {
    Invocation run(strip, {"strip_header", flag, "a", dir.filePath("body.bin")});
    CHECK(run.code == 0);
    CHECK(run.out.startsWith("USAGE: strip_header [OPTION]... SOURCE_DA OUTPUT_BODY"));
    CHECK(run.out.contains("EXAMPLE:"));
  }
  CHECK(ns_test::entry_count(dir) == 0);
}

TEST_CASE("help text reflects a custom header length")
{
  StripHeaderCommand strip;
  Invocation run(strip, {"strip_header", "--header-length", "0x100", "--help"});
  CHECK(run.code == 0);
  CHECK(run.out.contains("first 256 bytes"));
}

TEST_CASE("version flags print the version string")
{
  StripHeaderCommand strip;
  MergeDaCommand merge;

  Invocation short_flag(strip, {"/opt/tools/strip_header", "-v"});
  CHECK(short_flag.code == 0);
  CHECK(short_flag.out.trimmed() == "strip_header version 1.0.0");

  Invocation long_flag(merge, {"merge_da", "--version"});
  CHECK(long_flag.code == 0);
  CHECK(long_flag.out.trimmed() == "merge_da version 1.0.0");
}

TEST_CASE("wrong positional count exits 1 with a hint")
{
  StripHeaderCommand strip;
  Invocation too_few(strip, {"strip_header", "only_one.bin"});
  CHECK(too_few.code == 1);
  CHECK(too_few.err.contains("ERROR: Invalid number of arguments."));
  CHECK(too_few.err.contains("Try 'strip_header --help' for more information."));

  MergeDaCommand merge;
  Invocation too_many(merge, {"merge_da", "a", "b", "c", "d"});
  CHECK(too_many.code == 1);
  CHECK(too_many.err.contains("Invalid number of arguments."));
}

TEST_CASE("unknown options and bad header lengths exit 1")
{
  StripHeaderCommand strip;

  Invocation unknown(strip, {"strip_header", "--frobnicate", "a", "b"});
  CHECK(unknown.code == 1);
  CHECK(unknown.err.startsWith("ERROR: "));

  Invocation bad_length(strip, {"strip_header", "--header-length", "zero", "a", "b"});
  CHECK(bad_length.code == 1);
  CHECK(bad_length.err.contains("Invalid header length 'zero'."));

  Invocation zero_length(strip, {"strip_header", "--header-length", "0", "a", "b"});
  CHECK(zero_length.code == 1);
}

TEST_CASE("strip_header with a missing source exits 1 and writes nothing")
{
  QTemporaryDir dir;
  StripHeaderCommand strip;

  Invocation run(strip, {"strip_header", dir.filePath("missing.bin"), dir.filePath("body.bin")});
  CHECK(run.code == 1);
  CHECK(run.err.contains("ERROR: Source DA file"));
  CHECK(run.err.contains("does not exist."));
  CHECK_FALSE(ns_test::exists(dir.filePath("body.bin")));
}

TEST_CASE("merge_da with a missing body exits 1 and writes nothing")
{
  QTemporaryDir dir;
  REQUIRE(ns_test::write_file(dir.filePath("source.bin"), ns_test::make_image(14812, 10)));
  MergeDaCommand merge;

  Invocation run(merge, {"merge_da", dir.filePath("source.bin"), dir.filePath("missing.bin"),
                         dir.filePath("out.bin")});
  CHECK(run.code == 1);
  CHECK(run.err.contains("ERROR: Body DA file"));
  CHECK_FALSE(ns_test::exists(dir.filePath("out.bin")));
}

TEST_CASE("strip_header then merge_da reproduces the source image")
{
  QTemporaryDir dir;
  QString source = dir.filePath("source.bin");
  QByteArray image = ns_test::make_image(14812, 20000 - 14812);
  REQUIRE(ns_test::write_file(source, image));

  StripHeaderCommand strip;
  Invocation split(strip, {"strip_header", source, dir.filePath("body.bin")});
  CHECK(split.code == 0);
  CHECK(split.out.contains(QString("Header removed from '%1'.").arg(source)));
  CHECK(split.out.contains(QString("Body saved to '%1'.").arg(dir.filePath("body.bin"))));
  CHECK(ns_test::read_file(dir.filePath("body.bin")) == QByteArray(5188, char(0xAA)));

  MergeDaCommand merge;
  Invocation join(merge, {"merge_da", source, dir.filePath("body.bin"), dir.filePath("out.bin")});
  CHECK(join.code == 0);
  CHECK(join.out.contains("merged with body from"));
  CHECK(join.out.contains(QString("Output saved to '%1'.").arg(dir.filePath("out.bin"))));
  CHECK(ns_test::read_file(dir.filePath("out.bin")) == image);
}

TEST_CASE("quiet mode suppresses confirmation lines")
{
  QTemporaryDir dir;
  QString source = dir.filePath("source.bin");
  REQUIRE(ns_test::write_file(source, ns_test::make_image(14812, 8)));

  StripHeaderCommand strip;
  Invocation run(strip, {"strip_header", "-q", source, dir.filePath("body.bin")});
  CHECK(run.code == 0);
  CHECK(run.out.isEmpty());
  CHECK(ns_test::read_file(dir.filePath("body.bin")).size() == 8);
}

TEST_CASE("strict mode rejects a short source")
{
  QTemporaryDir dir;
  QString source = dir.filePath("short.bin");
  REQUIRE(ns_test::write_file(source, QByteArray(64, 's')));

  StripHeaderCommand strip;
  Invocation lenient(strip, {"strip_header", source, dir.filePath("lenient.bin")});
  CHECK(lenient.code == 0);
  CHECK(ns_test::exists(dir.filePath("lenient.bin")));

  Invocation strict(strip, {"strip_header", "--strict", source, dir.filePath("strict.bin")});
  CHECK(strict.code == 1);
  CHECK(strict.err.contains("shorter than the 14812-byte header"));
  CHECK_FALSE(ns_test::exists(dir.filePath("strict.bin")));
}

TEST_CASE("header length option applies to the split")
{
  QTemporaryDir dir;
  QString source = dir.filePath("source.bin");
  REQUIRE(ns_test::write_file(source, QByteArray("0123456789")));

  StripHeaderCommand strip;
  Invocation run(strip, {"strip_header", "--header-length=4", source, dir.filePath("body.bin")});
  CHECK(run.code == 0);
  CHECK(ns_test::read_file(dir.filePath("body.bin")) == QByteArray("456789"));
}

TEST_CASE("log directory receives a log file")
{
  QTemporaryDir dir;
  QTemporaryDir logs;
  QString source = dir.filePath("source.bin");
  REQUIRE(ns_test::write_file(source, ns_test::make_image(14812, 8)));

  StripHeaderCommand strip;
  Invocation run(strip, {"strip_header", "--verbose", "--log-dir", logs.path(), source,
                         dir.filePath("body.bin")});
  CHECK(run.code == 0);

  QString log_path = Logger::instance().logFilePath();
  CHECK(log_path.startsWith(logs.path()));
  Logger::instance().shutdown();
  CHECK(ns_test::read_file(log_path).contains("[DEBUG]"));
}
