#pragma once

#include "da_command.h"

namespace datool {

class StripHeaderCommand : public DaCommand {
public:
    QString name() const override { return "strip_header"; }
    QString synopsis() const override { return "SOURCE_DA OUTPUT_BODY"; }
    QString summary() const override;
    QString example() const override { return "source_da.bin output_body.bin"; }
    QString description(qint64 headerLength) const override;
    int positionalCount() const override { return 2; }

    DaError execute(const QStringList& positional, const ToolConfig& config,
                    QTextStream& out) override;
};

} // namespace datool
