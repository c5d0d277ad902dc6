#pragma once

#include "da_command.h"

namespace datool {

class MergeDaCommand : public DaCommand {
public:
    QString name() const override { return "merge_da"; }
    QString synopsis() const override { return "SOURCE_DA BODY_DA OUTPUT_DA"; }
    QString summary() const override;
    QString example() const override { return "source_da.bin body_da.bin output_da.bin"; }
    QString description(qint64 headerLength) const override;
    int positionalCount() const override { return 3; }

    DaError execute(const QStringList& positional, const ToolConfig& config,
                    QTextStream& out) override;
};

} // namespace datool
