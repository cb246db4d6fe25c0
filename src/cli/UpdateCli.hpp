#pragma once

#include <QStringList>

namespace updwatch {

class UpdateCli
{
public:
    // Runs one detection from command-line arguments (args[0] is the program name).
    // Returns the process exit code.
    int run(const QStringList &args);
};

} // namespace updwatch
