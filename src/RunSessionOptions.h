#pragma once

#include <string>
#include <vector>

struct RunSessionOptions {
    std::string sessionName;
    // A single WAV take or a folder of takes.
    std::string sessionPath;
    // Extra takes given on the command line, played after sessionPath.
    std::vector<std::string> sessionSampleFiles;

    std::string configPath;
    std::string saveConfigPath;
    std::string logFilePath;

    int tickMs {100};
    int frameSize {4096};
    bool realtime {false};
    bool everyTick {false};

    [[nodiscard]] bool hasConfig() const noexcept { return !configPath.empty(); }
};
