#pragma once
#include <string>

#include "cfc/app.hpp"

namespace app::cli
{
    enum ExitCode
    {
        EXIT_OK = 0,
        EXIT_USAGE = 1,    // bad arguments, unreadable model/sample files
        EXIT_TRAINING = 2, // training failed
        EXIT_CLASSIFY = 3  // classification run aborted
    };

    inline constexpr const char *kUsage =
        "Usage: cookie_flip_cli [--classifier svm|knn|bayes] [--delay-ms N] [--debug] [--save-debug]\n"
        "                       [--load-samples CSV] [--save-samples CSV]\n"
        "                       [--load-model FILE] [--save-model FILE]\n"
        "                       [TRAIN_DIR] [TEST_DIR]\n"
        "  --train DIR / --test DIR may be used instead of the positional folders.\n"
        "  With --load-model, --load-samples or --train a single folder is the TEST_DIR.\n";

    struct Options
    {
        app::State state;
        std::string loadSamples, saveSamples;
        std::string loadModel, saveModel;
    };

    // Fills `o` from argv; prints the reason and returns false on a usage error.
    bool parse_args(int argc, const char *const *argv, Options &o);

    // Train (or load) then classify. Returns an ExitCode.
    int run(const Options &o);
}
