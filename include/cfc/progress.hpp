#pragma once
#include <string>
#include <vector>

#include "cfc/app.hpp"

namespace app::progress
{
    struct ClassifySummary
    {
        int images = 0;
        int imagesWithCookies = 0;
        int cookies = 0;
        int flipped = 0;
        bool aborted = false; // classifier not trained
    };

    // Load training images (label from file name), append samples, train and print
    // accuracy + confusion matrix. Returns false when training failed.
    bool train_and_report(const std::vector<std::string> &images,
                          const app::State &state,
                          cfc::TrainingSet &samples,
                          cfc::Classifier &classifier);

    // Classify test images, print per-image verdicts and save outputs.
    // Default root is ./cfc_output, override with env CFC_OUTPUT_ROOT.
    // - CSV:      <root>/results/<YYYYMMDD-HHMMSS>.csv (one row per cookie)
    // - Overlays: <root>/debug/<YYYYMMDD-HHMMSS>/<index>_<name>_overlay.png
    ClassifySummary classify_and_report(const std::vector<std::string> &images,
                                        const app::State &state,
                                        const cfc::Classifier &classifier);
}
