#pragma once
#include "cfc/blob_detector.hpp"
#include "cfc/classifier.hpp"
#include "cfc/features.hpp"
#include "cfc/training_set.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace cfc
{
    struct PipelineParams
    {
        BlobParams blob;
        FeatureParams feature;
    };

    enum class ClassifyStatus
    {
        OK = 0,
        NO_COOKIES = 1,
        NOT_TRAINED = 2,
        PREDICT_FAILED = 3
    };

    inline const char *status_to_cstr(ClassifyStatus s)
    {
        switch (s)
        {
        case ClassifyStatus::OK:             return "OK";
        case ClassifyStatus::NO_COOKIES:     return "NO_COOKIES";
        case ClassifyStatus::NOT_TRAINED:    return "NOT_TRAINED";
        case ClassifyStatus::PREDICT_FAILED: return "PREDICT_FAILED";
        default:                             return "UNKNOWN";
        }
    }

    struct CookieResult
    {
        cv::RotatedRect box; // oriented bounding box of the blob
        cv::Point2d centroid;
        int area = 0;
        int label = 0;
        float features[FEAT_COUNT] = {0, 0, 0, 0};

        bool flipped() const { return label == LABEL_FLIPPED; }
    };

    struct ClassifyResult
    {
        ClassifyStatus status = ClassifyStatus::NO_COOKIES;
        std::vector<CookieResult> cookies;
        int flipped_count = 0;
        double elapsed_ms = 0.0; // detection + features + prediction
    };

    // Detect cookies and append their features with `label`.
    // Returns the number of samples added; 0 when no cookie was found.
    std::size_t add_training_samples(const cv::Mat &image,
                                     int label,
                                     TrainingSet &set,
                                     const PipelineParams &params = {});

    // Detect -> features -> predict for one image. No cookies short-circuits before
    // features and prediction are computed.
    ClassifyResult classify_image(const cv::Mat &image,
                                  const Classifier &classifier,
                                  const PipelineParams &params = {});

    // Minimum-area rectangle around a blob mask.
    cv::RotatedRect oriented_box(const Blob &blob);

    // BGR overlay: green = not flipped, red = flipped, plus a blue caption.
    cv::Mat draw_results(const cv::Mat &image, const ClassifyResult &result, const std::string &caption);

    // Training label from a file stem: "negatives*" -> 1, "positives*" -> 2, else 0.
    int label_from_filename(const std::string &path);
}
