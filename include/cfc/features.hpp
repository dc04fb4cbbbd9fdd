#pragma once
#include "cfc/blob_detector.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace cfc
{
    // Column layout of a feature row
    enum FeatureColumn
    {
        FEAT_MIN = 0,
        FEAT_MAX = 1,
        FEAT_MEAN = 2,
        FEAT_STD = 3,
        FEAT_COUNT = 4
    };

    struct FeatureParams
    {
        // elliptic erosion diameter applied to each blob mask [pixels]
        int erode_px = 21;
        // Sobel aperture used for the gradient magnitude
        int sobel_ksize = 3;
    };

    // Gradient magnitude sqrt(gx^2 + gy^2) of the GRAY8 view, CV_32F.
    cv::Mat gradient_magnitude(const cv::Mat &image, int ksize = 3);

    // Blob mask eroded with an elliptic kernel of `erode_px`. Pixels outside the
    // image count as background. May be empty (all zero) for thin blobs.
    cv::Mat blob_core(const cv::Mat &mask, const FeatureParams &params = {});

    // One CV_32F row {min, max, mean, std} of gradient magnitude per blob, in blob order.
    // Statistics are taken over the eroded blob mask. An empty blob list gives a 0x4 matrix.
    cv::Mat compute_cookie_features(const cv::Mat &image,
                                    const std::vector<Blob> &blobs,
                                    const FeatureParams &params = {});
}
