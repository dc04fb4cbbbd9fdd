#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace cfc
{
    struct BlobParams
    {
        // inclusive GRAY8 range that counts as cookie (dark on a bright belt)
        int thresh_lo = 0;
        int thresh_hi = 110;

        // accepted component area [pixels], after hole filling
        int min_area = 15000;
        int max_area = 300000;
    };

    struct Blob
    {
        cv::Mat mask;        // CV_8U, image-sized, 255 inside the blob
        cv::Rect box;        // axis-aligned bounds
        cv::Point2d centroid;
        int area = 0;
    };

    // Fills interior holes of a 0/255 mask (background reached from the border stays 0).
    cv::Mat fill_holes(const cv::Mat &bin);

    // Threshold -> fill holes -> 8-connected components within the area range.
    // Blobs come back in labeling (raster) order. An empty result is not an error.
    std::vector<Blob> detect_cookies(const cv::Mat &image, const BlobParams &params = {});

    // GRAY8 view of a BGR/BGRA/GRAY input (shares data when already GRAY8).
    cv::Mat to_gray8(const cv::Mat &image);
}
