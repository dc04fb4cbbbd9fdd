#include "cfc/features.hpp"
#include "cfc/log.hpp"

#include <opencv2/imgproc.hpp>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cfc
{
    namespace
    {
        struct MaskStats
        {
            double min = 0, max = 0, mean = 0, std = 0;
        };

        MaskStats masked_stats(const cv::Mat &mag, const cv::Mat &mask)
        {
            MaskStats s;
            cv::minMaxLoc(mag, &s.min, &s.max, nullptr, nullptr, mask);
            cv::Scalar m, sd;
            cv::meanStdDev(mag, m, sd, mask);
            s.mean = m[0];
            s.std = sd[0];
            return s;
        }
    } // namespace

    cv::Mat gradient_magnitude(const cv::Mat &image, int ksize)
    {
        const cv::Mat gray = to_gray8(image);
        cv::Mat gx, gy, mag;
        cv::Sobel(gray, gx, CV_32F, 1, 0, ksize);
        cv::Sobel(gray, gy, CV_32F, 0, 1, ksize);
        cv::magnitude(gx, gy, mag);
        return mag;
    }

    cv::Mat blob_core(const cv::Mat &mask, const FeatureParams &params)
    {
        if (params.erode_px <= 1)
            return mask.clone();
        const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, {params.erode_px, params.erode_px});
        cv::Mat core;
        cv::erode(mask, core, kernel, cv::Point(-1, -1), 1, cv::BORDER_CONSTANT, cv::Scalar(0));
        return core;
    }

    cv::Mat compute_cookie_features(const cv::Mat &image,
                                    const std::vector<Blob> &blobs,
                                    const FeatureParams &params)
    {
        cv::Mat features((int)blobs.size(), FEAT_COUNT, CV_32F, cv::Scalar(0));
        if (blobs.empty())
            return features;

        // magnitude image once for all blobs
        const cv::Mat mag = gradient_magnitude(image, params.sobel_ksize);
        const int n = (int)blobs.size();
        for (const Blob &blob : blobs)
            CV_Assert(blob.mask.size() == mag.size() && blob.mask.type() == CV_8U);

        // set inside the loop, logged after it
        std::vector<unsigned char> fullMask(n, 0);

#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
        for (int c = 0; c < n; ++c)
        {
            const Blob &blob = blobs[c];

            // central part of the cookie only
            cv::Mat core = blob_core(blob.mask, params);
            if (cv::countNonZero(core) == 0)
            {
                fullMask[c] = 1;
                core = blob.mask;
            }

            const MaskStats s = masked_stats(mag, core);
            float *row = features.ptr<float>(c);
            row[FEAT_MIN] = (float)s.min;
            row[FEAT_MAX] = (float)s.max;
            row[FEAT_MEAN] = (float)s.mean;
            row[FEAT_STD] = (float)s.std;
        }

        for (int c = 0; c < n; ++c)
            if (fullMask[c])
                log::w("cookie " + std::to_string(c) + " vanished after erosion, using full mask");

        return features;
    }
}
