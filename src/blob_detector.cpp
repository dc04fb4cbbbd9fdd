#include "cfc/blob_detector.hpp"
#include "cfc/log.hpp"

#include <opencv2/imgproc.hpp>
#include <string>
#include <utility>

namespace cfc
{
    cv::Mat to_gray8(const cv::Mat &image)
    {
        CV_Assert(!image.empty());
        cv::Mat gray;
        switch (image.channels())
        {
        case 1:
            gray = image;
            break;
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            CV_Error(cv::Error::StsBadArg, "unsupported channel count");
        }
        if (gray.depth() != CV_8U)
        {
            cv::Mat g8;
            gray.convertTo(g8, CV_8U);
            gray = g8;
        }
        return gray;
    }

    cv::Mat fill_holes(const cv::Mat &bin)
    {
        CV_Assert(bin.type() == CV_8U);

        // Pad by one pixel so the flood fill reaches every border-touching background pixel
        cv::Mat pad(bin.rows + 2, bin.cols + 2, CV_8U, cv::Scalar(0));
        bin.copyTo(pad(cv::Rect(1, 1, bin.cols, bin.rows)));
        cv::floodFill(pad, cv::Point(0, 0), cv::Scalar(255));

        cv::Mat holes;
        cv::bitwise_not(pad(cv::Rect(1, 1, bin.cols, bin.rows)), holes);
        cv::Mat filled;
        cv::bitwise_or(bin, holes, filled);
        return filled;
    }

    std::vector<Blob> detect_cookies(const cv::Mat &image, const BlobParams &params)
    {
        std::vector<Blob> blobs;
        if (image.empty())
        {
            log::w("detect_cookies: empty image");
            return blobs;
        }

        const cv::Mat gray = to_gray8(image);

        cv::Mat bin;
        cv::inRange(gray, cv::Scalar(params.thresh_lo), cv::Scalar(params.thresh_hi), bin);
        bin = fill_holes(bin);

        cv::Mat labels, stats, centroids;
        const int num = cv::connectedComponentsWithStats(bin, labels, stats, centroids, 8, CV_32S);

        for (int i = 1; i < num; ++i)
        {
            const int area = stats.at<int>(i, cv::CC_STAT_AREA);
            if (area < params.min_area || area > params.max_area)
            {
                log::d("component " + std::to_string(i) + " rejected, area=" + std::to_string(area));
                continue;
            }

            Blob b;
            b.area = area;
            b.box = cv::Rect(stats.at<int>(i, cv::CC_STAT_LEFT),
                             stats.at<int>(i, cv::CC_STAT_TOP),
                             stats.at<int>(i, cv::CC_STAT_WIDTH),
                             stats.at<int>(i, cv::CC_STAT_HEIGHT));
            b.centroid = cv::Point2d(centroids.at<double>(i, 0), centroids.at<double>(i, 1));
            b.mask = (labels == i);
            blobs.push_back(std::move(b));
        }

        log::d("detect_cookies: " + std::to_string(blobs.size()) + " cookie(s) out of " +
               std::to_string(num - 1) + " component(s)");
        return blobs;
    }
}
