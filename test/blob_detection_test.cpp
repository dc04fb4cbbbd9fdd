#include "cfc/blob_detector.hpp"
#include "test_support.hpp"

#include <opencv2/imgproc.hpp>
#include <cmath>

using namespace cfc::test;

int main()
{
    std::cout << "=== BLOB DETECTION TEST ===\n";

    // Three cookies in a row, found in left-to-right order
    {
        const bool textured[3] = {false, true, false};
        cv::Mat img = row_of_cookies(textured, 1);
        auto blobs = cfc::detect_cookies(img);
        check(blobs.size() == 3, "three cookies detected");
        if (blobs.size() == 3)
        {
            bool ordered = true;
            for (int i = 0; i < 3; ++i)
            {
                const cv::Point c = slot(i);
                if (std::abs(blobs[i].centroid.x - c.x) > 2.0 || std::abs(blobs[i].centroid.y - c.y) > 2.0)
                    ordered = false;
            }
            check(ordered, "blobs follow raster order, centroids on the cookie centres");
            check(blobs[0].mask.size() == img.size() && blobs[0].mask.type() == CV_8U,
                  "blob mask is image-sized GRAY8");
            check(cv::countNonZero(blobs[0].mask) == blobs[0].area, "mask pixel count equals area");
        }
    }

    // BGR input takes the same path
    {
        const bool textured[3] = {true, true, true};
        cv::Mat gray = row_of_cookies(textured, 2);
        cv::Mat bgr;
        cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
        check(cfc::detect_cookies(bgr).size() == 3, "BGR input detects the same cookies");
    }

    // Empty belt: zero blobs is a valid outcome
    {
        check(cfc::detect_cookies(belt(640, 480)).empty(), "empty belt gives no blobs");
        check(cfc::detect_cookies(cv::Mat()).empty(), "empty image gives no blobs");
    }

    // Crumbs below the minimum area are rejected
    {
        cv::RNG rng(3);
        cv::Mat img = belt(900, 300);
        draw_smooth_cookie(img, slot(0), rng);
        draw_smooth_cookie(img, slot(1), rng, 20); // ~1.2k px
        check(cfc::detect_cookies(img).size() == 1, "small crumb rejected by area filter");

        cfc::BlobParams p;
        p.min_area = 500;
        check(cfc::detect_cookies(img, p).size() == 2, "crumb accepted with lower min_area");
    }

    // Interior holes are filled before measuring area
    {
        cv::RNG rng(4);
        cv::Mat img = belt(400, 400);
        draw_smooth_cookie(img, {200, 200}, rng);
        cv::circle(img, {200, 200}, 25, cv::Scalar(kBelt), cv::FILLED);
        auto blobs = cfc::detect_cookies(img);
        const double disc = CV_PI * kRadius * kRadius;
        check(blobs.size() == 1 && blobs[0].area > 0.97 * disc,
              "hole inside a cookie is filled");
    }

    // Threshold upper bound is inclusive
    {
        cv::Mat img = belt(400, 400);
        cv::circle(img, {200, 200}, kRadius, cv::Scalar(110), cv::FILLED);
        check(cfc::detect_cookies(img).size() == 1, "intensity 110 counts as cookie");
        cv::circle(img, {200, 200}, kRadius, cv::Scalar(111), cv::FILLED);
        check(cfc::detect_cookies(img).empty(), "intensity 111 is belt");
    }

    // fill_holes on its own
    {
        cv::Mat ring = cv::Mat::zeros(50, 50, CV_8U);
        cv::rectangle(ring, {10, 10}, {39, 39}, cv::Scalar(255), 3);
        cv::Mat filled = cfc::fill_holes(ring);
        check(filled.at<uchar>(25, 25) == 255, "fill_holes fills the enclosed area");
        check(filled.at<uchar>(2, 2) == 0, "fill_holes leaves the outside alone");
    }

    return finish("blob_detection_test");
}
