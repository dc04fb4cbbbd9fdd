#include "cfc/pipeline.hpp"
#include "cfc/log.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace cfc
{
    namespace
    {
        const cv::Scalar kPassColor(0, 255, 0);  // BGR green
        const cv::Scalar kFailColor(0, 0, 255);  // BGR red
        const cv::Scalar kTextColor(255, 0, 0);  // BGR blue
        constexpr int kLineWidth = 10;
        constexpr double kFillAlpha = 40.0 / 255.0;

        std::string lower(std::string s)
        {
            for (auto &c : s)
                c = (char)std::tolower((unsigned char)c);
            return s;
        }
    } // namespace

    std::size_t add_training_samples(const cv::Mat &image,
                                     int label,
                                     TrainingSet &set,
                                     const PipelineParams &params)
    {
        const std::vector<Blob> cookies = detect_cookies(image, params.blob);
        if (cookies.empty())
        {
            log::w("no cookies in training image");
            return 0;
        }
        const cv::Mat features = compute_cookie_features(image, cookies, params.feature);
        return set.append(features, label);
    }

    cv::RotatedRect oriented_box(const Blob &blob)
    {
        std::vector<std::vector<cv::Point>> cnts;
        cv::findContours(blob.mask.clone(), cnts, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
        if (cnts.empty())
            return cv::RotatedRect(cv::Point2f((float)blob.centroid.x, (float)blob.centroid.y),
                                   cv::Size2f((float)blob.box.width, (float)blob.box.height), 0.f);

        // hole-filled blobs have a single outer contour; keep the largest to be safe
        auto it = std::max_element(cnts.begin(), cnts.end(),
                                   [](const std::vector<cv::Point> &a, const std::vector<cv::Point> &b)
                                   { return cv::contourArea(a) < cv::contourArea(b); });
        return cv::minAreaRect(*it);
    }

    ClassifyResult classify_image(const cv::Mat &image,
                                  const Classifier &classifier,
                                  const PipelineParams &params)
    {
        using clock = std::chrono::steady_clock;
        ClassifyResult res;
        const auto t0 = clock::now();

        const std::vector<Blob> cookies = detect_cookies(image, params.blob);
        if (cookies.empty())
        {
            log::w("No cookies in image");
            res.status = ClassifyStatus::NO_COOKIES;
            return res;
        }
        if (!classifier.is_trained())
        {
            log::e("Classifier was not trained");
            res.status = ClassifyStatus::NOT_TRAINED;
            return res;
        }

        const cv::Mat features = compute_cookie_features(image, cookies, params.feature);
        const std::vector<int> labels = classifier.predict(features);
        if (labels.size() != cookies.size())
        {
            log::e("prediction returned " + std::to_string(labels.size()) + " label(s) for " +
                   std::to_string(cookies.size()) + " cookie(s)");
            res.status = ClassifyStatus::PREDICT_FAILED;
            return res;
        }

        const auto t1 = clock::now();
        res.elapsed_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

        res.cookies.reserve(cookies.size());
        for (std::size_t c = 0; c < cookies.size(); ++c)
        {
            CookieResult cr;
            cr.box = oriented_box(cookies[c]);
            cr.centroid = cookies[c].centroid;
            cr.area = cookies[c].area;
            cr.label = labels[c];
            const float *row = features.ptr<float>((int)c);
            std::copy(row, row + FEAT_COUNT, cr.features);
            if (cr.flipped())
                ++res.flipped_count;
            res.cookies.push_back(cr);
        }
        res.status = ClassifyStatus::OK;
        return res;
    }

    cv::Mat draw_results(const cv::Mat &image, const ClassifyResult &result, const std::string &caption)
    {
        cv::Mat vis;
        if (image.channels() == 1)
            cv::cvtColor(image, vis, cv::COLOR_GRAY2BGR);
        else if (image.channels() == 4)
            cv::cvtColor(image, vis, cv::COLOR_BGRA2BGR);
        else
            vis = image.clone();

        // translucent fills first, outlines on top
        cv::Mat fill = vis.clone();
        for (const auto &c : result.cookies)
        {
            cv::Point2f pts[4];
            c.box.points(pts);
            std::vector<cv::Point> poly;
            for (const auto &p : pts)
                poly.emplace_back((int)std::lround(p.x), (int)std::lround(p.y));
            cv::fillConvexPoly(fill, poly, c.flipped() ? kFailColor : kPassColor);
        }
        cv::addWeighted(fill, kFillAlpha, vis, 1.0 - kFillAlpha, 0.0, vis);

        for (const auto &c : result.cookies)
        {
            cv::Point2f pts[4];
            c.box.points(pts);
            const cv::Scalar color = c.flipped() ? kFailColor : kPassColor;
            for (int i = 0; i < 4; ++i)
                cv::line(vis, pts[i], pts[(i + 1) % 4], color, kLineWidth, cv::LINE_AA);
        }

        if (!caption.empty())
        {
            const double scale = std::max(1.0, vis.rows / 400.0);
            cv::putText(vis, caption, {20, 100}, cv::FONT_HERSHEY_SIMPLEX, scale, kTextColor,
                        std::max(2, (int)std::lround(2 * scale)), cv::LINE_AA);
        }
        return vis;
    }

    int label_from_filename(const std::string &path)
    {
        const std::string stem = lower(std::filesystem::path(path).stem().string());
        if (stem.rfind("negatives", 0) == 0)
            return LABEL_NOT_FLIPPED;
        if (stem.rfind("positives", 0) == 0)
            return LABEL_FLIPPED;
        return 0;
    }
}
