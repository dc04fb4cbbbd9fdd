#include "cfc/pipeline.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cmath>

using namespace cfc::test;

int main()
{
    std::cout << "=== PIPELINE TEST ===\n";

    // ---- No cookies: short-circuit ----
    {
        cfc::TrainingSet set;
        check(cfc::add_training_samples(belt(640, 480), cfc::LABEL_FLIPPED, set) == 0,
              "empty belt adds no samples");
        check(set.empty(), "training set untouched");

        cfc::Classifier untrained;
        const auto res = cfc::classify_image(belt(640, 480), untrained);
        check(res.status == cfc::ClassifyStatus::NO_COOKIES && res.cookies.empty(),
              "no cookies is reported before the trained check");
    }

    // ---- Cookies but no model ----
    const bool mixed[3] = {false, true, false};
    {
        cfc::Classifier untrained;
        const auto res = cfc::classify_image(row_of_cookies(mixed, 21), untrained);
        check(res.status == cfc::ClassifyStatus::NOT_TRAINED, "untrained classifier stops classification");
    }

    // ---- Train on smooth (not flipped) and textured (flipped) scenes ----
    const bool allSmooth[3] = {false, false, false};
    const bool allTextured[3] = {true, true, true};
    cfc::TrainingSet set;
    std::size_t added = 0;
    for (std::uint64_t seed = 1; seed <= 2; ++seed)
    {
        added += cfc::add_training_samples(row_of_cookies(allSmooth, seed), cfc::LABEL_NOT_FLIPPED, set);
        added += cfc::add_training_samples(row_of_cookies(allTextured, 100 + seed), cfc::LABEL_FLIPPED, set);
    }
    check(added == 12 && set.size() == 12, "12 samples from four training images");
    check(set.count(cfc::LABEL_NOT_FLIPPED) == 6 && set.count(cfc::LABEL_FLIPPED) == 6, "balanced labels");

    cfc::Classifier clf(cfc::ClassifierKind::SVM);
    check(clf.train(set), "classifier trains on pipeline samples");

    // ---- Classify a mixed scene ----
    const cv::Mat test = row_of_cookies(mixed, 77);
    const auto res = cfc::classify_image(test, clf);
    check(res.status == cfc::ClassifyStatus::OK, "classification succeeds");
    check(res.cookies.size() == 3, "three cookies classified");
    if (res.cookies.size() == 3)
    {
        check(res.cookies[0].label == cfc::LABEL_NOT_FLIPPED &&
                  res.cookies[1].label == cfc::LABEL_FLIPPED &&
                  res.cookies[2].label == cfc::LABEL_NOT_FLIPPED,
              "labels match the cookie surfaces");
        check(res.flipped_count == 1, "one cookie counted as flipped");

        bool boxes = true;
        for (int i = 0; i < 3; ++i)
        {
            const cv::RotatedRect &b = res.cookies[i].box;
            const cv::Point c = slot(i);
            if (std::abs(b.center.x - c.x) > 2.0f || std::abs(b.center.y - c.y) > 2.0f ||
                std::abs(std::max(b.size.width, b.size.height) - 2.0f * kRadius) > 6.0f)
                boxes = false;
        }
        check(boxes, "oriented boxes enclose each cookie");
        check(res.elapsed_ms >= 0.0, "processing time measured");
    }

    // ---- Overlay ----
    {
        const cv::Mat vis = cfc::draw_results(test, res, "Classify");
        check(vis.type() == CV_8UC3 && vis.size() == test.size(), "overlay is BGR at input size");

        // Box outline colours: red for the flipped cookie, green for the others
        if (res.cookies.size() == 3)
        {
            cv::Point2f pts[4];
            res.cookies[1].box.points(pts);
            const cv::Point mid((int)std::lround((pts[0].x + pts[1].x) / 2), (int)std::lround((pts[0].y + pts[1].y) / 2));
            const cv::Vec3b px = vis.at<cv::Vec3b>(mid);
            check(px[2] > 200 && px[1] < 60, "flipped cookie outlined in red");

            res.cookies[0].box.points(pts);
            const cv::Point mid0((int)std::lround((pts[0].x + pts[1].x) / 2), (int)std::lround((pts[0].y + pts[1].y) / 2));
            const cv::Vec3b px0 = vis.at<cv::Vec3b>(mid0);
            check(px0[1] > 200 && px0[2] < 60, "not flipped cookie outlined in green");
        }
    }

    // ---- File name labels ----
    check(cfc::label_from_filename("resources/Train/negatives_1.png") == cfc::LABEL_NOT_FLIPPED, "negatives -> 1");
    check(cfc::label_from_filename("/x/Positives_2.PNG") == cfc::LABEL_FLIPPED, "positives -> 2");
    check(cfc::label_from_filename("resources/Test/mix_1.png") == 0, "other names unlabeled");

    return finish("pipeline_test");
}
