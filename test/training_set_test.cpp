#include "cfc/features.hpp"
#include "cfc/training_set.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <fstream>

using namespace cfc::test;

namespace
{
    cv::Mat batch(int rows, float base)
    {
        cv::Mat m(rows, cfc::FEAT_COUNT, CV_32F);
        for (int r = 0; r < rows; ++r)
            for (int c = 0; c < cfc::FEAT_COUNT; ++c)
                m.at<float>(r, c) = base + r * 10.0f + c;
        return m;
    }
}

int main()
{
    std::cout << "=== TRAINING SET TEST ===\n";

    cfc::TrainingSet set;
    check(set.empty() && set.size() == 0, "new set is empty");

    check(set.append(batch(2, 1.0f), cfc::LABEL_NOT_FLIPPED) == 2, "append returns rows added");
    check(set.append(cv::Mat(0, cfc::FEAT_COUNT, CV_32F), cfc::LABEL_FLIPPED) == 0, "empty batch adds nothing");
    check(set.append(batch(5, 100.0f), cfc::LABEL_FLIPPED) == 5, "second batch");
    check(set.append(batch(1, 7.0f), cfc::LABEL_NOT_FLIPPED) == 1, "third batch");
    check(set.size() == 8, "size is the sum of batch sizes");
    check(set.count(cfc::LABEL_NOT_FLIPPED) == 3 && set.count(cfc::LABEL_FLIPPED) == 5, "per-label counts");

    check(set.samples().type() == CV_32F && set.samples().cols == cfc::FEAT_COUNT, "samples are N x 4 CV_32F");
    check(set.responses().type() == CV_32S && set.responses().rows == 8, "responses are N x 1 CV_32S");
    check(set.samples().at<float>(2, 0) == 100.0f && set.responses().at<int>(2, 0) == cfc::LABEL_FLIPPED,
          "append order is preserved");

    // CV_64F input is converted
    check(set.append(cv::Mat(1, cfc::FEAT_COUNT, CV_64F, cv::Scalar(3.5)), cfc::LABEL_FLIPPED) == 1,
          "double features are accepted");
    check(set.samples().at<float>(8, 3) == 3.5f, "converted values kept");

    // Rejected shapes and labels leave the set untouched
    check(set.append(cv::Mat(2, 3, CV_32F, cv::Scalar(0)), cfc::LABEL_FLIPPED) == 0, "wrong column count rejected");
    check(set.append(batch(1, 0.0f), 3) == 0, "unknown label rejected");
    check(set.size() == 9, "rejections do not change size");

    // CSV persistence
    const std::string csv = "training_set_test.csv";
    check(set.save_csv(csv), "save_csv");
    cfc::TrainingSet loaded;
    check(loaded.load_csv(csv), "load_csv");
    check(loaded.size() == set.size() &&
              cv::norm(loaded.samples(), set.samples(), cv::NORM_INF) == 0.0 &&
              cv::countNonZero(loaded.responses() != set.responses()) == 0,
          "CSV keeps samples and labels");

    {
        std::ofstream bad("training_set_bad.csv");
        bad << "label,min,max,mean,std\n1,1,2,3,4\n2,1,2\n";
    }
    cfc::TrainingSet partial;
    check(!partial.load_csv("training_set_bad.csv") && partial.empty(), "malformed CSV is rejected whole");
    check(!partial.load_csv("does_not_exist.csv"), "missing CSV reported");

    std::remove(csv.c_str());
    std::remove("training_set_bad.csv");

    return finish("training_set_test");
}
