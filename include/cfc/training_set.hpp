#pragma once
#include <opencv2/core.hpp>
#include <cstddef>
#include <string>

namespace cfc
{
    enum CookieLabel
    {
        LABEL_NOT_FLIPPED = 1,
        LABEL_FLIPPED = 2
    };

    inline bool is_valid_label(int label)
    {
        return label == LABEL_NOT_FLIPPED || label == LABEL_FLIPPED;
    }

    inline const char *label_name(int label)
    {
        switch (label)
        {
        case LABEL_NOT_FLIPPED:
            return "not flipped";
        case LABEL_FLIPPED:
            return "flipped";
        default:
            return "unknown";
        }
    }

    // Append-only labeled sample store: samples (N x 4, CV_32F) + responses (N x 1, CV_32S).
    class TrainingSet
    {
    public:
        // Appends every row of `features` with `label`. Returns the number of rows added
        // (0 on empty input or rejected shape/label).
        std::size_t append(const cv::Mat &features, int label);

        std::size_t size() const { return (std::size_t)samples_.rows; }
        bool empty() const { return samples_.rows == 0; }
        std::size_t count(int label) const;

        const cv::Mat &samples() const { return samples_; }
        const cv::Mat &responses() const { return responses_; }

        // CSV rows: label,min,max,mean,std (with header line)
        bool save_csv(const std::string &path) const;
        // Appends the rows of a CSV written by save_csv. Returns false on I/O or parse error,
        // in which case nothing is appended.
        bool load_csv(const std::string &path);

    private:
        cv::Mat samples_;
        cv::Mat responses_;
    };
}
