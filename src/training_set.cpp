#include "cfc/training_set.hpp"
#include "cfc/features.hpp"
#include "cfc/log.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cfc
{
    std::size_t TrainingSet::append(const cv::Mat &features, int label)
    {
        if (features.empty())
            return 0;
        if (features.cols != FEAT_COUNT || features.channels() != 1)
        {
            log::e("TrainingSet::append: expected " + std::to_string(FEAT_COUNT) +
                   " feature columns, got " + std::to_string(features.cols));
            return 0;
        }
        if (!is_valid_label(label))
        {
            log::e("TrainingSet::append: invalid label " + std::to_string(label));
            return 0;
        }

        cv::Mat rows;
        features.convertTo(rows, CV_32F);
        samples_.push_back(rows);
        responses_.push_back(cv::Mat(rows.rows, 1, CV_32S, cv::Scalar(label)));

        log::d("training set: +" + std::to_string(rows.rows) + " x '" + label_name(label) +
               "', total " + std::to_string(size()));
        return (std::size_t)rows.rows;
    }

    std::size_t TrainingSet::count(int label) const
    {
        if (empty())
            return 0;
        return (std::size_t)cv::countNonZero(responses_ == label);
    }

    bool TrainingSet::save_csv(const std::string &path) const
    {
        std::ofstream out(path);
        if (!out)
        {
            log::e("cannot write training samples to " + path);
            return false;
        }
        out << "label,min,max,mean,std\n";
        out << std::setprecision(9);
        for (int r = 0; r < samples_.rows; ++r)
        {
            const float *f = samples_.ptr<float>(r);
            out << responses_.at<int>(r, 0);
            for (int c = 0; c < FEAT_COUNT; ++c)
                out << "," << f[c];
            out << "\n";
        }
        return (bool)out;
    }

    bool TrainingSet::load_csv(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
        {
            log::e("cannot open training samples " + path);
            return false;
        }

        std::vector<int> labels;
        std::vector<float> values;
        std::string line;
        int lineNo = 0;
        while (std::getline(in, line))
        {
            ++lineNo;
            if (line.empty() || (lineNo == 1 && line.rfind("label", 0) == 0))
                continue;

            std::istringstream ss(line);
            std::string field;
            std::vector<std::string> fields;
            while (std::getline(ss, field, ','))
                fields.push_back(field);

            if ((int)fields.size() != FEAT_COUNT + 1)
            {
                log::e(path + ":" + std::to_string(lineNo) + ": expected " +
                       std::to_string(FEAT_COUNT + 1) + " fields");
                return false;
            }
            try
            {
                const int label = std::stoi(fields[0]);
                if (!is_valid_label(label))
                {
                    log::e(path + ":" + std::to_string(lineNo) + ": invalid label " + fields[0]);
                    return false;
                }
                labels.push_back(label);
                for (int c = 0; c < FEAT_COUNT; ++c)
                    values.push_back(std::stof(fields[c + 1]));
            }
            catch (const std::exception &ex)
            {
                log::e(path + ":" + std::to_string(lineNo) + ": " + ex.what());
                return false;
            }
        }

        const int n = (int)labels.size();
        if (n == 0)
        {
            log::w("no samples in " + path);
            return true;
        }
        cv::Mat rows(n, FEAT_COUNT, CV_32F, values.data());
        samples_.push_back(rows.clone());
        responses_.push_back(cv::Mat(n, 1, CV_32S, labels.data()).clone());
        log::i("loaded " + std::to_string(n) + " sample(s) from " + path);
        return true;
    }
}
