#include "cfc/classifier.hpp"
#include "cfc/features.hpp"
#include "cfc/log.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace cfc
{
    const char *kind_name(ClassifierKind k)
    {
        switch (k)
        {
        case ClassifierKind::SVM:
            return "SVM";
        case ClassifierKind::KNN:
            return "kNN";
        case ClassifierKind::BAYES:
            return "Bayes";
        }
        return "?";
    }

    std::optional<ClassifierKind> parse_classifier_kind(const std::string &s)
    {
        std::string k;
        for (char ch : s)
            k.push_back((char)std::tolower((unsigned char)ch));
        if (k == "svm")
            return ClassifierKind::SVM;
        if (k == "knn")
            return ClassifierKind::KNN;
        if (k == "bayes")
            return ClassifierKind::BAYES;
        return std::nullopt;
    }

    std::string Evaluation::confusion_to_string() const
    {
        std::ostringstream oss;
        if (confusion.empty())
            return "(none)";
        oss << "            pred=1  pred=2\n";
        for (int r = 0; r < confusion.rows; ++r)
        {
            oss << "  actual=" << (r + 1);
            for (int c = 0; c < confusion.cols; ++c)
                oss << std::setw(8) << confusion.at<int>(r, c);
            oss << "\n";
        }
        return oss.str();
    }

    Classifier::Classifier(ClassifierKind kind, const ClassifierParams &params)
        : kind_(kind), params_(params)
    {
        if (params_.knn_k < 1)
            params_.knn_k = 1;
        if (params_.svm_c <= 0.0)
            params_.svm_c = 1.0;
    }

    bool Classifier::is_trained() const
    {
        return model_ && model_->isTrained();
    }

    cv::Ptr<cv::ml::StatModel> Classifier::create_model() const
    {
        switch (kind_)
        {
        case ClassifierKind::SVM:
        {
            auto svm = cv::ml::SVM::create();
            svm->setType(cv::ml::SVM::C_SVC);
            svm->setKernel(cv::ml::SVM::LINEAR);
            svm->setC(params_.svm_c);
            svm->setTermCriteria(cv::TermCriteria(cv::TermCriteria::MAX_ITER + cv::TermCriteria::EPS, 10000, 1e-6));
            return svm;
        }
        case ClassifierKind::KNN:
        {
            auto knn = cv::ml::KNearest::create();
            knn->setIsClassifier(true);
            knn->setDefaultK(params_.knn_k);
            knn->setAlgorithmType(cv::ml::KNearest::BRUTE_FORCE);
            return knn;
        }
        case ClassifierKind::BAYES:
            return cv::ml::NormalBayesClassifier::create();
        }
        return {};
    }

    bool Classifier::train(const TrainingSet &set)
    {
        if (set.empty())
        {
            log::e("training failed: training set is empty");
            return false;
        }
        if (set.count(LABEL_NOT_FLIPPED) == 0 || set.count(LABEL_FLIPPED) == 0)
        {
            log::e("training failed: both classes need at least one sample");
            return false;
        }

        cv::Ptr<cv::ml::StatModel> model = create_model();
        bool ok = false;
        try
        {
            auto data = cv::ml::TrainData::create(set.samples(), cv::ml::ROW_SAMPLE, set.responses());
            ok = model->train(data);
        }
        catch (const cv::Exception &ex)
        {
            log::e(std::string("training failed: ") + ex.what());
            return false;
        }
        if (!ok || !model->isTrained())
        {
            log::e(std::string("training failed: ") + kind_name(kind_) + " did not converge");
            return false;
        }

        model_ = model;
        log::d(std::string(kind_name(kind_)) + " trained on " + std::to_string(set.size()) + " sample(s)");
        return true;
    }

    std::vector<int> Classifier::predict(const cv::Mat &features) const
    {
        std::vector<int> labels;
        if (!is_trained())
        {
            log::e("classifier was not trained");
            return labels;
        }
        if (features.empty())
            return labels;
        if (features.cols != FEAT_COUNT)
        {
            log::e("predict: expected " + std::to_string(FEAT_COUNT) + " feature columns");
            return labels;
        }

        cv::Mat samples;
        features.convertTo(samples, CV_32F);
        cv::Mat results;
        try
        {
            if (kind_ == ClassifierKind::KNN)
            {
                auto knn = model_.staticCast<cv::ml::KNearest>();
                knn->findNearest(samples, params_.knn_k, results);
            }
            else
            {
                model_->predict(samples, results);
            }
        }
        catch (const cv::Exception &ex)
        {
            log::e(std::string("predict failed: ") + ex.what());
            return labels;
        }

        // One row per sample, whatever the model's output type
        cv::Mat col;
        results.reshape(1, (int)results.total()).convertTo(col, CV_32F);
        labels.reserve(col.rows);
        for (int r = 0; r < col.rows; ++r)
            labels.push_back((int)std::lround(col.at<float>(r, 0)));
        return labels;
    }

    bool Classifier::evaluate(const TrainingSet &set, Evaluation &out) const
    {
        out = Evaluation{};
        if (!is_trained() || set.empty())
            return false;

        const std::vector<int> pred = predict(set.samples());
        if (pred.size() != set.size())
            return false;

        out.confusion = cv::Mat::zeros(2, 2, CV_32S);
        int correct = 0;
        for (std::size_t r = 0; r < pred.size(); ++r)
        {
            const int actual = set.responses().at<int>((int)r, 0);
            const int p = pred[r];
            if (p == actual)
                ++correct;
            if (is_valid_label(actual) && is_valid_label(p))
                out.confusion.at<int>(actual - 1, p - 1)++;
        }
        out.accuracy = (double)correct / (double)pred.size();
        return true;
    }

    bool Classifier::save(const std::string &path) const
    {
        if (!is_trained())
        {
            log::e("cannot save an untrained classifier");
            return false;
        }
        try
        {
            model_->save(path);
        }
        catch (const cv::Exception &ex)
        {
            log::e("saving model to " + path + " failed: " + ex.what());
            return false;
        }
        return true;
    }

    bool Classifier::load(const std::string &path)
    {
        cv::Ptr<cv::ml::StatModel> model;
        try
        {
            cv::FileStorage fs(path, cv::FileStorage::READ);
            if (!fs.isOpened())
            {
                log::e("cannot open model file " + path);
                return false;
            }
            fs.release();

            switch (kind_)
            {
            case ClassifierKind::SVM:
                model = cv::ml::SVM::load(path);
                break;
            case ClassifierKind::KNN:
                model = cv::Algorithm::load<cv::ml::KNearest>(path);
                break;
            case ClassifierKind::BAYES:
                model = cv::Algorithm::load<cv::ml::NormalBayesClassifier>(path);
                break;
            }
        }
        catch (const cv::Exception &ex)
        {
            log::e("loading model from " + path + " failed: " + ex.what());
            return false;
        }
        if (!model || !model->isTrained())
        {
            log::e("no trained " + std::string(kind_name(kind_)) + " model in " + path);
            return false;
        }
        model_ = model;
        return true;
    }
}
