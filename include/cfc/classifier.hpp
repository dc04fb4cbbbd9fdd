#pragma once
#include "cfc/training_set.hpp"

#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cfc
{
    enum class ClassifierKind
    {
        SVM,
        KNN,
        BAYES
    };

    const char *kind_name(ClassifierKind k);
    // Case-insensitive "svm" / "knn" / "bayes"
    std::optional<ClassifierKind> parse_classifier_kind(const std::string &s);

    struct ClassifierParams
    {
        double svm_c = 1.0; // C-SVC, linear kernel
        int knn_k = 4;
    };

    struct Evaluation
    {
        double accuracy = 0.0; // 0..1
        // rows = actual (not flipped, flipped), cols = predicted (not flipped, flipped)
        cv::Mat confusion;     // 2x2 CV_32S

        std::string confusion_to_string() const;
    };

    // Binary cookie classifier over the OpenCV ML models.
    // Untrained until a train() or load() succeeds.
    class Classifier
    {
    public:
        explicit Classifier(ClassifierKind kind = ClassifierKind::SVM, const ClassifierParams &params = {});

        ClassifierKind kind() const { return kind_; }
        bool is_trained() const;

        // One attempt over the whole set; logs and returns false on failure.
        bool train(const TrainingSet &set);

        // One label per row of `features` (N x 4). Empty when untrained or on error.
        std::vector<int> predict(const cv::Mat &features) const;

        // Accuracy and confusion matrix of the model on a labeled set.
        bool evaluate(const TrainingSet &set, Evaluation &out) const;

        bool save(const std::string &path) const;
        bool load(const std::string &path);

    private:
        ClassifierKind kind_;
        ClassifierParams params_;
        cv::Ptr<cv::ml::StatModel> model_;

        cv::Ptr<cv::ml::StatModel> create_model() const;
    };
}
