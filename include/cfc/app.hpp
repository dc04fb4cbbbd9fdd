#pragma once
#include "cfc/classifier.hpp"
#include "cfc/training_set.hpp"

#include <string>

namespace app
{
    struct State
    {
        std::string trainPath;
        bool hasTrainPath{false};
        std::string testPath;
        bool hasTestPath{false};

        cfc::ClassifierKind kind{cfc::ClassifierKind::SVM};
        bool debug{false};
        bool saveDebug{false}; // write overlay PNGs
        int delayMs{0};        // pause between images (demonstration pacing)
    };

    class Application
    {
    public:
        int run();

    private:
        State state_{};
        cfc::TrainingSet samples_{};
        cfc::Classifier classifier_{};
        int main_loop();
        void train();
        void classify();
    };
}
