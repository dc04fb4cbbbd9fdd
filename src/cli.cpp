#include "cfc/cli.hpp"
#include "cfc/classifier.hpp"
#include "cfc/log.hpp"
#include "cfc/progress.hpp"
#include "cfc/training_set.hpp"
#include "cfc/ui.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace app::cli
{
    namespace
    {
        bool set_folder(const std::string &in, std::string &path, bool &has, const char *what)
        {
            if (has)
            {
                std::cerr << what << " folder given twice\n";
                return false;
            }
            if (!app::ui::validate_folder(in, path))
            {
                std::cerr << in << " is not a valid folder\n";
                return false;
            }
            has = true;
            return true;
        }
    } // namespace

    bool parse_args(int argc, const char *const *argv, Options &o)
    {
        o.state.debug = cfc::log::g_debug;
        std::vector<std::string> folders;

        for (int i = 1; i < argc; i++)
        {
            const std::string a = argv[i];
            auto value = [&](std::string &dst) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << a << " needs a value\n";
                    return false;
                }
                dst = argv[++i];
                return true;
            };

            std::string v;
            if (a == "--debug")
                o.state.debug = true;
            else if (a == "--save-debug")
                o.state.saveDebug = true;
            else if (a == "--classifier")
            {
                if (!value(v))
                    return false;
                auto kind = cfc::parse_classifier_kind(v);
                if (!kind)
                {
                    std::cerr << "Classifier type not specified correctly: " << v << "\n";
                    return false;
                }
                o.state.kind = *kind;
            }
            else if (a == "--delay-ms")
            {
                if (!value(v))
                    return false;
                try
                {
                    o.state.delayMs = std::max(0, std::stoi(v));
                }
                catch (const std::exception &)
                {
                    std::cerr << "invalid delay: " << v << "\n";
                    return false;
                }
            }
            else if (a == "--train")
            {
                if (!value(v) || !set_folder(v, o.state.trainPath, o.state.hasTrainPath, "training"))
                    return false;
            }
            else if (a == "--test")
            {
                if (!value(v) || !set_folder(v, o.state.testPath, o.state.hasTestPath, "test"))
                    return false;
            }
            else if (a == "--load-samples")
            {
                if (!value(o.loadSamples))
                    return false;
            }
            else if (a == "--save-samples")
            {
                if (!value(o.saveSamples))
                    return false;
            }
            else if (a == "--load-model")
            {
                if (!value(o.loadModel))
                    return false;
            }
            else if (a == "--save-model")
            {
                if (!value(o.saveModel))
                    return false;
            }
            else if (a.rfind("-", 0) == 0)
            {
                std::cerr << "unknown option: " << a << "\n";
                return false;
            }
            else
                folders.push_back(a);
        }

        // Positional folders: TRAIN_DIR TEST_DIR, or only TEST_DIR when training input came from a flag
        if (folders.size() > 2)
        {
            std::cerr << "too many folders\n";
            return false;
        }
        if (folders.size() == 2)
        {
            if (!set_folder(folders[0], o.state.trainPath, o.state.hasTrainPath, "training") ||
                !set_folder(folders[1], o.state.testPath, o.state.hasTestPath, "test"))
                return false;
        }
        else if (folders.size() == 1)
        {
            const bool asTest = !o.loadModel.empty() || !o.loadSamples.empty() || o.state.hasTrainPath;
            if (asTest ? !set_folder(folders[0], o.state.testPath, o.state.hasTestPath, "test")
                       : !set_folder(folders[0], o.state.trainPath, o.state.hasTrainPath, "training"))
                return false;
        }

        const bool haveTraining = o.state.hasTrainPath || !o.loadSamples.empty();
        if (!haveTraining && o.loadModel.empty())
        {
            std::cerr << "nothing to train from: give TRAIN_DIR, --load-samples or --load-model\n";
            return false;
        }
        if (!haveTraining && !o.saveSamples.empty())
        {
            std::cerr << "--save-samples needs TRAIN_DIR or --load-samples\n";
            return false;
        }
        return true;
    }

    int run(const Options &o)
    {
        cfc::log::set(o.state.debug);

        cfc::TrainingSet samples;
        cfc::Classifier classifier(o.state.kind);

        if (!o.loadModel.empty())
        {
            if (o.state.hasTrainPath || !o.loadSamples.empty())
                cfc::log::w("--load-model given, training input is ignored");
            if (!classifier.load(o.loadModel))
                return EXIT_USAGE;
            cfc::log::i(std::string("loaded ") + cfc::kind_name(o.state.kind) + " model from " + o.loadModel);
        }
        else
        {
            if (!o.loadSamples.empty() && !samples.load_csv(o.loadSamples))
                return EXIT_USAGE;

            std::vector<std::string> trainImages;
            if (o.state.hasTrainPath)
                trainImages = app::ui::collect_images(o.state.trainPath);

            if (!app::progress::train_and_report(trainImages, o.state, samples, classifier))
                return EXIT_TRAINING;

            if (!o.saveSamples.empty() && !samples.save_csv(o.saveSamples))
                return EXIT_USAGE;
        }

        if (!o.saveModel.empty())
        {
            if (!classifier.save(o.saveModel))
                return EXIT_USAGE;
            cfc::log::i("model saved to " + o.saveModel);
        }

        if (o.state.hasTestPath)
        {
            const auto sum = app::progress::classify_and_report(app::ui::collect_images(o.state.testPath),
                                                                o.state, classifier);
            if (sum.aborted)
                return EXIT_CLASSIFY;
        }

        std::cout << "App finished.\n";
        return EXIT_OK;
    }
}
