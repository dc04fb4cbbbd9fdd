#include <iostream> // for std::cout
#include "cfc/app.hpp"
#include "cfc/ui.hpp"
#include "cfc/ansi.hpp"
#include "cfc/log.hpp"
#include "cfc/progress.hpp"

namespace app
{

    int Application::run()
    {
        state_.debug = cfc::log::g_debug; // CFC_DEBUG
        return main_loop();
    }

    void Application::train()
    {
        if (!state_.hasTrainPath)
        {
            std::cout << cfc::ansi::warn << "Set a training folder first (option 1)." << cfc::ansi::reset << "\n";
            ui::wait_for_enter();
            return;
        }
        ui::title("Train");
        // every training run starts from an empty sample set
        samples_ = cfc::TrainingSet{};
        progress::train_and_report(ui::collect_images(state_.trainPath), state_, samples_, classifier_);
        ui::wait_for_enter();
    }

    void Application::classify()
    {
        if (!state_.hasTestPath)
        {
            std::cout << cfc::ansi::warn << "Set a test folder first (option 2)." << cfc::ansi::reset << "\n";
            ui::wait_for_enter();
            return;
        }
        ui::title("Classify");
        progress::classify_and_report(ui::collect_images(state_.testPath), state_, classifier_);
        ui::wait_for_enter();
    }

    int Application::main_loop()
    {
        for (;;)
        {
            ui::main_menu(state_);
            if (classifier_.is_trained())
                std::cout << cfc::ansi::ok << "Model: " << cfc::kind_name(classifier_.kind())
                          << " trained on " << samples_.size() << " sample(s)" << cfc::ansi::reset << "\n\n";
            const int choice = ui::read_menu_choice();
            if (!std::cin.good())
                return 0;

            switch (choice)
            {
            case 1:
                ui::input_train(state_);
                break;
            case 2:
                ui::input_test(state_);
                break;
            case 3:
                ui::settings(state_);
                break;
            case 4:
                ui::help();
                break;
            case 5:
                ui::about();
                break;
            case 6:
                train();
                break;
            case 7:
                classify();
                break;
            case 0:
                cfc::ansi::clear_screen();
                std::cout << cfc::ansi::muted << "App finished." << cfc::ansi::reset << "\n";
                return 0;

            default:
                std::cout << cfc::ansi::warn << "Invalid choice." << cfc::ansi::reset << "\n";
            }
        }
    }

} // namespace app
