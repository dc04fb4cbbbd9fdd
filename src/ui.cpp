#include "cfc/ui.hpp"
#include "cfc/app.hpp"
#include "cfc/ansi.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <limits>
#include <cctype>
#include <cstdlib> // std::getenv
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace app::ui
{

    static const char *kMenu = R"MENU(
Choose an option:

  1) Training folder (negatives_*.png / positives_*.png)
  2) Test folder
  3) Settings: classifier / debug / overlays / delay
  4) Help: How to use
  5) About
  6) Train classifier
  7) Classify test images
  0) Exit
)MENU";

    std::string trim(std::string s)
    {
        const auto sp = [](unsigned char c)
        { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        std::size_t a = 0;
        while (a < s.size() && sp((unsigned char)s[a]))
            ++a;
        std::size_t b = s.size();
        while (b > a && sp((unsigned char)s[b - 1]))
            --b;
        return s.substr(a, b - a);
    }

    std::string read_line(const std::string &prompt)
    {
        std::cout << cfc::ansi::info << prompt << cfc::ansi::reset;
        std::string s;
        std::getline(std::cin, s);
        return s;
    }

    std::string map_host_path_if_needed(const std::string &in)
    {
        const char *root = std::getenv("CFC_HOST_ROOT"); // e.g. "/host"
        if (!root || !*root)
            return in;

        static const std::regex winDrive(R"(^([A-Za-z]):[\\/](.*))");
        std::smatch m;
        if (std::regex_match(in, m, winDrive) && m.size() == 3)
        {
            std::string rest = m[2].str();
            std::replace(rest.begin(), rest.end(), '\\', '/');
            const char drive = (char)std::tolower((unsigned char)m[1].str()[0]);
            return std::string(root) + "/" + drive + "/" + rest;
        }
        return in;
    }

    void title(const std::string &t)
    {
        cfc::ansi::clear_screen();
        std::cout << cfc::ansi::title << cfc::ansi::bold << t << cfc::ansi::reset << "\n";
        std::cout << cfc::ansi::muted << std::string(t.size(), '=') << cfc::ansi::reset << "\n\n";
    }

    void main_menu(const app::State &s)
    {
        title("Cookie Flip Classifier");
        std::cout << kMenu << "\n";
        std::cout << cfc::ansi::muted
                  << "Training folder: " << (s.hasTrainPath ? s.trainPath : std::string("(none)")) << "\n"
                  << "Test folder    : " << (s.hasTestPath ? s.testPath : std::string("(none)")) << "\n"
                  << "Classifier: " << cfc::kind_name(s.kind)
                  << ", Debug: " << (s.debug ? "ON" : "OFF")
                  << ", Overlays: " << (s.saveDebug ? "ON" : "OFF")
                  << ", Delay: " << s.delayMs << " ms"
                  << cfc::ansi::reset << "\n\n";
    }

    void help()
    {
        title("Help");
        std::cout
            << "- Training folder (option 1): images named negatives_*.png (label 1, not flipped)\n"
            << "  and positives_*.png (label 2, flipped).\n"
            << "- Test folder (option 2): any PNG/JPEG images of cookies.\n"
            << "- Pick SVM, kNN or Bayes in Settings, then Train (6) and Classify (7).\n"
            << "- Results go to ./cfc_output (or $CFC_OUTPUT_ROOT).\n\n";
        wait_for_enter();
    }

    void about()
    {
        title("About");
        std::cout
            << "Binary classification of correctly oriented vs. flipped cookies.\n"
            << "Dark blobs are segmented, gradient-magnitude statistics of their\n"
            << "centre are used as features, and an OpenCV ML model decides.\n\n";
        wait_for_enter();
    }

    void wait_for_enter(const std::string &prompt)
    {
        std::cout << cfc::ansi::muted << prompt << cfc::ansi::reset;
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }

    int read_menu_choice()
    {
        std::cout << "Select (0-7): ";
        std::string line;
        std::getline(std::cin, line);
        line = trim(line);
        if (line.empty())
            return -1;
        for (char ch : line)
            if (!std::isdigit((unsigned char)ch))
                return -1;
        try
        {
            return std::stoi(line);
        }
        catch (const std::out_of_range &)
        {
            return -1;
        }
    }

    bool validate_folder(const std::string &pathStr, std::string &out)
    {
        const fs::path p = map_host_path_if_needed(trim(pathStr));
        std::error_code ec;
        if (p.empty() || !fs::is_directory(p, ec))
            return false;
        out = fs::absolute(p, ec).string();
        return !ec;
    }

    static void input_folder(const std::string &name, std::string &path, bool &valid)
    {
        title(name);
        std::cout << "Provide a path to a folder with images.\n\n";
        std::cout << cfc::ansi::muted
                  << "Examples:\n"
                     "  resources/Train\n"
                     "  /home/you/cookies/Test\n"
                     "  /host/c/Users/You/Cookies   (when running in Docker Compose)\n"
                  << cfc::ansi::reset << "\n";

        const std::string in = read_line("Folder> ");
        if (!std::cin.good())
            return;

        std::string abs;
        if (validate_folder(in, abs))
        {
            path = abs;
            valid = true;
            const auto n = collect_images(path).size();
            std::cout << cfc::ansi::ok << "[OK] " << path << cfc::ansi::reset
                      << " (" << n << " image(s))\n";
        }
        else
        {
            std::cout << cfc::ansi::err << "[X] Not a folder. Please try again." << cfc::ansi::reset << "\n";
        }
        std::cout << "\n";
        wait_for_enter();
    }

    void input_train(app::State &s) { input_folder("Training folder", s.trainPath, s.hasTrainPath); }

    void input_test(app::State &s) { input_folder("Test folder", s.testPath, s.hasTestPath); }

    void settings(app::State &s)
    {
        title("Settings");
        std::cout
            << "Select option (type number):\n"
            << "  1) Classifier: " << cfc::kind_name(s.kind) << " (SVM -> kNN -> Bayes)\n"
            << "  2) Debug logs: " << (s.debug ? "ON" : "OFF") << "\n"
            << "  3) Save overlays: " << (s.saveDebug ? "ON" : "OFF") << "\n"
            << "  4) Delay between images: " << s.delayMs << " ms\n"
            << "  0) Back\n\n";
        std::cout << "Select: ";
        std::string line;
        std::getline(std::cin, line);
        line = trim(line);
        if (line == "1")
        {
            switch (s.kind)
            {
            case cfc::ClassifierKind::SVM:
                s.kind = cfc::ClassifierKind::KNN;
                break;
            case cfc::ClassifierKind::KNN:
                s.kind = cfc::ClassifierKind::BAYES;
                break;
            case cfc::ClassifierKind::BAYES:
                s.kind = cfc::ClassifierKind::SVM;
                break;
            }
        }
        else if (line == "2")
            s.debug = !s.debug;
        else if (line == "3")
            s.saveDebug = !s.saveDebug;
        else if (line == "4")
        {
            const std::string ms = trim(read_line("Delay [ms]> "));
            try
            {
                s.delayMs = std::max(0, std::stoi(ms));
            }
            catch (const std::exception &)
            {
                std::cout << cfc::ansi::warn << "Invalid number." << cfc::ansi::reset << "\n";
                wait_for_enter();
            }
        }
    }

    std::vector<std::string> collect_images(const std::string &dir)
    {
        std::vector<std::string> out;
        std::error_code ec;
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
        {
            if (!it->is_regular_file())
                continue;
            auto ext = it->path().extension().string();
            for (auto &c : ext)
                c = (char)std::tolower((unsigned char)c);
            if (ext == ".png" || ext == ".jpg" || ext == ".jpeg")
                out.push_back(it->path().string());
        }
        std::sort(out.begin(), out.end());
        return out;
    }

} // namespace app::ui
