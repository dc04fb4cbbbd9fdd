#pragma once
#include <string>
#include <vector>

namespace app
{
    struct State;
}

namespace app::ui
{
    // ---- High-level UI ----
    void title(const std::string &t);
    void main_menu(const app::State &s);
    void help();
    void about();

    void wait_for_enter(const std::string &prompt = "Press Enter to continue...");

    // Reads menu choice from stdin (-1 on anything that is not a number)
    int read_menu_choice();

    // ---- Input & validation ----
    std::string trim(std::string s);
    std::string read_line(const std::string &prompt);

    // Map "C:\..." -> "/host/c/..." when CFC_HOST_ROOT is set (Docker drive mount)
    std::string map_host_path_if_needed(const std::string &p);

    // Validate a user-supplied folder; on success stores the absolute path in `out`
    bool validate_folder(const std::string &pathStr, std::string &out);

    // "Training folder" / "Test folder" views
    void input_train(app::State &s);
    void input_test(app::State &s);

    // Classifier kind, debug, overlays, delay
    void settings(app::State &s);

    // .png/.jpg/.jpeg files of a folder, sorted by path
    std::vector<std::string> collect_images(const std::string &dir);
}
