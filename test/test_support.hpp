#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

// Synthetic cookie scenes: dark discs on a bright belt.
// "Smooth" cookies have a flat surface, "textured" ones a rough one.
namespace cfc::test
{
    constexpr int kBelt = 200;
    constexpr int kCookie = 60;
    constexpr int kRadius = 90; // area ~25.4k px, inside the default 15k..300k range

    inline int g_failures = 0;

    inline void check(bool cond, const std::string &what)
    {
        if (cond)
        {
            std::cout << "[PASS] " << what << "\n";
        }
        else
        {
            std::cout << "[FAIL] " << what << "\n";
            ++g_failures;
        }
    }

    inline int finish(const char *name)
    {
        std::cout << name << ": " << (g_failures == 0 ? "OK" : "FAILED")
                  << " (" << g_failures << " failure(s))\n";
        return g_failures == 0 ? 0 : 1;
    }

    inline cv::Mat belt(int w, int h)
    {
        return cv::Mat(h, w, CV_8U, cv::Scalar(kBelt));
    }

    inline void draw_cookie(cv::Mat &img, cv::Point c, int r, int amplitude, cv::RNG &rng)
    {
        cv::Mat mask = cv::Mat::zeros(img.size(), CV_8U);
        cv::circle(mask, c, r, cv::Scalar(255), cv::FILLED);
        cv::Mat surface(img.size(), CV_8U);
        rng.fill(surface, cv::RNG::UNIFORM, cv::Scalar(kCookie - amplitude), cv::Scalar(kCookie + amplitude + 1));
        surface.copyTo(img, mask);
    }

    inline void draw_smooth_cookie(cv::Mat &img, cv::Point c, cv::RNG &rng, int r = kRadius)
    {
        draw_cookie(img, c, r, 2, rng);
    }

    inline void draw_textured_cookie(cv::Mat &img, cv::Point c, cv::RNG &rng, int r = kRadius)
    {
        draw_cookie(img, c, r, 35, rng);
    }

    // Three cookies in a row at x = 150, 450, 750
    inline cv::Point slot(int i) { return {150 + 300 * i, 150}; }

    inline cv::Mat row_of_cookies(const bool textured[3], std::uint64_t seed)
    {
        cv::RNG rng(seed);
        cv::Mat img = belt(900, 300);
        for (int i = 0; i < 3; ++i)
        {
            if (textured[i])
                draw_textured_cookie(img, slot(i), rng);
            else
                draw_smooth_cookie(img, slot(i), rng);
        }
        return img;
    }

    // Fresh empty directory under the system temp dir
    inline std::filesystem::path scratch_dir(const std::string &name)
    {
        namespace fs = std::filesystem;
        const fs::path p = fs::temp_directory_path() / name;
        std::error_code ec;
        fs::remove_all(p, ec);
        fs::create_directories(p);
        return p;
    }

    inline void set_output_root(const std::filesystem::path &p)
    {
#if defined(_WIN32)
        _putenv_s("CFC_OUTPUT_ROOT", p.string().c_str());
#else
        setenv("CFC_OUTPUT_ROOT", p.string().c_str(), 1);
#endif
    }
}
