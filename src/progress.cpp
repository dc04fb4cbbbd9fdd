#include "cfc/progress.hpp"
#include "cfc/ansi.hpp"
#include "cfc/log.hpp"
#include "cfc/pipeline.hpp"

#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace
{
    fs::path resolve_output_root()
    {
        const char *env = std::getenv("CFC_OUTPUT_ROOT");
        if (env && *env)
            return fs::path(env);
        return fs::current_path() / "cfc_output";
    }

    std::string now_stamp()
    {
        using clock = std::chrono::system_clock;
        auto t = clock::to_time_t(clock::now());
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
        return oss.str();
    }

    bool ensure_dir(const fs::path &p)
    {
        std::error_code ec;
        fs::create_directories(p, ec);
        if (ec)
        {
            cfc::log::e("cannot create " + p.string() + ": " + ec.message());
            return false;
        }
        return true;
    }

    void pace(int delayMs)
    {
        if (delayMs > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }

} // namespace

namespace app::progress
{

    bool train_and_report(const std::vector<std::string> &images,
                          const app::State &state,
                          cfc::TrainingSet &samples,
                          cfc::Classifier &classifier)
    {
        cfc::log::set(state.debug);

        const int N = static_cast<int>(images.size());
        std::cout << cfc::ansi::title << "Creating training data from " << N
                  << " image(s)" << cfc::ansi::reset << "\n\n";

        int i = 0;
        for (const auto &path : images)
        {
            ++i;
            std::cout << cfc::ansi::muted << "(" << i << "/" << N << ")"
                      << cfc::ansi::reset << " " << path << "  ";

            const int label = cfc::label_from_filename(path);
            if (label == 0)
            {
                std::cout << cfc::ansi::warn << "skipped (name must start with negatives/positives)"
                          << cfc::ansi::reset << "\n";
                continue;
            }

            cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
            if (img.empty())
            {
                std::cout << cfc::ansi::err << "Failed to read image" << cfc::ansi::reset << "\n";
                continue;
            }

            const std::size_t added = cfc::add_training_samples(img, label, samples);
            std::cout << (label == cfc::LABEL_FLIPPED ? "Train positives" : "Train negatives")
                      << cfc::ansi::muted << " (+" << added << " sample(s))"
                      << cfc::ansi::reset << "\n";
            pace(state.delayMs);
        }

        std::cout << "\n"
                  << cfc::ansi::muted << "Samples: " << samples.size()
                  << " (not flipped " << samples.count(cfc::LABEL_NOT_FLIPPED)
                  << ", flipped " << samples.count(cfc::LABEL_FLIPPED) << ")"
                  << cfc::ansi::reset << "\n";
        std::cout << "Classifier type: " << cfc::kind_name(state.kind) << "\n";

        classifier = cfc::Classifier(state.kind);
        if (!classifier.train(samples))
        {
            std::cout << cfc::ansi::err << "Training failed" << cfc::ansi::reset << "\n\n";
            return false;
        }

        cfc::Evaluation ev;
        if (classifier.evaluate(samples, ev))
        {
            std::cout << cfc::ansi::ok << "Trained classifier with accuracy: "
                      << std::fixed << std::setprecision(1) << ev.accuracy * 100.0 << " %"
                      << cfc::ansi::reset << "\n";
            std::cout << "Confusion matrix = \n"
                      << ev.confusion_to_string() << "\n";
        }
        else
        {
            cfc::log::w("could not evaluate the trained classifier");
        }
        return true;
    }

    ClassifySummary classify_and_report(const std::vector<std::string> &images,
                                        const app::State &state,
                                        const cfc::Classifier &classifier)
    {
        cfc::log::set(state.debug);
        ClassifySummary sum;

        const fs::path root = resolve_output_root();
        const std::string ts = now_stamp();
        const fs::path resultsDir = root / "results";
        const fs::path debugDir = root / "debug" / ts;

        const bool haveResults = ensure_dir(resultsDir);
        const bool saveOverlays = state.saveDebug && ensure_dir(debugDir);

        const fs::path csvPath = resultsDir / (ts + ".csv");
        std::ofstream csv;
        if (haveResults)
        {
            csv.open(csvPath);
            if (!csv)
                cfc::log::e("cannot write " + csvPath.string());
        }

        csv << "index,input_path,status,cookie,label,flipped,cx,cy,area,angle_deg,"
               "grad_min,grad_max,grad_mean,grad_std,elapsed_ms,overlay\n";

        const int N = static_cast<int>(images.size());
        std::cout << cfc::ansi::title << "Classifying " << N
                  << " image(s)" << cfc::ansi::reset << "\n\n";
        if (csv)
            std::cout << cfc::ansi::muted << "Results CSV: " << csvPath.string()
                      << cfc::ansi::reset << "\n";
        if (saveOverlays)
            std::cout << cfc::ansi::muted << "Overlay dir: " << debugDir.string()
                      << cfc::ansi::reset << "\n";
        std::cout << "\n";

        int i = 0;
        for (const auto &path : images)
        {
            ++i;
            ++sum.images;
            std::cout << cfc::ansi::muted << "(" << i << "/" << N << ")"
                      << cfc::ansi::reset << " Processing: " << path << "\n";

            cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
            if (img.empty())
            {
                std::cout << cfc::ansi::err << "Failed to read image" << cfc::ansi::reset << "\n";
                csv << i << "," << '"' << path << '"' << ",READ_ERROR,,,,,,,,,,,,,\n";
                continue;
            }

            const cfc::ClassifyResult res = cfc::classify_image(img, classifier);
            if (res.status != cfc::ClassifyStatus::OK)
            {
                csv << i << "," << '"' << path << '"' << "," << cfc::status_to_cstr(res.status)
                    << ",,,,,,,,,,,,,\n";
                if (res.status == cfc::ClassifyStatus::NO_COOKIES)
                {
                    std::cout << cfc::ansi::warn << "No cookies in image" << cfc::ansi::reset << "\n";
                    continue;
                }
                std::cout << cfc::ansi::err
                          << (res.status == cfc::ClassifyStatus::NOT_TRAINED ? "Classifier was not trained"
                                                                             : "Prediction failed")
                          << cfc::ansi::reset << "\n";
                sum.aborted = true;
                break;
            }

            ++sum.imagesWithCookies;
            sum.cookies += static_cast<int>(res.cookies.size());
            sum.flipped += res.flipped_count;

            std::string overlayPath;
            if (saveOverlays)
            {
                const std::string prefix = std::to_string(i) + "_" + fs::path(path).stem().string();
                overlayPath = (debugDir / (prefix + "_overlay.png")).string();
                if (!cv::imwrite(overlayPath, cfc::draw_results(img, res, "Classify")))
                {
                    cfc::log::w("could not write " + overlayPath);
                    overlayPath.clear();
                }
            }

            std::cout << cfc::ansi::muted << "        Processing time = "
                      << std::fixed << std::setprecision(1) << res.elapsed_ms << " ms"
                      << cfc::ansi::reset << "\n";
            std::cout << "        " << cfc::ansi::verdict_color(res.flipped_count > 0)
                      << res.flipped_count << " out of " << res.cookies.size()
                      << " cookies are flipped" << cfc::ansi::reset << "\n";

            for (std::size_t c = 0; c < res.cookies.size(); ++c)
            {
                const cfc::CookieResult &cr = res.cookies[c];
                cfc::log::d("cookie " + std::to_string(c) + ": " + cfc::label_name(cr.label));

                csv << i << "," << '"' << path << '"' << ",OK,"
                    << c << "," << cr.label << "," << (cr.flipped() ? 1 : 0) << ","
                    << std::fixed << std::setprecision(1)
                    << cr.centroid.x << "," << cr.centroid.y << ","
                    << cr.area << "," << cr.box.angle << ","
                    << std::setprecision(3)
                    << cr.features[cfc::FEAT_MIN] << "," << cr.features[cfc::FEAT_MAX] << ","
                    << cr.features[cfc::FEAT_MEAN] << "," << cr.features[cfc::FEAT_STD] << ","
                    << std::setprecision(2) << res.elapsed_ms << ",";
                if (!overlayPath.empty())
                    csv << '"' << overlayPath << '"';
                csv << "\n";
            }

            pace(state.delayMs);
        }

        std::cout << "\n"
                  << cfc::ansi::bold << sum.flipped << "/" << sum.cookies
                  << cfc::ansi::reset << " cookies flipped across "
                  << sum.imagesWithCookies << "/" << sum.images << " image(s) with cookies.\n\n";
        return sum;
    }

} // namespace app::progress
