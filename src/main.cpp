// File: main.cpp

#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <string>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "common/utilities/visualizer.hpp"
#include "config/configuration.hpp"
#include "processing/image/aligner.hpp"

namespace {

    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitUsage = 2;

    void printUsage(const char *program) {
        fmt::print(stderr, "Usage: {} <image1> <image2> [configuration.yaml]\n", program);
    }

    cv::Mat readImage(const std::string &path) {
        cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            LOG_ERROR("Failed to read image: {}", path);
        } else {
            LOG_DEBUG("Read {}x{} image with {} channels from {}", image.cols, image.rows, image.channels(), path);
        }
        return image;
    }

} // namespace

int main(const int argc, char *argv[]) {
    if (argc < 3 || argc > 4) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    // Without an explicit file the default configuration.yaml is picked up lazily, if present.
    if (argc == 4) {
        try {
            config::initialize(argv[3]);
        } catch (const std::runtime_error &e) {
            fmt::print(stderr, "{}\n", e.what());
            return kExitUsage;
        }
    }

    common::logging::Logger::configure(config::get("logging.level", "info"), config::get("logging.file", ""));
    if (const auto pattern = config::get<std::string>("logging.pattern")) {
        common::logging::Logger::setPattern(*pattern);
    }
    config::show();

    const cv::Mat image1 = readImage(argv[1]);
    const cv::Mat image2 = readImage(argv[2]);
    if (image1.empty() || image2.empty()) {
        return kExitFailure;
    }

    try {
        common::Timer timer("panorama alignment");

        const auto aligner = processing::image::ImageAligner::fromConfiguration();
        const auto result = aligner.align(image1, image2);

        using common::utilities::Visualizer;

        const auto corners_path = config::get("output.corners", "");
        if (!corners_path.empty()) {
            Visualizer::save(Visualizer::concatenate(Visualizer::markPoints(image1, result.corners1),
                                                     Visualizer::markPoints(image2, result.corners2)),
                             corners_path);
        }

        const auto overlay_path = config::get("output.overlay", "");
        if (!overlay_path.empty()) {
            const auto inliers = result.inlierCorrespondences();
            const auto &pairs = result.success() ? inliers : result.matches;
            Visualizer::save(Visualizer::drawPairs(image1, image2, pairs.points1, pairs.points2), overlay_path);
        }

        if (!result.success()) {
            LOG_ERROR("Could not register the images: not enough consistent correspondences");
            return kExitFailure;
        }

        const auto panorama_path = config::get("output.panorama", "");
        if (!panorama_path.empty()) {
            const auto panorama = Visualizer::blend(image1, image2, *result.estimate.homography);
            if (!Visualizer::save(panorama, panorama_path)) {
                return kExitFailure;
            }
        }

        LOG_INFO("Homography (image 1 -> image 2): {}", *result.estimate.homography);
    } catch (const common::UnsupportedFormatError &e) {
        LOG_ERROR("Unsupported image: {}", e.what());
        return kExitFailure;
    } catch (const common::ArgumentMismatchError &e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return kExitUsage;
    } catch (const common::NumericSingularityError &e) {
        LOG_ERROR("Numerical failure: {}", e.what());
        return kExitFailure;
    }

    return kExitSuccess;
}
