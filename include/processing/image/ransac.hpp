// File: processing/image/ransac.hpp

#ifndef PROCESSING_IMAGE_RANSAC_HPP
#define PROCESSING_IMAGE_RANSAC_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include "common/logging/logger.hpp"

namespace processing::image {

    /**
     * @brief RANSAC (Random Sample Consensus) class template for robust model fitting.
     *
     * The data itself is never seen by this class: callers describe it through three callables
     * that work on sample indices. A trial draws a minimal sample, rejects it if it is degenerate
     * (or if the fit fails), fits a model and counts its inliers. The number of trials adapts to the
     * best inlier ratio seen so far and is capped by Options::max_evaluations.
     *
     * @tparam ModelType Type of the model to be fitted (e.g. types::ProjectiveTransform).
     */
    template<typename ModelType>
    class RANSAC {
    public:
        using Sample = std::vector<int>;
        using Fitter = std::function<std::optional<ModelType>(const Sample &)>;
        using DegeneracyCheck = std::function<bool(const Sample &)>;
        using InlierFinder = std::function<std::vector<int>(const ModelType &, double)>;

        struct Options {
            int sample_size;
            double distance_threshold;
            double probability; // Confidence level for early termination
            int max_evaluations;
            int max_samplings; // Redraws allowed for one trial
            std::optional<std::uint32_t> seed; // Nondeterministic when empty

            Options() :
                sample_size(4), distance_threshold(0.001), probability(0.99), max_evaluations(1000),
                max_samplings(100), seed(std::nullopt) {}
        };

        struct Result {
            ModelType model{};
            Sample sample{};
            std::vector<int> inliers{};
            int trials{0};
            double inlier_ratio{0.0};
        };

        /**
         * @brief Constructs a RANSAC object from the model callables.
         *
         * @param fitter Fits a model to the points at the given indices; empty when no model exists.
         * @param degenerate Tells whether a sample cannot produce a meaningful model.
         * @param inlier_finder Returns the indices of all points within the threshold of a model.
         * @param options Configuration options for the RANSAC algorithm.
         */
        RANSAC(Fitter fitter, DegeneracyCheck degenerate, InlierFinder inlier_finder,
               const Options &options = Options()) noexcept;

        /**
         * @brief Runs the search over a data set of the given size.
         *
         * @param size Number of data points.
         * @return The best model with its sample and inliers, or empty if no trial produced a model.
         */
        [[nodiscard]] std::optional<Result> compute(int size) const;

        [[nodiscard]] const Options &options() const noexcept { return options_; }

        // ln(1 - p) / ln(1 - w^s), with the degenerate ratios w = 0 and w = 1 handled explicitly.
        [[nodiscard]] static double requiredIterations(double inlier_ratio, int sample_size, double probability) noexcept;

    private:
        const Fitter fitter_;
        const DegeneracyCheck degenerate_;
        const InlierFinder inlier_finder_;
        const Options options_;

        /**
         * @brief Generates unique random indices for selecting sample points.
         *
         * @tparam RNG Random number generator type.
         * @param count Number of unique indices to generate.
         * @param gen Random number generator.
         * @param dis Uniform integer distribution over the data indices.
         * @return Vector of unique random indices.
         */
        template<typename RNG>
        [[nodiscard]] static Sample generateUniqueIndices(int count, RNG &gen, std::uniform_int_distribution<> &dis);
    };

    template<typename ModelType>
    RANSAC<ModelType>::RANSAC(Fitter fitter, DegeneracyCheck degenerate, InlierFinder inlier_finder,
                              const Options &options) noexcept :
        fitter_(std::move(fitter)), degenerate_(std::move(degenerate)), inlier_finder_(std::move(inlier_finder)),
        options_(options) {}

    template<typename ModelType>
    std::optional<typename RANSAC<ModelType>::Result> RANSAC<ModelType>::compute(const int size) const {
        if (size < options_.sample_size || options_.sample_size <= 0) {
            return std::nullopt;
        }

        std::mt19937 gen(options_.seed ? *options_.seed : std::random_device{}());
        std::uniform_int_distribution<> dis(0, size - 1);

        std::optional<Result> best;
        double required = options_.max_evaluations;
        int trials = 0;

        while (trials < required && trials < options_.max_evaluations) {
            std::optional<ModelType> model;
            Sample sample;

            for (int samplings = 0; samplings < options_.max_samplings && !model; ++samplings) {
                sample = generateUniqueIndices(options_.sample_size, gen, dis);
                if (degenerate_(sample)) {
                    continue;
                }
                model = fitter_(sample);
            }

            if (!model) {
                LOG_DEBUG("No usable sample after {} draws, stopping after {} trials", options_.max_samplings, trials);
                break;
            }
            ++trials;

            auto inliers = inlier_finder_(*model, options_.distance_threshold);
            if (!best || inliers.size() > best->inliers.size()) {
                const double ratio = static_cast<double>(inliers.size()) / size;
                best = Result{std::move(*model), std::move(sample), std::move(inliers), 0, ratio};
                required = requiredIterations(ratio, options_.sample_size, options_.probability);
                LOG_TRACE("Trial {}: {} inliers ({:.3f}), {:.1f} trials required", trials, best->inliers.size(),
                          ratio, required);
            }
        }

        if (best) {
            best->trials = trials;
        }
        return best;
    }

    template<typename ModelType>
    double RANSAC<ModelType>::requiredIterations(const double inlier_ratio, const int sample_size,
                                                 const double probability) noexcept {
        const double no_outliers = 1.0 - std::pow(inlier_ratio, sample_size);
        if (no_outliers <= 0.0) {
            return 0.0;
        }
        if (no_outliers >= 1.0) {
            return std::numeric_limits<double>::infinity();
        }
        return std::log(1.0 - probability) / std::log(no_outliers);
    }

    template<typename ModelType>
    template<typename RNG>
    typename RANSAC<ModelType>::Sample RANSAC<ModelType>::generateUniqueIndices(const int count, RNG &gen,
                                                                               std::uniform_int_distribution<> &dis) {
        Sample indices;
        indices.reserve(count);
        while (static_cast<int>(indices.size()) < count) {
            if (int idx = dis(gen); std::find(indices.begin(), indices.end(), idx) == indices.end()) {
                indices.push_back(idx);
            }
        }
        return indices;
    }

} // namespace processing::image

#endif // PROCESSING_IMAGE_RANSAC_HPP
