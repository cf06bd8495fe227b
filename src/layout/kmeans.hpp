#ifndef DOCREDACT_LAYOUT_KMEANS_HPP
#define DOCREDACT_LAYOUT_KMEANS_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>
#include <utility>

/**
 * @file kmeans.hpp
 * @brief One-dimensional k-means (k-means++ seeding) and silhouette scoring.
 *
 * Used to cluster word x-positions into columns. Sampling draws raw 64-bit
 * values from std::mt19937_64 instead of going through the <random>
 * distributions, whose output differs between standard libraries, so a
 * given seed yields the same clustering everywhere.
 */

namespace docredact {
namespace layout {

/**
 * @brief Output of kmeans1d(). Labels are renumbered so that cluster 0 has
 *        the smallest centroid.
 */
struct KMeansResult
{
    std::vector<int> labels;
    std::vector<double> centroids;
    double inertia = 0.0;
};

namespace detail {

inline double unitDraw(std::mt19937_64 &rng)
{
    // 53 random mantissa bits -> [0, 1)
    return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}

inline std::vector<double> seedPlusPlus(const std::vector<double> &values, int k, std::mt19937_64 &rng)
{
    const size_t n = values.size();
    std::vector<double> centroids;
    centroids.reserve(static_cast<size_t>(k));
    centroids.push_back(values[rng() % n]);

    std::vector<double> dist(n, std::numeric_limits<double>::max());
    while (static_cast<int>(centroids.size()) < k) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double d = values[i] - centroids.back();
            dist[i] = std::min(dist[i], d * d);
            total += dist[i];
        }
        if (total <= 0.0) {
            centroids.push_back(values[rng() % n]);
            continue;
        }
        double target = unitDraw(rng) * total;
        size_t chosen = n - 1;
        double acc = 0.0;
        for (size_t i = 0; i < n; ++i) {
            acc += dist[i];
            if (acc > target) {
                chosen = i;
                break;
            }
        }
        centroids.push_back(values[chosen]);
    }
    return centroids;
}

inline KMeansResult lloyd(const std::vector<double> &values, std::vector<double> centroids, int maxIter)
{
    const size_t n = values.size();
    const size_t k = centroids.size();
    std::vector<int> labels(n, -1);

    for (int iter = 0; iter < maxIter; ++iter) {
        bool changed = false;
        for (size_t i = 0; i < n; ++i) {
            int best = 0;
            double bestDist = std::fabs(values[i] - centroids[0]);
            for (size_t c = 1; c < k; ++c) {
                double d = std::fabs(values[i] - centroids[c]);
                if (d < bestDist) {
                    bestDist = d;
                    best = static_cast<int>(c);
                }
            }
            if (labels[i] != best) {
                labels[i] = best;
                changed = true;
            }
        }
        if (!changed) {
            break;
        }

        std::vector<double> sums(k, 0.0);
        std::vector<size_t> counts(k, 0);
        for (size_t i = 0; i < n; ++i) {
            sums[static_cast<size_t>(labels[i])] += values[i];
            counts[static_cast<size_t>(labels[i])]++;
        }
        for (size_t c = 0; c < k; ++c) {
            if (counts[c] > 0) {
                centroids[c] = sums[c] / static_cast<double>(counts[c]);
            }
        }
    }

    KMeansResult result;
    result.labels = std::move(labels);
    result.centroids = std::move(centroids);
    for (size_t i = 0; i < n; ++i) {
        double d = values[i] - result.centroids[static_cast<size_t>(result.labels[i])];
        result.inertia += d * d;
    }
    return result;
}

inline void orderByCentroid(KMeansResult &result)
{
    const size_t k = result.centroids.size();
    std::vector<size_t> order(k);
    for (size_t c = 0; c < k; ++c) {
        order[c] = c;
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return result.centroids[a] < result.centroids[b];
    });
    std::vector<int> remap(k);
    std::vector<double> sorted(k);
    for (size_t rank = 0; rank < k; ++rank) {
        remap[order[rank]] = static_cast<int>(rank);
        sorted[rank] = result.centroids[order[rank]];
    }
    for (auto &label : result.labels) {
        label = remap[static_cast<size_t>(label)];
    }
    result.centroids = std::move(sorted);
}

// Sum of |x - y| over a sorted cluster, using its prefix sums.
inline double absDistanceSum(double x, const std::vector<double> &sorted, const std::vector<double> &prefix)
{
    const size_t n = sorted.size();
    size_t below = static_cast<size_t>(std::upper_bound(sorted.begin(), sorted.end(), x) - sorted.begin());
    double left = x * static_cast<double>(below) - prefix[below];
    double right = (prefix[n] - prefix[below]) - x * static_cast<double>(n - below);
    return left + right;
}

} // namespace detail

/**
 * @brief Cluster @p values into @p k groups, keeping the lowest-inertia run of @p restarts.
 * @throw std::invalid_argument if k < 1 or k > values.size().
 */
inline KMeansResult kmeans1d(const std::vector<double> &values, int k, uint64_t seed,
                             int restarts = 10, int maxIter = 300)
{
    if (k < 1 || static_cast<size_t>(k) > values.size()) {
        throw std::invalid_argument("kmeans1d: k must be in [1, n]");
    }

    std::mt19937_64 rng(seed);
    KMeansResult best;
    bool haveBest = false;
    for (int r = 0; r < std::max(1, restarts); ++r) {
        KMeansResult candidate = detail::lloyd(values, detail::seedPlusPlus(values, k, rng), maxIter);
        if (!haveBest || candidate.inertia < best.inertia) {
            best = std::move(candidate);
            haveBest = true;
        }
    }
    detail::orderByCentroid(best);
    return best;
}

/**
 * @brief Mean silhouette coefficient of a 1-D labelling.
 *
 * Singleton clusters score 0 for their point. Returns -1 when any of the
 * @p k clusters is empty, which callers treat as an unusable clustering.
 */
inline double silhouette1d(const std::vector<double> &values, const std::vector<int> &labels, int k)
{
    std::vector<std::vector<double>> clusters(static_cast<size_t>(k));
    for (size_t i = 0; i < values.size(); ++i) {
        clusters[static_cast<size_t>(labels[i])].push_back(values[i]);
    }
    std::vector<std::vector<double>> prefix(static_cast<size_t>(k));
    for (size_t c = 0; c < clusters.size(); ++c) {
        if (clusters[c].empty()) {
            return -1.0;
        }
        std::sort(clusters[c].begin(), clusters[c].end());
        prefix[c].assign(clusters[c].size() + 1, 0.0);
        for (size_t i = 0; i < clusters[c].size(); ++i) {
            prefix[c][i + 1] = prefix[c][i] + clusters[c][i];
        }
    }

    double total = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        const size_t own = static_cast<size_t>(labels[i]);
        const size_t ownSize = clusters[own].size();
        if (ownSize <= 1) {
            continue;
        }
        double a = detail::absDistanceSum(values[i], clusters[own], prefix[own]) / static_cast<double>(ownSize - 1);
        double b = std::numeric_limits<double>::max();
        for (size_t c = 0; c < clusters.size(); ++c) {
            if (c == own) {
                continue;
            }
            double mean = detail::absDistanceSum(values[i], clusters[c], prefix[c]) / static_cast<double>(clusters[c].size());
            b = std::min(b, mean);
        }
        double denom = std::max(a, b);
        if (denom > 0.0) {
            total += (b - a) / denom;
        }
    }
    return values.empty() ? 0.0 : total / static_cast<double>(values.size());
}

} // namespace layout
} // namespace docredact

#endif // DOCREDACT_LAYOUT_KMEANS_HPP
