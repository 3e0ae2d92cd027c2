#ifndef FRNN_DESCRIPTORS_HPP
#define FRNN_DESCRIPTORS_HPP

#include "dataset.hpp"
#include "distance.hpp"
#include "kspec.hpp"
#include "neighbour_index.hpp"
#include "owa.hpp"
#include <memory>
#include <string>
#include <vector>

namespace frnn {

/**
 * Constructed one-class model. query() returns one score in [0, 1] per row;
 * higher means the row looks more like the training data.
 */
class DescriptorModel {
public:
    virtual std::vector<double> query(const double* data, size_t n, size_t dim) const = 0;

    std::vector<double> query(const Dataset& data) const {
        return query(data.data(), data.size(), data.dim());
    }

    virtual size_t dim() const = 0;
    virtual size_t resolved_k() const = 0;

    virtual ~DescriptorModel() = default;
};

// Unconstructed descriptor. Labels in the training data, if any, are ignored.
class DataDescriptor {
public:
    virtual std::unique_ptr<const DescriptorModel> construct(const Dataset& train) const = 0;
    virtual std::string name() const = 0;
    virtual ~DataDescriptor() = default;
};

struct NNDConfig {
    KSpec k = KSpec::fixed(1);
    // Only the k-th neighbour's proximity counts. Otherwise the k nearest
    // proximities are aggregated with a soft maximum over `family`.
    bool trimmed = true;
    OWAFamily family = OWAFamily::Uniform;
    double decay = 0.5;   // exponential only
    Metric metric = Metric::Euclidean;
    SearchBackend backend = SearchBackend::BruteForce;
};

// Nearest Neighbour Distance (Knorr & Ng 1997), OWA aggregation after
// Cornelis, Verbiest & Jensen (2010).
class NND : public DataDescriptor {
public:
    explicit NND(const NNDConfig& cfg = {});
    std::unique_ptr<const DescriptorModel> construct(const Dataset& train) const override;
    std::string name() const override;

private:
    NNDConfig cfg_;
    OWAOperator owa_;
};

struct LocalConfig {
    KSpec k = KSpec::fixed(1);
    Metric metric = Metric::Euclidean;
    SearchBackend backend = SearchBackend::BruteForce;
};

/**
 * Localised Nearest Neighbour Distance (de Ridder, Tax & Duin 1998).
 * Ratio of the query's k-th neighbour distance to that neighbour's own k-th
 * neighbour distance; 0/0 counts as 1. Score 1 / (1 + ratio).
 */
class LNND : public DataDescriptor {
public:
    explicit LNND(const LocalConfig& cfg = {});
    std::unique_ptr<const DescriptorModel> construct(const Dataset& train) const override;
    std::string name() const override;

private:
    LocalConfig cfg_;
};

/**
 * Local Outlier Factor (Breunig et al. 2000). Score 1 / (1 + lof); an
 * undefined factor (inf / inf) counts as 1.
 */
class LOF : public DataDescriptor {
public:
    explicit LOF(const LocalConfig& cfg = {});
    std::unique_ptr<const DescriptorModel> construct(const Dataset& train) const override;
    std::string name() const override;

private:
    LocalConfig cfg_;
};

}  // namespace frnn

#endif  // FRNN_DESCRIPTORS_HPP
