#include "neighbour_index.hpp"
#include "brute_force_index.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

#ifdef FRNN_HAVE_FAISS
#include "faiss_index.hpp"
#endif

namespace frnn {

SearchBackend parse_backend(const std::string& text) {
    std::string t(text);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "brute_force" || t == "brute" || t == "blas") return SearchBackend::BruteForce;
    if (t == "faiss") return SearchBackend::Faiss;
    throw InvalidConfiguration("parse_backend: unknown search backend '" + text + "'");
}

const char* backend_name(SearchBackend backend) {
    switch (backend) {
    case SearchBackend::BruteForce: return "brute_force";
    case SearchBackend::Faiss: return "faiss";
    }
    return "unknown";
}

bool backend_available(SearchBackend backend) {
    switch (backend) {
    case SearchBackend::BruteForce:
        return true;
    case SearchBackend::Faiss:
#ifdef FRNN_HAVE_FAISS
        return true;
#else
        return false;
#endif
    }
    return false;
}

void check_finite_rows(const double* data, size_t n, size_t dim, const char* who) {
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < dim; ++j)
            if (!std::isfinite(data[i * dim + j]))
                throw InvalidInput(std::string(who) + ": non-finite value in row "
                                   + std::to_string(i));
}

std::unique_ptr<NeighbourIndex> make_index(SearchBackend backend,
                                           const double* data, size_t n,
                                           size_t dim, Metric metric) {
    switch (backend) {
    case SearchBackend::BruteForce:
        return std::make_unique<BruteForceIndex>(data, n, dim, metric);
    case SearchBackend::Faiss:
#ifdef FRNN_HAVE_FAISS
        return std::make_unique<FaissIndex>(data, n, dim, metric);
#else
        throw InvalidConfiguration("make_index: frnn was built without FAISS");
#endif
    }
    throw InvalidConfiguration("make_index: unknown search backend");
}

}  // namespace frnn
