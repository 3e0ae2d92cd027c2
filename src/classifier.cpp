#include "classifier.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace frnn {

double Confidences::score(size_t i, int label) const {
    if (i >= n)
        throw std::out_of_range("Confidences::score: row " + std::to_string(i)
                                + " out of range");
    auto it = std::lower_bound(classes.begin(), classes.end(), label);
    if (it == classes.end() || *it != label)
        throw std::out_of_range("Confidences::score: unknown label "
                                + std::to_string(label));
    return row(i)[static_cast<size_t>(it - classes.begin())];
}

void validate_training_data(const Dataset& train, const char* who) {
    if (train.empty())
        throw InvalidInput(std::string(who) + ": empty training data");
    train.validate_labeled();
    if (train.classes().size() < 2)
        throw InvalidInput(std::string(who) + ": need at least 2 distinct labels");
}

}  // namespace frnn
