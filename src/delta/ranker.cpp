#include "deltacode/delta/ranker.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace deltacode::delta {
namespace {

// Absent side first, then segment-wise path order
int compare_side(const FileRecord* lhs, const FileRecord* rhs) {
    if (lhs == nullptr || rhs == nullptr) {
        if (lhs == rhs) {
            return 0;
        }
        return lhs == nullptr ? -1 : 1;
    }
    if (lhs->path < rhs->path) {
        return -1;
    }
    return rhs->path < lhs->path ? 1 : 0;
}

} // namespace

std::string Ranker::canonical_key(const FactorMap& factors) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    for (const auto& [name, value] : factors) {
        oss << name << '=' << value << ';';
    }
    return oss.str();
}

bool Ranker::ranks_before(const Delta& lhs, const Delta& rhs) {
    if (lhs.score != rhs.score) {
        return lhs.score > rhs.score;
    }

    const auto lhs_key = canonical_key(lhs.factors);
    const auto rhs_key = canonical_key(rhs.factors);
    if (lhs_key != rhs_key) {
        return lhs_key < rhs_key;
    }

    if (int c = compare_side(&lhs.primary(), &rhs.primary()); c != 0) {
        return c < 0;
    }
    if (int c = compare_side(lhs.old_record, rhs.old_record); c != 0) {
        return c < 0;
    }
    return compare_side(lhs.new_record, rhs.new_record) < 0;
}

void Ranker::rank(std::vector<Delta>& deltas) {
    std::sort(deltas.begin(), deltas.end(), &Ranker::ranks_before);
}

} // namespace deltacode::delta
