#pragma once

#include <kgrag/kg/types.h>

#include <cstddef>
#include <string_view>
#include <vector>

namespace kgrag::kg {

struct ThresholdConfig {
    double thetaAdd = 0.55;              ///< minimum confidence to persist an edge
    double thetaShow = 0.60;             ///< minimum confidence to display an edge
    std::size_t minEvidenceCount = 2;    ///< minimum ';'-separated evidence parts to display

    bool isValid() const {
        return thetaAdd >= 0.0 && thetaAdd <= 1.0 && thetaShow >= 0.0 && thetaShow <= 1.0 &&
               minEvidenceCount > 0;
    }
};

/// Number of ';'-separated parts, empty ones included; "" counts as one
std::size_t evidenceCount(std::string_view evidence);

class ThresholdFilter {
public:
    explicit ThresholdFilter(ThresholdConfig config = {}) : config_(config) {}

    std::vector<KgEdge> filterForStorage(const std::vector<KgEdge>& edges) const;
    std::vector<KgEdge> filterForDisplay(const std::vector<KgEdge>& edges) const;

    const ThresholdConfig& config() const noexcept { return config_; }

private:
    ThresholdConfig config_;
};

} // namespace kgrag::kg
