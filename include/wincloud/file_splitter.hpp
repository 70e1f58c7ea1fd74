#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "wincloud/wc_status.hpp"

namespace wincloud {

constexpr int kDefaultLocalPercentage = 10;

// Inputs longer than this always keep at least one byte on each side.
constexpr std::size_t kMinClampedSplitSize = 100;

struct SplitResult {
    std::vector<std::uint8_t> local_part;
    std::vector<std::uint8_t> cloud_part;
    std::size_t local_size = 0;
    std::size_t cloud_size = 0;
};

struct SplitSizes {
    std::size_t total_size = 0;
    std::size_t local_size = 0;
    std::size_t cloud_size = 0;
    double local_percentage = 0.0;
    double cloud_percentage = 0.0;
};

class FileSplitter {
public:
    static WcStatus Split(
        const std::vector<std::uint8_t>& data,
        int local_percentage,
        SplitResult& out_result);

    static std::vector<std::uint8_t> Merge(
        const std::vector<std::uint8_t>& local_part,
        const std::vector<std::uint8_t>& cloud_part);

    // Sizing only; applies the same rounding and clamping as Split.
    static WcStatus CalculateSplitSizes(
        std::size_t total_size,
        int local_percentage,
        SplitSizes& out_sizes);

private:
    static std::size_t LocalSizeFor(std::size_t total_size, int local_percentage);
};

}  // namespace wincloud
