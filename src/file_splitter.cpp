#include "wincloud/file_splitter.hpp"

#include <algorithm>
#include <utility>

namespace wincloud {

namespace {

bool ValidPercentage(const int local_percentage) {
    return local_percentage >= 0 && local_percentage <= 100;
}

}  // namespace

std::size_t FileSplitter::LocalSizeFor(const std::size_t total_size, const int local_percentage) {
    const auto scaled = static_cast<unsigned long long>(total_size) *
        static_cast<unsigned long long>(local_percentage);
    std::size_t local_size = static_cast<std::size_t>(scaled / 100ULL);
    if (total_size > kMinClampedSplitSize) {
        local_size = std::max<std::size_t>(1, local_size);
        local_size = std::min<std::size_t>(total_size - 1, local_size);
    }
    return local_size;
}

WcStatus FileSplitter::Split(
    const std::vector<std::uint8_t>& data,
    const int local_percentage,
    SplitResult& out_result) {
    if (!ValidPercentage(local_percentage)) {
        return WcStatus::InvalidPercentage;
    }

    const std::size_t local_size = LocalSizeFor(data.size(), local_percentage);
    const auto split_point = data.begin() + static_cast<std::ptrdiff_t>(local_size);

    SplitResult result;
    result.local_part.assign(data.begin(), split_point);
    result.cloud_part.assign(split_point, data.end());
    result.local_size = result.local_part.size();
    result.cloud_size = result.cloud_part.size();
    out_result = std::move(result);
    return WcStatus::Ok;
}

std::vector<std::uint8_t> FileSplitter::Merge(
    const std::vector<std::uint8_t>& local_part,
    const std::vector<std::uint8_t>& cloud_part) {
    std::vector<std::uint8_t> out;
    out.reserve(local_part.size() + cloud_part.size());
    out.insert(out.end(), local_part.begin(), local_part.end());
    out.insert(out.end(), cloud_part.begin(), cloud_part.end());
    return out;
}

WcStatus FileSplitter::CalculateSplitSizes(
    const std::size_t total_size,
    const int local_percentage,
    SplitSizes& out_sizes) {
    if (!ValidPercentage(local_percentage)) {
        return WcStatus::InvalidPercentage;
    }

    SplitSizes sizes;
    sizes.total_size = total_size;
    sizes.local_size = LocalSizeFor(total_size, local_percentage);
    sizes.cloud_size = total_size - sizes.local_size;
    if (total_size > 0) {
        sizes.local_percentage = static_cast<double>(sizes.local_size) * 100.0 / static_cast<double>(total_size);
        sizes.cloud_percentage = static_cast<double>(sizes.cloud_size) * 100.0 / static_cast<double>(total_size);
    }
    out_sizes = sizes;
    return WcStatus::Ok;
}

}  // namespace wincloud
