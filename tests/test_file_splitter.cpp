#include "wincloud/file_splitter.hpp"

#include <cmath>
#include <vector>

#include "test_support.hpp"

using wincloud::FileSplitter;
using wincloud::SplitResult;
using wincloud::SplitSizes;
using wincloud::WcStatus;
using wincloud_test::RandomBytes;

int main() {
    {
        const std::vector<std::size_t> lengths = {0, 1, 7, 50, 100, 101, 1000, 4097};
        const std::vector<int> percentages = {0, 1, 10, 33, 50, 90, 99, 100};
        for (const std::size_t len : lengths) {
            const auto data = RandomBytes(len, static_cast<std::uint32_t>(len) + 1U);
            for (const int p : percentages) {
                SplitResult split;
                if (!WC_CHECK(FileSplitter::Split(data, p, split) == WcStatus::Ok)) {
                    return 1;
                }
                if (!WC_CHECK(split.local_part.size() == split.local_size && split.cloud_part.size() == split.cloud_size)) {
                    return 1;
                }
                if (!WC_CHECK(split.local_size + split.cloud_size == len)) {
                    return 1;
                }
                if (!WC_CHECK(FileSplitter::Merge(split.local_part, split.cloud_part) == data)) {
                    return 1;
                }
            }
        }
    }

    {
        // Below the clamp threshold the floor is taken as is.
        const auto data = RandomBytes(50, 3U);
        SplitResult split;
        if (!WC_CHECK(FileSplitter::Split(data, 10, split) == WcStatus::Ok && split.local_size == 5)) {
            return 1;
        }
        if (!WC_CHECK(FileSplitter::Split(data, 0, split) == WcStatus::Ok && split.local_size == 0 && split.cloud_size == 50)) {
            return 1;
        }
        if (!WC_CHECK(FileSplitter::Split(data, 100, split) == WcStatus::Ok && split.cloud_size == 0)) {
            return 1;
        }
    }

    {
        const auto data = RandomBytes(101, 4U);
        SplitResult split;
        if (!WC_CHECK(FileSplitter::Split(data, 0, split) == WcStatus::Ok && split.local_size == 1 && split.cloud_size == 100)) {
            return 1;
        }
        if (!WC_CHECK(FileSplitter::Split(data, 100, split) == WcStatus::Ok && split.local_size == 100 && split.cloud_size == 1)) {
            return 1;
        }
        if (!WC_CHECK(FileSplitter::Split(data, 10, split) == WcStatus::Ok && split.local_size == 10)) {
            return 1;
        }
    }

    {
        const auto data = RandomBytes(10, 5U);
        SplitResult split;
        if (!WC_CHECK(FileSplitter::Split(data, -1, split) == WcStatus::InvalidPercentage)) {
            return 1;
        }
        if (!WC_CHECK(FileSplitter::Split(data, 101, split) == WcStatus::InvalidPercentage)) {
            return 1;
        }
        SplitSizes sizes;
        if (!WC_CHECK(FileSplitter::CalculateSplitSizes(10, 150, sizes) == WcStatus::InvalidPercentage)) {
            return 1;
        }
    }

    {
        for (const std::size_t len : {std::size_t{0}, std::size_t{50}, std::size_t{101}, std::size_t{1000}}) {
            for (const int p : {0, 10, 100}) {
                const auto data = RandomBytes(len, 9U);
                SplitResult split;
                SplitSizes sizes;
                if (!WC_CHECK(FileSplitter::Split(data, p, split) == WcStatus::Ok)) {
                    return 1;
                }
                if (!WC_CHECK(FileSplitter::CalculateSplitSizes(len, p, sizes) == WcStatus::Ok)) {
                    return 1;
                }
                if (!WC_CHECK(sizes.total_size == len && sizes.local_size == split.local_size &&
                           sizes.cloud_size == split.cloud_size)) {
                    return 1;
                }
                if (len > 0 && !WC_CHECK(std::fabs(sizes.local_percentage + sizes.cloud_percentage - 100.0) < 1e-9)) {
                    return 1;
                }
            }
        }

        SplitSizes sizes;
        if (!WC_CHECK(FileSplitter::CalculateSplitSizes(1000, 10, sizes) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(sizes.local_size == 100 && sizes.cloud_size == 900 && std::fabs(sizes.local_percentage - 10.0) < 1e-9)) {
            return 1;
        }
    }

    return 0;
}
