#include "application/StorageGuard.hpp"
#include "infrastructure/LocalCacheIndex.hpp"
#include <iomanip>
#include <sstream>

namespace newscast::application {

std::string StorageGuard::FormatGigabytes(std::uintmax_t bytes) {
    constexpr double kBytesPerGigabyte = 1024.0 * 1024.0 * 1024.0;
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / kBytesPerGigabyte;
    return os.str();
}

std::optional<std::string> StorageGuard::Check(const std::filesystem::path& cacheDir, std::uintmax_t thresholdBytes) {
    const std::uintmax_t used = infrastructure::LocalCacheIndex::TotalSize(cacheDir);
    if (used <= thresholdBytes) {
        return std::nullopt;
    }

    std::ostringstream os;
    os << "Cache " << cacheDir.string() << " holds " << FormatGigabytes(used) << " GB, above the "
       << FormatGigabytes(thresholdBytes) << " GB limit. Run 'newscast --purge' to free space.";
    return os.str();
}

} // namespace newscast::application
