#include "dcp/copy/checksum_verifier.hpp"

#include <spdlog/spdlog.h>

namespace dcp::copy {

const char* to_string(ChecksumComparison comparison) noexcept {
    switch (comparison) {
        case ChecksumComparison::Equal: return "Equal";
        case ChecksumComparison::Mismatch: return "Mismatch";
        case ChecksumComparison::Unverifiable: return "Unverifiable";
    }
    return "Unknown";
}

ChecksumReport ChecksumVerifier::compare(storage::StorageBackend& source_fs,
                                         const std::filesystem::path& source,
                                         storage::StorageBackend& target_fs,
                                         const std::filesystem::path& target) {
    ChecksumReport report;

    auto source_sum = source_fs.checksum(source);
    if (source_sum.is_error()) {
        report.detail = "cannot read source checksum: " + source_sum.error();
        return report;
    }
    auto target_sum = target_fs.checksum(target);
    if (target_sum.is_error()) {
        report.detail = "cannot read target checksum: " + target_sum.error();
        return report;
    }

    report.source = source_sum.value();
    report.target = target_sum.value();
    if (!report.source || !report.target) {
        report.detail = !report.source ? "source backend exposes no checksum"
                                       : "target backend exposes no checksum";
        return report;
    }

    if (!report.source->comparable_with(*report.target)) {
        report.detail = "incomparable checksums " + report.source->to_string() + " vs " +
                        report.target->to_string();
        return report;
    }

    if (report.source->value == report.target->value) {
        report.outcome = ChecksumComparison::Equal;
    } else {
        report.outcome = ChecksumComparison::Mismatch;
        report.detail = report.source->to_string() + " != " + report.target->to_string();
    }
    spdlog::debug("Checksum {} vs {}: {}", source.string(), target.string(), to_string(report.outcome));
    return report;
}

bool ChecksumVerifier::verify_equal(storage::StorageBackend& source_fs,
                                    const std::filesystem::path& source,
                                    storage::StorageBackend& target_fs,
                                    const std::filesystem::path& target) {
    return compare(source_fs, source, target_fs, target).outcome == ChecksumComparison::Equal;
}

} // namespace dcp::copy
