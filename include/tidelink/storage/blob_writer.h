#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tidelink/core/error.h"
#include "tidelink/core/result.h"

namespace tidelink::storage {

/// @brief Append-only raw byte objects on the local filesystem, one per upload id.
///
/// Every mutating call re-checks the object length it expects, so a second writer
/// that bypassed the per-upload lock surfaces as kStorageDesync instead of a
/// silently interleaved byte stream.
class BlobWriter {
public:
    explicit BlobWriter(std::string base_path);

    core::Result<void> CreateEmpty(const std::string& id);
    /// @brief Append bytes at expected_length; returns the new object length.
    core::Result<std::uint64_t> AppendAt(const std::string& id, std::uint64_t expected_length,
                                         std::string_view bytes);
    core::Result<std::string> ReadRange(const std::string& id, std::uint64_t offset,
                                        std::uint64_t length) const;
    core::Result<std::uint64_t> Length(const std::string& id) const;
    /// @brief Drop bytes past length; used to discard unacknowledged tails.
    core::Result<void> Truncate(const std::string& id, std::uint64_t length);
    /// @brief Remove the object; a missing object is not an error.
    core::Result<void> Delete(const std::string& id);

    std::string PathFor(const std::string& id) const;
    const std::string& root() const { return root_; }

    static bool IsSafeName(const std::string& name);

private:
    std::string root_;
};

}  // namespace tidelink::storage
