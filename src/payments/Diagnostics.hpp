#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace payments
{

class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /// Bounded, single-line rendition of a field value for log messages.
    /// Control characters are escaped and the cut never splits a UTF-8 sequence.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace payments
