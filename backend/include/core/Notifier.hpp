#pragma once
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>

#include "Device.hpp"

namespace lanscout {

/**
 * @brief Prints discovery notification lines, gated by a display-enabled flag.
 *
 * The flag and the output stream are guarded by one mutex, so lines from the
 * discovery thread and the enrichment workers never interleave.
 */
class Notifier {
public:
    explicit Notifier(std::ostream& out = std::cout);

    void set_enabled(bool enabled);
    bool enabled() const;

    /** @brief Print the line for the device at 0-based index. Returns true if printed. */
    bool notify(std::size_t index, const Device& device);

    /** @brief "[n] friendly | IP: .. | Host: .. | MAC: .. | Vendor: .. | Service: .. | Name: .." */
    static std::string format_line(std::size_t index, const Device& device);

private:
    std::ostream& out_;
    mutable std::mutex mu_;
    bool enabled_ = true;
};

} // namespace lanscout
