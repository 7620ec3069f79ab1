//===----------------------------------------------------------------------===//
//
// File: src/console/BoundedLog.cpp
// Purpose: Capacity check and mirroring for the boot console log.
// Key invariants: The sink sees exactly the text that was buffered.
// Ownership/Lifetime: See BoundedLog.hpp.
// Links: src/console/BoundedLog.hpp
//
//===----------------------------------------------------------------------===//

#include "console/BoundedLog.hpp"

#include <utility>

namespace entfs::console
{

BoundedLog::BoundedLog(size_t capacity, Sink sink) : capacity_(capacity), sink_(std::move(sink))
{
    buffer_.reserve(capacity_);
}

support::Expected<void> BoundedLog::write(std::string_view text)
{
    if (text.size() > remaining())
    {
        return support::makeError({},
                                  "log buffer full: " + std::to_string(text.size()) +
                                      " characters requested, " + std::to_string(remaining()) +
                                      " remaining");
    }
    if (sink_)
        sink_(text);
    buffer_.append(text);
    return {};
}

} // namespace entfs::console
