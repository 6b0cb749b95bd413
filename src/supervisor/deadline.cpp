#include "deadline.hpp"
#include <algorithm>
#include <thread>

namespace herder {

deadline::deadline(duration budget)
    : start_{clock::now()}, budget_{budget}
{ }


bool deadline::expired() const
{
    return clock::now() - start_ >= budget_;
}


deadline::duration deadline::elapsed() const
{
    return std::chrono::duration_cast<duration>(clock::now() - start_);
}


deadline::duration deadline::remaining() const
{
    const auto left = budget_ - (clock::now() - start_);
    if (left <= clock::duration::zero())
        return duration::zero();
    // round up so a pending sub-millisecond remainder is still waited for
    return std::chrono::ceil<duration>(left);
}


bool deadline::sleep_for(duration step) const
{
    const auto left = remaining();
    if (left == duration::zero())
        return false;
    std::this_thread::sleep_for(std::min(step, left));
    return true;
}

} // namespace herder
