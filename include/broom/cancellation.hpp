#ifndef BROOM_CANCELLATION_HPP
#define BROOM_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace Broom {

/**
 * @class CancellationToken
 * @brief Shared cooperative-cancellation flag.
 *
 * Copies share the same flag. Long-running scans check it between units of
 * work (a root, a folder, a definition), never in the middle of one.
 */
class CancellationToken
{
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false))
    {
    }

    void cancel() const { flag_->store(true); }

    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace Broom

#endif // BROOM_CANCELLATION_HPP
