#pragma once

#include "common/parse_error.hpp"
#include <atomic>
#include <memory>
#include <utility>
#include <string>

namespace slnmodel {

// Read side of a cancellation flag. A default-constructed token never fires.
class CancellationToken {
public:
    CancellationToken() = default;

    bool cancelled() const { return flag_ && flag_->load(); }

    void throw_if_cancelled(const std::string& what) const {
        if (cancelled()) {
            throw OperationCancelledError(what);
        }
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

// Owner side: hand out tokens, then cancel() from any thread
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(flag_); }
    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace slnmodel
