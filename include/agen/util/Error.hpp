#pragma once
#include <stdexcept>

namespace agen {

/// Rejection reason delivered to a request or deferred that was destroyed before it was settled.
struct AbandonedError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
