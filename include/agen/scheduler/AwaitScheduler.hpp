#pragma once
#include <agen/util/Function.hpp>

namespace agen {

/// Host hook through which await continuations are run. The generator core never
/// resumes a body synchronously from an await; it posts a job here instead and the
/// host runs it at some later point, exactly once.
class AwaitScheduler {
public:
    using Job = MoveOnlyFunction<void()>;

    virtual ~AwaitScheduler() = default;

    virtual void post(Job job) = 0;
};

}
