#pragma once

#include "generator/AsyncGenerator.hpp"
#include "generator/Await.hpp"
#include "generator/Body.hpp"
#include "generator/CoroutineBody.hpp"
#include "generator/Options.hpp"
#include "generator/Outcome.hpp"
#include "generator/Resumption.hpp"
#include "generator/State.hpp"
#include "promise/Deferred.hpp"
#include "scheduler/AwaitScheduler.hpp"
#include "scheduler/MicrotaskQueue.hpp"
#include "util/Assert.hpp"
#include "util/Error.hpp"
#include "util/Result.hpp"
#include "util/Trace.hpp"
