#pragma once
#include <Geode/Result.hpp>

namespace agen {

using geode::Ok;
using geode::Err;
using geode::Result;

}
