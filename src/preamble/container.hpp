/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <array>
#include <span>
#include <boost/container/small_vector.hpp>
#include <boost/container/vector.hpp>
#include "concurrentqueue.h"
#include "preamble/types.hpp"

namespace kittymix {

using boost::container::vector;
using boost::container::small_vector;
using std::array;
using std::to_array;
using std::span;
using std::ssize;

// Lock-free multi-producer multi-consumer queue
template<typename T>
using mpmc_queue = moodycamel::ConcurrentQueue<T>;

}
