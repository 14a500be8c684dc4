#pragma once
#include <cstdint>

namespace kb {

using DocId = std::uint64_t;      // caller-assigned document id
using ClusterId = std::uint64_t;  // assigned by ClusteringEngine, starts at 0

}
