#include "search/RebuildPolicy.hpp"
#include "kb/Errors.hpp"

namespace search {

const char* rebuild_mode_str(RebuildMode m) {
    switch (m) {
        case RebuildMode::Incremental: return "incremental";
        case RebuildMode::PendingRebuild: return "pending_rebuild";
        default: return "unknown";
    }
}

RebuildPolicy::RebuildPolicy(size_t threshold) : m_threshold(threshold) {
    if (threshold == 0) {
        throw kb::InvalidArgumentError("rebuild threshold must be >= 1");
    }
}

RebuildMode RebuildPolicy::plan_single(bool corpus_was_empty) {
    if (corpus_was_empty) m_mode = RebuildMode::PendingRebuild;

    // this operation would be the threshold-th mutation since the last rebuild
    if (m_pending_ops + 1 >= m_threshold) m_mode = RebuildMode::PendingRebuild;

    return m_mode;
}

RebuildMode RebuildPolicy::plan_batch() {
    m_mode = RebuildMode::PendingRebuild;
    return m_mode;
}

void RebuildPolicy::request_rebuild() {
    m_mode = RebuildMode::PendingRebuild;
}

void RebuildPolicy::mark_rebuilt() {
    m_pending_ops = 0;
    m_mode = RebuildMode::Incremental;
}

void RebuildPolicy::mark_incremental() {
    ++m_pending_ops;
}

}
